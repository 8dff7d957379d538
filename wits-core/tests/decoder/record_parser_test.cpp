#include "wits/decoder/record_parser.hpp"

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <variant>

#include "wits/decoder/error.hpp"
#include "wits/symbols/catalog.hpp"
#include "wits/units/error.hpp"

namespace wits::decoder::test {

using units::UnitSystem;

namespace {

DecodeOptions metric() {
  DecodeOptions options;
  options.units = UnitSystem::Metric;
  return options;
}

std::string message_of(decode_errc ec) {
  return make_error_code(ec).message();
}

}  // namespace

// ----------------------------------------------------------------------------
// Basic Decoding
// ----------------------------------------------------------------------------

TEST(RecordParserTest, DecodesKnownFloatSymbols) {
  RecordParser parser;
  auto result = parser.decode("&&\n01083650.40\n011323.38\n!!", metric());
  ASSERT_TRUE(result) << result.error().message();

  const auto& frame = *result;
  EXPECT_TRUE(frame.errors.empty());
  ASSERT_EQ(frame.data_points.size(), 2u);

  const auto& depth = frame.data_points[0];
  EXPECT_EQ(depth.symbol_code, "0108");
  EXPECT_EQ(depth.symbol_name, "DBTM");
  EXPECT_EQ(depth.symbol_description, "Depth Bit (meas)");
  EXPECT_EQ(depth.record_type, 1);
  EXPECT_EQ(depth.raw_value, "3650.40");
  ASSERT_TRUE(depth.parsed_value);
  EXPECT_DOUBLE_EQ(std::get<double>(*depth.parsed_value), 3650.40);
  EXPECT_EQ(depth.unit, "M");

  const auto& rop = frame.data_points[1];
  EXPECT_EQ(rop.symbol_code, "0113");
  ASSERT_TRUE(rop.parsed_value);
  EXPECT_DOUBLE_EQ(std::get<double>(*rop.parsed_value), 23.38);
  EXPECT_EQ(rop.unit, "M/HR");
}

TEST(RecordParserTest, FieldUnitsByDefault) {
  auto result = decode_frame("&&\n01083650.40\n011323.38\n!!");
  ASSERT_TRUE(result);
  ASSERT_EQ(result->data_points.size(), 2u);
  EXPECT_EQ(result->data_points[0].unit, "F");
  EXPECT_EQ(result->data_points[1].unit, "F/HR");
  EXPECT_EQ(result->source, "unknown");
}

TEST(RecordParserTest, KeepsLineOrderAndSource) {
  DecodeOptions options;
  options.source = "tcp://rig:12345";

  auto result = decode_frame("&&\n0113 1\n0108 2\n0110 3\n!!", options);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->source, "tcp://rig:12345");
  ASSERT_EQ(result->data_points.size(), 3u);
  EXPECT_EQ(result->data_points[0].symbol_code, "0113");
  EXPECT_EQ(result->data_points[1].symbol_code, "0108");
  EXPECT_EQ(result->data_points[2].symbol_code, "0110");
}

TEST(RecordParserTest, HandlesCrLfAndBlankLines) {
  auto result = decode_frame("\r\n&&\r\n\r\n01081.5\r\n   \r\n01132\r\n!!\r\n");
  ASSERT_TRUE(result);
  EXPECT_TRUE(result->errors.empty());
  ASSERT_EQ(result->data_points.size(), 2u);
  EXPECT_EQ(result->data_points[0].raw_value, "1.5");
}

TEST(RecordParserTest, EmptyFrameHasNoPoints) {
  auto result = decode_frame("&&\n!!");
  ASSERT_TRUE(result);
  EXPECT_TRUE(result->data_points.empty());
  EXPECT_TRUE(result->errors.empty());
}

// ----------------------------------------------------------------------------
// Type Coercion
// ----------------------------------------------------------------------------

TEST(RecordParserTest, IntegerAndAsciiSymbols) {
  auto result = decode_frame("&&\n0137123456\n0101WELL-A 7\n0138-42\n!!");
  ASSERT_TRUE(result);
  ASSERT_EQ(result->data_points.size(), 3u);

  EXPECT_EQ(std::get<int64_t>(*result->data_points[0].parsed_value), 123456);
  EXPECT_EQ(std::get<std::string>(*result->data_points[1].parsed_value),
            "WELL-A 7");
  EXPECT_EQ(std::get<int64_t>(*result->data_points[2].parsed_value), -42);
}

TEST(RecordParserTest, InvalidFloatKeepsPointWithoutValue) {
  auto result = decode_frame("&&\n0108abc\n01131.2.3\n0110+12.5\n!!");
  ASSERT_TRUE(result);
  ASSERT_EQ(result->data_points.size(), 3u);
  ASSERT_EQ(result->errors.size(), 2u);

  EXPECT_FALSE(result->data_points[0].parsed_value);
  EXPECT_EQ(result->data_points[0].raw_value, "abc");
  EXPECT_FALSE(result->data_points[1].parsed_value);
  EXPECT_DOUBLE_EQ(std::get<double>(*result->data_points[2].parsed_value),
                   12.5);
  EXPECT_TRUE(result->errors[0].starts_with(
      message_of(decode_errc::invalid_float)));
  EXPECT_NE(result->errors[0].find("0108"), std::string::npos);
}

TEST(RecordParserTest, InvalidIntegerKeepsPointWithoutValue) {
  auto result = decode_frame("&&\n013712.5\n0137+-1\n0137+7\n!!");
  ASSERT_TRUE(result);
  ASSERT_EQ(result->data_points.size(), 3u);
  EXPECT_FALSE(result->data_points[0].parsed_value);
  EXPECT_FALSE(result->data_points[1].parsed_value);
  EXPECT_EQ(std::get<int64_t>(*result->data_points[2].parsed_value), 7);
  ASSERT_EQ(result->errors.size(), 2u);
  EXPECT_TRUE(result->errors[0].starts_with(
      message_of(decode_errc::invalid_integer)));
}

TEST(RecordParserTest, CoerceValue) {
  using symbols::DataType;

  EXPECT_EQ(std::get<double>(*coerce_value("-0.5", DataType::Float)), -0.5);
  EXPECT_EQ(std::get<double>(*coerce_value("7.", DataType::Float)), 7.0);
  EXPECT_EQ(std::get<double>(*coerce_value(".25", DataType::Float)), 0.25);
  EXPECT_FALSE(coerce_value("", DataType::Float));
  EXPECT_FALSE(coerce_value(".", DataType::Float));
  EXPECT_FALSE(coerce_value("1e5", DataType::Float));
  EXPECT_FALSE(coerce_value("nan", DataType::Float));
  EXPECT_FALSE(coerce_value("", DataType::Long));
  EXPECT_FALSE(coerce_value("+", DataType::Short));
  EXPECT_EQ(std::get<std::string>(*coerce_value("", DataType::Ascii)), "");
}

// ----------------------------------------------------------------------------
// Unknown Symbols & Malformed Lines
// ----------------------------------------------------------------------------

TEST(RecordParserTest, UnknownSymbolOnly_LenientAndStrict) {
  for (bool strict : {false, true}) {
    DecodeOptions options;
    options.strict = strict;

    auto result = decode_frame("&&\n9999123\n!!", options);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->data_points.empty());
    ASSERT_EQ(result->errors.size(), 1u);
    EXPECT_EQ(result->errors[0],
              message_of(decode_errc::unknown_symbol) + ": 9999");
    EXPECT_EQ(result->unknown_symbols, 1u);
  }
}

TEST(RecordParserTest, KnownAndUnknownSymbol_LenientAndStrict) {
  for (bool strict : {false, true}) {
    DecodeOptions options;
    options.strict = strict;

    auto result = decode_frame("&&\n01083650.40\n9999123\n!!", options);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->data_points.size(), 1u);
    EXPECT_EQ(result->errors.size(), 1u);
  }
}

TEST(RecordParserTest, ShortLineIsMalformed) {
  auto result = decode_frame("&&\n010\n01081\n!!");
  ASSERT_TRUE(result);
  ASSERT_EQ(result->data_points.size(), 1u);
  ASSERT_EQ(result->errors.size(), 1u);
  EXPECT_TRUE(result->errors[0].starts_with(
      message_of(decode_errc::malformed_line)));
}

TEST(RecordParserTest, CodeOnlyLineHasEmptyValue) {
  auto result = decode_frame("&&\n0108\n!!");
  ASSERT_TRUE(result);
  ASSERT_EQ(result->data_points.size(), 1u);
  EXPECT_FALSE(result->data_points[0].parsed_value);
  EXPECT_EQ(result->errors.size(), 1u);
}

// ----------------------------------------------------------------------------
// Structural Errors
// ----------------------------------------------------------------------------

TEST(RecordParserTest, MissingMarkersIsSingleError) {
  auto result = decode_frame("010812345");
  ASSERT_TRUE(result);
  EXPECT_TRUE(result->data_points.empty());
  ASSERT_EQ(result->errors.size(), 1u);
  EXPECT_TRUE(result->errors[0].starts_with(
      message_of(decode_errc::missing_start_marker)));

  result = decode_frame("&&\n010812345\n");
  ASSERT_TRUE(result);
  EXPECT_TRUE(result->data_points.empty());
  ASSERT_EQ(result->errors.size(), 1u);
  EXPECT_TRUE(result->errors[0].starts_with(
      message_of(decode_errc::missing_end_marker)));
}

TEST(RecordParserTest, EmptyInputFails) {
  for (std::string_view input : {"", "   \r\n\t"}) {
    auto result = decode_frame(input);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), make_error_code(decode_errc::empty_input));
  }
}

// ----------------------------------------------------------------------------
// Unit Conversion Post-pass
// ----------------------------------------------------------------------------

TEST(RecordParserTest, ConvertToMetricPostPass) {
  DecodeOptions options;
  options.units = UnitSystem::Field;
  options.convert_to = UnitSystem::Metric;

  auto result = decode_frame("&&\n01081000\n0137250\n!!", options);
  ASSERT_TRUE(result);
  EXPECT_TRUE(result->warnings.empty());
  ASSERT_EQ(result->data_points.size(), 2u);

  const auto& depth = result->data_points[0];
  EXPECT_EQ(depth.unit, "M");
  EXPECT_EQ(depth.unit_id, units::Unit::Meters);
  EXPECT_NEAR(*depth.as_double(), 304.8, 1e-9);
  EXPECT_EQ(depth.raw_value, "1000");

  // 無單位的整數不受影響
  EXPECT_EQ(std::get<int64_t>(*result->data_points[1].parsed_value), 250);
}

TEST(RecordParserTest, ConvertPoint_IncompatibleUnitsFails) {
  auto result = decode_frame("&&\n01083650.4\n!!");
  ASSERT_TRUE(result);
  auto point = result->data_points.at(0);

  auto converted = convert_point(point, units::Unit::Psi);
  ASSERT_FALSE(converted);
  EXPECT_EQ(converted.error(),
            make_error_code(units::convert_errc::incompatible_units));
  EXPECT_EQ(point.unit, "F");
  EXPECT_DOUBLE_EQ(*point.as_double(), 3650.4);
}

TEST(RecordParserTest, ConvertAll_MismatchBecomesWarning) {
  constexpr std::array kOdd = {
      symbols::Symbol{"9901", "ODD", "Mismatched units",
                      symbols::DataType::Float, units::Unit::Meters,
                      units::Unit::Psi},
  };
  symbols::SymbolCatalog catalog(kOdd);
  RecordParser parser(catalog);

  DecodeOptions options = metric();
  options.convert_to = UnitSystem::Field;

  auto result = parser.decode("&&\n990112.5\n!!", options);
  ASSERT_TRUE(result);
  EXPECT_TRUE(result->errors.empty());
  ASSERT_EQ(result->warnings.size(), 1u);
  EXPECT_NE(result->warnings[0].find("9901"), std::string::npos);

  const auto& point = result->data_points.at(0);
  EXPECT_EQ(point.unit, "M");
  EXPECT_DOUBLE_EQ(*point.as_double(), 12.5);
}

}  // namespace wits::decoder::test
