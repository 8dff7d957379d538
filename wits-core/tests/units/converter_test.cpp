#include "wits/units/converter.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "wits/units/error.hpp"
#include "wits/units/unit.hpp"

namespace wits::units::test {

// ----------------------------------------------------------------------------
// Category & Convertibility
// ----------------------------------------------------------------------------

TEST(UnitConverterTest, CategoryOfUnits) {
  EXPECT_EQ(UnitConverter::category(Unit::Meters), Category::Length);
  EXPECT_EQ(UnitConverter::category(Unit::Psi), Category::Pressure);
  EXPECT_EQ(UnitConverter::category(Unit::GallonsPerMinute),
            Category::FlowRate);
  EXPECT_EQ(UnitConverter::category(Unit::DegreesFahrenheit),
            Category::Temperature);
  EXPECT_EQ(UnitConverter::category(Unit::Unitless), Category::Dimensionless);
}

TEST(UnitConverterTest, IsConvertible_SameCategoryOnly) {
  EXPECT_TRUE(UnitConverter::is_convertible(Unit::Meters, Unit::Feet));
  EXPECT_TRUE(UnitConverter::is_convertible(Unit::Kilopascals, Unit::Psi));
  EXPECT_FALSE(UnitConverter::is_convertible(Unit::Psi, Unit::Meters));
  EXPECT_FALSE(UnitConverter::is_convertible(Unit::Barrels, Unit::Feet));
}

// ----------------------------------------------------------------------------
// Factor
// ----------------------------------------------------------------------------

TEST(UnitConverterTest, Factor_IdentityIsOne) {
  for (auto unit : all_units()) {
    auto factor = UnitConverter::factor(unit, unit);
    ASSERT_TRUE(factor);
    EXPECT_EQ(*factor, 1.0);
  }
}

TEST(UnitConverterTest, Factor_LinearUnits) {
  auto factor = UnitConverter::factor(Unit::Feet, Unit::Meters);
  ASSERT_TRUE(factor);
  EXPECT_DOUBLE_EQ(*factor, 0.3048);

  factor = UnitConverter::factor(Unit::Meters, Unit::Feet);
  ASSERT_TRUE(factor);
  EXPECT_NEAR(*factor, 3.28084, 1e-5);
}

TEST(UnitConverterTest, Factor_AbsentForTemperatureAndMismatch) {
  EXPECT_FALSE(
      UnitConverter::factor(Unit::DegreesCelsius, Unit::DegreesFahrenheit));
  EXPECT_FALSE(UnitConverter::factor(Unit::Psi, Unit::Meters));
}

// ----------------------------------------------------------------------------
// Convert
// ----------------------------------------------------------------------------

TEST(UnitConverterTest, Convert_Length) {
  auto result = UnitConverter::convert(1000.0, Unit::Feet, Unit::Meters);
  ASSERT_TRUE(result) << result.error().message();
  EXPECT_NEAR(*result, 304.8, 1e-9);
}

TEST(UnitConverterTest, Convert_Pressure) {
  auto result = UnitConverter::convert(100.0, Unit::Psi, Unit::Kilopascals);
  ASSERT_TRUE(result);
  EXPECT_NEAR(*result, 689.4757, 1e-4);

  result = UnitConverter::convert(1.0, Unit::Bar, Unit::Kilopascals);
  ASSERT_TRUE(result);
  EXPECT_DOUBLE_EQ(*result, 100.0);
}

TEST(UnitConverterTest, Convert_MudDensity) {
  auto result =
      UnitConverter::convert(10.0, Unit::PoundsPerGallon,
                             Unit::KilogramsPerCubicMeter);
  ASSERT_TRUE(result);
  EXPECT_NEAR(*result, 1198.26, 1e-2);
}

TEST(UnitConverterTest, Convert_FlowRate) {
  auto result = UnitConverter::convert(1.0, Unit::GallonsPerMinute,
                                       Unit::LitersPerMinute);
  ASSERT_TRUE(result);
  EXPECT_NEAR(*result, 3.785411784, 1e-9);
}

TEST(UnitConverterTest, Convert_TemperatureIsAffine) {
  auto f = UnitConverter::convert(100.0, Unit::DegreesCelsius,
                                  Unit::DegreesFahrenheit);
  ASSERT_TRUE(f);
  EXPECT_DOUBLE_EQ(*f, 212.0);

  auto c = UnitConverter::convert(32.0, Unit::DegreesFahrenheit,
                                  Unit::DegreesCelsius);
  ASSERT_TRUE(c);
  EXPECT_DOUBLE_EQ(*c, 0.0);

  c = UnitConverter::convert(-40.0, Unit::DegreesFahrenheit,
                             Unit::DegreesCelsius);
  ASSERT_TRUE(c);
  EXPECT_DOUBLE_EQ(*c, -40.0);
}

TEST(UnitConverterTest, Convert_IdentityReturnsInputExactly) {
  for (auto unit : all_units()) {
    auto result = UnitConverter::convert(1234.5678, unit, unit);
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, 1234.5678);
  }
}

TEST(UnitConverterTest, Convert_RoundTripWithinEpsilon) {
  const double values[] = {0.0, 1.0, -17.25, 3650.4, 1.0e6};

  for (auto a : all_units()) {
    for (auto b : all_units()) {
      if (!UnitConverter::is_convertible(a, b)) {
        continue;
      }
      for (double v : values) {
        auto there = UnitConverter::convert(v, a, b);
        ASSERT_TRUE(there);
        auto back = UnitConverter::convert(*there, b, a);
        ASSERT_TRUE(back);
        EXPECT_NEAR(*back, v, 1e-9 * std::max(1.0, std::abs(v)))
            << code(a) << " <-> " << code(b);
      }
    }
  }
}

TEST(UnitConverterTest, Convert_IncompatibleUnitsFails) {
  auto result = UnitConverter::convert(100.0, Unit::Psi, Unit::Meters);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), make_error_code(convert_errc::incompatible_units));
  EXPECT_FALSE(UnitConverter::is_convertible(Unit::Psi, Unit::Meters));
}

TEST(UnitConverterTest, Convert_NonFiniteValueFails) {
  auto result = UnitConverter::convert(
      std::numeric_limits<double>::infinity(), Unit::Feet, Unit::Meters);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), make_error_code(convert_errc::non_finite_value));
}

TEST(UnitConverterTest, Convert_ByLabelOrCode) {
  auto result = UnitConverter::convert(10.0, "f", "M");
  ASSERT_TRUE(result);
  EXPECT_NEAR(*result, 3.048, 1e-12);

  result = UnitConverter::convert(60.0, "FHR", "M/HR");
  ASSERT_TRUE(result);
  EXPECT_NEAR(*result, 18.288, 1e-12);
}

TEST(UnitConverterTest, Convert_UnknownUnitFails) {
  auto result = UnitConverter::convert(1.0, "FURLONG", "M");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), make_error_code(convert_errc::unknown_unit));
}

}  // namespace wits::units::test
