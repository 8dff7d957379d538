#include "wits/error.hpp"

#include <gtest/gtest.h>

#include <string>

#include "wits/decoder/error.hpp"
#include "wits/transport/error.hpp"
#include "wits/units/error.hpp"

namespace wits::test {

namespace {

Result<int> parse_positive(int value) {
  if (value <= 0) {
    return wits::fail(std::errc::invalid_argument, "value must be positive");
  }
  return value;
}

Result<int> doubled(int value) {
  int checked = WITS_TRY(parse_positive(value));
  return checked * 2;
}

Result<> verify(int value) {
  WITS_CHECK(parse_positive(value));
  return {};
}

}  // namespace

// ----------------------------------------------------------------------------
// WITS_TRY / WITS_CHECK
// ----------------------------------------------------------------------------

TEST(ErrorTest, TryUnwrapsValue) {
  auto result = doubled(21);
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, 42);
}

TEST(ErrorTest, TryPropagatesError) {
  auto result = doubled(-1);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), std::make_error_code(std::errc::invalid_argument));
}

TEST(ErrorTest, CheckPropagatesError) {
  EXPECT_TRUE(verify(1));
  EXPECT_FALSE(verify(0));
}

// ----------------------------------------------------------------------------
// ErrorRegistry
// ----------------------------------------------------------------------------

TEST(ErrorTest, RegistryCapturesOrigin) {
  ErrorRegistry::clear();
  EXPECT_TRUE(ErrorRegistry::describe_last_error().empty());

  auto result = doubled(0);
  ASSERT_FALSE(result);

  ASSERT_TRUE(ErrorRegistry::has_error());
  const auto& origin = ErrorRegistry::last_error();
  EXPECT_EQ(origin.ec, result.error());
  EXPECT_EQ(origin.context, "value must be positive");
  EXPECT_GT(origin.location.line(), 0u);

  std::string text = ErrorRegistry::describe_last_error();
  EXPECT_NE(text.find("error_test.cpp"), std::string::npos);
  EXPECT_NE(text.find("value must be positive"), std::string::npos);

  ErrorRegistry::clear();
  EXPECT_TRUE(ErrorRegistry::describe_last_error().empty());
}

TEST(ErrorTest, ErrnoMapsToGenericCategory) {
  auto ec = wits::make_error_code(ENOENT);
  EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
}

// ----------------------------------------------------------------------------
// Module Categories
// ----------------------------------------------------------------------------

TEST(ErrorTest, ModuleCategoriesHaveNames) {
  EXPECT_STREQ(
      make_error_code(decoder::decode_errc::unknown_symbol).category().name(),
      "wits.decoder");
  EXPECT_STREQ(
      make_error_code(transport::source_errc::invalid_url).category().name(),
      "wits.transport");
  EXPECT_EQ(make_error_code(decoder::decode_errc::missing_start_marker)
                .message(),
            "Missing start marker '&&'");
  EXPECT_FALSE(make_error_code(units::convert_errc::incompatible_units)
                   .message()
                   .empty());
}

}  // namespace wits::test
