#include "wits/decoder/batch.hpp"

#include <gtest/gtest.h>

#include <string>

namespace wits::decoder::test {

constexpr std::string_view kTwoFrames =
    "&&\n01083650.40\n011323.38\n!!\r\n"
    "&&\n01083651.10\n9999123\n!!\r\n";

TEST(BatchTest, DecodesEachFrameInOrder) {
  auto frames = decode_batch(kTwoFrames);
  ASSERT_TRUE(frames);
  ASSERT_EQ(frames->size(), 2u);

  EXPECT_TRUE((*frames)[0].ok());
  EXPECT_EQ((*frames)[0].data_points.size(), 2u);

  EXPECT_FALSE((*frames)[1].ok());
  EXPECT_EQ((*frames)[1].data_points.size(), 1u);
  EXPECT_EQ((*frames)[1].unknown_symbols, 1u);
  EXPECT_EQ((*frames)[1].data_points[0].raw_value, "3651.10");
}

TEST(BatchTest, NoFrameFallsBackToStructuralError) {
  auto frames = decode_batch("010812345");
  ASSERT_TRUE(frames);
  ASSERT_EQ(frames->size(), 1u);
  EXPECT_TRUE(frames->front().data_points.empty());
  EXPECT_EQ(frames->front().errors.size(), 1u);
}

TEST(BatchTest, EmptyInputFails) {
  auto frames = decode_batch("  \n");
  ASSERT_FALSE(frames);
  EXPECT_EQ(frames.error(), make_error_code(decode_errc::empty_input));
}

TEST(BatchTest, OptionsApplyToEveryFrame) {
  DecodeOptions options;
  options.units = units::UnitSystem::Metric;
  options.source = "file://batch.txt";

  auto frames = decode_batch(kTwoFrames, options);
  ASSERT_TRUE(frames);
  for (const auto& frame : *frames) {
    EXPECT_EQ(frame.source, "file://batch.txt");
    EXPECT_EQ(frame.data_points.front().unit, "M");
  }
}

TEST(BatchTest, CombineKeepsOrderAndNumbersFrames) {
  auto frames = decode_batch(kTwoFrames);
  ASSERT_TRUE(frames);

  auto view = combine(*frames);
  EXPECT_EQ(view.frame_count, 2u);
  EXPECT_FALSE(view.ok());
  EXPECT_EQ(view.unknown_symbols, 1u);

  ASSERT_EQ(view.data_points.size(), 3u);
  EXPECT_EQ(view.data_points[0].raw_value, "3650.40");
  EXPECT_EQ(view.data_points[1].symbol_code, "0113");
  EXPECT_EQ(view.data_points[2].raw_value, "3651.10");

  ASSERT_EQ(view.errors.size(), 1u);
  EXPECT_TRUE(view.errors[0].starts_with("frame 2: "));
}

TEST(BatchTest, CombineEmpty) {
  auto view = combine({});
  EXPECT_EQ(view.frame_count, 0u);
  EXPECT_TRUE(view.ok());
  EXPECT_TRUE(view.data_points.empty());
}

}  // namespace wits::decoder::test
