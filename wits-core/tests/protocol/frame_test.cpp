#include "wits/protocol/frame.hpp"

#include <gtest/gtest.h>

#include <string_view>

namespace wits::protocol::test {

// ----------------------------------------------------------------------------
// find_frame
// ----------------------------------------------------------------------------

TEST(FrameTest, FindFrame_Basic) {
  std::string_view text = "noise&&\n0108123\n!!tail";
  auto span = find_frame(text);
  ASSERT_TRUE(span);
  EXPECT_EQ(text.substr(span->begin, span->size()), "&&\n0108123\n!!");
  EXPECT_EQ(span->end, text.size() - 4);
}

TEST(FrameTest, FindFrame_Incomplete) {
  EXPECT_FALSE(find_frame("&&\n0108123\n"));
  EXPECT_FALSE(find_frame("0108123\n!!"));
  EXPECT_FALSE(find_frame(""));
}

TEST(FrameTest, FindFrame_EndMarkerBeforeStartIsIgnored) {
  std::string_view text = "!!&&\n0108123\n!!";
  auto span = find_frame(text);
  ASSERT_TRUE(span);
  EXPECT_EQ(span->begin, 2u);
  EXPECT_EQ(span->end, text.size());
}

TEST(FrameTest, FindFrame_NestedStartMarkerScannedLiterally) {
  // 第二個 "&&" 被包含在第一個 frame 中
  std::string_view text = "&&\n0108123\n&&\n0113456\n!!";
  auto frames = split_frames(text);
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0], text);
}

// ----------------------------------------------------------------------------
// split_frames
// ----------------------------------------------------------------------------

TEST(FrameTest, SplitFrames_Multiple) {
  std::string_view text =
      "junk&&\n0108100\n!!\r\n&&\n0108200\n!!\n&&\n0108300\n!!trailing&&";
  auto frames = split_frames(text);
  ASSERT_EQ(frames.size(), 3u);
  EXPECT_EQ(frames[0], "&&\n0108100\n!!");
  EXPECT_EQ(frames[1], "&&\n0108200\n!!");
  EXPECT_EQ(frames[2], "&&\n0108300\n!!");
}

TEST(FrameTest, SplitFrames_None) {
  EXPECT_TRUE(split_frames("010812345").empty());
  EXPECT_TRUE(split_frames("").empty());
}

TEST(FrameTest, SplitFrames_EmptyFrame) {
  auto frames = split_frames("&&!!");
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0], "&&!!");
}

// ----------------------------------------------------------------------------
// validate_frame
// ----------------------------------------------------------------------------

TEST(FrameTest, ValidateFrame) {
  EXPECT_TRUE(validate_frame("&&\n01083650.40\n!!"));
  EXPECT_TRUE(validate_frame("  &&\r\n01083650.40\r\n!!\r\n"));
  EXPECT_TRUE(validate_frame("&&!!"));
  EXPECT_FALSE(validate_frame("010812345"));
  EXPECT_FALSE(validate_frame("&&\n0108123\n"));
  EXPECT_FALSE(validate_frame("0108123\n!!"));
  EXPECT_FALSE(validate_frame("&&!"));
  EXPECT_FALSE(validate_frame(""));
}

TEST(FrameTest, Trim) {
  EXPECT_EQ(trim("  abc \r\n"), "abc");
  EXPECT_EQ(trim("\t\n"), "");
  EXPECT_EQ(trim("x"), "x");
}

}  // namespace wits::protocol::test
