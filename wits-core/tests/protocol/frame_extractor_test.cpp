#include "wits/protocol/frame_extractor.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

namespace wits::protocol::test {

namespace {

constexpr std::string_view kStream =
    "garbage before\r\n"
    "&&\n0108100.5\n0113 25.1\n!!\r\n"
    "&&\n0108101.0\n!!"
    "noise between"
    "&&\n0108102.5\n0114230\n!!\n"
    "&&\n0108103";  // 未完成

/// @brief 以固定大小切分後餵入，收集所有 frame
std::vector<std::string> extract(std::string_view input, size_t chunk_size) {
  FrameExtractor extractor;
  std::vector<std::string> frames;

  for (size_t pos = 0; pos < input.size(); pos += chunk_size) {
    extractor.feed(input.substr(pos, chunk_size));
    while (auto frame = extractor.next_frame()) {
      frames.push_back(std::move(*frame));
    }
  }
  return frames;
}

}  // namespace

TEST(FrameExtractorTest, ExtractsCompleteFramesInOrder) {
  auto frames = extract(kStream, kStream.size());

  ASSERT_EQ(frames.size(), 3u);
  EXPECT_EQ(frames[0], "&&\n0108100.5\n0113 25.1\n!!");
  EXPECT_EQ(frames[1], "&&\n0108101.0\n!!");
  EXPECT_EQ(frames[2], "&&\n0108102.5\n0114230\n!!");
}

TEST(FrameExtractorTest, ChunkBoundaryIndependent) {
  auto expected = extract(kStream, kStream.size());

  for (size_t chunk : {1u, 2u, 3u, 5u, 7u, 13u, 1000u}) {
    EXPECT_EQ(extract(kStream, chunk), expected) << "chunk size " << chunk;
  }
}

TEST(FrameExtractorTest, GarbageNeverAppearsInFrames) {
  for (const auto& frame : extract(kStream, 3)) {
    EXPECT_EQ(frame.find("garbage"), std::string::npos);
    EXPECT_EQ(frame.find("noise"), std::string::npos);
    EXPECT_TRUE(frame.starts_with("&&"));
    EXPECT_TRUE(frame.ends_with("!!"));
  }
}

TEST(FrameExtractorTest, PartialFrameStaysBuffered) {
  FrameExtractor extractor;
  extractor.feed("xx&&\n0108");
  EXPECT_FALSE(extractor.next_frame());
  EXPECT_EQ(extractor.buffered(), 7u);  // 前綴雜訊已丟棄

  extractor.feed("123\n!");
  EXPECT_FALSE(extractor.next_frame());

  extractor.feed("!");
  auto frame = extractor.next_frame();
  ASSERT_TRUE(frame);
  EXPECT_EQ(*frame, "&&\n0108123\n!!");
  EXPECT_EQ(extractor.buffered(), 0u);
}

TEST(FrameExtractorTest, SplitStartMarkerIsKept) {
  FrameExtractor extractor;
  extractor.feed("noise&");
  EXPECT_FALSE(extractor.next_frame());
  EXPECT_EQ(extractor.buffered(), 1u);

  extractor.feed("&\n0108123\n!!");
  auto frame = extractor.next_frame();
  ASSERT_TRUE(frame);
  EXPECT_EQ(*frame, "&&\n0108123\n!!");
}

TEST(FrameExtractorTest, GarbageWithoutMarkerIsDiscarded) {
  FrameExtractor extractor;
  extractor.feed("no markers here at all");
  EXPECT_FALSE(extractor.next_frame());
  EXPECT_EQ(extractor.buffered(), 0u);
}

TEST(FrameExtractorTest, ClearDropsPartialFrame) {
  FrameExtractor extractor;
  extractor.feed("&&\n0108123\n");
  EXPECT_FALSE(extractor.next_frame());
  extractor.clear();
  EXPECT_EQ(extractor.buffered(), 0u);

  extractor.feed("!!");
  EXPECT_FALSE(extractor.next_frame());
}

TEST(FrameExtractorTest, LongFrameFedByteByByte) {
  std::string body;
  for (int i = 0; i < 20000; ++i) {
    body += "0108123.4\n";
  }
  // 內含單一 '!'，不可被當成 end marker
  const std::string input = "junk&&\n" + body + "!\n" + body + "!!tail&&";

  FrameExtractor extractor;
  std::vector<std::string> frames;
  for (char c : input) {
    extractor.feed(std::string_view(&c, 1));
    while (auto frame = extractor.next_frame()) {
      frames.push_back(std::move(*frame));
    }
  }

  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0], "&&\n" + body + "!\n" + body + "!!");
  EXPECT_EQ(extractor.buffered(), 2u);  // 結尾的 "&&" 等待下一個 frame
}

TEST(FrameExtractorTest, EndMarkerRightAfterStartMarker) {
  FrameExtractor extractor;
  extractor.feed("&&!");
  EXPECT_FALSE(extractor.next_frame());

  extractor.feed("!&&\n0108");
  auto frame = extractor.next_frame();
  ASSERT_TRUE(frame);
  EXPECT_EQ(*frame, "&&!!");
  EXPECT_FALSE(extractor.next_frame());

  extractor.feed("1\n!!");
  frame = extractor.next_frame();
  ASSERT_TRUE(frame);
  EXPECT_EQ(*frame, "&&\n01081\n!!");
}

TEST(FrameExtractorTest, FreshInstanceReproducesOutput) {
  EXPECT_EQ(extract(kStream, 4), extract(kStream, 4));
}

}  // namespace wits::protocol::test
