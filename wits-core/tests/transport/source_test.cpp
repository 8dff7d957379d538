#include "wits/transport/source.hpp"

#include <gtest/gtest.h>

#include <array>
#include <string>

#include "../io/test_util.hpp"

namespace wits::transport::test {

using io::test::TempFile;

namespace {

template <typename S>
std::string drain(S& source, size_t buffer_size) {
  std::string text;
  std::string buffer(buffer_size, '\0');
  while (true) {
    auto n = source.read(buffer);
    if (!n || *n == 0) break;
    text.append(buffer.data(), *n);
  }
  return text;
}

}  // namespace

// ----------------------------------------------------------------------------
// URL Parsing
// ----------------------------------------------------------------------------

TEST(SourceUrlTest, ParsesTcp) {
  auto url = parse_source_url("tcp://192.168.1.100:12345");
  ASSERT_TRUE(url);
  EXPECT_EQ(url->scheme, Scheme::Tcp);
  EXPECT_EQ(url->host, "192.168.1.100");
  EXPECT_EQ(url->port, 12345);
}

TEST(SourceUrlTest, ParsesFileAndSerial) {
  auto file = parse_source_url("file://logs/drilling.wits");
  ASSERT_TRUE(file);
  EXPECT_EQ(file->scheme, Scheme::File);
  EXPECT_EQ(file->path, "logs/drilling.wits");

  auto serial = parse_source_url("serial:///dev/ttyUSB0");
  ASSERT_TRUE(serial);
  EXPECT_EQ(serial->scheme, Scheme::Serial);
  EXPECT_EQ(serial->path, "/dev/ttyUSB0");
}

TEST(SourceUrlTest, RejectsBadUrls) {
  EXPECT_EQ(parse_source_url("http://rig:80").error(),
            source_errc::unsupported_scheme);
  EXPECT_EQ(parse_source_url("drilling.wits").error(),
            source_errc::unsupported_scheme);
  EXPECT_EQ(parse_source_url("tcp://rig").error(), source_errc::invalid_port);
  EXPECT_EQ(parse_source_url("tcp://rig:0").error(),
            source_errc::invalid_port);
  EXPECT_EQ(parse_source_url("tcp://rig:70000").error(),
            source_errc::invalid_port);
  EXPECT_EQ(parse_source_url("file://").error(), source_errc::invalid_url);
  EXPECT_EQ(parse_source_url("serial://").error(), source_errc::invalid_url);
}

// ----------------------------------------------------------------------------
// StringSource
// ----------------------------------------------------------------------------

TEST(StringSourceTest, ReadsInChunks) {
  StringSource source("&&\n01081\n!!", 4, "test");
  EXPECT_EQ(source.describe(), "test");
  EXPECT_EQ(source.remaining(), 11u);

  std::array<char, 16> buffer{};
  auto n = source.read(buffer);
  ASSERT_TRUE(n);
  EXPECT_EQ(*n, 4u);
  EXPECT_EQ(std::string_view(buffer.data(), *n), "&&\n0");
  EXPECT_EQ(source.remaining(), 7u);

  EXPECT_EQ(drain(source, 2), "1081\n!!");
  EXPECT_EQ(source.remaining(), 0u);
}

TEST(StringSourceTest, CloseEndsStream) {
  StringSource source("&&\n01081\n!!");
  source.close();

  std::array<char, 8> buffer{};
  auto n = source.read(buffer);
  ASSERT_TRUE(n);
  EXPECT_EQ(*n, 0u);
}

// ----------------------------------------------------------------------------
// FileSource
// ----------------------------------------------------------------------------

TEST(FileSourceTest, ReadsWholeFile) {
  TempFile temp;
  ASSERT_TRUE(temp.is_valid());
  ASSERT_TRUE(temp.write_content("&&\n01083650.40\n!!\n"));

  auto source = FileSource::open(temp.path());
  ASSERT_TRUE(source);
  EXPECT_EQ(source->describe(), "file://" + temp.path());
  EXPECT_EQ(drain(*source, 5), "&&\n01083650.40\n!!\n");

  source->close();
  std::array<char, 4> buffer{};
  auto n = source->read(buffer);
  ASSERT_TRUE(n);
  EXPECT_EQ(*n, 0u);
}

TEST(FileSourceTest, MissingFileFails) {
  auto source = FileSource::open("/nonexistent/drilling.wits");
  ASSERT_FALSE(source);
  EXPECT_EQ(source.error(), std::errc::no_such_file_or_directory);
}

// ----------------------------------------------------------------------------
// open_source
// ----------------------------------------------------------------------------

TEST(OpenSourceTest, OpensFileUrl) {
  TempFile temp;
  ASSERT_TRUE(temp.is_valid());
  ASSERT_TRUE(temp.write_content("&&\n01132\n!!"));

  SourceConfig config;
  config.url = "file://" + temp.path();

  auto source = open_source(config);
  ASSERT_TRUE(source);
  EXPECT_EQ(source->describe(), config.url);
  EXPECT_EQ(drain(*source, 64), "&&\n01132\n!!");
}

TEST(OpenSourceTest, PropagatesErrors) {
  SourceConfig config;

  config.url = "udp://rig:5000";
  EXPECT_EQ(open_source(config).error(), source_errc::unsupported_scheme);

  config.url = "file:///nonexistent/drilling.wits";
  EXPECT_EQ(open_source(config).error(),
            std::errc::no_such_file_or_directory);

  config.url = "serial:///dev/ttyUSB0";
  config.baud_rate = 1234;
  EXPECT_EQ(open_source(config).error(), std::errc::invalid_argument);
}

TEST(OpenSourceTest, WrapsStringSource) {
  Source source(StringSource("&&\n!!", 2, "memory"));
  EXPECT_EQ(source.describe(), "memory");
  EXPECT_EQ(drain(source, 1), "&&\n!!");
}

}  // namespace wits::transport::test
