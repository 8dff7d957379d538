#ifndef WITS_TELEMETRY_CLI_CONSOLE_HPP
#define WITS_TELEMETRY_CLI_CONSOLE_HPP

#include <fmt/format.h>

#include <cstdio>
#include <span>
#include <string_view>
#include <system_error>
#include <utility>

#include "wits/decoder/data_point.hpp"

namespace wits::cli {

/// @brief 輸出格式
enum class Format { Table, Raw, Json };

// ----------------------------------------------------------------------------
// Diagnostics (stderr)
// ----------------------------------------------------------------------------

template <typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
  fmt::print(stderr, "error: ");
  fmt::print(stderr, format, std::forward<Args>(args)...);
  std::fputc('\n', stderr);
}

template <typename... Args>
void warning(fmt::format_string<Args...> format, Args&&... args) {
  fmt::print(stderr, "warning: ");
  fmt::print(stderr, format, std::forward<Args>(args)...);
  std::fputc('\n', stderr);
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
  fmt::print(stderr, "info: ");
  fmt::print(stderr, format, std::forward<Args>(args)...);
  std::fputc('\n', stderr);
}

/// @brief 回報失敗的 Result，附上 ErrorRegistry 記錄的錯誤源頭
void report(std::string_view what, const std::error_code& ec);

// ----------------------------------------------------------------------------
// Data Output (stdout)
// ----------------------------------------------------------------------------

/// @brief 印出資料點
/// @details Table 為對齊的表格，Raw 為每行 "code<TAB>name<TAB>value<TAB>unit"
void print_points(std::span<const decoder::DataPoint> points, Format format);

/// @brief 印出一個 frame 的資料點與錯誤
void print_frame(const decoder::DecodedFrame& frame, Format format);

}  // namespace wits::cli

#endif
