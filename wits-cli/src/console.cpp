#include "console.hpp"

#include <string>

#include "wits/error.hpp"

namespace wits::cli {

namespace {

constexpr size_t kDescriptionWidth = 28;

std::string_view clip(std::string_view text, size_t width) noexcept {
  return text.size() <= width ? text : text.substr(0, width);
}

}  // namespace

void report(std::string_view what, const std::error_code& ec) {
  error("{}: {}", what, ec.message());

  std::string origin = ErrorRegistry::describe_last_error();
  if (!origin.empty()) {
    fmt::print(stderr, "  at {}\n", origin);
  }
  ErrorRegistry::clear();
}

void print_points(std::span<const decoder::DataPoint> points, Format format) {
  if (format == Format::Raw) {
    for (const auto& point : points) {
      fmt::print("{}\t{}\t{}\t{}\n", point.symbol_code, point.symbol_name,
                 decoder::to_string(point.parsed_value), point.unit);
    }
    return;
  }

  fmt::print("{:<6} {:<6} {:<28} {:>14} {:<10}\n", "Code", "Name",
             "Description", "Value", "Unit");
  fmt::print("{:-<68}\n", "");
  for (const auto& point : points) {
    fmt::print("{:<6} {:<6} {:<28} {:>14} {:<10}\n", point.symbol_code,
               point.symbol_name,
               clip(point.symbol_description, kDescriptionWidth),
               decoder::to_string(point.parsed_value), point.unit);
  }
}

void print_frame(const decoder::DecodedFrame& frame, Format format) {
  if (format == Format::Table) {
    fmt::print("Source: {}  Points: {}\n", frame.source,
               frame.data_points.size());
  }
  print_points(frame.data_points, format);

  for (const auto& message : frame.errors) {
    error("{}", message);
  }
  for (const auto& message : frame.warnings) {
    warning("{}", message);
  }
}

}  // namespace wits::cli
