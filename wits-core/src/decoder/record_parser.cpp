#include "wits/decoder/record_parser.hpp"

#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <string>

#include "wits/protocol/frame.hpp"
#include "wits/units/converter.hpp"

namespace wits::decoder {

namespace {

constexpr size_t kSnippetLength = 16;

bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

std::string_view snippet(std::string_view text) noexcept {
  return text.substr(0, kSnippetLength);
}

/// @brief 可選的正負號 + 至少一位數字 + 至多一個小數點
bool is_decimal(std::string_view text) noexcept {
  if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
    text.remove_prefix(1);
  }

  bool seen_digit = false;
  bool seen_point = false;
  for (char c : text) {
    if (is_digit(c)) {
      seen_digit = true;
    } else if (c == '.' && !seen_point) {
      seen_point = true;
    } else {
      return false;
    }
  }
  return seen_digit;
}

// from_chars 不接受前置 '+'
std::string_view strip_plus(std::string_view text) noexcept {
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  return text;
}

}  // namespace

// ----------------------------------------------------------------------------
// Free Functions
// ----------------------------------------------------------------------------

std::string error_text(decode_errc ec, std::string_view detail) {
  return fmt::format("{}: {}", make_error_code(ec).message(), detail);
}

Result<Value> coerce_value(std::string_view text, symbols::DataType type) {
  using symbols::DataType;

  switch (type) {
    case DataType::Short:
    case DataType::Long: {
      auto digits = strip_plus(text);
      if (digits.size() != text.size() &&
          (digits.empty() || !is_digit(digits.front()))) {
        return wits::fail(decode_errc::invalid_integer);
      }

      int64_t value = 0;
      auto [ptr, ec] =
          std::from_chars(digits.data(), digits.data() + digits.size(), value);
      if (digits.empty() || ec != std::errc{} ||
          ptr != digits.data() + digits.size()) {
        return wits::fail(decode_errc::invalid_integer);
      }
      return Value{value};
    }
    case DataType::Float: {
      if (!is_decimal(text)) {
        return wits::fail(decode_errc::invalid_float);
      }

      auto digits = strip_plus(text);
      double value = 0.0;
      auto [ptr, ec] =
          std::from_chars(digits.data(), digits.data() + digits.size(), value);
      if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return wits::fail(decode_errc::invalid_float);
      }
      return Value{value};
    }
    case DataType::Ascii:
      break;
  }
  return Value{std::string(text)};
}

Result<> convert_point(DataPoint& point, units::Unit target) {
  auto value = point.as_double();
  if (!value) {
    return wits::fail(std::errc::invalid_argument, "Data point is not numeric");
  }

  double converted =
      WITS_TRY(units::UnitConverter::convert(*value, point.unit_id, target));

  if (point.unit_id != target) {
    point.parsed_value = converted;
    point.unit_id = target;
    point.unit = std::string(units::label(target));
  }
  return {};
}

Result<DecodedFrame> decode_frame(std::string_view frame,
                                  const DecodeOptions& options) {
  static const RecordParser parser;
  return parser.decode(frame, options);
}

// ----------------------------------------------------------------------------
// RecordParser
// ----------------------------------------------------------------------------

Result<DecodedFrame> RecordParser::decode(std::string_view frame,
                                          const DecodeOptions& options) const {
  std::string_view text = protocol::trim(frame);
  if (text.empty()) {
    return wits::fail(decode_errc::empty_input, "Nothing to decode");
  }

  DecodedFrame result;
  result.source = options.source;
  result.timestamp = std::chrono::system_clock::now();

  if (!text.starts_with(protocol::kStartMarker)) {
    result.errors.push_back(
        error_text(decode_errc::missing_start_marker, snippet(text)));
    return result;
  }
  if (text.size() <
          protocol::kStartMarker.size() + protocol::kEndMarker.size() ||
      !text.ends_with(protocol::kEndMarker)) {
    result.errors.push_back(
        error_text(decode_errc::missing_end_marker, snippet(text)));
    return result;
  }

  text.remove_prefix(protocol::kStartMarker.size());
  text.remove_suffix(protocol::kEndMarker.size());

  while (!text.empty()) {
    size_t eol = text.find('\n');
    std::string_view line = text.substr(0, eol);
    text = eol == std::string_view::npos ? std::string_view{}
                                         : text.substr(eol + 1);

    line = protocol::trim(line);
    if (!line.empty()) {
      decode_line(line, options, result);
    }
  }

  if (options.convert_to && *options.convert_to != options.units) {
    convert_all(result, *options.convert_to);
  }
  return result;
}

void RecordParser::decode_line(std::string_view line,
                               const DecodeOptions& options,
                               DecodedFrame& frame) const {
  if (line.size() < symbols::kCodeLength) {
    frame.errors.push_back(
        error_text(decode_errc::malformed_line, fmt::format("'{}'", line)));
    return;
  }

  std::string_view code = line.substr(0, symbols::kCodeLength);
  std::string_view raw = line.substr(symbols::kCodeLength);

  auto symbol = catalog_.get(code);
  if (!symbol) {
    ++frame.unknown_symbols;
    frame.errors.push_back(error_text(decode_errc::unknown_symbol, code));
    return;
  }

  DataPoint point;
  point.symbol_code = std::string(symbol->code);
  point.symbol_name = std::string(symbol->name);
  point.symbol_description = std::string(symbol->description);
  point.record_type = symbol->record_type;
  point.raw_value = std::string(raw);
  point.unit_id = symbol->unit(options.units);
  point.unit = std::string(units::label(point.unit_id));

  auto value = coerce_value(protocol::trim(raw), symbol->type);
  if (value) {
    point.parsed_value = std::move(*value);
  } else {
    frame.errors.push_back(
        fmt::format("{}: {} '{}'", value.error().message(), code, raw));
  }

  frame.data_points.push_back(std::move(point));
}

void RecordParser::convert_all(DecodedFrame& frame,
                               units::UnitSystem target) const {
  for (auto& point : frame.data_points) {
    if (!point.is_numeric()) {
      continue;
    }

    auto symbol = catalog_.get(point.symbol_code);
    if (!symbol) {
      continue;
    }

    units::Unit to = symbol->unit(target);
    units::Unit from = point.unit_id;
    if (auto converted = convert_point(point, to); !converted) {
      frame.warnings.push_back(fmt::format(
          "Cannot convert {} from {} to {}: {}", point.symbol_code,
          units::label(from), units::label(to), converted.error().message()));
    }
  }
}

}  // namespace wits::decoder
