#include "wits/decoder/data_point.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <type_traits>

namespace wits::decoder {

std::optional<double> DataPoint::as_double() const noexcept {
  if (!parsed_value) {
    return std::nullopt;
  }
  if (const auto* i = std::get_if<int64_t>(&*parsed_value)) {
    return static_cast<double>(*i);
  }
  if (const auto* d = std::get_if<double>(&*parsed_value)) {
    return *d;
  }
  return std::nullopt;
}

const DataPoint* DecodedFrame::find(std::string_view code) const noexcept {
  auto it = std::ranges::find(data_points, code, &DataPoint::symbol_code);
  return it == data_points.end() ? nullptr : &*it;
}

std::string to_string(const Value& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<T, double>) {
          std::string text = fmt::format("{:.6f}", v);
          text.erase(text.find_last_not_of('0') + 1);
          if (text.ends_with('.')) {
            text.pop_back();
          }
          return text == "-0" ? "0" : text;
        } else {
          return fmt::format("{}", v);
        }
      },
      value);
}

std::string to_string(const std::optional<Value>& value) {
  return value ? to_string(*value) : "null";
}

}  // namespace wits::decoder
