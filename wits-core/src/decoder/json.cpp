#include "wits/decoder/json.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <ctime>
#include <nlohmann/json.hpp>
#include <variant>

namespace wits::decoder {

namespace {

nlohmann::json point_entry(const DataPoint& point) {
  return {
      {"name", point.symbol_name},
      {"description", point.symbol_description},
      {"value", to_json(point.parsed_value)},
      {"raw_value", point.raw_value},
      {"unit", point.unit},
  };
}

nlohmann::json keyed_points(std::span<const DataPoint> points) {
  auto data = nlohmann::json::object();
  for (const auto& point : points) {
    data[point.symbol_code] = point_entry(point);
  }
  return data;
}

}  // namespace

nlohmann::json to_json(const std::optional<Value>& value) {
  if (!value) {
    return nullptr;
  }
  return std::visit([](const auto& v) { return nlohmann::json(v); }, *value);
}

nlohmann::json to_json(const DecodedFrame& frame) {
  return {
      {"timestamp", format_timestamp(frame.timestamp)},
      {"source", frame.source},
      {"frames", 1},
      {"data", keyed_points(frame.data_points)},
      {"errors", frame.errors},
      {"warnings", frame.warnings},
  };
}

nlohmann::json to_json(const CombinedView& view) {
  return {
      {"timestamp", format_timestamp(view.timestamp)},
      {"source", view.source},
      {"frames", view.frame_count},
      {"data", keyed_points(view.data_points)},
      {"errors", view.errors},
      {"warnings", view.warnings},
  };
}

nlohmann::json to_json(std::span<const DecodedFrame> frames,
                       std::string_view source) {
  auto data = nlohmann::json::array();
  size_t index = 0;
  for (const auto& frame : frames) {
    auto points = nlohmann::json::array();
    for (const auto& point : frame.data_points) {
      points.push_back({
          {"symbol_code", point.symbol_code},
          {"symbol_name", point.symbol_name},
          {"value", to_json(point.parsed_value)},
          {"unit", point.unit},
      });
    }
    data.push_back({
        {"frame", ++index},
        {"timestamp", format_timestamp(frame.timestamp)},
        {"data_points", std::move(points)},
        {"errors", frame.errors},
    });
  }

  return {
      {"source", std::string(source)},
      {"frames", frames.size()},
      {"data", std::move(data)},
  };
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
  using namespace std::chrono;

  auto whole = floor<seconds>(time);
  auto millis = duration_cast<milliseconds>(time - whole).count();

  std::time_t t = system_clock::to_time_t(whole);
  std::tm utc{};
  ::gmtime_r(&t, &utc);
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", utc, millis);
}

}  // namespace wits::decoder
