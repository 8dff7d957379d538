#include "wits/units/unit.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "unit_table.hpp"

namespace wits::units {

namespace {

constexpr std::array kAllUnits = [] {
  std::array<Unit, detail::kUnitTable.size()> units{};
  for (size_t i = 0; i < units.size(); ++i) {
    units[i] = detail::kUnitTable[i].unit;
  }
  return units;
}();

bool iequals(std::string_view a, std::string_view b) noexcept {
  return std::ranges::equal(a, b, [](char x, char y) {
    return std::toupper(static_cast<unsigned char>(x)) ==
           std::toupper(static_cast<unsigned char>(y));
  });
}

}  // namespace

std::string_view code(Unit unit) noexcept {
  return detail::info(unit).code;
}

std::string_view label(Unit unit) noexcept {
  return detail::info(unit).label;
}

std::string_view name(Category category) noexcept {
  switch (category) {
    case Category::Length:
      return "length";
    case Category::DrillingRate:
      return "drilling rate";
    case Category::Pressure:
      return "pressure";
    case Category::FlowRate:
      return "flow rate";
    case Category::Density:
      return "density";
    case Category::Temperature:
      return "temperature";
    case Category::Force:
      return "force";
    case Category::Torque:
      return "torque";
    case Category::Volume:
      return "volume";
    case Category::Angle:
      return "angle";
    case Category::DoglegSeverity:
      return "dogleg severity";
    case Category::RotarySpeed:
      return "rotary speed";
    case Category::StrokeRate:
      return "stroke rate";
    case Category::Time:
      return "time";
    case Category::Resistivity:
      return "resistivity";
    case Category::Conductivity:
      return "conductivity";
    case Category::Radioactivity:
      return "radioactivity";
    case Category::Concentration:
      return "concentration";
    case Category::Dimensionless:
      return "dimensionless";
  }
  return "unknown";
}

std::string_view name(UnitSystem system) noexcept {
  return system == UnitSystem::Metric ? "metric" : "fps";
}

std::optional<Unit> parse_unit(std::string_view text) noexcept {
  for (const auto& entry : detail::kUnitTable) {
    if (iequals(text, entry.code) || iequals(text, entry.label)) {
      return entry.unit;
    }
  }
  return std::nullopt;
}

std::span<const Unit> all_units() noexcept { return kAllUnits; }

}  // namespace wits::units
