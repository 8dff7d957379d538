#include "wits/units/converter.hpp"

#include <cmath>

#include "unit_table.hpp"

namespace wits::units {

Category UnitConverter::category(Unit unit) noexcept {
  return detail::info(unit).category;
}

bool UnitConverter::is_convertible(Unit from, Unit to) noexcept {
  return category(from) == category(to);
}

double UnitConverter::to_base(Unit unit) noexcept {
  return detail::info(unit).to_base;
}

std::optional<double> UnitConverter::factor(Unit from, Unit to) noexcept {
  if (from == to) {
    return 1.0;
  }
  if (!is_convertible(from, to) || category(from) == Category::Temperature) {
    return std::nullopt;
  }
  return to_base(from) / to_base(to);
}

Result<double> UnitConverter::convert(double value, Unit from,
                                      Unit to) noexcept {
  if (!is_convertible(from, to)) {
    return wits::fail(convert_errc::incompatible_units,
                      "Cannot convert between unit categories");
  }
  if (from == to) {
    return value;
  }
  if (!std::isfinite(value)) {
    return wits::fail(convert_errc::non_finite_value);
  }

  if (category(from) == Category::Temperature) {
    if (from == Unit::DegreesCelsius) {
      return value * 9.0 / 5.0 + 32.0;
    }
    return (value - 32.0) * 5.0 / 9.0;
  }

  // from -> 基準單位 -> to
  return value * to_base(from) / to_base(to);
}

Result<double> UnitConverter::convert(double value, std::string_view from,
                                      std::string_view to) noexcept {
  auto from_unit = parse_unit(from);
  if (!from_unit) {
    return wits::fail(convert_errc::unknown_unit, "Unknown source unit");
  }
  auto to_unit = parse_unit(to);
  if (!to_unit) {
    return wits::fail(convert_errc::unknown_unit, "Unknown target unit");
  }
  return convert(value, *from_unit, *to_unit);
}

}  // namespace wits::units
