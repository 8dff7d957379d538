#include "wits/units/error.hpp"

#include <string>

namespace wits::units {

const std::error_category& convert_category() noexcept {
  static const struct : public std::error_category {
    const char* name() const noexcept override { return "wits.units"; }
    std::string message(int ev) const override {
      switch (static_cast<convert_errc>(ev)) {
        case convert_errc::incompatible_units:
          return "Units are not in the same category";
        case convert_errc::unknown_unit:
          return "Unknown unit";
        case convert_errc::non_finite_value:
          return "Value is not finite";
        default:
          return "Unknown unit conversion error";
      }
    }
  } instance;

  return instance;
}

std::error_code make_error_code(convert_errc ec) noexcept {
  return {static_cast<int>(ec), convert_category()};
}

}  // namespace wits::units
