#ifndef WITS_TELEMETRY_UNITS_ERROR_HPP
#define WITS_TELEMETRY_UNITS_ERROR_HPP

#include <cstdint>
#include <system_error>

namespace wits::units {

/// @brief 單位轉換錯誤碼
enum class convert_errc : uint8_t {
  incompatible_units = 1,  ///< 不同類別的單位
  unknown_unit,            ///< 無法識別的單位
  non_finite_value,        ///< NaN 或 Inf
};

const std::error_category& convert_category() noexcept;

std::error_code make_error_code(convert_errc ec) noexcept;

}  // namespace wits::units

template <>
struct std::is_error_code_enum<wits::units::convert_errc> : std::true_type {};

#endif
