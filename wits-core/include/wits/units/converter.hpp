#ifndef WITS_TELEMETRY_UNITS_CONVERTER_HPP
#define WITS_TELEMETRY_UNITS_CONVERTER_HPP

#include <optional>

#include "wits/error.hpp"
#include "wits/units/error.hpp"
#include "wits/units/unit.hpp"

namespace wits::units {

/// @brief 單位換算
///
/// - 同類別單位才可互轉 (is_convertible)
/// - 線性類別：value × factor(from, to)，factor 以類別基準單位計算
/// - 溫度為仿射轉換：°F = °C × 9/5 + 32，°C = (°F − 32) × 5/9
/// - 相同單位直接返回原值 (factor = 1.0)
///
/// 換算表為唯讀靜態資料，可多執行緒同時使用。
///
class UnitConverter {
 public:
  /// @brief 取得單位所屬類別
  [[nodiscard]] static Category category(Unit unit) noexcept;

  /// @brief 兩個單位是否屬於同一類別
  [[nodiscard]] static bool is_convertible(Unit from, Unit to) noexcept;

  /// @brief 線性換算係數
  /// @return from == to 時為 1.0；溫度或不同類別時返回 std::nullopt
  [[nodiscard]] static std::optional<double> factor(Unit from,
                                                    Unit to) noexcept;

  /// @brief 換算數值
  /// @return 換算結果，或 convert_errc::incompatible_units /
  /// convert_errc::non_finite_value
  [[nodiscard]] static Result<double> convert(double value, Unit from,
                                              Unit to) noexcept;

  /// @brief 以字串 (代碼或標籤) 指定單位的換算
  /// @return 無法識別單位時返回 convert_errc::unknown_unit
  [[nodiscard]] static Result<double> convert(double value,
                                              std::string_view from,
                                              std::string_view to) noexcept;

 private:
  /// @brief 單位相對於類別基準單位的倍率
  [[nodiscard]] static double to_base(Unit unit) noexcept;
};

}  // namespace wits::units

#endif
