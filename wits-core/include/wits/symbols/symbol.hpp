#ifndef WITS_TELEMETRY_SYMBOLS_SYMBOL_HPP
#define WITS_TELEMETRY_SYMBOLS_SYMBOL_HPP

#include <cstdint>
#include <string_view>

#include "wits/units/unit.hpp"

namespace wits::symbols {

/// @brief 代碼長度：2 位 record type + 2 位 channel
inline constexpr size_t kCodeLength = 4;

/// @brief WITS 宣告的數值型別
enum class DataType : uint8_t {
  Ascii,  ///< A: 字串
  Short,  ///< S: 短整數
  Long,   ///< L: 長整數
  Float,  ///< F: 浮點數
};

/// @brief WITS 型別代碼 ("A", "S", "L", "F")
[[nodiscard]] constexpr std::string_view code(DataType type) noexcept {
  switch (type) {
    case DataType::Ascii:
      return "A";
    case DataType::Short:
      return "S";
    case DataType::Long:
      return "L";
    case DataType::Float:
      return "F";
  }
  return "?";
}

[[nodiscard]] constexpr bool is_integer(DataType type) noexcept {
  return type == DataType::Short || type == DataType::Long;
}

/// @brief 兩位數字 record type 解析
/// @return 非數字時返回 -1
[[nodiscard]] constexpr int parse_record_type(std::string_view code) noexcept {
  if (code.size() < 2 || code[0] < '0' || code[0] > '9' || code[1] < '0' ||
      code[1] > '9') {
    return -1;
  }
  return (code[0] - '0') * 10 + (code[1] - '0');
}

/// @brief 一個量測通道的靜態定義
/// @details record_type 一律由 code 前兩位推得
struct Symbol {
  std::string_view code;         ///< 4 字元代碼，例如 "0108"
  int record_type;               ///< code 前兩位的數值
  std::string_view name;         ///< 助記名稱，例如 "DBTM"
  std::string_view description;  ///< 說明，例如 "Depth Bit (meas)"
  DataType type;                 ///< 宣告型別
  units::Unit metric_unit;       ///< 公制單位
  units::Unit field_unit;        ///< 英制單位

  constexpr Symbol(std::string_view code, std::string_view name,
                   std::string_view description, DataType type,
                   units::Unit metric_unit, units::Unit field_unit) noexcept
      : code(code),
        record_type(parse_record_type(code)),
        name(name),
        description(description),
        type(type),
        metric_unit(metric_unit),
        field_unit(field_unit) {}

  /// @brief code 後兩位的 channel 編號
  [[nodiscard]] constexpr int channel() const noexcept {
    return parse_record_type(code.substr(2));
  }

  /// @brief 依單位制選擇單位
  [[nodiscard]] constexpr units::Unit unit(
      units::UnitSystem system) const noexcept {
    return system == units::UnitSystem::Metric ? metric_unit : field_unit;
  }
};

}  // namespace wits::symbols

#endif
