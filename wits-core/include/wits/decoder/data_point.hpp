#ifndef WITS_TELEMETRY_DECODER_DATA_POINT_HPP
#define WITS_TELEMETRY_DECODER_DATA_POINT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "wits/units/unit.hpp"

namespace wits::decoder {

/// @brief 解析後的數值：整數、浮點數或字串
using Value = std::variant<int64_t, double, std::string>;

/// @brief 一筆量測資料
struct DataPoint {
  std::string symbol_code;             ///< 4 字元代碼
  std::string symbol_name;             ///< 助記名稱
  std::string symbol_description;      ///< 說明
  int record_type{0};                  ///< code 前兩位
  std::string raw_value;               ///< 原始文字
  std::optional<Value> parsed_value;   ///< 解析失敗時為空
  std::string unit;                    ///< 單位標籤，例如 "F"
  units::Unit unit_id{units::Unit::Unitless};

  /// @brief 是否為數值 (整數或浮點數)
  [[nodiscard]] bool is_numeric() const noexcept {
    return parsed_value && !std::holds_alternative<std::string>(*parsed_value);
  }

  /// @brief 數值轉為 double
  /// @return 非數值時返回 std::nullopt
  [[nodiscard]] std::optional<double> as_double() const noexcept;
};

/// @brief 一個 frame 的解碼結果
///
/// data_points 與原始 frame 的行順序一致。
///
struct DecodedFrame {
  std::string source;                               ///< 來源描述
  std::chrono::system_clock::time_point timestamp;  ///< 解碼時間
  std::vector<DataPoint> data_points;
  std::vector<std::string> errors;    ///< 結構、代碼、數值錯誤
  std::vector<std::string> warnings;  ///< 單位換算問題
  size_t unknown_symbols{0};          ///< 未知代碼的行數

  [[nodiscard]] bool ok() const noexcept { return errors.empty(); }

  /// @brief 依代碼找第一筆資料
  [[nodiscard]] const DataPoint* find(std::string_view code) const noexcept;
};

/// @brief 數值轉字串
/// @details 整數原樣輸出，浮點數最多 6 位小數並去除尾端 0，字串原樣輸出
[[nodiscard]] std::string to_string(const Value& value);

/// @brief 同上，空值輸出 "null"
[[nodiscard]] std::string to_string(const std::optional<Value>& value);

}  // namespace wits::decoder

#endif
