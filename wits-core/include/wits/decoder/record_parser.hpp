#ifndef WITS_TELEMETRY_DECODER_RECORD_PARSER_HPP
#define WITS_TELEMETRY_DECODER_RECORD_PARSER_HPP

#include <optional>
#include <string>
#include <string_view>

#include "wits/decoder/data_point.hpp"
#include "wits/decoder/error.hpp"
#include "wits/error.hpp"
#include "wits/symbols/catalog.hpp"
#include "wits/units/unit.hpp"

namespace wits::decoder {

// ----------------------------------------------------------------------------
// Options
// ----------------------------------------------------------------------------

/// @brief 解碼設定
struct DecodeOptions {
  units::UnitSystem units = units::UnitSystem::Field;  ///< 標示用單位制
  bool strict = false;  ///< 未知代碼是否視為嚴重錯誤 (由呼叫者決定政策)
  std::string source = "unknown";  ///< 來源描述
  std::optional<units::UnitSystem> convert_to;  ///< 解碼後換算到此單位制
};

// ----------------------------------------------------------------------------
// RecordParser
// ----------------------------------------------------------------------------

/// @brief 將一個完整 frame 解碼為 DataPoint
///
/// 流程：
/// 1. 去除前後空白，檢查 "&&" / "!!"，缺少時只回報一個錯誤
/// 2. 去掉 markers，逐行處理 (空行略過，每行去除空白與 \r)
/// 3. 前 4 字元為代碼，其餘為數值文字
/// 4. 依宣告型別轉換數值，失敗時 parsed_value 為空並記錄錯誤
/// 5. 依 DecodeOptions::units 附加單位，必要時做換算 post-pass
///
/// 單行的問題都記錄在 DecodedFrame::errors，不會中斷解碼。
/// 只有空輸入會直接失敗 (decode_errc::empty_input)。
///
/// @note 不持有狀態，可多執行緒同時使用同一個 instance
///
class RecordParser {
 private:
  const symbols::SymbolCatalog& catalog_;

 public:
  explicit RecordParser(
      const symbols::SymbolCatalog& catalog = symbols::SymbolCatalog::instance())
      : catalog_(catalog) {}

  /// @brief 解碼一個 frame
  [[nodiscard]] Result<DecodedFrame> decode(
      std::string_view frame, const DecodeOptions& options = {}) const;

  /// @brief 將 frame 中所有數值換算到 target 單位制
  /// @details 換算失敗記錄在 warnings，原數值與單位保持不變
  void convert_all(DecodedFrame& frame, units::UnitSystem target) const;

  [[nodiscard]] const symbols::SymbolCatalog& catalog() const noexcept {
    return catalog_;
  }

 private:
  void decode_line(std::string_view line, const DecodeOptions& options,
                   DecodedFrame& frame) const;
};

// ----------------------------------------------------------------------------
// Free Functions
// ----------------------------------------------------------------------------

/// @brief 將單一 DataPoint 換算到指定單位
/// @return 成功、convert_errc::incompatible_units 或 non_finite_value
/// @note 非數值或解析失敗的資料點返回 std::errc::invalid_argument
[[nodiscard]] Result<> convert_point(DataPoint& point, units::Unit target);

/// @brief 依宣告型別轉換數值文字
/// @return Value 或 decode_errc::invalid_integer / invalid_float
[[nodiscard]] Result<Value> coerce_value(std::string_view text,
                                         symbols::DataType type);

/// @brief 使用內建 catalog 解碼
[[nodiscard]] Result<DecodedFrame> decode_frame(
    std::string_view frame, const DecodeOptions& options = {});

/// @brief 組合錯誤訊息 "<category message>: <detail>"
[[nodiscard]] std::string error_text(decode_errc ec, std::string_view detail);

}  // namespace wits::decoder

#endif
