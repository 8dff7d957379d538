#ifndef WITS_TELEMETRY_DECODER_ERROR_HPP
#define WITS_TELEMETRY_DECODER_ERROR_HPP

#include <cstdint>
#include <system_error>

namespace wits::decoder {

/// @brief 解碼錯誤碼
enum class decode_errc : uint8_t {
  empty_input = 1,       ///< 輸入為空或只有空白
  missing_start_marker,  ///< 不是以 "&&" 開頭
  missing_end_marker,    ///< 不是以 "!!" 結尾
  unknown_symbol,        ///< catalog 中沒有此代碼
  malformed_line,        ///< 資料行不足 4 字元
  invalid_integer,       ///< 無法解析為整數
  invalid_float,         ///< 無法解析為浮點數
};

const std::error_category& decode_category() noexcept;

std::error_code make_error_code(decode_errc ec) noexcept;

}  // namespace wits::decoder

template <>
struct std::is_error_code_enum<wits::decoder::decode_errc> : std::true_type {};

#endif
