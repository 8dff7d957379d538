#ifndef WITS_TELEMETRY_TRANSPORT_ERROR_HPP
#define WITS_TELEMETRY_TRANSPORT_ERROR_HPP

#include <cstdint>
#include <system_error>

namespace wits::transport {

/// @brief 資料來源設定錯誤碼
enum class source_errc : uint8_t {
  invalid_url = 1,     ///< 無法解析的來源 URL
  unsupported_scheme,  ///< 不是 tcp:// file:// serial://
  invalid_port,        ///< 缺少或非法的 TCP port
};

const std::error_category& source_category() noexcept;

std::error_code make_error_code(source_errc ec) noexcept;

}  // namespace wits::transport

template <>
struct std::is_error_code_enum<wits::transport::source_errc> : std::true_type {
};

#endif
