#ifndef WITS_TELEMETRY_ERROR_HPP
#define WITS_TELEMETRY_ERROR_HPP

#include <concepts>
#include <expected>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>

namespace wits {

/// @brief 所有可能失敗操作的回傳型別
/// @tparam T 成功時的數值型別，預設為 void
///
template <typename T = void>
using Result = std::expected<T, std::error_code>;

// ----------------------------------------------------------------------------
// Error Code Conversion
// ----------------------------------------------------------------------------

/// @brief errno 轉為 generic category 的 error_code
/// @warning ev 只能為 errno
std::error_code make_error_code(int ev) noexcept;

/// @brief 可轉為 std::error_code 的錯誤來源
///
/// - std::error_code 本身
/// - errno (int)
/// - std::errc
/// - 已註冊 std::is_error_code_enum 的模組錯誤碼 (decode_errc, ...)
///
template <typename E>
concept ErrorSource =
    std::same_as<E, std::error_code> || std::same_as<E, int> ||
    std::same_as<E, std::errc> || std::is_error_code_enum_v<E>;

template <ErrorSource E>
[[nodiscard]] std::error_code to_error_code(E source) noexcept {
  if constexpr (std::same_as<E, std::error_code>) {
    return source;
  } else if constexpr (std::same_as<E, int>) {
    return wits::make_error_code(source);
  } else if constexpr (std::same_as<E, std::errc>) {
    return std::make_error_code(source);
  } else {
    return make_error_code(source);
  }
}

// ----------------------------------------------------------------------------
// Error Origin
// ----------------------------------------------------------------------------

/// @brief 錯誤源頭紀錄
struct ErrorOrigin {
  std::error_code ec;
  std::source_location location;
  std::string_view context;  ///< 靜態說明字串
  bool is_active = false;
};

/// @brief 每個執行緒最後一次 fail() 的位置
///
/// Result 只帶 error_code，發生位置與說明記錄在這裡，
/// 由最外層 (CLI) 決定是否印出。
///
class ErrorRegistry {
 private:
  static inline thread_local ErrorOrigin last_{};

 public:
  static void record(std::error_code ec, std::string_view context,
                     std::source_location location) noexcept {
    last_ = {.ec = ec, .location = location, .context = context,
             .is_active = true};
  }

  [[nodiscard]] static const ErrorOrigin& last_error() noexcept {
    return last_;
  }

  [[nodiscard]] static bool has_error() noexcept { return last_.is_active; }

  /// @brief 忽略一個已處理的錯誤時呼叫
  static void clear() noexcept { last_.is_active = false; }

  /// @brief "file:line: context ([category:value] message)"
  /// @return 沒有紀錄時返回空字串
  [[nodiscard]] static std::string describe_last_error();
};

/// @brief 在錯誤源頭建立失敗結果，並記錄發生位置
///
/// @example
///   if (n < 0) {
///     return wits::fail(errno, "read() failed");
///   }
///
template <ErrorSource E>
[[nodiscard]] auto fail(
    E source, std::string_view context = {},
    std::source_location location = std::source_location::current()) noexcept {
  std::error_code ec = to_error_code(source);
  ErrorRegistry::record(ec, context, location);
  return std::unexpected(ec);
}

}  // namespace wits

/// @brief 取出 Result 的值，失敗時直接 return 錯誤
/// @details GNU statement expression，只能用在回傳 Result 的函數中
///
/// @example
///   auto socket = WITS_TRY(io::Socket::create_tcp());
///
#define WITS_TRY(expr)                                                    \
  __extension__({                                                         \
    auto&& wits_try_result_ = (expr);                                     \
    static_assert(                                                        \
        requires {                                                        \
          wits_try_result_.error();                                       \
          wits_try_result_.has_value();                                   \
        }, "WITS_TRY() expects a std::expected");                         \
    if (!wits_try_result_) [[unlikely]] {                                 \
      return std::unexpected(std::move(wits_try_result_).error());        \
    }                                                                     \
    std::move(*wits_try_result_);                                         \
  })

/// @brief 檢查 Result<void>，失敗時直接 return 錯誤
///
/// @example
///   WITS_CHECK(socket.bind(addr));
///
#define WITS_CHECK(expr)                                                  \
  do {                                                                    \
    auto&& wits_check_result_ = (expr);                                   \
    if (!wits_check_result_) [[unlikely]] {                               \
      return std::unexpected(wits_check_result_.error());                 \
    }                                                                     \
  } while (0)

#endif
