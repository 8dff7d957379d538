#ifndef WITS_TELEMETRY_TRANSPORT_SOURCE_HPP
#define WITS_TELEMETRY_TRANSPORT_SOURCE_HPP

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "wits/error.hpp"
#include "wits/transport/error.hpp"
#include "wits/transport/file_source.hpp"
#include "wits/transport/serial_source.hpp"
#include "wits/transport/string_source.hpp"
#include "wits/transport/tcp_source.hpp"

namespace wits::transport {

// ----------------------------------------------------------------------------
// Configuration
// ----------------------------------------------------------------------------

/// @brief 資料來源設定
struct SourceConfig {
  std::string url;  ///< tcp:// file:// serial://
  unsigned baud_rate = SerialSource::kDefaultBaudRate;  ///< serial 鮑率
  bool request = false;  ///< TCP 連線後是否送出 request_payload
  std::string request_payload{TcpSource::kDefaultRequest};
  size_t chunk_size = 1024;  ///< 每次 read 的緩衝大小
};

/// @brief 來源種類
enum class Scheme : uint8_t { Tcp, File, Serial };

/// @brief 解析後的來源 URL
struct SourceUrl {
  Scheme scheme;
  std::string host;  ///< Tcp
  uint16_t port{0};  ///< Tcp
  std::string path;  ///< File / Serial
};

/// @brief 解析 "tcp://host:port"、"file://path"、"serial:///dev/ttyX"
/// @return SourceUrl 或 source_errc
///
[[nodiscard]] Result<SourceUrl> parse_source_url(std::string_view url);

// ----------------------------------------------------------------------------
// Source
// ----------------------------------------------------------------------------

/// @brief 執行期選擇的資料來源 (TextSource)
class Source {
 private:
  using Variant =
      std::variant<FileSource, TcpSource, SerialSource, StringSource>;

  Variant impl_;

 public:
  template <typename S>
    requires(!std::same_as<std::remove_cvref_t<S>, Source> &&
             std::constructible_from<Variant, S&&>)
  Source(S&& source) : impl_(std::forward<S>(source)) {}

  [[nodiscard]] Result<size_t> read(std::span<char> buffer) noexcept {
    return std::visit([&](auto& s) { return s.read(buffer); }, impl_);
  }

  void close() noexcept {
    std::visit([](auto& s) noexcept { s.close(); }, impl_);
  }

  [[nodiscard]] std::string describe() const {
    return std::visit([](const auto& s) { return s.describe(); }, impl_);
  }
};

/// @brief 依設定開啟資料來源
///
/// - tcp：連線，request 為 true 時送出 request_payload
/// - file：唯讀開啟
/// - serial：以 baud_rate 開啟
///
[[nodiscard]] Result<Source> open_source(const SourceConfig& config);

}  // namespace wits::transport

#endif
