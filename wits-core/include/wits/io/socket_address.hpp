#ifndef WITS_TELEMETRY_IO_SOCKET_ADDRESS_HPP
#define WITS_TELEMETRY_IO_SOCKET_ADDRESS_HPP

#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <string>
#include <string_view>

#include "wits/error.hpp"

namespace wits::io {

/// @brief IPv4 socket 位址 (WITS 設備與 rig 網路只用 IPv4)
///
/// port 以主機位元序傳入與取出，內部保存網路位元序。
///
class SocketAddress {
 private:
  sockaddr_in addr_{};
  socklen_t length_{sizeof(sockaddr_in)};

  SocketAddress(in_addr_t host_order_ip, uint16_t port) noexcept;

 public:
  /// @brief 從點分十進位字串建立，例如 "192.168.1.100"
  [[nodiscard]] static Result<SocketAddress> from_ipv4(std::string_view ip,
                                                       uint16_t port) noexcept;

  /// @brief 從 "IP:PORT" 建立
  [[nodiscard]] static Result<SocketAddress> from_string(
      std::string_view address) noexcept;

  /// @brief 解析主機名稱或 IP，取第一個 IPv4 結果
  /// @return SocketAddress 或 host_unreachable
  [[nodiscard]] static Result<SocketAddress> resolve(std::string_view host,
                                                     uint16_t port);

  /// @brief 0.0.0.0
  [[nodiscard]] static SocketAddress any_ipv4(uint16_t port) noexcept {
    return {INADDR_ANY, port};
  }

  /// @brief 127.0.0.1
  [[nodiscard]] static SocketAddress loopback_ipv4(uint16_t port) noexcept {
    return {INADDR_LOOPBACK, port};
  }

  [[nodiscard]] bool is_ipv4() const noexcept {
    return addr_.sin_family == AF_INET;
  }

  // POSIX API 用

  [[nodiscard]] const sockaddr* raw() const noexcept {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }
  [[nodiscard]] sockaddr* raw() noexcept {
    return reinterpret_cast<sockaddr*>(&addr_);
  }
  [[nodiscard]] socklen_t length() const noexcept { return length_; }
  [[nodiscard]] socklen_t* length_ptr() noexcept { return &length_; }

  [[nodiscard]] uint16_t port() const noexcept;

  /// @brief "IP:PORT"
  [[nodiscard]] std::string to_string() const;
};

}  // namespace wits::io

#endif
