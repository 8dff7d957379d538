#ifndef WITS_TELEMETRY_TRANSPORT_TCP_SOURCE_HPP
#define WITS_TELEMETRY_TRANSPORT_TCP_SOURCE_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include "wits/error.hpp"
#include "wits/io/tcp_socket.hpp"

namespace wits::transport {

/// @brief WITS TCP client
///
/// - 連線後可選擇送出 request payload (request/response 型的 WITS server
///   收到 "&&" 後才開始送資料)
/// - 對端關閉 (FIN) 或重置 (ECONNRESET) 都視為資料結束
///
class TcpSource {
 private:
  io::TcpSocket socket_;
  std::string host_;
  uint16_t port_;

  TcpSource(io::TcpSocket socket, std::string host, uint16_t port) noexcept
      : socket_(std::move(socket)), host_(std::move(host)), port_(port) {}

 public:
  /// @brief 預設 request payload
  inline static constexpr std::string_view kDefaultRequest = "&&\r\n";

  /// @brief 連線到 WITS server
  /// @param host 主機名稱或 IPv4
  /// @param port 埠號
  /// @param request 連線後送出的資料 (std::nullopt = 不送)
  ///
  [[nodiscard]] static Result<TcpSource> connect(
      std::string host, uint16_t port,
      std::optional<std::string> request = std::nullopt);

  [[nodiscard]] Result<size_t> read(std::span<char> buffer) noexcept;

  void close() noexcept { socket_.close(); }

  [[nodiscard]] std::string describe() const;
};

}  // namespace wits::transport

#endif
