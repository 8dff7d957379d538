#ifndef WITS_TELEMETRY_IO_TCP_SOCKET_HPP
#define WITS_TELEMETRY_IO_TCP_SOCKET_HPP

#include <span>
#include <utility>

#include "wits/error.hpp"
#include "wits/io/socket.hpp"
#include "wits/io/socket_address.hpp"

namespace wits::io {

/// @brief TCP 連線 (client 或 listening server)
class TcpSocket {
 private:
  Socket socket_;

  explicit TcpSocket(Socket socket) noexcept : socket_(std::move(socket)) {}

 public:
  // ----------------------------------------------------------------------------
  // Factory Methods
  // ----------------------------------------------------------------------------

  /// @brief 建立 TCP Client 連線
  /// @param remote_addr 遠端地址
  /// @param nodelay 是否禁用 Nagle 算法
  /// @return TcpSocket 或錯誤
  [[nodiscard]] static Result<TcpSocket> connect(
      const SocketAddress& remote_addr, bool nodelay = true) noexcept;

  /// @brief 建立 TCP Server 監聽
  /// @param local_addr 本地綁定地址 (port 0 由系統分配)
  /// @param backlog 連線佇列大小
  /// @return TcpSocket（處於監聽狀態）或錯誤
  [[nodiscard]] static Result<TcpSocket> serve(const SocketAddress& local_addr,
                                               int backlog = 16) noexcept;

  // ----------------------------------------------------------------------------
  // RAII
  // ----------------------------------------------------------------------------

  ~TcpSocket() noexcept = default;
  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;
  TcpSocket(TcpSocket&&) noexcept = default;
  TcpSocket& operator=(TcpSocket&&) noexcept = default;

  // ----------------------------------------------------------------------------
  // Server 端操作
  // ----------------------------------------------------------------------------

  /// @brief 接受新連線
  /// @param client_addr 客戶端地址（可選）
  /// @return 新的 TcpSocket（代表客戶端連線）
  [[nodiscard]] Result<TcpSocket> accept(
      SocketAddress* client_addr = nullptr) noexcept;

  // ----------------------------------------------------------------------------
  // I/O 操作
  // ----------------------------------------------------------------------------

  [[nodiscard]] Result<size_t> send(std::span<const char> data) noexcept {
    return socket_.send(data);
  }

  /// @brief 送出全部資料 (partial send 自動續送)
  [[nodiscard]] Result<> send_all(std::span<const char> data) noexcept;

  /// @brief 接收數據 (0 = 對端關閉連線)
  [[nodiscard]] Result<size_t> recv(std::span<char> buffer) noexcept {
    return socket_.recv(buffer);
  }

  // ----------------------------------------------------------------------------
  // 查詢函數
  // ----------------------------------------------------------------------------

  [[nodiscard]] bool is_valid() const noexcept { return socket_.is_valid(); }

  [[nodiscard]] Result<SocketAddress> local_address() const noexcept {
    return socket_.local_address();
  }

  void close() noexcept { socket_.close(); }
};

}  // namespace wits::io

#endif
