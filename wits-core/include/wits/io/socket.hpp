#ifndef WITS_TELEMETRY_IO_SOCKET_HPP
#define WITS_TELEMETRY_IO_SOCKET_HPP

#include <cstddef>
#include <span>

#include "wits/error.hpp"
#include "wits/io/socket_address.hpp"

namespace wits::io {

/// @brief RAII Socket 封裝
/// @details Move-Only type，自動管理 file descriptor 生命週期
class Socket {
 private:
  int fd_{-1};

  explicit Socket(int fd) noexcept : fd_(fd) {}

 public:
  // ----------------------------------------------------------------------------
  // Factory Methods
  // ----------------------------------------------------------------------------

  /// @brief 建立 TCP Socket
  [[nodiscard]] static Result<Socket> create_tcp() noexcept;

  // ----------------------------------------------------------------------------
  // RAII
  // ----------------------------------------------------------------------------

  ~Socket() noexcept;
  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;
  Socket(Socket&& other) noexcept;
  Socket& operator=(Socket&& other) noexcept;

  // ----------------------------------------------------------------------------
  // Socket 操作
  // ----------------------------------------------------------------------------

  /// @brief 綁定到本地地址
  [[nodiscard]] Result<> bind(const SocketAddress& addr) noexcept;

  /// @brief 開始監聽
  /// @param backlog 連線佇列大小
  [[nodiscard]] Result<> listen(int backlog) noexcept;

  /// @brief 接收新連線 (TCP Server)
  /// @return 新的 Socket (客戶端連線)
  [[nodiscard]] Result<Socket> accept(
      SocketAddress* client_addr = nullptr) noexcept;

  /// @brief 連線到遠端 (TCP Client)
  [[nodiscard]] Result<> connect(const SocketAddress& addr) noexcept;

  // ----------------------------------------------------------------------------
  // I/O 操作
  // ----------------------------------------------------------------------------

  /// @brief 發送數據
  /// @return 實際發送的位元組數 (可能 < data.size())
  [[nodiscard]] Result<size_t> send(std::span<const char> data) noexcept;

  /// @brief 接收數據
  /// @return 實際接收的位元組數 (0 = 對端關閉連線 FIN)
  [[nodiscard]] Result<size_t> recv(std::span<char> buffer) noexcept;

  // ----------------------------------------------------------------------------
  // Socket 選項
  // ----------------------------------------------------------------------------

  /// @brief 設定 SO_REUSEADDR（允許埠號快速重用）
  [[nodiscard]] Result<> set_reuseaddr(bool enable) noexcept;

  /// @brief 設定 TCP_NODELAY（禁用 Nagle 算法）
  [[nodiscard]] Result<> set_tcp_nodelay(bool enable) noexcept;

  // ----------------------------------------------------------------------------
  // 查詢函數
  // ----------------------------------------------------------------------------

  /// @brief 檢查 Socket 是否有效
  [[nodiscard]] bool is_valid() const noexcept { return fd_ >= 0; }

  /// @brief 取得原始 file descriptor
  [[nodiscard]] int fd() const noexcept { return fd_; }

  /// @brief 取得本地位址
  [[nodiscard]] Result<SocketAddress> local_address() const noexcept;

  // ----------------------------------------------------------------------------
  // 手動管理
  // ----------------------------------------------------------------------------

  /// @brief 手動關閉 Socket (可重複呼叫)
  void close() noexcept;
};

}  // namespace wits::io

#endif
