#include "wits/io/tcp_socket.hpp"

#include "wits/error.hpp"
#include "wits/io/socket.hpp"

namespace wits::io {

Result<TcpSocket> TcpSocket::connect(const SocketAddress& remote_addr,
                                     bool nodelay) noexcept {
  auto socket = WITS_TRY(Socket::create_tcp());

  if (nodelay) {
    // 非致命錯誤，還是可以繼續運行
    if (!socket.set_tcp_nodelay(true)) {
      ErrorRegistry::clear();
    }
  }

  WITS_CHECK(socket.connect(remote_addr));

  return TcpSocket(std::move(socket));
}

Result<TcpSocket> TcpSocket::serve(const SocketAddress& local_addr,
                                   int backlog) noexcept {
  auto socket = WITS_TRY(Socket::create_tcp());

  WITS_CHECK(socket.set_reuseaddr(true));
  WITS_CHECK(socket.bind(local_addr));
  WITS_CHECK(socket.listen(backlog));

  return TcpSocket(std::move(socket));
}

Result<TcpSocket> TcpSocket::accept(SocketAddress* client_addr) noexcept {
  auto socket = WITS_TRY(socket_.accept(client_addr));

  return TcpSocket(std::move(socket));
}

Result<> TcpSocket::send_all(std::span<const char> data) noexcept {
  while (!data.empty()) {
    size_t n = WITS_TRY(socket_.send(data));
    data = data.subspan(n);
  }
  return {};
}

}  // namespace wits::io
