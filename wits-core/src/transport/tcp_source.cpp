#include "wits/transport/tcp_source.hpp"

#include <fmt/format.h>

#include <cerrno>

#include "wits/io/socket_address.hpp"

namespace wits::transport {

Result<TcpSource> TcpSource::connect(std::string host, uint16_t port,
                                     std::optional<std::string> request) {
  auto addr = WITS_TRY(io::SocketAddress::resolve(host, port));
  auto socket = WITS_TRY(io::TcpSocket::connect(addr));

  if (request && !request->empty()) {
    WITS_CHECK(socket.send_all(*request));
  }

  return TcpSource(std::move(socket), std::move(host), port);
}

Result<size_t> TcpSource::read(std::span<char> buffer) noexcept {
  if (!socket_.is_valid()) {
    return 0;
  }

  auto n = socket_.recv(buffer);
  if (!n && n.error() == std::errc::connection_reset) {
    ErrorRegistry::clear();
    close();
    return 0;
  }
  return n;
}

std::string TcpSource::describe() const {
  return fmt::format("tcp://{}:{}", host_, port_);
}

}  // namespace wits::transport
