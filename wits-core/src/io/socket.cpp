#include "wits/io/socket.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <utility>

#include "wits/error.hpp"

namespace wits::io {

Result<Socket> Socket::create_tcp() noexcept {
  int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return wits::fail(errno, "socket() failed");
  }

  return Socket(fd);
}

Socket::~Socket() noexcept { close(); }

Socket::Socket(Socket&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

Socket& Socket::operator=(Socket&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

Result<> Socket::bind(const SocketAddress& addr) noexcept {
  if (!is_valid()) {
    return wits::fail(std::errc::bad_file_descriptor, "Invalid socket");
  }

  if (::bind(fd_, addr.raw(), addr.length()) < 0) {
    return wits::fail(errno, "bind() failed");
  }

  return {};
}

Result<> Socket::listen(int backlog) noexcept {
  if (!is_valid()) {
    return wits::fail(std::errc::bad_file_descriptor, "Invalid socket");
  }

  if (::listen(fd_, backlog) < 0) {
    return wits::fail(errno, "listen() failed");
  }

  return {};
}

Result<Socket> Socket::accept(SocketAddress* client_addr) noexcept {
  if (!is_valid()) {
    return wits::fail(std::errc::bad_file_descriptor, "Invalid socket");
  }

  int client_fd;

  if (client_addr) {
    do {
      client_fd = ::accept(fd_, client_addr->raw(), client_addr->length_ptr());
    } while (client_fd < 0 && errno == EINTR);
  } else {
    do {
      client_fd = ::accept(fd_, nullptr, nullptr);
    } while (client_fd < 0 && errno == EINTR);
  }
  if (client_fd < 0) {
    return wits::fail(errno, "accept() failed");
  }

  return Socket(client_fd);
}

Result<> Socket::connect(const SocketAddress& addr) noexcept {
  if (!is_valid()) {
    return wits::fail(std::errc::bad_file_descriptor, "Invalid socket");
  }

  int ret;
  do {
    ret = ::connect(fd_, addr.raw(), addr.length());
  } while (ret < 0 && errno == EINTR);

  if (ret < 0) {
    return wits::fail(errno, "connect() failed");
  }
  return {};
}

Result<size_t> Socket::send(std::span<const char> data) noexcept {
  if (!is_valid()) {
    return wits::fail(std::errc::bad_file_descriptor, "Invalid socket");
  }

  ssize_t n;
  do {
    n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
  } while (n < 0 && errno == EINTR);

  if (n < 0) {
    return wits::fail(errno, "send() failed");
  }

  return static_cast<size_t>(n);
}

Result<size_t> Socket::recv(std::span<char> buffer) noexcept {
  if (!is_valid()) {
    return wits::fail(std::errc::bad_file_descriptor, "Invalid socket");
  }

  ssize_t n;
  do {
    n = ::recv(fd_, buffer.data(), buffer.size(), 0);
  } while (n < 0 && errno == EINTR);

  if (n < 0) {
    return wits::fail(errno, "recv() failed");
  }

  return static_cast<size_t>(n);
}

Result<> Socket::set_reuseaddr(bool enable) noexcept {
  if (!is_valid()) {
    return wits::fail(std::errc::bad_file_descriptor, "Invalid socket");
  }
  int optval = enable ? 1 : 0;
  if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) <
      0) {
    return wits::fail(errno, "setsockopt(SO_REUSEADDR) failed");
  }
  return {};
}

Result<> Socket::set_tcp_nodelay(bool enable) noexcept {
  if (!is_valid()) {
    return wits::fail(std::errc::bad_file_descriptor, "Invalid socket");
  }
  int optval = enable ? 1 : 0;
  if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &optval, sizeof(optval)) <
      0) {
    return wits::fail(errno, "setsockopt(TCP_NODELAY) failed");
  }
  return {};
}

Result<SocketAddress> Socket::local_address() const noexcept {
  if (!is_valid()) {
    return wits::fail(std::errc::bad_file_descriptor, "Invalid socket");
  }

  SocketAddress addr = SocketAddress::any_ipv4(0);  // 臨時物件
  if (::getsockname(fd_, addr.raw(), addr.length_ptr()) < 0) {
    return wits::fail(errno, "getsockname() failed");
  }
  return addr;
}

void Socket::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace wits::io
