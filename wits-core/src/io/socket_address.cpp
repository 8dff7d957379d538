#include "wits/io/socket_address.hpp"

#include <arpa/inet.h>
#include <fmt/format.h>
#include <netdb.h>

#include <charconv>
#include <memory>
#include <string>

namespace wits::io {

SocketAddress::SocketAddress(in_addr_t host_order_ip, uint16_t port) noexcept {
  addr_.sin_family = AF_INET;
  addr_.sin_port = htons(port);
  addr_.sin_addr.s_addr = htonl(host_order_ip);
}

Result<SocketAddress> SocketAddress::from_ipv4(std::string_view ip,
                                               uint16_t port) noexcept {
  // inet_pton 需要 NUL 結尾字串
  char text[INET_ADDRSTRLEN] = {};
  if (ip.empty() || ip.size() >= sizeof(text)) {
    return wits::fail(std::errc::invalid_argument, "Invalid IPv4 address");
  }
  ip.copy(text, ip.size());

  SocketAddress addr = any_ipv4(port);
  if (::inet_pton(AF_INET, text, &addr.addr_.sin_addr) != 1) {
    return wits::fail(std::errc::invalid_argument, "Invalid IPv4 address");
  }
  return addr;
}

Result<SocketAddress> SocketAddress::from_string(
    std::string_view address) noexcept {
  auto colon = address.rfind(':');
  if (colon == std::string_view::npos) {
    return wits::fail(std::errc::invalid_argument, "Missing port");
  }

  auto digits = address.substr(colon + 1);
  uint16_t port = 0;
  auto [end, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), port);
  if (ec != std::errc{} || end != digits.data() + digits.size()) {
    return wits::fail(std::errc::invalid_argument, "Invalid port");
  }

  return from_ipv4(address.substr(0, colon), port);
}

Result<SocketAddress> SocketAddress::resolve(std::string_view host,
                                             uint16_t port) {
  if (auto numeric = from_ipv4(host, port)) {
    return numeric;
  }
  // 不是數字位址，改用 DNS
  ErrorRegistry::clear();

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* found = nullptr;
  std::string name(host);
  int rc = ::getaddrinfo(name.c_str(), nullptr, &hints, &found);
  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(found,
                                                             &::freeaddrinfo);
  if (rc != 0 || found == nullptr) {
    return wits::fail(std::errc::host_unreachable, "getaddrinfo() failed");
  }

  SocketAddress addr = any_ipv4(port);
  addr.addr_.sin_addr =
      reinterpret_cast<const sockaddr_in*>(found->ai_addr)->sin_addr;
  return addr;
}

uint16_t SocketAddress::port() const noexcept {
  return ntohs(addr_.sin_port);
}

std::string SocketAddress::to_string() const {
  char text[INET_ADDRSTRLEN] = {};
  if (::inet_ntop(AF_INET, &addr_.sin_addr, text, sizeof(text)) == nullptr) {
    return fmt::format("?:{}", port());
  }
  return fmt::format("{}:{}", text, port());
}

}  // namespace wits::io
