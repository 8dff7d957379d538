#include "wits/transport/source.hpp"

#include <charconv>
#include <optional>

namespace wits::transport {

namespace {

constexpr std::string_view kTcpPrefix = "tcp://";
constexpr std::string_view kFilePrefix = "file://";
constexpr std::string_view kSerialPrefix = "serial://";

}  // namespace

Result<SourceUrl> parse_source_url(std::string_view url) {
  if (url.starts_with(kTcpPrefix)) {
    auto rest = url.substr(kTcpPrefix.size());
    auto colon = rest.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
      return wits::fail(source_errc::invalid_port, "tcp:// without host:port");
    }

    auto port_str = rest.substr(colon + 1);
    uint16_t port = 0;
    auto [ptr, ec] = std::from_chars(
        port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc{} || ptr != port_str.data() + port_str.size() ||
        port == 0) {
      return wits::fail(source_errc::invalid_port, "Invalid TCP port");
    }

    return SourceUrl{Scheme::Tcp, std::string(rest.substr(0, colon)), port,
                     {}};
  }

  if (url.starts_with(kFilePrefix)) {
    auto path = url.substr(kFilePrefix.size());
    if (path.empty()) {
      return wits::fail(source_errc::invalid_url, "file:// without path");
    }
    return SourceUrl{Scheme::File, {}, 0, std::string(path)};
  }

  if (url.starts_with(kSerialPrefix)) {
    auto path = url.substr(kSerialPrefix.size());
    if (path.empty()) {
      return wits::fail(source_errc::invalid_url, "serial:// without device");
    }
    return SourceUrl{Scheme::Serial, {}, 0, std::string(path)};
  }

  return wits::fail(source_errc::unsupported_scheme);
}

Result<Source> open_source(const SourceConfig& config) {
  auto url = WITS_TRY(parse_source_url(config.url));

  switch (url.scheme) {
    case Scheme::Tcp: {
      std::optional<std::string> request;
      if (config.request) {
        request = config.request_payload;
      }
      return Source(WITS_TRY(TcpSource::connect(std::move(url.host), url.port,
                                           std::move(request))));
    }
    case Scheme::File:
      return Source(WITS_TRY(FileSource::open(std::move(url.path))));
    case Scheme::Serial:
      return Source(
          WITS_TRY(SerialSource::open(std::move(url.path), config.baud_rate)));
  }
  return wits::fail(source_errc::unsupported_scheme);
}

}  // namespace wits::transport
