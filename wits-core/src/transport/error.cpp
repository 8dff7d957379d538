#include "wits/transport/error.hpp"

#include <string>

namespace wits::transport {

const std::error_category& source_category() noexcept {
  static const struct : public std::error_category {
    const char* name() const noexcept override { return "wits.transport"; }
    std::string message(int ev) const override {
      switch (static_cast<source_errc>(ev)) {
        case source_errc::invalid_url:
          return "Invalid source URL";
        case source_errc::unsupported_scheme:
          return "Source must start with tcp://, serial://, or file://";
        case source_errc::invalid_port:
          return "TCP source must include a valid port: tcp://host:port";
        default:
          return "Unknown source error";
      }
    }
  } instance;

  return instance;
}

std::error_code make_error_code(source_errc ec) noexcept {
  return {static_cast<int>(ec), source_category()};
}

}  // namespace wits::transport
