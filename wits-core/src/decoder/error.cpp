#include "wits/decoder/error.hpp"

#include <string>

namespace wits::decoder {

const std::error_category& decode_category() noexcept {
  static const struct : public std::error_category {
    const char* name() const noexcept override { return "wits.decoder"; }
    std::string message(int ev) const override {
      switch (static_cast<decode_errc>(ev)) {
        case decode_errc::empty_input:
          return "Empty input";
        case decode_errc::missing_start_marker:
          return "Missing start marker '&&'";
        case decode_errc::missing_end_marker:
          return "Missing end marker '!!'";
        case decode_errc::unknown_symbol:
          return "Unknown symbol code";
        case decode_errc::malformed_line:
          return "Malformed data line";
        case decode_errc::invalid_integer:
          return "Invalid integer value";
        case decode_errc::invalid_float:
          return "Invalid float value";
        default:
          return "Unknown decode error";
      }
    }
  } instance;

  return instance;
}

std::error_code make_error_code(decode_errc ec) noexcept {
  return {static_cast<int>(ec), decode_category()};
}

}  // namespace wits::decoder
