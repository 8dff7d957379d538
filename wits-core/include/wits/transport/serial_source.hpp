#ifndef WITS_TELEMETRY_TRANSPORT_SERIAL_SOURCE_HPP
#define WITS_TELEMETRY_TRANSPORT_SERIAL_SOURCE_HPP

#include <span>
#include <string>

#include "wits/error.hpp"
#include "wits/io/serial_port.hpp"

namespace wits::transport {

/// @brief 從序列埠讀取 WITS 資料
class SerialSource {
 private:
  io::SerialPort port_;

  explicit SerialSource(io::SerialPort port) noexcept
      : port_(std::move(port)) {}

 public:
  inline static constexpr unsigned kDefaultBaudRate = 9600;

  [[nodiscard]] static Result<SerialSource> open(
      std::string device, unsigned baud_rate = kDefaultBaudRate);

  [[nodiscard]] Result<size_t> read(std::span<char> buffer) noexcept {
    if (!port_.is_open()) {
      return 0;
    }
    return port_.read(buffer);
  }

  void close() noexcept { port_.close(); }

  [[nodiscard]] std::string describe() const {
    return "serial://" + port_.path();
  }
};

}  // namespace wits::transport

#endif
