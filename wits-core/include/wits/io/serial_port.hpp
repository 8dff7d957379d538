#ifndef WITS_TELEMETRY_IO_SERIAL_PORT_HPP
#define WITS_TELEMETRY_IO_SERIAL_PORT_HPP

#include <span>
#include <string>
#include <utility>

#include "wits/error.hpp"
#include "wits/io/file.hpp"

namespace wits::io {

/// @brief 序列埠 (termios raw mode, 8N1)
///
/// - 以 File 持有 file descriptor
/// - read() 阻塞直到至少收到 1 byte
///
class SerialPort {
 private:
  File file_;
  unsigned baud_rate_;

  SerialPort(File file, unsigned baud_rate) noexcept
      : file_(std::move(file)), baud_rate_(baud_rate) {}

 public:
  /// @brief 開啟並設定序列埠
  /// @param path 裝置路徑 (e.g. "/dev/ttyUSB0")
  /// @param baud_rate 鮑率 (1200 ~ 230400 的標準值)
  /// @return SerialPort 或錯誤 (不支援的鮑率為 invalid_argument)
  ///
  [[nodiscard]] static Result<SerialPort> open(std::string path,
                                               unsigned baud_rate);

  [[nodiscard]] Result<size_t> read(std::span<char> buffer) noexcept {
    return file_.read(buffer);
  }

  [[nodiscard]] Result<size_t> write(std::span<const char> data) noexcept {
    return file_.write(data);
  }

  [[nodiscard]] bool is_open() const noexcept { return file_.is_open(); }

  [[nodiscard]] const std::string& path() const noexcept {
    return file_.path();
  }

  [[nodiscard]] unsigned baud_rate() const noexcept { return baud_rate_; }

  void close() noexcept { file_.close(); }
};

}  // namespace wits::io

#endif
