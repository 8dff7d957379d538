#include "wits/io/serial_port.hpp"

#include <fcntl.h>
#include <termios.h>

#include <cerrno>
#include <optional>

namespace wits::io {

namespace {

std::optional<speed_t> to_speed(unsigned baud_rate) noexcept {
  switch (baud_rate) {
    case 1200:
      return B1200;
    case 2400:
      return B2400;
    case 4800:
      return B4800;
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    case 230400:
      return B230400;
    default:
      return std::nullopt;
  }
}

}  // namespace

Result<SerialPort> SerialPort::open(std::string path, unsigned baud_rate) {
  auto speed = to_speed(baud_rate);
  if (!speed) {
    return wits::fail(std::errc::invalid_argument, "Unsupported baud rate");
  }

  auto file =
      WITS_TRY(File::open(std::move(path), O_RDWR | O_NOCTTY | O_CLOEXEC));

  termios tty{};
  if (::tcgetattr(file.fd(), &tty) < 0) {
    return wits::fail(errno, "tcgetattr() failed");
  }

  ::cfmakeraw(&tty);
  ::cfsetispeed(&tty, *speed);
  ::cfsetospeed(&tty, *speed);

  // 8N1，無硬體流控
  tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
  tty.c_cflag |= CS8 | CLOCAL | CREAD;
  tty.c_cc[VMIN] = 1;
  tty.c_cc[VTIME] = 0;

  if (::tcsetattr(file.fd(), TCSANOW, &tty) < 0) {
    return wits::fail(errno, "tcsetattr() failed");
  }
  // 丟棄開啟前殘留在驅動程式中的資料
  if (::tcflush(file.fd(), TCIFLUSH) < 0) {
    return wits::fail(errno, "tcflush() failed");
  }

  return SerialPort(std::move(file), baud_rate);
}

}  // namespace wits::io
