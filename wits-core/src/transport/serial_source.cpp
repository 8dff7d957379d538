#include "wits/transport/serial_source.hpp"

namespace wits::transport {

Result<SerialSource> SerialSource::open(std::string device,
                                        unsigned baud_rate) {
  auto port = WITS_TRY(io::SerialPort::open(std::move(device), baud_rate));
  return SerialSource(std::move(port));
}

}  // namespace wits::transport
