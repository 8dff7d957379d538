#include "wits/transport/file_source.hpp"

#include <fcntl.h>

#include <string>

namespace wits::transport {

Result<FileSource> FileSource::open(std::string path) {
  auto file = WITS_TRY(io::File::open(std::move(path), O_RDONLY | O_CLOEXEC));
  return FileSource(std::move(file));
}

Result<size_t> FileSource::read(std::span<char> buffer) noexcept {
  if (!file_.is_open()) {
    return 0;
  }
  return file_.read(buffer);
}

std::string FileSource::describe() const { return "file://" + file_.path(); }

}  // namespace wits::transport
