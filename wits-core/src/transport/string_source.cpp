#include "wits/transport/string_source.hpp"

#include <algorithm>
#include <cstring>

namespace wits::transport {

StringSource::StringSource(std::string text, size_t chunk_size,
                           std::string label)
    : text_(std::move(text)),
      chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size),
      label_(std::move(label)) {}

Result<size_t> StringSource::read(std::span<char> buffer) noexcept {
  size_t n = std::min({buffer.size(), chunk_size_, remaining()});
  std::memcpy(buffer.data(), text_.data() + pos_, n);
  pos_ += n;
  return n;
}

}  // namespace wits::transport
