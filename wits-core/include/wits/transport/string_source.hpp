#ifndef WITS_TELEMETRY_TRANSPORT_STRING_SOURCE_HPP
#define WITS_TELEMETRY_TRANSPORT_STRING_SOURCE_HPP

#include <span>
#include <string>

#include "wits/error.hpp"

namespace wits::transport {

/// @brief 記憶體中的文字，每次 read() 最多給出 chunk_size 個字元
/// @details 用於批次文字與模擬任意切分的串流
class StringSource {
 private:
  std::string text_;
  size_t chunk_size_;
  size_t pos_{0};
  std::string label_;

 public:
  inline static constexpr size_t kDefaultChunkSize = 1024;

  explicit StringSource(std::string text,
                        size_t chunk_size = kDefaultChunkSize,
                        std::string label = "memory");

  [[nodiscard]] Result<size_t> read(std::span<char> buffer) noexcept;

  void close() noexcept { pos_ = text_.size(); }

  [[nodiscard]] std::string describe() const { return label_; }

  /// @brief 尚未讀出的字元數
  [[nodiscard]] size_t remaining() const noexcept {
    return text_.size() - pos_;
  }
};

}  // namespace wits::transport

#endif
