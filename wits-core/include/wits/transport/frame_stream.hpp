#ifndef WITS_TELEMETRY_TRANSPORT_FRAME_STREAM_HPP
#define WITS_TELEMETRY_TRANSPORT_FRAME_STREAM_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "wits/error.hpp"
#include "wits/protocol/frame_extractor.hpp"
#include "wits/transport/text_source.hpp"

namespace wits::transport {

/// @brief 從 TextSource 拉取完整 frame
///
/// 特性：
/// - pull model：next() 先從 buffer 取 frame，不足時才阻塞讀取來源
/// - 來源結束後，剩餘的不完整 frame 直接丟棄，並關閉來源
/// - 結束後不可重啟，next() 一律返回 std::nullopt
/// - 讀取錯誤原樣返回，呼叫者可決定是否繼續呼叫 next()
///
/// @note 非 thread-safe
///
/// @example
///   FrameStream stream(WITS_TRY(FileSource::open("drilling.wits")));
///   while (auto frame = WITS_TRY(stream.next())) {
///     handle(*frame);
///   }
///
template <TextSource Source>
class FrameStream {
 private:
  Source source_;
  protocol::FrameExtractor extractor_;
  std::vector<char> chunk_;
  bool exhausted_{false};

 public:
  inline static constexpr size_t kDefaultChunkSize = 1024;

  explicit FrameStream(Source source, size_t chunk_size = kDefaultChunkSize)
      : source_(std::move(source)),
        chunk_(chunk_size == 0 ? kDefaultChunkSize : chunk_size) {}

  /// @brief 下一個完整 frame
  /// @return frame、std::nullopt (來源結束) 或讀取錯誤
  ///
  [[nodiscard]] Result<std::optional<std::string>> next() {
    while (true) {
      if (auto frame = extractor_.next_frame()) {
        return frame;
      }
      if (exhausted_) {
        return std::nullopt;
      }

      size_t n = WITS_TRY(source_.read(chunk_));
      if (n == 0) {
        finish();
        return std::nullopt;
      }
      extractor_.feed({chunk_.data(), n});
    }
  }

  /// @brief 停止串流並關閉來源 (可重複呼叫)
  void finish() noexcept {
    exhausted_ = true;
    extractor_.clear();
    source_.close();
  }

  [[nodiscard]] bool exhausted() const noexcept { return exhausted_; }

  [[nodiscard]] Source& source() noexcept { return source_; }
  [[nodiscard]] const Source& source() const noexcept { return source_; }
};

}  // namespace wits::transport

#endif
