#include "wits/protocol/frame_extractor.hpp"

#include <algorithm>

#include "wits/protocol/frame.hpp"

namespace wits::protocol {

void FrameExtractor::feed(std::string_view chunk) {
  if (pos_ > 0) {  // 已消化的部分移除
    buffer_.erase(0, pos_);
    scan_from_ = scan_from_ > pos_ ? scan_from_ - pos_ : 0;
    pos_ = 0;
  }
  buffer_.append(chunk);
}

std::optional<std::string> FrameExtractor::next_frame() {
  size_t start = buffer_.find(kStartMarker, pos_);
  if (start == std::string::npos) {
    discard_garbage();
    return std::nullopt;
  }
  pos_ = start;

  size_t from = std::max(scan_from_, start + kStartMarker.size());
  size_t stop = buffer_.find(kEndMarker, from);
  if (stop == std::string::npos) {
    // 最後一個字元可能是被切開的 "!!"
    scan_from_ = std::max(buffer_.size() - 1, start + kStartMarker.size());
    return std::nullopt;
  }

  size_t end = stop + kEndMarker.size();
  std::string frame = buffer_.substr(start, end - start);
  pos_ = end;
  scan_from_ = 0;

  if (pos_ == buffer_.size()) {
    clear();
  }
  return frame;
}

void FrameExtractor::discard_garbage() noexcept {
  // 結尾的單一 '&' 可能是被切開的 start marker
  if (buffered() > 0 && buffer_.back() == kStartMarker.front()) {
    pos_ = buffer_.size() - 1;
  } else {
    pos_ = buffer_.size();
  }
}

}  // namespace wits::protocol
