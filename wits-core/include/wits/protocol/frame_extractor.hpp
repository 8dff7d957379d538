#ifndef WITS_TELEMETRY_PROTOCOL_FRAME_EXTRACTOR_HPP
#define WITS_TELEMETRY_PROTOCOL_FRAME_EXTRACTOR_HPP

#include <optional>
#include <string>
#include <string_view>

namespace wits::protocol {

/// @brief 從任意切分的文字區塊中重組完整 frame
///
/// 特性：
/// - feed() 追加資料，next_frame() 取出下一個完整 frame ("&&" ... "!!")
/// - start marker 之前的雜訊直接丟棄
/// - 未結束的 frame 保留在 buffer 等待後續資料，buffer 沒有上限
/// - 輸出與切分方式無關：相同輸入不論每次 feed 多少字元，結果都相同
/// - 開啟中的 frame 只掃描新進資料，總成本與輸入長度成線性
///
/// @note 非 thread-safe，一個 instance 只能由一個呼叫者驅動
///
/// @example
///   FrameExtractor extractor;
///   extractor.feed(chunk);
///   while (auto frame = extractor.next_frame()) {
///     handle(*frame);
///   }
///
class FrameExtractor {
 private:
  std::string buffer_;  ///< 累積中的資料
  size_t pos_{0};       ///< buffer_ 中尚未消化的起點
  size_t scan_from_{0};  ///< 開啟中的 frame 已掃描過 end marker 的位置

 public:
  FrameExtractor() = default;

  /// @brief 追加一段資料
  ///
  void feed(std::string_view chunk);

  /// @brief 取出下一個完整 frame (含 markers)
  /// @return 目前沒有完整 frame 時返回 std::nullopt
  ///
  [[nodiscard]] std::optional<std::string> next_frame();

  /// @brief 尚未消化的字元數
  ///
  [[nodiscard]] size_t buffered() const noexcept {
    return buffer_.size() - pos_;
  }

  /// @brief 丟棄所有暫存資料 (未完成的 frame 一併丟棄)
  ///
  void clear() noexcept {
    buffer_.clear();
    pos_ = 0;
    scan_from_ = 0;
  }

 private:
  /// @brief 丟棄不可能成為 frame 開頭的前綴
  ///
  void discard_garbage() noexcept;
};

}  // namespace wits::protocol

#endif
