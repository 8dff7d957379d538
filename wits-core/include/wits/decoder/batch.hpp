#ifndef WITS_TELEMETRY_DECODER_BATCH_HPP
#define WITS_TELEMETRY_DECODER_BATCH_HPP

#include <chrono>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "wits/decoder/data_point.hpp"
#include "wits/decoder/record_parser.hpp"
#include "wits/error.hpp"

namespace wits::decoder {

/// @brief 解碼多個連續 frame 的文字
///
/// - 以 split_frames 切分後逐一解碼，單一 frame 的錯誤不影響其他 frame
/// - 找不到任何完整 frame 時，整段文字視為一個 frame 解碼 (得到結構錯誤)
///
/// @return 依出現順序的 DecodedFrame，或 decode_errc::empty_input
///
[[nodiscard]] Result<std::vector<DecodedFrame>> decode_batch(
    std::string_view text, const DecodeOptions& options = {},
    const RecordParser& parser = RecordParser{});

/// @brief 多個 frame 合併後的平面檢視
struct CombinedView {
  std::string source;                               ///< 第一個 frame 的來源
  std::chrono::system_clock::time_point timestamp;  ///< 第一個 frame 的解碼時間
  size_t frame_count{0};
  std::vector<DataPoint> data_points;  ///< 依 frame 順序串接
  std::vector<std::string> errors;     ///< 前綴 "frame N: "
  std::vector<std::string> warnings;   ///< 前綴 "frame N: "
  size_t unknown_symbols{0};

  [[nodiscard]] bool ok() const noexcept { return errors.empty(); }
};

/// @brief 合併所有 frame 的 DataPoint 與錯誤，保持原順序
/// @note frame 編號從 1 開始
[[nodiscard]] CombinedView combine(std::span<const DecodedFrame> frames);

}  // namespace wits::decoder

#endif
