#ifndef WITS_TELEMETRY_PROTOCOL_FRAME_HPP
#define WITS_TELEMETRY_PROTOCOL_FRAME_HPP

#include <optional>
#include <string_view>
#include <vector>

namespace wits::protocol {

// ----------------------------------------------------------------------------
// Markers
// ----------------------------------------------------------------------------

inline constexpr std::string_view kStartMarker = "&&";
inline constexpr std::string_view kEndMarker = "!!";

/// @brief 一個 frame 在文字中的位置 [begin, end)
/// @details end 指向 end marker 之後
struct FrameSpan {
  size_t begin;
  size_t end;

  [[nodiscard]] constexpr size_t size() const noexcept { return end - begin; }
};

/// @brief 從 from 開始尋找下一個完整 frame
///
/// 規則：
/// - 找第一個 "&&"，再從它之後找第一個 "!!"
/// - start marker 之前的內容一律忽略
/// - frame 內部再出現 "&&" 不特別處理 (照字面掃描)
///
/// @return 找不到完整 frame 時返回 std::nullopt
///
[[nodiscard]] std::optional<FrameSpan> find_frame(std::string_view text,
                                                  size_t from = 0) noexcept;

/// @brief 將多 frame 文字切成各個 frame (與 FrameExtractor 相同的掃描規則)
/// @return 指向 text 的 view，依出現順序
///
[[nodiscard]] std::vector<std::string_view> split_frames(std::string_view text);

/// @brief 僅檢查結構：去除前後空白後以 "&&" 開頭並以 "!!" 結尾
///
[[nodiscard]] bool validate_frame(std::string_view text) noexcept;

/// @brief 去除前後空白 (含 \r \n \t)
///
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

}  // namespace wits::protocol

#endif
