#ifndef WITS_TELEMETRY_DECODER_JSON_HPP
#define WITS_TELEMETRY_DECODER_JSON_HPP

#include <chrono>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "wits/decoder/batch.hpp"
#include "wits/decoder/data_point.hpp"

namespace wits::decoder {

/// @brief 數值轉 JSON：整數、浮點數、字串，空值為 null
[[nodiscard]] nlohmann::json to_json(const std::optional<Value>& value);

/// @brief 一個 frame 的解碼結果
///
/// @code
/// {
///   "timestamp": "2024-05-01T08:30:00.000Z",
///   "source": "cli",
///   "frames": 1,
///   "data": {
///     "0108": {"name": "DBTM", "description": "...", "value": 3650.4,
///              "raw_value": "3650.40", "unit": "F"}
///   },
///   "errors": [],
///   "warnings": []
/// }
/// @endcode
///
/// @note data 以代碼為 key，同一代碼出現多次時保留最後一筆
///
[[nodiscard]] nlohmann::json to_json(const DecodedFrame& frame);

/// @brief 多個 frame 的合併檢視，格式同單一 frame，frames 為 frame 數
[[nodiscard]] nlohmann::json to_json(const CombinedView& view);

/// @brief 串流結果：{"source", "frames", "data": [{"frame": N, ...}]}
/// @details 每個 frame 保留完整的資料點清單 (不依代碼合併)
[[nodiscard]] nlohmann::json to_json(std::span<const DecodedFrame> frames,
                                     std::string_view source);

/// @brief ISO 8601 UTC 時間，精確到毫秒，例如 "2024-05-01T08:30:00.000Z"
[[nodiscard]] std::string format_timestamp(
    std::chrono::system_clock::time_point time);

}  // namespace wits::decoder

#endif
