#include "wits/decoder/batch.hpp"

#include <fmt/format.h>

#include "wits/protocol/frame.hpp"

namespace wits::decoder {

Result<std::vector<DecodedFrame>> decode_batch(std::string_view text,
                                               const DecodeOptions& options,
                                               const RecordParser& parser) {
  auto pieces = protocol::split_frames(text);
  if (pieces.empty()) {
    auto single = WITS_TRY(parser.decode(text, options));
    std::vector<DecodedFrame> frames;
    frames.push_back(std::move(single));
    return frames;
  }

  std::vector<DecodedFrame> frames;
  frames.reserve(pieces.size());
  for (auto piece : pieces) {
    frames.push_back(WITS_TRY(parser.decode(piece, options)));
  }
  return frames;
}

CombinedView combine(std::span<const DecodedFrame> frames) {
  CombinedView view;
  view.frame_count = frames.size();
  if (!frames.empty()) {
    view.source = frames.front().source;
    view.timestamp = frames.front().timestamp;
  }

  size_t index = 0;
  for (const auto& frame : frames) {
    ++index;
    view.data_points.insert(view.data_points.end(), frame.data_points.begin(),
                            frame.data_points.end());
    for (const auto& error : frame.errors) {
      view.errors.push_back(fmt::format("frame {}: {}", index, error));
    }
    for (const auto& warning : frame.warnings) {
      view.warnings.push_back(fmt::format("frame {}: {}", index, warning));
    }
    view.unknown_symbols += frame.unknown_symbols;
  }
  return view;
}

}  // namespace wits::decoder
