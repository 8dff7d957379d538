#include "wits/protocol/frame.hpp"

namespace wits::protocol {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\v\f";

}  // namespace

std::optional<FrameSpan> find_frame(std::string_view text,
                                    size_t from) noexcept {
  size_t start = text.find(kStartMarker, from);
  if (start == std::string_view::npos) {
    return std::nullopt;
  }

  size_t stop = text.find(kEndMarker, start + kStartMarker.size());
  if (stop == std::string_view::npos) {
    return std::nullopt;
  }

  return FrameSpan{start, stop + kEndMarker.size()};
}

std::vector<std::string_view> split_frames(std::string_view text) {
  std::vector<std::string_view> frames;

  size_t pos = 0;
  while (auto span = find_frame(text, pos)) {
    frames.push_back(text.substr(span->begin, span->size()));
    pos = span->end;
  }
  return frames;
}

bool validate_frame(std::string_view text) noexcept {
  text = trim(text);
  return text.size() >= kStartMarker.size() + kEndMarker.size() &&
         text.starts_with(kStartMarker) && text.ends_with(kEndMarker);
}

std::string_view trim(std::string_view text) noexcept {
  size_t first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  size_t last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

}  // namespace wits::protocol
