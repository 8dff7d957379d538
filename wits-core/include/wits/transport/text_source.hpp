#ifndef WITS_TELEMETRY_TRANSPORT_TEXT_SOURCE_HPP
#define WITS_TELEMETRY_TRANSPORT_TEXT_SOURCE_HPP

#include <concepts>
#include <cstddef>
#include <span>
#include <string>

#include "wits/error.hpp"

namespace wits::transport {

/// @brief 文字資料來源
///
/// 要求：
/// - read(buffer)：阻塞讀取，返回讀到的字元數，0 代表資料結束
/// - close()：釋放資源，可重複呼叫，關閉後 read() 返回 0
/// - describe()：來源描述，例如 "tcp://10.0.0.5:12345"
///
template <typename S>
concept TextSource = requires(S& source, const S& csource,
                              std::span<char> buffer) {
  { source.read(buffer) } -> std::same_as<Result<size_t>>;
  { source.close() } noexcept;
  { csource.describe() } -> std::convertible_to<std::string>;
};

}  // namespace wits::transport

#endif
