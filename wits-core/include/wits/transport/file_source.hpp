#ifndef WITS_TELEMETRY_TRANSPORT_FILE_SOURCE_HPP
#define WITS_TELEMETRY_TRANSPORT_FILE_SOURCE_HPP

#include <span>
#include <string>

#include "wits/error.hpp"
#include "wits/io/file.hpp"

namespace wits::transport {

/// @brief 從錄製的 .wits 檔案讀取
class FileSource {
 private:
  io::File file_;

  explicit FileSource(io::File file) noexcept : file_(std::move(file)) {}

 public:
  /// @brief 以唯讀開啟檔案
  [[nodiscard]] static Result<FileSource> open(std::string path);

  [[nodiscard]] Result<size_t> read(std::span<char> buffer) noexcept;

  void close() noexcept { file_.close(); }

  [[nodiscard]] std::string describe() const;
};

}  // namespace wits::transport

#endif
