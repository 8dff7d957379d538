#ifndef WITS_TELEMETRY_IO_FILE_HPP
#define WITS_TELEMETRY_IO_FILE_HPP

#include <fcntl.h>

#include <span>
#include <string>
#include <utility>

#include "wits/error.hpp"

namespace wits::io {

/// @brief 持有一個 file descriptor 的檔案或裝置 (錄製檔、tty)
///
/// - 解構時自動 close，可 move 不可 copy
/// - read / write 遇到 EINTR 自動重試
///
class File {
 private:
  int fd_{-1};
  std::string path_;

  File(int fd, std::string path) noexcept : fd_(fd), path_(std::move(path)) {}

 public:
  /// @brief 開啟既有檔案或裝置
  /// @param flags open(2) flags，例如 O_RDONLY | O_CLOEXEC
  /// @return File 或 errno
  [[nodiscard]] static Result<File> open(std::string path, int flags);

  /// @brief 建立或截斷檔案以供寫入 (權限 0644)
  [[nodiscard]] static Result<File> create(std::string path);

  ~File() noexcept { close(); }

  File(const File&) = delete;
  File& operator=(const File&) = delete;

  File(File&& other) noexcept
      : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}
  File& operator=(File&& other) noexcept;

  // ----------------------------------------------------------------------------
  // I/O
  // ----------------------------------------------------------------------------

  /// @brief 讀取最多 buffer.size() 個字元
  /// @return 讀到的字元數，0 代表 EOF
  [[nodiscard]] Result<size_t> read(std::span<char> buffer) noexcept;

  /// @brief 從目前位置讀到 EOF
  [[nodiscard]] Result<std::string> read_to_string();

  [[nodiscard]] Result<size_t> write(std::span<const char> data) noexcept;

  /// @brief 重複 write 直到全部寫出
  [[nodiscard]] Result<> write_all(std::span<const char> data) noexcept;

  /// @brief 檔案大小 (fstat)
  [[nodiscard]] Result<size_t> size() const noexcept;

  // ----------------------------------------------------------------------------
  // Accessor
  // ----------------------------------------------------------------------------

  [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

  [[nodiscard]] int fd() const noexcept { return fd_; }

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

  /// @brief 可重複呼叫
  void close() noexcept;
};

}  // namespace wits::io

#endif
