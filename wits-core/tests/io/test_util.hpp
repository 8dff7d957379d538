#ifndef WITS_TELEMETRY_TESTS_IO_TEST_UTIL_HPP
#define WITS_TELEMETRY_TESTS_IO_TEST_UTIL_HPP

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace wits::io::test {

// ----------------------------------------------------------------------------
// Temporary File
// ----------------------------------------------------------------------------

/// @brief RAII 管理臨時檔案（無異常版本）
class TempFile {
 private:
  std::string path_;
  bool valid_{false};

 public:
  /// @brief 建立臨時檔案
  /// @note 建構失敗時，is_valid() 返回 false
  TempFile() {
    char tmpl[] = "/tmp/wits-test-XXXXXX";
    int fd = ::mkstemp(tmpl);
    if (fd >= 0) {
      ::close(fd);
      path_ = tmpl;
      valid_ = true;
    }
  }

  /// @brief 解構時自動刪除檔案
  ~TempFile() {
    if (valid_) {
      ::unlink(path_.c_str());
    }
  }

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  TempFile(TempFile&& other) noexcept
      : path_(std::move(other.path_)),
        valid_(std::exchange(other.valid_, false)) {}

  TempFile& operator=(TempFile&&) = delete;

  [[nodiscard]] bool is_valid() const noexcept { return valid_; }

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

  /// @brief 以 content 覆寫整個檔案
  bool write_content(std::string_view content) noexcept {
    if (!valid_) return false;

    int fd = ::open(path_.c_str(), O_WRONLY | O_TRUNC);
    if (fd < 0) return false;

    ssize_t n = ::write(fd, content.data(), content.size());
    ::close(fd);

    return n == static_cast<ssize_t>(content.size());
  }

  /// @brief 讀取檔案內容為字串
  /// @return 檔案內容，失敗返回 nullopt
  [[nodiscard]] std::optional<std::string> read_content() const {
    if (!valid_) return std::nullopt;

    int fd = ::open(path_.c_str(), O_RDONLY);
    if (fd < 0) return std::nullopt;

    struct stat st;
    if (::fstat(fd, &st) < 0) {
      ::close(fd);
      return std::nullopt;
    }

    std::string content(st.st_size, '\0');
    ssize_t n = ::read(fd, content.data(), st.st_size);
    ::close(fd);

    if (n != st.st_size) return std::nullopt;

    return content;
  }
};

}  // namespace wits::io::test

#endif
