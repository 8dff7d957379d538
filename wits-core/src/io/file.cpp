#include "wits/io/file.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>

namespace wits::io {

namespace {

constexpr size_t kReadChunk = 4096;

/// @brief 重試被 signal 打斷的系統呼叫
template <typename Fn>
ssize_t retry_on_eintr(Fn&& fn) noexcept {
  ssize_t n;
  do {
    n = fn();
  } while (n < 0 && errno == EINTR);
  return n;
}

}  // namespace

Result<File> File::open(std::string path, int flags) {
  int fd = ::open(path.c_str(), flags);
  if (fd < 0) {
    return wits::fail(errno, "open() failed");
  }
  return File(fd, std::move(path));
}

Result<File> File::create(std::string path) {
  int fd =
      ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    return wits::fail(errno, "open() for writing failed");
  }
  return File(fd, std::move(path));
}

File& File::operator=(File&& other) noexcept {
  if (&other != this) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    path_ = std::move(other.path_);
  }
  return *this;
}

// ----------------------------------------------------------------------------
// I/O
// ----------------------------------------------------------------------------

Result<size_t> File::read(std::span<char> buffer) noexcept {
  if (!is_open()) {
    return wits::fail(std::errc::bad_file_descriptor);
  }

  ssize_t n = retry_on_eintr(
      [&] { return ::read(fd_, buffer.data(), buffer.size()); });
  if (n < 0) {
    return wits::fail(errno, "read() failed");
  }
  return static_cast<size_t>(n);
}

Result<std::string> File::read_to_string() {
  std::string text;
  if (auto hint = size(); hint) {
    text.reserve(*hint);
  }

  char chunk[kReadChunk];
  while (true) {
    size_t n = WITS_TRY(read(chunk));
    if (n == 0) {
      break;
    }
    text.append(chunk, n);
  }
  return text;
}

Result<size_t> File::write(std::span<const char> data) noexcept {
  if (!is_open()) {
    return wits::fail(std::errc::bad_file_descriptor);
  }

  ssize_t n =
      retry_on_eintr([&] { return ::write(fd_, data.data(), data.size()); });
  if (n < 0) {
    return wits::fail(errno, "write() failed");
  }
  return static_cast<size_t>(n);
}

Result<> File::write_all(std::span<const char> data) noexcept {
  while (!data.empty()) {
    size_t n = WITS_TRY(write(data));
    data = data.subspan(n);
  }
  return {};
}

Result<size_t> File::size() const noexcept {
  if (!is_open()) {
    return wits::fail(std::errc::bad_file_descriptor);
  }

  struct stat st{};
  if (::fstat(fd_, &st) < 0) {
    return wits::fail(errno, "fstat() failed");
  }
  return static_cast<size_t>(st.st_size);
}

void File::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace wits::io
