#pragma once

#include <utility>

namespace psdconv {

// Owns a file descriptor and closes it on destruction. Move only.
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  explicit BaseFd(int fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd&) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd&) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { close(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Gives up ownership without closing.
  [[nodiscard]] int release() noexcept { return std::exchange(_fd, kClosedFd); }

  // Closes now. No-op if already closed.
  void close() noexcept;

 private:
  int _fd;
};

}  // namespace psdconv
