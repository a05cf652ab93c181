#include "psdconv/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "psdconv/log.hpp"

namespace psdconv {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd == kClosedFd) {
    return;
  }
  const int fd = release();
  // Linux releases the descriptor even when close is interrupted: retrying could close a reused fd.
  if (::close(fd) != 0 && errno != EINTR) {
    log::error("close fd # {} failed: {}", fd, std::strerror(errno));
    return;
  }
  log::trace("fd # {} closed", fd);
}

}  // namespace psdconv
