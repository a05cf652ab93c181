#include "psdconv/socket-ops.hpp"

#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace psdconv {

bool SetNonBlocking(int fd) noexcept {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags == -1) {
    return false;
  }
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

bool SetTcpNoDelay(int fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

int64_t SafeSend(int fd, std::string_view data) noexcept {
  return static_cast<int64_t>(::send(fd, data.data(), data.size(), MSG_NOSIGNAL));
}

int64_t SafeRecv(int fd, char* buf, std::size_t len) noexcept {
  return static_cast<int64_t>(::recv(fd, buf, len, 0));
}

int AcceptNonBlocking(int listenFd) noexcept {
  return ::accept4(listenFd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
}

bool ShutdownWrite(int fd) noexcept { return ::shutdown(fd, SHUT_WR) == 0; }

}  // namespace psdconv
