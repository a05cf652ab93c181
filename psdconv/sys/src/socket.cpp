#include "psdconv/socket.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <utility>

#include "psdconv/base-fd.hpp"
#include "psdconv/errno-throw.hpp"
#include "psdconv/log.hpp"

namespace psdconv {

namespace {

int ComputeSocketType(Socket::Type type) {
  switch (type) {
    case Socket::Type::Stream:
      return SOCK_STREAM | SOCK_CLOEXEC;
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK;
    default:
      std::unreachable();
  }
}

}  // namespace

Socket::Socket(Type type) : _baseFd(::socket(AF_INET, ComputeSocketType(type), 0)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(bool reusePort, uint16_t& port) {
  static constexpr int kEnable = 1;
  const int fd = _baseFd.fd();
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) < 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }
  if (reusePort && ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) < 0) {
    throw_errno("setsockopt(SO_REUSEPORT) failed");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    throw_errno("bind failed on port {}", port);
  }
  if (::listen(fd, SOMAXCONN) < 0) {
    throw_errno("listen failed on port {}", port);
  }
  if (port == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&actual), &len) == 0) {
      port = ntohs(actual.sin_port);
    } else {
      throw_errno("getsockname failed");
    }
  }
  log::debug("Socket fd # {} listening on port {}", fd, port);
}

}  // namespace psdconv
