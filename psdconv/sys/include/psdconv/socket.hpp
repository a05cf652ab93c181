#pragma once

#include <cstdint>

#include "psdconv/base-fd.hpp"

namespace psdconv {

// Simple RAII class wrapping an IPv4 TCP socket file descriptor.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Construct a socket with the given type.
  // Throws std::system_error on failure.
  explicit Socket(Type type);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind on all interfaces and start listening on the given port. If port is 0, an ephemeral port is chosen and
  // updated in the argument.
  // Throws std::system_error on failure.
  void bindAndListen(bool reusePort, uint16_t& port);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace psdconv
