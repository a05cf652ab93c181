#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace psdconv {

// Thin wrappers centralising socket system calls so that higher-level modules never include
// networking headers directly.

// Set a file descriptor to non-blocking mode. Returns true on success.
bool SetNonBlocking(int fd) noexcept;

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket. Returns true on success.
bool SetTcpNoDelay(int fd) noexcept;

// Send data on a connected socket with MSG_NOSIGNAL.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(int fd, std::string_view data) noexcept;

// Receive up to 'len' bytes. Returns the number of bytes read, 0 on orderly shutdown, -1 on error (errno is set).
int64_t SafeRecv(int fd, char* buf, std::size_t len) noexcept;

// Accept a pending connection on a listening socket, the new descriptor being non-blocking and close-on-exec.
// Returns the new fd, or -1 on error (errno is set, EAGAIN when no connection is pending).
int AcceptNonBlocking(int listenFd) noexcept;

// Shutdown the write half of a socket connection. Returns true on success.
bool ShutdownWrite(int fd) noexcept;

}  // namespace psdconv
