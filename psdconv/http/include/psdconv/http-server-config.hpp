#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "psdconv/http-header.hpp"

namespace psdconv {

struct HttpServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port. After construction
  // you can retrieve the effective port via SingleHttpServer::port().
  uint16_t port{0};

  // If true, enables SO_REUSEPORT allowing multiple independent SingleHttpServer instances (usually one per thread)
  // to bind the same port for load distribution by the kernel. Forced by MultiHttpServer when it runs several
  // threads. Disabled by default.
  bool reusePort{false};

  // Disables the Nagle algorithm on accepted connections. Default: false.
  bool tcpNoDelay{false};

  // Number of event loop threads run by MultiHttpServer. Ignored by SingleHttpServer. Default: 1.
  uint32_t nbThreads{1};

  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================

  // Whether HTTP/1.1 persistent connections (keep-alive) are enabled. When false, server always closes after
  // each response regardless of client headers. Default: true.
  bool enableKeepAlive{true};

  // Maximum number of HTTP requests to serve over a single persistent connection before forcing close.
  uint32_t maxRequestsPerConnection{100};

  // Idle timeout of a connection (no bytes received or sent). Once exceeded the server closes the connection.
  // Default: 5000 ms.
  std::chrono::milliseconds keepAliveTimeout{std::chrono::milliseconds{5000}};

  // ============================
  // Request parsing & body limits
  // ============================
  // Maximum allowed size (in bytes) of the aggregate HTTP request head (request line + all headers + CRLFCRLF).
  // If exceeded while parsing, the server replies 431 and closes the connection. Default: 8 KiB.
  std::size_t maxHeaderBytes{8192};

  // Maximum allowed size (in bytes) of a request body. Requests announcing a larger Content-Length are answered
  // with 413 (Payload Too Large) and the connection is closed. Default: 256 MiB.
  std::size_t maxBodyBytes{1 << 28};

  // Size of each recv() call into the connection buffer. Default: 64 KiB.
  std::size_t readChunkBytes{64UL * 1024UL};

  // ===========================================
  // Event loop polling / responsiveness tuning
  // ===========================================
  // Maximum duration the event loop will block waiting for I/O in a single epoll_wait() when idle before it wakes to
  // perform housekeeping (idle connection sweeping) and to check for external stop conditions (stop() call or
  // termination signal). Epoll still returns early when I/O events arrive. Default: 500 ms.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{500}};

  // Will add all the headers defined here in all server responses, if not explicitly set by the handler for a given
  // response. Defaults to a list of one entry "Server: psdconv"
  std::vector<http::Header> globalHeaders{{"Server", "psdconv"}};

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  // Set explicit listening port (0 = ephemeral)
  HttpServerConfig& withPort(uint16_t port);

  // Enable/disable SO_REUSEPORT
  HttpServerConfig& withReusePort(bool on = true);

  // Toggle TCP_NODELAY (disable the Nagle algorithm). Default: false.
  HttpServerConfig& withTcpNoDelay(bool on = true);

  // Number of event loop threads for MultiHttpServer
  HttpServerConfig& withNbThreads(uint32_t nbThreads);

  // Toggle persistent connections
  HttpServerConfig& withKeepAliveMode(bool on = true);

  // Adjust per-connection request cap for keep-alive
  HttpServerConfig& withMaxRequestsPerConnection(uint32_t maxRequests);

  // Adjust idle timeout
  HttpServerConfig& withKeepAliveTimeout(std::chrono::milliseconds timeout);

  // Adjust maximum header bytes
  HttpServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  // Adjust maximum body bytes
  HttpServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  // Adjust recv() chunk size
  HttpServerConfig& withReadChunkBytes(std::size_t readChunkBytes);

  // Adjust event loop poll interval
  HttpServerConfig& withPollInterval(std::chrono::milliseconds interval);

  // Append a global header (emitted on every response that does not set it)
  HttpServerConfig& withGlobalHeader(std::string_view name, std::string_view value);
};

}  // namespace psdconv
