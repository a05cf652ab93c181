#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <unordered_map>

#include "psdconv/connection-state.hpp"
#include "psdconv/event-loop.hpp"
#include "psdconv/http-request.hpp"
#include "psdconv/http-response.hpp"
#include "psdconv/http-server-config.hpp"
#include "psdconv/http-status-code.hpp"
#include "psdconv/router.hpp"
#include "psdconv/socket.hpp"
#include "psdconv/timedef.hpp"

namespace psdconv {

// Single threaded HTTP/1.1 server driven by an epoll event loop.
//
// The listening socket is bound in the constructor, so port() is valid right after construction, even when the
// configured port is 0. Requests are read entirely (head and Content-Length body) before being dispatched to the
// router, handlers run synchronously in the event loop thread.
//
// Not copyable nor movable. To use several cores, run several instances bound to the same port with reusePort
// (see MultiHttpServer).
class SingleHttpServer {
 public:
  // Throws std::invalid_argument if the config is invalid and std::system_error if the socket cannot be set up.
  explicit SingleHttpServer(HttpServerConfig config, Router router = {});

  SingleHttpServer(const SingleHttpServer&) = delete;
  SingleHttpServer(SingleHttpServer&&) = delete;
  SingleHttpServer& operator=(const SingleHttpServer&) = delete;
  SingleHttpServer& operator=(SingleHttpServer&&) = delete;

  ~SingleHttpServer() = default;

  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

  // Routes can only be modified while the server is not running.
  [[nodiscard]] Router& router() noexcept { return _router; }

  // Runs the event loop in the calling thread until stop() is called or a termination signal is caught
  // (see SignalHandler). A stop() issued before run() makes it return immediately.
  // Throws std::logic_error if the server is already running.
  void run();

  // Requests the event loop to stop. Thread safe, it returns immediately, the loop exits at its next wake up.
  void stop() noexcept { _stopRequested.store(true, std::memory_order_relaxed); }

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_relaxed); }

 private:
  using ConnectionMap = std::unordered_map<int, ConnectionState>;
  using ConnectionMapIt = ConnectionMap::iterator;

  void eventLoop();
  void acceptNewConnections();
  void handleReadableClient(int fd);
  void handleWritableClient(int fd);
  void sweepIdleConnections(SteadyClock::time_point now);

  // Parses and dispatches all complete requests available in the input buffer.
  void processRequests(ConnectionMapIt cnxIt);

  HttpResponse dispatch(const HttpRequest& request) const;

  // Queues a JSON error response and marks the connection for closing.
  void emitSimpleError(ConnectionMapIt cnxIt, http::StatusCode statusCode);

  // Sends as much pending output as possible. May close the connection.
  void flushOutbound(ConnectionMapIt cnxIt);

  void closeConnection(ConnectionMapIt cnxIt);

  HttpServerConfig _config;
  Socket _listenSocket;
  EventLoop _eventLoop;
  Router _router;
  ConnectionMap _connections;
  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _running{false};
};

}  // namespace psdconv
