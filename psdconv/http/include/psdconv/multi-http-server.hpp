#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "psdconv/http-server-config.hpp"
#include "psdconv/router.hpp"
#include "psdconv/single-http-server.hpp"
#include "psdconv/vector.hpp"

namespace psdconv {

// Runs config.nbThreads SingleHttpServer instances, each with its own copy of the router, bound to the same port
// with SO_REUSEPORT so that the kernel balances connections between them.
// Handlers are therefore called concurrently from several threads.
class MultiHttpServer {
 public:
  // All servers are created and bound here: port() is valid right after construction.
  // Throws like the SingleHttpServer constructor.
  MultiHttpServer(HttpServerConfig config, const Router& router);

  [[nodiscard]] uint16_t port() const noexcept { return _servers.front()->port(); }

  [[nodiscard]] std::size_t nbThreads() const noexcept { return _servers.size(); }

  // Runs all event loops (the first one in the calling thread) and returns once all of them are stopped.
  // Rethrows the first exception raised by an event loop.
  void run();

  // Thread safe stop request of all event loops.
  void stop() noexcept;

 private:
  vector<std::unique_ptr<SingleHttpServer>> _servers;
};

}  // namespace psdconv
