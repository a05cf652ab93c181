#pragma once

#include <chrono>
#include <cstdint>
#include <thread>

#include "psdconv/http-server-config.hpp"
#include "psdconv/router.hpp"
#include "psdconv/single-http-server.hpp"

namespace psdconv::test {

// Runs a SingleHttpServer on an ephemeral port in a background thread for the lifetime of the object.
// Requests can be sent right after construction: the socket is already listening.
class TestServer {
 public:
  static constexpr std::chrono::milliseconds kPollInterval{10};

  explicit TestServer(HttpServerConfig config = {}, Router router = {});

  TestServer(const TestServer&) = delete;
  TestServer(TestServer&&) = delete;
  TestServer& operator=(const TestServer&) = delete;
  TestServer& operator=(TestServer&&) = delete;

  ~TestServer();

  [[nodiscard]] uint16_t port() const noexcept { return server.port(); }

  SingleHttpServer server;

 private:
  std::jthread _thread;
};

}  // namespace psdconv::test
