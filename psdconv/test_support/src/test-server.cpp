#include "psdconv/test-server.hpp"

#include <exception>
#include <thread>
#include <utility>

#include "psdconv/http-server-config.hpp"
#include "psdconv/log.hpp"
#include "psdconv/router.hpp"

namespace psdconv::test {

namespace {
HttpServerConfig PrepareConfig(HttpServerConfig config) {
  config.port = 0;
  config.pollInterval = TestServer::kPollInterval;
  return config;
}
}  // namespace

TestServer::TestServer(HttpServerConfig config, Router router)
    : server(PrepareConfig(std::move(config)), std::move(router)), _thread([this] {
        try {
          server.run();
        } catch (const std::exception& ex) {
          log::critical("TestServer event loop failed: {}", ex.what());
        }
      }) {}

TestServer::~TestServer() {
  server.stop();
  if (_thread.joinable()) {
    _thread.join();
  }
}

}  // namespace psdconv::test
