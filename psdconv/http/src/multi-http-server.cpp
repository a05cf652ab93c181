#include "psdconv/multi-http-server.hpp"

#include <cstddef>
#include <exception>
#include <memory>
#include <thread>
#include <utility>

#include "psdconv/http-server-config.hpp"
#include "psdconv/log.hpp"
#include "psdconv/router.hpp"
#include "psdconv/single-http-server.hpp"
#include "psdconv/vector.hpp"

namespace psdconv {

MultiHttpServer::MultiHttpServer(HttpServerConfig config, const Router& router) {
  config.validate();
  if (config.nbThreads > 1 && !config.reusePort) {
    log::debug("Enabling SO_REUSEPORT for {} event loop threads", config.nbThreads);
    config.reusePort = true;
  }

  _servers.reserve(config.nbThreads);
  _servers.push_back(std::make_unique<SingleHttpServer>(config, router));
  // Next servers bind the port resolved by the first one (useful when port 0 was requested).
  config.port = _servers.front()->port();
  while (_servers.size() < config.nbThreads) {
    _servers.push_back(std::make_unique<SingleHttpServer>(config, router));
  }
}

void MultiHttpServer::run() {
  const std::size_t nbServers = _servers.size();
  vector<std::exception_ptr> errors(nbServers);
  {
    vector<std::jthread> threads;
    threads.reserve(nbServers - 1U);
    for (std::size_t serverPos = 1; serverPos < nbServers; ++serverPos) {
      threads.emplace_back([this, serverPos, &errors] {
        try {
          _servers[serverPos]->run();
        } catch (const std::exception& ex) {
          log::critical("Event loop {} failed: {}", serverPos, ex.what());
          errors[serverPos] = std::current_exception();
          stop();
        }
      });
    }

    try {
      _servers.front()->run();
    } catch (const std::exception& ex) {
      log::critical("Event loop 0 failed: {}", ex.what());
      errors.front() = std::current_exception();
    }
    // The first loop returned (stop or signal): make sure the other ones follow.
    stop();
  }

  for (const auto& error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }
}

void MultiHttpServer::stop() noexcept {
  for (auto& server : _servers) {
    server->stop();
  }
}

}  // namespace psdconv
