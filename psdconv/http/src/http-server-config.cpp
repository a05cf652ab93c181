#include "psdconv/http-server-config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "psdconv/http-header.hpp"
#include "psdconv/http-response.hpp"

namespace psdconv {

HttpServerConfig& HttpServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReusePort(bool on) {
  this->reusePort = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withTcpNoDelay(bool on) {
  this->tcpNoDelay = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withNbThreads(uint32_t nbThreads) {
  this->nbThreads = nbThreads;
  return *this;
}

HttpServerConfig& HttpServerConfig::withKeepAliveMode(bool on) {
  this->enableKeepAlive = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxRequestsPerConnection(uint32_t maxRequests) {
  this->maxRequestsPerConnection = maxRequests;
  return *this;
}

HttpServerConfig& HttpServerConfig::withKeepAliveTimeout(std::chrono::milliseconds timeout) {
  this->keepAliveTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReadChunkBytes(std::size_t readChunkBytes) {
  this->readChunkBytes = readChunkBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  this->pollInterval = interval;
  return *this;
}

HttpServerConfig& HttpServerConfig::withGlobalHeader(std::string_view name, std::string_view value) {
  globalHeaders.emplace_back(std::string(name), std::string(value));
  return *this;
}

void HttpServerConfig::validate() const {
  if (nbThreads == 0) {
    throw std::invalid_argument("nbThreads must be > 0");
  }
  if (std::cmp_less(maxHeaderBytes, 128)) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (maxBodyBytes == 0) {
    throw std::invalid_argument("maxBodyBytes must be > 0");
  }
  if (readChunkBytes == 0) {
    throw std::invalid_argument("readChunkBytes must be > 0");
  }
  if (maxRequestsPerConnection == 0) {
    throw std::invalid_argument("maxRequestsPerConnection must be > 0");
  }
  if (keepAliveTimeout.count() < 0) {
    throw std::invalid_argument("keepAliveTimeout must be non-negative");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("Poll interval value is too large");
  }

  for (const http::Header& header : globalHeaders) {
    if (!http::IsValidHeaderName(header.name)) {
      throw std::invalid_argument(std::format("header has invalid name: '{}'", header.name));
    }
    if (IsReservedResponseHeader(header.name)) {
      throw std::invalid_argument(std::format("attempt to set reserved header: '{}'", header.name));
    }
    if (!http::IsValidHeaderValue(header.value)) {
      throw std::invalid_argument(std::format("header has invalid value: '{}'", header.value));
    }
  }
}

}  // namespace psdconv
