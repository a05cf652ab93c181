#include "psdconv/single-http-server.hpp"

#include <cerrno>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "psdconv/base-fd.hpp"
#include "psdconv/connection-state.hpp"
#include "psdconv/event-loop.hpp"
#include "psdconv/http-constants.hpp"
#include "psdconv/http-error-build.hpp"
#include "psdconv/http-method.hpp"
#include "psdconv/http-request.hpp"
#include "psdconv/http-response.hpp"
#include "psdconv/http-server-config.hpp"
#include "psdconv/http-status-code.hpp"
#include "psdconv/log.hpp"
#include "psdconv/router.hpp"
#include "psdconv/signal-handler.hpp"
#include "psdconv/socket-ops.hpp"
#include "psdconv/socket.hpp"
#include "psdconv/timedef.hpp"

namespace psdconv {

namespace {

constexpr EventBmp kReadEvents = EventIn | EventRdHup;
constexpr EventBmp kReadWriteEvents = EventIn | EventOut | EventRdHup;

std::string AllowedMethodsStr(http::MethodBmp methods) {
  std::string ret;
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    const auto method = http::MethodFromIdx(methodIdx);
    if (http::IsMethodSet(methods, method)) {
      if (!ret.empty()) {
        ret.append(", ");
      }
      ret.append(http::MethodToStr(method));
    }
  }
  return ret;
}

// Returns false if value is not entirely made of digits or overflows.
bool ParseContentLength(std::string_view value, std::size_t& contentLength) {
  const char* end = value.data() + value.size();
  const auto [ptr, errc] = std::from_chars(value.data(), end, contentLength);
  return !value.empty() && errc == std::errc() && ptr == end;
}

}  // namespace

SingleHttpServer::SingleHttpServer(HttpServerConfig config, Router router)
    : _config(std::move(config)), _router(std::move(router)) {
  _config.validate();

  _listenSocket = Socket(Socket::Type::StreamNonBlock);
  _listenSocket.bindAndListen(_config.reusePort, _config.port);
  _eventLoop = EventLoop(_config.pollInterval);
  _eventLoop.addOrThrow(EventLoop::EventFd{_listenSocket.fd(), EventIn});
}

void SingleHttpServer::run() {
  if (_running.exchange(true, std::memory_order_relaxed)) {
    throw std::logic_error("Server is already running");
  }

  log::info("Server running on port :{}", _config.port);

  while (!_stopRequested.load(std::memory_order_relaxed) && !SignalHandler::IsStopRequested()) {
    eventLoop();
  }

  log::info("Stopping server on port :{} ({} open connection(s))", _config.port, _connections.size());
  for (auto it = _connections.begin(); it != _connections.end();) {
    _eventLoop.del(it->first);
    it = _connections.erase(it);
  }

  _stopRequested.store(false, std::memory_order_relaxed);
  _running.store(false, std::memory_order_relaxed);
}

void SingleHttpServer::eventLoop() {
  const auto events = _eventLoop.poll();
  // Handlers run synchronously: idleness is measured against the time the events were observed, so that a long
  // handler does not make other connections look idle.
  const auto pollTime = SteadyClock::now();
  if (events.data() == nullptr) {
    log::critical("Event loop failure on port :{}, stopping server", _config.port);
    stop();
    return;
  }

  for (const auto& event : events) {
    if (event.fd == _listenSocket.fd()) {
      acceptNewConnections();
      continue;
    }
    if ((event.eventBmp & (EventIn | EventRdHup | EventHup | EventErr)) != 0) {
      handleReadableClient(event.fd);
    }
    if ((event.eventBmp & EventOut) != 0) {
      handleWritableClient(event.fd);
    }
  }

  sweepIdleConnections(pollTime);
}

void SingleHttpServer::acceptNewConnections() {
  while (true) {
    BaseFd clientFd(AcceptNonBlocking(_listenSocket.fd()));
    if (!clientFd) {
      if (errno == EINTR) {
        continue;
      }
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        log::error("accept failed on port :{}: {}", _config.port, std::strerror(errno));
      }
      break;
    }
    const int fd = clientFd.fd();
    if (_config.tcpNoDelay && !SetTcpNoDelay(fd)) {
      log::warn("Unable to set TCP_NODELAY on fd # {}", fd);
    }
    if (!_eventLoop.add(EventLoop::EventFd{fd, kReadEvents})) {
      continue;
    }
    _connections.insert_or_assign(fd, ConnectionState(std::move(clientFd)));
    log::trace("Accepted connection fd # {}", fd);
  }
}

void SingleHttpServer::handleReadableClient(int fd) {
  auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  ConnectionState& state = cnxIt->second;

  while (true) {
    int64_t nbRead = 0;
    state.inBuffer.resize_and_overwrite(
        state.inBuffer.size() + _config.readChunkBytes, [&](char* data, std::size_t newSize) {
          const std::size_t oldSize = newSize - _config.readChunkBytes;
          nbRead = SafeRecv(fd, data + oldSize, _config.readChunkBytes);
          return oldSize + static_cast<std::size_t>(nbRead > 0 ? nbRead : 0);
        });
    if (nbRead > 0) {
      state.lastActivity = SteadyClock::now();
      if (state.draining) {
        state.inBuffer.clear();
      }
      continue;
    }
    if (nbRead == 0) {
      state.peerClosed = true;
      break;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      break;
    }
    log::debug("recv failed on fd # {}: {}", fd, std::strerror(errno));
    closeConnection(cnxIt);
    return;
  }

  if (!state.draining) {
    processRequests(cnxIt);
  }

  if (state.peerClosed) {
    if (!state.hasPendingOutput() || state.draining) {
      closeConnection(cnxIt);
      return;
    }
    state.closeAfterFlush = true;
  }

  flushOutbound(cnxIt);
}

void SingleHttpServer::handleWritableClient(int fd) {
  auto cnxIt = _connections.find(fd);
  if (cnxIt != _connections.end()) {
    flushOutbound(cnxIt);
  }
}

void SingleHttpServer::processRequests(ConnectionMapIt cnxIt) {
  ConnectionState& state = cnxIt->second;
  std::size_t consumedBytes = 0;

  while (!state.closeAfterFlush) {
    std::string_view buffer(state.inBuffer);
    buffer.remove_prefix(consumedBytes);
    if (buffer.empty()) {
      break;
    }

    const auto headEnd = buffer.find(http::DoubleCRLF);
    if (headEnd == std::string_view::npos) {
      if (buffer.size() > _config.maxHeaderBytes) {
        emitSimpleError(cnxIt, http::StatusCodeRequestHeaderFieldsTooLarge);
      }
      break;
    }
    const std::size_t headSize = headEnd + http::DoubleCRLF.size();
    if (headSize > _config.maxHeaderBytes) {
      emitSimpleError(cnxIt, http::StatusCodeRequestHeaderFieldsTooLarge);
      break;
    }

    HttpRequest request;
    const auto status = request.setHead(buffer.substr(0, headSize));
    if (status != http::StatusCodeOK) {
      emitSimpleError(cnxIt, status);
      break;
    }

    if (request.headerValue(http::TransferEncoding)) {
      // Only Content-Length framed bodies are supported.
      emitSimpleError(cnxIt, http::StatusCodeNotImplemented);
      break;
    }

    std::size_t contentLength = 0;
    if (const auto contentLengthStr = request.headerValue(http::ContentLength)) {
      if (!ParseContentLength(*contentLengthStr, contentLength)) {
        emitSimpleError(cnxIt, http::StatusCodeBadRequest);
        break;
      }
    } else if (http::MethodExpectsBody(request.method())) {
      emitSimpleError(cnxIt, http::StatusCodeLengthRequired);
      break;
    }

    if (contentLength > _config.maxBodyBytes) {
      log::info("Rejecting request body of {} bytes (limit {})", contentLength, _config.maxBodyBytes);
      emitSimpleError(cnxIt, http::StatusCodePayloadTooLarge);
      break;
    }

    if (buffer.size() - headSize < contentLength) {
      if (request.hasExpectContinue() && !state.continueSent) {
        state.outBuffer.append(http::HTTP11_100_CONTINUE);
        state.continueSent = true;
      }
      // Views of 'request' and 'buffer' are not used after this point.
      state.inBuffer.reserve(consumedBytes + headSize + contentLength);
      break;
    }

    request.setBody(buffer.substr(headSize, contentLength));
    const HttpResponse response = dispatch(request);

    ++state.nbRequestsProcessed;
    const bool closeConnection = !_config.enableKeepAlive || request.wantClose() ||
                                 state.nbRequestsProcessed >= _config.maxRequestsPerConnection;
    response.appendTo(state.outBuffer, _config.globalHeaders, closeConnection,
                      request.method() == http::Method::HEAD, SysClock::now());
    log::debug("{} {} -> {}", http::MethodToStr(request.method()), request.path(), response.statusCode());

    consumedBytes += headSize + contentLength;
    state.continueSent = false;
    state.closeAfterFlush = closeConnection;
  }

  if (consumedBytes != 0) {
    state.inBuffer.erase(0, consumedBytes);
  }
}

HttpResponse SingleHttpServer::dispatch(const HttpRequest& request) const {
  const auto routing = _router.match(request.method(), request.path());
  if (routing.pRequestHandler == nullptr) {
    if (routing.methodNotAllowed()) {
      auto response = MakeJsonErrorResponse(http::StatusCodeMethodNotAllowed);
      response.header(http::Allow, AllowedMethodsStr(routing.allowedMethods));
      return response;
    }
    return MakeJsonErrorResponse(http::StatusCodeNotFound);
  }

  try {
    return (*routing.pRequestHandler)(request);
  } catch (const std::exception& ex) {
    log::error("Exception in handler of {} {}: {}", http::MethodToStr(request.method()), request.path(), ex.what());
  }
  return MakeJsonErrorResponse(http::StatusCodeInternalServerError);
}

void SingleHttpServer::emitSimpleError(ConnectionMapIt cnxIt, http::StatusCode statusCode) {
  log::debug("Emitting error {} on fd # {}", statusCode, cnxIt->first);
  ConnectionState& state = cnxIt->second;
  MakeJsonErrorResponse(statusCode).appendTo(state.outBuffer, _config.globalHeaders, true, false, SysClock::now());
  state.closeAfterFlush = true;
}

void SingleHttpServer::flushOutbound(ConnectionMapIt cnxIt) {
  ConnectionState& state = cnxIt->second;
  const int fd = cnxIt->first;

  while (state.hasPendingOutput()) {
    const auto nbSent = SafeSend(fd, state.pendingOutput());
    if (nbSent > 0) {
      state.consumeOutput(static_cast<std::size_t>(nbSent));
      state.lastActivity = SteadyClock::now();
      continue;
    }
    if (nbSent == -1 && errno == EINTR) {
      continue;
    }
    if (nbSent == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      if (!state.waitingWritable && _eventLoop.mod(EventLoop::EventFd{fd, kReadWriteEvents})) {
        state.waitingWritable = true;
      }
      return;
    }
    log::debug("send failed on fd # {}: {}", fd, std::strerror(errno));
    closeConnection(cnxIt);
    return;
  }

  if (state.waitingWritable && _eventLoop.mod(EventLoop::EventFd{fd, kReadEvents})) {
    state.waitingWritable = false;
  }

  if (state.closeAfterFlush) {
    if (state.peerClosed) {
      closeConnection(cnxIt);
      return;
    }
    if (!state.draining) {
      // Closing with unread input would reset the connection and may discard the response on the client side.
      ShutdownWrite(fd);
      state.draining = true;
      state.inBuffer.clear();
      state.inBuffer.shrink_to_fit();
    }
  }
}

void SingleHttpServer::closeConnection(ConnectionMapIt cnxIt) {
  log::trace("Closing connection fd # {}", cnxIt->first);
  _eventLoop.del(cnxIt->first);
  _connections.erase(cnxIt);
}

void SingleHttpServer::sweepIdleConnections(SteadyClock::time_point now) {
  if (_config.keepAliveTimeout.count() == 0) {
    return;
  }
  for (auto it = _connections.begin(); it != _connections.end();) {
    if (now - it->second.lastActivity > _config.keepAliveTimeout) {
      log::debug("Closing idle connection fd # {}", it->first);
      _eventLoop.del(it->first);
      it = _connections.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace psdconv
