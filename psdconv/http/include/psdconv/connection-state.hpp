#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "psdconv/base-fd.hpp"
#include "psdconv/timedef.hpp"

namespace psdconv {

// Per-connection state of SingleHttpServer.
struct ConnectionState {
  explicit ConnectionState(BaseFd socketFd) noexcept : fd(std::move(socketFd)), lastActivity(SteadyClock::now()) {}

  [[nodiscard]] bool hasPendingOutput() const noexcept { return outOffset < outBuffer.size(); }

  [[nodiscard]] std::string_view pendingOutput() const noexcept {
    return std::string_view(outBuffer).substr(outOffset);
  }

  // Marks 'nbBytes' of the pending output as sent, releasing the buffer once everything is flushed.
  void consumeOutput(std::size_t nbBytes) noexcept;

  BaseFd fd;
  // Received bytes not yet consumed by a complete request.
  std::string inBuffer;
  // Serialized responses, sent from outOffset.
  std::string outBuffer;
  std::size_t outOffset{0};
  SteadyClock::time_point lastActivity;
  uint32_t nbRequestsProcessed{0};
  // Close once the pending output is flushed (error response, Connection: close, request cap reached).
  bool closeAfterFlush{false};
  // The interim 100 Continue was already sent for the request being received.
  bool continueSent{false};
  // Write side is shut down, input is discarded until the peer closes or the idle timeout expires.
  bool draining{false};
  // The peer has closed its write side.
  bool peerClosed{false};
  // EventOut is currently registered for this fd.
  bool waitingWritable{false};
};

}  // namespace psdconv
