#pragma once

#include <sys/epoll.h>

#include <chrono>
#include <cstdint>
#include <span>

#include "psdconv/base-fd.hpp"
#include "psdconv/vector.hpp"

namespace psdconv {

// Readiness flags, same values as the epoll ones.
using EventBmp = uint32_t;

inline constexpr EventBmp EventIn = 0x001;
inline constexpr EventBmp EventOut = 0x004;
inline constexpr EventBmp EventErr = 0x008;
inline constexpr EventBmp EventHup = 0x010;
inline constexpr EventBmp EventRdHup = 0x2000;

// Level triggered epoll instance owning its descriptor and its ready events buffer.
// The buffer doubles each time a poll fills it entirely.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    int fd;
    EventBmp eventBmp;
  };

  EventLoop() noexcept = default;

  // Throws std::system_error if epoll_create1 fails.
  explicit EventLoop(std::chrono::milliseconds pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  // Register fd with given events. Throws std::system_error on failure.
  void addOrThrow(EventFd event) const;

  // Register fd with given events. Returns false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Change the events watched for fd. Returns false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Stop watching fd. A descriptor that is not registered is not an error.
  void del(int fd) const;

  // Waits up to the poll timeout and returns the ready events, valid until the next call.
  // Timeout and EINTR give an empty span with a non null data(), an epoll_wait failure (logged) a null one.
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

 private:
  [[nodiscard]] bool control(int operation, EventFd event) const;

  BaseFd _epollFd;
  int _pollTimeoutMs{0};
  vector<epoll_event> _epollEvents;
  vector<EventFd> _readyEvents;
};

}  // namespace psdconv
