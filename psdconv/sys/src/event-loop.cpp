#include "psdconv/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <utility>

#include "psdconv/base-fd.hpp"
#include "psdconv/errno-throw.hpp"
#include "psdconv/log.hpp"

namespace psdconv {

static_assert(EventIn == EPOLLIN && EventOut == EPOLLOUT && EventErr == EPOLLERR && EventHup == EPOLLHUP &&
              EventRdHup == EPOLLRDHUP);

namespace {

std::string_view OperationName(int operation) {
  switch (operation) {
    case EPOLL_CTL_ADD:
      return "ADD";
    case EPOLL_CTL_MOD:
      return "MOD";
    default:
      return "DEL";
  }
}

}  // namespace

EventLoop::EventLoop(std::chrono::milliseconds pollTimeout, uint32_t initialCapacity)
    : _epollFd(::epoll_create1(EPOLL_CLOEXEC)),
      _pollTimeoutMs(static_cast<int>(pollTimeout.count())),
      _epollEvents(std::max(1U, initialCapacity)) {
  if (!_epollFd) {
    throw_errno("epoll_create1 failed");
  }
  _readyEvents.reserve(_epollEvents.size());
  log::debug("EventLoop fd # {} opened", _epollFd.fd());
}

bool EventLoop::control(int operation, EventFd event) const {
  epoll_event ev{};
  ev.events = event.eventBmp;
  ev.data.fd = event.fd;
  if (::epoll_ctl(_epollFd.fd(), operation, event.fd, &ev) == 0) {
    return true;
  }
  const auto err = errno;
  // MOD of a connection closed in the meantime.
  const bool benign = operation == EPOLL_CTL_MOD && (err == EBADF || err == ENOENT);
  log::log(benign ? log::level::warn : log::level::err, "epoll_ctl {} failed for fd # {} (events=0x{:x}): {}",
           OperationName(operation), event.fd, event.eventBmp, std::strerror(err));
  errno = err;
  return false;
}

void EventLoop::addOrThrow(EventFd event) const {
  if (!add(event)) {
    throw_errno("epoll_ctl ADD failed for fd # {}", event.fd);
  }
}

bool EventLoop::add(EventFd event) const { return control(EPOLL_CTL_ADD, event); }

bool EventLoop::mod(EventFd event) const { return control(EPOLL_CTL_MOD, event); }

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_epollFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) {
    log::debug("epoll_ctl DEL failed for fd # {}: {}", fd, std::strerror(errno));
  }
}

std::span<const EventLoop::EventFd> EventLoop::poll() {
  _readyEvents.clear();
  const int nbReady =
      ::epoll_wait(_epollFd.fd(), _epollEvents.data(), static_cast<int>(_epollEvents.size()), _pollTimeoutMs);
  if (nbReady < 0) {
    if (errno == EINTR) {
      return {_readyEvents.data(), 0};
    }
    log::error("epoll_wait failed (timeout {} ms): {}", _pollTimeoutMs, std::strerror(errno));
    return {};
  }

  for (const epoll_event& ev : std::span<const epoll_event>(_epollEvents.data(), static_cast<std::size_t>(nbReady))) {
    _readyEvents.push_back(EventFd{ev.data.fd, static_cast<EventBmp>(ev.events)});
  }

  if (std::cmp_equal(nbReady, _epollEvents.size())) {
    // More descriptors may be ready than reported.
    _epollEvents.resize(_epollEvents.size() * 2U);
    _readyEvents.reserve(_epollEvents.size());
  }
  return _readyEvents;
}

}  // namespace psdconv
