#include "psdconv/event-loop.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>
#include <utility>

#include "psdconv/base-fd.hpp"

using namespace psdconv;
using namespace std::chrono_literals;

TEST(EventLoopTest, TimeoutReturnsEmptySpanWithData) {
  EventLoop loop(std::chrono::milliseconds{5});
  const auto events = loop.poll();
  EXPECT_TRUE(events.empty());
  EXPECT_NE(events.data(), nullptr);
}

TEST(EventLoopTest, ReportsReadablePipe) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  BaseFd rd(fds[0]);
  BaseFd wr(fds[1]);

  EventLoop loop(std::chrono::milliseconds{100});
  loop.addOrThrow(EventLoop::EventFd{rd.fd(), EventIn});
  ASSERT_EQ(1, ::write(wr.fd(), "x", 1));

  const auto events = loop.poll();
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].fd, rd.fd());
  EXPECT_TRUE((events[0].eventBmp & EventIn) != 0);
}

TEST(EventLoopTest, CapacityGrowsWhenSaturated) {
  EventLoop loop(std::chrono::milliseconds{10}, 1);
  EXPECT_EQ(loop.capacity(), 1U);

  int fds1[2];
  int fds2[2];
  ASSERT_EQ(0, ::pipe(fds1));
  ASSERT_EQ(0, ::pipe(fds2));
  BaseFd r1(fds1[0]);
  BaseFd w1(fds1[1]);
  BaseFd r2(fds2[0]);
  BaseFd w2(fds2[1]);
  loop.addOrThrow(EventLoop::EventFd{r1.fd(), EventIn});
  loop.addOrThrow(EventLoop::EventFd{r2.fd(), EventIn});
  ASSERT_EQ(1, ::write(w1.fd(), "a", 1));
  ASSERT_EQ(1, ::write(w2.fd(), "b", 1));

  const auto events = loop.poll();
  EXPECT_EQ(events.size(), 1U);
  EXPECT_EQ(loop.capacity(), 2U);
}

TEST(EventLoopTest, AddTwiceFailsAndModUnknownFails) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  BaseFd rd(fds[0]);
  BaseFd wr(fds[1]);

  EventLoop loop(std::chrono::milliseconds{1});
  EXPECT_TRUE(loop.add(EventLoop::EventFd{rd.fd(), EventIn}));
  EXPECT_FALSE(loop.add(EventLoop::EventFd{rd.fd(), EventIn}));
  EXPECT_FALSE(loop.mod(EventLoop::EventFd{wr.fd(), EventOut}));
  EXPECT_TRUE(loop.mod(EventLoop::EventFd{rd.fd(), EventIn | EventRdHup}));
  loop.del(rd.fd());
  loop.del(rd.fd());
}

TEST(EventLoopTest, MoveKeepsRegistrations) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  BaseFd rd(fds[0]);
  BaseFd wr(fds[1]);

  EventLoop loop(std::chrono::milliseconds{50});
  loop.addOrThrow(EventLoop::EventFd{rd.fd(), EventIn});
  EventLoop moved(std::move(loop));
  ASSERT_EQ(1, ::write(wr.fd(), "z", 1));
  EXPECT_EQ(moved.poll().size(), 1U);
}
