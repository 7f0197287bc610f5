#include "apirest/event-loop.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <system_error>
#include <vector>

#include "apirest/event-fd.hpp"
#include "apirest/event.hpp"

namespace apirest {

TEST(EventLoop, TimeoutReturnsEmpty) {
  EventLoop loop(std::chrono::milliseconds{10});
  EXPECT_TRUE(loop.poll().empty());
}

TEST(EventLoop, ReportsEventFdReadiness) {
  EventLoop loop(std::chrono::milliseconds{100});
  EventFd wakeup;
  loop.addOrThrow(EventLoop::EventFd{EventIn, wakeup.fd()});

  wakeup.send();
  auto events = loop.poll();
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events.front().fd, wakeup.fd());
  EXPECT_NE(events.front().eventBmp & EventIn, 0U);

  wakeup.read();
  EXPECT_TRUE(loop.poll().empty());
}

TEST(EventLoop, GrowsOnSaturation) {
  EventLoop loop(std::chrono::milliseconds{10}, 1);
  std::vector<EventFd> fds(3);
  for (const auto& efd : fds) {
    loop.addOrThrow(EventLoop::EventFd{EventIn, efd.fd()});
    efd.send();
  }
  EXPECT_EQ(loop.poll().size(), 1U);
  EXPECT_EQ(loop.capacity(), 2U);
  EXPECT_EQ(loop.poll().size(), 2U);
  EXPECT_EQ(loop.capacity(), 4U);
}

TEST(EventLoop, AddInvalidFdFails) {
  EventLoop loop(std::chrono::milliseconds{10});
  EXPECT_FALSE(loop.add(EventLoop::EventFd{EventIn, -1}));
  EXPECT_THROW(loop.addOrThrow(EventLoop::EventFd{EventIn, -1}), std::system_error);
}

TEST(EventLoop, DeletedFdNoLongerReported) {
  EventLoop loop(std::chrono::milliseconds{10});
  EventFd wakeup;
  loop.addOrThrow(EventLoop::EventFd{EventIn, wakeup.fd()});
  loop.del(wakeup.fd());
  wakeup.send();
  EXPECT_TRUE(loop.poll().empty());
}

}  // namespace apirest
