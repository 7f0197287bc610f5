#include <gtest/gtest.h>

#include <chrono>
#include <exception>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>

#include "apirest/fatal-fault-signal.hpp"
#include "apirest/quit-signal.hpp"

namespace apirest {

using namespace std::chrono_literals;

TEST(QuitSignal, NotifyWakesWaiters) {
  QuitSignal quit;
  quit.arm();
  EXPECT_FALSE(quit.notified());
  EXPECT_FALSE(quit.waitFor(1ms));

  const auto token = quit.token();
  std::jthread waiter([&quit] { EXPECT_TRUE(quit.waitFor(5s)); });
  std::this_thread::sleep_for(5ms);
  quit.notify();
  waiter.join();
  EXPECT_TRUE(quit.notified());
  EXPECT_TRUE(token.stop_requested());

  // idempotent
  quit.notify();
  EXPECT_TRUE(quit.waitFor(0ms));
}

TEST(QuitSignal, ArmStartsNewPeriod) {
  QuitSignal quit;
  quit.arm();
  const auto oldToken = quit.token();
  quit.notify();
  quit.arm();
  EXPECT_FALSE(quit.notified());
  EXPECT_FALSE(quit.token().stop_requested());
  EXPECT_TRUE(oldToken.stop_requested());
}

TEST(QuitSignal, StopCallback) {
  QuitSignal quit;
  quit.arm();
  bool called = false;
  std::stop_callback callback(quit.token(), [&called] { called = true; });
  quit.notify();
  EXPECT_TRUE(called);
}

TEST(FatalFaultSignal, RecordsAndForwardsFault) {
  FatalFaultSignal fault;
  EXPECT_FALSE(fault.raised());
  EXPECT_NO_THROW(fault.rethrowIfRaised());

  std::string seen;
  fault.setHandler([&seen](std::exception_ptr ptr) {
    try {
      std::rethrow_exception(ptr);
    } catch (const std::runtime_error& ex) {
      seen = ex.what();
    }
  });
  fault.raise(std::make_exception_ptr(std::runtime_error("epoll_wait failed")), "epoll_wait failed");
  EXPECT_EQ(seen, "epoll_wait failed");
  EXPECT_TRUE(fault.raised());
  EXPECT_THROW(fault.rethrowIfRaised(), std::runtime_error);

  fault.clear();
  EXPECT_FALSE(fault.raised());
  EXPECT_NO_THROW(fault.rethrowIfRaised());
}

TEST(FatalFaultSignal, WithoutHandler) {
  FatalFaultSignal fault;
  fault.raise(std::make_exception_ptr(std::logic_error("boom")), "boom");
  EXPECT_THROW(fault.rethrowIfRaised(), std::logic_error);
}

}  // namespace apirest
