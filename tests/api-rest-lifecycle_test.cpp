#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <latch>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "apirest/api-rest-error.hpp"
#include "apirest/api-rest-module.hpp"
#include "apirest/config-resolver.hpp"
#include "apirest/http-status-code.hpp"
#include "apirest/parameter-store.hpp"
#include "apirest/recording-handlers.hpp"
#include "apirest/socket.hpp"
#include "apirest/test-module-fixture.hpp"
#include "apirest/test-util.hpp"

using namespace std::chrono_literals;

namespace apirest {

namespace {

ApiRestErrc StartError(ApiRestModule& module) {
  try {
    module.start();
  } catch (const ApiRestError& ex) {
    return ex.code();
  }
  throw std::logic_error("start() unexpectedly succeeded");
}

}  // namespace

TEST(ApiRestLifecycle, StartServeStop) {
  test::TestModule tm;
  EXPECT_EQ(tm.module.state(), ApiRestModule::State::Idle);
  EXPECT_EQ(tm.port(), 0);

  tm.module.start();
  EXPECT_TRUE(tm.module.running());
  EXPECT_FALSE(tm.module.isTls());
  const auto port = tm.port();
  ASSERT_NE(port, 0);

  const auto response = test::simpleGet(port, "/api/session");
  EXPECT_EQ(response.statusCode, http::StatusCodeOK);
  EXPECT_EQ(response.body, "session");
  EXPECT_EQ(response.header("X-Frame-Options"), "DENY");

  EXPECT_TRUE(tm.module.stop());
  EXPECT_EQ(tm.module.state(), ApiRestModule::State::Idle);
  EXPECT_EQ(tm.port(), 0);
  EXPECT_FALSE(test::AttemptConnect(port));
}

TEST(ApiRestLifecycle, DefaultPortIs8081) {
  ParameterStore params;
  auto handlers = std::make_shared<test::RecordingHandlers>();
  ApiRestModule module(params, handlers, nullptr);
  EXPECT_EQ(params.getInt(param::kPort), 8081);
  EXPECT_EQ(params.getString(param::kAddress), "127.0.0.1");
  EXPECT_EQ(params.getString(param::kAllowOrigin), "*");
  EXPECT_FALSE(params.getBool(param::kWebsocket));
}

TEST(ApiRestLifecycle, StartWhileRunningIsRejected) {
  test::TestModule tm;
  tm.module.start();
  const auto port = tm.port();
  EXPECT_EQ(StartError(tm.module), ApiRestErrc::AlreadyStarted);
  // the running listener is unaffected
  EXPECT_TRUE(tm.module.running());
  EXPECT_EQ(tm.port(), port);
  EXPECT_EQ(test::simpleGet(port, "/api/file").statusCode, http::StatusCodeOK);
}

TEST(ApiRestLifecycle, StopIsIdempotent) {
  test::TestModule tm;
  EXPECT_FALSE(tm.module.stop());
  tm.module.start();
  EXPECT_TRUE(tm.module.stop());
  EXPECT_FALSE(tm.module.stop());
  EXPECT_EQ(tm.module.state(), ApiRestModule::State::Idle);
}

TEST(ApiRestLifecycle, RestartAfterStop) {
  test::TestModule tm;
  for (int round = 0; round < 3; ++round) {
    tm.module.start();
    EXPECT_EQ(test::simpleGet(tm.port(), "/api/events").body, "events");
    EXPECT_TRUE(tm.module.stop());
  }
  EXPECT_EQ(tm.handlers->nbCalls(), 3U);
}

TEST(ApiRestLifecycle, ParametersAreReadAtEachStart) {
  test::TestModule tm;
  tm.set(param::kAllowOrigin, "https://first.example");
  tm.module.start();
  EXPECT_EQ(test::simpleGet(tm.port(), "/api/session").header("Access-Control-Allow-Origin"), "https://first.example");
  tm.module.stop();

  tm.set(param::kAllowOrigin, "https://second.example");
  tm.module.start();
  EXPECT_EQ(test::simpleGet(tm.port(), "/api/session").header("Access-Control-Allow-Origin"),
            "https://second.example");
}

TEST(ApiRestLifecycle, InvalidConfigurationLeavesModuleIdle) {
  test::TestModule tm;
  tm.set(param::kAddress, "localhost");
  EXPECT_EQ(StartError(tm.module), ApiRestErrc::InvalidConfiguration);
  EXPECT_EQ(tm.module.state(), ApiRestModule::State::Idle);

  tm.set(param::kAddress, "127.0.0.1").set(param::kPort, "http");
  EXPECT_EQ(StartError(tm.module), ApiRestErrc::InvalidConfiguration);

  // recovers once fixed
  tm.set(param::kPort, "0");
  EXPECT_NO_THROW(tm.module.start());
}

TEST(ApiRestLifecycle, BindFailure) {
  Socket busy(Socket::Type::Stream);
  uint16_t busyPort = 0;
  busy.bindAndListen("127.0.0.1", busyPort);

  test::TestModule tm;
  tm.set(param::kPort, std::to_string(busyPort));
  EXPECT_EQ(StartError(tm.module), ApiRestErrc::BindFailed);
  EXPECT_EQ(tm.module.state(), ApiRestModule::State::Idle);
  EXPECT_EQ(tm.port(), 0);

  // unassignable address
  tm.set(param::kPort, "0").set(param::kAddress, "192.0.2.1");
  EXPECT_EQ(StartError(tm.module), ApiRestErrc::BindFailed);
}

TEST(ApiRestLifecycle, QuitSignalNotifiedOnStop) {
  test::TestModule tm;
  tm.module.start();
  const auto token = tm.module.quitSignal().token();
  EXPECT_FALSE(token.stop_requested());
  std::jthread observer([&tm] { EXPECT_TRUE(tm.module.quitSignal().waitFor(10s)); });
  tm.module.stop();
  observer.join();
  EXPECT_TRUE(token.stop_requested());

  // re-armed at next start
  tm.module.start();
  EXPECT_FALSE(tm.module.quitSignal().notified());
}

TEST(ApiRestLifecycle, NoFaultOnCleanRun) {
  test::TestModule tm;
  bool faultReported = false;
  tm.module.setFatalFaultHandler([&faultReported](std::exception_ptr) { faultReported = true; });
  tm.module.start();
  EXPECT_EQ(test::simpleGet(tm.port(), "/api/session/env").body, "session/env");
  tm.module.stop();
  EXPECT_FALSE(faultReported);
  EXPECT_NO_THROW(tm.module.rethrowIfFault());
}

TEST(ApiRestLifecycle, ListenerFaultIsReportedToHost) {
  auto failNextIteration = std::make_shared<std::atomic<bool>>(false);
  auto options = test::TestModule::DefaultOptions();
  options.listenerOptions.iterationHook = [failNextIteration] {
    if (failNextIteration->exchange(false)) {
      throw std::runtime_error("epoll_wait failed");
    }
  };
  std::promise<std::exception_ptr> reported;
  auto reportedFault = reported.get_future();
  test::TestModule tm(options);
  tm.module.setFatalFaultHandler([&reported](std::exception_ptr fault) { reported.set_value(std::move(fault)); });

  tm.module.start();
  const auto port = tm.port();
  EXPECT_EQ(test::simpleGet(port, "/api/session").statusCode, http::StatusCodeOK);
  EXPECT_NO_THROW(tm.module.rethrowIfFault());

  failNextIteration->store(true);
  ASSERT_EQ(reportedFault.wait_for(2s), std::future_status::ready);
  EXPECT_NE(reportedFault.get(), nullptr);
  EXPECT_THROW(tm.module.rethrowIfFault(), std::runtime_error);
  // the faulted listener does not accept connections anymore
  EXPECT_FALSE(test::AttemptConnect(port));

  EXPECT_TRUE(tm.module.stop());
  EXPECT_EQ(tm.module.state(), ApiRestModule::State::Idle);
  EXPECT_EQ(tm.port(), 0);

  // the fault is cleared by the next start
  tm.module.start();
  EXPECT_NO_THROW(tm.module.rethrowIfFault());
  EXPECT_EQ(test::simpleGet(tm.port(), "/api/session").statusCode, http::StatusCodeOK);
}

TEST(ApiRestLifecycle, ConcurrentStartsHaveSingleWinner) {
  constexpr int kNbThreads = 8;
  test::TestModule tm;
  std::atomic<int> nbStarted{0};
  std::atomic<int> nbAlreadyStarted{0};
  std::latch go(kNbThreads);
  {
    std::vector<std::jthread> starters;
    for (int threadPos = 0; threadPos < kNbThreads; ++threadPos) {
      starters.emplace_back([&] {
        go.arrive_and_wait();
        try {
          tm.module.start();
          ++nbStarted;
        } catch (const ApiRestError& ex) {
          if (ex.code() == ApiRestErrc::AlreadyStarted) {
            ++nbAlreadyStarted;
          }
        }
      });
    }
  }
  EXPECT_EQ(nbStarted.load(), 1);
  EXPECT_EQ(nbAlreadyStarted.load(), kNbThreads - 1);
  EXPECT_TRUE(tm.module.running());
  EXPECT_EQ(test::simpleGet(tm.port(), "/api/session").statusCode, http::StatusCodeOK);
}

TEST(ApiRestLifecycle, ConcurrentStartAndStop) {
  test::TestModule tm;
  for (int round = 0; round < 20; ++round) {
    std::latch go(2);
    std::jthread starter([&] {
      go.arrive_and_wait();
      tm.module.start();
    });
    std::jthread stopper([&] {
      go.arrive_and_wait();
      (void)tm.module.stop();
    });
    starter.join();
    stopper.join();

    // Either stop ran first and found nothing to stop, or it fully stopped the started listener.
    const auto state = tm.module.state();
    ASSERT_TRUE(state == ApiRestModule::State::Idle || state == ApiRestModule::State::Running);
    if (state == ApiRestModule::State::Running) {
      EXPECT_EQ(test::simpleGet(tm.port(), "/api/events").statusCode, http::StatusCodeOK);
      EXPECT_TRUE(tm.module.stop());
    }
    EXPECT_EQ(tm.port(), 0);
  }
}

TEST(ApiRestLifecycle, RequiresHandlers) {
  ParameterStore params;
  EXPECT_THROW(ApiRestModule(params, nullptr, nullptr), std::invalid_argument);
}

TEST(ApiRestLifecycle, StateNames) {
  EXPECT_EQ(StateName(ApiRestModule::State::Idle), "idle");
  EXPECT_EQ(StateName(ApiRestModule::State::Running), "running");
  EXPECT_EQ(StateName(ApiRestModule::State::Stopping), "stopping");
}

}  // namespace apirest
