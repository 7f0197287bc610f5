#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>

#include "apirest/api-rest-module.hpp"
#include "apirest/http-status-code.hpp"
#include "apirest/test-module-fixture.hpp"
#include "apirest/test-util.hpp"

using namespace std::chrono_literals;

namespace apirest {

namespace {

ApiRestModule::Options WithShutdownTimeout(std::chrono::milliseconds timeout) {
  auto options = test::TestModule::DefaultOptions();
  options.shutdownTimeout = timeout;
  return options;
}

}  // namespace

TEST(ApiRestShutdown, InFlightRequestCompletes) {
  test::TestModule tm(WithShutdownTimeout(5s));
  tm.handlers->setDelay(300ms);
  tm.module.start();
  const auto port = tm.port();

  auto pending = std::async(std::launch::async, [port] {
    test::RequestOptions opt;
    opt.target = "/api/session/modules";
    return test::request(port, opt);
  });
  ASSERT_TRUE(tm.handlers->waitInFlight(1));

  const auto before = std::chrono::steady_clock::now();
  EXPECT_TRUE(tm.module.stop());
  const auto elapsed = std::chrono::steady_clock::now() - before;
  EXPECT_LT(elapsed, 5s);

  const auto raw = pending.get();
  ASSERT_TRUE(raw);
  const auto response = test::parseResponseOrThrow(*raw);
  EXPECT_EQ(response.statusCode, http::StatusCodeOK);
  EXPECT_EQ(response.body, "session/modules");
}

TEST(ApiRestShutdown, NewConnectionsRefusedWhileDraining) {
  test::TestModule tm(WithShutdownTimeout(5s));
  tm.handlers->setDelay(500ms);
  tm.module.start();
  const auto port = tm.port();

  test::RequestOptions opt;
  opt.target = "/api/file";
  auto slow = std::async(std::launch::async, [port, opt] { return test::request(port, opt); });
  ASSERT_TRUE(tm.handlers->waitInFlight(1));

  auto stopping = std::async(std::launch::async, [&tm] { return tm.module.stop(); });
  EXPECT_TRUE(test::WaitForListenerClosed(port, 400ms));
  EXPECT_TRUE(stopping.get());
  const auto raw = slow.get();
  ASSERT_TRUE(raw);
  EXPECT_EQ(test::parseResponseOrThrow(*raw).body, "file");
}

TEST(ApiRestShutdown, DeadlineForcesClose) {
  test::TestModule tm(WithShutdownTimeout(200ms));
  tm.handlers->setDelay(3s);
  tm.module.start();
  const auto port = tm.port();

  test::ClientConnection cnx(port);
  test::RequestOptions opt;
  opt.target = "/api/session";
  ASSERT_TRUE(test::sendAll(cnx.fd(), test::buildRequest(opt)));
  ASSERT_TRUE(tm.handlers->waitInFlight(1));

  const auto before = std::chrono::steady_clock::now();
  EXPECT_TRUE(tm.module.stop());
  const auto elapsed = std::chrono::steady_clock::now() - before;
  EXPECT_GE(elapsed, 150ms);
  EXPECT_LT(elapsed, 2s);
  EXPECT_EQ(tm.module.state(), ApiRestModule::State::Idle);

  // the connection was closed without any response
  EXPECT_TRUE(test::recvUntilClosed(cnx.fd(), 1s).empty());
}

TEST(ApiRestShutdown, IdleKeepAliveConnectionsAreClosed) {
  test::TestModule tm;
  tm.module.start();
  test::ClientConnection cnx(tm.port());
  test::RequestOptions opt;
  opt.target = "/api/session";
  opt.connection = "keep-alive";
  ASSERT_TRUE(test::sendAll(cnx.fd(), test::buildRequest(opt)));
  EXPECT_EQ(test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd())).statusCode, http::StatusCodeOK);

  const auto before = std::chrono::steady_clock::now();
  EXPECT_TRUE(tm.module.stop());
  EXPECT_LT(std::chrono::steady_clock::now() - before, 2s);
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
}

TEST(ApiRestShutdown, DestructionWaitsForAbandonedHandlers) {
  auto tm = std::make_unique<test::TestModule>(WithShutdownTimeout(100ms));
  const auto handlers = tm->handlers;
  handlers->setDelay(600ms);
  tm->module.start();

  test::ClientConnection cnx(tm->port());
  test::RequestOptions opt;
  opt.target = "/api/session";
  ASSERT_TRUE(test::sendAll(cnx.fd(), test::buildRequest(opt)));
  ASSERT_TRUE(handlers->waitInFlight(1));

  // stop() gives up on the handler at the drain deadline
  EXPECT_TRUE(tm->module.stop());
  EXPECT_EQ(handlers->inFlight(), 1);

  // but the module does not go away before it returned
  tm.reset();
  EXPECT_EQ(handlers->inFlight(), 0);
  EXPECT_EQ(handlers->nbCalls(), 1U);
}

TEST(ApiRestShutdown, RestartAfterForcedClose) {
  test::TestModule tm(WithShutdownTimeout(100ms));
  tm.handlers->setDelay(1s);
  tm.module.start();
  auto abandoned = std::async(std::launch::async, [port = tm.port()] {
    test::RequestOptions opt;
    opt.target = "/api/session";
    return test::request(port, opt);
  });
  ASSERT_TRUE(tm.handlers->waitInFlight(1));
  EXPECT_TRUE(tm.module.stop());
  EXPECT_FALSE(abandoned.get());

  tm.handlers->setDelay(0ms);
  tm.module.start();
  EXPECT_EQ(test::simpleGet(tm.port(), "/api/session").statusCode, http::StatusCodeOK);
}

}  // namespace apirest
