#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>

#include "apirest/config-resolver.hpp"
#include "apirest/event-bus.hpp"
#include "apirest/http-status-code.hpp"
#include "apirest/test-module-fixture.hpp"
#include "apirest/test-util.hpp"
#include "apirest/websocket-client.hpp"
#include "apirest/websocket-constants.hpp"
#include "apirest/websocket-frame.hpp"

using namespace std::chrono_literals;

namespace apirest {

namespace {

// Wait until the server subscribed the given number of websocket channels to the bus.
bool WaitForSubscribers(const EventBus& bus, std::size_t nb) {
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (bus.nbSubscribers() != nb) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

}  // namespace

class ApiRestWebSocketTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tm.set(param::kWebsocket, "true");
    tm.module.start();
    port = tm.port();
  }

  test::TestModule tm;
  uint16_t port{0};
};

TEST_F(ApiRestWebSocketTest, EventsArePushed) {
  test::WebSocketClient client(port);
  const auto handshake = client.connect("/api/events");
  ASSERT_EQ(handshake.statusCode, http::StatusCodeSwitchingProtocols);
  EXPECT_EQ(handshake.header("Sec-WebSocket-Accept"), "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
  EXPECT_EQ(handshake.header("Access-Control-Allow-Origin"), "*");
  ASSERT_TRUE(WaitForSubscribers(*tm.events, 1));

  tm.events->publish("wifi.ap.new", R"({"tag":"wifi.ap.new","data":{"mac":"aa:bb"}})");
  tm.events->publish("sys.log", R"({"tag":"sys.log"})");

  auto frame = client.receiveFrame();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->opcode, websocket::Opcode::Text);
  EXPECT_EQ(frame->payload, R"({"tag":"wifi.ap.new","data":{"mac":"aa:bb"}})");
  frame = client.receiveFrame();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->payload, R"({"tag":"sys.log"})");

  // the events resource handler is not used in websocket mode
  EXPECT_EQ(tm.handlers->nbCalls(), 0U);
}

TEST_F(ApiRestWebSocketTest, SeveralClientsReceiveSameEvents) {
  test::WebSocketClient first(port);
  test::WebSocketClient second(port);
  ASSERT_EQ(first.connect("/api/events").statusCode, http::StatusCodeSwitchingProtocols);
  ASSERT_EQ(second.connect("/api/events").statusCode, http::StatusCodeSwitchingProtocols);
  ASSERT_TRUE(WaitForSubscribers(*tm.events, 2));
  tm.events->publish("endpoint.new", "x");
  for (auto* client : {&first, &second}) {
    const auto frame = client->receiveFrame();
    ASSERT_TRUE(frame);
    EXPECT_EQ(frame->payload, "x");
  }
}

TEST_F(ApiRestWebSocketTest, PingPong) {
  test::WebSocketClient client(port);
  ASSERT_EQ(client.connect("/api/events").statusCode, http::StatusCodeSwitchingProtocols);
  ASSERT_TRUE(client.sendPing("are you there"));
  const auto frame = client.receiveFrame();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->opcode, websocket::Opcode::Pong);
  EXPECT_EQ(frame->payload, "are you there");
}

TEST_F(ApiRestWebSocketTest, ClientCloseUnsubscribes) {
  test::WebSocketClient client(port);
  ASSERT_EQ(client.connect("/api/events").statusCode, http::StatusCodeSwitchingProtocols);
  ASSERT_TRUE(WaitForSubscribers(*tm.events, 1));
  ASSERT_TRUE(client.sendClose(websocket::CloseCode::Normal, "bye"));
  const auto frame = client.receiveFrame();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->opcode, websocket::Opcode::Close);
  EXPECT_EQ(websocket::ParseClosePayload(frame->payload).code, websocket::CloseCode::Normal);
  EXPECT_TRUE(test::WaitForPeerClose(client.fd(), 1s));
  EXPECT_TRUE(WaitForSubscribers(*tm.events, 0));
}

TEST_F(ApiRestWebSocketTest, ReservedCloseCodeIsNotEchoed) {
  test::WebSocketClient client(port);
  ASSERT_EQ(client.connect("/api/events").statusCode, http::StatusCodeSwitchingProtocols);
  // 1005 only reports locally that no status was received, it must never appear on the wire
  ASSERT_TRUE(client.sendClose(websocket::CloseCode::NoStatusReceived, "reserved"));
  const auto frame = client.receiveFrame();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->opcode, websocket::Opcode::Close);
  EXPECT_EQ(websocket::ParseClosePayload(frame->payload).code, websocket::CloseCode::ProtocolError);
  EXPECT_TRUE(test::WaitForPeerClose(client.fd(), 1s));
}

TEST_F(ApiRestWebSocketTest, UnmaskedClientFrameIsProtocolError) {
  test::WebSocketClient client(port);
  ASSERT_EQ(client.connect("/api/events").statusCode, http::StatusCodeSwitchingProtocols);
  std::string unmasked;
  websocket::BuildFrame(unmasked, websocket::Opcode::Text, "hello");
  ASSERT_TRUE(client.sendRaw(unmasked));
  const auto frame = client.receiveFrame();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->opcode, websocket::Opcode::Close);
  EXPECT_EQ(websocket::ParseClosePayload(frame->payload).code, websocket::CloseCode::ProtocolError);
}

TEST_F(ApiRestWebSocketTest, StopSendsGoingAway) {
  test::WebSocketClient client(port);
  ASSERT_EQ(client.connect("/api/events").statusCode, http::StatusCodeSwitchingProtocols);
  ASSERT_TRUE(WaitForSubscribers(*tm.events, 1));
  EXPECT_TRUE(tm.module.stop());
  const auto frame = client.receiveFrame();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->opcode, websocket::Opcode::Close);
  EXPECT_EQ(websocket::ParseClosePayload(frame->payload).code, websocket::CloseCode::GoingAway);
  EXPECT_EQ(tm.events->nbSubscribers(), 0U);
}

TEST_F(ApiRestWebSocketTest, PlainGetOnEventsIsBadRequest) {
  const auto response = test::simpleGet(port, "/api/events");
  EXPECT_EQ(response.statusCode, http::StatusCodeBadRequest);
  EXPECT_EQ(tm.handlers->nbCalls(), 0U);
}

TEST_F(ApiRestWebSocketTest, OtherRoutesStayPlain) {
  EXPECT_EQ(test::simpleGet(port, "/api/session").statusCode, http::StatusCodeOK);
}

TEST(ApiRestWebSocket, DisabledByDefault) {
  test::TestModule tm;
  tm.module.start();
  test::WebSocketClient client(tm.port());
  // the plain events handler answers, no upgrade
  const auto response = client.connect("/api/events");
  EXPECT_EQ(response.statusCode, http::StatusCodeOK);
  EXPECT_EQ(response.body, "events");
}

TEST(ApiRestWebSocket, AuthenticationRequiredForUpgrade) {
  test::TestModule tm;
  tm.set(param::kWebsocket, "true").set(param::kUsername, "admin").set(param::kPassword, "secret");
  tm.module.start();

  test::WebSocketClient anonymous(tm.port());
  EXPECT_EQ(anonymous.connect("/api/events").statusCode, http::StatusCodeUnauthorized);

  test::WebSocketClient authenticated(tm.port());
  EXPECT_EQ(authenticated.connect("/api/events", {{"Authorization", test::BasicAuthorization("admin", "secret")}})
                .statusCode,
            http::StatusCodeSwitchingProtocols);
}

}  // namespace apirest
