#include "apirest/control-surface.hpp"

#include <gtest/gtest.h>

#include <string>

#include "apirest/config-resolver.hpp"
#include "apirest/http-status-code.hpp"
#include "apirest/socket.hpp"
#include "apirest/test-module-fixture.hpp"
#include "apirest/test-util.hpp"

namespace apirest {

TEST(ControlSurface, ListsCommands) {
  const auto commands = ControlSurface::commands();
  ASSERT_EQ(commands.size(), 2U);
  EXPECT_EQ(commands[0].name, "api.rest on");
  EXPECT_EQ(commands[0].description, "Start REST API server.");
  EXPECT_EQ(commands[1].name, "api.rest off");
  EXPECT_EQ(commands[1].description, "Stop REST API server.");
}

TEST(ControlSurface, OnOff) {
  test::TestModule tm;
  ControlSurface surface(tm.module);

  auto result = surface.execute("api.rest on");
  ASSERT_TRUE(result.ok()) << result.message;
  EXPECT_EQ(result.message, "api.rest started on port " + std::to_string(tm.port()));
  EXPECT_EQ(test::simpleGet(tm.port(), "/api/session").statusCode, http::StatusCodeOK);

  result = surface.execute("  api.rest on\t");
  EXPECT_EQ(result.status, ControlStatus::AlreadyStarted);
  EXPECT_EQ(result.message, "api.rest is already started");

  result = surface.execute("api.rest off");
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.message, "api.rest stopped");
  EXPECT_FALSE(tm.module.running());

  result = surface.execute("api.rest off");
  EXPECT_EQ(result.status, ControlStatus::AlreadyStopped);
  EXPECT_EQ(result.message, "api.rest is not running");
}

TEST(ControlSurface, StartFailuresAreReported) {
  test::TestModule tm;
  ControlSurface surface(tm.module);

  tm.set(param::kPort, "99999");
  auto result = surface.execute("api.rest on");
  EXPECT_EQ(result.status, ControlStatus::ConfigurationInvalid);
  EXPECT_NE(result.message.find("api.rest.port"), std::string::npos);

  Socket busy(Socket::Type::Stream);
  uint16_t busyPort = 0;
  busy.bindAndListen("127.0.0.1", busyPort);
  tm.set(param::kPort, std::to_string(busyPort));
  result = surface.execute("api.rest on");
  EXPECT_EQ(result.status, ControlStatus::BindFailed);
  EXPECT_FALSE(tm.module.running());
}

TEST(ControlSurface, UnknownCommand) {
  test::TestModule tm;
  ControlSurface surface(tm.module);
  const auto result = surface.execute("api.rest restart");
  EXPECT_EQ(result.status, ControlStatus::UnknownCommand);
  EXPECT_EQ(result.message, "unknown command 'api.rest restart'");
  EXPECT_EQ(ControlStatusName(result.status), "unknown command");
  EXPECT_FALSE(tm.module.running());
}

}  // namespace apirest
