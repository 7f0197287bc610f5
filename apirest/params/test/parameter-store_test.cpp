#include "apirest/parameter-store.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "apirest/parameter.hpp"
#include "apirest/temp-file.hpp"

namespace apirest {

namespace {

void AddTestParameters(ParameterStore& store) {
  store.add({"net.address", ParamType::String, "127.0.0.1", IsIPv4Address, "bind address"});
  store.add({"net.port", ParamType::Int, "8081", IntRangeValidator(0, 65535), "bind port"});
  store.add({"net.tls", ParamType::Bool, "false", {}, "enable tls"});
  store.add({"net.name", ParamType::String, "", {}, "name"});
}

}  // namespace

TEST(Parameter, ParseBool) {
  for (const char* str : {"1", "t", "T", "TRUE", "true", "True"}) {
    EXPECT_EQ(ParseBool(str), true) << str;
  }
  for (const char* str : {"0", "f", "F", "FALSE", "false", "False"}) {
    EXPECT_EQ(ParseBool(str), false) << str;
  }
  for (const char* str : {"", "yes", "tRUE", "2", " true"}) {
    EXPECT_FALSE(ParseBool(str).has_value()) << str;
  }
}

TEST(Parameter, ParseInt) {
  EXPECT_EQ(ParseInt("8081"), 8081);
  EXPECT_EQ(ParseInt("-3"), -3);
  EXPECT_EQ(ParseInt("+42"), 42);
  EXPECT_FALSE(ParseInt("").has_value());
  EXPECT_FALSE(ParseInt("+").has_value());
  EXPECT_FALSE(ParseInt("+-1").has_value());
  EXPECT_FALSE(ParseInt("12a").has_value());
  EXPECT_FALSE(ParseInt("0x10").has_value());
  EXPECT_FALSE(ParseInt("99999999999999999999").has_value());
}

TEST(Parameter, IPv4Validator) {
  EXPECT_TRUE(IsIPv4Address("127.0.0.1"));
  EXPECT_TRUE(IsIPv4Address("0.0.0.0"));
  EXPECT_FALSE(IsIPv4Address("256.0.0.1"));
  EXPECT_FALSE(IsIPv4Address("localhost"));
  EXPECT_FALSE(IsIPv4Address("::1"));
  EXPECT_FALSE(IsIPv4Address(""));
}

TEST(ParameterStore, DefaultsAndOverrides) {
  ParameterStore store;
  AddTestParameters(store);
  EXPECT_EQ(store.getString("net.address"), "127.0.0.1");
  EXPECT_EQ(store.getInt("net.port"), 8081);
  EXPECT_FALSE(store.getBool("net.tls"));

  store.set("net.port", "0");
  store.set("net.tls", "T");
  EXPECT_EQ(store.getInt("net.port"), 0);
  EXPECT_TRUE(store.getBool("net.tls"));
  EXPECT_EQ(store.rawValue("net.port"), "0");

  EXPECT_TRUE(store.unset("net.port"));
  EXPECT_FALSE(store.unset("net.port"));
  EXPECT_EQ(store.getInt("net.port"), 8081);
}

TEST(ParameterStore, InvalidValuesReportNameAndValue) {
  ParameterStore store;
  AddTestParameters(store);
  store.set("net.port", "abc");
  try {
    (void)store.getInt("net.port");
    FAIL() << "expected ParameterError";
  } catch (const ParameterError& ex) {
    EXPECT_STREQ(ex.what(), "parameter net.port is not a valid integer: 'abc'");
  }

  store.set("net.port", "70000");
  EXPECT_THROW((void)store.getInt("net.port"), ParameterError);

  store.set("net.address", "300.1.1.1");
  EXPECT_THROW((void)store.getString("net.address"), ParameterError);

  store.set("net.tls", "maybe");
  EXPECT_THROW((void)store.getBool("net.tls"), ParameterError);
}

TEST(ParameterStore, UnknownAndMistypedParameters) {
  ParameterStore store;
  AddTestParameters(store);
  EXPECT_THROW((void)store.getString("does.not.exist"), ParameterError);
  EXPECT_THROW((void)store.getBool("net.port"), ParameterError);

  // values may be set before their parameter is registered
  store.set("late.param", "7");
  EXPECT_FALSE(store.isRegistered("late.param"));
  store.add({"late.param", ParamType::Int, "1", {}, ""});
  EXPECT_TRUE(store.isRegistered("late.param"));
  EXPECT_EQ(store.getInt("late.param"), 7);
}

TEST(ParameterStore, ParametersAreSorted) {
  ParameterStore store;
  AddTestParameters(store);
  store.set("unregistered", "x");
  const auto params = store.parameters();
  ASSERT_EQ(params.size(), 4U);
  EXPECT_EQ(params.front().name, "net.address");
  EXPECT_EQ(params.back().name, "net.tls");
}

TEST(ParameterStore, ConcurrentAccess) {
  ParameterStore store;
  AddTestParameters(store);
  std::vector<std::jthread> threads;
  for (int idx = 0; idx < 4; ++idx) {
    threads.emplace_back([&store, idx] {
      for (int iter = 0; iter < 1000; ++iter) {
        store.set("net.port", std::to_string(1000 + idx));
        const auto port = store.getInt("net.port");
        EXPECT_GE(port, 1000);
        EXPECT_LT(port, 1004);
      }
    });
  }
}

TEST(ParameterStore, Assignments) {
  ParameterStore store;
  AddTestParameters(store);
  SetParameterAssignment(store, "net.name = my server ");
  EXPECT_EQ(store.getString("net.name"), "my server");
  SetParameterAssignment(store, "net.name=");
  EXPECT_EQ(store.getString("net.name"), "");
  EXPECT_THROW(SetParameterAssignment(store, "net.name"), ParameterError);
  EXPECT_THROW(SetParameterAssignment(store, "=value"), ParameterError);
}

TEST(ParameterStore, LoadFile) {
  test::ScopedTempDir dir;
  const auto path = dir.pathOf("apirest.conf");
  test::WriteFile(path, "# comment\n\nnet.port=9000\r\n  net.tls = true\n");
  ParameterStore store;
  AddTestParameters(store);
  LoadParameterFile(store, path);
  EXPECT_EQ(store.getInt("net.port"), 9000);
  EXPECT_TRUE(store.getBool("net.tls"));

  test::WriteFile(path, "net.port=1\nbroken line\n");
  try {
    LoadParameterFile(store, path);
    FAIL() << "expected ParameterError";
  } catch (const ParameterError& ex) {
    EXPECT_NE(std::string(ex.what()).find(":2:"), std::string::npos);
  }
  EXPECT_THROW(LoadParameterFile(store, dir.pathOf("missing.conf")), ParameterError);
}

}  // namespace apirest
