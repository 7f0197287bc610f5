#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>

#include "apirest/api-rest-module.hpp"
#include "apirest/config-resolver.hpp"
#include "apirest/event-bus.hpp"
#include "apirest/parameter-store.hpp"
#include "apirest/recording-handlers.hpp"

namespace apirest::test {

// Test harness owning an ApiRestModule with its parameter store, recording handlers and event bus.
// The module is configured to listen on an ephemeral loopback port, with a short poll interval, and is stopped
// (if running) on destruction.
//
// Usage pattern:
//   TestModule tm;
//   tm.set(param::kUsername, "admin");   // optional parameters
//   tm.module.start();
//   auto port = tm.module.port();
struct TestModule {
  static ApiRestModule::Options DefaultOptions() {
    ApiRestModule::Options options;
    options.listenerOptions.pollInterval = std::chrono::milliseconds{5};
    return options;
  }

  explicit TestModule(ApiRestModule::Options options = DefaultOptions())
      : module(params, handlers, events, std::move(options)) {
    params.set(param::kPort, "0");
  }

  TestModule(const TestModule&) = delete;
  TestModule(TestModule&&) noexcept = delete;
  TestModule& operator=(const TestModule&) = delete;
  TestModule& operator=(TestModule&&) noexcept = delete;

  ~TestModule() { module.stop(); }

  TestModule& set(std::string_view name, std::string_view value) {
    params.set(name, value);
    return *this;
  }

  [[nodiscard]] uint16_t port() const noexcept { return module.port(); }

  ParameterStore params;
  std::shared_ptr<RecordingHandlers> handlers{std::make_shared<RecordingHandlers>()};
  std::shared_ptr<EventBus> events{std::make_shared<EventBus>()};
  ApiRestModule module;
};

}  // namespace apirest::test
