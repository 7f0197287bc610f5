#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "apirest/api-rest-module.hpp"

namespace apirest {

enum class ControlStatus : uint8_t {
  Ok,
  AlreadyStarted,
  AlreadyStopped,
  ConfigurationInvalid,
  TlsBootstrapFailed,
  BindFailed,
  UnknownCommand
};

[[nodiscard]] std::string_view ControlStatusName(ControlStatus status) noexcept;

struct ControlResult {
  [[nodiscard]] bool ok() const noexcept { return status == ControlStatus::Ok; }

  ControlStatus status{ControlStatus::Ok};
  std::string message;
};

struct ControlCommand {
  std::string_view name;
  std::string_view description;
};

// Commands through which the hosting process turns the service on and off.
class ControlSurface {
 public:
  static constexpr std::string_view kOnCommand = "api.rest on";
  static constexpr std::string_view kOffCommand = "api.rest off";

  explicit ControlSurface(ApiRestModule& module) noexcept : _module(module) {}

  // Leading and trailing blanks of the command are ignored.
  ControlResult execute(std::string_view command);

  [[nodiscard]] static std::span<const ControlCommand> commands() noexcept;

 private:
  ControlResult turnOn();
  ControlResult turnOff();

  ApiRestModule& _module;
};

}  // namespace apirest
