#include "apirest/control-surface.hpp"

#include <array>
#include <format>
#include <span>
#include <string>
#include <string_view>

#include "apirest/api-rest-error.hpp"
#include "apirest/api-rest-module.hpp"
#include "apirest/string-trim.hpp"

namespace apirest {

namespace {

constexpr std::array kCommands = {
    ControlCommand{ControlSurface::kOnCommand, "Start REST API server."},
    ControlCommand{ControlSurface::kOffCommand, "Stop REST API server."},
};

ControlStatus ToControlStatus(ApiRestErrc code) noexcept {
  switch (code) {
    case ApiRestErrc::AlreadyStarted:
      return ControlStatus::AlreadyStarted;
    case ApiRestErrc::InvalidConfiguration:
      return ControlStatus::ConfigurationInvalid;
    case ApiRestErrc::TlsBootstrapFailed:
      return ControlStatus::TlsBootstrapFailed;
    case ApiRestErrc::BindFailed:
      return ControlStatus::BindFailed;
    default:
      return ControlStatus::ConfigurationInvalid;
  }
}

}  // namespace

std::string_view ControlStatusName(ControlStatus status) noexcept {
  switch (status) {
    case ControlStatus::Ok:
      return "ok";
    case ControlStatus::AlreadyStarted:
      return "already started";
    case ControlStatus::AlreadyStopped:
      return "already stopped";
    case ControlStatus::ConfigurationInvalid:
      return "configuration invalid";
    case ControlStatus::TlsBootstrapFailed:
      return "TLS bootstrap failed";
    case ControlStatus::BindFailed:
      return "bind failed";
    case ControlStatus::UnknownCommand:
      return "unknown command";
    default:
      return "unknown";
  }
}

std::span<const ControlCommand> ControlSurface::commands() noexcept { return kCommands; }

ControlResult ControlSurface::execute(std::string_view command) {
  command = TrimOws(command);
  if (command == kOnCommand) {
    return turnOn();
  }
  if (command == kOffCommand) {
    return turnOff();
  }
  return {ControlStatus::UnknownCommand, std::format("unknown command '{}'", command)};
}

ControlResult ControlSurface::turnOn() {
  try {
    _module.start();
  } catch (const ApiRestError& ex) {
    return {ToControlStatus(ex.code()), ex.what()};
  }
  return {ControlStatus::Ok, std::format("{} started on port {}", ApiRestModule::kName, _module.port())};
}

ControlResult ControlSurface::turnOff() {
  if (!_module.stop()) {
    return {ControlStatus::AlreadyStopped, std::format("{} is not running", ApiRestModule::kName)};
  }
  return {ControlStatus::Ok, std::format("{} stopped", ApiRestModule::kName)};
}

}  // namespace apirest
