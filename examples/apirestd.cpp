// Standalone daemon exposing the REST API over an in-process event bus.
//
//   apirestd [--config FILE] [--set key=value]... [--log-level LEVEL]
//
// Resources served:
//   GET    /api/events                 JSON array of the retained events (DELETE clears them)
//   GET    /api/session[/<sub>]        JSON view of the daemon session
//   POST   /api/session                {"cmd":"set <name> <value>"} updates a parameter
//   GET    /api/file?name=<path>       file content, POST writes the request body to it
#include <glaze/glaze.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "apirest/api-rest-module.hpp"
#include "apirest/control-surface.hpp"
#include "apirest/event-bus.hpp"
#include "apirest/http-constants.hpp"
#include "apirest/http-method.hpp"
#include "apirest/http-request.hpp"
#include "apirest/http-response.hpp"
#include "apirest/http-status-code.hpp"
#include "apirest/log.hpp"
#include "apirest/parameter-store.hpp"
#include "apirest/resource-handlers.hpp"
#include "apirest/route-table.hpp"
#include "apirest/signal-handler.hpp"

namespace apirestd {

struct EventRecord {
  std::string tag;
  std::string time;
  std::string data;
};

struct SessionSnapshot {
  std::string startedAt;
  std::vector<std::string> modules;
  std::map<std::string, std::string> options;
  std::size_t nbEvents{};
};

struct SessionCommand {
  std::string cmd;
};

struct SessionCommandResult {
  std::string error;
};

}  // namespace apirestd

template <>
struct glz::meta<apirestd::EventRecord> {
  using T = apirestd::EventRecord;
  static constexpr auto value = glz::object("tag", &T::tag, "time", &T::time, "data", &T::data);
};

template <>
struct glz::meta<apirestd::SessionSnapshot> {
  using T = apirestd::SessionSnapshot;
  static constexpr auto value = glz::object("started_at", &T::startedAt, "modules", &T::modules, "options",
                                            &T::options, "events", &T::nbEvents);
};

template <>
struct glz::meta<apirestd::SessionCommand> {
  using T = apirestd::SessionCommand;
  static constexpr auto value = glz::object("cmd", &T::cmd);
};

template <>
struct glz::meta<apirestd::SessionCommandResult> {
  using T = apirestd::SessionCommandResult;
  static constexpr auto value = glz::object("error", &T::error);
};

namespace apirestd {

using namespace apirest;

namespace {

std::string FormatTime(std::chrono::system_clock::time_point tp) {
  return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(tp));
}

template <class T>
HttpResponse JsonResponse(const T& obj, http::StatusCode code = http::StatusCodeOK) {
  return {code, glz::write_json(obj).value_or(std::string{}), http::ContentTypeApplicationJson};
}

HttpResponse JsonError(http::StatusCode code, std::string message) {
  return JsonResponse(SessionCommandResult{std::move(message)}, code);
}

// Value of given query parameter, empty if absent. No percent-decoding.
std::string_view QueryParam(std::string_view query, std::string_view name) {
  while (!query.empty()) {
    const auto ampPos = query.find('&');
    const std::string_view pair = query.substr(0, ampPos);
    const auto eqPos = pair.find('=');
    if (pair.substr(0, eqPos) == name) {
      return eqPos == std::string_view::npos ? std::string_view{} : pair.substr(eqPos + 1);
    }
    if (ampPos == std::string_view::npos) {
      break;
    }
    query.remove_prefix(ampPos + 1);
  }
  return {};
}

}  // namespace

// Resources backed by the daemon state: its parameters and the event bus history.
class DaemonHandlers : public ResourceHandlers {
 public:
  DaemonHandlers(ParameterStore& params, std::shared_ptr<EventBus> bus)
      : _params(params), _bus(std::move(bus)), _startedAt(std::chrono::system_clock::now()) {}

  HttpResponse events(const HttpRequest& request) override {
    if (request.method() == http::Method::DELETE) {
      _bus->clear();
      return HttpResponse(http::StatusCodeNoContent);
    }
    std::vector<EventRecord> records;
    for (const auto& event : _bus->history()) {
      records.emplace_back(event.tag, FormatTime(event.time), event.payload);
    }
    return JsonResponse(records);
  }

  HttpResponse session(const HttpRequest& request, const RouteMatch& match) override {
    if (request.method() == http::Method::POST && match.subresource.empty()) {
      return runCommand(request.body());
    }
    if (match.subresource.empty()) {
      return JsonResponse(snapshot());
    }
    if (match.subresource == "started-at") {
      return JsonResponse(FormatTime(_startedAt));
    }
    if (match.subresource == "options") {
      return JsonResponse(snapshot().options);
    }
    if (match.subresource == "modules") {
      return JsonResponse(snapshot().modules);
    }
    if (!match.id.empty()) {
      return JsonError(http::StatusCodeNotFound, std::format("no {} entity '{}'", match.subresource, match.id));
    }
    // no network session is attached to this daemon
    return JsonResponse(std::vector<std::string>{});
  }

  HttpResponse file(const HttpRequest& request) override {
    const std::string name(QueryParam(request.query(), "name"));
    if (name.empty()) {
      return JsonError(http::StatusCodeBadRequest, "missing 'name' query parameter");
    }
    if (request.method() == http::Method::POST) {
      std::ofstream out(name, std::ios::binary | std::ios::trunc);
      if (!out || !out.write(request.body().data(), static_cast<std::streamsize>(request.body().size()))) {
        return JsonError(http::StatusCodeBadRequest, std::format("unable to write {}", name));
      }
      _bus->publish("sys.file.written", name);
      return JsonResponse(SessionCommandResult{});
    }
    std::ifstream in(name, std::ios::binary);
    if (!in) {
      return JsonError(http::StatusCodeNotFound, std::format("unable to read {}", name));
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return {http::StatusCodeOK, std::move(content), "application/octet-stream"};
  }

 private:
  SessionSnapshot snapshot() const {
    SessionSnapshot snap;
    snap.startedAt = FormatTime(_startedAt);
    snap.modules.emplace_back(ApiRestModule::kName);
    for (const auto& param : _params.parameters()) {
      snap.options.emplace(param.name, _params.rawValue(param.name).value_or(param.defaultValue));
    }
    snap.nbEvents = _bus->history().size();
    return snap;
  }

  // Only 'set <name> <value>' is accepted: turning the API itself on or off from one of its own requests would
  // have the request wait for its own completion.
  HttpResponse runCommand(std::string_view body) {
    SessionCommand command;
    const std::string buffer(body);
    if (auto ec = glz::read_json(command, buffer)) {
      return JsonError(http::StatusCodeBadRequest, glz::format_error(ec, buffer));
    }
    std::istringstream iss(command.cmd);
    std::string verb;
    std::string name;
    std::string value;
    iss >> verb >> name;
    std::getline(iss >> std::ws, value);
    if (verb != "set" || name.empty()) {
      return JsonError(http::StatusCodeBadRequest, std::format("unsupported command '{}'", command.cmd));
    }
    _params.set(name, value);
    _bus->publish("sys.param.set", std::format("{}={}", name, value));
    return JsonResponse(SessionCommandResult{});
  }

  ParameterStore& _params;
  std::shared_ptr<EventBus> _bus;
  std::chrono::system_clock::time_point _startedAt;
};

}  // namespace apirestd

namespace {

void Usage(std::ostream& os) {
  os << "usage: apirestd [--config FILE] [--set key=value]... [--log-level LEVEL]\n";
}

}  // namespace

int main(int argc, char** argv) {
  using namespace apirest;
  using namespace std::chrono_literals;

  SignalHandler::Enable();

  ParameterStore params;
  auto bus = std::make_shared<EventBus>();
  std::atomic<bool> faulted{false};

  try {
    ApiRestModule module(params, std::make_shared<apirestd::DaemonHandlers>(params, bus), bus);

    for (int argPos = 1; argPos < argc; ++argPos) {
      const std::string_view arg(argv[argPos]);
      if (arg == "--help" || arg == "-h") {
        Usage(std::cout);
        return EXIT_SUCCESS;
      }
      if (argPos + 1 == argc) {
        Usage(std::cerr);
        return EXIT_FAILURE;
      }
      const std::string_view value(argv[++argPos]);
      if (arg == "--config") {
        LoadParameterFile(params, std::filesystem::path(value));
      } else if (arg == "--set") {
        SetParameterAssignment(params, value);
      } else if (arg == "--log-level") {
        log::set_level(log::level::from_str(std::string(value)));
      } else {
        Usage(std::cerr);
        return EXIT_FAILURE;
      }
    }

    module.setFatalFaultHandler([&faulted](std::exception_ptr) { faulted.store(true); });

    ControlSurface control(module);
    const auto started = control.execute(ControlSurface::kOnCommand);
    if (!started.ok()) {
      log::critical("{}: {}", ControlStatusName(started.status), started.message);
      return EXIT_FAILURE;
    }
    bus->publish("api.rest.started", std::format("port={}", module.port()));

    auto lastHeartbeat = std::chrono::steady_clock::now();
    while (!SignalHandler::IsStopRequested() && !faulted.load() && module.running()) {
      (void)module.quitSignal().waitFor(100ms);
      if (std::chrono::steady_clock::now() - lastHeartbeat >= 10s) {
        lastHeartbeat = std::chrono::steady_clock::now();
        bus->publish("sys.heartbeat", std::to_string(module.port()));
      }
    }

    const auto stopped = control.execute(ControlSurface::kOffCommand);
    if (!stopped.ok()) {
      log::warn("{}", stopped.message);
    }
    module.rethrowIfFault();
  } catch (const std::exception& ex) {
    log::critical("apirestd: {}", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
