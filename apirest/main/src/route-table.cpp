#include "apirest/route-table.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace apirest {

namespace {

constexpr std::string_view kEventsPath = "/api/events";
constexpr std::string_view kSessionPath = "/api/session";
constexpr std::string_view kFilePath = "/api/file";

struct SessionSubresource {
  std::string_view name;
  bool acceptsId;
};

constexpr std::array kSessionSubresources = {
    SessionSubresource{"ble", true},       SessionSubresource{"hid", true},
    SessionSubresource{"env", false},      SessionSubresource{"gateway", false},
    SessionSubresource{"interface", false}, SessionSubresource{"modules", false},
    SessionSubresource{"lan", true},       SessionSubresource{"options", false},
    SessionSubresource{"packets", false},  SessionSubresource{"started-at", false},
    SessionSubresource{"wifi", true},
};

}  // namespace

std::string_view ResourceName(Resource resource) noexcept {
  switch (resource) {
    case Resource::Events:
      return "events";
    case Resource::Session:
      return "session";
    case Resource::File:
      return "file";
    default:
      return "unknown";
  }
}

RouteTable::RouteTable() {
  _routes.push_back({std::string(kEventsPath), Resource::Events, {}, false});
  _routes.push_back({std::string(kSessionPath), Resource::Session, {}, false});
  for (const auto& sub : kSessionSubresources) {
    std::string pattern(kSessionPath);
    pattern.push_back('/');
    pattern.append(sub.name);
    _routes.push_back({pattern, Resource::Session, std::string(sub.name), false});
    if (sub.acceptsId) {
      pattern.append("/{id}");
      _routes.push_back({std::move(pattern), Resource::Session, std::string(sub.name), true});
    }
  }
  _routes.push_back({std::string(kFilePath), Resource::File, {}, false});
}

std::optional<RouteMatch> RouteTable::match(std::string_view path) const {
  for (const Route& route : _routes) {
    if (!route.hasId) {
      if (path == route.pattern) {
        return RouteMatch{route.resource, route.subresource, {}};
      }
      continue;
    }
    // pattern is '<prefix>/{id}', the id is a single non-empty segment
    const std::string_view prefix = std::string_view(route.pattern).substr(0, route.pattern.size() - 4);
    if (path.size() <= prefix.size() || !path.starts_with(prefix)) {
      continue;
    }
    const std::string_view id = path.substr(prefix.size());
    if (id.find('/') != std::string_view::npos) {
      continue;
    }
    return RouteMatch{route.resource, route.subresource, std::string(id)};
  }
  return std::nullopt;
}

}  // namespace apirest
