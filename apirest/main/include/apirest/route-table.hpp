#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apirest {

// Logical resources exposed by the API.
enum class Resource : uint8_t { Events, Session, File };

[[nodiscard]] std::string_view ResourceName(Resource resource) noexcept;

struct RouteMatch {
  Resource resource{Resource::Session};
  // Session sub-resource ('ble', 'lan', ...), empty for the session itself.
  std::string subresource;
  // Last path segment for sub-resources accepting an identifier ('/api/session/lan/{id}'), empty otherwise.
  std::string id;

  bool operator==(const RouteMatch&) const noexcept = default;
};

// Fixed mapping from URL paths to logical resources. Matching is exact: no trailing slash, no prefix match.
class RouteTable {
 public:
  struct Route {
    std::string pattern;
    Resource resource;
    std::string subresource;
    bool hasId;
  };

  RouteTable();

  [[nodiscard]] std::optional<RouteMatch> match(std::string_view path) const;

  [[nodiscard]] const std::vector<Route>& routes() const noexcept { return _routes; }

 private:
  std::vector<Route> _routes;
};

}  // namespace apirest
