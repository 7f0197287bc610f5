#include "apirest/route-table.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace apirest {

TEST(RouteTable, TopLevelResources) {
  RouteTable table;
  EXPECT_EQ(table.match("/api/events"), (RouteMatch{Resource::Events, "", ""}));
  EXPECT_EQ(table.match("/api/session"), (RouteMatch{Resource::Session, "", ""}));
  EXPECT_EQ(table.match("/api/file"), (RouteMatch{Resource::File, "", ""}));
}

TEST(RouteTable, SessionSubresources) {
  RouteTable table;
  for (std::string_view sub : {"ble", "hid", "env", "gateway", "interface", "modules", "lan", "options", "packets",
                               "started-at", "wifi"}) {
    const auto match = table.match(std::string("/api/session/") + std::string(sub));
    ASSERT_TRUE(match) << sub;
    EXPECT_EQ(match->resource, Resource::Session);
    EXPECT_EQ(match->subresource, sub);
    EXPECT_TRUE(match->id.empty());
  }
}

TEST(RouteTable, IdentifiedSubresources) {
  RouteTable table;
  EXPECT_EQ(table.match("/api/session/lan/aa:bb:cc:dd:ee:ff"),
            (RouteMatch{Resource::Session, "lan", "aa:bb:cc:dd:ee:ff"}));
  EXPECT_EQ(table.match("/api/session/wifi/00:11:22:33:44:55"),
            (RouteMatch{Resource::Session, "wifi", "00:11:22:33:44:55"}));
  EXPECT_EQ(table.match("/api/session/ble/x"), (RouteMatch{Resource::Session, "ble", "x"}));
  EXPECT_EQ(table.match("/api/session/hid/y"), (RouteMatch{Resource::Session, "hid", "y"}));
}

TEST(RouteTable, UnknownPaths) {
  RouteTable table;
  for (std::string_view path : {"/", "/api", "/api/", "/api/events/", "/api/session/", "/api/sessionx",
                                "/api/session/env/x", "/api/session/lan/", "/api/session/lan/a/b", "/API/events",
                                "/api/unknown", "/api/file/x"}) {
    EXPECT_FALSE(table.match(path)) << path;
  }
}

TEST(RouteTable, ExposesRoutes) {
  RouteTable table;
  // events, session, 11 sub-resources, 4 identified variants and file
  EXPECT_EQ(table.routes().size(), 18U);
  EXPECT_EQ(ResourceName(Resource::Events), "events");
  EXPECT_EQ(ResourceName(Resource::File), "file");
}

}  // namespace apirest
