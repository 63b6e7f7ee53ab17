/**
 * @file in_memory_role_graph_test.cpp
 * @brief Unit tests for the in-memory role graph
 */

#include <catch2/catch_test_macros.hpp>

#include <rbac/security/in_memory_role_graph.hpp>

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

using namespace rbac;
using namespace rbac::security;

namespace {
bool contains(const std::vector<std::string> &values, std::string_view v) {
  return std::find(values.begin(), values.end(), v) != values.end();
}
} // namespace

TEST_CASE("in_memory_role_graph: direct and transitive roles",
          "[security][role_graph]") {
  in_memory_role_graph graph;
  REQUIRE(graph.add_link("user:default/alice", "group:default/team").is_ok());
  REQUIRE(graph.add_link("group:default/team", "role:default/dev").is_ok());

  SECTION("roles are resolved nearest first") {
    auto roles = graph.get_roles("user:default/alice");
    REQUIRE(roles.is_ok());
    REQUIRE(roles.value().size() == 2);
    CHECK(roles.value()[0] == "group:default/team");
    CHECK(roles.value()[1] == "role:default/dev");
  }

  SECTION("has_link follows inheritance") {
    CHECK(graph.has_link("user:default/alice", "role:default/dev").value());
    CHECK_FALSE(graph.has_link("role:default/dev", "user:default/alice").value());
    CHECK(graph.has_link("role:default/dev", "role:default/dev").value());
  }

  SECTION("has_edge only sees direct edges") {
    CHECK(graph.has_edge("user:default/alice", "group:default/team"));
    CHECK_FALSE(graph.has_edge("user:default/alice", "role:default/dev"));
  }

  SECTION("get_users lists direct members") {
    auto users = graph.get_users("role:default/dev");
    REQUIRE(users.is_ok());
    CHECK(users.value() == std::vector<std::string>{"group:default/team"});
    CHECK(graph.get_users("role:default/none").value().empty());
  }

  SECTION("deleting an edge invalidates cached resolution") {
    REQUIRE(graph.get_roles("user:default/alice").value().size() == 2);
    REQUIRE(graph.delete_link("group:default/team", "role:default/dev").is_ok());
    auto roles = graph.get_roles("user:default/alice");
    REQUIRE(roles.is_ok());
    CHECK(roles.value() == std::vector<std::string>{"group:default/team"});
  }

  SECTION("deleting a missing edge is a no-op") {
    CHECK(graph.delete_link("user:default/bob", "role:default/dev").is_ok());
    CHECK(graph.edge_count() == 2);
  }

  SECTION("clear drops every edge") {
    graph.clear();
    CHECK(graph.edge_count() == 0);
    CHECK(graph.get_roles("user:default/alice").value().empty());
  }
}

TEST_CASE("in_memory_role_graph: edge cases", "[security][role_graph]") {
  SECTION("empty endpoints are rejected") {
    in_memory_role_graph graph;
    auto result = graph.add_link("", "role:default/dev");
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::role_graph_error);
  }

  SECTION("cycles terminate") {
    in_memory_role_graph graph;
    REQUIRE(graph.add_link("role:default/a", "role:default/b").is_ok());
    REQUIRE(graph.add_link("role:default/b", "role:default/a").is_ok());
    auto roles = graph.get_roles("role:default/a");
    REQUIRE(roles.is_ok());
    CHECK(roles.value() == std::vector<std::string>{"role:default/b"});
  }

  SECTION("resolution stops at max depth") {
    in_memory_role_graph graph(2);
    REQUIRE(graph.add_link("user:default/u", "role:default/r1").is_ok());
    REQUIRE(graph.add_link("role:default/r1", "role:default/r2").is_ok());
    REQUIRE(graph.add_link("role:default/r2", "role:default/r3").is_ok());
    auto roles = graph.get_roles("user:default/u");
    REQUIRE(roles.is_ok());
    CHECK(contains(roles.value(), "role:default/r2"));
    CHECK_FALSE(contains(roles.value(), "role:default/r3"));
  }

  SECTION("membership resolver adds derived parents") {
    in_memory_role_graph graph;
    REQUIRE(graph.add_link("group:default/team", "role:default/dev").is_ok());
    graph.set_membership_resolver(
        [](std::string_view principal) -> Result<std::vector<std::string>> {
          if (principal == "user:default/carol") {
            return std::vector<std::string>{"group:default/team"};
          }
          return std::vector<std::string>{};
        });
    auto roles = graph.get_roles("user:default/carol");
    REQUIRE(roles.is_ok());
    CHECK(contains(roles.value(), "role:default/dev"));
    CHECK(graph.edge_count() == 1);
  }

  SECTION("resolver may query the graph") {
    in_memory_role_graph graph;
    REQUIRE(graph.add_link("group:default/team", "role:default/dev").is_ok());
    graph.set_membership_resolver(
        [&graph](std::string_view principal) -> Result<std::vector<std::string>> {
          if (principal == "user:default/carol" &&
              graph.has_edge("group:default/team", "role:default/dev")) {
            return std::vector<std::string>{"group:default/team"};
          }
          return std::vector<std::string>{};
        });

    auto roles = graph.get_roles("user:default/carol");
    REQUIRE(roles.is_ok());
    CHECK(contains(roles.value(), "role:default/dev"));
    CHECK(graph.has_link("user:default/carol", "role:default/dev").value());
  }

  SECTION("resolver errors propagate") {
    in_memory_role_graph graph;
    graph.set_membership_resolver(
        [](std::string_view) -> Result<std::vector<std::string>> {
          return rbac_error<std::vector<std::string>>(
              error_codes::role_graph_error, "catalog unavailable");
        });
    CHECK(graph.get_roles("user:default/x").is_err());
  }
}

TEST_CASE("in_memory_role_graph: resolution cache",
          "[security][role_graph][cache]") {
  in_memory_role_graph graph(in_memory_role_graph::default_max_depth, 2);
  REQUIRE(graph.add_link("user:default/alice", "role:default/dev").is_ok());

  SECTION("resolved principals are cached until an edge changes") {
    REQUIRE(graph.get_roles("user:default/alice").is_ok());
    CHECK(graph.cached_principals() == 1);
    REQUIRE(graph.add_link("user:default/bob", "role:default/dev").is_ok());
    CHECK(graph.cached_principals() == 0);
  }

  SECTION("the cache never exceeds its limit") {
    for (int i = 0; i < 5; ++i) {
      REQUIRE(graph.get_roles("user:default/u" + std::to_string(i)).is_ok());
      CHECK(graph.cached_principals() <= 2);
    }
    auto roles = graph.get_roles("user:default/alice");
    REQUIRE(roles.is_ok());
    CHECK(roles.value() == std::vector<std::string>{"role:default/dev"});
  }

  SECTION("rebuild empties the cache") {
    REQUIRE(graph.get_roles("user:default/alice").is_ok());
    graph.rebuild();
    CHECK(graph.cached_principals() == 0);
    CHECK(graph.edge_count() == 1);
  }
}

TEST_CASE("in_memory_role_graph: concurrent writers",
          "[security][role_graph][concurrency]") {
  in_memory_role_graph graph;
  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&graph, t] {
      for (int i = 0; i < 50; ++i) {
        auto member = "user:default/u" + std::to_string(t * 100 + i);
        (void)graph.add_link(member, "role:default/shared");
        (void)graph.get_roles(member);
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }
  CHECK(graph.edge_count() == 200);
  CHECK(graph.get_users("role:default/shared").value().size() == 200);
}
