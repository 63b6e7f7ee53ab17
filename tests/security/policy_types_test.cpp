/**
 * @file policy_types_test.cpp
 * @brief Unit tests for tuple validation, filters and the rule model
 */

#include <catch2/catch_test_macros.hpp>

#include <rbac/security/entity_ref.hpp>
#include <rbac/security/policy_model.hpp>
#include <rbac/security/policy_types.hpp>

using namespace rbac;
using namespace rbac::security;

TEST_CASE("policy tuples: validation", "[security][policy_types]") {
  SECTION("permission rule with three or four fields is valid") {
    CHECK(validate_policy_tuple({"role:default/dev", "catalog-entity", "read"})
              .is_ok());
    CHECK(validate_policy_tuple(
              {"role:default/dev", "catalog-entity", "read", "deny"})
              .is_ok());
  }

  SECTION("too few or too many fields are rejected") {
    auto short_rule = validate_policy_tuple({"role:default/dev", "read"});
    REQUIRE(short_rule.is_err());
    CHECK(short_rule.error().code == error_codes::invalid_policy_tuple);

    auto long_rule =
        validate_policy_tuple({"a", "b", "c", "d", "e", "f", "g"});
    REQUIRE(long_rule.is_err());
    CHECK(long_rule.error().code == error_codes::invalid_policy_tuple);
  }

  SECTION("empty field is rejected") {
    auto result = validate_policy_tuple({"role:default/dev", "", "read"});
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::invalid_policy_tuple);
  }

  SECTION("grouping rule must be a non-empty pair") {
    CHECK(validate_grouping_tuple({"user:default/alice", "role:default/dev"})
              .is_ok());
    CHECK(validate_grouping_tuple({"user:default/alice"}).is_err());
    CHECK(validate_grouping_tuple({"user:default/alice", ""}).is_err());
    CHECK(validate_grouping_tuple({"a", "b", "c"}).error().code ==
          error_codes::invalid_grouping_tuple);
  }

  SECTION("to_string joins fields") {
    CHECK(to_string(policy_tuple{"a", "b", "c"}) == "a, b, c");
    CHECK(to_string(policy_tuple{}).empty());
  }
}

TEST_CASE("policy filters: construction and validation",
          "[security][policy_types]") {
  SECTION("from_values places values at consecutive positions") {
    auto filter = policy_filter::from_values("p", 1, {"catalog-entity", "read"});
    REQUIRE(filter.is_ok());
    CHECK(filter.value().ptype == "p");
    CHECK(filter.value().fields.size() == 2);
    CHECK(filter.value().fields.at(1) == "catalog-entity");
    CHECK(filter.value().fields.at(2) == "read");
    CHECK(filter.value().validate().is_ok());
  }

  SECTION("from_values rejects positions past v5") {
    auto filter = policy_filter::from_values("p", 5, {"x", "y"});
    REQUIRE(filter.is_err());
    CHECK(filter.error().code == error_codes::filter_field_out_of_range);

    CHECK(policy_filter::from_values("p", 6, {}).is_err());
  }

  SECTION("all() has no constraints and matches everything") {
    auto filter = policy_filter::all("g");
    CHECK(filter.fields.empty());
    CHECK(filter.validate().is_ok());
    CHECK(filter.matches({"user:default/alice", "role:default/dev"}));
  }

  SECTION("unknown rule type is invalid") {
    auto filter = policy_filter::all("x");
    auto result = filter.validate();
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::invalid_filter);
  }

  SECTION("gaps between positions are rejected") {
    policy_filter filter;
    filter.fields = {{0, "role:default/dev"}, {2, "read"}};
    auto result = filter.validate();
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::filter_not_contiguous);
  }

  SECTION("out of range position is rejected") {
    policy_filter filter;
    filter.fields = {{6, "x"}};
    auto result = filter.validate();
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::filter_field_out_of_range);
  }

  SECTION("validate_filters stops at the first bad filter") {
    policy_filter gap;
    gap.fields = {{0, "a"}, {3, "b"}};
    std::vector<policy_filter> filters{policy_filter::all("p"), gap};
    auto result = validate_filters(filters);
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::filter_not_contiguous);
  }

  SECTION("matches compares only constrained positions") {
    auto filter = policy_filter::from_values("p", 1, {"catalog-entity"});
    REQUIRE(filter.is_ok());
    CHECK(filter.value().matches({"role:default/a", "catalog-entity", "read"}));
    CHECK_FALSE(filter.value().matches({"role:default/a", "policy", "read"}));
    CHECK_FALSE(filter.value().matches({"role:default/a"}));
  }
}

TEST_CASE("policy_model: rule storage", "[security][policy_model]") {
  policy_model model;
  const policy_tuple read{"role:default/dev", "catalog-entity", "read"};
  const policy_tuple write{"role:default/dev", "catalog-entity", "update"};

  SECTION("duplicates are rejected and load order kept") {
    CHECK(model.add_policy(policy_section::policy, "p", read));
    CHECK(model.add_policy(policy_section::policy, "p", write));
    CHECK_FALSE(model.add_policy(policy_section::policy, "p", read));

    auto rules = model.get_policy(policy_section::policy, "p");
    REQUIRE(rules.size() == 2);
    CHECK(rules[0] == read);
    CHECK(rules[1] == write);
  }

  SECTION("add_policies reports how many were new") {
    CHECK(model.add_policies(policy_section::policy, "p", {read, read, write}) ==
          2);
    CHECK(model.size(policy_section::policy, "p") == 2);
  }

  SECTION("sections are independent") {
    model.add_policy(policy_section::grouping, "g",
                     {"user:default/alice", "role:default/dev"});
    CHECK(model.get_policy(policy_section::policy, "p").empty());
    CHECK(model.size(policy_section::grouping, "g") == 1);
  }

  SECTION("remove and has_policy") {
    model.add_policy(policy_section::policy, "p", read);
    CHECK(model.has_policy(policy_section::policy, "p", read));
    CHECK(model.remove_policy(policy_section::policy, "p", read));
    CHECK_FALSE(model.remove_policy(policy_section::policy, "p", read));
    CHECK_FALSE(model.has_policy(policy_section::policy, "p", read));
  }

  SECTION("filtered view") {
    model.add_policies(policy_section::policy, "p", {read, write});
    auto filter = policy_filter::from_values("p", 2, {"update"});
    REQUIRE(filter.is_ok());
    auto rules = model.get_filtered_policy(policy_section::policy,
                                           filter.value());
    REQUIRE(rules.size() == 1);
    CHECK(rules[0] == write);
  }

  SECTION("clear empties the model") {
    model.add_policy(policy_section::policy, "p", read);
    CHECK_FALSE(model.empty());
    model.clear();
    CHECK(model.empty());
  }
}

TEST_CASE("entity references: parsing", "[security][entity_ref]") {
  SECTION("well formed references") {
    auto ref = parse_entity_ref("role:default/rbac_admin");
    REQUIRE(ref.has_value());
    CHECK(ref->kind == entity_kind::role);
    CHECK(ref->ns == "default");
    CHECK(ref->name == "rbac_admin");
    CHECK(ref->str() == "role:default/rbac_admin");

    auto group = parse_entity_ref("group:default/team-a");
    REQUIRE(group.has_value());
    CHECK(group->kind == entity_kind::group);
  }

  SECTION("malformed references") {
    CHECK_FALSE(parse_entity_ref("role").has_value());
    CHECK_FALSE(parse_entity_ref(":default/x").has_value());
    CHECK_FALSE(parse_entity_ref("role:/x").has_value());
    CHECK_FALSE(parse_entity_ref("role:default/").has_value());
  }

  SECTION("kind predicates") {
    CHECK(is_role_ref("role:default/dev"));
    CHECK_FALSE(is_role_ref("user:default/alice"));
    CHECK(is_principal_ref("user:default/alice"));
    CHECK(is_principal_ref("group:default/team"));
    CHECK_FALSE(is_principal_ref("role:default/dev"));
  }
}
