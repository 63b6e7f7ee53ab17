/**
 * @file sqlite_policy_adapter_test.cpp
 * @brief Unit tests for the SQLite policy adapter
 */

#include <catch2/catch_test_macros.hpp>

#include <rbac/storage/sqlite_policy_adapter.hpp>

using namespace rbac;
using namespace rbac::security;
using namespace rbac::storage;

namespace {

struct adapter_fixture {
    adapter_fixture() {
        auto opened = policy_database::open(":memory:");
        REQUIRE(opened.is_ok());
        db = opened.value();
        adapter = std::make_unique<sqlite_policy_adapter>(db);

        REQUIRE(add_p({"role:default/dev", "catalog-entity", "read"}));
        REQUIRE(add_p({"role:default/dev", "catalog-entity", "update", "deny"}));
        REQUIRE(add_p({"role:default/ops", "policy-entity", "read"}));
        REQUIRE(adapter
                    ->add_policy(policy_section::grouping, "g",
                                 {"user:default/alice", "role:default/dev"})
                    .is_ok());
    }

    bool add_p(const policy_tuple& rule) {
        return adapter->add_policy(policy_section::policy, "p", rule).is_ok();
    }

    std::shared_ptr<policy_database> db;
    std::unique_ptr<sqlite_policy_adapter> adapter;
};

}  // namespace

TEST_CASE("sqlite_policy_adapter full load", "[storage][adapter]") {
    adapter_fixture f;
    policy_model model;

    REQUIRE(f.adapter->load_policy(model).is_ok());
    CHECK_FALSE(f.adapter->is_filtered());

    auto rules = model.get_policy(policy_section::policy, "p");
    REQUIRE(rules.size() == 3);
    CHECK(rules[0] == policy_tuple{"role:default/dev", "catalog-entity", "read"});
    CHECK(rules[1].size() == 4);
    CHECK(model.size(policy_section::grouping, "g") == 1);
}

TEST_CASE("sqlite_policy_adapter writes", "[storage][adapter]") {
    adapter_fixture f;

    SECTION("duplicate insert is ignored") {
        REQUIRE(f.add_p({"role:default/dev", "catalog-entity", "read"}));
        CHECK(f.adapter->count("p").value() == 3);
    }

    SECTION("rules differing only in trailing fields are distinct") {
        REQUIRE(f.add_p({"role:default/dev", "catalog-entity", "read", "deny"}));
        CHECK(f.adapter->count("p").value() == 4);
    }

    SECTION("remove matches the full tuple") {
        REQUIRE(f.adapter
                    ->remove_policy(policy_section::policy, "p",
                                    {"role:default/dev", "catalog-entity",
                                     "update"})
                    .is_ok());
        CHECK(f.adapter->count("p").value() == 3);

        REQUIRE(f.adapter
                    ->remove_policy(policy_section::policy, "p",
                                    {"role:default/dev", "catalog-entity",
                                     "update", "deny"})
                    .is_ok());
        CHECK(f.adapter->count("p").value() == 2);
    }

    SECTION("tuples without fields or with too many are rejected") {
        auto empty = f.adapter->add_policy(policy_section::policy, "p", {});
        REQUIRE(empty.is_err());
        CHECK(empty.error().code == error_codes::invalid_policy_tuple);

        auto wide = f.adapter->add_policy(policy_section::policy, "p",
                                          {"1", "2", "3", "4", "5", "6", "7"});
        CHECK(wide.is_err());
    }

    SECTION("writes inside a rolled back transaction disappear") {
        auto tx = f.db->begin();
        REQUIRE(tx.is_ok());
        REQUIRE(f.add_p({"role:default/qa", "catalog-entity", "read"}));
        CHECK(f.adapter->count("p").value() == 4);
        REQUIRE(tx.value()->rollback().is_ok());
        CHECK(f.adapter->count("p").value() == 3);
    }
}

TEST_CASE("sqlite_policy_adapter filtered load", "[storage][adapter][filter]") {
    adapter_fixture f;
    policy_model model;

    SECTION("single filter on an inner field") {
        auto filter = policy_filter::from_values("p", 2, {"read"});
        REQUIRE(filter.is_ok());
        REQUIRE(f.adapter->load_filtered_policy(model, {filter.value()}).is_ok());
        CHECK(f.adapter->is_filtered());
        CHECK(model.size(policy_section::policy, "p") == 2);
        CHECK(model.size(policy_section::grouping, "g") == 0);
    }

    SECTION("several filters are combined") {
        auto dev = policy_filter::from_values(
            "p", 0, {"role:default/dev", "catalog-entity", "read"});
        auto ops = policy_filter::from_values("p", 0, {"role:default/ops"});
        REQUIRE(dev.is_ok());
        REQUIRE(ops.is_ok());
        REQUIRE(f.adapter
                    ->load_filtered_policy(model, {dev.value(), ops.value()})
                    .is_ok());
        CHECK(model.size(policy_section::policy, "p") == 2);
    }

    SECTION("filters of different rule types") {
        REQUIRE(f.adapter
                    ->load_filtered_policy(model, {policy_filter::all("g"),
                                                   policy_filter::all("p")})
                    .is_ok());
        CHECK(model.size(policy_section::policy, "p") == 3);
        CHECK(model.size(policy_section::grouping, "g") == 1);
    }

    SECTION("empty filter list loads nothing") {
        REQUIRE(f.adapter->load_filtered_policy(model, {}).is_ok());
        CHECK(model.empty());
    }

    SECTION("malformed filter is rejected and loads nothing") {
        policy_filter gap;
        gap.fields = {{0, "role:default/dev"}, {2, "read"}};
        auto result =
            f.adapter->load_filtered_policy(model, {policy_filter::all("p"), gap});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::filter_not_contiguous);
        CHECK(model.empty());
    }

    SECTION("filter values are bound, not interpolated") {
        auto filter = policy_filter::from_values("p", 0, {"' OR 1=1 --"});
        REQUIRE(filter.is_ok());
        REQUIRE(f.adapter->load_filtered_policy(model, {filter.value()}).is_ok());
        CHECK(model.empty());
    }
}
