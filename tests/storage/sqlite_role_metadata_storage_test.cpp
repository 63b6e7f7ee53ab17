/**
 * @file sqlite_role_metadata_storage_test.cpp
 * @brief Unit tests for SQLite role metadata storage
 */

#include <catch2/catch_test_macros.hpp>

#include <rbac/storage/sqlite_role_metadata_storage.hpp>

#include <chrono>

using namespace rbac;
using namespace rbac::security;
using namespace rbac::storage;

namespace {

auto make_record(std::string role) -> role_metadata {
    role_metadata record;
    record.role_entity_ref = std::move(role);
    record.source = role_source::csv_file;
    record.modified_by = "user:default/alice";
    record.description = "Developers";
    stamp_new_role_metadata(record);
    return record;
}

struct storage_fixture {
    storage_fixture() {
        auto opened = policy_database::open(":memory:");
        REQUIRE(opened.is_ok());
        db = opened.value();
        storage = std::make_unique<sqlite_role_metadata_storage>(db);
        auto begun = db->begin();
        REQUIRE(begun.is_ok());
        tx = std::move(begun.value());
    }

    std::shared_ptr<policy_database> db;
    std::unique_ptr<sqlite_role_metadata_storage> storage;
    std::unique_ptr<policy_transaction> tx;
};

}  // namespace

TEST_CASE("sqlite_role_metadata_storage CRUD", "[storage][metadata]") {
    storage_fixture f;
    auto record = make_record("role:default/dev");
    REQUIRE(f.storage->create_role_metadata(record, *f.tx).is_ok());

    SECTION("find returns the stored record") {
        auto found = f.storage->find_role_metadata("role:default/dev", *f.tx);
        REQUIRE(found.is_ok());
        REQUIRE(found.value().has_value());
        CHECK(*found.value() == record);
        CHECK_FALSE(found.value()->owner.has_value());
    }

    SECTION("find of an unknown role is empty") {
        auto found = f.storage->find_role_metadata("role:default/none", *f.tx);
        REQUIRE(found.is_ok());
        CHECK_FALSE(found.value().has_value());
    }

    SECTION("create twice reports a conflict") {
        auto again = f.storage->create_role_metadata(record, *f.tx);
        REQUIRE(again.is_err());
        CHECK(again.error().code == error_codes::role_metadata_exists);
    }

    SECTION("update replaces fields") {
        auto changed = record;
        changed.owner = "group:default/platform";
        changed.modified_by = "user:default/bob";
        REQUIRE(f.storage->update_role_metadata(changed, "role:default/dev", *f.tx)
                    .is_ok());
        auto found = f.storage->find_role_metadata("role:default/dev", *f.tx);
        REQUIRE(found.is_ok());
        CHECK(found.value()->owner == "group:default/platform");
        CHECK(found.value()->modified_by == "user:default/bob");
    }

    SECTION("update can rename the role") {
        auto renamed = record;
        renamed.role_entity_ref = "role:default/developers";
        REQUIRE(f.storage->update_role_metadata(renamed, "role:default/dev", *f.tx)
                    .is_ok());
        CHECK_FALSE(f.storage->find_role_metadata("role:default/dev", *f.tx)
                        .value()
                        .has_value());
        CHECK(f.storage->find_role_metadata("role:default/developers", *f.tx)
                  .value()
                  .has_value());
    }

    SECTION("update of an unknown role is not found") {
        auto result = f.storage->update_role_metadata(
            make_record("role:default/none"), "role:default/none", *f.tx);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::role_metadata_not_found);
    }

    SECTION("remove deletes the record") {
        REQUIRE(f.storage->remove_role_metadata("role:default/dev", *f.tx).is_ok());
        CHECK(f.storage->list_role_metadata().value().empty());
    }

    SECTION("list is ordered by role") {
        REQUIRE(f.storage->create_role_metadata(make_record("role:default/admin"),
                                                *f.tx)
                    .is_ok());
        auto records = f.storage->list_role_metadata();
        REQUIRE(records.is_ok());
        REQUIRE(records.value().size() == 2);
        CHECK(records.value()[0].role_entity_ref == "role:default/admin");
        CHECK(records.value()[1].role_entity_ref == "role:default/dev");
    }

    SECTION("rollback discards the record") {
        REQUIRE(f.tx->rollback().is_ok());
        CHECK(f.storage->list_role_metadata().value().empty());
    }

    if (f.tx->is_active()) {
        REQUIRE(f.tx->commit().is_ok());
    }
}

TEST_CASE("sqlite_role_metadata_storage guards", "[storage][metadata]") {
    storage_fixture f;

    SECTION("malformed role reference is rejected") {
        auto result =
            f.storage->create_role_metadata(make_record("not-a-ref"), *f.tx);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_entity_ref);
    }

    SECTION("finished transaction is rejected") {
        REQUIRE(f.tx->commit().is_ok());
        auto result = f.storage->create_role_metadata(
            make_record("role:default/dev"), *f.tx);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::transaction_not_active);

        auto found = f.storage->find_role_metadata("role:default/dev", *f.tx);
        REQUIRE(found.is_err());
        CHECK(found.error().code == error_codes::transaction_not_active);
    }
}

TEST_CASE("role metadata merge rules", "[security][metadata]") {
    const auto created = std::chrono::system_clock::time_point{
        std::chrono::seconds{1700000000}};
    const auto later = created + std::chrono::hours{24};

    auto current = make_record("role:default/dev");
    stamp_new_role_metadata(current, created);
    current.owner = "group:default/platform";

    role_metadata incoming;
    incoming.role_entity_ref = "role:default/dev";
    incoming.source = role_source::rest;
    incoming.modified_by = "user:default/bob";
    incoming.description = "Dev team";

    auto merged = merge_role_metadata(current, incoming, later);

    CHECK(merged.created_at == current.created_at);
    CHECK(merged.source == role_source::csv_file);
    CHECK(merged.modified_by == "user:default/bob");
    CHECK(merged.description == "Dev team");
    CHECK(merged.owner == "group:default/platform");
    CHECK(merged.last_modified == "Wed, 15 Nov 2023 22:13:20 GMT");
    CHECK(*current.created_at == "Tue, 14 Nov 2023 22:13:20 GMT");
}
