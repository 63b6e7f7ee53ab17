/**
 * @file policy_database_test.cpp
 * @brief Unit tests for the shared policy database connection
 */

#include <catch2/catch_test_macros.hpp>

#include <rbac/storage/policy_database.hpp>

#include <sqlite3.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

using namespace rbac;
using namespace rbac::storage;

namespace {

auto open_memory() -> std::shared_ptr<policy_database> {
    auto db = policy_database::open(":memory:");
    REQUIRE(db.is_ok());
    return db.value();
}

auto rule_count(policy_database& db) -> int {
    auto guard = db.lock();
    int count = 0;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db.native_handle(),
                           "SELECT COUNT(*) FROM casbin_rule;", -1, &stmt,
                           nullptr) == SQLITE_OK &&
        sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

constexpr const char* kInsertRule =
    "INSERT INTO casbin_rule (ptype, v0, v1, v2) VALUES ('p', 'a', 'b', 'c');";

}  // namespace

TEST_CASE("policy_database open", "[storage][database]") {
    SECTION("in-memory database is migrated") {
        auto db = open_memory();
        CHECK(db->schema_version() == 2);
        CHECK(db->path() == ":memory:");
        CHECK_FALSE(db->in_transaction());
    }

    SECTION("file database survives reopening") {
        auto path = std::filesystem::temp_directory_path() /
                    "rbac_policy_database_test.db";
        std::filesystem::remove(path);
        {
            auto db = policy_database::open(path.string());
            REQUIRE(db.is_ok());
            REQUIRE(db.value()->execute(kInsertRule).is_ok());
        }
        {
            auto db = policy_database::open(path.string());
            REQUIRE(db.is_ok());
            CHECK(rule_count(*db.value()) == 1);
        }
        std::filesystem::remove(path);
        std::filesystem::remove(path.string() + "-wal");
        std::filesystem::remove(path.string() + "-shm");
    }

    SECTION("unopenable path fails") {
        auto db = policy_database::open("/nonexistent-dir/sub/rbac.db");
        REQUIRE(db.is_err());
        CHECK(db.error().code == error_codes::database_open_error);
    }
}

TEST_CASE("policy_database transactions", "[storage][database][transaction]") {
    auto db = open_memory();

    SECTION("commit makes writes visible") {
        auto tx = db->begin();
        REQUIRE(tx.is_ok());
        CHECK(db->in_transaction());
        REQUIRE(db->execute(kInsertRule).is_ok());
        REQUIRE(tx.value()->commit().is_ok());
        CHECK_FALSE(tx.value()->is_active());
        CHECK_FALSE(db->in_transaction());
        CHECK(rule_count(*db) == 1);
    }

    SECTION("rollback discards writes") {
        auto tx = db->begin();
        REQUIRE(tx.is_ok());
        REQUIRE(db->execute(kInsertRule).is_ok());
        REQUIRE(tx.value()->rollback().is_ok());
        CHECK(rule_count(*db) == 0);
    }

    SECTION("destroying an active transaction rolls it back") {
        {
            auto tx = db->begin();
            REQUIRE(tx.is_ok());
            REQUIRE(db->execute(kInsertRule).is_ok());
        }
        CHECK_FALSE(db->in_transaction());
        CHECK(rule_count(*db) == 0);
    }

    SECTION("finishing twice is rejected") {
        auto tx = db->begin();
        REQUIRE(tx.is_ok());
        REQUIRE(tx.value()->commit().is_ok());
        auto again = tx.value()->commit();
        REQUIRE(again.is_err());
        CHECK(again.error().code == error_codes::transaction_not_active);
    }

    SECTION("invalid SQL reports a query error") {
        auto result = db->execute("SELECT FROM nowhere;");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::database_query_error);
    }
}

TEST_CASE("policy_database serialises writers", "[storage][database][concurrency]") {
    auto db = open_memory();

    auto tx = db->begin();
    REQUIRE(tx.is_ok());

    std::atomic<bool> second_began{false};
    std::thread writer([&db, &second_began] {
        auto other = db->begin();
        second_began = true;
        if (other.is_ok()) {
            (void)other.value()->commit();
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    CHECK_FALSE(second_began.load());

    REQUIRE(tx.value()->commit().is_ok());
    writer.join();
    CHECK(second_began.load());
}
