/**
 * @file library_database_test.cpp
 * @brief Unit tests for library_database and scoped_transaction
 */

#include <catch2/catch_test_macros.hpp>

#include <gamevault/core/result.hpp>
#include <gamevault/storage/library_database.hpp>

#include <sqlite3.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <latch>
#include <string>
#include <thread>
#include <vector>

using namespace gamevault::storage;
namespace error_codes = gamevault::error_codes;

namespace {

/// Temporary database file removed on destruction
class temp_db_file {
public:
    explicit temp_db_file(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / name) {
        cleanup();
    }

    ~temp_db_file() { cleanup(); }

    temp_db_file(const temp_db_file&) = delete;
    auto operator=(const temp_db_file&) -> temp_db_file& = delete;

    [[nodiscard]] auto string() const -> std::string { return path_.string(); }

private:
    void cleanup() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        std::filesystem::remove(path_.string() + "-wal", ec);
        std::filesystem::remove(path_.string() + "-shm", ec);
    }

    std::filesystem::path path_;
};

auto count_rows(library_database& db, const char* table) -> int {
    auto sql = std::string("SELECT COUNT(*) FROM ") + table + ";";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db.native_handle(), sql.c_str(), -1, &stmt, nullptr) !=
        SQLITE_OK) {
        return -1;
    }
    int count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

auto insert_game(library_database& db, int id) -> int {
    auto sql = "INSERT INTO games (game_id, name) VALUES (" + std::to_string(id) +
               ", 'g');";
    return sqlite3_exec(db.native_handle(), sql.c_str(), nullptr, nullptr, nullptr);
}

}  // namespace

TEST_CASE("library_database open", "[storage][database]") {
    SECTION("in-memory database is migrated") {
        auto result = library_database::open(":memory:");
        REQUIRE(result.is_ok());

        auto& db = *result.value();
        CHECK(db.is_open());
        CHECK(db.path() == ":memory:");
        CHECK(db.schema_version() == 2);
        CHECK_FALSE(db.in_transaction());
    }

    SECTION("file database persists across connections") {
        temp_db_file file("gamevault_open_test.db");
        {
            auto first = library_database::open(file.string());
            REQUIRE(first.is_ok());
            REQUIRE(insert_game(*first.value(), 7) == SQLITE_OK);
        }

        auto second = library_database::open(file.string());
        REQUIRE(second.is_ok());
        CHECK(second.value()->schema_version() == 2);
        CHECK(count_rows(*second.value(), "games") == 1);
    }

    SECTION("unopenable path reports database_open_error") {
        auto result = library_database::open("/nonexistent-dir/sub/library.db");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::database_open_error);
    }
}

TEST_CASE("library_database transactions", "[storage][database][transaction]") {
    auto result = library_database::open(":memory:");
    REQUIRE(result.is_ok());
    auto& db = *result.value();

    SECTION("commit keeps writes") {
        REQUIRE(db.begin_transaction().is_ok());
        CHECK(db.in_transaction());
        REQUIRE(insert_game(db, 1) == SQLITE_OK);
        REQUIRE(db.commit().is_ok());
        CHECK_FALSE(db.in_transaction());
        CHECK(count_rows(db, "games") == 1);
    }

    SECTION("rollback discards writes") {
        REQUIRE(db.begin_transaction().is_ok());
        REQUIRE(insert_game(db, 1) == SQLITE_OK);
        REQUIRE(db.rollback().is_ok());
        CHECK(count_rows(db, "games") == 0);
    }

    SECTION("rollback without transaction is a no-op") {
        CHECK(db.rollback().is_ok());
    }

    SECTION("nested begin is rejected") {
        REQUIRE(db.begin_transaction().is_ok());
        auto nested = db.begin_transaction();
        REQUIRE(nested.is_err());
        CHECK(nested.error().code == error_codes::database_transaction_error);
        REQUIRE(db.rollback().is_ok());
    }
}

TEST_CASE("scoped_transaction", "[storage][database][transaction]") {
    auto result = library_database::open(":memory:");
    REQUIRE(result.is_ok());
    auto& db = *result.value();

    SECTION("destructor rolls back uncommitted work") {
        {
            scoped_transaction tx(db);
            REQUIRE(tx.begin_result().is_ok());
            CHECK(tx.is_active());
            REQUIRE(insert_game(db, 1) == SQLITE_OK);
        }
        CHECK_FALSE(db.in_transaction());
        CHECK(count_rows(db, "games") == 0);
    }

    SECTION("commit persists work") {
        {
            scoped_transaction tx(db);
            REQUIRE(insert_game(db, 1) == SQLITE_OK);
            REQUIRE(tx.commit().is_ok());
            CHECK_FALSE(tx.is_active());
        }
        CHECK(count_rows(db, "games") == 1);
    }

    SECTION("second commit fails") {
        scoped_transaction tx(db);
        REQUIRE(tx.commit().is_ok());
        CHECK(tx.commit().is_err());
    }

    SECTION("explicit rollback") {
        scoped_transaction tx(db);
        REQUIRE(insert_game(db, 1) == SQLITE_OK);
        tx.rollback();
        CHECK_FALSE(tx.is_active());
        CHECK(count_rows(db, "games") == 0);
    }
}

TEST_CASE("library_database write lock conflict", "[storage][database][concurrency]") {
    temp_db_file file("gamevault_lock_test.db");

    library_database_config config;
    config.busy_timeout = std::chrono::milliseconds(0);

    auto first = library_database::open(file.string(), config);
    REQUIRE(first.is_ok());
    auto second = library_database::open(file.string(), config);
    REQUIRE(second.is_ok());

    REQUIRE(first.value()->begin_transaction().is_ok());

    auto blocked = second.value()->begin_transaction();
    REQUIRE(blocked.is_err());
    CHECK(blocked.error().code == error_codes::concurrent_modification);
    CHECK(gamevault::is_retryable(blocked.error()));

    REQUIRE(first.value()->commit().is_ok());
    REQUIRE(second.value()->begin_transaction().is_ok());
    REQUIRE(second.value()->commit().is_ok());
}

TEST_CASE("library_database concurrent first open", "[storage][database][concurrency]") {
    constexpr int worker_count = 4;
    constexpr int rounds = 20;

    library_database_config config;
    config.busy_timeout = std::chrono::milliseconds(1000);

    for (int round = 0; round < rounds; ++round) {
        temp_db_file file("gamevault_first_open_" + std::to_string(round) + ".db");

        std::latch start(worker_count);
        std::atomic<int> failures{0};
        std::vector<int> versions(worker_count, -1);

        std::vector<std::thread> workers;
        for (int i = 0; i < worker_count; ++i) {
            workers.emplace_back([&, i] {
                start.arrive_and_wait();
                auto db = library_database::open(file.string(), config);
                if (db.is_err()) {
                    ++failures;
                    return;
                }
                versions[static_cast<size_t>(i)] = db.value()->schema_version();
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        INFO("round " << round);
        REQUIRE(failures == 0);
        for (int version : versions) {
            CHECK(version == 2);
        }

        auto check = library_database::open(file.string(), config);
        REQUIRE(check.is_ok());
        CHECK(count_rows(*check.value(), "schema_version") == 2);
    }
}
