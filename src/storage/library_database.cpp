/**
 * @file library_database.cpp
 * @brief Implementation of the library database connection
 */

#include <gamevault/storage/library_database.hpp>

#include <gamevault/compat/format.hpp>
#include <gamevault/core/result.hpp>

#include "sqlite_helpers.hpp"

#include <sqlite3.h>

namespace gamevault::storage {

using kcenon::common::make_error;
using kcenon::common::ok;

using namespace gamevault::error_codes;

namespace {

/**
 * @brief Execute a transaction control statement and classify the failure
 */
auto execute_control(sqlite3* db, const char* sql, std::string_view what)
    -> VoidResult {
    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
    if (rc == SQLITE_OK) {
        return ok();
    }

    auto error_str = errmsg ? std::string(errmsg) : std::string(sqlite3_errmsg(db));
    sqlite3_free(errmsg);

    auto code = detail::is_lock_conflict(rc) ? concurrent_modification
                                             : database_transaction_error;
    return make_error<std::monostate>(
        code, gamevault::compat::format("Failed to {}: {}", what, error_str),
        "storage");
}

}  // namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

auto library_database::open(std::string_view db_path)
    -> Result<std::unique_ptr<library_database>> {
    return open(db_path, library_database_config{});
}

auto library_database::open(std::string_view db_path,
                            const library_database_config& config)
    -> Result<std::unique_ptr<library_database>> {
    sqlite3* db = nullptr;

    auto rc = sqlite3_open(std::string(db_path).c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg =
            db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return make_error<std::unique_ptr<library_database>>(
            database_open_error,
            gamevault::compat::format("Failed to open database: {}", error_msg),
            "storage");
    }

    sqlite3_busy_timeout(db, static_cast<int>(config.busy_timeout.count()));

    if (config.foreign_keys) {
        rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return make_error<std::unique_ptr<library_database>>(
                database_open_error, "Failed to enable foreign keys", "storage");
        }
    }

    // WAL lets readers proceed while a writer holds the lock (not for in-memory DB)
    if (config.wal_mode && db_path != ":memory:") {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return make_error<std::unique_ptr<library_database>>(
                database_open_error, "Failed to enable WAL mode", "storage");
        }
    }

    // Negative value means KB
    auto cache_sql = gamevault::compat::format("PRAGMA cache_size = -{};",
                                               config.cache_size_mb * 1024);
    rc = sqlite3_exec(db, cache_sql.c_str(), nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return make_error<std::unique_ptr<library_database>>(
            database_open_error, "Failed to set cache size", "storage");
    }

    rc = sqlite3_exec(db, "PRAGMA synchronous = NORMAL;", nullptr, nullptr,
                      nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return make_error<std::unique_ptr<library_database>>(
            database_open_error, "Failed to set synchronous mode", "storage");
    }

    auto instance = std::unique_ptr<library_database>(
        new library_database(db, std::string(db_path)));

    auto migration_result = instance->migration_runner_.migrate(db);
    if (migration_result.is_err()) {
        return make_error<std::unique_ptr<library_database>>(
            migration_result.error().code,
            gamevault::compat::format("Migration failed: {}",
                                      migration_result.error().message),
            "storage");
    }

    return instance;
}

library_database::library_database(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

library_database::~library_database() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Transaction Support
// ============================================================================

auto library_database::begin_transaction() -> VoidResult {
    if (in_transaction()) {
        return make_error<std::monostate>(database_transaction_error,
                                          "Transaction already active",
                                          "storage");
    }
    return execute_control(db_, "BEGIN IMMEDIATE;", "begin transaction");
}

auto library_database::commit() -> VoidResult {
    return execute_control(db_, "COMMIT;", "commit transaction");
}

auto library_database::rollback() -> VoidResult {
    if (!in_transaction()) {
        return ok();
    }
    return execute_control(db_, "ROLLBACK;", "rollback transaction");
}

auto library_database::in_transaction() const noexcept -> bool {
    return db_ != nullptr && sqlite3_get_autocommit(db_) == 0;
}

// ============================================================================
// Information
// ============================================================================

auto library_database::is_open() const noexcept -> bool {
    return db_ != nullptr;
}

auto library_database::path() const -> const std::string& {
    return path_;
}

auto library_database::schema_version() const -> int {
    return migration_runner_.current_version(db_);
}

auto library_database::native_handle() const noexcept -> sqlite3* {
    return db_;
}

// ============================================================================
// scoped_transaction Implementation
// ============================================================================

scoped_transaction::scoped_transaction(library_database& db)
    : db_(db), begin_result_(db.begin_transaction()) {
    active_ = begin_result_.is_ok();
}

scoped_transaction::~scoped_transaction() {
    if (active_ && !committed_) {
        (void)db_.rollback();
    }
}

auto scoped_transaction::begin_result() const -> const VoidResult& {
    return begin_result_;
}

auto scoped_transaction::commit() -> VoidResult {
    if (!active_) {
        return make_error<std::monostate>(database_transaction_error,
                                          "Transaction not active", "storage");
    }

    if (committed_) {
        return make_error<std::monostate>(database_transaction_error,
                                          "Transaction already committed",
                                          "storage");
    }

    auto result = db_.commit();
    if (result.is_ok()) {
        committed_ = true;
        active_ = false;
    }
    return result;
}

void scoped_transaction::rollback() noexcept {
    if (active_ && !committed_) {
        (void)db_.rollback();
        active_ = false;
    }
}

auto scoped_transaction::is_active() const noexcept -> bool {
    return active_ && !committed_;
}

}  // namespace gamevault::storage
