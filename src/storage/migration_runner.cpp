/**
 * @file migration_runner.cpp
 * @brief Schema steps and the locked upgrade loop
 */

#include <gamevault/storage/migration_runner.hpp>

#include <gamevault/compat/format.hpp>

#include "sqlite_helpers.hpp"

#include <sqlite3.h>

#include <array>
#include <string_view>

namespace gamevault::storage {

using namespace gamevault::error_codes;

namespace {

constexpr const char* kModule = "migration_runner";

struct schema_step {
    int version;
    const char* description;
    const char* sql;
};

constexpr const char* kVersionTableSql = R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version     INTEGER PRIMARY KEY,
            description TEXT NOT NULL,
            applied_at  TEXT NOT NULL DEFAULT (datetime('now'))
        );
    )";

// v1: catalog and the three library tables
constexpr const char* kLibraryTablesSql = R"(
        -- =====================================================================
        -- GAMES TABLE (catalog collaborator)
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS games (
            game_id     INTEGER PRIMARY KEY,
            name        TEXT NOT NULL,
            slug        TEXT,
            added_at    TEXT NOT NULL DEFAULT (datetime('now')),
            CHECK (game_id > 0)
        );

        CREATE INDEX IF NOT EXISTS idx_games_slug ON games(slug);

        -- =====================================================================
        -- USER_WISHLIST TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS user_wishlist (
            wishlist_pk INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id     TEXT NOT NULL,
            game_id     INTEGER NOT NULL,
            priority    INTEGER NOT NULL DEFAULT 0,
            notes       TEXT NOT NULL DEFAULT '',
            added_at    TEXT NOT NULL DEFAULT (strftime('%Y-%m-%d %H:%M:%f', 'now')),
            updated_at  TEXT NOT NULL DEFAULT (strftime('%Y-%m-%d %H:%M:%f', 'now')),
            UNIQUE (user_id, game_id),
            CHECK (length(user_id) <= 64)
        );

        CREATE INDEX IF NOT EXISTS idx_wishlist_user
            ON user_wishlist(user_id, priority DESC, added_at DESC);

        -- =====================================================================
        -- USER_COLLECTION TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS user_collection (
            collection_pk INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id       TEXT NOT NULL,
            game_id       INTEGER NOT NULL,
            added_at      TEXT NOT NULL DEFAULT (strftime('%Y-%m-%d %H:%M:%f', 'now')),
            updated_at    TEXT NOT NULL DEFAULT (strftime('%Y-%m-%d %H:%M:%f', 'now')),
            UNIQUE (user_id, game_id),
            CHECK (length(user_id) <= 64)
        );

        CREATE INDEX IF NOT EXISTS idx_collection_user
            ON user_collection(user_id, added_at DESC);

        -- =====================================================================
        -- GAME_PROGRESS TABLE (started / completed)
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS game_progress (
            progress_pk   INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id       TEXT NOT NULL,
            game_id       INTEGER NOT NULL,
            state         TEXT NOT NULL,
            started_at    TEXT,
            completed_at  TEXT,
            added_at      TEXT NOT NULL DEFAULT (strftime('%Y-%m-%d %H:%M:%f', 'now')),
            updated_at    TEXT NOT NULL DEFAULT (strftime('%Y-%m-%d %H:%M:%f', 'now')),
            UNIQUE (user_id, game_id),
            CHECK (length(user_id) <= 64),
            CHECK (state IN ('started', 'completed')),
            CHECK (state = 'started' OR completed_at IS NOT NULL),
            CHECK (completed_at IS NULL OR started_at IS NOT NULL)
        );

        CREATE INDEX IF NOT EXISTS idx_progress_user_state
            ON game_progress(user_id, state);
    )";

// v2: append-only transition ledger
constexpr const char* kAuditLedgerSql = R"(
        CREATE TABLE IF NOT EXISTS library_audit_log (
            audit_pk      INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id       TEXT NOT NULL,
            game_id       INTEGER NOT NULL,
            from_category TEXT,
            to_category   TEXT,
            reason        TEXT NOT NULL,
            created_at    TEXT NOT NULL DEFAULT (strftime('%Y-%m-%d %H:%M:%f', 'now')),
            CHECK (from_category IS NULL OR
                   from_category IN ('wishlist', 'collection', 'started', 'completed')),
            CHECK (to_category IS NULL OR
                   to_category IN ('wishlist', 'collection', 'started', 'completed'))
        );

        CREATE INDEX IF NOT EXISTS idx_audit_user_game
            ON library_audit_log(user_id, game_id, audit_pk);

        CREATE TRIGGER IF NOT EXISTS trg_audit_no_update
        BEFORE UPDATE ON library_audit_log
        BEGIN
            SELECT RAISE(ABORT, 'library_audit_log is append-only');
        END;

        CREATE TRIGGER IF NOT EXISTS trg_audit_no_delete
        BEFORE DELETE ON library_audit_log
        BEGIN
            SELECT RAISE(ABORT, 'library_audit_log is append-only');
        END;
    )";

constexpr std::array<schema_step, migration_runner::latest_version> kSteps = {{
    {1, "Initial library schema", kLibraryTablesSql},
    {2, "Library audit ledger", kAuditLedgerSql},
}};

auto exec(sqlite3* db, const char* sql, std::string_view what) -> VoidResult {
    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
    if (rc == SQLITE_OK) {
        return ok();
    }

    std::string message = errmsg ? errmsg : sqlite3_errmsg(db);
    sqlite3_free(errmsg);

    auto code = detail::is_lock_conflict(rc) ? concurrent_modification
                                             : database_migration_error;
    return gamevault_void_error(
        code, gamevault::compat::format("Failed to {}: {}", what, message), kModule);
}

auto record_step(sqlite3* db, const schema_step& step) -> VoidResult {
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(
        db, "INSERT INTO schema_version (version, description) VALUES (?, ?);", -1,
        &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::sqlite_failure<std::monostate>(
            db, rc, database_migration_error, "prepare schema_version insert", kModule);
    }

    sqlite3_bind_int(stmt, 1, step.version);
    sqlite3_bind_text(stmt, 2, step.description, -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::sqlite_failure<std::monostate>(
            db, rc, database_migration_error, "record schema version", kModule);
    }
    return ok();
}

/**
 * @brief Apply one step under the write lock
 *
 * The version is read again after BEGIN IMMEDIATE; a step that another
 * connection committed in the meantime is skipped.
 */
auto apply_step(const migration_runner& runner, sqlite3* db, const schema_step& step)
    -> VoidResult {
    auto begin = exec(db, "BEGIN IMMEDIATE;", "begin schema upgrade");
    if (begin.is_err()) {
        return begin;
    }

    auto result = [&]() -> VoidResult {
        auto table = exec(db, kVersionTableSql, "create schema_version");
        if (table.is_err()) {
            return table;
        }
        if (runner.current_version(db) >= step.version) {
            return ok();
        }
        auto body = exec(db, step.sql,
                         gamevault::compat::format("apply schema v{}", step.version));
        if (body.is_err()) {
            return body;
        }
        return record_step(db, step);
    }();

    if (result.is_err()) {
        // The step's own error is the one reported
        (void)exec(db, "ROLLBACK;", "roll back schema upgrade");
        return result;
    }
    return exec(db, "COMMIT;", "commit schema upgrade");
}

}  // namespace

auto migration_runner::migrate(sqlite3* db) const -> VoidResult {
    return migrate_to(db, latest_version);
}

auto migration_runner::migrate_to(sqlite3* db, int target_version) const
    -> VoidResult {
    if (target_version > latest_version) {
        return gamevault_void_error(
            database_migration_error,
            gamevault::compat::format("Schema v{} is newer than this build (v{})",
                                      target_version, latest_version),
            kModule);
    }

    const int current = current_version(db);
    for (const auto& step : kSteps) {
        if (step.version <= current || step.version > target_version) {
            continue;
        }
        auto result = apply_step(*this, db, step);
        if (result.is_err()) {
            return result;
        }
    }
    return ok();
}

auto migration_runner::current_version(sqlite3* db) const -> int {
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(
        db,
        "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = 'schema_version';",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }
    const bool has_table = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    if (!has_table) {
        return 0;
    }

    if (sqlite3_prepare_v2(db, "SELECT MAX(version) FROM schema_version;", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        return 0;
    }
    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);  // NULL reads as 0
    }
    sqlite3_finalize(stmt);
    return version;
}

auto migration_runner::history(sqlite3* db) const -> std::vector<applied_migration> {
    std::vector<applied_migration> rows;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(
            db,
            "SELECT version, description, applied_at FROM schema_version ORDER BY version;",
            -1, &stmt, nullptr) != SQLITE_OK) {
        return rows;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        applied_migration row;
        row.version = sqlite3_column_int(stmt, 0);
        row.description = detail::get_text_column(stmt, 1);
        row.applied_at = detail::get_text_column(stmt, 2);
        rows.push_back(std::move(row));
    }

    sqlite3_finalize(stmt);
    return rows;
}

}  // namespace gamevault::storage
