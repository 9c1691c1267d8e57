/**
 * @file sqlite_game_catalog.cpp
 * @brief Implementation of the games-table catalog
 */

#include <gamevault/storage/sqlite_game_catalog.hpp>

#include "sqlite_helpers.hpp"

#include <sqlite3.h>

namespace gamevault::storage {

using kcenon::common::ok;

using namespace gamevault::error_codes;
using namespace detail;

namespace {

constexpr const char* kModule = "game_catalog";

}  // namespace

sqlite_game_catalog::sqlite_game_catalog(sqlite3* db) : db_(db) {}

auto sqlite_game_catalog::exists(int64_t game_id) -> Result<bool> {
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(
        db_, "SELECT 1 FROM games WHERE game_id = ?;", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_failure<bool>(db_, rc, database_query_error,
                                    "prepare catalog lookup", kModule);
    }

    sqlite3_bind_int64(stmt, 1, game_id);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    return sqlite_failure<bool>(db_, rc, database_query_error,
                                "look up catalog game", kModule);
}

auto sqlite_game_catalog::register_game(int64_t game_id, std::string_view name,
                                        std::string_view slug) -> VoidResult {
    if (game_id <= 0 || name.empty()) {
        return gamevault_void_error(
            invalid_argument,
            "Catalog games require a positive id and a name", kModule);
    }

    static constexpr const char* sql = R"(
        INSERT INTO games (game_id, name, slug) VALUES (?, ?, ?)
        ON CONFLICT(game_id) DO UPDATE SET
            name = excluded.name,
            slug = excluded.slug
    )";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_failure<std::monostate>(db_, rc, database_query_error,
                                              "prepare catalog insert", kModule);
    }

    sqlite3_bind_int64(stmt, 1, game_id);
    sqlite3_bind_text(stmt, 2, name.data(), static_cast<int>(name.size()),
                      SQLITE_TRANSIENT);
    if (slug.empty()) {
        sqlite3_bind_null(stmt, 3);
    } else {
        sqlite3_bind_text(stmt, 3, slug.data(), static_cast<int>(slug.size()),
                          SQLITE_TRANSIENT);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return sqlite_failure<std::monostate>(db_, rc, storage_error,
                                              "register catalog game", kModule);
    }

    return ok();
}

auto sqlite_game_catalog::find(int64_t game_id) const
    -> std::optional<game_record> {
    if (!db_) return std::nullopt;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(
            db_, "SELECT game_id, name, slug, added_at FROM games WHERE game_id = ?;",
            -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, game_id);

    std::optional<game_record> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        game_record record;
        record.game_id = sqlite3_column_int64(stmt, 0);
        record.name = get_text_column(stmt, 1);
        record.slug = get_text_column(stmt, 2);
        auto added = get_text_column(stmt, 3);
        record.added_at = from_timestamp_string(added.c_str());
        result = std::move(record);
    }

    sqlite3_finalize(stmt);
    return result;
}

}  // namespace gamevault::storage
