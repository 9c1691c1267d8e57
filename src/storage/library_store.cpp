/**
 * @file library_store.cpp
 * @brief Implementation of per-category library table access
 */

#include <gamevault/storage/library_store.hpp>

#include "sqlite_helpers.hpp"

#include <sqlite3.h>

namespace gamevault::storage {

using kcenon::common::ok;

using namespace gamevault::error_codes;
using namespace detail;

namespace {

constexpr const char* kModule = "library_store";

// Column layout shared by get() and list():
// user_id, game_id, category, priority, notes,
// started_at, completed_at, added_at, updated_at
constexpr const char* kSelectWishlist = R"(
    SELECT user_id, game_id, 'wishlist', priority, notes,
           NULL, NULL, added_at, updated_at
    FROM user_wishlist
)";

constexpr const char* kSelectCollection = R"(
    SELECT user_id, game_id, 'collection', 0, '',
           NULL, NULL, added_at, updated_at
    FROM user_collection
)";

constexpr const char* kSelectProgress = R"(
    SELECT user_id, game_id, state, 0, '',
           started_at, completed_at, added_at, updated_at
    FROM game_progress
)";

void bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) {
    sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

auto stamp_or_now(std::chrono::system_clock::time_point tp)
    -> std::chrono::system_clock::time_point {
    return tp.time_since_epoch().count() == 0 ? now_millis() : tp;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

library_store::library_store(sqlite3* db) : db_(db) {}

// ============================================================================
// Read Operations
// ============================================================================

auto library_store::get(std::string_view user_id, int64_t game_id) const
    -> Result<std::optional<library_entry>> {
    const auto sql = std::string(kSelectWishlist) +
                     " WHERE user_id = ?1 AND game_id = ?2 UNION ALL " +
                     kSelectCollection +
                     " WHERE user_id = ?1 AND game_id = ?2 UNION ALL " +
                     kSelectProgress + " WHERE user_id = ?1 AND game_id = ?2;";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_failure<std::optional<library_entry>>(
            db_, rc, database_query_error, "prepare entry lookup", kModule);
    }

    bind_text(stmt, 1, user_id);
    sqlite3_bind_int64(stmt, 2, game_id);

    std::vector<library_entry> rows;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        rows.push_back(parse_row(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return sqlite_failure<std::optional<library_entry>>(
            db_, rc, database_query_error, "read library entry", kModule);
    }

    if (rows.size() > 1) {
        return gamevault_error<std::optional<library_entry>>(
            database_integrity_error,
            gamevault::compat::format(
                "Pair ({}, {}) occupies {} categories", user_id, game_id,
                rows.size()),
            kModule);
    }

    if (rows.empty()) {
        return std::optional<library_entry>{};
    }
    return std::optional<library_entry>{std::move(rows.front())};
}

auto library_store::list(std::string_view user_id,
                         library_category category) const
    -> Result<std::vector<library_entry>> {
    std::string sql;
    switch (category) {
        case library_category::wishlist:
            sql = std::string(kSelectWishlist) +
                  " WHERE user_id = ?1"
                  " ORDER BY priority DESC, added_at DESC, game_id ASC;";
            break;
        case library_category::collection:
            sql = std::string(kSelectCollection) +
                  " WHERE user_id = ?1 ORDER BY added_at DESC, game_id ASC;";
            break;
        case library_category::started:
            sql = std::string(kSelectProgress) +
                  " WHERE user_id = ?1 AND state = 'started'"
                  " ORDER BY started_at DESC, game_id ASC;";
            break;
        case library_category::completed:
            sql = std::string(kSelectProgress) +
                  " WHERE user_id = ?1 AND state = 'completed'"
                  " ORDER BY completed_at DESC, game_id ASC;";
            break;
    }

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_failure<std::vector<library_entry>>(
            db_, rc, database_query_error, "prepare category listing", kModule);
    }

    bind_text(stmt, 1, user_id);

    std::vector<library_entry> entries;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        entries.push_back(parse_row(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return sqlite_failure<std::vector<library_entry>>(
            db_, rc, database_query_error, "list category", kModule);
    }

    return entries;
}

auto library_store::count(std::string_view user_id,
                          library_category category) const -> Result<size_t> {
    const char* sql = nullptr;
    switch (category) {
        case library_category::wishlist:
            sql = "SELECT COUNT(*) FROM user_wishlist WHERE user_id = ?1;";
            break;
        case library_category::collection:
            sql = "SELECT COUNT(*) FROM user_collection WHERE user_id = ?1;";
            break;
        case library_category::started:
            sql = "SELECT COUNT(*) FROM game_progress"
                  " WHERE user_id = ?1 AND state = 'started';";
            break;
        case library_category::completed:
            sql = "SELECT COUNT(*) FROM game_progress"
                  " WHERE user_id = ?1 AND state = 'completed';";
            break;
    }

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_failure<size_t>(db_, rc, database_query_error,
                                      "prepare count", kModule);
    }

    bind_text(stmt, 1, user_id);

    size_t total = 0;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        total = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW) {
        return sqlite_failure<size_t>(db_, rc, database_query_error,
                                      "count category", kModule);
    }

    return total;
}

// ============================================================================
// Write Operations
// ============================================================================

auto library_store::put(const library_entry& entry) -> VoidResult {
    if (!entry.is_valid()) {
        return gamevault_void_error(invalid_argument,
                                    "Library entry requires user_id and game_id",
                                    kModule);
    }

    const char* sql = nullptr;
    switch (entry.category) {
        case library_category::wishlist:
            sql = R"(
                INSERT INTO user_wishlist (
                    user_id, game_id, priority, notes, added_at, updated_at
                ) VALUES (?, ?, ?, ?, ?, ?)
                ON CONFLICT(user_id, game_id) DO UPDATE SET
                    priority = excluded.priority,
                    notes = excluded.notes,
                    updated_at = excluded.updated_at
            )";
            break;
        case library_category::collection:
            sql = R"(
                INSERT INTO user_collection (
                    user_id, game_id, added_at, updated_at
                ) VALUES (?, ?, ?, ?)
                ON CONFLICT(user_id, game_id) DO UPDATE SET
                    updated_at = excluded.updated_at
            )";
            break;
        case library_category::started:
        case library_category::completed:
            sql = R"(
                INSERT INTO game_progress (
                    user_id, game_id, state, started_at, completed_at,
                    added_at, updated_at
                ) VALUES (?, ?, ?, ?, ?, ?, ?)
                ON CONFLICT(user_id, game_id) DO UPDATE SET
                    state = excluded.state,
                    started_at = excluded.started_at,
                    completed_at = excluded.completed_at,
                    updated_at = excluded.updated_at
            )";
            break;
    }

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_failure<std::monostate>(db_, rc, database_query_error,
                                              "prepare entry upsert", kModule);
    }

    auto added_str = to_timestamp_string(stamp_or_now(entry.added_at));
    auto updated_str = to_timestamp_string(stamp_or_now(entry.updated_at));

    int idx = 1;
    sqlite3_bind_text(stmt, idx++, entry.user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, idx++, entry.game_id);

    switch (entry.category) {
        case library_category::wishlist:
            sqlite3_bind_int(stmt, idx++, entry.priority);
            sqlite3_bind_text(stmt, idx++, entry.notes.c_str(), -1,
                              SQLITE_TRANSIENT);
            break;
        case library_category::collection:
            break;
        case library_category::started:
        case library_category::completed: {
            auto state = to_string(entry.category);
            sqlite3_bind_text(stmt, idx++, state.c_str(), -1, SQLITE_TRANSIENT);
            bind_optional_timestamp(stmt, idx++, entry.started_at);
            bind_optional_timestamp(stmt, idx++, entry.completed_at);
            break;
        }
    }

    sqlite3_bind_text(stmt, idx++, added_str.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, updated_str.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return sqlite_failure<std::monostate>(db_, rc, storage_error,
                                              "write library entry", kModule);
    }

    return ok();
}

auto library_store::remove(std::string_view user_id, int64_t game_id,
                           library_category category) -> Result<bool> {
    const char* sql = nullptr;
    switch (category) {
        case library_category::wishlist:
            sql = "DELETE FROM user_wishlist WHERE user_id = ? AND game_id = ?;";
            break;
        case library_category::collection:
            sql = "DELETE FROM user_collection WHERE user_id = ? AND game_id = ?;";
            break;
        case library_category::started:
            sql = "DELETE FROM game_progress"
                  " WHERE user_id = ? AND game_id = ? AND state = 'started';";
            break;
        case library_category::completed:
            sql = "DELETE FROM game_progress"
                  " WHERE user_id = ? AND game_id = ? AND state = 'completed';";
            break;
    }

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_failure<bool>(db_, rc, database_query_error,
                                    "prepare entry delete", kModule);
    }

    bind_text(stmt, 1, user_id);
    sqlite3_bind_int64(stmt, 2, game_id);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return sqlite_failure<bool>(db_, rc, storage_error,
                                    "delete library entry", kModule);
    }

    return sqlite3_changes(db_) > 0;
}

// ============================================================================
// Row Parsing
// ============================================================================

auto library_store::parse_row(sqlite3_stmt* stmt) const -> library_entry {
    library_entry entry;

    entry.user_id = get_text_column(stmt, 0);
    entry.game_id = sqlite3_column_int64(stmt, 1);
    entry.category = parse_library_category(get_text_column(stmt, 2))
                         .value_or(library_category::wishlist);
    entry.priority = sqlite3_column_int(stmt, 3);
    entry.notes = get_text_column(stmt, 4);
    entry.started_at = get_optional_timestamp(stmt, 5);
    entry.completed_at = get_optional_timestamp(stmt, 6);

    auto added = get_text_column(stmt, 7);
    entry.added_at = from_timestamp_string(added.c_str());
    auto updated = get_text_column(stmt, 8);
    entry.updated_at = from_timestamp_string(updated.c_str());

    return entry;
}

}  // namespace gamevault::storage
