/**
 * @file audit_ledger.cpp
 * @brief Implementation of the append-only transition ledger
 */

#include <gamevault/storage/audit_ledger.hpp>

#include "sqlite_helpers.hpp"

#include <sqlite3.h>

namespace gamevault::storage {

using namespace gamevault::error_codes;
using namespace detail;

namespace {

constexpr const char* kModule = "audit_ledger";

}  // namespace

audit_ledger::audit_ledger(sqlite3* db) : db_(db) {}

auto audit_ledger::append(std::string_view user_id,
                          int64_t game_id,
                          std::optional<library_category> from,
                          std::optional<library_category> to,
                          transition_reason reason) -> Result<int64_t> {
    static constexpr const char* sql = R"(
        INSERT INTO library_audit_log (
            user_id, game_id, from_category, to_category, reason, created_at
        ) VALUES (?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_failure<int64_t>(db_, rc, database_query_error,
                                       "prepare audit insert", kModule);
    }

    auto reason_str = to_string(reason);
    auto created_str = to_timestamp_string(now_millis());

    sqlite3_bind_text(stmt, 1, user_id.data(), static_cast<int>(user_id.size()),
                      SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, game_id);
    bind_optional_category(stmt, 3, from);
    bind_optional_category(stmt, 4, to);
    sqlite3_bind_text(stmt, 5, reason_str.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, created_str.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return sqlite_failure<int64_t>(db_, rc, storage_error,
                                       "append audit entry", kModule);
    }

    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

auto audit_ledger::history(std::string_view user_id, int64_t game_id) const
    -> Result<std::vector<audit_entry>> {
    static constexpr const char* sql = R"(
        SELECT audit_pk, user_id, game_id, from_category, to_category,
               reason, created_at
        FROM library_audit_log
        WHERE user_id = ? AND game_id = ?
        ORDER BY audit_pk ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_failure<std::vector<audit_entry>>(
            db_, rc, database_query_error, "prepare history query", kModule);
    }

    sqlite3_bind_text(stmt, 1, user_id.data(), static_cast<int>(user_id.size()),
                      SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, game_id);

    std::vector<audit_entry> entries;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        entries.push_back(parse_row(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return sqlite_failure<std::vector<audit_entry>>(
            db_, rc, database_query_error, "read history", kModule);
    }

    return entries;
}

auto audit_ledger::find_by_pk(int64_t pk) const -> std::optional<audit_entry> {
    if (!db_) return std::nullopt;

    static constexpr const char* sql = R"(
        SELECT audit_pk, user_id, game_id, from_category, to_category,
               reason, created_at
        FROM library_audit_log
        WHERE audit_pk = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, pk);

    std::optional<audit_entry> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = parse_row(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

auto audit_ledger::count() const -> Result<size_t> {
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM library_audit_log;",
                                 -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_failure<size_t>(db_, rc, database_query_error,
                                      "prepare audit count", kModule);
    }

    size_t total = 0;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        total = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW) {
        return sqlite_failure<size_t>(db_, rc, database_query_error,
                                      "count audit entries", kModule);
    }
    return total;
}

auto audit_ledger::count_for(std::string_view user_id, int64_t game_id) const
    -> Result<size_t> {
    static constexpr const char* sql =
        "SELECT COUNT(*) FROM library_audit_log WHERE user_id = ? AND game_id = ?;";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return sqlite_failure<size_t>(db_, rc, database_query_error,
                                      "prepare audit count", kModule);
    }

    sqlite3_bind_text(stmt, 1, user_id.data(), static_cast<int>(user_id.size()),
                      SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, game_id);

    size_t total = 0;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        total = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW) {
        return sqlite_failure<size_t>(db_, rc, database_query_error,
                                      "count audit entries", kModule);
    }
    return total;
}

auto audit_ledger::parse_row(sqlite3_stmt* stmt) const -> audit_entry {
    audit_entry entry;

    entry.pk = sqlite3_column_int64(stmt, 0);
    entry.user_id = get_text_column(stmt, 1);
    entry.game_id = sqlite3_column_int64(stmt, 2);
    entry.from_category = get_optional_category(stmt, 3);
    entry.to_category = get_optional_category(stmt, 4);
    entry.reason = get_text_column(stmt, 5);

    auto created = get_text_column(stmt, 6);
    entry.created_at = from_timestamp_string(created.c_str());

    return entry;
}

}  // namespace gamevault::storage
