/**
 * @file sqlite_helpers.hpp
 * @brief Internal SQLite column/timestamp helpers shared by the storage layer
 *
 * Timestamps are stored as UTC text "YYYY-MM-DD HH:MM:SS.mmm", the format
 * produced by strftime('%Y-%m-%d %H:%M:%f', 'now').
 */

#pragma once

#include <gamevault/compat/format.hpp>
#include <gamevault/compat/time.hpp>
#include <gamevault/core/result.hpp>
#include <gamevault/storage/library_record.hpp>

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace gamevault::storage::detail {

/// Convert time_point to "YYYY-MM-DD HH:MM:SS.mmm" (UTC)
[[nodiscard]] inline std::string to_timestamp_string(
    std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch()) %
              1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        --time;
    }

    std::tm tm{};
    gamevault::compat::gmtime_safe(&time, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);

    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(ms.count()));
    return out;
}

/// Parse "YYYY-MM-DD HH:MM:SS[.mmm]" (UTC) to time_point
[[nodiscard]] inline std::chrono::system_clock::time_point from_timestamp_string(
    const char* str) {
    if (!str || str[0] == '\0') {
        return {};
    }
    std::tm tm{};
    double seconds = 0.0;
    if (std::sscanf(str, "%d-%d-%d %d:%d:%lf",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &seconds) != 6) {
        return {};
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    tm.tm_sec = static_cast<int>(seconds);
    auto millis = static_cast<int>((seconds - tm.tm_sec) * 1000.0 + 0.5);

    auto time = gamevault::compat::timegm_safe(&tm);
    return std::chrono::system_clock::from_time_t(time) +
           std::chrono::milliseconds(millis);
}

/// Current time truncated to the stored millisecond precision
[[nodiscard]] inline std::chrono::system_clock::time_point now_millis() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

/// Get text column safely (returns empty string if NULL)
[[nodiscard]] inline std::string get_text_column(sqlite3_stmt* stmt, int col) {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

/// Get optional timestamp column
[[nodiscard]] inline std::optional<std::chrono::system_clock::time_point>
get_optional_timestamp(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return from_timestamp_string(text);
}

/// Get optional category column
[[nodiscard]] inline std::optional<library_category> get_optional_category(
    sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? parse_library_category(text) : std::nullopt;
}

/// Bind optional timestamp
inline void bind_optional_timestamp(
    sqlite3_stmt* stmt,
    int idx,
    const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (tp.has_value()) {
        auto str = to_timestamp_string(tp.value());
        sqlite3_bind_text(stmt, idx, str.c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

/// Bind optional category
inline void bind_optional_category(sqlite3_stmt* stmt,
                                   int idx,
                                   const std::optional<library_category>& category) {
    if (category.has_value()) {
        auto str = to_string(category.value());
        sqlite3_bind_text(stmt, idx, str.c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

/// SQLite reports lock contention with BUSY or LOCKED (including extended codes)
[[nodiscard]] inline bool is_lock_conflict(int rc) noexcept {
    auto primary = rc & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

/**
 * @brief Build an error result from a failed SQLite call
 *
 * Lock contention maps to concurrent_modification so that callers can retry;
 * every other failure maps to @p code.
 */
template <typename T>
[[nodiscard]] auto sqlite_failure(sqlite3* db, int rc, int code,
                                  std::string_view what,
                                  const std::string& module) -> Result<T> {
    auto error_code =
        is_lock_conflict(rc) ? error_codes::concurrent_modification : code;
    return gamevault_error<T>(
        error_code,
        gamevault::compat::format("Failed to {}: {}", what, sqlite3_errmsg(db)),
        module);
}

}  // namespace gamevault::storage::detail
