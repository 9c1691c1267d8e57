/**
 * @file library_store.hpp
 * @brief Per-category table access for library entries
 *
 * The library_store hides the three physical tables (user_wishlist,
 * user_collection, game_progress) behind a single category-addressed API.
 * It enforces nothing about transitions; that is the job of the
 * transition_enforcer, which is the only writer.
 */

#pragma once

#include "library_record.hpp"

#include <gamevault/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

// Forward declarations of SQLite handles
struct sqlite3;
struct sqlite3_stmt;

namespace gamevault::storage {

/**
 * @brief Table abstraction for library entries
 *
 * All operations run inside the caller's transaction; the store never
 * begins or commits one.
 *
 * Thread Safety: NOT thread-safe. Shares the connection of its owner.
 */
class library_store {
public:
    /**
     * @brief Construct store over an open connection
     *
     * @param db SQLite handle (not owned)
     */
    explicit library_store(sqlite3* db);

    ~library_store() = default;

    library_store(const library_store&) = delete;
    auto operator=(const library_store&) -> library_store& = delete;
    library_store(library_store&&) noexcept = default;
    auto operator=(library_store&&) noexcept -> library_store& = default;

    /**
     * @brief Find the current entry of a pair across all tables
     *
     * @return nullopt if the pair is untracked, database_integrity_error if
     *         rows exist in more than one table
     */
    [[nodiscard]] auto get(std::string_view user_id, int64_t game_id) const
        -> Result<std::optional<library_entry>>;

    /**
     * @brief Insert or update the row of entry.category's table
     *
     * Other tables are not touched.
     */
    [[nodiscard]] auto put(const library_entry& entry) -> VoidResult;

    /**
     * @brief Delete the row of a pair from one category's table
     *
     * @return true if a row was deleted
     */
    [[nodiscard]] auto remove(std::string_view user_id, int64_t game_id,
                              library_category category) -> Result<bool>;

    /**
     * @brief List the entries of one category for a user
     *
     * Ordering:
     * - wishlist: priority DESC, added_at DESC
     * - collection: added_at DESC
     * - started: started_at DESC
     * - completed: completed_at DESC
     *
     * Ties are broken by game_id ASC.
     */
    [[nodiscard]] auto list(std::string_view user_id,
                            library_category category) const
        -> Result<std::vector<library_entry>>;

    [[nodiscard]] auto count(std::string_view user_id,
                             library_category category) const
        -> Result<size_t>;

private:
    [[nodiscard]] auto parse_row(sqlite3_stmt* stmt) const -> library_entry;

    sqlite3* db_{nullptr};
};

}  // namespace gamevault::storage
