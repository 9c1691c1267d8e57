/**
 * @file audit_ledger.hpp
 * @brief Append-only ledger of library transitions
 *
 * The ledger has no update or delete operation. The schema additionally
 * installs triggers that abort any UPDATE or DELETE on library_audit_log.
 */

#pragma once

#include "audit_entry.hpp"

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
 * @brief Repository for library_audit_log
 *
 * append() runs inside the caller's transaction so the ledger row commits
 * or rolls back together with the library mutation it records.
 *
 * Thread Safety: NOT thread-safe. Shares the connection of its owner.
 */
class audit_ledger {
public:
    explicit audit_ledger(sqlite3* db);

    ~audit_ledger() = default;

    audit_ledger(const audit_ledger&) = delete;
    auto operator=(const audit_ledger&) -> audit_ledger& = delete;
    audit_ledger(audit_ledger&&) noexcept = default;
    auto operator=(audit_ledger&&) noexcept -> audit_ledger& = default;

    /**
     * @brief Append one transition record
     *
     * @param user_id User the transition belongs to
     * @param game_id Game the transition belongs to
     * @param from Category before the transition (nullopt = untracked)
     * @param to Category after the transition (nullopt = removal)
     * @param reason Reason label
     * @return Primary key of the new row
     */
    [[nodiscard]] auto append(std::string_view user_id,
                              int64_t game_id,
                              std::optional<library_category> from,
                              std::optional<library_category> to,
                              transition_reason reason) -> Result<int64_t>;

    /**
     * @brief Transitions of one pair in commit order (pk ascending)
     */
    [[nodiscard]] auto history(std::string_view user_id, int64_t game_id) const
        -> Result<std::vector<audit_entry>>;

    [[nodiscard]] auto find_by_pk(int64_t pk) const -> std::optional<audit_entry>;

    /// Total number of ledger rows
    [[nodiscard]] auto count() const -> Result<size_t>;

    /// Number of ledger rows for one pair
    [[nodiscard]] auto count_for(std::string_view user_id, int64_t game_id) const
        -> Result<size_t>;

private:
    [[nodiscard]] auto parse_row(sqlite3_stmt* stmt) const -> audit_entry;

    sqlite3* db_{nullptr};
};

}  // namespace gamevault::storage
