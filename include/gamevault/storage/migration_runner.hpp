/**
 * @file migration_runner.hpp
 * @brief Versioned schema upgrades for the library database
 *
 * The schema is a fixed list of steps; `schema_version` stores one row per
 * applied step.
 *
 * | Version | Adds                                                        |
 * |---------|-------------------------------------------------------------|
 * | 1       | games, user_wishlist, user_collection, game_progress         |
 * | 2       | library_audit_log and its append-only triggers               |
 *
 * Every step runs in its own `BEGIN IMMEDIATE` transaction and re-reads the
 * version after taking the write lock, so several connections may open the
 * same fresh file at once: the first one applies a step, the others find it
 * applied and skip it.
 */

#pragma once

#include <gamevault/core/result.hpp>

#include <string>
#include <vector>

struct sqlite3;

namespace gamevault::storage {

/**
 * @brief One row of the schema_version table
 */
struct applied_migration {
    int version{0};
    std::string description;
    std::string applied_at;
};

/**
 * @brief Brings a connection's schema up to a target version
 *
 * Stateless; one instance may serve any number of connections, but a single
 * sqlite3 handle must not be used from two threads at once.
 */
class migration_runner {
public:
    /// Newest schema version known to this build
    static constexpr int latest_version = 2;

    /**
     * @brief Apply every step up to latest_version
     *
     * @return database_migration_error if a step fails, or
     *         concurrent_modification if the write lock could not be taken
     *         within the connection's busy timeout
     */
    [[nodiscard]] auto migrate(sqlite3* db) const -> VoidResult;

    /**
     * @brief Apply steps up to @p target_version (for tests and tooling)
     */
    [[nodiscard]] auto migrate_to(sqlite3* db, int target_version) const
        -> VoidResult;

    /// Highest applied version, 0 for an empty database
    [[nodiscard]] auto current_version(sqlite3* db) const -> int;

    [[nodiscard]] auto needs_migration(sqlite3* db) const -> bool {
        return current_version(db) < latest_version;
    }

    /// Applied steps in version order
    [[nodiscard]] auto history(sqlite3* db) const -> std::vector<applied_migration>;
};

}  // namespace gamevault::storage
