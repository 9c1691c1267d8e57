/**
 * @file library_database.hpp
 * @brief SQLite connection owner for the game library
 *
 * This file provides the library_database class, which opens (or creates)
 * the library database, applies connection pragmas, runs schema migrations
 * and manages write transactions, plus the scoped_transaction RAII guard.
 */

#pragma once

#include "migration_runner.hpp"

#include <gamevault/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

// Forward declaration of SQLite handle
struct sqlite3;

namespace gamevault::storage {

/**
 * @brief Configuration for the library database connection
 */
struct library_database_config {
    /// Cache size in megabytes (default: 16 MB)
    size_t cache_size_mb = 16;

    /// Enable WAL (Write-Ahead Logging) mode for concurrent readers
    bool wal_mode = true;

    /// Enforce foreign key constraints
    bool foreign_keys = true;

    /// How long SQLite waits on a locked database before reporting BUSY
    std::chrono::milliseconds busy_timeout{50};
};

/**
 * @brief Library database connection
 *
 * Owns one SQLite connection. Write transactions are started with
 * BEGIN IMMEDIATE so the write lock is held before the first read, which
 * serializes concurrent read-validate-write sequences on the same file.
 * A lock conflict is reported as error_codes::concurrent_modification.
 *
 * Thread Safety: This class is NOT thread-safe. Give each thread its own
 * connection to the same database file.
 *
 * @example
 * @code
 * auto db_result = library_database::open(":memory:");
 * if (db_result.is_err()) {
 *     // Handle error
 * }
 * auto db = std::move(db_result.value());
 *
 * scoped_transaction tx(*db);
 * // ... library_store / audit_ledger writes ...
 * auto commit_result = tx.commit();
 * @endcode
 */
class library_database {
public:
    /**
     * @brief Open or create a database with default configuration
     *
     * @param db_path Path to the database file, or ":memory:"
     * @return Result containing the database instance or error
     */
    [[nodiscard]] static auto open(std::string_view db_path)
        -> Result<std::unique_ptr<library_database>>;

    /**
     * @brief Open or create a database with custom configuration
     *
     * Runs pending migrations. Several threads may open the same new file
     * at once; each schema step is applied by exactly one of them.
     *
     * @param db_path Path to the database file, or ":memory:"
     * @param config Connection options
     * @return Result containing the database instance or error
     */
    [[nodiscard]] static auto open(std::string_view db_path,
                                   const library_database_config& config)
        -> Result<std::unique_ptr<library_database>>;

    ~library_database();

    // Non-copyable, non-movable (handed out behind unique_ptr)
    library_database(const library_database&) = delete;
    auto operator=(const library_database&) -> library_database& = delete;
    library_database(library_database&&) = delete;
    auto operator=(library_database&&) -> library_database& = delete;

    // ========================================================================
    // Transaction Support
    // ========================================================================

    /**
     * @brief Begin a write transaction (BEGIN IMMEDIATE)
     *
     * @return concurrent_modification if another connection holds the
     *         write lock, database_transaction_error on other failures
     */
    [[nodiscard]] auto begin_transaction() -> VoidResult;

    /**
     * @brief Commit the current transaction
     */
    [[nodiscard]] auto commit() -> VoidResult;

    /**
     * @brief Rollback the current transaction (no-op if none is active)
     */
    [[nodiscard]] auto rollback() -> VoidResult;

    /**
     * @brief Check if a transaction is currently active
     */
    [[nodiscard]] auto in_transaction() const noexcept -> bool;

    // ========================================================================
    // Information
    // ========================================================================

    [[nodiscard]] auto is_open() const noexcept -> bool;

    [[nodiscard]] auto path() const -> const std::string&;

    [[nodiscard]] auto schema_version() const -> int;

    /**
     * @brief Get the raw SQLite database handle
     *
     * @warning The returned handle is managed by this class. Do not close it.
     */
    [[nodiscard]] auto native_handle() const noexcept -> sqlite3*;

private:
    explicit library_database(sqlite3* db, std::string path);

    /// SQLite database handle
    sqlite3* db_{nullptr};

    /// Database file path
    std::string path_;

    /// Migration runner for schema management
    migration_runner migration_runner_;
};

/**
 * @brief RAII transaction guard
 *
 * If commit() is not called before destruction, the transaction is
 * automatically rolled back.
 */
class scoped_transaction {
public:
    /**
     * @brief Construct and begin transaction
     *
     * Check begin_result() for success.
     */
    explicit scoped_transaction(library_database& db);

    ~scoped_transaction();

    scoped_transaction(const scoped_transaction&) = delete;
    auto operator=(const scoped_transaction&) -> scoped_transaction& = delete;
    scoped_transaction(scoped_transaction&&) = delete;
    auto operator=(scoped_transaction&&) -> scoped_transaction& = delete;

    /**
     * @brief Result of beginning the transaction
     */
    [[nodiscard]] auto begin_result() const -> const VoidResult&;

    /**
     * @brief Commit the transaction
     *
     * After successful commit, the destructor will not rollback.
     */
    [[nodiscard]] auto commit() -> VoidResult;

    /**
     * @brief Explicitly rollback the transaction
     */
    void rollback() noexcept;

    /**
     * @brief Check if transaction is active (not committed/rolled back)
     */
    [[nodiscard]] auto is_active() const noexcept -> bool;

private:
    library_database& db_;
    VoidResult begin_result_;
    bool committed_{false};
    bool active_{false};
};

}  // namespace gamevault::storage
