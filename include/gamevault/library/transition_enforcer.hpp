/**
 * @file transition_enforcer.hpp
 * @brief Library state machine and transaction boundary
 *
 * The transition_enforcer is the only component that writes library rows and
 * ledger rows. Each request runs in one write transaction:
 *
 * @code
 *   BEGIN IMMEDIATE -> read current -> validate -> write row(s)
 *                   -> append ledger row -> COMMIT
 * @endcode
 *
 * Progression rules:
 * - a pair in started or completed never returns to wishlist or collection
 * - entering completed from outside play sets started_at = completed_at
 * - completed -> started (reopen) keeps started_at and completed_at
 * - requesting the current category is a no-op without a ledger row
 */

#pragma once

#include <gamevault/core/result.hpp>
#include <gamevault/di/ilogger.hpp>
#include <gamevault/library/game_catalog.hpp>
#include <gamevault/storage/audit_ledger.hpp>
#include <gamevault/storage/library_database.hpp>
#include <gamevault/storage/library_record.hpp>
#include <gamevault/storage/library_store.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace gamevault::library {

/// Maximum accepted user_id length
inline constexpr std::size_t max_user_id_length = 64;

/**
 * @brief Retry behavior for lock conflicts
 */
struct transition_policy {
    /// Attempts per request, including the first one
    int max_attempts{5};

    /// Sleep before the second attempt; doubled after each further conflict
    std::chrono::milliseconds initial_backoff{5};

    /// Upper bound for the sleep between attempts
    std::chrono::milliseconds max_backoff{200};
};

/**
 * @brief Outcome of a successful request
 */
enum class transition_status {
    applied,   ///< library and ledger were written
    unchanged  ///< nothing to do, nothing written
};

[[nodiscard]] inline auto to_string(transition_status status) -> std::string {
    return status == transition_status::applied ? "applied" : "unchanged";
}

/**
 * @brief Result of request_transition() and remove()
 */
struct transition_result {
    transition_status status{transition_status::unchanged};

    /// Category before the request (nullopt = untracked)
    std::optional<storage::library_category> previous;

    /// Entry after the request (nullopt after a removal or for untracked pairs)
    std::optional<storage::library_entry> entry;

    /// Primary key of the ledger row, 0 when unchanged
    int64_t audit_pk{0};

    /// Number of attempts the request needed
    int attempts{1};
};

/**
 * @brief Validates and applies library transitions
 *
 * Thread Safety: NOT thread-safe. Use one enforcer (and one
 * library_database) per thread; concurrent writers are serialized by the
 * database write lock and retried according to transition_policy.
 *
 * @example
 * @code
 * auto db = std::move(library_database::open("library.db").value());
 * storage::sqlite_game_catalog catalog(db->native_handle());
 * transition_enforcer enforcer(*db, catalog);
 *
 * auto result = enforcer.request_transition("u1", 42, library_category::wishlist);
 * if (result.is_err() &&
 *     result.error().code == error_codes::already_advanced) {
 *     // the game is already being played
 * }
 * @endcode
 */
class transition_enforcer {
public:
    /**
     * @param db Connection owned by the caller; must outlive the enforcer
     * @param catalog Game catalog; must outlive the enforcer
     * @param policy Retry policy for lock conflicts
     * @param logger Logger (null uses the shared NullLogger)
     */
    transition_enforcer(storage::library_database& db,
                        game_catalog& catalog,
                        transition_policy policy = {},
                        std::shared_ptr<di::ILogger> logger = nullptr);

    transition_enforcer(const transition_enforcer&) = delete;
    auto operator=(const transition_enforcer&) -> transition_enforcer& = delete;

    /**
     * @brief Move a pair into the target category
     *
     * @param user_id Authenticated user (1..64 characters)
     * @param game_id Catalog game id (> 0)
     * @param target Requested category
     * @param metadata Wishlist priority/notes, used when target is wishlist
     * @return transition_result, or already_advanced, game_not_found,
     *         invalid_argument, concurrent_modification or a storage error
     */
    [[nodiscard]] auto request_transition(std::string_view user_id,
                                          int64_t game_id,
                                          storage::library_category target,
                                          const storage::entry_metadata& metadata = {})
        -> Result<transition_result>;

    /**
     * @brief Remove a pair from the library
     *
     * Writes a ledger row with no target category. Removing an untracked
     * pair is a no-op.
     */
    [[nodiscard]] auto remove(std::string_view user_id, int64_t game_id)
        -> Result<transition_result>;

    /**
     * @brief Edit priority/notes of a wishlist entry
     *
     * The category does not change, so no ledger row is written.
     *
     * @return Updated entry, or entry_not_found if the pair is not wishlisted
     */
    [[nodiscard]] auto update_details(std::string_view user_id,
                                      int64_t game_id,
                                      const storage::entry_metadata& metadata)
        -> Result<storage::library_entry>;

    [[nodiscard]] auto policy() const noexcept -> const transition_policy&;

    [[nodiscard]] auto logger() const noexcept -> const std::shared_ptr<di::ILogger>&;

    /// Replace the logger (nullptr restores the shared NullLogger)
    void set_logger(std::shared_ptr<di::ILogger> logger);

private:
    [[nodiscard]] auto apply_transition(const std::string& user_id,
                                        int64_t game_id,
                                        storage::library_category target,
                                        const storage::entry_metadata& metadata)
        -> Result<transition_result>;

    [[nodiscard]] auto apply_remove(const std::string& user_id, int64_t game_id)
        -> Result<transition_result>;

    [[nodiscard]] auto apply_update_details(const std::string& user_id,
                                            int64_t game_id,
                                            const storage::entry_metadata& metadata)
        -> Result<storage::library_entry>;

    void report_failure(const std::string& user_id,
                        int64_t game_id,
                        const std::string& requested,
                        const error_info& error);

    storage::library_database& db_;
    storage::library_store store_;
    storage::audit_ledger ledger_;
    game_catalog& catalog_;
    transition_policy policy_;
    std::shared_ptr<di::ILogger> logger_;
};

/**
 * @brief Validate the identity part of a request
 *
 * @return invalid_argument for an empty or oversized user_id or a
 *         non-positive game_id
 */
[[nodiscard]] auto validate_request(std::string_view user_id, int64_t game_id)
    -> VoidResult;

}  // namespace gamevault::library
