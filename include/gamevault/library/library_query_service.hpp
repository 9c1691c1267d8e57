/**
 * @file library_query_service.hpp
 * @brief Read-side API for library entries and their history
 */

#pragma once

#include <gamevault/core/result.hpp>
#include <gamevault/storage/audit_entry.hpp>
#include <gamevault/storage/audit_ledger.hpp>
#include <gamevault/storage/library_database.hpp>
#include <gamevault/storage/library_record.hpp>
#include <gamevault/storage/library_store.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gamevault::library {

/**
 * @brief Current category of a pair plus the targets a request may name
 *
 * can_transition_to lists every category that request_transition() would
 * accept (excluding the current one, which is a no-op).
 */
struct library_state {
    std::string user_id;
    int64_t game_id{0};
    std::optional<storage::library_category> category;
    std::optional<storage::library_entry> entry;
    std::vector<storage::library_category> can_transition_to;
    bool can_remove{false};
};

/**
 * @brief Number of entries per category for one user
 */
struct library_summary {
    std::string user_id;
    size_t wishlist{0};
    size_t collection{0};
    size_t started{0};
    size_t completed{0};

    [[nodiscard]] auto total() const noexcept -> size_t {
        return wishlist + collection + started + completed;
    }

    [[nodiscard]] auto count_of(storage::library_category category) const noexcept
        -> size_t;
};

/**
 * @brief Targets that are not rejected from the given category
 */
[[nodiscard]] auto allowed_targets(std::optional<storage::library_category> current)
    -> std::vector<storage::library_category>;

/**
 * @brief Parse a user-supplied category name
 *
 * @return the category, or invalid_category naming the accepted values
 */
[[nodiscard]] auto category_from_name(std::string_view name)
    -> Result<storage::library_category>;

/**
 * @brief Reconstruct the final category of a pair from its history
 *
 * Applies each entry's to_category in order. Returns nullopt for an empty
 * history or one that ends with a removal.
 */
[[nodiscard]] auto replay(const std::vector<storage::audit_entry>& history)
    -> std::optional<storage::library_category>;

/**
 * @brief Read-only queries over the library and the ledger
 *
 * Thread Safety: NOT thread-safe. Shares the connection of its owner.
 */
class library_query_service {
public:
    explicit library_query_service(storage::library_database& db);

    /**
     * @brief Entries of one category in that category's display order
     */
    [[nodiscard]] auto list_by_category(std::string_view user_id,
                                        storage::library_category category) const
        -> Result<std::vector<storage::library_entry>>;

    /**
     * @brief Transitions of one pair, oldest first
     */
    [[nodiscard]] auto history(std::string_view user_id, int64_t game_id) const
        -> Result<std::vector<storage::audit_entry>>;

    [[nodiscard]] auto get_state(std::string_view user_id, int64_t game_id) const
        -> Result<library_state>;

    [[nodiscard]] auto summary(std::string_view user_id) const
        -> Result<library_summary>;

private:
    storage::library_store store_;
    storage::audit_ledger ledger_;
};

}  // namespace gamevault::library
