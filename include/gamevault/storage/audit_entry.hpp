/**
 * @file audit_entry.hpp
 * @brief Library transition audit record
 *
 * Audit entries are written once, in the same transaction as the library
 * mutation they document, and are never updated or deleted afterwards.
 */

#pragma once

#include "library_record.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace gamevault::storage {

/**
 * @brief Derived label describing why a transition happened
 */
enum class transition_reason {
    added,      ///< untracked -> wishlist/collection
    moved,      ///< wishlist <-> collection
    started,    ///< non-play -> started
    completed,  ///< any -> completed
    reopened,   ///< completed -> started
    removed     ///< any -> untracked
};

/**
 * @brief Convert transition_reason enum to string representation
 */
[[nodiscard]] inline auto to_string(transition_reason reason) -> std::string {
    switch (reason) {
        case transition_reason::added:
            return "added";
        case transition_reason::moved:
            return "moved";
        case transition_reason::started:
            return "started";
        case transition_reason::completed:
            return "completed";
        case transition_reason::reopened:
            return "reopened";
        case transition_reason::removed:
            return "removed";
        default:
            return "unknown";
    }
}

/**
 * @brief Derive the reason label for a transition between two states
 *
 * @param from Category before the transition (nullopt = untracked)
 * @param to Category after the transition (nullopt = removal)
 */
[[nodiscard]] inline auto derive_reason(std::optional<library_category> from,
                                        std::optional<library_category> to)
    -> transition_reason {
    if (!to.has_value()) {
        return transition_reason::removed;
    }
    if (*to == library_category::completed) {
        return transition_reason::completed;
    }
    if (*to == library_category::started) {
        return from == library_category::completed ? transition_reason::reopened
                                                   : transition_reason::started;
    }
    return from.has_value() ? transition_reason::moved : transition_reason::added;
}

/**
 * @brief One observed library transition
 */
struct audit_entry {
    /// Primary key; monotonic, follows commit order
    int64_t pk{0};

    /// User the transition belongs to
    std::string user_id;

    /// Game the transition belongs to
    int64_t game_id{0};

    /// Category before the transition (nullopt = untracked)
    std::optional<library_category> from_category;

    /// Category after the transition (nullopt = bare removal)
    std::optional<library_category> to_category;

    /// Derived reason label (see transition_reason)
    std::string reason;

    /// Commit timestamp (UTC)
    std::chrono::system_clock::time_point created_at;
};

}  // namespace gamevault::storage
