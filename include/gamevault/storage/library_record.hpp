/**
 * @file library_record.hpp
 * @brief Library category and library entry data structures
 *
 * This file provides the library_category enumeration and the library_entry
 * record describing which category a (user, game) pair currently occupies.
 *
 * Category order (total):
 * @code
 *   wishlist < collection < started < completed
 *   \__ intent/ownership __/ \____ play ____/
 * @endcode
 *
 * A pair that has no entry is "untracked" and is represented by an empty
 * std::optional<library_category>.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gamevault::storage {

/**
 * @brief Mutually exclusive library categories
 *
 * The underlying values define the progression order.
 */
enum class library_category : int {
    wishlist = 0,
    collection = 1,
    started = 2,
    completed = 3
};

/// All categories in progression order
inline constexpr std::array<library_category, 4> all_categories = {
    library_category::wishlist, library_category::collection,
    library_category::started, library_category::completed};

/**
 * @brief Convert library_category enum to string representation
 */
[[nodiscard]] inline auto to_string(library_category category) -> std::string {
    switch (category) {
        case library_category::wishlist:
            return "wishlist";
        case library_category::collection:
            return "collection";
        case library_category::started:
            return "started";
        case library_category::completed:
            return "completed";
        default:
            return "unknown";
    }
}

/**
 * @brief Convert an optional category, rendering untracked as "none"
 */
[[nodiscard]] inline auto to_string(const std::optional<library_category>& category)
    -> std::string {
    return category.has_value() ? to_string(*category) : "none";
}

/**
 * @brief Parse string to library_category enum
 *
 * @param str Lowercase category name
 * @return Optional containing the category if valid, nullopt otherwise
 */
[[nodiscard]] inline auto parse_library_category(std::string_view str)
    -> std::optional<library_category> {
    if (str == "wishlist") {
        return library_category::wishlist;
    }
    if (str == "collection") {
        return library_category::collection;
    }
    if (str == "started") {
        return library_category::started;
    }
    if (str == "completed") {
        return library_category::completed;
    }
    return std::nullopt;
}

/**
 * @brief Position of a category in the progression order
 */
[[nodiscard]] constexpr auto rank(library_category category) noexcept -> int {
    return static_cast<int>(category);
}

/**
 * @brief Check if a category belongs to the play group (started/completed)
 */
[[nodiscard]] constexpr auto is_play_state(library_category category) noexcept
    -> bool {
    return category == library_category::started ||
           category == library_category::completed;
}

/**
 * @brief Caller-supplied metadata for a transition
 *
 * Only wishlist entries carry priority and notes. Unset fields keep their
 * defaults on insert.
 */
struct entry_metadata {
    /// Wishlist priority (higher sorts first)
    std::optional<int> priority;

    /// Free-form wishlist notes
    std::optional<std::string> notes;
};

/**
 * @brief Current library entry for a (user, game) pair
 *
 * Depending on the category the row lives in one of three physical tables:
 * user_wishlist, user_collection or game_progress.
 */
struct library_entry {
    /// Authenticated user identifier (max 64 chars)
    std::string user_id;

    /// External catalog game identifier
    int64_t game_id{0};

    /// Category the pair occupies
    library_category category{library_category::wishlist};

    /// Wishlist priority
    int priority{0};

    /// Wishlist notes
    std::string notes;

    /// Set when the pair entered play (started or completed)
    std::optional<std::chrono::system_clock::time_point> started_at;

    /// Set when the pair was completed; never cleared once set
    std::optional<std::chrono::system_clock::time_point> completed_at;

    /// When the row for the current category was written
    std::chrono::system_clock::time_point added_at;

    /// Last modification of the row
    std::chrono::system_clock::time_point updated_at;

    /**
     * @brief Check if this record has valid data
     */
    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return !user_id.empty() && game_id > 0;
    }
};

}  // namespace gamevault::storage
