/**
 * @file library_query_service.cpp
 * @brief Implementation of library read queries
 */

#include <gamevault/library/library_query_service.hpp>

#include <gamevault/library/transition_enforcer.hpp>

namespace gamevault::library {

using storage::library_category;

auto library_summary::count_of(library_category category) const noexcept -> size_t {
    switch (category) {
        case library_category::wishlist:
            return wishlist;
        case library_category::collection:
            return collection;
        case library_category::started:
            return started;
        case library_category::completed:
            return completed;
    }
    return 0;
}

auto allowed_targets(std::optional<library_category> current)
    -> std::vector<library_category> {
    std::vector<library_category> targets;
    for (auto category : storage::all_categories) {
        if (current == category) {
            continue;
        }
        // Play states never fall back to intent/ownership
        if (current.has_value() && storage::is_play_state(*current) &&
            !storage::is_play_state(category)) {
            continue;
        }
        targets.push_back(category);
    }
    return targets;
}

auto category_from_name(std::string_view name) -> Result<library_category> {
    auto category = storage::parse_library_category(name);
    if (!category.has_value()) {
        return gamevault_error<library_category>(
            error_codes::invalid_category,
            "Unknown category '" + std::string(name) + "'",
            "library_query_service",
            "expected wishlist, collection, started or completed");
    }
    return *category;
}

auto replay(const std::vector<storage::audit_entry>& history)
    -> std::optional<library_category> {
    std::optional<library_category> state;
    for (const auto& entry : history) {
        state = entry.to_category;
    }
    return state;
}

library_query_service::library_query_service(storage::library_database& db)
    : store_(db.native_handle()), ledger_(db.native_handle()) {}

auto library_query_service::list_by_category(std::string_view user_id,
                                             library_category category) const
    -> Result<std::vector<storage::library_entry>> {
    auto valid = validate_request(user_id, 1);
    if (valid.is_err()) {
        return Result<std::vector<storage::library_entry>>(valid.error());
    }
    return store_.list(user_id, category);
}

auto library_query_service::history(std::string_view user_id, int64_t game_id) const
    -> Result<std::vector<storage::audit_entry>> {
    auto valid = validate_request(user_id, game_id);
    if (valid.is_err()) {
        return Result<std::vector<storage::audit_entry>>(valid.error());
    }
    return ledger_.history(user_id, game_id);
}

auto library_query_service::get_state(std::string_view user_id, int64_t game_id) const
    -> Result<library_state> {
    auto valid = validate_request(user_id, game_id);
    if (valid.is_err()) {
        return Result<library_state>(valid.error());
    }

    auto current = store_.get(user_id, game_id);
    if (current.is_err()) {
        return Result<library_state>(current.error());
    }

    library_state state;
    state.user_id = std::string(user_id);
    state.game_id = game_id;
    state.entry = current.value();
    if (state.entry.has_value()) {
        state.category = state.entry->category;
    }
    state.can_transition_to = allowed_targets(state.category);
    state.can_remove = state.category.has_value();
    return state;
}

auto library_query_service::summary(std::string_view user_id) const
    -> Result<library_summary> {
    auto valid = validate_request(user_id, 1);
    if (valid.is_err()) {
        return Result<library_summary>(valid.error());
    }

    library_summary result;
    result.user_id = std::string(user_id);

    for (auto category : storage::all_categories) {
        auto count = store_.count(user_id, category);
        if (count.is_err()) {
            return Result<library_summary>(count.error());
        }
        switch (category) {
            case library_category::wishlist:
                result.wishlist = count.value();
                break;
            case library_category::collection:
                result.collection = count.value();
                break;
            case library_category::started:
                result.started = count.value();
                break;
            case library_category::completed:
                result.completed = count.value();
                break;
        }
    }

    return result;
}

}  // namespace gamevault::library
