/**
 * @file library_record_test.cpp
 * @brief Unit tests for library categories and transition reasons
 */

#include <catch2/catch_test_macros.hpp>

#include <gamevault/storage/audit_entry.hpp>
#include <gamevault/storage/library_record.hpp>

using namespace gamevault::storage;

TEST_CASE("library_category ordering", "[library][category]") {
    CHECK(rank(library_category::wishlist) < rank(library_category::collection));
    CHECK(rank(library_category::collection) < rank(library_category::started));
    CHECK(rank(library_category::started) < rank(library_category::completed));

    CHECK_FALSE(is_play_state(library_category::wishlist));
    CHECK_FALSE(is_play_state(library_category::collection));
    CHECK(is_play_state(library_category::started));
    CHECK(is_play_state(library_category::completed));
}

TEST_CASE("library_category string conversion", "[library][category]") {
    for (auto category : all_categories) {
        auto parsed = parse_library_category(to_string(category));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == category);
    }

    CHECK_FALSE(parse_library_category("Wishlist").has_value());
    CHECK_FALSE(parse_library_category("none").has_value());
    CHECK_FALSE(parse_library_category("").has_value());
    CHECK(to_string(std::optional<library_category>{}) == "none");
}

TEST_CASE("derive_reason labels", "[library][reason]") {
    using C = library_category;

    CHECK(derive_reason(std::nullopt, C::wishlist) == transition_reason::added);
    CHECK(derive_reason(std::nullopt, C::collection) == transition_reason::added);
    CHECK(derive_reason(C::wishlist, C::collection) == transition_reason::moved);
    CHECK(derive_reason(C::collection, C::wishlist) == transition_reason::moved);
    CHECK(derive_reason(std::nullopt, C::started) == transition_reason::started);
    CHECK(derive_reason(C::collection, C::started) == transition_reason::started);
    CHECK(derive_reason(C::wishlist, C::completed) == transition_reason::completed);
    CHECK(derive_reason(C::started, C::completed) == transition_reason::completed);
    CHECK(derive_reason(C::completed, C::started) == transition_reason::reopened);
    CHECK(derive_reason(C::completed, std::nullopt) == transition_reason::removed);

    CHECK(to_string(transition_reason::reopened) == "reopened");
    CHECK(to_string(transition_reason::removed) == "removed");
}
