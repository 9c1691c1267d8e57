/**
 * @file sqlite_game_catalog.hpp
 * @brief Game catalog backed by the games table
 */

#pragma once

#include <gamevault/core/result.hpp>
#include <gamevault/library/game_catalog.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Forward declaration of SQLite handle
struct sqlite3;

namespace gamevault::storage {

/**
 * @brief Catalog row for one game
 */
struct game_record {
    int64_t game_id{0};
    std::string name;
    std::string slug;
    std::chrono::system_clock::time_point added_at;
};

/**
 * @brief game_catalog implementation reading the local games table
 *
 * Registration exists for tools and tests that seed the catalog; the
 * library core only calls exists().
 */
class sqlite_game_catalog final : public library::game_catalog {
public:
    explicit sqlite_game_catalog(sqlite3* db);

    [[nodiscard]] auto exists(int64_t game_id) -> Result<bool> override;

    /**
     * @brief Insert or rename a catalog game
     *
     * @param game_id Positive catalog identifier
     * @param name Display name (required)
     * @param slug Optional URL slug
     */
    [[nodiscard]] auto register_game(int64_t game_id, std::string_view name,
                                     std::string_view slug = {}) -> VoidResult;

    [[nodiscard]] auto find(int64_t game_id) const -> std::optional<game_record>;

private:
    sqlite3* db_{nullptr};
};

}  // namespace gamevault::storage
