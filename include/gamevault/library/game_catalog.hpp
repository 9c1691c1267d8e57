/**
 * @file game_catalog.hpp
 * @brief Abstract game catalog lookup
 *
 * The library core only needs to know whether a game exists. Catalog
 * contents (names, ratings, search) belong to other services.
 */

#pragma once

#include <gamevault/core/result.hpp>

#include <cstdint>

namespace gamevault::library {

/**
 * @brief Read-only view of the external game catalog
 *
 * Implementations must be usable from the thread that owns the enforcer
 * holding them.
 */
class game_catalog {
public:
    virtual ~game_catalog() = default;

    /**
     * @brief Check whether a game is known to the catalog
     *
     * @param game_id External catalog identifier
     * @return true if the game exists, or a storage error
     */
    [[nodiscard]] virtual auto exists(int64_t game_id) -> Result<bool> = 0;

protected:
    game_catalog() = default;
    game_catalog(const game_catalog&) = default;
    auto operator=(const game_catalog&) -> game_catalog& = default;
    game_catalog(game_catalog&&) = default;
    auto operator=(game_catalog&&) -> game_catalog& = default;
};

}  // namespace gamevault::library
