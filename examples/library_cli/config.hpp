/**
 * @file config.hpp
 * @brief Configuration management for the library command line driver
 *
 * Provides configuration structures and parsing utilities for the
 * library_cli sample application.
 */

#ifndef GAMEVAULT_EXAMPLE_LIBRARY_CLI_CONFIG_HPP
#define GAMEVAULT_EXAMPLE_LIBRARY_CLI_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gamevault::example {

/**
 * @brief Database configuration
 */
struct database_config {
    /// Path to SQLite database file
    std::filesystem::path path{"./gamevault.db"};

    /// Enable WAL (Write-Ahead Logging) mode
    bool wal_mode{true};

    /// How long to wait for a competing writer before retrying
    std::chrono::milliseconds busy_timeout{50};
};

/**
 * @brief Logging configuration
 */
struct logging_config {
    /// Log level: "trace", "debug", "info", "warn", "error", "fatal", "off"
    std::string level{"warn"};

    /// Log directory (empty for console only, no transitions.json)
    std::filesystem::path directory;

    /// Enable console output
    bool console{true};
};

/**
 * @brief Complete library_cli configuration
 */
struct library_cli_config {
    /// Database settings
    database_config database;

    /// Logging settings
    logging_config logging;

    /// Attempts per request when another writer holds the lock
    int max_attempts{5};

    /// Command name (register-game, transition, remove, list, history, state, summary)
    std::string command;

    /// Positional command arguments
    std::vector<std::string> args;

    /// --priority for transition to wishlist and for details
    std::optional<int> priority;

    /// --notes for transition to wishlist and for details
    std::optional<std::string> notes;

    /**
     * @brief Parse configuration from command line arguments
     *
     * Options may appear before or after the command.
     *
     * @param argc Argument count
     * @param argv Argument vector
     * @return Configuration or nullopt if --help was requested or error
     */
    static auto parse_args(int argc, char* argv[])
        -> std::optional<library_cli_config>;

    /**
     * @brief Print help message to stdout
     */
    static void print_help();
};

}  // namespace gamevault::example

#endif  // GAMEVAULT_EXAMPLE_LIBRARY_CLI_CONFIG_HPP
