/**
 * @file config.cpp
 * @brief Configuration management implementation for library_cli
 */

#include "config.hpp"

#include <iostream>
#include <stdexcept>
#include <string_view>

namespace gamevault::example {

void library_cli_config::print_help() {
    std::cout << R"(
Library CLI - Game Library State Machine

Usage: library_cli [OPTIONS] <command> [ARGS]

Commands:
  register-game <game_id> <name>           Add a game to the local catalog
  transition <user> <game_id> <category>   Move a game into wishlist, collection,
                                           started or completed
  details <user> <game_id>                 Edit wishlist priority/notes
  remove <user> <game_id>                  Remove a game from the library
  list <user> <category>                   List one category
  history <user> <game_id>                 Show the transition ledger of a game
  state <user> <game_id>                   Show the current category and allowed moves
  summary <user>                           Count entries per category

Options:
  --db-path <path>         SQLite database path (default: ./gamevault.db)
  --log-dir <path>         Write gamevault.log and transitions.json here
  --log-level <level>      trace, debug, info, warn, error, fatal, off
                           (default: warn)
  --busy-timeout-ms <ms>   Lock wait before a retry (default: 50)
  --max-attempts <n>       Attempts per request on lock conflicts (default: 5)
  --priority <n>           Wishlist priority (transition/details)
  --notes <text>           Wishlist notes (transition/details)
  --help, -h               Show this help message

Exit status is 0 on success (including requests that change nothing) and 1
when a request is rejected or fails.

Examples:
  library_cli register-game 42 "Outer Wilds"
  library_cli transition alice 42 wishlist --priority 3 --notes "on sale"
  library_cli transition alice 42 completed
  library_cli history alice 42

)";
}

auto library_cli_config::parse_args(int argc, char* argv[])
    -> std::optional<library_cli_config> {

    library_cli_config config;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_help();
            return std::nullopt;
        }

        if (arg == "--db-path") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --db-path requires a value\n";
                return std::nullopt;
            }
            config.database.path = argv[++i];
            continue;
        }

        if (arg == "--log-dir") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --log-dir requires a value\n";
                return std::nullopt;
            }
            config.logging.directory = argv[++i];
            continue;
        }

        if (arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --log-level requires a value\n";
                return std::nullopt;
            }
            config.logging.level = argv[++i];
            const std::string_view level = config.logging.level;
            if (level != "trace" && level != "debug" && level != "info" &&
                level != "warn" && level != "error" && level != "fatal" &&
                level != "off") {
                std::cerr << "Error: Invalid log level: " << level << "\n";
                std::cerr << "Valid levels: trace, debug, info, warn, error, fatal, off\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--busy-timeout-ms") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --busy-timeout-ms requires a value\n";
                return std::nullopt;
            }
            try {
                auto value = std::stoi(argv[++i]);
                if (value < 0) {
                    throw std::out_of_range("negative timeout");
                }
                config.database.busy_timeout = std::chrono::milliseconds(value);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid busy timeout\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--max-attempts") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --max-attempts requires a value\n";
                return std::nullopt;
            }
            try {
                config.max_attempts = std::stoi(argv[++i]);
                if (config.max_attempts < 1) {
                    throw std::out_of_range("at least one attempt");
                }
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid max-attempts value\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--priority") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --priority requires a value\n";
                return std::nullopt;
            }
            try {
                config.priority = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid priority\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--notes") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --notes requires a value\n";
                return std::nullopt;
            }
            config.notes = std::string(argv[++i]);
            continue;
        }

        if (arg.size() > 1 && arg.front() == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return std::nullopt;
        }

        if (config.command.empty()) {
            config.command = std::string(arg);
        } else {
            config.args.emplace_back(arg);
        }
    }

    if (config.command.empty()) {
        std::cerr << "Error: No command given\n";
        std::cerr << "Use --help for usage information\n";
        return std::nullopt;
    }

    return config;
}

}  // namespace gamevault::example
