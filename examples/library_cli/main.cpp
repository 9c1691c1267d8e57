/**
 * @file main.cpp
 * @brief Entry point for the library command line driver
 *
 * Usage:
 *   library_cli [OPTIONS] <command> [ARGS]
 *
 * Example:
 *   library_cli register-game 42 "Outer Wilds"
 *   library_cli transition alice 42 started
 *   library_cli list alice started
 */

#include "config.hpp"

#include <gamevault/compat/time.hpp>
#include <gamevault/di/ilogger.hpp>
#include <gamevault/integration/logger_adapter.hpp>
#include <gamevault/library/library_query_service.hpp>
#include <gamevault/library/transition_enforcer.hpp>
#include <gamevault/storage/library_database.hpp>
#include <gamevault/storage/sqlite_game_catalog.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

using namespace gamevault;
using gamevault::example::library_cli_config;
using gamevault::storage::library_category;

namespace {

/**
 * @brief Format a time point as UTC date/time
 */
std::string format_time(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (compat::gmtime_safe(&time, &tm) == nullptr) {
        return "?";
    }
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string format_time(const std::optional<std::chrono::system_clock::time_point>& tp) {
    return tp.has_value() ? format_time(*tp) : "-";
}

/**
 * @brief Parse a positive game id argument
 */
std::optional<int64_t> parse_game_id(const std::string& text) {
    try {
        size_t consumed = 0;
        auto value = std::stoll(text, &consumed);
        if (consumed != text.size() || value <= 0) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int report_error(const error_info& error) {
    std::cerr << "Error [" << error.code << "]: " << error.message << "\n";
    if (error.details.has_value() && !error.details->empty()) {
        std::cerr << "  " << *error.details << "\n";
    }
    return 1;
}

bool require_args(const library_cli_config& config, size_t count, const char* usage) {
    if (config.args.size() != count) {
        std::cerr << "Usage: library_cli " << usage << "\n";
        return false;
    }
    return true;
}

void print_entry(const storage::library_entry& entry) {
    std::cout << std::left << std::setw(12) << entry.game_id
              << std::setw(12) << storage::to_string(entry.category);
    switch (entry.category) {
        case library_category::wishlist:
            std::cout << "priority=" << entry.priority;
            if (!entry.notes.empty()) {
                std::cout << " notes=\"" << entry.notes << "\"";
            }
            break;
        case library_category::collection:
            std::cout << "added=" << format_time(entry.added_at);
            break;
        case library_category::started:
            std::cout << "started=" << format_time(entry.started_at);
            break;
        case library_category::completed:
            std::cout << "started=" << format_time(entry.started_at)
                      << " completed=" << format_time(entry.completed_at);
            break;
    }
    std::cout << "\n";
}

int print_transition(const library::transition_result& result) {
    if (result.status == library::transition_status::unchanged) {
        std::cout << "unchanged (" << storage::to_string(result.previous) << ")\n";
        return 0;
    }
    std::cout << "applied: " << storage::to_string(result.previous) << " -> "
              << (result.entry ? storage::to_string(result.entry->category) : "none")
              << " (ledger #" << result.audit_pk << ", attempts "
              << result.attempts << ")\n";
    return 0;
}

storage::entry_metadata metadata_from(const library_cli_config& config) {
    storage::entry_metadata metadata;
    metadata.priority = config.priority;
    metadata.notes = config.notes;
    return metadata;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = library_cli_config::parse_args(argc, argv);
    if (!config_opt) {
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                return 0;
            }
        }
        return 1;
    }
    const auto& config = *config_opt;

    // Logging
    integration::logger_config log_config;
    log_config.min_level = integration::parse_log_level(config.logging.level)
                               .value_or(integration::log_level::warn);
    log_config.enable_console = config.logging.console;
    log_config.enable_file = !config.logging.directory.empty();
    log_config.enable_audit_log = !config.logging.directory.empty();
    if (!config.logging.directory.empty()) {
        log_config.log_directory = config.logging.directory;
    }
    log_config.async_mode = false;
    integration::logger_adapter::initialize(log_config);

    auto logger = std::make_shared<di::LoggerService>();

    // Database
    storage::library_database_config db_config;
    db_config.wal_mode = config.database.wal_mode;
    db_config.busy_timeout = config.database.busy_timeout;

    auto db_result = storage::library_database::open(config.database.path.string(),
                                                     db_config);
    if (db_result.is_err()) {
        int code = report_error(db_result.error());
        integration::logger_adapter::shutdown();
        return code;
    }
    auto db = std::move(db_result.value());

    storage::sqlite_game_catalog catalog(db->native_handle());

    library::transition_policy policy;
    policy.max_attempts = config.max_attempts;

    library::transition_enforcer enforcer(*db, catalog, policy, logger);
    library::library_query_service queries(*db);

    const auto& args = config.args;
    int exit_code = 0;

    auto run = [&]() -> int {
        if (config.command == "register-game") {
            if (!require_args(config, 2, "register-game <game_id> <name>")) return 1;
            auto game_id = parse_game_id(args[0]);
            if (!game_id) {
                std::cerr << "Error: Invalid game id: " << args[0] << "\n";
                return 1;
            }
            auto result = catalog.register_game(*game_id, args[1]);
            if (result.is_err()) return report_error(result.error());
            std::cout << "registered game " << *game_id << "\n";
            return 0;
        }

        if (config.command == "transition") {
            if (!require_args(config, 3, "transition <user> <game_id> <category>")) return 1;
            auto game_id = parse_game_id(args[1]);
            if (!game_id) {
                std::cerr << "Error: Invalid game id: " << args[1] << "\n";
                return 1;
            }
            auto target = library::category_from_name(args[2]);
            if (target.is_err()) return report_error(target.error());
            auto result = enforcer.request_transition(args[0], *game_id, target.value(),
                                                      metadata_from(config));
            if (result.is_err()) return report_error(result.error());
            return print_transition(result.value());
        }

        if (config.command == "details") {
            if (!require_args(config, 2, "details <user> <game_id>")) return 1;
            auto game_id = parse_game_id(args[1]);
            if (!game_id) {
                std::cerr << "Error: Invalid game id: " << args[1] << "\n";
                return 1;
            }
            auto result = enforcer.update_details(args[0], *game_id,
                                                  metadata_from(config));
            if (result.is_err()) return report_error(result.error());
            print_entry(result.value());
            return 0;
        }

        if (config.command == "remove") {
            if (!require_args(config, 2, "remove <user> <game_id>")) return 1;
            auto game_id = parse_game_id(args[1]);
            if (!game_id) {
                std::cerr << "Error: Invalid game id: " << args[1] << "\n";
                return 1;
            }
            auto result = enforcer.remove(args[0], *game_id);
            if (result.is_err()) return report_error(result.error());
            return print_transition(result.value());
        }

        if (config.command == "list") {
            if (!require_args(config, 2, "list <user> <category>")) return 1;
            auto category = library::category_from_name(args[1]);
            if (category.is_err()) return report_error(category.error());
            auto result = queries.list_by_category(args[0], category.value());
            if (result.is_err()) return report_error(result.error());
            for (const auto& entry : result.value()) {
                print_entry(entry);
            }
            std::cout << result.value().size() << " game(s)\n";
            return 0;
        }

        if (config.command == "history") {
            if (!require_args(config, 2, "history <user> <game_id>")) return 1;
            auto game_id = parse_game_id(args[1]);
            if (!game_id) {
                std::cerr << "Error: Invalid game id: " << args[1] << "\n";
                return 1;
            }
            auto result = queries.history(args[0], *game_id);
            if (result.is_err()) return report_error(result.error());
            for (const auto& entry : result.value()) {
                std::cout << "#" << std::left << std::setw(8) << entry.pk
                          << format_time(entry.created_at) << "  "
                          << storage::to_string(entry.from_category) << " -> "
                          << storage::to_string(entry.to_category) << " ("
                          << entry.reason << ")\n";
            }
            return 0;
        }

        if (config.command == "state") {
            if (!require_args(config, 2, "state <user> <game_id>")) return 1;
            auto game_id = parse_game_id(args[1]);
            if (!game_id) {
                std::cerr << "Error: Invalid game id: " << args[1] << "\n";
                return 1;
            }
            auto result = queries.get_state(args[0], *game_id);
            if (result.is_err()) return report_error(result.error());
            const auto& state = result.value();
            std::cout << "category: " << storage::to_string(state.category) << "\n";
            std::cout << "can move to:";
            for (auto target : state.can_transition_to) {
                std::cout << " " << storage::to_string(target);
            }
            std::cout << "\n";
            return 0;
        }

        if (config.command == "summary") {
            if (!require_args(config, 1, "summary <user>")) return 1;
            auto result = queries.summary(args[0]);
            if (result.is_err()) return report_error(result.error());
            const auto& summary = result.value();
            std::cout << "wishlist:   " << summary.wishlist << "\n"
                      << "collection: " << summary.collection << "\n"
                      << "started:    " << summary.started << "\n"
                      << "completed:  " << summary.completed << "\n"
                      << "total:      " << summary.total() << "\n";
            return 0;
        }

        std::cerr << "Error: Unknown command: " << config.command << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    };

    exit_code = run();

    integration::logger_adapter::shutdown();
    return exit_code;
}
