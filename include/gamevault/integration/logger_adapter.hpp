/**
 * @file logger_adapter.hpp
 * @brief Adapter for library logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with library operations. It supports standard logging and a JSON-lines
 * transition trail (one object per applied or rejected transition).
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <gamevault/compat/format.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace gamevault::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse a lowercase level name ("trace" .. "fatal", "off")
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<log_level>;

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable the transitions.json trail
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{100};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Process-wide logging facade over logger_system
 *
 * Provides:
 * - Standard application logging (trace through fatal)
 * - Transition trail logging: every applied transition and every rejected
 *   request is appended to transitions.json in the log directory
 *
 * Messages logged before initialize() are dropped.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/gamevault";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Library opened at {}", path);
 * logger_adapter::log_transition("u1", 42, "wishlist", "collection", "moved", 7);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and file writers and the transition trail path.
     * Calling initialize() on an initialized adapter has no effect.
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the underlying logger
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(gamevault::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, gamevault::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(gamevault::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, gamevault::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(gamevault::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, gamevault::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(gamevault::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, gamevault::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(gamevault::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, gamevault::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(gamevault::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, gamevault::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     */
    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Transition Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record an applied transition
     *
     * @param user_id User the transition belongs to
     * @param game_id Game the transition belongs to
     * @param from Previous category ("none" if untracked)
     * @param to New category ("none" after removal)
     * @param reason Reason label stored in the ledger
     * @param audit_pk Primary key of the ledger row
     */
    static void log_transition(const std::string& user_id,
                               int64_t game_id,
                               const std::string& from,
                               const std::string& to,
                               const std::string& reason,
                               int64_t audit_pk);

    /**
     * @brief Record a rejected transition request
     *
     * @param user_id User of the request
     * @param game_id Game of the request
     * @param requested Requested category
     * @param error_code Error code returned to the caller
     * @param message Error message returned to the caller
     */
    static void log_transition_rejected(const std::string& user_id,
                                        int64_t game_id,
                                        const std::string& requested,
                                        int error_code,
                                        const std::string& message);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    /// Copy of the active configuration (defaults before initialize())
    [[nodiscard]] static auto get_config() -> logger_config;

    /**
     * @brief Uppercase level name used in log output
     */
    [[nodiscard]] static auto log_level_to_string(log_level level) -> std::string;

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace gamevault::integration
