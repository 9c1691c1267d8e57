/**
 * @file logger_adapter.cpp
 * @brief logger_system backend and transitions.json trail
 */

#include <gamevault/integration/logger_adapter.hpp>

#include <gamevault/compat/time.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>
#include <utility>

namespace gamevault::integration {

namespace {

constexpr const char* kTrailFile = "transitions.json";
constexpr const char* kLogFile = "gamevault.log";

/// Names accepted by --log-level, in severity order
constexpr std::array<std::pair<std::string_view, log_level>, 7> kLevelNames = {{
    {"trace", log_level::trace},
    {"debug", log_level::debug},
    {"info", log_level::info},
    {"warn", log_level::warn},
    {"error", log_level::error},
    {"fatal", log_level::fatal},
    {"off", log_level::off},
}};

auto to_backend_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace: return kcenon::logger::log_level::trace;
        case log_level::debug: return kcenon::logger::log_level::debug;
        case log_level::info: return kcenon::logger::log_level::info;
        case log_level::warn: return kcenon::logger::log_level::warn;
        case log_level::error: return kcenon::logger::log_level::error;
        case log_level::fatal: return kcenon::logger::log_level::fatal;
        case log_level::off: break;
    }
    return kcenon::logger::log_level::off;
}

/// UTC wall clock as 2024-01-31T12:00:00.123Z
auto utc_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    if (compat::gmtime_safe(&seconds, &utc) == nullptr) {
        return {};
    }
    return compat::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                          utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                          utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
}

/**
 * @brief Builds one JSON object of the trail
 *
 * Fields keep insertion order; integers are written unquoted.
 */
class trail_line {
public:
    trail_line() { out_ = "{\"ts\":\"" + utc_timestamp() + "\""; }

    auto text(std::string_view key, std::string_view value) -> trail_line& {
        append_key(key);
        out_ += '"';
        append_escaped(value);
        out_ += '"';
        return *this;
    }

    auto number(std::string_view key, int64_t value) -> trail_line& {
        append_key(key);
        out_ += std::to_string(value);
        return *this;
    }

    [[nodiscard]] auto finish() const -> std::string { return out_ + "}\n"; }

private:
    void append_key(std::string_view key) {
        out_ += ",\"";
        out_ += key;
        out_ += "\":";
    }

    void append_escaped(std::string_view value) {
        for (char c : value) {
            switch (c) {
                case '"': out_ += "\\\""; break;
                case '\\': out_ += "\\\\"; break;
                case '\n': out_ += "\\n"; break;
                case '\r': out_ += "\\r"; break;
                case '\t': out_ += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        out_ += compat::format("\\u{:04x}", static_cast<int>(c));
                    } else {
                        out_ += c;
                    }
                    break;
            }
        }
    }

    std::string out_;
};

}  // namespace

auto parse_log_level(std::string_view name) -> std::optional<log_level> {
    for (const auto& [label, level] : kLevelNames) {
        if (label == name) {
            return level;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (backend_) {
            return;
        }

        if (config.enable_file || config.enable_audit_log) {
            std::filesystem::create_directories(config.log_directory);
        }

        auto backend = std::make_unique<kcenon::logger::logger>(config.async_mode,
                                                                config.buffer_size);
        backend->set_min_level(to_backend_level(config.min_level));
        if (config.enable_console) {
            backend->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config.enable_file) {
            backend->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                (config.log_directory / kLogFile).string(),
                config.max_file_size_mb * 1024 * 1024, config.max_files));
        }
        backend->start();

        {
            std::lock_guard trail_lock(trail_mutex_);
            trail_path_ = config.enable_audit_log ? config.log_directory / kTrailFile
                                                  : std::filesystem::path{};
        }

        config_ = config;
        min_level_.store(config.min_level);
        backend_ = std::move(backend);
        initialized_.store(true);
    }

    void shutdown() {
        std::scoped_lock lock(mutex_, trail_mutex_);
        if (!backend_) {
            return;
        }
        initialized_.store(false);
        backend_->flush();
        backend_->stop();
        backend_.reset();
        trail_path_.clear();
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool {
        return initialized_.load();
    }

    void log(log_level level, const std::string& message) {
        if (!is_level_enabled(level)) {
            return;
        }
        std::lock_guard lock(mutex_);
        if (backend_) {
            backend_->log(to_backend_level(level), message);
        }
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return level != log_level::off && level >= min_level_.load();
    }

    void flush() {
        std::lock_guard lock(mutex_);
        if (backend_) {
            backend_->flush();
        }
    }

    void set_min_level(log_level level) {
        std::lock_guard lock(mutex_);
        min_level_.store(level);
        config_.min_level = level;
        if (backend_) {
            backend_->set_min_level(to_backend_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level {
        return min_level_.load();
    }

    [[nodiscard]] auto config() const -> logger_config {
        std::lock_guard lock(mutex_);
        return config_;
    }

    void append_trail(std::string line) {
        std::lock_guard lock(trail_mutex_);
        if (trail_path_.empty()) {
            return;
        }
        std::ofstream file(trail_path_, std::ios::app);
        if (file) {
            file << line;
        }
    }

private:
    mutable std::mutex mutex_;
    std::mutex trail_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> backend_;
    std::filesystem::path trail_path_;
};

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Lifecycle and plain logging
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

// =============================================================================
// Transition Trail
// =============================================================================

void logger_adapter::log_transition(const std::string& user_id,
                                    int64_t game_id,
                                    const std::string& from,
                                    const std::string& to,
                                    const std::string& reason,
                                    int64_t audit_pk) {
    info("Library transition: user={} game={} {} -> {} ({})",
         user_id, game_id, from, to, reason);

    pimpl_->append_trail(trail_line{}
                             .text("outcome", "applied")
                             .text("user_id", user_id)
                             .number("game_id", game_id)
                             .text("from", from)
                             .text("to", to)
                             .text("reason", reason)
                             .number("ledger_pk", audit_pk)
                             .finish());
}

void logger_adapter::log_transition_rejected(const std::string& user_id,
                                             int64_t game_id,
                                             const std::string& requested,
                                             int error_code,
                                             const std::string& message) {
    warn("Library transition rejected: user={} game={} requested={} code={} {}",
         user_id, game_id, requested, error_code, message);

    pimpl_->append_trail(trail_line{}
                             .text("outcome", "rejected")
                             .text("user_id", user_id)
                             .number("game_id", game_id)
                             .text("requested", requested)
                             .number("error_code", error_code)
                             .text("message", message)
                             .finish());
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) {
    pimpl_->set_min_level(level);
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return pimpl_->get_min_level();
}

auto logger_adapter::get_config() -> logger_config { return pimpl_->config(); }

auto logger_adapter::log_level_to_string(log_level level) -> std::string {
    for (const auto& [label, value] : kLevelNames) {
        if (value == level) {
            std::string upper(label);
            for (auto& c : upper) {
                c = static_cast<char>(c - 'a' + 'A');
            }
            return upper;
        }
    }
    return "OFF";
}

}  // namespace gamevault::integration
