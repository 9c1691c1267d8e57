/**
 * @file ilogger.hpp
 * @brief Logger seam for library services
 *
 * transition_enforcer writes its diagnostics through an injected ILogger.
 * Implementations provide a single sink, write(), and a level filter; the
 * level helpers format only when the level is enabled.
 */

#pragma once

#include <gamevault/integration/logger_adapter.hpp>
#include <gamevault/compat/format.hpp>

#include <memory>
#include <string_view>

namespace gamevault::di {

/**
 * @brief Destination for service diagnostics
 *
 * write() and is_enabled() may be called from several enforcers on different
 * threads at once.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void write(integration::log_level level, std::string_view message) = 0;

    [[nodiscard]] virtual bool is_enabled(integration::log_level level) const noexcept = 0;

    void debug(std::string_view message) { emit(integration::log_level::debug, message); }
    void info(std::string_view message) { emit(integration::log_level::info, message); }
    void warn(std::string_view message) { emit(integration::log_level::warn, message); }
    void error(std::string_view message) { emit(integration::log_level::error, message); }

    template <typename... Args>
    void debug_fmt(gamevault::compat::format_string<Args...> fmt, Args&&... args) {
        emit_fmt(integration::log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info_fmt(gamevault::compat::format_string<Args...> fmt, Args&&... args) {
        emit_fmt(integration::log_level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn_fmt(gamevault::compat::format_string<Args...> fmt, Args&&... args) {
        emit_fmt(integration::log_level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error_fmt(gamevault::compat::format_string<Args...> fmt, Args&&... args) {
        emit_fmt(integration::log_level::error, fmt, std::forward<Args>(args)...);
    }

protected:
    ILogger() = default;
    ILogger(const ILogger&) = default;
    ILogger& operator=(const ILogger&) = default;
    ILogger(ILogger&&) = default;
    ILogger& operator=(ILogger&&) = default;

private:
    void emit(integration::log_level level, std::string_view message) {
        if (is_enabled(level)) {
            write(level, message);
        }
    }

    template <typename... Args>
    void emit_fmt(integration::log_level level,
                  gamevault::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(level)) {
            write(level, gamevault::compat::format(fmt, std::forward<Args>(args)...));
        }
    }
};

/// Discards everything; the enforcer's default
class NullLogger final : public ILogger {
public:
    void write(integration::log_level /*level*/, std::string_view /*message*/) override {}

    [[nodiscard]] bool is_enabled(integration::log_level /*level*/) const noexcept override {
        return false;
    }
};

/// Forwards to the process-wide logger_adapter (used by library_cli)
class LoggerService final : public ILogger {
public:
    void write(integration::log_level level, std::string_view message) override {
        integration::logger_adapter::log(level, std::string{message});
    }

    [[nodiscard]] bool is_enabled(integration::log_level level) const noexcept override {
        return integration::logger_adapter::is_level_enabled(level);
    }
};

[[nodiscard]] inline std::shared_ptr<ILogger> null_logger() {
    static auto instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace gamevault::di
