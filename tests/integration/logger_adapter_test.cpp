/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter
 */

#include <gamevault/integration/logger_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace gamevault::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

/**
 * @brief Create a temporary directory for test logs
 */
auto create_temp_log_directory() -> std::filesystem::path {
    auto temp_dir = std::filesystem::temp_directory_path() / "gamevault_logger_test";
    std::filesystem::create_directories(temp_dir);
    return temp_dir;
}

void cleanup_temp_directory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

auto read_file_contents(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path);
    if (!file) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config)
        : log_dir_(config.log_directory) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() {
        logger_adapter::shutdown();
        cleanup_temp_directory(log_dir_);
    }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;

private:
    std::filesystem::path log_dir_;
};

auto quiet_config(const std::filesystem::path& dir) -> logger_config {
    logger_config config;
    config.log_directory = dir;
    config.enable_console = false;
    config.async_mode = false;
    return config;
}

}  // namespace

// =============================================================================
// Initialization Tests
// =============================================================================

TEST_CASE("logger_adapter initialization and shutdown", "[logger_adapter][init]") {
    auto temp_dir = create_temp_log_directory();

    SECTION("Basic initialization") {
        auto config = quiet_config(temp_dir);
        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Multiple initialization calls are safe") {
        auto config = quiet_config(temp_dir);
        logger_adapter::initialize(config);
        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
    }

    SECTION("Shutdown without initialization is safe") {
        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Logging before initialization is dropped") {
        logger_adapter::info("dropped {}", 1);
        logger_adapter::log_transition("u", 1, "none", "wishlist", "added", 1);
        REQUIRE_FALSE(std::filesystem::exists(temp_dir / "transitions.json"));
    }

    cleanup_temp_directory(temp_dir);
}

// =============================================================================
// Standard Logging Tests
// =============================================================================

TEST_CASE("logger_adapter standard logging", "[logger_adapter][logging]") {
    auto temp_dir = create_temp_log_directory();
    auto config = quiet_config(temp_dir);
    config.enable_audit_log = false;
    config.min_level = log_level::trace;

    logger_test_fixture fixture(config);

    SECTION("Log at different levels") {
        logger_adapter::trace("Trace message: {}", 1);
        logger_adapter::debug("Debug message: {}", 2);
        logger_adapter::info("Info message: {}", 3);
        logger_adapter::warn("Warn message: {}", 4);
        logger_adapter::error("Error message: {}", 5);
        logger_adapter::flush();

        REQUIRE(std::filesystem::exists(temp_dir / "gamevault.log"));
    }

    SECTION("Log level filtering") {
        logger_adapter::set_min_level(log_level::warn);
        REQUIRE(logger_adapter::get_min_level() == log_level::warn);

        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::trace));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::debug));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::info));
        REQUIRE(logger_adapter::is_level_enabled(log_level::warn));
        REQUIRE(logger_adapter::is_level_enabled(log_level::error));
        REQUIRE(logger_adapter::is_level_enabled(log_level::fatal));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::off));
    }

    SECTION("Off disables every level") {
        logger_adapter::set_min_level(log_level::off);
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::fatal));
    }
}

// =============================================================================
// Transition Trail Tests
// =============================================================================

TEST_CASE("logger_adapter transition trail", "[logger_adapter][audit]") {
    auto temp_dir = create_temp_log_directory();
    auto config = quiet_config(temp_dir);
    config.enable_file = false;

    logger_test_fixture fixture(config);
    auto trail_path = temp_dir / "transitions.json";

    SECTION("Applied transition") {
        logger_adapter::log_transition("alice", 42, "wishlist", "collection", "moved",
                                       17);
        logger_adapter::flush();

        auto content = read_file_contents(trail_path);
        REQUIRE(content.find("\"outcome\":\"applied\"") != std::string::npos);
        REQUIRE(content.find("\"user_id\":\"alice\"") != std::string::npos);
        REQUIRE(content.find("\"game_id\":42") != std::string::npos);
        REQUIRE(content.find("\"to\":\"collection\"") != std::string::npos);
        REQUIRE(content.find("\"reason\":\"moved\"") != std::string::npos);
        REQUIRE(content.find("\"ledger_pk\":17") != std::string::npos);
        REQUIRE(content.rfind("{\"ts\":\"", 0) == 0);
    }

    SECTION("Rejected transition") {
        logger_adapter::log_transition_rejected("bob", 7, "wishlist", -1000,
                                                "Game 7 is already started");
        logger_adapter::flush();

        auto content = read_file_contents(trail_path);
        REQUIRE(content.find("\"outcome\":\"rejected\"") != std::string::npos);
        REQUIRE(content.find("\"user_id\":\"bob\"") != std::string::npos);
        REQUIRE(content.find("\"error_code\":-1000") != std::string::npos);
        REQUIRE(content.find("\"requested\":\"wishlist\"") != std::string::npos);
    }

    SECTION("Quotes and control characters are escaped") {
        logger_adapter::log_transition_rejected("eve \"q\"", 3, "started", -1003,
                                                "line one\nline two");
        logger_adapter::flush();

        auto content = read_file_contents(trail_path);
        REQUIRE(content.find("\"user_id\":\"eve \\\"q\\\"\"") != std::string::npos);
        REQUIRE(content.find("line one\\nline two") != std::string::npos);
        REQUIRE(std::count(content.begin(), content.end(), '\n') == 1);
    }

    SECTION("One JSON line per event") {
        logger_adapter::log_transition("c", 1, "none", "wishlist", "added", 1);
        logger_adapter::log_transition("c", 1, "wishlist", "started", "started", 2);
        logger_adapter::flush();

        std::ifstream file(trail_path);
        std::string line;
        int lines = 0;
        while (std::getline(file, line)) {
            if (line.empty()) {
                continue;
            }
            REQUIRE(line.front() == '{');
            REQUIRE(line.back() == '}');
            ++lines;
        }
        REQUIRE(lines == 2);
    }
}

TEST_CASE("logger_adapter trail can be disabled", "[logger_adapter][audit]") {
    auto temp_dir = create_temp_log_directory();
    auto config = quiet_config(temp_dir);
    config.enable_file = false;
    config.enable_audit_log = false;

    logger_test_fixture fixture(config);

    logger_adapter::log_transition("alice", 1, "none", "wishlist", "added", 1);
    logger_adapter::flush();

    REQUIRE_FALSE(std::filesystem::exists(temp_dir / "transitions.json"));
}

// =============================================================================
// Configuration Tests
// =============================================================================

TEST_CASE("logger_adapter configuration", "[logger_adapter][config]") {
    auto temp_dir = create_temp_log_directory();

    SECTION("Get configuration after initialization") {
        auto config = quiet_config(temp_dir);
        config.min_level = log_level::debug;
        config.max_file_size_mb = 50;
        config.max_files = 5;

        logger_test_fixture fixture(config);

        auto retrieved = logger_adapter::get_config();
        REQUIRE(retrieved.min_level == log_level::debug);
        REQUIRE(retrieved.max_file_size_mb == 50);
        REQUIRE(retrieved.max_files == 5);
        REQUIRE_FALSE(retrieved.enable_console);
    }

    SECTION("set_min_level is reflected in the configuration") {
        logger_test_fixture fixture(quiet_config(temp_dir));
        logger_adapter::set_min_level(log_level::error);
        REQUIRE(logger_adapter::get_config().min_level == log_level::error);
    }

    SECTION("Configuration reads race with re-initialization") {
        auto config = quiet_config(temp_dir);
        config.enable_file = false;
        config.enable_audit_log = false;
        config.max_files = 3;

        std::atomic<bool> done{false};
        std::atomic<int> reads{0};
        std::thread reader([&] {
            do {
                auto current = logger_adapter::get_config();
                if (!current.log_directory.empty()) {
                    ++reads;
                }
            } while (!done.load());
        });

        for (int i = 0; i < 50; ++i) {
            logger_adapter::initialize(config);
            logger_adapter::shutdown();
        }
        done.store(true);
        reader.join();

        REQUIRE(reads > 0);
        REQUIRE(logger_adapter::get_config().max_files == 3);
        cleanup_temp_directory(temp_dir);
    }

    SECTION("Level names") {
        REQUIRE(logger_adapter::log_level_to_string(log_level::warn) == "WARN");
        REQUIRE(logger_adapter::log_level_to_string(log_level::off) == "OFF");

        REQUIRE(parse_log_level("trace") == log_level::trace);
        REQUIRE(parse_log_level("error") == log_level::error);
        REQUIRE(parse_log_level("off") == log_level::off);
        REQUIRE_FALSE(parse_log_level("loud").has_value());
    }
}

// =============================================================================
// Thread Safety Tests
// =============================================================================

TEST_CASE("logger_adapter concurrent transition logging", "[logger_adapter][threading]") {
    auto temp_dir = create_temp_log_directory();
    auto config = quiet_config(temp_dir);
    config.enable_file = false;

    logger_test_fixture fixture(config);

    constexpr int thread_count = 4;
    constexpr int per_thread = 25;

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < per_thread; ++i) {
                logger_adapter::log_transition("user" + std::to_string(t), i + 1, "none",
                                               "collection", "added", t * 100 + i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    logger_adapter::flush();

    std::ifstream file(temp_dir / "transitions.json");
    std::string line;
    int lines = 0;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            ++lines;
        }
    }
    REQUIRE(lines == thread_count * per_thread);
}
