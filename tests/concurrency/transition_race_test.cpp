/**
 * @file transition_race_test.cpp
 * @brief Concurrent transition requests against one library file
 *
 * Every worker owns its own connection, as a request handler would. The
 * tests check that racing requests serialize: one winner per move, no pair
 * ever stored in two categories, and a ledger that replays to the final
 * state.
 */

#include <catch2/catch_test_macros.hpp>

#include <gamevault/core/result.hpp>
#include <gamevault/library/library_query_service.hpp>
#include <gamevault/library/transition_enforcer.hpp>
#include <gamevault/storage/audit_ledger.hpp>
#include <gamevault/storage/library_database.hpp>
#include <gamevault/storage/sqlite_game_catalog.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <latch>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace gamevault;
using namespace gamevault::library;
using storage::library_category;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

constexpr int64_t game_count = 6;

class temp_library {
public:
    explicit temp_library(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / name) {
        cleanup();
        auto db = open();
        storage::sqlite_game_catalog catalog(db->native_handle());
        for (int64_t id = 1; id <= game_count; ++id) {
            REQUIRE(catalog.register_game(id, "Game " + std::to_string(id)).is_ok());
        }
    }

    ~temp_library() { cleanup(); }

    temp_library(const temp_library&) = delete;
    temp_library& operator=(const temp_library&) = delete;

    [[nodiscard]] auto open() const -> std::unique_ptr<storage::library_database> {
        storage::library_database_config config;
        config.busy_timeout = 1000ms;
        auto result = storage::library_database::open(path_.string(), config);
        REQUIRE(result.is_ok());
        return std::move(result.value());
    }

private:
    void cleanup() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        std::filesystem::remove(path_.string() + "-wal", ec);
        std::filesystem::remove(path_.string() + "-shm", ec);
    }

    std::filesystem::path path_;
};

/// One connection with its own enforcer
struct worker_session {
    explicit worker_session(const temp_library& library)
        : db(library.open()),
          catalog(db->native_handle()),
          enforcer(*db, catalog, contention_policy()) {}

    static auto contention_policy() -> transition_policy {
        transition_policy policy;
        policy.max_attempts = 50;
        policy.initial_backoff = 1ms;
        policy.max_backoff = 20ms;
        return policy;
    }

    std::unique_ptr<storage::library_database> db;
    storage::sqlite_game_catalog catalog;
    transition_enforcer enforcer;
};

}  // namespace

// =============================================================================
// Racing Requests
// =============================================================================

TEST_CASE("identical racing requests apply once", "[concurrency][transition]") {
    temp_library library("gamevault_race_identical.db");
    {
        worker_session setup(library);
        REQUIRE(setup.enforcer.request_transition("u", 1, library_category::collection)
                    .is_ok());
    }

    constexpr int thread_count = 4;
    std::vector<std::unique_ptr<worker_session>> sessions;
    for (int i = 0; i < thread_count; ++i) {
        sessions.push_back(std::make_unique<worker_session>(library));
    }

    std::latch start(thread_count);
    std::atomic<int> applied{0};
    std::atomic<int> unchanged{0};
    std::atomic<int> failed{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < thread_count; ++i) {
        threads.emplace_back([&, i] {
            start.arrive_and_wait();
            auto result = sessions[static_cast<size_t>(i)]->enforcer.request_transition(
                "u", 1, library_category::started);
            if (result.is_err()) {
                ++failed;
            } else if (result.value().status == transition_status::applied) {
                ++applied;
            } else {
                ++unchanged;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(failed == 0);
    CHECK(applied == 1);
    CHECK(unchanged == thread_count - 1);

    storage::audit_ledger ledger(sessions[0]->db->native_handle());
    auto rows = ledger.count_for("u", 1);
    REQUIRE(rows.is_ok());
    CHECK(rows.value() == 2);
}

TEST_CASE("racing regression and progression serialize", "[concurrency][transition]") {
    temp_library library("gamevault_race_regression.db");
    {
        worker_session setup(library);
        REQUIRE(setup.enforcer.request_transition("u", 2, library_category::collection)
                    .is_ok());
    }

    worker_session forward(library);
    worker_session backward(library);

    std::latch start(2);
    Result<transition_result> started_result = transition_result{};
    Result<transition_result> wishlist_result = transition_result{};

    std::thread t1([&] {
        start.arrive_and_wait();
        started_result =
            forward.enforcer.request_transition("u", 2, library_category::started);
    });
    std::thread t2([&] {
        start.arrive_and_wait();
        wishlist_result =
            backward.enforcer.request_transition("u", 2, library_category::wishlist);
    });
    t1.join();
    t2.join();

    // started always lands; wishlist either landed first or was refused
    REQUIRE(started_result.is_ok());
    CHECK(started_result.value().status == transition_status::applied);
    if (wishlist_result.is_err()) {
        CHECK(wishlist_result.error().code == error_codes::already_advanced);
        CHECK(started_result.value().previous == library_category::collection);
    } else {
        CHECK(started_result.value().previous == library_category::wishlist);
    }

    library_query_service queries(*forward.db);
    auto state = queries.get_state("u", 2);
    REQUIRE(state.is_ok());
    CHECK(state.value().category == library_category::started);

    auto history = queries.history("u", 2);
    REQUIRE(history.is_ok());
    CHECK(replay(history.value()) == library_category::started);
}

TEST_CASE("random concurrent traffic keeps the library consistent",
          "[concurrency][transition][stress]") {
    temp_library library("gamevault_race_stress.db");

    constexpr int thread_count = 4;
    constexpr int requests_per_thread = 60;
    const std::vector<std::string> users = {"ana", "ben"};

    std::vector<std::unique_ptr<worker_session>> sessions;
    for (int i = 0; i < thread_count; ++i) {
        sessions.push_back(std::make_unique<worker_session>(library));
    }

    std::latch start(thread_count);
    std::atomic<int> unexpected_errors{0};
    std::atomic<size_t> applied{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < thread_count; ++i) {
        threads.emplace_back([&, i] {
            std::mt19937 rng(static_cast<unsigned>(1000 + i));
            std::uniform_int_distribution<size_t> user_pick(0, users.size() - 1);
            std::uniform_int_distribution<int64_t> game_pick(1, game_count);
            std::uniform_int_distribution<int> op_pick(0, 4);
            auto& enforcer = sessions[static_cast<size_t>(i)]->enforcer;

            start.arrive_and_wait();
            for (int n = 0; n < requests_per_thread; ++n) {
                const auto& user = users[user_pick(rng)];
                const auto game = game_pick(rng);
                const auto op = op_pick(rng);

                auto result =
                    op == 4 ? enforcer.remove(user, game)
                            : enforcer.request_transition(
                                  user, game,
                                  storage::all_categories[static_cast<size_t>(op)]);

                if (result.is_ok()) {
                    if (result.value().status == transition_status::applied) {
                        ++applied;
                    }
                } else if (result.error().code != error_codes::already_advanced) {
                    ++unexpected_errors;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(unexpected_errors == 0);

    auto& db = *sessions[0]->db;
    storage::audit_ledger ledger(db.native_handle());
    auto total = ledger.count();
    REQUIRE(total.is_ok());
    CHECK(total.value() == applied.load());

    library_query_service queries(db);
    for (const auto& user : users) {
        for (int64_t game = 1; game <= game_count; ++game) {
            // get_state fails with an integrity error if the pair has two rows
            auto state = queries.get_state(user, game);
            REQUIRE(state.is_ok());

            auto history = queries.history(user, game);
            REQUIRE(history.is_ok());
            CHECK(replay(history.value()) == state.value().category);

            for (size_t i = 1; i < history.value().size(); ++i) {
                CHECK(history.value()[i].from_category ==
                      history.value()[i - 1].to_category);
            }
        }
    }
}
