/**
 * @file time_test.cpp
 * @brief UTC conversion helpers shared by the CLI and the logger
 */

#include <catch2/catch_test_macros.hpp>

#include <gamevault/compat/time.hpp>

#include <ctime>

using namespace gamevault::compat;

TEST_CASE("gmtime_safe converts to UTC fields", "[compat][time]") {
    std::time_t epoch = 0;
    std::tm tm{};
    REQUIRE(gmtime_safe(&epoch, &tm) == &tm);
    CHECK(tm.tm_year == 70);
    CHECK(tm.tm_mon == 0);
    CHECK(tm.tm_mday == 1);
    CHECK(tm.tm_hour == 0);

    // 2024-02-29 12:34:56 UTC
    std::time_t leap_day = 1709210096;
    REQUIRE(gmtime_safe(&leap_day, &tm) != nullptr);
    CHECK(tm.tm_year + 1900 == 2024);
    CHECK(tm.tm_mon + 1 == 2);
    CHECK(tm.tm_mday == 29);
    CHECK(tm.tm_hour == 12);
    CHECK(tm.tm_min == 34);
    CHECK(tm.tm_sec == 56);
}

TEST_CASE("timegm_safe inverts gmtime_safe", "[compat][time]") {
    std::time_t original = 1709210096;
    std::tm tm{};
    REQUIRE(gmtime_safe(&original, &tm) != nullptr);
    CHECK(timegm_safe(&tm) == original);
}
