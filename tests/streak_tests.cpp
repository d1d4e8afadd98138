#include "streak.hpp"
#include "test_common.hpp"

using namespace gitpet;

TEST_CASE("Streak counts consecutive days ending today") {
    long long t = 20000;
    REQUIRE(compute_streak({t, t - 1, t - 2}, t) == 3);
    REQUIRE(compute_streak({t, t - 1, t - 3}, t) == 2);
    REQUIRE(compute_streak({t}, t) == 1);
}

TEST_CASE("Streak may still be alive from yesterday") {
    long long t = 20000;
    REQUIRE(compute_streak({t - 1, t - 2}, t) == 2);
    REQUIRE(compute_streak({t - 2, t - 3}, t) == 0);
}

TEST_CASE("Streak of empty history is zero") { REQUIRE(compute_streak({}, 20000) == 0); }

TEST_CASE("Streak ignores days in the future") {
    long long t = 20000;
    REQUIRE(compute_streak({t + 2, t, t - 1}, t) == 2);
    REQUIRE(compute_streak({t + 1}, t) == 0);
}

TEST_CASE("Distinct days collapse commits on the same day") {
    std::time_t today = test_support::local_noon(0);
    std::vector<std::time_t> stamps = {today, today + 60, test_support::local_noon(1),
                                       test_support::local_noon(1) - 3600};
    auto days = distinct_days_desc(stamps);
    REQUIRE(days.size() == 2);
    REQUIRE(days[0] == local_day(today));
    REQUIRE(days[1] == local_day(today) - 1);
}

TEST_CASE("Weekly window covers seven local days") {
    std::time_t now = std::time(nullptr);
    long long today = local_day(now);
    std::vector<std::time_t> stamps;
    for (int i = 0; i <= 8; ++i)
        stamps.push_back(test_support::local_noon(i, now));
    REQUIRE(count_in_window(stamps, today, 7) == 7);
    REQUIRE(count_in_window(stamps, today, 1) == 1);
    REQUIRE(count_in_window(stamps, today, 0) == 0);
}
