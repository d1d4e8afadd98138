#include "streak.hpp"

#include <algorithm>
#include <functional>
#include "time_utils.hpp"

namespace gitpet {

std::vector<long long> distinct_days_desc(const std::vector<std::time_t>& stamps) {
    std::vector<long long> days;
    days.reserve(stamps.size());
    for (std::time_t t : stamps)
        days.push_back(local_day(t));
    std::sort(days.begin(), days.end(), std::greater<long long>());
    days.erase(std::unique(days.begin(), days.end()), days.end());
    return days;
}

int compute_streak(const std::vector<long long>& days, long long today) {
    auto it = std::find_if(days.begin(), days.end(), [today](long long d) { return d <= today; });
    if (it == days.end())
        return 0;
    long long anchor = today;
    if (*it == today - 1)
        anchor = today - 1;
    int streak = 0;
    for (; it != days.end(); ++it) {
        if (*it != anchor - streak)
            break;
        ++streak;
    }
    return streak;
}

long long count_in_window(const std::vector<std::time_t>& stamps, long long today,
                          int window_days) {
    if (window_days <= 0)
        return 0;
    long long first = today - (window_days - 1);
    return std::count_if(stamps.begin(), stamps.end(), [&](std::time_t t) {
        long long d = local_day(t);
        return d >= first && d <= today;
    });
}

} // namespace gitpet
