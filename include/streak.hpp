#ifndef STREAK_HPP
#define STREAK_HPP

#include <ctime>
#include <vector>

namespace gitpet {

/**
 * @brief Map commit instants to distinct local days, most recent first.
 *
 * Days are expressed as days_from_civil() values (see local_day()).
 */
std::vector<long long> distinct_days_desc(const std::vector<std::time_t>& stamps);

/**
 * @brief Count consecutive commit days ending today or yesterday.
 *
 * @p days must be distinct and sorted descending. Days after @p today are
 * ignored. When the newest day is yesterday the count is anchored there, so a
 * run that has not been extended yet today is not reported as broken.
 *
 * @param days  Distinct commit days, newest first.
 * @param today Local day of "now".
 * @return Streak length, 0 when the newest day is older than yesterday.
 */
int compute_streak(const std::vector<long long>& days, long long today);

/**
 * @brief Number of @p stamps whose local day lies in the @p window_days
 * calendar days ending with @p today (inclusive).
 */
long long count_in_window(const std::vector<std::time_t>& stamps, long long today,
                          int window_days);

} // namespace gitpet

#endif // STREAK_HPP
