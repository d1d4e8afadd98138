#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <ctime>
#include <optional>
#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian calendar date.
 *
 * Works for any date, including those before the epoch (negative result).
 */
long long days_from_civil(int year, unsigned month, unsigned day);

/**
 * @brief Local calendar day of @p t, expressed with days_from_civil().
 *
 * Two instants map to the same value exactly when they fall between the same
 * pair of local midnights.
 */
long long local_day(std::time_t t);

/**
 * @brief Format an instant as UTC ISO-8601 (`2026-10-17T08:30:00Z`).
 */
std::string format_iso8601(std::time_t t);

/**
 * @brief Parse an ISO-8601 timestamp.
 *
 * Accepts `YYYY-MM-DDTHH:MM:SS` with an optional fractional part followed by
 * `Z` or a `+HH:MM`/`-HH:MM` offset. A missing zone designator is read as UTC.
 *
 * @return Seconds since the epoch or `std::nullopt` when the text is malformed.
 */
std::optional<std::time_t> parse_iso8601(const std::string& text);

#endif // TIME_UTILS_HPP
