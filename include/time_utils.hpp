#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <optional>
#include <string>
#include <vector>

namespace glucotrace {

/**
 * @brief Milliseconds since the Unix epoch (UTC).
 *
 * Kept as a double so that records coming from collaborators with missing or
 * garbage times (NaN, 0, negative) can be represented and filtered instead of
 * failing at conversion time.
 */
using TimestampMs = double;

constexpr double MS_PER_MINUTE = 60.0 * 1000.0;
constexpr double MS_PER_HOUR = 60.0 * MS_PER_MINUTE;
constexpr double MS_PER_DAY = 24.0 * MS_PER_HOUR;

// Calendar range of Boost.DateTime: 1400-01-01T00:00Z up to, but excluding, 10000-01-01T00:00Z.
constexpr TimestampMs EARLIEST_CALENDAR_MS = -17987443200000.0;
constexpr TimestampMs END_OF_CALENDAR_MS = 253402300800000.0;

/// A timestamp is usable when it is finite and strictly positive.
bool
is_valid_timestamp(TimestampMs t);

/// True when @p t can be placed on the calendar (day arithmetic is defined).
bool
is_calendar_timestamp(TimestampMs t);

inline double
hours_between(TimestampMs from, TimestampMs to) {
    return (to - from) / MS_PER_HOUR;
}

inline double
minutes_between(TimestampMs from, TimestampMs to) {
    return (to - from) / MS_PER_MINUTE;
}

/**
 * @brief Parses a daily dose time of the form "HH:MM" (or "HH:MM:SS").
 *
 * @return Offset from midnight in milliseconds, or std::nullopt when the string
 *         is not a time of day in [00:00, 24:00).
 */
std::optional<double>
parse_daily_time(const std::string &hh_mm);

/**
 * @brief Finds the most recent scheduled daily dose at or before @p now.
 *
 * Each entry of @p daily_offsets_ms is placed on the UTC calendar day of
 * @p now; entries that would fall after @p now are moved to the previous day.
 *
 * @return std::nullopt when there are no entries.
 * @throws std::out_of_range if @p now is outside the calendar range.
 */
std::optional<TimestampMs>
last_daily_dose_time(const std::vector<double> &daily_offsets_ms, TimestampMs now);

/// Returns the UTC midnight at or before @p t. Throws std::out_of_range off the calendar.
TimestampMs
start_of_utc_day(TimestampMs t);

} // namespace glucotrace

#endif // TIME_UTILS_HPP
