#include "time_utils.hpp"

#include <algorithm>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace glucotrace {

namespace {

namespace pt = boost::posix_time;

const pt::ptime &
unix_epoch() {
    static const pt::ptime epoch(boost::gregorian::date(1970, 1, 1));
    return epoch;
}

pt::ptime
to_ptime(TimestampMs t) {
    if (!is_calendar_timestamp(t)) {
        std::ostringstream msg;
        msg << "Timestamp " << t << " ms is outside the supported calendar range.";
        throw std::out_of_range(msg.str());
    }
    return unix_epoch() + pt::milliseconds(static_cast<std::int64_t>(std::floor(t)));
}

TimestampMs
from_ptime(const pt::ptime &p) {
    return static_cast<TimestampMs>((p - unix_epoch()).total_milliseconds());
}

} // namespace

bool
is_valid_timestamp(TimestampMs t) {
    return std::isfinite(t) && t > 0.0;
}

bool
is_calendar_timestamp(TimestampMs t) {
    return t >= EARLIEST_CALENDAR_MS && t < END_OF_CALENDAR_MS;
}

std::optional<double>
parse_daily_time(const std::string &hh_mm) {
    if (hh_mm.empty() || hh_mm.find(':') == std::string::npos || hh_mm.front() == '-') { return std::nullopt; }

    pt::time_duration offset;
    try {
        offset = pt::duration_from_string(hh_mm);
    } catch (const std::exception &) {
        // Malformed field (non-numeric hours or minutes).
        return std::nullopt;
    }

    if (offset.is_special() || offset.is_negative() || offset >= pt::hours(24)) { return std::nullopt; }
    return static_cast<double>(offset.total_milliseconds());
}

TimestampMs
start_of_utc_day(TimestampMs t) {
    return from_ptime(pt::ptime(to_ptime(t).date()));
}

std::optional<TimestampMs>
last_daily_dose_time(const std::vector<double> &daily_offsets_ms, TimestampMs now) {
    if (daily_offsets_ms.empty()) { return std::nullopt; }

    const pt::ptime now_p = to_ptime(now);
    const pt::ptime midnight(now_p.date());

    TimestampMs latest = -std::numeric_limits<double>::infinity();
    for (double offset_ms : daily_offsets_ms) {
        pt::ptime dose = midnight + pt::milliseconds(static_cast<std::int64_t>(offset_ms));
        if (dose > now_p) { dose -= boost::gregorian::days(1); }
        latest = std::max(latest, from_ptime(dose));
    }
    return latest;
}

} // namespace glucotrace
