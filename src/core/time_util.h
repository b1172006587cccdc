#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace codenv {

using TimePoint = std::chrono::system_clock::time_point;

// Accepts "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]". Naive times are UTC.
std::optional<TimePoint> parse_iso8601(const std::string& ts);

// "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string format_iso8601(TimePoint tp);

struct DayWindow {
    TimePoint start;
    TimePoint end;

    bool contains(TimePoint tp) const { return tp >= start && tp < end; }
};

// Local calendar day [midnight, next midnight) containing `now`.
DayWindow local_day_window(TimePoint now);

int64_t to_epoch_ms(TimePoint tp);

}
