#include "core/time_util.h"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace codenv {

namespace {

std::time_t utc_from_tm(std::tm* tm) {
#if defined(__APPLE__) || defined(__linux__)
    return timegm(tm);
#else
    return _mkgmtime(tm);
#endif
}

}

std::optional<TimePoint> parse_iso8601(const std::string& ts) {
    if (ts.size() < 19) {
        return std::nullopt;
    }
    std::tm tm{};
    std::istringstream ss(ts.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    std::time_t t = utc_from_tm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    TimePoint out = std::chrono::system_clock::from_time_t(t);

    size_t pos = 19;
    if (pos < ts.size() && ts[pos] == '.') {
        size_t end = pos + 1;
        while (end < ts.size() && std::isdigit(static_cast<unsigned char>(ts[end]))) {
            end++;
        }
        std::string frac = ts.substr(pos + 1, end - pos - 1);
        if (!frac.empty()) {
            while (frac.size() < 3) {
                frac.push_back('0');
            }
            out += std::chrono::milliseconds(std::stoi(frac.substr(0, 3)));
        }
        pos = end;
    }

    if (pos < ts.size() && (ts[pos] == '+' || ts[pos] == '-')) {
        int sign = ts[pos] == '+' ? 1 : -1;
        std::string digits;
        for (size_t i = pos + 1; i < ts.size(); ++i) {
            if (std::isdigit(static_cast<unsigned char>(ts[i]))) {
                digits.push_back(ts[i]);
            }
        }
        if (digits.size() >= 2) {
            int hours = std::stoi(digits.substr(0, 2));
            int minutes = digits.size() >= 4 ? std::stoi(digits.substr(2, 2)) : 0;
            out -= sign * (std::chrono::hours(hours) + std::chrono::minutes(minutes));
        }
    }
    return out;
}

std::string format_iso8601(TimePoint tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &secs);
#else
    gmtime_r(&secs, &tm);
#endif
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

DayWindow local_day_window(TimePoint now) {
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    std::tm next = tm;
    next.tm_mday += 1;

    DayWindow window;
    window.start = std::chrono::system_clock::from_time_t(std::mktime(&tm));
    window.end = std::chrono::system_clock::from_time_t(std::mktime(&next));
    return window;
}

int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

}
