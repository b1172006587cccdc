#pragma once

#include "core/time_util.h"
#include "usage/usage_record.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace codenv {

struct UsageTotals {
    int64_t today = 0;
    int64_t total = 0;
    int64_t today_input = 0;
    int64_t total_input = 0;
    int64_t today_output = 0;
    int64_t total_output = 0;
    int64_t today_cache_read = 0;
    int64_t total_cache_read = 0;
    int64_t today_cache_write = 0;
    int64_t total_cache_write = 0;
};

// Keyed by "<tool>||<profile key>" and "<tool>||<profile name>".
struct UsageTotalsIndex {
    std::unordered_map<std::string, UsageTotals> by_key;
    std::unordered_map<std::string, UsageTotals> by_name;

    bool empty() const { return by_key.empty() && by_name.empty(); }
};

// "<normalized tool>||<id>", or empty when either part is missing.
std::string usage_lookup_key(const std::string& type, const std::string& profile_id);

// "Today" is the local calendar day containing `now`.
UsageTotalsIndex build_totals_index(const std::vector<UsageRecord>& records,
                                    TimePoint now = std::chrono::system_clock::now());

// Key match wins over name match.
std::optional<UsageTotals> lookup_totals(const UsageTotalsIndex& index,
                                         const std::string& type,
                                         const std::string& profile_key,
                                         const std::string& profile_name);

// Record timestamp inside `window`; unparsable timestamps never count as today.
bool record_in_window(const UsageRecord& record, const DayWindow& window);

}
