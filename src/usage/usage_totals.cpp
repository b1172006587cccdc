#include "usage/usage_totals.h"
#include "core/json_util.h"
#include "core/tool_type.h"

namespace codenv {

namespace {

void add_totals(std::unordered_map<std::string, UsageTotals>& map,
                const std::string& key,
                const TokenCounters& tokens,
                bool today) {
    if (key.empty()) return;
    auto& totals = map[key];
    totals.total = add_tokens(totals.total, tokens.total_tokens);
    totals.total_input = add_tokens(totals.total_input, tokens.input_tokens);
    totals.total_output = add_tokens(totals.total_output, tokens.output_tokens);
    totals.total_cache_read = add_tokens(totals.total_cache_read, tokens.cache_read_tokens);
    totals.total_cache_write = add_tokens(totals.total_cache_write, tokens.cache_write_tokens);
    if (today) {
        totals.today = add_tokens(totals.today, tokens.total_tokens);
        totals.today_input = add_tokens(totals.today_input, tokens.input_tokens);
        totals.today_output = add_tokens(totals.today_output, tokens.output_tokens);
        totals.today_cache_read = add_tokens(totals.today_cache_read, tokens.cache_read_tokens);
        totals.today_cache_write = add_tokens(totals.today_cache_write, tokens.cache_write_tokens);
    }
}

}

std::string usage_lookup_key(const std::string& type, const std::string& profile_id) {
    if (profile_id.empty()) {
        return std::string();
    }
    std::string resolved = normalize_tool_name(type);
    if (resolved.empty()) {
        return std::string();
    }
    return resolved + "||" + profile_id;
}

bool record_in_window(const UsageRecord& record, const DayWindow& window) {
    auto tp = parse_iso8601(record.ts);
    return tp && window.contains(*tp);
}

UsageTotalsIndex build_totals_index(const std::vector<UsageRecord>& records, TimePoint now) {
    UsageTotalsIndex index;
    DayWindow window = local_day_window(now);

    for (const auto& record : records) {
        bool today = record_in_window(record, window);
        add_totals(index.by_key, usage_lookup_key(record.type, record.profile_key), record.tokens, today);
        add_totals(index.by_name, usage_lookup_key(record.type, record.profile_name), record.tokens, today);
    }
    return index;
}

std::optional<UsageTotals> lookup_totals(const UsageTotalsIndex& index,
                                         const std::string& type,
                                         const std::string& profile_key,
                                         const std::string& profile_name) {
    std::string key_lookup = usage_lookup_key(type, profile_key);
    if (!key_lookup.empty()) {
        auto it = index.by_key.find(key_lookup);
        if (it != index.by_key.end()) {
            return it->second;
        }
    }
    std::string name_lookup = usage_lookup_key(type, profile_name);
    if (!name_lookup.empty()) {
        auto it = index.by_name.find(name_lookup);
        if (it != index.by_name.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

}
