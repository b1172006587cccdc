#include "usage/cost_index.h"
#include "usage/pricing.h"
#include "usage/usage_totals.h"

namespace codenv {

namespace {

struct CostBucket {
    double today = 0.0;
    double total = 0.0;
    bool today_known = true;
    bool total_known = true;
};

void add_cost(std::unordered_map<std::string, CostBucket>& map,
              const std::string& key,
              std::optional<double> cost,
              bool today) {
    if (key.empty()) return;
    auto& bucket = map[key];
    if (cost) {
        bucket.total += *cost;
        if (today) bucket.today += *cost;
    } else {
        bucket.total_known = false;
        if (today) bucket.today_known = false;
    }
}

std::unordered_map<std::string, CostTotals> finish(
        const std::unordered_map<std::string, CostBucket>& buckets) {
    std::unordered_map<std::string, CostTotals> out;
    for (const auto& [key, bucket] : buckets) {
        CostTotals totals;
        if (bucket.today_known) totals.today = bucket.today;
        if (bucket.total_known) totals.total = bucket.total;
        out.emplace(key, totals);
    }
    return out;
}

}

std::optional<double> record_cost(const UsageRecord& record, const UsageConfig& config) {
    const TokenCounters& t = record.tokens;
    if (t.total_tokens <= 0 && t.breakdown_total() <= 0) {
        return 0.0;
    }
    const ProfileConfig* profile = find_profile(config, record.profile_key);
    auto pricing = resolve_pricing(config, profile, record.model);
    if (!pricing) {
        return std::nullopt;
    }
    UsageTokenBreakdown usage;
    usage.input_tokens = static_cast<double>(t.input_tokens);
    usage.output_tokens = static_cast<double>(t.output_tokens);
    usage.cache_read_tokens = static_cast<double>(t.cache_read_tokens);
    usage.cache_write_tokens = static_cast<double>(t.cache_write_tokens);
    usage.total_tokens = static_cast<double>(t.total_tokens);
    return calculate_cost(usage, *pricing);
}

CostIndex build_cost_index(const std::vector<UsageRecord>& records,
                           const UsageConfig& config,
                           TimePoint now) {
    std::unordered_map<std::string, CostBucket> by_key;
    std::unordered_map<std::string, CostBucket> by_name;
    DayWindow window = local_day_window(now);

    for (const auto& record : records) {
        bool today = record_in_window(record, window);
        auto cost = record_cost(record, config);
        add_cost(by_key, usage_lookup_key(record.type, record.profile_key), cost, today);
        add_cost(by_name, usage_lookup_key(record.type, record.profile_name), cost, today);
    }

    CostIndex index;
    index.by_key = finish(by_key);
    index.by_name = finish(by_name);
    return index;
}

std::optional<CostTotals> lookup_cost(const CostIndex& index,
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
