#pragma once

#include "config/usage_config.h"
#include "core/time_util.h"
#include "usage/usage_record.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace codenv {

// USD. A window is empty when any of its records could not be priced.
struct CostTotals {
    std::optional<double> today;
    std::optional<double> total;
};

struct CostIndex {
    std::unordered_map<std::string, CostTotals> by_key;
    std::unordered_map<std::string, CostTotals> by_name;
};

// Cost of one ledger record, priced for its profile with the record's model
// as hint. 0 for records without tokens.
std::optional<double> record_cost(const UsageRecord& record, const UsageConfig& config);

CostIndex build_cost_index(const std::vector<UsageRecord>& records,
                           const UsageConfig& config,
                           TimePoint now = std::chrono::system_clock::now());

std::optional<CostTotals> lookup_cost(const CostIndex& index,
                                      const std::string& type,
                                      const std::string& profile_key,
                                      const std::string& profile_name);

}
