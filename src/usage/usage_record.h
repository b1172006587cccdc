#pragma once

#include "core/json_util.h"
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace codenv {

struct TokenCounters {
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    int64_t cache_read_tokens = 0;
    int64_t cache_write_tokens = 0;
    int64_t total_tokens = 0;

    int64_t breakdown_total() const {
        return add_tokens(add_tokens(input_tokens, output_tokens),
                          add_tokens(cache_read_tokens, cache_write_tokens));
    }
};

// One ledger line. Immutable once written.
struct UsageRecord {
    std::string ts;
    std::string type;
    std::string profile_key;
    std::string profile_name;
    std::string model;
    std::string session_id;
    TokenCounters tokens;
};

void to_json(nlohmann::json& j, const UsageRecord& r);

// Tolerant reader: accepts legacy key aliases and missing fields. totalTokens
// is the larger of the recorded total and the sum of the breakdown.
std::optional<UsageRecord> parse_usage_record(const nlohmann::json& j);

}
