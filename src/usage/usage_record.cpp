#include "usage/usage_record.h"
#include "core/json_util.h"
#include "core/tool_type.h"
#include <algorithm>

namespace codenv {

namespace {

nlohmann::json nullable(const std::string& value) {
    if (value.empty()) {
        return nullptr;
    }
    return value;
}

std::string text_field(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) continue;
        if (it->is_string()) {
            if (!it->get<std::string>().empty()) return it->get<std::string>();
            continue;
        }
        if (it->is_number() || it->is_boolean()) {
            return it->dump();
        }
    }
    return std::string();
}

}

void to_json(nlohmann::json& j, const UsageRecord& r) {
    j = nlohmann::json{
        {"ts", r.ts},
        {"type", r.type},
        {"profileKey", nullable(r.profile_key)},
        {"profileName", nullable(r.profile_name)},
        {"model", nullable(r.model)},
        {"sessionId", nullable(r.session_id)},
        {"inputTokens", r.tokens.input_tokens},
        {"outputTokens", r.tokens.output_tokens},
        {"cacheReadTokens", r.tokens.cache_read_tokens},
        {"cacheWriteTokens", r.tokens.cache_write_tokens},
        {"totalTokens", r.tokens.total_tokens},
    };
}

std::optional<UsageRecord> parse_usage_record(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    UsageRecord r;
    r.ts = text_field(j, {"ts", "timestamp"});
    std::string type = text_field(j, {"type"});
    r.type = type.empty() ? std::string("unknown") : normalize_tool_name(type);
    r.profile_key = text_field(j, {"profileKey"});
    r.profile_name = text_field(j, {"profileName"});
    r.model = text_field(j, {"model"});
    r.session_id = text_field(j, {"sessionId", "session_id"});

    auto& t = r.tokens;
    t.input_tokens = to_token_count(first_number(j, {"inputTokens", "input", "input_tokens"}));
    t.output_tokens = to_token_count(first_number(j, {"outputTokens", "output", "output_tokens"}));
    t.cache_read_tokens = to_token_count(first_number(j, {
        "cacheReadTokens", "cacheRead", "cache_read_tokens", "cache_read_input_tokens",
        "cached_input_tokens"}));
    t.cache_write_tokens = to_token_count(first_number(j, {
        "cacheWriteTokens", "cacheWrite", "cache_write_tokens", "cache_creation_input_tokens"}));
    int64_t recorded_total = to_token_count(first_number(j, {"totalTokens", "total", "total_tokens"}));
    t.total_tokens = std::max(recorded_total, t.breakdown_total());
    return r;
}

}
