#include "usage/statusline_input.h"
#include "core/json_util.h"
#include <algorithm>

namespace codenv {

namespace {

std::optional<int64_t> token_field(const nlohmann::json& record,
                                   std::initializer_list<const char*> keys) {
    auto value = first_number(record, keys);
    if (!value) {
        return std::nullopt;
    }
    return to_token_count(value);
}

std::optional<int64_t> cache_read_field(const nlohmann::json& record) {
    return token_field(record, {"cached_input_tokens", "cachedInputTokens",
                                "cache_read_input_tokens", "cacheReadInputTokens",
                                "cache_read", "cacheRead"});
}

std::optional<int64_t> cache_write_field(const nlohmann::json& record) {
    return token_field(record, {"cache_creation_input_tokens", "cacheCreationInputTokens",
                                "cache_write_input_tokens", "cacheWriteInputTokens",
                                "cache_write", "cacheWrite"});
}

// Codex reports reasoning separately; it is billed as output.
std::optional<int64_t> codex_output_field(const nlohmann::json& record) {
    auto output = token_field(record, {"outputTokens", "output", "output_tokens"});
    auto reasoning = token_field(record, {"reasoning_output_tokens", "reasoningOutputTokens",
                                          "reasoning_output"});
    if (!reasoning) {
        return output;
    }
    return add_tokens(output.value_or(0), *reasoning);
}

std::optional<UsageObservation> parse_flat_record(const nlohmann::json& record, ToolType tool) {
    if (!record.is_object()) {
        return std::nullopt;
    }
    UsageObservation obs;
    obs.input_tokens = token_field(record, {"inputTokens", "input", "input_tokens"});
    obs.output_tokens = tool == ToolType::Codex
        ? codex_output_field(record)
        : token_field(record, {"outputTokens", "output", "output_tokens"});
    obs.cache_read_tokens = cache_read_field(record);
    obs.cache_write_tokens = cache_write_field(record);
    obs.total_tokens = token_field(record, {"totalTokens", "total", "total_tokens"});
    if (obs.empty()) {
        return std::nullopt;
    }
    if (tool == ToolType::Codex) {
        // Codex input_tokens includes the cached part; count it once, as cache read.
        if (obs.input_tokens && obs.cache_read_tokens) {
            obs.input_tokens = std::max<int64_t>(0, *obs.input_tokens - *obs.cache_read_tokens);
        }
        UsageObservation breakdown = obs;
        breakdown.total_tokens.reset();
        if (auto sum = breakdown.resolved_total()) {
            obs.total_tokens = std::max(obs.total_tokens.value_or(0), *sum);
        }
    }
    obs.total_tokens = obs.resolved_total();
    return obs;
}

std::optional<UsageObservation> parse_context_window(const nlohmann::json& window) {
    UsageObservation obs;
    obs.input_tokens = token_field(window, {"total_input_tokens", "totalInputTokens"});
    obs.output_tokens = token_field(window, {"total_output_tokens", "totalOutputTokens"});
    if (!obs.input_tokens && !obs.output_tokens) {
        return std::nullopt;
    }
    // current_usage describes the last turn only, so its cache counts are not
    // cumulative and are left out.
    obs.total_tokens = obs.resolved_total();
    return obs;
}

std::optional<UsageObservation> parse_claude(const nlohmann::json& input) {
    if (const auto* window = object_field(input, {"context_window", "contextWindow"})) {
        if (auto obs = parse_context_window(*window)) {
            return obs;
        }
    }
    if (const auto* usage = object_field(input, {"usage"})) {
        return parse_flat_record(*usage, ToolType::Claude);
    }
    return std::nullopt;
}

std::optional<UsageObservation> parse_codex(const nlohmann::json& input) {
    auto it = input.find("token_usage");
    if (it != input.end() && it->is_number()) {
        auto total = coerce_number(*it);
        if (!total) {
            return std::nullopt;
        }
        UsageObservation obs;
        obs.total_tokens = to_token_count(total);
        return obs;
    }
    if (it != input.end() && it->is_object()) {
        if (const auto* total = object_field(*it, {"total_token_usage", "totalTokenUsage"})) {
            if (auto obs = parse_flat_record(*total, ToolType::Codex)) {
                return obs;
            }
        }
        if (const auto* last = object_field(*it, {"last_token_usage", "lastTokenUsage"})) {
            if (auto obs = parse_flat_record(*last, ToolType::Codex)) {
                return obs;
            }
        }
        if (auto obs = parse_flat_record(*it, ToolType::Codex)) {
            return obs;
        }
    }
    if (const auto* usage = object_field(input, {"usage"})) {
        return parse_flat_record(*usage, ToolType::Codex);
    }
    return std::nullopt;
}

}

std::optional<UsageObservation> parse_statusline_totals(ToolType tool, const nlohmann::json& input) {
    if (!input.is_object()) {
        return std::nullopt;
    }
    return tool == ToolType::Codex ? parse_codex(input) : parse_claude(input);
}

std::string statusline_session_id(const nlohmann::json& input) {
    if (!input.is_object()) {
        return "";
    }
    return first_string(input, {"session_id", "sessionId"}).value_or("");
}

std::string statusline_model(const nlohmann::json& input) {
    if (!input.is_object()) {
        return "";
    }
    if (auto model = string_field(input, "model")) {
        return *model;
    }
    if (const auto* model = object_field(input, {"model"})) {
        return first_string(*model, {"id", "display_name", "displayName"}).value_or("");
    }
    return "";
}

}
