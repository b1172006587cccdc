#include "usage/pricing.h"
#include "core/string_util.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace codenv {

namespace {

TokenPricing make_pricing(double input, double output, std::optional<double> cache_write,
                          double cache_read, const char* description) {
    TokenPricing p;
    p.input = input;
    p.output = output;
    p.cache_write = cache_write;
    p.cache_read = cache_read;
    p.description = description;
    return p;
}

std::optional<TokenPricing> find_by_compact_key(const std::map<std::string, TokenPricing>& models,
                                                const std::string& key) {
    for (const auto& [name, pricing] : models) {
        if (compact_key(name) == key && pricing.has_price()) {
            return pricing;
        }
    }
    return std::nullopt;
}

std::optional<double> clamp_tokens(std::optional<double> value) {
    if (!value || !std::isfinite(*value)) {
        return std::nullopt;
    }
    return std::max(0.0, *value);
}

}

const std::map<std::string, TokenPricing>& default_model_pricing() {
    static const std::map<std::string, TokenPricing> kDefaults = [] {
        const char* sonnet = "Balanced performance and speed for daily use.";
        const char* opus = "Most capable model for agents and coding.";
        const char* haiku = "Fast responses for lightweight tasks.";
        std::map<std::string, TokenPricing> m;
        m["Claude Sonnet 4.5"] = make_pricing(3.0, 15.0, 3.75, 0.3, sonnet);
        m["Sonnet 4.5"] = make_pricing(3.0, 15.0, 3.75, 0.3, sonnet);
        m["claude-sonnet-4-5-20250929"] = make_pricing(3.0, 15.0, 3.75, 0.3, sonnet);
        m["Claude Opus 4.5"] = make_pricing(5.0, 25.0, 6.25, 0.5, opus);
        m["Opus 4.5"] = make_pricing(5.0, 25.0, 6.25, 0.5, opus);
        m["claude-opus-4-5-20251101"] = make_pricing(5.0, 25.0, 6.25, 0.5, opus);
        m["Claude Haiku 4.5"] = make_pricing(1.0, 5.0, 1.25, 0.1, haiku);
        m["Haiku 4.5"] = make_pricing(1.0, 5.0, 1.25, 0.1, haiku);
        m["claude-haiku-4-5-20251001"] = make_pricing(1.0, 5.0, 1.25, 0.1, haiku);
        m["gpt-5.1"] = make_pricing(1.25, 10.0, std::nullopt, 0.125,
                                    "Base model for daily development work.");
        m["gpt-5.1-codex"] = make_pricing(1.25, 10.0, std::nullopt, 0.125,
                                          "Code-focused model for programming workflows.");
        m["gpt-5.1-codex-max"] = make_pricing(1.25, 10.0, std::nullopt, 0.125,
                                              "Flagship code model for complex projects.");
        m["gpt-5.2"] = make_pricing(1.75, 14.0, std::nullopt, 0.175,
                                    "Latest flagship model with improved performance.");
        m["gpt-5.2-codex"] = make_pricing(1.75, 14.0, std::nullopt, 0.175,
                                          "Latest flagship code model.");
        return m;
    }();
    return kDefaults;
}

TokenPricing merge_pricing(const TokenPricing& base, const TokenPricing& override_pricing) {
    TokenPricing merged = base;
    if (override_pricing.input) merged.input = override_pricing.input;
    if (override_pricing.output) merged.output = override_pricing.output;
    if (override_pricing.cache_read) merged.cache_read = override_pricing.cache_read;
    if (override_pricing.cache_write) merged.cache_write = override_pricing.cache_write;
    if (!override_pricing.description.empty()) merged.description = override_pricing.description;
    return merged;
}

TokenPricing apply_multiplier(const TokenPricing& pricing, std::optional<double> multiplier) {
    if (!multiplier || *multiplier < 0 || !std::isfinite(*multiplier)) {
        return pricing;
    }
    TokenPricing scaled = pricing;
    if (scaled.input) *scaled.input *= *multiplier;
    if (scaled.output) *scaled.output *= *multiplier;
    if (scaled.cache_read) *scaled.cache_read *= *multiplier;
    if (scaled.cache_write) *scaled.cache_write *= *multiplier;
    return scaled;
}

std::optional<TokenPricing> lookup_model_pricing(const UsageConfig& config, const std::string& model) {
    std::string key = compact_key(model);
    if (key.empty()) {
        return std::nullopt;
    }
    auto builtin = find_by_compact_key(default_model_pricing(), key);
    auto configured = find_by_compact_key(config.pricing_models, key);
    if (builtin && configured) {
        return merge_pricing(*builtin, *configured);
    }
    if (configured) {
        return configured;
    }
    return builtin;
}

std::optional<TokenPricing> resolve_pricing(const UsageConfig& config,
                                            const ProfileConfig* profile,
                                            const std::string& model_hint) {
    TokenPricing resolved;
    if (auto from_hint = lookup_model_pricing(config, model_hint)) {
        resolved = merge_pricing(resolved, *from_hint);
    }

    std::optional<double> multiplier;
    if (profile && profile->pricing) {
        const ProfilePricing& pp = *profile->pricing;
        if (!pp.model.empty()) {
            if (auto from_profile_model = lookup_model_pricing(config, pp.model)) {
                resolved = merge_pricing(resolved, *from_profile_model);
            }
        }
        resolved = merge_pricing(resolved, pp.overrides);
        multiplier = pp.multiplier;
    }

    if (!resolved.has_price()) {
        return std::nullopt;
    }
    return apply_multiplier(resolved, multiplier);
}

std::optional<double> calculate_cost(const UsageTokenBreakdown& usage, const TokenPricing& pricing) {
    auto input = clamp_tokens(usage.input_tokens);
    auto output = clamp_tokens(usage.output_tokens);
    auto cache_read = clamp_tokens(usage.cache_read_tokens);
    auto cache_write = clamp_tokens(usage.cache_write_tokens);
    if (!input && !output && !cache_read && !cache_write) {
        return std::nullopt;
    }

    double in = input.value_or(0.0);
    double out = output.value_or(0.0);
    double cr = cache_read.value_or(0.0);
    double cw = cache_write.value_or(0.0);

    // A known total with no breakdown cannot be priced.
    double breakdown = in + out + cr + cw;
    auto known_total = clamp_tokens(usage.total_tokens);
    if (breakdown == 0.0 && known_total && *known_total > 0.0) {
        return std::nullopt;
    }

    if (in > 0 && !pricing.input) return std::nullopt;
    if (out > 0 && !pricing.output) return std::nullopt;
    if (cr > 0 && !pricing.cache_read) return std::nullopt;
    if (cw > 0 && !pricing.cache_write) return std::nullopt;

    double total = (in * pricing.input.value_or(0.0) +
                    out * pricing.output.value_or(0.0) +
                    cr * pricing.cache_read.value_or(0.0) +
                    cw * pricing.cache_write.value_or(0.0)) / kTokensPerMillion;
    if (!std::isfinite(total)) {
        return std::nullopt;
    }
    return total;
}

std::string format_usd_amount(std::optional<double> amount) {
    if (!amount || !std::isfinite(*amount)) {
        return "-";
    }
    double normalized = std::fabs(*amount) < 1e-12 ? 0.0 : *amount;
    double abs = std::fabs(normalized);
    int decimals = 2;
    if (abs < 1) decimals = 4;
    if (abs < 0.1) decimals = 5;
    if (abs < 0.01) decimals = 6;

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, normalized);
    std::string text = buf;
    if (text.find('.') != std::string::npos) {
        while (!text.empty() && text.back() == '0') text.pop_back();
        if (!text.empty() && text.back() == '.') text.pop_back();
    }
    return "$" + text;
}

std::string format_token_count(std::optional<double> value) {
    if (!value || !std::isfinite(*value)) {
        return "-";
    }
    double v = *value;
    char buf[64];
    if (v < 1000) {
        std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(std::llround(v)));
    } else if (v < 1000000) {
        std::snprintf(buf, sizeof(buf), "%.2fK", v / 1000.0);
    } else if (v < 1000000000) {
        std::snprintf(buf, sizeof(buf), "%.2fM", v / 1000000.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%.2fB", v / 1000000000.0);
    }
    return buf;
}

}
