#pragma once

#include "config/usage_config.h"
#include <map>
#include <optional>
#include <string>

namespace codenv {

constexpr double kTokensPerMillion = 1000000.0;

const std::map<std::string, TokenPricing>& default_model_pricing();

// Token counts to price. Empty fields were not observed.
struct UsageTokenBreakdown {
    std::optional<double> input_tokens;
    std::optional<double> output_tokens;
    std::optional<double> cache_read_tokens;
    std::optional<double> cache_write_tokens;
    std::optional<double> total_tokens;
};

// Fields set in `override_pricing` replace those of `base`.
TokenPricing merge_pricing(const TokenPricing& base, const TokenPricing& override_pricing);

// Scales every price; a negative multiplier is ignored.
TokenPricing apply_multiplier(const TokenPricing& pricing, std::optional<double> multiplier);

// Configured entry merged over the built-in one; model names compare
// case- and punctuation-insensitively.
std::optional<TokenPricing> lookup_model_pricing(const UsageConfig& config, const std::string& model);

// Layers, lowest first: pricing of `model_hint`, pricing of the profile's own
// model, the profile's explicit prices. The profile multiplier scales the
// result. nullopt when no layer yields a price.
std::optional<TokenPricing> resolve_pricing(const UsageConfig& config,
                                            const ProfileConfig* profile,
                                            const std::string& model_hint);

// nullopt when any observed category lacks a price; never a partial cost.
std::optional<double> calculate_cost(const UsageTokenBreakdown& usage, const TokenPricing& pricing);

std::string format_usd_amount(std::optional<double> amount);
std::string format_token_count(std::optional<double> value);

}
