#pragma once

#include "core/tool_type.h"
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace codenv {

// Prices in USD per million tokens
struct TokenPricing {
    std::optional<double> input;
    std::optional<double> output;
    std::optional<double> cache_read;
    std::optional<double> cache_write;
    std::string description;

    bool has_price() const {
        return input.has_value() || output.has_value() ||
               cache_read.has_value() || cache_write.has_value();
    }
};

struct ProfilePricing {
    std::string model;
    TokenPricing overrides;
    std::optional<double> multiplier;
};

struct ProfileConfig {
    std::string name;
    std::string type;
    std::optional<ProfilePricing> pricing;
};

struct UsageConfig {
    std::string config_path;

    std::string usage_path;
    std::string usage_state_path;
    std::string profile_log_path;
    std::string codex_sessions_path;
    std::string claude_sessions_path;

    std::map<std::string, ProfileConfig> profiles;
    std::map<std::string, TokenPricing> pricing_models;

    static UsageConfig from_json(const nlohmann::json& j);
};

// Accepts numbers and strings such as "$1,250.50"; nullopt otherwise.
std::optional<double> parse_price_value(const nlohmann::json& value);
TokenPricing token_pricing_from_json(const nlohmann::json& j);

std::string default_config_path();
// Explicit path, then CODE_ENV_CONFIG, then the default.
std::string find_config_path(const std::string& explicit_path);

// Missing file -> empty config; invalid JSON -> nullopt with `error` set.
std::optional<UsageConfig> read_config(const std::string& path, std::string* error = nullptr);

std::string config_dir(const UsageConfig& config);
std::string ledger_path(const UsageConfig& config);
std::string state_path(const UsageConfig& config);
std::string lock_path(const UsageConfig& config);
std::string binding_log_path(const UsageConfig& config);
std::string sessions_path(const UsageConfig& config, ToolType tool);

const ProfileConfig* find_profile(const UsageConfig& config, const std::string& key);

std::optional<ToolType> infer_profile_type(const std::string& key, const ProfileConfig* profile);

// Explicit name, else the key with its "<type>-" prefix stripped.
std::string profile_display_name(const std::string& key, const ProfileConfig& profile,
                                 std::optional<ToolType> requested = std::nullopt);

}
