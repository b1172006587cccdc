#include "config/usage_config.h"
#include "core/json_util.h"
#include "core/paths.h"
#include "core/string_util.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <regex>
#include <vector>

namespace codenv {

namespace {

std::string path_setting(const nlohmann::json& j, const char* key) {
    if (auto value = string_field(j, key)) {
        return *value;
    }
    return std::string();
}

bool has_type_prefix(const std::string& name, ToolType type) {
    std::string lowered = to_lower(name);
    std::vector<std::string> prefixes = {tool_name(type)};
    if (type == ToolType::Claude) {
        prefixes.push_back("cc");
    }
    for (const auto& prefix : prefixes) {
        for (const char* sep : {"-", "_", "."}) {
            if (starts_with(lowered, prefix + sep)) {
                return true;
            }
        }
    }
    return false;
}

std::string strip_type_prefix(const std::string& name, ToolType type) {
    std::string lowered = to_lower(name);
    std::vector<std::string> prefixes = {tool_name(type)};
    if (type == ToolType::Claude) {
        prefixes.push_back("cc");
    }
    for (const auto& prefix : prefixes) {
        for (const char* sep : {"-", "_", "."}) {
            std::string candidate = prefix + sep;
            if (starts_with(lowered, candidate)) {
                std::string stripped = name.substr(candidate.size());
                return stripped.empty() ? name : stripped;
            }
        }
    }
    return name;
}

}

std::optional<double> parse_price_value(const nlohmann::json& value) {
    if (value.is_number()) {
        return coerce_number(value);
    }
    if (!value.is_string()) {
        return std::nullopt;
    }
    std::string text = value.get<std::string>();
    text.erase(std::remove(text.begin(), text.end(), ','), text.end());
    static const std::regex number_pattern(R"(-?\d+(?:\.\d+)?)");
    std::smatch match;
    if (!std::regex_search(text, match, number_pattern)) {
        return std::nullopt;
    }
    return coerce_number(nlohmann::json(match[0].str()));
}

TokenPricing token_pricing_from_json(const nlohmann::json& j) {
    TokenPricing pricing;
    if (!j.is_object()) {
        return pricing;
    }
    if (j.contains("input")) pricing.input = parse_price_value(j["input"]);
    if (j.contains("output")) pricing.output = parse_price_value(j["output"]);
    if (j.contains("cacheRead")) pricing.cache_read = parse_price_value(j["cacheRead"]);
    if (j.contains("cacheWrite")) pricing.cache_write = parse_price_value(j["cacheWrite"]);
    if (auto description = string_field(j, "description")) {
        pricing.description = *description;
    }
    return pricing;
}

UsageConfig UsageConfig::from_json(const nlohmann::json& j) {
    UsageConfig cfg;
    if (!j.is_object()) {
        return cfg;
    }

    cfg.usage_path = path_setting(j, "usagePath");
    cfg.usage_state_path = path_setting(j, "usageStatePath");
    cfg.profile_log_path = path_setting(j, "profileLogPath");
    cfg.codex_sessions_path = path_setting(j, "codexSessionsPath");
    cfg.claude_sessions_path = path_setting(j, "claudeSessionsPath");

    if (j.contains("profiles") && j["profiles"].is_object()) {
        for (const auto& [key, pj] : j["profiles"].items()) {
            if (!pj.is_object()) continue;
            ProfileConfig profile;
            if (auto name = string_field(pj, "name")) profile.name = *name;
            if (auto type = string_field(pj, "type")) profile.type = *type;
            if (pj.contains("pricing") && pj["pricing"].is_object()) {
                const auto& raw = pj["pricing"];
                ProfilePricing pricing;
                if (auto model = string_field(raw, "model")) pricing.model = *model;
                pricing.overrides = token_pricing_from_json(raw);
                if (raw.contains("multiplier")) {
                    pricing.multiplier = parse_price_value(raw["multiplier"]);
                }
                profile.pricing = pricing;
            }
            cfg.profiles[key] = profile;
        }
    }

    if (j.contains("pricing") && j["pricing"].is_object()) {
        const auto& pricing = j["pricing"];
        if (pricing.contains("models") && pricing["models"].is_object()) {
            for (const auto& [model, mj] : pricing["models"].items()) {
                cfg.pricing_models[model] = token_pricing_from_json(mj);
            }
        }
    }
    return cfg;
}

std::string default_config_path() {
    return (std::filesystem::path(home_dir()) / ".config" / "code-env" / "config.json").string();
}

std::string find_config_path(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        return resolve_path(explicit_path);
    }
    std::string from_env = env_value("CODE_ENV_CONFIG");
    if (!from_env.empty()) {
        return resolve_path(from_env);
    }
    return default_config_path();
}

std::optional<UsageConfig> read_config(const std::string& path, std::string* error) {
    UsageConfig cfg;
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        cfg.config_path = path;
        return cfg;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        if (error) *error = "Unable to read config: " + path;
        return std::nullopt;
    }
    auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        if (error) *error = "Invalid JSON in config: " + path;
        return std::nullopt;
    }
    cfg = UsageConfig::from_json(j);
    cfg.config_path = path;
    return cfg;
}

std::string config_dir(const UsageConfig& config) {
    if (!config.config_path.empty()) {
        return std::filesystem::path(config.config_path).parent_path().string();
    }
    return (std::filesystem::path(home_dir()) / ".config" / "code-env").string();
}

std::string ledger_path(const UsageConfig& config) {
    if (!config.usage_path.empty()) {
        return resolve_path(config.usage_path);
    }
    return (std::filesystem::path(config_dir(config)) / "usage.jsonl").string();
}

std::string state_path(const UsageConfig& config) {
    if (!config.usage_state_path.empty()) {
        return resolve_path(config.usage_state_path);
    }
    return ledger_path(config) + ".state.json";
}

std::string lock_path(const UsageConfig& config) {
    return state_path(config) + ".lock";
}

std::string binding_log_path(const UsageConfig& config) {
    if (!config.profile_log_path.empty()) {
        return resolve_path(config.profile_log_path);
    }
    return (std::filesystem::path(config_dir(config)) / "profile-log.jsonl").string();
}

std::string sessions_path(const UsageConfig& config, ToolType tool) {
    namespace fs = std::filesystem;

    if (tool == ToolType::Codex) {
        if (!config.codex_sessions_path.empty()) {
            return resolve_path(config.codex_sessions_path);
        }
        std::string codex_home = env_value("CODEX_HOME");
        if (!codex_home.empty()) {
            return (fs::path(resolve_path(codex_home)) / "sessions").string();
        }
        return (fs::path(home_dir()) / ".codex" / "sessions").string();
    }

    if (!config.claude_sessions_path.empty()) {
        return resolve_path(config.claude_sessions_path);
    }
    std::string claude_home = env_value("CLAUDE_HOME");
    if (!claude_home.empty()) {
        return (fs::path(resolve_path(claude_home)) / "projects").string();
    }
    return (fs::path(home_dir()) / ".claude" / "projects").string();
}

const ProfileConfig* find_profile(const UsageConfig& config, const std::string& key) {
    if (key.empty()) {
        return nullptr;
    }
    auto it = config.profiles.find(key);
    if (it == config.profiles.end()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<ToolType> infer_profile_type(const std::string& key, const ProfileConfig* profile) {
    if (profile) {
        if (auto type = normalize_tool(profile->type)) {
            return type;
        }
    }
    if (has_type_prefix(key, ToolType::Codex)) {
        return ToolType::Codex;
    }
    if (has_type_prefix(key, ToolType::Claude)) {
        return ToolType::Claude;
    }
    return std::nullopt;
}

std::string profile_display_name(const std::string& key, const ProfileConfig& profile,
                                 std::optional<ToolType> requested) {
    if (!profile.name.empty()) {
        return profile.name;
    }
    if (!profile.type.empty()) {
        auto type = normalize_tool(profile.type);
        return type ? strip_type_prefix(key, *type) : key;
    }
    if (requested) {
        return strip_type_prefix(key, *requested);
    }
    return key;
}

}
