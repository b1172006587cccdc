#include "config/tool_defaults.h"
#include "core/json_util.h"
#include "core/paths.h"
#include "core/string_util.h"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

namespace codenv {

std::string codex_config_path() {
    namespace fs = std::filesystem;

    std::string from_env = env_value("CODE_ENV_CODEX_CONFIG_PATH");
    if (!from_env.empty()) {
        return resolve_path(from_env);
    }
    std::string codex_home = env_value("CODEX_HOME");
    if (!codex_home.empty()) {
        return (fs::path(resolve_path(codex_home)) / "config.toml").string();
    }
    return (fs::path(home_dir()) / ".codex" / "config.toml").string();
}

std::string claude_settings_path() {
    namespace fs = std::filesystem;

    std::string claude_home = env_value("CLAUDE_HOME");
    if (!claude_home.empty()) {
        return (fs::path(resolve_path(claude_home)) / "settings.json").string();
    }
    return (fs::path(home_dir()) / ".claude" / "settings.json").string();
}

std::optional<std::string> read_codex_default_model(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error&) {
        return std::nullopt;
    }
    if (auto v = tbl["model"].value<std::string>()) {
        std::string model = trim(*v);
        if (!model.empty()) {
            return model;
        }
    }
    return std::nullopt;
}

std::optional<std::string> read_claude_default_model(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        return std::nullopt;
    }
    return string_field(j, "model");
}

std::optional<std::string> tool_default_model(ToolType tool) {
    if (tool == ToolType::Codex) {
        return read_codex_default_model(codex_config_path());
    }
    return read_claude_default_model(claude_settings_path());
}

}
