#pragma once

#include "core/tool_type.h"
#include <optional>
#include <string>

namespace codenv {

// CODE_ENV_CODEX_CONFIG_PATH, $CODEX_HOME/config.toml, ~/.codex/config.toml
std::string codex_config_path();

// $CLAUDE_HOME/settings.json, ~/.claude/settings.json
std::string claude_settings_path();

// `model` from a Codex config.toml
std::optional<std::string> read_codex_default_model(const std::string& path);

// `model` from a Claude settings.json
std::optional<std::string> read_claude_default_model(const std::string& path);

// Model the tool falls back to when a transcript never names one.
std::optional<std::string> tool_default_model(ToolType tool);

}
