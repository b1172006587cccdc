#pragma once

#include <string>
#include <nlohmann/json_fwd.hpp>

namespace codenv {

// Enabled by CODE_ENV_USAGE_DEBUG or CODE_ENV_STATUSLINE_DEBUG.
bool usage_debug_enabled();

// CODE_ENV_USAGE_DEBUG_PATH, else <config_dir>/usage-debug.jsonl
std::string usage_debug_path(const std::string& config_dir);

// Appends one JSON line when debugging is enabled; never fails loudly.
void append_usage_debug(const std::string& debug_path, const nlohmann::json& payload);

}
