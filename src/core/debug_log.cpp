#include "core/debug_log.h"
#include "core/paths.h"
#include "core/time_util.h"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace codenv {

bool usage_debug_enabled() {
    return env_flag("CODE_ENV_USAGE_DEBUG") || env_flag("CODE_ENV_STATUSLINE_DEBUG");
}

std::string usage_debug_path(const std::string& config_dir) {
    std::string from_env = env_value("CODE_ENV_USAGE_DEBUG_PATH");
    if (!from_env.empty()) {
        return resolve_path(from_env);
    }
    return (std::filesystem::path(config_dir) / "usage-debug.jsonl").string();
}

void append_usage_debug(const std::string& debug_path, const nlohmann::json& payload) {
    if (debug_path.empty() || !usage_debug_enabled()) {
        return;
    }
    if (!ensure_parent_dir(debug_path)) {
        return;
    }
    nlohmann::json line = payload;
    if (line.is_object() && !line.contains("ts")) {
        line["ts"] = format_iso8601(std::chrono::system_clock::now());
    }
    std::ofstream out(debug_path, std::ios::app);
    if (!out) {
        return;
    }
    out << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

}
