#include "core/tool_type.h"
#include "core/string_util.h"

namespace codenv {

std::optional<ToolType> normalize_tool(const std::string& value) {
    std::string raw = to_lower(trim(value));
    if (raw.empty()) {
        return std::nullopt;
    }
    std::string compact;
    for (char c : raw) {
        if (c == ' ' || c == '\t' || c == '_' || c == '-') continue;
        compact.push_back(c);
    }
    if (compact == "codex") {
        return ToolType::Codex;
    }
    if (compact == "claude" || compact == "claudecode" || compact == "cc") {
        return ToolType::Claude;
    }
    return std::nullopt;
}

std::string normalize_tool_name(const std::string& value) {
    if (auto type = normalize_tool(value)) {
        return tool_name(*type);
    }
    return trim(value);
}

}
