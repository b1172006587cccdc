#pragma once

#include <optional>
#include <string>

namespace codenv {

// External CLI tools whose transcripts we meter
enum class ToolType {
    Codex,
    Claude
};

std::optional<ToolType> normalize_tool(const std::string& value);

// Normalized identifier if recognized, otherwise the trimmed input.
std::string normalize_tool_name(const std::string& value);

inline const char* tool_name(ToolType type) {
    switch (type) {
        case ToolType::Codex: return "codex";
        case ToolType::Claude: return "claude";
    }
    return "unknown";
}

}
