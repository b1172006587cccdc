#pragma once

#include "core/tool_type.h"
#include <string>

namespace codenv {

// Who is running which tool, and where. Passed explicitly into every entry
// point instead of being read from the process environment.
struct UsageContext {
    ToolType tool = ToolType::Codex;
    std::string profile_key;
    std::string profile_name;
    std::string cwd;
    std::string terminal_tag;

    bool has_profile() const { return !profile_key.empty() || !profile_name.empty(); }
};

// Collaborator helper: CODE_ENV_PROFILE_KEY_<TOOL>, CODE_ENV_PROFILE_NAME_<TOOL>,
// CODE_ENV_TERMINAL_TAG and CODE_ENV_CWD (falling back to the process cwd).
UsageContext context_from_environment(ToolType tool);

}
