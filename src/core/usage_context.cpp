#include "core/usage_context.h"
#include "core/paths.h"
#include <filesystem>

namespace codenv {

UsageContext context_from_environment(ToolType tool) {
    UsageContext ctx;
    ctx.tool = tool;
    if (tool == ToolType::Codex) {
        ctx.profile_key = env_value("CODE_ENV_PROFILE_KEY_CODEX");
        ctx.profile_name = env_value("CODE_ENV_PROFILE_NAME_CODEX");
    } else {
        ctx.profile_key = env_value("CODE_ENV_PROFILE_KEY_CLAUDE");
        ctx.profile_name = env_value("CODE_ENV_PROFILE_NAME_CLAUDE");
    }
    ctx.terminal_tag = env_value("CODE_ENV_TERMINAL_TAG");
    ctx.cwd = env_value("CODE_ENV_CWD");
    if (ctx.cwd.empty()) {
        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        if (!ec) {
            ctx.cwd = cwd.string();
        }
    }
    return ctx;
}

}
