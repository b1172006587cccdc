#pragma once

#include "config/usage_config.h"
#include "core/tool_type.h"
#include "core/usage_context.h"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace codenv {

enum class BindingKind {
    Use,
    Session
};

struct ProfileBindingEntry {
    BindingKind kind = BindingKind::Use;
    std::string timestamp;
    std::string profile_key;
    std::string profile_name;
    std::optional<ToolType> profile_type;
    std::string config_path;
    std::string terminal_tag;
    std::string cwd;
    std::string session_file;
    std::string session_id;
};

void to_json(nlohmann::json& j, const ProfileBindingEntry& e);
std::optional<ProfileBindingEntry> parse_binding_entry(const nlohmann::json& j);

struct ProfileMatch {
    std::string profile_key;
    std::string profile_name;
};

struct BindingResult {
    std::optional<ProfileMatch> match;
    bool ambiguous = false;
};

// Append-only JSONL log of profile activations and session attributions.
class ProfileBindingLog {
public:
    explicit ProfileBindingLog(std::string path);

    std::vector<ProfileBindingEntry> read_entries() const;

    bool append(const ProfileBindingEntry& entry) const;
    bool append_use(const UsageContext& ctx, const std::string& config_path = "") const;
    // No-op without a profile key or name. Empty timestamp means now.
    bool append_session(const UsageContext& ctx,
                        const std::string& session_file,
                        const std::string& session_id,
                        const std::string& timestamp = "",
                        const std::string& config_path = "") const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Attributes a transcript to a profile from `session` bindings of the same
// tool: by file path first, then by session id. More than one distinct
// profile is ambiguous and never bound.
class ProfileBinder {
public:
    explicit ProfileBinder(std::vector<ProfileBindingEntry> entries,
                           const UsageConfig* config = nullptr);

    BindingResult resolve(ToolType tool,
                          const std::string& session_file,
                          const std::string& session_id) const;

private:
    BindingResult resolve_unique(const std::vector<const ProfileBindingEntry*>& matches,
                                 ToolType tool) const;
    ProfileMatch normalize_match(const ProfileBindingEntry& entry, ToolType tool) const;

    std::vector<ProfileBindingEntry> entries_;
    const UsageConfig* config_ = nullptr;
};

}
