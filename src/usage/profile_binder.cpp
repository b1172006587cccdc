#include "usage/profile_binder.h"
#include "core/json_util.h"
#include "core/paths.h"
#include "core/string_util.h"
#include "core/time_util.h"
#include <fstream>
#include <map>

namespace codenv {

namespace {

nlohmann::json nullable(const std::string& value) {
    if (value.empty()) {
        return nullptr;
    }
    return value;
}

std::string text(const nlohmann::json& j, const char* key) {
    auto value = string_field(j, key);
    return value ? *value : std::string();
}

}

void to_json(nlohmann::json& j, const ProfileBindingEntry& e) {
    j = nlohmann::json{
        {"timestamp", e.timestamp},
        {"kind", e.kind == BindingKind::Session ? "session" : "use"},
        {"profileKey", nullable(e.profile_key)},
        {"profileName", nullable(e.profile_name)},
        {"profileType", e.profile_type ? nlohmann::json(tool_name(*e.profile_type)) : nlohmann::json(nullptr)},
        {"configPath", nullable(e.config_path)},
        {"terminalTag", nullable(e.terminal_tag)},
        {"cwd", nullable(e.cwd)},
        {"sessionFile", nullable(e.session_file)},
        {"sessionId", nullable(e.session_id)},
    };
}

std::optional<ProfileBindingEntry> parse_binding_entry(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    ProfileBindingEntry e;
    e.kind = to_lower(text(j, "kind")) == "session" ? BindingKind::Session : BindingKind::Use;
    e.timestamp = text(j, "timestamp");
    e.profile_key = text(j, "profileKey");
    e.profile_name = text(j, "profileName");
    e.profile_type = normalize_tool(text(j, "profileType"));
    e.config_path = text(j, "configPath");
    e.terminal_tag = text(j, "terminalTag");
    e.cwd = text(j, "cwd");
    e.session_file = text(j, "sessionFile");
    e.session_id = text(j, "sessionId");
    return e;
}

ProfileBindingLog::ProfileBindingLog(std::string path)
    : path_(std::move(path))
{
}

std::vector<ProfileBindingEntry> ProfileBindingLog::read_entries() const {
    std::vector<ProfileBindingEntry> entries;
    if (path_.empty()) return entries;

    std::ifstream file(path_);
    if (!file) return entries;

    std::string line;
    while (std::getline(file, line)) {
        auto json = parse_object_line(line);
        if (!json) continue;
        if (auto entry = parse_binding_entry(*json)) {
            entries.push_back(std::move(*entry));
        }
    }
    return entries;
}

bool ProfileBindingLog::append(const ProfileBindingEntry& entry) const {
    if (path_.empty() || !ensure_parent_dir(path_)) return false;

    nlohmann::json j = entry;
    std::ofstream file(path_, std::ios::app);
    if (!file.is_open()) return false;
    file << j.dump() << "\n";
    file.flush();
    return file.good();
}

bool ProfileBindingLog::append_use(const UsageContext& ctx, const std::string& config_path) const {
    if (ctx.profile_key.empty()) return false;

    ProfileBindingEntry entry;
    entry.kind = BindingKind::Use;
    entry.timestamp = format_iso8601(std::chrono::system_clock::now());
    entry.profile_key = ctx.profile_key;
    entry.profile_name = ctx.profile_name.empty() ? ctx.profile_key : ctx.profile_name;
    entry.profile_type = ctx.tool;
    entry.config_path = config_path;
    entry.terminal_tag = ctx.terminal_tag;
    entry.cwd = ctx.cwd;
    return append(entry);
}

bool ProfileBindingLog::append_session(const UsageContext& ctx,
                                       const std::string& session_file,
                                       const std::string& session_id,
                                       const std::string& timestamp,
                                       const std::string& config_path) const {
    if (!ctx.has_profile()) return false;

    ProfileBindingEntry entry;
    entry.kind = BindingKind::Session;
    entry.timestamp = timestamp.empty() ? format_iso8601(std::chrono::system_clock::now()) : timestamp;
    entry.profile_key = ctx.profile_key.empty() ? std::string("unknown") : ctx.profile_key;
    entry.profile_name = ctx.profile_name.empty() ? entry.profile_key : ctx.profile_name;
    entry.profile_type = ctx.tool;
    entry.config_path = config_path;
    entry.terminal_tag = ctx.terminal_tag;
    entry.cwd = ctx.cwd;
    entry.session_file = session_file;
    entry.session_id = session_id;
    return append(entry);
}

ProfileBinder::ProfileBinder(std::vector<ProfileBindingEntry> entries, const UsageConfig* config)
    : entries_(std::move(entries))
    , config_(config)
{
}

BindingResult ProfileBinder::resolve(ToolType tool,
                                     const std::string& session_file,
                                     const std::string& session_id) const {
    std::vector<const ProfileBindingEntry*> by_file;
    std::vector<const ProfileBindingEntry*> by_id;
    for (const auto& entry : entries_) {
        if (entry.kind != BindingKind::Session) continue;
        if (!entry.profile_type || *entry.profile_type != tool) continue;
        if (!session_file.empty() && entry.session_file == session_file) {
            by_file.push_back(&entry);
        }
        if (!session_id.empty() && entry.session_id == session_id) {
            by_id.push_back(&entry);
        }
    }

    if (!by_file.empty()) {
        BindingResult result = resolve_unique(by_file, tool);
        if (result.match || result.ambiguous) return result;
    }
    if (!by_id.empty()) {
        BindingResult result = resolve_unique(by_id, tool);
        if (result.match || result.ambiguous) return result;
    }
    return BindingResult{};
}

BindingResult ProfileBinder::resolve_unique(const std::vector<const ProfileBindingEntry*>& matches,
                                            ToolType tool) const {
    std::map<std::string, const ProfileBindingEntry*> unique_profiles;
    for (const auto* entry : matches) {
        const std::string& id = !entry->profile_key.empty() ? entry->profile_key : entry->profile_name;
        if (id.empty()) continue;
        unique_profiles.emplace(id, entry);
    }

    BindingResult result;
    if (unique_profiles.empty()) {
        return result;
    }
    if (unique_profiles.size() > 1) {
        result.ambiguous = true;
        return result;
    }
    result.match = normalize_match(*unique_profiles.begin()->second, tool);
    return result;
}

ProfileMatch ProfileBinder::normalize_match(const ProfileBindingEntry& entry, ToolType tool) const {
    ProfileMatch match;
    match.profile_key = entry.profile_key;
    match.profile_name = entry.profile_name;
    if (config_) {
        if (const ProfileConfig* profile = find_profile(*config_, entry.profile_key)) {
            match.profile_name = profile_display_name(entry.profile_key, *profile, tool);
        }
    }
    if (match.profile_name.empty()) {
        match.profile_name = match.profile_key;
    }
    return match;
}

}
