#include "usage/state_store.h"
#include "core/json_util.h"
#include "core/paths.h"
#include <cstdio>
#include <fstream>

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

std::map<std::string, CounterState> parse_entries(const nlohmann::json& j, const char* key) {
    std::map<std::string, CounterState> entries;
    if (!j.contains(key) || !j[key].is_object()) {
        return entries;
    }
    for (const auto& [name, value] : j[key].items()) {
        if (!value.is_object()) continue;
        entries[name] = parse_counter_state(value);
    }
    return entries;
}

}

void to_json(nlohmann::json& j, const CounterState& s) {
    j = nlohmann::json{
        {"mtimeMs", s.mtime_ms},
        {"size", s.size},
        {"type", s.type},
        {"inputTokens", s.tokens.input_tokens},
        {"outputTokens", s.tokens.output_tokens},
        {"cacheReadTokens", s.tokens.cache_read_tokens},
        {"cacheWriteTokens", s.tokens.cache_write_tokens},
        {"totalTokens", s.tokens.total_tokens},
        {"startTs", nullable(s.start_ts)},
        {"endTs", nullable(s.end_ts)},
        {"cwd", nullable(s.cwd)},
        {"model", nullable(s.model)},
        {"sessionId", nullable(s.session_id)},
    };
}

CounterState parse_counter_state(const nlohmann::json& j) {
    CounterState s;
    if (auto mtime = first_number(j, {"mtimeMs"})) s.mtime_ms = *mtime;
    s.size = static_cast<uint64_t>(to_token_count(first_number(j, {"size"})));
    s.type = text(j, "type");
    s.tokens.input_tokens = to_token_count(first_number(j, {"inputTokens"}));
    s.tokens.output_tokens = to_token_count(first_number(j, {"outputTokens"}));
    s.tokens.cache_read_tokens = to_token_count(first_number(j, {"cacheReadTokens"}));
    s.tokens.cache_write_tokens = to_token_count(first_number(j, {"cacheWriteTokens"}));
    s.tokens.total_tokens = to_token_count(first_number(j, {"totalTokens"}));
    s.start_ts = text(j, "startTs");
    s.end_ts = text(j, "endTs");
    s.cwd = text(j, "cwd");
    s.model = text(j, "model");
    s.session_id = text(j, "sessionId");
    return s;
}

std::string session_state_key(ToolType tool, const std::string& session_id) {
    return std::string(tool_name(tool)) + "::" + session_id;
}

StateStore::StateStore(std::string path)
    : path_(std::move(path))
{
}

UsageState StateStore::load() const {
    UsageState state;
    if (path_.empty()) return state;

    std::ifstream file(path_);
    if (!file.is_open()) {
        return state;
    }
    auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return state;
    }
    state.files = parse_entries(j, "files");
    state.sessions = parse_entries(j, "sessions");
    return state;
}

bool StateStore::save(const UsageState& state) const {
    if (path_.empty()) return false;
    if (!ensure_parent_dir(path_)) return false;

    nlohmann::json j;
    j["version"] = UsageState::kVersion;
    j["files"] = nlohmann::json::object();
    for (const auto& [path, entry] : state.files) {
        j["files"][path] = entry;
    }
    j["sessions"] = nlohmann::json::object();
    for (const auto& [key, entry] : state.sessions) {
        j["sessions"][key] = entry;
    }

    std::string temp_path = path_ + ".tmp";
    std::ofstream file(temp_path);
    if (!file.is_open()) {
        fprintf(stderr, "codenv: cannot write usage state %s\n", temp_path.c_str());
        return false;
    }

    file << j.dump(2) << "\n";
    file.close();

    if (!file.good()) {
        std::remove(temp_path.c_str());
        return false;
    }

    if (std::rename(temp_path.c_str(), path_.c_str()) != 0) {
        std::remove(temp_path.c_str());
        return false;
    }

    return true;
}

}
