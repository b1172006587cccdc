#pragma once

#include "core/tool_type.h"
#include "usage/usage_record.h"
#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace codenv {

// Last-observed cumulative counters for one transcript file or one live
// session, plus what we know about it.
struct CounterState {
    double mtime_ms = 0.0;
    uint64_t size = 0;
    std::string type;
    TokenCounters tokens;
    std::string start_ts;
    std::string end_ts;
    std::string cwd;
    std::string model;
    std::string session_id;
};

struct UsageState {
    static constexpr int kVersion = 2;

    int version = kVersion;
    std::map<std::string, CounterState> files;
    std::map<std::string, CounterState> sessions;
};

void to_json(nlohmann::json& j, const CounterState& s);
CounterState parse_counter_state(const nlohmann::json& j);

// "<tool>::<sessionId>"
std::string session_state_key(ToolType tool, const std::string& session_id);

class StateStore {
public:
    explicit StateStore(std::string path);

    // Absent or unreadable document -> empty state.
    UsageState load() const;

    // Whole-document rewrite through a temp file and rename.
    bool save(const UsageState& state) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

}
