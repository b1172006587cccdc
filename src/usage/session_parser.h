#pragma once

#include "core/tool_type.h"
#include "usage/usage_record.h"
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace codenv {

// Normalized per-session totals extracted from one transcript.
struct SessionStats {
    TokenCounters tokens;
    std::string start_ts;
    std::string end_ts;
    std::string cwd;
    std::string session_id;
    std::string model;
    size_t usage_events = 0;
};

class ISessionLogFormat {
public:
    virtual ~ISessionLogFormat() = default;

    virtual ToolType tool() const = 0;

    // nullopt only when the file cannot be opened.
    std::optional<SessionStats> extract(const std::filesystem::path& file) const;

    virtual SessionStats extract(std::istream& in, const std::string& file_name) const = 0;
};

// Codex rollouts: token_count events carry a running session total plus a
// last-turn snapshot.
class CumulativeCounterFormat : public ISessionLogFormat {
public:
    ToolType tool() const override { return ToolType::Codex; }
    using ISessionLogFormat::extract;
    SessionStats extract(std::istream& in, const std::string& file_name) const override;
};

// Claude transcripts: every assistant message carries its own usage, summed
// over the file.
class AdditiveMessageFormat : public ISessionLogFormat {
public:
    ToolType tool() const override { return ToolType::Claude; }
    using ISessionLogFormat::extract;
    SessionStats extract(std::istream& in, const std::string& file_name) const override;
};

const ISessionLogFormat& format_for(ToolType tool);

// Last UUID embedded in a file name, e.g. rollout-2025-01-01T10-00-00-<uuid>.jsonl
std::string session_id_from_file_name(const std::string& file_name);

}
