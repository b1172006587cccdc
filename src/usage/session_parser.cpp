#include "usage/session_parser.h"
#include "core/json_util.h"
#include "core/time_util.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>

namespace codenv {

namespace {

class TimestampRange {
public:
    void observe(const nlohmann::json& event) {
        auto ts = string_field(event, "timestamp");
        if (!ts) return;
        auto tp = parse_iso8601(*ts);
        if (!tp) return;
        if (!start_ || *tp < *start_) {
            start_ = tp;
            start_text_ = *ts;
        }
        if (!end_ || *tp > *end_) {
            end_ = tp;
            end_text_ = *ts;
        }
    }

    void apply(SessionStats& stats) const {
        stats.start_ts = start_text_;
        stats.end_ts = end_text_;
    }

private:
    std::optional<TimePoint> start_;
    std::optional<TimePoint> end_;
    std::string start_text_;
    std::string end_text_;
};

bool is_hex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_uuid_at(const std::string& s, size_t pos) {
    static const int kGroups[] = {8, 4, 4, 4, 12};
    if (pos + 36 > s.size()) return false;
    size_t i = pos;
    for (int g = 0; g < 5; ++g) {
        for (int k = 0; k < kGroups[g]; ++k, ++i) {
            if (!is_hex(s[i])) return false;
        }
        if (g < 4) {
            if (s[i] != '-') return false;
            ++i;
        }
    }
    return true;
}

// Claude marks synthetic turns with models such as "<synthetic>".
bool is_real_model(const std::string& model) {
    return !model.empty() && model.front() != '<';
}

int64_t token_field(const nlohmann::json& usage, std::initializer_list<const char*> keys) {
    return to_token_count(first_number(usage, keys));
}

void accumulate(int64_t& field, int64_t value) {
    field = std::min(kMaxTokenCount, add_tokens(field, value));
}

}

std::optional<SessionStats> ISessionLogFormat::extract(const std::filesystem::path& file) const {
    std::ifstream in(file);
    if (!in) {
        return std::nullopt;
    }
    return extract(in, file.filename().string());
}

std::string session_id_from_file_name(const std::string& file_name) {
    if (file_name.size() < 36) {
        return std::string();
    }
    for (size_t pos = file_name.size() - 36 + 1; pos-- > 0;) {
        if (is_uuid_at(file_name, pos)) {
            return file_name.substr(pos, 36);
        }
    }
    return std::string();
}

SessionStats CumulativeCounterFormat::extract(std::istream& in, const std::string& file_name) const {
    SessionStats stats;
    TimestampRange range;

    bool has_total = false;
    TokenCounters max_total;
    TokenCounters sum_last;

    std::string line;
    while (std::getline(in, line)) {
        auto parsed = parse_object_line(line);
        if (!parsed) continue;
        const auto& event = *parsed;

        range.observe(event);

        auto type = string_field(event, "type");
        if (!type) continue;

        const nlohmann::json* payload = object_field(event, {"payload"});
        if (*type == "session_meta" && payload) {
            if (stats.cwd.empty()) {
                if (auto cwd = string_field(*payload, "cwd")) stats.cwd = *cwd;
            }
            if (stats.session_id.empty()) {
                if (auto id = string_field(*payload, "id")) stats.session_id = *id;
            }
            if (auto model = string_field(*payload, "model")) stats.model = *model;
            continue;
        }
        if (*type == "turn_context" && payload) {
            if (stats.cwd.empty()) {
                if (auto cwd = string_field(*payload, "cwd")) stats.cwd = *cwd;
            }
            if (auto model = string_field(*payload, "model")) stats.model = *model;
            continue;
        }
        if (*type != "event_msg" || !payload) continue;
        if (string_field(*payload, "type").value_or("") != "token_count") continue;

        const nlohmann::json* info = object_field(*payload, {"info"});
        if (!info) continue;

        const nlohmann::json* total_usage = object_field(*info, {"total_token_usage"});
        const nlohmann::json* last_usage = object_field(*info, {"last_token_usage"});

        if (total_usage && first_number(*total_usage, {"total_tokens"})) {
            has_total = true;
            int64_t input = token_field(*total_usage, {"input_tokens"});
            int64_t cached = token_field(*total_usage, {"cached_input_tokens"});
            int64_t output = token_field(*total_usage, {"output_tokens"}) +
                             token_field(*total_usage, {"reasoning_output_tokens"});
            int64_t total = token_field(*total_usage, {"total_tokens"});

            max_total.input_tokens = std::max(max_total.input_tokens, std::max<int64_t>(0, input - cached));
            max_total.cache_read_tokens = std::max(max_total.cache_read_tokens, cached);
            max_total.output_tokens = std::max(max_total.output_tokens, output);
            max_total.total_tokens = std::max(max_total.total_tokens, total);
            ++stats.usage_events;
        } else if (last_usage) {
            int64_t input = token_field(*last_usage, {"input_tokens"});
            int64_t cached = token_field(*last_usage, {"cached_input_tokens"});
            accumulate(sum_last.input_tokens, std::max<int64_t>(0, input - cached));
            accumulate(sum_last.cache_read_tokens, cached);
            accumulate(sum_last.output_tokens, token_field(*last_usage, {"output_tokens"}) +
                                               token_field(*last_usage, {"reasoning_output_tokens"}));
            accumulate(sum_last.total_tokens, token_field(*last_usage, {"total_tokens"}));
            ++stats.usage_events;
        }
    }

    stats.tokens = has_total ? max_total : sum_last;
    stats.tokens.total_tokens = std::max(stats.tokens.total_tokens, stats.tokens.breakdown_total());
    if (stats.session_id.empty()) {
        stats.session_id = session_id_from_file_name(file_name);
    }
    range.apply(stats);
    return stats;
}

SessionStats AdditiveMessageFormat::extract(std::istream& in, const std::string& file_name) const {
    SessionStats stats;
    TimestampRange range;

    std::string line;
    while (std::getline(in, line)) {
        auto parsed = parse_object_line(line);
        if (!parsed) continue;
        const auto& event = *parsed;

        range.observe(event);
        if (stats.cwd.empty()) {
            if (auto cwd = string_field(event, "cwd")) stats.cwd = *cwd;
        }
        if (stats.session_id.empty()) {
            if (auto id = first_string(event, {"sessionId", "session_id"})) stats.session_id = *id;
        }

        const nlohmann::json* message = object_field(event, {"message"});
        if (message) {
            auto model = first_string(*message, {"model", "modelId", "model_id", "modelName"});
            if (model && is_real_model(*model)) stats.model = *model;
        }
        if (auto model = first_string(event, {"model", "modelId", "model_id"})) {
            if (is_real_model(*model) && stats.model.empty()) stats.model = *model;
        }

        const nlohmann::json* usage = message ? object_field(*message, {"usage"}) : nullptr;
        if (!usage) continue;

        int64_t input = token_field(*usage, {"input_tokens"});
        int64_t output = token_field(*usage, {"output_tokens"});
        int64_t cache_write = token_field(*usage, {"cache_creation_input_tokens"});
        int64_t cache_read = token_field(*usage, {"cache_read_input_tokens"});

        accumulate(stats.tokens.input_tokens, input);
        accumulate(stats.tokens.output_tokens, output);
        accumulate(stats.tokens.cache_write_tokens, cache_write);
        accumulate(stats.tokens.cache_read_tokens, cache_read);
        accumulate(stats.tokens.total_tokens, input + output + cache_write + cache_read);
        ++stats.usage_events;
    }

    if (stats.session_id.empty()) {
        stats.session_id = session_id_from_file_name(file_name);
    }
    range.apply(stats);
    return stats;
}

const ISessionLogFormat& format_for(ToolType tool) {
    static const CumulativeCounterFormat codex_format;
    static const AdditiveMessageFormat claude_format;
    if (tool == ToolType::Codex) {
        return codex_format;
    }
    return claude_format;
}

}
