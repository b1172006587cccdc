#include "usage/usage_engine.h"
#include "config/tool_defaults.h"
#include "core/debug_log.h"
#include "core/time_util.h"
#include "usage/ledger_store.h"
#include "usage/lock_file.h"
#include "usage/profile_binder.h"
#include "usage/session_parser.h"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <sys/stat.h>

namespace codenv {

namespace {

struct FileStat {
    double mtime_ms = 0.0;
    uint64_t size = 0;
};

std::optional<FileStat> stat_file(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return std::nullopt;
    }
    FileStat out;
    out.mtime_ms = static_cast<double>(st.st_mtim.tv_sec) * 1000.0 +
                   static_cast<double>(st.st_mtim.tv_nsec) / 1000000.0;
    out.size = static_cast<uint64_t>(st.st_size);
    return out;
}

// *.jsonl below `root`, skipping dot-entries. Sorted for a stable scan order.
std::vector<std::string> collect_session_files(const std::string& root) {
    namespace fs = std::filesystem;
    std::vector<std::string> files;
    if (root.empty()) return files;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) return files;

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    while (!ec && it != end) {
        const auto& entry = *it;
        std::string name = entry.path().filename().string();
        if (!name.empty() && name[0] == '.') {
            if (entry.is_directory(ec)) {
                it.disable_recursion_pending();
            }
        } else if (entry.is_regular_file(ec) && entry.path().extension() == ".jsonl") {
            files.push_back(entry.path().string());
        }
        it.increment(ec);
    }
    std::sort(files.begin(), files.end());
    return files;
}

TokenCounters file_counters(const UsageState& state, const std::string& file) {
    auto it = state.files.find(file);
    return it != state.files.end() ? it->second.tokens : TokenCounters{};
}

// What the statusline path has recorded for the same session.
TokenCounters session_counters(const UsageState& state, ToolType tool,
                               const std::string& session_id) {
    if (session_id.empty()) return TokenCounters{};
    auto it = state.sessions.find(session_state_key(tool, session_id));
    return it != state.sessions.end() ? it->second.tokens : TokenCounters{};
}

// What transcript scans have recorded for the same session.
TokenCounters transcript_counters(const UsageState& state, ToolType tool,
                                  const std::string& session_id) {
    TokenCounters merged;
    for (const auto& [path, entry] : state.files) {
        if (entry.session_id == session_id && entry.type == tool_name(tool)) {
            merged = merge_maxima(merged, entry.tokens);
        }
    }
    return merged;
}

nlohmann::json counters_json(const TokenCounters& t) {
    return nlohmann::json{
        {"inputTokens", t.input_tokens},
        {"outputTokens", t.output_tokens},
        {"cacheReadTokens", t.cache_read_tokens},
        {"cacheWriteTokens", t.cache_write_tokens},
        {"totalTokens", t.total_tokens},
    };
}

}

const char* record_status_name(RecordStatus status) {
    switch (status) {
        case RecordStatus::Recorded: return "recorded";
        case RecordStatus::NoDelta: return "no-delta";
        case RecordStatus::Skipped: return "skipped";
        case RecordStatus::LockBusy: return "lock-busy";
        case RecordStatus::WriteFailed: return "write-failed";
    }
    return "unknown";
}

UsageEngine::UsageEngine(UsageConfig config)
    : config_(std::move(config))
    , default_model_(tool_default_model)
{
}

void UsageEngine::set_default_model_lookup(DefaultModelLookup lookup) {
    default_model_ = std::move(lookup);
}

std::string UsageEngine::resolve_model(ToolType tool, const std::string& observed) const {
    if (!observed.empty()) return observed;
    if (!default_model_) return std::string();
    return default_model_(tool).value_or(std::string());
}

void UsageEngine::debug(const nlohmann::json& payload) const {
    if (!usage_debug_enabled()) return;
    append_usage_debug(usage_debug_path(config_dir(config_)), payload);
}

SyncReport UsageEngine::sync_from_session_logs() {
    SyncReport report;
    auto lock = LockFile::acquire(lock_path(config_));
    if (!lock) {
        report.lock_busy = true;
        return report;
    }

    ProfileBindingLog binding_log(binding_log_path(config_));
    ProfileBinder binder(binding_log.read_entries(), &config_);

    StateStore store(state_path(config_));
    UsageState state = store.load();

    for (ToolType tool : {ToolType::Codex, ToolType::Claude}) {
        for (const auto& file : collect_session_files(sessions_path(config_, tool))) {
            sync_file(file, tool, binder, state, report);
        }
    }

    if (!store.save(state)) {
        fprintf(stderr, "codenv: failed to save usage state %s\n", store.path().c_str());
    }

    debug({
        {"event", "sync"},
        {"ts", format_iso8601(std::chrono::system_clock::now())},
        {"files", report.files_seen},
        {"unchanged", report.files_unchanged},
        {"unbound", report.files_unbound},
        {"ambiguous", report.files_ambiguous},
        {"appended", report.records_appended},
        {"resets", report.resets},
    });
    return report;
}

void UsageEngine::sync_file(const std::string& file, ToolType tool, const ProfileBinder& binder,
                            UsageState& state, SyncReport& report) {
    auto st = stat_file(file);
    if (!st) return;
    ++report.files_seen;

    auto prev_it = state.files.find(file);
    if (prev_it != state.files.end() &&
        prev_it->second.mtime_ms == st->mtime_ms &&
        prev_it->second.size == st->size) {
        ++report.files_unchanged;
        return;
    }

    auto stats = format_for(tool).extract(std::filesystem::path(file));
    if (!stats) {
        ++report.files_failed;
        return;
    }

    // Unbound transcripts keep no state, so a later binding still counts
    // everything seen so far.
    BindingResult binding = binder.resolve(tool, file, stats->session_id);
    if (!binding.match) {
        if (binding.ambiguous) {
            ++report.files_ambiguous;
        } else {
            ++report.files_unbound;
        }
        return;
    }

    UsageDelta delta = compute_delta(UsageObservation::from_counters(stats->tokens),
                                     file_counters(state, file),
                                     session_counters(state, tool, stats->session_id));
    if (delta.reset) ++report.resets;

    std::string model = resolve_model(tool, stats->model);
    if (delta.should_emit()) {
        UsageRecord record;
        record.ts = !stats->end_ts.empty() ? stats->end_ts
                  : !stats->start_ts.empty() ? stats->start_ts
                  : format_iso8601(std::chrono::system_clock::now());
        record.type = tool_name(tool);
        record.profile_key = binding.match->profile_key;
        record.profile_name = binding.match->profile_name;
        record.model = model;
        record.session_id = stats->session_id;
        record.tokens = delta.tokens;
        if (!LedgerStore(ledger_path(config_)).append(record)) {
            // Leave the state untouched so the delta is retried next sync.
            ++report.files_failed;
            return;
        }
        ++report.records_appended;
    }

    CounterState entry;
    entry.mtime_ms = st->mtime_ms;
    entry.size = st->size;
    entry.type = tool_name(tool);
    entry.tokens = stats->tokens;
    entry.start_ts = stats->start_ts;
    entry.end_ts = stats->end_ts;
    entry.cwd = stats->cwd;
    entry.model = model;
    entry.session_id = stats->session_id;
    state.files[file] = entry;

    debug({
        {"event", "file"},
        {"file", file},
        {"type", tool_name(tool)},
        {"profileKey", binding.match->profile_key},
        {"sessionId", stats->session_id},
        {"reset", delta.reset},
        {"observed", counters_json(stats->tokens)},
        {"delta", counters_json(delta.tokens)},
    });
}

RecordStatus UsageEngine::record_incremental_usage(const UsageContext& ctx,
                                                   const std::string& session_id,
                                                   const UsageObservation& totals,
                                                   const std::string& model) {
    if (!ctx.has_profile() || session_id.empty() || totals.empty()) {
        return RecordStatus::Skipped;
    }

    auto lock = LockFile::acquire(lock_path(config_));
    if (!lock) {
        return RecordStatus::LockBusy;
    }

    std::string profile_key = ctx.profile_key;
    std::string profile_name = ctx.profile_name;
    if (const ProfileConfig* profile = find_profile(config_, profile_key)) {
        profile_name = profile_display_name(profile_key, *profile, ctx.tool);
    }
    if (profile_name.empty()) profile_name = profile_key;

    StateStore store(state_path(config_));
    UsageState state = store.load();
    std::string key = session_state_key(ctx.tool, session_id);

    CounterState entry;
    auto session_it = state.sessions.find(key);
    bool first_seen = session_it == state.sessions.end();
    if (!first_seen) {
        entry = session_it->second;
    }
    const TokenCounters own = entry.tokens;

    UsageDelta delta = compute_delta(totals, own, transcript_counters(state, ctx.tool, session_id));
    std::string now = format_iso8601(std::chrono::system_clock::now());
    std::string resolved_model = resolve_model(ctx.tool, model.empty() ? entry.model : model);

    RecordStatus status = RecordStatus::NoDelta;
    if (delta.should_emit()) {
        UsageRecord record;
        record.ts = now;
        record.type = tool_name(ctx.tool);
        record.profile_key = profile_key;
        record.profile_name = profile_name;
        record.model = resolved_model;
        record.session_id = session_id;
        record.tokens = delta.tokens;
        if (!LedgerStore(ledger_path(config_)).append(record)) {
            return RecordStatus::WriteFailed;
        }
        status = RecordStatus::Recorded;
    }

    entry.type = tool_name(ctx.tool);
    entry.tokens = advance_counters(own, totals);
    if (entry.start_ts.empty()) entry.start_ts = now;
    entry.end_ts = now;
    if (!ctx.cwd.empty()) entry.cwd = ctx.cwd;
    entry.model = resolved_model;
    entry.session_id = session_id;
    state.sessions[key] = entry;

    if (!store.save(state)) {
        fprintf(stderr, "codenv: failed to save usage state %s\n", store.path().c_str());
    }

    // Lets a later transcript scan attribute this session to the same profile.
    if (first_seen) {
        UsageContext bound = ctx;
        bound.profile_name = profile_name;
        ProfileBindingLog binding_log(binding_log_path(config_));
        if (!binding_log.append_session(bound, "", session_id, now, config_.config_path)) {
            fprintf(stderr, "codenv: cannot append to profile log %s\n", binding_log.path().c_str());
        }
    }

    debug({
        {"event", "statusline"},
        {"type", tool_name(ctx.tool)},
        {"profileKey", profile_key},
        {"sessionId", session_id},
        {"reset", delta.reset},
        {"status", record_status_name(status)},
        {"delta", counters_json(delta.tokens)},
    });
    return status;
}

std::vector<UsageRecord> UsageEngine::read_ledger() const {
    return LedgerStore(ledger_path(config_)).read_all();
}

UsageTotalsIndex UsageEngine::read_totals_index(bool sync) {
    if (sync) sync_from_session_logs();
    return build_totals_index(read_ledger());
}

CostIndex UsageEngine::read_cost_index(bool sync) {
    if (sync) sync_from_session_logs();
    return build_cost_index(read_ledger(), config_);
}

ClearResult UsageEngine::clear_history() {
    namespace fs = std::filesystem;
    ClearResult result;
    for (const auto& path : {ledger_path(config_), state_path(config_), lock_path(config_)}) {
        if (path.empty()) continue;
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            result.missing.push_back(path);
            continue;
        }
        if (fs::remove(path, ec) && !ec) {
            result.removed.push_back(path);
        } else {
            result.failed.push_back(path);
        }
    }
    return result;
}

}
