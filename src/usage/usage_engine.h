#pragma once

#include "config/usage_config.h"
#include "core/tool_type.h"
#include "core/usage_context.h"
#include "usage/cost_index.h"
#include "usage/delta_engine.h"
#include "usage/state_store.h"
#include "usage/usage_record.h"
#include "usage/usage_totals.h"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace codenv {

class ProfileBinder;

struct SyncReport {
    bool lock_busy = false;
    size_t files_seen = 0;
    size_t files_unchanged = 0;
    size_t files_unbound = 0;
    size_t files_ambiguous = 0;
    size_t files_failed = 0;
    size_t records_appended = 0;
    size_t resets = 0;
};

enum class RecordStatus {
    Recorded,
    NoDelta,
    Skipped,
    LockBusy,
    WriteFailed
};

const char* record_status_name(RecordStatus status);

struct ClearResult {
    std::vector<std::string> removed;
    std::vector<std::string> missing;
    std::vector<std::string> failed;
};

// Entry point for both ingestion paths. Every mutation of the ledger and the
// state document happens under the lock file and is skipped, not retried,
// when the lock is held elsewhere.
class UsageEngine {
public:
    using DefaultModelLookup = std::function<std::optional<std::string>(ToolType)>;

    explicit UsageEngine(UsageConfig config);

    const UsageConfig& config() const { return config_; }

    // Defaults to tool_default_model().
    void set_default_model_lookup(DefaultModelLookup lookup);

    // Rescans every transcript under the configured session directories and
    // appends one record per changed, unambiguously bound transcript.
    SyncReport sync_from_session_logs();

    // Statusline path: fresh cumulative totals for one live session.
    RecordStatus record_incremental_usage(const UsageContext& ctx,
                                          const std::string& session_id,
                                          const UsageObservation& totals,
                                          const std::string& model = "");

    std::vector<UsageRecord> read_ledger() const;

    UsageTotalsIndex read_totals_index(bool sync);
    CostIndex read_cost_index(bool sync);

    // Deletes the ledger, the state document and the lock file.
    ClearResult clear_history();

private:
    void sync_file(const std::string& file, ToolType tool, const ProfileBinder& binder,
                   UsageState& state, SyncReport& report);
    std::string resolve_model(ToolType tool, const std::string& observed) const;
    void debug(const nlohmann::json& payload) const;

    UsageConfig config_;
    DefaultModelLookup default_model_;
};

}
