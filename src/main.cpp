#include <cstdio>
#include <cstring>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "config/usage_config.h"
#include "core/tool_type.h"
#include "core/usage_context.h"
#include "usage/cost_index.h"
#include "usage/pricing.h"
#include "usage/statusline_input.h"
#include "usage/usage_engine.h"
#include "usage/usage_totals.h"

using namespace codenv;

static void print_usage() {
    fprintf(stderr,
            "usage: codenv-usage [--config <path>] sync\n"
            "       codenv-usage totals <codex|claude> <profileKey> [profileName]\n"
            "       codenv-usage record <codex|claude> <profileKey> [profileName] < statusline.json\n"
            "       codenv-usage reset\n");
}

static int run_sync(UsageEngine& engine) {
    SyncReport report = engine.sync_from_session_logs();
    if (report.lock_busy) {
        printf("sync skipped: usage lock is held by another process\n");
        return 0;
    }
    printf("files: %zu (unchanged %zu, unbound %zu, ambiguous %zu, failed %zu)\n",
           report.files_seen, report.files_unchanged, report.files_unbound,
           report.files_ambiguous, report.files_failed);
    printf("records appended: %zu (resets %zu)\n", report.records_appended, report.resets);
    return 0;
}

static int run_totals(UsageEngine& engine, ToolType tool, const std::string& key,
                      const std::string& name) {
    UsageTotalsIndex totals_index = engine.read_totals_index(true);
    CostIndex cost_index = engine.read_cost_index(false);

    auto totals = lookup_totals(totals_index, tool_name(tool), key, name);
    if (!totals) {
        printf("no usage recorded for %s %s\n", tool_name(tool), key.c_str());
        return 0;
    }
    auto cost = lookup_cost(cost_index, tool_name(tool), key, name);
    std::optional<double> today_cost = cost ? cost->today : std::nullopt;
    std::optional<double> total_cost = cost ? cost->total : std::nullopt;

    printf("today: %s tokens (in %s, out %s, cache read %s, cache write %s) %s\n",
           format_token_count(static_cast<double>(totals->today)).c_str(),
           format_token_count(static_cast<double>(totals->today_input)).c_str(),
           format_token_count(static_cast<double>(totals->today_output)).c_str(),
           format_token_count(static_cast<double>(totals->today_cache_read)).c_str(),
           format_token_count(static_cast<double>(totals->today_cache_write)).c_str(),
           format_usd_amount(today_cost).c_str());
    printf("total: %s tokens (in %s, out %s, cache read %s, cache write %s) %s\n",
           format_token_count(static_cast<double>(totals->total)).c_str(),
           format_token_count(static_cast<double>(totals->total_input)).c_str(),
           format_token_count(static_cast<double>(totals->total_output)).c_str(),
           format_token_count(static_cast<double>(totals->total_cache_read)).c_str(),
           format_token_count(static_cast<double>(totals->total_cache_write)).c_str(),
           format_usd_amount(total_cost).c_str());
    return 0;
}

static int run_record(UsageEngine& engine, ToolType tool, const std::string& key,
                      const std::string& name) {
    std::string raw((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    auto input = nlohmann::json::parse(raw, nullptr, false);
    if (input.is_discarded() || !input.is_object()) {
        fprintf(stderr, "codenv-usage: statusline input is not a JSON object\n");
        return 1;
    }

    UsageContext ctx = context_from_environment(tool);
    ctx.profile_key = key;
    if (!name.empty()) ctx.profile_name = name;

    auto totals = parse_statusline_totals(tool, input);
    if (!totals) {
        printf("%s\n", record_status_name(RecordStatus::Skipped));
        return 0;
    }
    RecordStatus status = engine.record_incremental_usage(
        ctx, statusline_session_id(input), *totals, statusline_model(input));
    printf("%s\n", record_status_name(status));
    return status == RecordStatus::WriteFailed ? 1 : 0;
}

static int run_reset(UsageEngine& engine) {
    ClearResult result = engine.clear_history();
    for (const auto& path : result.removed) printf("removed %s\n", path.c_str());
    for (const auto& path : result.missing) printf("missing %s\n", path.c_str());
    for (const auto& path : result.failed) fprintf(stderr, "failed to remove %s\n", path.c_str());
    return result.failed.empty() ? 0 : 1;
}

int main(int argc, char** argv) {
    std::string explicit_config;
    if (argc >= 3 && std::strcmp(argv[1], "--config") == 0) {
        explicit_config = argv[2];
        argv[2] = argv[0];
        argv += 2;
        argc -= 2;
    }
    if (argc < 2) {
        print_usage();
        return 2;
    }
    std::string command = argv[1];

    std::string error;
    std::string config_path = find_config_path(explicit_config);
    auto config = read_config(config_path, &error);
    if (!config) {
        fprintf(stderr, "codenv-usage: %s\n", error.c_str());
        return 1;
    }
    UsageEngine engine(std::move(*config));

    if (command == "sync") {
        return run_sync(engine);
    }
    if (command == "reset") {
        return run_reset(engine);
    }
    if (command == "totals" || command == "record") {
        if (argc < 4) {
            print_usage();
            return 2;
        }
        auto tool = normalize_tool(argv[2]);
        if (!tool) {
            fprintf(stderr, "codenv-usage: unknown tool '%s'\n", argv[2]);
            return 2;
        }
        std::string key = argv[3];
        std::string name = argc > 4 ? argv[4] : "";
        if (command == "totals") {
            return run_totals(engine, *tool, key, name);
        }
        return run_record(engine, *tool, key, name);
    }

    print_usage();
    return 2;
}
