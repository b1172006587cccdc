#include <gtest/gtest.h>
#include "usage/cost_index.h"

using namespace codenv;

namespace {

UsageRecord make_record(const std::string& key, const std::string& model, TimePoint ts,
                        int64_t input, int64_t output, int64_t cache_read = 0) {
    UsageRecord r;
    r.ts = format_iso8601(ts);
    r.type = "codex";
    r.profile_key = key;
    r.profile_name = key;
    r.model = model;
    r.tokens.input_tokens = input;
    r.tokens.output_tokens = output;
    r.tokens.cache_read_tokens = cache_read;
    r.tokens.total_tokens = input + output + cache_read;
    return r;
}

}

TEST(CostIndexTest, SumsPricedRecords) {
    auto now = std::chrono::system_clock::now();
    DayWindow window = local_day_window(now);
    UsageConfig config;
    std::vector<UsageRecord> records = {
        make_record("codex-a", "gpt-5.1", window.start + std::chrono::minutes(5), 1000000, 0),
        make_record("codex-a", "gpt-5.1", window.start - std::chrono::hours(40), 0, 1000000),
    };

    CostIndex index = build_cost_index(records, config, now);
    auto cost = lookup_cost(index, "codex", "codex-a", "");
    ASSERT_TRUE(cost.has_value());
    ASSERT_TRUE(cost->today.has_value());
    ASSERT_TRUE(cost->total.has_value());
    EXPECT_NEAR(*cost->today, 1.25, 1e-9);
    EXPECT_NEAR(*cost->total, 11.25, 1e-9);
}

TEST(CostIndexTest, UnpricedRecordBlanksOnlyItsWindows) {
    auto now = std::chrono::system_clock::now();
    DayWindow window = local_day_window(now);
    UsageConfig config;
    std::vector<UsageRecord> records = {
        make_record("codex-a", "gpt-5.1", window.start + std::chrono::minutes(5), 1000000, 0),
        make_record("codex-a", "mystery", window.start - std::chrono::hours(40), 10, 10),
    };

    CostIndex index = build_cost_index(records, config, now);
    auto cost = lookup_cost(index, "codex", "codex-a", "");
    ASSERT_TRUE(cost.has_value());
    ASSERT_TRUE(cost->today.has_value());
    EXPECT_NEAR(*cost->today, 1.25, 1e-9);
    EXPECT_FALSE(cost->total.has_value());
}

TEST(CostIndexTest, ProfilePricingFromConfig) {
    auto now = std::chrono::system_clock::now();
    UsageConfig config;
    ProfileConfig profile;
    ProfilePricing pp;
    pp.model = "gpt-5.2";
    pp.multiplier = 0.5;
    profile.pricing = pp;
    config.profiles["codex-cheap"] = profile;

    CostIndex index = build_cost_index({make_record("codex-cheap", "", now, 2000000, 0)}, config, now);
    auto cost = lookup_cost(index, "codex", "codex-cheap", "");
    ASSERT_TRUE(cost.has_value());
    EXPECT_NEAR(cost->total.value_or(-1), 1.75, 1e-9);
}

TEST(CostIndexTest, RecordCostOfEmptyRecordIsZero) {
    UsageConfig config;
    UsageRecord empty;
    EXPECT_DOUBLE_EQ(record_cost(empty, config).value_or(-1), 0.0);
}
