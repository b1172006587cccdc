#include <gtest/gtest.h>
#include "usage/pricing.h"

using namespace codenv;

namespace {

UsageTokenBreakdown breakdown(double input, double output, double cache_read, double cache_write) {
    UsageTokenBreakdown b;
    b.input_tokens = input;
    b.output_tokens = output;
    b.cache_read_tokens = cache_read;
    b.cache_write_tokens = cache_write;
    b.total_tokens = input + output + cache_read + cache_write;
    return b;
}

}

TEST(PricingTest, BuiltInModelsMatchLoosely) {
    UsageConfig config;
    auto sonnet = lookup_model_pricing(config, "claude sonnet 4.5");
    ASSERT_TRUE(sonnet.has_value());
    EXPECT_DOUBLE_EQ(sonnet->input.value_or(0), 3.0);
    EXPECT_DOUBLE_EQ(sonnet->cache_write.value_or(0), 3.75);

    auto codex = lookup_model_pricing(config, "GPT-5.1-Codex");
    ASSERT_TRUE(codex.has_value());
    EXPECT_DOUBLE_EQ(codex->cache_read.value_or(0), 0.125);
    EXPECT_FALSE(codex->cache_write.has_value());

    EXPECT_FALSE(lookup_model_pricing(config, "mystery-model").has_value());
    EXPECT_FALSE(lookup_model_pricing(config, "").has_value());
}

TEST(PricingTest, ConfigEntryOverridesBuiltInFields) {
    UsageConfig config;
    TokenPricing custom;
    custom.output = 20.0;
    config.pricing_models["gpt-5.1"] = custom;

    auto pricing = lookup_model_pricing(config, "gpt-5.1");
    ASSERT_TRUE(pricing.has_value());
    EXPECT_DOUBLE_EQ(pricing->input.value_or(0), 1.25);
    EXPECT_DOUBLE_EQ(pricing->output.value_or(0), 20.0);
}

TEST(PricingTest, ProfileLayersAndMultiplier) {
    UsageConfig config;
    ProfileConfig profile;
    ProfilePricing pp;
    pp.model = "Claude Opus 4.5";
    pp.overrides.input = 4.0;
    pp.multiplier = 2.0;
    profile.pricing = pp;

    // The profile model beats the record's model hint; explicit prices beat both.
    auto pricing = resolve_pricing(config, &profile, "claude-haiku-4-5-20251001");
    ASSERT_TRUE(pricing.has_value());
    EXPECT_DOUBLE_EQ(pricing->input.value_or(0), 8.0);
    EXPECT_DOUBLE_EQ(pricing->output.value_or(0), 50.0);
    EXPECT_DOUBLE_EQ(pricing->cache_read.value_or(0), 1.0);
}

TEST(PricingTest, NegativeMultiplierIgnored) {
    UsageConfig config;
    ProfileConfig profile;
    ProfilePricing pp;
    pp.multiplier = -1.0;
    profile.pricing = pp;
    auto pricing = resolve_pricing(config, &profile, "gpt-5.2");
    ASSERT_TRUE(pricing.has_value());
    EXPECT_DOUBLE_EQ(pricing->input.value_or(0), 1.75);
}

TEST(PricingTest, NoPriceAnywhere) {
    UsageConfig config;
    EXPECT_FALSE(resolve_pricing(config, nullptr, "unknown").has_value());
    EXPECT_FALSE(resolve_pricing(config, nullptr, "").has_value());
}

TEST(PricingTest, CostPerMillionTokens) {
    TokenPricing pricing;
    pricing.input = 3.0;
    pricing.output = 15.0;
    pricing.cache_read = 0.3;
    pricing.cache_write = 3.75;
    auto cost = calculate_cost(breakdown(1000000, 100000, 2000000, 0), pricing);
    ASSERT_TRUE(cost.has_value());
    EXPECT_NEAR(*cost, 3.0 + 1.5 + 0.6, 1e-9);
}

TEST(PricingTest, MissingPriceForUsedCategoryMeansNoCost) {
    TokenPricing pricing;
    pricing.input = 1.25;
    pricing.output = 10.0;
    EXPECT_FALSE(calculate_cost(breakdown(1000, 1000, 500, 0), pricing).has_value());
    EXPECT_TRUE(calculate_cost(breakdown(1000, 1000, 0, 0), pricing).has_value());
}

TEST(PricingTest, TotalWithoutBreakdownIsUnpriced) {
    TokenPricing pricing;
    pricing.input = 1.0;
    pricing.output = 1.0;
    UsageTokenBreakdown b = breakdown(0, 0, 0, 0);
    b.total_tokens = 500;
    EXPECT_FALSE(calculate_cost(b, pricing).has_value());
    EXPECT_FALSE(calculate_cost(UsageTokenBreakdown{}, pricing).has_value());
}

TEST(FormatTest, UsdAmounts) {
    EXPECT_EQ(format_usd_amount(std::nullopt), "-");
    EXPECT_EQ(format_usd_amount(12.5), "$12.5");
    EXPECT_EQ(format_usd_amount(3.0), "$3");
    EXPECT_EQ(format_usd_amount(0.25), "$0.25");
    EXPECT_EQ(format_usd_amount(0.0512), "$0.0512");
    EXPECT_EQ(format_usd_amount(0.001234), "$0.001234");
    EXPECT_EQ(format_usd_amount(0.0), "$0");
}

TEST(FormatTest, TokenCounts) {
    EXPECT_EQ(format_token_count(std::nullopt), "-");
    EXPECT_EQ(format_token_count(999), "999");
    EXPECT_EQ(format_token_count(1500), "1.50K");
    EXPECT_EQ(format_token_count(2000000), "2.00M");
    EXPECT_EQ(format_token_count(3000000000.0), "3.00B");
}
