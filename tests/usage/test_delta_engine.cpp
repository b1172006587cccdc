#include <gtest/gtest.h>
#include "usage/delta_engine.h"

using namespace codenv;

namespace {

TokenCounters counters(int64_t input, int64_t output, int64_t total) {
    TokenCounters c;
    c.input_tokens = input;
    c.output_tokens = output;
    c.total_tokens = total;
    return c;
}

UsageObservation observe(int64_t input, int64_t output) {
    UsageObservation obs;
    obs.input_tokens = input;
    obs.output_tokens = output;
    return obs;
}

}

TEST(DeltaEngineTest, GrowthEmitsDifference) {
    UsageDelta delta = compute_delta(observe(150, 80), counters(100, 50, 150));
    EXPECT_FALSE(delta.reset);
    EXPECT_EQ(delta.tokens.input_tokens, 50);
    EXPECT_EQ(delta.tokens.output_tokens, 30);
    EXPECT_EQ(delta.tokens.total_tokens, 80);
    EXPECT_TRUE(delta.should_emit());
}

TEST(DeltaEngineTest, AnyDecreaseIsReset) {
    UsageDelta delta = compute_delta(observe(10, 60), counters(100, 50, 150));
    EXPECT_TRUE(delta.reset);
    EXPECT_EQ(delta.tokens.input_tokens, 10);
    EXPECT_EQ(delta.tokens.output_tokens, 60);
    EXPECT_EQ(delta.tokens.total_tokens, 70);
}

TEST(DeltaEngineTest, UnchangedEmitsNothing) {
    UsageDelta delta = compute_delta(observe(100, 50), counters(100, 50, 150));
    EXPECT_FALSE(delta.reset);
    EXPECT_EQ(delta.tokens.total_tokens, 0);
    EXPECT_FALSE(delta.should_emit());
}

TEST(DeltaEngineTest, UnreportedFieldsDoNotTriggerReset) {
    UsageObservation obs;
    obs.total_tokens = 500;
    UsageDelta delta = compute_delta(obs, counters(100, 50, 150));
    EXPECT_FALSE(delta.reset);
    EXPECT_EQ(delta.tokens.input_tokens, 0);
    EXPECT_EQ(delta.tokens.output_tokens, 0);
    EXPECT_EQ(delta.tokens.total_tokens, 350);
}

TEST(DeltaEngineTest, FirstObservationCountsEverything) {
    UsageDelta delta = compute_delta(observe(7, 3), TokenCounters{});
    EXPECT_FALSE(delta.reset);
    EXPECT_EQ(delta.tokens.total_tokens, 10);
}

TEST(DeltaEngineTest, AdvanceStoresObservationNotSum) {
    TokenCounters previous = counters(100, 50, 150);
    previous.cache_read_tokens = 9;
    TokenCounters next = advance_counters(previous, observe(120, 60));
    EXPECT_EQ(next.input_tokens, 120);
    EXPECT_EQ(next.output_tokens, 60);
    EXPECT_EQ(next.total_tokens, 180);
    EXPECT_EQ(next.cache_read_tokens, 9);
}

TEST(DeltaEngineTest, MergeTakesFieldwiseMaximum) {
    TokenCounters merged = merge_maxima(counters(100, 10, 110), counters(50, 70, 120));
    EXPECT_EQ(merged.input_tokens, 100);
    EXPECT_EQ(merged.output_tokens, 70);
    EXPECT_EQ(merged.total_tokens, 120);
}

TEST(DeltaEngineTest, FreshBelowPeerIsNotReset) {
    TokenCounters own = counters(100, 50, 150);
    TokenCounters peer = counters(300, 90, 390);
    UsageDelta delta = compute_delta(observe(200, 60), own, peer);
    EXPECT_FALSE(delta.reset);
    EXPECT_EQ(delta.tokens.input_tokens, 0);
    EXPECT_EQ(delta.tokens.output_tokens, 0);
    EXPECT_FALSE(delta.should_emit());
}

TEST(DeltaEngineTest, GrowthAbovePeerEmitsFieldSum) {
    TokenCounters own = counters(100, 50, 150);
    TokenCounters peer = counters(300, 90, 900);
    UsageDelta delta = compute_delta(observe(320, 95), own, peer);
    EXPECT_FALSE(delta.reset);
    EXPECT_EQ(delta.tokens.input_tokens, 20);
    EXPECT_EQ(delta.tokens.output_tokens, 5);
    EXPECT_EQ(delta.tokens.total_tokens, 25);
}

TEST(DeltaEngineTest, OwnDecreaseIsResetEvenWithPeer) {
    TokenCounters own = counters(100, 50, 150);
    TokenCounters peer = counters(300, 90, 390);
    UsageDelta delta = compute_delta(observe(40, 10), own, peer);
    EXPECT_TRUE(delta.reset);
    EXPECT_EQ(delta.tokens.input_tokens, 40);
    EXPECT_EQ(delta.tokens.total_tokens, 50);
}

TEST(DeltaEngineTest, TotalOnlyObservationUsesPeerFloor) {
    UsageObservation obs;
    obs.total_tokens = 500;
    UsageDelta delta = compute_delta(obs, counters(0, 0, 100), counters(0, 0, 450));
    EXPECT_FALSE(delta.reset);
    EXPECT_EQ(delta.tokens.total_tokens, 50);
}
