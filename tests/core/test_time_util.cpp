#include <gtest/gtest.h>
#include "core/time_util.h"

using namespace codenv;

TEST(TimeUtilTest, ParsesUtcWithMilliseconds) {
    auto tp = parse_iso8601("2025-01-02T03:04:05.678Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(format_iso8601(*tp), "2025-01-02T03:04:05.678Z");
}

TEST(TimeUtilTest, AppliesOffset) {
    auto local = parse_iso8601("2025-01-02T05:00:00+02:00");
    auto utc = parse_iso8601("2025-01-02T03:00:00Z");
    ASSERT_TRUE(local.has_value());
    ASSERT_TRUE(utc.has_value());
    EXPECT_EQ(*local, *utc);
}

TEST(TimeUtilTest, NegativeOffset) {
    auto tp = parse_iso8601("2025-01-01T22:30:00-01:30");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(format_iso8601(*tp), "2025-01-02T00:00:00.000Z");
}

TEST(TimeUtilTest, RejectsGarbage) {
    EXPECT_FALSE(parse_iso8601("").has_value());
    EXPECT_FALSE(parse_iso8601("yesterday").has_value());
    EXPECT_FALSE(parse_iso8601("2025-01-02").has_value());
}

TEST(TimeUtilTest, DayWindowContainsNow) {
    auto now = std::chrono::system_clock::now();
    DayWindow window = local_day_window(now);
    EXPECT_TRUE(window.contains(now));
    EXPECT_FALSE(window.contains(window.end));
    EXPECT_TRUE(window.contains(window.start));
    EXPECT_FALSE(window.contains(now - std::chrono::hours(49)));
}
