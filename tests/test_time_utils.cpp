#include <gtest/gtest.h>
#include <core/time_utils.hpp>

TEST(TimeUtils, FormatDurationNegative) {
    EXPECT_EQ(format_duration(-5), "-");
}

TEST(TimeUtils, FormatDurationZero) {
    EXPECT_EQ(format_duration(0), "0s");
}

TEST(TimeUtils, FormatDurationSeconds) {
    EXPECT_EQ(format_duration(45), "45s");
}

TEST(TimeUtils, FormatDurationMinutes) {
    EXPECT_EQ(format_duration(5 * 60 + 30), "5m30s");
}

TEST(TimeUtils, FormatDurationHours) {
    EXPECT_EQ(format_duration(2 * 3600 + 15 * 60), "2h15m");
}

TEST(TimeUtils, FormatDurationDays) {
    EXPECT_EQ(format_duration(3 * 86400 + 4 * 3600 + 59), "3d4h");
}

// ── uptime -p ──

TEST(TimeUtils, ParseUptimeMixedUnits) {
    EXPECT_EQ(parse_uptime_seconds("up 2 weeks, 6 hours, 20 minutes"),
              2 * 7 * 86400 + 6 * 3600 + 20 * 60);
}

TEST(TimeUtils, ParseUptimeSingular) {
    EXPECT_EQ(parse_uptime_seconds("up 1 day, 1 hour, 1 minute"), 86400 + 3600 + 60);
}

TEST(TimeUtils, ParseUptimeMinutesOnly) {
    EXPECT_EQ(parse_uptime_seconds("up 7 minutes"), 7 * 60);
}

TEST(TimeUtils, ParseUptimeGarbage) {
    EXPECT_EQ(parse_uptime_seconds(""), 0);
    EXPECT_EQ(parse_uptime_seconds("command not found"), 0);
}

// ── seconds_between ──

TEST(TimeUtils, SecondsBetween) {
    EXPECT_EQ(seconds_between("2025-01-15T10:00:00", "2025-01-15T10:05:30"), 330);
}

TEST(TimeUtils, SecondsBetweenBadStart) {
    EXPECT_EQ(seconds_between("not-a-date", "2025-01-15T10:00:00"), -1);
}

TEST(TimeUtils, SecondsBetweenDefaultsToNow) {
    EXPECT_GT(seconds_between("2020-01-01T00:00:00"), 0);
}
