#include <gtest/gtest.h>
#include <core/time_utils.hpp>

TEST(TimeUtils, FormatDurationEmpty) {
    EXPECT_EQ(format_duration(""), "-");
}

TEST(TimeUtils, FormatDurationBadParse) {
    EXPECT_EQ(format_duration("not-a-date"), "?");
}

TEST(TimeUtils, FormatDurationSeconds) {
    EXPECT_EQ(format_duration("2025-01-15T10:00:00", "2025-01-15T10:00:45"), "45s");
}

TEST(TimeUtils, FormatDurationMinutes) {
    EXPECT_EQ(format_duration("2025-01-15T10:00:00", "2025-01-15T10:05:30"), "5m30s");
}

TEST(TimeUtils, FormatDurationHours) {
    EXPECT_EQ(format_duration("2025-01-15T10:00:00", "2025-01-15T12:15:00"), "2h15m");
}

TEST(TimeUtils, FormatDurationNegativeClampsToZero) {
    EXPECT_EQ(format_duration("2025-01-15T10:00:10", "2025-01-15T10:00:00"), "0s");
}

TEST(TimeUtils, SecondsBetween) {
    auto s = seconds_between("2025-01-15T10:00:00", "2025-01-15T10:01:30");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(*s, 90);

    auto neg = seconds_between("2025-01-15T10:01:30", "2025-01-15T10:00:00");
    ASSERT_TRUE(neg.has_value());
    EXPECT_EQ(*neg, -90);

    EXPECT_FALSE(seconds_between("garbage", "2025-01-15T10:00:00").has_value());
}

TEST(TimeUtils, IsIsoTimestamp) {
    EXPECT_TRUE(is_iso_timestamp("2025-01-15T10:00:00"));
    EXPECT_FALSE(is_iso_timestamp(""));
    EXPECT_FALSE(is_iso_timestamp("yesterday"));
}

TEST(TimeUtils, FormatClock) {
    EXPECT_EQ(format_clock(""), "-");
    EXPECT_EQ(format_clock("garbage"), "?");
    EXPECT_EQ(format_clock("2025-01-15T14:35:22"), "14:35:22");
}
