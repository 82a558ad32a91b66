#include <gtest/gtest.h>
#include <core/time_utils.hpp>
#include <core/utils.hpp>

TEST(TimeUtils, FormatAgeEmpty) {
    EXPECT_EQ(format_age(""), "-");
}

TEST(TimeUtils, FormatAgeBadParse) {
    EXPECT_EQ(format_age("not-a-date"), "?");
}

TEST(TimeUtils, FormatAgeSeconds) {
    EXPECT_EQ(format_age("2025-01-15T10:00:00", "2025-01-15T10:00:45"), "45s");
}

TEST(TimeUtils, FormatAgeMinutes) {
    EXPECT_EQ(format_age("2025-01-15T10:00:00", "2025-01-15T10:05:30"), "5m30s");
}

TEST(TimeUtils, FormatAgeHours) {
    EXPECT_EQ(format_age("2025-01-15T10:00:00", "2025-01-15T12:15:00"), "2h15m");
}

TEST(TimeUtils, FormatAgeDays) {
    EXPECT_EQ(format_age("2025-01-15T10:00:00", "2025-01-18T14:00:00"), "3d4h");
}

TEST(TimeUtils, FormatAgeNeverNegative) {
    EXPECT_EQ(format_age("2025-01-15T10:00:00", "2025-01-15T09:00:00"), "0s");
}

TEST(TimeUtils, FormatTimestamp) {
    EXPECT_EQ(format_timestamp(""), "-");
    EXPECT_EQ(format_timestamp("garbage"), "?");
    EXPECT_EQ(format_timestamp("2025-01-15T14:35:22"), "2:35pm");
    EXPECT_EQ(format_timestamp("2025-01-15T00:00:00"), "12:00am");
}

TEST(TimeUtils, FormatElapsed) {
    EXPECT_EQ(format_elapsed(0), "0s");
    EXPECT_EQ(format_elapsed(7), "7s");
    EXPECT_EQ(format_elapsed(65), "1m05s");
    EXPECT_EQ(format_elapsed(-3), "0s");
}

TEST(TimeUtils, OlderThanDays) {
    EXPECT_TRUE(older_than_days("2000-01-01T00:00:00", 30));
    EXPECT_FALSE(older_than_days(now_iso(), 1));
    EXPECT_FALSE(older_than_days("garbage", 1));
}
