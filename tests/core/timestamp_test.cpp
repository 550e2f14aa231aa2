#include "dsync/core/timestamp.hpp"

#include "support/test_utils.hpp"

#include <gtest/gtest.h>

using dsync::naive_from_fields;
using dsync::parse_iso8601_naive;

TEST(TimestampTest, OffsetIsStripped) {
    const auto expected = naive_from_fields(2024, 1, 2, 0, 0, 0);
    EXPECT_EQ(parse_iso8601_naive("2024-01-02T00:00:00Z"), expected);
    EXPECT_EQ(parse_iso8601_naive("2024-01-02T00:00:00+05:30"), expected);
    EXPECT_EQ(parse_iso8601_naive("2024-01-02T00:00:00-0800"), expected);
    EXPECT_EQ(parse_iso8601_naive("2024-01-02 00:00:00"), expected);
}

TEST(TimestampTest, FractionalSecondsKeepMicroseconds) {
    const auto parsed = parse_iso8601_naive("2024-01-02T00:00:00.250Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, naive_from_fields(2024, 1, 2, 0, 0, 0, 250000));
}

TEST(TimestampTest, RemoteAfterLocalWallClock) {
    // Remote 2024-01-02T00:00:00Z against local naive 2024-01-01T23:00:00
    const auto remote = parse_iso8601_naive("2024-01-02T00:00:00Z");
    const auto local = naive_from_fields(2024, 1, 1, 23, 0, 0);
    ASSERT_TRUE(remote.has_value());
    EXPECT_GT(*remote, local);
}

TEST(TimestampTest, MalformedInputIsRejected) {
    EXPECT_FALSE(parse_iso8601_naive("").has_value());
    EXPECT_FALSE(parse_iso8601_naive("yesterday").has_value());
    EXPECT_FALSE(parse_iso8601_naive("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(parse_iso8601_naive("2024-01-01T00:00").has_value());
    EXPECT_FALSE(parse_iso8601_naive("2024-01-01T00:00:00.Z").has_value());
    EXPECT_FALSE(parse_iso8601_naive("2024-01-01T00:00:00Zjunk").has_value());
}

TEST(TimestampTest, LocalMtimeReadsWallClock) {
    const auto dir = dsync::testing::create_temp_dir("dsync_time");
    const auto file = dir / "note.txt";
    dsync::testing::write_file(file, "x");
    ASSERT_TRUE(dsync::testing::set_local_mtime(file, 2023, 6, 15, 12, 30, 45));

    const auto mtime = dsync::local_mtime_naive(file);
    ASSERT_TRUE(mtime.has_value());
    EXPECT_EQ(*mtime, naive_from_fields(2023, 6, 15, 12, 30, 45));
    EXPECT_EQ(dsync::format_naive(*mtime), "2023-06-15T12:30:45");
}

TEST(TimestampTest, MissingFileHasNoMtime) {
    EXPECT_FALSE(dsync::local_mtime_naive("/nonexistent/dsync/file").has_value());
}
