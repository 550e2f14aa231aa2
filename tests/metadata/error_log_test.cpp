#include "dsync/metadata/error_log.hpp"

#include <gtest/gtest.h>

using dsync::Error;
using dsync::ErrorKind;
using dsync::metadata::Database;
using dsync::metadata::ErrorLog;

TEST(ErrorLogTest, EntriesAreNewestFirst) {
    auto db = Database::open(":memory:");
    ASSERT_TRUE(db.is_ok());
    ErrorLog log(*db.value());

    ASSERT_TRUE(log.append(1, "a.bin", Error{ErrorKind::TransientTransport, "reset"}, 3).is_ok());
    ASSERT_TRUE(log.append(1, "b.bin", Error{ErrorKind::Integrity, "checksum mismatch"}, 0).is_ok());
    ASSERT_TRUE(log.append(2, "c.bin", Error{ErrorKind::NotFound, "gone"}, 0).is_ok());

    auto entries = log.list_by_task(1);
    ASSERT_TRUE(entries.is_ok());
    ASSERT_EQ(entries.value().size(), 2u);

    const auto& newest = entries.value()[0];
    EXPECT_EQ(newest.file_path, "b.bin");
    EXPECT_EQ(newest.kind, "IntegrityError");
    EXPECT_EQ(newest.message, "checksum mismatch");
    EXPECT_EQ(newest.retry_count, 0u);
    EXPECT_FALSE(newest.timestamp.empty());

    const auto& oldest = entries.value()[1];
    EXPECT_EQ(oldest.kind, "TransientTransportError");
    EXPECT_EQ(oldest.retry_count, 3u);
}

TEST(ErrorLogTest, LimitTruncatesToMostRecent) {
    auto db = Database::open(":memory:");
    ASSERT_TRUE(db.is_ok());
    ErrorLog log(*db.value());

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(log.append(1, "f" + std::to_string(i), Error{ErrorKind::Remote, "denied"}, 0).is_ok());
    }

    auto entries = log.list_by_task(1, 2);
    ASSERT_TRUE(entries.is_ok());
    ASSERT_EQ(entries.value().size(), 2u);
    EXPECT_EQ(entries.value()[0].file_path, "f4");
    EXPECT_EQ(entries.value()[1].file_path, "f3");
}
