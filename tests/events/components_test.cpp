#include "dsync/events/components.hpp"
#include "dsync/events/event_bus.hpp"
#include "dsync/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace dsync::events;

TEST(MetricsComponentTest, TracksRunAndTransferCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(SyncStartedEvent{1, "photos"});
    bus.emit(ScanCompletedEvent{"photos", 5, 1, 3, 1});
    bus.emit(FileDownloadCompletedEvent{"photos", "a.bin", 4096, 1024, 2, std::chrono::milliseconds{30}});
    bus.emit(FileDownloadCompletedEvent{"photos", "b.bin", 100, 100, 0, std::chrono::milliseconds{5}});
    bus.emit(FileDownloadFailedEvent{"photos", "c.bin", dsync::ErrorKind::Integrity, "checksum mismatch"});
    bus.emit(FileSkippedEvent{"photos", "d.bin", "up to date"});
    bus.emit(SyncFailedEvent{"photos", dsync::ErrorKind::Authentication, "HTTP 401"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.runs_started.load(), 1u);
    EXPECT_EQ(stats.runs_failed.load(), 1u);
    EXPECT_EQ(stats.files_scanned.load(), 5u);
    EXPECT_EQ(stats.files_downloaded.load(), 2u);
    EXPECT_EQ(stats.bytes_downloaded.load(), 4196u);
    EXPECT_EQ(stats.bytes_transferred.load(), 1124u);
    EXPECT_EQ(stats.retries.load(), 2u);
    EXPECT_EQ(stats.files_failed.load(), 1u);
    EXPECT_EQ(stats.files_skipped.load(), 1u);
}

TEST(MetricsComponentTest, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        EXPECT_EQ(bus.subscriber_count<FileSkippedEvent>(), 1u);
    }
    EXPECT_EQ(bus.subscriber_count<FileSkippedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<SyncStartedEvent>(), 0u);
}

TEST(LoggerComponentTest, SubscribesAndReleases) {
    EventBus bus;
    {
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<SyncStartedEvent>(), 1u);
        EXPECT_EQ(bus.subscriber_count<FileDownloadFailedEvent>(), 1u);
        EXPECT_NO_THROW(bus.emit(FileDownloadStartedEvent{"photos", "a.bin", 512, 1024}));
    }
    EXPECT_EQ(bus.subscriber_count<SyncStartedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<FileDownloadFailedEvent>(), 0u);
}
