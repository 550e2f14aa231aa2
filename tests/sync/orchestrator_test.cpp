#include "dsync/sync/orchestrator.hpp"

#include "dsync/events/event_bus.hpp"
#include "dsync/events/events.hpp"
#include "dsync/metadata/database.hpp"
#include "dsync/sync/file_transfer.hpp"
#include "support/fake_drive.hpp"
#include "support/test_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <thread>

namespace fs = std::filesystem;
using dsync::ErrorKind;
using dsync::events::EventBus;
using dsync::metadata::Database;
using dsync::metadata::ErrorLog;
using dsync::metadata::ProgressStore;
using dsync::metadata::RemoteFileRecord;
using dsync::metadata::SyncTask;
using dsync::sync::BatchOrchestrator;
using dsync::sync::BatchStats;
using dsync::sync::ChunkedDownloader;
using dsync::sync::DownloadOptions;
using dsync::sync::FileTransferJob;
using dsync::sync::TransferControl;
using dsync::testing::FakeDrive;

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto opened = Database::open(":memory:");
        ASSERT_TRUE(opened.is_ok()) << opened.error().message;
        db_ = std::move(opened.value());
        progress_ = std::make_unique<ProgressStore>(*db_);
        errors_ = std::make_unique<ErrorLog>(*db_);

        dir_ = dsync::testing::create_temp_dir("dsync_batch");
        task_.id = 1;
        task_.name = "docs";
        task_.remote_root_id = "root";
        task_.local_root = dir_.string();
        task_.concurrency = 1;
        task_.retry_count = 0;
    }

    void TearDown() override { fs::remove_all(dir_); }

    std::vector<RemoteFileRecord> add_files(std::size_t count, std::size_t size) {
        std::vector<RemoteFileRecord> files;
        for (std::size_t i = 0; i < count; ++i) {
            const auto id = "f" + std::to_string(i);
            files.push_back(drive_.add_file(id, id + ".bin", "root", std::string(size, static_cast<char>('a' + i))));
        }
        return files;
    }

    BatchStats run(const std::vector<RemoteFileRecord>& files, TransferControl& control) {
        DownloadOptions options;
        options.chunk_size = 128;
        options.max_retries = task_.retry_count;
        options.backoff_unit = std::chrono::milliseconds(0);
        options.progress_interval = std::chrono::milliseconds(0);
        ChunkedDownloader downloader(drive_, options);
        FileTransferJob job(task_, downloader, *progress_, *errors_, bus_);
        BatchOrchestrator orchestrator(task_, job, bus_);
        return orchestrator.run(files, control);
    }

    FakeDrive drive_;
    EventBus bus_;
    std::unique_ptr<Database> db_;
    std::unique_ptr<ProgressStore> progress_;
    std::unique_ptr<ErrorLog> errors_;
    SyncTask task_;
    fs::path dir_;
};

TEST_F(OrchestratorTest, DownloadsEveryFile) {
    const auto files = add_files(4, 300);
    task_.concurrency = 3;

    TransferControl control;
    const auto stats = run(files, control);

    EXPECT_EQ(stats.success, 4u);
    EXPECT_EQ(stats.total(), 4u);
    for (const auto& file : files) {
        EXPECT_TRUE(fs::exists(dir_ / file.name));
    }
}

TEST_F(OrchestratorTest, CancelLeavesRemainingFilesUnstarted) {
    const auto files = add_files(5, 200);
    TransferControl control;

    std::atomic<int> completed{0};
    bus_.subscribe<dsync::events::FileDownloadCompletedEvent>(
        [&](const dsync::events::FileDownloadCompletedEvent&) {
            if (++completed == 2) {
                control.cancel();
            }
        });

    const auto stats = run(files, control);

    EXPECT_EQ(stats.success, 2u);
    EXPECT_EQ(stats.not_started, 3u);
    EXPECT_EQ(stats.failed, 0u);
    EXPECT_EQ(drive_.total_opens(), 2u);
}

TEST_F(OrchestratorTest, CancelLetsInFlightFileFinish) {
    const std::string big_body(5120, 'B');
    std::vector<RemoteFileRecord> files;
    files.push_back(drive_.add_file("big", "big.bin", "root", big_body));
    files.push_back(drive_.add_file("small", "small.bin", "root", std::string(128, 's')));
    files.push_back(drive_.add_file("late", "late.bin", "root", std::string(128, 'l')));
    task_.concurrency = 2;
    drive_.set_read_delay(std::chrono::milliseconds(2));

    TransferControl control;
    bus_.subscribe<dsync::events::FileDownloadCompletedEvent>(
        [&](const dsync::events::FileDownloadCompletedEvent& e) {
            if (e.file_path == "small.bin") {
                control.cancel();
            }
        });

    const auto stats = run(files, control);

    EXPECT_EQ(stats.success, 2u);
    EXPECT_EQ(stats.cancelled, 0u);
    EXPECT_EQ(stats.failed, 0u);
    EXPECT_EQ(stats.not_started, 1u);
    EXPECT_EQ(dsync::testing::read_file(dir_ / "big.bin"), big_body);
    EXPECT_EQ(drive_.open_count("late"), 0u);
}

TEST_F(OrchestratorTest, AbortStopsInFlightFile) {
    const auto files = add_files(1, 1024);
    TransferControl control;
    bus_.subscribe<dsync::events::FileChunkWrittenEvent>(
        [&](const dsync::events::FileChunkWrittenEvent& e) {
            if (e.downloaded >= 256) {
                control.abort();
            }
        });

    const auto stats = run(files, control);

    EXPECT_EQ(stats.cancelled, 1u);
    EXPECT_EQ(stats.success, 0u);
    EXPECT_EQ(fs::file_size(dir_ / files[0].name), 256u);
}

TEST_F(OrchestratorTest, CancelReleasesPausedInFlightFile) {
    const auto files = add_files(2, 1024);
    TransferControl control(std::chrono::milliseconds(5));
    bus_.subscribe<dsync::events::FileChunkWrittenEvent>(
        [&](const dsync::events::FileChunkWrittenEvent& e) {
            if (e.downloaded == 256) {
                control.pause();
            }
        });

    BatchStats stats;
    std::thread runner([&]() { stats = run(files, control); });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    control.cancel();
    runner.join();

    EXPECT_EQ(stats.success, 1u);
    EXPECT_EQ(stats.not_started, 1u);
    EXPECT_EQ(fs::file_size(dir_ / files[0].name), 1024u);
}

TEST_F(OrchestratorTest, PreflightSkipsFilesAlreadyOnDisk) {
    const auto files = add_files(2, 100);
    dsync::testing::write_file(dir_ / files[0].name, std::string(100, 'a'));

    std::vector<std::string> skipped;
    bus_.subscribe<dsync::events::FileSkippedEvent>([&](const dsync::events::FileSkippedEvent& e) {
        skipped.push_back(e.file_path);
    });

    TransferControl control;
    const auto stats = run(files, control);

    EXPECT_EQ(stats.skipped, 1u);
    EXPECT_EQ(stats.success, 1u);
    EXPECT_EQ(drive_.open_count("f0"), 0u);
    EXPECT_EQ(skipped, std::vector<std::string>{"f0.bin"});
}

TEST_F(OrchestratorTest, NeverExceedsConcurrency) {
    const auto files = add_files(6, 512);
    task_.concurrency = 2;
    drive_.set_read_delay(std::chrono::milliseconds(5));

    TransferControl control;
    const auto stats = run(files, control);

    EXPECT_EQ(stats.success, 6u);
    EXPECT_LE(drive_.max_concurrent_streams(), 2u);
}

TEST_F(OrchestratorTest, FailedFileDoesNotStopBatch) {
    const auto files = add_files(3, 100);
    drive_.fail_open("f1", dsync::Error{ErrorKind::NotFound, "HTTP 404"});

    TransferControl control;
    const auto stats = run(files, control);

    EXPECT_EQ(stats.success, 2u);
    EXPECT_EQ(stats.failed, 1u);
}

TEST_F(OrchestratorTest, PausedBatchWaitsForResume) {
    const auto files = add_files(2, 100);
    TransferControl control(std::chrono::milliseconds(5));
    control.pause();

    BatchStats stats;
    std::thread runner([&]() { stats = run(files, control); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(drive_.total_opens(), 0u);

    control.resume();
    runner.join();
    EXPECT_EQ(stats.success, 2u);
}

TEST_F(OrchestratorTest, CancelWhilePausedStartsNothing) {
    const auto files = add_files(3, 100);
    TransferControl control(std::chrono::milliseconds(5));
    control.pause();

    BatchStats stats;
    std::thread runner([&]() { stats = run(files, control); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    control.cancel();
    runner.join();

    EXPECT_EQ(stats.not_started, 3u);
    EXPECT_EQ(drive_.total_opens(), 0u);
}

TEST(PreflightTest, NativeDocumentsAreNeverPreflightSkipped) {
    const auto dir = dsync::testing::create_temp_dir("dsync_preflight");
    dsync::testing::write_file(dir / "Plan.docx", "");

    RemoteFileRecord doc;
    doc.id = "g1";
    doc.name = "Plan";
    doc.path = "Plan";
    doc.media_type = "application/vnd.google-apps.document";
    EXPECT_FALSE(BatchOrchestrator::preflight_skip(doc, dir / "Plan.docx"));

    RemoteFileRecord empty;
    empty.id = "f1";
    empty.name = "Plan.docx";
    EXPECT_TRUE(BatchOrchestrator::preflight_skip(empty, dir / "Plan.docx"));
    fs::remove_all(dir);
}
