/**
 * @file components.hpp
 * @brief Event subscribers shipped with drivesync
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * engine.sync("photos", control);
 * metrics.print_stats();
 */

#pragma once

#include "dsync/events/event_bus.hpp"
#include "dsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace dsync::events {

/**
 * @brief Writes every sync event to spdlog
 *
 * Chunk events go to debug level; everything else to info, warn or error.
 * Unsubscribes on destruction, so it may be shorter-lived than the bus.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        track<SyncStartedEvent>([](const SyncStartedEvent& e) {
            spdlog::info("[SyncStarted] task={} id={}", e.task_name, e.task_id);
        });

        track<ScanCompletedEvent>([](const ScanCompletedEvent& e) {
            spdlog::info("[ScanCompleted] task={} scanned={} filtered_out={} to_download={} to_skip={}",
                         e.task_name, e.scanned, e.filtered_out, e.to_download, e.to_skip);
        });

        track<FileDownloadStartedEvent>([](const FileDownloadStartedEvent& e) {
            if (e.resume_offset > 0) {
                spdlog::info("[DownloadStarted] task={} path={} resume_from={} total={}",
                             e.task_name, e.file_path, e.resume_offset, e.total_bytes);
            } else {
                spdlog::info("[DownloadStarted] task={} path={} total={}",
                             e.task_name, e.file_path, e.total_bytes);
            }
        });

        track<FileChunkWrittenEvent>([](const FileChunkWrittenEvent& e) {
            spdlog::debug("[ChunkWritten] task={} path={} {}/{}",
                          e.task_name, e.file_path, e.downloaded, e.total);
        });

        track<FileDownloadCompletedEvent>([](const FileDownloadCompletedEvent& e) {
            spdlog::info("[DownloadCompleted] task={} path={} bytes={} transferred={} retries={} duration={}ms",
                         e.task_name, e.file_path, e.total_bytes, e.bytes_transferred,
                         e.retries, e.duration.count());
        });

        track<FileDownloadFailedEvent>([](const FileDownloadFailedEvent& e) {
            spdlog::warn("[DownloadFailed] task={} path={} kind={} error={}",
                         e.task_name, e.file_path, ErrorKindUtils::to_string(e.kind), e.message);
        });

        track<FileSkippedEvent>([](const FileSkippedEvent& e) {
            spdlog::debug("[FileSkipped] task={} path={} reason={}", e.task_name, e.file_path, e.reason);
        });

        track<SyncCompletedEvent>([](const SyncCompletedEvent& e) {
            spdlog::info("[SyncCompleted] task={} success={} failed={} skipped={} cancelled={} not_started={} "
                         "was_cancelled={} duration={}ms",
                         e.task_name, e.success, e.failed, e.skipped, e.cancelled, e.not_started,
                         e.was_cancelled, e.duration.count());
        });

        track<SyncFailedEvent>([](const SyncFailedEvent& e) {
            spdlog::error("[SyncFailed] task={} kind={} error={}",
                          e.task_name, ErrorKindUtils::to_string(e.kind), e.message);
        });
    }

    ~LoggerComponent() {
        for (auto& release : releases_) {
            release();
        }
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    template<typename EventType>
    void track(std::function<void(const EventType&)> handler) {
        const auto id = bus_.subscribe<EventType>(std::move(handler));
        releases_.push_back([this, id]() { bus_.unsubscribe<EventType>(id); });
    }

    EventBus& bus_;
    std::vector<std::function<void()>> releases_;
};

/**
 * @brief Counts files and bytes across one or more runs
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // after the run
 * metrics.get_stats().files_downloaded.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> runs_started{0};
        std::atomic<std::uint64_t> runs_failed{0};
        std::atomic<std::uint64_t> files_scanned{0};
        std::atomic<std::uint64_t> files_downloaded{0};
        std::atomic<std::uint64_t> bytes_downloaded{0};
        std::atomic<std::uint64_t> bytes_transferred{0};
        std::atomic<std::uint64_t> files_failed{0};
        std::atomic<std::uint64_t> files_skipped{0};
        std::atomic<std::uint64_t> retries{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        ids_.started = bus_.subscribe<SyncStartedEvent>([this](const SyncStartedEvent&) {
            stats_.runs_started++;
        });
        ids_.failed_run = bus_.subscribe<SyncFailedEvent>([this](const SyncFailedEvent&) {
            stats_.runs_failed++;
        });
        ids_.scanned = bus_.subscribe<ScanCompletedEvent>([this](const ScanCompletedEvent& e) {
            stats_.files_scanned += e.scanned;
        });
        ids_.completed = bus_.subscribe<FileDownloadCompletedEvent>([this](const FileDownloadCompletedEvent& e) {
            stats_.files_downloaded++;
            stats_.bytes_downloaded += e.total_bytes;
            stats_.bytes_transferred += e.bytes_transferred;
            stats_.retries += e.retries;
        });
        ids_.failed_file = bus_.subscribe<FileDownloadFailedEvent>([this](const FileDownloadFailedEvent&) {
            stats_.files_failed++;
        });
        ids_.skipped = bus_.subscribe<FileSkippedEvent>([this](const FileSkippedEvent&) {
            stats_.files_skipped++;
        });
    }

    ~MetricsComponent() {
        bus_.unsubscribe<SyncStartedEvent>(ids_.started);
        bus_.unsubscribe<SyncFailedEvent>(ids_.failed_run);
        bus_.unsubscribe<ScanCompletedEvent>(ids_.scanned);
        bus_.unsubscribe<FileDownloadCompletedEvent>(ids_.completed);
        bus_.unsubscribe<FileDownloadFailedEvent>(ids_.failed_file);
        bus_.unsubscribe<FileSkippedEvent>(ids_.skipped);
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const { return stats_; }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Transfer Statistics:");
        spdlog::info("  Runs started:      {}", stats_.runs_started.load());
        spdlog::info("  Runs failed:       {}", stats_.runs_failed.load());
        spdlog::info("  Files scanned:     {}", stats_.files_scanned.load());
        spdlog::info("  Files downloaded:  {}", stats_.files_downloaded.load());
        spdlog::info("  Files skipped:     {}", stats_.files_skipped.load());
        spdlog::info("  Files failed:      {}", stats_.files_failed.load());
        spdlog::info("  Bytes on disk:     {}", stats_.bytes_downloaded.load());
        spdlog::info("  Bytes transferred: {}", stats_.bytes_transferred.load());
        spdlog::info("  Retries:           {}", stats_.retries.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    struct Subscriptions {
        SubscriptionId started = 0;
        SubscriptionId failed_run = 0;
        SubscriptionId scanned = 0;
        SubscriptionId completed = 0;
        SubscriptionId failed_file = 0;
        SubscriptionId skipped = 0;
    };

    EventBus& bus_;
    Stats stats_;
    Subscriptions ids_;
};

} // namespace dsync::events
