/**
 * @file events.hpp
 * @brief Event types emitted during a sync run
 *
 * WHY THIS FILE EXISTS:
 * The engine, the orchestrator and the per-file jobs report what they do
 * as events. Logging, metrics and the CLI progress display subscribe to
 * them instead of being called directly.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: FileDownloadCompletedEvent, SyncFailedEvent
 */

#pragma once

#include "dsync/core/error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace dsync::events {

// ════════════════════════════════════════════════════════
// Run Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once credentials and the task are resolved
 *
 * WHO EMITS:
 * - SyncEngine::sync
 *
 * WHO SUBSCRIBES:
 * - Logger
 * - Metrics (run counter)
 */
struct SyncStartedEvent {
    std::int64_t task_id = 0;
    std::string task_name;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted after the remote walk and the diff, before any transfer
 */
struct ScanCompletedEvent {
    std::string task_name;
    std::size_t scanned = 0;
    std::size_t filtered_out = 0;
    std::size_t to_download = 0;
    std::size_t to_skip = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SyncCompletedEvent {
    std::string task_name;
    std::size_t success = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::size_t cancelled = 0;
    std::size_t not_started = 0;
    bool was_cancelled = false;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a run aborts on a fatal error (authentication, configuration, scan)
 */
struct SyncFailedEvent {
    std::string task_name;
    ErrorKind kind = ErrorKind::Io;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

struct FileDownloadStartedEvent {
    std::string task_name;
    std::string file_path;
    std::uint64_t resume_offset = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief One chunk flushed to disk
 *
 * For exported documents downloaded/total is a percentage out of 100.
 */
struct FileChunkWrittenEvent {
    std::string task_name;
    std::string file_path;
    std::uint64_t downloaded = 0;
    std::uint64_t total = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileDownloadCompletedEvent {
    std::string task_name;
    std::string file_path;
    std::uint64_t total_bytes = 0;
    std::uint64_t bytes_transferred = 0;
    std::uint32_t retries = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileDownloadFailedEvent {
    std::string task_name;
    std::string file_path;
    ErrorKind kind = ErrorKind::Io;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileSkippedEvent {
    std::string task_name;
    std::string file_path;
    std::string reason;  // "up to date", "already verified", ...
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace dsync::events
