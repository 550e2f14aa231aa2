#pragma once

/**
 * @file engine.hpp
 * @brief Service entry point: one call per sync run
 *
 * WHAT IT DOES:
 * sync(task) = credentials check → task lookup and validation → one scan
 * and diff → batch transfer → report.
 *
 * Authentication and Configuration errors abort the run before anything is
 * listed or written. A scan failure aborts the run too, since no download
 * set exists without it. Per-file failures never surface here; they are in
 * the report's stats and in the progress store.
 *
 * EXAMPLE:
 * SyncEngine engine(drive, tokens, db, bus, EngineOptions{});
 * TransferControl control;
 * auto report = engine.sync("photos", control);
 * if (report.is_ok()) { report.value().stats.success; }
 */

#include "dsync/core/result.hpp"
#include "dsync/events/event_bus.hpp"
#include "dsync/metadata/database.hpp"
#include "dsync/metadata/error_log.hpp"
#include "dsync/metadata/progress_store.hpp"
#include "dsync/metadata/task_store.hpp"
#include "dsync/metadata/types.hpp"
#include "dsync/remote/credentials.hpp"
#include "dsync/remote/drive.hpp"
#include "dsync/sync/control.hpp"
#include "dsync/sync/orchestrator.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace dsync::sync {

/**
 * @brief Run-wide transfer settings; per-task retry and bandwidth come from the task
 */
struct EngineOptions {
    std::size_t chunk_size = 10 * 1024 * 1024;
    std::chrono::milliseconds backoff_unit{1000};
    std::chrono::milliseconds progress_interval{1000};
};

struct SyncReport {
    std::string task_name;
    std::size_t scanned = 0;
    std::size_t filtered_out = 0;
    std::size_t to_download = 0;
    std::size_t skipped_by_diff = 0;  ///< Up to date according to the diff, never queued
    BatchStats stats;
    bool cancelled = false;
    std::chrono::milliseconds duration{0};
};

class SyncEngine {
public:
    SyncEngine(remote::RemoteDrive& drive,
               remote::TokenProvider& tokens,
               metadata::Database& db,
               events::EventBus& bus,
               EngineOptions options);

    /**
     * @brief Sync a task stored in the task store, looked up by name
     *
     * ERRORS:
     * - Configuration: unknown task name
     * - everything sync(const SyncTask&, ...) returns
     */
    Result<SyncReport> sync(const std::string& task_name, TransferControl& control);

    /**
     * @brief Sync a task that already carries its store id
     *
     * ERRORS:
     * - Authentication: no usable token
     * - Configuration: invalid filter rules, empty roots, id not assigned
     * - any kind the remote listing reports, when the scan fails
     */
    Result<SyncReport> sync(const metadata::SyncTask& task, TransferControl& control);

    metadata::TaskStore& tasks() noexcept { return tasks_; }
    metadata::ProgressStore& progress() noexcept { return progress_; }
    metadata::ErrorLog& errors() noexcept { return errors_; }

private:
    Result<void> validate(const metadata::SyncTask& task) const;
    Result<SyncReport> abort(const std::string& task_name, const Error& error);

    remote::RemoteDrive& drive_;
    remote::TokenProvider& tokens_;
    events::EventBus& bus_;
    EngineOptions options_;
    metadata::TaskStore tasks_;
    metadata::ProgressStore progress_;
    metadata::ErrorLog errors_;
};

} // namespace dsync::sync
