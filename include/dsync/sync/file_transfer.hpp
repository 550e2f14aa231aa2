#pragma once

/**
 * @file file_transfer.hpp
 * @brief One file from resume decision to persisted outcome
 *
 * WHAT IT DOES:
 * 1. Loads (or creates) the file's progress record
 * 2. Decides the resume offset from the record and the bytes on disk
 * 3. Runs the chunked downloader, persisting progress as chunks land
 * 4. Records the outcome: completed, failed (+ error log), or left
 *    downloading when aborted so the next run resumes it
 *
 * Every per-file failure ends here; nothing a single file does can abort
 * the batch it belongs to.
 */

#include "dsync/core/error.hpp"
#include "dsync/events/event_bus.hpp"
#include "dsync/metadata/error_log.hpp"
#include "dsync/metadata/progress_store.hpp"
#include "dsync/metadata/types.hpp"
#include "dsync/sync/control.hpp"
#include "dsync/sync/downloader.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace dsync::sync {

enum class FileOutcome {
    Success,
    Failed,
    Skipped,
    Cancelled
};

struct FileResult {
    FileOutcome outcome = FileOutcome::Failed;
    std::uint64_t bytes_on_disk = 0;
    std::uint64_t bytes_transferred = 0;
    std::optional<Error> error;  ///< Set for Failed
    std::string reason;          ///< Set for Skipped
};

class FileTransferJob {
public:
    FileTransferJob(const metadata::SyncTask& task,
                    ChunkedDownloader& downloader,
                    metadata::ProgressStore& progress,
                    metadata::ErrorLog& errors,
                    events::EventBus& bus)
        : task_(task), downloader_(downloader), progress_(progress), errors_(errors), bus_(bus) {}

    /**
     * @brief Transfer one remote file into task.local_root
     *
     * Thread-safe for distinct files; the orchestrator shares one job
     * across all workers of a run.
     */
    FileResult run(const metadata::RemoteFileRecord& remote, TransferControl& control);

private:
    FileResult fail(const metadata::RemoteFileRecord& remote,
                    std::optional<std::int64_t> record_id,
                    const Error& error,
                    std::uint32_t retries);

    const metadata::SyncTask& task_;
    ChunkedDownloader& downloader_;
    metadata::ProgressStore& progress_;
    metadata::ErrorLog& errors_;
    events::EventBus& bus_;
};

} // namespace dsync::sync
