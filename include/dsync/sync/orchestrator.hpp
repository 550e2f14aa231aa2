#pragma once

/**
 * @file orchestrator.hpp
 * @brief Runs the download set of one scan over a bounded worker pool
 *
 * HOW IT WORKS:
 * Every file of the immutable list becomes one pool job. A job first
 * honours pause and cancel, then applies the size preflight, then hands
 * the file to the FileTransferJob. Outcomes are tallied atomically.
 *
 * Cancel does not interrupt the dispatch loop: jobs still queued observe
 * the cancel flag on start and count as not_started, while in-flight
 * transfers run to success or failure and are counted as such. Only an
 * abort stops them at their next chunk boundary (counted as cancelled).
 */

#include "dsync/events/event_bus.hpp"
#include "dsync/metadata/types.hpp"
#include "dsync/sync/control.hpp"
#include "dsync/sync/file_transfer.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace dsync::sync {

struct BatchStats {
    std::size_t success = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::size_t cancelled = 0;     ///< Started, then stopped by abort
    std::size_t not_started = 0;   ///< Never started because cancel came first

    std::size_t total() const { return success + failed + skipped + cancelled + not_started; }
};

class BatchOrchestrator {
public:
    BatchOrchestrator(const metadata::SyncTask& task, FileTransferJob& job, events::EventBus& bus)
        : task_(task), job_(job), bus_(bus) {}

    /**
     * @brief Transfer every file, at most max(1, task.concurrency) at a time
     *
     * Blocks until all jobs have finished or been counted as not started.
     */
    BatchStats run(const std::vector<metadata::RemoteFileRecord>& files, TransferControl& control);

    /**
     * @brief True when a local file already has exactly the expected length
     *
     * Never true for native documents, whose remote size says nothing about
     * the exported rendition.
     */
    static bool preflight_skip(const metadata::RemoteFileRecord& remote, const std::filesystem::path& local_path);

private:
    const metadata::SyncTask& task_;
    FileTransferJob& job_;
    events::EventBus& bus_;
};

} // namespace dsync::sync
