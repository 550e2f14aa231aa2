#pragma once

/**
 * @file progress_store.hpp
 * @brief Persisted per-file transfer state, the durability mechanism for resume
 *
 * WHAT PROBLEM IT SOLVES:
 * A sync run can die at any byte. The next run must pick up where the last
 * one left off without trusting stale bookkeeping: the progress record says
 * how far we *think* we got, the file on disk says how far we *actually*
 * got. resolve_resume() reconciles the two.
 *
 * THREAD SAFETY:
 * All methods lock the shared Database. Each worker only mutates the record
 * of the file it owns.
 */

#include "dsync/core/result.hpp"
#include "dsync/metadata/database.hpp"
#include "dsync/metadata/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dsync::metadata {

/**
 * @brief Outcome of the resume-offset policy for one file
 */
struct ResumeDecision {
    bool already_synced = false;  // Completed and verified, no transfer needed
    std::uint64_t offset = 0;     // Byte position to resume from
    std::string reason;           // Human-readable explanation for logs
};

/**
 * @brief Decide where a transfer restarts
 *
 * POLICY:
 * - Completed record: local file present and matching the expected
 *   checksum ⇒ already synced. With no checksum expected the file counts as
 *   verified when its length equals the recorded total (any length when the
 *   total is unknown). Anything else restarts at 0.
 * - Completed export (exported = true): always restart at 0. Exports carry
 *   no checksum and are only scheduled when the remote document changed.
 * - Otherwise: start from the stored downloaded_size, but if the file on
 *   disk has a different length, trust the disk. A missing file means 0; a
 *   file longer than the known total means 0.
 */
ResumeDecision resolve_resume(const ProgressRecord& record,
                              const std::filesystem::path& local_path,
                              const std::string& expected_checksum,
                              bool exported = false);

class ProgressStore {
public:
    explicit ProgressStore(Database& db) : db_(db) {}

    Result<std::optional<ProgressRecord>> find(std::int64_t task_id, const std::string& remote_file_id);

    Result<ProgressRecord> get(std::int64_t record_id);

    /**
     * @brief Insert a pending record with downloaded_size = 0
     *
     * Fails if a record already exists for (task_id, remote_file_id).
     */
    Result<ProgressRecord> create(std::int64_t task_id,
                                  const RemoteFileRecord& remote,
                                  const std::string& local_path);

    /**
     * @brief Existing record (refreshed with the current remote size/checksum) or a new pending one
     */
    Result<ProgressRecord> get_or_create(std::int64_t task_id,
                                         const RemoteFileRecord& remote,
                                         const std::string& local_path);

    /**
     * @brief Record bytes flushed so far; clamped to total_size when known
     */
    Result<void> update_partial(std::int64_t record_id, std::uint64_t downloaded, TransferStatus status);

    Result<void> mark_completed(std::int64_t record_id, std::uint64_t final_size);

    /**
     * @brief status = failed, error_count += 1, last_error = message (single atomic UPDATE)
     */
    Result<void> mark_failed(std::int64_t record_id, const std::string& message);

    Result<std::vector<ProgressRecord>> list_by_task(std::int64_t task_id);

    /**
     * @brief Records still pending or downloading, oldest first
     */
    Result<std::vector<ProgressRecord>> pending(std::int64_t task_id);

    Result<ProgressStats> stats(std::int64_t task_id);

private:
    Result<ProgressRecord> get_locked(std::int64_t record_id);
    Result<std::vector<ProgressRecord>> query_locked(const std::string& where, std::int64_t task_id);

    Database& db_;
};

} // namespace dsync::metadata
