#pragma once

/**
 * @file downloader.hpp
 * @brief Resumable chunked download of one remote file
 *
 * PROTOCOL:
 * 1. offset > 0 ⇒ range request "bytes=offset-", destination opened for
 *    append; offset 0 ⇒ full request, destination truncated.
 * 2. Body streamed in fixed-size chunks; each chunk is written and flushed
 *    before the progress callback fires, so reported bytes are always on disk.
 * 3. Transient failures retry with backoff; each retry recomputes the offset
 *    from the file on disk.
 * 4. Completed file is hashed (MD5) and compared to the expected checksum;
 *    a mismatch deletes the file.
 *
 * Native documents take the export path instead: one full request for the
 * rendition, progress reported as a percentage, no checksum.
 */

#include "dsync/core/result.hpp"
#include "dsync/metadata/types.hpp"
#include "dsync/remote/drive.hpp"
#include "dsync/sync/control.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace dsync::sync {

struct DownloadOptions {
    std::size_t chunk_size = 10 * 1024 * 1024;
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds backoff_unit{1000};       ///< Wait before retry n is backoff_unit * 2^n
    std::chrono::milliseconds progress_interval{1000};  ///< Minimum time between persisted updates
    std::uint64_t bandwidth_limit_kbps = 0;             ///< KiB per second, 0 = unlimited
};

struct DownloadRequest {
    metadata::RemoteFileRecord remote;
    std::filesystem::path destination;
    std::uint64_t resume_offset = 0;
};

struct DownloadOutcome {
    std::uint64_t bytes_on_disk = 0;
    std::uint64_t bytes_transferred = 0;  ///< Fetched during this call
    std::uint32_t retries = 0;
    bool exported = false;
};

/**
 * (downloaded, total); for exports total is 100 and downloaded a percentage
 */
using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

/**
 * Persist bytes known to be flushed to disk
 */
using PersistCallback = std::function<Result<void>(std::uint64_t)>;

class ChunkedDownloader {
public:
    ChunkedDownloader(remote::RemoteDrive& drive, DownloadOptions options);

    /**
     * @brief Fetch, write and verify one file
     *
     * ERRORS:
     * - TransientTransport once the retry budget is spent
     * - Integrity on checksum mismatch (file deleted, never retried here)
     * - Cancelled when control is aborted mid-transfer (bytes kept)
     * - Authentication / NotFound / Remote / Io as reported, not retried
     */
    Result<DownloadOutcome> download(const DownloadRequest& request,
                                     TransferControl& control,
                                     const ProgressCallback& on_progress = {},
                                     const PersistCallback& persist = {});

    const DownloadOptions& options() const noexcept { return options_; }

private:
    /**
     * @return bytes on disk after the attempt; transferred counts fetched bytes even on failure
     */
    Result<std::uint64_t> fetch_media(const DownloadRequest& request,
                                      std::uint64_t offset,
                                      TransferControl& control,
                                      const ProgressCallback& on_progress,
                                      const PersistCallback& persist,
                                      std::uint64_t& transferred);

    Result<std::uint64_t> fetch_export(const DownloadRequest& request,
                                       TransferControl& control,
                                       const ProgressCallback& on_progress,
                                       const PersistCallback& persist,
                                       std::uint64_t& transferred);

    Result<void> verify(const DownloadRequest& request);

    remote::RemoteDrive& drive_;
    DownloadOptions options_;
};

} // namespace dsync::sync
