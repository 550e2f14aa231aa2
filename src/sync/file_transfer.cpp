#include "dsync/sync/file_transfer.hpp"

#include "dsync/events/events.hpp"
#include "dsync/sync/diff_engine.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace dsync::sync {
using metadata::RemoteFileRecord;
using metadata::TransferStatus;

FileResult FileTransferJob::run(const RemoteFileRecord& remote, TransferControl& control) {
    const auto local_path = local_path_for(task_.local_root, remote);
    const auto started = std::chrono::steady_clock::now();

    auto record = progress_.get_or_create(task_.id, remote, local_path.string());
    if (record.is_error()) {
        return fail(remote, std::nullopt, record.error(), 0);
    }
    const auto record_id = record.value().id;

    const auto decision = metadata::resolve_resume(record.value(), local_path, remote.checksum_or_empty(),
                                                   remote.is_native_document());
    if (decision.already_synced) {
        bus_.emit(events::FileSkippedEvent{task_.name, remote.path, decision.reason});
        FileResult result;
        result.outcome = FileOutcome::Skipped;
        result.bytes_on_disk = record.value().downloaded_size;
        result.reason = decision.reason;
        return result;
    }
    spdlog::debug("{}: {} (offset {})", remote.path, decision.reason, decision.offset);

    auto marked = progress_.update_partial(record_id, decision.offset, TransferStatus::Downloading);
    if (marked.is_error()) {
        return fail(remote, record_id, marked.error(), 0);
    }

    bus_.emit(events::FileDownloadStartedEvent{task_.name, remote.path, decision.offset, remote.size});

    DownloadRequest request{remote, local_path, decision.offset};
    auto downloaded = downloader_.download(
        request, control,
        [&](std::uint64_t done, std::uint64_t total) {
            bus_.emit(events::FileChunkWrittenEvent{task_.name, remote.path, done, total});
        },
        [&](std::uint64_t bytes) {
            return progress_.update_partial(record_id, bytes, TransferStatus::Downloading);
        });

    if (downloaded.is_error()) {
        const auto& error = downloaded.error();
        if (error.kind == ErrorKind::Cancelled) {
            spdlog::info("[DownloadCancelled] task={} path={} {}", task_.name, remote.path, error.message);
            FileResult result;
            result.outcome = FileOutcome::Cancelled;
            return result;
        }
        const std::uint32_t retries = error.is_retryable() ? downloader_.options().max_retries : 0;
        return fail(remote, record_id, error, retries);
    }

    const auto& outcome = downloaded.value();
    auto completed = progress_.mark_completed(record_id, outcome.bytes_on_disk);
    if (completed.is_error()) {
        return fail(remote, record_id, completed.error(), outcome.retries);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    bus_.emit(events::FileDownloadCompletedEvent{task_.name, remote.path, outcome.bytes_on_disk,
                                                 outcome.bytes_transferred, outcome.retries, elapsed});

    FileResult result;
    result.outcome = FileOutcome::Success;
    result.bytes_on_disk = outcome.bytes_on_disk;
    result.bytes_transferred = outcome.bytes_transferred;
    return result;
}

FileResult FileTransferJob::fail(const RemoteFileRecord& remote,
                                 std::optional<std::int64_t> record_id,
                                 const Error& error,
                                 std::uint32_t retries) {
    if (record_id) {
        auto marked = progress_.mark_failed(*record_id, describe(error));
        if (marked.is_error()) {
            spdlog::error("Could not mark {} failed: {}", remote.path, marked.error().message);
        }
    }
    auto logged = errors_.append(task_.id, remote.path, error, retries);
    if (logged.is_error()) {
        spdlog::error("Could not append error log for {}: {}", remote.path, logged.error().message);
    }

    bus_.emit(events::FileDownloadFailedEvent{task_.name, remote.path, error.kind, error.message});

    FileResult result;
    result.outcome = FileOutcome::Failed;
    result.error = error;
    return result;
}

} // namespace dsync::sync
