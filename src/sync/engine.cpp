#include "dsync/sync/engine.hpp"

#include "dsync/config/config.hpp"
#include "dsync/events/events.hpp"
#include "dsync/sync/diff_engine.hpp"
#include "dsync/sync/downloader.hpp"
#include "dsync/sync/file_transfer.hpp"
#include "dsync/sync/session.hpp"

#include <spdlog/spdlog.h>

namespace dsync::sync {

SyncEngine::SyncEngine(remote::RemoteDrive& drive,
                       remote::TokenProvider& tokens,
                       metadata::Database& db,
                       events::EventBus& bus,
                       EngineOptions options)
    : drive_(drive),
      tokens_(tokens),
      bus_(bus),
      options_(options),
      tasks_(db),
      progress_(db),
      errors_(db) {}

Result<SyncReport> SyncEngine::sync(const std::string& task_name, TransferControl& control) {
    auto token = tokens_.access_token();
    if (token.is_error()) {
        return abort(task_name, token.error());
    }

    auto found = tasks_.find_by_name(task_name);
    if (found.is_error()) {
        return abort(task_name, found.error());
    }
    if (!found.value()) {
        return abort(task_name, Error{ErrorKind::Configuration, "unknown task '" + task_name + "'"});
    }
    return sync(*found.value(), control);
}

Result<SyncReport> SyncEngine::sync(const metadata::SyncTask& task, TransferControl& control) {
    auto token = tokens_.access_token();
    if (token.is_error()) {
        return abort(task.name, token.error());
    }
    auto valid = validate(task);
    if (valid.is_error()) {
        return abort(task.name, valid.error());
    }

    SyncRun run(task.name);
    auto started = run.start();
    if (started.is_error()) {
        return abort(task.name, started.error());
    }
    bus_.emit(events::SyncStartedEvent{task.id, task.name});

    DiffEngine diff(drive_);
    auto scanned = diff.scan_and_compare(task);
    if (scanned.is_error()) {
        auto failed = run.mark_failed(scanned.error().message);
        if (failed.is_error()) {
            spdlog::error("[SyncRun] task={} {}", task.name, failed.error().message);
        }
        return abort(task.name, scanned.error());
    }
    const auto& plan = scanned.value();

    bus_.emit(events::ScanCompletedEvent{task.name, plan.scanned, plan.filtered_out,
                                         plan.to_download.size(), plan.to_skip.size()});
    for (const auto& record : plan.to_skip) {
        bus_.emit(events::FileSkippedEvent{task.name, record.path, "up to date"});
    }

    SyncReport report;
    report.task_name = task.name;
    report.scanned = plan.scanned;
    report.filtered_out = plan.filtered_out;
    report.to_download = plan.to_download.size();
    report.skipped_by_diff = plan.to_skip.size();

    DownloadOptions download_options;
    download_options.chunk_size = options_.chunk_size;
    download_options.max_retries = task.retry_count;
    download_options.backoff_unit = options_.backoff_unit;
    download_options.progress_interval = options_.progress_interval;
    download_options.bandwidth_limit_kbps = task.bandwidth_limit_kbps;

    ChunkedDownloader downloader(drive_, download_options);
    FileTransferJob job(task, downloader, progress_, errors_, bus_);
    BatchOrchestrator orchestrator(task, job, bus_);

    auto moved = run.transition_to(RunState::Transferring);
    if (moved.is_error()) {
        return abort(task.name, moved.error());
    }
    run.set_pending(plan.to_download.size());

    report.stats = orchestrator.run(plan.to_download, control);
    report.cancelled = control.is_cancelled();

    moved = run.transition_to(report.cancelled ? RunState::Cancelled : RunState::Complete);
    if (moved.is_error()) {
        return abort(task.name, moved.error());
    }
    report.duration = run.elapsed();

    bus_.emit(events::SyncCompletedEvent{task.name, report.stats.success, report.stats.failed,
                                         report.stats.skipped, report.stats.cancelled,
                                         report.stats.not_started, report.cancelled, report.duration});
    return Ok(std::move(report));
}

Result<void> SyncEngine::validate(const metadata::SyncTask& task) const {
    if (task.id <= 0) {
        return Err<void>(ErrorKind::Configuration, "task '" + task.name + "' has no store id");
    }
    if (task.remote_root_id.empty()) {
        return Err<void>(ErrorKind::Configuration, "task '" + task.name + "' has no remote_root_id");
    }
    if (task.local_root.empty()) {
        return Err<void>(ErrorKind::Configuration, "task '" + task.name + "' has no local_root");
    }
    if (task.retry_count > metadata::kMaxRetryCount) {
        return Err<void>(ErrorKind::Configuration, "task '" + task.name + "': retry_count must be <= " +
                                                       std::to_string(metadata::kMaxRetryCount));
    }
    return config::validate_filters(task.filters);
}

Result<SyncReport> SyncEngine::abort(const std::string& task_name, const Error& error) {
    bus_.emit(events::SyncFailedEvent{task_name, error.kind, error.message});
    return Err<SyncReport>(error);
}

} // namespace dsync::sync
