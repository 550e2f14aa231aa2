#include "dsync/sync/orchestrator.hpp"

#include "dsync/concurrency/worker_pool.hpp"
#include "dsync/events/events.hpp"
#include "dsync/sync/diff_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <system_error>

namespace dsync::sync {
namespace fs = std::filesystem;
using metadata::RemoteFileRecord;

namespace {

struct Tally {
    std::atomic<std::size_t> success{0};
    std::atomic<std::size_t> failed{0};
    std::atomic<std::size_t> skipped{0};
    std::atomic<std::size_t> cancelled{0};
    std::atomic<std::size_t> not_started{0};

    BatchStats snapshot() const {
        BatchStats stats;
        stats.success = success.load();
        stats.failed = failed.load();
        stats.skipped = skipped.load();
        stats.cancelled = cancelled.load();
        stats.not_started = not_started.load();
        return stats;
    }
};

} // namespace

bool BatchOrchestrator::preflight_skip(const RemoteFileRecord& remote, const fs::path& local_path) {
    if (remote.is_native_document()) {
        return false;
    }
    std::error_code ec;
    if (!fs::is_regular_file(local_path, ec)) {
        return false;
    }
    const auto size = fs::file_size(local_path, ec);
    return !ec && size == remote.size;
}

BatchStats BatchOrchestrator::run(const std::vector<RemoteFileRecord>& files, TransferControl& control) {
    Tally tally;
    const std::size_t workers = std::max<std::uint32_t>(1, task_.concurrency);
    spdlog::debug("[Batch] task={} files={} workers={}", task_.name, files.size(), workers);

    {
        concurrency::WorkerPool pool(workers);
        for (const auto& file : files) {
            pool.submit([this, &file, &control, &tally]() {
                if (control.is_cancelled() || !control.wait_while_paused()) {
                    tally.not_started++;
                    return;
                }

                if (preflight_skip(file, local_path_for(task_.local_root, file))) {
                    bus_.emit(events::FileSkippedEvent{task_.name, file.path, "local size matches"});
                    tally.skipped++;
                    return;
                }

                const auto result = job_.run(file, control);
                switch (result.outcome) {
                    case FileOutcome::Success: tally.success++; break;
                    case FileOutcome::Failed: tally.failed++; break;
                    case FileOutcome::Skipped: tally.skipped++; break;
                    case FileOutcome::Cancelled: tally.cancelled++; break;
                }
            });
        }
        pool.wait();
    }

    const auto stats = tally.snapshot();
    spdlog::debug("[Batch] task={} success={} failed={} skipped={} cancelled={} not_started={}",
                  task_.name, stats.success, stats.failed, stats.skipped, stats.cancelled, stats.not_started);
    return stats;
}

} // namespace dsync::sync
