#include "dsync/metadata/progress_store.hpp"

#include "dsync/core/hash.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace dsync::metadata {
namespace fs = std::filesystem;

namespace {

constexpr const char* kColumns =
    "id, task_id, remote_file_id, remote_path, local_path, total_size, downloaded_size, "
    "status, checksum, error_count, last_error, updated_at";

ProgressRecord read_row(const Statement& stmt) {
    ProgressRecord record;
    record.id = stmt.column_int64(0);
    record.task_id = stmt.column_int64(1);
    record.remote_file_id = stmt.column_text(2);
    record.remote_path = stmt.column_text(3);
    record.local_path = stmt.column_text(4);
    record.total_size = static_cast<std::uint64_t>(stmt.column_int64(5));
    record.downloaded_size = static_cast<std::uint64_t>(stmt.column_int64(6));
    record.status = TransferStatusUtils::from_string(stmt.column_text(7)).value_or(TransferStatus::Pending);
    record.checksum = stmt.column_text(8);
    record.error_count = static_cast<std::uint32_t>(stmt.column_int64(9));
    record.last_error = stmt.column_text(10);
    record.updated_at = stmt.column_text(11);
    return record;
}

std::optional<std::uint64_t> on_disk_size(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size);
}

} // namespace

ResumeDecision resolve_resume(const ProgressRecord& record,
                              const fs::path& local_path,
                              const std::string& expected_checksum,
                              bool exported) {
    ResumeDecision decision;
    const auto actual = on_disk_size(local_path);

    if (record.status == TransferStatus::Completed) {
        if (exported) {
            decision.offset = 0;
            decision.reason = "completed export, fetching again";
            return decision;
        }
        if (actual && expected_checksum.empty()) {
            if (record.total_size == 0 || *actual == record.total_size) {
                decision.already_synced = true;
                decision.offset = *actual;
                decision.reason = "completed, no checksum to verify";
                return decision;
            }
            decision.reason = "completed but local length differs, restarting";
        } else if (actual) {
            auto hash = md5_file(local_path);
            if (hash.is_ok() && checksum_matches(hash.value(), expected_checksum)) {
                decision.already_synced = true;
                decision.offset = *actual;
                decision.reason = "completed and verified";
                return decision;
            }
            decision.reason = hash.is_ok() ? "completed but checksum differs, restarting"
                                           : "completed but unreadable, restarting";
        } else {
            decision.reason = "completed but local file missing, restarting";
        }
        decision.offset = 0;
        return decision;
    }

    decision.offset = record.downloaded_size;
    decision.reason = "resuming from stored progress";

    if (!actual) {
        if (decision.offset != 0) {
            decision.reason = "local file missing, restarting";
        }
        decision.offset = 0;
    } else if (*actual != decision.offset) {
        decision.offset = *actual;
        decision.reason = "on-disk length differs from stored progress, trusting disk";
    }

    if (record.total_size > 0 && decision.offset > record.total_size) {
        decision.offset = 0;
        decision.reason = "local file larger than remote, restarting";
    }
    return decision;
}

Result<std::optional<ProgressRecord>> ProgressStore::find(std::int64_t task_id, const std::string& remote_file_id) {
    auto guard = db_.lock();
    auto stmt = db_.prepare(std::string("SELECT ") + kColumns +
                            " FROM download_progress WHERE task_id = ?1 AND remote_file_id = ?2");
    if (stmt.is_error()) {
        return Err<std::optional<ProgressRecord>>(stmt.error());
    }
    stmt.value().bind(1, task_id).bind(2, remote_file_id);

    auto row = stmt.value().step();
    if (row.is_error()) {
        return Err<std::optional<ProgressRecord>>(row.error());
    }
    if (!row.value()) {
        return Ok(std::optional<ProgressRecord>{});
    }
    return Ok(std::optional<ProgressRecord>(read_row(stmt.value())));
}

Result<ProgressRecord> ProgressStore::get(std::int64_t record_id) {
    auto guard = db_.lock();
    return get_locked(record_id);
}

Result<ProgressRecord> ProgressStore::get_locked(std::int64_t record_id) {
    auto stmt = db_.prepare(std::string("SELECT ") + kColumns + " FROM download_progress WHERE id = ?1");
    if (stmt.is_error()) {
        return Err<ProgressRecord>(stmt.error());
    }
    stmt.value().bind(1, record_id);

    auto row = stmt.value().step();
    if (row.is_error()) {
        return Err<ProgressRecord>(row.error());
    }
    if (!row.value()) {
        return Err<ProgressRecord>(ErrorKind::NotFound, "Progress record not found: " + std::to_string(record_id));
    }
    return Ok(read_row(stmt.value()));
}

Result<ProgressRecord> ProgressStore::create(std::int64_t task_id,
                                             const RemoteFileRecord& remote,
                                             const std::string& local_path) {
    auto guard = db_.lock();
    auto stmt = db_.prepare(
        "INSERT INTO download_progress "
        "(task_id, remote_file_id, remote_path, local_path, total_size, downloaded_size, status, checksum) "
        "VALUES (?1, ?2, ?3, ?4, ?5, 0, 'pending', ?6)");
    if (stmt.is_error()) {
        return Err<ProgressRecord>(stmt.error());
    }
    stmt.value()
        .bind(1, task_id)
        .bind(2, remote.id)
        .bind(3, remote.path)
        .bind(4, local_path)
        .bind(5, static_cast<std::int64_t>(remote.size))
        .bind(6, remote.checksum_or_empty());

    if (auto inserted = stmt.value().run(); inserted.is_error()) {
        return Err<ProgressRecord>(inserted.error());
    }
    return get_locked(db_.last_insert_id());
}

Result<ProgressRecord> ProgressStore::get_or_create(std::int64_t task_id,
                                                    const RemoteFileRecord& remote,
                                                    const std::string& local_path) {
    auto existing = find(task_id, remote.id);
    if (existing.is_error()) {
        return Err<ProgressRecord>(existing.error());
    }
    if (!existing.value()) {
        return create(task_id, remote, local_path);
    }

    ProgressRecord record = *existing.value();
    const auto checksum = remote.checksum_or_empty();
    if (record.total_size == remote.size && record.checksum == checksum &&
        record.local_path == local_path && record.remote_path == remote.path) {
        return Ok(std::move(record));
    }

    // The remote changed since the record was written; the remote is the source of truth
    auto guard = db_.lock();
    auto stmt = db_.prepare(
        "UPDATE download_progress SET total_size = ?1, checksum = ?2, local_path = ?3, remote_path = ?4, "
        "downloaded_size = CASE WHEN ?1 > 0 AND downloaded_size > ?1 THEN ?1 ELSE downloaded_size END, "
        "updated_at = CURRENT_TIMESTAMP WHERE id = ?5");
    if (stmt.is_error()) {
        return Err<ProgressRecord>(stmt.error());
    }
    stmt.value()
        .bind(1, static_cast<std::int64_t>(remote.size))
        .bind(2, checksum)
        .bind(3, local_path)
        .bind(4, remote.path)
        .bind(5, record.id);
    if (auto updated = stmt.value().run(); updated.is_error()) {
        return Err<ProgressRecord>(updated.error());
    }
    spdlog::debug("Refreshed progress record {} for {} (remote metadata changed)", record.id, remote.path);
    return get_locked(record.id);
}

Result<void> ProgressStore::update_partial(std::int64_t record_id, std::uint64_t downloaded, TransferStatus status) {
    auto guard = db_.lock();
    auto stmt = db_.prepare(
        "UPDATE download_progress SET "
        "downloaded_size = CASE WHEN total_size > 0 AND ?1 > total_size THEN total_size ELSE ?1 END, "
        "status = ?2, updated_at = CURRENT_TIMESTAMP WHERE id = ?3");
    if (stmt.is_error()) {
        return Err<void>(stmt.error());
    }
    stmt.value()
        .bind(1, static_cast<std::int64_t>(downloaded))
        .bind(2, TransferStatusUtils::to_string(status))
        .bind(3, record_id);
    if (auto updated = stmt.value().run(); updated.is_error()) {
        return updated;
    }
    if (db_.changes() == 0) {
        return Err<void>(ErrorKind::NotFound, "Progress record not found: " + std::to_string(record_id));
    }
    return Ok();
}

Result<void> ProgressStore::mark_completed(std::int64_t record_id, std::uint64_t final_size) {
    auto guard = db_.lock();
    auto stmt = db_.prepare(
        "UPDATE download_progress SET status = 'completed', "
        "total_size = CASE WHEN total_size < ?1 THEN ?1 ELSE total_size END, "
        "downloaded_size = ?1, updated_at = CURRENT_TIMESTAMP WHERE id = ?2");
    if (stmt.is_error()) {
        return Err<void>(stmt.error());
    }
    stmt.value().bind(1, static_cast<std::int64_t>(final_size)).bind(2, record_id);
    if (auto updated = stmt.value().run(); updated.is_error()) {
        return updated;
    }
    if (db_.changes() == 0) {
        return Err<void>(ErrorKind::NotFound, "Progress record not found: " + std::to_string(record_id));
    }
    return Ok();
}

Result<void> ProgressStore::mark_failed(std::int64_t record_id, const std::string& message) {
    auto guard = db_.lock();
    auto stmt = db_.prepare(
        "UPDATE download_progress SET status = 'failed', last_error = ?1, "
        "error_count = error_count + 1, updated_at = CURRENT_TIMESTAMP WHERE id = ?2");
    if (stmt.is_error()) {
        return Err<void>(stmt.error());
    }
    stmt.value().bind(1, message).bind(2, record_id);
    if (auto updated = stmt.value().run(); updated.is_error()) {
        return updated;
    }
    if (db_.changes() == 0) {
        return Err<void>(ErrorKind::NotFound, "Progress record not found: " + std::to_string(record_id));
    }
    return Ok();
}

Result<std::vector<ProgressRecord>> ProgressStore::list_by_task(std::int64_t task_id) {
    auto guard = db_.lock();
    return query_locked("task_id = ?1 ORDER BY id", task_id);
}

Result<std::vector<ProgressRecord>> ProgressStore::pending(std::int64_t task_id) {
    auto guard = db_.lock();
    return query_locked("task_id = ?1 AND status IN ('pending', 'downloading') ORDER BY id", task_id);
}

Result<std::vector<ProgressRecord>> ProgressStore::query_locked(const std::string& where, std::int64_t task_id) {
    auto stmt = db_.prepare(std::string("SELECT ") + kColumns + " FROM download_progress WHERE " + where);
    if (stmt.is_error()) {
        return Err<std::vector<ProgressRecord>>(stmt.error());
    }
    stmt.value().bind(1, task_id);

    std::vector<ProgressRecord> records;
    while (true) {
        auto row = stmt.value().step();
        if (row.is_error()) {
            return Err<std::vector<ProgressRecord>>(row.error());
        }
        if (!row.value()) {
            break;
        }
        records.push_back(read_row(stmt.value()));
    }
    return Ok(std::move(records));
}

Result<ProgressStats> ProgressStore::stats(std::int64_t task_id) {
    auto guard = db_.lock();
    auto stmt = db_.prepare(
        "SELECT COUNT(*), "
        "SUM(CASE WHEN status = 'completed' THEN 1 ELSE 0 END), "
        "SUM(CASE WHEN status = 'failed' THEN 1 ELSE 0 END), "
        "SUM(CASE WHEN status IN ('pending', 'downloading') THEN 1 ELSE 0 END) "
        "FROM download_progress WHERE task_id = ?1");
    if (stmt.is_error()) {
        return Err<ProgressStats>(stmt.error());
    }
    stmt.value().bind(1, task_id);

    auto row = stmt.value().step();
    if (row.is_error()) {
        return Err<ProgressStats>(row.error());
    }

    ProgressStats stats;
    if (row.value()) {
        stats.total = static_cast<std::size_t>(stmt.value().column_int64(0));
        stats.completed = static_cast<std::size_t>(stmt.value().column_int64(1));
        stats.failed = static_cast<std::size_t>(stmt.value().column_int64(2));
        stats.pending = static_cast<std::size_t>(stmt.value().column_int64(3));
    }
    return Ok(stats);
}

} // namespace dsync::metadata
