#include "dsync/metadata/task_store.hpp"

#include "dsync/config/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace dsync::metadata {
namespace {

using json = nlohmann::json;

constexpr const char* kColumns =
    "id, name, remote_root_id, local_root, filters, bandwidth_limit_kbps, concurrency, retry_count, created_at";

Result<SyncTask> read_row(const Statement& stmt) {
    SyncTask task;
    task.id = stmt.column_int64(0);
    task.name = stmt.column_text(1);
    task.remote_root_id = stmt.column_text(2);
    task.local_root = stmt.column_text(3);
    task.bandwidth_limit_kbps = static_cast<std::uint64_t>(stmt.column_int64(5));
    task.concurrency = static_cast<std::uint32_t>(stmt.column_int64(6));
    task.retry_count = static_cast<std::uint32_t>(stmt.column_int64(7));
    task.created_at = stmt.column_text(8);

    const auto filters_text = stmt.column_text(4);
    if (!filters_text.empty()) {
        auto j = json::parse(filters_text, nullptr, false);
        if (j.is_discarded()) {
            return Err<SyncTask>(ErrorKind::Configuration, "task '" + task.name + "' has malformed filters");
        }
        auto filters = config::parse_filters(j);
        if (filters.is_error()) {
            return Err<SyncTask>(Error{ErrorKind::Configuration,
                                       "task '" + task.name + "': " + filters.error().message});
        }
        task.filters = std::move(filters.value());
    }
    return Ok(std::move(task));
}

Result<void> validate(const SyncTask& task) {
    if (task.name.empty()) {
        return Err<void>(ErrorKind::Configuration, "task name must not be empty");
    }
    if (task.remote_root_id.empty()) {
        return Err<void>(ErrorKind::Configuration, "task '" + task.name + "' has no remote_root_id");
    }
    if (task.local_root.empty()) {
        return Err<void>(ErrorKind::Configuration, "task '" + task.name + "' has no local_root");
    }
    if (task.concurrency < 1) {
        return Err<void>(ErrorKind::Configuration, "task '" + task.name + "': concurrency must be >= 1");
    }
    if (task.retry_count > kMaxRetryCount) {
        return Err<void>(ErrorKind::Configuration, "task '" + task.name + "': retry_count must be <= " +
                                                       std::to_string(kMaxRetryCount));
    }
    return config::validate_filters(task.filters);
}

} // namespace

Result<SyncTask> TaskStore::create(const SyncTask& task) {
    if (auto valid = validate(task); valid.is_error()) {
        return Err<SyncTask>(valid.error());
    }

    auto guard = db_.lock();
    auto stmt = db_.prepare(
        "INSERT INTO sync_tasks "
        "(name, remote_root_id, local_root, filters, bandwidth_limit_kbps, concurrency, retry_count) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)");
    if (stmt.is_error()) {
        return Err<SyncTask>(stmt.error());
    }
    stmt.value()
        .bind(1, task.name)
        .bind(2, task.remote_root_id)
        .bind(3, task.local_root)
        .bind(4, config::filters_to_json(task.filters).dump())
        .bind(5, static_cast<std::int64_t>(task.bandwidth_limit_kbps))
        .bind(6, static_cast<std::int64_t>(task.concurrency))
        .bind(7, static_cast<std::int64_t>(task.retry_count));
    if (auto inserted = stmt.value().run(); inserted.is_error()) {
        return Err<SyncTask>(Error{inserted.error().kind,
                                   "failed to create task '" + task.name + "': " + inserted.error().message});
    }

    const auto id = db_.last_insert_id();
    auto rows = query_locked("id = ?1", [id](Statement& s) { s.bind(1, id); });
    if (rows.is_error()) {
        return Err<SyncTask>(rows.error());
    }
    if (rows.value().empty()) {
        return Err<SyncTask>(ErrorKind::Io, "task vanished after insert: " + task.name);
    }
    spdlog::info("[TaskCreated] id={} name={} remote_root={} local_root={}",
                 id, task.name, task.remote_root_id, task.local_root);
    return Ok(std::move(rows.value().front()));
}

Result<SyncTask> TaskStore::upsert_by_name(const SyncTask& task) {
    auto existing = find_by_name(task.name);
    if (existing.is_error()) {
        return Err<SyncTask>(existing.error());
    }
    if (!existing.value()) {
        return create(task);
    }

    SyncTask updated = task;
    updated.id = existing.value()->id;
    updated.created_at = existing.value()->created_at;
    if (auto result = update(updated); result.is_error()) {
        return Err<SyncTask>(result.error());
    }
    return get(updated.id);
}

Result<SyncTask> TaskStore::get(std::int64_t task_id) {
    auto guard = db_.lock();
    auto rows = query_locked("id = ?1", [task_id](Statement& s) { s.bind(1, task_id); });
    if (rows.is_error()) {
        return Err<SyncTask>(rows.error());
    }
    if (rows.value().empty()) {
        return Err<SyncTask>(ErrorKind::Configuration, "unknown task id: " + std::to_string(task_id));
    }
    return Ok(std::move(rows.value().front()));
}

Result<std::optional<SyncTask>> TaskStore::find_by_name(const std::string& name) {
    auto guard = db_.lock();
    auto rows = query_locked("name = ?1", [&name](Statement& s) { s.bind(1, name); });
    if (rows.is_error()) {
        return Err<std::optional<SyncTask>>(rows.error());
    }
    if (rows.value().empty()) {
        return Ok(std::optional<SyncTask>{});
    }
    return Ok(std::optional<SyncTask>(std::move(rows.value().front())));
}

Result<std::vector<SyncTask>> TaskStore::list() {
    auto guard = db_.lock();
    return query_locked("1 = 1 ORDER BY id", [](Statement&) {});
}

Result<void> TaskStore::update(const SyncTask& task) {
    if (auto valid = validate(task); valid.is_error()) {
        return valid;
    }

    auto guard = db_.lock();
    auto stmt = db_.prepare(
        "UPDATE sync_tasks SET name = ?1, remote_root_id = ?2, local_root = ?3, filters = ?4, "
        "bandwidth_limit_kbps = ?5, concurrency = ?6, retry_count = ?7 WHERE id = ?8");
    if (stmt.is_error()) {
        return Err<void>(stmt.error());
    }
    stmt.value()
        .bind(1, task.name)
        .bind(2, task.remote_root_id)
        .bind(3, task.local_root)
        .bind(4, config::filters_to_json(task.filters).dump())
        .bind(5, static_cast<std::int64_t>(task.bandwidth_limit_kbps))
        .bind(6, static_cast<std::int64_t>(task.concurrency))
        .bind(7, static_cast<std::int64_t>(task.retry_count))
        .bind(8, task.id);
    if (auto updated = stmt.value().run(); updated.is_error()) {
        return updated;
    }
    if (db_.changes() == 0) {
        return Err<void>(ErrorKind::Configuration, "unknown task id: " + std::to_string(task.id));
    }
    spdlog::debug("[TaskUpdated] id={} name={}", task.id, task.name);
    return Ok();
}

Result<void> TaskStore::remove(std::int64_t task_id) {
    auto guard = db_.lock();
    Database::Transaction tx(db_);
    if (tx.begin_result().is_error()) {
        return tx.begin_result();
    }

    for (const char* sql : {"DELETE FROM download_progress WHERE task_id = ?1",
                            "DELETE FROM error_logs WHERE task_id = ?1"}) {
        auto stmt = db_.prepare(sql);
        if (stmt.is_error()) {
            return Err<void>(stmt.error());
        }
        stmt.value().bind(1, task_id);
        if (auto deleted = stmt.value().run(); deleted.is_error()) {
            return deleted;
        }
    }

    auto stmt = db_.prepare("DELETE FROM sync_tasks WHERE id = ?1");
    if (stmt.is_error()) {
        return Err<void>(stmt.error());
    }
    stmt.value().bind(1, task_id);
    if (auto deleted = stmt.value().run(); deleted.is_error()) {
        return deleted;
    }
    if (db_.changes() == 0) {
        return Err<void>(ErrorKind::Configuration, "unknown task id: " + std::to_string(task_id));
    }

    if (auto committed = tx.commit(); committed.is_error()) {
        return committed;
    }
    spdlog::info("[TaskRemoved] id={}", task_id);
    return Ok();
}

Result<std::vector<SyncTask>> TaskStore::query_locked(const std::string& where,
                                                      const std::function<void(Statement&)>& bind) {
    auto stmt = db_.prepare(std::string("SELECT ") + kColumns + " FROM sync_tasks WHERE " + where);
    if (stmt.is_error()) {
        return Err<std::vector<SyncTask>>(stmt.error());
    }
    bind(stmt.value());

    std::vector<SyncTask> tasks;
    while (true) {
        auto row = stmt.value().step();
        if (row.is_error()) {
            return Err<std::vector<SyncTask>>(row.error());
        }
        if (!row.value()) {
            break;
        }
        auto task = read_row(stmt.value());
        if (task.is_error()) {
            return Err<std::vector<SyncTask>>(task.error());
        }
        tasks.push_back(std::move(task.value()));
    }
    return Ok(std::move(tasks));
}

} // namespace dsync::metadata
