#include "dsync/metadata/error_log.hpp"

namespace dsync::metadata {

Result<void> ErrorLog::append(std::int64_t task_id,
                              const std::string& file_path,
                              const Error& error,
                              std::uint32_t retry_count) {
    auto guard = db_.lock();
    auto stmt = db_.prepare(
        "INSERT INTO error_logs (task_id, file_path, error_type, error_message, retry_count) "
        "VALUES (?1, ?2, ?3, ?4, ?5)");
    if (stmt.is_error()) {
        return Err<void>(stmt.error());
    }
    stmt.value()
        .bind(1, task_id)
        .bind(2, file_path)
        .bind(3, ErrorKindUtils::to_string(error.kind))
        .bind(4, error.message)
        .bind(5, static_cast<std::int64_t>(retry_count));
    return stmt.value().run();
}

Result<std::vector<ErrorLogEntry>> ErrorLog::list_by_task(std::int64_t task_id, std::size_t limit) {
    auto guard = db_.lock();
    std::string sql =
        "SELECT id, task_id, file_path, error_type, error_message, retry_count, timestamp "
        "FROM error_logs WHERE task_id = ?1 ORDER BY timestamp DESC, id DESC";
    if (limit > 0) {
        sql += " LIMIT " + std::to_string(limit);
    }

    auto stmt = db_.prepare(sql);
    if (stmt.is_error()) {
        return Err<std::vector<ErrorLogEntry>>(stmt.error());
    }
    stmt.value().bind(1, task_id);

    std::vector<ErrorLogEntry> entries;
    while (true) {
        auto row = stmt.value().step();
        if (row.is_error()) {
            return Err<std::vector<ErrorLogEntry>>(row.error());
        }
        if (!row.value()) {
            break;
        }
        const auto& s = stmt.value();
        ErrorLogEntry entry;
        entry.id = s.column_int64(0);
        entry.task_id = s.column_int64(1);
        entry.file_path = s.column_text(2);
        entry.kind = s.column_text(3);
        entry.message = s.column_text(4);
        entry.retry_count = static_cast<std::uint32_t>(s.column_int64(5));
        entry.timestamp = s.column_text(6);
        entries.push_back(std::move(entry));
    }
    return Ok(std::move(entries));
}

} // namespace dsync::metadata
