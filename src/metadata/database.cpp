#include "dsync/metadata/database.hpp"

#include <spdlog/spdlog.h>

namespace dsync::metadata {
namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS sync_tasks (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL UNIQUE,
    remote_root_id TEXT NOT NULL,
    local_root TEXT NOT NULL,
    filters TEXT,
    bandwidth_limit_kbps INTEGER DEFAULT 0,
    concurrency INTEGER DEFAULT 3,
    retry_count INTEGER DEFAULT 3,
    created_at DATETIME DEFAULT CURRENT_TIMESTAMP
);

CREATE TABLE IF NOT EXISTS download_progress (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    task_id INTEGER NOT NULL,
    remote_file_id TEXT NOT NULL,
    remote_path TEXT NOT NULL,
    local_path TEXT NOT NULL,
    total_size INTEGER DEFAULT 0,
    downloaded_size INTEGER DEFAULT 0,
    status TEXT DEFAULT 'pending',
    checksum TEXT,
    error_count INTEGER DEFAULT 0,
    last_error TEXT,
    updated_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    UNIQUE (task_id, remote_file_id)
);

CREATE TABLE IF NOT EXISTS error_logs (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    task_id INTEGER NOT NULL,
    file_path TEXT NOT NULL,
    error_type TEXT NOT NULL,
    error_message TEXT,
    retry_count INTEGER DEFAULT 0,
    timestamp DATETIME DEFAULT CURRENT_TIMESTAMP
);

CREATE INDEX IF NOT EXISTS idx_error_logs_task ON error_logs (task_id);
)sql";

Error sqlite_error(sqlite3* db, const std::string& what) {
    return Error{ErrorKind::Io, what + ": " + (db ? sqlite3_errmsg(db) : "no database handle")};
}

} // namespace

// ──────────────────────────────────────────────────────────
// Statement
// ──────────────────────────────────────────────────────────

Statement::Statement(sqlite3* db, sqlite3_stmt* stmt)
    : db_(db), stmt_(stmt, sqlite3_finalize) {}

Statement& Statement::bind(int index, std::int64_t value) {
    sqlite3_bind_int64(stmt_.get(), index, static_cast<sqlite3_int64>(value));
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind_null(int index) {
    sqlite3_bind_null(stmt_.get(), index);
    return *this;
}

Result<bool> Statement::step() {
    const int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Ok(false);
    }
    return Err<bool>(sqlite_error(db_, "sqlite3_step failed"));
}

Result<void> Statement::run() {
    auto result = step();
    if (result.is_error()) {
        return Err<void>(result.error());
    }
    return Ok();
}

std::int64_t Statement::column_int64(int index) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_.get(), index));
}

std::string Statement::column_text(int index) const {
    const auto* text = sqlite3_column_text(stmt_.get(), index);
    if (text == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

// ──────────────────────────────────────────────────────────
// Database
// ──────────────────────────────────────────────────────────

Database::Database(std::filesystem::path path, sqlite3* handle)
    : path_(std::move(path)), handle_(handle, sqlite3_close_v2) {}

Result<std::unique_ptr<Database>> Database::open(const std::filesystem::path& path) {
    if (path.has_parent_path() && path.string() != ":memory:") {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Err<std::unique_ptr<Database>>(
                ErrorKind::Io, "Failed to create database directory " + path.parent_path().string());
        }
    }

    sqlite3* raw = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &raw, flags, nullptr) != SQLITE_OK) {
        auto error = sqlite_error(raw, "Failed to open database " + path.string());
        if (raw) {
            sqlite3_close_v2(raw);
        }
        return Err<std::unique_ptr<Database>>(std::move(error));
    }

    std::unique_ptr<Database> db(new Database(path, raw));
    sqlite3_busy_timeout(raw, 5000);

    if (auto migrated = db->migrate(); migrated.is_error()) {
        return Err<std::unique_ptr<Database>>(migrated.error());
    }

    spdlog::debug("Opened progress database {}", path.string());
    return Ok(std::move(db));
}

Result<void> Database::migrate() {
    if (path_.string() != ":memory:") {
        if (auto wal = exec("PRAGMA journal_mode=WAL;"); wal.is_error()) {
            spdlog::warn("WAL journal mode unavailable: {}", wal.error().message);
        }
    }
    return exec(kSchema);
}

Result<void> Database::exec(const std::string& sql) {
    char* message = nullptr;
    if (sqlite3_exec(handle_.get(), sql.c_str(), nullptr, nullptr, &message) != SQLITE_OK) {
        std::string text = message ? message : "unknown error";
        sqlite3_free(message);
        return Err<void>(ErrorKind::Io, "SQL exec failed: " + text);
    }
    return Ok();
}

Result<Statement> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(handle_.get(), sql.c_str(), static_cast<int>(sql.size()) + 1, &stmt, nullptr) != SQLITE_OK) {
        return Err<Statement>(sqlite_error(handle_.get(), "Failed to prepare statement"));
    }
    return Ok(Statement(handle_.get(), stmt));
}

std::int64_t Database::last_insert_id() const {
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(handle_.get()));
}

int Database::changes() const {
    return sqlite3_changes(handle_.get());
}

// ──────────────────────────────────────────────────────────
// Transaction
// ──────────────────────────────────────────────────────────

Database::Transaction::Transaction(Database& db)
    : db_(db), begin_(db.exec("BEGIN IMMEDIATE;")) {}

Database::Transaction::~Transaction() {
    if (!done_ && begin_.is_ok()) {
        if (auto rolled_back = db_.exec("ROLLBACK;"); rolled_back.is_error()) {
            spdlog::error("Rollback failed: {}", rolled_back.error().message);
        }
    }
}

Result<void> Database::Transaction::commit() {
    if (begin_.is_error()) {
        return begin_;
    }
    auto result = db_.exec("COMMIT;");
    if (result.is_ok()) {
        done_ = true;
    }
    return result;
}

} // namespace dsync::metadata
