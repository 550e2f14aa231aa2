#pragma once

/**
 * @file database.hpp
 * @brief SQLite connection shared by the task store, progress store and error log
 *
 * CONCURRENCY MODEL:
 * One connection, one mutex. Every store method takes the lock for the
 * duration of its statement(s), so a read-modify-write on one record is
 * atomic and concurrent workers writing different records never interleave
 * inside a statement. Workers each own a distinct record, so contention is
 * limited to the (short) statement itself.
 */

#include "dsync/core/result.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace dsync::metadata {

/**
 * @brief Prepared statement with 1-based binds and 0-based columns
 */
class Statement {
public:
    Statement(sqlite3* db, sqlite3_stmt* stmt);

    Statement& bind(int index, std::int64_t value);
    Statement& bind(int index, const std::string& value);
    Statement& bind_null(int index);

    /**
     * @return true when a row is available, false when done
     */
    Result<bool> step();

    /**
     * @brief Run to completion, expecting no rows
     */
    Result<void> run();

    std::int64_t column_int64(int index) const;
    std::string column_text(int index) const;
    bool column_is_null(int index) const;

private:
    sqlite3* db_;
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt_;
};

class Database {
public:
    /**
     * @brief Open (creating if needed) and migrate the schema
     *
     * @param path File path, or ":memory:" for a private in-memory database
     */
    static Result<std::unique_ptr<Database>> open(const std::filesystem::path& path);

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    [[nodiscard]] std::unique_lock<std::mutex> lock() { return std::unique_lock<std::mutex>(mutex_); }

    Result<void> exec(const std::string& sql);
    Result<Statement> prepare(const std::string& sql);

    std::int64_t last_insert_id() const;
    int changes() const;

    const std::filesystem::path& path() const noexcept { return path_; }

    /**
     * @brief BEGIN IMMEDIATE / COMMIT, rolled back on destruction unless committed
     *
     * Caller must already hold lock().
     */
    class Transaction {
    public:
        explicit Transaction(Database& db);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        const Result<void>& begin_result() const { return begin_; }
        Result<void> commit();

    private:
        Database& db_;
        Result<void> begin_;
        bool done_ = false;
    };

private:
    Database(std::filesystem::path path, sqlite3* handle);

    Result<void> migrate();

    std::filesystem::path path_;
    std::unique_ptr<sqlite3, decltype(&sqlite3_close_v2)> handle_;
    std::mutex mutex_;
};

} // namespace dsync::metadata
