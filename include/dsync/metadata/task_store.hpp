#pragma once

#include "dsync/core/result.hpp"
#include "dsync/metadata/database.hpp"
#include "dsync/metadata/types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dsync::metadata {

/**
 * @brief Persisted sync task definitions
 *
 * Filters are stored as a JSON object in the `filters` column.
 */
class TaskStore {
public:
    explicit TaskStore(Database& db) : db_(db) {}

    /**
     * @brief Insert a new task; the name must be unique
     *
     * @return the stored task with its assigned id
     */
    Result<SyncTask> create(const SyncTask& task);

    /**
     * @brief Create, or update the task of the same name in place (keeping its id)
     */
    Result<SyncTask> upsert_by_name(const SyncTask& task);

    Result<SyncTask> get(std::int64_t task_id);

    Result<std::optional<SyncTask>> find_by_name(const std::string& name);

    Result<std::vector<SyncTask>> list();

    Result<void> update(const SyncTask& task);

    /**
     * @brief Delete a task with its progress records and error log in one transaction
     */
    Result<void> remove(std::int64_t task_id);

private:
    Result<std::vector<SyncTask>> query_locked(const std::string& where,
                                               const std::function<void(Statement&)>& bind);

    Database& db_;
};

} // namespace dsync::metadata
