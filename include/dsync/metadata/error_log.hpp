#pragma once

#include "dsync/core/error.hpp"
#include "dsync/core/result.hpp"
#include "dsync/metadata/database.hpp"
#include "dsync/metadata/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dsync::metadata {

/**
 * @brief Append-only audit trail of failed transfer attempts
 */
class ErrorLog {
public:
    explicit ErrorLog(Database& db) : db_(db) {}

    Result<void> append(std::int64_t task_id,
                        const std::string& file_path,
                        const Error& error,
                        std::uint32_t retry_count);

    /**
     * @brief Entries for one task, newest first
     *
     * @param limit 0 for all entries
     */
    Result<std::vector<ErrorLogEntry>> list_by_task(std::int64_t task_id, std::size_t limit = 0);

private:
    Database& db_;
};

} // namespace dsync::metadata
