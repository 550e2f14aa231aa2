#pragma once

/**
 * @file config.hpp
 * @brief JSON configuration for drivesync
 *
 * EXAMPLE:
 * {
 *   "database": "drivesync.db",
 *   "token_file": "token.json",
 *   "tasks": [
 *     {"name": "photos", "remote_root_id": "1AbC", "local_root": "/data/photos",
 *      "filters": {"include_extensions": [".jpg", ".png"], "min_size": 1024}}
 *   ]
 * }
 *
 * Unknown keys are ignored. Anything present but malformed is a
 * Configuration error; nothing is silently defaulted.
 */

#include "dsync/core/result.hpp"
#include "dsync/metadata/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace dsync::config {

inline constexpr std::size_t kDefaultChunkSize = 10 * 1024 * 1024;
inline constexpr const char* kDefaultApiBaseUrl = "https://www.googleapis.com/drive/v3";

struct LoggingConfig {
    std::string level = "info";
    std::string file;  // Empty: console only
};

struct AppConfig {
    std::string database = "drivesync.db";
    std::string api_base_url = kDefaultApiBaseUrl;
    std::string token_file = "token.json";
    std::size_t chunk_size = kDefaultChunkSize;
    std::chrono::milliseconds pause_poll{500};
    std::chrono::milliseconds progress_interval{1000};
    LoggingConfig logging;
    std::vector<metadata::SyncTask> tasks;
};

/**
 * @brief Parse a filter-rule object; extensions are normalized to lowercase ".ext"
 */
Result<metadata::FilterRules> parse_filters(const nlohmann::json& j);

nlohmann::json filters_to_json(const metadata::FilterRules& rules);

/**
 * @brief min_size <= max_size when both are set
 */
Result<void> validate_filters(const metadata::FilterRules& rules);

Result<metadata::SyncTask> parse_task(const nlohmann::json& j);

Result<AppConfig> parse_config(const nlohmann::json& j);

Result<AppConfig> parse_config_text(const std::string& text);

Result<AppConfig> load_config(const std::filesystem::path& path);

} // namespace dsync::config
