#include "dsync/config/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace dsync::config {
namespace {

using json = nlohmann::json;
using metadata::FilterRules;
using metadata::SyncTask;

template<typename T>
Result<T> config_error(const std::string& message) {
    return Err<T>(ErrorKind::Configuration, message);
}

std::string normalize_extension(std::string ext) {
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!ext.empty() && ext.front() != '.') {
        ext.insert(ext.begin(), '.');
    }
    return ext;
}

Result<std::vector<std::string>> read_extensions(const json& j, const char* key) {
    const auto& value = j.at(key);
    if (!value.is_array()) {
        return config_error<std::vector<std::string>>(std::string(key) + " must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto& item : value) {
        if (!item.is_string() || item.get<std::string>().empty()) {
            return config_error<std::vector<std::string>>(std::string(key) + " must contain non-empty strings");
        }
        out.push_back(normalize_extension(item.get<std::string>()));
    }
    return Ok(std::move(out));
}

Result<std::uint64_t> read_size(const json& j, const char* key) {
    const auto& value = j.at(key);
    if (value.is_number_unsigned()) {
        return Ok(value.get<std::uint64_t>());
    }
    if (value.is_number_integer()) {
        return config_error<std::uint64_t>(std::string(key) + " must not be negative");
    }
    return config_error<std::uint64_t>(std::string(key) + " must be a non-negative integer");
}

Result<std::string> read_string(const json& j, const char* key, bool required) {
    if (!j.contains(key)) {
        if (required) {
            return config_error<std::string>(std::string("missing required key: ") + key);
        }
        return Ok(std::string{});
    }
    const auto& value = j.at(key);
    if (!value.is_string()) {
        return config_error<std::string>(std::string(key) + " must be a string");
    }
    if (required && value.get<std::string>().empty()) {
        return config_error<std::string>(std::string(key) + " must not be empty");
    }
    return Ok(value.get<std::string>());
}

} // namespace

Result<FilterRules> parse_filters(const json& j) {
    FilterRules rules;
    if (j.is_null()) {
        return Ok(rules);
    }
    if (!j.is_object()) {
        return config_error<FilterRules>("filters must be an object");
    }

    for (const char* key : {"include_extensions", "exclude_extensions"}) {
        if (!j.contains(key) || j.at(key).is_null()) {
            continue;
        }
        auto exts = read_extensions(j, key);
        if (exts.is_error()) {
            return Err<FilterRules>(exts.error());
        }
        if (std::string(key) == "include_extensions") {
            rules.include_extensions = std::move(exts.value());
        } else {
            rules.exclude_extensions = std::move(exts.value());
        }
    }

    if (j.contains("min_size") && !j.at("min_size").is_null()) {
        auto size = read_size(j, "min_size");
        if (size.is_error()) {
            return Err<FilterRules>(size.error());
        }
        rules.min_size = size.value();
    }
    if (j.contains("max_size") && !j.at("max_size").is_null()) {
        auto size = read_size(j, "max_size");
        if (size.is_error()) {
            return Err<FilterRules>(size.error());
        }
        rules.max_size = size.value();
    }

    for (const char* key : {"name_contains", "name_excludes"}) {
        if (!j.contains(key) || j.at(key).is_null()) {
            continue;
        }
        if (!j.at(key).is_string()) {
            return config_error<FilterRules>(std::string(key) + " must be a string");
        }
        auto text = j.at(key).get<std::string>();
        if (std::string(key) == "name_contains") {
            rules.name_contains = std::move(text);
        } else {
            rules.name_excludes = std::move(text);
        }
    }

    if (auto valid = validate_filters(rules); valid.is_error()) {
        return Err<FilterRules>(valid.error());
    }
    return Ok(std::move(rules));
}

json filters_to_json(const FilterRules& rules) {
    json j = json::object();
    if (rules.include_extensions) j["include_extensions"] = *rules.include_extensions;
    if (rules.exclude_extensions) j["exclude_extensions"] = *rules.exclude_extensions;
    if (rules.min_size) j["min_size"] = *rules.min_size;
    if (rules.max_size) j["max_size"] = *rules.max_size;
    if (rules.name_contains) j["name_contains"] = *rules.name_contains;
    if (rules.name_excludes) j["name_excludes"] = *rules.name_excludes;
    return j;
}

Result<void> validate_filters(const FilterRules& rules) {
    if (rules.min_size && rules.max_size && *rules.min_size > *rules.max_size) {
        return config_error<void>("min_size (" + std::to_string(*rules.min_size) +
                                  ") is greater than max_size (" + std::to_string(*rules.max_size) + ")");
    }
    return Ok();
}

Result<SyncTask> parse_task(const json& j) {
    if (!j.is_object()) {
        return config_error<SyncTask>("task entry must be an object");
    }

    SyncTask task;
    auto name = read_string(j, "name", true);
    if (name.is_error()) return Err<SyncTask>(name.error());
    task.name = name.value();

    auto root = read_string(j, "remote_root_id", true);
    if (root.is_error()) return Err<SyncTask>(root.error());
    task.remote_root_id = root.value();

    auto local = read_string(j, "local_root", true);
    if (local.is_error()) return Err<SyncTask>(local.error());
    task.local_root = local.value();

    if (j.contains("filters")) {
        auto filters = parse_filters(j.at("filters"));
        if (filters.is_error()) {
            return Err<SyncTask>(Error{ErrorKind::Configuration,
                                       "task '" + task.name + "': " + filters.error().message});
        }
        task.filters = std::move(filters.value());
    }

    if (j.contains("concurrency")) {
        const auto& value = j.at("concurrency");
        if (!value.is_number_integer() || value.get<std::int64_t>() < 1) {
            return config_error<SyncTask>("task '" + task.name + "': concurrency must be an integer >= 1");
        }
        task.concurrency = value.get<std::uint32_t>();
    }
    if (j.contains("retry_count")) {
        const auto& value = j.at("retry_count");
        if (!value.is_number_integer() || value.get<std::int64_t>() < 0 ||
            value.get<std::int64_t>() > static_cast<std::int64_t>(metadata::kMaxRetryCount)) {
            return config_error<SyncTask>("task '" + task.name + "': retry_count must be an integer in [0, " +
                                          std::to_string(metadata::kMaxRetryCount) + "]");
        }
        task.retry_count = value.get<std::uint32_t>();
    }
    if (j.contains("bandwidth_limit_kbps")) {
        auto limit = read_size(j, "bandwidth_limit_kbps");
        if (limit.is_error()) {
            return Err<SyncTask>(Error{ErrorKind::Configuration,
                                       "task '" + task.name + "': " + limit.error().message});
        }
        task.bandwidth_limit_kbps = limit.value();
    }
    return Ok(std::move(task));
}

Result<AppConfig> parse_config(const json& j) {
    if (!j.is_object()) {
        return config_error<AppConfig>("configuration root must be an object");
    }

    AppConfig config;
    const std::pair<const char*, std::string*> string_keys[] = {
        {"database", &config.database},
        {"api_base_url", &config.api_base_url},
        {"token_file", &config.token_file},
    };
    for (const auto& [key, target] : string_keys) {
        if (!j.contains(key)) {
            continue;
        }
        auto value = read_string(j, key, true);
        if (value.is_error()) {
            return Err<AppConfig>(value.error());
        }
        *target = value.value();
    }

    if (j.contains("chunk_size")) {
        auto size = read_size(j, "chunk_size");
        if (size.is_error()) {
            return Err<AppConfig>(size.error());
        }
        if (size.value() == 0) {
            return config_error<AppConfig>("chunk_size must be > 0");
        }
        config.chunk_size = static_cast<std::size_t>(size.value());
    }
    if (j.contains("pause_poll_ms")) {
        auto ms = read_size(j, "pause_poll_ms");
        if (ms.is_error()) {
            return Err<AppConfig>(ms.error());
        }
        config.pause_poll = std::chrono::milliseconds(ms.value());
    }
    if (j.contains("progress_interval_ms")) {
        auto ms = read_size(j, "progress_interval_ms");
        if (ms.is_error()) {
            return Err<AppConfig>(ms.error());
        }
        config.progress_interval = std::chrono::milliseconds(ms.value());
    }

    if (j.contains("logging")) {
        const auto& logging = j.at("logging");
        if (!logging.is_object()) {
            return config_error<AppConfig>("logging must be an object");
        }
        auto level = read_string(logging, "level", false);
        if (level.is_error()) {
            return Err<AppConfig>(level.error());
        }
        if (!level.value().empty()) {
            static const char* const kLevels[] = {"trace", "debug", "info", "warn", "warning",
                                                  "error", "err", "critical", "off"};
            const auto& name = level.value();
            if (std::find(std::begin(kLevels), std::end(kLevels), name) == std::end(kLevels)) {
                return config_error<AppConfig>("unknown logging level '" + name + "'");
            }
            config.logging.level = name;
        }
        auto file = read_string(logging, "file", false);
        if (file.is_error()) {
            return Err<AppConfig>(file.error());
        }
        config.logging.file = file.value();
    }

    if (j.contains("tasks")) {
        const auto& tasks = j.at("tasks");
        if (!tasks.is_array()) {
            return config_error<AppConfig>("tasks must be an array");
        }
        for (const auto& entry : tasks) {
            auto task = parse_task(entry);
            if (task.is_error()) {
                return Err<AppConfig>(task.error());
            }
            const bool duplicate = std::any_of(config.tasks.begin(), config.tasks.end(),
                [&](const SyncTask& existing) { return existing.name == task.value().name; });
            if (duplicate) {
                return config_error<AppConfig>("duplicate task name: " + task.value().name);
            }
            config.tasks.push_back(std::move(task.value()));
        }
    }
    return Ok(std::move(config));
}

Result<AppConfig> parse_config_text(const std::string& text) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return config_error<AppConfig>("configuration is not valid JSON");
    }
    return parse_config(j);
}

Result<AppConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return config_error<AppConfig>("cannot open configuration file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto config = parse_config_text(buffer.str());
    if (config.is_error()) {
        return Err<AppConfig>(Error{ErrorKind::Configuration, path.string() + ": " + config.error().message});
    }
    return config;
}

} // namespace dsync::config
