#include "dsync/sync/diff_engine.hpp"

#include "dsync/core/timestamp.hpp"
#include "dsync/remote/walker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <system_error>

namespace dsync::sync {
namespace fs = std::filesystem;
using metadata::FilterRules;
using metadata::RemoteFileRecord;

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

bool ends_with_ci(const std::string& text, const std::string& suffix) {
    if (suffix.size() > text.size()) {
        return false;
    }
    return to_lower(text.substr(text.size() - suffix.size())) == to_lower(suffix);
}

bool in_list(const std::vector<std::string>& list, const std::string& ext) {
    return std::any_of(list.begin(), list.end(),
                       [&](const std::string& candidate) { return to_lower(candidate) == ext; });
}

} // namespace

std::string lowercase_extension(const std::string& name) {
    return to_lower(fs::path(name).extension().string());
}

fs::path local_path_for(const fs::path& local_root, const RemoteFileRecord& record) {
    std::string relative = record.path.empty() ? record.name : record.path;
    if (record.is_native_document()) {
        const auto format = remote::export_format_for(record.native_kind());
        if (!ends_with_ci(relative, format.extension)) {
            relative += format.extension;
        }
    }
    return local_root / fs::path(relative);
}

SyncDecision DiffEngine::compare(const RemoteFileRecord& remote, const fs::path& local_path) {
    std::error_code ec;
    if (!fs::is_regular_file(local_path, ec)) {
        return SyncDecision::Download;
    }

    if (!remote.is_native_document()) {
        const auto local_size = fs::file_size(local_path, ec);
        if (ec || local_size != remote.size) {
            return SyncDecision::Download;
        }
    }

    const auto remote_time = parse_iso8601_naive(remote.modified_time);
    const auto local_time = local_mtime_naive(local_path);
    if (!remote_time || !local_time) {
        spdlog::debug("Unreadable modification time for {} (remote='{}'), downloading",
                      remote.path, remote.modified_time);
        return SyncDecision::Download;
    }

    return *remote_time > *local_time ? SyncDecision::Download : SyncDecision::Skip;
}

bool DiffEngine::matches(const RemoteFileRecord& record, const FilterRules& rules) {
    if (record.is_directory) {
        return false;
    }

    const auto ext = lowercase_extension(record.name);
    if (rules.include_extensions && !rules.include_extensions->empty() &&
        !in_list(*rules.include_extensions, ext)) {
        return false;
    }
    if (rules.exclude_extensions && in_list(*rules.exclude_extensions, ext)) {
        return false;
    }
    if (rules.min_size && record.size < *rules.min_size) {
        return false;
    }
    if (rules.max_size && record.size > *rules.max_size) {
        return false;
    }
    if (rules.name_contains && !rules.name_contains->empty() && !contains_ci(record.name, *rules.name_contains)) {
        return false;
    }
    if (rules.name_excludes && !rules.name_excludes->empty() && contains_ci(record.name, *rules.name_excludes)) {
        return false;
    }
    return true;
}

std::vector<RemoteFileRecord> DiffEngine::filter(const std::vector<RemoteFileRecord>& records,
                                                 const FilterRules& rules) {
    std::vector<RemoteFileRecord> kept;
    kept.reserve(records.size());
    std::copy_if(records.begin(), records.end(), std::back_inserter(kept),
                 [&](const RemoteFileRecord& record) { return matches(record, rules); });
    return kept;
}

Result<DiffResult> DiffEngine::scan_and_compare(const metadata::SyncTask& task) {
    remote::RemoteWalker walker(drive_);
    auto listed = walker.walk(task.remote_root_id);
    if (listed.is_error()) {
        return Err<DiffResult>(listed.error());
    }

    DiffResult result;
    result.scanned = listed.value().size();

    auto candidates = filter(listed.value(), task.filters);
    result.filtered_out = result.scanned - candidates.size();

    const fs::path root(task.local_root);
    for (auto& record : candidates) {
        if (compare(record, local_path_for(root, record)) == SyncDecision::Download) {
            result.to_download.push_back(std::move(record));
        } else {
            result.to_skip.push_back(std::move(record));
        }
    }

    spdlog::info("[ScanCompared] task={} scanned={} filtered_out={} to_download={} to_skip={}",
                 task.name, result.scanned, result.filtered_out,
                 result.to_download.size(), result.to_skip.size());
    return Ok(std::move(result));
}

} // namespace dsync::sync
