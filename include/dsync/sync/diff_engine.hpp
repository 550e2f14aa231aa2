#pragma once

#include "dsync/core/result.hpp"
#include "dsync/metadata/types.hpp"
#include "dsync/remote/drive.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace dsync::sync {

enum class SyncDecision {
    Download,
    Skip
};

/**
 * @brief Partition of one scan, computed once per run
 */
struct DiffResult {
    std::vector<metadata::RemoteFileRecord> to_download;  ///< Encounter order
    std::vector<metadata::RemoteFileRecord> to_skip;      ///< Encounter order
    std::size_t scanned = 0;                              ///< Files seen before filtering
    std::size_t filtered_out = 0;
};

/**
 * @brief Decides which remote files need transferring
 *
 * The remote is the source of truth. A local file is up to date when it
 * has the remote's size and is not older than the remote's modification
 * time (both read as timezone-stripped wall clock). Anything uncertain
 * (missing file, unparsable time) is downloaded.
 */
class DiffEngine {
public:
    explicit DiffEngine(remote::RemoteDrive& drive) : drive_(drive) {}

    /**
     * @brief Per-file decision
     *
     * The size check is skipped for native documents, whose remote size is
     * not the size of their exported rendition.
     */
    static SyncDecision compare(const metadata::RemoteFileRecord& remote,
                                const std::filesystem::path& local_path);

    /**
     * @brief True when the record passes every configured rule; directories never pass
     */
    static bool matches(const metadata::RemoteFileRecord& record, const metadata::FilterRules& rules);

    static std::vector<metadata::RemoteFileRecord> filter(const std::vector<metadata::RemoteFileRecord>& records,
                                                          const metadata::FilterRules& rules);

    /**
     * @brief Walk the task's remote root, filter, and compare against local_root
     */
    Result<DiffResult> scan_and_compare(const metadata::SyncTask& task);

private:
    remote::RemoteDrive& drive_;
};

/**
 * @brief local_root / path, plus the export extension for native documents
 *
 * EXAMPLE:
 * "docs/Plan" (document) ⇒ <root>/docs/Plan.docx
 * "docs/Plan.docx" (document) ⇒ <root>/docs/Plan.docx
 */
std::filesystem::path local_path_for(const std::filesystem::path& local_root,
                                     const metadata::RemoteFileRecord& record);

/**
 * @brief Lowercase extension of a file name including the dot ("" when none)
 */
std::string lowercase_extension(const std::string& name);

} // namespace dsync::sync
