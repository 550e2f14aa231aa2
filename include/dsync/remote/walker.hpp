#pragma once

#include "dsync/core/result.hpp"
#include "dsync/metadata/types.hpp"
#include "dsync/remote/drive.hpp"

#include <string>
#include <vector>

namespace dsync::remote {

/**
 * @brief Recursively enumerates a remote folder tree into a flat file list
 *
 * ORDER:
 * Depth-first; the files of a subfolder appear at that subfolder's position
 * in its parent's listing. Folders themselves are never returned.
 *
 * PATHS:
 * Each record's path is "parent/child" relative to the root, '/'-separated.
 * Names that would escape the root ("", ".", "..", or containing '/') are
 * skipped with a warning.
 */
class RemoteWalker {
public:
    explicit RemoteWalker(RemoteDrive& drive) : drive_(drive) {}

    Result<std::vector<metadata::RemoteFileRecord>> walk(const std::string& root_id);

    std::size_t folders_visited() const noexcept { return folders_visited_; }

private:
    Result<void> walk_folder(const std::string& folder_id,
                             const std::string& folder_path,
                             std::vector<metadata::RemoteFileRecord>& out,
                             std::vector<std::string>& ancestry);

    RemoteDrive& drive_;
    std::size_t folders_visited_ = 0;
};

std::string join_remote_path(const std::string& parent, const std::string& name);

} // namespace dsync::remote
