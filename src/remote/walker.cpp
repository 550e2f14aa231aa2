#include "dsync/remote/walker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace dsync::remote {
namespace {

bool is_safe_name(const std::string& name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

} // namespace

std::string join_remote_path(const std::string& parent, const std::string& name) {
    if (parent.empty()) {
        return name;
    }
    return parent + "/" + name;
}

Result<std::vector<metadata::RemoteFileRecord>> RemoteWalker::walk(const std::string& root_id) {
    folders_visited_ = 0;
    std::vector<metadata::RemoteFileRecord> files;
    std::vector<std::string> ancestry;
    if (auto walked = walk_folder(root_id, "", files, ancestry); walked.is_error()) {
        return Err<std::vector<metadata::RemoteFileRecord>>(walked.error());
    }
    spdlog::debug("Walked {} folder(s) under {}: {} file(s)", folders_visited_, root_id, files.size());
    return Ok(std::move(files));
}

Result<void> RemoteWalker::walk_folder(const std::string& folder_id,
                                       const std::string& folder_path,
                                       std::vector<metadata::RemoteFileRecord>& out,
                                       std::vector<std::string>& ancestry) {
    // Shared folders can be reachable from more than one parent; never loop
    if (std::find(ancestry.begin(), ancestry.end(), folder_id) != ancestry.end()) {
        spdlog::warn("Folder cycle at {} ({}), not descending", folder_path, folder_id);
        return Ok();
    }
    ancestry.push_back(folder_id);
    ++folders_visited_;

    std::string page_token;
    do {
        auto page = drive_.list_children(folder_id, page_token);
        if (page.is_error()) {
            return Err<void>(Error{page.error().kind,
                                   "listing " + (folder_path.empty() ? folder_id : folder_path) +
                                       ": " + page.error().message});
        }

        for (auto& item : page.value().items) {
            if (!is_safe_name(item.name)) {
                spdlog::warn("Skipping remote item {} with unusable name '{}'", item.id, item.name);
                continue;
            }
            item.path = join_remote_path(folder_path, item.name);
            if (item.is_directory) {
                if (auto nested = walk_folder(item.id, item.path, out, ancestry); nested.is_error()) {
                    return nested;
                }
                continue;
            }
            out.push_back(std::move(item));
        }
        page_token = page.value().next_page_token;
    } while (!page_token.empty());

    ancestry.pop_back();
    return Ok();
}

} // namespace dsync::remote
