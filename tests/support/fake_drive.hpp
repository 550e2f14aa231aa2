#pragma once

/**
 * @file fake_drive.hpp
 * @brief Scripted in-memory RemoteDrive for tests
 *
 * Folders and files live in memory. Faults are queued per file id and
 * consumed one per open, so "fail the first two attempts, then succeed"
 * is two calls to cut_after() or fail_open().
 */

#include "dsync/core/hash.hpp"
#include "dsync/metadata/types.hpp"
#include "dsync/remote/drive.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace dsync::testing {

using metadata::RemoteFileRecord;

class FakeDrive : public remote::RemoteDrive {
public:
    static constexpr const char* kDefaultTime = "2024-01-01T00:00:00.000Z";

    void add_folder(const std::string& id, const std::string& name, const std::string& parent_id) {
        RemoteFileRecord record;
        record.id = id;
        record.name = name;
        record.media_type = metadata::kFolderMediaType;
        record.is_directory = true;
        record.parent_ids = {parent_id};
        std::lock_guard<std::mutex> lock(mutex_);
        children_[parent_id].push_back(record);
    }

    RemoteFileRecord add_file(const std::string& id,
                              const std::string& name,
                              const std::string& parent_id,
                              const std::string& content,
                              const std::string& modified_time = kDefaultTime) {
        RemoteFileRecord record;
        record.id = id;
        record.name = name;
        record.path = name;
        record.size = content.size();
        record.modified_time = modified_time;
        record.checksum = md5_hex(content);
        record.media_type = "application/octet-stream";
        record.parent_ids = {parent_id};
        std::lock_guard<std::mutex> lock(mutex_);
        children_[parent_id].push_back(record);
        contents_[id] = content;
        return record;
    }

    RemoteFileRecord add_native(const std::string& id,
                                const std::string& name,
                                const std::string& parent_id,
                                const std::string& media_type,
                                const std::string& rendition) {
        RemoteFileRecord record;
        record.id = id;
        record.name = name;
        record.path = name;
        record.modified_time = kDefaultTime;
        record.media_type = media_type;
        record.parent_ids = {parent_id};
        std::lock_guard<std::mutex> lock(mutex_);
        children_[parent_id].push_back(record);
        exports_[id] = rendition;
        return record;
    }

    /**
     * Serve different bytes than the recorded checksum describes
     */
    void replace_content(const std::string& id, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        contents_[id] = content;
    }

    void set_page_size(std::size_t size) { page_size_ = size; }

    void fail_listing(const std::string& folder_id, Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        listing_faults_[folder_id] = std::move(error);
    }

    void fail_open(const std::string& file_id, Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        open_faults_[file_id].push_back(std::move(error));
    }

    /**
     * The next stream for file_id delivers `bytes` bytes, then a transient error
     */
    void cut_after(const std::string& file_id, std::size_t bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        cuts_[file_id].push_back(bytes);
    }

    void ignore_range(const std::string& file_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        ignore_range_.push_back(file_id);
    }

    void reject_range(const std::string& file_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        reject_range_.push_back(file_id);
    }

    /**
     * Delay applied to every read, to keep transfers in flight
     */
    void set_read_delay(std::chrono::milliseconds delay) { read_delay_ = delay; }

    std::vector<std::uint64_t> offsets(const std::string& file_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = offsets_.find(file_id);
        return it == offsets_.end() ? std::vector<std::uint64_t>{} : it->second;
    }

    std::size_t open_count(const std::string& file_id) const { return offsets(file_id).size(); }

    std::size_t total_opens() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t total = 0;
        for (const auto& entry : offsets_) {
            total += entry.second.size();
        }
        return total;
    }

    std::size_t list_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return list_calls_;
    }

    std::size_t max_concurrent_streams() const { return counter_->max_active.load(); }

    Result<remote::ListingPage> list_children(const std::string& folder_id,
                                              const std::string& page_token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++list_calls_;
        if (auto fault = listing_faults_.find(folder_id); fault != listing_faults_.end()) {
            return Err<remote::ListingPage>(fault->second);
        }

        remote::ListingPage page;
        auto it = children_.find(folder_id);
        if (it == children_.end()) {
            return Ok(std::move(page));
        }
        const auto& all = it->second;
        const std::size_t start = page_token.empty() ? 0 : std::stoul(page_token);
        const std::size_t end = std::min(all.size(), start + page_size_);
        for (std::size_t i = start; i < end; ++i) {
            auto item = all[i];
            item.path.clear();
            page.items.push_back(std::move(item));
        }
        if (end < all.size()) {
            page.next_page_token = std::to_string(end);
        }
        return Ok(std::move(page));
    }

    Result<std::unique_ptr<remote::ByteStream>> open_media(const std::string& file_id,
                                                           std::uint64_t offset) override {
        std::lock_guard<std::mutex> lock(mutex_);
        offsets_[file_id].push_back(offset);

        if (auto error = take_open_fault(file_id)) {
            return Err<std::unique_ptr<remote::ByteStream>>(*error);
        }
        auto content = contents_.find(file_id);
        if (content == contents_.end()) {
            return Err<std::unique_ptr<remote::ByteStream>>(ErrorKind::NotFound, "no such file " + file_id);
        }
        const std::string& body = content->second;
        const auto total = static_cast<std::uint64_t>(body.size());

        if (offset > 0 && contains(reject_range_, file_id)) {
            return stream("", remote::kStatusRangeNotSatisfiable, total, take_cut(file_id));
        }
        if (offset > 0 && contains(ignore_range_, file_id)) {
            return stream(body, remote::kStatusOk, total, take_cut(file_id));
        }
        if (offset > 0) {
            const auto start = std::min<std::uint64_t>(offset, total);
            return stream(body.substr(start), remote::kStatusPartialContent, total, take_cut(file_id));
        }
        return stream(body, remote::kStatusOk, total, take_cut(file_id));
    }

    Result<std::unique_ptr<remote::ByteStream>> open_export(const std::string& file_id,
                                                            const std::string& mime_type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        offsets_[file_id].push_back(0);
        export_mimes_.push_back(mime_type);

        if (auto error = take_open_fault(file_id)) {
            return Err<std::unique_ptr<remote::ByteStream>>(*error);
        }
        auto rendition = exports_.find(file_id);
        if (rendition == exports_.end()) {
            return Err<std::unique_ptr<remote::ByteStream>>(ErrorKind::NotFound, "no export for " + file_id);
        }
        return stream(rendition->second, remote::kStatusOk, std::nullopt, take_cut(file_id));
    }

    std::vector<std::string> export_mimes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return export_mimes_;
    }

private:
    struct StreamCounter {
        std::atomic<std::size_t> active{0};
        std::atomic<std::size_t> max_active{0};
    };

    class Stream : public remote::ByteStream {
    public:
        Stream(std::string body, int status, std::optional<std::uint64_t> total,
               std::optional<std::size_t> cut, std::chrono::milliseconds delay,
               std::shared_ptr<StreamCounter> counter)
            : body_(std::move(body)), status_(status), total_(total), cut_(cut),
              delay_(delay), counter_(std::move(counter)) {
            const auto now = ++counter_->active;
            auto seen = counter_->max_active.load();
            while (now > seen && !counter_->max_active.compare_exchange_weak(seen, now)) {
            }
        }

        ~Stream() override { --counter_->active; }

        Result<std::size_t> read(std::uint8_t* buffer, std::size_t max_bytes) override {
            if (delay_.count() > 0) {
                std::this_thread::sleep_for(delay_);
            }
            if (cut_ && position_ >= *cut_) {
                return Err<std::size_t>(ErrorKind::TransientTransport, "connection reset by peer");
            }
            std::size_t limit = body_.size() - position_;
            if (cut_) {
                limit = std::min(limit, *cut_ - position_);
            }
            const std::size_t n = std::min(limit, max_bytes);
            std::memcpy(buffer, body_.data() + position_, n);
            position_ += n;
            return Ok(n);
        }

        int status() const override { return status_; }
        std::optional<std::uint64_t> total_size() const override { return total_; }

    private:
        std::string body_;
        int status_;
        std::optional<std::uint64_t> total_;
        std::optional<std::size_t> cut_;
        std::chrono::milliseconds delay_;
        std::shared_ptr<StreamCounter> counter_;
        std::size_t position_ = 0;
    };

    Result<std::unique_ptr<remote::ByteStream>> stream(std::string body, int status,
                                                       std::optional<std::uint64_t> total,
                                                       std::optional<std::size_t> cut) {
        std::unique_ptr<remote::ByteStream> s =
            std::make_unique<Stream>(std::move(body), status, total, cut, read_delay_, counter_);
        return Ok(std::move(s));
    }

    std::optional<Error> take_open_fault(const std::string& file_id) {
        auto it = open_faults_.find(file_id);
        if (it == open_faults_.end() || it->second.empty()) {
            return std::nullopt;
        }
        Error error = it->second.front();
        it->second.pop_front();
        return error;
    }

    std::optional<std::size_t> take_cut(const std::string& file_id) {
        auto it = cuts_.find(file_id);
        if (it == cuts_.end() || it->second.empty()) {
            return std::nullopt;
        }
        const auto bytes = it->second.front();
        it->second.pop_front();
        return bytes;
    }

    static bool contains(const std::vector<std::string>& list, const std::string& id) {
        return std::find(list.begin(), list.end(), id) != list.end();
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<RemoteFileRecord>> children_;
    std::map<std::string, std::string> contents_;
    std::map<std::string, std::string> exports_;
    std::map<std::string, Error> listing_faults_;
    std::map<std::string, std::deque<Error>> open_faults_;
    std::map<std::string, std::deque<std::size_t>> cuts_;
    std::vector<std::string> ignore_range_;
    std::vector<std::string> reject_range_;
    std::map<std::string, std::vector<std::uint64_t>> offsets_;
    std::vector<std::string> export_mimes_;
    std::size_t list_calls_ = 0;
    std::size_t page_size_ = 1000;
    std::chrono::milliseconds read_delay_{0};
    std::shared_ptr<StreamCounter> counter_ = std::make_shared<StreamCounter>();
};

} // namespace dsync::testing
