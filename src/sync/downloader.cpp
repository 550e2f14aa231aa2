#include "dsync/sync/downloader.hpp"

#include "dsync/core/hash.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <optional>
#include <system_error>
#include <vector>

namespace dsync::sync {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kReadBlock = 64 * 1024;
constexpr std::uint32_t kMaxBackoffExponent = 10;

std::uint64_t on_disk_size(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return 0;
    }
    const auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

Result<void> ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return Ok();
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::is_directory(parent)) {
        return Err<void>(ErrorKind::Io, "Failed to create directory " + parent.string() + ": " + ec.message());
    }
    return Ok();
}

/**
 * Byte budget enforcing an average rate since the start of the transfer
 */
class RateLimiter {
public:
    explicit RateLimiter(std::uint64_t kib_per_second)
        : bytes_per_second_(kib_per_second * 1024), start_(std::chrono::steady_clock::now()) {}

    /**
     * @return false if aborted while throttling
     */
    bool consume(std::size_t bytes, TransferControl& control) {
        if (bytes_per_second_ == 0) {
            return true;
        }
        consumed_ += bytes;
        const std::chrono::duration<double> expected(static_cast<double>(consumed_) /
                                                     static_cast<double>(bytes_per_second_));
        const auto elapsed = std::chrono::steady_clock::now() - start_;
        if (expected > elapsed) {
            return control.sleep_for(std::chrono::duration_cast<std::chrono::milliseconds>(expected - elapsed));
        }
        return true;
    }

private:
    std::uint64_t bytes_per_second_;
    std::uint64_t consumed_ = 0;
    std::chrono::steady_clock::time_point start_;
};

struct ChunkRead {
    std::size_t bytes = 0;
    bool eof = false;
    std::optional<Error> error;
};

/**
 * Fill the chunk buffer until it is full, the body ends, or a read fails.
 * Bytes read before a failure are still reported so they can be written.
 */
ChunkRead fill_chunk(remote::ByteStream& stream,
                     std::vector<std::uint8_t>& chunk,
                     RateLimiter& limiter,
                     TransferControl& control) {
    ChunkRead result;
    while (result.bytes < chunk.size()) {
        const auto want = std::min(kReadBlock, chunk.size() - result.bytes);
        auto n = stream.read(chunk.data() + result.bytes, want);
        if (n.is_error()) {
            result.error = n.error();
            break;
        }
        if (n.value() == 0) {
            result.eof = true;
            break;
        }
        result.bytes += n.value();
        if (!limiter.consume(n.value(), control)) {
            break;
        }
    }
    return result;
}

/**
 * Writes flushed chunks and decides when to persist progress
 */
class ChunkSink {
public:
    ChunkSink(const fs::path& path,
              std::uint64_t start,
              std::chrono::milliseconds persist_interval,
              const PersistCallback& persist)
        : path_(path),
          written_(start),
          persist_interval_(persist_interval),
          persist_(persist),
          last_persist_(std::chrono::steady_clock::now()) {}

    Result<void> open(bool append) {
        out_.open(path_, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
        if (!out_) {
            return Err<void>(ErrorKind::Io, "Failed to open " + path_.string() + " for writing");
        }
        return Ok();
    }

    Result<void> write(const std::uint8_t* data, std::size_t size) {
        out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        out_.flush();
        if (!out_) {
            return Err<void>(ErrorKind::Io, "Failed to write " + path_.string());
        }
        written_ += size;
        dirty_ = true;

        if (std::chrono::steady_clock::now() - last_persist_ >= persist_interval_) {
            return persist();
        }
        return Ok();
    }

    Result<void> persist() {
        if (!persist_ || !dirty_) {
            return Ok();
        }
        if (auto saved = persist_(written_); saved.is_error()) {
            return saved;
        }
        dirty_ = false;
        last_persist_ = std::chrono::steady_clock::now();
        return Ok();
    }

    /**
     * Best effort on the way out of a failed or cancelled attempt
     */
    void persist_or_log() {
        if (auto saved = persist(); saved.is_error()) {
            spdlog::error("Could not record progress for {}: {}", path_.string(), saved.error().message);
        }
    }

    Result<void> close() {
        out_.close();
        if (out_.fail()) {
            return Err<void>(ErrorKind::Io, "Failed to close " + path_.string());
        }
        return persist();
    }

    std::uint64_t written() const noexcept { return written_; }

private:
    fs::path path_;
    std::ofstream out_;
    std::uint64_t written_;
    std::chrono::milliseconds persist_interval_;
    const PersistCallback& persist_;
    std::chrono::steady_clock::time_point last_persist_;
    bool dirty_ = false;
};

Error cancelled_error(const fs::path& path, std::uint64_t bytes) {
    return Error{ErrorKind::Cancelled,
                 "cancelled at " + std::to_string(bytes) + " bytes: " + path.string()};
}

} // namespace

ChunkedDownloader::ChunkedDownloader(remote::RemoteDrive& drive, DownloadOptions options)
    : drive_(drive), options_(std::move(options)) {
    if (options_.chunk_size == 0) {
        options_.chunk_size = 10 * 1024 * 1024;
    }
}

Result<DownloadOutcome> ChunkedDownloader::download(const DownloadRequest& request,
                                                    TransferControl& control,
                                                    const ProgressCallback& on_progress,
                                                    const PersistCallback& persist) {
    const auto& remote = request.remote;
    const bool exported = remote.is_native_document();

    std::uint64_t offset = exported ? 0 : request.resume_offset;
    if (remote.size > 0 && offset > remote.size) {
        spdlog::warn("[ResumeReset] path={} offset={} exceeds remote size {}", remote.path, offset, remote.size);
        offset = 0;
    }

    DownloadOutcome outcome;
    outcome.exported = exported;

    const bool already_complete = !exported && remote.size > 0 && offset == remote.size &&
                                  on_disk_size(request.destination) == remote.size;
    if (already_complete) {
        spdlog::debug("{} already holds all {} bytes, verifying only", request.destination.string(), remote.size);
    }

    while (!already_complete) {
        std::uint64_t transferred = 0;
        auto fetched = exported
                           ? fetch_export(request, control, on_progress, persist, transferred)
                           : fetch_media(request, offset, control, on_progress, persist, transferred);
        outcome.bytes_transferred += transferred;
        if (fetched.is_ok()) {
            break;
        }

        const auto& error = fetched.error();
        if (error.kind == ErrorKind::Cancelled || !error.is_retryable()) {
            return Err<DownloadOutcome>(error);
        }
        if (outcome.retries >= options_.max_retries) {
            return Err<DownloadOutcome>(Error{error.kind,
                "giving up after " + std::to_string(outcome.retries) + " retries: " + error.message});
        }

        ++outcome.retries;
        const auto wait = options_.backoff_unit * (1u << std::min(outcome.retries, kMaxBackoffExponent));
        spdlog::warn("[DownloadRetry] path={} retry={}/{} wait={}ms error={}",
                     remote.path, outcome.retries, options_.max_retries, wait.count(), error.message);
        if (!control.sleep_for(wait)) {
            return Err<DownloadOutcome>(cancelled_error(request.destination, on_disk_size(request.destination)));
        }

        // The disk is the only trustworthy record of what the failed attempt wrote
        offset = exported ? 0 : on_disk_size(request.destination);
        if (remote.size > 0 && offset > remote.size) {
            offset = 0;
        }
    }

    if (auto verified = verify(request); verified.is_error()) {
        return Err<DownloadOutcome>(verified.error());
    }

    outcome.bytes_on_disk = on_disk_size(request.destination);
    return Ok(outcome);
}

Result<std::uint64_t> ChunkedDownloader::fetch_media(const DownloadRequest& request,
                                                     std::uint64_t offset,
                                                     TransferControl& control,
                                                     const ProgressCallback& on_progress,
                                                     const PersistCallback& persist,
                                                     std::uint64_t& transferred) {
    const auto& remote = request.remote;
    auto opened = drive_.open_media(remote.id, offset);
    if (opened.is_error()) {
        return Err<std::uint64_t>(opened.error());
    }
    auto stream = std::move(opened.value());

    if (offset > 0 && stream->status() == remote::kStatusRangeNotSatisfiable) {
        spdlog::warn("[RangeRejected] path={} offset={}, restarting from 0", remote.path, offset);
        offset = 0;
        auto reopened = drive_.open_media(remote.id, 0);
        if (reopened.is_error()) {
            return Err<std::uint64_t>(reopened.error());
        }
        stream = std::move(reopened.value());
    } else if (offset > 0 && stream->status() != remote::kStatusPartialContent) {
        spdlog::warn("[RangeIgnored] path={} offset={} status={}, rewriting from 0",
                     remote.path, offset, stream->status());
        offset = 0;
    }

    if (auto dir = ensure_parent_exists(request.destination); dir.is_error()) {
        return Err<std::uint64_t>(dir.error());
    }

    if (offset > 0 && on_disk_size(request.destination) != offset) {
        std::error_code ec;
        fs::resize_file(request.destination, offset, ec);
        if (ec) {
            return Err<std::uint64_t>(ErrorKind::Io,
                "Failed to truncate " + request.destination.string() + " to resume offset: " + ec.message());
        }
    }

    ChunkSink sink(request.destination, offset, options_.progress_interval, persist);
    if (auto opened_file = sink.open(offset > 0); opened_file.is_error()) {
        return Err<std::uint64_t>(opened_file.error());
    }

    const std::uint64_t total = remote.size > 0 ? remote.size : stream->total_size().value_or(0);
    std::vector<std::uint8_t> chunk(options_.chunk_size);
    RateLimiter limiter(options_.bandwidth_limit_kbps);

    while (true) {
        if (!control.hold_while_paused()) {
            sink.persist_or_log();
            return Err<std::uint64_t>(cancelled_error(request.destination, sink.written()));
        }

        const auto read = fill_chunk(*stream, chunk, limiter, control);
        if (read.bytes > 0) {
            if (auto written = sink.write(chunk.data(), read.bytes); written.is_error()) {
                return Err<std::uint64_t>(written.error());
            }
            transferred += read.bytes;
            if (on_progress) {
                on_progress(sink.written(), total);
            }
        }
        if (read.error) {
            sink.persist_or_log();
            return Err<std::uint64_t>(*read.error);
        }
        if (read.eof) {
            break;
        }
    }

    if (auto closed = sink.close(); closed.is_error()) {
        return Err<std::uint64_t>(closed.error());
    }

    if (total > 0 && sink.written() < total) {
        return Err<std::uint64_t>(ErrorKind::TransientTransport,
            "body ended after " + std::to_string(sink.written()) + " of " + std::to_string(total) + " bytes");
    }
    return Ok(sink.written());
}

Result<std::uint64_t> ChunkedDownloader::fetch_export(const DownloadRequest& request,
                                                      TransferControl& control,
                                                      const ProgressCallback& on_progress,
                                                      const PersistCallback& persist,
                                                      std::uint64_t& transferred) {
    const auto& remote = request.remote;
    const auto format = remote::export_format_for(remote.native_kind());
    if (on_progress) {
        on_progress(0, 100);
    }

    auto opened = drive_.open_export(remote.id, format.mime_type);
    if (opened.is_error()) {
        return Err<std::uint64_t>(opened.error());
    }
    auto stream = std::move(opened.value());

    if (auto dir = ensure_parent_exists(request.destination); dir.is_error()) {
        return Err<std::uint64_t>(dir.error());
    }

    ChunkSink sink(request.destination, 0, options_.progress_interval, persist);
    if (auto opened_file = sink.open(false); opened_file.is_error()) {
        return Err<std::uint64_t>(opened_file.error());
    }

    const auto total = stream->total_size();
    std::vector<std::uint8_t> chunk(options_.chunk_size);
    RateLimiter limiter(options_.bandwidth_limit_kbps);
    std::uint64_t last_percent = 0;

    while (true) {
        if (!control.hold_while_paused()) {
            sink.persist_or_log();
            return Err<std::uint64_t>(cancelled_error(request.destination, sink.written()));
        }

        const auto read = fill_chunk(*stream, chunk, limiter, control);
        if (read.bytes > 0) {
            if (auto written = sink.write(chunk.data(), read.bytes); written.is_error()) {
                return Err<std::uint64_t>(written.error());
            }
            transferred += read.bytes;
            if (on_progress && total && *total > 0) {
                const auto percent = std::min<std::uint64_t>(99, sink.written() * 100 / *total);
                if (percent != last_percent) {
                    last_percent = percent;
                    on_progress(percent, 100);
                }
            }
        }
        if (read.error) {
            sink.persist_or_log();
            return Err<std::uint64_t>(*read.error);
        }
        if (read.eof) {
            break;
        }
    }

    if (auto closed = sink.close(); closed.is_error()) {
        return Err<std::uint64_t>(closed.error());
    }
    if (on_progress) {
        on_progress(100, 100);
    }
    spdlog::debug("Exported {} as {} ({} bytes)", remote.path, format.mime_type, sink.written());
    return Ok(sink.written());
}

Result<void> ChunkedDownloader::verify(const DownloadRequest& request) {
    const auto expected = request.remote.checksum_or_empty();
    if (expected.empty()) {
        return Ok();
    }

    auto actual = md5_file(request.destination);
    if (actual.is_error()) {
        return Err<void>(actual.error());
    }
    if (checksum_matches(actual.value(), expected)) {
        return Ok();
    }

    std::error_code ec;
    fs::remove(request.destination, ec);
    if (ec) {
        spdlog::error("Could not delete corrupt file {}: {}", request.destination.string(), ec.message());
    }
    return Err<void>(ErrorKind::Integrity,
                     "checksum mismatch for " + request.remote.path + ": expected " + expected +
                         ", got " + actual.value());
}

} // namespace dsync::sync
