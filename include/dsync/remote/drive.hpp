#pragma once

/**
 * @file drive.hpp
 * @brief Backend seam between the sync engine and a remote file store
 *
 * WHY THIS FILE EXISTS:
 * The walker and the downloader only need three things from the remote:
 * list a folder, stream a file's bytes from an offset, and stream an
 * exported rendition of a native document. Everything behind this interface
 * (HTTP, TLS, auth headers, redirects) is the backend's business, so tests
 * plug in a scripted in-memory drive and never touch the network.
 *
 * CONTRACT:
 * - Errors use the shared ErrorKind taxonomy: TransientTransport for
 *   anything worth retrying, Authentication for 401/403, NotFound for 404,
 *   Remote for other client errors.
 * - A ByteStream reports the HTTP-style status of the response so the
 *   downloader can tell a honoured range (206) from an ignored one (200)
 *   or an unsatisfiable one (416).
 */

#include "dsync/core/result.hpp"
#include "dsync/metadata/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dsync::remote {

inline constexpr int kStatusOk = 200;
inline constexpr int kStatusPartialContent = 206;
inline constexpr int kStatusRangeNotSatisfiable = 416;

/**
 * @brief Pull-based response body
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /**
     * @brief Read up to max_bytes into buffer
     *
     * @return bytes read; 0 means the body is complete
     */
    virtual Result<std::size_t> read(std::uint8_t* buffer, std::size_t max_bytes) = 0;

    /**
     * @brief 200 (whole object), 206 (range honoured) or 416 (range past the end)
     */
    virtual int status() const = 0;

    /**
     * @brief Size of the whole remote object when the response says so
     *
     * Taken from Content-Range on a 206, Content-Length on a 200.
     */
    virtual std::optional<std::uint64_t> total_size() const = 0;
};

/**
 * @brief One page of a folder listing
 */
struct ListingPage {
    std::vector<metadata::RemoteFileRecord> items;  // path is left empty; the walker assigns it
    std::string next_page_token;                    // Empty on the last page
};

class RemoteDrive {
public:
    virtual ~RemoteDrive() = default;

    /**
     * @brief Direct, non-trashed children of a folder
     *
     * @param page_token empty for the first page
     */
    virtual Result<ListingPage> list_children(const std::string& folder_id,
                                              const std::string& page_token) = 0;

    /**
     * @brief Raw bytes of a file, starting at offset (offset > 0 sends a range request)
     */
    virtual Result<std::unique_ptr<ByteStream>> open_media(const std::string& file_id,
                                                           std::uint64_t offset) = 0;

    /**
     * @brief Exported rendition of a native document in the given format
     */
    virtual Result<std::unique_ptr<ByteStream>> open_export(const std::string& file_id,
                                                            const std::string& mime_type) = 0;
};

/**
 * @brief Export format for a native document
 */
struct ExportFormat {
    std::string mime_type;
    std::string extension;  // With the leading dot
};

ExportFormat export_format_for(metadata::NativeKind kind);

} // namespace dsync::remote
