#pragma once

/**
 * @file http_drive_client.hpp
 * @brief RemoteDrive over the Drive v3 REST API (Boost.Beast, TLS via OpenSSL)
 *
 * HOW IT WORKS:
 * Every call is a synchronous GET on its own connection and io_context, so
 * worker threads never share a socket. The response header is read eagerly;
 * the body is handed back as a ByteStream and pulled by the caller, which
 * is what lets the downloader write chunk by chunk without buffering a
 * whole file.
 *
 * Redirects (301/302/303/307/308) are followed up to max_redirects hops.
 */

#include "dsync/core/result.hpp"
#include "dsync/remote/credentials.hpp"
#include "dsync/remote/drive.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace boost::asio::ssl {
class context;
}

namespace dsync::remote {

struct Url {
    std::string scheme;  // "http" or "https"
    std::string host;
    std::string port;
    std::string target;  // Path plus query, always starts with '/'
};

Result<Url> parse_url(const std::string& text);

std::string url_encode(const std::string& value);

/**
 * @brief Parse one files.list response body
 *
 * Accepts size as a JSON string (what the API sends) or a number.
 */
Result<ListingPage> parse_listing_page(const std::string& body);

/**
 * @brief Map a non-success HTTP status (and its JSON error body) to an Error
 *
 * 401/403 ⇒ Authentication (except 403 rate limiting, which is transient),
 * 404 ⇒ NotFound, 408/429/5xx ⇒ TransientTransport, other 4xx ⇒ Remote.
 */
Error error_for_status(int status, const std::string& body);

// "bytes 100-999/1000" ⇒ 1000; "bytes */1000" ⇒ 1000 (416 answers); "bytes 0-9/*" ⇒ nullopt
std::optional<std::uint64_t> total_from_content_range(const std::string& header);

class HttpDriveClient : public RemoteDrive {
public:
    struct Options {
        std::string api_base_url = "https://www.googleapis.com/drive/v3";
        std::chrono::seconds timeout{60};
        int max_redirects = 5;
        std::size_t page_size = 1000;
    };

    HttpDriveClient(Options options, TokenProvider& tokens);
    ~HttpDriveClient() override;

    HttpDriveClient(const HttpDriveClient&) = delete;
    HttpDriveClient& operator=(const HttpDriveClient&) = delete;

    Result<ListingPage> list_children(const std::string& folder_id,
                                      const std::string& page_token) override;

    Result<std::unique_ptr<ByteStream>> open_media(const std::string& file_id,
                                                   std::uint64_t offset) override;

    Result<std::unique_ptr<ByteStream>> open_export(const std::string& file_id,
                                                    const std::string& mime_type) override;

private:
    Result<std::unique_ptr<ByteStream>> get(const std::string& url, std::uint64_t offset);

    Options options_;
    TokenProvider& tokens_;
    std::shared_ptr<boost::asio::ssl::context> ssl_context_;
};

} // namespace dsync::remote
