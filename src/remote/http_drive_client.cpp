#include "dsync/remote/http_drive_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <nlohmann/json.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <sys/socket.h>
#include <sys/time.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <limits>
#include <iomanip>
#include <sstream>

namespace dsync::remote {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using json = nlohmann::json;

constexpr std::size_t kErrorBodyLimit = 64 * 1024;
constexpr const char* kUserAgent = "drivesync/1.0";
constexpr const char* kListFields =
    "nextPageToken,files(id,name,mimeType,size,modifiedTime,md5Checksum,parents)";

bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::optional<std::uint64_t> parse_u64(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return value;
}

/**
 * Beast stream expiry only covers async operations; blocking reads need the socket options
 */
void apply_socket_timeout(tcp::socket& socket, std::chrono::seconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout.count());
    const auto handle = socket.native_handle();
    if (::setsockopt(handle, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        ::setsockopt(handle, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        spdlog::warn("Could not set socket timeout: {}", std::strerror(errno));
    }
}

Result<std::string> read_all(ByteStream& stream, std::size_t limit) {
    std::string body;
    std::uint8_t buffer[4096];
    while (body.size() < limit) {
        auto n = stream.read(buffer, sizeof(buffer));
        if (n.is_error()) {
            return Err<std::string>(n.error());
        }
        if (n.value() == 0) {
            break;
        }
        body.append(reinterpret_cast<const char*>(buffer), n.value());
    }
    return Ok(std::move(body));
}

void shutdown_stream(beast::tcp_stream& stream) {
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        spdlog::debug("Socket shutdown: {}", ec.message());
    }
}

// A body left unread makes a graceful TLS shutdown pointless; just drop the socket
void shutdown_stream(beast::ssl_stream<beast::tcp_stream>& stream) {
    beast::error_code ec;
    beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        spdlog::debug("TLS socket shutdown: {}", ec.message());
    }
}

/**
 * Response whose header has been read; the body is pulled on demand
 */
class HttpResponseStream : public ByteStream {
public:
    virtual std::string location() const = 0;
};

template<typename Stream>
class BeastResponseStream final : public HttpResponseStream {
public:
    BeastResponseStream(std::unique_ptr<net::io_context> ioc, std::unique_ptr<Stream> stream)
        : ioc_(std::move(ioc)), stream_(std::move(stream)) {
        parser_.body_limit(boost::none);
    }

    ~BeastResponseStream() override { shutdown_stream(*stream_); }

    Result<void> send(const http::request<http::empty_body>& request) {
        beast::error_code ec;
        http::write(*stream_, request, ec);
        if (ec) {
            return Err<void>(ErrorKind::TransientTransport, "write failed: " + ec.message());
        }
        http::read_header(*stream_, buffer_, parser_, ec);
        if (ec) {
            return Err<void>(ErrorKind::TransientTransport, "reading response header failed: " + ec.message());
        }
        return Ok();
    }

    Result<std::size_t> read(std::uint8_t* buffer, std::size_t max_bytes) override {
        if (max_bytes == 0 || parser_.is_done()) {
            return Ok(std::size_t{0});
        }
        auto& body = parser_.get().body();
        body.data = buffer;
        body.size = max_bytes;

        beast::error_code ec;
        http::read(*stream_, buffer_, parser_, ec);
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        if (ec) {
            return Err<std::size_t>(ErrorKind::TransientTransport, "reading response body failed: " + ec.message());
        }
        return Ok(max_bytes - body.size);
    }

    int status() const override { return static_cast<int>(parser_.get().result_int()); }

    std::optional<std::uint64_t> total_size() const override {
        const auto& response = parser_.get();
        if (status() == kStatusPartialContent || status() == kStatusRangeNotSatisfiable) {
            const auto it = response.find(http::field::content_range);
            if (it == response.end()) {
                return std::nullopt;
            }
            return total_from_content_range(std::string(it->value()));
        }
        if (const auto length = parser_.content_length()) {
            return static_cast<std::uint64_t>(*length);
        }
        return std::nullopt;
    }

    std::string location() const override {
        const auto& response = parser_.get();
        const auto it = response.find(http::field::location);
        return it == response.end() ? std::string{} : std::string(it->value());
    }

private:
    std::unique_ptr<net::io_context> ioc_;
    std::unique_ptr<Stream> stream_;
    beast::flat_buffer buffer_;
    http::response_parser<http::buffer_body> parser_;
};

http::request<http::empty_body> make_request(const Url& url, const std::string& token, std::uint64_t offset) {
    http::request<http::empty_body> request{http::verb::get, url.target, 11};
    request.set(http::field::host, url.host);
    request.set(http::field::user_agent, kUserAgent);
    if (!token.empty()) {
        request.set(http::field::authorization, "Bearer " + token);
    }
    if (offset > 0) {
        request.set(http::field::range, "bytes=" + std::to_string(offset) + "-");
    }
    return request;
}

Result<std::unique_ptr<HttpResponseStream>> open_plain(const Url& url,
                                                       const http::request<http::empty_body>& request,
                                                       std::chrono::seconds timeout) {
    auto ioc = std::make_unique<net::io_context>();
    auto stream = std::make_unique<beast::tcp_stream>(*ioc);

    beast::error_code ec;
    tcp::resolver resolver(*ioc);
    const auto endpoints = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        return Err<std::unique_ptr<HttpResponseStream>>(
            ErrorKind::TransientTransport, "resolve " + url.host + " failed: " + ec.message());
    }
    stream->connect(endpoints, ec);
    if (ec) {
        return Err<std::unique_ptr<HttpResponseStream>>(
            ErrorKind::TransientTransport, "connect to " + url.host + " failed: " + ec.message());
    }
    apply_socket_timeout(stream->socket(), timeout);

    auto response = std::make_unique<BeastResponseStream<beast::tcp_stream>>(std::move(ioc), std::move(stream));
    if (auto sent = response->send(request); sent.is_error()) {
        return Err<std::unique_ptr<HttpResponseStream>>(sent.error());
    }
    return Ok(std::unique_ptr<HttpResponseStream>(std::move(response)));
}

Result<std::unique_ptr<HttpResponseStream>> open_tls(const Url& url,
                                                     const http::request<http::empty_body>& request,
                                                     ssl::context& ssl_context,
                                                     std::chrono::seconds timeout) {
    using TlsStream = beast::ssl_stream<beast::tcp_stream>;
    auto ioc = std::make_unique<net::io_context>();
    auto stream = std::make_unique<TlsStream>(*ioc, ssl_context);

    if (!SSL_set_tlsext_host_name(stream->native_handle(), url.host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        return Err<std::unique_ptr<HttpResponseStream>>(
            ErrorKind::TransientTransport, "setting SNI for " + url.host + " failed: " + ec.message());
    }

    beast::error_code ec;
    tcp::resolver resolver(*ioc);
    const auto endpoints = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        return Err<std::unique_ptr<HttpResponseStream>>(
            ErrorKind::TransientTransport, "resolve " + url.host + " failed: " + ec.message());
    }
    beast::get_lowest_layer(*stream).connect(endpoints, ec);
    if (ec) {
        return Err<std::unique_ptr<HttpResponseStream>>(
            ErrorKind::TransientTransport, "connect to " + url.host + " failed: " + ec.message());
    }
    apply_socket_timeout(beast::get_lowest_layer(*stream).socket(), timeout);
    stream->handshake(ssl::stream_base::client, ec);
    if (ec) {
        return Err<std::unique_ptr<HttpResponseStream>>(
            ErrorKind::TransientTransport, "TLS handshake with " + url.host + " failed: " + ec.message());
    }

    auto response = std::make_unique<BeastResponseStream<TlsStream>>(std::move(ioc), std::move(stream));
    if (auto sent = response->send(request); sent.is_error()) {
        return Err<std::unique_ptr<HttpResponseStream>>(sent.error());
    }
    return Ok(std::unique_ptr<HttpResponseStream>(std::move(response)));
}

std::string resolve_location(const Url& base, const std::string& location) {
    if (location.find("://") != std::string::npos) {
        return location;
    }
    std::string origin = base.scheme + "://" + base.host;
    const bool default_port = (base.scheme == "https" && base.port == "443") ||
                              (base.scheme == "http" && base.port == "80");
    if (!default_port) {
        origin += ":" + base.port;
    }
    if (!location.empty() && location.front() == '/') {
        return origin + location;
    }
    const auto path_end = base.target.find('?');
    const auto dir = base.target.substr(0, base.target.rfind('/', path_end) + 1);
    return origin + dir + location;
}

std::uint64_t json_size(const json& value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>();
    }
    if (value.is_string()) {
        return parse_u64(value.get<std::string>()).value_or(0);
    }
    return 0;
}

} // namespace

std::optional<std::uint64_t> total_from_content_range(const std::string& header) {
    const auto slash = header.rfind('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }
    return parse_u64(header.substr(slash + 1));
}

ExportFormat export_format_for(metadata::NativeKind kind) {
    switch (kind) {
        case metadata::NativeKind::Document:
            return {"application/vnd.openxmlformats-officedocument.wordprocessingml.document", ".docx"};
        case metadata::NativeKind::Spreadsheet:
            return {"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet", ".xlsx"};
        case metadata::NativeKind::Presentation:
            return {"application/vnd.openxmlformats-officedocument.presentationml.presentation", ".pptx"};
        case metadata::NativeKind::Other:
        default:
            return {"application/pdf", ".pdf"};
    }
}

Result<Url> parse_url(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Err<Url>(ErrorKind::Configuration, "URL has no scheme: " + text);
    }

    Url url;
    url.scheme = text.substr(0, scheme_end);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme != "http" && url.scheme != "https") {
        return Err<Url>(ErrorKind::Configuration, "unsupported URL scheme: " + url.scheme);
    }

    const auto authority_start = scheme_end + 3;
    const auto path_start = text.find_first_of("/?", authority_start);
    const auto authority = text.substr(authority_start, path_start == std::string::npos
                                                            ? std::string::npos
                                                            : path_start - authority_start);
    if (authority.empty()) {
        return Err<Url>(ErrorKind::Configuration, "URL has no host: " + text);
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        url.host = authority.substr(0, colon);
        url.port = authority.substr(colon + 1);
        if (!parse_u64(url.port)) {
            return Err<Url>(ErrorKind::Configuration, "invalid port in URL: " + text);
        }
    } else {
        url.host = authority;
        url.port = url.scheme == "https" ? "443" : "80";
    }

    url.target = path_start == std::string::npos ? "/" : text.substr(path_start);
    if (url.target.front() == '?') {
        url.target.insert(url.target.begin(), '/');
    }
    return Ok(std::move(url));
}

std::string url_encode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << static_cast<char>(c);
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

Result<ListingPage> parse_listing_page(const std::string& body) {
    auto payload = json::parse(body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return Err<ListingPage>(ErrorKind::Remote, "listing response is not a JSON object");
    }
    const auto files = payload.find("files");
    if (files == payload.end() || !files->is_array()) {
        return Err<ListingPage>(ErrorKind::Remote, "listing response has no files array");
    }

    ListingPage page;
    page.next_page_token = payload.value("nextPageToken", std::string{});
    for (const auto& entry : *files) {
        if (!entry.is_object() || !entry.contains("id") || !entry.at("id").is_string()) {
            return Err<ListingPage>(ErrorKind::Remote, "listing entry without an id: " + entry.dump());
        }
        metadata::RemoteFileRecord record;
        record.id = entry.at("id").get<std::string>();
        record.name = entry.value("name", std::string{});
        record.media_type = entry.value("mimeType", std::string{});
        record.modified_time = entry.value("modifiedTime", std::string{});
        record.is_directory = record.media_type == metadata::kFolderMediaType;
        if (entry.contains("size")) {
            record.size = json_size(entry.at("size"));
        }
        if (entry.contains("md5Checksum") && entry.at("md5Checksum").is_string()) {
            record.checksum = entry.at("md5Checksum").get<std::string>();
        }
        if (entry.contains("parents") && entry.at("parents").is_array()) {
            for (const auto& parent : entry.at("parents")) {
                if (parent.is_string()) {
                    record.parent_ids.push_back(parent.get<std::string>());
                }
            }
        }
        page.items.push_back(std::move(record));
    }
    return Ok(std::move(page));
}

Error error_for_status(int status, const std::string& body) {
    std::string message = "HTTP " + std::to_string(status);
    std::string reason;

    auto payload = json::parse(body, nullptr, false);
    if (!payload.is_discarded() && payload.is_object() && payload.contains("error")) {
        const auto& error = payload.at("error");
        if (error.is_object()) {
            if (error.contains("message") && error.at("message").is_string()) {
                message += ": " + error.at("message").get<std::string>();
            }
            if (error.contains("errors") && error.at("errors").is_array() && !error.at("errors").empty()) {
                const auto& first = error.at("errors").front();
                if (first.is_object()) {
                    reason = first.value("reason", std::string{});
                }
            }
        } else if (error.is_string()) {
            message += ": " + error.get<std::string>();
        }
    }

    if (status == 401) {
        return Error{ErrorKind::Authentication, message};
    }
    if (status == 403) {
        if (reason == "rateLimitExceeded" || reason == "userRateLimitExceeded") {
            return Error{ErrorKind::TransientTransport, message};
        }
        return Error{ErrorKind::Authentication, message};
    }
    if (status == 404) {
        return Error{ErrorKind::NotFound, message};
    }
    if (status == 408 || status == 429 || status >= 500) {
        return Error{ErrorKind::TransientTransport, message};
    }
    return Error{ErrorKind::Remote, message};
}

HttpDriveClient::HttpDriveClient(Options options, TokenProvider& tokens)
    : options_(std::move(options)),
      tokens_(tokens),
      ssl_context_(std::make_shared<ssl::context>(ssl::context::tls_client)) {
    while (!options_.api_base_url.empty() && options_.api_base_url.back() == '/') {
        options_.api_base_url.pop_back();
    }
    ssl_context_->set_default_verify_paths();
    ssl_context_->set_verify_mode(ssl::verify_peer);
}

HttpDriveClient::~HttpDriveClient() = default;

Result<ListingPage> HttpDriveClient::list_children(const std::string& folder_id,
                                                   const std::string& page_token) {
    std::string url = options_.api_base_url + "/files?q=" +
                      url_encode("'" + folder_id + "' in parents and trashed=false") +
                      "&fields=" + url_encode(kListFields) +
                      "&pageSize=" + std::to_string(options_.page_size) +
                      "&supportsAllDrives=true&includeItemsFromAllDrives=true";
    if (!page_token.empty()) {
        url += "&pageToken=" + url_encode(page_token);
    }

    auto response = get(url, 0);
    if (response.is_error()) {
        return Err<ListingPage>(response.error());
    }
    auto body = read_all(*response.value(), std::numeric_limits<std::size_t>::max());
    if (body.is_error()) {
        return Err<ListingPage>(body.error());
    }
    return parse_listing_page(body.value());
}

Result<std::unique_ptr<ByteStream>> HttpDriveClient::open_media(const std::string& file_id,
                                                                std::uint64_t offset) {
    return get(options_.api_base_url + "/files/" + url_encode(file_id) + "?alt=media&supportsAllDrives=true",
               offset);
}

Result<std::unique_ptr<ByteStream>> HttpDriveClient::open_export(const std::string& file_id,
                                                                 const std::string& mime_type) {
    return get(options_.api_base_url + "/files/" + url_encode(file_id) + "/export?mimeType=" + url_encode(mime_type),
               0);
}

Result<std::unique_ptr<ByteStream>> HttpDriveClient::get(const std::string& url, std::uint64_t offset) {
    auto token = tokens_.access_token();
    if (token.is_error()) {
        return Err<std::unique_ptr<ByteStream>>(token.error());
    }

    std::string current = url;
    for (int hop = 0; hop <= options_.max_redirects; ++hop) {
        auto parsed = parse_url(current);
        if (parsed.is_error()) {
            return Err<std::unique_ptr<ByteStream>>(parsed.error());
        }

        // The bearer token never travels over plain HTTP to a different host
        const auto origin = parse_url(url);
        const bool send_token = parsed.value().scheme == "https" ||
                                (origin.is_ok() && origin.value().host == parsed.value().host);
        const auto request = make_request(parsed.value(), send_token ? token.value() : std::string{}, offset);

        auto opened = parsed.value().scheme == "https"
                          ? open_tls(parsed.value(), request, *ssl_context_, options_.timeout)
                          : open_plain(parsed.value(), request, options_.timeout);
        if (opened.is_error()) {
            return Err<std::unique_ptr<ByteStream>>(opened.error());
        }

        auto& response = opened.value();
        const int status = response->status();
        spdlog::debug("GET {} -> {}", parsed.value().host + parsed.value().target, status);

        if (is_redirect(status)) {
            const auto location = response->location();
            if (location.empty()) {
                return Err<std::unique_ptr<ByteStream>>(ErrorKind::Remote,
                                                        "redirect without Location from " + parsed.value().host);
            }
            current = resolve_location(parsed.value(), location);
            continue;
        }

        if (status == kStatusOk || status == kStatusPartialContent ||
            (status == kStatusRangeNotSatisfiable && offset > 0)) {
            return Ok(std::unique_ptr<ByteStream>(std::move(response)));
        }

        auto body = read_all(*response, kErrorBodyLimit);
        return Err<std::unique_ptr<ByteStream>>(error_for_status(status, body.is_ok() ? body.value() : std::string{}));
    }
    return Err<std::unique_ptr<ByteStream>>(ErrorKind::Remote,
                                            "too many redirects (> " + std::to_string(options_.max_redirects) + ")");
}

} // namespace dsync::remote
