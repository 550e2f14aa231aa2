#include "dsync/remote/http_drive_client.hpp"

#include <gtest/gtest.h>

using dsync::ErrorKind;
using dsync::remote::error_for_status;
using dsync::remote::parse_listing_page;
using dsync::remote::parse_url;
using dsync::remote::url_encode;

TEST(HttpDriveClientTest, ParsesUrls) {
    auto api = parse_url("https://www.googleapis.com/drive/v3/files?alt=media");
    ASSERT_TRUE(api.is_ok());
    EXPECT_EQ(api.value().scheme, "https");
    EXPECT_EQ(api.value().host, "www.googleapis.com");
    EXPECT_EQ(api.value().port, "443");
    EXPECT_EQ(api.value().target, "/drive/v3/files?alt=media");

    auto local = parse_url("HTTP://localhost:8080");
    ASSERT_TRUE(local.is_ok());
    EXPECT_EQ(local.value().scheme, "http");
    EXPECT_EQ(local.value().port, "8080");
    EXPECT_EQ(local.value().target, "/");

    auto query_only = parse_url("http://example.com?x=1");
    ASSERT_TRUE(query_only.is_ok());
    EXPECT_EQ(query_only.value().target, "/?x=1");

    EXPECT_TRUE(parse_url("www.googleapis.com/drive").is_error());
    EXPECT_TRUE(parse_url("ftp://example.com/").is_error());
    EXPECT_TRUE(parse_url("http://host:port/").is_error());
    EXPECT_TRUE(parse_url("https:///path").is_error());
}

TEST(HttpDriveClientTest, EncodesQueryValues) {
    EXPECT_EQ(url_encode("'abc' in parents and trashed=false"),
              "%27abc%27%20in%20parents%20and%20trashed%3Dfalse");
    EXPECT_EQ(url_encode("A-z_0.9~"), "A-z_0.9~");
}

TEST(HttpDriveClientTest, ParsesListingPage) {
    const char* body = R"({
        "nextPageToken": "tok-2",
        "files": [
            {"id": "f1", "name": "a.png", "mimeType": "image/png", "size": "2048",
             "modifiedTime": "2024-01-02T00:00:00.000Z", "md5Checksum": "abc", "parents": ["root"]},
            {"id": "d1", "name": "sub", "mimeType": "application/vnd.google-apps.folder"},
            {"id": "g1", "name": "Plan", "mimeType": "application/vnd.google-apps.document"},
            {"id": "n1", "name": "raw", "mimeType": "application/octet-stream", "size": 17}
        ]
    })";

    auto page = parse_listing_page(body);
    ASSERT_TRUE(page.is_ok()) << page.error().message;
    EXPECT_EQ(page.value().next_page_token, "tok-2");
    ASSERT_EQ(page.value().items.size(), 4u);

    const auto& file = page.value().items[0];
    EXPECT_EQ(file.size, 2048u);
    EXPECT_EQ(file.checksum, std::string("abc"));
    EXPECT_EQ(file.parent_ids, std::vector<std::string>{"root"});
    EXPECT_FALSE(file.is_directory);

    EXPECT_TRUE(page.value().items[1].is_directory);

    const auto& doc = page.value().items[2];
    EXPECT_TRUE(doc.is_native_document());
    EXPECT_FALSE(doc.checksum.has_value());
    EXPECT_EQ(doc.size, 0u);

    EXPECT_EQ(page.value().items[3].size, 17u);
}

TEST(HttpDriveClientTest, RejectsMalformedListing) {
    EXPECT_EQ(parse_listing_page("<html>").error().kind, ErrorKind::Remote);
    EXPECT_TRUE(parse_listing_page(R"({"kind": "drive#fileList"})").is_error());
    EXPECT_TRUE(parse_listing_page(R"({"files": [{"name": "no id"}]})").is_error());

    auto empty = parse_listing_page(R"({"files": []})");
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value().items.empty());
    EXPECT_TRUE(empty.value().next_page_token.empty());
}

TEST(HttpDriveClientTest, MapsStatusToErrorKind) {
    EXPECT_EQ(error_for_status(401, "").kind, ErrorKind::Authentication);
    EXPECT_EQ(error_for_status(403, R"({"error": {"errors": [{"reason": "insufficientPermissions"}]}})").kind,
              ErrorKind::Authentication);
    EXPECT_EQ(error_for_status(403, R"({"error": {"errors": [{"reason": "userRateLimitExceeded"}]}})").kind,
              ErrorKind::TransientTransport);
    EXPECT_EQ(error_for_status(404, "").kind, ErrorKind::NotFound);
    EXPECT_EQ(error_for_status(408, "").kind, ErrorKind::TransientTransport);
    EXPECT_EQ(error_for_status(429, "").kind, ErrorKind::TransientTransport);
    EXPECT_EQ(error_for_status(503, "").kind, ErrorKind::TransientTransport);
    EXPECT_EQ(error_for_status(400, "").kind, ErrorKind::Remote);
    EXPECT_EQ(error_for_status(416, "").kind, ErrorKind::Remote);
}

TEST(HttpDriveClientTest, ErrorMessageCarriesRemoteText) {
    const auto error = error_for_status(404, R"({"error": {"code": 404, "message": "File not found: x."}})");
    EXPECT_EQ(error.message, "HTTP 404: File not found: x.");
}

TEST(HttpDriveClientTest, ReadsTotalFromContentRange) {
    using dsync::remote::total_from_content_range;
    EXPECT_EQ(total_from_content_range("bytes 100-999/1000"), std::optional<std::uint64_t>(1000));
    EXPECT_EQ(total_from_content_range("bytes */1000"), std::optional<std::uint64_t>(1000));
    EXPECT_FALSE(total_from_content_range("bytes 0-9/*").has_value());
    EXPECT_FALSE(total_from_content_range("garbage").has_value());
}

TEST(HttpDriveClientTest, ExportFormats) {
    using dsync::metadata::NativeKind;
    EXPECT_EQ(dsync::remote::export_format_for(NativeKind::Document).extension, ".docx");
    EXPECT_EQ(dsync::remote::export_format_for(NativeKind::Spreadsheet).extension, ".xlsx");
    EXPECT_EQ(dsync::remote::export_format_for(NativeKind::Presentation).extension, ".pptx");
    EXPECT_EQ(dsync::remote::export_format_for(NativeKind::Other).mime_type, "application/pdf");
}
