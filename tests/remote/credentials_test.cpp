#include "dsync/remote/credentials.hpp"

#include "support/test_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>

using dsync::ErrorKind;
using dsync::remote::FileTokenProvider;
using dsync::remote::StaticTokenProvider;

namespace {

std::int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

TEST(CredentialsTest, FileTokenIsReadOnEveryCall) {
    const auto dir = dsync::testing::create_temp_dir("dsync_token");
    const auto path = dir / "token.json";
    dsync::testing::write_file(path, R"({"access_token": "first"})");

    FileTokenProvider provider(path);
    auto token = provider.access_token();
    ASSERT_TRUE(token.is_ok());
    EXPECT_EQ(token.value(), "first");

    dsync::testing::write_file(path, "{\"access_token\": \"second\", \"expires_at\": " +
                                         std::to_string(unix_now() + 3600) + "}");
    token = provider.access_token();
    ASSERT_TRUE(token.is_ok());
    EXPECT_EQ(token.value(), "second");
}

TEST(CredentialsTest, UnusableTokensAreAuthenticationErrors) {
    const auto dir = dsync::testing::create_temp_dir("dsync_token");
    const std::string bodies[] = {
        "not json",
        R"({"token": "x"})",
        R"({"access_token": ""})",
        "{\"access_token\": \"old\", \"expires_at\": " + std::to_string(unix_now() - 60) + "}",
    };
    for (const auto& body : bodies) {
        dsync::testing::write_file(dir / "token.json", body);
        FileTokenProvider provider(dir / "token.json");
        auto token = provider.access_token();
        ASSERT_TRUE(token.is_error()) << body;
        EXPECT_EQ(token.error().kind, ErrorKind::Authentication) << body;
    }

    FileTokenProvider missing(dir / "absent.json");
    EXPECT_EQ(missing.access_token().error().kind, ErrorKind::Authentication);
}

TEST(CredentialsTest, StaticTokenHonoursExpiry) {
    StaticTokenProvider valid("abc");
    EXPECT_TRUE(valid.access_token().is_ok());

    StaticTokenProvider expired("abc", std::chrono::system_clock::now() - std::chrono::minutes(1));
    EXPECT_EQ(expired.access_token().error().kind, ErrorKind::Authentication);

    StaticTokenProvider empty("");
    EXPECT_TRUE(empty.access_token().is_error());
}
