#include "dsync/remote/credentials.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace dsync::remote {
namespace {

using json = nlohmann::json;

Result<std::string> check_expiry(std::string token,
                                 const std::optional<std::chrono::system_clock::time_point>& expires_at) {
    if (token.empty()) {
        return Err<std::string>(ErrorKind::Authentication, "access token is empty");
    }
    if (expires_at && *expires_at <= std::chrono::system_clock::now()) {
        return Err<std::string>(ErrorKind::Authentication, "access token has expired");
    }
    return Ok(std::move(token));
}

} // namespace

FileTokenProvider::FileTokenProvider(std::filesystem::path path) : path_(std::move(path)) {}

Result<std::string> FileTokenProvider::access_token() {
    std::ifstream input(path_);
    if (!input) {
        return Err<std::string>(ErrorKind::Authentication, "cannot read token file: " + path_.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto payload = json::parse(buffer.str(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return Err<std::string>(ErrorKind::Authentication, "token file is not a JSON object: " + path_.string());
    }

    const auto token_it = payload.find("access_token");
    if (token_it == payload.end() || !token_it->is_string()) {
        return Err<std::string>(ErrorKind::Authentication, "token file has no access_token: " + path_.string());
    }

    std::optional<std::chrono::system_clock::time_point> expires_at;
    const auto expiry_it = payload.find("expires_at");
    if (expiry_it != payload.end() && !expiry_it->is_null()) {
        if (!expiry_it->is_number()) {
            return Err<std::string>(ErrorKind::Authentication, "expires_at must be unix seconds: " + path_.string());
        }
        expires_at = std::chrono::system_clock::time_point(
            std::chrono::seconds(expiry_it->get<std::int64_t>()));
    }

    auto token = check_expiry(token_it->get<std::string>(), expires_at);
    if (token.is_error()) {
        spdlog::warn("Token from {} rejected: {}", path_.string(), token.error().message);
    }
    return token;
}

Result<std::string> StaticTokenProvider::access_token() {
    return check_expiry(token_, expires_at_);
}

} // namespace dsync::remote
