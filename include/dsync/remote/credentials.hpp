#pragma once

#include "dsync/core/result.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace dsync::remote {

/**
 * @brief Source of an already-issued bearer token
 *
 * drivesync never runs an interactive authorization flow; it only reads a
 * token that something else obtained. Any failure is an Authentication error.
 */
class TokenProvider {
public:
    virtual ~TokenProvider() = default;

    virtual Result<std::string> access_token() = 0;
};

/**
 * @brief Reads {"access_token": "...", "expires_at": <unix seconds>} from disk
 *
 * The file is re-read on every call so an external refresher can rotate it
 * while a long sync is running.
 */
class FileTokenProvider : public TokenProvider {
public:
    explicit FileTokenProvider(std::filesystem::path path);

    Result<std::string> access_token() override;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

class StaticTokenProvider : public TokenProvider {
public:
    explicit StaticTokenProvider(std::string token,
                                 std::optional<std::chrono::system_clock::time_point> expires_at = std::nullopt)
        : token_(std::move(token)), expires_at_(expires_at) {}

    Result<std::string> access_token() override;

private:
    std::string token_;
    std::optional<std::chrono::system_clock::time_point> expires_at_;
};

} // namespace dsync::remote
