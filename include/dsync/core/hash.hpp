#pragma once

#include "dsync/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace dsync {

/**
 * @brief MD5 of a file's contents as lowercase hex
 *
 * The remote publishes MD5 checksums, so this is the digest the downloader
 * verifies against. Reads in fixed-size blocks; never loads the whole file.
 */
Result<std::string> md5_file(const std::filesystem::path& path);

std::string md5_hex(const std::vector<std::uint8_t>& data);
std::string md5_hex(const std::string& data);

/**
 * @brief Case-insensitive checksum comparison; an empty expectation always matches
 */
bool checksum_matches(const std::string& actual, const std::string& expected);

} // namespace dsync
