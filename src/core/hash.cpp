#include "dsync/core/hash.hpp"

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace dsync {
namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext make_md5_context() {
    DigestContext ctx{EVP_MD_CTX_new(), EVP_MD_CTX_free};
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

std::string finish_hex(EVP_MD_CTX* ctx) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
        return {};
    }
    std::ostringstream hex;
    for (unsigned int i = 0; i < length; ++i) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return hex.str();
}

std::string digest_buffer(const void* data, std::size_t size) {
    auto ctx = make_md5_context();
    if (!ctx || EVP_DigestUpdate(ctx.get(), data, size) != 1) {
        return {};
    }
    return finish_hex(ctx.get());
}

} // namespace

Result<std::string> md5_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorKind::Io, "Failed to open file for hashing: " + path.string());
    }

    auto ctx = make_md5_context();
    if (!ctx) {
        return Err<std::string>(ErrorKind::Io, std::string("Failed to initialise MD5 context"));
    }

    std::array<char, 64 * 1024> buffer{};
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), count) != 1) {
            return Err<std::string>(ErrorKind::Io, "MD5 update failed for " + path.string());
        }
    }
    if (input.bad()) {
        return Err<std::string>(ErrorKind::Io, "Read error while hashing " + path.string());
    }

    auto hex = finish_hex(ctx.get());
    if (hex.empty()) {
        return Err<std::string>(ErrorKind::Io, "MD5 finalisation failed for " + path.string());
    }
    return Ok(std::move(hex));
}

std::string md5_hex(const std::vector<std::uint8_t>& data) {
    return digest_buffer(data.data(), data.size());
}

std::string md5_hex(const std::string& data) {
    return digest_buffer(data.data(), data.size());
}

bool checksum_matches(const std::string& actual, const std::string& expected) {
    if (expected.empty()) {
        return true;
    }
    if (actual.size() != expected.size()) {
        return false;
    }
    for (std::size_t i = 0; i < actual.size(); ++i) {
        const auto a = std::tolower(static_cast<unsigned char>(actual[i]));
        const auto b = std::tolower(static_cast<unsigned char>(expected[i]));
        if (a != b) {
            return false;
        }
    }
    return true;
}

} // namespace dsync
