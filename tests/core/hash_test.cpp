#include "dsync/core/hash.hpp"

#include "support/test_utils.hpp"

#include <gtest/gtest.h>

using dsync::checksum_matches;
using dsync::md5_file;
using dsync::md5_hex;

TEST(HashTest, KnownDigests) {
    EXPECT_EQ(md5_hex(std::string{}), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(md5_hex(std::string("The quick brown fox jumps over the lazy dog")),
              "9e107d9d372bb6826bd81d3542a419d6");
}

TEST(HashTest, FileDigestMatchesInMemoryDigest) {
    const auto dir = dsync::testing::create_temp_dir("dsync_hash");
    // Larger than one read block
    std::string content(200 * 1024, 'x');
    content += "tail";
    dsync::testing::write_file(dir / "blob.bin", content);

    auto digest = md5_file(dir / "blob.bin");
    ASSERT_TRUE(digest.is_ok());
    EXPECT_EQ(digest.value(), md5_hex(content));
}

TEST(HashTest, MissingFileIsIoError) {
    const auto dir = dsync::testing::create_temp_dir("dsync_hash");
    auto digest = md5_file(dir / "absent.bin");
    ASSERT_TRUE(digest.is_error());
    EXPECT_EQ(digest.error().kind, dsync::ErrorKind::Io);
}

TEST(HashTest, ChecksumComparisonIgnoresCase) {
    EXPECT_TRUE(checksum_matches("9E107D9D372BB6826BD81D3542A419D6", "9e107d9d372bb6826bd81d3542a419d6"));
    EXPECT_FALSE(checksum_matches("9e107d9d372bb6826bd81d3542a419d6", "d41d8cd98f00b204e9800998ecf8427e"));
    EXPECT_TRUE(checksum_matches("anything", ""));
}
