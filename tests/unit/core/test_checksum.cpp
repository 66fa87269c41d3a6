/**
 * @file test_checksum.cpp
 * @brief Unit tests for checksum utilities
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_upload/config/feature_flags.h>
#include <kcenon/cloud_upload/core/checksum.h>

#include <cstring>
#include <sstream>
#include <string>
#include <vector>

namespace kcenon::cloud_upload::test {

namespace {

auto to_bytes(const std::string& text) -> std::vector<std::byte> {
    std::vector<std::byte> bytes(text.size());
    if (!text.empty()) {
        std::memcpy(bytes.data(), text.data(), text.size());
    }
    return bytes;
}

}  // namespace

class ChecksumTest : public ::testing::Test {};

// CRC32C Tests

TEST_F(ChecksumTest, CRC32C_EmptyData) {
    std::vector<std::byte> empty;
    EXPECT_EQ(checksum::crc32c(empty), 0x00000000u);
}

TEST_F(ChecksumTest, CRC32C_KnownValue) {
    // Castagnoli check value for "123456789"
    auto data = to_bytes("123456789");
    EXPECT_EQ(checksum::crc32c(data), 0xE3069283u);
}

TEST_F(ChecksumTest, CRC32C_IncrementalMatchesOneShot) {
    auto whole = to_bytes("The quick brown fox jumps over the lazy dog");
    auto first = std::span<const std::byte>(whole).subspan(0, 10);
    auto rest = std::span<const std::byte>(whole).subspan(10);

    auto crc = checksum::crc32c_update(0, first);
    crc = checksum::crc32c_update(crc, rest);
    EXPECT_EQ(crc, checksum::crc32c(whole));
}

TEST_F(ChecksumTest, CRC32C_StreamMatchesBuffer) {
    std::string content(300000, '\0');
    for (std::size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<char>(i * 31 % 251);
    }
    std::istringstream stream(content);

    auto crc = checksum::crc32c_stream(stream);
    ASSERT_TRUE(crc.has_value());
    EXPECT_EQ(crc.value(), checksum::crc32c(to_bytes(content)));
}

TEST_F(ChecksumTest, CRC32C_Base64IsBigEndian) {
    // 0xE3069283 -> bytes E3 06 92 83
    EXPECT_EQ(checksum::crc32c_to_base64(0xE3069283u), "4waSgw==");
    EXPECT_EQ(checksum::crc32c_to_base64(0u), "AAAAAA==");
}

// MD5 Tests

TEST_F(ChecksumTest, MD5_KnownValue) {
    std::istringstream stream("abc");
    auto digest = checksum::md5_stream(stream);

#if CLOUD_UPLOAD_HAS_OPENSSL
    ASSERT_TRUE(digest.has_value());
    const std::array<uint8_t, 16> expected = {0x90, 0x01, 0x50, 0x98, 0x3c, 0xd2, 0x4f, 0xb0,
                                              0xd6, 0x96, 0x3f, 0x7d, 0x28, 0xe1, 0x7f, 0x72};
    EXPECT_EQ(digest.value(), expected);
#else
    ASSERT_FALSE(digest.has_value());
    EXPECT_EQ(digest.error().code, error_code::internal_error);
#endif
}

TEST_F(ChecksumTest, MD5_EmptyStream) {
#if CLOUD_UPLOAD_HAS_OPENSSL
    std::istringstream stream("");
    auto digest = checksum::md5_stream(stream);
    ASSERT_TRUE(digest.has_value());
    // d41d8cd98f00b204e9800998ecf8427e
    EXPECT_EQ(digest.value()[0], 0xd4);
    EXPECT_EQ(digest.value()[15], 0x7e);
#else
    GTEST_SKIP() << "Built without OpenSSL";
#endif
}

}  // namespace kcenon::cloud_upload::test
