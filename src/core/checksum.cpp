/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include <kcenon/cloud_upload/core/checksum.h>
#include <kcenon/cloud_upload/config/feature_flags.h>
#include <kcenon/cloud_upload/storage/storage_utils.h>

#include <memory>
#include <vector>

#if CLOUD_UPLOAD_HAS_OPENSSL
#include <openssl/evp.h>
#endif

namespace kcenon::cloud_upload {

namespace {

// CRC32C polynomial (Castagnoli, reflected)
constexpr uint32_t CRC32C_POLYNOMIAL = 0x82F63B78;

constexpr auto generate_crc32c_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};

    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1) {
                crc = (crc >> 1) ^ CRC32C_POLYNOMIAL;
            } else {
                crc >>= 1;
            }
        }
        table[i] = crc;
    }

    return table;
}

constexpr auto CRC32C_TABLE = generate_crc32c_table();

constexpr std::size_t STREAM_BUFFER_SIZE = 64 * 1024;

}  // namespace

auto checksum::crc32c_update(uint32_t crc, std::span<const std::byte> data) -> uint32_t {
    crc = ~crc;

    for (std::byte b : data) {
        uint8_t index = static_cast<uint8_t>(crc ^ static_cast<uint8_t>(b));
        crc = CRC32C_TABLE[index] ^ (crc >> 8);
    }

    return ~crc;
}

auto checksum::crc32c(std::span<const std::byte> data) -> uint32_t {
    return crc32c_update(0, data);
}

auto checksum::crc32c_stream(std::istream& input) -> result<uint32_t> {
    std::vector<char> buffer(STREAM_BUFFER_SIZE);
    uint32_t crc = 0;

    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = input.gcount();
        if (count > 0) {
            crc = crc32c_update(
                crc, std::as_bytes(std::span<const char>(buffer.data(),
                                                         static_cast<std::size_t>(count))));
        }
    }

    if (input.bad()) {
        return unexpected{error{error_code::file_read_error,
                                "Failed to read stream while computing CRC32C"}};
    }
    return crc;
}

auto checksum::md5_stream(std::istream& input) -> result<std::array<uint8_t, 16>> {
#if CLOUD_UPLOAD_HAS_OPENSSL
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                 EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return unexpected{error{error_code::internal_error, "Failed to initialize MD5 digest"}};
    }

    std::vector<char> buffer(STREAM_BUFFER_SIZE);
    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = input.gcount();
        if (count > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(count)) != 1) {
            return unexpected{error{error_code::internal_error, "MD5 digest update failed"}};
        }
    }

    if (input.bad()) {
        return unexpected{error{error_code::file_read_error,
                                "Failed to read stream while computing MD5"}};
    }

    std::array<uint8_t, 16> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1 || length != digest.size()) {
        return unexpected{error{error_code::internal_error, "MD5 digest finalization failed"}};
    }
    return digest;
#else
    (void)input;
    return unexpected{error{error_code::internal_error,
                            "MD5 requires OpenSSL (CLOUD_UPLOAD_ENABLE_OPENSSL)"}};
#endif
}

auto checksum::crc32c_to_base64(uint32_t crc) -> std::string {
    const std::vector<uint8_t> bytes = {
        static_cast<uint8_t>(crc >> 24),
        static_cast<uint8_t>(crc >> 16),
        static_cast<uint8_t>(crc >> 8),
        static_cast<uint8_t>(crc),
    };
    return storage_utils::base64_encode(bytes);
}

}  // namespace kcenon::cloud_upload
