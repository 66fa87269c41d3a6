/**
 * @file checksum.h
 * @brief Checksum utilities for object integrity validation
 */

#ifndef KCENON_CLOUD_UPLOAD_CORE_CHECKSUM_H
#define KCENON_CLOUD_UPLOAD_CORE_CHECKSUM_H

#include <kcenon/cloud_upload/core/types.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>
#include <string>

namespace kcenon::cloud_upload {

/**
 * @brief Checksum utilities used to validate uploaded objects
 *
 * Provides static methods for:
 * - CRC32C (Castagnoli), the checksum Cloud Storage reports for every object
 * - MD5 via OpenSSL, the alternative validation hash
 * - Base64 rendering of CRC32C in the form the storage API expects
 */
class checksum {
public:
    /**
     * @brief Calculate CRC32C of data
     * @param data Input data span
     * @return CRC32C checksum value
     */
    [[nodiscard]] static auto crc32c(std::span<const std::byte> data) -> uint32_t;

    /**
     * @brief Continue a CRC32C calculation
     * @param crc Value returned by a previous call (0 for the first block)
     * @param data Next block of input
     * @return Updated CRC32C value
     */
    [[nodiscard]] static auto crc32c_update(uint32_t crc, std::span<const std::byte> data)
        -> uint32_t;

    /**
     * @brief Calculate CRC32C over the remaining bytes of a stream
     *
     * The stream is read to EOF. Callers that reuse it must clear and seek.
     */
    [[nodiscard]] static auto crc32c_stream(std::istream& input) -> result<uint32_t>;

    /**
     * @brief Calculate MD5 over the remaining bytes of a stream
     *
     * Requires OpenSSL; returns internal_error when built without it.
     */
    [[nodiscard]] static auto md5_stream(std::istream& input)
        -> result<std::array<uint8_t, 16>>;

    /**
     * @brief Render a CRC32C value as big-endian base64 (the x-goog-hash form)
     */
    [[nodiscard]] static auto crc32c_to_base64(uint32_t crc) -> std::string;
};

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_CORE_CHECKSUM_H
