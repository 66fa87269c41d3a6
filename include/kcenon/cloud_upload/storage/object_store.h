/**
 * @file object_store.h
 * @brief Abstract remote object store consumed by the uploader
 */

#ifndef KCENON_CLOUD_UPLOAD_STORAGE_OBJECT_STORE_H
#define KCENON_CLOUD_UPLOAD_STORAGE_OBJECT_STORE_H

#include <kcenon/cloud_upload/core/types.h>

#include <array>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace kcenon::cloud_upload {

/**
 * @brief Options for a single object upload
 */
struct put_options {
    /// Use the store's resumable (session based) upload mode
    bool resumable = false;

    /// Send the payload in pieces of this many bytes (resumable mode only)
    std::optional<uint64_t> chunk_size;

    /// MIME type recorded on the object
    std::string content_type = "application/octet-stream";

    /// Validation algorithm: "crc32c", "md5" or "none"
    std::string checksum_algorithm = "crc32c";

    /// Precomputed CRC32C of the payload (when checksum_algorithm is crc32c)
    std::optional<uint32_t> crc32c;

    /// Precomputed MD5 of the payload (when checksum_algorithm is md5)
    std::optional<std::array<uint8_t, 16>> md5;
};

/**
 * @brief Result of a successful upload
 */
struct put_result {
    std::string key;
    uint64_t bytes = 0;
    std::string generation;      ///< Object generation reported by the store
    std::string crc32c;          ///< Base64 CRC32C reported by the store
    bool resumable = false;      ///< Resumable mode was used
    std::size_t requests = 0;    ///< HTTP requests issued for this object
};

/**
 * @brief Remote bucket the uploader writes into
 *
 * Implementations must allow put_object() to be called from several worker
 * threads at once. A failed put_object() is always safe to repeat with the
 * same stream rewound to the start.
 */
class object_store {
public:
    virtual ~object_store() = default;

    /// Short provider label used in messages, e.g. "GCS"
    [[nodiscard]] virtual auto provider_name() const -> std::string = 0;

    [[nodiscard]] virtual auto bucket() const -> const std::string& = 0;

    /**
     * @brief Check that the bucket exists and is reachable
     * @return true/false, or a transport or credential error
     */
    [[nodiscard]] virtual auto bucket_exists() -> result<bool> = 0;

    /**
     * @brief Write @p size bytes from @p data to @p key
     */
    [[nodiscard]] virtual auto put_object(const std::string& key,
                                          std::istream& data,
                                          uint64_t size,
                                          const put_options& options)
        -> result<put_result> = 0;

    /// Human-readable URI of an object, used in logs
    [[nodiscard]] virtual auto object_uri(const std::string& key) const -> std::string = 0;
};

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_STORAGE_OBJECT_STORE_H
