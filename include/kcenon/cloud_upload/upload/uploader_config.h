/**
 * @file uploader_config.h
 * @brief Configuration for bucket_uploader
 */

#ifndef KCENON_CLOUD_UPLOAD_UPLOAD_UPLOADER_CONFIG_H
#define KCENON_CLOUD_UPLOAD_UPLOAD_UPLOADER_CONFIG_H

#include <kcenon/cloud_upload/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace kcenon::cloud_upload {

/// Resumable chunk sizes must be a multiple of this
inline constexpr uint64_t resumable_chunk_granularity = 256 * 1024;

/**
 * @brief Uploader configuration
 */
struct uploader_config {
    /// Target bucket (required)
    std::string bucket_name;

    /// Prefix prepended to every object key
    std::string key_prefix;

    /// Service account key file; falls back to GOOGLE_APPLICATION_CREDENTIALS
    std::optional<std::filesystem::path> credentials_path;

    /// Project billed for storage requests (userProject), for requester-pays buckets
    std::optional<std::string> project_id;

    /// Storage API endpoint
    std::string endpoint = "https://storage.googleapis.com";

    /// HTTP request timeout
    std::chrono::milliseconds request_timeout{30000};

    /// Maximum concurrent uploads per batch
    std::size_t parallelism = 16;

    /// Retries allowed per file after the first attempt
    uint32_t max_retries = 5;

    /// Retry n waits retry_base_delay * 2^n
    std::chrono::milliseconds retry_base_delay{1000};

    /// Randomize retry delays by a factor in [0.5, 1.5)
    bool retry_jitter = false;

    /// Files larger than this use a resumable session
    uint64_t resumable_threshold = 5 * mebibyte;

    /// Files larger than this are sent in chunk_size pieces
    uint64_t chunk_threshold = 10 * mebibyte;

    /// Resumable chunk size
    uint64_t chunk_size = 10 * mebibyte;

    /// Integrity check sent with each object: "crc32c", "md5" or "none"
    std::string checksum_algorithm = "crc32c";

    /**
     * @brief Check the configuration for errors
     * @return invalid_configuration describing the first problem found
     */
    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Fluent builder for uploader_config
 *
 * @code
 * auto config = uploader_config_builder()
 *     .with_bucket("survey-results")
 *     .with_parallelism(8)
 *     .with_max_retries(3)
 *     .build();
 * @endcode
 */
class uploader_config_builder {
public:
    uploader_config_builder() = default;

    auto with_bucket(std::string bucket) -> uploader_config_builder& {
        config_.bucket_name = std::move(bucket);
        return *this;
    }

    auto with_key_prefix(std::string prefix) -> uploader_config_builder& {
        config_.key_prefix = std::move(prefix);
        return *this;
    }

    auto with_credentials_file(std::filesystem::path path) -> uploader_config_builder& {
        config_.credentials_path = std::move(path);
        return *this;
    }

    auto with_project_id(std::string project_id) -> uploader_config_builder& {
        config_.project_id = std::move(project_id);
        return *this;
    }

    auto with_endpoint(std::string endpoint) -> uploader_config_builder& {
        config_.endpoint = std::move(endpoint);
        return *this;
    }

    auto with_request_timeout(std::chrono::milliseconds timeout) -> uploader_config_builder& {
        config_.request_timeout = timeout;
        return *this;
    }

    auto with_parallelism(std::size_t workers) -> uploader_config_builder& {
        config_.parallelism = workers;
        return *this;
    }

    auto with_max_retries(uint32_t retries) -> uploader_config_builder& {
        config_.max_retries = retries;
        return *this;
    }

    auto with_retry_delay(std::chrono::milliseconds base_delay, bool jitter = false)
        -> uploader_config_builder& {
        config_.retry_base_delay = base_delay;
        config_.retry_jitter = jitter;
        return *this;
    }

    auto with_resumable_threshold(uint64_t bytes) -> uploader_config_builder& {
        config_.resumable_threshold = bytes;
        return *this;
    }

    auto with_chunking(uint64_t threshold, uint64_t chunk_size) -> uploader_config_builder& {
        config_.chunk_threshold = threshold;
        config_.chunk_size = chunk_size;
        return *this;
    }

    auto with_checksum(std::string algorithm) -> uploader_config_builder& {
        config_.checksum_algorithm = std::move(algorithm);
        return *this;
    }

    /**
     * @brief Validate and return the configuration
     */
    [[nodiscard]] auto build() const -> result<uploader_config> {
        auto valid = config_.validate();
        if (!valid) {
            return unexpected{valid.error()};
        }
        return config_;
    }

private:
    uploader_config config_;
};

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_UPLOAD_UPLOADER_CONFIG_H
