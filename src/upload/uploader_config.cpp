/**
 * @file uploader_config.cpp
 * @brief Validation of uploader_config
 */

#include <kcenon/cloud_upload/upload/uploader_config.h>
#include <kcenon/cloud_upload/config/feature_flags.h>

namespace kcenon::cloud_upload {

namespace {

auto invalid(std::string message) -> unexpected {
    return unexpected{error{error_code::invalid_configuration, std::move(message)}};
}

}  // namespace

auto uploader_config::validate() const -> result<void> {
    if (bucket_name.empty()) {
        return invalid("Bucket name must not be empty");
    }
    if (parallelism == 0) {
        return invalid("Parallelism must be at least 1");
    }
    if (endpoint.empty()) {
        return invalid("Storage endpoint must not be empty");
    }
    if (chunk_size == 0 || chunk_size % resumable_chunk_granularity != 0) {
        return invalid("Chunk size must be a positive multiple of 256 KiB, got " +
                       std::to_string(chunk_size));
    }
    if (checksum_algorithm != "crc32c" && checksum_algorithm != "md5" &&
        checksum_algorithm != "none") {
        return invalid("Unknown checksum algorithm '" + checksum_algorithm +
                       "' (expected crc32c, md5 or none)");
    }
#if !CLOUD_UPLOAD_HAS_OPENSSL
    if (checksum_algorithm == "md5") {
        return invalid("Checksum algorithm 'md5' requires a build with OpenSSL");
    }
#endif
    if (retry_base_delay.count() < 0) {
        return invalid("Retry delay must not be negative");
    }
    return {};
}

}  // namespace kcenon::cloud_upload
