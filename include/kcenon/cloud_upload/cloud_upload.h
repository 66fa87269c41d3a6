/**
 * @file cloud_upload.h
 * @brief Main header for the cloud_upload library
 * @version 0.1.0
 *
 * Include this header to access the bucket uploader and its building blocks.
 *
 * @code
 * #include <kcenon/cloud_upload/cloud_upload.h>
 *
 * using namespace kcenon::cloud_upload;
 *
 * auto config = uploader_config_builder()
 *     .with_bucket("survey-results")
 *     .build();
 *
 * auto uploader = bucket_uploader::builder()
 *     .with_config(config.value())
 *     .build();
 * @endcode
 */

#ifndef KCENON_CLOUD_UPLOAD_CLOUD_UPLOAD_H
#define KCENON_CLOUD_UPLOAD_CLOUD_UPLOAD_H

#include <cstdint>
#include <string>

// Core
#include "kcenon/cloud_upload/core/types.h"
#include "kcenon/cloud_upload/core/logging.h"

// Storage
#include "kcenon/cloud_upload/storage/object_store.h"
#include "kcenon/cloud_upload/storage/gcs_credentials.h"
#include "kcenon/cloud_upload/storage/gcs_object_store.h"

// Upload
#include "kcenon/cloud_upload/upload/uploader_config.h"
#include "kcenon/cloud_upload/upload/bucket_uploader.h"

// Adapters
#include "kcenon/cloud_upload/adapters/thread_pool_adapter.h"

namespace kcenon::cloud_upload {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_CLOUD_UPLOAD_H
