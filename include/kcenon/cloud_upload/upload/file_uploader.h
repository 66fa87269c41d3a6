/**
 * @file file_uploader.h
 * @brief Executes one transfer_task against an object_store
 */

#ifndef KCENON_CLOUD_UPLOAD_UPLOAD_FILE_UPLOADER_H
#define KCENON_CLOUD_UPLOAD_UPLOAD_FILE_UPLOADER_H

#include <kcenon/cloud_upload/core/types.h>
#include <kcenon/cloud_upload/storage/object_store.h>
#include <kcenon/cloud_upload/upload/transfer_task.h>

#include <cstdint>
#include <memory>
#include <string>

namespace kcenon::cloud_upload {

class progress_reporter;

/**
 * @brief Size-dependent upload settings
 */
struct transfer_settings {
    uint64_t resumable_threshold = 5 * mebibyte;   ///< Strictly larger files go resumable
    uint64_t chunk_threshold = 10 * mebibyte;      ///< Strictly larger files are chunked
    uint64_t chunk_size = 10 * mebibyte;
    std::string checksum_algorithm = "crc32c";
};

/**
 * @brief Uploads a single local file
 *
 * Each call opens the file afresh, so a retried task re-reads the source
 * from the start. Safe to call from several workers at once as long as the
 * object_store is.
 */
class file_uploader {
public:
    file_uploader(std::shared_ptr<object_store> store, transfer_settings settings = {});

    /**
     * @brief Upload @p task.source_path to @p task.destination_key
     * @param reporter Optional observer told when the transfer starts
     */
    [[nodiscard]] auto upload(const transfer_task& task, progress_reporter* reporter = nullptr) const
        -> result<put_result>;

    /**
     * @brief Options chosen for a file of @p size bytes (checksums not filled)
     */
    [[nodiscard]] auto options_for(const std::string& path, uint64_t size) const -> put_options;

    [[nodiscard]] auto settings() const -> const transfer_settings& { return settings_; }

private:
    auto compute_checksum(std::istream& input, put_options& options) const -> result<void>;

    std::shared_ptr<object_store> store_;
    transfer_settings settings_;
};

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_UPLOAD_FILE_UPLOADER_H
