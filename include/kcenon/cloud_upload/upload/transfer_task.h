/**
 * @file transfer_task.h
 * @brief Unit of upload work
 */

#ifndef KCENON_CLOUD_UPLOAD_UPLOAD_TRANSFER_TASK_H
#define KCENON_CLOUD_UPLOAD_UPLOAD_TRANSFER_TASK_H

#include <cstdint>
#include <filesystem>
#include <string>

namespace kcenon::cloud_upload {

/**
 * @brief One local file to be sent to one remote object
 *
 * Created by path_expander, moved between the pending queue and exactly one
 * worker per attempt. Only retry_policy changes @c attempt.
 */
struct transfer_task {
    std::filesystem::path source_path;   ///< Absolute local path
    std::string destination_key;         ///< Remote object key
    std::string relative_path;           ///< Path relative to the transfer root ('/' separated)
    uint32_t attempt = 0;                ///< Attempts made so far

    /// File name used in progress and error messages
    [[nodiscard]] auto display_name() const -> std::string {
        return source_path.filename().string();
    }

    [[nodiscard]] auto operator==(const transfer_task& other) const -> bool = default;
};

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_UPLOAD_TRANSFER_TASK_H
