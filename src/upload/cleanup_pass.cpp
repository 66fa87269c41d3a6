/**
 * @file cleanup_pass.cpp
 * @brief Implementation of local path removal
 */

#include <kcenon/cloud_upload/upload/cleanup_pass.h>
#include <kcenon/cloud_upload/core/logging.h>

#include <system_error>

namespace kcenon::cloud_upload {

auto cleanup_pass::run(const std::filesystem::path& source_root,
                       const std::vector<std::string>& relative_paths) -> cleanup_summary {
    namespace fs = std::filesystem;
    cleanup_summary summary;

    for (const auto& relative : relative_paths) {
        const fs::path target = (source_root / relative).lexically_normal();

        std::error_code ec;
        auto status = fs::symlink_status(target, ec);
        if (ec || !fs::exists(status)) {
            CU_LOG_DEBUG(log_category::cleanup, "Nothing to delete at " + target.string());
            ++summary.skipped;
            continue;
        }

        const bool is_dir = fs::is_directory(status);
        if (is_dir) {
            fs::remove_all(target, ec);
        } else {
            fs::remove(target, ec);
        }

        if (ec) {
            error failure{error_code::cleanup_failed,
                          std::string("Failed to delete ") + (is_dir ? "directory " : "file ") +
                              target.string() + ": " + ec.message()};
            CU_LOG_WARN(log_category::cleanup, failure.message);
            summary.failures.push_back(std::move(failure));
            ++summary.failed;
            continue;
        }

        CU_LOG_DEBUG(log_category::cleanup,
                     std::string("Deleted ") + (is_dir ? "directory " : "file ") + target.string());
        ++summary.deleted;
    }

    return summary;
}

}  // namespace kcenon::cloud_upload
