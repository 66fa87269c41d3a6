/**
 * @file cleanup_pass.h
 * @brief Best-effort removal of local paths after a successful upload
 */

#ifndef KCENON_CLOUD_UPLOAD_UPLOAD_CLEANUP_PASS_H
#define KCENON_CLOUD_UPLOAD_UPLOAD_CLEANUP_PASS_H

#include <kcenon/cloud_upload/core/types.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::cloud_upload {

/**
 * @brief What a cleanup pass did
 */
struct cleanup_summary {
    std::size_t deleted = 0;   ///< Files and directories removed
    std::size_t skipped = 0;   ///< Paths that did not exist
    std::size_t failed = 0;    ///< Removals that raised an error (logged, not fatal)

    /// One cleanup_failed error per failed removal
    std::vector<error> failures;
};

/**
 * @brief Deletes the given paths, one at a time
 *
 * Directories are removed recursively. A missing path is skipped and a
 * failed removal is logged as a warning; neither stops the pass.
 */
class cleanup_pass {
public:
    /**
     * @param source_root Directory the relative paths are resolved against
     * @param relative_paths Files or directories relative to @p source_root
     */
    [[nodiscard]] static auto run(const std::filesystem::path& source_root,
                                  const std::vector<std::string>& relative_paths)
        -> cleanup_summary;
};

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_UPLOAD_CLEANUP_PASS_H
