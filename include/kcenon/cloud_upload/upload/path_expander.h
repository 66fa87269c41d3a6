/**
 * @file path_expander.h
 * @brief Turns requested paths into a flat list of transfer tasks
 */

#ifndef KCENON_CLOUD_UPLOAD_UPLOAD_PATH_EXPANDER_H
#define KCENON_CLOUD_UPLOAD_UPLOAD_PATH_EXPANDER_H

#include <kcenon/cloud_upload/core/types.h>
#include <kcenon/cloud_upload/upload/transfer_task.h>

#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::cloud_upload {

/**
 * @brief Expands files and directories under a root into transfer tasks
 *
 * Paths are processed in the order given. A missing path is skipped with a
 * debug log. A directory contributes every regular file beneath it, sorted
 * by relative path so the output is stable for a given filesystem snapshot.
 * Directory symlinks are not followed.
 *
 * Any filesystem error while listing aborts the whole expansion with
 * error_code::directory_listing_failed so that no partial batch is started.
 */
class path_expander {
public:
    /**
     * @param key_prefix Prefix prepended to every destination key
     */
    explicit path_expander(std::string key_prefix = {});

    /**
     * @brief Build the task list for one batch
     * @param source_root Directory the relative paths are resolved against
     * @param destination_prefix Remote folder the files are placed under
     * @param relative_paths Files or directories relative to @p source_root
     * @return Tasks with attempt == 0, or the first listing error
     */
    [[nodiscard]] auto expand(const std::filesystem::path& source_root,
                              std::string_view destination_prefix,
                              const std::vector<std::string>& relative_paths) const
        -> result<std::vector<transfer_task>>;

    [[nodiscard]] auto key_prefix() const -> const std::string& { return key_prefix_; }

    /**
     * @brief Join object key segments with '/'
     *
     * Empty and "." segments are dropped, ".." removes the previous segment,
     * and backslashes are treated as separators.
     */
    [[nodiscard]] static auto join_key(std::initializer_list<std::string_view> parts)
        -> std::string;

private:
    auto make_task(const std::filesystem::path& source_root,
                   std::string_view destination_prefix,
                   const std::string& relative) const -> transfer_task;

    std::string key_prefix_;
};

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_UPLOAD_PATH_EXPANDER_H
