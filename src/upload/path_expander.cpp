/**
 * @file path_expander.cpp
 * @brief Implementation of path expansion into transfer tasks
 */

#include <kcenon/cloud_upload/upload/path_expander.h>
#include <kcenon/cloud_upload/core/logging.h>

#include <algorithm>
#include <system_error>

namespace kcenon::cloud_upload {

namespace fs = std::filesystem;

path_expander::path_expander(std::string key_prefix) : key_prefix_(std::move(key_prefix)) {}

auto path_expander::join_key(std::initializer_list<std::string_view> parts) -> std::string {
    std::vector<std::string> segments;

    for (auto part : parts) {
        std::size_t start = 0;
        while (start <= part.size()) {
            auto end = part.find_first_of("/\\", start);
            if (end == std::string_view::npos) {
                end = part.size();
            }
            auto segment = part.substr(start, end - start);
            if (segment == "..") {
                if (!segments.empty()) {
                    segments.pop_back();
                }
            } else if (!segment.empty() && segment != ".") {
                segments.emplace_back(segment);
            }
            start = end + 1;
        }
    }

    std::string key;
    for (const auto& segment : segments) {
        if (!key.empty()) {
            key += '/';
        }
        key += segment;
    }
    return key;
}

auto path_expander::make_task(const fs::path& source_root,
                              std::string_view destination_prefix,
                              const std::string& relative) const -> transfer_task {
    transfer_task task;
    task.source_path = (source_root / fs::path(relative)).lexically_normal();
    task.relative_path = relative;
    task.destination_key = join_key({key_prefix_, destination_prefix, relative});
    task.attempt = 0;
    return task;
}

auto path_expander::expand(const fs::path& source_root,
                           std::string_view destination_prefix,
                           const std::vector<std::string>& relative_paths) const
    -> result<std::vector<transfer_task>> {
    std::vector<transfer_task> tasks;
    std::error_code ec;

    auto root = fs::absolute(source_root, ec).lexically_normal();
    if (!root.has_filename() && root != root.root_path()) {
        root = root.parent_path();
    }
    if (ec) {
        return unexpected{error{error_code::invalid_file_path,
                                "Cannot resolve source root " + source_root.string() + ": " +
                                    ec.message()}};
    }

    for (const auto& requested : relative_paths) {
        const auto full_path = root / fs::path(requested);

        auto status = fs::status(full_path, ec);
        if (status.type() == fs::file_type::not_found ||
            ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
            CU_LOG_DEBUG(log_category::expander,
                         "Skipping non-existent path: " + full_path.string());
            ec.clear();
            continue;
        }
        if (ec) {
            return unexpected{error{error_code::directory_listing_failed,
                                    "Cannot stat " + full_path.string() + ": " + ec.message()}};
        }

        if (!fs::is_directory(status)) {
            tasks.push_back(make_task(root, destination_prefix,
                                      fs::path(requested).lexically_normal().generic_string()));
            continue;
        }

        std::vector<std::string> found;
        fs::recursive_directory_iterator it(full_path, fs::directory_options::none, ec);
        const fs::recursive_directory_iterator end;
        while (!ec && it != end) {
            // Regular files, and symlinks that resolve to one
            std::error_code entry_ec;
            if (it->is_regular_file(entry_ec)) {
                found.push_back(
                    it->path().lexically_relative(root).lexically_normal().generic_string());
            } else if (entry_ec && entry_ec != std::errc::no_such_file_or_directory) {
                ec = entry_ec;
                break;
            }
            it.increment(ec);
        }

        if (ec) {
            return unexpected{error{error_code::directory_listing_failed,
                                    "Failed to list " + full_path.string() + ": " +
                                        ec.message()}};
        }

        std::sort(found.begin(), found.end());
        for (const auto& relative : found) {
            tasks.push_back(make_task(root, destination_prefix, relative));
        }
    }

    CU_LOG_DEBUG(log_category::expander,
                 "Expanded " + std::to_string(relative_paths.size()) + " paths into " +
                     std::to_string(tasks.size()) + " files");
    return tasks;
}

}  // namespace kcenon::cloud_upload
