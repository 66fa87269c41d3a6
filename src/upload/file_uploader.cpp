/**
 * @file file_uploader.cpp
 * @brief Single file upload with size-based options and checksums
 */

#include <kcenon/cloud_upload/upload/file_uploader.h>
#include <kcenon/cloud_upload/core/checksum.h>
#include <kcenon/cloud_upload/core/logging.h>
#include <kcenon/cloud_upload/storage/storage_utils.h>
#include <kcenon/cloud_upload/upload/progress_reporter.h>

#include <filesystem>
#include <fstream>
#include <system_error>

namespace kcenon::cloud_upload {

file_uploader::file_uploader(std::shared_ptr<object_store> store, transfer_settings settings)
    : store_(std::move(store)), settings_(std::move(settings)) {}

auto file_uploader::options_for(const std::string& path, uint64_t size) const -> put_options {
    put_options options;
    options.resumable = size > settings_.resumable_threshold;
    if (size > settings_.chunk_threshold) {
        options.chunk_size = settings_.chunk_size;
    }
    options.content_type = storage_utils::detect_content_type(path);
    options.checksum_algorithm = settings_.checksum_algorithm;
    return options;
}

auto file_uploader::compute_checksum(std::istream& input, put_options& options) const
    -> result<void> {
    if (options.checksum_algorithm == "crc32c") {
        auto crc = checksum::crc32c_stream(input);
        if (!crc) {
            return unexpected{crc.error()};
        }
        options.crc32c = crc.value();
    } else if (options.checksum_algorithm == "md5") {
        auto digest = checksum::md5_stream(input);
        if (!digest) {
            return unexpected{digest.error()};
        }
        options.md5 = digest.value();
    }

    input.clear();
    input.seekg(0);
    if (!input) {
        return unexpected{error{error_code::file_read_error, "Cannot rewind file after checksum"}};
    }
    return {};
}

auto file_uploader::upload(const transfer_task& task, progress_reporter* reporter) const
    -> result<put_result> {
    std::error_code ec;
    auto size = std::filesystem::file_size(task.source_path, ec);
    if (ec) {
        auto code = ec == std::errc::no_such_file_or_directory ? error_code::file_not_found
                                                               : error_code::file_access_denied;
        return unexpected{error{code, "Cannot stat " + task.source_path.string() + ": " +
                                          ec.message()}};
    }

    std::ifstream file(task.source_path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_access_denied,
                                "Cannot open file: " + task.source_path.string()}};
    }

    auto options = options_for(task.source_path.string(), size);
    auto checked = compute_checksum(file, options);
    if (!checked) {
        return unexpected{checked.error()};
    }

    if (reporter != nullptr) {
        reporter->task_started(task, size);
    }

    auto outcome = store_->put_object(task.destination_key, file, size, options);
    if (!outcome) {
        return unexpected{outcome.error()};
    }

    CU_LOG_TRACE(log_category::uploader,
                 "Stored " + store_->object_uri(task.destination_key) + " in " +
                     std::to_string(outcome.value().requests) + " request(s)");
    return outcome;
}

}  // namespace kcenon::cloud_upload
