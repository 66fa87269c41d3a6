/**
 * @file upload_paths_example.cpp
 * @brief Upload files and directories to a Google Cloud Storage bucket
 *
 * Prerequisites:
 * - Google Cloud service account credentials configured
 * - A bucket with write permissions
 *
 * Build:
 *   cmake --build build --target upload_paths_example
 *
 * Run:
 *   ./build/bin/upload_paths_example my-bucket /data/task-42 task-42 odm_orthophoto report.pdf
 */

#include <kcenon/cloud_upload/core/logging.h>
#include <kcenon/cloud_upload/upload/bucket_uploader.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace kcenon::cloud_upload;

namespace {

/**
 * @brief Print usage information
 */
void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [options] <bucket-name> <source-root> <destination-prefix> <path>...\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --parallelism N   Concurrent uploads (default: 16)\n";
    std::cerr << "  --retries N       Retries per file (default: 5)\n";
    std::cerr << "  --endpoint URL    Custom endpoint (for fake-gcs-server, etc.)\n";
    std::cerr << "  --credentials F   Service account JSON file\n";
    std::cerr << "  --prefix P        Key prefix for every object\n";
    std::cerr << "  --delete          Delete local paths after a successful upload\n";
    std::cerr << "  --verbose         Enable debug logging\n\n";
    std::cerr << "Environment:\n";
    std::cerr << "  GOOGLE_APPLICATION_CREDENTIALS  Path to service account JSON file\n\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << program << " my-bucket /data/task-42 task-42 odm_orthophoto\n";
    std::cerr << "  " << program
              << " --endpoint http://localhost:4443 --delete my-bucket /tmp/out run-1 .\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    uploader_config_builder config_builder;
    bool delete_after_upload = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (++i >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                std::exit(1);
            }
            return argv[i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--parallelism") {
            config_builder.with_parallelism(static_cast<std::size_t>(std::stoul(next())));
        } else if (arg == "--retries") {
            config_builder.with_max_retries(static_cast<uint32_t>(std::stoul(next())));
        } else if (arg == "--endpoint") {
            config_builder.with_endpoint(next());
        } else if (arg == "--credentials") {
            config_builder.with_credentials_file(next());
        } else if (arg == "--prefix") {
            config_builder.with_key_prefix(next());
        } else if (arg == "--delete") {
            delete_after_upload = true;
        } else if (arg == "--verbose") {
            get_logger().set_level(log_level::debug);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 4) {
        print_usage(argv[0]);
        return 1;
    }

    config_builder.with_bucket(positional[0]);
    auto config = config_builder.build();
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << "\n";
        return 1;
    }

    auto uploader = bucket_uploader::builder().with_config(config.value()).build();
    if (!uploader) {
        std::cerr << "Failed to create uploader: " << uploader.error().message << "\n";
        return 1;
    }

    auto& up = uploader.value();
    auto init = up.initialize();
    if (!init) {
        std::cerr << init.error().message << "\n";
        return 1;
    }

    upload_request request;
    request.source_root = positional[1];
    request.destination_prefix = positional[2];
    request.relative_paths.assign(positional.begin() + 3, positional.end());
    request.delete_after_upload = delete_after_upload;

    auto summary = up.upload(
        request,
        [](const std::optional<error>& err) {
            if (err) {
                std::cerr << "Batch failed: " << err->message << "\n";
            }
        },
        [](const std::string& line) { std::cout << line << "\n"; });

    if (!summary) {
        return 1;
    }

    std::cout << "\nUploaded " << summary.value().uploaded_files << "/"
              << summary.value().total_files << " files ("
              << progress_reporter::format_megabytes(summary.value().total_bytes) << " MB, "
              << summary.value().retries << " retries) in "
              << summary.value().elapsed.count() << " ms\n";
    return 0;
}
