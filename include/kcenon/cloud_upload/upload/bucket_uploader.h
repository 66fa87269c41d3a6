/**
 * @file bucket_uploader.h
 * @brief Public entry point: initialize, upload paths, clean up local copies
 */

#ifndef KCENON_CLOUD_UPLOAD_UPLOAD_BUCKET_UPLOADER_H
#define KCENON_CLOUD_UPLOAD_UPLOAD_BUCKET_UPLOADER_H

#include <kcenon/cloud_upload/adapters/thread_pool_adapter.h>
#include <kcenon/cloud_upload/core/types.h>
#include <kcenon/cloud_upload/storage/gcs_credentials.h>
#include <kcenon/cloud_upload/storage/http_client.h>
#include <kcenon/cloud_upload/storage/object_store.h>
#include <kcenon/cloud_upload/upload/batch_tracker.h>
#include <kcenon/cloud_upload/upload/cleanup_pass.h>
#include <kcenon/cloud_upload/upload/progress_reporter.h>
#include <kcenon/cloud_upload/upload/uploader_config.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::cloud_upload {

/**
 * @brief Totals for one upload batch
 */
struct batch_summary {
    std::size_t total_files = 0;      ///< Tasks produced by path expansion
    std::size_t uploaded_files = 0;   ///< Tasks that succeeded
    uint64_t total_bytes = 0;         ///< Bytes of the uploaded files
    std::size_t retries = 0;          ///< Retries scheduled across the batch
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief One upload call, optionally followed by local cleanup
 */
struct upload_request {
    std::filesystem::path source_root;
    std::string destination_prefix;
    std::vector<std::string> relative_paths;

    /// Run the cleanup pass on relative_paths after a fully successful batch
    bool delete_after_upload = false;
};

/**
 * @brief Uploads local files and directories to a bucket
 *
 * @code
 * auto uploader = bucket_uploader::builder()
 *     .with_config(uploader_config_builder().with_bucket("survey-results").build().value())
 *     .build();
 *
 * if (uploader.has_value()) {
 *     auto& up = uploader.value();
 *     if (up.initialize()) {
 *         up.upload_paths("/data/task-42", "task-42", {"odm_orthophoto", "report.pdf"},
 *                         [](const std::optional<error>& err) { ... },
 *                         [](const std::string& line) { std::cout << line << "\n"; });
 *     }
 * }
 * @endcode
 *
 * @note upload_paths() may be called from several threads at once; each call
 *       is an independent batch sharing the thread pool and object store.
 */
class bucket_uploader {
public:
    /**
     * @brief Builder for bucket_uploader
     */
    class builder {
    public:
        builder();

        auto with_config(uploader_config config) -> builder&;

        /**
         * @brief Use this store instead of creating a GCS backend
         */
        auto with_object_store(std::shared_ptr<object_store> store) -> builder&;

        /**
         * @brief Run worker loops on this pool instead of creating one
         */
        auto with_thread_pool(std::shared_ptr<adapters::upload_thread_pool_interface> pool)
            -> builder&;

        /**
         * @brief HTTP client for the GCS backend (default: network_system client)
         */
        auto with_http_client(std::shared_ptr<http_client_interface> http) -> builder&;

        /**
         * @brief Credentials for the GCS backend (default: resolved at initialize())
         */
        auto with_credentials(std::shared_ptr<credential_provider> credentials) -> builder&;

        /**
         * @brief Validate the configuration and build the uploader
         */
        [[nodiscard]] auto build() -> result<bucket_uploader>;

    private:
        uploader_config config_;
        std::shared_ptr<object_store> store_;
        std::shared_ptr<adapters::upload_thread_pool_interface> pool_;
        std::shared_ptr<http_client_interface> http_;
        std::shared_ptr<credential_provider> credentials_;
    };

    bucket_uploader(const bucket_uploader&) = delete;
    auto operator=(const bucket_uploader&) -> bucket_uploader& = delete;
    bucket_uploader(bucket_uploader&&) noexcept;
    auto operator=(bucket_uploader&&) noexcept -> bucket_uploader&;
    ~bucket_uploader();

    /**
     * @brief Create the storage backend and verify the bucket is reachable
     * @return storage_unreachable, bucket_not_found or invalid_credentials
     *         on failure
     */
    [[nodiscard]] auto initialize() -> result<void>;

    /// initialize() succeeded
    [[nodiscard]] auto is_initialized() const -> bool;

    /**
     * @brief Upload files and directories under @p source_root
     *
     * Blocks until the batch is terminal. @p on_complete is invoked exactly
     * once, as the last event of the batch, including when the uploader is
     * not initialized or expansion fails.
     *
     * @param source_root Directory the relative paths are resolved against
     * @param destination_prefix Remote folder for the uploaded objects
     * @param relative_paths Files or directories relative to @p source_root
     * @param on_complete No error on success, the first fatal error otherwise
     * @param on_progress Receives rendered progress lines
     */
    [[nodiscard]] auto upload_paths(const std::filesystem::path& source_root,
                                    const std::string& destination_prefix,
                                    const std::vector<std::string>& relative_paths,
                                    const completion_callback& on_complete = {},
                                    const progress_callback& on_progress = {})
        -> result<batch_summary>;

    /**
     * @brief Upload and, when requested, delete the local copies afterwards
     *
     * Cleanup runs only after a fully successful batch and before
     * @p on_complete fires.
     */
    [[nodiscard]] auto upload(const upload_request& request,
                              const completion_callback& on_complete = {},
                              const progress_callback& on_progress = {})
        -> result<batch_summary>;

    /**
     * @brief upload() on a background thread
     * @note The uploader must outlive the returned future.
     */
    [[nodiscard]] auto upload_async(upload_request request,
                                    completion_callback on_complete = {},
                                    progress_callback on_progress = {})
        -> std::future<result<batch_summary>>;

    /**
     * @brief Delete local files and directories, best effort
     *
     * Failures are logged and never reported as an error; @p on_complete
     * always receives no error.
     */
    auto cleanup_local_paths(const std::filesystem::path& source_root,
                             const std::vector<std::string>& relative_paths,
                             const completion_callback& on_complete = {},
                             const progress_callback& on_progress = {})
        -> result<cleanup_summary>;

    [[nodiscard]] auto config() const -> const uploader_config&;

private:
    bucket_uploader();

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_UPLOAD_BUCKET_UPLOADER_H
