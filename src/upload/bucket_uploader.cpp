/**
 * @file bucket_uploader.cpp
 * @brief Implementation of the uploader facade
 */

#include <kcenon/cloud_upload/upload/bucket_uploader.h>
#include <kcenon/cloud_upload/core/logging.h>
#include <kcenon/cloud_upload/storage/cloud_http_client.h>
#include <kcenon/cloud_upload/storage/gcs_object_store.h>
#include <kcenon/cloud_upload/upload/file_uploader.h>
#include <kcenon/cloud_upload/upload/path_expander.h>
#include <kcenon/cloud_upload/upload/retry_policy.h>
#include <kcenon/cloud_upload/upload/upload_pool.h>

#include <atomic>
#include <mutex>
#include <optional>

namespace kcenon::cloud_upload {

namespace {

// Label used before a backend exists
constexpr const char* DEFAULT_PROVIDER = "GCS";

}  // namespace

struct bucket_uploader::impl {
    uploader_config config;
    std::shared_ptr<object_store> store;
    std::shared_ptr<adapters::upload_thread_pool_interface> threads;
    std::shared_ptr<http_client_interface> http;
    std::shared_ptr<credential_provider> credentials;

    std::mutex init_mutex;
    std::atomic<bool> initialized{false};

    auto provider() const -> std::string {
        return store ? store->provider_name() : std::string(DEFAULT_PROVIDER);
    }

    auto make_retry_policy() const -> retry_policy {
        retry_settings settings;
        settings.max_retries = config.max_retries;
        settings.base_delay = config.retry_base_delay;
        settings.use_jitter = config.retry_jitter;
        return retry_policy(settings);
    }

    auto make_transfer_settings() const -> transfer_settings {
        transfer_settings settings;
        settings.resumable_threshold = config.resumable_threshold;
        settings.chunk_threshold = config.chunk_threshold;
        settings.chunk_size = config.chunk_size;
        settings.checksum_algorithm = config.checksum_algorithm;
        return settings;
    }

    /// Build the default GCS backend from configuration
    auto create_store() -> result<void> {
        if (!http) {
            http = make_cloud_http_client(config.request_timeout);
        }
        if (!credentials) {
            auto resolved = make_default_credentials(config.credentials_path, http);
            if (!resolved) {
                return unexpected{resolved.error()};
            }
            credentials = resolved.value();
        }

        gcs_store_config store_config;
        store_config.bucket = config.bucket_name;
        store_config.endpoint = config.endpoint;
        store_config.project_id = config.project_id;

        auto created = gcs_object_store::create(std::move(store_config), credentials, http);
        if (!created) {
            return unexpected{created.error()};
        }
        store = std::move(created.value());
        return {};
    }
};

// ============================================================================
// builder
// ============================================================================

bucket_uploader::builder::builder() = default;

auto bucket_uploader::builder::with_config(uploader_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto bucket_uploader::builder::with_object_store(std::shared_ptr<object_store> store)
    -> builder& {
    store_ = std::move(store);
    return *this;
}

auto bucket_uploader::builder::with_thread_pool(
    std::shared_ptr<adapters::upload_thread_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto bucket_uploader::builder::with_http_client(std::shared_ptr<http_client_interface> http)
    -> builder& {
    http_ = std::move(http);
    return *this;
}

auto bucket_uploader::builder::with_credentials(
    std::shared_ptr<credential_provider> credentials) -> builder& {
    credentials_ = std::move(credentials);
    return *this;
}

auto bucket_uploader::builder::build() -> result<bucket_uploader> {
    auto valid = config_.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }

    bucket_uploader uploader;
    uploader.impl_->config = std::move(config_);
    uploader.impl_->store = std::move(store_);
    uploader.impl_->http = std::move(http_);
    uploader.impl_->credentials = std::move(credentials_);
    uploader.impl_->threads =
        pool_ ? std::move(pool_)
              : adapters::upload_pool_factory::create(uploader.impl_->config.parallelism,
                                                      "cloud_upload_pool");
    return result<bucket_uploader>(std::move(uploader));
}

// ============================================================================
// bucket_uploader
// ============================================================================

bucket_uploader::bucket_uploader() : impl_(std::make_unique<impl>()) {
    get_logger().initialize();
}

bucket_uploader::bucket_uploader(bucket_uploader&&) noexcept = default;
auto bucket_uploader::operator=(bucket_uploader&&) noexcept -> bucket_uploader& = default;
bucket_uploader::~bucket_uploader() = default;

auto bucket_uploader::config() const -> const uploader_config& {
    return impl_->config;
}

auto bucket_uploader::is_initialized() const -> bool {
    return impl_ && impl_->initialized.load(std::memory_order_acquire);
}

auto bucket_uploader::initialize() -> result<void> {
    std::lock_guard<std::mutex> lock(impl_->init_mutex);
    if (impl_->initialized.load(std::memory_order_acquire)) {
        CU_LOG_DEBUG(log_category::uploader, "Uploader already initialized");
        return {};
    }

    const auto& bucket = impl_->config.bucket_name;

    if (!impl_->store) {
        auto created = impl_->create_store();
        if (!created) {
            auto err = error{created.error().code, "Failed to initialize " + impl_->provider() +
                                                       ": " + created.error().message};
            CU_LOG_ERROR(log_category::uploader, err.message);
            return unexpected{err};
        }
    }

    auto exists = impl_->store->bucket_exists();
    if (!exists) {
        auto code = exists.error().code == error_code::invalid_credentials
                        ? error_code::invalid_credentials
                        : error_code::storage_unreachable;
        auto err = error{code, "Cannot connect to " + impl_->provider() + ": " +
                                   exists.error().message};
        CU_LOG_ERROR(log_category::uploader, err.message);
        return unexpected{err};
    }
    if (!exists.value()) {
        auto err = error{error_code::bucket_not_found,
                         impl_->provider() + " bucket '" + bucket +
                             "' does not exist or is not accessible"};
        CU_LOG_ERROR(log_category::uploader, err.message);
        return unexpected{err};
    }

    impl_->initialized.store(true, std::memory_order_release);
    CU_LOG_INFO(log_category::uploader,
                "Connected to " + impl_->provider() + " bucket: " + bucket);
    return {};
}

auto bucket_uploader::upload_paths(const std::filesystem::path& source_root,
                                   const std::string& destination_prefix,
                                   const std::vector<std::string>& relative_paths,
                                   const completion_callback& on_complete,
                                   const progress_callback& on_progress)
    -> result<batch_summary> {
    const auto started = std::chrono::steady_clock::now();

    if (!is_initialized()) {
        error err{error_code::not_initialized, impl_->provider() + " is not initialized"};
        if (on_complete) {
            on_complete(err);
        }
        return unexpected{err};
    }

    progress_reporter reporter(on_progress, impl_->provider(), impl_->config.bucket_name);

    path_expander expander(impl_->config.key_prefix);
    auto expanded = expander.expand(source_root, destination_prefix, relative_paths);
    if (!expanded) {
        reporter.batch_failed(expanded.error());
        if (on_complete) {
            on_complete(expanded.error());
        }
        return unexpected{expanded.error()};
    }

    auto tasks = std::move(expanded.value());
    batch_tracker tracker(tasks.size());
    batch_summary summary;
    summary.total_files = tasks.size();

    if (tasks.empty()) {
        reporter.batch_empty();
        tracker.signal_completion(on_complete);
        summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        return summary;
    }

    reporter.batch_started(tasks.size());

    file_uploader uploader(impl_->store, impl_->make_transfer_settings());
    task_executor execute = [&uploader, &reporter](const transfer_task& task)
        -> result<uint64_t> {
        auto outcome = uploader.upload(task, &reporter);
        if (!outcome) {
            return unexpected{outcome.error()};
        }
        return outcome.value().bytes;
    };

    upload_pool pool(impl_->threads, impl_->config.parallelism, impl_->make_retry_policy());
    pool.run(std::move(tasks), execute, tracker, reporter);

    const bool all_done =
        !tracker.is_aborted() && tracker.completed_count() == tracker.total_count();
    if (all_done) {
        reporter.batch_succeeded(tracker.total_count());
    }

    std::optional<error> outcome;
    tracker.signal_completion([&](const std::optional<error>& err) {
        outcome = err;
        if (err) {
            reporter.batch_failed(*err);
        }
        if (on_complete) {
            on_complete(err);
        }
    });

    summary.uploaded_files = tracker.completed_count();
    summary.total_bytes = tracker.total_bytes();
    summary.retries = tracker.retry_count();
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    CU_LOG_INFO(log_category::uploader,
                "Batch " + std::string(to_string(tracker.state())) + ": " +
                    std::to_string(summary.uploaded_files) + "/" +
                    std::to_string(summary.total_files) + " files, " +
                    std::to_string(summary.retries) + " retries");

    if (outcome) {
        return unexpected{*outcome};
    }
    return summary;
}

auto bucket_uploader::upload(const upload_request& request,
                             const completion_callback& on_complete,
                             const progress_callback& on_progress) -> result<batch_summary> {
    std::optional<error> batch_error;
    auto uploaded = upload_paths(request.source_root, request.destination_prefix,
                                 request.relative_paths,
                                 [&batch_error](const std::optional<error>& err) {
                                     batch_error = err;
                                 },
                                 on_progress);

    if (uploaded && request.delete_after_upload) {
        auto cleaned = cleanup_local_paths(request.source_root, request.relative_paths, {},
                                           on_progress);
        if (cleaned && cleaned.value().failed > 0) {
            CU_LOG_WARN(log_category::cleanup,
                        std::to_string(cleaned.value().failed) +
                            " path(s) could not be deleted after upload");
        }
    }

    if (on_complete) {
        on_complete(batch_error);
    }
    return uploaded;
}

auto bucket_uploader::upload_async(upload_request request,
                                   completion_callback on_complete,
                                   progress_callback on_progress)
    -> std::future<result<batch_summary>> {
    return std::async(std::launch::async,
                      [this, request = std::move(request), on_complete = std::move(on_complete),
                       on_progress = std::move(on_progress)]() {
                          return upload(request, on_complete, on_progress);
                      });
}

auto bucket_uploader::cleanup_local_paths(const std::filesystem::path& source_root,
                                          const std::vector<std::string>& relative_paths,
                                          const completion_callback& on_complete,
                                          const progress_callback& on_progress)
    -> result<cleanup_summary> {
    progress_reporter reporter(on_progress, impl_->provider(), impl_->config.bucket_name);

    reporter.cleanup_started();
    auto summary = cleanup_pass::run(source_root, relative_paths);
    reporter.cleanup_finished();

    CU_LOG_DEBUG(log_category::cleanup,
                 "Cleanup deleted " + std::to_string(summary.deleted) + ", skipped " +
                     std::to_string(summary.skipped) + ", failed " +
                     std::to_string(summary.failed));

    if (on_complete) {
        on_complete(std::nullopt);
    }
    return summary;
}

}  // namespace kcenon::cloud_upload
