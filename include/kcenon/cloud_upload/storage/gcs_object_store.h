/**
 * @file gcs_object_store.h
 * @brief Google Cloud Storage implementation of object_store
 *
 * Uses the GCS JSON API: multipart uploads for small objects and
 * resumable sessions (optionally chunked) for large ones.
 */

#ifndef KCENON_CLOUD_UPLOAD_STORAGE_GCS_OBJECT_STORE_H
#define KCENON_CLOUD_UPLOAD_STORAGE_GCS_OBJECT_STORE_H

#include <kcenon/cloud_upload/storage/gcs_credentials.h>
#include <kcenon/cloud_upload/storage/http_client.h>
#include <kcenon/cloud_upload/storage/object_store.h>

#include <memory>
#include <optional>
#include <string>

namespace kcenon::cloud_upload {

/**
 * @brief Connection settings for a GCS bucket
 */
struct gcs_store_config {
    /// Bucket name
    std::string bucket;

    /// API endpoint (override for emulators such as fake-gcs-server)
    std::string endpoint = "https://storage.googleapis.com";

    /// Project billed for requests (sent as userProject, for requester-pays buckets)
    std::optional<std::string> project_id;

    /// Session recoveries allowed per resumable upload after a failed chunk
    std::size_t max_session_recoveries = 3;
};

/**
 * @brief object_store backed by the GCS JSON API
 *
 * @code
 * auto http = make_cloud_http_client();
 * auto creds = make_default_credentials(std::nullopt, http);
 * gcs_store_config cfg;
 * cfg.bucket = "survey-results";
 * auto store = gcs_object_store::create(cfg, creds.value(), http);
 * @endcode
 */
class gcs_object_store : public object_store {
public:
    gcs_object_store(gcs_store_config config,
                     std::shared_ptr<credential_provider> credentials,
                     std::shared_ptr<http_client_interface> http);

    ~gcs_object_store() override;

    gcs_object_store(const gcs_object_store&) = delete;
    auto operator=(const gcs_object_store&) -> gcs_object_store& = delete;
    gcs_object_store(gcs_object_store&&) noexcept;
    auto operator=(gcs_object_store&&) noexcept -> gcs_object_store&;

    /**
     * @brief Validate arguments and create the store
     * @return Store, or invalid_configuration when bucket, credentials or
     *         HTTP client is missing
     */
    [[nodiscard]] static auto create(gcs_store_config config,
                                     std::shared_ptr<credential_provider> credentials,
                                     std::shared_ptr<http_client_interface> http)
        -> result<std::unique_ptr<gcs_object_store>>;

    [[nodiscard]] auto provider_name() const -> std::string override { return "GCS"; }
    [[nodiscard]] auto bucket() const -> const std::string& override;
    [[nodiscard]] auto bucket_exists() -> result<bool> override;
    [[nodiscard]] auto put_object(const std::string& key,
                                  std::istream& data,
                                  uint64_t size,
                                  const put_options& options) -> result<put_result> override;
    [[nodiscard]] auto object_uri(const std::string& key) const -> std::string override;

    [[nodiscard]] auto config() const -> const gcs_store_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_STORAGE_GCS_OBJECT_STORE_H
