/**
 * @file gcs_credentials.h
 * @brief OAuth2 access token sources for Google Cloud Storage
 *
 * Supported sources:
 * - Service account key file (JWT bearer grant, RS256 signed with OpenSSL)
 * - GCE/GKE metadata server
 * - A fixed access token
 * - Anonymous access (no Authorization header)
 */

#ifndef KCENON_CLOUD_UPLOAD_STORAGE_GCS_CREDENTIALS_H
#define KCENON_CLOUD_UPLOAD_STORAGE_GCS_CREDENTIALS_H

#include <kcenon/cloud_upload/core/types.h>
#include <kcenon/cloud_upload/storage/http_client.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::cloud_upload {

/// OAuth2 scope requested for uploads
inline constexpr std::string_view gcs_read_write_scope =
    "https://www.googleapis.com/auth/devstorage.read_write";

/// Token endpoint used when a key file does not name one
inline constexpr std::string_view google_token_uri = "https://oauth2.googleapis.com/token";

/// Metadata server endpoint for the default service account token
inline constexpr std::string_view gce_metadata_token_url =
    "http://metadata.google.internal/computeMetadata/v1/instance/service-accounts/default/token";

/**
 * @brief Source of bearer tokens for storage requests
 *
 * access_token() is called by every upload worker, so implementations must
 * be thread-safe and should cache tokens until shortly before expiry.
 */
class credential_provider {
public:
    virtual ~credential_provider() = default;

    /**
     * @brief Get a valid access token
     * @return Token, an empty string for anonymous access, or an error
     */
    [[nodiscard]] virtual auto access_token() -> result<std::string> = 0;

    /// Label for logs, e.g. "service-account"
    [[nodiscard]] virtual auto auth_type() const -> std::string_view = 0;

    /// Project id known to the credentials (may be empty)
    [[nodiscard]] virtual auto project_id() const -> std::string { return {}; }
};

/**
 * @brief Fields of a service account key file
 */
struct service_account_info {
    std::string project_id;
    std::string private_key_id;
    std::string private_key;
    std::string client_email;
    std::string token_uri;

    /**
     * @brief Parse the JSON content of a key file
     *
     * private_key and client_email are required. token_uri defaults to
     * google_token_uri.
     */
    [[nodiscard]] static auto parse(const std::string& json) -> result<service_account_info>;
};

/**
 * @brief Token obtained from an OAuth2 endpoint
 */
struct access_token_grant {
    std::string token;
    std::chrono::system_clock::time_point expiry;

    /// Usable for at least @p margin more
    [[nodiscard]] auto valid_for(std::chrono::seconds margin) const -> bool {
        return !token.empty() && std::chrono::system_clock::now() + margin < expiry;
    }

    /**
     * @brief Parse {"access_token": ..., "expires_in": ...}
     */
    [[nodiscard]] static auto parse(const std::string& json) -> result<access_token_grant>;
};

/**
 * @brief Service account credentials using the JWT bearer grant
 *
 * @code
 * auto http = make_cloud_http_client();
 * auto creds = service_account_credentials::from_file("/etc/keys/uploader.json", http);
 * if (creds) {
 *     auto token = creds.value()->access_token();
 * }
 * @endcode
 */
class service_account_credentials : public credential_provider {
public:
    service_account_credentials(service_account_info info,
                                std::shared_ptr<http_client_interface> http);

    [[nodiscard]] static auto from_file(const std::filesystem::path& path,
                                        std::shared_ptr<http_client_interface> http)
        -> result<std::shared_ptr<service_account_credentials>>;

    [[nodiscard]] static auto from_json(const std::string& json,
                                        std::shared_ptr<http_client_interface> http)
        -> result<std::shared_ptr<service_account_credentials>>;

    [[nodiscard]] auto access_token() -> result<std::string> override;
    [[nodiscard]] auto auth_type() const -> std::string_view override { return "service-account"; }
    [[nodiscard]] auto project_id() const -> std::string override { return info_.project_id; }

    [[nodiscard]] auto client_email() const -> const std::string& { return info_.client_email; }

    /**
     * @brief Build the signed JWT assertion sent to the token endpoint
     * @param issued_at Unix time written to the iat claim
     */
    [[nodiscard]] auto make_assertion(int64_t issued_at) const -> result<std::string>;

private:
    service_account_info info_;
    std::shared_ptr<http_client_interface> http_;
    std::mutex mutex_;
    std::optional<access_token_grant> cached_;
};

/**
 * @brief Tokens from the compute metadata server
 */
class metadata_server_credentials : public credential_provider {
public:
    explicit metadata_server_credentials(std::shared_ptr<http_client_interface> http,
                                         std::string token_url = std::string(gce_metadata_token_url));

    [[nodiscard]] auto access_token() -> result<std::string> override;
    [[nodiscard]] auto auth_type() const -> std::string_view override { return "metadata-server"; }

private:
    std::shared_ptr<http_client_interface> http_;
    std::string token_url_;
    std::mutex mutex_;
    std::optional<access_token_grant> cached_;
};

/**
 * @brief A caller-supplied token that never refreshes
 */
class static_token_credentials : public credential_provider {
public:
    explicit static_token_credentials(std::string token) : token_(std::move(token)) {}

    [[nodiscard]] auto access_token() -> result<std::string> override { return token_; }
    [[nodiscard]] auto auth_type() const -> std::string_view override { return "static-token"; }

private:
    std::string token_;
};

/**
 * @brief No credentials; requests are sent unauthenticated
 */
class anonymous_credentials : public credential_provider {
public:
    [[nodiscard]] auto access_token() -> result<std::string> override { return std::string{}; }
    [[nodiscard]] auto auth_type() const -> std::string_view override { return "anonymous"; }
};

/**
 * @brief Resolve credentials the way Google client libraries do
 *
 * Order: @p credentials_path, then GOOGLE_APPLICATION_CREDENTIALS, then the
 * metadata server.
 */
[[nodiscard]] auto make_default_credentials(
    const std::optional<std::filesystem::path>& credentials_path,
    std::shared_ptr<http_client_interface> http)
    -> result<std::shared_ptr<credential_provider>>;

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_STORAGE_GCS_CREDENTIALS_H
