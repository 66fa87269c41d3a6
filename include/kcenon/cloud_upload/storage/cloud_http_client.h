/**
 * @file cloud_http_client.h
 * @brief network_system backed implementation of http_client_interface
 *
 * Wraps kcenon::network::core::http_client. When the library is built
 * without network_system every request fails with storage_unreachable, so
 * callers must inject their own client.
 */

#ifndef KCENON_CLOUD_UPLOAD_STORAGE_CLOUD_HTTP_CLIENT_H
#define KCENON_CLOUD_UPLOAD_STORAGE_CLOUD_HTTP_CLIENT_H

#include <kcenon/cloud_upload/storage/http_client.h>

#include <chrono>
#include <memory>

namespace kcenon::cloud_upload {

/**
 * @brief HTTP client for the storage API
 *
 * @note This client is thread-safe for concurrent operations.
 */
class cloud_http_client : public http_client_interface {
public:
    /**
     * @param timeout Request timeout duration
     */
    explicit cloud_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~cloud_http_client() override;

    cloud_http_client(const cloud_http_client&) = delete;
    auto operator=(const cloud_http_client&) -> cloud_http_client& = delete;
    cloud_http_client(cloud_http_client&&) noexcept;
    auto operator=(cloud_http_client&&) noexcept -> cloud_http_client&;

    [[nodiscard]] auto get(const std::string& url,
                           const std::map<std::string, std::string>& query,
                           const http_headers& headers) -> result<http_response> override;

    [[nodiscard]] auto post(const std::string& url,
                            const std::string& body,
                            const http_headers& headers) -> result<http_response> override;

    [[nodiscard]] auto post(const std::string& url,
                            const std::vector<uint8_t>& body,
                            const http_headers& headers) -> result<http_response> override;

    [[nodiscard]] auto put(const std::string& url,
                           const std::vector<uint8_t>& body,
                           const http_headers& headers) -> result<http_response> override;

    /**
     * @brief Check if the HTTP client is available
     * @return true if built with network_system
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Create a shared cloud HTTP client
 */
[[nodiscard]] auto make_cloud_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<cloud_http_client>;

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_STORAGE_CLOUD_HTTP_CLIENT_H
