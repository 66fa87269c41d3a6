/**
 * @file http_client.h
 * @brief HTTP seam used by the object storage backend
 */

#ifndef KCENON_CLOUD_UPLOAD_STORAGE_HTTP_CLIENT_H
#define KCENON_CLOUD_UPLOAD_STORAGE_HTTP_CLIENT_H

#include <kcenon/cloud_upload/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::cloud_upload {

/**
 * @brief HTTP response
 */
struct http_response {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    std::map<std::string, std::string> headers;

    /// Response body
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        };

        const auto lower_key = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == lower_key) {
                return v;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] auto is_client_error() const -> bool {
        return status_code >= 400 && status_code < 500;
    }

    [[nodiscard]] auto is_server_error() const -> bool {
        return status_code >= 500 && status_code < 600;
    }
};

using http_headers = std::map<std::string, std::string>;

/**
 * @brief Minimal HTTP client interface
 *
 * A failed result means the request never produced a response (DNS,
 * connect, TLS or timeout failure). Any HTTP status, including 4xx and 5xx,
 * is returned as a value. Implementations must be safe to call from several
 * upload workers at once.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    virtual auto get(const std::string& url,
                     const std::map<std::string, std::string>& query,
                     const http_headers& headers) -> result<http_response> = 0;

    virtual auto post(const std::string& url,
                      const std::string& body,
                      const http_headers& headers) -> result<http_response> = 0;

    virtual auto post(const std::string& url,
                      const std::vector<uint8_t>& body,
                      const http_headers& headers) -> result<http_response> = 0;

    virtual auto put(const std::string& url,
                     const std::vector<uint8_t>& body,
                     const http_headers& headers) -> result<http_response> = 0;
};

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_STORAGE_HTTP_CLIENT_H
