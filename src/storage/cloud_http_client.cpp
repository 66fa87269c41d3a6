/**
 * @file cloud_http_client.cpp
 * @brief network_system backed HTTP client
 */

#include "kcenon/cloud_upload/storage/cloud_http_client.h"

#include "kcenon/cloud_upload/config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::cloud_upload {

namespace {

[[maybe_unused]] auto unavailable(const char* method) -> unexpected {
    return unexpected{error{error_code::storage_unreachable,
                            std::string("HTTP ") + method +
                                " not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
}

[[maybe_unused]] auto request_failed(const char* method, const std::string& url) -> unexpected {
    return unexpected{error{error_code::storage_unreachable,
                            std::string("HTTP ") + method + " request failed: " + url}};
}

}  // namespace

struct cloud_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
        available = false;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }
#endif
};

cloud_http_client::cloud_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

cloud_http_client::~cloud_http_client() = default;

cloud_http_client::cloud_http_client(cloud_http_client&&) noexcept = default;
auto cloud_http_client::operator=(cloud_http_client&&) noexcept
    -> cloud_http_client& = default;

auto cloud_http_client::get(const std::string& url,
                            const std::map<std::string, std::string>& query,
                            const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->get(url, query, headers);
    if (response.is_err()) {
        return request_failed("GET", url);
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)query;
    (void)headers;
    return unavailable("GET");
#endif
}

auto cloud_http_client::post(const std::string& url,
                             const std::string& body,
                             const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->post(url, body, headers);
    if (response.is_err()) {
        return request_failed("POST", url);
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)body;
    (void)headers;
    return unavailable("POST");
#endif
}

auto cloud_http_client::post(const std::string& url,
                             const std::vector<uint8_t>& body,
                             const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->post(url, body, headers);
    if (response.is_err()) {
        return request_failed("POST", url);
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)body;
    (void)headers;
    return unavailable("POST");
#endif
}

auto cloud_http_client::put(const std::string& url,
                            const std::vector<uint8_t>& body,
                            const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    std::string body_str(body.begin(), body.end());
    auto response = impl_->client->put(url, body_str, headers);
    if (response.is_err()) {
        return request_failed("PUT", url);
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)body;
    (void)headers;
    return unavailable("PUT");
#endif
}

auto cloud_http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

auto make_cloud_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<cloud_http_client> {
    return std::make_shared<cloud_http_client>(timeout);
}

}  // namespace kcenon::cloud_upload
