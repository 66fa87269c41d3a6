/**
 * @file test_cloud_http_client.cpp
 * @brief Unit tests for the storage HTTP client wrapper
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_upload/config/feature_flags.h>
#include <kcenon/cloud_upload/storage/cloud_http_client.h>

namespace kcenon::cloud_upload::test {

TEST(HttpResponseTest, HeaderLookupIsCaseInsensitive) {
    http_response response;
    response.headers["location"] = "https://upload.example.test/session";

    EXPECT_EQ(response.get_header("Location"), "https://upload.example.test/session");
    EXPECT_FALSE(response.get_header("Range").has_value());
}

TEST(HttpResponseTest, StatusClasses) {
    http_response response;
    response.status_code = 308;
    EXPECT_FALSE(response.is_success());
    EXPECT_FALSE(response.is_client_error());

    response.status_code = 404;
    EXPECT_TRUE(response.is_client_error());

    response.status_code = 503;
    EXPECT_TRUE(response.is_server_error());

    response.status_code = 201;
    EXPECT_TRUE(response.is_success());
}

TEST(CloudHttpClientTest, Availability) {
    auto client = make_cloud_http_client(std::chrono::milliseconds(1000));
    ASSERT_NE(client, nullptr);
    EXPECT_EQ(client->is_available(), static_cast<bool>(KCENON_WITH_NETWORK_SYSTEM));
}

#if !KCENON_WITH_NETWORK_SYSTEM
TEST(CloudHttpClientTest, RequestsFailWithoutNetworkSystem) {
    cloud_http_client client;
    auto response = client.get("https://storage.googleapis.com/storage/v1/b/x", {}, {});
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::storage_unreachable);

    auto put = client.put("https://example.test", {}, {});
    EXPECT_FALSE(put.has_value());
}
#endif

}  // namespace kcenon::cloud_upload::test
