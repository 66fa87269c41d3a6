/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes and result types
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_upload/core/types.h>

#include <string>
#include <vector>

namespace kcenon::cloud_upload::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Local file errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::file_not_found), -100);
    EXPECT_EQ(static_cast<int>(error_code::directory_listing_failed), -104);

    // Configuration errors: -140 to -159
    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -140);
    EXPECT_EQ(static_cast<int>(error_code::invalid_credentials), -141);

    // Storage errors: -160 to -179
    EXPECT_EQ(static_cast<int>(error_code::storage_unreachable), -160);
    EXPECT_EQ(static_cast<int>(error_code::retries_exhausted), -164);

    EXPECT_EQ(static_cast<int>(error_code::cleanup_failed), -180);
    EXPECT_EQ(static_cast<int>(error_code::internal_error), -200);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::bucket_not_found), "bucket not found");
    EXPECT_STREQ(to_string(error_code::retries_exhausted), "retries exhausted");
    EXPECT_STREQ(to_string(static_cast<error_code>(-999)), "unknown error");
}

TEST_F(ErrorCodeTest, SetupErrorsAreFatalBeforeTransfer) {
    EXPECT_TRUE(is_setup_error(error_code::storage_unreachable));
    EXPECT_TRUE(is_setup_error(error_code::bucket_not_found));
    EXPECT_TRUE(is_setup_error(error_code::invalid_credentials));
    EXPECT_TRUE(is_setup_error(error_code::not_initialized));
    EXPECT_TRUE(is_setup_error(error_code::directory_listing_failed));

    EXPECT_FALSE(is_setup_error(error_code::transfer_failed));
    EXPECT_FALSE(is_setup_error(error_code::upload_rejected));
    EXPECT_FALSE(is_setup_error(error_code::retries_exhausted));
}

// =============================================================================
// error / result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, ErrorFromCodeUsesDefaultMessage) {
    error err(error_code::file_not_found);
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, "file not found");

    error none;
    EXPECT_FALSE(static_cast<bool>(none));
}

TEST_F(ResultTest, HoldsValue) {
    result<std::vector<int>> r(std::vector<int>{1, 2, 3});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().size(), 3u);
}

TEST_F(ResultTest, HoldsError) {
    result<int> r = unexpected{error{error_code::transfer_failed, "HTTP 503"}};
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::transfer_failed);
    EXPECT_EQ(r.error().message, "HTTP 503");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected{error{error_code::not_initialized}};
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::not_initialized);
}

TEST_F(ResultTest, MoveValueOut) {
    result<std::string> r(std::string("payload"));
    std::string moved = std::move(r).value();
    EXPECT_EQ(moved, "payload");
}

TEST_F(ResultTest, MebibyteConstant) {
    EXPECT_EQ(mebibyte, 1048576u);
    EXPECT_EQ(5 * mebibyte, 5242880u);
}

}  // namespace kcenon::cloud_upload::test
