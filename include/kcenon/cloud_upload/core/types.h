/**
 * @file types.h
 * @brief Core type definitions for cloud_upload
 */

#ifndef KCENON_CLOUD_UPLOAD_CORE_TYPES_H
#define KCENON_CLOUD_UPLOAD_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::cloud_upload {

/**
 * @brief Error codes for upload operations
 */
enum class error_code {
    success = 0,

    // Local file errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    invalid_file_path = -102,
    file_read_error = -103,
    directory_listing_failed = -104,

    // Configuration errors (-140 to -159)
    invalid_configuration = -140,
    invalid_credentials = -141,

    // Storage errors (-160 to -179)
    storage_unreachable = -160,
    bucket_not_found = -161,
    transfer_failed = -162,
    upload_rejected = -163,
    retries_exhausted = -164,

    // Cleanup errors (-180 to -199)
    cleanup_failed = -180,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::invalid_file_path:
            return "invalid file path";
        case error_code::file_read_error:
            return "file read error";
        case error_code::directory_listing_failed:
            return "directory listing failed";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_credentials:
            return "invalid credentials";
        case error_code::storage_unreachable:
            return "storage unreachable";
        case error_code::bucket_not_found:
            return "bucket not found";
        case error_code::transfer_failed:
            return "transfer failed";
        case error_code::upload_rejected:
            return "upload rejected";
        case error_code::retries_exhausted:
            return "retries exhausted";
        case error_code::cleanup_failed:
            return "cleanup failed";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Whether an error aborts a batch before any transfer starts
 */
[[nodiscard]] constexpr auto is_setup_error(error_code code) -> bool {
    switch (code) {
        case error_code::storage_unreachable:
        case error_code::bucket_not_found:
        case error_code::invalid_credentials:
        case error_code::invalid_configuration:
        case error_code::not_initialized:
        case error_code::directory_listing_failed:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an error, in the spirit of
 * std::expected (C++23).
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/// Size of one mebibyte, used for upload thresholds and progress output
inline constexpr uint64_t mebibyte = 1024ULL * 1024ULL;

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_CORE_TYPES_H
