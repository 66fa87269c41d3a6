/**
 * @file storage_utils.h
 * @brief Shared helpers for the object storage backend
 *
 * Encoding, JSON field extraction, time and content-type helpers used by the
 * GCS backend and its credential providers.
 */

#ifndef KCENON_CLOUD_UPLOAD_STORAGE_STORAGE_UTILS_H
#define KCENON_CLOUD_UPLOAD_STORAGE_STORAGE_UTILS_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::cloud_upload::storage_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Base64 encode bytes
 * @param data Vector of bytes to encode
 * @return Base64 encoded string with padding
 */
auto base64_encode(const std::vector<uint8_t>& data) -> std::string;

/**
 * @brief Base64 encode string
 */
auto base64_encode(const std::string& data) -> std::string;

/**
 * @brief Base64 URL-safe encode (for JWT)
 * @param data Vector of bytes to encode
 * @return URL-safe base64 encoded string without padding
 */
auto base64url_encode(const std::vector<uint8_t>& data) -> std::string;

/**
 * @brief Base64 URL-safe encode string
 */
auto base64url_encode(const std::string& data) -> std::string;

/**
 * @brief URL encode a string (RFC 3986)
 * @param value String to encode
 * @param encode_slash Whether to encode forward slashes (default: true)
 * @return URL encoded string
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

/**
 * @brief Escape a string for embedding in a JSON document
 */
auto json_escape(std::string_view value) -> std::string;

// ============================================================================
// JSON Utilities
// ============================================================================

/**
 * @brief Extract a top-level JSON value (simple parser for known structure)
 *
 * String values are returned with escape sequences decoded; other values
 * are returned verbatim.
 *
 * @param json JSON document
 * @param key Key to extract
 * @return Value if found, nullopt otherwise
 */
auto extract_json_value(const std::string& json,
                        const std::string& key) -> std::optional<std::string>;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Get current UTC timestamp in seconds since epoch
 */
auto get_unix_timestamp() -> int64_t;

// ============================================================================
// Random Utilities
// ============================================================================

/**
 * @brief Generate random hex string
 * @param byte_count Number of random bytes (result will be 2x this length)
 */
auto generate_random_hex(std::size_t byte_count) -> std::string;

// ============================================================================
// Content Type Detection
// ============================================================================

/**
 * @brief Resolve a MIME content type from a file extension
 *
 * Static mapping covering the raster, point cloud, mesh and report outputs
 * commonly uploaded, case-insensitive.
 *
 * @param path File path or object key
 * @return MIME type string (defaults to "application/octet-stream")
 */
auto detect_content_type(std::string_view path) -> std::string;

}  // namespace kcenon::cloud_upload::storage_utils

#endif  // KCENON_CLOUD_UPLOAD_STORAGE_STORAGE_UTILS_H
