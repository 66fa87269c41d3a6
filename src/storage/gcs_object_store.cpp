/**
 * @file gcs_object_store.cpp
 * @brief GCS JSON API uploads (multipart and resumable)
 */

#include <kcenon/cloud_upload/storage/gcs_object_store.h>
#include <kcenon/cloud_upload/core/checksum.h>
#include <kcenon/cloud_upload/core/logging.h>
#include <kcenon/cloud_upload/storage/storage_utils.h>

#include <algorithm>
#include <charconv>
#include <map>
#include <vector>

namespace kcenon::cloud_upload {

namespace {

// HTTP 308 "Resume Incomplete" from a resumable session
constexpr int RESUME_INCOMPLETE = 308;

auto status_error(const http_response& response, const std::string& operation) -> unexpected {
    error_code code = error_code::transfer_failed;
    if (response.status_code == 401 || response.status_code == 403) {
        code = error_code::invalid_credentials;
    } else if (response.is_client_error()) {
        code = error_code::upload_rejected;
    }

    std::string message = operation + " failed with HTTP " + std::to_string(response.status_code);
    if (auto detail = storage_utils::extract_json_value(response.get_body_string(), "message")) {
        message += ": " + *detail;
    }
    return unexpected{error{code, message}};
}

auto read_range(std::istream& data, uint64_t offset, uint64_t count)
    -> result<std::vector<uint8_t>> {
    data.clear();
    data.seekg(static_cast<std::streamoff>(offset));
    if (!data) {
        return unexpected{error{error_code::file_read_error,
                                "Cannot seek to offset " + std::to_string(offset)}};
    }

    std::vector<uint8_t> buffer(static_cast<std::size_t>(count));
    data.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(count));
    if (static_cast<uint64_t>(data.gcount()) != count) {
        return unexpected{error{error_code::file_read_error,
                                "Short read: expected " + std::to_string(count) + " bytes at offset " +
                                    std::to_string(offset)}};
    }
    return buffer;
}

/**
 * @brief Parse the Range header of a 308 response ("bytes=0-N")
 * @return Offset of the first byte the server does not have yet
 */
auto committed_offset(const http_response& response) -> uint64_t {
    auto range = response.get_header("Range");
    if (!range) {
        return 0;
    }
    auto dash = range->rfind('-');
    if (dash == std::string::npos) {
        return 0;
    }
    uint64_t last = 0;
    const char* first = range->data() + dash + 1;
    auto [ptr, ec] = std::from_chars(first, range->data() + range->size(), last);
    if (ec != std::errc{}) {
        return 0;
    }
    return last + 1;
}

auto object_metadata_json(const std::string& key, const put_options& options) -> std::string {
    std::string json = R"({"name":")" + storage_utils::json_escape(key) + R"(","contentType":")" +
                       storage_utils::json_escape(options.content_type) + "\"";
    if (options.checksum_algorithm == "crc32c" && options.crc32c) {
        json += R"(,"crc32c":")" + checksum::crc32c_to_base64(*options.crc32c) + "\"";
    } else if (options.checksum_algorithm == "md5" && options.md5) {
        std::vector<uint8_t> digest(options.md5->begin(), options.md5->end());
        json += R"(,"md5Hash":")" + storage_utils::base64_encode(digest) + "\"";
    }
    json += "}";
    return json;
}

void fill_from_object_resource(put_result& result, const http_response& response) {
    auto body = response.get_body_string();
    result.generation = storage_utils::extract_json_value(body, "generation").value_or("");
    result.crc32c = storage_utils::extract_json_value(body, "crc32c").value_or("");
}

}  // namespace

struct gcs_object_store::impl {
    gcs_store_config config;
    std::shared_ptr<credential_provider> credentials;
    std::shared_ptr<http_client_interface> http;

    impl(gcs_store_config cfg,
         std::shared_ptr<credential_provider> creds,
         std::shared_ptr<http_client_interface> client)
        : config(std::move(cfg)), credentials(std::move(creds)), http(std::move(client)) {}

    auto bucket_url() const -> std::string {
        return config.endpoint + "/storage/v1/b/" + storage_utils::url_encode(config.bucket);
    }

    auto upload_url(std::string_view upload_type) const -> std::string {
        std::string url = config.endpoint + "/upload/storage/v1/b/" +
                          storage_utils::url_encode(config.bucket) +
                          "/o?uploadType=" + std::string(upload_type);
        if (config.project_id && !config.project_id->empty()) {
            url += "&userProject=" + storage_utils::url_encode(*config.project_id);
        }
        return url;
    }

    auto bucket_query() const -> std::map<std::string, std::string> {
        std::map<std::string, std::string> query{{"fields", "name"}};
        if (config.project_id && !config.project_id->empty()) {
            query["userProject"] = *config.project_id;
        }
        return query;
    }

    auto auth_headers() -> result<http_headers> {
        http_headers headers;
        auto token = credentials->access_token();
        if (!token) {
            return unexpected{token.error()};
        }
        if (!token.value().empty()) {
            headers["Authorization"] = "Bearer " + token.value();
        }
        return headers;
    }

    auto multipart_upload(const std::string& key,
                          std::istream& data,
                          uint64_t size,
                          const put_options& options) -> result<put_result> {
        auto payload = read_range(data, 0, size);
        if (!payload) {
            return unexpected{payload.error()};
        }

        auto headers = auth_headers();
        if (!headers) {
            return unexpected{headers.error()};
        }

        const std::string boundary = "cloud_upload_" + storage_utils::generate_random_hex(16);
        const std::string head = "--" + boundary +
                                 "\r\nContent-Type: application/json; charset=UTF-8\r\n\r\n" +
                                 object_metadata_json(key, options) + "\r\n--" + boundary +
                                 "\r\nContent-Type: " + options.content_type + "\r\n\r\n";
        const std::string tail = "\r\n--" + boundary + "--\r\n";

        std::vector<uint8_t> body;
        body.reserve(head.size() + payload.value().size() + tail.size());
        body.insert(body.end(), head.begin(), head.end());
        body.insert(body.end(), payload.value().begin(), payload.value().end());
        body.insert(body.end(), tail.begin(), tail.end());

        auto& hdrs = headers.value();
        hdrs["Content-Type"] = "multipart/related; boundary=" + boundary;

        auto response = http->post(upload_url("multipart"), body, hdrs);
        if (!response) {
            return unexpected{response.error()};
        }
        if (!response.value().is_success()) {
            return status_error(response.value(), "Upload of " + key);
        }

        put_result result;
        result.key = key;
        result.bytes = size;
        result.requests = 1;
        fill_from_object_resource(result, response.value());
        return result;
    }

    auto start_session(const std::string& key, uint64_t size, const put_options& options,
                       std::size_t& requests) -> result<std::string> {
        auto headers = auth_headers();
        if (!headers) {
            return unexpected{headers.error()};
        }
        auto& hdrs = headers.value();
        hdrs["Content-Type"] = "application/json; charset=UTF-8";
        hdrs["X-Upload-Content-Type"] = options.content_type;
        hdrs["X-Upload-Content-Length"] = std::to_string(size);

        ++requests;
        auto response = http->post(upload_url("resumable") + "&name=" + storage_utils::url_encode(key),
                                   object_metadata_json(key, options), hdrs);
        if (!response) {
            return unexpected{response.error()};
        }
        if (!response.value().is_success()) {
            return status_error(response.value(), "Starting resumable upload of " + key);
        }

        auto location = response.value().get_header("Location");
        if (!location || location->empty()) {
            return unexpected{error{error_code::transfer_failed,
                                    "Resumable upload of " + key + " returned no session URI"}};
        }
        return *location;
    }

    /**
     * @brief Ask the session how many bytes it has committed
     * @return Next offset to send, or std::nullopt if the object is complete
     */
    auto query_session(const std::string& session_url, uint64_t size, std::size_t& requests,
                       http_response& final_response) -> result<std::optional<uint64_t>> {
        auto headers = auth_headers();
        if (!headers) {
            return unexpected{headers.error()};
        }
        headers.value()["Content-Range"] = "bytes */" + std::to_string(size);

        ++requests;
        auto response = http->put(session_url, {}, headers.value());
        if (!response) {
            return unexpected{response.error()};
        }
        if (response.value().status_code == RESUME_INCOMPLETE) {
            return std::optional<uint64_t>(committed_offset(response.value()));
        }
        if (response.value().is_success()) {
            final_response = std::move(response.value());
            return std::optional<uint64_t>{};
        }
        return status_error(response.value(), "Resumable session status query");
    }

    auto resumable_upload(const std::string& key,
                          std::istream& data,
                          uint64_t size,
                          const put_options& options) -> result<put_result> {
        put_result result;
        result.key = key;
        result.bytes = size;
        result.resumable = true;

        auto session = start_session(key, size, options, result.requests);
        if (!session) {
            return unexpected{session.error()};
        }
        const std::string& session_url = session.value();

        const uint64_t chunk =
            options.chunk_size && *options.chunk_size > 0 ? *options.chunk_size : size;
        uint64_t offset = 0;
        std::size_t recoveries = 0;
        http_response final_response;
        bool finished = false;

        while (!finished) {
            if (size > 0 && offset >= size) {
                // Every byte is committed but the object was not finalized.
                auto status = query_session(session_url, size, result.requests, final_response);
                if (!status) {
                    return unexpected{status.error()};
                }
                if (status.value().has_value() && *status.value() >= size) {
                    return unexpected{error{error_code::transfer_failed,
                                            "Resumable upload of " + key + " did not finalize"}};
                }
                finished = !status.value().has_value();
                if (!finished) {
                    offset = *status.value();
                }
                continue;
            }

            const uint64_t count = size == 0 ? 0 : std::min<uint64_t>(chunk, size - offset);
            auto piece = read_range(data, offset, count);
            if (!piece) {
                return unexpected{piece.error()};
            }

            auto headers = auth_headers();
            if (!headers) {
                return unexpected{headers.error()};
            }
            headers.value()["Content-Range"] =
                size == 0 ? "bytes */0"
                          : "bytes " + std::to_string(offset) + "-" +
                                std::to_string(offset + count - 1) + "/" + std::to_string(size);

            ++result.requests;
            auto response = http->put(session_url, piece.value(), headers.value());

            if (response && response.value().status_code == RESUME_INCOMPLETE) {
                const uint64_t committed = committed_offset(response.value());
                if (committed <= offset) {
                    // The session did not advance; counts as a failed chunk.
                    if (recoveries >= config.max_session_recoveries) {
                        return unexpected{error{
                            error_code::transfer_failed,
                            "Resumable upload of " + key + " stalled at offset " +
                                std::to_string(offset) + " of " + std::to_string(size)}};
                    }
                    ++recoveries;
                    CU_LOG_WARN(log_category::storage,
                                "Session for " + key + " did not advance past offset " +
                                    std::to_string(offset));
                }
                offset = committed;
                continue;
            }
            if (response && response.value().is_success()) {
                final_response = std::move(response.value());
                finished = true;
                continue;
            }
            if (response && response.value().is_client_error()) {
                return status_error(response.value(), "Chunk upload of " + key);
            }

            // Transport failure or 5xx: find out where the session stands and resume.
            if (recoveries >= config.max_session_recoveries) {
                if (!response) {
                    return unexpected{response.error()};
                }
                return status_error(response.value(), "Chunk upload of " + key);
            }
            ++recoveries;
            CU_LOG_WARN(log_category::storage,
                        "Chunk at offset " + std::to_string(offset) + " of " + key +
                            " failed, querying session");

            auto status = query_session(session_url, size, result.requests, final_response);
            if (!status) {
                return unexpected{status.error()};
            }
            if (status.value().has_value()) {
                offset = *status.value();
            } else {
                finished = true;
            }
        }

        fill_from_object_resource(result, final_response);
        return result;
    }
};

gcs_object_store::gcs_object_store(gcs_store_config config,
                                   std::shared_ptr<credential_provider> credentials,
                                   std::shared_ptr<http_client_interface> http)
    : impl_(std::make_unique<impl>(std::move(config), std::move(credentials), std::move(http))) {}

gcs_object_store::~gcs_object_store() = default;

gcs_object_store::gcs_object_store(gcs_object_store&&) noexcept = default;
auto gcs_object_store::operator=(gcs_object_store&&) noexcept -> gcs_object_store& = default;

auto gcs_object_store::create(gcs_store_config config,
                              std::shared_ptr<credential_provider> credentials,
                              std::shared_ptr<http_client_interface> http)
    -> result<std::unique_ptr<gcs_object_store>> {
    if (config.bucket.empty()) {
        return unexpected{error{error_code::invalid_configuration, "Bucket name is empty"}};
    }
    if (!credentials) {
        return unexpected{error{error_code::invalid_configuration, "No credential provider"}};
    }
    if (!http) {
        return unexpected{error{error_code::invalid_configuration, "No HTTP client"}};
    }
    while (!config.endpoint.empty() && config.endpoint.back() == '/') {
        config.endpoint.pop_back();
    }
    return std::make_unique<gcs_object_store>(std::move(config), std::move(credentials),
                                              std::move(http));
}

auto gcs_object_store::bucket() const -> const std::string& {
    return impl_->config.bucket;
}

auto gcs_object_store::config() const -> const gcs_store_config& {
    return impl_->config;
}

auto gcs_object_store::bucket_exists() -> result<bool> {
    auto headers = impl_->auth_headers();
    if (!headers) {
        return unexpected{headers.error()};
    }

    auto response = impl_->http->get(impl_->bucket_url(), impl_->bucket_query(), headers.value());
    if (!response) {
        return unexpected{response.error()};
    }

    const auto& resp = response.value();
    if (resp.is_success()) {
        return true;
    }
    if (resp.status_code == 404) {
        return false;
    }
    if (resp.status_code == 401 || resp.status_code == 403) {
        return unexpected{error{error_code::invalid_credentials,
                                "Access denied to bucket '" + impl_->config.bucket + "' (HTTP " +
                                    std::to_string(resp.status_code) + ")"}};
    }
    return unexpected{error{error_code::storage_unreachable,
                            "Bucket lookup failed with HTTP " + std::to_string(resp.status_code)}};
}

auto gcs_object_store::put_object(const std::string& key,
                                  std::istream& data,
                                  uint64_t size,
                                  const put_options& options) -> result<put_result> {
    CU_LOG_TRACE(log_category::storage,
                 std::string(options.resumable ? "Resumable" : "Multipart") + " upload of " +
                     object_uri(key) + " (" + std::to_string(size) + " bytes)");

    if (options.resumable) {
        return impl_->resumable_upload(key, data, size, options);
    }
    return impl_->multipart_upload(key, data, size, options);
}

auto gcs_object_store::object_uri(const std::string& key) const -> std::string {
    return "gs://" + impl_->config.bucket + "/" + key;
}

}  // namespace kcenon::cloud_upload
