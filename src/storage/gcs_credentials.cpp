/**
 * @file gcs_credentials.cpp
 * @brief Implementation of Google Cloud Storage token sources
 */

#include <kcenon/cloud_upload/storage/gcs_credentials.h>
#include <kcenon/cloud_upload/config/feature_flags.h>
#include <kcenon/cloud_upload/core/logging.h>
#include <kcenon/cloud_upload/storage/storage_utils.h>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

#if CLOUD_UPLOAD_HAS_OPENSSL
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#endif

namespace kcenon::cloud_upload {

namespace {

// Refresh this long before the reported expiry
constexpr std::chrono::seconds TOKEN_REFRESH_MARGIN{60};

// Lifetime requested for JWT assertions
constexpr int64_t ASSERTION_LIFETIME_SECONDS = 3600;

auto read_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::invalid_credentials,
                                "Cannot open credentials file: " + path.string()}};
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

auto sign_rs256(const std::string& pem_key, const std::string& data)
    -> result<std::vector<uint8_t>> {
#if CLOUD_UPLOAD_HAS_OPENSSL
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(
        BIO_new_mem_buf(pem_key.data(), static_cast<int>(pem_key.size())), BIO_free);
    if (!bio) {
        return unexpected{error{error_code::internal_error, "Failed to allocate key buffer"}};
    }

    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey(
        PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), EVP_PKEY_free);
    if (!pkey) {
        return unexpected{error{error_code::invalid_credentials,
                                "Service account private key is not a valid PEM key"}};
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                 EVP_MD_CTX_free);
    if (!ctx ||
        EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1 ||
        EVP_DigestSignUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return unexpected{error{error_code::internal_error, "RS256 signing setup failed"}};
    }

    std::size_t sig_len = 0;
    if (EVP_DigestSignFinal(ctx.get(), nullptr, &sig_len) != 1) {
        return unexpected{error{error_code::internal_error, "RS256 signing failed"}};
    }
    std::vector<uint8_t> signature(sig_len);
    if (EVP_DigestSignFinal(ctx.get(), signature.data(), &sig_len) != 1) {
        return unexpected{error{error_code::internal_error, "RS256 signing failed"}};
    }
    signature.resize(sig_len);
    return signature;
#else
    (void)pem_key;
    (void)data;
    return unexpected{error{error_code::invalid_credentials,
                            "Service account authentication requires OpenSSL"}};
#endif
}

auto token_request_error(const http_response& response, std::string_view source) -> unexpected {
    auto description = storage_utils::extract_json_value(response.get_body_string(),
                                                         "error_description");
    std::string message = "Token request to " + std::string(source) + " failed with HTTP " +
                          std::to_string(response.status_code);
    if (description) {
        message += ": " + *description;
    }
    return unexpected{error{error_code::invalid_credentials, message}};
}

}  // namespace

// ============================================================================
// service_account_info / access_token_grant
// ============================================================================

auto service_account_info::parse(const std::string& json) -> result<service_account_info> {
    service_account_info info;
    info.project_id = storage_utils::extract_json_value(json, "project_id").value_or("");
    info.private_key_id = storage_utils::extract_json_value(json, "private_key_id").value_or("");
    info.private_key = storage_utils::extract_json_value(json, "private_key").value_or("");
    info.client_email = storage_utils::extract_json_value(json, "client_email").value_or("");
    info.token_uri = storage_utils::extract_json_value(json, "token_uri")
                         .value_or(std::string(google_token_uri));

    if (info.private_key.empty() || info.client_email.empty()) {
        return unexpected{error{error_code::invalid_credentials,
                                "Service account JSON is missing private_key or client_email"}};
    }
    if (info.token_uri.empty()) {
        info.token_uri = std::string(google_token_uri);
    }
    return info;
}

auto access_token_grant::parse(const std::string& json) -> result<access_token_grant> {
    auto token = storage_utils::extract_json_value(json, "access_token");
    if (!token || token->empty()) {
        return unexpected{error{error_code::invalid_credentials,
                                "Token response has no access_token"}};
    }

    int64_t expires_in = 3600;
    if (auto raw = storage_utils::extract_json_value(json, "expires_in")) {
        int64_t parsed = 0;
        auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), parsed);
        if (ec == std::errc{} && parsed > 0) {
            expires_in = parsed;
        }
    }

    access_token_grant grant;
    grant.token = std::move(*token);
    grant.expiry = std::chrono::system_clock::now() + std::chrono::seconds(expires_in);
    return grant;
}

// ============================================================================
// service_account_credentials
// ============================================================================

service_account_credentials::service_account_credentials(
    service_account_info info, std::shared_ptr<http_client_interface> http)
    : info_(std::move(info)), http_(std::move(http)) {}

auto service_account_credentials::from_file(const std::filesystem::path& path,
                                            std::shared_ptr<http_client_interface> http)
    -> result<std::shared_ptr<service_account_credentials>> {
    auto content = read_file(path);
    if (!content) {
        return unexpected{content.error()};
    }
    return from_json(content.value(), std::move(http));
}

auto service_account_credentials::from_json(const std::string& json,
                                            std::shared_ptr<http_client_interface> http)
    -> result<std::shared_ptr<service_account_credentials>> {
    auto info = service_account_info::parse(json);
    if (!info) {
        return unexpected{info.error()};
    }
    return std::make_shared<service_account_credentials>(std::move(info.value()),
                                                         std::move(http));
}

auto service_account_credentials::make_assertion(int64_t issued_at) const
    -> result<std::string> {
    std::string header = R"({"alg":"RS256","typ":"JWT")";
    if (!info_.private_key_id.empty()) {
        header += R"(,"kid":")" + storage_utils::json_escape(info_.private_key_id) + "\"";
    }
    header += "}";

    std::ostringstream claims;
    claims << R"({"iss":")" << storage_utils::json_escape(info_.client_email)
           << R"(","scope":")" << gcs_read_write_scope
           << R"(","aud":")" << storage_utils::json_escape(info_.token_uri)
           << R"(","iat":)" << issued_at
           << R"(,"exp":)" << issued_at + ASSERTION_LIFETIME_SECONDS << "}";

    std::string signing_input =
        storage_utils::base64url_encode(header) + "." + storage_utils::base64url_encode(claims.str());

    auto signature = sign_rs256(info_.private_key, signing_input);
    if (!signature) {
        return unexpected{signature.error()};
    }
    return signing_input + "." + storage_utils::base64url_encode(signature.value());
}

auto service_account_credentials::access_token() -> result<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cached_ && cached_->valid_for(TOKEN_REFRESH_MARGIN)) {
        return cached_->token;
    }
    if (!http_) {
        return unexpected{error{error_code::invalid_configuration,
                                "No HTTP client for token exchange"}};
    }

    auto assertion = make_assertion(storage_utils::get_unix_timestamp());
    if (!assertion) {
        return unexpected{assertion.error()};
    }

    std::string body = "grant_type=" +
                       storage_utils::url_encode("urn:ietf:params:oauth:grant-type:jwt-bearer") +
                       "&assertion=" + storage_utils::url_encode(assertion.value());
    http_headers headers{{"Content-Type", "application/x-www-form-urlencoded"}};

    CU_LOG_DEBUG(log_category::auth,
                 "Requesting access token for " + info_.client_email);

    auto response = http_->post(info_.token_uri, body, headers);
    if (!response) {
        return unexpected{response.error()};
    }
    if (!response.value().is_success()) {
        return token_request_error(response.value(), info_.token_uri);
    }

    auto grant = access_token_grant::parse(response.value().get_body_string());
    if (!grant) {
        return unexpected{grant.error()};
    }
    cached_ = std::move(grant.value());
    return cached_->token;
}

// ============================================================================
// metadata_server_credentials
// ============================================================================

metadata_server_credentials::metadata_server_credentials(
    std::shared_ptr<http_client_interface> http, std::string token_url)
    : http_(std::move(http)), token_url_(std::move(token_url)) {}

auto metadata_server_credentials::access_token() -> result<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cached_ && cached_->valid_for(TOKEN_REFRESH_MARGIN)) {
        return cached_->token;
    }
    if (!http_) {
        return unexpected{error{error_code::invalid_configuration,
                                "No HTTP client for metadata server"}};
    }

    auto response = http_->get(token_url_, {}, {{"Metadata-Flavor", "Google"}});
    if (!response) {
        return unexpected{error{error_code::invalid_credentials,
                                "Metadata server unreachable: " + response.error().message}};
    }
    if (!response.value().is_success()) {
        return token_request_error(response.value(), "metadata server");
    }

    auto grant = access_token_grant::parse(response.value().get_body_string());
    if (!grant) {
        return unexpected{grant.error()};
    }
    cached_ = std::move(grant.value());
    return cached_->token;
}

// ============================================================================
// Factory
// ============================================================================

auto make_default_credentials(const std::optional<std::filesystem::path>& credentials_path,
                              std::shared_ptr<http_client_interface> http)
    -> result<std::shared_ptr<credential_provider>> {
    std::optional<std::filesystem::path> key_file = credentials_path;
    if (!key_file) {
        if (const char* env = std::getenv("GOOGLE_APPLICATION_CREDENTIALS");
            env != nullptr && *env != '\0') {
            key_file = std::filesystem::path(env);
        }
    }

    if (key_file) {
        auto creds = service_account_credentials::from_file(*key_file, std::move(http));
        if (!creds) {
            return unexpected{creds.error()};
        }
        CU_LOG_INFO(log_category::auth,
                    "Using service account " + creds.value()->client_email());
        return std::shared_ptr<credential_provider>(creds.value());
    }

    CU_LOG_INFO(log_category::auth, "Using metadata server credentials");
    return std::shared_ptr<credential_provider>(
        std::make_shared<metadata_server_credentials>(std::move(http)));
}

}  // namespace kcenon::cloud_upload
