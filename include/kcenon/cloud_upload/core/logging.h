// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <kcenon/cloud_upload/config/feature_flags.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#if CLOUD_UPLOAD_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::cloud_upload {

/**
 * @brief Log categories, one per stage of a batch
 */
struct log_category {
    static constexpr std::string_view uploader = "cloud_upload.uploader";
    static constexpr std::string_view expander = "cloud_upload.expander";
    static constexpr std::string_view pool = "cloud_upload.pool";
    static constexpr std::string_view retry = "cloud_upload.retry";
    static constexpr std::string_view progress = "cloud_upload.progress";
    static constexpr std::string_view cleanup = "cloud_upload.cleanup";
    static constexpr std::string_view storage = "cloud_upload.storage";
    static constexpr std::string_view auth = "cloud_upload.auth";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
    }
    return "UNKNOWN";
}

namespace detail {

inline auto json_quote(std::string_view input) -> std::string {
    std::string output = "\"";
    output.reserve(input.size() + 8);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    output += '"';
    return output;
}

/// UTC time as 2025-01-31T08:15:02.123Z
inline auto utc_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#if defined(_WIN32)
    gmtime_s(&tm_buf, &seconds);
#else
    gmtime_r(&seconds, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace detail

/**
 * @brief Per-file fields attached to a log record
 */
struct upload_log_context {
    std::string bucket;
    std::string object_key;
    std::string relative_path;
    std::optional<uint64_t> file_size;
    std::optional<uint32_t> attempt;

    /// Comma separated JSON members, without braces
    [[nodiscard]] auto json_members() const -> std::string {
        std::string out;
        auto add = [&out](const char* name, const std::string& value) {
            if (!out.empty()) out += ',';
            out += '"';
            out += name;
            out += "\":";
            out += value;
        };

        if (!bucket.empty()) add("bucket", detail::json_quote(bucket));
        if (!object_key.empty()) add("object_key", detail::json_quote(object_key));
        if (!relative_path.empty()) add("relative_path", detail::json_quote(relative_path));
        if (file_size) add("size", std::to_string(*file_size));
        if (attempt) add("attempt", std::to_string(*attempt));
        return out;
    }
};

/**
 * @brief One record as delivered to the JSON callback
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<upload_log_context> context;

    [[nodiscard]] auto to_json() const -> std::string {
        std::string json = "{\"timestamp\":\"" + timestamp + "\",\"level\":\"" +
                           std::string(log_level_to_string(level)) + "\",\"category\":" +
                           detail::json_quote(category) + ",\"message\":" +
                           detail::json_quote(message);
        if (context) {
            auto members = context->json_members();
            if (!members.empty()) {
                json += ',' + members;
            }
        }
        json += '}';
        return json;
    }
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Logging front-end for the upload library
 *
 * Forwards to kcenon::logger when logger_system is linked, writes to stderr
 * otherwise. Callbacks receive every enabled record even when console output
 * is switched off.
 */
class upload_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const upload_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    upload_logger() = default;

    upload_logger(const upload_logger&) = delete;
    upload_logger& operator=(const upload_logger&) = delete;

    /**
     * @brief Create the logger_system backend; later calls are no-ops
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if CLOUD_UPLOAD_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_backend_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            std::lock_guard<std::mutex> lock(backend_mutex_);
            backend_ = std::move(result.value());
        }
#endif
    }

    void set_level(log_level level) {
        min_level_.store(level);
#if CLOUD_UPLOAD_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (backend_) {
            backend_->set_min_level(to_backend_level(level));
        }
#endif
    }

    void set_output_format(log_output_format format) {
        json_output_.store(format == log_output_format::json);
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        return json_output_.load() ? log_output_format::json : log_output_format::text;
    }

    /// Pass an empty function to remove the callback
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /// Receives records while the output format is json
    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    void set_console_output(bool enabled) { console_output_.store(enabled); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        if (json_output_.load()) {
            structured_log_entry entry{detail::utc_timestamp(), level, std::string(category),
                                       std::string(message), std::nullopt};
            if (context) {
                entry.context = *context;
            }
            auto json = entry.to_json();
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                if (json_callback_) {
                    json_callback_(entry, json);
                }
            }
            write(level, json);
            return;
        }

        std::string line;
#if !CLOUD_UPLOAD_USE_LOGGER_SYSTEM
        line = detail::utc_timestamp() + " [" + std::string(log_level_to_string(level)) + "] ";
#endif
        line += "[" + std::string(category) + "] " + std::string(message);
        if (context) {
            auto members = context->json_members();
            if (!members.empty()) {
                line += " {" + members + "}";
            }
        }
        write(level, line);
    }

private:
    void write([[maybe_unused]] log_level level, const std::string& line) {
        if (!console_output_.load()) return;

#if CLOUD_UPLOAD_USE_LOGGER_SYSTEM
        {
            std::lock_guard<std::mutex> lock(backend_mutex_);
            if (backend_) {
                backend_->log(to_backend_level(level), line);
                return;
            }
        }
#endif
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << line << "\n";
    }

#if CLOUD_UPLOAD_USE_LOGGER_SYSTEM
    static auto to_backend_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
        }
        return kcenon::logger::log_level::info;
    }

    std::unique_ptr<kcenon::logger::logger> backend_;
    std::mutex backend_mutex_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    std::atomic<bool> json_output_{false};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;
};

inline upload_logger& get_logger() {
    static upload_logger instance;
    return instance;
}

#define CU_LOG(level, category, message) \
    kcenon::cloud_upload::get_logger().log(level, category, message)

#define CU_LOG_TRACE(category, message) \
    CU_LOG(kcenon::cloud_upload::log_level::trace, category, message)

#define CU_LOG_DEBUG(category, message) \
    CU_LOG(kcenon::cloud_upload::log_level::debug, category, message)

#define CU_LOG_INFO(category, message) \
    CU_LOG(kcenon::cloud_upload::log_level::info, category, message)

#define CU_LOG_WARN(category, message) \
    CU_LOG(kcenon::cloud_upload::log_level::warn, category, message)

#define CU_LOG_ERROR(category, message) \
    CU_LOG(kcenon::cloud_upload::log_level::error, category, message)

/// Debug record carrying an upload_log_context
#define CU_LOG_DEBUG_CTX(category, message, ctx) \
    kcenon::cloud_upload::get_logger().log( \
        kcenon::cloud_upload::log_level::debug, category, message, &(ctx))

}  // namespace kcenon::cloud_upload
