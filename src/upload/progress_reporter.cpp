/**
 * @file progress_reporter.cpp
 * @brief Implementation of progress line rendering
 */

#include <kcenon/cloud_upload/upload/progress_reporter.h>
#include <kcenon/cloud_upload/core/logging.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <sstream>

namespace kcenon::cloud_upload {

progress_reporter::progress_reporter(progress_callback sink,
                                     std::string provider,
                                     std::string bucket)
    : sink_(std::move(sink)), provider_(std::move(provider)), bucket_(std::move(bucket)) {}

auto progress_reporter::format_megabytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << static_cast<double>(bytes) / static_cast<double>(mebibyte);
    return oss.str();
}

auto progress_reporter::format_delay_seconds(std::chrono::milliseconds delay) -> std::string {
    if (delay.count() % 1000 == 0) {
        return std::to_string(delay.count() / 1000);
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << static_cast<double>(delay.count()) / 1000.0;
    return oss.str();
}

void progress_reporter::emit(const std::string& line) {
    CU_LOG_DEBUG(log_category::progress, line);

    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (!sink_) {
        return;
    }
    try {
        sink_(line);
    } catch (const std::exception& e) {
        CU_LOG_WARN(log_category::progress,
                    std::string("Progress sink failed: ") + e.what());
    }
}

void progress_reporter::batch_started(std::size_t total_files) {
    emit("Uploading " + std::to_string(total_files) + " files to " + provider_ + " bucket '" +
         bucket_ + "'...");
}

void progress_reporter::batch_empty() {
    emit("No files to upload to " + provider_);
}

void progress_reporter::task_started(const transfer_task& task, uint64_t bytes) {
    upload_log_context ctx;
    ctx.bucket = bucket_;
    ctx.object_key = task.destination_key;
    ctx.relative_path = task.relative_path;
    ctx.file_size = bytes;
    ctx.attempt = task.attempt;
    CU_LOG_DEBUG_CTX(log_category::progress,
                     "Uploading " + task.source_path.string() + " --> " + bucket_ + "/" +
                         task.destination_key + " (" + format_megabytes(bytes) + " MB)",
                     ctx);
}

void progress_reporter::task_succeeded(const transfer_task& task,
                                       uint64_t bytes,
                                       std::chrono::steady_clock::duration elapsed,
                                       std::size_t completed,
                                       std::size_t total) {
    const double seconds = std::chrono::duration<double>(elapsed).count();
    const double megabytes = static_cast<double>(bytes) / static_cast<double>(mebibyte);
    const double rate = megabytes / std::max(seconds, 0.001);
    const auto percent = total == 0
        ? 100L
        : std::lround(static_cast<double>(completed) * 100.0 / static_cast<double>(total));

    std::ostringstream oss;
    oss << "[" << percent << "%] Uploaded " << task.display_name() << " ("
        << format_megabytes(bytes) << " MB in " << std::fixed << std::setprecision(1) << seconds
        << "s, " << std::setprecision(2) << rate << " MB/s)";
    emit(oss.str());
}

void progress_reporter::retry_scheduled(const transfer_task& task,
                                        uint32_t max_retries,
                                        std::chrono::milliseconds delay) {
    emit("Retrying " + task.display_name() + " (attempt " + std::to_string(task.attempt) + "/" +
         std::to_string(max_retries) + ") in " + format_delay_seconds(delay) + "s...");
}

void progress_reporter::batch_succeeded(std::size_t total_files) {
    emit("Successfully uploaded " + std::to_string(total_files) + " files to " + provider_ + "!");
}

void progress_reporter::batch_failed(const error& err) {
    emit("Upload to " + provider_ + " failed: " + err.message);
}

void progress_reporter::cleanup_started() {
    emit("Cleaning up local files after " + provider_ + " upload...");
}

void progress_reporter::cleanup_finished() {
    emit("Local cleanup completed");
}

}  // namespace kcenon::cloud_upload
