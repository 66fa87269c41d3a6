/**
 * @file progress_reporter.h
 * @brief Renders upload events as human-readable progress lines
 */

#ifndef KCENON_CLOUD_UPLOAD_UPLOAD_PROGRESS_REPORTER_H
#define KCENON_CLOUD_UPLOAD_UPLOAD_PROGRESS_REPORTER_H

#include <kcenon/cloud_upload/core/types.h>
#include <kcenon/cloud_upload/upload/transfer_task.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace kcenon::cloud_upload {

/**
 * @brief Receives one rendered progress line at a time
 *
 * Invoked from worker threads, one call at a time: the reporter holds its
 * sink lock for the duration of the call, so a slow sink delays every worker
 * that reports next. The sink must not call back into the uploader or the
 * reporter that invoked it.
 */
using progress_callback = std::function<void(const std::string&)>;

/**
 * @brief Observer turning batch and task events into text
 *
 * Calls into the sink are serialized. An exception thrown by the sink is
 * logged and dropped so reporting can never change the batch outcome.
 *
 * Example output:
 * @code
 * Uploading 3 files to GCS bucket 'survey-results'...
 * [33%] Uploaded orthophoto.tif (12.40 MB in 1.8s, 6.89 MB/s)
 * Retrying dsm.tif (attempt 1/5) in 2s...
 * @endcode
 */
class progress_reporter {
public:
    /**
     * @param sink Destination for rendered lines (may be empty)
     * @param provider Storage label used in messages, e.g. "GCS"
     * @param bucket Bucket name used in messages
     */
    progress_reporter(progress_callback sink, std::string provider, std::string bucket);

    void batch_started(std::size_t total_files);
    void batch_empty();
    void task_started(const transfer_task& task, uint64_t bytes);
    void task_succeeded(const transfer_task& task,
                        uint64_t bytes,
                        std::chrono::steady_clock::duration elapsed,
                        std::size_t completed,
                        std::size_t total);
    void retry_scheduled(const transfer_task& task,
                         uint32_t max_retries,
                         std::chrono::milliseconds delay);
    void batch_succeeded(std::size_t total_files);
    void batch_failed(const error& err);
    void cleanup_started();
    void cleanup_finished();

    /// Render a byte count as megabytes with two decimals
    [[nodiscard]] static auto format_megabytes(uint64_t bytes) -> std::string;

    /// Render a delay as seconds ("2" for 2000ms, "0.005" for 5ms)
    [[nodiscard]] static auto format_delay_seconds(std::chrono::milliseconds delay)
        -> std::string;

private:
    void emit(const std::string& line);

    progress_callback sink_;
    std::string provider_;
    std::string bucket_;
    std::mutex sink_mutex_;
};

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_UPLOAD_PROGRESS_REPORTER_H
