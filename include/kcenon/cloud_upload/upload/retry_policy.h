/**
 * @file retry_policy.h
 * @brief Per-task retry decisions with exponential backoff
 */

#ifndef KCENON_CLOUD_UPLOAD_UPLOAD_RETRY_POLICY_H
#define KCENON_CLOUD_UPLOAD_UPLOAD_RETRY_POLICY_H

#include <kcenon/cloud_upload/core/types.h>
#include <kcenon/cloud_upload/upload/transfer_task.h>

#include <chrono>
#include <cstdint>

namespace kcenon::cloud_upload {

/**
 * @brief Retry configuration
 */
struct retry_settings {
    /// Retries allowed after the first attempt
    uint32_t max_retries = 5;

    /// Delay unit; the n-th retry waits base_delay * 2^n
    std::chrono::milliseconds base_delay{1000};

    /// Upper bound on a single delay (0 = unbounded)
    std::chrono::milliseconds max_delay{0};

    /// Scale each delay by a random factor in [0.5, 1.5)
    bool use_jitter = false;
};

/**
 * @brief Outcome of a failed attempt
 */
struct retry_decision {
    bool retry = false;                      ///< Task should be re-enqueued
    std::chrono::milliseconds delay{0};      ///< Wait before it becomes eligible again
    error terminal_error;                    ///< Set when retry is false
};

/**
 * @brief Decides whether a failed task is retried
 *
 * Every failure is treated as retryable until the task has used all of its
 * retries; there is no classification by cause.
 */
class retry_policy {
public:
    explicit retry_policy(retry_settings settings = {});

    /**
     * @brief Record a failed attempt of @p task
     *
     * When retries remain, increments task.attempt and returns the backoff
     * delay for that attempt. Otherwise leaves the task untouched and returns
     * a retries_exhausted error naming the file.
     */
    [[nodiscard]] auto on_failure(transfer_task& task, const error& cause) const
        -> retry_decision;

    /**
     * @brief Delay before retry number @p attempt (1-based), without jitter
     */
    [[nodiscard]] auto backoff_delay(uint32_t attempt) const -> std::chrono::milliseconds;

    [[nodiscard]] auto settings() const -> const retry_settings& { return settings_; }

private:
    retry_settings settings_;
};

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_UPLOAD_RETRY_POLICY_H
