/**
 * @file retry_policy.cpp
 * @brief Implementation of the per-task retry policy
 */

#include <kcenon/cloud_upload/upload/retry_policy.h>
#include <kcenon/cloud_upload/core/logging.h>

#include <algorithm>
#include <random>

namespace kcenon::cloud_upload {

namespace {

// 2^30 * base is already far beyond any sensible delay
constexpr uint32_t MAX_BACKOFF_SHIFT = 30;

}  // namespace

retry_policy::retry_policy(retry_settings settings) : settings_(settings) {}

auto retry_policy::backoff_delay(uint32_t attempt) const -> std::chrono::milliseconds {
    const auto shift = std::min(attempt, MAX_BACKOFF_SHIFT);
    auto delay = settings_.base_delay * (int64_t{1} << shift);

    if (settings_.max_delay.count() > 0) {
        delay = std::min(delay, settings_.max_delay);
    }
    return delay;
}

auto retry_policy::on_failure(transfer_task& task, const error& cause) const -> retry_decision {
    retry_decision decision;

    if (task.attempt >= settings_.max_retries) {
        decision.retry = false;
        decision.terminal_error =
            error{error_code::retries_exhausted,
                  "Failed to upload " + task.relative_path + " after " +
                      std::to_string(settings_.max_retries) + " retries: " + cause.message};
        return decision;
    }

    ++task.attempt;
    auto delay = backoff_delay(task.attempt);

    if (settings_.use_jitter) {
        thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_real_distribution<> dis(0.5, 1.5);
        delay = std::chrono::milliseconds(
            static_cast<int64_t>(static_cast<double>(delay.count()) * dis(gen)));
    }

    CU_LOG_DEBUG(log_category::retry,
                 "Scheduling retry " + std::to_string(task.attempt) + "/" +
                     std::to_string(settings_.max_retries) + " of " + task.relative_path +
                     " in " + std::to_string(delay.count()) + "ms: " + cause.message);

    decision.retry = true;
    decision.delay = delay;
    return decision;
}

}  // namespace kcenon::cloud_upload
