/**
 * @file batch_tracker.h
 * @brief Aggregates task outcomes and signals batch completion once
 */

#ifndef KCENON_CLOUD_UPLOAD_UPLOAD_BATCH_TRACKER_H
#define KCENON_CLOUD_UPLOAD_UPLOAD_BATCH_TRACKER_H

#include <kcenon/cloud_upload/core/types.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace kcenon::cloud_upload {

/**
 * @brief Batch lifecycle
 */
enum class batch_state {
    running,    ///< Tasks are in flight
    succeeded,  ///< Every task succeeded
    aborted,    ///< A fatal error stopped the batch
    empty,      ///< Nothing to upload
};

[[nodiscard]] constexpr auto to_string(batch_state state) -> const char* {
    switch (state) {
        case batch_state::running:
            return "running";
        case batch_state::succeeded:
            return "succeeded";
        case batch_state::aborted:
            return "aborted";
        case batch_state::empty:
            return "empty";
        default:
            return "unknown";
    }
}

/**
 * @brief Completion signal: no error on success, the first fatal error otherwise
 */
using completion_callback = std::function<void(const std::optional<error>&)>;

/**
 * @brief Per-batch outcome bookkeeping shared by all workers
 *
 * completed_count only grows and never exceeds total_count. Once aborted,
 * later successes and failures are ignored. signal_completion() moves the
 * batch into its terminal state and fires the callback exactly once, no
 * matter how many threads call it.
 */
class batch_tracker {
public:
    explicit batch_tracker(std::size_t total_count);

    batch_tracker(const batch_tracker&) = delete;
    batch_tracker& operator=(const batch_tracker&) = delete;

    /**
     * @brief Record a task that finished successfully
     * @return Completed count after this success (unchanged if already aborted)
     */
    auto record_success(uint64_t bytes) -> std::size_t;

    /// Record a retry that was scheduled
    void record_retry();

    /**
     * @brief Abort the batch with @p err
     * @return true if this call caused the abort, false if it was already terminal
     */
    auto abort(error err) -> bool;

    /// Lock-free check used by workers before pulling more work
    [[nodiscard]] auto is_aborted() const noexcept -> bool {
        return aborted_.load(std::memory_order_acquire);
    }

    /**
     * @brief Enter the terminal state and invoke @p callback once
     *
     * A running batch becomes succeeded when every task completed, and
     * aborted with an internal error otherwise.
     *
     * @return true if this call fired the callback
     */
    auto signal_completion(const completion_callback& callback) -> bool;

    [[nodiscard]] auto state() const -> batch_state;
    [[nodiscard]] auto total_count() const noexcept -> std::size_t { return total_count_; }
    [[nodiscard]] auto completed_count() const -> std::size_t;
    [[nodiscard]] auto total_bytes() const -> uint64_t;
    [[nodiscard]] auto retry_count() const -> std::size_t;
    [[nodiscard]] auto first_error() const -> std::optional<error>;
    [[nodiscard]] auto outcome_signaled() const -> bool;

private:
    const std::size_t total_count_;

    mutable std::mutex mutex_;
    batch_state state_;
    std::size_t completed_count_{0};
    uint64_t total_bytes_{0};
    std::size_t retry_count_{0};
    std::optional<error> first_error_;
    bool outcome_signaled_{false};

    std::atomic<bool> aborted_{false};
};

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_UPLOAD_BATCH_TRACKER_H
