/**
 * @file batch_tracker.cpp
 * @brief Implementation of batch outcome bookkeeping
 */

#include <kcenon/cloud_upload/upload/batch_tracker.h>
#include <kcenon/cloud_upload/core/logging.h>

namespace kcenon::cloud_upload {

batch_tracker::batch_tracker(std::size_t total_count)
    : total_count_(total_count),
      state_(total_count == 0 ? batch_state::empty : batch_state::running) {}

auto batch_tracker::record_success(uint64_t bytes) -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != batch_state::running || completed_count_ >= total_count_) {
        return completed_count_;
    }
    ++completed_count_;
    total_bytes_ += bytes;
    return completed_count_;
}

void batch_tracker::record_retry() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++retry_count_;
}

auto batch_tracker::abort(error err) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != batch_state::running) {
        CU_LOG_DEBUG(log_category::uploader,
                     "Ignoring failure after batch ended: " + err.message);
        return false;
    }
    state_ = batch_state::aborted;
    first_error_ = std::move(err);
    aborted_.store(true, std::memory_order_release);
    return true;
}

auto batch_tracker::signal_completion(const completion_callback& callback) -> bool {
    std::optional<error> outcome;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outcome_signaled_) {
            return false;
        }
        outcome_signaled_ = true;

        if (state_ == batch_state::running) {
            if (completed_count_ == total_count_) {
                state_ = batch_state::succeeded;
            } else {
                state_ = batch_state::aborted;
                first_error_ = error{error_code::internal_error,
                                     "Batch ended with " + std::to_string(completed_count_) +
                                         " of " + std::to_string(total_count_) +
                                         " files uploaded"};
                aborted_.store(true, std::memory_order_release);
            }
        }
        outcome = first_error_;
    }

    if (callback) {
        callback(outcome);
    }
    return true;
}

auto batch_tracker::state() const -> batch_state {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

auto batch_tracker::completed_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_count_;
}

auto batch_tracker::total_bytes() const -> uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_bytes_;
}

auto batch_tracker::retry_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return retry_count_;
}

auto batch_tracker::first_error() const -> std::optional<error> {
    std::lock_guard<std::mutex> lock(mutex_);
    return first_error_;
}

auto batch_tracker::outcome_signaled() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcome_signaled_;
}

}  // namespace kcenon::cloud_upload
