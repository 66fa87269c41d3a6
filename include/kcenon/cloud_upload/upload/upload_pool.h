/**
 * @file upload_pool.h
 * @brief Bounded-parallel execution of a batch of transfer tasks
 */

#ifndef KCENON_CLOUD_UPLOAD_UPLOAD_UPLOAD_POOL_H
#define KCENON_CLOUD_UPLOAD_UPLOAD_UPLOAD_POOL_H

#include <kcenon/cloud_upload/adapters/thread_pool_adapter.h>
#include <kcenon/cloud_upload/core/types.h>
#include <kcenon/cloud_upload/upload/batch_tracker.h>
#include <kcenon/cloud_upload/upload/progress_reporter.h>
#include <kcenon/cloud_upload/upload/retry_policy.h>
#include <kcenon/cloud_upload/upload/transfer_task.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace kcenon::cloud_upload {

/**
 * @brief Performs one attempt of a task
 * @return Bytes uploaded, or the error that made the attempt fail
 */
using task_executor = std::function<result<uint64_t>(const transfer_task&)>;

/**
 * @brief Runs a batch with at most @c parallelism attempts in flight
 *
 * Workers pull tasks from a shared queue. A failed attempt goes back to the
 * queue with a due time taken from the retry_policy; it does not occupy a
 * worker while waiting. Once the batch is aborted, no new attempt starts and
 * retries still waiting are dropped. Attempts already running finish and
 * their results are ignored by the tracker.
 *
 * @code
 * upload_pool pool(adapters::upload_pool_factory::create(16), 16, retry_policy{});
 * batch_tracker tracker(tasks.size());
 * pool.run(std::move(tasks), executor, tracker, reporter);
 * tracker.signal_completion(on_complete);
 * @endcode
 */
class upload_pool {
public:
    /**
     * @param threads Thread pool the worker loops are submitted to
     * @param parallelism Maximum concurrent attempts (at least 1)
     * @param policy Retry decisions for failed attempts
     */
    upload_pool(std::shared_ptr<adapters::upload_thread_pool_interface> threads,
                std::size_t parallelism,
                retry_policy policy);

    /**
     * @brief Execute every task and block until the batch drains or aborts
     *
     * Does not signal completion; the caller does that through @p tracker
     * after this returns, so the callback never runs on a worker thread.
     */
    void run(std::vector<transfer_task> tasks,
             const task_executor& execute,
             batch_tracker& tracker,
             progress_reporter& reporter);

    [[nodiscard]] auto parallelism() const noexcept -> std::size_t { return parallelism_; }

    /// Highest number of simultaneous attempts seen by the last run()
    [[nodiscard]] auto peak_in_flight() const noexcept -> std::size_t {
        return peak_in_flight_.load(std::memory_order_relaxed);
    }

private:
    struct run_state;

    void worker_loop(run_state& state,
                     const task_executor& execute,
                     batch_tracker& tracker,
                     progress_reporter& reporter);

    std::shared_ptr<adapters::upload_thread_pool_interface> threads_;
    std::size_t parallelism_;
    retry_policy policy_;
    std::atomic<std::size_t> peak_in_flight_{0};
};

}  // namespace kcenon::cloud_upload

#endif  // KCENON_CLOUD_UPLOAD_UPLOAD_UPLOAD_POOL_H
