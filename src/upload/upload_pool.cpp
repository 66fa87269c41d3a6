/**
 * @file upload_pool.cpp
 * @brief Worker loops, delayed retries and abort handling
 */

#include <kcenon/cloud_upload/upload/upload_pool.h>
#include <kcenon/cloud_upload/core/logging.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <optional>

namespace kcenon::cloud_upload {

using clock_type = std::chrono::steady_clock;

struct upload_pool::run_state {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<transfer_task> ready;
    std::multimap<clock_type::time_point, transfer_task> delayed;
    std::size_t in_flight = 0;

    /// Move retries whose delay has elapsed to the ready queue
    void promote_due(clock_type::time_point now) {
        auto it = delayed.begin();
        while (it != delayed.end() && it->first <= now) {
            ready.push_back(std::move(it->second));
            it = delayed.erase(it);
        }
    }
};

upload_pool::upload_pool(std::shared_ptr<adapters::upload_thread_pool_interface> threads,
                         std::size_t parallelism,
                         retry_policy policy)
    : threads_(std::move(threads)),
      parallelism_(std::max<std::size_t>(parallelism, 1)),
      policy_(std::move(policy)) {
    if (!threads_) {
        threads_ = adapters::upload_pool_factory::create(parallelism_, "cloud_upload_pool");
    }
}

void upload_pool::run(std::vector<transfer_task> tasks,
                      const task_executor& execute,
                      batch_tracker& tracker,
                      progress_reporter& reporter) {
    peak_in_flight_.store(0, std::memory_order_relaxed);
    if (tasks.empty()) {
        return;
    }

    run_state state;
    for (auto& task : tasks) {
        state.ready.push_back(std::move(task));
    }

    auto workers = std::min(parallelism_, state.ready.size());
    if (threads_->worker_count() < workers) {
        CU_LOG_WARN(log_category::pool,
                    "Thread pool has " + std::to_string(threads_->worker_count()) +
                        " threads, fewer than the requested parallelism " +
                        std::to_string(parallelism_));
        workers = std::max<std::size_t>(threads_->worker_count(), 1);
    }
    CU_LOG_DEBUG(log_category::pool,
                 "Starting " + std::to_string(workers) + " upload workers for " +
                     std::to_string(state.ready.size()) + " files");

    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        futures.push_back(threads_->submit(
            [this, &state, &execute, &tracker, &reporter]() {
                worker_loop(state, execute, tracker, reporter);
            }));
    }

    for (auto& future : futures) {
        try {
            future.get();
        } catch (const std::exception& e) {
            CU_LOG_ERROR(log_category::pool, std::string("Upload worker failed: ") + e.what());
            tracker.abort(error{error_code::internal_error,
                                std::string("Upload worker failed: ") + e.what()});
        }
    }
}

void upload_pool::worker_loop(run_state& state,
                              const task_executor& execute,
                              batch_tracker& tracker,
                              progress_reporter& reporter) {
    std::unique_lock<std::mutex> lock(state.mutex);

    while (!tracker.is_aborted()) {
        state.promote_due(clock_type::now());

        if (state.ready.empty()) {
            if (state.delayed.empty() && state.in_flight == 0) {
                break;
            }
            if (state.delayed.empty()) {
                state.cv.wait(lock);
            } else {
                state.cv.wait_until(lock, state.delayed.begin()->first);
            }
            continue;
        }

        transfer_task task = std::move(state.ready.front());
        state.ready.pop_front();
        ++state.in_flight;

        auto peak = peak_in_flight_.load(std::memory_order_relaxed);
        while (state.in_flight > peak &&
               !peak_in_flight_.compare_exchange_weak(peak, state.in_flight,
                                                      std::memory_order_relaxed)) {
        }

        lock.unlock();

        const auto started = clock_type::now();
        result<uint64_t> outcome;
        try {
            outcome = execute(task);
        } catch (const std::exception& e) {
            outcome = unexpected{error{error_code::internal_error,
                                       std::string("Unexpected exception: ") + e.what()}};
        }

        std::optional<std::pair<clock_type::time_point, transfer_task>> retry;
        if (outcome) {
            auto completed = tracker.record_success(outcome.value());
            if (!tracker.is_aborted()) {
                reporter.task_succeeded(task, outcome.value(), clock_type::now() - started,
                                        completed, tracker.total_count());
            }
        } else if (!tracker.is_aborted()) {
            CU_LOG_WARN(log_category::pool,
                        "Upload of " + task.relative_path + " failed: " + outcome.error().message);
            auto decision = policy_.on_failure(task, outcome.error());
            if (decision.retry) {
                tracker.record_retry();
                reporter.retry_scheduled(task, policy_.settings().max_retries, decision.delay);
                retry.emplace(clock_type::now() + decision.delay, std::move(task));
            } else if (tracker.abort(decision.terminal_error)) {
                CU_LOG_ERROR(log_category::pool, decision.terminal_error.message);
            }
        }

        lock.lock();
        --state.in_flight;
        if (retry) {
            state.delayed.emplace(std::move(retry->first), std::move(retry->second));
        }
        state.cv.notify_all();
    }

    // Wake peers blocked on the queue so they observe the abort or the drain.
    state.cv.notify_all();
}

}  // namespace kcenon::cloud_upload
