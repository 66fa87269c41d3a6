/**
 * @file test_upload_pool.cpp
 * @brief Unit tests for bounded-parallel task execution
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_upload/core/logging.h>
#include <kcenon/cloud_upload/upload/upload_pool.h>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

namespace kcenon::cloud_upload::test {

using namespace std::chrono_literals;

namespace {

auto make_tasks(std::size_t count) -> std::vector<transfer_task> {
    std::vector<transfer_task> tasks;
    for (std::size_t i = 0; i < count; ++i) {
        transfer_task task;
        task.relative_path = "file_" + std::to_string(i) + ".bin";
        task.source_path = "/data/" + task.relative_path;
        task.destination_key = "out/" + task.relative_path;
        tasks.push_back(std::move(task));
    }
    return tasks;
}

auto fast_retries(uint32_t max_retries = 5) -> retry_policy {
    retry_settings settings;
    settings.max_retries = max_retries;
    settings.base_delay = 1ms;
    return retry_policy(settings);
}

}  // namespace

class UploadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_console_output(false);
        threads_ = std::make_shared<adapters::async_upload_pool>(16);
    }

    void TearDown() override {
        get_logger().set_console_output(true);
    }

    auto make_reporter() -> progress_reporter {
        return progress_reporter(
            [this](const std::string& line) {
                std::lock_guard<std::mutex> lock(lines_mutex_);
                lines_.push_back(line);
            },
            "GCS", "survey-results");
    }

    auto count_lines(const std::string& needle) -> std::size_t {
        std::lock_guard<std::mutex> lock(lines_mutex_);
        std::size_t count = 0;
        for (const auto& line : lines_) {
            if (line.find(needle) != std::string::npos) {
                ++count;
            }
        }
        return count;
    }

    std::shared_ptr<adapters::upload_thread_pool_interface> threads_;
    std::mutex lines_mutex_;
    std::vector<std::string> lines_;
};

TEST_F(UploadPoolTest, ParallelismIsAtLeastOne) {
    upload_pool pool(threads_, 0, fast_retries());
    EXPECT_EQ(pool.parallelism(), 1u);
}

TEST_F(UploadPoolTest, CreatesItsOwnThreadsWhenNoneGiven) {
    upload_pool pool(nullptr, 2, fast_retries());
    batch_tracker tracker(3);
    auto reporter = make_reporter();

    pool.run(make_tasks(3), [](const transfer_task&) -> result<uint64_t> { return 1; },
             tracker, reporter);
    EXPECT_EQ(tracker.completed_count(), 3u);
}

TEST_F(UploadPoolTest, RunsEveryTaskOnce) {
    upload_pool pool(threads_, 4, fast_retries());
    batch_tracker tracker(20);
    auto reporter = make_reporter();

    std::mutex mutex;
    std::multiset<std::string> seen;
    pool.run(make_tasks(20),
             [&](const transfer_task& task) -> result<uint64_t> {
                 std::lock_guard<std::mutex> lock(mutex);
                 seen.insert(task.destination_key);
                 return 10;
             },
             tracker, reporter);

    EXPECT_EQ(seen.size(), 20u);
    for (const auto& key : seen) {
        EXPECT_EQ(seen.count(key), 1u);
    }
    EXPECT_EQ(tracker.completed_count(), 20u);
    EXPECT_EQ(tracker.total_bytes(), 200u);
    EXPECT_FALSE(tracker.is_aborted());
    EXPECT_EQ(count_lines("Uploaded "), 20u);
    EXPECT_EQ(count_lines("[100%]"), 1u);
}

TEST_F(UploadPoolTest, NeverExceedsParallelism) {
    upload_pool pool(threads_, 3, fast_retries());
    batch_tracker tracker(12);
    auto reporter = make_reporter();

    std::atomic<int> current{0};
    std::atomic<int> observed_max{0};
    pool.run(make_tasks(12),
             [&](const transfer_task&) -> result<uint64_t> {
                 int now = ++current;
                 int prev = observed_max.load();
                 while (now > prev && !observed_max.compare_exchange_weak(prev, now)) {
                 }
                 std::this_thread::sleep_for(20ms);
                 --current;
                 return 1;
             },
             tracker, reporter);

    EXPECT_LE(observed_max.load(), 3);
    EXPECT_LE(pool.peak_in_flight(), 3u);
    EXPECT_GE(pool.peak_in_flight(), 2u);
    EXPECT_EQ(tracker.completed_count(), 12u);
}

TEST_F(UploadPoolTest, WorkersCappedBySmallerThreadPool) {
    auto two_threads = std::make_shared<adapters::async_upload_pool>(2);
    upload_pool pool(two_threads, 8, fast_retries());
    batch_tracker tracker(10);
    auto reporter = make_reporter();

    pool.run(make_tasks(10),
             [](const transfer_task&) -> result<uint64_t> {
                 std::this_thread::sleep_for(10ms);
                 return 1;
             },
             tracker, reporter);

    EXPECT_EQ(tracker.completed_count(), 10u);
    EXPECT_LE(pool.peak_in_flight(), 2u);
}

TEST_F(UploadPoolTest, FailedTaskIsRetriedThenSucceeds) {
    upload_pool pool(threads_, 2, fast_retries());
    batch_tracker tracker(3);
    auto reporter = make_reporter();

    std::mutex mutex;
    std::map<std::string, int> attempts;
    std::vector<uint32_t> attempt_numbers;
    pool.run(make_tasks(3),
             [&](const transfer_task& task) -> result<uint64_t> {
                 std::lock_guard<std::mutex> lock(mutex);
                 int n = ++attempts[task.relative_path];
                 if (task.relative_path == "file_1.bin") {
                     attempt_numbers.push_back(task.attempt);
                     if (n <= 2) {
                         return unexpected{error{error_code::transfer_failed, "HTTP 503"}};
                     }
                 }
                 return 5;
             },
             tracker, reporter);

    EXPECT_EQ(attempts["file_0.bin"], 1);
    EXPECT_EQ(attempts["file_1.bin"], 3);
    EXPECT_EQ(attempts["file_2.bin"], 1);
    EXPECT_EQ(attempt_numbers, (std::vector<uint32_t>{0, 1, 2}));
    EXPECT_EQ(tracker.completed_count(), 3u);
    EXPECT_EQ(tracker.retry_count(), 2u);
    EXPECT_FALSE(tracker.is_aborted());
    EXPECT_EQ(count_lines("Retrying file_1.bin (attempt 1/5)"), 1u);
    EXPECT_EQ(count_lines("Retrying file_1.bin (attempt 2/5)"), 1u);
}

TEST_F(UploadPoolTest, RetryDoesNotBlockOtherTasks) {
    retry_settings settings;
    settings.max_retries = 1;
    settings.base_delay = 100ms;  // first retry waits 200ms
    upload_pool pool(threads_, 1, retry_policy(settings));
    batch_tracker tracker(4);
    auto reporter = make_reporter();

    std::mutex mutex;
    std::vector<std::string> order;
    bool failed_once = false;
    pool.run(make_tasks(4),
             [&](const transfer_task& task) -> result<uint64_t> {
                 std::lock_guard<std::mutex> lock(mutex);
                 order.push_back(task.relative_path);
                 if (task.relative_path == "file_0.bin" && !failed_once) {
                     failed_once = true;
                     return unexpected{error{error_code::transfer_failed, "timeout"}};
                 }
                 return 1;
             },
             tracker, reporter);

    // With a single worker the delayed retry runs after the remaining tasks
    std::vector<std::string> expected = {"file_0.bin", "file_1.bin", "file_2.bin", "file_3.bin",
                                         "file_0.bin"};
    EXPECT_EQ(order, expected);
    EXPECT_EQ(tracker.completed_count(), 4u);
}

TEST_F(UploadPoolTest, ExhaustedRetriesAbortTheBatch) {
    upload_pool pool(threads_, 1, fast_retries(5));
    batch_tracker tracker(5);
    auto reporter = make_reporter();

    std::mutex mutex;
    std::map<std::string, int> attempts;
    pool.run(make_tasks(5),
             [&](const transfer_task& task) -> result<uint64_t> {
                 std::lock_guard<std::mutex> lock(mutex);
                 ++attempts[task.relative_path];
                 if (task.relative_path == "file_0.bin") {
                     return unexpected{error{error_code::transfer_failed, "HTTP 500"}};
                 }
                 return 1;
             },
             tracker, reporter);

    EXPECT_TRUE(tracker.is_aborted());
    EXPECT_EQ(attempts["file_0.bin"], 6);
    EXPECT_EQ(tracker.retry_count(), 5u);

    auto err = tracker.first_error();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, error_code::retries_exhausted);
    EXPECT_NE(err->message.find("file_0.bin"), std::string::npos);
}

TEST_F(UploadPoolTest, NothingIsDispatchedAfterAbort) {
    upload_pool pool(threads_, 1, fast_retries(0));
    batch_tracker tracker(10);
    auto reporter = make_reporter();

    std::atomic<int> executed{0};
    pool.run(make_tasks(10),
             [&](const transfer_task& task) -> result<uint64_t> {
                 ++executed;
                 if (task.relative_path == "file_2.bin") {
                     return unexpected{error{error_code::upload_rejected, "HTTP 400"}};
                 }
                 return 1;
             },
             tracker, reporter);

    EXPECT_TRUE(tracker.is_aborted());
    EXPECT_EQ(executed.load(), 3);
    EXPECT_EQ(tracker.completed_count(), 2u);
}

TEST_F(UploadPoolTest, LateResultsAfterAbortAreIgnored) {
    upload_pool pool(threads_, 2, fast_retries(0));
    batch_tracker tracker(2);
    auto reporter = make_reporter();

    pool.run(make_tasks(2),
             [&](const transfer_task& task) -> result<uint64_t> {
                 if (task.relative_path == "file_0.bin") {
                     return unexpected{error{error_code::transfer_failed, "boom"}};
                 }
                 std::this_thread::sleep_for(50ms);
                 return 1;
             },
             tracker, reporter);

    EXPECT_TRUE(tracker.is_aborted());
    EXPECT_EQ(tracker.completed_count(), 0u);
    EXPECT_EQ(count_lines("Uploaded "), 0u);
}

TEST_F(UploadPoolTest, ExecutorExceptionCountsAsFailure) {
    upload_pool pool(threads_, 1, fast_retries(1));
    batch_tracker tracker(1);
    auto reporter = make_reporter();

    std::atomic<int> calls{0};
    pool.run(make_tasks(1),
             [&](const transfer_task&) -> result<uint64_t> {
                 if (++calls == 1) {
                     throw std::runtime_error("disk vanished");
                 }
                 return 1;
             },
             tracker, reporter);

    EXPECT_EQ(calls.load(), 2);
    EXPECT_FALSE(tracker.is_aborted());
    EXPECT_EQ(tracker.completed_count(), 1u);
}

TEST_F(UploadPoolTest, EmptyBatchReturnsImmediately) {
    upload_pool pool(threads_, 4, fast_retries());
    batch_tracker tracker(0);
    auto reporter = make_reporter();

    bool called = false;
    pool.run({}, [&](const transfer_task&) -> result<uint64_t> {
        called = true;
        return 0;
    }, tracker, reporter);

    EXPECT_FALSE(called);
    EXPECT_EQ(pool.peak_in_flight(), 0u);
}

}  // namespace kcenon::cloud_upload::test
