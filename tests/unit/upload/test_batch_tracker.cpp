/**
 * @file test_batch_tracker.cpp
 * @brief Unit tests for batch outcome tracking
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_upload/upload/batch_tracker.h>

#include <atomic>
#include <thread>
#include <vector>

namespace kcenon::cloud_upload::test {

class BatchTrackerTest : public ::testing::Test {};

TEST_F(BatchTrackerTest, InitialState) {
    batch_tracker tracker(3);
    EXPECT_EQ(tracker.state(), batch_state::running);
    EXPECT_EQ(tracker.total_count(), 3u);
    EXPECT_EQ(tracker.completed_count(), 0u);
    EXPECT_FALSE(tracker.is_aborted());
    EXPECT_FALSE(tracker.outcome_signaled());

    batch_tracker empty(0);
    EXPECT_EQ(empty.state(), batch_state::empty);
}

TEST_F(BatchTrackerTest, AllSuccessesSignalNoError) {
    batch_tracker tracker(2);
    EXPECT_EQ(tracker.record_success(100), 1u);
    EXPECT_EQ(tracker.record_success(50), 2u);
    EXPECT_EQ(tracker.total_bytes(), 150u);

    int calls = 0;
    std::optional<error> seen{error{error_code::internal_error}};
    EXPECT_TRUE(tracker.signal_completion([&](const std::optional<error>& err) {
        ++calls;
        seen = err;
    }));

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(seen.has_value());
    EXPECT_EQ(tracker.state(), batch_state::succeeded);
}

TEST_F(BatchTrackerTest, CompletedCountNeverExceedsTotal) {
    batch_tracker tracker(1);
    tracker.record_success(1);
    EXPECT_EQ(tracker.record_success(1), 1u);
    EXPECT_EQ(tracker.completed_count(), 1u);
}

TEST_F(BatchTrackerTest, FirstAbortWins) {
    batch_tracker tracker(3);
    tracker.record_success(10);

    EXPECT_TRUE(tracker.abort(error{error_code::retries_exhausted, "first"}));
    EXPECT_FALSE(tracker.abort(error{error_code::retries_exhausted, "second"}));
    EXPECT_TRUE(tracker.is_aborted());
    EXPECT_EQ(tracker.state(), batch_state::aborted);

    // Late success after abort is ignored
    EXPECT_EQ(tracker.record_success(10), 1u);
    EXPECT_EQ(tracker.total_bytes(), 10u);

    std::optional<error> seen;
    tracker.signal_completion([&](const std::optional<error>& err) { seen = err; });
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->message, "first");
    EXPECT_EQ(tracker.first_error()->message, "first");
}

TEST_F(BatchTrackerTest, IncompleteBatchSignalsInternalError) {
    batch_tracker tracker(2);
    tracker.record_success(1);

    std::optional<error> seen;
    tracker.signal_completion([&](const std::optional<error>& err) { seen = err; });
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->code, error_code::internal_error);
    EXPECT_EQ(tracker.state(), batch_state::aborted);
}

TEST_F(BatchTrackerTest, EmptyBatchSignalsSuccess) {
    batch_tracker tracker(0);
    bool called = false;
    tracker.signal_completion([&](const std::optional<error>& err) {
        called = true;
        EXPECT_FALSE(err.has_value());
    });
    EXPECT_TRUE(called);
    EXPECT_EQ(tracker.state(), batch_state::empty);
}

TEST_F(BatchTrackerTest, AbortAfterCompletionIsIgnored) {
    batch_tracker tracker(1);
    tracker.record_success(1);
    tracker.signal_completion({});
    EXPECT_FALSE(tracker.abort(error{error_code::transfer_failed}));
    EXPECT_EQ(tracker.state(), batch_state::succeeded);
}

TEST_F(BatchTrackerTest, RetriesAreCounted) {
    batch_tracker tracker(1);
    tracker.record_retry();
    tracker.record_retry();
    EXPECT_EQ(tracker.retry_count(), 2u);
}

TEST_F(BatchTrackerTest, CallbackFiresExactlyOnceAcrossThreads) {
    batch_tracker tracker(1);
    tracker.record_success(1);

    std::atomic<int> calls{0};
    std::atomic<int> winners{0};
    completion_callback callback = [&calls](const std::optional<error>&) { ++calls; };

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            if (tracker.signal_completion(callback)) {
                ++winners;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(winners.load(), 1);
    EXPECT_TRUE(tracker.outcome_signaled());
}

TEST_F(BatchTrackerTest, StateNames) {
    EXPECT_STREQ(to_string(batch_state::running), "running");
    EXPECT_STREQ(to_string(batch_state::succeeded), "succeeded");
    EXPECT_STREQ(to_string(batch_state::aborted), "aborted");
    EXPECT_STREQ(to_string(batch_state::empty), "empty");
}

}  // namespace kcenon::cloud_upload::test
