/**
 * @file test_progress_reporter.cpp
 * @brief Unit tests for progress line rendering
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_upload/core/logging.h>
#include <kcenon/cloud_upload/upload/progress_reporter.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::cloud_upload::test {

using namespace std::chrono_literals;

class ProgressReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_console_output(false);
    }

    void TearDown() override {
        get_logger().set_console_output(true);
    }

    auto make_reporter() -> progress_reporter {
        return progress_reporter([this](const std::string& line) { lines_.push_back(line); },
                                 "GCS", "survey-results");
    }

    static auto make_task(const std::string& relative) -> transfer_task {
        transfer_task task;
        task.source_path = "/data/task-42/" + relative;
        task.relative_path = relative;
        task.destination_key = "task-42/" + relative;
        return task;
    }

    std::vector<std::string> lines_;
};

TEST_F(ProgressReporterTest, BatchLifecycleMessages) {
    auto reporter = make_reporter();
    reporter.batch_started(3);
    reporter.batch_succeeded(3);
    reporter.batch_failed(error{error_code::retries_exhausted, "Failed to upload a.tif"});
    reporter.batch_empty();

    ASSERT_EQ(lines_.size(), 4u);
    EXPECT_EQ(lines_[0], "Uploading 3 files to GCS bucket 'survey-results'...");
    EXPECT_EQ(lines_[1], "Successfully uploaded 3 files to GCS!");
    EXPECT_EQ(lines_[2], "Upload to GCS failed: Failed to upload a.tif");
    EXPECT_EQ(lines_[3], "No files to upload to GCS");
}

TEST_F(ProgressReporterTest, TaskSuccessShowsPercentSizeAndRate) {
    auto reporter = make_reporter();
    reporter.task_succeeded(make_task("odm_orthophoto/odm_orthophoto.tif"), 13002342, 1800ms, 1,
                            3);

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(lines_[0], "[33%] Uploaded odm_orthophoto.tif (12.40 MB in 1.8s, 6.89 MB/s)");
}

TEST_F(ProgressReporterTest, PercentReachesHundred) {
    auto reporter = make_reporter();
    reporter.task_succeeded(make_task("a.txt"), 1, 1ms, 2, 2);
    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(lines_[0].rfind("[100%] Uploaded a.txt", 0), 0u);
}

TEST_F(ProgressReporterTest, RetryMessage) {
    auto reporter = make_reporter();
    auto task = make_task("odm_dem/dsm.tif");
    task.attempt = 1;
    reporter.retry_scheduled(task, 5, 2000ms);

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(lines_[0], "Retrying dsm.tif (attempt 1/5) in 2s...");
}

TEST_F(ProgressReporterTest, CleanupMessages) {
    auto reporter = make_reporter();
    reporter.cleanup_started();
    reporter.cleanup_finished();

    ASSERT_EQ(lines_.size(), 2u);
    EXPECT_EQ(lines_[0], "Cleaning up local files after GCS upload...");
    EXPECT_EQ(lines_[1], "Local cleanup completed");
}

TEST_F(ProgressReporterTest, TaskStartedOnlyLogs) {
    auto reporter = make_reporter();
    reporter.task_started(make_task("a.txt"), 10);
    EXPECT_TRUE(lines_.empty());
}

TEST_F(ProgressReporterTest, Formatting) {
    EXPECT_EQ(progress_reporter::format_megabytes(0), "0.00");
    EXPECT_EQ(progress_reporter::format_megabytes(mebibyte), "1.00");
    EXPECT_EQ(progress_reporter::format_megabytes(13002342), "12.40");

    EXPECT_EQ(progress_reporter::format_delay_seconds(2000ms), "2");
    EXPECT_EQ(progress_reporter::format_delay_seconds(32000ms), "32");
    EXPECT_EQ(progress_reporter::format_delay_seconds(5ms), "0.005");
}

TEST_F(ProgressReporterTest, EmptySinkIsAllowed) {
    progress_reporter reporter({}, "GCS", "b");
    reporter.batch_started(1);
    reporter.batch_succeeded(1);
    SUCCEED();
}

TEST_F(ProgressReporterTest, ThrowingSinkDoesNotPropagate) {
    int calls = 0;
    progress_reporter reporter(
        [&calls](const std::string&) {
            ++calls;
            throw std::runtime_error("terminal closed");
        },
        "GCS", "b");

    EXPECT_NO_THROW(reporter.batch_started(1));
    EXPECT_NO_THROW(reporter.batch_succeeded(1));
    EXPECT_EQ(calls, 2);
}

TEST_F(ProgressReporterTest, ConcurrentEmitsAreSerialized) {
    std::vector<std::string> lines;
    progress_reporter reporter([&lines](const std::string& line) { lines.push_back(line); },
                               "GCS", "b");

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&reporter, t]() {
            for (int i = 0; i < 50; ++i) {
                reporter.task_succeeded(make_task("f" + std::to_string(t) + ".bin"), 1, 1ms, 1, 1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(lines.size(), 400u);
}

TEST_F(ProgressReporterTest, SinkIsNeverEnteredConcurrently) {
    std::atomic<int> inside{0};
    std::atomic<int> peak{0};
    progress_reporter reporter(
        [&inside, &peak](const std::string&) {
            auto now = inside.fetch_add(1) + 1;
            auto seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(1ms);
            inside.fetch_sub(1);
        },
        "GCS", "b");

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&reporter]() {
            for (int i = 0; i < 10; ++i) {
                reporter.batch_empty();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(peak.load(), 1);
}

}  // namespace kcenon::cloud_upload::test
