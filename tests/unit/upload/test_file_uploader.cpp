/**
 * @file test_file_uploader.cpp
 * @brief Unit tests for single file uploads
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_upload/core/checksum.h>
#include <kcenon/cloud_upload/upload/file_uploader.h>

#include "test_fixtures.h"

#include <cstring>

namespace kcenon::cloud_upload::test {

class FileUploaderTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        get_logger().set_console_output(false);
        store_ = std::make_shared<mock_object_store>();
    }

    void TearDown() override {
        get_logger().set_console_output(true);
        TempDirectoryFixture::TearDown();
    }

    auto task_for(const std::string& relative) -> transfer_task {
        transfer_task task;
        task.source_path = test_dir_ / relative;
        task.relative_path = relative;
        task.destination_key = "task-42/" + relative;
        return task;
    }

    std::shared_ptr<mock_object_store> store_;
};

TEST_F(FileUploaderTest, OptionsDependOnSize) {
    file_uploader uploader(store_);

    auto small = uploader.options_for("a.txt", 5 * mebibyte);
    EXPECT_FALSE(small.resumable);
    EXPECT_FALSE(small.chunk_size.has_value());
    EXPECT_EQ(small.content_type, "text/plain");

    auto medium = uploader.options_for("dsm.tif", 5 * mebibyte + 1);
    EXPECT_TRUE(medium.resumable);
    EXPECT_FALSE(medium.chunk_size.has_value());
    EXPECT_EQ(medium.content_type, "image/tiff");

    auto large = uploader.options_for("cloud.laz", 10 * mebibyte + 1);
    EXPECT_TRUE(large.resumable);
    ASSERT_TRUE(large.chunk_size.has_value());
    EXPECT_EQ(*large.chunk_size, 10 * mebibyte);
    EXPECT_EQ(large.checksum_algorithm, "crc32c");
}

TEST_F(FileUploaderTest, SmallFileUsesSimpleUploadWithCrc32c) {
    create_text_file("report.txt", "123456789");

    file_uploader uploader(store_);
    auto put = uploader.upload(task_for("report.txt"));
    ASSERT_TRUE(put.has_value()) << put.error().message;
    EXPECT_EQ(put.value().bytes, 9u);

    auto objects = store_->objects();
    ASSERT_EQ(objects.count("task-42/report.txt"), 1u);
    const auto& stored = objects.at("task-42/report.txt");
    EXPECT_EQ(stored.content, "123456789");
    EXPECT_FALSE(stored.options.resumable);
    ASSERT_TRUE(stored.options.crc32c.has_value());
    EXPECT_EQ(*stored.options.crc32c, 0xE3069283u);
}

TEST_F(FileUploaderTest, LargeFileIsResumableAndChunked) {
    create_test_file("odm_georeferencing/cloud.laz", 12 * mebibyte);

    file_uploader uploader(store_);
    auto put = uploader.upload(task_for("odm_georeferencing/cloud.laz"));
    ASSERT_TRUE(put.has_value()) << put.error().message;
    EXPECT_TRUE(put.value().resumable);

    const auto stored = store_->objects().at("task-42/odm_georeferencing/cloud.laz");
    EXPECT_EQ(stored.content.size(), 12 * mebibyte);
    EXPECT_TRUE(stored.options.resumable);
    ASSERT_TRUE(stored.options.chunk_size.has_value());
    EXPECT_EQ(*stored.options.chunk_size, 10 * mebibyte);

    std::vector<std::byte> bytes(stored.content.size());
    std::memcpy(bytes.data(), stored.content.data(), stored.content.size());
    EXPECT_EQ(*stored.options.crc32c, checksum::crc32c(bytes));
}

TEST_F(FileUploaderTest, CustomThresholds) {
    create_test_file("a.bin", 2048);

    transfer_settings settings;
    settings.resumable_threshold = 1024;
    settings.chunk_threshold = 4096;
    settings.checksum_algorithm = "none";
    file_uploader uploader(store_, settings);

    ASSERT_TRUE(uploader.upload(task_for("a.bin")).has_value());
    const auto stored = store_->objects().at("task-42/a.bin");
    EXPECT_TRUE(stored.options.resumable);
    EXPECT_FALSE(stored.options.chunk_size.has_value());
    EXPECT_FALSE(stored.options.crc32c.has_value());
    EXPECT_FALSE(stored.options.md5.has_value());
}

TEST_F(FileUploaderTest, MissingFile) {
    file_uploader uploader(store_);
    auto put = uploader.upload(task_for("vanished.tif"));
    ASSERT_FALSE(put.has_value());
    EXPECT_EQ(put.error().code, error_code::file_not_found);
    EXPECT_EQ(store_->total_attempts(), 0);
}

TEST_F(FileUploaderTest, StoreFailurePropagates) {
    create_text_file("a.txt", "a");
    store_->fail_times("task-42/a.txt", 1);

    file_uploader uploader(store_);
    auto first = uploader.upload(task_for("a.txt"));
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code, error_code::transfer_failed);

    // A retry re-reads the file from the start
    auto second = uploader.upload(task_for("a.txt"));
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(store_->objects().at("task-42/a.txt").content, "a");
}

TEST_F(FileUploaderTest, ReporterIsToldWhenTransferStarts) {
    create_text_file("a.txt", "abc");

    std::vector<std::string> lines;
    progress_reporter reporter([&lines](const std::string& line) { lines.push_back(line); },
                               "GCS", "survey-results");

    file_uploader uploader(store_);
    ASSERT_TRUE(uploader.upload(task_for("a.txt"), &reporter).has_value());
    // task_started logs only; nothing reaches the sink
    EXPECT_TRUE(lines.empty());
}

}  // namespace kcenon::cloud_upload::test
