// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Threads that host the upload worker loops
 *
 * thread_system backs the pool when it is linked; std::async otherwise.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::cloud_upload::adapters {

/**
 * @brief Threads for upload worker loops
 *
 * Every submitted task is a worker loop that runs until the batch drains,
 * so upload_pool never starts more loops than worker_count().
 */
class upload_thread_pool_interface {
public:
    virtual ~upload_thread_pool_interface() = default;

    /**
     * @brief Run @p task on a pool thread
     * @return Future that rethrows whatever the task threw
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /// Loops that can run at the same time
    [[nodiscard]] virtual size_t worker_count() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Worker loops on a started kcenon::thread::thread_pool
 */
class thread_system_upload_adapter : public upload_thread_pool_interface {
public:
    /**
     * @param pool Started pool
     * @param workers Threads in @p pool
     */
    thread_system_upload_adapter(std::shared_ptr<kcenon::thread::thread_pool> pool,
                                 size_t workers);
    ~thread_system_upload_adapter() override;

    thread_system_upload_adapter(const thread_system_upload_adapter&) = delete;
    thread_system_upload_adapter& operator=(const thread_system_upload_adapter&) = delete;

    /**
     * @brief Start a pool of @p workers threads (0 picks the hardware count)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_upload_adapter> start(
        size_t workers, const std::string& name);

    std::future<void> submit(std::function<void()> task) override;
    [[nodiscard]] size_t worker_count() const override;

private:
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
    size_t workers_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief One std::async thread per submitted loop
 */
class async_upload_pool : public upload_thread_pool_interface {
public:
    /// @param workers Loops to allow (0 picks the hardware count)
    explicit async_upload_pool(size_t workers = 0);

    std::future<void> submit(std::function<void()> task) override;
    [[nodiscard]] size_t worker_count() const override;

private:
    size_t workers_;
};

/**
 * @brief Picks thread_system when linked, async_upload_pool otherwise
 */
class upload_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<upload_thread_pool_interface> create(
        size_t workers, const std::string& name = "cloud_upload_pool");
};

}  // namespace kcenon::cloud_upload::adapters
