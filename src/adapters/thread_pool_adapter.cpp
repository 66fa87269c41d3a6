// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Upload worker threads on thread_system or std::async
 */

#include "kcenon/cloud_upload/adapters/thread_pool_adapter.h"

#include <exception>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::cloud_upload::adapters {

namespace {

auto threads_for(size_t requested) -> size_t {
    if (requested != 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

}  // namespace

#if KCENON_WITH_THREAD_SYSTEM

namespace {

/// One worker loop; its outcome goes to the promise handed out by submit()
class worker_loop_job : public kcenon::thread::job {
public:
    worker_loop_job(std::function<void()> loop, std::shared_ptr<std::promise<void>> done)
        : job("upload_worker"), loop_(std::move(loop)), done_(std::move(done)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        try {
            loop_();
            done_->set_value();
        } catch (...) {
            done_->set_exception(std::current_exception());
        }
        return common::ok();
    }

private:
    std::function<void()> loop_;
    std::shared_ptr<std::promise<void>> done_;
};

}  // namespace

thread_system_upload_adapter::thread_system_upload_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool, size_t workers)
    : pool_(std::move(pool)), workers_(workers) {}

thread_system_upload_adapter::~thread_system_upload_adapter() = default;

std::shared_ptr<thread_system_upload_adapter> thread_system_upload_adapter::start(
    size_t workers, const std::string& name) {
    workers = threads_for(workers);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(name);
    for (size_t i = 0; i < workers; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_upload_adapter>(std::move(pool), workers);
}

std::future<void> thread_system_upload_adapter::submit(std::function<void()> task) {
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    pool_->enqueue(std::make_unique<worker_loop_job>(std::move(task), std::move(done)));
    return future;
}

size_t thread_system_upload_adapter::worker_count() const {
    return workers_;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

async_upload_pool::async_upload_pool(size_t workers) : workers_(threads_for(workers)) {}

std::future<void> async_upload_pool::submit(std::function<void()> task) {
    return std::async(std::launch::async, std::move(task));
}

size_t async_upload_pool::worker_count() const {
    return workers_;
}

std::shared_ptr<upload_thread_pool_interface> upload_pool_factory::create(
    size_t workers, const std::string& name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_upload_adapter::start(workers, name);
#else
    (void)name;
    return std::make_shared<async_upload_pool>(workers);
#endif
}

}  // namespace kcenon::cloud_upload::adapters
