// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file worker_pool_adapter.cpp
 * @brief Worker pool adapter implementation for cymo
 */

#include "cymo/adapters/worker_pool_adapter.h"

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma GCC diagnostic pop
#endif

namespace cymo::adapters {

namespace {

size_t default_worker_count(size_t requested) {
    if (requested > 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

}  // namespace

// ============================================================================
// thread_system_worker_pool implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that runs one worker unit on a thread_system thread
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "upload_unit")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_worker_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<size_t> active_tasks{0};
};

thread_system_worker_pool::thread_system_worker_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_worker_pool::~thread_system_worker_pool() = default;

std::shared_ptr<thread_system_worker_pool> thread_system_worker_pool::create_default(
    size_t worker_count, const std::string& pool_name) {
    worker_count = default_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_worker_pool>(std::move(pool), pool_name,
                                                       worker_count);
}

std::future<void> thread_system_worker_pool::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);
    auto* pimpl = pimpl_.get();
    auto wrapped_task = [task = std::move(task), promise, pimpl]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed);
    };

    auto job = std::make_unique<function_job>(std::move(wrapped_task));
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

size_t thread_system_worker_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_worker_pool::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_worker_pool::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

std::shared_ptr<kcenon::thread::thread_pool> thread_system_worker_pool::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_worker_pool implementation
// ============================================================================

struct async_worker_pool::impl {
    size_t worker_count{0};
    std::atomic<size_t> active_tasks{0};
};

async_worker_pool::async_worker_pool(size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->worker_count = default_worker_count(worker_count);
}

async_worker_pool::~async_worker_pool() = default;

std::future<void> async_worker_pool::submit(std::function<void()> task) {
    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

    auto* pimpl = pimpl_.get();
    return std::async(std::launch::async,
                      [pimpl, task = std::move(task)]() {
                          try {
                              task();
                          } catch (...) {
                              pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                              throw;
                          }
                          pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                      });
}

size_t async_worker_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool async_worker_pool::is_running() const { return true; }

size_t async_worker_pool::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

// ============================================================================
// worker_pool_factory implementation
// ============================================================================

std::shared_ptr<worker_pool_interface> worker_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_worker_pool::create_default(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_worker_pool>(worker_count);
#endif
}

}  // namespace cymo::adapters
