// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool adapter implementation
 */

#include "kcenon/package_upload/adapters/thread_pool_adapter.h"

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace kcenon::package_upload::adapters {

namespace {

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

auto default_worker_count() -> size_t {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

}  // namespace

// ============================================================================
// thread_system_worker_pool implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that runs a function on a thread_system worker
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "upload_job")
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
    stage_tracker tracker;
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

std::shared_ptr<thread_system_worker_pool>
thread_system_worker_pool::create_default(size_t worker_count,
                                                const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = default_worker_count();
    }

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

    auto wrapped_task = [task = std::move(task), promise]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };

    pimpl_->pool->enqueue(std::make_unique<function_job>(std::move(wrapped_task)));
    return future;
}

std::future<void> thread_system_worker_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    // The adapter outlives every task it hands out
    auto* tracker = &pimpl_->tracker;
    auto wrapped_task = [task = std::move(task), promise, tracker, stage = stage_name]() {
        try {
            task();
            tracker->decrement(stage);
            promise->set_value();
        } catch (...) {
            tracker->decrement(stage);
            promise->set_exception(std::current_exception());
        }
    };

    pimpl_->pool->enqueue(
        std::make_unique<function_job>(std::move(wrapped_task), "staged_upload_job"));
    return future;
}

size_t thread_system_worker_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_worker_pool::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_worker_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

std::string thread_system_worker_pool::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_worker_pool implementation
// ============================================================================

struct async_worker_pool::impl {
    size_t nominal_workers{0};
    stage_tracker tracker;
};

async_worker_pool::async_worker_pool(size_t nominal_workers)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->nominal_workers = nominal_workers > 0 ? nominal_workers : default_worker_count();
}

async_worker_pool::~async_worker_pool() = default;

std::future<void> async_worker_pool::submit(std::function<void()> task) {
    return std::async(std::launch::async, std::move(task));
}

std::future<void> async_worker_pool::submit_to_stage(std::function<void()> task,
                                                       const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);

    auto* pimpl = pimpl_.get();
    return std::async(std::launch::async,
                      [pimpl, task = std::move(task), stage = stage_name]() {
                          try {
                              task();
                          } catch (...) {
                              pimpl->tracker.decrement(stage);
                              throw;
                          }
                          pimpl->tracker.decrement(stage);
                      });
}

size_t async_worker_pool::worker_count() const {
    return pimpl_->nominal_workers;
}

bool async_worker_pool::is_running() const { return true; }

size_t async_worker_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
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

}  // namespace kcenon::package_upload::adapters
