// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Thread pool adapter implementation for chunked_upload_system
 */

#include "chunked_upload/adapters/thread_pool_adapter.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace chunked_upload::adapters {

// ============================================================================
// Stage tracking helper (shared implementation)
// ============================================================================

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

auto default_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

/// Pool state whose task the current thread is running, if any
thread_local const void* current_pool = nullptr;

class current_pool_scope {
public:
    explicit current_pool_scope(const void* pool) : previous_(current_pool) {
        current_pool = pool;
    }
    ~current_pool_scope() { current_pool = previous_; }

    current_pool_scope(const current_pool_scope&) = delete;
    current_pool_scope& operator=(const current_pool_scope&) = delete;

private:
    const void* previous_;
};

/**
 * @brief Wrap a task so its outcome lands in a promise
 * @param owner Pool state reported by is_worker_thread() while the task runs
 */
auto make_promised_task(std::function<void()> task,
                        std::shared_ptr<std::promise<void>> promise,
                        const void* owner,
                        std::function<void()> on_finish) -> std::function<void()> {
    return [task = std::move(task), promise = std::move(promise), owner,
            on_finish = std::move(on_finish)]() {
        {
            current_pool_scope scope(owner);
            try {
                task();
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }
        if (on_finish) {
            on_finish();
        }
    };
}

}  // namespace

// ============================================================================
// thread_system_upload_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Simple job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "function_job")
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

struct thread_system_upload_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<size_t> active_tasks{0};
    stage_tracker tracker;
};

thread_system_upload_adapter::thread_system_upload_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_shared<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_upload_adapter::~thread_system_upload_adapter() = default;

std::shared_ptr<thread_system_upload_adapter>
thread_system_upload_adapter::create_default(size_t worker_count,
                                             const std::string& pool_name) {
    worker_count = default_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_upload_adapter>(std::move(pool), pool_name,
                                                          worker_count);
}

std::future<void> thread_system_upload_adapter::submit(std::function<void()> task) {
    return submit_to_stage(std::move(task), "default");
}

std::future<void> thread_system_upload_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);
    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    std::weak_ptr<impl> weak = pimpl_;
    auto wrapped = make_promised_task(std::move(task), std::move(promise), pimpl_.get(),
                                      [weak, stage = stage_name]() {
                                          if (auto state = weak.lock()) {
                                              state->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                                              state->tracker.decrement(stage);
                                          }
                                      });

    auto job = std::make_unique<function_job>(std::move(wrapped), "chunked_upload_task");
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

size_t thread_system_upload_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_upload_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

bool thread_system_upload_adapter::is_worker_thread() const {
    return current_pool == pimpl_.get();
}

size_t thread_system_upload_adapter::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

size_t thread_system_upload_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_upload_adapter::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// basic_upload_pool implementation
// ============================================================================

struct basic_upload_pool::impl {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::function<void()>> queue;
    std::vector<std::thread> workers;
    bool stopping{false};
    std::atomic<size_t> active_tasks{0};
    stage_tracker tracker;

    static void run(const std::shared_ptr<impl>& self) {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(self->mutex);
                self->cv.wait(lock, [&] { return self->stopping || !self->queue.empty(); });
                if (self->queue.empty()) {
                    return;
                }
                task = std::move(self->queue.front());
                self->queue.pop_front();
            }
            task();
        }
    }
};

basic_upload_pool::basic_upload_pool(size_t worker_count)
    : pimpl_(std::make_shared<impl>()) {
    worker_count = default_worker_count(worker_count);
    pimpl_->workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        pimpl_->workers.emplace_back([state = pimpl_]() { impl::run(state); });
    }
}

basic_upload_pool::~basic_upload_pool() {
    shutdown();
}

void basic_upload_pool::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            return;
        }
        pimpl_->stopping = true;
        workers.swap(pimpl_->workers);
    }
    pimpl_->cv.notify_all();

    for (auto& worker : workers) {
        if (worker.get_id() == std::this_thread::get_id()) {
            // Last owner released from inside a task; the worker keeps impl alive.
            worker.detach();
        } else if (worker.joinable()) {
            worker.join();
        }
    }
}

std::future<void> basic_upload_pool::submit(std::function<void()> task) {
    return submit_to_stage(std::move(task), "default");
}

std::future<void> basic_upload_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            promise->set_exception(std::make_exception_ptr(
                std::runtime_error("upload pool is shut down")));
            return future;
        }

        pimpl_->tracker.increment(stage_name);
        pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

        auto* state = pimpl_.get();
        pimpl_->queue.push_back(make_promised_task(
            std::move(task), std::move(promise), state, [state, stage = stage_name]() {
                state->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                state->tracker.decrement(stage);
            }));
    }
    pimpl_->cv.notify_one();

    return future;
}

size_t basic_upload_pool::worker_count() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->workers.size();
}

bool basic_upload_pool::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return !pimpl_->stopping;
}

bool basic_upload_pool::is_worker_thread() const {
    return current_pool == pimpl_.get();
}

size_t basic_upload_pool::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

size_t basic_upload_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

// ============================================================================
// upload_pool_factory implementation
// ============================================================================

std::shared_ptr<upload_thread_pool_interface> upload_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_upload_adapter::create_default(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<basic_upload_pool>(worker_count);
#endif
}

}  // namespace chunked_upload::adapters
