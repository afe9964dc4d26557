// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Thread pool adapter for chunked_upload_system
 *
 * Runs chunk transfer tasks and parallel digest computation, either on
 * thread_system's thread_pool or on a built-in fixed worker pool.
 *
 * Features:
 * - Stage-based task tracking ("digest", "chunk_transfer")
 * - Seamless integration with thread_system when available
 * - Futures that never block in their destructor
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include <chunked_upload/config/feature_flags.h>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace chunked_upload::adapters {

/**
 * @brief Interface for thread pool operations in chunked_upload_system
 */
class upload_thread_pool_interface {
public:
    virtual ~upload_thread_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion; exceptions are forwarded through it
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task counted under a named stage
     * @param task The task to execute
     * @param stage_name Stage label (e.g., "chunk_transfer")
     * @return Future for the task completion
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Whether the calling thread is running one of this pool's tasks
     *
     * A task must not block on futures of the same pool; callers check this
     * before fanning work out and waiting for it.
     */
    [[nodiscard]] virtual bool is_worker_thread() const = 0;

    /**
     * @brief Tasks submitted but not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Unfinished tasks of one stage
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool for chunk tasks
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_upload_adapter : public upload_thread_pool_interface {
public:
    explicit thread_system_upload_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "chunked_upload_pool",
        size_t worker_count = 0);

    ~thread_system_upload_adapter() override;

    thread_system_upload_adapter(const thread_system_upload_adapter&) = delete;
    thread_system_upload_adapter& operator=(const thread_system_upload_adapter&) = delete;

    /**
     * @brief Create a started pool with the given number of workers
     * @param worker_count Number of worker threads (0 = auto-detect from hardware)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_upload_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "chunked_upload_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] bool is_worker_thread() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fixed-size worker pool used when thread_system is unavailable
 *
 * Workers drain the queue before exiting, so every returned future becomes
 * ready. Destruction from one of the pool's own workers is allowed.
 */
class basic_upload_pool : public upload_thread_pool_interface {
public:
    /**
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     */
    explicit basic_upload_pool(size_t worker_count = 0);
    ~basic_upload_pool() override;

    basic_upload_pool(const basic_upload_pool&) = delete;
    basic_upload_pool& operator=(const basic_upload_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] bool is_worker_thread() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    /**
     * @brief Stop accepting tasks and join the workers after the queue drains
     */
    void shutdown();

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Factory selecting the best available pool
 *
 * 1. thread_system_upload_adapter (when KCENON_WITH_THREAD_SYSTEM)
 * 2. basic_upload_pool (fallback)
 */
class upload_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<upload_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "chunked_upload_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace chunked_upload::adapters
