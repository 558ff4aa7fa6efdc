// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Thread pool adapter for chunk transfers and retry timers
 *
 * Transfer attempts run on a shared executor. Delayed submissions are used for
 * retry backoff: the task is reinserted only when its delay has elapsed.
 *
 * The executor is kcenon::thread::thread_pool when built with thread_system,
 * otherwise a small std::thread pool with its own timer queue.
 */

#pragma once

#include <kcenon/chunked_upload/config/feature_flags.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::chunked_upload::adapters {

/**
 * @brief Executor used by the transfer worker pool
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task that runs once delay has elapsed
     * @param task The task to execute
     * @param delay Time to wait before executing the task
     * @return Future for the task completion
     */
    virtual std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Number of submitted tasks that have not finished yet
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that runs transfers on a kcenon::thread::thread_pool
 *
 * Delayed tasks sleep inside a pool job, so the pool should have more workers
 * than the number of parallel transfers.
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    /**
     * @brief Construct with an existing thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_transfer_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "chunked_upload_pool",
        size_t worker_count = 0);

    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    /**
     * @brief Create and start a pool with worker_count workers
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_transfer_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "chunked_upload_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Standalone pool used when thread_system is unavailable
 *
 * A fixed set of std::thread workers drains a FIFO task queue. Delayed tasks
 * wait in a timer queue serviced by a dedicated thread and are moved to the
 * task queue when due, so they never occupy a worker while waiting.
 *
 * Tasks still queued when the pool is destroyed are discarded; their futures
 * report std::future_errc::broken_promise.
 */
class async_transfer_pool : public transfer_thread_pool_interface {
public:
    /**
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     */
    explicit async_transfer_pool(size_t worker_count = 0);
    ~async_transfer_pool() override;

    async_transfer_pool(const async_transfer_pool&) = delete;
    async_transfer_pool& operator=(const async_transfer_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    /**
     * @brief Stop accepting tasks and join all threads
     */
    void shutdown();

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Factory selecting the best available pool
 *
 * 1. thread_system_transfer_adapter (when KCENON_WITH_THREAD_SYSTEM)
 * 2. async_transfer_pool (fallback)
 */
class transfer_pool_factory {
public:
    /**
     * @brief Create the best available thread pool adapter
     * @param worker_count Number of worker threads (0 = auto-detect)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
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

}  // namespace kcenon::chunked_upload::adapters
