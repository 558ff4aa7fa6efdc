// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Thread pool adapter implementation for chunked_upload
 */

#include <kcenon/chunked_upload/adapters/thread_pool_adapter.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::chunked_upload::adapters {

namespace {

auto resolve_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

// Runs task and settles the promise; an escaping exception goes to the future.
void run_and_settle(const std::function<void()>& task, std::promise<void>& promise) {
    try {
        task();
        promise.set_value();
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
}

}  // namespace

// ============================================================================
// thread_system_transfer_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
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

struct thread_system_transfer_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<size_t> pending{0};
};

thread_system_transfer_adapter::thread_system_transfer_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_shared<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_transfer_adapter::~thread_system_transfer_adapter() {
    if (pimpl_ && pimpl_->pool) {
        // Pending retry timers hold upload state; drop them with the pool
        auto queue = pimpl_->pool->get_job_queue();
        if (queue) {
            queue->stop();
            queue->clear();
        }
        pimpl_->pool->stop(true);
    }
}

std::shared_ptr<thread_system_transfer_adapter>
thread_system_transfer_adapter::create_default(size_t worker_count,
                                               const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_transfer_adapter>(
        std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_transfer_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->pending.fetch_add(1, std::memory_order_relaxed);
    auto state = pimpl_;
    auto wrapped = [task = std::move(task), promise, state]() {
        run_and_settle(task, *promise);
        state->pending.fetch_sub(1, std::memory_order_relaxed);
    };

    pimpl_->pool->enqueue(std::make_unique<function_job>(std::move(wrapped), "chunk_transfer"));
    return future;
}

std::future<void> thread_system_transfer_adapter::submit_delayed(
    std::function<void()> task, std::chrono::milliseconds delay) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->pending.fetch_add(1, std::memory_order_relaxed);
    auto state = pimpl_;
    auto delayed = [task = std::move(task), promise, state, delay]() {
        std::this_thread::sleep_for(delay);
        run_and_settle(task, *promise);
        state->pending.fetch_sub(1, std::memory_order_relaxed);
    };

    pimpl_->pool->enqueue(std::make_unique<function_job>(std::move(delayed), "retry_timer"));
    return future;
}

size_t thread_system_transfer_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_transfer_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_transfer_adapter::pending_tasks() const {
    return pimpl_->pending.load(std::memory_order_relaxed);
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_transfer_adapter::underlying_pool() const {
    return pimpl_->pool;
}

std::string thread_system_transfer_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_transfer_pool implementation
// ============================================================================

struct async_transfer_pool::impl {
    using clock = std::chrono::steady_clock;

    std::mutex mutex;
    std::condition_variable task_cv;
    std::condition_variable timer_cv;
    std::deque<std::function<void()>> tasks;
    std::multimap<clock::time_point, std::function<void()>> timers;
    std::vector<std::thread> threads;
    size_t worker_count{0};
    bool stopping{false};
    std::atomic<size_t> pending{0};

    // Threads start lazily so an unused pool costs nothing. Requires mutex.
    static void ensure_started(const std::shared_ptr<impl>& self) {
        if (!self->threads.empty() || self->stopping) {
            return;
        }
        for (size_t i = 0; i < self->worker_count; ++i) {
            self->threads.emplace_back([self] { worker_loop(self); });
        }
        self->threads.emplace_back([self] { timer_loop(self); });
    }

    static void worker_loop(const std::shared_ptr<impl>& self) {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock lock(self->mutex);
                self->task_cv.wait(lock, [&] { return self->stopping || !self->tasks.empty(); });
                if (self->stopping) {
                    return;
                }
                task = std::move(self->tasks.front());
                self->tasks.pop_front();
            }
            task();
        }
    }

    static void timer_loop(const std::shared_ptr<impl>& self) {
        std::unique_lock lock(self->mutex);
        while (!self->stopping) {
            if (self->timers.empty()) {
                self->timer_cv.wait(lock, [&] { return self->stopping || !self->timers.empty(); });
                continue;
            }

            auto due = self->timers.begin()->first;
            if (clock::now() >= due) {
                self->tasks.push_back(std::move(self->timers.begin()->second));
                self->timers.erase(self->timers.begin());
                self->task_cv.notify_one();
                continue;
            }
            self->timer_cv.wait_until(lock, due);
        }
    }

    static auto wrap(std::function<void()> task,
                     std::shared_ptr<std::promise<void>> promise,
                     impl* state) -> std::function<void()> {
        return [task = std::move(task), promise = std::move(promise), state]() {
            run_and_settle(task, *promise);
            state->pending.fetch_sub(1, std::memory_order_relaxed);
        };
    }
};

async_transfer_pool::async_transfer_pool(size_t worker_count)
    : pimpl_(std::make_shared<impl>()) {
    pimpl_->worker_count = resolve_worker_count(worker_count);
}

async_transfer_pool::~async_transfer_pool() {
    shutdown();
}

void async_transfer_pool::shutdown() {
    std::vector<std::thread> threads;
    std::deque<std::function<void()>> dropped_tasks;
    std::multimap<impl::clock::time_point, std::function<void()>> dropped_timers;
    {
        std::lock_guard lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            return;
        }
        pimpl_->stopping = true;
        threads.swap(pimpl_->threads);
        dropped_tasks.swap(pimpl_->tasks);
        dropped_timers.swap(pimpl_->timers);
    }
    pimpl_->task_cv.notify_all();
    pimpl_->timer_cv.notify_all();

    for (auto& thread : threads) {
        if (thread.get_id() == std::this_thread::get_id()) {
            // Destroyed from inside one of our own tasks; the thread keeps impl alive
            thread.detach();
        } else if (thread.joinable()) {
            thread.join();
        }
    }
    pimpl_->pending.fetch_sub(dropped_tasks.size() + dropped_timers.size(),
                              std::memory_order_relaxed);
}

std::future<void> async_transfer_pool::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            return future;
        }
        impl::ensure_started(pimpl_);
        pimpl_->pending.fetch_add(1, std::memory_order_relaxed);
        pimpl_->tasks.push_back(impl::wrap(std::move(task), promise, pimpl_.get()));
    }
    pimpl_->task_cv.notify_one();
    return future;
}

std::future<void> async_transfer_pool::submit_delayed(
    std::function<void()> task, std::chrono::milliseconds delay) {
    if (delay <= std::chrono::milliseconds::zero()) {
        return submit(std::move(task));
    }

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            return future;
        }
        impl::ensure_started(pimpl_);
        pimpl_->pending.fetch_add(1, std::memory_order_relaxed);
        pimpl_->timers.emplace(impl::clock::now() + delay,
                               impl::wrap(std::move(task), promise, pimpl_.get()));
    }
    pimpl_->timer_cv.notify_one();
    return future;
}

size_t async_transfer_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool async_transfer_pool::is_running() const {
    std::lock_guard lock(pimpl_->mutex);
    return !pimpl_->stopping;
}

size_t async_transfer_pool::pending_tasks() const {
    return pimpl_->pending.load(std::memory_order_relaxed);
}

// ============================================================================
// transfer_pool_factory implementation
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_transfer_adapter::create_default(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_transfer_pool>(worker_count);
#endif
}

}  // namespace kcenon::chunked_upload::adapters
