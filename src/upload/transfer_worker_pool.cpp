/**
 * @file transfer_worker_pool.cpp
 * @brief Transfer worker pool implementation
 */

#include <kcenon/chunked_upload/upload/transfer_worker_pool.h>

#include <kcenon/chunked_upload/core/logging.h>

#include <algorithm>
#include <exception>

namespace kcenon::chunked_upload {

namespace {

auto cancelled_error() -> error {
    return error{error_code::cancelled, "upload cancelled"};
}

auto executor_gone_error() -> error {
    return error{error_code::internal_error, "thread pool is no longer available"};
}

}  // namespace

auto transfer_worker_pool::create(
    std::weak_ptr<adapters::transfer_thread_pool_interface> executor,
    std::size_t max_parallel,
    retry_controller retry,
    attempt_function attempt,
    events handlers,
    cancellation_token token) -> std::shared_ptr<transfer_worker_pool> {
    return std::shared_ptr<transfer_worker_pool>(new transfer_worker_pool(
        std::move(executor), max_parallel, std::move(retry), std::move(attempt),
        std::move(handlers), std::move(token)));
}

transfer_worker_pool::transfer_worker_pool(
    std::weak_ptr<adapters::transfer_thread_pool_interface> executor,
    std::size_t max_parallel,
    retry_controller retry,
    attempt_function attempt,
    events handlers,
    cancellation_token token)
    : executor_(std::move(executor)),
      max_parallel_(std::max<std::size_t>(max_parallel, 1)),
      retry_(std::move(retry)),
      attempt_(std::move(attempt)),
      events_(std::move(handlers)),
      token_(std::move(token)) {}

void transfer_worker_pool::start(const std::vector<chunk_range>& plan) {
    {
        std::lock_guard lock(mutex_);
        outstanding_ = plan.size();
        for (const auto& range : plan) {
            queue_.push_back(chunk_task{range, 0});
        }
    }

    if (plan.empty()) {
        {
            std::lock_guard lock(mutex_);
            if (finished_) {
                return;
            }
            finished_ = true;
        }
        if (events_.on_drained) {
            events_.on_drained();
        }
        return;
    }

    CU_LOG_DEBUG(log_category::worker,
        "Dispatching " + std::to_string(plan.size()) + " chunks, " +
            std::to_string(max_parallel_) + " in parallel");
    pump();
}

void transfer_worker_pool::cancel() {
    fail(std::nullopt, cancelled_error());
}

void transfer_worker_pool::pump() {
    if (token_.is_cancelled()) {
        fail(std::nullopt, cancelled_error());
        return;
    }

    std::vector<chunk_task> batch;
    {
        std::lock_guard lock(mutex_);
        if (finished_) {
            return;
        }
        while (active_ < max_parallel_) {
            auto task = queue_.try_pop();
            if (!task) {
                break;
            }
            ++active_;
            ++stats_.attempts;
            batch.push_back(std::move(*task));
        }
        stats_.max_in_flight = std::max(stats_.max_in_flight, active_);
    }

    if (batch.empty()) {
        return;
    }

    auto executor = executor_.lock();
    if (!executor) {
        {
            std::lock_guard lock(mutex_);
            active_ -= batch.size();
        }
        fail(std::nullopt, executor_gone_error());
        return;
    }

    auto self = shared_from_this();
    for (auto& task : batch) {
        executor->submit([self, task]() { self->run_attempt(task); });
    }
}

void transfer_worker_pool::run_attempt(const chunk_task& task) {
    if (token_.is_cancelled()) {
        {
            std::lock_guard lock(mutex_);
            --active_;
        }
        fail(std::nullopt, cancelled_error());
        return;
    }

    {
        std::lock_guard lock(mutex_);
        if (finished_) {
            --active_;
            return;
        }
    }

    chunk_outcome outcome;
    try {
        outcome = attempt_(task);
    } catch (const std::exception& e) {
        outcome = chunk_outcome{};
        outcome.index = task.index();
        outcome.error = error{error_code::chunk_transfer_failure, e.what()};
    } catch (...) {
        outcome = chunk_outcome{};
        outcome.index = task.index();
        outcome.error = error{error_code::chunk_transfer_failure,
                              "unknown exception during chunk transfer"};
    }

    if (!outcome.success) {
        handle_failure(task, outcome.error.value_or(error{error_code::chunk_transfer_failure}));
        return;
    }

    {
        // Stopped while this chunk was in flight; account for it silently
        std::lock_guard lock(mutex_);
        if (finished_) {
            --active_;
            --outstanding_;
            ++stats_.succeeded;
            return;
        }
    }

    if (events_.on_chunk_success) {
        events_.on_chunk_success(task, outcome);
    }

    bool drained = false;
    {
        std::lock_guard lock(mutex_);
        --active_;
        --outstanding_;
        ++stats_.succeeded;
        if (!finished_ && outstanding_ == 0) {
            finished_ = true;
            drained = true;
        }
    }

    if (drained) {
        CU_LOG_DEBUG(log_category::worker, "All chunks acknowledged");
        if (events_.on_drained) {
            events_.on_drained();
        }
        return;
    }
    pump();
}

void transfer_worker_pool::handle_failure(const chunk_task& task, const error& failure) {
    auto decision = retry_.on_failure(task, failure);

    if (decision.action == retry_action::permanent_failure) {
        {
            std::lock_guard lock(mutex_);
            --active_;
        }
        fail(task.index(), error{error_code::chunk_permanent_failure, failure.message});
        return;
    }

    {
        std::lock_guard lock(mutex_);
        --active_;
        if (finished_) {
            return;
        }
        ++pending_retries_;
        ++stats_.retries;
    }

    auto executor = executor_.lock();
    if (!executor) {
        {
            std::lock_guard lock(mutex_);
            --pending_retries_;
        }
        fail(std::nullopt, executor_gone_error());
        return;
    }

    auto self = shared_from_this();
    executor->submit_delayed(
        [self, next = decision.next]() { self->requeue(next); },
        decision.delay);

    // The slot is free again; let the next queued chunk use it
    pump();
}

void transfer_worker_pool::requeue(chunk_task task) {
    {
        std::lock_guard lock(mutex_);
        --pending_retries_;
        if (finished_) {
            return;
        }
        if (!token_.is_cancelled()) {
            queue_.push_front(std::move(task));
        }
    }
    pump();
}

void transfer_worker_pool::fail(std::optional<uint64_t> chunk_index, const error& failure) {
    std::size_t dropped = 0;
    {
        std::lock_guard lock(mutex_);
        if (finished_) {
            return;
        }
        finished_ = true;
        dropped = queue_.clear();
    }

    CU_LOG_DEBUG(log_category::worker,
        std::string("Worker pool stopped: ") + failure.message + " (" +
            std::to_string(dropped) + " queued chunks abandoned)");

    if (events_.on_failed) {
        events_.on_failed(chunk_index, failure);
    }
}

auto transfer_worker_pool::active() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return active_;
}

auto transfer_worker_pool::outstanding() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return outstanding_;
}

auto transfer_worker_pool::pending_retries() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return pending_retries_;
}

auto transfer_worker_pool::is_stopped() const -> bool {
    std::lock_guard lock(mutex_);
    return finished_;
}

auto transfer_worker_pool::stats() const -> worker_pool_stats {
    std::lock_guard lock(mutex_);
    return stats_;
}

}  // namespace kcenon::chunked_upload
