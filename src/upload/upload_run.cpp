/**
 * @file upload_run.cpp
 * @brief Upload session lifecycle
 */

#include "upload_run.h"

#include <kcenon/chunked_upload/core/chunk_splitter.h>

#include <cmath>

namespace kcenon::chunked_upload::detail {

upload_run::upload_run(upload_config config,
                       std::shared_ptr<upload_endpoint> endpoint,
                       std::shared_ptr<chunk_source> source,
                       std::shared_ptr<upload_observer> observer,
                       std::weak_ptr<adapters::transfer_thread_pool_interface> executor)
    : config_(std::move(config)),
      endpoint_(std::move(endpoint)),
      source_(std::move(source)),
      observer_(std::move(observer)),
      executor_(std::move(executor)) {
    session_.total_bytes = source_->size();
}

void upload_run::launch() {
    {
        std::lock_guard lock(mutex_);
        started_at_ = std::chrono::steady_clock::now();
        transition(session_state::starting);
    }

    auto executor = executor_.lock();
    if (!executor) {
        finish(failure(error_code::internal_error, std::nullopt,
                       "thread pool is no longer available", "Upload failed"));
        return;
    }

    auto self = shared_from_this();
    executor->submit([self]() { self->begin(); });
}

auto upload_run::transition(session_state to) -> bool {
    if (terminal_claimed_ || !is_valid_transition(state_, to)) {
        return false;
    }
    state_ = to;
    return true;
}

auto upload_run::log_context() const -> upload_log_context {
    upload_log_context ctx;
    ctx.filename = source_->name();
    ctx.file_size = session_.total_bytes;
    std::lock_guard lock(mutex_);
    ctx.upload_id = session_.upload_id;
    if (session_.total_chunks > 0) {
        ctx.total_chunks = session_.total_chunks;
    }
    return ctx;
}

auto upload_run::failure(error_code code,
                         std::optional<uint64_t> chunk_index,
                         std::string detail,
                         std::string message) const -> session_error {
    session_error err;
    err.code = code;
    err.chunk_index = chunk_index;
    err.detail = std::move(detail);
    err.message = std::move(message);
    std::lock_guard lock(mutex_);
    err.upload_id = session_.upload_id;
    return err;
}

void upload_run::begin() {
    const auto total_bytes = session_.total_bytes;

    auto requested_chunks = chunk_splitter::chunk_count(
        static_cast<int64_t>(total_bytes), config_.chunk_size);
    if (!requested_chunks) {
        finish(failure(error_code::invalid_input, std::nullopt,
                       requested_chunks.error().message, "Upload failed"));
        return;
    }

    if (token_.is_cancelled()) {
        finish(failure(error_code::cancelled, std::nullopt, "upload cancelled",
                       "Upload cancelled"));
        return;
    }

    auto ctx = log_context();
    ctx.total_chunks = requested_chunks.value();
    CU_LOG_INFO_CTX(log_category::session, "Starting upload session", ctx);

    auto grant = endpoint_->start_session(source_->name(), requested_chunks.value(),
                                          config_.guest);
    if (!grant) {
        finish(failure(error_code::session_start_failure, std::nullopt,
                       grant.error().message, "Failed to start upload session"));
        return;
    }

    auto plan = chunk_splitter::plan(static_cast<int64_t>(total_bytes),
                                     grant.value().chunk_size);
    if (!plan) {
        finish(failure(error_code::session_start_failure, std::nullopt,
                       plan.error().message, "Failed to start upload session"));
        return;
    }

    std::weak_ptr<upload_run> weak = weak_from_this();
    transfer_worker_pool::events handlers;
    handlers.on_chunk_success = [weak](const chunk_task& task, const chunk_outcome& outcome) {
        if (auto self = weak.lock()) {
            self->on_chunk_success(task, outcome);
        }
    };
    handlers.on_drained = [weak]() {
        if (auto self = weak.lock()) {
            self->on_drained();
        }
    };
    handlers.on_failed = [weak](std::optional<uint64_t> chunk_index, const error& err) {
        if (auto self = weak.lock()) {
            self->on_pool_failed(chunk_index, err);
        }
    };

    auto attempt = [weak](const chunk_task& task) -> chunk_outcome {
        if (auto self = weak.lock()) {
            return self->attempt(task);
        }
        chunk_outcome abandoned;
        abandoned.index = task.index();
        abandoned.error = error{error_code::cancelled, "upload abandoned"};
        return abandoned;
    };

    auto pool = transfer_worker_pool::create(executor_, config_.max_parallel_uploads,
                                             retry_controller(config_), std::move(attempt),
                                             std::move(handlers), token_);

    {
        std::lock_guard lock(mutex_);
        session_.upload_id = grant.value().upload_id;
        session_.chunk_size = grant.value().chunk_size;
        session_.total_chunks = plan.value().size();
        session_.created_at = std::chrono::system_clock::now();
        if (!transition(session_state::transferring)) {
            // Cancelled while start-session was in flight
            return;
        }
        worker_pool_ = pool;
    }

    ctx = log_context();
    CU_LOG_INFO_CTX(log_category::session,
        "Upload session started, chunk size " + std::to_string(grant.value().chunk_size),
        ctx);

    pool->start(plan.value());
}

auto upload_run::attempt(const chunk_task& task) -> chunk_outcome {
    chunk_outcome outcome;
    outcome.index = task.index();
    outcome.bytes_transferred = task.size();

    auto data = source_->read(task.range);
    if (!data) {
        outcome.error = error{error_code::chunk_transfer_failure, data.error().message};
        return outcome;
    }

    auto payload = compression_.compress_chunk(data.value(), config_.compression);

    chunk_upload_request request;
    request.upload_id = session_.upload_id;
    request.chunk_index = task.index();
    request.total_chunks = session_.total_chunks;
    request.payload = payload.data;
    request.compressed = payload.compressed;
    request.original_size = data.value().size();

    auto sent = endpoint_->upload_chunk(request);
    if (!sent) {
        outcome.error = error{error_code::chunk_transfer_failure, sent.error().message};
        return outcome;
    }

    outcome.success = true;
    outcome.wire_bytes = payload.data.size();
    outcome.compressed = payload.compressed;
    return outcome;
}

void upload_run::on_chunk_success(const chunk_task& task, const chunk_outcome& outcome) {
    std::lock_guard notify(notify_mutex_);

    progress_snapshot snapshot;
    {
        std::lock_guard lock(mutex_);
        if (terminal_claimed_) {
            return;
        }
        ++completed_chunks_;
        uploaded_bytes_ += outcome.bytes_transferred;
        wire_bytes_ += outcome.wire_bytes;
        if (outcome.compressed) {
            ++compressed_chunks_;
        }

        snapshot.loaded = uploaded_bytes_;
        snapshot.total = session_.total_bytes;
        snapshot.completed_chunks = completed_chunks_;
        snapshot.total_chunks = session_.total_chunks;
        snapshot.percent = static_cast<int>(std::lround(
            static_cast<double>(completed_chunks_) /
            static_cast<double>(session_.total_chunks) * 100.0));
    }

    auto ctx = log_context();
    ctx.chunk_index = task.index();
    ctx.bytes = outcome.bytes_transferred;
    ctx.percent = snapshot.percent;
    if (task.retry_count > 0) {
        ctx.retry_count = task.retry_count;
    }
    CU_LOG_DEBUG_CTX(log_category::session, "Chunk uploaded", ctx);

    progress_.publish(snapshot);
    if (observer_) {
        observer_->on_progress(snapshot);
    }
}

void upload_run::on_drained() {
    std::string upload_id;
    {
        std::lock_guard lock(mutex_);
        if (!transition(session_state::finalizing)) {
            return;
        }
        upload_id = session_.upload_id;
    }

    auto ctx = log_context();
    CU_LOG_INFO_CTX(log_category::session, "All chunks uploaded, finalizing", ctx);

    auto completed = endpoint_->complete_session(upload_id);
    if (!completed) {
        finish(failure(error_code::finalize_failure, std::nullopt,
                       completed.error().message, "Failed to complete upload"));
        return;
    }

    session_summary summary;
    {
        std::lock_guard lock(mutex_);
        summary.upload_id = session_.upload_id;
        summary.total_bytes = session_.total_bytes;
        summary.total_chunks = session_.total_chunks;
        summary.chunk_size = session_.chunk_size;
        summary.compressed_chunks = compressed_chunks_;
        summary.wire_bytes = wire_bytes_;
        if (worker_pool_) {
            summary.retries = worker_pool_->stats().retries;
        }
    }
    summary.filename = source_->name();
    summary.payload = std::move(completed.value());
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_);

    finish(std::move(summary));
}

void upload_run::on_pool_failed(std::optional<uint64_t> chunk_index, const error& err) {
    switch (err.code) {
        case error_code::cancelled:
            finish(failure(error_code::cancelled, std::nullopt, err.message,
                           "Upload cancelled"));
            break;
        case error_code::chunk_permanent_failure:
            finish(failure(error_code::chunk_permanent_failure, chunk_index, err.message,
                           "Failed to upload chunk " +
                               std::to_string(chunk_index.value_or(0))));
            break;
        default:
            finish(failure(err.code, chunk_index, err.message, "Upload failed"));
            break;
    }
}

void upload_run::finish(session_result outcome) {
    std::lock_guard notify(notify_mutex_);

    {
        std::lock_guard lock(mutex_);
        if (terminal_claimed_) {
            return;
        }
        terminal_claimed_ = true;
        state_ = outcome.state();
    }

    auto ctx = log_context();
    if (outcome.succeeded()) {
        ctx.duration_ms = static_cast<uint64_t>(outcome.summary().elapsed.count());
        CU_LOG_INFO_CTX(log_category::session, "Upload completed", ctx);
    } else {
        const auto& err = outcome.failure();
        ctx.chunk_index = err.chunk_index;
        ctx.error_message = err.detail;
        CU_LOG_ERROR_CTX(log_category::session, err.message, ctx);
    }

    progress_.close();
    if (observer_) {
        if (outcome.succeeded()) {
            observer_->on_complete(outcome.summary());
        } else {
            observer_->on_error(outcome.failure());
        }
    }

    {
        std::lock_guard lock(mutex_);
        result_ = std::move(outcome);
    }
    done_cv_.notify_all();
}

auto upload_run::state() const -> session_state {
    std::lock_guard lock(mutex_);
    return state_;
}

auto upload_run::upload_id() const -> std::string {
    std::lock_guard lock(mutex_);
    return session_.upload_id;
}

auto upload_run::cancel() -> result<void> {
    std::shared_ptr<transfer_worker_pool> pool;
    {
        std::lock_guard lock(mutex_);
        if (terminal_claimed_) {
            return unexpected{error{error_code::invalid_state,
                std::string("Cannot cancel upload in state: ") + to_string(state_)}};
        }
        pool = worker_pool_;
    }

    token_.cancel();
    if (pool) {
        pool->cancel();
    } else {
        finish(failure(error_code::cancelled, std::nullopt, "upload cancelled",
                       "Upload cancelled"));
    }
    return {};
}

auto upload_run::wait() -> session_result {
    std::unique_lock lock(mutex_);
    done_cv_.wait(lock, [this] { return result_.has_value(); });
    return *result_;
}

auto upload_run::wait_for(std::chrono::milliseconds timeout)
    -> std::optional<session_result> {
    std::unique_lock lock(mutex_);
    if (!done_cv_.wait_for(lock, timeout, [this] { return result_.has_value(); })) {
        return std::nullopt;
    }
    return *result_;
}

}  // namespace kcenon::chunked_upload::detail
