/**
 * @file transfer_worker_pool.h
 * @brief Bounded-concurrency consumer of the chunk queue
 */

#ifndef KCENON_CHUNKED_UPLOAD_UPLOAD_TRANSFER_WORKER_POOL_H
#define KCENON_CHUNKED_UPLOAD_UPLOAD_TRANSFER_WORKER_POOL_H

#include <kcenon/chunked_upload/adapters/thread_pool_adapter.h>
#include <kcenon/chunked_upload/upload/cancellation_token.h>
#include <kcenon/chunked_upload/upload/chunk_queue.h>
#include <kcenon/chunked_upload/upload/retry_controller.h>
#include <kcenon/chunked_upload/upload/upload_types.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief Worker pool counters
 */
struct worker_pool_stats {
    uint64_t attempts = 0;          ///< Transfer attempts started
    uint64_t succeeded = 0;         ///< Chunks that succeeded
    uint64_t retries = 0;           ///< Delayed requeues scheduled
    std::size_t max_in_flight = 0;  ///< Highest concurrent attempt count seen
};

/**
 * @brief Runs chunk transfers with at most max_parallel attempts in flight
 *
 * The pool pulls from its chunk_queue only while fewer than max_parallel
 * attempts are active. Every finished attempt releases its slot and the pool
 * re-evaluates the queue by submitting new tasks; nothing recurses.
 *
 * A failed attempt goes through the retry_controller. A requeue is a
 * submit_delayed() timer that puts the chunk back at the queue front, so the
 * waiting chunk holds no transfer slot. Until it succeeds the chunk still
 * counts as outstanding, which keeps on_drained from firing.
 *
 * Exactly one of on_drained and on_failed fires, once. After that the pool is
 * stopped: queued chunks are dropped and pending timers do nothing.
 */
class transfer_worker_pool : public std::enable_shared_from_this<transfer_worker_pool> {
public:
    /// One transfer attempt; runs on a pool thread
    using attempt_function = std::function<chunk_outcome(const chunk_task&)>;

    struct events {
        /// A chunk succeeded. Returns before the chunk stops being outstanding.
        std::function<void(const chunk_task&, const chunk_outcome&)> on_chunk_success;

        /// Every chunk succeeded
        std::function<void()> on_drained;

        /// Terminal failure: chunk_permanent_failure, cancelled or internal_error
        std::function<void(std::optional<uint64_t> chunk_index, const error& failure)>
            on_failed;
    };

    /**
     * @param executor Thread pool the attempts run on; not owned
     * @param max_parallel Maximum attempts in flight (at least 1)
     * @param retry Retry policy
     * @param attempt Transfer function
     * @param handlers Event callbacks
     * @param token Cancellation observed before each attempt and requeue
     */
    [[nodiscard]] static auto create(
        std::weak_ptr<adapters::transfer_thread_pool_interface> executor,
        std::size_t max_parallel,
        retry_controller retry,
        attempt_function attempt,
        events handlers,
        cancellation_token token = {}) -> std::shared_ptr<transfer_worker_pool>;

    transfer_worker_pool(const transfer_worker_pool&) = delete;
    auto operator=(const transfer_worker_pool&) -> transfer_worker_pool& = delete;

    /**
     * @brief Seed the queue and start dispatching
     *
     * An empty plan fires on_drained immediately.
     */
    void start(const std::vector<chunk_range>& plan);

    /**
     * @brief Abort with error_code::cancelled unless already finished
     */
    void cancel();

    [[nodiscard]] auto active() const -> std::size_t;
    [[nodiscard]] auto outstanding() const -> uint64_t;
    [[nodiscard]] auto pending_retries() const -> std::size_t;
    [[nodiscard]] auto is_stopped() const -> bool;
    [[nodiscard]] auto stats() const -> worker_pool_stats;
    [[nodiscard]] auto max_parallel() const noexcept -> std::size_t { return max_parallel_; }

private:
    transfer_worker_pool(std::weak_ptr<adapters::transfer_thread_pool_interface> executor,
                         std::size_t max_parallel,
                         retry_controller retry,
                         attempt_function attempt,
                         events handlers,
                         cancellation_token token);

    /// Fill free slots from the queue
    void pump();

    void run_attempt(const chunk_task& task);

    void handle_failure(const chunk_task& task, const error& failure);

    void requeue(chunk_task task);

    /// Stop the pool and report failure if nothing was reported yet
    void fail(std::optional<uint64_t> chunk_index, const error& failure);

    std::weak_ptr<adapters::transfer_thread_pool_interface> executor_;
    std::size_t max_parallel_;
    retry_controller retry_;
    attempt_function attempt_;
    events events_;
    cancellation_token token_;

    chunk_queue queue_;

    mutable std::mutex mutex_;
    std::size_t active_ = 0;
    uint64_t outstanding_ = 0;
    std::size_t pending_retries_ = 0;
    bool finished_ = false;
    worker_pool_stats stats_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_UPLOAD_TRANSFER_WORKER_POOL_H
