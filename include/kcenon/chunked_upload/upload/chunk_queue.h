/**
 * @file chunk_queue.h
 * @brief Work queue of chunks waiting for a transfer slot
 */

#ifndef KCENON_CHUNKED_UPLOAD_UPLOAD_CHUNK_QUEUE_H
#define KCENON_CHUNKED_UPLOAD_UPLOAD_CHUNK_QUEUE_H

#include <kcenon/chunked_upload/upload/upload_types.h>

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace kcenon::chunked_upload {

/**
 * @brief Thread-safe double-ended chunk queue
 *
 * New chunks go to the back; retried chunks go to the front so they are
 * picked before chunks that were never attempted. A popped chunk belongs to
 * exactly one caller.
 */
class chunk_queue {
public:
    chunk_queue() = default;

    chunk_queue(const chunk_queue&) = delete;
    auto operator=(const chunk_queue&) -> chunk_queue& = delete;

    void push_back(chunk_task task);

    void push_front(chunk_task task);

    [[nodiscard]] auto try_pop() -> std::optional<chunk_task>;

    /**
     * @brief Drop every queued chunk
     * @return Number of chunks dropped
     */
    auto clear() -> std::size_t;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto empty() const -> bool;

private:
    mutable std::mutex mutex_;
    std::deque<chunk_task> tasks_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_UPLOAD_CHUNK_QUEUE_H
