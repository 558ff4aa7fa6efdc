/**
 * @file retry_controller.h
 * @brief Linear backoff decisions for failed chunk attempts
 */

#ifndef KCENON_CHUNKED_UPLOAD_UPLOAD_RETRY_CONTROLLER_H
#define KCENON_CHUNKED_UPLOAD_UPLOAD_RETRY_CONTROLLER_H

#include <kcenon/chunked_upload/upload/upload_types.h>

#include <chrono>
#include <cstdint>

namespace kcenon::chunked_upload {

/**
 * @brief What to do with a failed chunk
 */
enum class retry_action {
    requeue,            ///< Reinsert at the queue front after delay
    permanent_failure   ///< Give up; the session fails
};

[[nodiscard]] constexpr auto to_string(retry_action action) noexcept -> const char* {
    switch (action) {
        case retry_action::requeue: return "requeue";
        case retry_action::permanent_failure: return "permanent_failure";
        default: return "unknown";
    }
}

/**
 * @brief Decision for one failed attempt
 */
struct retry_decision {
    retry_action action = retry_action::permanent_failure;
    std::chrono::milliseconds delay{0};  ///< Wait before the requeue
    chunk_task next;                     ///< Chunk to requeue, retry_count advanced
};

/**
 * @brief Retry policy for chunk transfers
 *
 * A chunk that has failed with retry count r is requeued with count r + 1
 * after retry_delay * (r + 1) while r < retry_attempts. Once r reaches
 * retry_attempts the failure is permanent, so a chunk is attempted at most
 * retry_attempts + 1 times.
 */
class retry_controller {
public:
    retry_controller(uint32_t retry_attempts, std::chrono::milliseconds retry_delay);

    explicit retry_controller(const upload_config& config)
        : retry_controller(config.retry_attempts, config.retry_delay) {}

    [[nodiscard]] auto on_failure(const chunk_task& task, const error& failure) const
        -> retry_decision;

    /**
     * @brief Backoff before the attempt following a failure at retry_count
     */
    [[nodiscard]] auto delay_for(uint32_t retry_count) const -> std::chrono::milliseconds;

    [[nodiscard]] auto retry_attempts() const noexcept -> uint32_t { return retry_attempts_; }
    [[nodiscard]] auto retry_delay() const noexcept -> std::chrono::milliseconds {
        return retry_delay_;
    }

private:
    uint32_t retry_attempts_;
    std::chrono::milliseconds retry_delay_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_UPLOAD_RETRY_CONTROLLER_H
