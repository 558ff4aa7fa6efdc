/**
 * @file retry_controller.cpp
 * @brief Retry controller implementation
 */

#include <kcenon/chunked_upload/upload/retry_controller.h>

#include <kcenon/chunked_upload/core/logging.h>

namespace kcenon::chunked_upload {

retry_controller::retry_controller(uint32_t retry_attempts,
                                   std::chrono::milliseconds retry_delay)
    : retry_attempts_(retry_attempts), retry_delay_(retry_delay) {}

auto retry_controller::delay_for(uint32_t retry_count) const -> std::chrono::milliseconds {
    return retry_delay_ * (static_cast<int64_t>(retry_count) + 1);
}

auto retry_controller::on_failure(const chunk_task& task, const error& failure) const
    -> retry_decision {
    upload_log_context ctx;
    ctx.chunk_index = task.index();
    ctx.retry_count = task.retry_count;
    ctx.error_message = failure.message;

    retry_decision decision;
    decision.next = task;

    if (task.retry_count < retry_attempts_) {
        decision.action = retry_action::requeue;
        decision.delay = delay_for(task.retry_count);
        decision.next.retry_count = task.retry_count + 1;

        CU_LOG_WARN_CTX(log_category::retry,
            "Retrying chunk " + std::to_string(task.index()) + " (" +
                std::to_string(decision.next.retry_count) + "/" +
                std::to_string(retry_attempts_) + ") in " +
                std::to_string(decision.delay.count()) + "ms",
            ctx);
        return decision;
    }

    decision.action = retry_action::permanent_failure;
    CU_LOG_ERROR_CTX(log_category::retry,
        "Failed to upload chunk " + std::to_string(task.index()) + " after " +
            std::to_string(retry_attempts_) + " retries",
        ctx);
    return decision;
}

}  // namespace kcenon::chunked_upload
