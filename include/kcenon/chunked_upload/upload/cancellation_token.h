/**
 * @file cancellation_token.h
 * @brief Shared cancellation flag observed between chunk attempts
 */

#ifndef KCENON_CHUNKED_UPLOAD_UPLOAD_CANCELLATION_TOKEN_H
#define KCENON_CHUNKED_UPLOAD_UPLOAD_CANCELLATION_TOKEN_H

#include <atomic>
#include <memory>

namespace kcenon::chunked_upload {

/**
 * @brief Copyable handle to a shared cancellation flag
 *
 * Copies observe the same flag. Cancellation cannot be undone.
 */
class cancellation_token {
public:
    cancellation_token() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_UPLOAD_CANCELLATION_TOKEN_H
