/**
 * @file upload_handle.h
 * @brief Handle to a running upload session
 */

#ifndef KCENON_CHUNKED_UPLOAD_UPLOAD_UPLOAD_HANDLE_H
#define KCENON_CHUNKED_UPLOAD_UPLOAD_UPLOAD_HANDLE_H

#include <kcenon/chunked_upload/adapters/thread_pool_adapter.h>
#include <kcenon/chunked_upload/upload/progress_channel.h>
#include <kcenon/chunked_upload/upload/upload_types.h>

#include <chrono>
#include <memory>
#include <string>

namespace kcenon::chunked_upload {

namespace detail {
class upload_run;
}

/**
 * @brief Tracks and controls a session started by upload_orchestrator::start()
 *
 * Copies refer to the same session. The handle keeps the session's thread
 * pool alive, so a session keeps running after the orchestrator is gone.
 *
 * @code
 * auto handle = orchestrator.start(source);
 * if (handle) {
 *     while (auto snapshot = handle.value().progress().receive()) {
 *         report(*snapshot);
 *     }
 *     auto outcome = handle.value().wait();
 * }
 * @endcode
 */
class upload_handle {
public:
    /**
     * @brief Default constructor (invalid handle)
     */
    upload_handle() = default;

    upload_handle(std::shared_ptr<detail::upload_run> run,
                  std::shared_ptr<adapters::transfer_thread_pool_interface> executor);

    [[nodiscard]] auto is_valid() const noexcept -> bool { return run_ != nullptr; }

    [[nodiscard]] auto state() const -> session_state;

    /**
     * @brief Session token; empty until start-session succeeded
     */
    [[nodiscard]] auto upload_id() const -> std::string;

    /**
     * @brief Progress snapshots, closed when the session ends
     *
     * An invalid handle returns an empty channel that is already closed.
     */
    [[nodiscard]] auto progress() const -> progress_channel&;

    /**
     * @brief Cancel the session
     * @return invalid_state if the session already ended
     *
     * The session ends in session_state::failed with error_code::cancelled.
     * In-flight attempts finish but their results are ignored.
     */
    [[nodiscard]] auto cancel() -> result<void>;

    /**
     * @brief Block until the session ends
     */
    [[nodiscard]] auto wait() const -> session_result;

    /**
     * @brief Wait with timeout
     * @return Session result, or error_code::timeout
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) const
        -> result<session_result>;

private:
    std::shared_ptr<detail::upload_run> run_;
    std::shared_ptr<adapters::transfer_thread_pool_interface> executor_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_UPLOAD_UPLOAD_HANDLE_H
