/**
 * @file upload_run.h
 * @brief State of one upload session (internal)
 */

#ifndef KCENON_CHUNKED_UPLOAD_SRC_UPLOAD_UPLOAD_RUN_H
#define KCENON_CHUNKED_UPLOAD_SRC_UPLOAD_UPLOAD_RUN_H

#include <kcenon/chunked_upload/adapters/thread_pool_adapter.h>
#include <kcenon/chunked_upload/core/chunk_source.h>
#include <kcenon/chunked_upload/core/compression_engine.h>
#include <kcenon/chunked_upload/core/logging.h>
#include <kcenon/chunked_upload/transport/upload_endpoint.h>
#include <kcenon/chunked_upload/upload/cancellation_token.h>
#include <kcenon/chunked_upload/upload/progress_channel.h>
#include <kcenon/chunked_upload/upload/transfer_worker_pool.h>
#include <kcenon/chunked_upload/upload/upload_types.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace kcenon::chunked_upload::detail {

/**
 * @brief One session: lifecycle, counters and terminal result
 *
 * Worker pool callbacks hold weak references, so an abandoned session is
 * released once its last in-flight task returns.
 */
class upload_run : public std::enable_shared_from_this<upload_run> {
public:
    upload_run(upload_config config,
               std::shared_ptr<upload_endpoint> endpoint,
               std::shared_ptr<chunk_source> source,
               std::shared_ptr<upload_observer> observer,
               std::weak_ptr<adapters::transfer_thread_pool_interface> executor);

    upload_run(const upload_run&) = delete;
    auto operator=(const upload_run&) -> upload_run& = delete;

    /**
     * @brief Enter starting and schedule the start-session request
     */
    void launch();

    [[nodiscard]] auto state() const -> session_state;
    [[nodiscard]] auto upload_id() const -> std::string;
    [[nodiscard]] auto progress() -> progress_channel& { return progress_; }

    [[nodiscard]] auto cancel() -> result<void>;

    [[nodiscard]] auto wait() -> session_result;
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout)
        -> std::optional<session_result>;

private:
    void begin();

    [[nodiscard]] auto attempt(const chunk_task& task) -> chunk_outcome;

    void on_chunk_success(const chunk_task& task, const chunk_outcome& outcome);
    void on_drained();
    void on_pool_failed(std::optional<uint64_t> chunk_index, const error& failure);

    /// Requires mutex_
    auto transition(session_state to) -> bool;

    void finish(session_result outcome);

    [[nodiscard]] auto failure(error_code code,
                               std::optional<uint64_t> chunk_index,
                               std::string detail,
                               std::string message) const -> session_error;

    [[nodiscard]] auto log_context() const -> upload_log_context;

    const upload_config config_;
    const std::shared_ptr<upload_endpoint> endpoint_;
    const std::shared_ptr<chunk_source> source_;
    const std::shared_ptr<upload_observer> observer_;
    const std::weak_ptr<adapters::transfer_thread_pool_interface> executor_;

    compression_engine compression_;
    cancellation_token token_;
    progress_channel progress_;
    std::chrono::steady_clock::time_point started_at_;

    mutable std::mutex mutex_;
    std::condition_variable done_cv_;
    session_state state_ = session_state::idle;
    bool terminal_claimed_ = false;
    upload_session session_;
    std::shared_ptr<transfer_worker_pool> worker_pool_;
    uint64_t completed_chunks_ = 0;
    uint64_t uploaded_bytes_ = 0;
    uint64_t wire_bytes_ = 0;
    uint64_t compressed_chunks_ = 0;
    std::optional<session_result> result_;

    // Serializes progress publication with the terminal notification. Recursive
    // because observer callbacks may cancel the session.
    std::recursive_mutex notify_mutex_;
};

}  // namespace kcenon::chunked_upload::detail

#endif  // KCENON_CHUNKED_UPLOAD_SRC_UPLOAD_UPLOAD_RUN_H
