/**
 * @file upload_types.h
 * @brief Session, chunk and progress types for chunked uploads
 */

#ifndef KCENON_CHUNKED_UPLOAD_UPLOAD_UPLOAD_TYPES_H
#define KCENON_CHUNKED_UPLOAD_UPLOAD_UPLOAD_TYPES_H

#include <kcenon/chunked_upload/core/chunk_config.h>
#include <kcenon/chunked_upload/core/chunk_splitter.h>
#include <kcenon/chunked_upload/core/compression_engine.h>
#include <kcenon/chunked_upload/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief Upload configuration
 */
struct upload_config {
    int64_t chunk_size = chunk_config::default_chunk_size;  ///< Requested chunk size
    std::size_t max_parallel_uploads = 4;
    uint32_t retry_attempts = 3;
    std::chrono::milliseconds retry_delay{1000};  ///< Base of the linear backoff
    compression_mode compression = compression_mode::none;
    std::string guest;  ///< Caller identity sent with start-session

    /**
     * @brief Validate the configuration
     * @return invalid_input for a non-positive chunk size, zero parallelism or a
     *         negative retry delay
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (auto chunk = chunk_config(chunk_size).validate(); !chunk) {
            return chunk;
        }
        if (max_parallel_uploads == 0) {
            return unexpected{error{error_code::invalid_input,
                "max_parallel_uploads must be at least 1"}};
        }
        if (retry_delay.count() < 0) {
            return unexpected{error{error_code::invalid_input,
                "retry_delay must not be negative"}};
        }
        return {};
    }
};

/**
 * @brief Server-issued upload session
 */
struct upload_session {
    std::string upload_id;
    uint64_t total_bytes = 0;
    int64_t chunk_size = 0;  ///< Authoritative chunk size
    uint64_t total_chunks = 0;
    std::chrono::system_clock::time_point created_at;
};

/**
 * @brief Chunk queued for transfer
 */
struct chunk_task {
    chunk_range range;
    uint32_t retry_count = 0;

    [[nodiscard]] auto index() const -> uint64_t { return range.index; }
    [[nodiscard]] auto size() const -> uint64_t { return range.size(); }
};

/**
 * @brief Result of one transfer attempt
 */
struct chunk_outcome {
    uint64_t index = 0;
    bool success = false;
    uint64_t bytes_transferred = 0;  ///< Raw file bytes of the chunk
    uint64_t wire_bytes = 0;         ///< Payload bytes actually sent
    bool compressed = false;
    std::optional<struct error> error;
};

/**
 * @brief Progress after a successful chunk
 */
struct progress_snapshot {
    uint64_t loaded = 0;            ///< Raw bytes of the succeeded chunks
    uint64_t total = 0;             ///< Source size
    int percent = 0;                ///< round(completed_chunks / total_chunks * 100)
    uint64_t completed_chunks = 0;
    uint64_t total_chunks = 0;
};

/**
 * @brief Session lifecycle state
 */
enum class session_state {
    idle,
    starting,
    transferring,
    finalizing,
    completed,
    failed
};

[[nodiscard]] constexpr auto to_string(session_state state) noexcept -> const char* {
    switch (state) {
        case session_state::idle: return "idle";
        case session_state::starting: return "starting";
        case session_state::transferring: return "transferring";
        case session_state::finalizing: return "finalizing";
        case session_state::completed: return "completed";
        case session_state::failed: return "failed";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal_state(session_state state) noexcept -> bool {
    return state == session_state::completed || state == session_state::failed;
}

/**
 * @brief Check a session state transition
 *
 * idle -> starting -> transferring -> finalizing -> completed, and failed from
 * starting, transferring or finalizing.
 */
[[nodiscard]] constexpr auto is_valid_transition(session_state from,
                                                 session_state to) noexcept -> bool {
    switch (from) {
        case session_state::idle:
            return to == session_state::starting;
        case session_state::starting:
            return to == session_state::transferring || to == session_state::failed;
        case session_state::transferring:
            return to == session_state::finalizing || to == session_state::failed;
        case session_state::finalizing:
            return to == session_state::completed || to == session_state::failed;
        case session_state::completed:
        case session_state::failed:
        default:
            return false;
    }
}

/**
 * @brief Terminal failure of a session
 */
struct session_error {
    error_code code = error_code::internal_error;
    std::optional<uint64_t> chunk_index;  ///< Set for chunk failures
    std::string detail;                   ///< Underlying error text
    std::string message;                  ///< Human-readable summary
    std::string upload_id;                ///< Empty when no session was issued
};

/**
 * @brief Summary of a completed session
 */
struct session_summary {
    std::string upload_id;
    std::string filename;
    std::string payload;  ///< Finalize response body, verbatim
    uint64_t total_bytes = 0;
    uint64_t total_chunks = 0;
    int64_t chunk_size = 0;
    uint64_t retries = 0;            ///< Requeued attempts
    uint64_t compressed_chunks = 0;
    uint64_t wire_bytes = 0;         ///< Chunk payload bytes sent (successful attempts)
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Outcome of a session: a summary or a session_error
 */
class session_result {
public:
    session_result(session_summary summary) : summary_(std::move(summary)) {}
    session_result(session_error failure) : failure_(std::move(failure)) {}

    [[nodiscard]] auto succeeded() const noexcept -> bool { return summary_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return succeeded(); }

    /// Requires succeeded()
    [[nodiscard]] auto summary() const -> const session_summary& { return *summary_; }

    /// Requires !succeeded()
    [[nodiscard]] auto failure() const -> const session_error& { return *failure_; }

    [[nodiscard]] auto state() const noexcept -> session_state {
        return succeeded() ? session_state::completed : session_state::failed;
    }

private:
    std::optional<session_summary> summary_;
    std::optional<session_error> failure_;
};

/**
 * @brief Push notifications for a session
 *
 * on_progress is called once per successful chunk, in publication order.
 * Exactly one of on_complete and on_error is called per session.
 */
class upload_observer {
public:
    virtual ~upload_observer() = default;

    virtual void on_progress(const progress_snapshot& /*snapshot*/) {}
    virtual void on_complete(const session_summary& /*summary*/) {}
    virtual void on_error(const session_error& /*failure*/) {}
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_UPLOAD_UPLOAD_TYPES_H
