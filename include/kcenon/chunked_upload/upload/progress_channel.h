/**
 * @file progress_channel.h
 * @brief Stream of progress snapshots published by a session
 */

#ifndef KCENON_CHUNKED_UPLOAD_UPLOAD_PROGRESS_CHANNEL_H
#define KCENON_CHUNKED_UPLOAD_UPLOAD_PROGRESS_CHANNEL_H

#include <kcenon/chunked_upload/upload/upload_types.h>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace kcenon::chunked_upload {

/**
 * @brief Multi-producer, single-consumer channel of progress snapshots
 *
 * The session closes the channel when it reaches a terminal state. Snapshots
 * published before close() remain readable afterwards.
 *
 * @code
 * while (auto snapshot = handle.progress().receive()) {
 *     std::cout << snapshot->percent << "%\n";
 * }
 * @endcode
 */
class progress_channel {
public:
    progress_channel() = default;

    progress_channel(const progress_channel&) = delete;
    auto operator=(const progress_channel&) -> progress_channel& = delete;

    /**
     * @brief Append a snapshot; ignored once closed
     * @return false if the channel was closed
     */
    auto publish(const progress_snapshot& snapshot) -> bool;

    /**
     * @brief Mark the end of the stream and wake waiting receivers
     */
    void close();

    /**
     * @brief Block until a snapshot is available or the channel is drained
     * @return Next snapshot, nullopt once closed and empty
     */
    [[nodiscard]] auto receive() -> std::optional<progress_snapshot>;

    /**
     * @brief Like receive(), giving up after timeout
     */
    [[nodiscard]] auto receive_for(std::chrono::milliseconds timeout)
        -> std::optional<progress_snapshot>;

    [[nodiscard]] auto try_receive() -> std::optional<progress_snapshot>;

    [[nodiscard]] auto is_closed() const -> bool;

    /**
     * @brief Most recently published snapshot
     */
    [[nodiscard]] auto latest() const -> progress_snapshot;

private:
    auto pop_locked() -> std::optional<progress_snapshot>;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<progress_snapshot> pending_;
    progress_snapshot latest_;
    bool closed_ = false;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_UPLOAD_PROGRESS_CHANNEL_H
