/**
 * @file progress_channel.cpp
 * @brief Progress channel implementation
 */

#include <kcenon/chunked_upload/upload/progress_channel.h>

namespace kcenon::chunked_upload {

auto progress_channel::publish(const progress_snapshot& snapshot) -> bool {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return false;
        }
        pending_.push_back(snapshot);
        latest_ = snapshot;
    }
    cv_.notify_one();
    return true;
}

void progress_channel::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

auto progress_channel::pop_locked() -> std::optional<progress_snapshot> {
    if (pending_.empty()) {
        return std::nullopt;
    }
    auto snapshot = pending_.front();
    pending_.pop_front();
    return snapshot;
}

auto progress_channel::receive() -> std::optional<progress_snapshot> {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !pending_.empty(); });
    return pop_locked();
}

auto progress_channel::receive_for(std::chrono::milliseconds timeout)
    -> std::optional<progress_snapshot> {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !pending_.empty(); });
    return pop_locked();
}

auto progress_channel::try_receive() -> std::optional<progress_snapshot> {
    std::lock_guard lock(mutex_);
    return pop_locked();
}

auto progress_channel::is_closed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
}

auto progress_channel::latest() const -> progress_snapshot {
    std::lock_guard lock(mutex_);
    return latest_;
}

}  // namespace kcenon::chunked_upload
