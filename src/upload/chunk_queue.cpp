/**
 * @file chunk_queue.cpp
 * @brief Chunk queue implementation
 */

#include <kcenon/chunked_upload/upload/chunk_queue.h>

namespace kcenon::chunked_upload {

void chunk_queue::push_back(chunk_task task) {
    std::lock_guard lock(mutex_);
    tasks_.push_back(std::move(task));
}

void chunk_queue::push_front(chunk_task task) {
    std::lock_guard lock(mutex_);
    tasks_.push_front(std::move(task));
}

auto chunk_queue::try_pop() -> std::optional<chunk_task> {
    std::lock_guard lock(mutex_);
    if (tasks_.empty()) {
        return std::nullopt;
    }
    auto task = std::move(tasks_.front());
    tasks_.pop_front();
    return task;
}

auto chunk_queue::clear() -> std::size_t {
    std::lock_guard lock(mutex_);
    auto dropped = tasks_.size();
    tasks_.clear();
    return dropped;
}

auto chunk_queue::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

auto chunk_queue::empty() const -> bool {
    std::lock_guard lock(mutex_);
    return tasks_.empty();
}

}  // namespace kcenon::chunked_upload
