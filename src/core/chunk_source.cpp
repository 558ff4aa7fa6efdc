/**
 * @file chunk_source.cpp
 * @brief File and memory chunk sources
 */

#include <kcenon/chunked_upload/core/chunk_source.h>

#include <kcenon/chunked_upload/core/logging.h>

namespace kcenon::chunked_upload {

namespace {

auto check_range(const chunk_range& range, uint64_t size) -> result<void> {
    if (range.start > range.end || range.end > size) {
        return unexpected(error{
            error_code::invalid_chunk_range,
            "chunk " + std::to_string(range.index) + " range [" +
                std::to_string(range.start) + ", " + std::to_string(range.end) +
                ") outside source of " + std::to_string(size) + " bytes"});
    }
    return {};
}

}  // namespace

// file_chunk_source

file_chunk_source::file_chunk_source(std::filesystem::path path,
                                     std::ifstream file,
                                     uint64_t size)
    : path_(std::move(path)), file_(std::move(file)), size_(size) {}

auto file_chunk_source::open(const std::filesystem::path& path)
    -> result<std::shared_ptr<file_chunk_source>> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected(
            error{error_code::file_not_found, "file not found: " + path.string()});
    }

    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(error{error_code::file_read_error,
                                "cannot get file size: " + path.string()});
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_read_error, "cannot open file: " + path.string()});
    }

    CU_LOG_DEBUG(log_category::splitter,
        "Opened " + path.string() + " (" + std::to_string(file_size) + " bytes)");

    return std::make_shared<file_chunk_source>(path, std::move(file), file_size);
}

auto file_chunk_source::name() const -> std::string {
    return path_.filename().string();
}

auto file_chunk_source::size() const -> uint64_t {
    return size_;
}

auto file_chunk_source::read(const chunk_range& range) -> result<byte_buffer> {
    if (auto valid = check_range(range, size_); !valid) {
        return unexpected(valid.error());
    }

    byte_buffer buffer(static_cast<std::size_t>(range.size()));
    if (buffer.empty()) {
        return buffer;
    }

    std::lock_guard lock(file_mutex_);

    file_.clear();
    file_.seekg(static_cast<std::streamoff>(range.start), std::ios::beg);
    if (!file_.good()) {
        return unexpected(error{error_code::file_read_error, "seek failed"});
    }

    file_.read(reinterpret_cast<char*>(buffer.data()),
               static_cast<std::streamsize>(buffer.size()));
    auto bytes_read = static_cast<std::size_t>(file_.gcount());

    if (bytes_read != buffer.size()) {
        return unexpected(error{
            error_code::file_read_error,
            "short read for chunk " + std::to_string(range.index) + ": expected " +
                std::to_string(buffer.size()) + " bytes, got " +
                std::to_string(bytes_read)});
    }

    return buffer;
}

// memory_chunk_source

memory_chunk_source::memory_chunk_source(std::string name, byte_buffer data)
    : name_(std::move(name)), data_(std::move(data)) {}

auto memory_chunk_source::name() const -> std::string {
    return name_;
}

auto memory_chunk_source::size() const -> uint64_t {
    return data_.size();
}

auto memory_chunk_source::read(const chunk_range& range) -> result<byte_buffer> {
    if (auto valid = check_range(range, data_.size()); !valid) {
        return unexpected(valid.error());
    }

    auto first = data_.begin() + static_cast<std::ptrdiff_t>(range.start);
    auto last = data_.begin() + static_cast<std::ptrdiff_t>(range.end);
    return byte_buffer(first, last);
}

}  // namespace kcenon::chunked_upload
