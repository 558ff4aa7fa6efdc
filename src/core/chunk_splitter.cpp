/**
 * @file chunk_splitter.cpp
 * @brief Implementation of chunk planning
 */

#include <kcenon/chunked_upload/core/chunk_splitter.h>

#include <kcenon/chunked_upload/core/chunk_config.h>

#include <algorithm>
#include <string>

namespace kcenon::chunked_upload {

namespace {

auto validate_inputs(int64_t file_size, int64_t chunk_size) -> result<void> {
    if (file_size < 0) {
        return unexpected(error{
            error_code::invalid_input,
            "file size must not be negative (got " + std::to_string(file_size) + ")"});
    }
    return chunk_config(chunk_size).validate();
}

}  // namespace

auto chunk_splitter::chunk_count(int64_t file_size, int64_t chunk_size)
    -> result<uint64_t> {
    if (auto valid = validate_inputs(file_size, chunk_size); !valid) {
        return unexpected(valid.error());
    }

    auto size = static_cast<uint64_t>(file_size);
    auto step = static_cast<uint64_t>(chunk_size);
    return (size + step - 1) / step;
}

auto chunk_splitter::plan(int64_t file_size, int64_t chunk_size)
    -> result<std::vector<chunk_range>> {
    auto count = chunk_count(file_size, chunk_size);
    if (!count) {
        return unexpected(count.error());
    }

    auto size = static_cast<uint64_t>(file_size);
    auto step = static_cast<uint64_t>(chunk_size);

    std::vector<chunk_range> ranges;
    ranges.reserve(static_cast<std::size_t>(count.value()));

    for (uint64_t index = 0; index < count.value(); ++index) {
        chunk_range range;
        range.index = index;
        range.start = index * step;
        range.end = std::min(range.start + step, size);
        ranges.push_back(range);
    }

    return ranges;
}

}  // namespace kcenon::chunked_upload
