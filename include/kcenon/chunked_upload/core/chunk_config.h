/**
 * @file chunk_config.h
 * @brief Chunk sizing constants and validation
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_CHUNK_CONFIG_H
#define KCENON_CHUNKED_UPLOAD_CORE_CHUNK_CONFIG_H

#include <kcenon/chunked_upload/core/types.h>

#include <cstdint>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief Chunk size requested from the endpoint
 *
 * The endpoint may answer with a different authoritative size; the chunk plan
 * always uses the size returned by start-session.
 */
struct chunk_config {
    /// Default chunk size (5MiB)
    static constexpr int64_t default_chunk_size = 5 * 1024 * 1024;

    int64_t chunk_size = default_chunk_size;

    chunk_config() = default;

    explicit chunk_config(int64_t size) : chunk_size(size) {}

    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size <= 0) {
            return unexpected(error{
                error_code::invalid_input,
                "chunk size must be positive (got " + std::to_string(chunk_size) + ")"});
        }
        return {};
    }
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_CHUNK_CONFIG_H
