/**
 * @file chunk_splitter.h
 * @brief Derives the chunk plan of a file
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_CHUNK_SPLITTER_H
#define KCENON_CHUNKED_UPLOAD_CORE_CHUNK_SPLITTER_H

#include <kcenon/chunked_upload/core/types.h>

#include <cstdint>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief Half-open byte range [start, end) of one chunk
 */
struct chunk_range {
    uint64_t index = 0;
    uint64_t start = 0;
    uint64_t end = 0;

    [[nodiscard]] auto size() const noexcept -> uint64_t { return end - start; }

    [[nodiscard]] auto operator==(const chunk_range& other) const -> bool = default;
};

/**
 * @brief Splits a byte count into contiguous chunk ranges
 *
 * The splitter only computes ranges; reading the bytes is the job of a
 * chunk_source. Output depends on the inputs alone, so planning the same
 * (file_size, chunk_size) twice yields identical plans.
 *
 * @code
 * auto plan = chunk_splitter::plan(12'000'000, 5'000'000);
 * // plan.value() == {{0, 0, 5000000}, {1, 5000000, 10000000}, {2, 10000000, 12000000}}
 * @endcode
 */
class chunk_splitter {
public:
    /**
     * @brief Compute the chunk plan
     * @param file_size Total byte count, must be >= 0
     * @param chunk_size Maximum chunk length, must be > 0
     * @return Ordered ranges partitioning [0, file_size), or invalid_input
     */
    [[nodiscard]] static auto plan(int64_t file_size, int64_t chunk_size)
        -> result<std::vector<chunk_range>>;

    /**
     * @brief Number of chunks plan() would produce
     * @return ceil(file_size / chunk_size), or invalid_input
     */
    [[nodiscard]] static auto chunk_count(int64_t file_size, int64_t chunk_size)
        -> result<uint64_t>;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_CHUNK_SPLITTER_H
