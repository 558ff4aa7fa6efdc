/**
 * @file compression_engine.h
 * @brief Best-effort LZ4 compression of chunk payloads
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_COMPRESSION_ENGINE_H
#define KCENON_CHUNKED_UPLOAD_CORE_COMPRESSION_ENGINE_H

#include <kcenon/chunked_upload/core/types.h>

#include <cstddef>
#include <memory>
#include <span>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief Compression mode for chunk payloads
 */
enum class compression_mode {
    none,      ///< Send raw bytes
    always,    ///< Compress every chunk
    adaptive   ///< Compress only chunks that look compressible
};

[[nodiscard]] constexpr auto to_string(compression_mode mode) -> const char* {
    switch (mode) {
        case compression_mode::none: return "none";
        case compression_mode::always: return "always";
        case compression_mode::adaptive: return "adaptive";
        default: return "unknown";
    }
}

/**
 * @brief Compression level
 */
enum class compression_level {
    fast,     ///< LZ4 default compression
    high      ///< LZ4 HC compression
};

/**
 * @brief Compression counters
 */
struct compression_stats {
    uint64_t total_input_bytes = 0;      ///< Bytes handed to compress_chunk
    uint64_t total_output_bytes = 0;     ///< Bytes returned by compress_chunk
    uint64_t compressed_chunks = 0;      ///< Chunks sent compressed
    uint64_t skipped_chunks = 0;         ///< Chunks sent raw by decision
    uint64_t failed_compressions = 0;    ///< Chunks sent raw after a failure

    /**
     * @brief Output/input ratio (1.0 means no benefit)
     */
    [[nodiscard]] auto compression_ratio() const -> double {
        if (total_input_bytes == 0) return 1.0;
        return static_cast<double>(total_output_bytes) /
               static_cast<double>(total_input_bytes);
    }

    [[nodiscard]] auto bytes_saved() const -> uint64_t {
        if (total_output_bytes >= total_input_bytes) return 0;
        return total_input_bytes - total_output_bytes;
    }
};

/**
 * @brief Payload produced by compress_chunk
 */
struct compressed_payload {
    byte_buffer data;
    bool compressed = false;
    std::size_t original_size = 0;
};

/**
 * @brief LZ4 compression engine
 *
 * compress_chunk() never fails: when LZ4 is not built in, when the mode says
 * no, when the data is already compressed (JPEG, PNG, ZIP, ...) or when LZ4
 * reports an error, the original bytes are returned with compressed == false.
 *
 * @code
 * compression_engine engine;
 * auto payload = engine.compress_chunk(bytes, compression_mode::adaptive);
 * send(payload.data, payload.compressed);
 * @endcode
 */
class compression_engine {
public:
    explicit compression_engine(compression_level level = compression_level::fast);
    ~compression_engine();

    compression_engine(const compression_engine&) = delete;
    auto operator=(const compression_engine&) -> compression_engine& = delete;
    compression_engine(compression_engine&&) noexcept;
    auto operator=(compression_engine&&) noexcept -> compression_engine&;

    /**
     * @brief Whether LZ4 support was compiled in
     */
    [[nodiscard]] static auto is_available() noexcept -> bool;

    /**
     * @brief Best-effort compression of one chunk
     * @param input Raw chunk bytes
     * @param mode Compression mode
     * @return Compressed bytes, or the input unchanged
     */
    [[nodiscard]] auto compress_chunk(std::span<const std::byte> input,
                                      compression_mode mode) -> compressed_payload;

    /**
     * @brief Strict LZ4 compression
     * @return Compressed data or compression_failed
     */
    [[nodiscard]] auto compress(std::span<const std::byte> input) -> result<byte_buffer>;

    /**
     * @brief LZ4 decompression
     * @param input Compressed data
     * @param original_size Expected decompressed size
     * @return Decompressed data or decompression_failed
     */
    [[nodiscard]] auto decompress(std::span<const std::byte> input,
                                  std::size_t original_size) -> result<byte_buffer>;

    /**
     * @brief Check whether data is worth compressing
     *
     * Returns false for known pre-compressed formats and for data whose first
     * 4KB compresses by less than 1.1x.
     */
    [[nodiscard]] auto is_compressible(std::span<const std::byte> data) const -> bool;

    [[nodiscard]] auto stats() const -> compression_stats;
    auto reset_stats() -> void;

    [[nodiscard]] auto level() const -> compression_level;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_COMPRESSION_ENGINE_H
