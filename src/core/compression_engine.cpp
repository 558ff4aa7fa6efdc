/**
 * @file compression_engine.cpp
 * @brief LZ4 compression engine implementation
 */

#include <kcenon/chunked_upload/core/compression_engine.h>

#include <kcenon/chunked_upload/config/feature_flags.h>
#include <kcenon/chunked_upload/core/logging.h>

#include <algorithm>
#include <array>
#include <mutex>
#include <string>

#if CHUNKED_UPLOAD_HAS_LZ4
#include <lz4.h>
#include <lz4hc.h>
#endif

namespace kcenon::chunked_upload {

namespace {

#if CHUNKED_UPLOAD_HAS_LZ4

struct magic_signature {
    std::array<uint8_t, 8> bytes;
    std::size_t length;
};

// Formats that LZ4 cannot shrink further. Photo uploads are mostly JPEG/PNG.
constexpr std::array<magic_signature, 12> precompressed_signatures = {{
    {{0x50, 0x4B, 0x03, 0x04}, 4},                          // ZIP
    {{0x1F, 0x8B}, 2},                                      // GZIP
    {{0x28, 0xB5, 0x2F, 0xFD}, 4},                          // ZSTD
    {{0xFD, 0x37, 0x7A, 0x58, 0x5A, 0x00}, 6},              // XZ
    {{0x42, 0x5A, 0x68}, 3},                                // BZIP2
    {{0x04, 0x22, 0x4D, 0x18}, 4},                          // LZ4 frame
    {{0xFF, 0xD8, 0xFF}, 3},                                // JPEG
    {{0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A}, 8},  // PNG
    {{0x47, 0x49, 0x46, 0x38}, 4},                          // GIF
    {{0x52, 0x49, 0x46, 0x46}, 4},                          // RIFF (WEBP)
    {{0x37, 0x7A, 0xBC, 0xAF, 0x27, 0x1C}, 6},              // 7-Zip
    {{0x00, 0x00, 0x00, 0x0C, 0x6A, 0x50, 0x20, 0x20}, 8},  // JPEG 2000
}};

// ISO base media (MP4, MOV, HEIC) carries 'ftyp' at offset 4
auto has_ftyp_box(std::span<const std::byte> data) -> bool {
    return data.size() >= 12 &&
           static_cast<uint8_t>(data[4]) == 0x66 &&
           static_cast<uint8_t>(data[5]) == 0x74 &&
           static_cast<uint8_t>(data[6]) == 0x79 &&
           static_cast<uint8_t>(data[7]) == 0x70;
}

auto is_precompressed_format(std::span<const std::byte> data) -> bool {
    for (const auto& sig : precompressed_signatures) {
        if (data.size() < sig.length) {
            continue;
        }
        bool match = true;
        for (std::size_t i = 0; i < sig.length; ++i) {
            if (static_cast<uint8_t>(data[i]) != sig.bytes[i]) {
                match = false;
                break;
            }
        }
        if (match) {
            return true;
        }
    }
    return has_ftyp_box(data);
}

constexpr std::size_t sample_size = 4096;
constexpr double min_compression_ratio = 1.1;

// LZ4 block sizes are int; larger spans would wrap
auto exceeds_block_limit(std::size_t size) -> bool {
    return size > static_cast<std::size_t>(LZ4_MAX_INPUT_SIZE);
}

#endif

}  // namespace

class compression_engine::impl {
public:
    explicit impl(compression_level level) : level_(level) {}

    auto compress(std::span<const std::byte> input) -> result<byte_buffer> {
#if CHUNKED_UPLOAD_HAS_LZ4
        if (input.empty()) {
            return byte_buffer{};
        }
        if (exceeds_block_limit(input.size())) {
            return unexpected(error(error_code::compression_failed,
                                    "input too large for LZ4: " +
                                        std::to_string(input.size()) + " bytes"));
        }

        const int src_size = static_cast<int>(input.size());
        const int max_dst_size = LZ4_compressBound(src_size);

        byte_buffer output(static_cast<std::size_t>(max_dst_size));

        int compressed_size = 0;
        if (level_ == compression_level::high) {
            compressed_size = LZ4_compress_HC(
                reinterpret_cast<const char*>(input.data()),
                reinterpret_cast<char*>(output.data()),
                src_size,
                max_dst_size,
                LZ4HC_CLEVEL_DEFAULT);
        } else {
            compressed_size = LZ4_compress_default(
                reinterpret_cast<const char*>(input.data()),
                reinterpret_cast<char*>(output.data()),
                src_size,
                max_dst_size);
        }

        if (compressed_size <= 0) {
            return unexpected(error(error_code::compression_failed,
                                    "LZ4 compression failed for " +
                                        std::to_string(input.size()) + " bytes"));
        }

        output.resize(static_cast<std::size_t>(compressed_size));
        return output;
#else
        (void)input;
        return unexpected(error(error_code::compression_failed,
                                "LZ4 compression not enabled"));
#endif
    }

    auto decompress(std::span<const std::byte> input, std::size_t original_size)
        -> result<byte_buffer> {
#if CHUNKED_UPLOAD_HAS_LZ4
        if (input.empty() && original_size == 0) {
            return byte_buffer{};
        }
        if (exceeds_block_limit(input.size()) || exceeds_block_limit(original_size)) {
            return unexpected(error(error_code::decompression_failed,
                                    "block too large for LZ4: expected " +
                                        std::to_string(original_size) + " bytes from " +
                                        std::to_string(input.size())));
        }

        byte_buffer output(original_size);

        const int decompressed_size = LZ4_decompress_safe(
            reinterpret_cast<const char*>(input.data()),
            reinterpret_cast<char*>(output.data()),
            static_cast<int>(input.size()),
            static_cast<int>(original_size));

        if (decompressed_size < 0) {
            return unexpected(error(error_code::decompression_failed,
                                    "LZ4 decompression failed: corrupted data"));
        }
        if (static_cast<std::size_t>(decompressed_size) != original_size) {
            return unexpected(error(error_code::decompression_failed,
                                    "LZ4 decompression size mismatch: expected " +
                                        std::to_string(original_size) + ", got " +
                                        std::to_string(decompressed_size)));
        }
        return output;
#else
        (void)input;
        (void)original_size;
        return unexpected(error(error_code::decompression_failed,
                                "LZ4 compression not enabled"));
#endif
    }

    auto is_compressible(std::span<const std::byte> data) const -> bool {
#if CHUNKED_UPLOAD_HAS_LZ4
        if (data.empty() || is_precompressed_format(data)) {
            return false;
        }

        auto sample = data.subspan(0, std::min(data.size(), sample_size));
        const int src_size = static_cast<int>(sample.size());
        const int max_dst_size = LZ4_compressBound(src_size);

        std::vector<char> scratch(static_cast<std::size_t>(max_dst_size));
        const int compressed_size = LZ4_compress_default(
            reinterpret_cast<const char*>(sample.data()),
            scratch.data(),
            src_size,
            max_dst_size);

        if (compressed_size <= 0) {
            return false;
        }

        const double ratio =
            static_cast<double>(sample.size()) / static_cast<double>(compressed_size);
        return ratio >= min_compression_ratio;
#else
        (void)data;
        return false;
#endif
    }

    auto compress_chunk(std::span<const std::byte> input, compression_mode mode)
        -> compressed_payload {
        compressed_payload payload;
        payload.original_size = input.size();

        bool should_compress = false;
        if (!input.empty() && compression_engine::is_available()) {
            switch (mode) {
                case compression_mode::always:
                    should_compress = true;
                    break;
                case compression_mode::adaptive:
                    should_compress = is_compressible(input);
                    break;
                case compression_mode::none:
                default:
                    should_compress = false;
                    break;
            }
        }

        if (should_compress) {
            auto compressed = compress(input);
            if (compressed.has_value()) {
                payload.data = std::move(compressed.value());
                payload.compressed = true;
                record(input.size(), payload.data.size(), true, false);
                return payload;
            }
            CU_LOG_WARN(log_category::compression,
                "Compression failed, using uncompressed chunk: " +
                    compressed.error().message);
            payload.data.assign(input.begin(), input.end());
            record(input.size(), input.size(), false, true);
            return payload;
        }

        payload.data.assign(input.begin(), input.end());
        record(input.size(), input.size(), false, false);
        return payload;
    }

    auto stats() const -> compression_stats {
        std::lock_guard lock(stats_mutex_);
        return stats_;
    }

    auto reset_stats() -> void {
        std::lock_guard lock(stats_mutex_);
        stats_ = compression_stats{};
    }

    auto level() const -> compression_level { return level_; }

private:
    void record(std::size_t in, std::size_t out, bool compressed, bool failed) {
        std::lock_guard lock(stats_mutex_);
        stats_.total_input_bytes += in;
        stats_.total_output_bytes += out;
        if (compressed) {
            stats_.compressed_chunks++;
        } else if (failed) {
            stats_.failed_compressions++;
        } else {
            stats_.skipped_chunks++;
        }
    }

    compression_level level_;
    compression_stats stats_;
    mutable std::mutex stats_mutex_;
};

compression_engine::compression_engine(compression_level level)
    : impl_(std::make_unique<impl>(level)) {}

compression_engine::~compression_engine() = default;

compression_engine::compression_engine(compression_engine&&) noexcept = default;

auto compression_engine::operator=(compression_engine&&) noexcept
    -> compression_engine& = default;

auto compression_engine::is_available() noexcept -> bool {
#if CHUNKED_UPLOAD_HAS_LZ4
    return true;
#else
    return false;
#endif
}

auto compression_engine::compress_chunk(std::span<const std::byte> input,
                                        compression_mode mode) -> compressed_payload {
    return impl_->compress_chunk(input, mode);
}

auto compression_engine::compress(std::span<const std::byte> input)
    -> result<byte_buffer> {
    return impl_->compress(input);
}

auto compression_engine::decompress(std::span<const std::byte> input,
                                    std::size_t original_size) -> result<byte_buffer> {
    return impl_->decompress(input, original_size);
}

auto compression_engine::is_compressible(std::span<const std::byte> data) const -> bool {
    return impl_->is_compressible(data);
}

auto compression_engine::stats() const -> compression_stats {
    return impl_->stats();
}

auto compression_engine::reset_stats() -> void {
    impl_->reset_stats();
}

auto compression_engine::level() const -> compression_level {
    return impl_->level();
}

}  // namespace kcenon::chunked_upload
