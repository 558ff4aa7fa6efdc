/**
 * @file chunk_source.h
 * @brief Random-access byte sources that chunk ranges are read from
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_CHUNK_SOURCE_H
#define KCENON_CHUNKED_UPLOAD_CORE_CHUNK_SOURCE_H

#include <kcenon/chunked_upload/core/chunk_splitter.h>
#include <kcenon/chunked_upload/core/types.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief Source of the bytes being uploaded
 *
 * Implementations must allow concurrent read() calls from several workers.
 */
class chunk_source {
public:
    virtual ~chunk_source() = default;

    /**
     * @brief Name reported to the endpoint as the upload filename
     */
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /**
     * @brief Total number of bytes
     */
    [[nodiscard]] virtual auto size() const -> uint64_t = 0;

    /**
     * @brief Read the bytes of one chunk
     * @param range Range inside [0, size())
     * @return Exactly range.size() bytes, or an error
     */
    [[nodiscard]] virtual auto read(const chunk_range& range) -> result<byte_buffer> = 0;
};

/**
 * @brief chunk_source backed by a file on disk
 */
class file_chunk_source : public chunk_source {
public:
    /**
     * @brief Open a file for chunked reading
     * @param path File to upload
     * @return Source or file_not_found / file_read_error
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> result<std::shared_ptr<file_chunk_source>>;

    [[nodiscard]] auto name() const -> std::string override;
    [[nodiscard]] auto size() const -> uint64_t override;
    [[nodiscard]] auto read(const chunk_range& range) -> result<byte_buffer> override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    file_chunk_source(std::filesystem::path path, std::ifstream file, uint64_t size);

private:
    std::filesystem::path path_;
    std::ifstream file_;
    uint64_t size_;
    std::mutex file_mutex_;
};

/**
 * @brief chunk_source over an in-memory buffer
 */
class memory_chunk_source : public chunk_source {
public:
    memory_chunk_source(std::string name, byte_buffer data);

    [[nodiscard]] auto name() const -> std::string override;
    [[nodiscard]] auto size() const -> uint64_t override;
    [[nodiscard]] auto read(const chunk_range& range) -> result<byte_buffer> override;

private:
    std::string name_;
    byte_buffer data_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_CHUNK_SOURCE_H
