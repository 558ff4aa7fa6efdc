/**
 * @file upload_endpoint.h
 * @brief Remote endpoint contract consumed by the upload orchestrator
 */

#ifndef KCENON_CHUNKED_UPLOAD_TRANSPORT_UPLOAD_ENDPOINT_H
#define KCENON_CHUNKED_UPLOAD_TRANSPORT_UPLOAD_ENDPOINT_H

#include <kcenon/chunked_upload/core/types.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief Response of a successful start-session request
 */
struct session_grant {
    std::string upload_id;   ///< Opaque session token
    int64_t chunk_size = 0;  ///< Authoritative chunk size
};

/**
 * @brief One chunk transfer attempt
 */
struct chunk_upload_request {
    std::string upload_id;
    uint64_t chunk_index = 0;
    uint64_t total_chunks = 0;
    std::span<const std::byte> payload;
    bool compressed = false;       ///< payload is LZ4 compressed
    uint64_t original_size = 0;    ///< Raw chunk length
};

/**
 * @brief Remote upload endpoint
 *
 * Implementations must accept concurrent upload_chunk() calls.
 *
 * Error codes: start_session fails with session_start_failure, upload_chunk
 * with chunk_transfer_failure, complete_session with finalize_failure. The
 * message carries the endpoint's error detail when one was returned.
 */
class upload_endpoint {
public:
    virtual ~upload_endpoint() = default;

    /**
     * @brief Open an upload session
     * @param filename Name of the uploaded file
     * @param total_chunks Chunk count for the requested chunk size
     * @param guest Caller identity
     */
    [[nodiscard]] virtual auto start_session(const std::string& filename,
                                             uint64_t total_chunks,
                                             const std::string& guest)
        -> result<session_grant> = 0;

    /**
     * @brief Send one chunk
     */
    [[nodiscard]] virtual auto upload_chunk(const chunk_upload_request& request)
        -> result<void> = 0;

    /**
     * @brief Finalize the session
     * @return Result payload, forwarded verbatim
     */
    [[nodiscard]] virtual auto complete_session(const std::string& upload_id)
        -> result<std::string> = 0;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_TRANSPORT_UPLOAD_ENDPOINT_H
