/**
 * @file chunked_upload.h
 * @brief Main header for chunked_upload library
 * @version 0.1.0
 *
 * Include this header to access the upload orchestrator, its endpoint
 * contract and the HTTP binding.
 *
 * @code
 * #include <kcenon/chunked_upload/chunked_upload.h>
 *
 * using namespace kcenon::chunked_upload;
 *
 * auto orchestrator = upload_orchestrator::builder()
 *     .with_endpoint(std::make_shared<http_upload_endpoint>(
 *         endpoint_config::from_environment()))
 *     .with_max_parallel_uploads(4)
 *     .build();
 *
 * auto outcome = orchestrator.value().upload("archive.tar");
 * @endcode
 */

#ifndef KCENON_CHUNKED_UPLOAD_CHUNKED_UPLOAD_H
#define KCENON_CHUNKED_UPLOAD_CHUNKED_UPLOAD_H

#include <cstdint>
#include <string>

// Core
#include "kcenon/chunked_upload/core/types.h"
#include "kcenon/chunked_upload/core/chunk_config.h"
#include "kcenon/chunked_upload/core/chunk_splitter.h"
#include "kcenon/chunked_upload/core/chunk_source.h"
#include "kcenon/chunked_upload/core/compression_engine.h"
#include "kcenon/chunked_upload/core/logging.h"

// Transport
#include "kcenon/chunked_upload/transport/upload_endpoint.h"
#include "kcenon/chunked_upload/transport/http_client.h"
#include "kcenon/chunked_upload/transport/http_upload_endpoint.h"

// Upload
#include "kcenon/chunked_upload/upload/upload_types.h"
#include "kcenon/chunked_upload/upload/retry_controller.h"
#include "kcenon/chunked_upload/upload/transfer_worker_pool.h"
#include "kcenon/chunked_upload/upload/upload_handle.h"
#include "kcenon/chunked_upload/upload/upload_orchestrator.h"

// Adapters
#include "kcenon/chunked_upload/adapters/thread_pool_adapter.h"

namespace kcenon::chunked_upload {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CHUNKED_UPLOAD_H
