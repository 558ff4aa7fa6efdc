/**
 * @file http_upload_endpoint.h
 * @brief upload_endpoint over the photo service HTTP API
 *
 * | Operation        | Request                                               |
 * |------------------|-------------------------------------------------------|
 * | start_session    | POST {base}/api/upload/start (urlencoded form)        |
 * | upload_chunk     | POST {base}/api/upload/chunk/{id} (multipart form)    |
 * | complete_session | POST {base}/api/upload/complete/{id} (empty body)     |
 */

#ifndef KCENON_CHUNKED_UPLOAD_TRANSPORT_HTTP_UPLOAD_ENDPOINT_H
#define KCENON_CHUNKED_UPLOAD_TRANSPORT_HTTP_UPLOAD_ENDPOINT_H

#include <kcenon/chunked_upload/transport/http_client.h>
#include <kcenon/chunked_upload/transport/upload_endpoint.h>

#include <chrono>
#include <memory>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief Endpoint location and request settings
 */
struct endpoint_config {
    /// Base URL prepended to the API paths; empty means relative paths
    std::string api_base_url;

    /// Per-request timeout
    std::chrono::milliseconds request_timeout{30000};

    /**
     * @brief Read the base URL from the environment
     *
     * CHUNKED_UPLOAD_API_BASE_URL is used when set, then API_BASE_URL.
     */
    [[nodiscard]] static auto from_environment() -> endpoint_config;
};

/**
 * @brief HTTP implementation of upload_endpoint
 */
class http_upload_endpoint : public upload_endpoint {
public:
    /**
     * @param config Endpoint location
     * @param client HTTP client; nullptr selects make_http_client()
     */
    explicit http_upload_endpoint(endpoint_config config,
                                  std::shared_ptr<http_client_interface> client = nullptr);

    [[nodiscard]] auto start_session(const std::string& filename,
                                     uint64_t total_chunks,
                                     const std::string& guest)
        -> result<session_grant> override;

    [[nodiscard]] auto upload_chunk(const chunk_upload_request& request)
        -> result<void> override;

    [[nodiscard]] auto complete_session(const std::string& upload_id)
        -> result<std::string> override;

    [[nodiscard]] auto config() const -> const endpoint_config& { return config_; }

private:
    [[nodiscard]] auto url(const std::string& path) const -> std::string;

    endpoint_config config_;
    std::shared_ptr<http_client_interface> client_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_TRANSPORT_HTTP_UPLOAD_ENDPOINT_H
