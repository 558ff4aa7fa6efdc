/**
 * @file http_client.h
 * @brief HTTP client abstraction used by the upload endpoint
 *
 * network_http_client wraps the network_system HTTP client. Tests substitute
 * their own http_client_interface implementation.
 */

#ifndef KCENON_CHUNKED_UPLOAD_TRANSPORT_HTTP_CLIENT_H
#define KCENON_CHUNKED_UPLOAD_TRANSPORT_HTTP_CLIENT_H

#include <kcenon/chunked_upload/core/types.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace kcenon::chunked_upload {

/**
 * @brief HTTP response
 */
struct http_response {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    std::map<std::string, std::string> headers;

    /// Response body
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return s;
        };
        const auto lower_key = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == lower_key) {
                return v;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Check for a 2xx status
     */
    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Minimal HTTP client interface
 *
 * A returned error means the request never produced a response (connection
 * refused, timeout, ...). Non-2xx responses are returned as values.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    /**
     * @brief Execute POST request with string body
     */
    [[nodiscard]] virtual auto post(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers) -> result<http_response> = 0;

    /**
     * @brief Execute POST request with binary body
     */
    [[nodiscard]] virtual auto post(
        const std::string& url,
        const std::vector<uint8_t>& body,
        const std::map<std::string, std::string>& headers) -> result<http_response> = 0;
};

/**
 * @brief http_client_interface backed by kcenon::network::core::http_client
 *
 * Without network_system every request fails with error_code::internal_error.
 *
 * @note This client is thread-safe for concurrent operations.
 */
class network_http_client : public http_client_interface {
public:
    /**
     * @param timeout Request timeout
     */
    explicit network_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~network_http_client() override;

    network_http_client(const network_http_client&) = delete;
    auto operator=(const network_http_client&) -> network_http_client& = delete;
    network_http_client(network_http_client&&) noexcept;
    auto operator=(network_http_client&&) noexcept -> network_http_client&;

    [[nodiscard]] auto post(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto post(
        const std::string& url,
        const std::vector<uint8_t>& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    /**
     * @brief Check if the HTTP client is available
     * @return true if network_system was compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Create the default HTTP client
 * @param timeout Request timeout
 */
[[nodiscard]] auto make_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<http_client_interface>;

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_TRANSPORT_HTTP_CLIENT_H
