/**
 * @file http_client.cpp
 * @brief network_system HTTP client adapter
 */

#include <kcenon/chunked_upload/transport/http_client.h>

#include <kcenon/chunked_upload/config/feature_flags.h>
#include <kcenon/chunked_upload/core/logging.h>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::chunked_upload {

struct network_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
        available = false;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }

    template <typename Body>
    auto post(const std::string& url,
              const Body& body,
              const std::map<std::string, std::string>& headers) -> result<http_response> {
        if (!client) {
            return unexpected{error{error_code::internal_error,
                "HTTP client not initialized"}};
        }

        auto response = client->post(url, body, headers);
        if (response.is_err()) {
            CU_LOG_DEBUG(log_category::transport, "POST " + url + " failed");
            return unexpected{error{error_code::request_failed,
                "HTTP POST request failed: " + url}};
        }
        return convert_response(response.value());
    }
#endif
};

network_http_client::network_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_client::~network_http_client() = default;

network_http_client::network_http_client(network_http_client&&) noexcept = default;
auto network_http_client::operator=(network_http_client&&) noexcept
    -> network_http_client& = default;

auto network_http_client::post(
    const std::string& url,
    const std::string& body,
    const std::map<std::string, std::string>& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl_->post(url, body, headers);
#else
    (void)url;
    (void)body;
    (void)headers;
    return unexpected{error{error_code::internal_error,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

auto network_http_client::post(
    const std::string& url,
    const std::vector<uint8_t>& body,
    const std::map<std::string, std::string>& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl_->post(url, body, headers);
#else
    (void)url;
    (void)body;
    (void)headers;
    return unexpected{error{error_code::internal_error,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

auto network_http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

auto make_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<http_client_interface> {
    return std::make_shared<network_http_client>(timeout);
}

}  // namespace kcenon::chunked_upload
