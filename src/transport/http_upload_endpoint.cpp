/**
 * @file http_upload_endpoint.cpp
 * @brief HTTP upload endpoint implementation
 */

#include <kcenon/chunked_upload/transport/http_upload_endpoint.h>

#include <kcenon/chunked_upload/core/logging.h>
#include <kcenon/chunked_upload/transport/http_utils.h>

#include <charconv>
#include <cstdlib>

namespace kcenon::chunked_upload {

namespace {

constexpr const char* start_failed_message = "Failed to start upload session";
constexpr const char* chunk_failed_message = "Upload failed";
constexpr const char* complete_failed_message = "Failed to complete upload";

// The "detail" field of a JSON error body, if any
auto error_detail(const http_response& response) -> std::optional<std::string> {
    auto detail = http_utils::extract_json_value(response.get_body_string(), "detail");
    if (detail && !detail->empty()) {
        return detail;
    }
    return std::nullopt;
}

auto parse_int64(const std::string& text) -> std::optional<int64_t> {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto endpoint_config::from_environment() -> endpoint_config {
    endpoint_config config;
    if (const char* url = std::getenv("CHUNKED_UPLOAD_API_BASE_URL"); url && *url) {
        config.api_base_url = url;
    } else if (const char* legacy = std::getenv("API_BASE_URL"); legacy && *legacy) {
        config.api_base_url = legacy;
    }
    return config;
}

http_upload_endpoint::http_upload_endpoint(endpoint_config config,
                                           std::shared_ptr<http_client_interface> client)
    : config_(std::move(config)), client_(std::move(client)) {
    if (!client_) {
        client_ = make_http_client(config_.request_timeout);
    }
}

auto http_upload_endpoint::url(const std::string& path) const -> std::string {
    return http_utils::join_url(config_.api_base_url, path);
}

auto http_upload_endpoint::start_session(const std::string& filename,
                                         uint64_t total_chunks,
                                         const std::string& guest)
    -> result<session_grant> {
    auto body = http_utils::encode_form({
        {"filename", filename},
        {"total_chunks", std::to_string(total_chunks)},
        {"guest", guest},
    });

    auto response = client_->post(
        url("/api/upload/start"), body,
        {{"Content-Type", "application/x-www-form-urlencoded"}});

    if (!response) {
        return unexpected{error{error_code::session_start_failure,
            std::string(start_failed_message) + ": " + response.error().message}};
    }

    const auto& resp = response.value();
    if (!resp.is_success()) {
        std::string message = start_failed_message;
        if (auto detail = error_detail(resp)) {
            message += ": " + *detail;
        }
        return unexpected{error{error_code::session_start_failure, message}};
    }

    auto json = resp.get_body_string();
    auto upload_id = http_utils::extract_json_value(json, "upload_id");
    auto chunk_size_text = http_utils::extract_json_value(json, "chunk_size");
    if (!upload_id || upload_id->empty() || !chunk_size_text) {
        return unexpected{error{error_code::session_start_failure,
            std::string(start_failed_message) + ": malformed response"}};
    }

    auto chunk_size = parse_int64(*chunk_size_text);
    if (!chunk_size || *chunk_size <= 0) {
        return unexpected{error{error_code::session_start_failure,
            std::string(start_failed_message) + ": invalid chunk_size " + *chunk_size_text}};
    }

    return session_grant{*upload_id, *chunk_size};
}

auto http_upload_endpoint::upload_chunk(const chunk_upload_request& request)
    -> result<void> {
    http_utils::multipart_form_builder form;
    form.add_file("file", "chunk_" + std::to_string(request.chunk_index),
                  "application/octet-stream", request.payload)
        .add_field("chunk_index", std::to_string(request.chunk_index))
        .add_field("total_chunks", std::to_string(request.total_chunks));
    if (request.compressed) {
        form.add_field("compression", "lz4")
            .add_field("original_size", std::to_string(request.original_size));
    }

    auto response = client_->post(
        url("/api/upload/chunk/" + http_utils::url_encode(request.upload_id)),
        form.build(),
        {{"Content-Type", form.content_type()}});

    if (!response) {
        return unexpected{error{error_code::chunk_transfer_failure,
                                response.error().message}};
    }

    const auto& resp = response.value();
    if (!resp.is_success()) {
        CU_LOG_DEBUG(log_category::transport,
            "Chunk " + std::to_string(request.chunk_index) + " rejected with HTTP " +
                std::to_string(resp.status_code));
        return unexpected{error{error_code::chunk_transfer_failure,
                                error_detail(resp).value_or(chunk_failed_message)}};
    }
    return {};
}

auto http_upload_endpoint::complete_session(const std::string& upload_id)
    -> result<std::string> {
    auto response = client_->post(
        url("/api/upload/complete/" + http_utils::url_encode(upload_id)),
        std::string{}, {});

    if (!response) {
        return unexpected{error{error_code::finalize_failure,
            std::string(complete_failed_message) + ": " + response.error().message}};
    }

    const auto& resp = response.value();
    if (!resp.is_success()) {
        std::string message = complete_failed_message;
        if (auto detail = error_detail(resp)) {
            message += ": " + *detail;
        }
        return unexpected{error{error_code::finalize_failure, message}};
    }
    return resp.get_body_string();
}

}  // namespace kcenon::chunked_upload
