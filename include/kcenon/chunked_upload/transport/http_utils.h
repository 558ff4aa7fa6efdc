/**
 * @file http_utils.h
 * @brief Request encoding and response parsing helpers for the upload endpoint
 */

#ifndef KCENON_CHUNKED_UPLOAD_TRANSPORT_HTTP_UTILS_H
#define KCENON_CHUNKED_UPLOAD_TRANSPORT_HTTP_UTILS_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::chunked_upload::http_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief URL encode a string (RFC 3986)
 * @param value String to encode
 * @param encode_slash Whether to encode forward slashes (default: true)
 * @return URL encoded string
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

/**
 * @brief Encode fields as application/x-www-form-urlencoded
 *
 * Spaces become '+', as browsers do for form bodies. Field order is kept.
 */
auto encode_form(const std::vector<std::pair<std::string, std::string>>& fields)
    -> std::string;

/**
 * @brief Join a base URL and a path without doubling the slash
 *
 * An empty base yields the path unchanged (relative URL).
 */
auto join_url(const std::string& base, const std::string& path) -> std::string;

/**
 * @brief Generate a random multipart boundary
 */
auto generate_boundary() -> std::string;

// ============================================================================
// JSON Utilities
// ============================================================================

/**
 * @brief Extract a top-level JSON value (simple parser for known structure)
 *
 * String values are returned unquoted with \" and \\ unescaped; other values
 * (numbers, booleans, null) are returned as their literal text.
 *
 * @param json JSON string to parse
 * @param key Key to extract
 * @return Value if found, nullopt otherwise
 */
auto extract_json_value(const std::string& json,
                        const std::string& key) -> std::optional<std::string>;

// ============================================================================
// Multipart form
// ============================================================================

/**
 * @brief Builder for multipart/form-data request bodies
 *
 * @code
 * multipart_form_builder form;
 * form.add_file("file", "chunk_0", "application/octet-stream", bytes)
 *     .add_field("chunk_index", "0");
 * auto body = form.build();
 * headers["Content-Type"] = form.content_type();
 * @endcode
 */
class multipart_form_builder {
public:
    multipart_form_builder();
    explicit multipart_form_builder(std::string boundary);

    auto add_field(const std::string& name, const std::string& value)
        -> multipart_form_builder&;

    auto add_file(const std::string& name,
                  const std::string& filename,
                  const std::string& content_type,
                  std::span<const std::byte> data) -> multipart_form_builder&;

    /**
     * @brief Content-Type header value including the boundary
     */
    [[nodiscard]] auto content_type() const -> std::string;

    [[nodiscard]] auto boundary() const -> const std::string& { return boundary_; }

    /**
     * @brief Body with all parts and the closing delimiter
     */
    [[nodiscard]] auto build() const -> std::vector<uint8_t>;

private:
    void append(const std::string& text);

    std::string boundary_;
    std::vector<uint8_t> body_;
};

}  // namespace kcenon::chunked_upload::http_utils

#endif  // KCENON_CHUNKED_UPLOAD_TRANSPORT_HTTP_UTILS_H
