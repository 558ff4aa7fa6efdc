/**
 * @file types.h
 * @brief Core type definitions for chunked_upload
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_TYPES_H
#define KCENON_CHUNKED_UPLOAD_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief Error codes for chunked upload operations
 */
enum class error_code {
    success = 0,

    // Input errors (-100 to -119)
    invalid_input = -100,
    invalid_configuration = -101,

    // Source errors (-120 to -139)
    file_not_found = -120,
    file_read_error = -121,
    invalid_chunk_range = -122,

    // Session errors (-140 to -159)
    session_start_failure = -140,
    chunk_transfer_failure = -141,
    chunk_permanent_failure = -142,
    finalize_failure = -143,
    cancelled = -144,
    invalid_state = -145,

    // Transport errors (-160 to -179)
    request_failed = -160,
    malformed_response = -161,

    // Compression errors (-180 to -199)
    compression_failed = -180,
    decompression_failed = -181,

    // Internal errors (-200 to -219)
    internal_error = -200,
    timeout = -201,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_input:
            return "invalid input";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::invalid_chunk_range:
            return "invalid chunk range";
        case error_code::session_start_failure:
            return "session start failure";
        case error_code::chunk_transfer_failure:
            return "chunk transfer failure";
        case error_code::chunk_permanent_failure:
            return "chunk permanent failure";
        case error_code::finalize_failure:
            return "finalize failure";
        case error_code::cancelled:
            return "cancelled";
        case error_code::invalid_state:
            return "invalid state";
        case error_code::request_failed:
            return "request failed";
        case error_code::malformed_response:
            return "malformed response";
        case error_code::compression_failed:
            return "compression failed";
        case error_code::decompression_failed:
            return "decompression failed";
        case error_code::internal_error:
            return "internal error";
        case error_code::timeout:
            return "timeout";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error, similar to std::expected.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Raw byte buffer used for chunk payloads
 */
using byte_buffer = std::vector<std::byte>;

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_TYPES_H
