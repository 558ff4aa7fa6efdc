// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file logging.h
 * @brief Structured logging for chunked_upload
 *
 * Messages go to kcenon::logger when the library is built with logger_system
 * and common_system, and to stderr otherwise. A callback hook lets callers
 * capture every emitted record regardless of the backend.
 */

#pragma once

#include <kcenon/chunked_upload/config/feature_flags.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::chunked_upload {

/**
 * @brief Log categories
 */
struct log_category {
    static constexpr std::string_view session = "chunked_upload.session";
    static constexpr std::string_view worker = "chunked_upload.worker";
    static constexpr std::string_view retry = "chunked_upload.retry";
    static constexpr std::string_view compression = "chunked_upload.compression";
    static constexpr std::string_view transport = "chunked_upload.transport";
    static constexpr std::string_view splitter = "chunked_upload.splitter";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured context attached to upload log records
 */
struct upload_log_context {
    std::string upload_id;
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes;
    std::optional<uint64_t> chunk_index;
    std::optional<uint64_t> total_chunks;
    std::optional<uint32_t> retry_count;
    std::optional<int> percent;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    /**
     * @brief Render the populated fields as a JSON object
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto separator = [&]() {
            if (!first) oss << ",";
            first = false;
        };
        auto add_string = [&](const char* name, const std::string& value) {
            separator();
            oss << "\"" << name << "\":\"" << escape_json(value) << "\"";
        };
        auto add_number = [&](const char* name, auto value) {
            separator();
            oss << "\"" << name << "\":" << value;
        };

        if (!upload_id.empty()) add_string("upload_id", upload_id);
        if (!filename.empty()) add_string("filename", filename);
        if (file_size) add_number("file_size", *file_size);
        if (bytes) add_number("bytes", *bytes);
        if (chunk_index) add_number("chunk_index", *chunk_index);
        if (total_chunks) add_number("total_chunks", *total_chunks);
        if (retry_count) add_number("retry_count", *retry_count);
        if (percent) add_number("percent", *percent);
        if (duration_ms) add_number("duration_ms", *duration_ms);
        if (error_message) add_string("error_message", *error_message);

        oss << "}";
        return oss.str();
    }

    [[nodiscard]] static auto escape_json(const std::string& input) -> std::string {
        std::string output;
        output.reserve(input.size() + 8);
        for (char c : input) {
            switch (c) {
                case '"':  output += "\\\""; break;
                case '\\': output += "\\\\"; break;
                case '\n': output += "\\n";  break;
                case '\r': output += "\\r";  break;
                case '\t': output += "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x",
                                      static_cast<unsigned char>(c));
                        output += buf;
                    } else {
                        output += c;
                    }
            }
        }
        return output;
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Timestamp, level and category prefix followed by the message
    json    ///< One JSON object per record
};

/**
 * @brief Logger shared by all chunked_upload components
 */
class upload_logger {
public:
    using log_callback = std::function<void(
        log_level, std::string_view, std::string_view, const upload_log_context*)>;

    upload_logger() = default;
    ~upload_logger() = default;

    upload_logger(const upload_logger&) = delete;
    upload_logger& operator=(const upload_logger&) = delete;

    /**
     * @brief Initialize the backend
     *
     * Safe to call multiple times; only the first call has an effect.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        auto built = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (built) {
            std::lock_guard<std::mutex> lock(backend_mutex_);
            logger_ = std::move(built.value());
        }
#endif
    }

    void shutdown() {
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) { output_format_.store(format); }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        return output_format_.load();
    }

    /**
     * @brief Install a hook receiving every record that passes the level filter
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        std::string record = output_format_.load() == log_output_format::json
            ? format_json(level, category, message, context, file, line, function)
            : format_text(category, message, context);

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), record, file, line, function);
            } else {
                logger_->log(to_logger_level(level), record);
            }
            return;
        }
#endif
        write_stderr(level, record);
    }

    void flush() {
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static auto format_text(std::string_view category,
                            std::string_view message,
                            const upload_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const upload_log_context* context,
                            const char* file,
                            int line,
                            const char* function) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << timestamp(true) << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\""
            << upload_log_context::escape_json(std::string(message)) << "\"";

        if (context) {
            auto ctx = context->to_json();
            if (ctx.size() > 2) {
                oss << "," << ctx.substr(1, ctx.size() - 2);
            }
        }
        if (file && line > 0) {
            oss << ",\"source\":{\"file\":\"" << file << "\",\"line\":" << line;
            if (function) {
                oss << ",\"function\":\"" << function << "\"";
            }
            oss << "}";
        }
        oss << "}";
        return oss.str();
    }

    static void write_stderr(log_level level, const std::string& record) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << timestamp(false) << " [" << log_level_to_string(level) << "] "
                  << record << "\n";
    }

    static auto timestamp(bool utc) -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        if (utc) {
            gmtime_s(&tm_buf, &time_t_val);
        } else {
            localtime_s(&tm_buf, &time_t_val);
        }
#else
        if (utc) {
            gmtime_r(&time_t_val, &tm_buf);
        } else {
            localtime_r(&time_t_val, &tm_buf);
        }
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        if (utc) {
            oss << 'Z';
        }
        return oss.str();
    }

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
    std::mutex backend_mutex_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<log_output_format> output_format_{log_output_format::text};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;
};

/**
 * @brief Global logger instance
 */
inline upload_logger& get_logger() {
    static upload_logger instance;
    return instance;
}

#define CU_LOG(level, category, message) \
    kcenon::chunked_upload::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define CU_LOG_CTX(level, category, message, context) \
    kcenon::chunked_upload::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define CU_LOG_TRACE(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::trace, category, message)

#define CU_LOG_DEBUG(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::debug, category, message)

#define CU_LOG_INFO(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::info, category, message)

#define CU_LOG_WARN(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::warn, category, message)

#define CU_LOG_ERROR(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::error, category, message)

#define CU_LOG_DEBUG_CTX(category, message, ctx) \
    CU_LOG_CTX(kcenon::chunked_upload::log_level::debug, category, message, ctx)

#define CU_LOG_INFO_CTX(category, message, ctx) \
    CU_LOG_CTX(kcenon::chunked_upload::log_level::info, category, message, ctx)

#define CU_LOG_WARN_CTX(category, message, ctx) \
    CU_LOG_CTX(kcenon::chunked_upload::log_level::warn, category, message, ctx)

#define CU_LOG_ERROR_CTX(category, message, ctx) \
    CU_LOG_CTX(kcenon::chunked_upload::log_level::error, category, message, ctx)

}  // namespace kcenon::chunked_upload
