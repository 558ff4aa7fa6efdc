/**
 * @file chunked_upload_cli.cpp
 * @brief Command-line chunked uploader
 *
 * Uploads one file through the HTTP upload endpoint, printing a progress line
 * per acknowledged chunk and the server's completion payload on success.
 */

#include <kcenon/chunked_upload/chunked_upload.h>

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

using namespace kcenon::chunked_upload;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

template <typename T>
auto parse_number(const std::string& text) -> std::optional<T> {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto parse_compression_mode(const std::string& mode) -> std::optional<compression_mode> {
    if (mode == "none") return compression_mode::none;
    if (mode == "always") return compression_mode::always;
    if (mode == "adaptive") return compression_mode::adaptive;
    return std::nullopt;
}

/**
 * @brief Prints one line per progress snapshot
 */
class console_observer : public upload_observer {
public:
    void on_progress(const progress_snapshot& snapshot) override {
        std::cout << "[" << std::setw(3) << snapshot.percent << "%] "
                  << snapshot.completed_chunks << "/" << snapshot.total_chunks
                  << " chunks, " << format_bytes(snapshot.loaded) << " of "
                  << format_bytes(snapshot.total) << std::endl;
    }

    void on_error(const session_error& failure) override {
        reported_ = true;
        std::cerr << "[Failed] " << failure.message;
        if (!failure.detail.empty()) {
            std::cerr << " (" << failure.detail << ")";
        }
        std::cerr << std::endl;
    }

    [[nodiscard]] auto reported() const -> bool { return reported_; }

private:
    std::atomic<bool> reported_{false};
};

}  // namespace

void print_usage(const char* program) {
    std::cout << "Chunked Upload" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <file>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -a, --api <url>            API base URL (default: $CHUNKED_UPLOAD_API_BASE_URL or $API_BASE_URL)" << std::endl;
    std::cout << "  -g, --guest <name>         Guest identity sent with the session" << std::endl;
    std::cout << "  -s, --chunk-size <bytes>   Requested chunk size (default: 5242880)" << std::endl;
    std::cout << "  -p, --parallel <n>         Concurrent chunk uploads (default: 4)" << std::endl;
    std::cout << "  -r, --retries <n>          Retries per chunk (default: 3)" << std::endl;
    std::cout << "  -d, --retry-delay <ms>     Backoff base in milliseconds (default: 1000)" << std::endl;
    std::cout << "  -c, --compression <mode>   none, always, adaptive (default: none)" << std::endl;
    std::cout << "  -v, --verbose              Debug logging" << std::endl;
    std::cout << "  --help                     Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    auto endpoint_settings = endpoint_config::from_environment();
    upload_config config;
    bool verbose = false;
    std::string file_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&](const char* option) -> std::optional<std::string> {
            if (++i >= argc) {
                std::cerr << "Error: " << option << " requires an argument" << std::endl;
                return std::nullopt;
            }
            return std::string(argv[i]);
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-a" || arg == "--api") {
            auto value = next_value("--api");
            if (!value) return 1;
            endpoint_settings.api_base_url = *value;
        } else if (arg == "-g" || arg == "--guest") {
            auto value = next_value("--guest");
            if (!value) return 1;
            config.guest = *value;
        } else if (arg == "-s" || arg == "--chunk-size") {
            auto value = next_value("--chunk-size");
            if (!value) return 1;
            auto size = parse_number<int64_t>(*value);
            if (!size) {
                std::cerr << "Error: Invalid chunk size: " << *value << std::endl;
                return 1;
            }
            config.chunk_size = *size;
        } else if (arg == "-p" || arg == "--parallel") {
            auto value = next_value("--parallel");
            if (!value) return 1;
            auto count = parse_number<std::size_t>(*value);
            if (!count) {
                std::cerr << "Error: Invalid parallel count: " << *value << std::endl;
                return 1;
            }
            config.max_parallel_uploads = *count;
        } else if (arg == "-r" || arg == "--retries") {
            auto value = next_value("--retries");
            if (!value) return 1;
            auto retries = parse_number<uint32_t>(*value);
            if (!retries) {
                std::cerr << "Error: Invalid retry count: " << *value << std::endl;
                return 1;
            }
            config.retry_attempts = *retries;
        } else if (arg == "-d" || arg == "--retry-delay") {
            auto value = next_value("--retry-delay");
            if (!value) return 1;
            auto delay = parse_number<int64_t>(*value);
            if (!delay) {
                std::cerr << "Error: Invalid retry delay: " << *value << std::endl;
                return 1;
            }
            config.retry_delay = std::chrono::milliseconds{*delay};
        } else if (arg == "-c" || arg == "--compression") {
            auto value = next_value("--compression");
            if (!value) return 1;
            auto mode = parse_compression_mode(*value);
            if (!mode) {
                std::cerr << "Error: Invalid compression mode: " << *value << std::endl;
                return 1;
            }
            config.compression = *mode;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (!arg.empty() && arg[0] != '-') {
            file_path = arg;
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            return 1;
        }
    }

    if (file_path.empty()) {
        std::cerr << "Error: A file to upload is required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (endpoint_settings.api_base_url.empty()) {
        std::cerr << "Error: No API base URL; use --api or set CHUNKED_UPLOAD_API_BASE_URL"
                  << std::endl;
        return 1;
    }

    get_logger().initialize();
    get_logger().set_level(verbose ? log_level::debug : log_level::warn);

    auto observer = std::make_shared<console_observer>();
    auto orchestrator_result = upload_orchestrator::builder()
        .with_config(config)
        .with_endpoint(std::make_shared<http_upload_endpoint>(endpoint_settings))
        .with_observer(observer)
        .build();

    if (!orchestrator_result.has_value()) {
        std::cerr << "Failed to create uploader: " << orchestrator_result.error().message
                  << std::endl;
        return 1;
    }

    auto& orchestrator = orchestrator_result.value();

    std::cout << "Uploading " << file_path << " to " << endpoint_settings.api_base_url
              << std::endl;

    auto outcome = orchestrator.upload(std::filesystem::path(file_path));
    if (!outcome) {
        const auto& failure = outcome.failure();
        // File errors end the upload before the observer is involved
        if (!observer->reported()) {
            std::cerr << "[Failed] " << failure.message << " (" << failure.detail << ")"
                      << std::endl;
        }
        return 1;
    }

    const auto& summary = outcome.summary();
    std::cout << "[Complete] " << summary.filename << ": " << summary.total_chunks
              << " chunks, " << format_bytes(summary.total_bytes) << " in "
              << summary.elapsed.count() << "ms";
    if (summary.retries > 0) {
        std::cout << ", " << summary.retries << " retries";
    }
    std::cout << std::endl;
    std::cout << summary.payload << std::endl;

    return 0;
}
