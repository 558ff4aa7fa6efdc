/**
 * @file upload_orchestrator.h
 * @brief Chunked upload session orchestrator
 */

#ifndef KCENON_CHUNKED_UPLOAD_UPLOAD_UPLOAD_ORCHESTRATOR_H
#define KCENON_CHUNKED_UPLOAD_UPLOAD_UPLOAD_ORCHESTRATOR_H

#include <kcenon/chunked_upload/adapters/thread_pool_adapter.h>
#include <kcenon/chunked_upload/core/chunk_source.h>
#include <kcenon/chunked_upload/transport/upload_endpoint.h>
#include <kcenon/chunked_upload/upload/upload_handle.h>
#include <kcenon/chunked_upload/upload/upload_types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief Runs upload sessions against an upload_endpoint
 *
 * Each session goes idle -> starting -> transferring -> finalizing ->
 * completed, or ends in failed:
 * - starting: start_session with the chunk count for the requested chunk size.
 *   Failure ends the session before any chunk is sent.
 * - transferring: the plan is built from the chunk size the endpoint
 *   returned; a transfer_worker_pool sends it with at most
 *   max_parallel_uploads attempts in flight and linear-backoff retries.
 * - finalizing: complete_session, issued once every chunk succeeded.
 *
 * @code
 * auto orchestrator = upload_orchestrator::builder()
 *     .with_endpoint(std::make_shared<http_upload_endpoint>(endpoint_config::from_environment()))
 *     .with_guest("alice")
 *     .build();
 * auto outcome = orchestrator.value().upload("photo.jpg");
 * @endcode
 */
class upload_orchestrator {
public:
    /**
     * @brief Builder for upload_orchestrator
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the remote endpoint (required)
         */
        auto with_endpoint(std::shared_ptr<upload_endpoint> endpoint) -> builder&;

        /**
         * @brief Replace the whole configuration
         */
        auto with_config(upload_config config) -> builder&;

        /**
         * @brief Set the requested chunk size (default: 5MiB)
         */
        auto with_chunk_size(int64_t size) -> builder&;

        /**
         * @brief Set the transfer concurrency (default: 4)
         */
        auto with_max_parallel_uploads(std::size_t count) -> builder&;

        /**
         * @brief Set the retry ceiling per chunk (default: 3)
         */
        auto with_retry_attempts(uint32_t attempts) -> builder&;

        /**
         * @brief Set the backoff base (default: 1000ms)
         */
        auto with_retry_delay(std::chrono::milliseconds delay) -> builder&;

        auto with_compression(compression_mode mode) -> builder&;

        auto with_guest(std::string guest) -> builder&;

        /**
         * @brief Share an executor instead of creating one per orchestrator
         *
         * The executor should have more workers than max_parallel_uploads when
         * it implements delayed tasks by sleeping in a worker.
         */
        auto with_thread_pool(std::shared_ptr<adapters::transfer_thread_pool_interface> pool)
            -> builder&;

        auto with_observer(std::shared_ptr<upload_observer> observer) -> builder&;

        /**
         * @brief Build the orchestrator
         * @return invalid_configuration without an endpoint, invalid_input for
         *         a configuration rejected by upload_config::validate()
         */
        [[nodiscard]] auto build() -> result<upload_orchestrator>;

    private:
        upload_config config_;
        std::shared_ptr<upload_endpoint> endpoint_;
        std::shared_ptr<adapters::transfer_thread_pool_interface> pool_;
        std::shared_ptr<upload_observer> observer_;
    };

    ~upload_orchestrator();

    upload_orchestrator(const upload_orchestrator&) = delete;
    auto operator=(const upload_orchestrator&) -> upload_orchestrator& = delete;
    upload_orchestrator(upload_orchestrator&&) noexcept;
    auto operator=(upload_orchestrator&&) noexcept -> upload_orchestrator&;

    /**
     * @brief Start a session without blocking
     * @param source Bytes to upload; name() is sent as the filename
     * @return Handle, or invalid_input for a null source
     */
    [[nodiscard]] auto start(std::shared_ptr<chunk_source> source) -> result<upload_handle>;

    /**
     * @brief Start a session for a file on disk
     * @return Handle, or file_not_found / file_read_error before any request
     */
    [[nodiscard]] auto start(const std::filesystem::path& path) -> result<upload_handle>;

    /**
     * @brief Run a session to the end
     *
     * Errors that prevent the session from starting are reported as a failed
     * session_result with an empty upload_id.
     */
    [[nodiscard]] auto upload(std::shared_ptr<chunk_source> source) -> session_result;

    [[nodiscard]] auto upload(const std::filesystem::path& path) -> session_result;

    [[nodiscard]] auto config() const -> const upload_config&;

private:
    struct impl;

    explicit upload_orchestrator(std::unique_ptr<impl> impl);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_UPLOAD_UPLOAD_ORCHESTRATOR_H
