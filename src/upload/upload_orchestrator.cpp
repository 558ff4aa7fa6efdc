/**
 * @file upload_orchestrator.cpp
 * @brief Upload orchestrator and handle implementation
 */

#include <kcenon/chunked_upload/upload/upload_orchestrator.h>

#include <kcenon/chunked_upload/core/logging.h>

#include "upload_run.h"

#include <mutex>

namespace kcenon::chunked_upload {

namespace {

auto to_session_error(const error& err) -> session_error {
    session_error failure;
    failure.code = err.code;
    failure.detail = err.message;
    failure.message = "Upload failed";
    return failure;
}

// Shared by every invalid handle; closed and never published to
auto closed_progress_channel() -> progress_channel& {
    static progress_channel channel;
    static std::once_flag closed;
    std::call_once(closed, [] { channel.close(); });
    return channel;
}

}  // namespace

// ============================================================================
// upload_handle
// ============================================================================

upload_handle::upload_handle(
    std::shared_ptr<detail::upload_run> run,
    std::shared_ptr<adapters::transfer_thread_pool_interface> executor)
    : run_(std::move(run)), executor_(std::move(executor)) {}

auto upload_handle::state() const -> session_state {
    return run_ ? run_->state() : session_state::idle;
}

auto upload_handle::upload_id() const -> std::string {
    return run_ ? run_->upload_id() : std::string{};
}

auto upload_handle::progress() const -> progress_channel& {
    return run_ ? run_->progress() : closed_progress_channel();
}

auto upload_handle::cancel() -> result<void> {
    if (!run_) {
        return unexpected{error{error_code::invalid_state, "Invalid upload handle"}};
    }
    return run_->cancel();
}

auto upload_handle::wait() const -> session_result {
    if (!run_) {
        session_error failure;
        failure.code = error_code::invalid_state;
        failure.message = "Invalid upload handle";
        return failure;
    }
    return run_->wait();
}

auto upload_handle::wait_for(std::chrono::milliseconds timeout) const
    -> result<session_result> {
    if (!run_) {
        return unexpected{error{error_code::invalid_state, "Invalid upload handle"}};
    }
    auto outcome = run_->wait_for(timeout);
    if (!outcome) {
        return unexpected{error{error_code::timeout,
            "Upload did not finish within " + std::to_string(timeout.count()) + "ms"}};
    }
    return std::move(*outcome);
}

// ============================================================================
// upload_orchestrator
// ============================================================================

struct upload_orchestrator::impl {
    upload_config config;
    std::shared_ptr<upload_endpoint> endpoint;
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool;
    std::shared_ptr<upload_observer> observer;
};

upload_orchestrator::builder::builder() = default;

auto upload_orchestrator::builder::with_endpoint(std::shared_ptr<upload_endpoint> endpoint)
    -> builder& {
    endpoint_ = std::move(endpoint);
    return *this;
}

auto upload_orchestrator::builder::with_config(upload_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto upload_orchestrator::builder::with_chunk_size(int64_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto upload_orchestrator::builder::with_max_parallel_uploads(std::size_t count) -> builder& {
    config_.max_parallel_uploads = count;
    return *this;
}

auto upload_orchestrator::builder::with_retry_attempts(uint32_t attempts) -> builder& {
    config_.retry_attempts = attempts;
    return *this;
}

auto upload_orchestrator::builder::with_retry_delay(std::chrono::milliseconds delay)
    -> builder& {
    config_.retry_delay = delay;
    return *this;
}

auto upload_orchestrator::builder::with_compression(compression_mode mode) -> builder& {
    config_.compression = mode;
    return *this;
}

auto upload_orchestrator::builder::with_guest(std::string guest) -> builder& {
    config_.guest = std::move(guest);
    return *this;
}

auto upload_orchestrator::builder::with_thread_pool(
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto upload_orchestrator::builder::with_observer(std::shared_ptr<upload_observer> observer)
    -> builder& {
    observer_ = std::move(observer);
    return *this;
}

auto upload_orchestrator::builder::build() -> result<upload_orchestrator> {
    if (!endpoint_) {
        return unexpected{error{error_code::invalid_configuration,
            "An upload endpoint is required"}};
    }

    if (auto valid = config_.validate(); !valid) {
        return unexpected{valid.error()};
    }

    get_logger().initialize();

    auto pimpl = std::make_unique<impl>();
    pimpl->config = config_;
    pimpl->endpoint = endpoint_;
    pimpl->observer = observer_;
    pimpl->pool = pool_;
    if (!pimpl->pool) {
        // Delayed retries occupy a worker while they wait
        pimpl->pool = adapters::transfer_pool_factory::create(
            config_.max_parallel_uploads * 2, "chunked_upload_pool");
    }

    CU_LOG_DEBUG(log_category::session,
        "Orchestrator ready: chunk size " + std::to_string(config_.chunk_size) +
            ", parallel " + std::to_string(config_.max_parallel_uploads) +
            ", retries " + std::to_string(config_.retry_attempts) +
            ", compression " + to_string(config_.compression));

    return upload_orchestrator(std::move(pimpl));
}

upload_orchestrator::upload_orchestrator(std::unique_ptr<impl> impl)
    : impl_(std::move(impl)) {}

upload_orchestrator::~upload_orchestrator() = default;

upload_orchestrator::upload_orchestrator(upload_orchestrator&&) noexcept = default;

auto upload_orchestrator::operator=(upload_orchestrator&&) noexcept
    -> upload_orchestrator& = default;

auto upload_orchestrator::start(std::shared_ptr<chunk_source> source)
    -> result<upload_handle> {
    if (!source) {
        return unexpected{error{error_code::invalid_input, "chunk source is null"}};
    }

    auto run = std::make_shared<detail::upload_run>(
        impl_->config, impl_->endpoint, std::move(source), impl_->observer, impl_->pool);
    run->launch();

    return upload_handle(std::move(run), impl_->pool);
}

auto upload_orchestrator::start(const std::filesystem::path& path) -> result<upload_handle> {
    auto source = file_chunk_source::open(path);
    if (!source) {
        CU_LOG_ERROR(log_category::session,
            "Cannot open " + path.string() + ": " + source.error().message);
        return unexpected{source.error()};
    }
    return start(std::shared_ptr<chunk_source>(std::move(source.value())));
}

auto upload_orchestrator::upload(std::shared_ptr<chunk_source> source) -> session_result {
    auto handle = start(std::move(source));
    if (!handle) {
        return to_session_error(handle.error());
    }
    return handle.value().wait();
}

auto upload_orchestrator::upload(const std::filesystem::path& path) -> session_result {
    auto handle = start(path);
    if (!handle) {
        return to_session_error(handle.error());
    }
    return handle.value().wait();
}

auto upload_orchestrator::config() const -> const upload_config& {
    return impl_->config;
}

}  // namespace kcenon::chunked_upload
