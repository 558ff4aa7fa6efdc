/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef KCENON_CHUNKED_UPLOAD_TEST_FIXTURES_H
#define KCENON_CHUNKED_UPLOAD_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/chunked_upload.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::chunked_upload::test {

/**
 * @brief One chunk request as seen by the fake server
 */
struct recorded_chunk {
    std::string upload_id;
    uint64_t chunk_index = 0;
    uint64_t total_chunks = 0;
    byte_buffer payload;
    bool compressed = false;
    uint64_t original_size = 0;
};

/**
 * @brief In-process upload endpoint with scripted failures
 *
 * Accepts every call by default. Failures, latency and a gate that holds
 * chunk requests can be configured before the upload starts.
 */
class fake_upload_endpoint : public upload_endpoint {
public:
    explicit fake_upload_endpoint(int64_t grant_chunk_size)
        : grant_chunk_size_(grant_chunk_size) {}

    // ---- scripting -------------------------------------------------------

    void fail_start(std::string message) {
        std::lock_guard lock(mutex_);
        start_failure_ = std::move(message);
    }

    void fail_complete(std::string message) {
        std::lock_guard lock(mutex_);
        complete_failure_ = std::move(message);
    }

    /// The next @p times requests for @p index fail; -1 fails forever
    void fail_chunk(uint64_t index, int times, std::string message = "HTTP 500") {
        std::lock_guard lock(mutex_);
        chunk_failures_[index] = {times, std::move(message)};
    }

    void set_latency(std::chrono::milliseconds latency) {
        std::lock_guard lock(mutex_);
        latency_ = latency;
    }

    void set_payload(std::string payload) {
        std::lock_guard lock(mutex_);
        payload_ = std::move(payload);
    }

    /// Chunk requests block until release() is called
    void hold_chunks() {
        std::lock_guard lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }

    // ---- upload_endpoint -------------------------------------------------

    auto start_session(const std::string& filename,
                       uint64_t total_chunks,
                       const std::string& guest) -> result<session_grant> override {
        std::lock_guard lock(mutex_);
        ++start_calls_;
        started_filename_ = filename;
        started_total_chunks_ = total_chunks;
        started_guest_ = guest;
        if (start_failure_) {
            return unexpected{error{error_code::session_start_failure, *start_failure_}};
        }
        return session_grant{upload_id_, grant_chunk_size_};
    }

    auto upload_chunk(const chunk_upload_request& request) -> result<void> override {
        int now = ++in_flight_;
        int seen = peak_in_flight_.load();
        while (now > seen && !peak_in_flight_.compare_exchange_weak(seen, now)) {
        }

        std::chrono::milliseconds latency{0};
        {
            std::unique_lock lock(mutex_);
            ++chunk_calls_;
            attempt_order_.push_back(request.chunk_index);
            cv_.notify_all();
            cv_.wait(lock, [this] { return !held_; });
            latency = latency_;
        }
        if (latency.count() > 0) {
            std::this_thread::sleep_for(latency);
        }

        std::lock_guard lock(mutex_);
        --in_flight_;

        auto it = chunk_failures_.find(request.chunk_index);
        if (it != chunk_failures_.end() && it->second.remaining != 0) {
            if (it->second.remaining > 0) {
                --it->second.remaining;
            }
            return unexpected{error{error_code::chunk_transfer_failure, it->second.message}};
        }

        recorded_chunk chunk;
        chunk.upload_id = request.upload_id;
        chunk.chunk_index = request.chunk_index;
        chunk.total_chunks = request.total_chunks;
        chunk.payload.assign(request.payload.begin(), request.payload.end());
        chunk.compressed = request.compressed;
        chunk.original_size = request.original_size;
        accepted_.push_back(std::move(chunk));
        return {};
    }

    auto complete_session(const std::string& upload_id) -> result<std::string> override {
        std::lock_guard lock(mutex_);
        ++complete_calls_;
        completed_id_ = upload_id;
        if (complete_failure_) {
            return unexpected{error{error_code::finalize_failure, *complete_failure_}};
        }
        return payload_;
    }

    // ---- inspection ------------------------------------------------------

    /// Wait until at least @p count chunk requests have arrived
    auto wait_for_chunk_calls(int count, std::chrono::milliseconds timeout = std::chrono::seconds(5))
        -> bool {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return chunk_calls_ >= count; });
    }

    auto start_calls() const -> int { std::lock_guard lock(mutex_); return start_calls_; }
    auto chunk_calls() const -> int { std::lock_guard lock(mutex_); return chunk_calls_; }
    auto complete_calls() const -> int { std::lock_guard lock(mutex_); return complete_calls_; }
    auto peak_in_flight() const -> int { return peak_in_flight_.load(); }

    auto started_filename() const -> std::string {
        std::lock_guard lock(mutex_);
        return started_filename_;
    }

    auto started_total_chunks() const -> uint64_t {
        std::lock_guard lock(mutex_);
        return started_total_chunks_;
    }

    auto started_guest() const -> std::string {
        std::lock_guard lock(mutex_);
        return started_guest_;
    }

    auto completed_id() const -> std::string {
        std::lock_guard lock(mutex_);
        return completed_id_;
    }

    auto attempt_order() const -> std::vector<uint64_t> {
        std::lock_guard lock(mutex_);
        return attempt_order_;
    }

    auto accepted() const -> std::vector<recorded_chunk> {
        std::lock_guard lock(mutex_);
        return accepted_;
    }

    auto attempts_for(uint64_t index) const -> int {
        std::lock_guard lock(mutex_);
        return static_cast<int>(std::count(attempt_order_.begin(), attempt_order_.end(), index));
    }

    /// Accepted payloads concatenated by chunk index
    auto reassembled() const -> byte_buffer {
        auto chunks = accepted();
        std::sort(chunks.begin(), chunks.end(),
                  [](const auto& a, const auto& b) { return a.chunk_index < b.chunk_index; });
        byte_buffer out;
        for (const auto& chunk : chunks) {
            out.insert(out.end(), chunk.payload.begin(), chunk.payload.end());
        }
        return out;
    }

    auto upload_id() const -> const std::string& { return upload_id_; }

private:
    struct scripted_failure {
        int remaining = 0;
        std::string message;
    };

    const std::string upload_id_ = "upload-7f3a";
    int64_t grant_chunk_size_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::optional<std::string> start_failure_;
    std::optional<std::string> complete_failure_;
    std::map<uint64_t, scripted_failure> chunk_failures_;
    std::chrono::milliseconds latency_{0};
    std::string payload_ = R"({"fileId":"file-42","status":"complete"})";
    bool held_ = false;

    int start_calls_ = 0;
    int chunk_calls_ = 0;
    int complete_calls_ = 0;
    std::string started_filename_;
    uint64_t started_total_chunks_ = 0;
    std::string started_guest_;
    std::string completed_id_;
    std::vector<uint64_t> attempt_order_;
    std::vector<recorded_chunk> accepted_;

    std::atomic<int> in_flight_{0};
    std::atomic<int> peak_in_flight_{0};
};

/**
 * @brief Observer that records every callback
 */
class recording_observer : public upload_observer {
public:
    void on_progress(const progress_snapshot& snapshot) override {
        std::lock_guard lock(mutex_);
        progress_.push_back(snapshot);
    }

    void on_complete(const session_summary& summary) override {
        std::lock_guard lock(mutex_);
        ++completions_;
        summary_ = summary;
    }

    void on_error(const session_error& failure) override {
        std::lock_guard lock(mutex_);
        ++errors_;
        failure_ = failure;
    }

    auto progress() const -> std::vector<progress_snapshot> {
        std::lock_guard lock(mutex_);
        return progress_;
    }

    auto completions() const -> int { std::lock_guard lock(mutex_); return completions_; }
    auto errors() const -> int { std::lock_guard lock(mutex_); return errors_; }

    auto summary() const -> std::optional<session_summary> {
        std::lock_guard lock(mutex_);
        return summary_;
    }

    auto failure() const -> std::optional<session_error> {
        std::lock_guard lock(mutex_);
        return failure_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<progress_snapshot> progress_;
    int completions_ = 0;
    int errors_ = 0;
    std::optional<session_summary> summary_;
    std::optional<session_error> failure_;
};

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("chunked_upload_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        auto data = make_data(size);
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        return path;
    }

    /// Deterministic pseudo-random bytes
    static auto make_data(std::size_t size, unsigned seed = 42) -> byte_buffer {
        byte_buffer data(size);
        std::mt19937 gen(seed);
        std::uniform_int_distribution<> dis(0, 255);
        for (auto& b : data) {
            b = static_cast<std::byte>(dis(gen));
        }
        return data;
    }

    std::filesystem::path test_dir_;
};

/**
 * @brief Orchestrator wired to a fake endpoint
 *
 * Retry delays are kept short so retry scenarios finish quickly.
 */
class UploadFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        observer_ = std::make_shared<recording_observer>();
    }

    auto make_endpoint(int64_t grant_chunk_size) -> std::shared_ptr<fake_upload_endpoint> {
        endpoint_ = std::make_shared<fake_upload_endpoint>(grant_chunk_size);
        return endpoint_;
    }

    auto make_orchestrator(upload_config config) -> upload_orchestrator {
        if (!endpoint_) {
            make_endpoint(config.chunk_size);
        }
        auto built = upload_orchestrator::builder()
            .with_config(std::move(config))
            .with_endpoint(endpoint_)
            .with_observer(observer_)
            .build();
        EXPECT_TRUE(built.has_value()) << built.error().message;
        return std::move(built.value());
    }

    static auto small_config(int64_t chunk_size) -> upload_config {
        upload_config config;
        config.chunk_size = chunk_size;
        config.retry_delay = std::chrono::milliseconds(10);
        return config;
    }

    static auto memory_source(std::string name, byte_buffer data)
        -> std::shared_ptr<chunk_source> {
        return std::make_shared<memory_chunk_source>(std::move(name), std::move(data));
    }

    std::shared_ptr<fake_upload_endpoint> endpoint_;
    std::shared_ptr<recording_observer> observer_;
};

}  // namespace kcenon::chunked_upload::test

#endif  // KCENON_CHUNKED_UPLOAD_TEST_FIXTURES_H
