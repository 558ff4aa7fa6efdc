/**
 * @file test_http_upload_endpoint.cpp
 * @brief Unit tests for the HTTP binding of the upload endpoint
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/transport/http_upload_endpoint.h>

#include <cstdlib>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::chunked_upload::test {

/**
 * @brief Records requests and replays canned responses
 */
class recording_http_client : public http_client_interface {
public:
    struct request {
        std::string url;
        std::string body;
        std::map<std::string, std::string> headers;
    };

    void respond(int status, const std::string& body) {
        http_response response;
        response.status_code = status;
        response.body.assign(body.begin(), body.end());
        std::lock_guard lock(mutex_);
        responses_.push_back(std::move(response));
    }

    void fail_transport(const std::string& message) {
        std::lock_guard lock(mutex_);
        transport_failure_ = message;
    }

    auto post(const std::string& url,
              const std::string& body,
              const std::map<std::string, std::string>& headers)
        -> result<http_response> override {
        return record(url, body, headers);
    }

    auto post(const std::string& url,
              const std::vector<uint8_t>& body,
              const std::map<std::string, std::string>& headers)
        -> result<http_response> override {
        return record(url, std::string(body.begin(), body.end()), headers);
    }

    auto requests() -> std::vector<request> {
        std::lock_guard lock(mutex_);
        return requests_;
    }

private:
    auto record(const std::string& url,
                std::string body,
                const std::map<std::string, std::string>& headers)
        -> result<http_response> {
        std::lock_guard lock(mutex_);
        requests_.push_back(request{url, std::move(body), headers});
        if (!transport_failure_.empty()) {
            return unexpected{error{error_code::request_failed, transport_failure_}};
        }
        if (responses_.empty()) {
            http_response ok;
            ok.status_code = 200;
            return ok;
        }
        auto response = std::move(responses_.front());
        responses_.pop_front();
        return response;
    }

    std::mutex mutex_;
    std::deque<http_response> responses_;
    std::vector<request> requests_;
    std::string transport_failure_;
};

class HttpUploadEndpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<recording_http_client>();
        endpoint_config config;
        config.api_base_url = "http://uploads.test";
        endpoint_ = std::make_unique<http_upload_endpoint>(config, client_);
    }

    static auto bytes(const std::string& text) -> std::vector<std::byte> {
        std::vector<std::byte> out;
        for (char c : text) {
            out.push_back(static_cast<std::byte>(c));
        }
        return out;
    }

    static auto contains(const std::string& haystack, const std::string& needle) -> bool {
        return haystack.find(needle) != std::string::npos;
    }

    std::shared_ptr<recording_http_client> client_;
    std::unique_ptr<http_upload_endpoint> endpoint_;
};

// =============================================================================
// start_session
// =============================================================================

TEST_F(HttpUploadEndpointTest, StartSession_RequestFormat) {
    client_->respond(200, R"({"upload_id":"abc","chunk_size":5242880})");

    auto grant = endpoint_->start_session("my photo.jpg", 3, "alice");
    ASSERT_TRUE(grant.has_value()) << grant.error().message;

    auto sent = client_->requests();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].url, "http://uploads.test/api/upload/start");
    EXPECT_EQ(sent[0].body, "filename=my+photo.jpg&total_chunks=3&guest=alice");
    EXPECT_EQ(sent[0].headers.at("Content-Type"), "application/x-www-form-urlencoded");
}

TEST_F(HttpUploadEndpointTest, StartSession_ParsesGrant) {
    client_->respond(200, R"({"upload_id": "abc", "chunk_size": 2097152})");

    auto grant = endpoint_->start_session("a.bin", 1, "");
    ASSERT_TRUE(grant.has_value());
    EXPECT_EQ(grant.value().upload_id, "abc");
    EXPECT_EQ(grant.value().chunk_size, 2097152);
}

TEST_F(HttpUploadEndpointTest, StartSession_ErrorWithDetail) {
    client_->respond(400, R"({"detail":"quota exceeded"})");

    auto grant = endpoint_->start_session("a.bin", 1, "");
    ASSERT_FALSE(grant.has_value());
    EXPECT_EQ(grant.error().code, error_code::session_start_failure);
    EXPECT_EQ(grant.error().message, "Failed to start upload session: quota exceeded");
}

TEST_F(HttpUploadEndpointTest, StartSession_ErrorWithoutDetail) {
    client_->respond(500, "Internal Server Error");

    auto grant = endpoint_->start_session("a.bin", 1, "");
    ASSERT_FALSE(grant.has_value());
    EXPECT_EQ(grant.error().message, "Failed to start upload session");
}

TEST_F(HttpUploadEndpointTest, StartSession_MalformedResponse) {
    client_->respond(200, R"({"chunk_size":100})");

    auto grant = endpoint_->start_session("a.bin", 1, "");
    ASSERT_FALSE(grant.has_value());
    EXPECT_EQ(grant.error().code, error_code::session_start_failure);
    EXPECT_TRUE(contains(grant.error().message, "malformed response"));
}

TEST_F(HttpUploadEndpointTest, StartSession_InvalidChunkSize) {
    client_->respond(200, R"({"upload_id":"abc","chunk_size":0})");

    auto grant = endpoint_->start_session("a.bin", 1, "");
    ASSERT_FALSE(grant.has_value());
    EXPECT_TRUE(contains(grant.error().message, "invalid chunk_size 0"));
}

TEST_F(HttpUploadEndpointTest, StartSession_TransportFailure) {
    client_->fail_transport("connection refused");

    auto grant = endpoint_->start_session("a.bin", 1, "");
    ASSERT_FALSE(grant.has_value());
    EXPECT_EQ(grant.error().code, error_code::session_start_failure);
    EXPECT_EQ(grant.error().message, "Failed to start upload session: connection refused");
}

// =============================================================================
// upload_chunk
// =============================================================================

TEST_F(HttpUploadEndpointTest, UploadChunk_MultipartFormat) {
    auto payload = bytes("chunk-bytes");
    chunk_upload_request request;
    request.upload_id = "abc";
    request.chunk_index = 1;
    request.total_chunks = 3;
    request.payload = payload;

    auto sent_result = endpoint_->upload_chunk(request);
    ASSERT_TRUE(sent_result.has_value());

    auto sent = client_->requests();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].url, "http://uploads.test/api/upload/chunk/abc");

    const auto& content_type = sent[0].headers.at("Content-Type");
    ASSERT_EQ(content_type.rfind("multipart/form-data; boundary=", 0), 0u);
    auto boundary = content_type.substr(std::string("multipart/form-data; boundary=").size());

    const auto& body = sent[0].body;
    EXPECT_TRUE(contains(body, "--" + boundary + "\r\n"));
    EXPECT_TRUE(contains(body,
        "Content-Disposition: form-data; name=\"file\"; filename=\"chunk_1\"\r\n"
        "Content-Type: application/octet-stream\r\n\r\nchunk-bytes\r\n"));
    EXPECT_TRUE(contains(body,
        "Content-Disposition: form-data; name=\"chunk_index\"\r\n\r\n1\r\n"));
    EXPECT_TRUE(contains(body,
        "Content-Disposition: form-data; name=\"total_chunks\"\r\n\r\n3\r\n"));
    EXPECT_FALSE(contains(body, "name=\"compression\""));
    EXPECT_TRUE(contains(body, "--" + boundary + "--\r\n"));
}

TEST_F(HttpUploadEndpointTest, UploadChunk_CompressedFields) {
    auto payload = bytes("lz4");
    chunk_upload_request request;
    request.upload_id = "abc";
    request.chunk_index = 0;
    request.total_chunks = 1;
    request.payload = payload;
    request.compressed = true;
    request.original_size = 4096;

    ASSERT_TRUE(endpoint_->upload_chunk(request).has_value());

    auto body = client_->requests().at(0).body;
    EXPECT_TRUE(contains(body, "name=\"compression\"\r\n\r\nlz4\r\n"));
    EXPECT_TRUE(contains(body, "name=\"original_size\"\r\n\r\n4096\r\n"));
}

TEST_F(HttpUploadEndpointTest, UploadChunk_EncodesUploadId) {
    auto payload = bytes("x");
    chunk_upload_request request;
    request.upload_id = "a/b c";
    request.payload = payload;
    request.total_chunks = 1;

    ASSERT_TRUE(endpoint_->upload_chunk(request).has_value());
    EXPECT_EQ(client_->requests().at(0).url, "http://uploads.test/api/upload/chunk/a%2Fb%20c");
}

TEST_F(HttpUploadEndpointTest, UploadChunk_ErrorDetail) {
    client_->respond(413, R"({"detail":"Chunk too large"})");

    auto payload = bytes("x");
    chunk_upload_request request;
    request.upload_id = "abc";
    request.payload = payload;

    auto sent = endpoint_->upload_chunk(request);
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::chunk_transfer_failure);
    EXPECT_EQ(sent.error().message, "Chunk too large");
}

TEST_F(HttpUploadEndpointTest, UploadChunk_ErrorWithoutDetail) {
    client_->respond(502, "Bad Gateway");

    auto payload = bytes("x");
    chunk_upload_request request;
    request.upload_id = "abc";
    request.payload = payload;

    auto sent = endpoint_->upload_chunk(request);
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().message, "Upload failed");
}

// =============================================================================
// complete_session
// =============================================================================

TEST_F(HttpUploadEndpointTest, CompleteSession_ReturnsPayloadVerbatim) {
    client_->respond(200, R"({"file_id":"f1","url":"/files/f1"})");

    auto payload = endpoint_->complete_session("abc");
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(payload.value(), R"({"file_id":"f1","url":"/files/f1"})");

    auto sent = client_->requests();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].url, "http://uploads.test/api/upload/complete/abc");
    EXPECT_TRUE(sent[0].body.empty());
}

TEST_F(HttpUploadEndpointTest, CompleteSession_Error) {
    client_->respond(409, R"({"detail":"missing chunks"})");

    auto payload = endpoint_->complete_session("abc");
    ASSERT_FALSE(payload.has_value());
    EXPECT_EQ(payload.error().code, error_code::finalize_failure);
    EXPECT_EQ(payload.error().message, "Failed to complete upload: missing chunks");
}

TEST_F(HttpUploadEndpointTest, CompleteSession_ErrorWithoutDetail) {
    client_->respond(500, "");

    auto payload = endpoint_->complete_session("abc");
    ASSERT_FALSE(payload.has_value());
    EXPECT_EQ(payload.error().message, "Failed to complete upload");
}

// =============================================================================
// Configuration
// =============================================================================

TEST_F(HttpUploadEndpointTest, RelativeUrlsWithoutBase) {
    http_upload_endpoint relative(endpoint_config{}, client_);
    (void)relative.complete_session("abc");

    EXPECT_EQ(client_->requests().at(0).url, "/api/upload/complete/abc");
}

TEST_F(HttpUploadEndpointTest, ConfigFromEnvironment) {
    ::setenv("CHUNKED_UPLOAD_API_BASE_URL", "http://env.test", 1);
    EXPECT_EQ(endpoint_config::from_environment().api_base_url, "http://env.test");

    ::unsetenv("CHUNKED_UPLOAD_API_BASE_URL");
    ::setenv("API_BASE_URL", "http://legacy.test", 1);
    EXPECT_EQ(endpoint_config::from_environment().api_base_url, "http://legacy.test");

    ::unsetenv("API_BASE_URL");
    EXPECT_TRUE(endpoint_config::from_environment().api_base_url.empty());
}

TEST_F(HttpUploadEndpointTest, DefaultClientWithoutNetworkSystem) {
    network_http_client client;
    if (client.is_available()) {
        GTEST_SKIP() << "network_system HTTP client is available";
    }

    auto response = client.post("http://uploads.test/api/upload/start", std::string{}, {});
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::internal_error);
}

}  // namespace kcenon::chunked_upload::test
