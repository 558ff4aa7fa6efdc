/**
 * @file test_core_types.cpp
 * @brief Unit tests for core types (error_code, error, result)
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/core/types.h>

#include <memory>
#include <string>

namespace kcenon::chunked_upload::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Input errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::invalid_input), -100);
    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -101);

    // Source errors: -120 to -139
    EXPECT_EQ(static_cast<int>(error_code::file_not_found), -120);
    EXPECT_EQ(static_cast<int>(error_code::invalid_chunk_range), -122);

    // Session errors: -140 to -159
    EXPECT_EQ(static_cast<int>(error_code::session_start_failure), -140);
    EXPECT_EQ(static_cast<int>(error_code::invalid_state), -145);

    // Transport errors: -160 to -179
    EXPECT_EQ(static_cast<int>(error_code::request_failed), -160);

    // Compression errors: -180 to -199
    EXPECT_EQ(static_cast<int>(error_code::compression_failed), -180);

    // Internal errors: -200 to -219
    EXPECT_EQ(static_cast<int>(error_code::internal_error), -200);
    EXPECT_EQ(static_cast<int>(error_code::timeout), -201);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::session_start_failure), "session start failure");
    EXPECT_STREQ(to_string(error_code::chunk_permanent_failure), "chunk permanent failure");
    EXPECT_STREQ(to_string(error_code::finalize_failure), "finalize failure");
    EXPECT_STREQ(to_string(error_code::cancelled), "cancelled");
}

// =============================================================================
// error Tests
// =============================================================================

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, DefaultIsSuccess) {
    error err;
    EXPECT_EQ(err.code, error_code::success);
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST_F(ErrorTest, CodeOnlyUsesDefaultMessage) {
    error err(error_code::timeout);
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, "timeout");
}

TEST_F(ErrorTest, CustomMessage) {
    error err(error_code::request_failed, "connection refused");
    EXPECT_EQ(err.code, error_code::request_failed);
    EXPECT_EQ(err.message, "connection refused");
}

// =============================================================================
// result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<std::string> r = unexpected{error{error_code::file_not_found, "missing"}};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::file_not_found);
    EXPECT_EQ(r.error().message, "missing");
}

TEST_F(ResultTest, MoveOnlyValue) {
    result<std::unique_ptr<int>> r = std::make_unique<int>(7);
    ASSERT_TRUE(r.has_value());

    auto owned = std::move(r).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected{error{error_code::invalid_state, "bad state"}};
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::invalid_state);
}

}  // namespace kcenon::chunked_upload::test
