/**
 * @file test_chunk_splitter.cpp
 * @brief Unit tests for chunk_splitter
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/core/chunk_config.h>
#include <kcenon/chunked_upload/core/chunk_splitter.h>

#include <cstdint>
#include <utility>
#include <vector>

namespace kcenon::chunked_upload::test {

class ChunkSplitterTest : public ::testing::Test {
protected:
    static constexpr int64_t MiB = 1024 * 1024;

    static void expect_contiguous(const std::vector<chunk_range>& ranges, uint64_t total) {
        uint64_t expected_start = 0;
        for (std::size_t i = 0; i < ranges.size(); ++i) {
            EXPECT_EQ(ranges[i].index, i);
            EXPECT_EQ(ranges[i].start, expected_start);
            EXPECT_GT(ranges[i].size(), 0u);
            expected_start = ranges[i].end;
        }
        EXPECT_EQ(expected_start, total);
    }
};

// chunk_config Tests

TEST_F(ChunkSplitterTest, ChunkConfig_DefaultValues) {
    chunk_config config;

    EXPECT_EQ(config.chunk_size, chunk_config::default_chunk_size);
    EXPECT_EQ(config.chunk_size, 5 * MiB);

    auto result = config.validate();
    EXPECT_TRUE(result.has_value());
}

TEST_F(ChunkSplitterTest, ChunkConfig_RejectsNonPositiveSize) {
    EXPECT_FALSE(chunk_config(0).validate().has_value());

    auto result = chunk_config(-1).validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_input);
}

// plan Tests

TEST_F(ChunkSplitterTest, Plan_TwelveMegabytesInFiveMegabyteChunks) {
    auto result = chunk_splitter::plan(12 * MiB, 5 * MiB);
    ASSERT_TRUE(result.has_value());

    const auto& ranges = result.value();
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[0], (chunk_range{0, 0, 5 * MiB}));
    EXPECT_EQ(ranges[1], (chunk_range{1, 5 * MiB, 10 * MiB}));
    EXPECT_EQ(ranges[2], (chunk_range{2, 10 * MiB, 12 * MiB}));
    EXPECT_EQ(ranges[2].size(), static_cast<uint64_t>(2 * MiB));
}

TEST_F(ChunkSplitterTest, Plan_ExactMultiple) {
    auto result = chunk_splitter::plan(10 * MiB, 5 * MiB);
    ASSERT_TRUE(result.has_value());

    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[1].size(), static_cast<uint64_t>(5 * MiB));
    expect_contiguous(result.value(), 10 * MiB);
}

TEST_F(ChunkSplitterTest, Plan_SmallerThanOneChunk) {
    auto result = chunk_splitter::plan(100, 5 * MiB);
    ASSERT_TRUE(result.has_value());

    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0], (chunk_range{0, 0, 100}));
}

TEST_F(ChunkSplitterTest, Plan_EmptyFileHasNoChunks) {
    auto result = chunk_splitter::plan(0, 5 * MiB);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().empty());
}

TEST_F(ChunkSplitterTest, Plan_OneByteChunks) {
    auto result = chunk_splitter::plan(7, 1);
    ASSERT_TRUE(result.has_value());

    ASSERT_EQ(result.value().size(), 7u);
    expect_contiguous(result.value(), 7);
}

TEST_F(ChunkSplitterTest, Plan_CoversOddSizes) {
    for (int64_t size : {1, 999, 1000, 1001, 65537}) {
        auto result = chunk_splitter::plan(size, 1000);
        ASSERT_TRUE(result.has_value()) << "size " << size;
        expect_contiguous(result.value(), static_cast<uint64_t>(size));
    }
}

TEST_F(ChunkSplitterTest, Plan_IsIdempotent) {
    const std::vector<std::pair<int64_t, int64_t>> cases = {
        {0, 10}, {1, 1}, {10, 3}, {100, 100}, {12'000'000, 5'000'000}, {4097, 1024}};

    for (const auto& [file_size, chunk_size] : cases) {
        auto first = chunk_splitter::plan(file_size, chunk_size);
        auto second = chunk_splitter::plan(file_size, chunk_size);
        ASSERT_TRUE(first.has_value());
        ASSERT_TRUE(second.has_value());
        ASSERT_EQ(first.value().size(), second.value().size());

        for (std::size_t i = 0; i < first.value().size(); ++i) {
            const auto& a = first.value()[i];
            const auto& b = second.value()[i];
            EXPECT_EQ(a.index, b.index) << file_size << "/" << chunk_size << " #" << i;
            EXPECT_EQ(a.start, b.start) << file_size << "/" << chunk_size << " #" << i;
            EXPECT_EQ(a.end, b.end) << file_size << "/" << chunk_size << " #" << i;
        }
    }
}

TEST_F(ChunkSplitterTest, Plan_RejectsInvalidChunkSize) {
    auto result = chunk_splitter::plan(1024, 0);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_input);

    EXPECT_FALSE(chunk_splitter::plan(1024, -5).has_value());
}

TEST_F(ChunkSplitterTest, Plan_RejectsNegativeFileSize) {
    auto result = chunk_splitter::plan(-1, 1024);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_input);
}

// chunk_count Tests

TEST_F(ChunkSplitterTest, ChunkCount_MatchesPlan) {
    auto count = chunk_splitter::chunk_count(12 * MiB, 5 * MiB);
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(count.value(), 3u);

    EXPECT_EQ(chunk_splitter::chunk_count(0, 5 * MiB).value(), 0u);
    EXPECT_EQ(chunk_splitter::chunk_count(1, 5 * MiB).value(), 1u);
    EXPECT_EQ(chunk_splitter::chunk_count(5 * MiB + 1, 5 * MiB).value(), 2u);
}

TEST_F(ChunkSplitterTest, ChunkCount_RejectsInvalidInput) {
    EXPECT_FALSE(chunk_splitter::chunk_count(100, 0).has_value());
    EXPECT_FALSE(chunk_splitter::chunk_count(-100, 10).has_value());
}

}  // namespace kcenon::chunked_upload::test
