#include <gtest/gtest.h>
#include "chunkwire/core/identity.hpp"
#include "chunkwire/storage/chunk_planner.hpp"
#include "chunkwire/storage/file_metadata.hpp"
#include <cstdint>
#include <stdexcept>

using namespace chunkwire::storage;

class ChunkPlannerTest : public ::testing::Test {};

TEST_F(ChunkPlannerTest, ChunkCount) {
    EXPECT_EQ(ChunkPlanner::chunk_count(0, 1024), 0u);
    EXPECT_EQ(ChunkPlanner::chunk_count(1, 1024), 1u);
    EXPECT_EQ(ChunkPlanner::chunk_count(1024, 1024), 1u);
    EXPECT_EQ(ChunkPlanner::chunk_count(1025, 1024), 2u);
    EXPECT_EQ(ChunkPlanner::chunk_count(10 * 1024 * 1024, 32 * 1024), 320u);
    EXPECT_THROW(ChunkPlanner::chunk_count(100, 0), std::invalid_argument);
}

TEST_F(ChunkPlannerTest, CountBeyondChunkIndexRangeThrows) {
    const std::uint64_t largest = static_cast<std::uint64_t>(UINT32_MAX) * 1024;
    EXPECT_EQ(ChunkPlanner::chunk_count(largest, 1024), UINT32_MAX);
    EXPECT_THROW(ChunkPlanner::chunk_count(largest + 1, 1024), std::out_of_range);
    EXPECT_THROW(ChunkPlanner::chunk_count(1ULL << 44, 1024), std::out_of_range);
    EXPECT_THROW(ChunkPlanner::chunk_count(UINT64_MAX, 1), std::out_of_range);
}

TEST_F(ChunkPlannerTest, LastChunkIsShort) {
    auto first = ChunkPlanner::chunk_bounds(0, 2500, 1024);
    EXPECT_EQ(first.offset, 0u);
    EXPECT_EQ(first.length, 1024u);

    auto last = ChunkPlanner::chunk_bounds(2, 2500, 1024);
    EXPECT_EQ(last.offset, 2048u);
    EXPECT_EQ(last.length, 452u);

    EXPECT_THROW(ChunkPlanner::chunk_bounds(3, 2500, 1024), std::out_of_range);
}

TEST_F(ChunkPlannerTest, HundredThousandBytesInThirtyTwoKChunks) {
    EXPECT_EQ(ChunkPlanner::chunk_count(100000, 32768), 4u);
    for (std::uint32_t i = 0; i < 3; ++i) {
        EXPECT_EQ(ChunkPlanner::chunk_bounds(i, 100000, 32768).length, 32768u);
    }
    EXPECT_EQ(ChunkPlanner::chunk_bounds(3, 100000, 32768).length, 3696u);
}

TEST_F(ChunkPlannerTest, SelectChunkSize) {
    EXPECT_EQ(ChunkPlanner::select_chunk_size(10), SMALL_FILE_CHUNK_SIZE);
    EXPECT_EQ(ChunkPlanner::select_chunk_size(1024 * 1024 - 1), SMALL_FILE_CHUNK_SIZE);
    EXPECT_EQ(ChunkPlanner::select_chunk_size(1024 * 1024), MEDIUM_FILE_CHUNK_SIZE);
    EXPECT_EQ(ChunkPlanner::select_chunk_size(100ull * 1024 * 1024), LARGE_FILE_CHUNK_SIZE);
}

TEST_F(ChunkPlannerTest, ValidChunkSize) {
    EXPECT_TRUE(ChunkPlanner::valid_chunk_size(MIN_CHUNK_SIZE));
    EXPECT_TRUE(ChunkPlanner::valid_chunk_size(MAX_CHUNK_SIZE));
    EXPECT_FALSE(ChunkPlanner::valid_chunk_size(MIN_CHUNK_SIZE - 1));
    EXPECT_FALSE(ChunkPlanner::valid_chunk_size(MAX_CHUNK_SIZE + 1));
}

class FileMetadataTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(chunkwire::core::Identity::initialize());
    }

    std::chrono::system_clock::time_point mtime{std::chrono::milliseconds(1700000000000)};
};

TEST_F(FileMetadataTest, DescribeAppliesChunkPolicy) {
    auto metadata = FileMetadata::describe("report.pdf", 2 * 1024 * 1024, mtime, "application/pdf");

    EXPECT_EQ(metadata.chunk_size, MEDIUM_FILE_CHUNK_SIZE);
    EXPECT_EQ(metadata.total_chunks, 64u);
    EXPECT_EQ(metadata.file_id.size(), 64u);
    EXPECT_EQ(metadata.chunk_length(63), MEDIUM_FILE_CHUNK_SIZE);
}

TEST_F(FileMetadataTest, FileIdIsStable) {
    auto a = FileMetadata::derive_file_id("a.bin", 100, mtime);
    auto b = FileMetadata::derive_file_id("a.bin", 100, mtime);
    auto c = FileMetadata::derive_file_id("a.bin", 101, mtime);

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(a, chunkwire::core::Identity::sha256_hex("a.bin_100_1700000000000"));
}

TEST_F(FileMetadataTest, SerializeRoundTrip) {
    auto metadata = FileMetadata::describe("notes.txt", 40000, mtime, "text/plain");
    auto decoded = FileMetadata::deserialize(metadata.serialize());

    EXPECT_EQ(decoded, metadata);
    EXPECT_EQ(decoded.modified_at, metadata.modified_at);
}

TEST_F(FileMetadataTest, RejectsInconsistentLayout) {
    auto metadata = FileMetadata::describe("notes.txt", 40000, mtime);
    metadata.total_chunks += 1;

    EXPECT_THROW(FileMetadata::deserialize(metadata.serialize()), std::runtime_error);
}

TEST_F(FileMetadataTest, RejectsChunkSizeOutOfBounds) {
    auto metadata = FileMetadata::describe("notes.txt", 40000, mtime);
    metadata.chunk_size = 512;
    metadata.total_chunks = ChunkPlanner::chunk_count(metadata.size, metadata.chunk_size);
    EXPECT_THROW(FileMetadata::deserialize(metadata.serialize()), std::runtime_error);

    metadata.chunk_size = 2 * 1024 * 1024;
    metadata.total_chunks = 1;
    EXPECT_THROW(FileMetadata::deserialize(metadata.serialize()), std::runtime_error);
}

TEST_F(FileMetadataTest, GuessMimeType) {
    EXPECT_EQ(guess_mime_type("photo.JPG"), "image/jpeg");
    EXPECT_EQ(guess_mime_type("archive.unknown"), "application/octet-stream");
}
