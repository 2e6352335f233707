#include <gtest/gtest.h>
#include "chunkwire/core/identity.hpp"
#include "chunkwire/storage/chunk_io.hpp"
#include "chunkwire/storage/memory_store.hpp"
#include "test_support.hpp"
#include <filesystem>

using namespace chunkwire::storage;
using chunkwire::core::TransferError;
using chunkwire::testing::pattern_bytes;

class ChunkIoTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(chunkwire::core::Identity::initialize());
        dir = std::filesystem::temp_directory_path() / "chunkwire_chunk_io_test";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);

        content = pattern_bytes(40000);
        source_path = dir / "input.bin";
        chunkwire::testing::write_file(source_path, content);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    std::filesystem::path dir;
    std::filesystem::path source_path;
    std::vector<std::uint8_t> content;
};

TEST_F(ChunkIoTest, FileSourceReadsChunks) {
    std::shared_ptr<FileChunkSource> source;
    ASSERT_TRUE(FileChunkSource::open(source_path, source));

    const auto& metadata = source->metadata();
    EXPECT_EQ(metadata.name, "input.bin");
    EXPECT_EQ(metadata.size, content.size());
    EXPECT_EQ(metadata.chunk_size, SMALL_FILE_CHUNK_SIZE);
    EXPECT_EQ(metadata.total_chunks, 3u);

    std::vector<std::uint8_t> chunk;
    ASSERT_TRUE(source->read_chunk(2, chunk));
    ASSERT_EQ(chunk.size(), 40000u - 2 * SMALL_FILE_CHUNK_SIZE);
    EXPECT_TRUE(std::equal(chunk.begin(), chunk.end(), content.begin() + 2 * SMALL_FILE_CHUNK_SIZE));

    EXPECT_EQ(source->read_chunk(3, chunk).error, TransferError::OUT_OF_RANGE);
}

TEST_F(ChunkIoTest, OpenMissingFileFails) {
    std::shared_ptr<FileChunkSource> source;
    auto result = FileChunkSource::open(dir / "missing.bin", source);

    EXPECT_FALSE(result);
    EXPECT_EQ(source, nullptr);
}

TEST_F(ChunkIoTest, StoreSourceServesHeldChunks) {
    auto store = std::make_shared<MemoryStore>();
    std::shared_ptr<FileChunkSource> file_source;
    ASSERT_TRUE(FileChunkSource::open(source_path, file_source));
    const auto metadata = file_source->metadata();

    std::vector<std::uint8_t> chunk;
    ASSERT_TRUE(file_source->read_chunk(0, chunk));
    ASSERT_TRUE(store->put_chunk(metadata.file_id, 0, chunk));

    StoreChunkSource source(store, metadata);
    std::vector<std::uint8_t> served;
    ASSERT_TRUE(source.read_chunk(0, served));
    EXPECT_EQ(served, chunk);
    EXPECT_EQ(source.read_chunk(1, served).error, TransferError::NOT_FOUND);
    EXPECT_EQ(source.read_chunk(99, served).error, TransferError::OUT_OF_RANGE);
}

TEST_F(ChunkIoTest, AssembleWritesWholeFile) {
    auto store = std::make_shared<MemoryStore>();
    std::shared_ptr<FileChunkSource> source;
    ASSERT_TRUE(FileChunkSource::open(source_path, source));
    const auto& metadata = source->metadata();

    // out of order on purpose
    for (std::uint32_t index : {2u, 0u, 1u}) {
        std::vector<std::uint8_t> chunk;
        ASSERT_TRUE(source->read_chunk(index, chunk));
        ASSERT_TRUE(store->put_chunk(metadata.file_id, index, chunk));
    }

    auto output = dir / "output.bin";
    ASSERT_TRUE(assemble_file(*store, metadata, output));
    EXPECT_EQ(chunkwire::testing::read_file(output), content);
    EXPECT_FALSE(std::filesystem::exists(dir / "output.bin.part"));
}

TEST_F(ChunkIoTest, AssembleRefusesIncompleteFile) {
    auto store = std::make_shared<MemoryStore>();
    std::shared_ptr<FileChunkSource> source;
    ASSERT_TRUE(FileChunkSource::open(source_path, source));
    const auto& metadata = source->metadata();

    std::vector<std::uint8_t> chunk;
    ASSERT_TRUE(source->read_chunk(0, chunk));
    ASSERT_TRUE(store->put_chunk(metadata.file_id, 0, chunk));

    auto output = dir / "output.bin";
    auto result = assemble_file(*store, metadata, output);
    EXPECT_FALSE(result);
    EXPECT_FALSE(std::filesystem::exists(output));
    EXPECT_FALSE(std::filesystem::exists(dir / "output.bin.part"));
}
