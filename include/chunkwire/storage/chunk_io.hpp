#pragma once

#include "chunkwire/core/result.hpp"
#include "chunkwire/storage/file_metadata.hpp"
#include "chunkwire/storage/persistent_store.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>

namespace chunkwire::storage {

// Read-only provider of a file's chunks, shared by every upload session of that file.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual const FileMetadata& metadata() const = 0;

    // OUT_OF_RANGE past the last chunk, NOT_FOUND when the chunk is not held.
    virtual core::Result read_chunk(std::uint32_t index, std::vector<std::uint8_t>& data) = 0;
};

class FileChunkSource : public ChunkSource {
public:
    FileChunkSource(const std::filesystem::path& path, FileMetadata metadata);

    // Describes the file and opens it for reading.
    static core::Result open(const std::filesystem::path& path, std::shared_ptr<FileChunkSource>& source);

    const FileMetadata& metadata() const override { return metadata_; }
    core::Result read_chunk(std::uint32_t index, std::vector<std::uint8_t>& data) override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    FileMetadata metadata_;
    std::ifstream file_;
    std::mutex mutex_;
};

// Serves chunks that were previously downloaded into a store.
class StoreChunkSource : public ChunkSource {
public:
    StoreChunkSource(std::shared_ptr<PersistentStore> store, FileMetadata metadata);

    const FileMetadata& metadata() const override { return metadata_; }
    core::Result read_chunk(std::uint32_t index, std::vector<std::uint8_t>& data) override;

private:
    std::shared_ptr<PersistentStore> store_;
    FileMetadata metadata_;
};

// Writes every stored chunk in index order to output_path. Fails without touching
// output_path unless all total_chunks chunks are present with their planned lengths.
core::Result assemble_file(PersistentStore& store, const FileMetadata& metadata,
                           const std::filesystem::path& output_path);

}
