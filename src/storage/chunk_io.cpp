#include "chunkwire/storage/chunk_io.hpp"
#include "chunkwire/storage/chunk_planner.hpp"
#include "chunkwire/core/logger.hpp"

namespace chunkwire::storage {

FileChunkSource::FileChunkSource(const std::filesystem::path& path, FileMetadata metadata)
    : path_(path)
    , metadata_(std::move(metadata))
    , file_(path, std::ios::binary) {
}

core::Result FileChunkSource::open(const std::filesystem::path& path,
                                   std::shared_ptr<FileChunkSource>& source) {
    FileMetadata metadata;
    auto result = FileMetadata::from_file(path, metadata);
    if (!result) {
        return result;
    }

    auto opened = std::make_shared<FileChunkSource>(path, std::move(metadata));
    if (!opened->file_.is_open()) {
        return core::Result(core::TransferError::FILE_READ_ERROR, "Cannot open " + path.string());
    }

    source = std::move(opened);
    return core::Result();
}

core::Result FileChunkSource::read_chunk(std::uint32_t index, std::vector<std::uint8_t>& data) {
    if (index >= metadata_.total_chunks) {
        return core::Result(core::TransferError::OUT_OF_RANGE,
                            "Chunk " + std::to_string(index) + " out of range");
    }

    auto bounds = ChunkPlanner::chunk_bounds(index, metadata_.size, metadata_.chunk_size);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return core::Result(core::TransferError::FILE_READ_ERROR, "File not open: " + path_.string());
    }

    file_.clear();
    file_.seekg(static_cast<std::streamoff>(bounds.offset), std::ios::beg);
    data.resize(bounds.length);
    file_.read(reinterpret_cast<char*>(data.data()), bounds.length);

    if (file_.gcount() != static_cast<std::streamsize>(bounds.length)) {
        data.clear();
        return core::Result(core::TransferError::FILE_READ_ERROR,
                            "Short read on chunk " + std::to_string(index) + " of " + path_.string());
    }
    return core::Result();
}

StoreChunkSource::StoreChunkSource(std::shared_ptr<PersistentStore> store, FileMetadata metadata)
    : store_(std::move(store))
    , metadata_(std::move(metadata)) {
}

core::Result StoreChunkSource::read_chunk(std::uint32_t index, std::vector<std::uint8_t>& data) {
    if (index >= metadata_.total_chunks) {
        return core::Result(core::TransferError::OUT_OF_RANGE,
                            "Chunk " + std::to_string(index) + " out of range");
    }
    return store_->get_chunk(metadata_.file_id, index, data);
}

core::Result assemble_file(PersistentStore& store, const FileMetadata& metadata,
                           const std::filesystem::path& output_path) {
    auto partial_path = output_path;
    partial_path += ".part";

    {
        std::ofstream output_file(partial_path, std::ios::binary | std::ios::trunc);
        if (!output_file.is_open()) {
            return core::Result(core::TransferError::FILE_WRITE_ERROR,
                                "Cannot create " + partial_path.string());
        }

        std::vector<std::uint8_t> chunk;
        std::uint64_t written = 0;

        for (std::uint32_t i = 0; i < metadata.total_chunks; ++i) {
            auto result = store.get_chunk(metadata.file_id, i, chunk);
            if (!result || chunk.size() != metadata.chunk_length(i)) {
                output_file.close();
                std::error_code ec;
                std::filesystem::remove(partial_path, ec);
                return core::Result(core::TransferError::STORE_FAILURE,
                                    "Chunk " + std::to_string(i) + " unavailable for assembly" +
                                    (result ? std::string(" (length mismatch)") : ": " + result.message));
            }

            output_file.write(reinterpret_cast<const char*>(chunk.data()),
                              static_cast<std::streamsize>(chunk.size()));
            if (!output_file.good()) {
                return core::Result(core::TransferError::FILE_WRITE_ERROR,
                                    "Write failed on " + partial_path.string());
            }
            written += chunk.size();
        }

        if (written != metadata.size) {
            return core::Result(core::TransferError::FILE_WRITE_ERROR,
                                "Assembled " + std::to_string(written) + " bytes, expected " +
                                std::to_string(metadata.size));
        }
    }

    std::error_code ec;
    std::filesystem::rename(partial_path, output_path, ec);
    if (ec) {
        return core::Result(core::TransferError::FILE_WRITE_ERROR,
                            "Cannot move assembled file into place: " + ec.message());
    }

    LOG_INFO("Assembled {} ({} bytes) at {}", metadata.name, metadata.size, output_path.string());
    return core::Result();
}

}
