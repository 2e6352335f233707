#include "chunkwire/storage/file_metadata.hpp"
#include "chunkwire/storage/chunk_planner.hpp"
#include "chunkwire/core/byte_order.hpp"
#include "chunkwire/core/identity.hpp"
#include "chunkwire/core/utils.hpp"
#include <map>
#include <stdexcept>

namespace chunkwire::storage {

namespace {

std::int64_t to_millis(std::chrono::system_clock::time_point time) {
    return core::utils::TimeUtils::to_unix_millis(time);
}

std::chrono::system_clock::time_point from_millis(std::int64_t millis) {
    return core::utils::TimeUtils::from_unix_millis(millis);
}

}

FileMetadata FileMetadata::describe(const std::string& name, std::uint64_t size,
                                    std::chrono::system_clock::time_point modified_at,
                                    const std::string& mime_type) {
    FileMetadata metadata;
    metadata.name = name;
    metadata.mime_type = mime_type;
    metadata.size = size;
    metadata.chunk_size = ChunkPlanner::select_chunk_size(size);
    metadata.total_chunks = ChunkPlanner::chunk_count(size, metadata.chunk_size);
    metadata.created_at = std::chrono::system_clock::now();
    metadata.modified_at = modified_at;
    metadata.file_id = derive_file_id(name, size, modified_at);
    return metadata;
}

core::Result FileMetadata::from_file(const std::filesystem::path& path, FileMetadata& metadata) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return core::Result(core::TransferError::NOT_FOUND, "Not a regular file: " + path.string());
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return core::Result(core::TransferError::FILE_READ_ERROR,
                            "Cannot stat " + path.string() + ": " + ec.message());
    }

    auto write_time = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return core::Result(core::TransferError::FILE_READ_ERROR,
                            "Cannot read mtime of " + path.string() + ": " + ec.message());
    }

    auto modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(write_time));

    try {
        metadata = describe(path.filename().string(), size, modified, guess_mime_type(path));
    } catch (const std::exception& e) {
        return core::Result(core::TransferError::FILE_READ_ERROR, e.what());
    }
    return core::Result();
}

std::string FileMetadata::derive_file_id(const std::string& name, std::uint64_t size,
                                         std::chrono::system_clock::time_point modified_at) {
    auto key = name + "_" + std::to_string(size) + "_" + std::to_string(to_millis(modified_at));
    return core::Identity::sha256_hex(key);
}

bool FileMetadata::same_layout(const FileMetadata& other) const {
    return size == other.size &&
           chunk_size == other.chunk_size &&
           total_chunks == other.total_chunks;
}

std::uint32_t FileMetadata::chunk_length(std::uint32_t index) const {
    return ChunkPlanner::chunk_bounds(index, size, chunk_size).length;
}

std::vector<std::uint8_t> FileMetadata::serialize() const {
    std::vector<std::uint8_t> buffer;
    core::bytes::write_string(buffer, file_id);
    core::bytes::write_string(buffer, name);
    core::bytes::write_string(buffer, mime_type);
    core::bytes::write_uint64(buffer, size);
    core::bytes::write_uint32(buffer, chunk_size);
    core::bytes::write_uint32(buffer, total_chunks);
    core::bytes::write_uint64(buffer, static_cast<std::uint64_t>(to_millis(created_at)));
    core::bytes::write_uint64(buffer, static_cast<std::uint64_t>(to_millis(modified_at)));
    return buffer;
}

FileMetadata FileMetadata::deserialize(std::span<const std::uint8_t> data) {
    FileMetadata metadata;
    metadata.file_id = core::bytes::read_string(data);
    metadata.name = core::bytes::read_string(data);
    metadata.mime_type = core::bytes::read_string(data);
    metadata.size = core::bytes::read_uint64(data);
    metadata.chunk_size = core::bytes::read_uint32(data);
    metadata.total_chunks = core::bytes::read_uint32(data);
    metadata.created_at = from_millis(static_cast<std::int64_t>(core::bytes::read_uint64(data)));
    metadata.modified_at = from_millis(static_cast<std::int64_t>(core::bytes::read_uint64(data)));

    if (!ChunkPlanner::valid_chunk_size(metadata.chunk_size)) {
        throw std::runtime_error("Chunk size " + std::to_string(metadata.chunk_size) +
                                 " out of bounds in metadata for " + metadata.file_id);
    }
    if (metadata.total_chunks != ChunkPlanner::chunk_count(metadata.size, metadata.chunk_size)) {
        throw std::runtime_error("Inconsistent chunk layout in metadata for " + metadata.file_id);
    }
    return metadata;
}

bool FileMetadata::operator==(const FileMetadata& other) const {
    return file_id == other.file_id &&
           name == other.name &&
           mime_type == other.mime_type &&
           same_layout(other);
}

std::string guess_mime_type(const std::filesystem::path& path) {
    static const std::map<std::string, std::string> types = {
        {".txt", "text/plain"},
        {".html", "text/html"},
        {".json", "application/json"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".mp3", "audio/mpeg"},
        {".mp4", "video/mp4"},
    };

    auto ext = core::utils::StringUtils::to_lower(path.extension().string());
    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}

}
