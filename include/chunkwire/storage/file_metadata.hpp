#pragma once

#include "chunkwire/core/result.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace chunkwire::storage {

// Immutable description of a file offered for transfer.
struct FileMetadata {
    std::string file_id;
    std::string name;
    std::string mime_type;
    std::uint64_t size = 0;
    std::uint32_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point modified_at;

    // Builds metadata with the chunk size policy applied and the file id derived.
    static FileMetadata describe(const std::string& name, std::uint64_t size,
                                 std::chrono::system_clock::time_point modified_at,
                                 const std::string& mime_type = "application/octet-stream");

    static core::Result from_file(const std::filesystem::path& path, FileMetadata& metadata);

    // Stable id: SHA-256 over "name_size_mtime", hex encoded.
    static std::string derive_file_id(const std::string& name, std::uint64_t size,
                                      std::chrono::system_clock::time_point modified_at);

    // Size, chunk size and chunk count agree.
    bool same_layout(const FileMetadata& other) const;

    std::uint32_t chunk_length(std::uint32_t index) const;

    std::vector<std::uint8_t> serialize() const;
    static FileMetadata deserialize(std::span<const std::uint8_t> data);

    bool operator==(const FileMetadata& other) const;
    bool operator!=(const FileMetadata& other) const { return !(*this == other); }
};

std::string guess_mime_type(const std::filesystem::path& path);

}
