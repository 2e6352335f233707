#pragma once

#include <cstdint>

namespace chunkwire::storage {

constexpr std::uint32_t MIN_CHUNK_SIZE = 1024;            // 1KB
constexpr std::uint32_t MAX_CHUNK_SIZE = 1024 * 1024;     // 1MB
constexpr std::uint32_t SMALL_FILE_CHUNK_SIZE = 16 * 1024;
constexpr std::uint32_t MEDIUM_FILE_CHUNK_SIZE = 32 * 1024;
constexpr std::uint32_t LARGE_FILE_CHUNK_SIZE = 64 * 1024;

struct ChunkBounds {
    std::uint64_t offset;
    std::uint32_t length;
};

// Stateless mapping between file sizes, chunk indices and byte ranges.
class ChunkPlanner {
public:
    // Throws std::invalid_argument for a zero chunk size, std::out_of_range when the
    // count does not fit in a 32-bit chunk index.
    static std::uint32_t chunk_count(std::uint64_t file_size, std::uint32_t chunk_size);

    // Throws std::out_of_range when index >= chunk_count(file_size, chunk_size).
    static ChunkBounds chunk_bounds(std::uint32_t index, std::uint64_t file_size, std::uint32_t chunk_size);

    // <1MB: 16KB, <100MB: 32KB, otherwise 64KB.
    static std::uint32_t select_chunk_size(std::uint64_t file_size);

    static bool valid_chunk_size(std::uint32_t chunk_size);
};

}
