#include "chunkwire/storage/chunk_planner.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace chunkwire::storage {

std::uint32_t ChunkPlanner::chunk_count(std::uint64_t file_size, std::uint32_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    std::uint64_t count = file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        throw std::out_of_range("file of " + std::to_string(file_size) + " bytes needs " +
                                std::to_string(count) + " chunks of " + std::to_string(chunk_size) +
                                " bytes, more than a chunk index can address");
    }
    return static_cast<std::uint32_t>(count);
}

ChunkBounds ChunkPlanner::chunk_bounds(std::uint32_t index, std::uint64_t file_size, std::uint32_t chunk_size) {
    auto total = chunk_count(file_size, chunk_size);
    if (index >= total) {
        throw std::out_of_range("chunk index " + std::to_string(index) +
                                " out of range (total " + std::to_string(total) + ")");
    }

    std::uint64_t offset = static_cast<std::uint64_t>(index) * chunk_size;
    auto length = static_cast<std::uint32_t>(
        std::min<std::uint64_t>(chunk_size, file_size - offset));
    return ChunkBounds{offset, length};
}

std::uint32_t ChunkPlanner::select_chunk_size(std::uint64_t file_size) {
    constexpr std::uint64_t MB = 1024 * 1024;

    if (file_size < MB) {
        return SMALL_FILE_CHUNK_SIZE;
    }
    if (file_size < 100 * MB) {
        return MEDIUM_FILE_CHUNK_SIZE;
    }
    return LARGE_FILE_CHUNK_SIZE;
}

bool ChunkPlanner::valid_chunk_size(std::uint32_t chunk_size) {
    return chunk_size >= MIN_CHUNK_SIZE && chunk_size <= MAX_CHUNK_SIZE;
}

}
