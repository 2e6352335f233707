#pragma once

#include <cstdint>
#include <vector>

namespace chunkwire::storage {

// Inclusive range of chunk indices.
struct Range {
    std::uint32_t start = 0;
    std::uint32_t end = 0;

    std::uint32_t length() const { return end - start + 1; }
    bool contains(std::uint32_t index) const { return index >= start && index <= end; }

    bool operator==(const Range& other) const = default;
};

// Chunk presence bitmap. Bit i lives in byte i/8 at position 7 - i%8 (MSB first),
// which is also the BITFIELD wire layout.
class Bitfield {
public:
    Bitfield() = default;
    explicit Bitfield(std::uint32_t total_chunks);

    // Throws std::invalid_argument when bytes.size() != ceil(total_chunks / 8).
    // Padding bits past total_chunks are cleared.
    static Bitfield from_bytes(std::vector<std::uint8_t> bytes, std::uint32_t total_chunks);

    bool has(std::uint32_t index) const;

    // Returns true if the bit was newly set. Throws std::out_of_range past the end.
    bool set(std::uint32_t index);

    std::uint32_t size() const { return total_chunks_; }
    std::uint32_t count() const { return count_; }
    bool complete() const { return count_ == total_chunks_; }

    // Recounts set bits from the raw bytes.
    std::uint32_t popcount() const;

    // Zero-extends to a larger chunk total; existing bits are kept.
    void grow(std::uint32_t new_total_chunks);

    // Maximal runs of missing indices in ascending order, each at most max_range_size long.
    std::vector<Range> missing_ranges(std::uint32_t max_range_size) const;

    const std::vector<std::uint8_t>& bytes() const { return bits_; }

    bool operator==(const Bitfield& other) const {
        return total_chunks_ == other.total_chunks_ && bits_ == other.bits_;
    }

    static std::size_t byte_length(std::uint32_t total_chunks) {
        return (static_cast<std::size_t>(total_chunks) + 7) / 8;
    }

private:
    std::vector<std::uint8_t> bits_;
    std::uint32_t total_chunks_ = 0;
    std::uint32_t count_ = 0;

    void clear_padding();
};

}
