#include "chunkwire/storage/bitfield.hpp"
#include <bit>
#include <stdexcept>
#include <string>

namespace chunkwire::storage {

Bitfield::Bitfield(std::uint32_t total_chunks)
    : bits_(byte_length(total_chunks), 0)
    , total_chunks_(total_chunks)
    , count_(0) {
}

Bitfield Bitfield::from_bytes(std::vector<std::uint8_t> bytes, std::uint32_t total_chunks) {
    if (bytes.size() != byte_length(total_chunks)) {
        throw std::invalid_argument("bitfield length " + std::to_string(bytes.size()) +
                                    " does not match " + std::to_string(total_chunks) + " chunks");
    }

    Bitfield bitfield;
    bitfield.bits_ = std::move(bytes);
    bitfield.total_chunks_ = total_chunks;
    bitfield.clear_padding();
    bitfield.count_ = bitfield.popcount();
    return bitfield;
}

bool Bitfield::has(std::uint32_t index) const {
    if (index >= total_chunks_) {
        throw std::out_of_range("bit index " + std::to_string(index) + " out of range");
    }
    return (bits_[index / 8] & (0x80u >> (index % 8))) != 0;
}

bool Bitfield::set(std::uint32_t index) {
    if (has(index)) {
        return false;
    }
    bits_[index / 8] |= static_cast<std::uint8_t>(0x80u >> (index % 8));
    ++count_;
    return true;
}

std::uint32_t Bitfield::popcount() const {
    std::uint32_t total = 0;
    for (auto byte : bits_) {
        total += static_cast<std::uint32_t>(std::popcount(byte));
    }
    return total;
}

void Bitfield::grow(std::uint32_t new_total_chunks) {
    if (new_total_chunks < total_chunks_) {
        throw std::invalid_argument("bitfield cannot shrink");
    }
    bits_.resize(byte_length(new_total_chunks), 0);
    total_chunks_ = new_total_chunks;
}

std::vector<Range> Bitfield::missing_ranges(std::uint32_t max_range_size) const {
    if (max_range_size == 0) {
        throw std::invalid_argument("max range size must be positive");
    }

    std::vector<Range> ranges;
    bool in_run = false;
    Range current;

    for (std::uint32_t i = 0; i < total_chunks_; ++i) {
        bool missing = (bits_[i / 8] & (0x80u >> (i % 8))) == 0;

        if (missing) {
            if (!in_run) {
                current = Range{i, i};
                in_run = true;
            } else {
                current.end = i;
            }

            if (current.length() == max_range_size) {
                ranges.push_back(current);
                in_run = false;
            }
        } else if (in_run) {
            ranges.push_back(current);
            in_run = false;
        }
    }

    if (in_run) {
        ranges.push_back(current);
    }

    return ranges;
}

void Bitfield::clear_padding() {
    auto used = total_chunks_ % 8;
    if (used != 0 && !bits_.empty()) {
        bits_.back() &= static_cast<std::uint8_t>(0xFFu << (8 - used));
    }
}

}
