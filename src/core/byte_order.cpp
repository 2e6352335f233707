#include "chunkwire/core/byte_order.hpp"
#include <stdexcept>

namespace chunkwire::core::bytes {

void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value) {
    buffer.push_back(value);
}

void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
    buffer.push_back((value >> 8) & 0xFF);
    buffer.push_back(value & 0xFF);
}

void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
    buffer.push_back((value >> 24) & 0xFF);
    buffer.push_back((value >> 16) & 0xFF);
    buffer.push_back((value >> 8) & 0xFF);
    buffer.push_back(value & 0xFF);
}

void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
    write_uint32(buffer, static_cast<std::uint32_t>(value >> 32));
    write_uint32(buffer, static_cast<std::uint32_t>(value & 0xFFFFFFFF));
}

void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
    write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
    buffer.insert(buffer.end(), str.begin(), str.end());
}

void write_blob(std::vector<std::uint8_t>& buffer, std::span<const std::uint8_t> blob) {
    write_uint32(buffer, static_cast<std::uint32_t>(blob.size()));
    buffer.insert(buffer.end(), blob.begin(), blob.end());
}

std::uint8_t read_uint8(std::span<const std::uint8_t>& data) {
    if (data.empty()) throw std::runtime_error("Insufficient data for uint8");
    std::uint8_t value = data[0];
    data = data.subspan(1);
    return value;
}

std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
    if (data.size() < 2) throw std::runtime_error("Insufficient data for uint16");
    std::uint16_t value = (static_cast<std::uint16_t>(data[0]) << 8) |
                         static_cast<std::uint16_t>(data[1]);
    data = data.subspan(2);
    return value;
}

std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
    if (data.size() < 4) throw std::runtime_error("Insufficient data for uint32");
    std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                         (static_cast<std::uint32_t>(data[1]) << 16) |
                         (static_cast<std::uint32_t>(data[2]) << 8) |
                         static_cast<std::uint32_t>(data[3]);
    data = data.subspan(4);
    return value;
}

std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
    if (data.size() < 8) throw std::runtime_error("Insufficient data for uint64");
    std::uint64_t high = read_uint32(data);
    std::uint64_t low = read_uint32(data);
    return (high << 32) | low;
}

std::string read_string(std::span<const std::uint8_t>& data) {
    auto length = read_uint32(data);
    if (data.size() < length) throw std::runtime_error("Insufficient data for string");
    std::string str(reinterpret_cast<const char*>(data.data()), length);
    data = data.subspan(length);
    return str;
}

std::vector<std::uint8_t> read_blob(std::span<const std::uint8_t>& data) {
    auto length = read_uint32(data);
    if (data.size() < length) throw std::runtime_error("Insufficient data for blob");
    std::vector<std::uint8_t> blob(data.begin(), data.begin() + length);
    data = data.subspan(length);
    return blob;
}

}
