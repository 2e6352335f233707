#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

// Big-endian read/write helpers shared by the wire codec and the record serializers.
// Readers consume from the front of the span and throw std::runtime_error on short input.
namespace chunkwire::core::bytes {

void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value);
void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value);
void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value);
void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value);
void write_string(std::vector<std::uint8_t>& buffer, const std::string& str);
void write_blob(std::vector<std::uint8_t>& buffer, std::span<const std::uint8_t> blob);

std::uint8_t read_uint8(std::span<const std::uint8_t>& data);
std::uint16_t read_uint16(std::span<const std::uint8_t>& data);
std::uint32_t read_uint32(std::span<const std::uint8_t>& data);
std::uint64_t read_uint64(std::span<const std::uint8_t>& data);
std::string read_string(std::span<const std::uint8_t>& data);
std::vector<std::uint8_t> read_blob(std::span<const std::uint8_t>& data);

}
