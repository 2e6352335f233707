#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace chunkwire::core {

// libsodium-backed identifiers: random peer ids and stable file ids.
class Identity {
public:
    static bool initialize();

    // 16 random bytes, hex encoded.
    static std::string random_peer_id();

    static std::string sha256_hex(std::string_view input);
    static std::string to_hex(std::span<const std::uint8_t> bytes);

private:
    static bool initialized_;
};

}
