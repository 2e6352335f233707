#include "chunkwire/core/identity.hpp"
#include "chunkwire/core/logger.hpp"
#include <sodium.h>
#include <array>
#include <stdexcept>
#include <vector>

namespace chunkwire::core {

bool Identity::initialized_ = false;

bool Identity::initialize() {
    if (initialized_) {
        return true;
    }

    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }

    initialized_ = true;
    return true;
}

std::string Identity::random_peer_id() {
    if (!initialize()) {
        throw std::runtime_error("libsodium unavailable, cannot generate peer id");
    }

    std::array<std::uint8_t, 16> raw{};
    randombytes_buf(raw.data(), raw.size());
    return to_hex(raw);
}

std::string Identity::sha256_hex(std::string_view input) {
    if (!initialize()) {
        throw std::runtime_error("libsodium unavailable, cannot hash");
    }

    std::array<std::uint8_t, crypto_hash_sha256_BYTES> digest{};
    crypto_hash_sha256(digest.data(),
                       reinterpret_cast<const unsigned char*>(input.data()),
                       input.size());
    return to_hex(digest);
}

std::string Identity::to_hex(std::span<const std::uint8_t> bytes) {
    std::vector<char> hex(bytes.size() * 2 + 1);
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    return std::string(hex.data(), bytes.size() * 2);
}

}
