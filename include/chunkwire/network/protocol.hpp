#pragma once

#include "chunkwire/storage/bitfield.hpp"
#include "chunkwire/storage/file_metadata.hpp"
#include <array>
#include <concepts>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace chunkwire::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x43484E4B; // "CHNK"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t FRAME_HEADER_SIZE = 20;
constexpr std::uint32_t MAX_FRAME_PAYLOAD = 16 * 1024 * 1024;

enum class MessageType : std::uint8_t {
    HELLO           = 0x01,

    META            = 0x10,
    BITFIELD        = 0x11,
    REQUEST         = 0x12,
    CHUNK           = 0x13,
    ACK             = 0x14,
    NEED            = 0x15,
    END             = 0x16,

    ERROR_RESPONSE  = 0xFF
};

const char* to_string(MessageType type);

class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct FrameHeader {
    std::uint32_t magic;           // PROTOCOL_MAGIC
    std::uint16_t version;
    MessageType type;
    std::uint8_t flags;            // reserved, always 0
    std::uint64_t timestamp_ms;    // sender wall clock
    std::uint32_t payload_size;

    FrameHeader();
    FrameHeader(MessageType msg_type, std::uint32_t payload_len);

    bool is_valid() const;

    std::vector<std::uint8_t> serialize() const;
    // Throws ProtocolError on short input, bad magic/version or oversized payload.
    static FrameHeader deserialize(std::span<const std::uint8_t> data);
};

template<typename T>
concept MessagePayload = requires(T t) {
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
};

// Transport-level greeting; carries the stable peer id used to find a paused session.
struct HelloMessage {
    std::string peer_id;

    std::vector<std::uint8_t> serialize() const;
    static HelloMessage deserialize(std::span<const std::uint8_t> data);
};

struct MetaMessage {
    storage::FileMetadata metadata;

    std::vector<std::uint8_t> serialize() const;
    static MetaMessage deserialize(std::span<const std::uint8_t> data);
};

struct BitfieldMessage {
    std::string file_id;
    std::uint32_t total_chunks = 0;
    std::uint32_t received_count = 0;
    std::vector<std::uint8_t> bits;   // MSB-first, ceil(total_chunks / 8) bytes

    std::vector<std::uint8_t> serialize() const;
    static BitfieldMessage deserialize(std::span<const std::uint8_t> data);
};

struct RequestMessage {
    std::uint32_t start = 0;
    std::uint32_t end = 0;            // inclusive

    std::vector<std::uint8_t> serialize() const;
    static RequestMessage deserialize(std::span<const std::uint8_t> data);
};

// index u32 followed by the raw chunk bytes, no length prefix.
struct ChunkMessage {
    std::uint32_t index = 0;
    std::vector<std::uint8_t> payload;

    std::vector<std::uint8_t> serialize() const;
    static ChunkMessage deserialize(std::span<const std::uint8_t> data);
};

struct AckMessage {
    std::uint32_t index = 0;

    std::vector<std::uint8_t> serialize() const;
    static AckMessage deserialize(std::span<const std::uint8_t> data);
};

struct NeedMessage {
    std::vector<storage::Range> ranges;

    std::vector<std::uint8_t> serialize() const;
    static NeedMessage deserialize(std::span<const std::uint8_t> data);
};

struct EndMessage {
    std::vector<std::uint8_t> serialize() const { return {}; }
    static EndMessage deserialize(std::span<const std::uint8_t>) { return EndMessage{}; }
};

enum class ErrorCode : std::uint32_t {
    NONE                = 0,
    INVALID_MESSAGE     = 1,
    CHUNK_NOT_AVAILABLE = 2,
    OUT_OF_RANGE        = 3,
    METADATA_MISMATCH   = 4,
    STORE_FAILURE       = 5,
    CANCELLED           = 6,
    INTERNAL_ERROR      = 99
};

struct ErrorMessage {
    ErrorCode code = ErrorCode::NONE;
    std::uint32_t index = 0;          // offending chunk index where relevant
    std::string reason;

    std::vector<std::uint8_t> serialize() const;
    static ErrorMessage deserialize(std::span<const std::uint8_t> data);
};

using ControlMessage = std::variant<MetaMessage, BitfieldMessage, RequestMessage, ChunkMessage,
                                    AckMessage, NeedMessage, EndMessage, ErrorMessage>;

MessageType message_type(const ControlMessage& message);

std::vector<std::uint8_t> encode_frame(MessageType type, std::span<const std::uint8_t> payload);

template<MessagePayload T>
std::vector<std::uint8_t> encode_frame(MessageType type, const T& payload) {
    auto payload_data = payload.serialize();
    return encode_frame(type, payload_data);
}

// One complete frame per control message.
std::vector<std::uint8_t> encode(const ControlMessage& message);

// Throws ProtocolError on any malformed frame. HELLO frames are transport-level and rejected here.
ControlMessage decode(std::span<const std::uint8_t> frame);

}

static_assert(chunkwire::network::MessagePayload<chunkwire::network::HelloMessage>);
static_assert(chunkwire::network::MessagePayload<chunkwire::network::ChunkMessage>);
static_assert(chunkwire::network::MessagePayload<chunkwire::network::NeedMessage>);
