#include "chunkwire/network/protocol.hpp"
#include "chunkwire/core/byte_order.hpp"
#include "chunkwire/core/utils.hpp"

namespace chunkwire::network {

using namespace core::bytes;

namespace {

std::uint64_t get_timestamp_ms() {
    return static_cast<std::uint64_t>(
        core::utils::TimeUtils::to_unix_millis(core::utils::TimeUtils::now()));
}

template<typename T>
T parse_payload(MessageType type, std::span<const std::uint8_t> payload) {
    try {
        return T::deserialize(payload);
    } catch (const ProtocolError&) {
        throw;
    } catch (const std::exception& e) {
        throw ProtocolError(std::string("Malformed ") + to_string(type) + " payload: " + e.what());
    }
}

void expect_consumed(std::span<const std::uint8_t> rest, const char* what) {
    if (!rest.empty()) {
        throw ProtocolError(std::string("Trailing bytes after ") + what + " payload");
    }
}

}

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::HELLO: return "HELLO";
        case MessageType::META: return "META";
        case MessageType::BITFIELD: return "BITFIELD";
        case MessageType::REQUEST: return "REQUEST";
        case MessageType::CHUNK: return "CHUNK";
        case MessageType::ACK: return "ACK";
        case MessageType::NEED: return "NEED";
        case MessageType::END: return "END";
        case MessageType::ERROR_RESPONSE: return "ERROR";
    }
    return "UNKNOWN";
}

FrameHeader::FrameHeader()
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(MessageType::END)
    , flags(0)
    , timestamp_ms(get_timestamp_ms())
    , payload_size(0) {
}

FrameHeader::FrameHeader(MessageType msg_type, std::uint32_t payload_len)
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(msg_type)
    , flags(0)
    , timestamp_ms(get_timestamp_ms())
    , payload_size(payload_len) {
}

bool FrameHeader::is_valid() const {
    return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION && payload_size <= MAX_FRAME_PAYLOAD;
}

std::vector<std::uint8_t> FrameHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(FRAME_HEADER_SIZE);

    write_uint32(buffer, magic);
    write_uint16(buffer, version);
    write_uint8(buffer, static_cast<std::uint8_t>(type));
    write_uint8(buffer, flags);
    write_uint64(buffer, timestamp_ms);
    write_uint32(buffer, payload_size);

    return buffer;
}

FrameHeader FrameHeader::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < FRAME_HEADER_SIZE) {
        throw ProtocolError("Insufficient data for frame header");
    }

    FrameHeader header;
    auto span = data;

    header.magic = read_uint32(span);
    header.version = read_uint16(span);
    header.type = static_cast<MessageType>(read_uint8(span));
    header.flags = read_uint8(span);
    header.timestamp_ms = read_uint64(span);
    header.payload_size = read_uint32(span);

    if (header.magic != PROTOCOL_MAGIC) {
        throw ProtocolError("Bad frame magic");
    }
    if (header.version != PROTOCOL_VERSION) {
        throw ProtocolError("Unsupported protocol version " + std::to_string(header.version));
    }
    if (header.payload_size > MAX_FRAME_PAYLOAD) {
        throw ProtocolError("Frame payload too large: " + std::to_string(header.payload_size));
    }

    return header;
}

std::vector<std::uint8_t> HelloMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, peer_id);
    return buffer;
}

HelloMessage HelloMessage::deserialize(std::span<const std::uint8_t> data) {
    HelloMessage msg;
    msg.peer_id = read_string(data);
    expect_consumed(data, "HELLO");
    if (msg.peer_id.empty()) {
        throw ProtocolError("HELLO without peer id");
    }
    return msg;
}

std::vector<std::uint8_t> MetaMessage::serialize() const {
    return metadata.serialize();
}

MetaMessage MetaMessage::deserialize(std::span<const std::uint8_t> data) {
    MetaMessage msg;
    msg.metadata = storage::FileMetadata::deserialize(data);
    return msg;
}

std::vector<std::uint8_t> BitfieldMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_uint32(buffer, total_chunks);
    write_uint32(buffer, received_count);
    write_blob(buffer, bits);
    return buffer;
}

BitfieldMessage BitfieldMessage::deserialize(std::span<const std::uint8_t> data) {
    BitfieldMessage msg;
    msg.file_id = read_string(data);
    msg.total_chunks = read_uint32(data);
    msg.received_count = read_uint32(data);
    msg.bits = read_blob(data);
    expect_consumed(data, "BITFIELD");

    if (msg.bits.size() != storage::Bitfield::byte_length(msg.total_chunks)) {
        throw ProtocolError("BITFIELD length does not match chunk count");
    }
    if (msg.received_count > msg.total_chunks) {
        throw ProtocolError("BITFIELD received count exceeds chunk count");
    }
    return msg;
}

std::vector<std::uint8_t> RequestMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, start);
    write_uint32(buffer, end);
    return buffer;
}

RequestMessage RequestMessage::deserialize(std::span<const std::uint8_t> data) {
    RequestMessage msg;
    msg.start = read_uint32(data);
    msg.end = read_uint32(data);
    expect_consumed(data, "REQUEST");
    if (msg.end < msg.start) {
        throw ProtocolError("REQUEST range end before start");
    }
    return msg;
}

std::vector<std::uint8_t> ChunkMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(4 + payload.size());
    write_uint32(buffer, index);
    buffer.insert(buffer.end(), payload.begin(), payload.end());
    return buffer;
}

ChunkMessage ChunkMessage::deserialize(std::span<const std::uint8_t> data) {
    ChunkMessage msg;
    msg.index = read_uint32(data);
    msg.payload.assign(data.begin(), data.end());
    return msg;
}

std::vector<std::uint8_t> AckMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, index);
    return buffer;
}

AckMessage AckMessage::deserialize(std::span<const std::uint8_t> data) {
    AckMessage msg;
    msg.index = read_uint32(data);
    expect_consumed(data, "ACK");
    return msg;
}

std::vector<std::uint8_t> NeedMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, static_cast<std::uint32_t>(ranges.size()));
    for (const auto& range : ranges) {
        write_uint32(buffer, range.start);
        write_uint32(buffer, range.end);
    }
    return buffer;
}

NeedMessage NeedMessage::deserialize(std::span<const std::uint8_t> data) {
    NeedMessage msg;
    auto count = read_uint32(data);
    if (static_cast<std::uint64_t>(count) * 8 != data.size()) {
        throw ProtocolError("NEED range count does not match payload");
    }

    msg.ranges.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        storage::Range range;
        range.start = read_uint32(data);
        range.end = read_uint32(data);
        if (range.end < range.start) {
            throw ProtocolError("NEED range end before start");
        }
        msg.ranges.push_back(range);
    }
    return msg;
}

std::vector<std::uint8_t> ErrorMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, static_cast<std::uint32_t>(code));
    write_uint32(buffer, index);
    write_string(buffer, reason);
    return buffer;
}

ErrorMessage ErrorMessage::deserialize(std::span<const std::uint8_t> data) {
    ErrorMessage msg;
    msg.code = static_cast<ErrorCode>(read_uint32(data));
    msg.index = read_uint32(data);
    msg.reason = read_string(data);
    expect_consumed(data, "ERROR");
    return msg;
}

MessageType message_type(const ControlMessage& message) {
    static constexpr std::array<MessageType, std::variant_size_v<ControlMessage>> types = {
        MessageType::META, MessageType::BITFIELD, MessageType::REQUEST, MessageType::CHUNK,
        MessageType::ACK, MessageType::NEED, MessageType::END, MessageType::ERROR_RESPONSE
    };
    return types[message.index()];
}

std::vector<std::uint8_t> encode_frame(MessageType type, std::span<const std::uint8_t> payload) {
    if (payload.size() > MAX_FRAME_PAYLOAD) {
        throw ProtocolError("Payload too large to frame: " + std::to_string(payload.size()));
    }

    FrameHeader header(type, static_cast<std::uint32_t>(payload.size()));
    auto frame = header.serialize();
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

std::vector<std::uint8_t> encode(const ControlMessage& message) {
    return std::visit([&](const auto& msg) {
        return encode_frame(message_type(message), msg);
    }, message);
}

ControlMessage decode(std::span<const std::uint8_t> frame) {
    auto header = FrameHeader::deserialize(frame);
    auto payload = frame.subspan(FRAME_HEADER_SIZE);

    if (payload.size() != header.payload_size) {
        throw ProtocolError("Frame payload size mismatch: header says " +
                            std::to_string(header.payload_size) + ", got " +
                            std::to_string(payload.size()));
    }

    switch (header.type) {
        case MessageType::META: return parse_payload<MetaMessage>(header.type, payload);
        case MessageType::BITFIELD: return parse_payload<BitfieldMessage>(header.type, payload);
        case MessageType::REQUEST: return parse_payload<RequestMessage>(header.type, payload);
        case MessageType::CHUNK: return parse_payload<ChunkMessage>(header.type, payload);
        case MessageType::ACK: return parse_payload<AckMessage>(header.type, payload);
        case MessageType::NEED: return parse_payload<NeedMessage>(header.type, payload);
        case MessageType::END: return parse_payload<EndMessage>(header.type, payload);
        case MessageType::ERROR_RESPONSE: return parse_payload<ErrorMessage>(header.type, payload);
        case MessageType::HELLO:
            throw ProtocolError("HELLO is not a control message");
    }

    throw ProtocolError("Unknown message type " + std::to_string(static_cast<int>(header.type)));
}

}
