#include "chunkwire/transfer/chunk_server.hpp"
#include "chunkwire/core/logger.hpp"
#include <algorithm>

namespace chunkwire::transfer {

ChunkServer::ChunkServer(std::shared_ptr<storage::ChunkSource> source, std::size_t high_water, std::size_t low_water)
    : source_(std::move(source))
    , high_water_(high_water)
    , low_water_(std::min(low_water, high_water))
    , peer_bitfield_(source_->metadata().total_chunks)
    , suspended_(false)
    , chunks_sent_(0)
    , bytes_sent_(0) {
}

void ChunkServer::attach(std::shared_ptr<network::MessageChannel> channel) {
    channel_ = std::move(channel);
    channel_->set_buffered_low_threshold(low_water_);
    suspended_ = false;
    peer_bitfield_ = storage::Bitfield(source_->metadata().total_chunks);
}

void ChunkServer::detach() {
    channel_.reset();
    queue_.clear();
    cursor_.reset();
    suspended_ = false;
}

void ChunkServer::enqueue(const storage::Range& range) {
    auto total = source_->metadata().total_chunks;
    if (range.start > range.end || range.end >= total) {
        LOG_WARN("Rejecting request {}-{} for file with {} chunks", range.start, range.end, total);
        auto reason = "Range " + std::to_string(range.start) + "-" + std::to_string(range.end) +
                      " outside 0-" + std::to_string(total == 0 ? 0 : total - 1);
        if (!send_error(network::ErrorCode::OUT_OF_RANGE, range.end, reason)) {
            LOG_DEBUG("Channel gone before range error could be reported");
        }
        return;
    }
    queue_.push_back(range);
}

core::Result ChunkServer::pump() {
    if (!channel_) {
        return core::Result(core::TransferError::CHANNEL_CLOSED, "No channel attached");
    }

    suspended_ = false;

    while (true) {
        if (channel_->buffered_bytes() > high_water_) {
            suspended_ = true;
            LOG_TRACE("Suspending send to {} at {} buffered bytes", channel_->remote_peer_id(),
                      channel_->buffered_bytes());
            return {};
        }

        auto index = next_index();
        if (!index) {
            break;
        }

        std::vector<std::uint8_t> data;
        auto result = source_->read_chunk(*index, data);
        if (!result) {
            LOG_WARN("Cannot serve chunk {}: {}", *index, result.message);
            auto code = result.error == core::TransferError::OUT_OF_RANGE
                ? network::ErrorCode::OUT_OF_RANGE
                : network::ErrorCode::CHUNK_NOT_AVAILABLE;
            if (!send_error(code, *index, result.message)) {
                return core::Result(core::TransferError::CHANNEL_CLOSED, "Channel closed while reporting error");
            }
            continue;
        }

        auto size = data.size();
        try {
            channel_->send(network::encode_frame(network::MessageType::CHUNK,
                                                 network::ChunkMessage{*index, std::move(data)}));
        } catch (const network::ChannelClosedError& e) {
            return core::Result(core::TransferError::CHANNEL_CLOSED, e.what());
        }

        ++chunks_sent_;
        bytes_sent_ += size;
    }

    return {};
}

core::Result ChunkServer::set_peer_bitfield(storage::Bitfield bitfield) {
    if (bitfield.size() != source_->metadata().total_chunks) {
        return core::Result(core::TransferError::METADATA_MISMATCH,
                            "Peer bitfield covers " + std::to_string(bitfield.size()) + " chunks, expected " +
                            std::to_string(source_->metadata().total_chunks));
    }
    peer_bitfield_ = std::move(bitfield);
    return {};
}

bool ChunkServer::on_ack(std::uint32_t index) {
    if (index >= peer_bitfield_.size()) {
        return false;
    }
    return peer_bitfield_.set(index);
}

std::size_t ChunkServer::pending_chunks() const {
    std::size_t pending = 0;
    for (const auto& range : queue_) {
        pending += range.length();
    }
    if (cursor_ && !queue_.empty()) {
        pending -= *cursor_ - queue_.front().start;
    }
    return pending;
}

std::uint32_t ChunkServer::peer_received_count() const {
    return peer_bitfield_.count();
}

bool ChunkServer::send_error(network::ErrorCode code, std::uint32_t index, const std::string& reason) {
    if (!channel_) {
        return false;
    }
    try {
        channel_->send(network::encode(network::ErrorMessage{code, index, reason}));
        return true;
    } catch (const network::ChannelClosedError&) {
        return false;
    }
}

std::optional<std::uint32_t> ChunkServer::next_index() {
    while (!queue_.empty()) {
        const auto& front = queue_.front();
        std::uint32_t index = cursor_ ? *cursor_ : front.start;

        if (index >= front.end) {
            queue_.pop_front();
            cursor_.reset();
        } else {
            cursor_ = index + 1;
        }

        if (!peer_bitfield_.has(index)) {
            return index;
        }
    }
    return std::nullopt;
}

}
