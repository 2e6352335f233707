#pragma once

#include "chunkwire/core/result.hpp"
#include "chunkwire/network/message_channel.hpp"
#include "chunkwire/network/protocol.hpp"
#include "chunkwire/storage/bitfield.hpp"
#include "chunkwire/storage/chunk_io.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>

namespace chunkwire::transfer {

// Sender side of one session: streams requested chunks in ascending order, pausing
// whenever the channel holds more than high_water buffered bytes. Not thread-safe;
// driven from the owning session's strand.
class ChunkServer {
public:
    ChunkServer(std::shared_ptr<storage::ChunkSource> source, std::size_t high_water, std::size_t low_water);

    // Sets the channel's low-water threshold and forgets the peer's bitfield until it sends
    // a new one. The owner calls pump() on the low-water event.
    void attach(std::shared_ptr<network::MessageChannel> channel);

    // Forgets the channel and every queued range.
    void detach();

    // Out-of-range requests are answered with ERROR right away.
    void enqueue(const storage::Range& range);

    // Sends until the queue drains or the channel is over the high-water mark.
    // CHANNEL_CLOSED if the channel went away mid-stream.
    core::Result pump();

    // The peer's BITFIELD. Chunks it already holds are skipped.
    core::Result set_peer_bitfield(storage::Bitfield bitfield);

    // Returns true if the ACK marked a chunk the peer did not hold before.
    bool on_ack(std::uint32_t index);

    bool suspended() const { return suspended_; }
    std::size_t pending_chunks() const;

    std::uint32_t peer_received_count() const;
    const storage::Bitfield& peer_bitfield() const { return peer_bitfield_; }

    std::uint64_t chunks_sent() const { return chunks_sent_; }
    std::uint64_t bytes_sent() const { return bytes_sent_; }

    std::size_t high_water() const { return high_water_; }
    std::size_t low_water() const { return low_water_; }

private:
    std::shared_ptr<storage::ChunkSource> source_;
    std::shared_ptr<network::MessageChannel> channel_;
    std::size_t high_water_;
    std::size_t low_water_;

    std::deque<storage::Range> queue_;
    std::optional<std::uint32_t> cursor_;   // next index within queue_.front()
    storage::Bitfield peer_bitfield_;
    bool suspended_;

    std::uint64_t chunks_sent_;
    std::uint64_t bytes_sent_;

    bool send_error(network::ErrorCode code, std::uint32_t index, const std::string& reason);
    std::optional<std::uint32_t> next_index();
};

}
