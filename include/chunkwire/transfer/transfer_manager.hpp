#pragma once

#include "chunkwire/core/result.hpp"
#include "chunkwire/network/message_channel.hpp"
#include "chunkwire/network/rendezvous.hpp"
#include "chunkwire/storage/chunk_io.hpp"
#include "chunkwire/storage/persistent_store.hpp"
#include "chunkwire/transfer/session_config.hpp"
#include "chunkwire/transfer/transfer_session.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace chunkwire::transfer {

struct TransferStats {
    std::size_t uploads = 0;
    std::size_t downloads = 0;
    std::size_t transferring = 0;
    std::size_t paused = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;       // error or cancelled
    std::uint64_t bytes_done = 0; // held by the receiving side, summed over sessions
};

// Owns every session of this peer, at most one live session per (file_id, peer_id).
// Channels are routed by the peer id announced in the HELLO exchange, so a reconnecting
// peer lands on the session it left.
class TransferManager {
public:
    TransferManager(boost::asio::io_context& io_context, std::shared_ptr<storage::PersistentStore> store,
                    SessionConfig config);
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // Callbacks handed to every session created from now on.
    void set_session_events(SessionEvents events);

    // The file offered to peers arriving through serve_channel().
    void share(std::shared_ptr<storage::ChunkSource> source);

    // Sender: resumes the upload to the channel's peer or starts a new one.
    core::Result serve_channel(std::shared_ptr<network::MessageChannel> channel);

    // Receiver: hands the channel to the peer's unfinished download, or opens a new one.
    std::shared_ptr<TransferSession> receive_channel(std::shared_ptr<network::MessageChannel> channel);

    // Pauses a peer's sessions when it leaves the room. The rendezvous must not
    // outlive this manager.
    void watch(network::RendezvousService& rendezvous);
    void pause_peer(const std::string& peer_id);

    std::shared_ptr<TransferSession> find_session(const std::string& file_id, const std::string& peer_id) const;
    std::vector<SessionSnapshot> list_sessions() const;

    core::Result cancel_transfer(const std::string& file_id, const std::string& peer_id);

    // Deletes the file's stored chunks and record. Live downloads of it must be cancelled first.
    core::Result purge(const std::string& file_id);

    // Forgets finished sessions, then deletes stored records idle for longer than max_idle.
    core::Result collect_garbage(std::chrono::hours max_idle, std::size_t& removed_records);
    std::size_t remove_finished_sessions();

    TransferStats stats() const;

private:
    boost::asio::io_context& io_context_;
    std::shared_ptr<storage::PersistentStore> store_;
    SessionConfig config_;

    mutable std::mutex mutex_;
    SessionEvents events_;
    std::shared_ptr<storage::ChunkSource> shared_source_;
    std::vector<std::shared_ptr<TransferSession>> sessions_;
};

}
