#include "chunkwire/network/rendezvous.hpp"
#include "chunkwire/core/logger.hpp"

namespace chunkwire::network {

void LocalRendezvous::announce_peer(const std::string& peer_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!present_.insert(peer_id).second) {
            return;
        }
    }

    LOG_DEBUG("Peer {} joined the room", peer_id);
    for (const auto& handler : peer_joined_handlers_) {
        handler(peer_id);
    }
}

void LocalRendezvous::leave(const std::string& peer_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        members_.erase(peer_id);
        if (present_.erase(peer_id) == 0) {
            return;
        }
    }

    LOG_DEBUG("Peer {} left the room", peer_id);
    for (const auto& handler : peer_left_handlers_) {
        handler(peer_id);
    }
}

void LocalRendezvous::relay(const std::string& from_peer, const std::string& target_peer,
                            std::vector<std::uint8_t> blob) {
    RelayHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = members_.find(target_peer);
        if (!present_.count(target_peer) || it == members_.end() || !it->second) {
            LOG_WARN("Dropping relay from {} to unknown peer {}", from_peer, target_peer);
            return;
        }
        handler = it->second;
    }
    handler(from_peer, std::move(blob));
}

void LocalRendezvous::attach(const std::string& peer_id, RelayHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    members_[peer_id] = std::move(handler);
}

std::vector<std::string> LocalRendezvous::peers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(present_.begin(), present_.end());
}

}
