#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace chunkwire::network {

// Room-style peer presence and opaque blob relay (signaling). Relay blobs are never inspected.
class RendezvousService {
public:
    using PeerHandler = std::function<void(const std::string& peer_id)>;
    using RelayHandler = std::function<void(const std::string& from_peer, std::vector<std::uint8_t> blob)>;

    virtual ~RendezvousService() = default;

    virtual void announce_peer(const std::string& peer_id) = 0;
    virtual void leave(const std::string& peer_id) = 0;
    virtual void relay(const std::string& from_peer, const std::string& target_peer,
                       std::vector<std::uint8_t> blob) = 0;

    void on_peer_joined(PeerHandler handler) { peer_joined_handlers_.push_back(std::move(handler)); }
    void on_peer_left(PeerHandler handler) { peer_left_handlers_.push_back(std::move(handler)); }

protected:
    std::vector<PeerHandler> peer_joined_handlers_;
    std::vector<PeerHandler> peer_left_handlers_;
};

// Single-process room. Members subscribe to relayed blobs with attach().
class LocalRendezvous : public RendezvousService {
public:
    void announce_peer(const std::string& peer_id) override;
    void leave(const std::string& peer_id) override;
    void relay(const std::string& from_peer, const std::string& target_peer,
               std::vector<std::uint8_t> blob) override;

    void attach(const std::string& peer_id, RelayHandler handler);

    std::vector<std::string> peers() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, RelayHandler> members_;
    std::set<std::string> present_;
};

}
