#include <gtest/gtest.h>
#include "chunkwire/network/rendezvous.hpp"

using namespace chunkwire::network;

class LocalRendezvousTest : public ::testing::Test {
protected:
    LocalRendezvous room;
};

TEST_F(LocalRendezvousTest, JoinAndLeaveEvents) {
    std::vector<std::string> joined;
    std::vector<std::string> left;
    room.on_peer_joined([&](const std::string& peer) { joined.push_back(peer); });
    room.on_peer_left([&](const std::string& peer) { left.push_back(peer); });

    room.announce_peer("alice");
    room.announce_peer("alice");
    room.announce_peer("bob");
    room.leave("alice");
    room.leave("alice");

    EXPECT_EQ(joined, (std::vector<std::string>{"alice", "bob"}));
    EXPECT_EQ(left, (std::vector<std::string>{"alice"}));
    EXPECT_EQ(room.peers(), (std::vector<std::string>{"bob"}));
}

TEST_F(LocalRendezvousTest, RelaysOpaqueBlobs) {
    std::string from;
    std::vector<std::uint8_t> received;

    room.announce_peer("alice");
    room.announce_peer("bob");
    room.attach("bob", [&](const std::string& peer, std::vector<std::uint8_t> blob) {
        from = peer;
        received = std::move(blob);
    });

    room.relay("alice", "bob", {0x01, 0xFF, 0x00});

    EXPECT_EQ(from, "alice");
    EXPECT_EQ(received, (std::vector<std::uint8_t>{0x01, 0xFF, 0x00}));
}

TEST_F(LocalRendezvousTest, DropsRelayToAbsentPeer) {
    bool delivered = false;
    room.attach("carol", [&](const std::string&, std::vector<std::uint8_t>) { delivered = true; });

    room.relay("alice", "carol", {1});
    EXPECT_FALSE(delivered);

    room.announce_peer("carol");
    room.leave("carol");
    room.relay("alice", "carol", {1});
    EXPECT_FALSE(delivered);
}
