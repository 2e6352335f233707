#pragma once

#include "chunkwire/network/message_channel.hpp"
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>
#include <boost/asio.hpp>

namespace chunkwire::network {

// In-process MessageChannel. Channels come in linked pairs; what one side sends is
// delivered to the other on its own strand. Used for loopback sessions and tests.
class MemoryChannel : public MessageChannel, public std::enable_shared_from_this<MemoryChannel> {
public:
    using Pair = std::pair<std::shared_ptr<MemoryChannel>, std::shared_ptr<MemoryChannel>>;

    // first.remote_peer_id() == second_peer_id and vice versa.
    static Pair create_pair(boost::asio::io_context& io_context,
                            const std::string& first_peer_id, const std::string& second_peer_id);

    MemoryChannel(boost::asio::io_context& io_context, std::string remote_peer_id);

    void start() override;
    void send(std::vector<std::uint8_t> message) override;
    std::size_t buffered_bytes() const override { return buffered_bytes_.load(); }
    void set_buffered_low_threshold(std::size_t threshold) override { low_threshold_ = threshold; }
    bool is_open() const override { return open_.load(); }
    void close() override;
    const std::string& remote_peer_id() const override { return remote_peer_id_; }

    // While held, sent messages stay buffered. Releasing flushes them.
    void hold(bool held);

    std::size_t messages_sent() const { return messages_sent_.load(); }

private:
    void flush();
    void receive(std::vector<std::uint8_t> message);
    void notify_closed();

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    std::string remote_peer_id_;
    std::weak_ptr<MemoryChannel> peer_;

    std::atomic<bool> open_;
    std::atomic<bool> held_;
    std::atomic<std::size_t> buffered_bytes_;
    std::atomic<std::size_t> low_threshold_;
    std::atomic<std::size_t> messages_sent_;

    std::mutex outbox_mutex_;
    std::deque<std::vector<std::uint8_t>> outbox_;

    // strand only
    bool started_;
    bool closed_notified_;
    std::deque<std::vector<std::uint8_t>> inbox_;
};

}
