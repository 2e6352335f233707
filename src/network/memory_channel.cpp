#include "chunkwire/network/memory_channel.hpp"
#include "chunkwire/core/logger.hpp"

namespace chunkwire::network {

MemoryChannel::Pair MemoryChannel::create_pair(boost::asio::io_context& io_context,
                                               const std::string& first_peer_id,
                                               const std::string& second_peer_id) {
    auto first = std::make_shared<MemoryChannel>(io_context, second_peer_id);
    auto second = std::make_shared<MemoryChannel>(io_context, first_peer_id);
    first->peer_ = second;
    second->peer_ = first;
    return {first, second};
}

MemoryChannel::MemoryChannel(boost::asio::io_context& io_context, std::string remote_peer_id)
    : strand_(boost::asio::make_strand(io_context))
    , remote_peer_id_(std::move(remote_peer_id))
    , open_(true)
    , held_(false)
    , buffered_bytes_(0)
    , low_threshold_(0)
    , messages_sent_(0)
    , started_(false)
    , closed_notified_(false) {
}

void MemoryChannel::start() {
    auto self = shared_from_this();
    boost::asio::post(strand_, [this, self]() {
        started_ = true;
        while (!inbox_.empty() && message_handler_) {
            auto message = std::move(inbox_.front());
            inbox_.pop_front();
            message_handler_(std::move(message));
        }
    });
}

void MemoryChannel::send(std::vector<std::uint8_t> message) {
    if (!open_) {
        throw ChannelClosedError("Memory channel to " + remote_peer_id_ + " is closed");
    }

    {
        std::lock_guard<std::mutex> lock(outbox_mutex_);
        buffered_bytes_ += message.size();
        outbox_.push_back(std::move(message));
    }
    ++messages_sent_;

    auto self = shared_from_this();
    boost::asio::post(strand_, [this, self]() { flush(); });
}

void MemoryChannel::hold(bool held) {
    held_ = held;
    if (!held) {
        auto self = shared_from_this();
        boost::asio::post(strand_, [this, self]() { flush(); });
    }
}

void MemoryChannel::flush() {
    auto peer = peer_.lock();

    while (!held_) {
        std::vector<std::uint8_t> message;
        {
            std::lock_guard<std::mutex> lock(outbox_mutex_);
            if (outbox_.empty()) {
                return;
            }
            message = std::move(outbox_.front());
            outbox_.pop_front();
        }

        auto size = message.size();
        if (peer) {
            peer->receive(std::move(message));
        }

        auto before = buffered_bytes_.fetch_sub(size);
        auto after = before - size;
        auto threshold = low_threshold_.load();
        if (before > threshold && after <= threshold && buffered_low_handler_) {
            buffered_low_handler_();
        }
    }
}

void MemoryChannel::receive(std::vector<std::uint8_t> message) {
    auto self = shared_from_this();
    boost::asio::post(strand_, [this, self, message = std::move(message)]() mutable {
        if (!open_) {
            return;
        }
        if (!started_ || !message_handler_) {
            inbox_.push_back(std::move(message));
            return;
        }
        message_handler_(std::move(message));
    });
}

void MemoryChannel::close() {
    open_ = false;

    // Messages accepted before close() still reach the peer unless held.
    auto self = shared_from_this();
    boost::asio::post(strand_, [this, self]() {
        flush();
        {
            std::lock_guard<std::mutex> lock(outbox_mutex_);
            std::size_t dropped = 0;
            for (const auto& message : outbox_) {
                dropped += message.size();
            }
            outbox_.clear();
            buffered_bytes_ -= dropped;
        }
        notify_closed();

        if (auto peer = peer_.lock()) {
            boost::asio::post(peer->strand_, [peer]() {
                peer->open_ = false;
                peer->notify_closed();
            });
        }
    });
}

void MemoryChannel::notify_closed() {
    if (closed_notified_) {
        return;
    }
    closed_notified_ = true;
    inbox_.clear();

    LOG_DEBUG("Memory channel to {} closed", remote_peer_id_);
    if (closed_handler_) {
        closed_handler_();
    }
}

}
