#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunkwire::network {

class ChannelClosedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Ordered, message-oriented point-to-point link. One encoded control frame per message.
// Handlers may be invoked from any I/O thread; consumers re-post them onto their own strand.
class MessageChannel {
public:
    using MessageHandler = std::function<void(std::vector<std::uint8_t>)>;
    using ClosedHandler = std::function<void()>;
    using BufferedLowHandler = std::function<void()>;

    virtual ~MessageChannel() = default;

    // Begins delivering inbound messages. Install handlers first.
    virtual void start() = 0;

    // Throws ChannelClosedError once the channel is closed.
    virtual void send(std::vector<std::uint8_t> message) = 0;

    // Bytes accepted by send() that have not reached the wire yet.
    virtual std::size_t buffered_bytes() const = 0;

    // The buffered-low handler fires when buffered_bytes() falls to or below this value.
    virtual void set_buffered_low_threshold(std::size_t threshold) = 0;

    virtual bool is_open() const = 0;
    virtual void close() = 0;

    // Stable id announced by the remote side.
    virtual const std::string& remote_peer_id() const = 0;

    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }
    void set_closed_handler(ClosedHandler handler) { closed_handler_ = std::move(handler); }
    void set_buffered_low_handler(BufferedLowHandler handler) { buffered_low_handler_ = std::move(handler); }

protected:
    MessageHandler message_handler_;
    ClosedHandler closed_handler_;
    BufferedLowHandler buffered_low_handler_;
};

}
