#pragma once

#include "chunkwire/network/message_channel.hpp"
#include "chunkwire/network/protocol.hpp"
#include <boost/asio.hpp>
#include <array>
#include <atomic>
#include <memory>
#include <queue>
#include <string>

namespace chunkwire::network {

using boost::asio::ip::tcp;

// MessageChannel over a TCP socket. Frames are written back to back and read by
// their FRAME_HEADER_SIZE header. A HELLO exchange precedes all control traffic.
class TcpChannel : public MessageChannel, public std::enable_shared_from_this<TcpChannel> {
public:
    using ReadyHandler = std::function<void(const boost::system::error_code&, std::shared_ptr<TcpChannel>)>;

    TcpChannel(boost::asio::io_context& io_context, tcp::socket socket, std::string local_peer_id);
    ~TcpChannel() override;

    // Resolves, connects and performs the HELLO exchange.
    static void connect(boost::asio::io_context& io_context, const std::string& host,
                        std::uint16_t port, const std::string& local_peer_id, ReadyHandler handler);

    // Sends our HELLO and waits for the remote one. The handler runs once.
    void handshake(ReadyHandler handler);

    void start() override;
    void send(std::vector<std::uint8_t> message) override;
    std::size_t buffered_bytes() const override { return buffered_bytes_.load(); }
    void set_buffered_low_threshold(std::size_t threshold) override { low_threshold_ = threshold; }
    bool is_open() const override { return open_.load(); }
    // Frames already accepted by send() are written before the socket closes.
    void close() override;
    const std::string& remote_peer_id() const override { return remote_peer_id_; }

    const std::string& remote_endpoint() const { return remote_endpoint_; }

private:
    void do_read_header();
    void do_read_payload(std::uint32_t payload_size);
    void do_write();
    void do_close();
    void handle_error(const boost::system::error_code& error);

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    tcp::socket socket_;
    std::string local_peer_id_;
    std::string remote_peer_id_;
    std::string remote_endpoint_;

    std::atomic<bool> open_;
    std::atomic<std::size_t> buffered_bytes_;
    std::atomic<std::size_t> low_threshold_;
    bool closing_;
    bool closed_notified_;

    std::array<std::uint8_t, FRAME_HEADER_SIZE> read_header_buffer_;
    std::vector<std::uint8_t> read_payload_buffer_;

    std::queue<std::vector<std::uint8_t>> write_queue_;
    bool write_in_progress_;
};

// Accepts inbound TcpChannels and hands them over once the HELLO exchange completes.
class TcpListener {
public:
    using ChannelHandler = std::function<void(std::shared_ptr<TcpChannel>)>;

    TcpListener(boost::asio::io_context& io_context, std::uint16_t port, std::string local_peer_id);

    void start(ChannelHandler handler);
    void stop();

    std::uint16_t port() const;

private:
    void do_accept();

    boost::asio::io_context& io_context_;
    tcp::acceptor acceptor_;
    std::string local_peer_id_;
    ChannelHandler handler_;
    bool running_;
};

}
