#include "chunkwire/network/tcp_channel.hpp"
#include "chunkwire/core/logger.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

namespace chunkwire::network {

namespace {

constexpr std::uint32_t MAX_HELLO_PAYLOAD = 4096;

boost::system::error_code protocol_error() {
    return boost::system::errc::make_error_code(boost::system::errc::protocol_error);
}

}

TcpChannel::TcpChannel(boost::asio::io_context& io_context, tcp::socket socket, std::string local_peer_id)
    : strand_(boost::asio::make_strand(io_context))
    , socket_(std::move(socket))
    , local_peer_id_(std::move(local_peer_id))
    , open_(true)
    , buffered_bytes_(0)
    , low_threshold_(0)
    , closing_(false)
    , closed_notified_(false)
    , write_in_progress_(false) {

    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        remote_endpoint_ = "unknown";
        LOG_WARN("Failed to get remote endpoint: {}", ec.message());
    } else {
        remote_endpoint_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }
}

TcpChannel::~TcpChannel() {
    LOG_DEBUG("Channel to {} destroyed", remote_endpoint_);
}

void TcpChannel::connect(boost::asio::io_context& io_context, const std::string& host,
                         std::uint16_t port, const std::string& local_peer_id, ReadyHandler handler) {
    auto resolver = std::make_shared<tcp::resolver>(io_context);
    auto socket = std::make_shared<tcp::socket>(io_context);

    LOG_INFO("Connecting to {}:{}", host, port);

    resolver->async_resolve(host, std::to_string(port),
        [&io_context, resolver, socket, local_peer_id, handler = std::move(handler)]
        (const boost::system::error_code& ec, tcp::resolver::results_type endpoints) mutable {
            if (ec) {
                LOG_ERROR("Failed to resolve peer address: {}", ec.message());
                handler(ec, nullptr);
                return;
            }

            boost::asio::async_connect(*socket, endpoints,
                [&io_context, socket, local_peer_id, handler = std::move(handler)]
                (const boost::system::error_code& ec, const tcp::endpoint&) mutable {
                    if (ec) {
                        LOG_ERROR("Connection failed: {}", ec.message());
                        handler(ec, nullptr);
                        return;
                    }

                    auto channel = std::make_shared<TcpChannel>(io_context, std::move(*socket), local_peer_id);
                    channel->handshake(std::move(handler));
                });
        });
}

void TcpChannel::handshake(ReadyHandler handler) {
    auto self = shared_from_this();
    auto hello = std::make_shared<std::vector<std::uint8_t>>(
        encode_frame(MessageType::HELLO, HelloMessage{local_peer_id_}));
    auto done = std::make_shared<ReadyHandler>(std::move(handler));

    boost::asio::async_write(socket_, boost::asio::buffer(*hello),
        boost::asio::bind_executor(strand_,
            [this, self, hello](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    LOG_ERROR("Failed to send HELLO to {}: {}", remote_endpoint_, ec.message());
                    do_close();
                }
            }));

    boost::asio::async_read(socket_, boost::asio::buffer(read_header_buffer_),
        boost::asio::bind_executor(strand_,
            [this, self, done](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    do_close();
                    (*done)(ec, nullptr);
                    return;
                }

                FrameHeader header;
                try {
                    header = FrameHeader::deserialize(read_header_buffer_);
                } catch (const ProtocolError& e) {
                    LOG_ERROR("Bad HELLO header from {}: {}", remote_endpoint_, e.what());
                    do_close();
                    (*done)(protocol_error(), nullptr);
                    return;
                }

                if (header.type != MessageType::HELLO || header.payload_size > MAX_HELLO_PAYLOAD) {
                    LOG_ERROR("Expected HELLO from {}, got {}", remote_endpoint_, to_string(header.type));
                    do_close();
                    (*done)(protocol_error(), nullptr);
                    return;
                }

                read_payload_buffer_.resize(header.payload_size);
                boost::asio::async_read(socket_, boost::asio::buffer(read_payload_buffer_),
                    boost::asio::bind_executor(strand_,
                        [this, self, done](boost::system::error_code ec, std::size_t) {
                            if (ec) {
                                do_close();
                                (*done)(ec, nullptr);
                                return;
                            }

                            try {
                                remote_peer_id_ = HelloMessage::deserialize(read_payload_buffer_).peer_id;
                            } catch (const std::exception& e) {
                                LOG_ERROR("Malformed HELLO from {}: {}", remote_endpoint_, e.what());
                                do_close();
                                (*done)(protocol_error(), nullptr);
                                return;
                            }

                            LOG_INFO("Channel to {} established (peer {})", remote_endpoint_, remote_peer_id_);
                            (*done)({}, self);
                        }));
            }));
}

void TcpChannel::start() {
    auto self = shared_from_this();
    boost::asio::post(strand_, [this, self]() { do_read_header(); });
}

void TcpChannel::send(std::vector<std::uint8_t> message) {
    if (!open_) {
        throw ChannelClosedError("Channel to " + remote_endpoint_ + " is closed");
    }

    buffered_bytes_ += message.size();

    auto self = shared_from_this();
    boost::asio::post(strand_, [this, self, message = std::move(message)]() mutable {
        if (closed_notified_) {
            buffered_bytes_ -= message.size();
            return;
        }

        write_queue_.push(std::move(message));
        if (!write_in_progress_) {
            do_write();
        }
    });
}

void TcpChannel::close() {
    open_ = false;
    auto self = shared_from_this();
    boost::asio::post(strand_, [this, self]() {
        // queued frames are written out first
        closing_ = true;
        if (!write_in_progress_ && write_queue_.empty()) {
            do_close();
        }
    });
}

void TcpChannel::do_read_header() {
    if (!open_) {
        return;
    }

    auto self = shared_from_this();
    boost::asio::async_read(socket_, boost::asio::buffer(read_header_buffer_),
        boost::asio::bind_executor(strand_,
            [this, self](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    handle_error(ec);
                    return;
                }

                try {
                    auto header = FrameHeader::deserialize(read_header_buffer_);
                    do_read_payload(header.payload_size);
                } catch (const ProtocolError& e) {
                    LOG_ERROR("Invalid frame header from {}: {}", remote_endpoint_, e.what());
                    do_close();
                }
            }));
}

void TcpChannel::do_read_payload(std::uint32_t payload_size) {
    read_payload_buffer_.resize(payload_size);

    auto self = shared_from_this();
    auto deliver = [this, self]() {
        std::vector<std::uint8_t> frame;
        frame.reserve(FRAME_HEADER_SIZE + read_payload_buffer_.size());
        frame.insert(frame.end(), read_header_buffer_.begin(), read_header_buffer_.end());
        frame.insert(frame.end(), read_payload_buffer_.begin(), read_payload_buffer_.end());

        if (message_handler_) {
            message_handler_(std::move(frame));
        }
        do_read_header();
    };

    if (payload_size == 0) {
        deliver();
        return;
    }

    boost::asio::async_read(socket_, boost::asio::buffer(read_payload_buffer_),
        boost::asio::bind_executor(strand_,
            [this, self, deliver](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    handle_error(ec);
                    return;
                }
                deliver();
            }));
}

void TcpChannel::do_write() {
    if (write_queue_.empty() || write_in_progress_) {
        return;
    }

    write_in_progress_ = true;
    auto& message = write_queue_.front();

    auto self = shared_from_this();
    boost::asio::async_write(socket_, boost::asio::buffer(message),
        boost::asio::bind_executor(strand_,
            [this, self](boost::system::error_code ec, std::size_t) {
                write_in_progress_ = false;

                // do_close already dropped the queue and its byte count
                if (closed_notified_) {
                    return;
                }

                if (ec) {
                    handle_error(ec);
                    return;
                }

                auto written = write_queue_.front().size();
                write_queue_.pop();

                auto before = buffered_bytes_.fetch_sub(written);
                auto after = before - written;
                auto threshold = low_threshold_.load();
                if (before > threshold && after <= threshold && buffered_low_handler_) {
                    buffered_low_handler_();
                }

                if (!write_queue_.empty()) {
                    do_write();
                } else if (closing_) {
                    do_close();
                }
            }));
}

void TcpChannel::do_close() {
    open_ = false;
    if (closed_notified_) {
        return;
    }
    closed_notified_ = true;

    LOG_INFO("Closing channel to {}", remote_endpoint_);

    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    // sends still posted behind this subtract their own bytes
    std::size_t dropped = 0;
    while (!write_queue_.empty()) {
        dropped += write_queue_.front().size();
        write_queue_.pop();
    }
    buffered_bytes_ -= dropped;

    if (closed_handler_) {
        closed_handler_();
    }
}

void TcpChannel::handle_error(const boost::system::error_code& error) {
    if (error == boost::asio::error::eof) {
        LOG_INFO("Channel to {} closed by peer", remote_endpoint_);
    } else if (error == boost::asio::error::operation_aborted) {
        LOG_DEBUG("Channel operation aborted for {}", remote_endpoint_);
    } else {
        LOG_ERROR("Channel error with {}: {}", remote_endpoint_, error.message());
    }

    do_close();
}

TcpListener::TcpListener(boost::asio::io_context& io_context, std::uint16_t port, std::string local_peer_id)
    : io_context_(io_context)
    , acceptor_(io_context, tcp::endpoint(tcp::v4(), port))
    , local_peer_id_(std::move(local_peer_id))
    , running_(false) {
}

void TcpListener::start(ChannelHandler handler) {
    handler_ = std::move(handler);
    running_ = true;
    LOG_INFO("Listening on port {}", port());
    do_accept();
}

void TcpListener::stop() {
    running_ = false;
    boost::system::error_code ec;
    acceptor_.close(ec);
}

std::uint16_t TcpListener::port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void TcpListener::do_accept() {
    if (!running_) {
        return;
    }

    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!running_) {
                return;
            }

            if (ec) {
                LOG_ERROR("Accept error: {}", ec.message());
            } else {
                auto channel = std::make_shared<TcpChannel>(io_context_, std::move(socket), local_peer_id_);
                channel->handshake([this](const boost::system::error_code& ec, std::shared_ptr<TcpChannel> ready) {
                    if (ec || !ready) {
                        LOG_WARN("Inbound handshake failed: {}", ec.message());
                        return;
                    }
                    if (handler_) {
                        handler_(std::move(ready));
                    }
                });
            }

            do_accept();
        });
}

}
