#pragma once

#include "chunkwire/network/message_channel.hpp"
#include "chunkwire/network/protocol.hpp"
#include "chunkwire/storage/bitfield_store.hpp"
#include "chunkwire/storage/chunk_io.hpp"
#include "chunkwire/storage/persistent_store.hpp"
#include "chunkwire/transfer/chunk_server.hpp"
#include "chunkwire/transfer/request_scheduler.hpp"
#include "chunkwire/transfer/resume_coordinator.hpp"
#include "chunkwire/transfer/session_config.hpp"
#include "chunkwire/transfer/throughput_predictor.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace chunkwire::transfer {

enum class SessionStatus {
    IDLE,
    AWAITING_ACCEPT,
    TRANSFERRING,
    PAUSED,
    COMPLETED,
    ERROR,
    CANCELLED
};

enum class ErrorReason {
    NONE,
    STORE_FAILURE,
    METADATA_MISMATCH,
    CANCELLED,
    PROTOCOL_ERROR,
    PEER_ERROR
};

const char* to_string(SessionStatus status);
const char* to_string(ErrorReason reason);

bool is_terminal(SessionStatus status);

// All callbacks run on the session's strand. None of them is required.
struct SessionEvents {
    std::function<void(SessionStatus)> on_status;
    // Receiver: a file was offered. Call accept() or cancel().
    std::function<void(const storage::FileMetadata&)> on_offer;
    // Chunks held by the receiving side so far.
    std::function<void(std::uint32_t received, std::uint32_t total)> on_progress;
    std::function<void(const EtaEstimate&)> on_eta;
    std::function<void(const storage::Range&)> on_degraded;
    std::function<void(ErrorReason, const std::string&)> on_error;
    std::function<void()> on_completed;
};

struct SessionSnapshot {
    SessionRole role;
    std::string file_id;
    std::string peer_id;
    std::string name;
    SessionStatus status;
    ErrorReason error_reason;
    std::string error_message;
    std::uint32_t received_count;
    std::uint32_t total_chunks;
    std::uint64_t size;
    std::uint64_t bytes_done;
    bool degraded;
    EtaEstimate eta;
};

// One file exchanged with one peer. Everything that mutates the session runs on its
// strand: channel events, timers and the public control calls are all posted there.
class TransferSession : public std::enable_shared_from_this<TransferSession> {
public:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    // Sender side for one peer. The source is shared with other sessions of the same file.
    static std::shared_ptr<TransferSession> create_upload(boost::asio::io_context& io_context,
                                                          SessionConfig config,
                                                          std::shared_ptr<storage::ChunkSource> source,
                                                          std::string peer_id,
                                                          SessionEvents events = {});

    // Receiver side. The file is learned from the peer's META.
    static std::shared_ptr<TransferSession> create_download(boost::asio::io_context& io_context,
                                                            SessionConfig config,
                                                            std::shared_ptr<storage::PersistentStore> store,
                                                            std::string peer_id,
                                                            SessionEvents events = {});

    TransferSession(boost::asio::io_context& io_context, SessionConfig config, std::string peer_id,
                    SessionEvents events);
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // Hands a freshly opened channel to the session. On a paused session this runs the
    // resume handshake; any previous channel is closed.
    void attach_channel(std::shared_ptr<network::MessageChannel> channel);

    // Receiver: AwaitingAccept -> Transferring.
    void accept();

    // Drops the transport as if it had been lost. Transferring -> Paused.
    void pause();

    // Terminal. Persisted chunks are kept.
    void cancel();

    SessionStatus status() const { return status_.load(); }
    ErrorReason error_reason() const { return error_reason_.load(); }
    SessionRole role() const { return config_.role; }
    const std::string& peer_id() const { return peer_id_; }

    // Empty on a receiver until META arrives.
    std::string file_id() const;
    std::optional<storage::FileMetadata> metadata() const;

    SessionSnapshot snapshot() const;

private:
    Strand strand_;
    SessionConfig config_;
    std::string peer_id_;
    SessionEvents events_;

    std::atomic<SessionStatus> status_;
    std::atomic<ErrorReason> error_reason_;
    std::atomic<std::uint32_t> received_count_;
    std::atomic<std::uint32_t> total_chunks_;
    std::atomic<bool> degraded_;

    mutable std::mutex info_mutex_;
    std::optional<storage::FileMetadata> metadata_;
    std::string error_message_;

    // strand only
    std::shared_ptr<network::MessageChannel> channel_;
    std::uint64_t channel_generation_;
    bool resuming_;

    // receiver
    std::shared_ptr<storage::PersistentStore> store_;
    std::unique_ptr<ResumeCoordinator> coordinator_;
    std::unique_ptr<storage::BitfieldStore> bitfield_store_;
    std::unique_ptr<RequestScheduler> scheduler_;

    // sender
    std::shared_ptr<storage::ChunkSource> source_;
    std::unique_ptr<ChunkServer> server_;

    ThroughputPredictor predictor_;
    boost::asio::steady_timer stall_timer_;
    boost::asio::steady_timer eta_timer_;

    void do_attach(std::shared_ptr<network::MessageChannel> channel);
    void install_handlers(const std::shared_ptr<network::MessageChannel>& channel, std::uint64_t generation);

    void handle_frame(std::uint64_t generation, std::vector<std::uint8_t> frame);
    void handle_channel_closed(std::uint64_t generation);
    void handle_buffered_low(std::uint64_t generation);

    // receiver
    void on_meta(const network::MetaMessage& message);
    void on_chunk(network::ChunkMessage message);
    void do_accept();
    void resume_download();
    void send_requests(const std::vector<storage::Range>& ranges);
    void check_stalls();
    void complete_download();

    // sender
    void on_request(const storage::Range& range);
    void on_need(const network::NeedMessage& message);
    void on_ack(const network::AckMessage& message);
    void start_serving();
    void serve();

    void on_bitfield(const network::BitfieldMessage& message);
    void on_error_message(const network::ErrorMessage& message);

    void enter_paused();
    void fail(ErrorReason reason, const std::string& message, bool notify_peer = true);
    void set_status(SessionStatus status);
    void report_progress(std::uint32_t received, std::uint32_t total);

    void send_message(const network::ControlMessage& message);
    void close_channel();

    void schedule_stall_check();
    void schedule_eta_update();
    void stop_timers();

    bool is_current(std::uint64_t generation) const { return channel_ && generation == channel_generation_; }
};

}
