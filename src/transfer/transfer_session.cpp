#include "chunkwire/transfer/transfer_session.hpp"
#include "chunkwire/core/logger.hpp"
#include <algorithm>

namespace chunkwire::transfer {

namespace {

constexpr auto MIN_STALL_CHECK_INTERVAL = std::chrono::milliseconds(10);

network::ErrorCode to_error_code(ErrorReason reason) {
    switch (reason) {
        case ErrorReason::STORE_FAILURE: return network::ErrorCode::STORE_FAILURE;
        case ErrorReason::METADATA_MISMATCH: return network::ErrorCode::METADATA_MISMATCH;
        case ErrorReason::CANCELLED: return network::ErrorCode::CANCELLED;
        case ErrorReason::PROTOCOL_ERROR: return network::ErrorCode::INVALID_MESSAGE;
        default: return network::ErrorCode::INTERNAL_ERROR;
    }
}

// Bytes covered by the held chunks; only the last chunk may be short.
std::uint64_t held_bytes(const storage::FileMetadata& metadata, const storage::Bitfield& bitfield) {
    if (bitfield.count() == 0) {
        return 0;
    }

    auto bytes = static_cast<std::uint64_t>(bitfield.count()) * metadata.chunk_size;
    auto last = metadata.total_chunks - 1;
    if (bitfield.has(last)) {
        bytes -= metadata.chunk_size - metadata.chunk_length(last);
    }
    return bytes;
}

storage::Bitfield full_bitfield(std::uint32_t total_chunks) {
    storage::Bitfield bitfield(total_chunks);
    for (std::uint32_t i = 0; i < total_chunks; ++i) {
        bitfield.set(i);
    }
    return bitfield;
}

}

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::IDLE: return "idle";
        case SessionStatus::AWAITING_ACCEPT: return "awaiting-accept";
        case SessionStatus::TRANSFERRING: return "transferring";
        case SessionStatus::PAUSED: return "paused";
        case SessionStatus::COMPLETED: return "completed";
        case SessionStatus::ERROR: return "error";
        case SessionStatus::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

const char* to_string(ErrorReason reason) {
    switch (reason) {
        case ErrorReason::NONE: return "none";
        case ErrorReason::STORE_FAILURE: return "store failure";
        case ErrorReason::METADATA_MISMATCH: return "metadata mismatch";
        case ErrorReason::CANCELLED: return "cancelled";
        case ErrorReason::PROTOCOL_ERROR: return "protocol error";
        case ErrorReason::PEER_ERROR: return "peer error";
        default: return "unknown";
    }
}

bool is_terminal(SessionStatus status) {
    return status == SessionStatus::COMPLETED ||
           status == SessionStatus::ERROR ||
           status == SessionStatus::CANCELLED;
}

std::shared_ptr<TransferSession> TransferSession::create_upload(boost::asio::io_context& io_context,
                                                                SessionConfig config,
                                                                std::shared_ptr<storage::ChunkSource> source,
                                                                std::string peer_id,
                                                                SessionEvents events) {
    config.role = SessionRole::SENDER;
    auto session = std::make_shared<TransferSession>(io_context, config, std::move(peer_id), std::move(events));

    const auto& metadata = source->metadata();
    session->metadata_ = metadata;
    session->total_chunks_ = metadata.total_chunks;
    session->predictor_.set_total_bytes(metadata.size);
    session->server_ = std::make_unique<ChunkServer>(source, config.high_water_mark, config.low_water_mark);
    session->source_ = std::move(source);

    return session;
}

std::shared_ptr<TransferSession> TransferSession::create_download(boost::asio::io_context& io_context,
                                                                  SessionConfig config,
                                                                  std::shared_ptr<storage::PersistentStore> store,
                                                                  std::string peer_id,
                                                                  SessionEvents events) {
    config.role = SessionRole::RECEIVER;
    auto session = std::make_shared<TransferSession>(io_context, config, std::move(peer_id), std::move(events));

    session->coordinator_ = std::make_unique<ResumeCoordinator>(store, config.store_retry);
    session->store_ = std::move(store);

    return session;
}

TransferSession::TransferSession(boost::asio::io_context& io_context, SessionConfig config, std::string peer_id,
                                 SessionEvents events)
    : strand_(boost::asio::make_strand(io_context))
    , config_(config)
    , peer_id_(std::move(peer_id))
    , events_(std::move(events))
    , status_(SessionStatus::IDLE)
    , error_reason_(ErrorReason::NONE)
    , received_count_(0)
    , total_chunks_(0)
    , degraded_(false)
    , channel_generation_(0)
    , resuming_(false)
    , predictor_(0, config.eta)
    , stall_timer_(strand_)
    , eta_timer_(strand_) {
}

TransferSession::~TransferSession() {
    LOG_DEBUG("Session with {} destroyed ({})", peer_id_, to_string(status_.load()));
}

void TransferSession::attach_channel(std::shared_ptr<network::MessageChannel> channel) {
    auto self = shared_from_this();
    boost::asio::post(strand_, [this, self, channel = std::move(channel)]() mutable {
        do_attach(std::move(channel));
    });
}

void TransferSession::accept() {
    auto self = shared_from_this();
    boost::asio::post(strand_, [this, self]() { do_accept(); });
}

void TransferSession::pause() {
    auto self = shared_from_this();
    boost::asio::post(strand_, [this, self]() {
        close_channel();

        switch (status_.load()) {
            case SessionStatus::TRANSFERRING:
                enter_paused();
                break;
            case SessionStatus::AWAITING_ACCEPT:
                set_status(SessionStatus::IDLE);
                break;
            default:
                break;
        }
    });
}

void TransferSession::cancel() {
    auto self = shared_from_this();
    boost::asio::post(strand_, [this, self]() {
        if (is_terminal(status_.load())) {
            return;
        }

        LOG_INFO("Cancelling transfer of {} with {}", file_id(), peer_id_);
        send_message(network::ErrorMessage{network::ErrorCode::CANCELLED, 0, "Transfer cancelled"});

        stop_timers();
        if (scheduler_) {
            scheduler_->clear();
        }
        close_channel();

        error_reason_ = ErrorReason::CANCELLED;
        set_status(SessionStatus::CANCELLED);
    });
}

std::string TransferSession::file_id() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return metadata_ ? metadata_->file_id : std::string();
}

std::optional<storage::FileMetadata> TransferSession::metadata() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return metadata_;
}

SessionSnapshot TransferSession::snapshot() const {
    SessionSnapshot snapshot;
    snapshot.role = config_.role;
    snapshot.peer_id = peer_id_;
    snapshot.status = status_.load();
    snapshot.error_reason = error_reason_.load();
    snapshot.received_count = received_count_.load();
    snapshot.total_chunks = total_chunks_.load();
    snapshot.degraded = degraded_.load();
    snapshot.eta = predictor_.last_estimate();
    snapshot.bytes_done = predictor_.received_bytes();
    snapshot.size = 0;

    std::lock_guard<std::mutex> lock(info_mutex_);
    if (metadata_) {
        snapshot.file_id = metadata_->file_id;
        snapshot.name = metadata_->name;
        snapshot.size = metadata_->size;
    }
    snapshot.error_message = error_message_;
    return snapshot;
}

void TransferSession::do_attach(std::shared_ptr<network::MessageChannel> channel) {
    if (is_terminal(status_.load())) {
        LOG_WARN("Session with {} is {}, refusing channel", peer_id_, to_string(status_.load()));
        channel->close();
        return;
    }

    if (channel_) {
        LOG_INFO("Replacing channel to {}", peer_id_);
        close_channel();
        if (status_.load() == SessionStatus::TRANSFERRING) {
            enter_paused();
        }
    }

    channel_ = std::move(channel);
    ++channel_generation_;
    install_handlers(channel_, channel_generation_);
    if (server_) {
        server_->attach(channel_);
    }
    channel_->start();

    auto status = status_.load();

    if (config_.role == SessionRole::SENDER) {
        const auto& metadata = source_->metadata();
        // progress follows the peer's view, which the server just forgot
        received_count_ = 0;
        predictor_.set_received_bytes(0);
        send_message(network::MetaMessage{metadata});

        if (status == SessionStatus::PAUSED) {
            resuming_ = true;
            send_message(ResumeCoordinator::make_bitfield(metadata, full_bitfield(metadata.total_chunks)));
            LOG_INFO("Resuming upload of {} to {}", metadata.name, peer_id_);
        } else if (status == SessionStatus::IDLE) {
            LOG_INFO("Offering {} ({} bytes) to {}", metadata.name, metadata.size, peer_id_);
            set_status(SessionStatus::AWAITING_ACCEPT);
        }
        return;
    }

    if (status == SessionStatus::PAUSED && bitfield_store_) {
        resuming_ = true;
        send_message(ResumeCoordinator::make_bitfield(*metadata_, bitfield_store_->snapshot()));
        LOG_INFO("Channel to {} reopened, waiting for resume", peer_id_);
    }
}

void TransferSession::install_handlers(const std::shared_ptr<network::MessageChannel>& channel,
                                       std::uint64_t generation) {
    std::weak_ptr<TransferSession> weak = shared_from_this();

    channel->set_message_handler([weak, generation](std::vector<std::uint8_t> frame) {
        if (auto self = weak.lock()) {
            boost::asio::post(self->strand_, [self, generation, frame = std::move(frame)]() mutable {
                self->handle_frame(generation, std::move(frame));
            });
        }
    });

    channel->set_closed_handler([weak, generation]() {
        if (auto self = weak.lock()) {
            boost::asio::post(self->strand_, [self, generation]() {
                self->handle_channel_closed(generation);
            });
        }
    });

    channel->set_buffered_low_handler([weak, generation]() {
        if (auto self = weak.lock()) {
            boost::asio::post(self->strand_, [self, generation]() {
                self->handle_buffered_low(generation);
            });
        }
    });
}

void TransferSession::handle_frame(std::uint64_t generation, std::vector<std::uint8_t> frame) {
    if (is_terminal(status_.load())) {
        return;
    }

    network::ControlMessage message;
    try {
        message = network::decode(frame);
    } catch (const network::ProtocolError& e) {
        if (!is_current(generation)) {
            return;
        }
        LOG_ERROR("Malformed message from {}: {}", peer_id_, e.what());
        fail(ErrorReason::PROTOCOL_ERROR, e.what());
        return;
    }

    auto type = network::message_type(message);

    // Late chunks from a replaced channel are still worth keeping.
    if (!is_current(generation) && type != network::MessageType::CHUNK) {
        LOG_DEBUG("Ignoring {} from stale channel to {}", network::to_string(type), peer_id_);
        return;
    }

    bool sender = config_.role == SessionRole::SENDER;
    bool expected = true;

    switch (type) {
        case network::MessageType::META:
            if (sender) { expected = false; break; }
            on_meta(std::get<network::MetaMessage>(message));
            break;

        case network::MessageType::BITFIELD:
            on_bitfield(std::get<network::BitfieldMessage>(message));
            break;

        case network::MessageType::REQUEST: {
            if (!sender) { expected = false; break; }
            const auto& request = std::get<network::RequestMessage>(message);
            on_request({request.start, request.end});
            break;
        }

        case network::MessageType::CHUNK:
            if (sender) { expected = false; break; }
            on_chunk(std::move(std::get<network::ChunkMessage>(message)));
            break;

        case network::MessageType::ACK:
            if (!sender) { expected = false; break; }
            on_ack(std::get<network::AckMessage>(message));
            break;

        case network::MessageType::NEED:
            if (!sender) { expected = false; break; }
            on_need(std::get<network::NeedMessage>(message));
            break;

        case network::MessageType::END:
            if (!sender) { expected = false; break; }
            LOG_INFO("Peer {} finished receiving {}", peer_id_, file_id());
            stop_timers();
            set_status(SessionStatus::COMPLETED);
            if (events_.on_completed) {
                events_.on_completed();
            }
            close_channel();
            break;

        case network::MessageType::ERROR_RESPONSE:
            on_error_message(std::get<network::ErrorMessage>(message));
            break;

        default:
            expected = false;
            break;
    }

    if (!expected) {
        LOG_WARN("Unexpected {} from {} as {}", network::to_string(type), peer_id_, to_string(config_.role));
        send_message(network::ErrorMessage{network::ErrorCode::INVALID_MESSAGE, 0,
                                           std::string("Unexpected ") + network::to_string(type)});
    }
}

void TransferSession::handle_channel_closed(std::uint64_t generation) {
    if (!is_current(generation)) {
        return;
    }

    channel_.reset();
    if (server_) {
        server_->detach();
    }

    switch (status_.load()) {
        case SessionStatus::TRANSFERRING:
            enter_paused();
            break;
        case SessionStatus::PAUSED:
            resuming_ = false;
            break;
        case SessionStatus::AWAITING_ACCEPT:
            LOG_INFO("Peer {} left before the offer was accepted", peer_id_);
            set_status(SessionStatus::IDLE);
            break;
        default:
            break;
    }
}

void TransferSession::handle_buffered_low(std::uint64_t generation) {
    if (!is_current(generation) || !server_ || !server_->suspended()) {
        return;
    }
    serve();
}

void TransferSession::on_meta(const network::MetaMessage& message) {
    const auto& offered = message.metadata;

    switch (status_.load()) {
        case SessionStatus::IDLE:
            LOG_INFO("Peer {} offers {} ({} bytes, {} chunks)", peer_id_, offered.name, offered.size,
                     offered.total_chunks);
            {
                std::lock_guard<std::mutex> lock(info_mutex_);
                metadata_ = offered;
            }
            total_chunks_ = offered.total_chunks;
            received_count_ = 0;
            set_status(SessionStatus::AWAITING_ACCEPT);

            if (events_.on_offer) {
                events_.on_offer(offered);
            }
            if (config_.auto_accept) {
                do_accept();
            }
            break;

        case SessionStatus::AWAITING_ACCEPT:
            if (metadata_ && *metadata_ != offered) {
                LOG_WARN("Peer {} replaced its offer with {}", peer_id_, offered.name);
                std::lock_guard<std::mutex> lock(info_mutex_);
                metadata_ = offered;
                total_chunks_ = offered.total_chunks;
            }
            break;

        case SessionStatus::PAUSED:
        case SessionStatus::TRANSFERRING:
            if (offered.file_id != metadata_->file_id || !offered.same_layout(*metadata_)) {
                fail(ErrorReason::METADATA_MISMATCH,
                     "Peer now offers " + offered.name + " (" + offered.file_id + ") instead of " + metadata_->file_id);
                return;
            }
            if (status_.load() == SessionStatus::PAUSED && resuming_) {
                resume_download();
            }
            break;

        default:
            break;
    }
}

void TransferSession::do_accept() {
    if (status_.load() != SessionStatus::AWAITING_ACCEPT || !metadata_) {
        LOG_WARN("Nothing to accept from {} ({})", peer_id_, to_string(status_.load()));
        return;
    }

    auto metadata = *metadata_;
    auto reconciled = coordinator_->reconcile(metadata);

    switch (reconciled.outcome) {
        case ReconcileOutcome::MISMATCH:
            fail(ErrorReason::METADATA_MISMATCH, reconciled.message);
            return;
        case ReconcileOutcome::STORE_FAILURE:
            fail(ErrorReason::STORE_FAILURE, reconciled.message);
            return;
        default:
            break;
    }

    bitfield_store_ = std::make_unique<storage::BitfieldStore>(store_, std::move(reconciled.record),
                                                               config_.store_retry);
    scheduler_ = std::make_unique<RequestScheduler>(config_.window_size, config_.max_range_size,
                                                    config_.stall_timeout, config_.stall_retry_cap);

    auto held = bitfield_store_->snapshot();
    predictor_.reset();
    predictor_.set_total_bytes(metadata.size);
    predictor_.set_received_bytes(held_bytes(metadata, held));
    received_count_ = held.count();

    LOG_INFO("Accepted {} from {} ({})", metadata.name, peer_id_, to_string(reconciled.outcome));

    if (reconciled.outcome == ReconcileOutcome::RESUMED) {
        send_message(ResumeCoordinator::make_bitfield(metadata, held));
        resume_download();
        return;
    }

    set_status(SessionStatus::TRANSFERRING);
    report_progress(received_count_.load(), metadata.total_chunks);

    if (bitfield_store_->complete()) {
        complete_download();
        return;
    }

    send_requests(scheduler_->fill_window(held));
    schedule_stall_check();
    schedule_eta_update();
}

void TransferSession::resume_download() {
    resuming_ = false;
    scheduler_->clear();
    set_status(SessionStatus::TRANSFERRING);
    report_progress(bitfield_store_->received_count(), bitfield_store_->total_chunks());

    if (bitfield_store_->complete()) {
        complete_download();
        return;
    }

    // The first window after a reconnect goes out as a single NEED.
    auto ranges = scheduler_->fill_window(bitfield_store_->snapshot());
    if (!ranges.empty()) {
        LOG_INFO("Resuming {} from {}: {} chunks missing", metadata_->name, peer_id_,
                 bitfield_store_->total_chunks() - bitfield_store_->received_count());
        send_message(network::NeedMessage{ranges});
    }

    schedule_stall_check();
    schedule_eta_update();
}

void TransferSession::send_requests(const std::vector<storage::Range>& ranges) {
    for (const auto& range : ranges) {
        if (!channel_ || !channel_->is_open()) {
            return;
        }
        send_message(network::RequestMessage{range.start, range.end});
    }
}

void TransferSession::on_chunk(network::ChunkMessage message) {
    auto status = status_.load();
    if (!bitfield_store_ || (status != SessionStatus::TRANSFERRING && status != SessionStatus::PAUSED)) {
        LOG_WARN("Chunk {} from {} while {}", message.index, peer_id_, to_string(status));
        return;
    }

    const auto& metadata = *metadata_;
    auto index = message.index;

    if (index >= metadata.total_chunks) {
        LOG_WARN("Chunk {} from {} is out of range", index, peer_id_);
        send_message(network::ErrorMessage{network::ErrorCode::OUT_OF_RANGE, index,
                                           "Chunk index past " + std::to_string(metadata.total_chunks)});
        return;
    }

    if (message.payload.size() != metadata.chunk_length(index)) {
        LOG_WARN("Chunk {} from {} has {} bytes, expected {}", index, peer_id_, message.payload.size(),
                 metadata.chunk_length(index));
        send_message(network::ErrorMessage{network::ErrorCode::INVALID_MESSAGE, index, "Wrong chunk length"});
        return;
    }

    if (bitfield_store_->has(index)) {
        send_message(network::AckMessage{index});
        return;
    }

    auto stored = storage::retry_store_operation(config_.store_retry, [&]() {
        return store_->put_chunk(metadata.file_id, index, message.payload);
    });
    if (!stored) {
        fail(ErrorReason::STORE_FAILURE, stored.message);
        return;
    }

    bool newly_set = false;
    auto marked = bitfield_store_->set(index, newly_set);
    if (!marked) {
        fail(ErrorReason::STORE_FAILURE, marked.message);
        return;
    }

    received_count_ = bitfield_store_->received_count();
    predictor_.on_bytes(message.payload.size());
    send_message(network::AckMessage{index});
    report_progress(received_count_.load(), metadata.total_chunks);

    bool range_done = newly_set && scheduler_->on_chunk(index);

    if (bitfield_store_->complete()) {
        complete_download();
        return;
    }

    if (range_done && status_.load() == SessionStatus::TRANSFERRING) {
        send_requests(scheduler_->fill_window(bitfield_store_->snapshot()));
    }
}

void TransferSession::check_stalls() {
    if (status_.load() != SessionStatus::TRANSFERRING || !scheduler_) {
        return;
    }

    auto held = bitfield_store_->snapshot();
    auto report = scheduler_->collect_stalled(held);

    for (const auto& range : report.degraded) {
        LOG_WARN("Range {}-{} from {} keeps stalling", range.start, range.end, peer_id_);
        degraded_ = true;
        if (events_.on_degraded) {
            events_.on_degraded(range);
        }
    }

    if (!report.reissued.empty()) {
        LOG_INFO("Re-requesting {} stalled ranges from {}", report.reissued.size(), peer_id_);
        send_requests(report.reissued);
    }
    send_requests(scheduler_->fill_window(held));
}

void TransferSession::complete_download() {
    stop_timers();
    scheduler_->clear();

    auto touched = bitfield_store_->touch();
    if (!touched) {
        LOG_WARN("Could not stamp completed record for {}: {}", metadata_->file_id, touched.message);
    }

    send_message(network::EndMessage{});
    predictor_.update();

    LOG_INFO("Received all {} chunks of {} from {}", metadata_->total_chunks, metadata_->name, peer_id_);
    set_status(SessionStatus::COMPLETED);
    if (events_.on_completed) {
        events_.on_completed();
    }
}

void TransferSession::on_request(const storage::Range& range) {
    start_serving();
    server_->enqueue(range);
    serve();
}

void TransferSession::on_need(const network::NeedMessage& message) {
    LOG_INFO("Peer {} needs {} ranges", peer_id_, message.ranges.size());
    start_serving();
    for (const auto& range : message.ranges) {
        server_->enqueue(range);
    }
    serve();
}

void TransferSession::on_ack(const network::AckMessage& message) {
    if (!server_->on_ack(message.index)) {
        return;
    }

    const auto& metadata = source_->metadata();
    predictor_.on_bytes(metadata.chunk_length(message.index));
    received_count_ = server_->peer_received_count();
    report_progress(received_count_.load(), metadata.total_chunks);
}

void TransferSession::start_serving() {
    auto status = status_.load();
    if (status != SessionStatus::AWAITING_ACCEPT && status != SessionStatus::PAUSED) {
        return;
    }

    resuming_ = false;
    set_status(SessionStatus::TRANSFERRING);
    schedule_eta_update();
}

void TransferSession::serve() {
    if (status_.load() != SessionStatus::TRANSFERRING) {
        return;
    }

    auto result = server_->pump();
    if (!result) {
        // the closed handler moves the session to Paused
        LOG_DEBUG("Serving {} stopped: {}", peer_id_, result.message);
    }
}

void TransferSession::on_bitfield(const network::BitfieldMessage& message) {
    if (!metadata_) {
        LOG_WARN("Bitfield from {} before any metadata", peer_id_);
        return;
    }

    storage::Bitfield peer;
    auto read = ResumeCoordinator::read_peer_bitfield(message, *metadata_, peer);
    if (!read) {
        fail(read.error == core::TransferError::METADATA_MISMATCH ? ErrorReason::METADATA_MISMATCH
                                                                  : ErrorReason::PROTOCOL_ERROR,
             read.message);
        return;
    }

    if (config_.role == SessionRole::RECEIVER) {
        LOG_DEBUG("Peer {} holds {}/{} chunks", peer_id_, peer.count(), peer.size());
        return;
    }

    auto held = held_bytes(*metadata_, peer);
    auto count = peer.count();
    auto applied = server_->set_peer_bitfield(std::move(peer));
    if (!applied) {
        fail(ErrorReason::METADATA_MISMATCH, applied.message);
        return;
    }

    LOG_INFO("Peer {} already holds {}/{} chunks of {}", peer_id_, count, metadata_->total_chunks, metadata_->name);
    predictor_.set_received_bytes(held);
    received_count_ = count;
    report_progress(count, metadata_->total_chunks);
    start_serving();
}

void TransferSession::on_error_message(const network::ErrorMessage& message) {
    switch (message.code) {
        case network::ErrorCode::CHUNK_NOT_AVAILABLE:
        case network::ErrorCode::OUT_OF_RANGE:
        case network::ErrorCode::INVALID_MESSAGE:
            // per-chunk problems; the stall timer re-requests
            LOG_WARN("Peer {} reports {} for chunk {}: {}", peer_id_, static_cast<std::uint32_t>(message.code),
                     message.index, message.reason);
            break;

        case network::ErrorCode::CANCELLED:
            fail(ErrorReason::PEER_ERROR, "Peer cancelled the transfer", false);
            break;

        default:
            fail(ErrorReason::PEER_ERROR, "Peer error: " + message.reason, false);
            break;
    }
}

void TransferSession::enter_paused() {
    stop_timers();
    if (scheduler_) {
        scheduler_->clear();
    }
    if (server_) {
        server_->detach();
    }
    resuming_ = false;

    if (bitfield_store_) {
        auto touched = bitfield_store_->touch();
        if (!touched) {
            LOG_WARN("Could not stamp paused record for {}: {}", metadata_->file_id, touched.message);
        }
    }

    LOG_INFO("Transfer of {} with {} paused at {}/{} chunks", file_id(), peer_id_, received_count_.load(),
             total_chunks_.load());
    set_status(SessionStatus::PAUSED);
}

void TransferSession::fail(ErrorReason reason, const std::string& message, bool notify_peer) {
    if (is_terminal(status_.load())) {
        return;
    }

    LOG_ERROR("Transfer with {} failed ({}): {}", peer_id_, to_string(reason), message);
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        error_message_ = message;
    }
    error_reason_ = reason;

    if (notify_peer) {
        send_message(network::ErrorMessage{to_error_code(reason), 0, message});
    }

    stop_timers();
    if (scheduler_) {
        scheduler_->clear();
    }
    close_channel();

    set_status(SessionStatus::ERROR);
    if (events_.on_error) {
        events_.on_error(reason, message);
    }
}

void TransferSession::set_status(SessionStatus status) {
    auto previous = status_.exchange(status);
    if (previous == status) {
        return;
    }

    LOG_DEBUG("Session with {}: {} -> {}", peer_id_, to_string(previous), to_string(status));
    if (events_.on_status) {
        events_.on_status(status);
    }
}

void TransferSession::report_progress(std::uint32_t received, std::uint32_t total) {
    if (events_.on_progress) {
        events_.on_progress(received, total);
    }
}

void TransferSession::send_message(const network::ControlMessage& message) {
    if (!channel_) {
        return;
    }

    try {
        channel_->send(network::encode(message));
    } catch (const network::ChannelClosedError& e) {
        // the closed handler takes care of the state change
        LOG_DEBUG("Dropped {} to {}: {}", network::to_string(network::message_type(message)), peer_id_, e.what());
    }
}

void TransferSession::close_channel() {
    if (!channel_) {
        return;
    }

    auto channel = std::move(channel_);
    channel_.reset();
    if (server_) {
        server_->detach();
    }
    channel->close();
}

void TransferSession::schedule_stall_check() {
    auto interval = std::max<std::chrono::milliseconds>(config_.stall_timeout / 2, MIN_STALL_CHECK_INTERVAL);

    auto self = shared_from_this();
    stall_timer_.expires_after(interval);
    stall_timer_.async_wait([this, self](const boost::system::error_code& ec) {
        if (ec || status_.load() != SessionStatus::TRANSFERRING) {
            return;
        }
        check_stalls();
        schedule_stall_check();
    });
}

void TransferSession::schedule_eta_update() {
    auto self = shared_from_this();
    eta_timer_.expires_after(config_.eta.update_interval);
    eta_timer_.async_wait([this, self](const boost::system::error_code& ec) {
        if (ec || status_.load() != SessionStatus::TRANSFERRING) {
            return;
        }

        auto estimate = predictor_.update();
        if (events_.on_eta) {
            events_.on_eta(estimate);
        }
        schedule_eta_update();
    });
}

void TransferSession::stop_timers() {
    stall_timer_.cancel();
    eta_timer_.cancel();
}

}
