#include "chunkwire/transfer/transfer_manager.hpp"
#include "chunkwire/core/logger.hpp"
#include <algorithm>

namespace chunkwire::transfer {

TransferManager::TransferManager(boost::asio::io_context& io_context,
                                 std::shared_ptr<storage::PersistentStore> store,
                                 SessionConfig config)
    : io_context_(io_context)
    , store_(std::move(store))
    , config_(config) {
}

TransferManager::~TransferManager() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& session : sessions_) {
        if (!is_terminal(session->status())) {
            session->pause();
        }
    }
    sessions_.clear();
}

void TransferManager::set_session_events(SessionEvents events) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_ = std::move(events);
}

void TransferManager::share(std::shared_ptr<storage::ChunkSource> source) {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_INFO("Sharing {} as {}", source->metadata().name, source->metadata().file_id);
    shared_source_ = std::move(source);
}

core::Result TransferManager::serve_channel(std::shared_ptr<network::MessageChannel> channel) {
    std::shared_ptr<TransferSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!shared_source_) {
            channel->close();
            return core::Result(core::TransferError::INVALID_STATE, "No file is being shared");
        }

        const auto& file_id = shared_source_->metadata().file_id;
        const auto& peer_id = channel->remote_peer_id();

        auto it = std::find_if(sessions_.begin(), sessions_.end(), [&](const auto& candidate) {
            return candidate->role() == SessionRole::SENDER && candidate->peer_id() == peer_id &&
                   candidate->file_id() == file_id && !is_terminal(candidate->status());
        });

        if (it != sessions_.end()) {
            LOG_INFO("Peer {} reconnected, resuming upload", peer_id);
            session = *it;
        } else {
            auto config = config_;
            config.role = SessionRole::SENDER;
            session = TransferSession::create_upload(io_context_, config, shared_source_, peer_id, events_);
            sessions_.push_back(session);
        }
    }

    session->attach_channel(std::move(channel));
    return {};
}

std::shared_ptr<TransferSession> TransferManager::receive_channel(std::shared_ptr<network::MessageChannel> channel) {
    std::shared_ptr<TransferSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto& peer_id = channel->remote_peer_id();

        // A paused download wins over one that never got going.
        std::shared_ptr<TransferSession> idle;
        for (const auto& candidate : sessions_) {
            if (candidate->role() != SessionRole::RECEIVER || candidate->peer_id() != peer_id) {
                continue;
            }
            auto status = candidate->status();
            if (status == SessionStatus::PAUSED) {
                session = candidate;
                break;
            }
            if (!idle && (status == SessionStatus::IDLE || status == SessionStatus::AWAITING_ACCEPT)) {
                idle = candidate;
            }
        }

        if (!session) {
            session = idle;
        }

        if (session) {
            LOG_INFO("Routing channel from {} to its {} download", peer_id, to_string(session->status()));
        } else {
            auto config = config_;
            config.role = SessionRole::RECEIVER;
            session = TransferSession::create_download(io_context_, config, store_, peer_id, events_);
            sessions_.push_back(session);
        }
    }

    session->attach_channel(std::move(channel));
    return session;
}

void TransferManager::watch(network::RendezvousService& rendezvous) {
    rendezvous.on_peer_left([this](const std::string& peer_id) {
        pause_peer(peer_id);
    });
}

void TransferManager::pause_peer(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& session : sessions_) {
        if (session->peer_id() == peer_id && !is_terminal(session->status())) {
            LOG_INFO("Peer {} left, pausing {}", peer_id, session->file_id());
            session->pause();
        }
    }
}

std::shared_ptr<TransferSession> TransferManager::find_session(const std::string& file_id,
                                                               const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::shared_ptr<TransferSession> finished;
    for (const auto& session : sessions_) {
        if (session->peer_id() != peer_id || session->file_id() != file_id) {
            continue;
        }
        if (!is_terminal(session->status())) {
            return session;
        }
        finished = session;
    }
    return finished;
}

std::vector<SessionSnapshot> TransferManager::list_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SessionSnapshot> snapshots;
    snapshots.reserve(sessions_.size());
    for (const auto& session : sessions_) {
        snapshots.push_back(session->snapshot());
    }
    return snapshots;
}

core::Result TransferManager::cancel_transfer(const std::string& file_id, const std::string& peer_id) {
    auto session = find_session(file_id, peer_id);
    if (!session) {
        return core::Result(core::TransferError::NOT_FOUND, "No transfer of " + file_id + " with " + peer_id);
    }
    if (is_terminal(session->status())) {
        return core::Result(core::TransferError::INVALID_STATE,
                            std::string("Transfer already ") + to_string(session->status()));
    }

    session->cancel();
    return {};
}

core::Result TransferManager::purge(const std::string& file_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& session : sessions_) {
            if (session->role() == SessionRole::RECEIVER && session->file_id() == file_id &&
                !is_terminal(session->status())) {
                return core::Result(core::TransferError::INVALID_STATE,
                                    "Download of " + file_id + " is still " + to_string(session->status()));
            }
        }
    }

    auto result = storage::retry_store_operation(config_.store_retry, [&]() {
        return store_->delete_file(file_id);
    });
    if (result) {
        LOG_INFO("Purged stored data for {}", file_id);
    }
    return result;
}

core::Result TransferManager::collect_garbage(std::chrono::hours max_idle, std::size_t& removed_records) {
    auto forgotten = remove_finished_sessions();
    if (forgotten > 0) {
        LOG_DEBUG("Forgot {} finished sessions", forgotten);
    }

    auto cutoff = std::chrono::system_clock::now() - max_idle;
    removed_records = 0;
    auto result = storage::retry_store_operation(config_.store_retry, [&]() {
        return store_->remove_stale_records(cutoff, removed_records);
    });
    if (result && removed_records > 0) {
        LOG_INFO("Removed {} transfer records idle for more than {}h", removed_records, max_idle.count());
    }
    return result;
}

std::size_t TransferManager::remove_finished_sessions() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto before = sessions_.size();
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                   [](const auto& session) { return is_terminal(session->status()); }),
                    sessions_.end());
    return before - sessions_.size();
}

TransferStats TransferManager::stats() const {
    TransferStats stats;
    for (const auto& snapshot : list_sessions()) {
        if (snapshot.role == SessionRole::SENDER) {
            ++stats.uploads;
        } else {
            ++stats.downloads;
        }

        switch (snapshot.status) {
            case SessionStatus::TRANSFERRING: ++stats.transferring; break;
            case SessionStatus::PAUSED: ++stats.paused; break;
            case SessionStatus::COMPLETED: ++stats.completed; break;
            case SessionStatus::ERROR:
            case SessionStatus::CANCELLED: ++stats.failed; break;
            default: break;
        }

        stats.bytes_done += snapshot.bytes_done;
    }
    return stats;
}

}
