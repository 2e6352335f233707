#include <gtest/gtest.h>
#include "chunkwire/core/identity.hpp"
#include "chunkwire/transfer/transfer_session.hpp"
#include "test_support.hpp"
#include <mutex>
#include <set>

using namespace chunkwire::transfer;
using namespace chunkwire::network;
using chunkwire::storage::Bitfield;
using chunkwire::storage::FileMetadata;
using chunkwire::storage::FileRecord;
using chunkwire::storage::Range;
using chunkwire::testing::BufferSource;
using chunkwire::testing::FlakyStore;
using chunkwire::testing::IoRunner;
using chunkwire::testing::ScriptedPeer;
using chunkwire::testing::fast_retry;
using chunkwire::testing::serve_requests;
using chunkwire::testing::wait_until;

namespace {

// Collects every event a session raises.
struct EventLog {
    std::mutex mutex;
    std::vector<SessionStatus> statuses;
    std::vector<FileMetadata> offers;
    std::vector<Range> degraded;
    std::vector<ErrorReason> errors;
    std::uint32_t last_received = 0;
    int completed = 0;

    SessionEvents events() {
        SessionEvents events;
        events.on_status = [this](SessionStatus status) {
            std::lock_guard<std::mutex> lock(mutex);
            statuses.push_back(status);
        };
        events.on_offer = [this](const FileMetadata& metadata) {
            std::lock_guard<std::mutex> lock(mutex);
            offers.push_back(metadata);
        };
        events.on_progress = [this](std::uint32_t received, std::uint32_t) {
            std::lock_guard<std::mutex> lock(mutex);
            last_received = received;
        };
        events.on_degraded = [this](const Range& range) {
            std::lock_guard<std::mutex> lock(mutex);
            degraded.push_back(range);
        };
        events.on_error = [this](ErrorReason reason, const std::string&) {
            std::lock_guard<std::mutex> lock(mutex);
            errors.push_back(reason);
        };
        events.on_completed = [this]() {
            std::lock_guard<std::mutex> lock(mutex);
            ++completed;
        };
        return events;
    }

    std::size_t offer_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return offers.size();
    }

    int completed_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return completed;
    }

    std::vector<ErrorReason> error_list() {
        std::lock_guard<std::mutex> lock(mutex);
        return errors;
    }
};

std::set<std::uint32_t> indices_in(const std::vector<Range>& ranges) {
    std::set<std::uint32_t> indices;
    for (const auto& range : ranges) {
        for (auto i = range.start; i <= range.end; ++i) {
            indices.insert(i);
        }
    }
    return indices;
}

}

class TransferSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(chunkwire::core::Identity::initialize());
        // 10 chunks of 16KB
        metadata = FileMetadata::describe("session.bin", 10 * 16 * 1024,
                                          std::chrono::system_clock::time_point(std::chrono::hours(2)));
        ASSERT_EQ(metadata.total_chunks, 10u);

        source = std::make_shared<BufferSource>(metadata);
        store = std::make_shared<FlakyStore>();

        config.window_size = 2;
        config.max_range_size = 4;
        config.stall_timeout = std::chrono::milliseconds(10000);
        config.store_retry = fast_retry(2);
    }

    std::shared_ptr<TransferSession> download(bool auto_accept = false) {
        auto download_config = config;
        download_config.auto_accept = auto_accept;
        return TransferSession::create_download(io.io_context, download_config, store, "sender", log.events());
    }

    std::shared_ptr<TransferSession> upload() {
        return TransferSession::create_upload(io.io_context, config, source, "receiver", log.events());
    }

    // Attaches one end of a fresh pair to the session and returns the scripted other end.
    std::unique_ptr<ScriptedPeer> connect(const std::shared_ptr<TransferSession>& session) {
        auto pair = MemoryChannel::create_pair(io.io_context, "local", "remote");
        session->attach_channel(pair.first);
        return std::make_unique<ScriptedPeer>(pair.second);
    }

    bool wait_status(const std::shared_ptr<TransferSession>& session, SessionStatus status) {
        return wait_until([&]() { return session->status() == status; });
    }

    // Downloads the first held chunks, then pauses the session.
    void download_then_pause(const std::shared_ptr<TransferSession>& session, ScriptedPeer& peer,
                             std::uint32_t held) {
        peer.send(MetaMessage{metadata});
        ASSERT_TRUE(wait_status(session, SessionStatus::TRANSFERRING));

        std::vector<std::uint32_t> withheld;
        for (auto i = held; i < metadata.total_chunks; ++i) {
            withheld.push_back(i);
        }

        std::size_t answered = 0;
        ASSERT_TRUE(wait_until([&]() {
            serve_requests(peer, *source, answered, withheld);
            return peer.received_of<AckMessage>().size() >= held;
        }));

        peer.close();
        ASSERT_TRUE(wait_status(session, SessionStatus::PAUSED));
    }

    IoRunner io;
    EventLog log;
    FileMetadata metadata;
    std::shared_ptr<BufferSource> source;
    std::shared_ptr<FlakyStore> store;
    SessionConfig config;
};

TEST_F(TransferSessionTest, OfferWaitsForAccept) {
    auto session = download();
    auto peer = connect(session);

    peer->send(MetaMessage{metadata});
    ASSERT_TRUE(wait_status(session, SessionStatus::AWAITING_ACCEPT));
    EXPECT_EQ(log.offer_count(), 1u);
    EXPECT_EQ(session->file_id(), metadata.file_id);

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_TRUE(peer->received_of<RequestMessage>().empty());

    session->accept();
    ASSERT_TRUE(peer->wait_for<RequestMessage>(2));
    EXPECT_EQ(session->status(), SessionStatus::TRANSFERRING);

    auto requests = peer->received_of<RequestMessage>();
    EXPECT_EQ(requests[0].start, 0u);
    EXPECT_EQ(requests[0].end, 3u);
    EXPECT_EQ(requests[1].start, 4u);
    EXPECT_EQ(requests[1].end, 7u);
}

TEST_F(TransferSessionTest, DownloadsEveryChunkThenSendsEnd) {
    auto session = download(true);
    auto peer = connect(session);
    peer->send(MetaMessage{metadata});

    std::size_t answered = 0;
    ASSERT_TRUE(wait_until([&]() {
        serve_requests(*peer, *source, answered);
        return session->status() == SessionStatus::COMPLETED;
    }));

    ASSERT_TRUE(peer->wait_for<EndMessage>());
    EXPECT_EQ(peer->received_of<AckMessage>().size(), 10u);
    EXPECT_EQ(store->chunk_count(metadata.file_id), 10u);
    EXPECT_EQ(log.completed_count(), 1);

    std::vector<std::uint8_t> expected;
    std::vector<std::uint8_t> stored;
    ASSERT_TRUE(source->read_chunk(9, expected));
    ASSERT_TRUE(store->get_chunk(metadata.file_id, 9, stored));
    EXPECT_EQ(stored, expected);

    FileRecord record;
    ASSERT_TRUE(store->get_file_record(metadata.file_id, record));
    EXPECT_EQ(record.received_count, 10u);
    EXPECT_TRUE(record.bitfield.complete());

    auto snapshot = session->snapshot();
    EXPECT_EQ(snapshot.role, SessionRole::RECEIVER);
    EXPECT_EQ(snapshot.name, "session.bin");
    EXPECT_EQ(snapshot.received_count, 10u);
    EXPECT_EQ(snapshot.total_chunks, 10u);
    EXPECT_EQ(snapshot.bytes_done, metadata.size);
    EXPECT_EQ(snapshot.error_reason, ErrorReason::NONE);
    EXPECT_FALSE(snapshot.degraded);
}

TEST_F(TransferSessionTest, ResumesWithSingleNeedForMissingChunks) {
    auto session = download(true);
    auto first = connect(session);
    download_then_pause(session, *first, 4);
    EXPECT_EQ(session->snapshot().received_count, 4u);

    auto second = connect(session);
    ASSERT_TRUE(second->wait_for<BitfieldMessage>());

    auto bitfield = second->received_of<BitfieldMessage>().front();
    EXPECT_EQ(bitfield.file_id, metadata.file_id);
    EXPECT_EQ(bitfield.received_count, 4u);
    EXPECT_EQ(Bitfield::from_bytes(bitfield.bits, bitfield.total_chunks).count(), 4u);

    second->send(MetaMessage{metadata});
    ASSERT_TRUE(second->wait_for<NeedMessage>());

    auto need = second->received_of<NeedMessage>().front();
    EXPECT_EQ(indices_in(need.ranges), (std::set<std::uint32_t>{4, 5, 6, 7, 8, 9}));

    std::size_t answered = 0;
    ASSERT_TRUE(wait_until([&]() {
        serve_requests(*second, *source, answered);
        return session->status() == SessionStatus::COMPLETED;
    }));

    EXPECT_TRUE(second->received_of<RequestMessage>().empty());
    EXPECT_EQ(second->received_of<AckMessage>().size(), 6u);
}

TEST_F(TransferSessionTest, ExplicitPauseClosesChannel) {
    auto session = download(true);
    auto peer = connect(session);
    peer->send(MetaMessage{metadata});
    ASSERT_TRUE(wait_status(session, SessionStatus::TRANSFERRING));

    session->pause();
    ASSERT_TRUE(wait_status(session, SessionStatus::PAUSED));
    EXPECT_TRUE(wait_until([&]() { return peer->closed(); }));
}

TEST_F(TransferSessionTest, ResumesFromStoredRecord) {
    auto record = FileRecord::fresh(metadata);
    for (std::uint32_t i = 0; i < 5; ++i) {
        std::vector<std::uint8_t> chunk;
        ASSERT_TRUE(source->read_chunk(i, chunk));
        ASSERT_TRUE(store->put_chunk(metadata.file_id, i, chunk));
        record.bitfield.set(i);
    }
    record.received_count = 5;
    ASSERT_TRUE(store->put_file_record(record));

    auto session = download(true);
    auto peer = connect(session);
    peer->send(MetaMessage{metadata});

    ASSERT_TRUE(peer->wait_for<NeedMessage>());
    EXPECT_EQ(peer->received_of<BitfieldMessage>().size(), 1u);
    EXPECT_EQ(indices_in(peer->received_of<NeedMessage>().front().ranges),
              (std::set<std::uint32_t>{5, 6, 7, 8, 9}));

    std::size_t answered = 0;
    ASSERT_TRUE(wait_until([&]() {
        serve_requests(*peer, *source, answered);
        return session->status() == SessionStatus::COMPLETED;
    }));
    EXPECT_EQ(store->chunk_count(metadata.file_id), 10u);
}

TEST_F(TransferSessionTest, MismatchedOfferAfterPauseFails) {
    auto session = download(true);
    auto first = connect(session);
    download_then_pause(session, *first, 2);

    auto other = FileMetadata::describe("other.bin", 3 * 16 * 1024,
                                        std::chrono::system_clock::time_point(std::chrono::hours(3)));
    auto second = connect(session);
    second->send(MetaMessage{other});

    ASSERT_TRUE(wait_status(session, SessionStatus::ERROR));
    EXPECT_EQ(session->error_reason(), ErrorReason::METADATA_MISMATCH);

    ASSERT_TRUE(second->wait_for<ErrorMessage>());
    EXPECT_EQ(second->received_of<ErrorMessage>().front().code, ErrorCode::METADATA_MISMATCH);
    EXPECT_TRUE(wait_until([&]() { return second->closed(); }));
}

TEST_F(TransferSessionTest, StoreFailureEndsInError) {
    store->fail_chunk_writes = true;

    auto session = download(true);
    auto peer = connect(session);
    peer->send(MetaMessage{metadata});

    std::size_t answered = 0;
    ASSERT_TRUE(wait_until([&]() {
        if (!peer->closed()) {
            serve_requests(*peer, *source, answered);
        }
        return session->status() == SessionStatus::ERROR;
    }));

    EXPECT_EQ(session->error_reason(), ErrorReason::STORE_FAILURE);
    EXPECT_FALSE(session->snapshot().error_message.empty());
    EXPECT_EQ(log.error_list(), std::vector<ErrorReason>{ErrorReason::STORE_FAILURE});
    EXPECT_EQ(store->chunk_count(metadata.file_id), 0u);

    ASSERT_TRUE(peer->wait_for<ErrorMessage>());
    EXPECT_EQ(peer->received_of<ErrorMessage>().front().code, ErrorCode::STORE_FAILURE);
}

TEST_F(TransferSessionTest, TransientStoreFailureIsRetried) {
    store->transient_failures = 1;

    auto session = download(true);
    auto peer = connect(session);
    peer->send(MetaMessage{metadata});

    std::size_t answered = 0;
    ASSERT_TRUE(wait_until([&]() {
        serve_requests(*peer, *source, answered);
        return is_terminal(session->status());
    }));
    EXPECT_EQ(session->status(), SessionStatus::COMPLETED);
}

TEST_F(TransferSessionTest, CancelNotifiesPeer) {
    auto session = download(true);
    auto peer = connect(session);
    peer->send(MetaMessage{metadata});
    ASSERT_TRUE(wait_status(session, SessionStatus::TRANSFERRING));

    session->cancel();
    ASSERT_TRUE(wait_status(session, SessionStatus::CANCELLED));
    EXPECT_EQ(session->error_reason(), ErrorReason::CANCELLED);

    ASSERT_TRUE(peer->wait_for<ErrorMessage>());
    EXPECT_EQ(peer->received_of<ErrorMessage>().front().code, ErrorCode::CANCELLED);
    EXPECT_TRUE(wait_until([&]() { return peer->closed(); }));

    // terminal sessions refuse new channels
    auto late = connect(session);
    EXPECT_TRUE(wait_until([&]() { return late->closed(); }));
    EXPECT_EQ(session->status(), SessionStatus::CANCELLED);
}

TEST_F(TransferSessionTest, ToleratesPerChunkErrors) {
    auto session = download(true);
    auto peer = connect(session);
    peer->send(MetaMessage{metadata});
    ASSERT_TRUE(wait_status(session, SessionStatus::TRANSFERRING));

    peer->send(ErrorMessage{ErrorCode::CHUNK_NOT_AVAILABLE, 3, "not here"});
    peer->send(ChunkMessage{0, std::vector<std::uint8_t>(10, 1)});
    ASSERT_TRUE(peer->wait_for<ErrorMessage>());

    auto reply = peer->received_of<ErrorMessage>().front();
    EXPECT_EQ(reply.code, ErrorCode::INVALID_MESSAGE);
    EXPECT_EQ(reply.index, 0u);
    EXPECT_EQ(session->status(), SessionStatus::TRANSFERRING);
    EXPECT_EQ(store->chunk_count(metadata.file_id), 0u);
}

TEST_F(TransferSessionTest, ChunkPastTheEndIsAnsweredWithError) {
    auto session = download(true);
    auto peer = connect(session);
    peer->send(MetaMessage{metadata});
    ASSERT_TRUE(wait_status(session, SessionStatus::TRANSFERRING));

    peer->send(ChunkMessage{metadata.total_chunks, std::vector<std::uint8_t>(16 * 1024, 7)});
    ASSERT_TRUE(peer->wait_for<ErrorMessage>());

    auto reply = peer->received_of<ErrorMessage>().front();
    EXPECT_EQ(reply.code, ErrorCode::OUT_OF_RANGE);
    EXPECT_EQ(reply.index, metadata.total_chunks);
    EXPECT_EQ(session->status(), SessionStatus::TRANSFERRING);
    EXPECT_EQ(session->snapshot().received_count, 0u);
    EXPECT_EQ(store->chunk_count(metadata.file_id), 0u);
}

TEST_F(TransferSessionTest, ChunkArrivingWhilePausedIsKept) {
    auto session = download(true);
    auto first = connect(session);
    download_then_pause(session, *first, 4);

    // the new channel is open but the handshake has not run yet
    auto second = connect(session);
    ASSERT_TRUE(second->wait_for<BitfieldMessage>());
    ASSERT_EQ(session->status(), SessionStatus::PAUSED);

    std::vector<std::uint8_t> late;
    ASSERT_TRUE(source->read_chunk(6, late));
    second->send(ChunkMessage{6, late});
    second->send(ChunkMessage{6, late});
    ASSERT_TRUE(second->wait_for<AckMessage>(2));

    EXPECT_EQ(session->status(), SessionStatus::PAUSED);
    EXPECT_EQ(session->snapshot().received_count, 5u);
    std::vector<std::uint8_t> stored;
    ASSERT_TRUE(store->get_chunk(metadata.file_id, 6, stored));
    EXPECT_EQ(stored, late);

    FileRecord record;
    ASSERT_TRUE(store->get_file_record(metadata.file_id, record));
    EXPECT_EQ(record.received_count, 5u);

    second->send(MetaMessage{metadata});
    ASSERT_TRUE(second->wait_for<NeedMessage>());
    EXPECT_EQ(indices_in(second->received_of<NeedMessage>().front().ranges),
              (std::set<std::uint32_t>{4, 5, 7, 8, 9}));
}

TEST_F(TransferSessionTest, PeerCancellationIsAnError) {
    auto session = download(true);
    auto peer = connect(session);
    peer->send(MetaMessage{metadata});
    ASSERT_TRUE(wait_status(session, SessionStatus::TRANSFERRING));

    peer->send(ErrorMessage{ErrorCode::CANCELLED, 0, "bye"});
    ASSERT_TRUE(wait_status(session, SessionStatus::ERROR));
    EXPECT_EQ(session->error_reason(), ErrorReason::PEER_ERROR);
}

TEST_F(TransferSessionTest, StalledRangesAreReissuedAndDegrade) {
    config.stall_timeout = std::chrono::milliseconds(40);
    config.stall_retry_cap = 1;

    auto session = download(true);
    auto peer = connect(session);
    peer->send(MetaMessage{metadata});

    // Nothing is ever answered: the first window keeps getting re-requested.
    ASSERT_TRUE(wait_until([&]() { return session->snapshot().degraded; }));
    EXPECT_EQ(session->status(), SessionStatus::TRANSFERRING);

    auto requests = peer->received_of<RequestMessage>();
    ASSERT_GE(requests.size(), 4u);
    for (const auto& request : requests) {
        EXPECT_LE(request.end, 7u);
    }

    std::lock_guard<std::mutex> lock(log.mutex);
    ASSERT_FALSE(log.degraded.empty());
    EXPECT_EQ(log.degraded.front().start, 0u);
}

TEST_F(TransferSessionTest, UploadOffersMetadataOnAttach) {
    auto session = upload();
    auto peer = connect(session);

    ASSERT_TRUE(peer->wait_for<MetaMessage>());
    EXPECT_EQ(peer->received_of<MetaMessage>().front().metadata, metadata);
    EXPECT_TRUE(wait_status(session, SessionStatus::AWAITING_ACCEPT));
    EXPECT_EQ(session->file_id(), metadata.file_id);
    EXPECT_EQ(session->role(), SessionRole::SENDER);
}

TEST_F(TransferSessionTest, UploadServesRequestsUntilEnd) {
    auto session = upload();
    auto peer = connect(session);
    ASSERT_TRUE(peer->wait_for<MetaMessage>());

    peer->send(RequestMessage{0, 9});
    ASSERT_TRUE(peer->wait_for<ChunkMessage>(10));
    EXPECT_EQ(session->status(), SessionStatus::TRANSFERRING);

    auto chunks = peer->received_of<ChunkMessage>();
    for (std::uint32_t i = 0; i < 10; ++i) {
        EXPECT_EQ(chunks[i].index, i);
        EXPECT_EQ(chunks[i].payload.size(), metadata.chunk_length(i));
        peer->send(AckMessage{i});
    }

    ASSERT_TRUE(wait_until([&]() { return session->snapshot().received_count == 10; }));
    EXPECT_EQ(session->snapshot().bytes_done, metadata.size);

    peer->send(EndMessage{});
    ASSERT_TRUE(wait_status(session, SessionStatus::COMPLETED));
    EXPECT_EQ(log.completed_count(), 1);
    EXPECT_TRUE(wait_until([&]() { return peer->closed(); }));
}

TEST_F(TransferSessionTest, UploadResumesOnlyWhatIsNeeded) {
    auto session = upload();
    auto first = connect(session);
    ASSERT_TRUE(first->wait_for<MetaMessage>());
    first->send(RequestMessage{0, 3});
    ASSERT_TRUE(first->wait_for<ChunkMessage>(4));

    first->close();
    ASSERT_TRUE(wait_status(session, SessionStatus::PAUSED));

    auto second = connect(session);
    ASSERT_TRUE(second->wait_for<BitfieldMessage>());
    EXPECT_EQ(second->received_of<MetaMessage>().size(), 1u);

    auto before = source->reads.load();
    second->send(NeedMessage{{{4, 7}, {8, 9}}});
    ASSERT_TRUE(second->wait_for<ChunkMessage>(6));
    EXPECT_EQ(session->status(), SessionStatus::TRANSFERRING);

    std::set<std::uint32_t> served;
    for (const auto& chunk : second->received_of<ChunkMessage>()) {
        served.insert(chunk.index);
    }
    EXPECT_EQ(served, (std::set<std::uint32_t>{4, 5, 6, 7, 8, 9}));
    EXPECT_EQ(source->reads.load() - before, 6);
}

TEST_F(TransferSessionTest, UploadServesReceiverThatLostItsChunks) {
    auto session = upload();
    auto first = connect(session);
    ASSERT_TRUE(first->wait_for<MetaMessage>());
    first->send(RequestMessage{0, 3});
    ASSERT_TRUE(first->wait_for<ChunkMessage>(4));
    for (std::uint32_t i = 0; i < 4; ++i) {
        first->send(AckMessage{i});
    }
    ASSERT_TRUE(wait_until([&]() { return session->snapshot().received_count == 4; }));

    first->close();
    ASSERT_TRUE(wait_status(session, SessionStatus::PAUSED));

    // the receiver comes back with an empty store and asks again without a BITFIELD
    auto second = connect(session);
    ASSERT_TRUE(second->wait_for<MetaMessage>());
    second->send(RequestMessage{0, 3});
    ASSERT_TRUE(second->wait_for<ChunkMessage>(4));

    std::set<std::uint32_t> served;
    for (const auto& chunk : second->received_of<ChunkMessage>()) {
        served.insert(chunk.index);
    }
    EXPECT_EQ(served, (std::set<std::uint32_t>{0, 1, 2, 3}));
    EXPECT_TRUE(second->received_of<ErrorMessage>().empty());
    EXPECT_EQ(session->status(), SessionStatus::TRANSFERRING);

    for (std::uint32_t i = 0; i < 4; ++i) {
        second->send(AckMessage{i});
    }
    ASSERT_TRUE(wait_until([&]() { return session->snapshot().received_count == 4; }));
    EXPECT_EQ(session->snapshot().bytes_done, 4u * 16 * 1024);
}

TEST_F(TransferSessionTest, UploadSkipsChunksThePeerHolds) {
    auto session = upload();
    auto peer = connect(session);
    ASSERT_TRUE(peer->wait_for<MetaMessage>());

    Bitfield held(metadata.total_chunks);
    for (std::uint32_t i = 0; i < 8; ++i) {
        held.set(i);
    }
    peer->send(ResumeCoordinator::make_bitfield(metadata, held));
    peer->send(RequestMessage{0, 9});

    ASSERT_TRUE(peer->wait_for<ChunkMessage>(2));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    auto chunks = peer->received_of<ChunkMessage>();
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].index, 8u);
    EXPECT_EQ(chunks[1].index, 9u);
    EXPECT_EQ(session->snapshot().received_count, 8u);
}

TEST_F(TransferSessionTest, UploadRejectsReceiverMessages) {
    auto session = upload();
    auto peer = connect(session);
    ASSERT_TRUE(peer->wait_for<MetaMessage>());

    peer->send(ChunkMessage{0, std::vector<std::uint8_t>(16, 0)});
    ASSERT_TRUE(peer->wait_for<ErrorMessage>());
    EXPECT_EQ(peer->received_of<ErrorMessage>().front().code, ErrorCode::INVALID_MESSAGE);
    EXPECT_EQ(session->status(), SessionStatus::AWAITING_ACCEPT);
}

TEST_F(TransferSessionTest, UploadRejectsBitfieldForAnotherFile) {
    auto session = upload();
    auto peer = connect(session);
    ASSERT_TRUE(peer->wait_for<MetaMessage>());

    BitfieldMessage foreign;
    foreign.file_id = "someone-else";
    foreign.total_chunks = metadata.total_chunks;
    foreign.bits.assign(Bitfield::byte_length(metadata.total_chunks), 0);
    peer->send(foreign);

    ASSERT_TRUE(wait_status(session, SessionStatus::ERROR));
    EXPECT_EQ(session->error_reason(), ErrorReason::METADATA_MISMATCH);
}

TEST_F(TransferSessionTest, SenderAndReceiverCompleteTogether) {
    auto receiver = download(true);
    EventLog sender_log;
    auto sender = TransferSession::create_upload(io.io_context, config, source, "receiver", sender_log.events());

    auto pair = MemoryChannel::create_pair(io.io_context, "receiver", "sender");
    receiver->attach_channel(pair.first);
    sender->attach_channel(pair.second);

    ASSERT_TRUE(wait_status(receiver, SessionStatus::COMPLETED));
    ASSERT_TRUE(wait_status(sender, SessionStatus::COMPLETED));
    EXPECT_EQ(sender_log.completed_count(), 1);

    chunkwire::storage::StoreChunkSource stored(store, metadata);
    for (std::uint32_t i = 0; i < metadata.total_chunks; ++i) {
        std::vector<std::uint8_t> expected;
        std::vector<std::uint8_t> actual;
        ASSERT_TRUE(source->read_chunk(i, expected));
        ASSERT_TRUE(stored.read_chunk(i, actual));
        EXPECT_EQ(actual, expected) << "chunk " << i;
    }
}

TEST(SessionStatusTest, TerminalStates) {
    EXPECT_TRUE(is_terminal(SessionStatus::COMPLETED));
    EXPECT_TRUE(is_terminal(SessionStatus::ERROR));
    EXPECT_TRUE(is_terminal(SessionStatus::CANCELLED));
    EXPECT_FALSE(is_terminal(SessionStatus::PAUSED));
    EXPECT_FALSE(is_terminal(SessionStatus::AWAITING_ACCEPT));
    EXPECT_STREQ(to_string(SessionStatus::AWAITING_ACCEPT), "awaiting-accept");
    EXPECT_STREQ(to_string(ErrorReason::STORE_FAILURE), "store failure");
}
