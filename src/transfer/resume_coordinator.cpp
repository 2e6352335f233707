#include "chunkwire/transfer/resume_coordinator.hpp"
#include "chunkwire/core/logger.hpp"
#include <stdexcept>

namespace chunkwire::transfer {

const char* to_string(ReconcileOutcome outcome) {
    switch (outcome) {
        case ReconcileOutcome::FRESH: return "fresh";
        case ReconcileOutcome::RESUMED: return "resumed";
        case ReconcileOutcome::MISMATCH: return "mismatch";
        case ReconcileOutcome::STORE_FAILURE: return "store failure";
        default: return "unknown";
    }
}

ResumeCoordinator::ResumeCoordinator(std::shared_ptr<storage::PersistentStore> store, storage::StoreRetryPolicy policy)
    : store_(std::move(store))
    , policy_(policy) {
}

ReconcileResult ResumeCoordinator::reconcile(const storage::FileMetadata& metadata) {
    ReconcileResult result;

    storage::FileRecord record;
    auto loaded = storage::retry_store_operation(policy_, [&]() {
        return store_->get_file_record(metadata.file_id, record);
    });

    if (loaded.error == core::TransferError::NOT_FOUND) {
        result.record = storage::FileRecord::fresh(metadata);
        auto created = storage::retry_store_operation(policy_, [&]() {
            return store_->put_file_record(result.record);
        });
        if (!created) {
            result.outcome = ReconcileOutcome::STORE_FAILURE;
            result.message = created.message;
            return result;
        }

        LOG_INFO("Created transfer record for {} ({} chunks)", metadata.name, metadata.total_chunks);
        result.outcome = ReconcileOutcome::FRESH;
        return result;
    }

    if (!loaded) {
        result.outcome = ReconcileOutcome::STORE_FAILURE;
        result.message = loaded.message;
        return result;
    }

    if (!record.metadata.same_layout(metadata)) {
        result.outcome = ReconcileOutcome::MISMATCH;
        result.message = "Stored record for " + metadata.file_id + " has size " +
                         std::to_string(record.metadata.size) + "/" + std::to_string(record.metadata.chunk_size) +
                         ", offered " + std::to_string(metadata.size) + "/" + std::to_string(metadata.chunk_size);
        return result;
    }

    if (record.bitfield.size() > metadata.total_chunks) {
        result.outcome = ReconcileOutcome::MISMATCH;
        result.message = "Stored bitfield covers " + std::to_string(record.bitfield.size()) +
                         " chunks, file has " + std::to_string(metadata.total_chunks);
        return result;
    }

    if (record.bitfield.size() < metadata.total_chunks) {
        LOG_WARN("Growing stored bitfield for {} from {} to {} chunks", metadata.file_id,
                 record.bitfield.size(), metadata.total_chunks);
        record.bitfield.grow(metadata.total_chunks);
        result.repaired = true;
    }

    auto counted = record.bitfield.popcount();
    if (record.received_count != counted) {
        LOG_WARN("Stored received count {} for {} disagrees with bitfield ({}), repairing",
                 record.received_count, metadata.file_id, counted);
        record.received_count = counted;
        result.repaired = true;
    }

    record.last_accessed = std::chrono::system_clock::now();
    auto saved = storage::retry_store_operation(policy_, [&]() {
        return store_->put_file_record(record);
    });
    if (!saved) {
        result.outcome = ReconcileOutcome::STORE_FAILURE;
        result.message = saved.message;
        return result;
    }

    LOG_INFO("Resuming {} with {}/{} chunks held", metadata.name, record.received_count, metadata.total_chunks);
    result.outcome = ReconcileOutcome::RESUMED;
    result.record = std::move(record);
    return result;
}

network::BitfieldMessage ResumeCoordinator::make_bitfield(const storage::FileMetadata& metadata,
                                                          const storage::Bitfield& bitfield) {
    network::BitfieldMessage message;
    message.file_id = metadata.file_id;
    message.total_chunks = metadata.total_chunks;
    message.received_count = bitfield.count();
    message.bits = bitfield.bytes();
    return message;
}

core::Result ResumeCoordinator::read_peer_bitfield(const network::BitfieldMessage& message,
                                                   const storage::FileMetadata& metadata,
                                                   storage::Bitfield& bitfield) {
    if (message.file_id != metadata.file_id) {
        return core::Result(core::TransferError::METADATA_MISMATCH,
                            "Peer bitfield is for file " + message.file_id + ", expected " + metadata.file_id);
    }
    if (message.total_chunks != metadata.total_chunks) {
        return core::Result(core::TransferError::METADATA_MISMATCH,
                            "Peer reports " + std::to_string(message.total_chunks) + " chunks, expected " +
                            std::to_string(metadata.total_chunks));
    }

    try {
        bitfield = storage::Bitfield::from_bytes(message.bits, message.total_chunks);
    } catch (const std::invalid_argument& e) {
        return core::Result(core::TransferError::PROTOCOL_ERROR, e.what());
    }

    if (bitfield.count() != message.received_count) {
        LOG_DEBUG("Peer claims {} chunks but its bitfield holds {}", message.received_count, bitfield.count());
    }
    return {};
}

}
