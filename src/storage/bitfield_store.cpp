#include "chunkwire/storage/bitfield_store.hpp"
#include "chunkwire/core/logger.hpp"

namespace chunkwire::storage {

BitfieldStore::BitfieldStore(std::shared_ptr<PersistentStore> store, FileRecord record,
                             StoreRetryPolicy policy)
    : store_(std::move(store))
    , record_(std::move(record))
    , policy_(policy) {
    record_.received_count = record_.bitfield.count();
}

bool BitfieldStore::has(std::uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.bitfield.has(index);
}

core::Result BitfieldStore::set(std::uint32_t index, bool& newly_set) {
    std::lock_guard<std::mutex> lock(mutex_);
    newly_set = false;

    if (record_.bitfield.has(index)) {
        return core::Result();
    }

    FileRecord updated = record_;
    updated.bitfield.set(index);
    updated.received_count = updated.bitfield.count();

    auto result = persist(updated);
    if (!result) {
        LOG_ERROR("Failed to persist bitfield for {} after chunk {}: {}",
                  record_.metadata.file_id, index, result.message);
        return result;
    }

    record_ = std::move(updated);
    newly_set = true;
    return core::Result();
}

std::uint32_t BitfieldStore::received_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.received_count;
}

std::uint32_t BitfieldStore::total_chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.bitfield.size();
}

bool BitfieldStore::complete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.bitfield.complete();
}

std::vector<Range> BitfieldStore::missing_ranges(std::uint32_t max_range_size) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.bitfield.missing_ranges(max_range_size);
}

Bitfield BitfieldStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.bitfield;
}

FileRecord BitfieldStore::record() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_;
}

core::Result BitfieldStore::grow(std::uint32_t new_total_chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (new_total_chunks == record_.bitfield.size()) {
        return core::Result();
    }
    if (new_total_chunks < record_.bitfield.size()) {
        return core::Result(core::TransferError::INVALID_ARGUMENT, "Bitfield cannot shrink");
    }

    FileRecord updated = record_;
    updated.bitfield.grow(new_total_chunks);

    auto result = persist(updated);
    if (!result) {
        return result;
    }

    LOG_DEBUG("Bitfield for {} grown from {} to {} chunks",
              record_.metadata.file_id, record_.bitfield.size(), new_total_chunks);
    record_ = std::move(updated);
    return core::Result();
}

core::Result BitfieldStore::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    FileRecord updated = record_;
    auto result = persist(updated);
    if (result) {
        record_ = std::move(updated);
    }
    return result;
}

core::Result BitfieldStore::persist(FileRecord& record) {
    record.last_accessed = std::chrono::system_clock::now();
    return retry_store_operation(policy_, [&] { return store_->put_file_record(record); });
}

}
