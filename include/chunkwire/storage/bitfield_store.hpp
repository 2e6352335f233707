#pragma once

#include "chunkwire/storage/persistent_store.hpp"
#include <memory>
#include <mutex>

namespace chunkwire::storage {

// Per-file presence bitmap backed by a PersistentStore.
// Every successful set() is written through to the store before it becomes visible.
class BitfieldStore {
public:
    BitfieldStore(std::shared_ptr<PersistentStore> store, FileRecord record,
                  StoreRetryPolicy policy = {});

    const std::string& file_id() const { return record_.metadata.file_id; }

    bool has(std::uint32_t index) const;

    // newly_set is false when the bit was already held; nothing is written then.
    // On STORE_FAILURE the bit stays clear.
    core::Result set(std::uint32_t index, bool& newly_set);

    std::uint32_t received_count() const;
    std::uint32_t total_chunks() const;
    bool complete() const;

    std::vector<Range> missing_ranges(std::uint32_t max_range_size) const;

    Bitfield snapshot() const;
    FileRecord record() const;

    core::Result grow(std::uint32_t new_total_chunks);

    // Rewrites the record with a fresh last_accessed stamp.
    core::Result touch();

private:
    mutable std::mutex mutex_;
    std::shared_ptr<PersistentStore> store_;
    FileRecord record_;
    StoreRetryPolicy policy_;

    core::Result persist(FileRecord& record);
};

}
