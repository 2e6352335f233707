#pragma once

#include "chunkwire/core/result.hpp"
#include "chunkwire/storage/bitfield.hpp"
#include "chunkwire/storage/file_metadata.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace chunkwire::storage {

// Durable state of one transfer, keyed by metadata.file_id.
struct FileRecord {
    FileMetadata metadata;
    Bitfield bitfield;
    std::uint32_t received_count = 0;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_accessed;

    static FileRecord fresh(const FileMetadata& metadata) {
        FileRecord record;
        record.metadata = metadata;
        record.bitfield = Bitfield(metadata.total_chunks);
        record.created_at = std::chrono::system_clock::now();
        record.last_accessed = record.created_at;
        return record;
    }
};

// Byte-addressable chunk and record storage. Every call may fail transiently.
// get_chunk and get_file_record report an absent key as TransferError::NOT_FOUND.
// put_chunk is write-once per (file_id, index); a second write is a successful no-op.
class PersistentStore {
public:
    virtual ~PersistentStore() = default;

    virtual core::Result get_chunk(const std::string& file_id, std::uint32_t index,
                                   std::vector<std::uint8_t>& data) = 0;
    virtual core::Result put_chunk(const std::string& file_id, std::uint32_t index,
                                   std::span<const std::uint8_t> data) = 0;

    virtual core::Result get_file_record(const std::string& file_id, FileRecord& record) = 0;
    virtual core::Result put_file_record(const FileRecord& record) = 0;

    // Drops the record and every chunk of the file.
    virtual core::Result delete_file(const std::string& file_id) = 0;

    virtual core::Result list_file_records(std::vector<FileRecord>& records) = 0;

    // Deletes files whose last_accessed is older than cutoff.
    virtual core::Result remove_stale_records(std::chrono::system_clock::time_point cutoff,
                                              std::size_t& removed) = 0;
};

struct StoreRetryPolicy {
    int attempts = 3;
    std::chrono::milliseconds backoff{50};
};

// Runs op until it succeeds or the policy is exhausted, doubling the delay each time.
// NOT_FOUND is a definitive answer and is never retried.
template<typename Operation>
core::Result retry_store_operation(const StoreRetryPolicy& policy, Operation&& op) {
    auto delay = policy.backoff;
    core::Result result;

    for (int attempt = 1; attempt <= std::max(1, policy.attempts); ++attempt) {
        result = op();
        if (result.success() || result.error == core::TransferError::NOT_FOUND) {
            return result;
        }
        if (attempt < policy.attempts) {
            std::this_thread::sleep_for(delay);
            delay *= 2;
        }
    }

    return core::Result(core::TransferError::STORE_FAILURE,
                        "Store operation failed after " + std::to_string(policy.attempts) +
                        " attempts: " + result.message);
}

}
