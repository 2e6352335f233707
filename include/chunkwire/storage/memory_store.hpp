#pragma once

#include "chunkwire/storage/persistent_store.hpp"
#include <map>
#include <mutex>
#include <utility>

namespace chunkwire::storage {

// In-process store for ephemeral sessions. Contents die with the object.
class MemoryStore : public PersistentStore {
public:
    core::Result get_chunk(const std::string& file_id, std::uint32_t index,
                           std::vector<std::uint8_t>& data) override;
    core::Result put_chunk(const std::string& file_id, std::uint32_t index,
                           std::span<const std::uint8_t> data) override;

    core::Result get_file_record(const std::string& file_id, FileRecord& record) override;
    core::Result put_file_record(const FileRecord& record) override;

    core::Result delete_file(const std::string& file_id) override;
    core::Result list_file_records(std::vector<FileRecord>& records) override;
    core::Result remove_stale_records(std::chrono::system_clock::time_point cutoff,
                                      std::size_t& removed) override;

    std::size_t chunk_count(const std::string& file_id) const;

private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::uint32_t>, std::vector<std::uint8_t>> chunks_;
    std::map<std::string, FileRecord> records_;

    void erase_file_locked(const std::string& file_id);
};

}
