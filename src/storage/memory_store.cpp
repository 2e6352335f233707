#include "chunkwire/storage/memory_store.hpp"

namespace chunkwire::storage {

core::Result MemoryStore::get_chunk(const std::string& file_id, std::uint32_t index,
                                    std::vector<std::uint8_t>& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chunks_.find({file_id, index});
    if (it == chunks_.end()) {
        return core::Result(core::TransferError::NOT_FOUND,
                            "Chunk " + std::to_string(index) + " not stored");
    }
    data = it->second;
    return core::Result();
}

core::Result MemoryStore::put_chunk(const std::string& file_id, std::uint32_t index,
                                    std::span<const std::uint8_t> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_.try_emplace({file_id, index}, data.begin(), data.end());
    return core::Result();
}

core::Result MemoryStore::get_file_record(const std::string& file_id, FileRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(file_id);
    if (it == records_.end()) {
        return core::Result(core::TransferError::NOT_FOUND, "No record for " + file_id);
    }
    record = it->second;
    return core::Result();
}

core::Result MemoryStore::put_file_record(const FileRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.metadata.file_id] = record;
    return core::Result();
}

core::Result MemoryStore::delete_file(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    erase_file_locked(file_id);
    return core::Result();
}

core::Result MemoryStore::list_file_records(std::vector<FileRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    records.clear();
    for (const auto& [id, record] : records_) {
        records.push_back(record);
    }
    return core::Result();
}

core::Result MemoryStore::remove_stale_records(std::chrono::system_clock::time_point cutoff,
                                               std::size_t& removed) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> stale;
    for (const auto& [id, record] : records_) {
        if (record.last_accessed < cutoff) {
            stale.push_back(id);
        }
    }
    for (const auto& id : stale) {
        erase_file_locked(id);
    }
    removed = stale.size();
    return core::Result();
}

std::size_t MemoryStore::chunk_count(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto first = chunks_.lower_bound({file_id, 0});
    std::size_t count = 0;
    for (auto it = first; it != chunks_.end() && it->first.first == file_id; ++it) {
        ++count;
    }
    return count;
}

void MemoryStore::erase_file_locked(const std::string& file_id) {
    records_.erase(file_id);
    auto it = chunks_.lower_bound({file_id, 0});
    while (it != chunks_.end() && it->first.first == file_id) {
        it = chunks_.erase(it);
    }
}

}
