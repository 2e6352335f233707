#pragma once

#include "chunkwire/storage/persistent_store.hpp"
#include <filesystem>
#include <mutex>

struct sqlite3;

namespace chunkwire::storage {

// PersistentStore on a single SQLite database with `files` and `chunks` tables.
// Pass ":memory:" for a private in-memory database.
class SqliteStore : public PersistentStore {
public:
    explicit SqliteStore(const std::filesystem::path& db_path);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    core::Result initialize();

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

    core::Result vacuum();

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    std::mutex mutex_;

    core::Result create_tables();
    core::Result exec(const char* sql);
    core::Result delete_file_locked(const std::string& file_id);
    core::Result rollback(core::Result failure);
    core::Result error(const std::string& context) const;
};

}
