#include "chunkwire/storage/sqlite_store.hpp"
#include "chunkwire/core/logger.hpp"
#include "chunkwire/core/utils.hpp"
#include <sqlite3.h>
#include <memory>

namespace chunkwire::storage {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return nullptr;
    }
    return Statement(stmt);
}

std::vector<std::uint8_t> column_blob(sqlite3_stmt* stmt, int column) {
    const auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, column));
    int size = sqlite3_column_bytes(stmt, column);
    if (!data || size <= 0) {
        return {};
    }
    return std::vector<std::uint8_t>(data, data + size);
}

FileRecord read_record_row(sqlite3_stmt* stmt) {
    FileRecord record;
    auto metadata_blob = column_blob(stmt, 0);
    record.metadata = FileMetadata::deserialize(metadata_blob);
    auto bitfield_chunks = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 2));
    record.bitfield = Bitfield::from_bytes(column_blob(stmt, 1), bitfield_chunks);
    record.received_count = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 3));
    record.created_at = core::utils::TimeUtils::from_unix_millis(sqlite3_column_int64(stmt, 4));
    record.last_accessed = core::utils::TimeUtils::from_unix_millis(sqlite3_column_int64(stmt, 5));
    return record;
}

constexpr const char* SELECT_RECORD_COLUMNS =
    "SELECT metadata_blob, bitfield, bitfield_chunks, received_count, created_at, last_accessed FROM files";

}

SqliteStore::SqliteStore(const std::filesystem::path& db_path)
    : db_path_(db_path), db_(nullptr) {
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

core::Result SqliteStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_path_ != ":memory:" && db_path_.has_parent_path() &&
        !core::utils::FileUtils::create_directories(db_path_.parent_path())) {
        LOG_WARN("Could not create directory {}", db_path_.parent_path().string());
    }

    if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
        auto result = error("Failed to open " + db_path_.string());
        sqlite3_close(db_);
        db_ = nullptr;
        return result;
    }

    sqlite3_busy_timeout(db_, 2000);

    auto result = exec("PRAGMA journal_mode=WAL;");
    if (!result) {
        LOG_WARN("WAL journal unavailable for {}: {}", db_path_.string(), result.message);
    }

    return create_tables();
}

core::Result SqliteStore::create_tables() {
    const char* create_files_table = R"(
        CREATE TABLE IF NOT EXISTS files (
            file_id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            size INTEGER NOT NULL,
            chunk_size INTEGER NOT NULL,
            total_chunks INTEGER NOT NULL,
            metadata_blob BLOB NOT NULL,
            bitfield BLOB,
            bitfield_chunks INTEGER NOT NULL,
            received_count INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            last_accessed INTEGER NOT NULL
        );
    )";

    const char* create_chunks_table = R"(
        CREATE TABLE IF NOT EXISTS chunks (
            file_id TEXT NOT NULL,
            chunk_index INTEGER NOT NULL,
            data BLOB NOT NULL,
            PRIMARY KEY (file_id, chunk_index)
        );
    )";

    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_files_last_accessed ON files(last_accessed);
    )";

    for (const char* sql : {create_files_table, create_chunks_table, create_indexes}) {
        auto result = exec(sql);
        if (!result) {
            return result;
        }
    }
    return core::Result();
}

core::Result SqliteStore::exec(const char* sql) {
    char* error_msg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg) != SQLITE_OK) {
        std::string message = error_msg ? error_msg : "unknown sqlite error";
        sqlite3_free(error_msg);
        return core::Result(core::TransferError::STORE_FAILURE, message);
    }
    return core::Result();
}

core::Result SqliteStore::error(const std::string& context) const {
    std::string detail = db_ ? sqlite3_errmsg(db_) : "database not open";
    return core::Result(core::TransferError::STORE_FAILURE, context + ": " + detail);
}

core::Result SqliteStore::get_chunk(const std::string& file_id, std::uint32_t index,
                                    std::vector<std::uint8_t>& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_, "SELECT data FROM chunks WHERE file_id = ? AND chunk_index = ?;");
    if (!stmt) {
        return error("Failed to prepare chunk select");
    }

    sqlite3_bind_text(stmt.get(), 1, file_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt.get(), 2, index);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return core::Result(core::TransferError::NOT_FOUND,
                            "Chunk " + std::to_string(index) + " not stored");
    }
    if (rc != SQLITE_ROW) {
        return error("Failed to read chunk " + std::to_string(index));
    }

    data = column_blob(stmt.get(), 0);
    return core::Result();
}

core::Result SqliteStore::put_chunk(const std::string& file_id, std::uint32_t index,
                                    std::span<const std::uint8_t> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_,
        "INSERT OR IGNORE INTO chunks (file_id, chunk_index, data) VALUES (?, ?, ?);");
    if (!stmt) {
        return error("Failed to prepare chunk insert");
    }

    sqlite3_bind_text(stmt.get(), 1, file_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt.get(), 2, index);
    // zeroblob keeps the column NOT NULL for an empty payload
    if (data.empty()) {
        sqlite3_bind_zeroblob(stmt.get(), 3, 0);
    } else {
        sqlite3_bind_blob(stmt.get(), 3, data.data(), static_cast<int>(data.size()), SQLITE_STATIC);
    }

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return error("Failed to write chunk " + std::to_string(index));
    }
    return core::Result();
}

core::Result SqliteStore::get_file_record(const std::string& file_id, FileRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string(SELECT_RECORD_COLUMNS) + " WHERE file_id = ?;";
    auto stmt = prepare(db_, sql.c_str());
    if (!stmt) {
        return error("Failed to prepare record select");
    }

    sqlite3_bind_text(stmt.get(), 1, file_id.c_str(), -1, SQLITE_STATIC);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return core::Result(core::TransferError::NOT_FOUND, "No record for " + file_id);
    }
    if (rc != SQLITE_ROW) {
        return error("Failed to read record " + file_id);
    }

    try {
        record = read_record_row(stmt.get());
    } catch (const std::exception& e) {
        return core::Result(core::TransferError::STORE_FAILURE,
                            "Corrupt record " + file_id + ": " + e.what());
    }
    return core::Result();
}

core::Result SqliteStore::put_file_record(const FileRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_, R"(
        INSERT OR REPLACE INTO files
        (file_id, name, size, chunk_size, total_chunks, metadata_blob, bitfield,
         bitfield_chunks, received_count, created_at, last_accessed)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    if (!stmt) {
        return error("Failed to prepare record insert");
    }

    const auto& metadata = record.metadata;
    auto serialized = metadata.serialize();
    const auto& bits = record.bitfield.bytes();

    sqlite3_bind_text(stmt.get(), 1, metadata.file_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 2, metadata.name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(metadata.size));
    sqlite3_bind_int64(stmt.get(), 4, metadata.chunk_size);
    sqlite3_bind_int64(stmt.get(), 5, metadata.total_chunks);
    sqlite3_bind_blob(stmt.get(), 6, serialized.data(), static_cast<int>(serialized.size()), SQLITE_STATIC);
    sqlite3_bind_blob(stmt.get(), 7, bits.data(), static_cast<int>(bits.size()), SQLITE_STATIC);
    sqlite3_bind_int64(stmt.get(), 8, record.bitfield.size());
    sqlite3_bind_int64(stmt.get(), 9, record.received_count);
    sqlite3_bind_int64(stmt.get(), 10, core::utils::TimeUtils::to_unix_millis(record.created_at));
    sqlite3_bind_int64(stmt.get(), 11, core::utils::TimeUtils::to_unix_millis(record.last_accessed));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return error("Failed to write record " + metadata.file_id);
    }
    return core::Result();
}

core::Result SqliteStore::delete_file(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return delete_file_locked(file_id);
}

core::Result SqliteStore::delete_file_locked(const std::string& file_id) {
    auto result = exec("BEGIN;");
    if (!result) {
        return result;
    }

    for (const char* sql : {"DELETE FROM chunks WHERE file_id = ?;",
                            "DELETE FROM files WHERE file_id = ?;"}) {
        auto stmt = prepare(db_, sql);
        if (!stmt) {
            return rollback(error("Failed to prepare delete"));
        }
        sqlite3_bind_text(stmt.get(), 1, file_id.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            return rollback(error("Failed to delete " + file_id));
        }
    }

    return exec("COMMIT;");
}

core::Result SqliteStore::rollback(core::Result failure) {
    auto result = exec("ROLLBACK;");
    if (!result) {
        LOG_WARN("Rollback failed: {}", result.message);
    }
    return failure;
}

core::Result SqliteStore::list_file_records(std::vector<FileRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    records.clear();

    std::string sql = std::string(SELECT_RECORD_COLUMNS) + " ORDER BY last_accessed DESC;";
    auto stmt = prepare(db_, sql.c_str());
    if (!stmt) {
        return error("Failed to prepare record list");
    }

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        try {
            records.push_back(read_record_row(stmt.get()));
        } catch (const std::exception& e) {
            LOG_WARN("Skipping corrupt file record: {}", e.what());
        }
    }

    if (rc != SQLITE_DONE) {
        return error("Failed to list records");
    }
    return core::Result();
}

core::Result SqliteStore::remove_stale_records(std::chrono::system_clock::time_point cutoff,
                                               std::size_t& removed) {
    std::lock_guard<std::mutex> lock(mutex_);
    removed = 0;

    std::vector<std::string> stale;
    {
        auto stmt = prepare(db_, "SELECT file_id FROM files WHERE last_accessed < ?;");
        if (!stmt) {
            return error("Failed to prepare stale select");
        }
        sqlite3_bind_int64(stmt.get(), 1, core::utils::TimeUtils::to_unix_millis(cutoff));

        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            const auto* text = sqlite3_column_text(stmt.get(), 0);
            if (text) {
                stale.emplace_back(reinterpret_cast<const char*>(text));
            }
        }
    }

    for (const auto& file_id : stale) {
        auto result = delete_file_locked(file_id);
        if (!result) {
            return result;
        }
        ++removed;
        LOG_DEBUG("Removed stale transfer record {}", file_id);
    }

    return core::Result();
}

core::Result SqliteStore::vacuum() {
    std::lock_guard<std::mutex> lock(mutex_);
    return exec("VACUUM;");
}

}
