#pragma once

#include "coldpack/types.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace coldpack {

/// Tracked items and their last known state, keyed by path.
/// Implementations must tolerate save() from several workers at once.
class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    /// Every item, ordered by path.
    virtual std::vector<SyncItem> load() = 0;

    /// Upsert by path. Returns false if the write failed.
    virtual bool save(const std::vector<SyncItem>& items) = 0;
};

class MemoryMetadataStore : public MetadataStore {
public:
    std::vector<SyncItem> load() override;
    bool save(const std::vector<SyncItem>& items) override;

    size_t size() const;
    size_t save_calls() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, SyncItem> items_;
    size_t save_calls_ = 0;
};

/// SQLite manifest (WAL mode). open() resets items interrupted mid-flight
/// (uploading, archiving, queued) back to pending.
class SqliteMetadataStore : public MetadataStore {
public:
    explicit SqliteMetadataStore(const std::filesystem::path& db_path);
    ~SqliteMetadataStore() override;

    SqliteMetadataStore(const SqliteMetadataStore&) = delete;
    SqliteMetadataStore& operator=(const SqliteMetadataStore&) = delete;

    /// Returns error message or empty string.
    std::string open();

    std::vector<SyncItem> load() override;
    bool save(const std::vector<SyncItem>& items) override;

    std::map<SyncStatus, size_t> counts_by_status();

    /// Items reset to pending by the last open()
    size_t recovered() const { return recovered_; }

    const std::filesystem::path& path() const { return db_path_; }

private:
    void init_manifest();
    void crash_recovery();

    std::filesystem::path db_path_;
    std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_upsert_ = nullptr;
    sqlite3_stmt* stmt_load_ = nullptr;
    sqlite3_stmt* stmt_counts_ = nullptr;
    size_t recovered_ = 0;
};

}  // namespace coldpack
