#include "coldpack/metadata_store.hpp"
#include "coldpack/log.hpp"

#include <sqlite3.h>

#include <chrono>
#include <stdexcept>
#include <thread>

namespace coldpack {

namespace {

const char* MANIFEST_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS sync_items (
    path TEXT PRIMARY KEY,
    size INTEGER NOT NULL,
    mtime INTEGER NOT NULL,
    status TEXT NOT NULL DEFAULT 'pending',
    sig TEXT,
    sha256 TEXT,
    job_id TEXT,
    remote_variant TEXT,
    remote_type TEXT,
    remote_object TEXT,
    remote_etag TEXT,
    remote_size INTEGER,
    last_error TEXT,
    error_message TEXT,
    updated_at INTEGER NOT NULL
) WITHOUT ROWID;

CREATE INDEX IF NOT EXISTS idx_status ON sync_items(status);

CREATE INDEX IF NOT EXISTS idx_job
    ON sync_items(job_id) WHERE job_id IS NOT NULL;
)";

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

void bind_text_or_null(sqlite3_stmt* stmt, int idx, const std::string& value) {
    if (value.empty()) {
        sqlite3_bind_null(stmt, idx);
    } else {
        sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    }
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

}  // namespace

// --- MemoryMetadataStore ---

std::vector<SyncItem> MemoryMetadataStore::load() {
    std::lock_guard lock(mutex_);
    std::vector<SyncItem> out;
    out.reserve(items_.size());
    for (const auto& [path, item] : items_) out.push_back(item);
    return out;
}

bool MemoryMetadataStore::save(const std::vector<SyncItem>& items) {
    std::lock_guard lock(mutex_);
    ++save_calls_;
    for (const auto& item : items) items_[item.path] = item;
    return true;
}

size_t MemoryMetadataStore::size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
}

size_t MemoryMetadataStore::save_calls() const {
    std::lock_guard lock(mutex_);
    return save_calls_;
}

// --- SqliteMetadataStore ---

SqliteMetadataStore::SqliteMetadataStore(const std::filesystem::path& db_path)
    : db_path_(db_path) {}

SqliteMetadataStore::~SqliteMetadataStore() {
    if (stmt_upsert_) sqlite3_finalize(stmt_upsert_);
    if (stmt_load_) sqlite3_finalize(stmt_load_);
    if (stmt_counts_) sqlite3_finalize(stmt_counts_);

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
    }
}

std::string SqliteMetadataStore::open() {
    std::error_code ec;
    if (db_path_.has_parent_path()) {
        std::filesystem::create_directories(db_path_.parent_path(), ec);
        if (ec) return "Failed to create state_dir: " + ec.message();
    }

    try {
        init_manifest();
    } catch (const std::exception& e) {
        return std::string("Failed to init manifest: ") + e.what();
    }

    crash_recovery();
    return {};
}

void SqliteMetadataStore::init_manifest() {
    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Cannot open manifest: " + std::string(sqlite3_errmsg(db_)));
    }

    // WAL mode for concurrent readers
    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db_, MANIFEST_SCHEMA)) {
        throw std::runtime_error("Cannot create manifest schema");
    }

    rc = sqlite3_prepare_v2(db_,
        "INSERT OR REPLACE INTO sync_items (path, size, mtime, status, sig, sha256, job_id, "
        "remote_variant, remote_type, remote_object, remote_etag, remote_size, "
        "last_error, error_message, updated_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15)",
        -1, &stmt_upsert_, nullptr);
    if (rc == SQLITE_OK) {
        rc = sqlite3_prepare_v2(db_,
            "SELECT path, size, mtime, status, sig, sha256, job_id, remote_variant, remote_type, "
            "remote_object, remote_etag, remote_size, last_error, error_message, updated_at "
            "FROM sync_items ORDER BY path ASC",
            -1, &stmt_load_, nullptr);
    }
    if (rc == SQLITE_OK) {
        rc = sqlite3_prepare_v2(db_,
            "SELECT status, COUNT(*) FROM sync_items GROUP BY status",
            -1, &stmt_counts_, nullptr);
    }
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Cannot prepare manifest statements: " +
                                 std::string(sqlite3_errmsg(db_)));
    }
}

void SqliteMetadataStore::crash_recovery() {
    // Anything caught mid-flight may or may not have reached the backend.
    // Object keys are deterministic, so re-uploading overwrites in place.
    sql_exec(db_,
        "UPDATE sync_items SET status = 'pending' "
        "WHERE status IN ('uploading', 'archiving', 'queued')");
    recovered_ = static_cast<size_t>(sqlite3_changes(db_));

    if (recovered_ > 0) {
        log_info("Crash recovery: reset %zu interrupted items to pending", recovered_);
    }
}

std::vector<SyncItem> SqliteMetadataStore::load() {
    std::lock_guard lock(mutex_);
    std::vector<SyncItem> out;
    if (!stmt_load_) return out;

    sqlite3_reset(stmt_load_);
    int rc;
    while ((rc = sql_step_retry(stmt_load_)) == SQLITE_ROW) {
        SyncItem item;
        item.path = column_text(stmt_load_, 0);
        item.size = static_cast<uint64_t>(sqlite3_column_int64(stmt_load_, 1));
        item.mtime = sqlite3_column_int64(stmt_load_, 2);
        item.status = parse_sync_status(column_text(stmt_load_, 3)).value_or(SyncStatus::Pending);
        item.sig = column_text(stmt_load_, 4);
        item.sha256 = column_text(stmt_load_, 5);
        item.job_id = column_text(stmt_load_, 6);

        auto variant = parse_backend_variant(column_text(stmt_load_, 7));
        auto object_id = column_text(stmt_load_, 9);
        if (variant && !object_id.empty()) {
            RemoteReference ref;
            ref.variant = *variant;
            ref.backend_type = column_text(stmt_load_, 8);
            ref.object_id = object_id;
            ref.etag = column_text(stmt_load_, 10);
            ref.size = static_cast<uint64_t>(sqlite3_column_int64(stmt_load_, 11));
            item.remote = ref;
        }

        item.last_error = parse_error_kind(column_text(stmt_load_, 12)).value_or(ErrorKind::None);
        item.error_message = column_text(stmt_load_, 13);
        item.updated_at = sqlite3_column_int64(stmt_load_, 14);
        out.push_back(std::move(item));
    }
    if (rc != SQLITE_DONE) {
        log_error("Manifest load failed: %s", sqlite3_errmsg(db_));
    }
    sqlite3_reset(stmt_load_);
    return out;
}

bool SqliteMetadataStore::save(const std::vector<SyncItem>& items) {
    std::lock_guard lock(mutex_);
    if (!stmt_upsert_) return false;
    if (items.empty()) return true;

    if (!sql_exec(db_, "BEGIN IMMEDIATE")) return false;

    bool ok = true;
    for (const auto& item : items) {
        sqlite3_reset(stmt_upsert_);
        sqlite3_bind_text(stmt_upsert_, 1, item.path.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_upsert_, 2, static_cast<int64_t>(item.size));
        sqlite3_bind_int64(stmt_upsert_, 3, item.mtime);
        sqlite3_bind_text(stmt_upsert_, 4, to_string(item.status), -1, SQLITE_STATIC);
        bind_text_or_null(stmt_upsert_, 5, item.sig);
        bind_text_or_null(stmt_upsert_, 6, item.sha256);
        bind_text_or_null(stmt_upsert_, 7, item.job_id);
        if (item.remote) {
            sqlite3_bind_text(stmt_upsert_, 8, to_string(item.remote->variant), -1, SQLITE_STATIC);
            bind_text_or_null(stmt_upsert_, 9, item.remote->backend_type);
            bind_text_or_null(stmt_upsert_, 10, item.remote->object_id);
            bind_text_or_null(stmt_upsert_, 11, item.remote->etag);
            sqlite3_bind_int64(stmt_upsert_, 12, static_cast<int64_t>(item.remote->size));
        } else {
            for (int i = 8; i <= 12; ++i) sqlite3_bind_null(stmt_upsert_, i);
        }
        if (item.last_error != ErrorKind::None) {
            sqlite3_bind_text(stmt_upsert_, 13, to_string(item.last_error), -1, SQLITE_STATIC);
        } else {
            sqlite3_bind_null(stmt_upsert_, 13);
        }
        bind_text_or_null(stmt_upsert_, 14, item.error_message);
        sqlite3_bind_int64(stmt_upsert_, 15, item.updated_at ? item.updated_at : now_epoch());

        if (sql_step_retry(stmt_upsert_) != SQLITE_DONE) {
            log_error("Manifest upsert failed for %s: %s", item.path.c_str(), sqlite3_errmsg(db_));
            ok = false;
            break;
        }
    }
    sqlite3_reset(stmt_upsert_);

    if (!ok) {
        sql_exec(db_, "ROLLBACK");
        return false;
    }
    return sql_exec(db_, "COMMIT");
}

std::map<SyncStatus, size_t> SqliteMetadataStore::counts_by_status() {
    std::lock_guard lock(mutex_);
    std::map<SyncStatus, size_t> counts;
    if (!stmt_counts_) return counts;

    sqlite3_reset(stmt_counts_);
    while (sql_step_retry(stmt_counts_) == SQLITE_ROW) {
        auto status = parse_sync_status(column_text(stmt_counts_, 0));
        if (status) counts[*status] = static_cast<size_t>(sqlite3_column_int64(stmt_counts_, 1));
    }
    sqlite3_reset(stmt_counts_);
    return counts;
}

}  // namespace coldpack
