#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace coldpack {

/// Lifecycle of a tracked item. Persisted by name in the manifest.
enum class SyncStatus {
    Pending,
    Archiving,
    Queued,
    Uploading,
    Uploaded,
    Failed,
};

enum class Direction {
    Upload,
    Download,
};

/// The two transport variants. Simple is single-shot with a small ceiling,
/// Chunked reassembles fixed-size chunks remotely.
enum class BackendVariant {
    Simple,
    Chunked,
};

enum class ErrorKind {
    None,
    IOError,
    SizeLimitExceeded,
    TransientNetworkError,
    AuthenticationError,
    PermissionDenied,
    IntegrityError,
    DiskFull,
    Cancelled,
};

const char* to_string(SyncStatus status);
const char* to_string(Direction direction);
const char* to_string(BackendVariant variant);
const char* to_string(ErrorKind kind);

std::optional<SyncStatus> parse_sync_status(const std::string& s);
std::optional<BackendVariant> parse_backend_variant(const std::string& s);
std::optional<ErrorKind> parse_error_kind(const std::string& s);

/// Only transient network failures and integrity mismatches are retried.
bool is_retryable(ErrorKind kind);

/// Where an object lives once an adapter has accepted it.
struct RemoteReference {
    BackendVariant variant = BackendVariant::Simple;
    std::string backend_type;  // "s3", "local"
    std::string object_id;     // Key relative to the backend's prefix
    std::string etag;
    uint64_t size = 0;
};

/// A file (or sealed archive part) the tool tracks, keyed by path.
struct SyncItem {
    std::string path;
    uint64_t size = 0;
    int64_t mtime = 0;  // seconds since epoch
    SyncStatus status = SyncStatus::Pending;
    std::optional<RemoteReference> remote;

    std::string sig;     // "size:mtime[:sha256]"
    std::string sha256;
    std::string job_id;  // Set for archive parts
    ErrorKind last_error = ErrorKind::None;
    std::string error_message;
    int64_t updated_at = 0;
};

/// A sealed zip container produced by the Archiver. Immutable once sealed.
struct ArchivePart {
    uint32_t index = 0;  // 1-based
    uint64_t size = 0;
    std::vector<std::string> entries;
    std::string job_id;
    std::filesystem::path path;
    bool oversized = false;  // A single file larger than the ceiling
};

/// One unit of work for the Transfer Orchestrator.
///
/// For uploads, `item` describes the local source and `object_key` the
/// deterministic remote key. For downloads, `remote` names the object and
/// `item.path` the local destination.
struct TransferUnit {
    SyncItem item;
    Direction direction = Direction::Upload;
    std::string object_key;
    std::optional<RemoteReference> remote;
    std::optional<uint32_t> part_index;

    // Filled in by the orchestrator
    std::optional<BackendVariant> variant;
    uint64_t bytes_done = 0;

    const std::string& id() const { return item.path; }
};

struct ProgressEvent {
    std::string unit_id;
    Direction direction = Direction::Upload;
    uint64_t bytes_done = 0;
    uint64_t bytes_total = 0;
    std::chrono::steady_clock::time_point timestamp;
    bool done = false;
};

/// Process-wide cancellation flag that sleeping workers can wait on.
class CancelToken {
public:
    CancelToken() = default;
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() {
        {
            std::lock_guard lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    /// Sleep for up to `d`. Returns true if cancelled before or during the wait.
    template <class Rep, class Period>
    bool wait_for(std::chrono::duration<Rep, Period> d) const {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, d, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

int64_t now_epoch();

/// Seconds since epoch for a filesystem timestamp.
int64_t to_epoch(std::filesystem::file_time_type t);

}  // namespace coldpack
