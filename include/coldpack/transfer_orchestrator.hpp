#pragma once

#include "coldpack/backend.hpp"
#include "coldpack/metadata_store.hpp"
#include "coldpack/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace coldpack {

struct SelectionPolicy {
    bool simple_enabled = true;
    bool chunked_enabled = true;
    bool force_simple = false;
    bool skip_simple = false;  // force-chunked override
    uint64_t simple_ceiling = SIMPLE_MAX_OBJECT_BYTES;
    uint64_t chunked_ceiling = CHUNKED_MAX_OBJECT_BYTES;
};

/// Pick the variant for an upload of `size` bytes, or nullopt if no enabled
/// backend can take it (the unit then fails with SizeLimitExceeded).
std::optional<BackendVariant> select_backend(uint64_t size, const SelectionPolicy& policy);

struct RetryPolicy {
    uint32_t max_retries = 3;
    std::chrono::milliseconds initial_backoff{500};
    double multiplier = 2.0;
    std::chrono::milliseconds max_backoff{30000};
    double jitter = 0.2;  // +/- fraction of the delay
};

/// Delay before retry number `retry` (1-based). `r` in [0, 1) drives jitter.
std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, uint32_t retry, double r);

struct OrchestratorConfig {
    size_t workers = 3;
    SelectionPolicy selection;
    RetryPolicy retry;
    bool verbose = false;
};

struct TransferOutcome {
    std::string unit_id;
    std::string path;
    Direction direction = Direction::Upload;
    std::optional<BackendVariant> variant;
    SyncStatus state = SyncStatus::Pending;  // Uploaded, Failed or Pending
    ErrorKind error = ErrorKind::None;
    std::string error_message;
    uint32_t attempts = 0;
    std::optional<RemoteReference> reference;
    uint64_t bytes = 0;
    std::chrono::milliseconds elapsed{0};
};

/// Receives events from worker threads; implementations must be thread-safe.
class TransferListener {
public:
    virtual ~TransferListener() = default;
    virtual void on_progress(const ProgressEvent& event) { (void)event; }
    virtual void on_retry(const TransferUnit& unit, uint32_t attempt,
                          std::chrono::milliseconds delay, const std::string& error) {
        (void)unit; (void)attempt; (void)delay; (void)error;
    }
    virtual void on_finished(const TransferOutcome& outcome) { (void)outcome; }
};

/// Paths with a transfer in flight. At most one holder per path.
class PathLockTable {
public:
    bool try_acquire(const std::string& path);
    void release(const std::string& path);
    bool held(const std::string& path) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::set<std::string> held_;
};

struct RunSummary {
    size_t succeeded = 0;
    size_t failed = 0;
    size_t pending = 0;
    bool cancelled = false;
    std::vector<TransferOutcome> outcomes;
};

/// Bounded worker pool draining a producer-consumer queue of TransferUnits.
///
/// Producers (the archiver sink, the tracked-file scan) call schedule() while
/// run() is active; run() returns once the queue is empty and every producer
/// registered with add_producer() has called producer_done(), or once
/// cancel() has been called. A worker only takes a unit whose path is not
/// already in flight.
class TransferOrchestrator {
public:
    /// Adapters, store and listener are borrowed; any of them may be null
    /// except that a unit routed to a null adapter fails.
    TransferOrchestrator(const OrchestratorConfig& config,
                         BackendAdapter* simple,
                         BackendAdapter* chunked,
                         MetadataStore* store,
                         TransferListener* listener);
    ~TransferOrchestrator();

    TransferOrchestrator(const TransferOrchestrator&) = delete;
    TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;

    /// Enqueue and return immediately. Returns false if a unit for the same
    /// path and direction is already waiting in the queue.
    bool schedule(TransferUnit unit);

    void add_producer();
    void producer_done();

    /// Drain the queue. Blocks until done or cancelled.
    RunSummary run();

    /// Stop taking units and let in-flight transfers reach a checkpoint.
    void cancel();

    const CancelToken& cancel_token() const { return cancel_; }

    size_t queued() const;
    size_t in_flight() const { return in_flight_.load(); }

private:
    void worker_loop();
    TransferOutcome process(TransferUnit& unit);

    struct AttemptResult {
        ErrorKind error = ErrorKind::None;
        std::string message;
        std::optional<RemoteReference> reference;
        uint64_t bytes = 0;
    };
    AttemptResult attempt_upload(BackendAdapter& adapter, const TransferUnit& unit,
                                 const ProgressFn& progress);
    AttemptResult attempt_download(BackendAdapter& adapter, const TransferUnit& unit,
                                   const ProgressFn& progress);

    void persist(const SyncItem& item);
    void record(TransferOutcome outcome);

    OrchestratorConfig config_;
    BackendAdapter* simple_;
    BackendAdapter* chunked_;
    MetadataStore* store_;
    TransferListener* listener_;

    CancelToken cancel_;
    PathLockTable locks_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TransferUnit> queue_;
    size_t producers_ = 0;
    std::atomic<size_t> in_flight_{0};

    std::mutex results_mutex_;
    RunSummary summary_;
};

}  // namespace coldpack
