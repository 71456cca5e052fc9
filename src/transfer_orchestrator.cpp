#include "coldpack/transfer_orchestrator.hpp"
#include "coldpack/log.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <random>

namespace coldpack {

// --- Backend selection ---

std::optional<BackendVariant> select_backend(uint64_t size, const SelectionPolicy& policy) {
    bool fits_simple = policy.simple_enabled && size <= policy.simple_ceiling;

    if (policy.force_simple && fits_simple) {
        return BackendVariant::Simple;
    }
    if (fits_simple && !policy.skip_simple) {
        return BackendVariant::Simple;
    }
    if (policy.chunked_enabled && size <= policy.chunked_ceiling) {
        return BackendVariant::Chunked;
    }
    return std::nullopt;
}

std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, uint32_t retry, double r) {
    double base = static_cast<double>(policy.initial_backoff.count()) *
                  std::pow(policy.multiplier, retry > 0 ? retry - 1 : 0);
    base = std::min(base, static_cast<double>(policy.max_backoff.count()));
    double factor = 1.0 + policy.jitter * (2.0 * r - 1.0);
    return std::chrono::milliseconds(static_cast<int64_t>(std::max(0.0, base * factor)));
}

// --- PathLockTable ---

bool PathLockTable::try_acquire(const std::string& path) {
    std::lock_guard lock(mutex_);
    return held_.insert(path).second;
}

void PathLockTable::release(const std::string& path) {
    std::lock_guard lock(mutex_);
    held_.erase(path);
}

bool PathLockTable::held(const std::string& path) const {
    std::lock_guard lock(mutex_);
    return held_.count(path) > 0;
}

size_t PathLockTable::size() const {
    std::lock_guard lock(mutex_);
    return held_.size();
}

// --- TransferOrchestrator ---

TransferOrchestrator::TransferOrchestrator(const OrchestratorConfig& config,
                                           BackendAdapter* simple,
                                           BackendAdapter* chunked,
                                           MetadataStore* store,
                                           TransferListener* listener)
    : config_(config)
    , simple_(simple)
    , chunked_(chunked)
    , store_(store)
    , listener_(listener) {
    if (config_.workers == 0) config_.workers = 1;
    // A backend that isn't there can't be selected
    if (!simple_) config_.selection.simple_enabled = false;
    if (!chunked_) config_.selection.chunked_enabled = false;
}

TransferOrchestrator::~TransferOrchestrator() = default;

bool TransferOrchestrator::schedule(TransferUnit unit) {
    {
        std::lock_guard lock(mutex_);
        for (const auto& queued : queue_) {
            if (queued.id() == unit.id() && queued.direction == unit.direction) {
                return false;
            }
        }
        queue_.push_back(std::move(unit));
    }
    cv_.notify_one();
    return true;
}

void TransferOrchestrator::add_producer() {
    std::lock_guard lock(mutex_);
    ++producers_;
}

void TransferOrchestrator::producer_done() {
    {
        std::lock_guard lock(mutex_);
        if (producers_ > 0) --producers_;
    }
    cv_.notify_all();
}

void TransferOrchestrator::cancel() {
    cancel_.cancel();
    {
        std::lock_guard lock(mutex_);
    }
    cv_.notify_all();
}

size_t TransferOrchestrator::queued() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

RunSummary TransferOrchestrator::run() {
    {
        std::lock_guard lock(results_mutex_);
        summary_ = RunSummary{};
    }

    std::vector<std::thread> workers;
    workers.reserve(config_.workers);
    for (size_t i = 0; i < config_.workers; ++i) {
        workers.emplace_back(&TransferOrchestrator::worker_loop, this);
    }
    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }

    // Whatever never started goes back to Pending
    std::deque<TransferUnit> leftover;
    {
        std::lock_guard lock(mutex_);
        leftover.swap(queue_);
    }
    for (auto& unit : leftover) {
        TransferOutcome outcome;
        outcome.unit_id = unit.id();
        outcome.path = unit.item.path;
        outcome.direction = unit.direction;
        outcome.state = SyncStatus::Pending;
        outcome.error = ErrorKind::Cancelled;
        outcome.error_message = "not started";
        if (unit.direction == Direction::Upload) {
            unit.item.status = SyncStatus::Pending;
            unit.item.updated_at = now_epoch();
            persist(unit.item);
        }
        if (listener_) listener_->on_finished(outcome);
        record(std::move(outcome));
    }

    std::lock_guard lock(results_mutex_);
    summary_.cancelled = cancel_.cancelled();
    return summary_;
}

void TransferOrchestrator::worker_loop() {
    while (true) {
        TransferUnit unit;
        {
            std::unique_lock lock(mutex_);
            while (true) {
                if (cancel_.cancelled()) return;

                auto it = std::find_if(queue_.begin(), queue_.end(), [this](const TransferUnit& u) {
                    return locks_.try_acquire(u.id());
                });
                if (it != queue_.end()) {
                    unit = std::move(*it);
                    queue_.erase(it);
                    ++in_flight_;
                    break;
                }
                if (queue_.empty() && producers_ == 0) return;

                cv_.wait(lock);
            }
        }

        TransferOutcome outcome;
        try {
            outcome = process(unit);
        } catch (const std::exception& e) {
            log_error("Transfer of %s threw: %s", unit.id().c_str(), e.what());
            outcome.unit_id = unit.id();
            outcome.path = unit.item.path;
            outcome.direction = unit.direction;
            outcome.variant = unit.variant;
            outcome.state = SyncStatus::Failed;
            outcome.error = ErrorKind::IOError;
            outcome.error_message = e.what();
            if (unit.direction == Direction::Upload) {
                unit.item.status = SyncStatus::Failed;
                unit.item.last_error = ErrorKind::IOError;
                unit.item.error_message = e.what();
                unit.item.updated_at = now_epoch();
                persist(unit.item);
            }
        }

        // State is persisted before the path is released
        {
            std::lock_guard lock(mutex_);
            locks_.release(unit.id());
            --in_flight_;
        }
        cv_.notify_all();

        if (listener_) listener_->on_finished(outcome);
        record(std::move(outcome));
    }
}

TransferOutcome TransferOrchestrator::process(TransferUnit& unit) {
    auto start = std::chrono::steady_clock::now();

    TransferOutcome outcome;
    outcome.unit_id = unit.id();
    outcome.path = unit.item.path;
    outcome.direction = unit.direction;

    auto finish = [&](SyncStatus state, ErrorKind error, const std::string& message) {
        outcome.state = state;
        outcome.error = error;
        outcome.error_message = message;
        outcome.variant = unit.variant;
        outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (unit.direction == Direction::Upload) {
            unit.item.status = state;
            unit.item.last_error = error == ErrorKind::Cancelled ? ErrorKind::None : error;
            unit.item.error_message = error == ErrorKind::Cancelled ? "" : message;
            unit.item.updated_at = now_epoch();
            if (state == SyncStatus::Uploaded) unit.item.remote = outcome.reference;
            persist(unit.item);
        } else {
            unit.item.status = state;
        }

        if (state == SyncStatus::Failed) {
            log_error("%s %s failed (%s, %s): %s", to_string(unit.direction),
                      unit.item.path.c_str(),
                      unit.variant ? to_string(*unit.variant) : "no backend",
                      to_string(error), message.c_str());
        } else if (config_.verbose && state == SyncStatus::Uploaded) {
            log_info("%s %s done via %s (%lu bytes, %u attempts)", to_string(unit.direction),
                     unit.item.path.c_str(), to_string(*unit.variant),
                     static_cast<unsigned long>(outcome.bytes), outcome.attempts);
        }
        return outcome;
    };

    // Route
    if (unit.direction == Direction::Upload) {
        unit.variant = select_backend(unit.item.size, config_.selection);
        if (!unit.variant) {
            return finish(SyncStatus::Failed, ErrorKind::SizeLimitExceeded,
                          std::to_string(unit.item.size) + " bytes exceeds every enabled backend");
        }
    } else {
        if (!unit.remote) {
            return finish(SyncStatus::Failed, ErrorKind::IOError, "download without a remote reference");
        }
        unit.variant = unit.remote->variant;
    }

    BackendAdapter* adapter = *unit.variant == BackendVariant::Simple ? simple_ : chunked_;
    if (!adapter) {
        return finish(SyncStatus::Failed, ErrorKind::IOError,
                      std::string(to_string(*unit.variant)) + " backend is not configured");
    }

    if (cancel_.cancelled()) {
        return finish(SyncStatus::Pending, ErrorKind::Cancelled, "cancelled before start");
    }

    if (unit.direction == Direction::Upload) {
        unit.item.status = SyncStatus::Uploading;
        unit.item.updated_at = now_epoch();
        persist(unit.item);
    }

    // Progress never goes backwards, even across retries
    uint64_t total = unit.direction == Direction::Upload ? unit.item.size : unit.remote->size;
    uint64_t reported = 0;
    bool any_reported = false;
    ProgressFn progress = [&](uint64_t done, uint64_t) {
        done = std::min(done, total);
        if (any_reported && done <= reported) return;
        reported = done;
        any_reported = true;
        unit.bytes_done = done;
        if (listener_) {
            ProgressEvent ev;
            ev.unit_id = unit.id();
            ev.direction = unit.direction;
            ev.bytes_done = done;
            ev.bytes_total = total;
            ev.timestamp = std::chrono::steady_clock::now();
            listener_->on_progress(ev);
        }
    };

    thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_real_distribution<double> unit_interval(0.0, 1.0);

    while (true) {
        ++outcome.attempts;
        AttemptResult r = unit.direction == Direction::Upload
            ? attempt_upload(*adapter, unit, progress)
            : attempt_download(*adapter, unit, progress);

        if (r.error == ErrorKind::None) {
            outcome.reference = r.reference;
            outcome.bytes = r.bytes;
            unit.bytes_done = total;
            if (listener_) {
                ProgressEvent ev;
                ev.unit_id = unit.id();
                ev.direction = unit.direction;
                ev.bytes_done = total;
                ev.bytes_total = total;
                ev.timestamp = std::chrono::steady_clock::now();
                ev.done = true;
                listener_->on_progress(ev);
            }
            return finish(SyncStatus::Uploaded, ErrorKind::None, "");
        }

        if (r.error == ErrorKind::Cancelled) {
            return finish(SyncStatus::Pending, ErrorKind::Cancelled, r.message);
        }
        if (!is_retryable(r.error) || outcome.attempts > config_.retry.max_retries) {
            return finish(SyncStatus::Failed, r.error, r.message);
        }

        auto delay = backoff_delay(config_.retry, outcome.attempts, unit_interval(rng));
        if (listener_) listener_->on_retry(unit, outcome.attempts, delay, r.message);
        if (config_.verbose) {
            log_warn("Retrying %s in %ld ms (attempt %u): %s", unit.id().c_str(),
                     static_cast<long>(delay.count()), outcome.attempts, r.message.c_str());
        }
        if (cancel_.wait_for(delay)) {
            return finish(SyncStatus::Pending, ErrorKind::Cancelled, "cancelled during backoff");
        }
    }
}

TransferOrchestrator::AttemptResult TransferOrchestrator::attempt_upload(
    BackendAdapter& adapter, const TransferUnit& unit, const ProgressFn& progress) {
    AttemptResult r;

    PutRequest req;
    req.source = unit.item.path;
    req.key = unit.object_key;
    req.size = unit.item.size;

    auto result = adapter.put(req, progress, &cancel_);
    if (!result.success) {
        r.error = result.error == ErrorKind::None ? ErrorKind::IOError : result.error;
        r.message = result.error_message;
        return r;
    }
    r.reference = result.reference;
    r.bytes = result.reference.size;
    return r;
}

TransferOrchestrator::AttemptResult TransferOrchestrator::attempt_download(
    BackendAdapter& adapter, const TransferUnit& unit, const ProgressFn& progress) {
    AttemptResult r;
    const auto& ref = *unit.remote;

    std::filesystem::path dest(unit.item.path);
    std::error_code ec;
    if (dest.has_parent_path()) {
        std::filesystem::create_directories(dest.parent_path(), ec);
        if (ec) {
            r.error = ec == std::errc::no_space_on_device ? ErrorKind::DiskFull : ErrorKind::IOError;
            r.message = "cannot create " + dest.parent_path().string() + ": " + ec.message();
            return r;
        }
    }

    // Temporary file beside the destination so the rename stays on one filesystem
    auto tmp = dest.parent_path() / ("." + dest.filename().string() + ".coldpack-download");
    auto result = adapter.get(ref, tmp, progress, &cancel_);
    if (!result.success) {
        std::filesystem::remove(tmp, ec);
        r.error = result.error == ErrorKind::None ? ErrorKind::IOError : result.error;
        r.message = result.error_message;
        return r;
    }

    std::error_code size_ec;
    uint64_t got = std::filesystem::file_size(tmp, size_ec);
    if (size_ec) {
        r.error = ErrorKind::IntegrityError;
        r.message = "cannot stat downloaded " + ref.object_id + " at " + tmp.string() + ": " +
                    size_ec.message();
        std::filesystem::remove(tmp, ec);
        return r;
    }
    if (got != ref.size) {
        std::filesystem::remove(tmp, ec);
        r.error = ErrorKind::IntegrityError;
        r.message = "downloaded " + std::to_string(got) + " bytes of " + ref.object_id +
                    ", expected " + std::to_string(ref.size);
        return r;
    }

    std::filesystem::rename(tmp, dest, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        r.error = ErrorKind::IOError;
        r.message = "cannot move download into " + dest.string() + ": " + ec.message();
        return r;
    }

    r.reference = ref;
    r.bytes = got;
    return r;
}

void TransferOrchestrator::persist(const SyncItem& item) {
    if (!store_) return;
    if (!store_->save({item})) {
        log_error("Failed to persist state of %s (%s)", item.path.c_str(), to_string(item.status));
    }
}

void TransferOrchestrator::record(TransferOutcome outcome) {
    std::lock_guard lock(results_mutex_);
    switch (outcome.state) {
        case SyncStatus::Uploaded: ++summary_.succeeded; break;
        case SyncStatus::Failed: ++summary_.failed; break;
        default: ++summary_.pending; break;
    }
    summary_.outcomes.push_back(std::move(outcome));
}

}  // namespace coldpack
