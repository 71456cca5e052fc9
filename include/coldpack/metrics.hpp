#pragma once

#include "coldpack/types.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace coldpack {

class SqliteMetadataStore;
class TransferOrchestrator;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports coldpack metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file (default 15s).
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Sources for gauge snapshots. Either may be null; the orchestrator is
    /// swapped in and out as runs start and finish.
    void set_store(SqliteMetadataStore* store);
    void set_orchestrator(TransferOrchestrator* orchestrator);

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Serialize now. Returns false if the file could not be replaced.
    bool write_file();

    // --- Counter accessors ---
    prometheus::Counter& transfers(Direction direction, bool success);
    prometheus::Counter& transfer_bytes(Direction direction);
    prometheus::Counter& transfer_retries() { return *transfer_retries_; }
    prometheus::Counter& archive_parts() { return *archive_parts_; }
    prometheus::Counter& archive_bytes() { return *archive_bytes_; }
    prometheus::Counter& archive_file_errors() { return *archive_file_errors_; }

    // --- Histogram accessors ---
    prometheus::Histogram& transfer_duration(Direction direction);
    prometheus::Histogram& part_duration() { return *part_duration_; }

    const std::filesystem::path& path() const { return prom_file_path_; }

private:
    void writer_loop();
    void update_gauges();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // Gauge sources (not owned)
    std::mutex sources_mutex_;
    SqliteMetadataStore* store_ = nullptr;
    TransferOrchestrator* orchestrator_ = nullptr;

    // --- Counters ---
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* downloads_success_;
    prometheus::Counter* downloads_failure_;
    prometheus::Counter* upload_bytes_;
    prometheus::Counter* download_bytes_;
    prometheus::Counter* transfer_retries_;
    prometheus::Counter* archive_parts_;
    prometheus::Counter* archive_bytes_;
    prometheus::Counter* archive_file_errors_;

    // --- Gauges ---
    prometheus::Family<prometheus::Gauge>* items_family_;
    std::map<SyncStatus, prometheus::Gauge*> items_by_status_;
    prometheus::Gauge* queue_pending_;
    prometheus::Gauge* in_flight_;

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;
    prometheus::Histogram* download_duration_;
    prometheus::Histogram* part_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace coldpack
