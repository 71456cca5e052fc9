#pragma once

#include "coldpack/archiver.hpp"
#include "coldpack/backend.hpp"
#include "coldpack/backup_config.hpp"
#include "coldpack/metadata_store.hpp"
#include "coldpack/metrics.hpp"
#include "coldpack/transfer_orchestrator.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace coldpack {

struct JobResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
    std::string job_id;
    std::vector<ArchivePart> parts;
    size_t succeeded = 0;
    size_t failed = 0;   // transfers and unreadable source files
    size_t pending = 0;  // left for the next run
    bool cancelled = false;
};

/// One invocation of the tool: owns the manifest, the backend adapters and
/// the metrics exporter, and wires the archiver into the transfer pipeline.
class BackupJob : public ArchiveListener, public TransferListener {
public:
    explicit BackupJob(const BackupConfig& config);
    ~BackupJob() override;

    BackupJob(const BackupJob&) = delete;
    BackupJob& operator=(const BackupJob&) = delete;

    /// Open the manifest and create the configured adapters.
    /// Returns error message or empty string.
    std::string start();

    /// Scan tracked_dir, pack source_dir and upload parts and tracked files
    /// in one pipelined run. Parts left pending by an earlier run go first.
    JobResult backup();

    /// Archive only.
    JobResult pack_only();

    /// Extract the parts in parts_dir into restore_dir.
    JobResult unpack();

    /// Download the uploaded parts of job_id (latest job if empty) into
    /// staging and extract them into restore_dir.
    JobResult restore();

    std::map<SyncStatus, size_t> status_counts();

    /// Most recent job with at least one uploaded part, empty if none.
    std::string latest_job();

    /// Stop archiving and transfers at the next checkpoint. Safe from any thread.
    void cancel();

    /// Flush metrics and close the manifest.
    void stop();

    bool cancelled() const { return cancel_.cancelled(); }

    MetadataStore* store() { return store_.get(); }

    /// "zip_files/<job>/<name>"
    static std::string part_object_key(const std::string& job_id, const std::string& file_name);

    /// "tracked/<relative path>"
    static std::string tracked_object_key(const std::filesystem::path& tracked_dir,
                                          const std::filesystem::path& file);

    // ArchiveListener
    void on_part_sealed(const ArchivePart& part) override;
    void on_file_failed(const SyncItem& item) override;

    // TransferListener
    void on_progress(const ProgressEvent& event) override;
    void on_retry(const TransferUnit& unit, uint32_t attempt,
                  std::chrono::milliseconds delay, const std::string& error) override;
    void on_finished(const TransferOutcome& outcome) override;

private:
    OrchestratorConfig orchestrator_config() const;
    std::unique_ptr<TransferOrchestrator> make_orchestrator();
    void release_orchestrator();

    std::vector<TransferUnit> resumable_parts(const std::vector<SyncItem>& items) const;
    std::vector<TransferUnit> tracked_units(const std::vector<SyncItem>& items);

    BackupConfig config_;
    std::unique_ptr<SqliteMetadataStore> store_;
    std::unique_ptr<BackendAdapter> simple_;
    std::unique_ptr<BackendAdapter> chunked_;
    std::unique_ptr<MetricsExporter> metrics_;
    Archiver archiver_;

    CancelToken cancel_;

    // Current orchestrator run, for cancel() and the archiver callback
    std::mutex run_mutex_;
    TransferOrchestrator* orchestrator_ = nullptr;
    std::chrono::steady_clock::time_point pack_start_;
    size_t file_failures_ = 0;

    // Last logged progress decile per unit (verbose only)
    std::mutex progress_mutex_;
    std::map<std::string, int> progress_decile_;

    bool stopped_ = false;
};

}  // namespace coldpack
