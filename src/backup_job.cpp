#include "coldpack/backup_job.hpp"
#include "coldpack/log.hpp"
#include "coldpack/scanner.hpp"

#include <algorithm>
#include <thread>

namespace coldpack {

namespace {

ArchiverConfig make_archiver_config(const BackupConfig& config) {
    ArchiverConfig ac;
    ac.staging_dir = config.staging_dir;
    ac.ceiling = config.archive_ceiling;
    ac.base_name = config.base_name;
    ac.workers = config.archive_workers;
    ac.verbose = config.verbose;
    return ac;
}

AdapterSettings make_settings(const BackupConfig& config, uint64_t ceiling) {
    AdapterSettings s;
    s.max_object_bytes = ceiling;
    s.chunk_size = config.chunk_size;
    s.connect_timeout_secs = config.connect_timeout_secs;
    s.request_timeout_secs = config.request_timeout_secs;
    return s;
}

void merge(RunSummary& into, RunSummary&& from) {
    into.succeeded += from.succeeded;
    into.failed += from.failed;
    into.pending += from.pending;
    into.cancelled = into.cancelled || from.cancelled;
    for (auto& o : from.outcomes) into.outcomes.push_back(std::move(o));
}

// Sealed parts live at <staging>/zip_files/<job>/<name>.zip
bool is_part_record(const SyncItem& item) {
    if (item.job_id.empty()) return false;
    std::filesystem::path p(item.path);
    return p.extension() == ".zip" && p.parent_path().filename() == item.job_id &&
           p.parent_path().parent_path().filename() == "zip_files";
}

}  // namespace

BackupJob::BackupJob(const BackupConfig& config)
    : config_(config)
    , archiver_(make_archiver_config(config)) {}

BackupJob::~BackupJob() {
    stop();
}

std::string BackupJob::start() {
    if (!config_.state_dir.empty()) {
        store_ = std::make_unique<SqliteMetadataStore>(config_.state_dir / "manifest.db");
        auto err = store_->open();
        if (!err.empty()) {
            store_.reset();
            return err;
        }
    }

    try {
        if (config_.simple_enabled && !config_.simple.empty()) {
            simple_ = BackendFactory::create(BackendVariant::Simple, config_.simple.type,
                                             config_.simple.params,
                                             make_settings(config_, config_.simple_ceiling));
        }
        if (config_.chunked_enabled && !config_.chunked.empty()) {
            chunked_ = BackendFactory::create(BackendVariant::Chunked, config_.chunked.type,
                                              config_.chunked.params,
                                              make_settings(config_, config_.chunked_ceiling));
        }
    } catch (const std::exception& e) {
        return std::string("Failed to create backend: ") + e.what();
    }

    if (!config_.metrics_file.empty()) {
        std::map<std::string, std::string> labels;
        if (!config_.base_name.empty()) labels["backup"] = config_.base_name;
        metrics_ = std::make_unique<MetricsExporter>(
            config_.metrics_file, std::chrono::seconds(config_.metrics_interval_secs), labels);
        metrics_->set_store(store_.get());
        metrics_->start();
    }
    return {};
}

void BackupJob::stop() {
    if (stopped_) return;
    stopped_ = true;

    if (metrics_) {
        metrics_->stop();
        metrics_->set_store(nullptr);
        metrics_.reset();
    }
    store_.reset();
}

void BackupJob::cancel() {
    cancel_.cancel();
    std::lock_guard lock(run_mutex_);
    if (orchestrator_) orchestrator_->cancel();
}

std::string BackupJob::part_object_key(const std::string& job_id, const std::string& file_name) {
    return "zip_files/" + job_id + "/" + file_name;
}

std::string BackupJob::tracked_object_key(const std::filesystem::path& tracked_dir,
                                          const std::filesystem::path& file) {
    auto rel = std::filesystem::absolute(file).lexically_relative(
        std::filesystem::absolute(tracked_dir).lexically_normal());
    return "tracked/" + rel.generic_string();
}

OrchestratorConfig BackupJob::orchestrator_config() const {
    OrchestratorConfig oc;
    oc.workers = config_.transfer_workers;
    oc.verbose = config_.verbose;
    oc.selection.simple_enabled = config_.simple_enabled && simple_ != nullptr;
    oc.selection.chunked_enabled = config_.chunked_enabled && chunked_ != nullptr;
    oc.selection.force_simple = config_.force_simple;
    oc.selection.skip_simple = config_.force_chunked;
    oc.selection.simple_ceiling = config_.simple_ceiling;
    oc.selection.chunked_ceiling = config_.chunked_ceiling;
    oc.retry.max_retries = config_.max_retries;
    oc.retry.initial_backoff = std::chrono::milliseconds(config_.initial_backoff_ms);
    oc.retry.max_backoff = std::chrono::milliseconds(config_.max_backoff_ms);
    return oc;
}

std::unique_ptr<TransferOrchestrator> BackupJob::make_orchestrator() {
    auto orchestrator = std::make_unique<TransferOrchestrator>(
        orchestrator_config(), simple_.get(), chunked_.get(), store_.get(), this);
    {
        std::lock_guard lock(run_mutex_);
        orchestrator_ = orchestrator.get();
        if (cancel_.cancelled()) orchestrator->cancel();
    }
    if (metrics_) metrics_->set_orchestrator(orchestrator.get());
    return orchestrator;
}

void BackupJob::release_orchestrator() {
    if (metrics_) metrics_->set_orchestrator(nullptr);
    std::lock_guard lock(run_mutex_);
    orchestrator_ = nullptr;
}

std::vector<TransferUnit> BackupJob::resumable_parts(const std::vector<SyncItem>& items) const {
    std::vector<TransferUnit> units;
    for (const auto& item : items) {
        if (!is_part_record(item)) continue;
        if (item.status != SyncStatus::Pending && item.status != SyncStatus::Failed) continue;

        std::error_code ec;
        auto size = std::filesystem::file_size(item.path, ec);
        if (ec || size != item.size) {
            log_warn("Part %s is gone or changed since it was sealed, not resuming",
                     item.path.c_str());
            continue;
        }

        TransferUnit unit;
        unit.item = item;
        unit.item.status = SyncStatus::Queued;
        unit.direction = Direction::Upload;
        unit.object_key = part_object_key(item.job_id,
                                          std::filesystem::path(item.path).filename().string());
        units.push_back(std::move(unit));
    }
    return units;
}

std::vector<TransferUnit> BackupJob::tracked_units(const std::vector<SyncItem>& items) {
    std::vector<TransferUnit> units;
    if (config_.tracked_dir.empty()) return units;

    std::map<std::string, SyncItem> known;
    for (const auto& item : items) {
        if (!is_part_record(item)) known[item.path] = item;
    }

    auto changed = scan_tracked(config_.tracked_dir, known, config_.use_sha256);
    for (auto& item : changed) item.status = SyncStatus::Queued;
    if (!changed.empty() && store_ && !store_->save(changed)) {
        log_error("Failed to record %zu tracked files in the manifest", changed.size());
    }

    for (auto& item : changed) {
        TransferUnit unit;
        unit.object_key = tracked_object_key(config_.tracked_dir, item.path);
        unit.item = std::move(item);
        unit.direction = Direction::Upload;
        units.push_back(std::move(unit));
    }
    return units;
}

JobResult BackupJob::backup() {
    JobResult result;
    if (!store_) {
        result.error = ErrorKind::IOError;
        result.error_message = "manifest is not open";
        return result;
    }
    if (!simple_ && !chunked_) {
        result.error = ErrorKind::IOError;
        result.error_message = "no backend configured";
        return result;
    }

    auto items = store_->load();
    file_failures_ = 0;

    ArchivePlan plan;
    try {
        plan = archiver_.plan(config_.source_dir);
    } catch (const std::exception& e) {
        result.error = ErrorKind::IOError;
        result.error_message = e.what();
        return result;
    }
    result.job_id = plan.job_id;

    auto orchestrator = make_orchestrator();

    auto resumed = resumable_parts(items);
    if (!resumed.empty()) {
        log_info("Resuming %zu parts from earlier runs", resumed.size());
        for (auto& unit : resumed) orchestrator->schedule(std::move(unit));
    }
    for (auto& unit : tracked_units(items)) orchestrator->schedule(std::move(unit));

    PackResult pack_result;
    orchestrator->add_producer();
    pack_start_ = std::chrono::steady_clock::now();
    std::thread packer([&] {
        try {
            pack_result = archiver_.pack(plan, this, &cancel_);
        } catch (const std::exception& e) {
            pack_result.error = ErrorKind::IOError;
            pack_result.error_message = e.what();
        }
        orchestrator->producer_done();
    });

    RunSummary summary = orchestrator->run();
    packer.join();

    // Parts sealed after the workers stopped are still queued
    if (orchestrator->queued() > 0) {
        merge(summary, orchestrator->run());
    }
    release_orchestrator();

    result.parts = pack_result.parts;
    result.succeeded = summary.succeeded;
    result.failed = summary.failed + file_failures_;
    result.pending = summary.pending;
    result.cancelled = summary.cancelled || cancel_.cancelled();

    if (!pack_result.success && pack_result.error != ErrorKind::Cancelled) {
        result.error = pack_result.error;
        result.error_message = pack_result.error_message;
    } else if (result.cancelled) {
        result.error = ErrorKind::Cancelled;
        result.error_message = "cancelled";
    } else if (result.failed > 0) {
        result.error = ErrorKind::IOError;
        result.error_message = std::to_string(result.failed) + " items failed";
    }
    result.success = result.error == ErrorKind::None;

    log_info("Backup %s: %zu uploaded, %zu failed, %zu pending%s", result.job_id.c_str(),
             result.succeeded, result.failed, result.pending,
             result.cancelled ? " (cancelled)" : "");
    return result;
}

JobResult BackupJob::pack_only() {
    JobResult result;
    file_failures_ = 0;
    pack_start_ = std::chrono::steady_clock::now();

    PackResult pack_result;
    try {
        auto plan = archiver_.plan(config_.source_dir);
        result.job_id = plan.job_id;
        pack_result = archiver_.pack(plan, this, &cancel_);
    } catch (const std::exception& e) {
        result.error = ErrorKind::IOError;
        result.error_message = e.what();
        return result;
    }

    result.parts = pack_result.parts;
    result.succeeded = pack_result.parts.size();
    result.failed = file_failures_;
    result.cancelled = pack_result.error == ErrorKind::Cancelled;
    result.error = pack_result.error;
    result.error_message = pack_result.error_message;
    if (result.error == ErrorKind::None && result.failed > 0) {
        result.error = ErrorKind::IOError;
        result.error_message = std::to_string(result.failed) + " files could not be read";
    }
    result.success = result.error == ErrorKind::None;
    return result;
}

JobResult BackupJob::unpack() {
    JobResult result;

    std::vector<std::filesystem::path> parts;
    std::error_code ec;
    for (auto& de : std::filesystem::directory_iterator(config_.parts_dir, ec)) {
        if (de.is_regular_file() && de.path().extension() == ".zip") {
            parts.push_back(de.path());
        }
    }
    if (ec) {
        result.error = ErrorKind::IOError;
        result.error_message = "cannot list " + config_.parts_dir.string() + ": " + ec.message();
        return result;
    }
    if (parts.empty()) {
        result.error = ErrorKind::IOError;
        result.error_message = "no parts in " + config_.parts_dir.string();
        return result;
    }

    auto ur = Archiver::unpack(parts, config_.restore_dir);
    result.success = ur.success;
    result.error = ur.error;
    result.error_message = ur.error_message;
    result.succeeded = ur.files_written + ur.files_unchanged;
    log_info("Unpacked %zu parts into %s: %zu files written, %zu unchanged", parts.size(),
             config_.restore_dir.c_str(), ur.files_written, ur.files_unchanged);
    return result;
}

std::string BackupJob::latest_job() {
    if (!store_) return {};
    std::string latest;
    for (const auto& item : store_->load()) {
        if (!is_part_record(item) || item.status != SyncStatus::Uploaded) continue;
        // Job ids start with a sortable timestamp
        if (item.job_id > latest) latest = item.job_id;
    }
    return latest;
}

JobResult BackupJob::restore() {
    JobResult result;
    if (!store_) {
        result.error = ErrorKind::IOError;
        result.error_message = "manifest is not open";
        return result;
    }

    result.job_id = config_.job_id.empty() ? latest_job() : config_.job_id;
    if (result.job_id.empty()) {
        result.error = ErrorKind::IOError;
        result.error_message = "no uploaded job to restore";
        return result;
    }

    auto download_dir = config_.staging_dir / "restore" / result.job_id;
    std::vector<TransferUnit> units;
    for (const auto& item : store_->load()) {
        if (item.job_id != result.job_id || !is_part_record(item) ||
            item.status != SyncStatus::Uploaded || !item.remote) {
            continue;
        }
        TransferUnit unit;
        unit.direction = Direction::Download;
        unit.item.path = (download_dir / std::filesystem::path(item.path).filename()).string();
        unit.item.size = item.remote->size;
        unit.item.job_id = item.job_id;
        unit.remote = item.remote;
        unit.object_key = item.remote->object_id;
        units.push_back(std::move(unit));
    }
    if (units.empty()) {
        result.error = ErrorKind::IOError;
        result.error_message = "job " + result.job_id + " has no uploaded parts";
        return result;
    }

    log_info("Restoring job %s: downloading %zu parts", result.job_id.c_str(), units.size());

    std::vector<std::filesystem::path> parts;
    for (const auto& unit : units) parts.push_back(unit.item.path);

    auto orchestrator = make_orchestrator();
    for (auto& unit : units) orchestrator->schedule(std::move(unit));
    auto summary = orchestrator->run();
    release_orchestrator();

    result.succeeded = summary.succeeded;
    result.failed = summary.failed;
    result.pending = summary.pending;
    result.cancelled = summary.cancelled;

    if (summary.failed > 0 || summary.pending > 0) {
        result.error = summary.cancelled ? ErrorKind::Cancelled : ErrorKind::IOError;
        result.error_message = "downloaded " + std::to_string(summary.succeeded) + " of " +
                               std::to_string(parts.size()) + " parts";
        return result;
    }

    auto ur = Archiver::unpack(parts, config_.restore_dir);
    result.success = ur.success;
    result.error = ur.error;
    result.error_message = ur.error_message;
    if (ur.success) {
        log_info("Restored job %s into %s: %zu files written, %zu unchanged",
                 result.job_id.c_str(), config_.restore_dir.c_str(),
                 ur.files_written, ur.files_unchanged);
    }
    return result;
}

std::map<SyncStatus, size_t> BackupJob::status_counts() {
    if (!store_) return {};
    return store_->counts_by_status();
}

// --- ArchiveListener ---

void BackupJob::on_part_sealed(const ArchivePart& part) {
    SyncItem item;
    item.path = part.path.string();
    item.size = part.size;
    std::error_code ec;
    auto mt = std::filesystem::last_write_time(part.path, ec);
    item.mtime = ec ? now_epoch() : to_epoch(mt);
    item.sig = make_signature(item.size, item.mtime);
    item.job_id = part.job_id;
    item.updated_at = now_epoch();

    if (metrics_) {
        metrics_->archive_parts().Increment();
        metrics_->archive_bytes().Increment(static_cast<double>(part.size));
        metrics_->part_duration().Observe(std::chrono::duration<double>(
            std::chrono::steady_clock::now() - pack_start_).count());
    }

    std::lock_guard lock(run_mutex_);
    // Without a run the part waits for the next backup
    item.status = orchestrator_ ? SyncStatus::Queued : SyncStatus::Pending;
    if (store_ && !store_->save({item})) {
        log_error("Failed to record part %s in the manifest", item.path.c_str());
    }
    if (!orchestrator_) return;

    TransferUnit unit;
    unit.item = item;
    unit.direction = Direction::Upload;
    unit.object_key = part_object_key(part.job_id, part.path.filename().string());
    unit.part_index = part.index;
    orchestrator_->schedule(std::move(unit));
}

void BackupJob::on_file_failed(const SyncItem& item) {
    ++file_failures_;
    if (metrics_) metrics_->archive_file_errors().Increment();
    if (store_ && !store_->save({item})) {
        log_error("Failed to record unreadable file %s", item.path.c_str());
    }
}

// --- TransferListener ---

void BackupJob::on_progress(const ProgressEvent& event) {
    if (!config_.verbose || event.bytes_total == 0) return;

    int decile = static_cast<int>(event.bytes_done * 10 / event.bytes_total);
    {
        std::lock_guard lock(progress_mutex_);
        auto& last = progress_decile_[event.unit_id];
        if (decile <= last && !event.done) return;
        last = decile;
    }
    log_info("%s %s: %d%% (%s of %s)", to_string(event.direction), event.unit_id.c_str(),
             decile * 10, human_size(event.bytes_done).c_str(),
             human_size(event.bytes_total).c_str());
}

void BackupJob::on_retry(const TransferUnit& unit, uint32_t attempt,
                         std::chrono::milliseconds delay, const std::string& error) {
    if (metrics_) metrics_->transfer_retries().Increment();
    log_warn("Attempt %u of %s failed, retrying in %ld ms: %s", attempt, unit.id().c_str(),
             static_cast<long>(delay.count()), error.c_str());
}

void BackupJob::on_finished(const TransferOutcome& outcome) {
    {
        std::lock_guard lock(progress_mutex_);
        progress_decile_.erase(outcome.unit_id);
    }
    if (!metrics_) return;
    if (outcome.state == SyncStatus::Pending) return;

    bool ok = outcome.state == SyncStatus::Uploaded;
    metrics_->transfers(outcome.direction, ok).Increment();
    if (ok) {
        metrics_->transfer_bytes(outcome.direction).Increment(static_cast<double>(outcome.bytes));
    }
    metrics_->transfer_duration(outcome.direction).Observe(
        std::chrono::duration<double>(outcome.elapsed).count());
}

}  // namespace coldpack
