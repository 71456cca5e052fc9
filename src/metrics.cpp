#include "coldpack/metrics.hpp"
#include "coldpack/log.hpp"
#include "coldpack/metadata_store.hpp"
#include "coldpack/transfer_orchestrator.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace coldpack {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& transfers_family = prometheus::BuildCounter()
        .Name("coldpack_transfers_total")
        .Help("Total transfers finished")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &transfers_family.Add({{"direction", "upload"}, {"result", "success"}});
    uploads_failure_ = &transfers_family.Add({{"direction", "upload"}, {"result", "failure"}});
    downloads_success_ = &transfers_family.Add({{"direction", "download"}, {"result", "success"}});
    downloads_failure_ = &transfers_family.Add({{"direction", "download"}, {"result", "failure"}});

    auto& bytes_family = prometheus::BuildCounter()
        .Name("coldpack_transfer_bytes_total")
        .Help("Total bytes transferred")
        .Labels(labels)
        .Register(*registry_);
    upload_bytes_ = &bytes_family.Add({{"direction", "upload"}});
    download_bytes_ = &bytes_family.Add({{"direction", "download"}});

    transfer_retries_ = &prometheus::BuildCounter()
        .Name("coldpack_transfer_retries_total")
        .Help("Total transfer attempts retried after a transient failure")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    archive_parts_ = &prometheus::BuildCounter()
        .Name("coldpack_archive_parts_total")
        .Help("Total archive parts sealed")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    archive_bytes_ = &prometheus::BuildCounter()
        .Name("coldpack_archive_bytes_total")
        .Help("Total bytes written to archive parts")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    archive_file_errors_ = &prometheus::BuildCounter()
        .Name("coldpack_archive_file_errors_total")
        .Help("Source files skipped because they could not be read")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    items_family_ = &prometheus::BuildGauge()
        .Name("coldpack_items")
        .Help("Tracked items by status")
        .Labels(labels)
        .Register(*registry_);
    for (auto status : {SyncStatus::Pending, SyncStatus::Archiving, SyncStatus::Queued,
                        SyncStatus::Uploading, SyncStatus::Uploaded, SyncStatus::Failed}) {
        items_by_status_[status] = &items_family_->Add({{"status", to_string(status)}});
    }

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    queue_pending_ = &gauge_reg("coldpack_transfer_queue_pending", "Transfers waiting for a worker");
    in_flight_ = &gauge_reg("coldpack_transfers_in_flight", "Transfers currently running");

    // --- Histograms ---

    auto& duration_family = prometheus::BuildHistogram()
        .Name("coldpack_transfer_duration_seconds")
        .Help("Transfer duration in seconds, retries included")
        .Labels(labels)
        .Register(*registry_);
    upload_duration_ = &duration_family.Add({{"direction", "upload"}},
        prometheus::Histogram::BucketBoundaries{
            0.1, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 600, 1800});
    download_duration_ = &duration_family.Add({{"direction", "download"}},
        prometheus::Histogram::BucketBoundaries{
            0.1, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 600, 1800});

    part_duration_ = &prometheus::BuildHistogram()
        .Name("coldpack_archive_part_duration_seconds")
        .Help("Time from pack start to each part being sealed, in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            1, 5, 10, 30, 60, 120, 300, 600, 1200, 3600});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::set_store(SqliteMetadataStore* store) {
    std::lock_guard lock(sources_mutex_);
    store_ = store;
}

void MetricsExporter::set_orchestrator(TransferOrchestrator* orchestrator) {
    std::lock_guard lock(sources_mutex_);
    orchestrator_ = orchestrator;
}

prometheus::Counter& MetricsExporter::transfers(Direction direction, bool success) {
    if (direction == Direction::Upload) return success ? *uploads_success_ : *uploads_failure_;
    return success ? *downloads_success_ : *downloads_failure_;
}

prometheus::Counter& MetricsExporter::transfer_bytes(Direction direction) {
    return direction == Direction::Upload ? *upload_bytes_ : *download_bytes_;
}

prometheus::Histogram& MetricsExporter::transfer_duration(Direction direction) {
    return direction == Direction::Upload ? *upload_duration_ : *download_duration_;
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    update_gauges();
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_gauges();
        write_file();
    }
}

void MetricsExporter::update_gauges() {
    std::lock_guard lock(sources_mutex_);
    if (store_) {
        auto counts = store_->counts_by_status();
        for (auto& [status, gauge] : items_by_status_) {
            auto it = counts.find(status);
            gauge->Set(it == counts.end() ? 0.0 : static_cast<double>(it->second));
        }
    }
    if (orchestrator_) {
        queue_pending_->Set(static_cast<double>(orchestrator_->queued()));
        in_flight_->Set(static_cast<double>(orchestrator_->in_flight()));
    } else {
        queue_pending_->Set(0);
        in_flight_->Set(0);
    }
}

bool MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("Cannot write metrics to %s", tmp_path.c_str());
        return false;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot replace %s: %s", prom_file_path_.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

}  // namespace coldpack
