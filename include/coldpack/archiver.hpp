#pragma once

#include "coldpack/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace coldpack {

struct ArchiverConfig {
    std::filesystem::path staging_dir;  // Parts land in <staging>/zip_files/<job_id>/
    uint64_t ceiling = 1'900'000'000;
    std::string base_name = "Backup";
    size_t workers = 0;  // 0 = hardware concurrency
    bool verbose = false;
};

/// A source file as seen by the planner.
struct PlannedEntry {
    std::string relative;  // generic '/' form, used as the zip entry name
    std::filesystem::path absolute;
    uint64_t size = 0;
    int64_t mtime = 0;
};

struct PlannedPart {
    uint32_t index = 0;
    std::vector<PlannedEntry> entries;
    uint64_t estimated_size = 0;  // upper bound on the sealed container
    bool oversized = false;
};

/// Deterministic partition of a source tree into containers.
struct ArchivePlan {
    std::filesystem::path source_dir;
    std::filesystem::path output_dir;
    std::string job_id;
    std::string base_name;
    uint64_t ceiling = 0;
    std::vector<PlannedPart> parts;
    uint64_t total_bytes = 0;
    size_t total_files = 0;
};

/// Receives sealed parts in index order, and files that could not be read.
/// Called from the thread running Archiver::pack().
class ArchiveListener {
public:
    virtual ~ArchiveListener() = default;
    virtual void on_part_sealed(const ArchivePart& part) = 0;
    virtual void on_file_failed(const SyncItem& item) { (void)item; }
};

struct PackResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
    std::string job_id;
    std::vector<ArchivePart> parts;
    std::vector<SyncItem> failed;  // unreadable source files
    uint64_t bytes_in = 0;
    uint64_t bytes_out = 0;
    std::chrono::milliseconds elapsed{0};
};

struct UnpackResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
    size_t files_written = 0;
    size_t files_unchanged = 0;
};

/// Splits a folder into size-capped zip parts and recombines them.
///
/// Planning is pure and ordered: files are visited in lexicographic order
/// of their relative path and packed greedily against an upper-bound size
/// estimate, so a non-oversized container can never exceed the ceiling.
/// Packing compresses independent containers in parallel, one container
/// per worker, and releases them to the listener in index order.
class Archiver {
public:
    explicit Archiver(const ArchiverConfig& config);

    /// Walk `source_dir` and partition it. Throws std::runtime_error if the
    /// directory cannot be read.
    ArchivePlan plan(const std::filesystem::path& source_dir) const;
    ArchivePlan plan(const std::filesystem::path& source_dir, uint64_t ceiling,
                     const std::string& base_name) const;

    /// Write the planned containers. `listener` and `cancel` may be null.
    PackResult pack(const ArchivePlan& plan, ArchiveListener* listener,
                    const CancelToken* cancel);

    /// plan() followed by pack(), with an explicit ceiling and base name.
    PackResult pack(const std::filesystem::path& source_dir, uint64_t ceiling,
                    const std::string& base_name, ArchiveListener* listener,
                    const CancelToken* cancel);

    /// Extract parts into `dest_dir` in index order. Entries whose
    /// destination already holds identical bytes are left untouched.
    static UnpackResult unpack(const std::vector<std::filesystem::path>& parts,
                               const std::filesystem::path& dest_dir);

    /// Greedy partition of already-sorted entries against `ceiling`.
    static std::vector<PlannedPart> partition(const std::vector<PlannedEntry>& entries,
                                              uint64_t ceiling);

    /// Upper bound on the bytes one entry adds to a container.
    static uint64_t estimate_entry_bytes(const std::string& name, uint64_t size);

    /// Fixed bytes every container spends on its end-of-archive records.
    static constexpr uint64_t CONTAINER_RESERVE = 128;

    /// "{base}_{index:03d}.zip"
    static std::string part_file_name(const std::string& base_name, uint32_t index);

    /// "YYYYmmdd_HHMMSS_XXXXX" in local time with a random suffix.
    static std::string make_job_id();

    const ArchiverConfig& config() const { return config_; }

private:
    struct BuildResult {
        ErrorKind error = ErrorKind::None;
        std::string error_message;
        ArchivePart part;
        bool produced = false;  // false when every entry failed
        uint64_t bytes_in = 0;
        std::vector<SyncItem> failed;
    };

    BuildResult build_part(const ArchivePlan& plan, const PlannedPart& planned,
                           const CancelToken* cancel, const std::atomic<bool>& abort);

    ArchiverConfig config_;
};

}  // namespace coldpack
