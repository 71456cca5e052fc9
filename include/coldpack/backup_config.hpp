#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace coldpack {

/// Configuration for one backend variant (S3 or a local/NFS directory).
struct BackendConfig {
    std::string type;  // "s3", "local", "nfs"
    std::map<std::string, std::string> params;  // Passed to BackendFactory

    bool empty() const { return type.empty(); }

    /// Validate required fields for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Resolved configuration for one coldpack invocation.
struct BackupConfig {
    // "backup", "pack", "unpack", "restore", "status"
    std::string command;

    std::filesystem::path source_dir;   // Folder to archive
    std::filesystem::path tracked_dir;  // Files uploaded one by one (optional)
    std::filesystem::path state_dir;    // Default: <source_dir>/../.coldpack
    std::filesystem::path staging_dir;  // Default: <state_dir>/staging
    std::string base_name = "Backup";

    // Archiver
    uint64_t archive_ceiling = 1'900'000'000;
    size_t archive_workers = 0;  // 0 = hardware concurrency

    // Backends
    BackendConfig simple;
    BackendConfig chunked;
    bool simple_enabled = true;
    bool chunked_enabled = true;
    bool force_simple = false;
    bool force_chunked = false;
    uint64_t simple_ceiling = 50'000'000;
    uint64_t chunked_ceiling = 2'000'000'000;
    uint64_t chunk_size = 16ULL * 1024 * 1024;

    // Transfers
    size_t transfer_workers = 3;
    uint32_t max_retries = 3;
    uint32_t initial_backoff_ms = 500;
    uint32_t max_backoff_ms = 30000;
    uint32_t request_timeout_secs = 300;
    uint32_t connect_timeout_secs = 10;

    bool use_sha256 = false;
    bool verbose = false;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    // unpack / restore
    std::filesystem::path restore_dir;
    std::filesystem::path parts_dir;  // unpack: directory holding the parts
    std::string job_id;               // restore: default is the latest job

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<BackupConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in defaults (state_dir, staging_dir) based on source_dir.
    void apply_defaults();

    /// Validate required fields for `command`. Returns error message or empty string.
    std::string validate() const;

    /// One line per setting, with keys and tokens masked.
    std::vector<std::string> describe() const;

    static void print_usage();
};

/// "abcd****" for secrets, the value itself otherwise.
std::string mask_secret(const std::string& key, const std::string& value);

}  // namespace coldpack
