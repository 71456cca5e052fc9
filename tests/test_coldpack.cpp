// Test suite for coldpack.
//
// Tests:
//   1. BackendConfig validation
//   2. BackupConfig CLI parsing, JSON loading, defaults and validation
//   3. SizedWriter capacity and disk-full handling
//   4. Archiver: partition, pack/unpack, oversized files, unreadable files,
//      broken and disk-full containers
//   5. Backend selection and backoff
//   6. TransferOrchestrator with fake adapters
//      - Retry budget, non-retryable errors, size limits
//      - Per-path exclusivity, cancellation, monotonic progress
//   7. Local adapters
//   8. HTTP failure classification, S3 attempts against a loopback server
//   9. SQLite manifest and crash recovery
//  10. Tracked-file scanner
//  11. Metrics exporter
//  12. BackupJob end to end with local backends

#include "coldpack/archiver.hpp"
#include "coldpack/backend.hpp"
#include "coldpack/backup_config.hpp"
#include "coldpack/backup_job.hpp"
#include "coldpack/metadata_store.hpp"
#include "coldpack/metrics.hpp"
#include "coldpack/scanner.hpp"
#include "coldpack/sized_writer.hpp"
#include "coldpack/transfer_orchestrator.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace fs = std::filesystem;
using namespace coldpack;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), msg ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), content.size());
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

/// Incompressible bytes, deterministic per seed.
static std::string random_bytes(size_t n, uint32_t seed) {
    std::mt19937 gen(seed);
    std::string s(n, '\0');
    for (auto& c : s) c = static_cast<char>(gen() & 0xff);
    return s;
}

/// Wait for a condition with timeout (milliseconds). Returns true if met.
static bool wait_for(std::function<bool()> cond, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return cond();
}

/// Relative path -> content for every regular file under `dir`.
static std::map<std::string, std::string> snapshot_tree(const fs::path& dir) {
    std::map<std::string, std::string> out;
    for (auto& de : fs::recursive_directory_iterator(dir)) {
        if (de.is_regular_file()) {
            out[fs::relative(de.path(), dir).generic_string()] = read_file(de.path());
        }
    }
    return out;
}

static std::vector<fs::path> part_paths(const std::vector<ArchivePart>& parts) {
    std::vector<fs::path> out;
    for (const auto& p : parts) out.push_back(p.path);
    return out;
}

/// Scripted adapter: returns the queued errors in order, then succeeds.
/// Never touches the filesystem for uploads.
class FakeAdapter : public BackendAdapter {
public:
    FakeAdapter(BackendVariant variant, uint64_t max_bytes)
        : variant_(variant), max_bytes_(max_bytes) {}

    BackendVariant variant() const override { return variant_; }
    std::string type_name() const override { return "fake"; }
    uint64_t max_object_bytes() const override { return max_bytes_; }

    PutResult put(const PutRequest& request, const ProgressFn& progress,
                  const CancelToken* cancel) override {
        ++put_calls;
        enter(request.source.string());

        PutResult result;
        ErrorKind scripted = next_error();

        // Report half the object, then either fail or finish
        if (progress) progress(request.size / 2, request.size);
        if (delay.count() > 0) {
            if (cancel) cancel->wait_for(delay);
            else std::this_thread::sleep_for(delay);
        }

        leave(request.source.string());
        if (scripted != ErrorKind::None) {
            result.error = scripted;
            result.error_message = std::string("scripted ") + to_string(scripted);
            return result;
        }
        if (progress) progress(request.size, request.size);

        result.success = true;
        result.reference.variant = variant_;
        result.reference.backend_type = type_name();
        result.reference.object_id = request.key;
        result.reference.size = request.size;
        return result;
    }

    GetResult get(const RemoteReference& ref, const fs::path& target,
                  const ProgressFn& progress, const CancelToken* cancel) override {
        (void)cancel;
        ++get_calls;
        GetResult result;
        ErrorKind scripted = next_error();
        if (scripted != ErrorKind::None) {
            result.error = scripted;
            result.error_message = std::string("scripted ") + to_string(scripted);
            return result;
        }
        if (write_target) write_file(target, std::string(static_cast<size_t>(ref.size), 'x'));
        if (progress) progress(ref.size, ref.size);
        result.success = true;
        result.bytes_written = ref.size;
        return result;
    }

    void script(std::vector<ErrorKind> errors) {
        std::lock_guard lock(mutex_);
        errors_ = std::move(errors);
    }

    std::atomic<int> put_calls{0};
    std::atomic<int> get_calls{0};
    std::atomic<bool> overlap{false};
    std::chrono::milliseconds delay{0};
    bool write_target = true;  // false: report success without creating the file

private:
    ErrorKind next_error() {
        std::lock_guard lock(mutex_);
        if (errors_.empty()) return ErrorKind::None;
        auto e = errors_.front();
        errors_.erase(errors_.begin());
        return e;
    }

    void enter(const std::string& path) {
        std::lock_guard lock(mutex_);
        if (!active_.insert(path).second) overlap = true;
    }

    void leave(const std::string& path) {
        std::lock_guard lock(mutex_);
        active_.erase(path);
    }

    BackendVariant variant_;
    uint64_t max_bytes_;
    std::mutex mutex_;
    std::vector<ErrorKind> errors_;
    std::set<std::string> active_;
};

/// Loopback HTTP endpoint answering every request with one canned response,
/// one request per connection.
class CannedHttpServer {
public:
    explicit CannedHttpServer(std::string response) : response_(std::move(response)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd_ < 0) throw std::runtime_error("socket failed");
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        socklen_t len = sizeof(addr);
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), len) != 0 ||
            ::listen(fd_, 16) != 0 ||
            ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            ::close(fd_);
            throw std::runtime_error("cannot listen on loopback");
        }
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this] { serve(); });
    }

    ~CannedHttpServer() {
        ::shutdown(fd_, SHUT_RDWR);
        thread_.join();
        ::close(fd_);
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    std::atomic<int> requests{0};

private:
    void serve() {
        for (;;) {
            int c = ::accept(fd_, nullptr, nullptr);
            if (c < 0) {
                if (errno == EINTR) continue;
                return;  // listening socket shut down
            }
            std::string head;
            char buf[4096];
            size_t header_end;
            while ((header_end = head.find("\r\n\r\n")) == std::string::npos) {
                ssize_t n = ::recv(c, buf, sizeof(buf), 0);
                if (n <= 0) break;
                head.append(buf, static_cast<size_t>(n));
            }
            if (header_end != std::string::npos) {
                ++requests;
                // Drain the body so the close is orderly
                size_t body = 0;
                auto cl = head.find("Content-Length: ");
                if (cl != std::string::npos) body = std::stoul(head.substr(cl + 16));
                size_t have = head.size() - header_end - 4;
                while (have < body) {
                    ssize_t n = ::recv(c, buf, sizeof(buf), 0);
                    if (n <= 0) break;
                    have += static_cast<size_t>(n);
                }
                ::send(c, response_.data(), response_.size(), MSG_NOSIGNAL);
            }
            ::close(c);
        }
    }

    std::string response_;
    int fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
};

/// Records everything the orchestrator reports.
class RecordingListener : public TransferListener {
public:
    void on_progress(const ProgressEvent& event) override {
        std::lock_guard lock(mutex_);
        progress[event.unit_id].push_back(event.bytes_done);
        if (event.done) ++done_events;
    }

    void on_retry(const TransferUnit& unit, uint32_t attempt,
                  std::chrono::milliseconds delay, const std::string& error) override {
        (void)unit; (void)delay; (void)error;
        std::lock_guard lock(mutex_);
        retries.push_back(attempt);
    }

    void on_finished(const TransferOutcome& outcome) override {
        std::lock_guard lock(mutex_);
        finished.push_back(outcome);
    }

    std::mutex mutex_;
    std::map<std::string, std::vector<uint64_t>> progress;
    std::vector<uint32_t> retries;
    std::vector<TransferOutcome> finished;
    int done_events = 0;
};

static TransferUnit upload_unit(const std::string& path, uint64_t size) {
    TransferUnit unit;
    unit.item.path = path;
    unit.item.size = size;
    unit.direction = Direction::Upload;
    unit.object_key = "tracked/" + fs::path(path).filename().string();
    return unit;
}

static OrchestratorConfig fast_config(size_t workers) {
    OrchestratorConfig oc;
    oc.workers = workers;
    oc.retry.initial_backoff = std::chrono::milliseconds(1);
    oc.retry.max_backoff = std::chrono::milliseconds(5);
    oc.retry.jitter = 0.0;
    return oc;
}

static std::map<std::string, SyncItem> items_by_path(MetadataStore& store) {
    std::map<std::string, SyncItem> out;
    for (auto& item : store.load()) out[item.path] = item;
    return out;
}

// ---------------------------------------------------------------------------
// 1. BackendConfig validation
// ---------------------------------------------------------------------------

static void test_backend_config_validation() {
    std::cout << "\n=== BackendConfig validation ===" << std::endl;

    {
        TEST(empty_type_fails);
        BackendConfig bc;
        ASSERT_NOT_EMPTY(bc.validate(), "empty type should fail");
        PASS();
    }
    {
        TEST(unknown_type_fails);
        BackendConfig bc;
        bc.type = "ftp";
        ASSERT_TRUE(bc.validate().find("unknown") != std::string::npos, "should say unknown");
        PASS();
    }
    {
        TEST(s3_requires_bucket_and_credentials);
        BackendConfig bc;
        bc.type = "s3";
        ASSERT_TRUE(bc.validate().find("bucket") != std::string::npos, "s3 needs bucket");
        bc.params["bucket"] = "cold";
        ASSERT_TRUE(bc.validate().find("credentials") != std::string::npos, "s3 needs keys");
        bc.params["access_key"] = "AKIA";
        bc.params["secret_key"] = "secret";
        auto err = bc.validate();
        ASSERT_EMPTY(err, "complete s3 config should pass");
        PASS();
    }
    {
        TEST(local_requires_path);
        BackendConfig bc;
        bc.type = "local";
        ASSERT_TRUE(bc.validate().find("path") != std::string::npos, "local needs path");
        bc.params["path"] = "/tmp/coldpack-store";
        auto err = bc.validate();
        ASSERT_EMPTY(err, "local with path should pass");
        PASS();
    }
    {
        TEST(bad_chunk_size_fails);
        BackendConfig bc;
        bc.type = "nfs";
        bc.params["path"] = "/tmp";
        bc.params["chunk_size"] = "16M";
        ASSERT_TRUE(bc.validate().find("chunk_size") != std::string::npos, "chunk_size must be numeric");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. BackupConfig
// ---------------------------------------------------------------------------

static void test_config() {
    std::cout << "\n=== BackupConfig ===" << std::endl;

    auto tmpdir = make_temp_dir("coldpack-config");
    auto source = tmpdir / "Documents";
    fs::create_directories(source);

    {
        TEST(cli_parsing);
        std::string src = source.string();
        const char* args[] = {
            "coldpack", "backup",
            "--source-dir", src.c_str(),
            "--simple-type", "local",
            "--simple-path", "/tmp/simple",
            "--chunked-type", "s3",
            "--chunked-bucket", "cold",
            "--chunked-access-key", "AKIAEXAMPLE",
            "--chunked-secret-key", "s3cr3t",
            "--chunked-chunk-size", "8388608",
            "--force-chunked",
            "--transfer-workers", "5",
            "--max-retries", "7",
            "--simple-ceiling", "1000",
            "--verbose",
        };
        int argc = static_cast<int>(sizeof(args) / sizeof(args[0]));
        auto cfg = BackupConfig::from_args(argc, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->command, "backup", "command");
        ASSERT_EQ(cfg->simple.type, "local", "simple type");
        ASSERT_EQ(cfg->simple.params["path"], "/tmp/simple", "simple path");
        ASSERT_EQ(cfg->chunked.params["bucket"], "cold", "chunked bucket");
        ASSERT_EQ(cfg->chunked.params["chunk_size"], "8388608", "per-backend chunk size kept");
        ASSERT_EQ(cfg->simple.params["chunk_size"], std::to_string(16ULL * 1024 * 1024),
                  "global chunk size applied");
        ASSERT_TRUE(cfg->force_chunked, "force_chunked");
        ASSERT_EQ(cfg->transfer_workers, 5u, "workers");
        ASSERT_EQ(cfg->max_retries, 7u, "retries");
        ASSERT_EQ(cfg->simple_ceiling, 1000u, "simple ceiling");
        ASSERT_TRUE(cfg->verbose, "verbose");
        ASSERT_EQ(cfg->state_dir, tmpdir / ".coldpack", "state_dir default");
        ASSERT_EQ(cfg->staging_dir, tmpdir / ".coldpack" / "staging", "staging default");
        auto err = cfg->validate();
        ASSERT_EMPTY(err, "should validate");
        PASS();
    }
    {
        TEST(unknown_option_rejected);
        const char* args[] = {"coldpack", "backup", "--bogus"};
        auto cfg = BackupConfig::from_args(3, const_cast<char**>(args));
        ASSERT_TRUE(!cfg.has_value(), "unknown option should fail");
        PASS();
    }
    {
        TEST(bad_number_rejected);
        const char* args[] = {"coldpack", "pack", "--archive-ceiling", "lots"};
        auto cfg = BackupConfig::from_args(4, const_cast<char**>(args));
        ASSERT_TRUE(!cfg.has_value(), "non-numeric ceiling should fail");
        PASS();
    }
    {
        TEST(json_overlay);
        auto json_path = tmpdir / "coldpack.json";
        write_file(json_path, R"({
            "command": "pack",
            "source_dir": ")" + source.string() + R"(",
            "archive_ceiling": 40000,
            "base_name": "Docs",
            "simple": {"type": "local", "path": "/tmp/s", "verify_ssl": false},
            "chunked_enabled": false,
            "metrics_file": "/tmp/coldpack.prom"
        })");
        std::string jp = json_path.string();
        const char* args[] = {"coldpack", "--config", jp.c_str()};
        auto cfg = BackupConfig::from_args(3, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse json");
        ASSERT_EQ(cfg->command, "pack", "command from json");
        ASSERT_EQ(cfg->archive_ceiling, 40000u, "ceiling");
        ASSERT_EQ(cfg->base_name, "Docs", "base name");
        ASSERT_EQ(cfg->simple.params["verify_ssl"], "false", "bool param stringified");
        ASSERT_TRUE(!cfg->chunked_enabled, "chunked disabled");
        ASSERT_EQ(cfg->metrics_file.string(), "/tmp/coldpack.prom", "metrics file");
        PASS();
    }
    {
        TEST(env_credentials);
        setenv("AWS_ACCESS_KEY_ID", "AKIAENV", 1);
        setenv("AWS_SECRET_ACCESS_KEY", "envsecret", 1);
        const char* args[] = {"coldpack", "restore", "--simple-type", "s3",
                              "--simple-bucket", "b", "--restore-dir", "/tmp/r",
                              "--state-dir", "/tmp/state"};
        auto cfg = BackupConfig::from_args(10, const_cast<char**>(args));
        unsetenv("AWS_ACCESS_KEY_ID");
        unsetenv("AWS_SECRET_ACCESS_KEY");
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->simple.params["access_key"], "AKIAENV", "access key from env");
        ASSERT_EQ(cfg->simple.params["secret_key"], "envsecret", "secret key from env");
        auto err = cfg->validate();
        ASSERT_EMPTY(err, "restore config should validate");
        PASS();
    }
    {
        TEST(validation_errors);
        BackupConfig cfg;
        ASSERT_TRUE(cfg.validate().find("command") != std::string::npos, "command required");
        cfg.command = "backup";
        ASSERT_TRUE(cfg.validate().find("source_dir") != std::string::npos, "source required");
        cfg.source_dir = source;
        cfg.apply_defaults();
        ASSERT_TRUE(cfg.validate().find("backend") != std::string::npos, "backend required");
        cfg.simple.type = "local";
        cfg.simple.params["path"] = (tmpdir / "store").string();
        cfg.force_simple = true;
        cfg.force_chunked = true;
        ASSERT_TRUE(cfg.validate().find("mutually exclusive") != std::string::npos,
                    "both overrides rejected");
        cfg.force_chunked = false;
        auto err = cfg.validate();
        ASSERT_EMPTY(err, "simple-only backup should validate");
        cfg.command = "unpack";
        ASSERT_TRUE(cfg.validate().find("parts_dir") != std::string::npos, "unpack needs parts_dir");
        PASS();
    }
    {
        TEST(secrets_masked);
        BackupConfig cfg;
        cfg.command = "backup";
        cfg.simple.type = "s3";
        cfg.simple.params["secret_key"] = "wJalrXUtnFEMI";
        cfg.simple.params["bucket"] = "cold";
        bool leaked = false;
        for (auto& line : cfg.describe()) {
            if (line.find("wJalrXUtnFEMI") != std::string::npos) leaked = true;
        }
        ASSERT_TRUE(!leaked, "secret must not be printed");
        ASSERT_EQ(mask_secret("secret_key", "wJalrXUtnFEMI"), "wJal****", "mask");
        ASSERT_EQ(mask_secret("bucket", "cold"), "cold", "non-secret untouched");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 3. SizedWriter
// ---------------------------------------------------------------------------

static void test_sized_writer() {
    std::cout << "\n=== SizedWriter ===" << std::endl;

    auto tmpdir = make_temp_dir("coldpack-writer");

    {
        TEST(capacity_enforced);
        SizedWriter w(tmpdir / "capped", 100);
        auto err = w.open();
        ASSERT_EMPTY(err, "open");
        std::string data(60, 'a');
        ASSERT_TRUE(w.write(data.data(), data.size()), "first write fits");
        ASSERT_TRUE(w.would_exceed(41), "41 more would exceed");
        ASSERT_TRUE(!w.would_exceed(40), "40 more fits");
        ASSERT_TRUE(!w.write(data.data(), data.size()), "second write must fail");
        ASSERT_TRUE(w.capacity_exceeded(), "capacity flag");
        ASSERT_EQ(w.bytes_written(), 60u, "nothing partial written");
        ASSERT_TRUE(w.close(), "close");
        ASSERT_EQ(fs::file_size(tmpdir / "capped"), 60u, "file size");
        PASS();
    }
    {
        TEST(unlimited_capacity);
        SizedWriter w(tmpdir / "open", 0);
        auto err = w.open();
        ASSERT_EMPTY(err, "open");
        std::string data(4096, 'b');
        for (int i = 0; i < 10; ++i) {
            ASSERT_TRUE(w.write(data.data(), data.size()), "write");
        }
        ASSERT_TRUE(w.close(), "close");
        ASSERT_EQ(w.bytes_written(), 40960u, "bytes");
        PASS();
    }
    {
        TEST(discard_unlinks);
        SizedWriter w(tmpdir / "gone", 0);
        auto err = w.open();
        ASSERT_EMPTY(err, "open");
        w.write("x", 1);
        w.discard();
        ASSERT_TRUE(!fs::exists(tmpdir / "gone"), "file removed");
        PASS();
    }
    if (fs::exists("/dev/full")) {
        TEST(dev_full_reports_disk_full);
        SizedWriter w("/dev/full", 0);
        auto err = w.open();
        ASSERT_EMPTY(err, "open /dev/full");
        std::string data(8192, 'c');
        ASSERT_TRUE(!w.write(data.data(), data.size()), "write must fail");
        ASSERT_TRUE(w.disk_full(), "ENOSPC reported as disk full");
        w.close();
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 4. Archiver
// ---------------------------------------------------------------------------

/// Records parts and failed files as the archiver releases them.
struct CollectingArchiveListener : ArchiveListener {
    std::vector<ArchivePart> parts;
    std::vector<SyncItem> failed;
    void on_part_sealed(const ArchivePart& p) override { parts.push_back(p); }
    void on_file_failed(const SyncItem& i) override { failed.push_back(i); }
};

static void test_archiver() {
    std::cout << "\n=== Archiver ===" << std::endl;

    auto tmpdir = make_temp_dir("coldpack-archiver");

    {
        TEST(partition_isolates_oversized);
        // Planned only: nothing of this size is written
        std::vector<PlannedEntry> entries;
        PlannedEntry big;
        big.relative = "big.bin";
        big.size = 3'000'000'000ULL;
        entries.push_back(big);
        for (int i = 0; i < 10; ++i) {
            PlannedEntry e;
            char name[32];
            std::snprintf(name, sizeof(name), "small_%02d.bin", i);
            e.relative = name;
            e.size = 1024 * 1024;
            entries.push_back(e);
        }
        auto parts = Archiver::partition(entries, 1'900'000'000);
        ASSERT_EQ(parts.size(), 2u, "two parts");
        ASSERT_TRUE(parts[0].oversized, "first part is oversized");
        ASSERT_EQ(parts[0].entries.size(), 1u, "oversized part holds one file");
        ASSERT_EQ(parts[0].entries[0].relative, "big.bin", "the big file");
        ASSERT_TRUE(!parts[1].oversized, "second part is normal");
        ASSERT_EQ(parts[1].entries.size(), 10u, "ten small files together");
        ASSERT_EQ(parts[0].index, 1u, "indices start at 1");
        ASSERT_EQ(parts[1].index, 2u, "second index");
        PASS();
    }
    {
        TEST(partition_respects_estimate);
        std::vector<PlannedEntry> entries;
        for (int i = 0; i < 50; ++i) {
            PlannedEntry e;
            e.relative = "f" + std::to_string(100 + i);
            e.size = 1000 + static_cast<uint64_t>(i) * 37;
            entries.push_back(e);
        }
        auto parts = Archiver::partition(entries, 10000);
        size_t total = 0;
        for (const auto& p : parts) {
            ASSERT_TRUE(p.estimated_size <= 10000, "estimate within ceiling");
            total += p.entries.size();
        }
        ASSERT_EQ(total, 50u, "every entry placed once");
        PASS();
    }
    {
        TEST(names);
        ASSERT_EQ(Archiver::part_file_name("Backup", 7), "Backup_007.zip", "part name");
        auto id = Archiver::make_job_id();
        ASSERT_EQ(id.size(), 21u, "job id length");
        ASSERT_EQ(id[8], '_', "date/time separator");
        ASSERT_EQ(id[15], '_', "suffix separator");
        PASS();
    }

    auto source = tmpdir / "src";
    std::map<std::string, std::string> expected;
    for (int i = 0; i < 10; ++i) {
        auto rel = (i < 5 ? "a/" : "b/deep/") + std::string("f") + std::to_string(i) + ".bin";
        expected[rel] = random_bytes(10 * 1024, static_cast<uint32_t>(i + 1));
        write_file(source / rel, expected[rel]);
    }

    ArchiverConfig ac;
    ac.staging_dir = tmpdir / "staging";
    ac.workers = 3;
    Archiver archiver(ac);

    PackResult packed;
    {
        TEST(pack_respects_ceiling);
        packed = archiver.pack(source, 40000, "Backup", nullptr, nullptr);
        ASSERT_TRUE(packed.success, "pack should succeed: " + packed.error_message);
        ASSERT_TRUE(packed.parts.size() >= 3, "ten 10KB files need several 40KB parts");
        size_t files = 0;
        for (size_t i = 0; i < packed.parts.size(); ++i) {
            const auto& p = packed.parts[i];
            ASSERT_EQ(p.index, static_cast<uint32_t>(i + 1), "parts in index order");
            ASSERT_TRUE(!p.oversized, "no oversized parts");
            ASSERT_TRUE(fs::file_size(p.path) <= 40000, "part within ceiling");
            ASSERT_EQ(p.size, fs::file_size(p.path), "recorded size");
            files += p.entries.size();
        }
        ASSERT_EQ(files, 10u, "every file packed");
        ASSERT_EQ(packed.parts[0].path.filename().string(), "Backup_001.zip", "first part name");
        ASSERT_EQ(packed.parts[0].path.parent_path(),
                  ac.staging_dir / "zip_files" / packed.job_id, "output dir");
        PASS();
    }
    {
        TEST(unpack_round_trip);
        auto dest = tmpdir / "restored";
        auto ur = Archiver::unpack(part_paths(packed.parts), dest);
        ASSERT_TRUE(ur.success, "unpack: " + ur.error_message);
        ASSERT_EQ(ur.files_written, 10u, "files written");
        ASSERT_TRUE(snapshot_tree(dest) == expected, "restored tree matches source");
        PASS();
    }
    {
        TEST(unpack_idempotent);
        auto dest = tmpdir / "restored";
        auto ur = Archiver::unpack(part_paths(packed.parts), dest);
        ASSERT_TRUE(ur.success, "second unpack");
        ASSERT_EQ(ur.files_written, 0u, "nothing rewritten");
        ASSERT_EQ(ur.files_unchanged, 10u, "all unchanged");
        ASSERT_TRUE(snapshot_tree(dest) == expected, "tree still matches");
        PASS();
    }
    {
        TEST(oversized_file_alone);
        auto src2 = tmpdir / "src2";
        write_file(src2 / "huge.bin", random_bytes(100000, 99));
        write_file(src2 / "tiny.txt", "hello");
        auto r = archiver.pack(src2, 40000, "Big", nullptr, nullptr);
        ASSERT_TRUE(r.success, "pack: " + r.error_message);
        ASSERT_EQ(r.parts.size(), 2u, "two parts");
        ASSERT_TRUE(r.parts[0].oversized, "huge file part is oversized");
        ASSERT_EQ(r.parts[0].entries.size(), 1u, "only the huge file");
        ASSERT_TRUE(!r.parts[1].oversized, "tiny file in a normal part");
        auto dest = tmpdir / "restored2";
        auto ur = Archiver::unpack(part_paths(r.parts), dest);
        ASSERT_TRUE(ur.success, "unpack");
        ASSERT_EQ(read_file(dest / "huge.bin"), random_bytes(100000, 99), "huge bytes");
        ASSERT_EQ(read_file(dest / "tiny.txt"), "hello", "tiny bytes");
        PASS();
    }
    {
        TEST(unreadable_file_recorded);
        auto src3 = tmpdir / "src3";
        write_file(src3 / "keep1.txt", "one");
        write_file(src3 / "lost.txt", "vanishes");
        write_file(src3 / "keep2.txt", "two");
        auto plan = archiver.plan(src3, 40000, "Gap");
        fs::remove(src3 / "lost.txt");

        CollectingArchiveListener listener;

        auto r = archiver.pack(plan, &listener, nullptr);
        ASSERT_TRUE(r.success, "one bad file does not abort the run");
        ASSERT_EQ(listener.failed.size(), 1u, "one failure reported");
        ASSERT_TRUE(listener.failed[0].path.find("lost.txt") != std::string::npos, "the lost file");
        ASSERT_EQ(std::string(to_string(listener.failed[0].last_error)), "io_error", "IOError");
        ASSERT_EQ(std::string(to_string(listener.failed[0].status)), "failed", "Failed status");
        ASSERT_TRUE(listener.failed[0].job_id.empty(), "source file carries no job id");
        ASSERT_EQ(listener.parts.size(), 1u, "part still sealed");
        auto dest = tmpdir / "restored3";
        auto ur = Archiver::unpack(part_paths(r.parts), dest);
        ASSERT_TRUE(ur.success, "unpack");
        ASSERT_EQ(ur.files_written, 2u, "two readable files");
        ASSERT_TRUE(!fs::exists(dest / "lost.txt"), "lost file absent");
        PASS();
    }
    {
        TEST(broken_container_skips_only_its_files);
        auto plan = archiver.plan(source, 40000, "Hole");
        ASSERT_TRUE(plan.parts.size() >= 3, "several parts planned");
        // A directory squatting on the part name makes that container unwritable
        fs::create_directories(plan.output_dir / "Hole_002.zip");

        CollectingArchiveListener listener;
        auto r = archiver.pack(plan, &listener, nullptr);
        ASSERT_TRUE(r.success, "packing continues: " + r.error_message);
        ASSERT_EQ(r.parts.size(), plan.parts.size() - 1, "every other part sealed");
        for (const auto& p : r.parts) {
            ASSERT_TRUE(p.index != 2u, "part 2 not released");
        }
        ASSERT_EQ(r.parts[0].index, 1u, "part 1 sealed");
        ASSERT_EQ(r.parts[1].index, 3u, "part 3 sealed");
        ASSERT_EQ(r.failed.size(), plan.parts[1].entries.size(), "part 2 files reported");
        ASSERT_EQ(listener.failed.size(), r.failed.size(), "listener told about each");
        for (const auto& item : listener.failed) {
            ASSERT_EQ(std::string(to_string(item.last_error)), "io_error", "IOError");
            ASSERT_EQ(std::string(to_string(item.status)), "failed", "Failed status");
            ASSERT_TRUE(item.job_id.empty(), "no job id on source files");
        }

        auto dest = tmpdir / "restored4";
        auto ur = Archiver::unpack(part_paths(r.parts), dest);
        ASSERT_TRUE(ur.success, "unpack: " + ur.error_message);
        ASSERT_EQ(ur.files_written, 10u - r.failed.size(), "remaining files restored");
        PASS();
    }
    if (fs::exists("/dev/full")) {
        TEST(disk_full_container_aborts_pack);
        auto plan = archiver.plan(source, 40000, "Full");
        ASSERT_TRUE(plan.parts.size() >= 3, "several parts planned");
        fs::create_directories(plan.output_dir);
        fs::create_symlink("/dev/full", plan.output_dir / "Full_002.zip");

        CollectingArchiveListener listener;
        auto r = archiver.pack(plan, &listener, nullptr);
        ASSERT_TRUE(!r.success, "a full disk stops the run");
        ASSERT_EQ(std::string(to_string(r.error)), "disk_full", "DiskFull");
        ASSERT_EQ(r.parts.size(), 1u, "only the part before the failure released");
        ASSERT_EQ(r.parts[0].index, 1u, "part 1");
        ASSERT_EQ(listener.parts.size(), 1u, "listener saw one part");
        ASSERT_TRUE(listener.failed.empty(), "no files blamed for the disk");
        ASSERT_TRUE(!fs::exists(plan.output_dir / "Full_003.zip"), "later part discarded");
        PASS();
    }
    {
        TEST(missing_source_reported);
        bool threw = false;
        try {
            archiver.plan(tmpdir / "absent", 40000, "None");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "planning a missing tree throws");
        auto r = archiver.pack(tmpdir / "absent", 40000, "None", nullptr, nullptr);
        ASSERT_TRUE(!r.success, "pack fails");
        ASSERT_EQ(std::string(to_string(r.error)), "io_error", "IOError");
        ASSERT_TRUE(r.error_message.find("absent") != std::string::npos, "names the path");
        PASS();
    }
    {
        TEST(cancelled_pack);
        CancelToken token;
        token.cancel();
        auto r = archiver.pack(source, 40000, "Stop", nullptr, &token);
        ASSERT_TRUE(!r.success, "cancelled pack reports failure");
        ASSERT_EQ(std::string(to_string(r.error)), "cancelled", "Cancelled");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 5. Selection and backoff
// ---------------------------------------------------------------------------

static void test_selection() {
    std::cout << "\n=== Backend selection ===" << std::endl;

    SelectionPolicy policy;
    {
        TEST(simple_boundary);
        ASSERT_TRUE(select_backend(50'000'000, policy) == BackendVariant::Simple, "exactly 50MB is simple");
        ASSERT_TRUE(select_backend(50'000'001, policy) == BackendVariant::Chunked, "one more is chunked");
        PASS();
    }
    {
        TEST(typical_sizes);
        ASSERT_TRUE(select_backend(40'000'000, policy) == BackendVariant::Simple, "40MB simple");
        ASSERT_TRUE(select_backend(1'500'000'000, policy) == BackendVariant::Chunked, "1.5GB chunked");
        ASSERT_TRUE(!select_backend(2'500'000'000ULL, policy).has_value(), "2.5GB fits nothing");
        ASSERT_TRUE(select_backend(2'000'000'000, policy) == BackendVariant::Chunked, "2GB chunked");
        PASS();
    }
    {
        TEST(overrides);
        SelectionPolicy p = policy;
        p.skip_simple = true;
        ASSERT_TRUE(select_backend(1000, p) == BackendVariant::Chunked, "force chunked");
        p = policy;
        p.simple_enabled = false;
        ASSERT_TRUE(select_backend(1000, p) == BackendVariant::Chunked, "simple disabled");
        p = policy;
        p.chunked_enabled = false;
        ASSERT_TRUE(!select_backend(60'000'000, p).has_value(), "no chunked, too big");
        p = policy;
        p.force_simple = true;
        ASSERT_TRUE(select_backend(1000, p) == BackendVariant::Simple, "force simple");
        ASSERT_TRUE(select_backend(60'000'000, p) == BackendVariant::Chunked,
                    "force simple never exceeds the simple ceiling");
        PASS();
    }
    {
        TEST(backoff_growth);
        RetryPolicy rp;
        rp.initial_backoff = std::chrono::milliseconds(100);
        rp.multiplier = 2.0;
        rp.max_backoff = std::chrono::milliseconds(1000);
        rp.jitter = 0.0;
        ASSERT_EQ(backoff_delay(rp, 1, 0.5).count(), 100, "first");
        ASSERT_EQ(backoff_delay(rp, 2, 0.5).count(), 200, "second");
        ASSERT_EQ(backoff_delay(rp, 3, 0.5).count(), 400, "third");
        ASSERT_EQ(backoff_delay(rp, 10, 0.5).count(), 1000, "capped");
        rp.jitter = 0.2;
        auto lo = backoff_delay(rp, 1, 0.0).count();
        auto hi = backoff_delay(rp, 1, 0.999).count();
        ASSERT_TRUE(lo >= 80 && lo <= 81, "lower jitter bound");
        ASSERT_TRUE(hi >= 119 && hi <= 120, "upper jitter bound");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 6. TransferOrchestrator
// ---------------------------------------------------------------------------

static void test_orchestrator() {
    std::cout << "\n=== TransferOrchestrator ===" << std::endl;

    {
        TEST(transient_errors_retried_within_budget);
        FakeAdapter simple(BackendVariant::Simple, SIMPLE_MAX_OBJECT_BYTES);
        FakeAdapter chunked(BackendVariant::Chunked, CHUNKED_MAX_OBJECT_BYTES);
        simple.script({ErrorKind::TransientNetworkError, ErrorKind::TransientNetworkError,
                       ErrorKind::TransientNetworkError});
        MemoryMetadataStore store;
        RecordingListener listener;
        auto oc = fast_config(2);
        oc.retry.max_retries = 3;
        TransferOrchestrator orch(oc, &simple, &chunked, &store, &listener);
        orch.schedule(upload_unit("/data/report.pdf", 40'000'000));
        auto summary = orch.run();

        ASSERT_EQ(summary.succeeded, 1u, "uploaded");
        ASSERT_EQ(simple.put_calls.load(), 4, "four attempts");
        ASSERT_EQ(listener.retries.size(), 3u, "exactly three backoff delays");
        ASSERT_EQ(summary.outcomes[0].attempts, 4u, "attempt count");
        auto items = items_by_path(store);
        ASSERT_EQ(std::string(to_string(items["/data/report.pdf"].status)), "uploaded", "persisted");
        ASSERT_TRUE(items["/data/report.pdf"].remote.has_value(), "remote reference stored");
        ASSERT_EQ(items["/data/report.pdf"].remote->object_id, "tracked/report.pdf", "object key");
        PASS();
    }
    {
        TEST(retry_budget_exhausted);
        FakeAdapter simple(BackendVariant::Simple, SIMPLE_MAX_OBJECT_BYTES);
        simple.script({ErrorKind::TransientNetworkError, ErrorKind::TransientNetworkError,
                       ErrorKind::TransientNetworkError});
        MemoryMetadataStore store;
        RecordingListener listener;
        auto oc = fast_config(1);
        oc.retry.max_retries = 2;
        TransferOrchestrator orch(oc, &simple, nullptr, &store, &listener);
        orch.schedule(upload_unit("/data/a.txt", 100));
        auto summary = orch.run();
        ASSERT_EQ(summary.failed, 1u, "failed");
        ASSERT_EQ(simple.put_calls.load(), 3, "initial attempt plus two retries");
        auto items = items_by_path(store);
        ASSERT_EQ(std::string(to_string(items["/data/a.txt"].last_error)),
                  "transient_network_error", "error kind recorded");
        PASS();
    }
    {
        TEST(auth_error_not_retried);
        FakeAdapter simple(BackendVariant::Simple, SIMPLE_MAX_OBJECT_BYTES);
        simple.script({ErrorKind::AuthenticationError});
        MemoryMetadataStore store;
        RecordingListener listener;
        TransferOrchestrator orch(fast_config(1), &simple, nullptr, &store, &listener);
        orch.schedule(upload_unit("/data/b.txt", 100));
        auto summary = orch.run();
        ASSERT_EQ(summary.failed, 1u, "failed");
        ASSERT_EQ(simple.put_calls.load(), 1, "single attempt");
        ASSERT_EQ(listener.retries.size(), 0u, "no retries");
        ASSERT_EQ(std::string(to_string(summary.outcomes[0].error)), "authentication_error", "kind");
        ASSERT_TRUE(summary.outcomes[0].variant == BackendVariant::Simple, "variant reported");
        PASS();
    }
    {
        TEST(routing_by_size);
        FakeAdapter simple(BackendVariant::Simple, SIMPLE_MAX_OBJECT_BYTES);
        FakeAdapter chunked(BackendVariant::Chunked, CHUNKED_MAX_OBJECT_BYTES);
        MemoryMetadataStore store;
        TransferOrchestrator orch(fast_config(3), &simple, &chunked, &store, nullptr);
        orch.schedule(upload_unit("/data/small.bin", 40'000'000));
        orch.schedule(upload_unit("/data/medium.bin", 1'500'000'000));
        orch.schedule(upload_unit("/data/huge.bin", 2'500'000'000ULL));
        auto summary = orch.run();
        ASSERT_EQ(summary.succeeded, 2u, "two uploaded");
        ASSERT_EQ(summary.failed, 1u, "one too large");
        ASSERT_EQ(simple.put_calls.load(), 1, "simple got the small file");
        ASSERT_EQ(chunked.put_calls.load(), 1, "chunked got the medium file, not the huge one");
        auto items = items_by_path(store);
        ASSERT_EQ(std::string(to_string(items["/data/huge.bin"].last_error)),
                  "size_limit_exceeded", "huge file rejected");
        ASSERT_EQ(std::string(to_string(items["/data/huge.bin"].status)), "failed", "failed status");
        ASSERT_TRUE(items["/data/medium.bin"].remote->variant == BackendVariant::Chunked,
                    "medium stored via chunked");
        PASS();
    }
    {
        TEST(one_transfer_per_path);
        FakeAdapter simple(BackendVariant::Simple, SIMPLE_MAX_OBJECT_BYTES);
        simple.delay = std::chrono::milliseconds(15);
        MemoryMetadataStore store;
        TransferOrchestrator orch(fast_config(8), &simple, nullptr, &store, nullptr);
        orch.add_producer();
        RunSummary summary;
        std::thread runner([&] { summary = orch.run(); });

        int scheduled = 0;
        for (int i = 0; i < 24; ++i) {
            auto unit = upload_unit("/data/p" + std::to_string(i % 3), 10);
            while (!orch.schedule(unit)) {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            }
            ++scheduled;
        }
        orch.producer_done();
        runner.join();

        ASSERT_TRUE(!simple.overlap.load(), "never two transfers of the same path at once");
        ASSERT_EQ(simple.put_calls.load(), scheduled, "every unit ran");
        ASSERT_EQ(summary.succeeded, static_cast<size_t>(scheduled), "all uploaded");
        PASS();
    }
    {
        TEST(duplicate_in_queue_rejected);
        FakeAdapter simple(BackendVariant::Simple, SIMPLE_MAX_OBJECT_BYTES);
        TransferOrchestrator orch(fast_config(1), &simple, nullptr, nullptr, nullptr);
        ASSERT_TRUE(orch.schedule(upload_unit("/data/dup", 1)), "first accepted");
        ASSERT_TRUE(!orch.schedule(upload_unit("/data/dup", 1)), "second rejected");
        ASSERT_EQ(orch.queued(), 1u, "one queued");
        orch.run();
        PASS();
    }
    {
        TEST(cancel_leaves_pending);
        FakeAdapter simple(BackendVariant::Simple, SIMPLE_MAX_OBJECT_BYTES);
        simple.delay = std::chrono::milliseconds(200);
        MemoryMetadataStore store;
        RecordingListener listener;
        TransferOrchestrator orch(fast_config(1), &simple, nullptr, &store, &listener);
        for (int i = 0; i < 5; ++i) {
            orch.schedule(upload_unit("/data/c" + std::to_string(i), 100));
        }
        RunSummary summary;
        std::thread runner([&] { summary = orch.run(); });
        bool started = wait_for([&] { return simple.put_calls.load() >= 1; });
        orch.cancel();
        runner.join();

        ASSERT_TRUE(started, "first transfer started");
        ASSERT_TRUE(summary.cancelled, "run reports cancellation");
        ASSERT_EQ(simple.put_calls.load(), 1, "no new transfers after cancel");
        ASSERT_EQ(summary.outcomes.size(), 5u, "every unit accounted for");
        auto items = items_by_path(store);
        ASSERT_EQ(items.size(), 5u, "every unit persisted");
        for (auto& [path, item] : items) {
            bool ok = item.status == SyncStatus::Pending || item.status == SyncStatus::Uploaded;
            ASSERT_TRUE(ok, path + " left " + to_string(item.status));
        }
        PASS();
    }
    {
        TEST(progress_monotonic_across_retries);
        FakeAdapter chunked(BackendVariant::Chunked, CHUNKED_MAX_OBJECT_BYTES);
        chunked.script({ErrorKind::TransientNetworkError, ErrorKind::IntegrityError});
        RecordingListener listener;
        TransferOrchestrator orch(fast_config(1), nullptr, &chunked, nullptr, &listener);
        orch.schedule(upload_unit("/data/video.mp4", 100'000'000));
        auto summary = orch.run();
        ASSERT_EQ(summary.succeeded, 1u, "uploaded after integrity retry");
        auto& events = listener.progress["/data/video.mp4"];
        ASSERT_TRUE(!events.empty(), "progress reported");
        for (size_t i = 1; i < events.size(); ++i) {
            ASSERT_TRUE(events[i] >= events[i - 1], "bytes never go backwards");
        }
        ASSERT_EQ(events.back(), 100'000'000u, "ends at total");
        ASSERT_EQ(listener.done_events, 1, "one done event");
        PASS();
    }
    {
        TEST(download_unit);
        auto tmpdir = make_temp_dir("coldpack-dl");
        FakeAdapter simple(BackendVariant::Simple, SIMPLE_MAX_OBJECT_BYTES);
        TransferOrchestrator orch(fast_config(1), &simple, nullptr, nullptr, nullptr);
        TransferUnit unit;
        unit.direction = Direction::Download;
        unit.item.path = (tmpdir / "out" / "Backup_001.zip").string();
        RemoteReference ref;
        ref.variant = BackendVariant::Simple;
        ref.object_id = "zip_files/job/Backup_001.zip";
        ref.size = 1234;
        unit.remote = ref;
        unit.item.size = ref.size;
        orch.schedule(unit);
        auto summary = orch.run();
        ASSERT_EQ(summary.succeeded, 1u, "downloaded");
        ASSERT_EQ(fs::file_size(tmpdir / "out" / "Backup_001.zip"), 1234u, "file in place");
        ASSERT_TRUE(!fs::exists(tmpdir / "out" / ".Backup_001.zip.coldpack-download"),
                    "temporary removed");
        fs::remove_all(tmpdir);
        PASS();
    }
    {
        TEST(download_missing_file_reports_stat_error);
        auto tmpdir = make_temp_dir("coldpack-dl");
        FakeAdapter simple(BackendVariant::Simple, SIMPLE_MAX_OBJECT_BYTES);
        simple.write_target = false;
        auto oc = fast_config(1);
        oc.retry.max_retries = 1;
        TransferOrchestrator orch(oc, &simple, nullptr, nullptr, nullptr);
        TransferUnit unit;
        unit.direction = Direction::Download;
        unit.item.path = (tmpdir / "out" / "Backup_001.zip").string();
        RemoteReference ref;
        ref.variant = BackendVariant::Simple;
        ref.object_id = "zip_files/job/Backup_001.zip";
        ref.size = 1234;
        unit.remote = ref;
        unit.item.size = ref.size;
        orch.schedule(unit);
        auto summary = orch.run();
        ASSERT_EQ(summary.failed, 1u, "download failed");
        ASSERT_EQ(summary.outcomes.size(), 1u, "one outcome");
        const auto& outcome = summary.outcomes[0];
        ASSERT_EQ(std::string(to_string(outcome.error)), "integrity_error", "IntegrityError");
        ASSERT_TRUE(outcome.error_message.find("cannot stat downloaded") != std::string::npos,
                    "stat failure named: " + outcome.error_message);
        ASSERT_TRUE(outcome.error_message.find("18446744073709551615") == std::string::npos,
                    "no bogus byte count: " + outcome.error_message);
        ASSERT_TRUE(!fs::exists(tmpdir / "out" / "Backup_001.zip"), "nothing renamed into place");
        fs::remove_all(tmpdir);
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 7. Local adapters
// ---------------------------------------------------------------------------

static void test_local_backend() {
    std::cout << "\n=== Local backend ===" << std::endl;

    auto tmpdir = make_temp_dir("coldpack-local");
    auto store_root = tmpdir / "store";
    auto src = tmpdir / "file.bin";
    auto content = random_bytes(3500, 7);
    write_file(src, content);

    {
        TEST(size_limit_before_io);
        AdapterSettings s;
        s.max_object_bytes = 1000;
        auto simple = BackendFactory::create_local(BackendVariant::Simple, store_root, s);
        PutRequest req{src, "tracked/file.bin", 3500};
        auto r = simple->put(req, nullptr, nullptr);
        ASSERT_TRUE(!r.success, "must reject");
        ASSERT_EQ(std::string(to_string(r.error)), "size_limit_exceeded", "kind");
        ASSERT_TRUE(!fs::exists(store_root / "tracked" / "file.bin"), "nothing stored");
        PASS();
    }
    {
        TEST(chunked_progress_per_chunk);
        AdapterSettings s;
        s.chunk_size = 1000;
        auto chunked = BackendFactory::create_local(BackendVariant::Chunked, store_root, s);
        std::vector<uint64_t> seen;
        PutRequest req{src, "tracked/file.bin", 3500};
        auto r = chunked->put(req, [&](uint64_t done, uint64_t) { seen.push_back(done); }, nullptr);
        ASSERT_TRUE(r.success, "put: " + r.error_message);
        ASSERT_EQ(seen.size(), 4u, "four chunk boundaries");
        ASSERT_EQ(seen.back(), 3500u, "final progress");
        ASSERT_EQ(read_file(store_root / "tracked" / "file.bin"), content, "stored bytes");
        ASSERT_EQ(r.reference.size, 3500u, "reference size");
        ASSERT_EQ(r.reference.backend_type, "local", "backend type");
        PASS();
    }
    {
        TEST(chunked_cancel_between_chunks);
        AdapterSettings s;
        s.chunk_size = 1000;
        auto chunked = BackendFactory::create_local(BackendVariant::Chunked, store_root, s);
        CancelToken token;
        PutRequest req{src, "tracked/cancelled.bin", 3500};
        auto r = chunked->put(req, [&](uint64_t, uint64_t) { token.cancel(); }, &token);
        ASSERT_TRUE(!r.success, "cancelled");
        ASSERT_EQ(std::string(to_string(r.error)), "cancelled", "kind");
        ASSERT_TRUE(!fs::exists(store_root / "tracked" / "cancelled.bin"), "no object");
        ASSERT_TRUE(!fs::exists(store_root / "tracked" / "cancelled.bin.coldpack-staging"),
                    "no staging leftover");
        PASS();
    }
    {
        TEST(round_trip_get);
        auto simple = BackendFactory::create_local(BackendVariant::Simple, store_root, {});
        PutRequest req{src, "tracked/rt.bin", 3500};
        auto put = simple->put(req, nullptr, nullptr);
        ASSERT_TRUE(put.success, "put");
        auto target = tmpdir / "rt.out";
        auto get = simple->get(put.reference, target, nullptr, nullptr);
        ASSERT_TRUE(get.success, "get: " + get.error_message);
        ASSERT_EQ(get.bytes_written, 3500u, "bytes");
        ASSERT_EQ(read_file(target), content, "content");
        PASS();
    }
    {
        TEST(rejects_escaping_keys);
        auto simple = BackendFactory::create_local(BackendVariant::Simple, store_root, {});
        PutRequest req{src, "../outside.bin", 3500};
        auto r = simple->put(req, nullptr, nullptr);
        ASSERT_TRUE(!r.success, "must reject");
        ASSERT_TRUE(!fs::exists(tmpdir / "outside.bin"), "nothing written outside root");
        PASS();
    }
    {
        TEST(short_download_is_integrity_error);
        auto simple = BackendFactory::create_local(BackendVariant::Simple, store_root, {});
        PutRequest req{src, "tracked/short.bin", 3500};
        auto put = simple->put(req, nullptr, nullptr);
        ASSERT_TRUE(put.success, "put");
        // Damage the stored object
        write_file(store_root / "tracked" / "short.bin", content.substr(0, 1000));

        auto oc = fast_config(1);
        oc.retry.max_retries = 1;
        RecordingListener listener;
        TransferOrchestrator orch(oc, simple.get(), nullptr, nullptr, &listener);
        TransferUnit unit;
        unit.direction = Direction::Download;
        unit.item.path = (tmpdir / "restore" / "short.bin").string();
        unit.remote = put.reference;
        unit.item.size = put.reference.size;
        orch.schedule(unit);
        auto summary = orch.run();
        ASSERT_EQ(summary.failed, 1u, "failed");
        ASSERT_EQ(std::string(to_string(summary.outcomes[0].error)), "integrity_error", "kind");
        ASSERT_EQ(listener.retries.size(), 1u, "integrity errors are retried");
        ASSERT_TRUE(!fs::exists(tmpdir / "restore" / "short.bin"), "no partial file left");
        PASS();
    }
    {
        TEST(factory_errors);
        bool threw = false;
        try {
            BackendFactory::create(BackendVariant::Simple, "local", {}, {});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "local without path throws");
        threw = false;
        try {
            BackendFactory::create(BackendVariant::Simple, "ftp", {{"path", "/tmp"}}, {});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "unknown type throws");
        auto s3 = BackendFactory::create(BackendVariant::Chunked, "s3",
            {{"bucket", "b"}, {"access_key", "k"}, {"secret_key", "s"}}, {});
        ASSERT_TRUE(s3 != nullptr, "s3 adapter created without network access");
        ASSERT_EQ(s3->type_name(), "s3", "type");
        ASSERT_EQ(s3->max_object_bytes(), CHUNKED_MAX_OBJECT_BYTES, "default chunked ceiling");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 8. HTTP failure classification
// ---------------------------------------------------------------------------

static void test_http_classification() {
    std::cout << "\n=== HTTP failure classification ===" << std::endl;

    {
        TEST(status_codes);
        auto k = [](long status, const char* code) {
            return std::string(to_string(classify_http_failure(status, code, false, false)));
        };
        ASSERT_EQ(k(413, ""), "size_limit_exceeded", "413");
        ASSERT_EQ(k(400, "EntityTooLarge"), "size_limit_exceeded", "EntityTooLarge");
        ASSERT_EQ(k(401, ""), "authentication_error", "401");
        ASSERT_EQ(k(403, "AccessDenied"), "permission_denied", "403");
        ASSERT_EQ(k(503, "SlowDown"), "transient_network_error", "503");
        ASSERT_EQ(k(500, ""), "transient_network_error", "500");
        ASSERT_EQ(k(429, ""), "transient_network_error", "429");
        ASSERT_EQ(k(404, "NoSuchKey"), "io_error", "404");
        PASS();
    }
    {
        TEST(network_and_timeout);
        ASSERT_EQ(std::string(to_string(classify_http_failure(0, "", true, false))),
                  "transient_network_error", "network error");
        ASSERT_EQ(std::string(to_string(classify_http_failure(0, "", false, true))),
                  "transient_network_error", "timeout");
        ASSERT_TRUE(is_retryable(ErrorKind::TransientNetworkError), "transient retryable");
        ASSERT_TRUE(is_retryable(ErrorKind::IntegrityError), "integrity retryable");
        ASSERT_TRUE(!is_retryable(ErrorKind::PermissionDenied), "quota not retryable");
        ASSERT_TRUE(!is_retryable(ErrorKind::SizeLimitExceeded), "size not retryable");
        PASS();
    }
    {
        TEST(s3_attempts_follow_orchestrator_budget);
        setenv("no_proxy", "127.0.0.1", 1);  // talk to the loopback server directly
        CannedHttpServer server("HTTP/1.1 503 Service Unavailable\r\n"
                                "Content-Length: 0\r\nConnection: close\r\n\r\n");
        auto tmpdir = make_temp_dir("coldpack-s3");
        auto src = tmpdir / "a.bin";
        write_file(src, random_bytes(100, 3));

        AdapterSettings settings;
        settings.connect_timeout_secs = 2;
        settings.request_timeout_secs = 5;
        auto s3 = BackendFactory::create(BackendVariant::Simple, "s3",
            {{"bucket", "b"}, {"access_key", "k"}, {"secret_key", "s"},
             {"endpoint", server.url()}, {"use_path_style", "true"}}, settings);

        PutRequest req;
        req.source = src;
        req.key = "tracked/a.bin";
        req.size = 100;
        auto put = s3->put(req, nullptr, nullptr);
        ASSERT_TRUE(!put.success, "503 fails the put");
        ASSERT_EQ(std::string(to_string(put.error)), "transient_network_error", "503 is transient");
        ASSERT_EQ(server.requests.load(), 1, "one request per put");

        auto oc = fast_config(1);
        oc.retry.max_retries = 2;
        RecordingListener listener;
        TransferOrchestrator orch(oc, s3.get(), nullptr, nullptr, &listener);
        orch.schedule(upload_unit(src.string(), 100));
        auto summary = orch.run();
        ASSERT_EQ(summary.failed, 1u, "unit failed");
        ASSERT_EQ(listener.retries.size(), 2u, "two retries");
        ASSERT_EQ(server.requests.load(), 4, "initial attempt plus two retries");
        fs::remove_all(tmpdir);
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 9. SQLite manifest
// ---------------------------------------------------------------------------

static void test_sqlite_store() {
    std::cout << "\n=== SQLite manifest ===" << std::endl;

    auto tmpdir = make_temp_dir("coldpack-sqlite");
    auto db = tmpdir / "state" / "manifest.db";

    {
        TEST(save_and_load);
        SqliteMetadataStore store(db);
        auto err = store.open();
        ASSERT_EMPTY(err, "open");

        SyncItem a;
        a.path = "/data/b.txt";
        a.size = 10;
        a.mtime = 1700000000;
        a.status = SyncStatus::Uploaded;
        a.sig = "10:1700000000";
        RemoteReference ref;
        ref.variant = BackendVariant::Chunked;
        ref.backend_type = "s3";
        ref.object_id = "tracked/b.txt";
        ref.etag = "\"abc\"";
        ref.size = 10;
        a.remote = ref;

        SyncItem b;
        b.path = "/data/a.txt";
        b.size = 5;
        b.status = SyncStatus::Uploading;

        SyncItem c;
        c.path = "/staging/Backup_001.zip";
        c.size = 500;
        c.status = SyncStatus::Queued;
        c.job_id = "20260101_000000_ABCDE";

        SyncItem d;
        d.path = "/data/c.txt";
        d.status = SyncStatus::Failed;
        d.last_error = ErrorKind::PermissionDenied;
        d.error_message = "quota exceeded";

        ASSERT_TRUE(store.save({a, b, c, d}), "save");
        auto items = store.load();
        ASSERT_EQ(items.size(), 4u, "four items");
        ASSERT_EQ(items[0].path, "/data/a.txt", "ordered by path");
        ASSERT_TRUE(items[1].remote.has_value(), "remote loaded");
        ASSERT_EQ(items[1].remote->etag, "\"abc\"", "etag");
        ASSERT_TRUE(items[1].remote->variant == BackendVariant::Chunked, "variant");
        ASSERT_EQ(std::string(to_string(items[2].last_error)), "permission_denied", "error kind");
        ASSERT_EQ(items[2].error_message, "quota exceeded", "message");
        PASS();
    }
    {
        TEST(crash_recovery_on_open);
        SqliteMetadataStore store(db);
        auto err = store.open();
        ASSERT_EMPTY(err, "reopen");
        ASSERT_EQ(store.recovered(), 2u, "uploading and queued reset");
        auto items = items_by_path(store);
        ASSERT_EQ(std::string(to_string(items["/data/a.txt"].status)), "pending", "uploading -> pending");
        ASSERT_EQ(std::string(to_string(items["/staging/Backup_001.zip"].status)), "pending",
                  "queued -> pending");
        ASSERT_EQ(items["/staging/Backup_001.zip"].job_id, "20260101_000000_ABCDE", "job id kept");
        ASSERT_EQ(std::string(to_string(items["/data/b.txt"].status)), "uploaded", "uploaded kept");
        auto counts = store.counts_by_status();
        ASSERT_EQ(counts[SyncStatus::Pending], 2u, "two pending");
        ASSERT_EQ(counts[SyncStatus::Uploaded], 1u, "one uploaded");
        ASSERT_EQ(counts[SyncStatus::Failed], 1u, "one failed");
        PASS();
    }
    {
        TEST(upsert_by_path);
        SqliteMetadataStore store(db);
        auto err = store.open();
        ASSERT_EMPTY(err, "open");
        SyncItem a;
        a.path = "/data/a.txt";
        a.size = 6;
        a.status = SyncStatus::Uploaded;
        ASSERT_TRUE(store.save({a}), "save");
        auto items = items_by_path(store);
        ASSERT_EQ(items.size(), 4u, "no duplicate row");
        ASSERT_EQ(items["/data/a.txt"].size, 6u, "updated size");
        ASSERT_TRUE(!items["/data/a.txt"].remote.has_value(), "remote cleared");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 10. Scanner
// ---------------------------------------------------------------------------

static void test_scanner() {
    std::cout << "\n=== Tracked-file scanner ===" << std::endl;

    auto tmpdir = make_temp_dir("coldpack-scan");
    auto dir = fs::absolute(tmpdir / "tracked");
    write_file(dir / "notes.txt", "notes");
    write_file(dir / "sub" / "photo.jpg", "jpeg");
    write_file(dir / "download.crdownload", "partial");
    write_file(dir / "~$report.docx", "lock");
    write_file(dir / "scratch.TMP", "tmp");

    {
        TEST(ignored_names);
        ASSERT_TRUE(is_ignored_name("~$budget.xlsx"), "office lock");
        ASSERT_TRUE(is_ignored_name("movie.PART"), "case-insensitive suffix");
        ASSERT_TRUE(is_ignored_name("x.partial"), "partial");
        ASSERT_TRUE(!is_ignored_name("partial.txt"), "suffix only");
        PASS();
    }
    {
        TEST(scan_new_files);
        auto items = scan_tracked(dir, {}, false);
        ASSERT_EQ(items.size(), 2u, "two tracked files");
        ASSERT_EQ(items[0].path, (dir / "notes.txt").string(), "sorted by path");
        ASSERT_EQ(std::string(to_string(items[0].status)), "pending", "pending");
        ASSERT_TRUE(items[0].sig.starts_with("5:"), "signature has size");
        PASS();
    }
    {
        TEST(unchanged_uploaded_skipped);
        auto first = scan_tracked(dir, {}, true);
        std::map<std::string, SyncItem> known;
        for (auto item : first) {
            item.status = SyncStatus::Uploaded;
            known[item.path] = item;
        }
        // Failed items come back even when unchanged
        known[(dir / "notes.txt").string()].status = SyncStatus::Failed;
        auto again = scan_tracked(dir, known, true);
        ASSERT_EQ(again.size(), 1u, "only the failed file");
        ASSERT_EQ(again[0].path, (dir / "notes.txt").string(), "notes retried");
        ASSERT_EQ(again[0].sha256.size(), 64u, "sha256 hex");

        write_file(dir / "sub" / "photo.jpg", "a different jpeg");
        known[(dir / "notes.txt").string()].status = SyncStatus::Uploaded;
        again = scan_tracked(dir, known, true);
        ASSERT_EQ(again.size(), 1u, "changed file detected");
        ASSERT_EQ(again[0].path, (dir / "sub" / "photo.jpg").string(), "photo changed");
        PASS();
    }
    {
        TEST(sha256_known_value);
        write_file(tmpdir / "abc.txt", "abc");
        ASSERT_EQ(sha256_file(tmpdir / "abc.txt"),
                  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "sha256(abc)");
        ASSERT_EQ(human_size(512), "512 B", "bytes");
        ASSERT_EQ(human_size(1536), "1.5 KB", "kilobytes");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 11. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;

    auto tmpdir = make_temp_dir("coldpack-metrics");
    auto prom_path = tmpdir / "coldpack.prom";

    {
        TEST(creates_prom_file);
        MetricsExporter exporter(prom_path, std::chrono::seconds(1), {{"backup", "Docs"}});
        exporter.start();
        bool created = wait_for([&] { return fs::exists(prom_path); }, 5000);
        exporter.stop();

        ASSERT_TRUE(created, ".prom file should be created");
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("coldpack_transfers_total") != std::string::npos, "transfers");
        ASSERT_TRUE(content.find("coldpack_items") != std::string::npos, "items gauge");
        ASSERT_TRUE(content.find("coldpack_transfer_duration_seconds") != std::string::npos,
                    "duration histogram");
        ASSERT_TRUE(content.find("backup=\"Docs\"") != std::string::npos, "constant label");
        PASS();
    }
    {
        TEST(counters_and_store_gauges);
        fs::remove(prom_path);
        SqliteMetadataStore store(tmpdir / "manifest.db");
        auto err = store.open();
        ASSERT_EMPTY(err, "open store");
        SyncItem item;
        item.path = "/x";
        item.status = SyncStatus::Failed;
        store.save({item});

        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {});
        exporter.set_store(&store);
        exporter.transfers(Direction::Upload, true).Increment(3);
        exporter.transfer_bytes(Direction::Upload).Increment(4096);
        exporter.archive_parts().Increment();
        {
            ScopedTimer timer(exporter.part_duration());
        }
        exporter.stop();

        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("coldpack_transfers_total{direction=\"upload\",result=\"success\"} 3")
                        != std::string::npos, "upload success count");
        ASSERT_TRUE(content.find("coldpack_items{status=\"failed\"} 1") != std::string::npos,
                    "failed items gauge");
        ASSERT_TRUE(content.find("coldpack_archive_part_duration_seconds_count 1") != std::string::npos,
                    "timer observed");
        auto tmp = prom_path;
        tmp += ".tmp";
        ASSERT_TRUE(!fs::exists(tmp), ".tmp file should not persist");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 12. BackupJob end to end
// ---------------------------------------------------------------------------

static void test_backup_job() {
    std::cout << "\n=== BackupJob end to end ===" << std::endl;

    auto tmpdir = make_temp_dir("coldpack-job");
    auto source = tmpdir / "Documents";
    auto tracked = tmpdir / "Inbox";

    std::map<std::string, std::string> expected;
    for (int i = 0; i < 12; ++i) {
        auto rel = "dir" + std::to_string(i % 3) + "/file" + std::to_string(i) + ".dat";
        expected[rel] = random_bytes(8000, static_cast<uint32_t>(100 + i));
        write_file(source / rel, expected[rel]);
    }
    write_file(tracked / "letter.txt", "dear coldpack");
    write_file(tracked / "scan.pdf", random_bytes(30000, 5));

    BackupConfig cfg;
    cfg.command = "backup";
    cfg.source_dir = source;
    cfg.tracked_dir = tracked;
    cfg.archive_ceiling = 40000;
    cfg.archive_workers = 2;
    cfg.simple.type = "local";
    cfg.simple.params["path"] = (tmpdir / "remote-simple").string();
    cfg.chunked.type = "local";
    cfg.chunked.params["path"] = (tmpdir / "remote-chunked").string();
    cfg.simple_ceiling = 20000;
    cfg.chunk_size = 4096;
    cfg.initial_backoff_ms = 1;
    cfg.max_backoff_ms = 5;
    cfg.metrics_file = tmpdir / "coldpack.prom";
    cfg.restore_dir = tmpdir / "Restored";
    cfg.apply_defaults();

    std::string job_id;
    {
        TEST(backup_uploads_parts_and_tracked_files);
        BackupJob job(cfg);
        auto err = job.start();
        ASSERT_EMPTY(err, "start");
        auto result = job.backup();
        ASSERT_TRUE(result.success, "backup: " + result.error_message);
        ASSERT_TRUE(result.parts.size() >= 3, "several parts");
        ASSERT_EQ(result.succeeded, result.parts.size() + 2, "parts plus tracked files");
        job_id = result.job_id;

        auto counts = job.status_counts();
        ASSERT_EQ(counts[SyncStatus::Uploaded], result.parts.size() + 2, "all uploaded");
        ASSERT_TRUE(fs::exists(tmpdir / "remote-chunked" / "tracked" / "scan.pdf"),
                    "large tracked file on chunked backend");
        ASSERT_TRUE(fs::exists(tmpdir / "remote-simple" / "tracked" / "letter.txt"),
                    "small tracked file on simple backend");
        // Every part is above the lowered simple ceiling
        ASSERT_TRUE(fs::exists(tmpdir / "remote-chunked" / "zip_files" / job_id / "Backup_001.zip"),
                    "part under its job");
        job.stop();
        ASSERT_TRUE(read_file(cfg.metrics_file).find("coldpack_archive_parts_total") !=
                        std::string::npos, "metrics written");
        PASS();
    }
    {
        TEST(second_backup_skips_unchanged_tracked_files);
        BackupJob job(cfg);
        auto err = job.start();
        ASSERT_EMPTY(err, "start");
        auto result = job.backup();
        ASSERT_TRUE(result.success, "backup: " + result.error_message);
        ASSERT_EQ(result.succeeded, result.parts.size(), "only the new job's parts");
        ASSERT_TRUE(result.job_id != job_id, "new job id");
        PASS();
    }
    {
        TEST(restore_job);
        auto rcfg = cfg;
        rcfg.command = "restore";
        rcfg.job_id = job_id;
        BackupJob job(rcfg);
        auto err = job.start();
        ASSERT_EMPTY(err, "start");
        auto result = job.restore();
        ASSERT_TRUE(result.success, "restore: " + result.error_message);
        ASSERT_TRUE(snapshot_tree(rcfg.restore_dir) == expected, "restored tree matches");
        ASSERT_TRUE(!job.latest_job().empty(), "latest job known");
        PASS();
    }
    {
        TEST(failed_source_file_not_uploaded_as_part);
        auto fcfg = cfg;
        fcfg.tracked_dir.clear();
        auto file = source / "dir0" / "file0.dat";
        {
            BackupJob job(fcfg);
            auto err = job.start();
            ASSERT_EMPTY(err, "start");
            // A source file recorded as failed alongside the first job's parts
            SyncItem item;
            item.path = file.string();
            item.size = fs::file_size(file);
            item.status = SyncStatus::Failed;
            item.job_id = job_id;
            item.last_error = ErrorKind::IOError;
            item.error_message = "cannot open dir0/file0.dat";
            ASSERT_TRUE(job.store()->save({item}), "seed manifest");

            auto result = job.backup();
            ASSERT_TRUE(result.success, "backup: " + result.error_message);
            ASSERT_EQ(result.succeeded, result.parts.size(), "only the new parts uploaded");
            for (const auto* remote : {"remote-simple", "remote-chunked"}) {
                ASSERT_TRUE(!fs::exists(tmpdir / remote / "zip_files" / job_id / "file0.dat"),
                            "source file not stored as a part");
            }
            auto items = items_by_path(*job.store());
            ASSERT_EQ(std::string(to_string(items[file.string()].status)), "failed",
                      "failed record left alone");
            job.stop();
        }

        auto rcfg = cfg;
        rcfg.command = "restore";
        rcfg.job_id = job_id;
        rcfg.restore_dir = tmpdir / "Restored2";
        BackupJob job(rcfg);
        auto err = job.start();
        ASSERT_EMPTY(err, "start");
        auto result = job.restore();
        ASSERT_TRUE(result.success, "restore: " + result.error_message);
        ASSERT_TRUE(snapshot_tree(rcfg.restore_dir) == expected, "restored tree matches");
        PASS();
    }
    {
        TEST(unpack_local_parts);
        auto ucfg = cfg;
        ucfg.command = "unpack";
        ucfg.parts_dir = cfg.staging_dir / "zip_files" / job_id;
        ucfg.restore_dir = tmpdir / "Unpacked";
        BackupJob job(ucfg);
        auto err = job.start();
        ASSERT_EMPTY(err, "start");
        auto result = job.unpack();
        ASSERT_TRUE(result.success, "unpack: " + result.error_message);
        ASSERT_TRUE(snapshot_tree(ucfg.restore_dir) == expected, "unpacked tree matches");
        PASS();
    }
    {
        TEST(cancelled_backup_leaves_nothing_uploading);
        auto ccfg = cfg;
        ccfg.tracked_dir.clear();
        BackupJob job(ccfg);
        auto err = job.start();
        ASSERT_EMPTY(err, "start");
        job.cancel();
        auto result = job.backup();
        ASSERT_TRUE(result.cancelled, "cancelled");
        ASSERT_TRUE(!result.success, "not a success");
        auto counts = job.status_counts();
        ASSERT_EQ(counts[SyncStatus::Uploading], 0u, "nothing stuck uploading");
        ASSERT_EQ(counts[SyncStatus::Queued], 0u, "nothing stuck queued");
        PASS();
    }
    {
        TEST(object_keys);
        ASSERT_EQ(BackupJob::part_object_key("J", "Backup_002.zip"), "zip_files/J/Backup_002.zip",
                  "part key");
        ASSERT_EQ(BackupJob::tracked_object_key(tracked, tracked / "sub" / "x.txt"),
                  "tracked/sub/x.txt", "tracked key");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "coldpack test suite" << std::endl;
    std::cout << "===================" << std::endl;

    test_backend_config_validation();
    test_config();
    test_sized_writer();
    test_archiver();
    test_selection();
    test_orchestrator();
    test_local_backend();
    test_http_classification();
    test_sqlite_store();
    test_scanner();
    test_metrics();
    test_backup_job();

    std::cout << "\n===================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
