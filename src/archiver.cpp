#include "coldpack/archiver.hpp"
#include "coldpack/log.hpp"
#include "coldpack/sized_writer.hpp"
#include "coldpack/thread_pool.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <fstream>
#include <future>
#include <memory>
#include <optional>
#include <random>
#include <sys/stat.h>
#include <unistd.h>

namespace coldpack {

namespace {

constexpr size_t IO_BLOCK = 64 * 1024;

// Local header + data descriptor + central directory record, each with
// room for the zip64, timestamp and unix extra fields libarchive emits.
constexpr uint64_t PER_ENTRY_OVERHEAD = 256;

la_ssize_t archive_write_cb(struct archive* a, void* client, const void* buf, size_t len) {
    auto* writer = static_cast<SizedWriter*>(client);
    if (!writer->write(buf, len)) {
        archive_set_error(a, writer->disk_full() ? ENOSPC : EIO, "%s",
                          writer->last_error().c_str());
        return -1;
    }
    return static_cast<la_ssize_t>(len);
}

using WriteArchive = std::unique_ptr<struct archive, decltype(&archive_write_free)>;
using ReadArchive = std::unique_ptr<struct archive, decltype(&archive_read_free)>;

struct ContainerAttempt {
    ErrorKind error = ErrorKind::None;
    std::string error_message;
    std::optional<size_t> failed_entry;  // source file that could not be read
    uint64_t size = 0;
};

ErrorKind writer_error_kind(const SizedWriter& writer) {
    return writer.disk_full() ? ErrorKind::DiskFull : ErrorKind::IOError;
}

// Write one container holding `entries`. On a source read failure the
// container is left half-written and `failed_entry` names the culprit.
ContainerAttempt write_container(const std::filesystem::path& path, uint64_t capacity,
                                 const std::vector<PlannedEntry>& entries,
                                 const CancelToken* cancel, const std::atomic<bool>& abort) {
    ContainerAttempt attempt;

    SizedWriter writer(path, capacity);
    auto err = writer.open();
    if (!err.empty()) {
        attempt.error = writer_error_kind(writer);
        attempt.error_message = err;
        return attempt;
    }

    WriteArchive a(archive_write_new(), archive_write_free);
    auto fail = [&](ErrorKind kind, const std::string& msg) {
        archive_write_fail(a.get());
        a.reset();
        writer.discard();
        attempt.error = kind;
        attempt.error_message = msg;
        return attempt;
    };

    if (archive_write_set_format_zip(a.get()) != ARCHIVE_OK ||
        archive_write_zip_set_compression_deflate(a.get()) != ARCHIVE_OK) {
        return fail(ErrorKind::IOError,
                    std::string("zip writer setup failed: ") + archive_error_string(a.get()));
    }
    archive_write_set_bytes_per_block(a.get(), 0);
    archive_write_set_bytes_in_last_block(a.get(), 1);

    if (archive_write_open(a.get(), &writer, nullptr, archive_write_cb, nullptr) != ARCHIVE_OK) {
        return fail(writer_error_kind(writer),
                    std::string("cannot open container: ") + archive_error_string(a.get()));
    }

    std::vector<char> buf(IO_BLOCK);

    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        if (abort.load() || (cancel && cancel->cancelled())) {
            return fail(ErrorKind::Cancelled, "archiving cancelled");
        }

        int fd = ::open(e.absolute.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            attempt.failed_entry = i;
            attempt.error_message = "cannot open " + e.relative + ": " + strerror(errno);
            fail(ErrorKind::IOError, attempt.error_message);
            return attempt;
        }

        struct stat st;
        if (fstat(fd, &st) != 0 || static_cast<uint64_t>(st.st_size) != e.size) {
            ::close(fd);
            attempt.failed_entry = i;
            attempt.error_message = "file changed since planning: " + e.relative;
            fail(ErrorKind::IOError, attempt.error_message);
            return attempt;
        }

        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, e.relative.c_str());
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, st.st_mode & 0777);
        archive_entry_set_size(entry, static_cast<la_int64_t>(e.size));
        archive_entry_set_mtime(entry, static_cast<time_t>(e.mtime), 0);

        int r = archive_write_header(a.get(), entry);
        archive_entry_free(entry);
        if (r != ARCHIVE_OK) {
            ::close(fd);
            return fail(writer_error_kind(writer),
                        "write header for " + e.relative + ": " + archive_error_string(a.get()));
        }

        uint64_t remaining = e.size;
        while (remaining > 0) {
            if (abort.load() || (cancel && cancel->cancelled())) {
                ::close(fd);
                return fail(ErrorKind::Cancelled, "archiving cancelled");
            }
            ssize_t n = ::read(fd, buf.data(), std::min<uint64_t>(buf.size(), remaining));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                attempt.failed_entry = i;
                attempt.error_message = n < 0
                    ? "read " + e.relative + ": " + strerror(errno)
                    : "file shrank while reading: " + e.relative;
                ::close(fd);
                fail(ErrorKind::IOError, attempt.error_message);
                return attempt;
            }
            if (archive_write_data(a.get(), buf.data(), static_cast<size_t>(n)) < 0) {
                ::close(fd);
                return fail(writer_error_kind(writer),
                            "write data for " + e.relative + ": " + archive_error_string(a.get()));
            }
            remaining -= static_cast<uint64_t>(n);
        }
        ::close(fd);
    }

    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        return fail(writer_error_kind(writer),
                    std::string("finalize container: ") + archive_error_string(a.get()));
    }
    a.reset();

    if (!writer.close()) {
        ErrorKind kind = writer_error_kind(writer);
        std::string msg = writer.last_error();
        writer.discard();
        attempt.error = kind;
        attempt.error_message = msg;
        return attempt;
    }

    attempt.size = writer.bytes_written();
    return attempt;
}

// Index parsed from "<base>_<NNN>.zip"; 0 when the name does not match.
uint32_t part_index_from_name(const std::filesystem::path& p) {
    auto stem = p.stem().string();
    auto us = stem.rfind('_');
    if (us == std::string::npos || us + 1 >= stem.size()) return 0;
    try {
        return static_cast<uint32_t>(std::stoul(stem.substr(us + 1)));
    } catch (const std::exception&) {
        return 0;
    }
}

bool is_safe_entry_path(const std::string& name) {
    if (name.empty() || name.front() == '/') return false;
    for (const auto& part : std::filesystem::path(name)) {
        if (part == "..") return false;
    }
    return true;
}

bool files_identical(const std::filesystem::path& a, const std::filesystem::path& b) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(b, ec)) return false;
    auto sa = std::filesystem::file_size(a, ec);
    if (ec) return false;
    auto sb = std::filesystem::file_size(b, ec);
    if (ec || sa != sb) return false;

    std::ifstream fa(a, std::ios::binary);
    std::ifstream fb(b, std::ios::binary);
    if (!fa || !fb) return false;

    std::vector<char> ba(IO_BLOCK), bb(IO_BLOCK);
    while (fa && fb) {
        fa.read(ba.data(), ba.size());
        fb.read(bb.data(), bb.size());
        auto na = fa.gcount();
        auto nb = fb.gcount();
        if (na != nb) return false;
        if (na == 0) break;
        if (std::memcmp(ba.data(), bb.data(), static_cast<size_t>(na)) != 0) return false;
    }
    return true;
}

}  // namespace

Archiver::Archiver(const ArchiverConfig& config) : config_(config) {}

// --- Planning ---

uint64_t Archiver::estimate_entry_bytes(const std::string& name, uint64_t size) {
    // Deflate never expands by more than a few bytes per 16 KiB stored block
    uint64_t data_bound = size + (size >> 10) + 64;
    return data_bound + PER_ENTRY_OVERHEAD + 2 * static_cast<uint64_t>(name.size());
}

std::vector<PlannedPart> Archiver::partition(const std::vector<PlannedEntry>& entries,
                                             uint64_t ceiling) {
    std::vector<PlannedPart> parts;
    PlannedPart current;
    current.estimated_size = CONTAINER_RESERVE;

    auto seal = [&]() {
        if (current.entries.empty()) return;
        current.index = static_cast<uint32_t>(parts.size() + 1);
        parts.push_back(std::move(current));
        current = PlannedPart{};
        current.estimated_size = CONTAINER_RESERVE;
    };

    for (const auto& e : entries) {
        uint64_t est = estimate_entry_bytes(e.relative, e.size);

        if (est + CONTAINER_RESERVE > ceiling) {
            // Never split a file: it gets a container of its own
            seal();
            PlannedPart alone;
            alone.entries.push_back(e);
            alone.estimated_size = est + CONTAINER_RESERVE;
            alone.oversized = true;
            alone.index = static_cast<uint32_t>(parts.size() + 1);
            parts.push_back(std::move(alone));
            continue;
        }

        if (!current.entries.empty() && current.estimated_size + est > ceiling) {
            seal();
        }
        current.entries.push_back(e);
        current.estimated_size += est;
    }
    seal();
    return parts;
}

ArchivePlan Archiver::plan(const std::filesystem::path& source_dir) const {
    return plan(source_dir, config_.ceiling, config_.base_name);
}

ArchivePlan Archiver::plan(const std::filesystem::path& source_dir, uint64_t ceiling,
                           const std::string& base_name) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(source_dir, ec)) {
        throw std::runtime_error("source is not a directory: " + source_dir.string());
    }

    ArchivePlan plan;
    plan.source_dir = std::filesystem::absolute(source_dir);
    plan.ceiling = ceiling;
    plan.base_name = base_name;
    plan.job_id = make_job_id();
    plan.output_dir = config_.staging_dir / "zip_files" / plan.job_id;

    auto staging = config_.staging_dir.empty()
        ? std::filesystem::path{}
        : std::filesystem::weakly_canonical(config_.staging_dir, ec);

    std::vector<PlannedEntry> entries;
    std::filesystem::recursive_directory_iterator it(
        plan.source_dir, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw std::runtime_error("cannot read " + source_dir.string() + ": " + ec.message());
    }

    std::error_code walk_ec;
    for (auto end = std::filesystem::recursive_directory_iterator(); it != end;
         it.increment(walk_ec)) {
        const auto& de = *it;

        // Staging may live inside the source tree; never archive our own output
        if (!staging.empty() && de.is_directory(ec) &&
            std::filesystem::weakly_canonical(de.path(), ec) == staging) {
            it.disable_recursion_pending();
            continue;
        }
        if (de.is_symlink(ec) || !de.is_regular_file(ec)) continue;

        PlannedEntry e;
        e.absolute = de.path();
        e.relative = std::filesystem::relative(de.path(), plan.source_dir).generic_string();
        e.size = de.file_size(ec);
        if (ec) {
            ec.clear();
            e.size = 0;
        }
        auto mt = de.last_write_time(ec);
        e.mtime = ec ? 0 : to_epoch(mt);
        ec.clear();
        entries.push_back(std::move(e));
    }
    // A failed increment leaves the iterator at end; the listing is partial
    if (walk_ec) {
        throw std::runtime_error("cannot walk " + source_dir.string() + ": " + walk_ec.message());
    }

    std::sort(entries.begin(), entries.end(),
              [](const PlannedEntry& a, const PlannedEntry& b) { return a.relative < b.relative; });

    for (const auto& e : entries) plan.total_bytes += e.size;
    plan.total_files = entries.size();
    plan.parts = partition(entries, ceiling);
    return plan;
}

// --- Packing ---

Archiver::BuildResult Archiver::build_part(const ArchivePlan& plan, const PlannedPart& planned,
                                           const CancelToken* cancel,
                                           const std::atomic<bool>& abort) {
    BuildResult result;
    auto path = plan.output_dir / part_file_name(plan.base_name, planned.index);
    uint64_t capacity = planned.oversized ? 0 : plan.ceiling;

    // Source files are not part records and carry no job id
    auto failed_item = [](const PlannedEntry& e, const std::string& message) {
        SyncItem item;
        item.path = e.absolute.string();
        item.size = e.size;
        item.mtime = e.mtime;
        item.status = SyncStatus::Failed;
        item.last_error = ErrorKind::IOError;
        item.error_message = message;
        item.updated_at = now_epoch();
        return item;
    };

    // Only a full disk or cancellation stops the run. Any other container
    // failure costs this part's files and packing carries on.
    auto give_up_part = [&](const std::vector<PlannedEntry>& lost, const std::string& message) {
        log_error("Archive part %u abandoned, %zu files not archived: %s", planned.index,
                  lost.size(), message.c_str());
        std::error_code ec;
        if (!std::filesystem::is_directory(path, ec)) std::filesystem::remove(path, ec);
        for (const auto& e : lost) result.failed.push_back(failed_item(e, message));
    };

    std::vector<PlannedEntry> entries = planned.entries;
    try {
        while (!entries.empty()) {
            auto attempt = write_container(path, capacity, entries, cancel, abort);

            if (attempt.failed_entry) {
                // Drop the unreadable file and rebuild under the same index
                const auto& bad = entries[*attempt.failed_entry];
                log_warn("Archive part %u: %s", planned.index, attempt.error_message.c_str());
                result.failed.push_back(failed_item(bad, attempt.error_message));
                entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(*attempt.failed_entry));
                continue;
            }

            if (attempt.error == ErrorKind::DiskFull || attempt.error == ErrorKind::Cancelled) {
                result.error = attempt.error;
                result.error_message = attempt.error_message;
                return result;
            }
            if (attempt.error != ErrorKind::None) {
                give_up_part(entries, "archive part " + std::to_string(planned.index) + ": " +
                                          attempt.error_message);
                return result;
            }

            result.produced = true;
            result.part.index = planned.index;
            result.part.size = attempt.size;
            result.part.job_id = plan.job_id;
            result.part.path = path;
            result.part.oversized = planned.oversized;
            for (const auto& e : entries) {
                result.part.entries.push_back(e.relative);
                result.bytes_in += e.size;
            }
            return result;
        }
    } catch (const std::exception& e) {
        give_up_part(entries, std::string("archive part ") + std::to_string(planned.index) +
                                  ": " + e.what());
    }
    return result;
}

PackResult Archiver::pack(const ArchivePlan& plan, ArchiveListener* listener,
                          const CancelToken* cancel) {
    auto start = std::chrono::steady_clock::now();
    PackResult result;
    result.job_id = plan.job_id;

    std::error_code ec;
    std::filesystem::create_directories(plan.output_dir, ec);
    if (ec) {
        result.error = ec == std::errc::no_space_on_device ? ErrorKind::DiskFull : ErrorKind::IOError;
        result.error_message = "cannot create " + plan.output_dir.string() + ": " + ec.message();
        return result;
    }

    size_t workers = config_.workers;
    if (workers == 0) workers = std::max(1u, std::thread::hardware_concurrency());
    workers = std::min(workers, std::max<size_t>(1, plan.parts.size()));

    log_info("Packing %zu files (%lu bytes) from %s into %zu parts, job %s",
             plan.total_files, static_cast<unsigned long>(plan.total_bytes),
             plan.source_dir.c_str(), plan.parts.size(), plan.job_id.c_str());

    std::atomic<bool> abort{false};
    ThreadPool pool(workers);
    std::vector<std::future<BuildResult>> futures;
    futures.reserve(plan.parts.size());
    for (const auto& planned : plan.parts) {
        futures.push_back(pool.submit([this, &plan, &planned, cancel, &abort]() {
            return build_part(plan, planned, cancel, abort);
        }));
    }

    // Release in index order; later parts may already be sealed and waiting
    bool fatal = false;
    for (auto& fut : futures) {
        BuildResult br = fut.get();

        for (auto& item : br.failed) {
            if (listener) listener->on_file_failed(item);
            result.failed.push_back(std::move(item));
        }

        if (fatal) {
            if (br.produced) std::filesystem::remove(br.part.path, ec);
            continue;
        }

        if (br.error != ErrorKind::None) {
            fatal = true;
            abort = true;
            result.error = br.error;
            result.error_message = br.error_message;
            log_error("Packing aborted: %s", br.error_message.c_str());
            continue;
        }

        if (!br.produced) continue;

        if (config_.verbose) {
            log_info("Sealed %s (%lu bytes, %zu files%s)",
                     br.part.path.filename().c_str(), static_cast<unsigned long>(br.part.size),
                     br.part.entries.size(), br.part.oversized ? ", oversized" : "");
        }
        result.bytes_in += br.bytes_in;
        result.bytes_out += br.part.size;
        if (listener) listener->on_part_sealed(br.part);
        result.parts.push_back(std::move(br.part));
    }
    pool.shutdown(true);

    result.success = !fatal;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    log_info("Packed %zu parts (%lu -> %lu bytes, %zu unreadable files) in %.1fs",
             result.parts.size(), static_cast<unsigned long>(result.bytes_in),
             static_cast<unsigned long>(result.bytes_out), result.failed.size(),
             result.elapsed.count() / 1000.0);
    return result;
}

PackResult Archiver::pack(const std::filesystem::path& source_dir, uint64_t ceiling,
                          const std::string& base_name, ArchiveListener* listener,
                          const CancelToken* cancel) {
    ArchivePlan p;
    try {
        p = plan(source_dir, ceiling, base_name);
    } catch (const std::exception& e) {
        PackResult result;
        result.error = ErrorKind::IOError;
        result.error_message = e.what();
        return result;
    }
    return pack(p, listener, cancel);
}

// --- Unpacking ---

UnpackResult Archiver::unpack(const std::vector<std::filesystem::path>& parts,
                              const std::filesystem::path& dest_dir) {
    UnpackResult result;

    auto ordered = parts;
    std::sort(ordered.begin(), ordered.end(),
              [](const std::filesystem::path& a, const std::filesystem::path& b) {
                  auto ia = part_index_from_name(a);
                  auto ib = part_index_from_name(b);
                  if (ia != ib) return ia < ib;
                  return a < b;
              });

    std::error_code ec;
    std::filesystem::create_directories(dest_dir, ec);
    if (ec) {
        result.error = ErrorKind::IOError;
        result.error_message = "cannot create " + dest_dir.string() + ": " + ec.message();
        return result;
    }

    auto fail = [&](ErrorKind kind, const std::string& msg) {
        result.error = kind;
        result.error_message = msg;
        return result;
    };

    for (const auto& part : ordered) {
        ReadArchive a(archive_read_new(), archive_read_free);
        archive_read_support_format_zip(a.get());
        if (archive_read_open_filename(a.get(), part.c_str(), IO_BLOCK) != ARCHIVE_OK) {
            return fail(ErrorKind::IOError,
                        "cannot open " + part.string() + ": " + archive_error_string(a.get()));
        }

        struct archive_entry* entry = nullptr;
        int r;
        while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK) {
            if (archive_entry_filetype(entry) != AE_IFREG) {
                archive_read_data_skip(a.get());
                continue;
            }

            std::string name = archive_entry_pathname(entry) ? archive_entry_pathname(entry) : "";
            if (!is_safe_entry_path(name)) {
                return fail(ErrorKind::IntegrityError,
                            "unsafe entry path in " + part.filename().string() + ": " + name);
            }

            auto target = (dest_dir / name).lexically_normal();
            std::filesystem::create_directories(target.parent_path(), ec);
            if (ec) {
                return fail(ErrorKind::IOError, "cannot create " + target.parent_path().string() +
                                                    ": " + ec.message());
            }

            auto tmp = target.parent_path() / ("." + target.filename().string() + ".coldpack-tmp");
            SizedWriter writer(tmp, 0);
            auto err = writer.open();
            if (!err.empty()) {
                return fail(writer.disk_full() ? ErrorKind::DiskFull : ErrorKind::IOError, err);
            }

            const void* buff = nullptr;
            size_t size = 0;
            la_int64_t offset = 0;
            int dr;
            while ((dr = archive_read_data_block(a.get(), &buff, &size, &offset)) == ARCHIVE_OK) {
                if (!writer.write(buff, size)) {
                    auto kind = writer.disk_full() ? ErrorKind::DiskFull : ErrorKind::IOError;
                    auto msg = writer.last_error();
                    writer.discard();
                    return fail(kind, msg);
                }
            }
            if (dr != ARCHIVE_EOF) {
                writer.discard();
                return fail(ErrorKind::IntegrityError,
                            "corrupt entry " + name + " in " + part.filename().string() + ": " +
                                archive_error_string(a.get()));
            }
            if (!writer.close()) {
                auto kind = writer.disk_full() ? ErrorKind::DiskFull : ErrorKind::IOError;
                auto msg = writer.last_error();
                writer.discard();
                return fail(kind, msg);
            }

            if (files_identical(tmp, target)) {
                std::filesystem::remove(tmp, ec);
                ++result.files_unchanged;
                continue;
            }

            std::filesystem::rename(tmp, target, ec);
            if (ec) {
                std::filesystem::remove(tmp, ec);
                return fail(ErrorKind::IOError, "cannot replace " + target.string());
            }
            if (archive_entry_mtime_is_set(entry)) {
                auto tp = std::chrono::system_clock::from_time_t(archive_entry_mtime(entry));
                std::filesystem::last_write_time(
                    target, std::chrono::file_clock::from_sys(tp), ec);
            }
            ++result.files_written;
        }

        if (r != ARCHIVE_EOF) {
            return fail(ErrorKind::IntegrityError,
                        "corrupt archive " + part.string() + ": " + archive_error_string(a.get()));
        }
    }

    result.success = true;
    return result;
}

// --- Naming ---

std::string Archiver::part_file_name(const std::string& base_name, uint32_t index) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%03u", index);
    return base_name + "_" + buf + ".zip";
}

std::string Archiver::make_job_id() {
    std::time_t t = std::time(nullptr);
    std::tm tm;
    localtime_r(&t, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);

    static const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<size_t> dist(0, sizeof(alphabet) - 2);
    std::string suffix;
    for (int i = 0; i < 5; ++i) suffix += alphabet[dist(gen)];

    return std::string(stamp) + "_" + suffix;
}

}  // namespace coldpack
