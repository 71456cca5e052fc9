#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace coldpack {

/// Byte sink over a POSIX file descriptor that counts what it writes and
/// refuses to grow past a capacity.
///
/// A capacity of 0 means unlimited (used for oversized parts). Writes that
/// would cross the capacity fail without writing anything. ENOSPC from the
/// kernel is surfaced separately through disk_full() so the caller can
/// abort the whole run instead of just one container.
class SizedWriter {
public:
    SizedWriter(const std::filesystem::path& path, uint64_t capacity);
    ~SizedWriter();

    SizedWriter(const SizedWriter&) = delete;
    SizedWriter& operator=(const SizedWriter&) = delete;

    /// Create or truncate the file. Returns error message or empty string.
    std::string open();

    /// Write all of `data`. Returns false on short write, I/O error, or
    /// capacity overflow; see last_error() and disk_full().
    bool write(const void* data, size_t len);

    /// True if writing `additional` more bytes would cross the capacity.
    bool would_exceed(uint64_t additional) const;

    /// fsync and close. Returns false if either fails.
    bool close();

    /// Close and unlink the file.
    void discard();

    uint64_t bytes_written() const { return bytes_written_; }
    uint64_t capacity() const { return capacity_; }
    bool disk_full() const { return disk_full_; }
    bool capacity_exceeded() const { return capacity_exceeded_; }
    const std::string& last_error() const { return last_error_; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    uint64_t capacity_;
    int fd_ = -1;
    uint64_t bytes_written_ = 0;
    bool disk_full_ = false;
    bool capacity_exceeded_ = false;
    std::string last_error_;
};

}  // namespace coldpack
