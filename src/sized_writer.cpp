#include "coldpack/sized_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace coldpack {

SizedWriter::SizedWriter(const std::filesystem::path& path, uint64_t capacity)
    : path_(path), capacity_(capacity) {}

SizedWriter::~SizedWriter() {
    if (fd_ >= 0) ::close(fd_);
}

std::string SizedWriter::open() {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        if (errno == ENOSPC) disk_full_ = true;
        last_error_ = "cannot create " + path_.string() + ": " + strerror(errno);
        return last_error_;
    }
    return {};
}

bool SizedWriter::would_exceed(uint64_t additional) const {
    return capacity_ > 0 && bytes_written_ + additional > capacity_;
}

bool SizedWriter::write(const void* data, size_t len) {
    if (fd_ < 0) {
        last_error_ = "write on closed file";
        return false;
    }
    if (would_exceed(len)) {
        capacity_exceeded_ = true;
        last_error_ = "container would exceed " + std::to_string(capacity_) + " bytes";
        return false;
    }

    auto* p = static_cast<const char*>(data);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t n = ::write(fd_, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == ENOSPC || errno == EDQUOT) disk_full_ = true;
            last_error_ = "write " + path_.string() + ": " + strerror(errno);
            return false;
        }
        p += n;
        remaining -= static_cast<size_t>(n);
        bytes_written_ += static_cast<uint64_t>(n);
    }
    return true;
}

bool SizedWriter::close() {
    if (fd_ < 0) return true;
    bool ok = true;
    if (::fsync(fd_) != 0 && errno != EINVAL) {
        // EINVAL: special files such as /dev/full do not support fsync
        if (errno == ENOSPC || errno == EDQUOT) disk_full_ = true;
        last_error_ = "fsync " + path_.string() + ": " + strerror(errno);
        ok = false;
    }
    if (::close(fd_) != 0) {
        if (errno == ENOSPC || errno == EDQUOT) disk_full_ = true;
        if (ok) last_error_ = "close " + path_.string() + ": " + strerror(errno);
        ok = false;
    }
    fd_ = -1;
    return ok;
}

void SizedWriter::discard() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    ::unlink(path_.c_str());
}

}  // namespace coldpack
