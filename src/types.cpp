#include "coldpack/types.hpp"

namespace coldpack {

const char* to_string(SyncStatus status) {
    switch (status) {
        case SyncStatus::Pending: return "pending";
        case SyncStatus::Archiving: return "archiving";
        case SyncStatus::Queued: return "queued";
        case SyncStatus::Uploading: return "uploading";
        case SyncStatus::Uploaded: return "uploaded";
        case SyncStatus::Failed: return "failed";
    }
    return "pending";
}

const char* to_string(Direction direction) {
    return direction == Direction::Upload ? "upload" : "download";
}

const char* to_string(BackendVariant variant) {
    return variant == BackendVariant::Simple ? "simple" : "chunked";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::IOError: return "io_error";
        case ErrorKind::SizeLimitExceeded: return "size_limit_exceeded";
        case ErrorKind::TransientNetworkError: return "transient_network_error";
        case ErrorKind::AuthenticationError: return "authentication_error";
        case ErrorKind::PermissionDenied: return "permission_denied";
        case ErrorKind::IntegrityError: return "integrity_error";
        case ErrorKind::DiskFull: return "disk_full";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "none";
}

std::optional<SyncStatus> parse_sync_status(const std::string& s) {
    if (s == "pending") return SyncStatus::Pending;
    if (s == "archiving") return SyncStatus::Archiving;
    if (s == "queued") return SyncStatus::Queued;
    if (s == "uploading") return SyncStatus::Uploading;
    if (s == "uploaded") return SyncStatus::Uploaded;
    if (s == "failed") return SyncStatus::Failed;
    return std::nullopt;
}

std::optional<BackendVariant> parse_backend_variant(const std::string& s) {
    if (s == "simple") return BackendVariant::Simple;
    if (s == "chunked") return BackendVariant::Chunked;
    return std::nullopt;
}

std::optional<ErrorKind> parse_error_kind(const std::string& s) {
    static const ErrorKind all[] = {
        ErrorKind::None, ErrorKind::IOError, ErrorKind::SizeLimitExceeded,
        ErrorKind::TransientNetworkError, ErrorKind::AuthenticationError,
        ErrorKind::PermissionDenied, ErrorKind::IntegrityError,
        ErrorKind::DiskFull, ErrorKind::Cancelled,
    };
    for (auto k : all) {
        if (s == to_string(k)) return k;
    }
    return std::nullopt;
}

bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::TransientNetworkError || kind == ErrorKind::IntegrityError;
}

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

int64_t to_epoch(std::filesystem::file_time_type t) {
    auto sys = std::chrono::file_clock::to_sys(t);
    return std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count();
}

}  // namespace coldpack
