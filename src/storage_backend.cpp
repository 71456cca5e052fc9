#include "coldpack/backend.hpp"
#include "coldpack/http.hpp"
#include "coldpack/log.hpp"
#include "coldpack/sized_writer.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace coldpack {

// ============================================================================
// Shared helpers
// ============================================================================

namespace {

constexpr size_t COPY_BLOCK = 1024 * 1024;

uint64_t variant_default_ceiling(BackendVariant variant) {
    return variant == BackendVariant::Simple ? SIMPLE_MAX_OBJECT_BYTES : CHUNKED_MAX_OBJECT_BYTES;
}

bool param_flag(const std::map<std::string, std::string>& params, const std::string& name,
                bool fallback) {
    auto it = params.find(name);
    if (it == params.end()) return fallback;
    return it->second == "true" || it->second == "1";
}

std::string too_large_message(uint64_t size, uint64_t limit, BackendVariant variant) {
    return "object of " + std::to_string(size) + " bytes exceeds the " +
           to_string(variant) + " limit of " + std::to_string(limit) + " bytes";
}

struct CopyStatus {
    ErrorKind error = ErrorKind::None;
    std::string message;
};

// Read exactly `len` bytes from `fd` into `writer`
CopyStatus copy_fd_range(int fd, uint64_t len, SizedWriter& writer, std::vector<char>& buf,
                         const std::string& source_name) {
    uint64_t remaining = len;
    while (remaining > 0) {
        ssize_t n = ::read(fd, buf.data(), std::min<uint64_t>(buf.size(), remaining));
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            return {ErrorKind::IOError, "read " + source_name + ": " + strerror(errno)};
        }
        if (n == 0) {
            return {ErrorKind::IOError, "unexpected end of " + source_name};
        }
        if (!writer.write(buf.data(), static_cast<size_t>(n))) {
            return {writer.disk_full() ? ErrorKind::DiskFull : ErrorKind::IOError,
                    writer.last_error()};
        }
        remaining -= static_cast<uint64_t>(n);
    }
    return {};
}

}  // namespace

ErrorKind classify_http_failure(long status, const std::string& code,
                                bool network_error, bool timeout) {
    if (network_error || timeout) return ErrorKind::TransientNetworkError;

    if (status == 413 || code == "EntityTooLarge") return ErrorKind::SizeLimitExceeded;

    if (status == 401 || code == "InvalidAccessKeyId" || code == "SignatureDoesNotMatch" ||
        code == "ExpiredToken" || code == "InvalidToken" || code == "TokenRefreshRequired") {
        return ErrorKind::AuthenticationError;
    }
    if (status == 403 || code == "QuotaExceeded" || code == "AccessDenied") {
        return ErrorKind::PermissionDenied;
    }

    if (status == 408 || status == 429 || status >= 500 || code == "SlowDown" ||
        code == "RequestTimeout") {
        return ErrorKind::TransientNetworkError;
    }

    return ErrorKind::IOError;
}

// ============================================================================
// LocalBackend - a directory tree standing in for the remote store
// ============================================================================

class LocalBackend : public BackendAdapter {
public:
    LocalBackend(BackendVariant variant, const std::filesystem::path& root,
                 const std::string& path_prefix, const AdapterSettings& settings)
        : variant_(variant)
        , root_(std::filesystem::absolute(root))
        , path_prefix_(path_prefix)
        , max_object_bytes_(settings.max_object_bytes ? settings.max_object_bytes
                                                      : variant_default_ceiling(variant))
        , chunk_size_(std::max<uint64_t>(1, settings.chunk_size)) {
        std::error_code ec;
        std::filesystem::create_directories(root_, ec);
        if (ec) {
            throw std::runtime_error("Cannot create local backend root " + root_.string() +
                                     ": " + ec.message());
        }
    }

    BackendVariant variant() const override { return variant_; }
    std::string type_name() const override { return "local"; }
    uint64_t max_object_bytes() const override { return max_object_bytes_; }

    PutResult put(const PutRequest& request, const ProgressFn& progress,
                  const CancelToken* cancel) override {
        PutResult result;

        if (request.size > max_object_bytes_) {
            result.error = ErrorKind::SizeLimitExceeded;
            result.error_message = too_large_message(request.size, max_object_bytes_, variant_);
            return result;
        }
        if (cancel && cancel->cancelled()) {
            result.error = ErrorKind::Cancelled;
            result.error_message = "cancelled before start";
            return result;
        }

        auto dest = key_to_path(request.key);
        if (dest.empty()) {
            result.error = ErrorKind::IOError;
            result.error_message = "invalid object key: " + request.key;
            return result;
        }

        int fd = ::open(request.source.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            result.error = ErrorKind::IOError;
            result.error_message = "open " + request.source.string() + ": " + strerror(errno);
            return result;
        }

        struct stat st;
        if (fstat(fd, &st) != 0) {
            result.error = ErrorKind::IOError;
            result.error_message = "stat " + request.source.string() + ": " + strerror(errno);
            ::close(fd);
            return result;
        }
        uint64_t size = static_cast<uint64_t>(st.st_size);
        if (size > max_object_bytes_) {
            ::close(fd);
            result.error = ErrorKind::SizeLimitExceeded;
            result.error_message = too_large_message(size, max_object_bytes_, variant_);
            return result;
        }

        std::error_code ec;
        std::filesystem::create_directories(dest.parent_path(), ec);
        if (ec) {
            ::close(fd);
            result.error = ErrorKind::PermissionDenied;
            result.error_message = "cannot create " + dest.parent_path().string() + ": " +
                                   ec.message();
            return result;
        }

        // Staging object next to the destination, renamed once complete
        auto staging = dest;
        staging += ".coldpack-staging";
        SizedWriter writer(staging, max_object_bytes_);
        auto err = writer.open();
        if (!err.empty()) {
            ::close(fd);
            result.error = writer.disk_full() ? ErrorKind::PermissionDenied : ErrorKind::IOError;
            result.error_message = err;
            return result;
        }

        std::vector<char> buf(static_cast<size_t>(std::min<uint64_t>(COPY_BLOCK, chunk_size_)));
        auto fail = [&](ErrorKind kind, const std::string& msg) {
            ::close(fd);
            writer.discard();
            result.error = kind;
            result.error_message = msg;
            return result;
        };

        if (variant_ == BackendVariant::Simple) {
            auto status = copy_fd_range(fd, size, writer, buf, request.source.string());
            if (status.error != ErrorKind::None) {
                // A full store is a quota denial from the uploader's side
                return fail(status.error == ErrorKind::DiskFull ? ErrorKind::PermissionDenied
                                                                : status.error,
                            status.message);
            }
            if (progress) progress(size, size);
        } else {
            uint64_t done = 0;
            while (done < size) {
                if (cancel && cancel->cancelled()) {
                    return fail(ErrorKind::Cancelled,
                                "cancelled after " + std::to_string(done) + " bytes");
                }
                uint64_t chunk = std::min(chunk_size_, size - done);
                auto status = copy_fd_range(fd, chunk, writer, buf, request.source.string());
                if (status.error != ErrorKind::None) {
                    return fail(status.error == ErrorKind::DiskFull ? ErrorKind::PermissionDenied
                                                                    : status.error,
                                status.message);
                }
                done += chunk;
                if (progress) progress(done, size);
            }
            if (size == 0 && progress) progress(0, 0);
        }
        ::close(fd);

        if (!writer.close()) {
            auto msg = writer.last_error();
            writer.discard();
            result.error = ErrorKind::IOError;
            result.error_message = msg;
            return result;
        }

        std::filesystem::rename(staging, dest, ec);
        if (ec) {
            std::filesystem::remove(staging, ec);
            result.error = ErrorKind::IOError;
            result.error_message = "Failed to rename staging object: " + ec.message();
            return result;
        }

        result.success = true;
        result.reference.variant = variant_;
        result.reference.backend_type = type_name();
        result.reference.object_id = request.key;
        result.reference.size = size;
        result.reference.etag = std::to_string(size) + "-" + std::to_string(st.st_mtime);
        return result;
    }

    GetResult get(const RemoteReference& ref, const std::filesystem::path& target,
                  const ProgressFn& progress, const CancelToken* cancel) override {
        GetResult result;

        if (ref.size > max_object_bytes_) {
            result.error = ErrorKind::SizeLimitExceeded;
            result.error_message = too_large_message(ref.size, max_object_bytes_, variant_);
            return result;
        }
        if (cancel && cancel->cancelled()) {
            result.error = ErrorKind::Cancelled;
            result.error_message = "cancelled before start";
            return result;
        }

        auto source = key_to_path(ref.object_id);
        int fd = source.empty() ? -1 : ::open(source.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            result.error = ErrorKind::IOError;
            result.error_message = "Object not found: " + ref.object_id;
            return result;
        }

        struct stat st;
        if (fstat(fd, &st) != 0) {
            ::close(fd);
            result.error = ErrorKind::IOError;
            result.error_message = "stat " + source.string() + ": " + strerror(errno);
            return result;
        }
        uint64_t size = static_cast<uint64_t>(st.st_size);

        SizedWriter writer(target, 0);
        auto err = writer.open();
        if (!err.empty()) {
            ::close(fd);
            result.error = writer.disk_full() ? ErrorKind::DiskFull : ErrorKind::IOError;
            result.error_message = err;
            return result;
        }

        std::vector<char> buf(static_cast<size_t>(std::min<uint64_t>(COPY_BLOCK, chunk_size_)));
        auto fail = [&](ErrorKind kind, const std::string& msg) {
            ::close(fd);
            writer.discard();
            result.error = kind;
            result.error_message = msg;
            return result;
        };

        uint64_t step = variant_ == BackendVariant::Simple ? std::max<uint64_t>(size, 1) : chunk_size_;
        uint64_t done = 0;
        while (done < size) {
            if (variant_ == BackendVariant::Chunked && cancel && cancel->cancelled()) {
                return fail(ErrorKind::Cancelled, "cancelled after " + std::to_string(done) + " bytes");
            }
            uint64_t chunk = std::min(step, size - done);
            auto status = copy_fd_range(fd, chunk, writer, buf, source.string());
            if (status.error != ErrorKind::None) {
                return fail(status.error, status.message);
            }
            done += chunk;
            if (progress) progress(done, size);
        }
        ::close(fd);

        if (!writer.close()) {
            auto kind = writer.disk_full() ? ErrorKind::DiskFull : ErrorKind::IOError;
            auto msg = writer.last_error();
            writer.discard();
            result.error = kind;
            result.error_message = msg;
            return result;
        }

        result.success = true;
        result.bytes_written = writer.bytes_written();
        return result;
    }

private:
    // Empty path for keys that would escape the root
    std::filesystem::path key_to_path(const std::string& key) const {
        std::filesystem::path rel(path_prefix_ + key);
        if (key.empty() || rel.is_absolute()) return {};
        for (const auto& part : rel) {
            if (part == "..") return {};
        }
        return root_ / rel;
    }

    BackendVariant variant_;
    std::filesystem::path root_;
    std::string path_prefix_;
    uint64_t max_object_bytes_;
    uint64_t chunk_size_;
};

// ============================================================================
// XML parsing helpers for S3 responses
// ============================================================================

namespace xml {

// Value between <tag>value</tag>, empty if not found
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }
        } else {
            result += s[i++];
        }
    }
    return result;
}

std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

}  // namespace xml

// ============================================================================
// S3Backend - S3-compatible object storage
// ============================================================================

class S3Backend : public BackendAdapter {
public:
    struct Config {
        std::string bucket;
        std::string region = "us-east-1";
        std::string endpoint;     // Empty for AWS, custom for MinIO etc.
        std::string path_prefix;  // Key prefix inside the bucket
        std::string access_key;
        std::string secret_key;
        std::string session_token;
        bool use_path_style = false;
        bool verify_ssl = true;
        uint32_t connect_timeout_secs = 10;
        uint32_t request_timeout_secs = 300;
        uint32_t cleanup_retries = 2;  // AbortMultipartUpload only
    };

    S3Backend(BackendVariant variant, const Config& config, const AdapterSettings& settings)
        : variant_(variant)
        , config_(config)
        , max_object_bytes_(settings.max_object_bytes ? settings.max_object_bytes
                                                      : variant_default_ceiling(variant))
        , chunk_size_(std::max<uint64_t>(MIN_PART_SIZE, settings.chunk_size))
        , signer_(config.access_key, config.secret_key, config.region, "s3") {
        HttpClientConfig http_config;
        http_config.user_agent = "coldpack-s3/1.0";
        http_client_ = std::make_unique<HttpClient>(http_config);
    }

    BackendVariant variant() const override { return variant_; }
    std::string type_name() const override { return "s3"; }
    uint64_t max_object_bytes() const override { return max_object_bytes_; }

    PutResult put(const PutRequest& request, const ProgressFn& progress,
                  const CancelToken* cancel) override {
        PutResult result;

        if (request.size > max_object_bytes_) {
            result.error = ErrorKind::SizeLimitExceeded;
            result.error_message = too_large_message(request.size, max_object_bytes_, variant_);
            return result;
        }
        if (cancel && cancel->cancelled()) {
            result.error = ErrorKind::Cancelled;
            result.error_message = "cancelled before start";
            return result;
        }

        std::error_code ec;
        uint64_t size = std::filesystem::file_size(request.source, ec);
        if (ec) {
            result.error = ErrorKind::IOError;
            result.error_message = "stat " + request.source.string() + ": " + ec.message();
            return result;
        }
        if (size > max_object_bytes_) {
            result.error = ErrorKind::SizeLimitExceeded;
            result.error_message = too_large_message(size, max_object_bytes_, variant_);
            return result;
        }

        std::string etag;
        if (variant_ == BackendVariant::Simple) {
            etag = put_single(request, size, progress, result);
        } else {
            etag = put_multipart(request, size, progress, cancel, result);
        }
        if (result.error != ErrorKind::None) {
            return result;
        }

        result.success = true;
        result.reference.variant = variant_;
        result.reference.backend_type = type_name();
        result.reference.object_id = request.key;
        result.reference.etag = etag;
        result.reference.size = size;
        return result;
    }

    GetResult get(const RemoteReference& ref, const std::filesystem::path& target,
                  const ProgressFn& progress, const CancelToken* cancel) override {
        GetResult result;

        if (ref.size > max_object_bytes_) {
            result.error = ErrorKind::SizeLimitExceeded;
            result.error_message = too_large_message(ref.size, max_object_bytes_, variant_);
            return result;
        }
        if (cancel && cancel->cancelled()) {
            result.error = ErrorKind::Cancelled;
            result.error_message = "cancelled before start";
            return result;
        }

        SizedWriter writer(target, 0);
        auto err = writer.open();
        if (!err.empty()) {
            result.error = writer.disk_full() ? ErrorKind::DiskFull : ErrorKind::IOError;
            result.error_message = err;
            return result;
        }

        auto fail = [&](ErrorKind kind, const std::string& msg) {
            writer.discard();
            result.error = kind;
            result.error_message = msg;
            return result;
        };

        // Simple fetches in one request; Chunked fetches one range per chunk
        uint64_t step = variant_ == BackendVariant::Simple ? ref.size : chunk_size_;
        uint64_t done = 0;
        do {
            if (variant_ == BackendVariant::Chunked && done > 0 && cancel && cancel->cancelled()) {
                return fail(ErrorKind::Cancelled, "cancelled after " + std::to_string(done) + " bytes");
            }

            HttpRequest request = HttpRequest::get(build_url(ref.object_id));
            apply_timeouts(request);
            uint64_t len = std::min(step, ref.size - done);
            if (variant_ == BackendVariant::Chunked && ref.size > 0) {
                request.byte_range = std::make_pair(done, done + len - 1);
            }

            uint64_t base = done;
            uint64_t received = 0;
            request.response_sink = [&writer, &received](const uint8_t* data, size_t n) {
                if (!writer.write(data, n)) return false;
                received += n;
                return true;
            };
            if (progress) {
                request.progress_callback = [&progress, base, total = ref.size](const HttpProgress& p) {
                    progress(std::min(base + p.download_now, total), total);
                    return true;
                };
            }
            sign_request(request);

            // No internal retry: a partial body has already reached the file
            auto response = http_client_->execute(request);
            if (response.sink_failed) {
                return fail(writer.disk_full() ? ErrorKind::DiskFull : ErrorKind::IOError,
                            writer.last_error());
            }
            if (!response.ok()) {
                auto [kind, msg] = describe_failure(response);
                return fail(kind, "GET " + ref.object_id + ": " + msg);
            }
            if (variant_ == BackendVariant::Simple || ref.size == 0) {
                done += received;
                break;
            }
            if (received != len) {
                return fail(ErrorKind::IntegrityError,
                            "short range read for " + ref.object_id + ": got " +
                                std::to_string(received) + " of " + std::to_string(len));
            }
            done += received;
            if (progress) progress(done, ref.size);
        } while (done < ref.size);

        if (!writer.close()) {
            auto kind = writer.disk_full() ? ErrorKind::DiskFull : ErrorKind::IOError;
            return fail(kind, writer.last_error());
        }

        result.success = true;
        result.bytes_written = writer.bytes_written();
        return result;
    }

private:
    static constexpr uint64_t MIN_PART_SIZE = 5 * 1024 * 1024;  // S3 minimum part size
    static constexpr uint64_t MAX_PARTS = 10000;

    std::string build_url(const std::string& key) const {
        std::string url;
        if (!config_.endpoint.empty()) {
            url = config_.endpoint;
            if (config_.use_path_style && !config_.bucket.empty()) {
                url += "/" + config_.bucket;
            }
        } else {
            if (config_.use_path_style) {
                url = "https://s3." + config_.region + ".amazonaws.com/" + config_.bucket;
            } else {
                url = "https://" + config_.bucket + ".s3." + config_.region + ".amazonaws.com";
            }
        }
        if (!key.empty()) {
            url += "/" + url_encode(config_.path_prefix + key, true);
        }
        return url;
    }

    void apply_timeouts(HttpRequest& request) const {
        request.connect_timeout = std::chrono::seconds(config_.connect_timeout_secs);
        request.total_timeout = std::chrono::seconds(config_.request_timeout_secs);
        request.verify_ssl = config_.verify_ssl;
    }

    void sign_request(HttpRequest& request) const {
        // Sign with session token if present (STS credentials)
        if (!config_.session_token.empty()) {
            signer_.sign_with_token(request, config_.session_token);
        } else {
            signer_.sign(request);
        }
    }

    // One signed attempt. Retries belong to the orchestrator's budget.
    HttpResponse send(HttpRequest request) {
        sign_request(request);
        return http_client_->execute(request);
    }

    // Cleanup after a unit has already failed, outside any unit's budget.
    // The request is re-signed each time so X-Amz-Date stays fresh.
    HttpResponse send_cleanup(HttpRequest request) {
        HttpResponse response;
        for (uint32_t attempt = 0; attempt <= config_.cleanup_retries; ++attempt) {
            if (attempt > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100 * (1 << attempt)));
            }
            sign_request(request);
            response = http_client_->execute(request);
            if (response.ok() ||
                (!response.is_network_error && !is_retryable_status(static_cast<int>(response.status_code)))) {
                break;
            }
        }
        return response;
    }

    std::pair<ErrorKind, std::string> describe_failure(const HttpResponse& response) const {
        std::string body = response.body_string();
        std::string code = xml::get_element(body, "Code");
        std::string message = xml::decode_entities(xml::get_element(body, "Message"));

        auto kind = classify_http_failure(response.status_code, code,
                                          response.is_network_error, response.is_timeout);
        if (!response.is_network_error && !response.error.empty() && response.status_code == 0) {
            // Local failure before the server answered (unreadable source file)
            kind = ErrorKind::IOError;
        }

        std::string text;
        if (!response.error.empty()) {
            text = response.error;
        } else {
            text = "HTTP " + std::to_string(response.status_code);
            if (!code.empty()) text += " " + code;
            if (!message.empty()) text += ": " + message;
        }
        return {kind, text};
    }

    // Ensure ETag has surrounding quotes (required for CompleteMultipartUpload)
    static std::string ensure_etag_quotes(const std::string& etag) {
        if (etag.empty()) return etag;
        std::string result = etag;
        if (result.front() != '"') result = "\"" + result;
        if (result.back() != '"') result += "\"";
        return result;
    }

    std::string put_single(const PutRequest& request, uint64_t size, const ProgressFn& progress,
                           PutResult& result) {
        HttpRequest http = HttpRequest::put_file(build_url(request.key), request.source.string(),
                                                 0, size);
        apply_timeouts(http);
        http.headers.set("Content-Type", "application/zip");
        http.headers.set("X-Amz-Content-Sha256", "UNSIGNED-PAYLOAD");
        if (progress) {
            http.progress_callback = [&progress, size](const HttpProgress& p) {
                progress(std::min(p.upload_now, size), size);
                return true;
            };
        }

        // A started single-shot transfer runs to completion
        auto response = send(std::move(http));
        if (!response.ok()) {
            auto [kind, msg] = describe_failure(response);
            result.error = kind;
            result.error_message = "PUT " + request.key + ": " + msg;
            return "";
        }
        if (progress) progress(size, size);
        return response.headers.get("ETag").value_or("");
    }

    std::string put_multipart(const PutRequest& request, uint64_t size,
                              const ProgressFn& progress, const CancelToken* cancel,
                              PutResult& result) {
        // 1. Initiate
        std::string upload_id = initiate_multipart_upload(request.key, cancel, result);
        if (upload_id.empty()) {
            return "";
        }

        // 2. Sequential parts, chunk boundaries are the cancellation checkpoints
        uint64_t part_size = std::max(chunk_size_, (size + MAX_PARTS - 1) / MAX_PARTS);
        std::vector<std::pair<int, std::string>> part_etags;
        uint64_t offset = 0;
        int part_number = 1;
        do {
            if (cancel && cancel->cancelled()) {
                abort_multipart_upload(request.key, upload_id);
                result.error = ErrorKind::Cancelled;
                result.error_message = "cancelled after " + std::to_string(offset) + " bytes";
                return "";
            }

            uint64_t len = std::min(part_size, size - offset);
            std::string etag = upload_part(request, upload_id, part_number, offset, len,
                                           progress, size, cancel, result);
            if (etag.empty()) {
                abort_multipart_upload(request.key, upload_id);
                return "";
            }
            part_etags.emplace_back(part_number, etag);
            offset += len;
            ++part_number;
            if (progress) progress(offset, size);
        } while (offset < size);

        // 3. Complete
        std::string final_etag = complete_multipart_upload(request.key, upload_id, part_etags,
                                                           cancel, result);
        if (final_etag.empty()) {
            abort_multipart_upload(request.key, upload_id);
            return "";
        }
        return final_etag;
    }

    std::string initiate_multipart_upload(const std::string& key, const CancelToken* cancel,
                                          PutResult& result) {
        HttpRequest request = HttpRequest::post(build_url(key) + "?uploads", "");
        apply_timeouts(request);
        request.headers.set("Content-Type", "application/zip");

        auto response = send(std::move(request));
        if (!response.ok()) {
            auto [kind, msg] = describe_failure(response);
            result.error = kind;
            result.error_message = "CreateMultipartUpload " + key + ": " + msg;
            return "";
        }

        std::string upload_id = xml::get_element(response.body_string(), "UploadId");
        if (upload_id.empty()) {
            result.error = ErrorKind::TransientNetworkError;
            result.error_message = "CreateMultipartUpload " + key + ": no UploadId in response";
        }
        return upload_id;
    }

    std::string upload_part(const PutRequest& request, const std::string& upload_id,
                            int part_number, uint64_t offset, uint64_t len,
                            const ProgressFn& progress, uint64_t total,
                            const CancelToken* cancel, PutResult& result) {
        std::string url = build_url(request.key) +
            "?partNumber=" + std::to_string(part_number) +
            "&uploadId=" + url_encode(upload_id);

        HttpRequest http = HttpRequest::put_file(url, request.source.string(), offset, len);
        apply_timeouts(http);
        http.headers.set("X-Amz-Content-Sha256", "UNSIGNED-PAYLOAD");
        if (progress) {
            http.progress_callback = [&progress, offset, len, total](const HttpProgress& p) {
                progress(offset + std::min(p.upload_now, len), total);
                return true;
            };
        }

        auto response = send(std::move(http));
        if (!response.ok()) {
            auto [kind, msg] = describe_failure(response);
            result.error = kind;
            result.error_message = "UploadPart " + std::to_string(part_number) + " of " +
                                   request.key + ": " + msg;
            return "";
        }

        std::string etag = response.headers.get("ETag").value_or("");
        if (etag.empty()) {
            result.error = ErrorKind::TransientNetworkError;
            result.error_message = "UploadPart " + std::to_string(part_number) + ": no ETag";
        }
        return ensure_etag_quotes(etag);
    }

    std::string complete_multipart_upload(const std::string& key, const std::string& upload_id,
                                          const std::vector<std::pair<int, std::string>>& part_etags,
                                          const CancelToken* cancel, PutResult& result) {
        std::string url = build_url(key) + "?uploadId=" + url_encode(upload_id);

        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        body << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
        for (const auto& [part_num, etag] : part_etags) {
            body << "  <Part>\n";
            body << "    <PartNumber>" << part_num << "</PartNumber>\n";
            body << "    <ETag>" << xml::escape(etag) << "</ETag>\n";
            body << "  </Part>\n";
        }
        body << "</CompleteMultipartUpload>";

        HttpRequest request = HttpRequest::post(url, body.str());
        apply_timeouts(request);
        request.headers.set("Content-Type", "application/xml");

        auto response = send(std::move(request));
        std::string response_body = response.body_string();

        // S3 can answer 200 with an <Error> document
        if (!response.ok() || response_body.find("<Error>") != std::string::npos) {
            auto [kind, msg] = describe_failure(response);
            if (response.ok()) kind = ErrorKind::TransientNetworkError;
            result.error = kind;
            result.error_message = "CompleteMultipartUpload " + key + ": " + msg;
            return "";
        }

        std::string etag = xml::decode_entities(xml::get_element(response_body, "ETag"));
        if (etag.empty()) {
            result.error = ErrorKind::TransientNetworkError;
            result.error_message = "CompleteMultipartUpload " + key + ": no ETag in response";
            return "";
        }
        return ensure_etag_quotes(etag);
    }

    void abort_multipart_upload(const std::string& key, const std::string& upload_id) {
        std::string url = build_url(key) + "?uploadId=" + url_encode(upload_id);

        HttpRequest request = HttpRequest::del(url);
        apply_timeouts(request);
        auto response = send_cleanup(std::move(request));
        if (!response.ok()) {
            log_warn("AbortMultipartUpload %s failed: %s", key.c_str(),
                     response.error.empty() ? ("HTTP " + std::to_string(response.status_code)).c_str()
                                            : response.error.c_str());
        }
    }

    BackendVariant variant_;
    Config config_;
    uint64_t max_object_bytes_;
    uint64_t chunk_size_;
    AwsSigV4Signer signer_;
    std::unique_ptr<HttpClient> http_client_;
};

// ============================================================================
// BackendFactory
// ============================================================================

std::unique_ptr<BackendAdapter> BackendFactory::create(
    BackendVariant variant,
    const std::string& type,
    const std::map<std::string, std::string>& params,
    const AdapterSettings& settings) {

    AdapterSettings resolved = settings;
    if (auto it = params.find("chunk_size"); it != params.end()) {
        try {
            resolved.chunk_size = std::stoull(it->second);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid chunk_size: " + it->second);
        }
    }

    if (type == "local" || type == "nfs") {
        auto it = params.find("path");
        if (it == params.end() || it->second.empty()) {
            throw std::runtime_error("Local backend requires 'path' config");
        }
        std::string prefix;
        if (auto p = params.find("path_prefix"); p != params.end()) prefix = p->second;
        return std::make_unique<LocalBackend>(variant, it->second, prefix, resolved);
    }

    if (type == "s3") {
        S3Backend::Config s3_config;

        auto it = params.find("bucket");
        if (it == params.end() || it->second.empty()) {
            throw std::runtime_error("S3 backend requires 'bucket' config");
        }
        s3_config.bucket = it->second;

        if ((it = params.find("region")) != params.end()) s3_config.region = it->second;
        if ((it = params.find("endpoint")) != params.end()) s3_config.endpoint = it->second;
        if ((it = params.find("path_prefix")) != params.end()) s3_config.path_prefix = it->second;
        if ((it = params.find("access_key")) != params.end()) s3_config.access_key = it->second;
        if ((it = params.find("secret_key")) != params.end()) s3_config.secret_key = it->second;
        if ((it = params.find("session_token")) != params.end()) s3_config.session_token = it->second;
        s3_config.use_path_style = param_flag(params, "use_path_style", false);
        s3_config.verify_ssl = param_flag(params, "verify_ssl", true);
        s3_config.connect_timeout_secs = resolved.connect_timeout_secs;
        s3_config.request_timeout_secs = resolved.request_timeout_secs;
        if ((it = params.find("cleanup_retries")) != params.end()) {
            try {
                s3_config.cleanup_retries = static_cast<uint32_t>(std::stoul(it->second));
            } catch (const std::exception&) {
                throw std::runtime_error("Invalid cleanup_retries: " + it->second);
            }
        }

        if (s3_config.access_key.empty() || s3_config.secret_key.empty()) {
            throw std::runtime_error("S3 backend requires access_key and secret_key");
        }

        return std::make_unique<S3Backend>(variant, s3_config, resolved);
    }

    throw std::runtime_error("Unknown storage backend type: " + type);
}

std::unique_ptr<BackendAdapter> BackendFactory::create_local(
    BackendVariant variant,
    const std::filesystem::path& root,
    const AdapterSettings& settings) {
    return std::make_unique<LocalBackend>(variant, root, "", settings);
}

}  // namespace coldpack
