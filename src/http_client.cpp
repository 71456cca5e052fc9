#include "coldpack/http.hpp"

#include <curl/curl.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <set>
#include <sstream>

namespace coldpack {

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::POST: return "POST";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_retryable_status(int status) {
    // Retry on server errors and rate limiting
    return status == 408 || status == 429 || status == 500 || status == 502 ||
           status == 503 || status == 504;
}

std::string url_encode(const std::string& str, bool keep_slash) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (keep_slash && c == '/')) {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

// ============================================================================
// HttpRequest
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::put(const std::string& url, const std::vector<uint8_t>& body) {
    HttpRequest req;
    req.method = HttpMethod::PUT;
    req.url = url;
    req.body = body;
    return req;
}

HttpRequest HttpRequest::put_file(const std::string& url, const std::string& path,
                                  uint64_t offset, uint64_t length) {
    HttpRequest req;
    req.method = HttpMethod::PUT;
    req.url = url;
    req.body_file = path;
    req.body_offset = offset;
    req.body_length = length;
    return req;
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = url;
    req.body.assign(body.begin(), body.end());
    return req;
}

HttpRequest HttpRequest::del(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::DELETE;
    req.url = url;
    return req;
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, scheme_end);
    size_t pos = scheme_end + 3;

    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }
    std::string host_port = url.substr(pos, host_end - pos);
    if (host_port.empty()) {
        return std::nullopt;
    }

    if (host_port.front() == '[') {
        // IPv6 literal
        size_t bracket_end = host_port.find(']');
        if (bracket_end == std::string::npos) return std::nullopt;
        result.host = host_port.substr(1, bracket_end - 1);
        if (bracket_end + 1 < host_port.size() && host_port[bracket_end + 1] == ':') {
            try {
                result.port = std::stoi(host_port.substr(bracket_end + 2));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    } else if (size_t colon = host_port.rfind(':'); colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        try {
            result.port = std::stoi(host_port.substr(colon + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        result.host = host_port;
    }

    pos = host_end;
    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) path_end = url.size();
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }

    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = url.find('#', pos);
        if (query_end == std::string::npos) query_end = url.size();
        result.query = url.substr(pos + 1, query_end - pos - 1);
    }

    return result;
}

// ============================================================================
// CURL callback functions
// ============================================================================

struct WriteCallbackContext {
    std::vector<uint8_t>* response = nullptr;
    size_t max_size = 0;
    size_t current_size = 0;
    bool size_exceeded = false;
    const HttpBodySink* sink = nullptr;
    bool sink_failed = false;
    long status = 0;  // Latest status line seen by header_callback
};

struct HeaderCallbackContext {
    HttpHeaders* headers = nullptr;
    WriteCallbackContext* write_ctx = nullptr;
};

struct ReadCallbackContext {
    const uint8_t* data = nullptr;  // In-memory body
    size_t size = 0;
    size_t pos = 0;
    std::FILE* file = nullptr;      // Streamed body
    uint64_t remaining = 0;
    bool read_failed = false;
    int read_errno = 0;
};

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    // Only successful bodies go to the sink; error bodies are kept so the
    // caller can read the service's error code.
    if (ctx->sink && *ctx->sink && is_success_status(static_cast<int>(ctx->status))) {
        if (!(*ctx->sink)(reinterpret_cast<const uint8_t*>(ptr), bytes)) {
            ctx->sink_failed = true;
            return 0;
        }
        return bytes;
    }

    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Abort transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<HeaderCallbackContext*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    if (line.empty()) {
        return bytes;
    }

    // A new status line starts a new header block (100 Continue, redirects)
    if (line.starts_with("HTTP/")) {
        size_t sp = line.find(' ');
        if (sp != std::string::npos) {
            ctx->write_ctx->status = std::strtol(line.c_str() + sp + 1, nullptr, 10);
        }
        ctx->headers->clear();
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? "" : value.substr(start);
        ctx->headers->add(name, value);
    }

    return bytes;
}

static size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* rd = static_cast<ReadCallbackContext*>(userdata);
    size_t max_bytes = size * nitems;

    if (rd->file) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(max_bytes, rd->remaining));
        if (want == 0) return 0;
        size_t n = std::fread(buffer, 1, want, rd->file);
        if (n == 0) {
            rd->read_failed = true;
            rd->read_errno = std::ferror(rd->file) ? errno : 0;
            return CURL_READFUNC_ABORT;
        }
        rd->remaining -= n;
        return n;
    }

    size_t remaining = rd->size - rd->pos;
    size_t to_copy = std::min(max_bytes, remaining);
    if (to_copy > 0) {
        std::memcpy(buffer, rd->data + rd->pos, to_copy);
        rd->pos += to_copy;
    }
    return to_copy;
}

static int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                             curl_off_t ultotal, curl_off_t ulnow) {
    auto* callback = static_cast<const HttpProgressCallback*>(clientp);
    if (*callback) {
        HttpProgress progress;
        progress.download_total = static_cast<uint64_t>(dltotal);
        progress.download_now = static_cast<uint64_t>(dlnow);
        progress.upload_total = static_cast<uint64_t>(ultotal);
        progress.upload_now = static_cast<uint64_t>(ulnow);

        // Non-zero aborts the transfer
        if (!(*callback)(progress)) {
            return 1;
        }
    }
    return 0;
}

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to create CURL handle";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
        }

        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        if (headers_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);
        }
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        // Request body
        ReadCallbackContext read_ctx;
        if (!request.body_file.empty()) {
            read_ctx.file = std::fopen(request.body_file.c_str(), "rb");
            if (!read_ctx.file) {
                response.error = "Failed to open " + request.body_file + ": " + strerror(errno);
                if (headers_list) curl_slist_free_all(headers_list);
                release_handle(curl);
                return response;
            }
            if (request.body_offset > 0 &&
                fseeko(read_ctx.file, static_cast<off_t>(request.body_offset), SEEK_SET) != 0) {
                response.error = "Failed to seek " + request.body_file + ": " + strerror(errno);
                std::fclose(read_ctx.file);
                if (headers_list) curl_slist_free_all(headers_list);
                release_handle(curl);
                return response;
            }
            read_ctx.remaining = request.body_length;
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &read_ctx);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(request.body_length));
        } else if (request.method == HttpMethod::PUT) {
            read_ctx.data = request.body.data();
            read_ctx.size = request.body.size();
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &read_ctx);
            // Explicit length, including 0, so servers don't answer 411
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        } else if (request.method == HttpMethod::POST) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS,
                             request.body.empty() ? "" : reinterpret_cast<const char*>(request.body.data()));
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        }

        // Response callbacks
        std::vector<uint8_t> response_body;
        WriteCallbackContext write_ctx;
        write_ctx.response = &response_body;
        write_ctx.max_size = config_.max_response_size;
        write_ctx.sink = &request.response_sink;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        HeaderCallbackContext header_ctx{&response.headers, &write_ctx};
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &header_ctx);

        if (request.progress_callback) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &request.progress_callback);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(request.total_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        if (config_.tcp_keepalive) {
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        }

        if (request.verify_ssl) {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        } else {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        }

        std::string range;
        if (request.byte_range) {
            range = std::to_string(request.byte_range->first) + "-" +
                    std::to_string(request.byte_range->second);
            curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        auto start_time = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);

        if (res == CURLE_OK) {
            response.body = std::move(response_body);
        } else if (write_ctx.sink_failed) {
            response.sink_failed = true;
            response.error = "Response sink rejected data";
        } else if (write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
        } else if (read_ctx.read_failed) {
            response.error = "Failed to read " + request.body_file +
                             (read_ctx.read_errno ? std::string(": ") + strerror(read_ctx.read_errno)
                                                  : std::string(": unexpected end of file"));
        } else if (res == CURLE_ABORTED_BY_CALLBACK) {
            response.aborted = true;
            response.error = "Transfer aborted";
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
            response.is_timeout = (res == CURLE_OPERATION_TIMEDOUT);
        }

        if (read_ctx.file) {
            std::fclose(read_ctx.file);
        }
        if (headers_list) {
            curl_slist_free_all(headers_list);
        }
        release_handle(curl);

        return response;
    }

    const HttpClientConfig& config() const { return config_; }

private:
    CURL* acquire_handle() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!idle_handles_.empty()) {
                CURL* handle = idle_handles_.back();
                idle_handles_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void release_handle(CURL* handle) {
        if (!handle) return;

        curl_easy_reset(handle);
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (idle_handles_.size() < config_.max_idle_handles) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;
    std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

AwsSigV4Signer::AwsSigV4Signer(const std::string& access_key_id,
                               const std::string& secret_access_key,
                               const std::string& region,
                               const std::string& service)
    : access_key_id_(access_key_id)
    , secret_access_key_(secret_access_key)
    , region_(region)
    , service_(service) {}

static std::string to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

static std::string sha256_hex(const uint8_t* data, size_t len) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data, len, hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

static std::string sha256_hex(const std::string& data) {
    return sha256_hex(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

static std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key,
                                        const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hash_len = 0;

    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.c_str()), data.size(),
         hash, &hash_len);

    return std::vector<uint8_t>(hash, hash + hash_len);
}

static std::vector<uint8_t> hmac_sha256(const std::string& key, const std::string& data) {
    return hmac_sha256(std::vector<uint8_t>(key.begin(), key.end()), data);
}

static std::string format_utc_now(const char* fmt) {
    std::time_t t = std::time(nullptr);
    std::tm tm;
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return buf;
}

// Query params in the URL are already encoded; sort them and give
// valueless params ("uploads") the "key=" form.
static std::string build_canonical_query_string(const std::string& query) {
    if (query.empty()) {
        return "";
    }

    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string param = query.substr(pos, amp - pos);
        size_t eq = param.find('=');
        if (eq != std::string::npos) {
            params[param.substr(0, eq)] = param.substr(eq + 1);
        } else {
            params[param] = "";
        }
        pos = amp + 1;
    }

    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

std::string AwsSigV4Signer::get_canonical_request(const HttpRequest& request,
                                                  const std::string& signed_headers,
                                                  const std::string& payload_hash) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return "";

    std::ostringstream oss;
    oss << http_method_to_string(request.method) << "\n";
    oss << (url->path.empty() ? "/" : url->path) << "\n";
    oss << build_canonical_query_string(url->query) << "\n";

    // HttpHeaders keys are already lowercase and sorted
    for (const auto& [name, value] : request.headers.all()) {
        oss << name << ":" << value << "\n";
    }
    oss << "\n";

    oss << signed_headers << "\n";
    oss << payload_hash;

    return oss.str();
}

std::string AwsSigV4Signer::get_string_to_sign(const std::string& datetime,
                                               const std::string& date,
                                               const std::string& canonical_request) const {
    std::ostringstream oss;
    oss << "AWS4-HMAC-SHA256\n";
    oss << datetime << "\n";
    oss << date << "/" << region_ << "/" << service_ << "/aws4_request\n";
    oss << sha256_hex(canonical_request);
    return oss.str();
}

std::string AwsSigV4Signer::calculate_signature(const std::string& date,
                                                const std::string& string_to_sign) const {
    auto k_date = hmac_sha256("AWS4" + secret_access_key_, date);
    auto k_region = hmac_sha256(k_date, region_);
    auto k_service = hmac_sha256(k_region, service_);
    auto k_signing = hmac_sha256(k_service, "aws4_request");

    auto sig = hmac_sha256(k_signing, string_to_sign);
    return to_hex(sig.data(), sig.size());
}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    std::string datetime = format_utc_now("%Y%m%dT%H%M%SZ");
    std::string date = datetime.substr(0, 8);

    auto url = ParsedUrl::parse(request.url);
    if (!url) return;

    bool default_port = url->port == 0 ||
                        (url->scheme == "https" && url->port == 443) ||
                        (url->scheme == "http" && url->port == 80);
    request.headers.set("Host", default_port ? url->host
                                             : url->host + ":" + std::to_string(url->port));
    request.headers.set("X-Amz-Date", datetime);

    // Reuse a preset payload hash; streamed bodies are never hashed
    std::string payload_hash;
    if (auto existing = request.headers.get("X-Amz-Content-Sha256"); existing && !existing->empty()) {
        payload_hash = *existing;
    } else if (!request.body_file.empty()) {
        payload_hash = "UNSIGNED-PAYLOAD";
    } else {
        payload_hash = sha256_hex(request.body.data(), request.body.size());
    }
    request.headers.set("X-Amz-Content-Sha256", payload_hash);
    request.headers.remove("Authorization");

    std::set<std::string> header_names;
    for (const auto& [name, value] : request.headers.all()) {
        header_names.insert(name);
    }
    std::string signed_headers;
    for (const auto& h : header_names) {
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += h;
    }

    std::string canonical_request = get_canonical_request(request, signed_headers, payload_hash);
    std::string string_to_sign = get_string_to_sign(datetime, date, canonical_request);
    std::string signature = calculate_signature(date, string_to_sign);

    std::ostringstream auth;
    auth << "AWS4-HMAC-SHA256 ";
    auth << "Credential=" << access_key_id_ << "/" << date << "/" << region_ << "/"
         << service_ << "/aws4_request, ";
    auth << "SignedHeaders=" << signed_headers << ", ";
    auth << "Signature=" << signature;

    request.headers.set("Authorization", auth.str());
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request,
                                     const std::string& session_token) const {
    request.headers.set("X-Amz-Security-Token", session_token);
    sign(request);
}

}  // namespace coldpack
