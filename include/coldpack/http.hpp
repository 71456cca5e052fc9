#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace coldpack {

enum class HttpMethod {
    GET,
    PUT,
    POST,
    DELETE,
    HEAD,
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);
bool is_retryable_status(int status);

// RFC 3986 percent-encoding. With keep_slash, '/' passes through so object
// keys keep their path structure in the URL.
std::string url_encode(const std::string& str, bool keep_slash = false);

// Case-insensitive header map
class HttpHeaders {
public:
    using HeaderPair = std::pair<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);
    void clear() { headers_.clear(); }

    std::optional<std::string> get(const std::string& name) const;
    std::vector<HeaderPair> all() const;

private:
    static std::string normalize_name(const std::string& name);

    std::map<std::string, std::vector<std::string>> headers_;
};

struct HttpProgress {
    uint64_t download_total = 0;
    uint64_t download_now = 0;
    uint64_t upload_total = 0;
    uint64_t upload_now = 0;
};

// Return false to abort the transfer
using HttpProgressCallback = std::function<bool(const HttpProgress&)>;

// Receives a 2xx response body as it arrives. Return false to abort.
using HttpBodySink = std::function<bool(const uint8_t* data, size_t len)>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;

    // In-memory body, or a byte range of a file streamed from disk
    std::vector<uint8_t> body;
    std::string body_file;
    uint64_t body_offset = 0;
    uint64_t body_length = 0;

    HttpBodySink response_sink;
    HttpProgressCallback progress_callback;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{300000};
    bool verify_ssl = true;

    // Inclusive byte range for GET
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;

    static HttpRequest get(const std::string& url);
    static HttpRequest put(const std::string& url, const std::vector<uint8_t>& body);
    static HttpRequest put_file(const std::string& url, const std::string& path,
                                uint64_t offset, uint64_t length);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest del(const std::string& url);
};

struct HttpResponse {
    long status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;  // Empty when a sink consumed a 2xx body
    std::string error;
    bool is_network_error = false;
    bool is_timeout = false;
    bool aborted = false;       // Progress callback asked to stop
    bool sink_failed = false;   // Sink rejected data
    std::chrono::milliseconds total_time{0};

    bool ok() const { return error.empty() && is_success_status(static_cast<int>(status_code)); }
    std::string body_string() const { return std::string(body.begin(), body.end()); }
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;
    std::string query;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

struct HttpClientConfig {
    std::string user_agent = "coldpack/1.0";
    size_t max_idle_handles = 16;
    size_t max_response_size = 16 * 1024 * 1024;  // Buffered bodies only
    bool tcp_keepalive = true;
    bool verbose = false;
};

// Blocking libcurl client with a pool of reusable easy handles.
// Safe to call execute() from several threads at once.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// AWS Signature Version 4 request signer
class AwsSigV4Signer {
public:
    AwsSigV4Signer(const std::string& access_key_id,
                   const std::string& secret_access_key,
                   const std::string& region,
                   const std::string& service);

    // Adds Host, X-Amz-Date, X-Amz-Content-Sha256 and Authorization.
    // A preset X-Amz-Content-Sha256 (e.g. UNSIGNED-PAYLOAD) is kept.
    void sign(HttpRequest& request) const;
    void sign_with_token(HttpRequest& request, const std::string& session_token) const;

private:
    std::string get_canonical_request(const HttpRequest& request,
                                      const std::string& signed_headers,
                                      const std::string& payload_hash) const;
    std::string get_string_to_sign(const std::string& datetime, const std::string& date,
                                   const std::string& canonical_request) const;
    std::string calculate_signature(const std::string& date,
                                    const std::string& string_to_sign) const;

    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;
};

}  // namespace coldpack
