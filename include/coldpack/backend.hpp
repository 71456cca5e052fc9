#pragma once

#include "coldpack/types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace coldpack {

constexpr uint64_t SIMPLE_MAX_OBJECT_BYTES = 50'000'000;
constexpr uint64_t CHUNKED_MAX_OBJECT_BYTES = 2'000'000'000;
constexpr uint64_t DEFAULT_CHUNK_SIZE = 16 * 1024 * 1024;

// Cumulative bytes moved so far, and the object size
using ProgressFn = std::function<void(uint64_t done, uint64_t total)>;

struct PutRequest {
    std::filesystem::path source;
    std::string key;    // Deterministic object key, relative to the backend prefix
    uint64_t size = 0;  // Expected source size
};

struct PutResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
    RemoteReference reference;
};

struct GetResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
    uint64_t bytes_written = 0;
};

// Per-adapter limits resolved from configuration
struct AdapterSettings {
    uint64_t max_object_bytes = 0;  // 0 = variant default
    uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
    uint32_t connect_timeout_secs = 10;
    uint32_t request_timeout_secs = 300;
};

// Transport for one backend variant.
//
// Adapters reject objects above max_object_bytes() with SizeLimitExceeded
// before touching the network or the remote store, and never truncate.
// A Chunked adapter reports progress at every chunk boundary and honours
// cancellation there; a Simple adapter checks cancellation only before it
// starts. Neither throws: every failure comes back classified in the result.
class BackendAdapter {
public:
    virtual ~BackendAdapter() = default;

    virtual BackendVariant variant() const = 0;

    // "s3", "local"
    virtual std::string type_name() const = 0;

    virtual uint64_t max_object_bytes() const = 0;

    virtual PutResult put(const PutRequest& request, const ProgressFn& progress,
                          const CancelToken* cancel) = 0;

    // Write the object named by `ref` to `target`, replacing it. The caller
    // picks a temporary `target` and renames it once the size checks out.
    virtual GetResult get(const RemoteReference& ref, const std::filesystem::path& target,
                          const ProgressFn& progress, const CancelToken* cancel) = 0;
};

// Map an HTTP failure onto the error taxonomy. `code` is the service's
// error code from the response body, empty if none.
ErrorKind classify_http_failure(long status, const std::string& code,
                                bool network_error, bool timeout);

class BackendFactory {
public:
    // type: "s3", or "local" (alias "nfs"). Throws std::runtime_error on an
    // unknown type or a missing required parameter.
    static std::unique_ptr<BackendAdapter> create(
        BackendVariant variant,
        const std::string& type,
        const std::map<std::string, std::string>& params,
        const AdapterSettings& settings);

    static std::unique_ptr<BackendAdapter> create_local(
        BackendVariant variant,
        const std::filesystem::path& root,
        const AdapterSettings& settings);
};

}  // namespace coldpack
