#pragma once

#include "coldpack/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace coldpack {

/// Temporary download suffixes and Office lock files are never tracked.
bool is_ignored_name(const std::string& filename);

/// "size:mtime" or "size:mtime:sha256"
std::string make_signature(uint64_t size, int64_t mtime, const std::string& sha256 = {});

/// Hex SHA-256 of a file, empty string if it cannot be read.
std::string sha256_file(const std::filesystem::path& path);

/// Walk `dir` and return the files that need uploading: new files, files
/// whose signature changed, and files whose last known state is not
/// Uploaded. Returned items are Pending with `sig` (and `sha256` when
/// requested) filled in. `known` is keyed by absolute path.
std::vector<SyncItem> scan_tracked(const std::filesystem::path& dir,
                                   const std::map<std::string, SyncItem>& known,
                                   bool use_sha256);

/// "1.5 GB", "512 B"
std::string human_size(uint64_t bytes);

}  // namespace coldpack
