#include "coldpack/scanner.hpp"
#include "coldpack/log.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <memory>
#include <vector>

namespace coldpack {

bool is_ignored_name(const std::string& filename) {
    static const char* const suffixes[] = {".tmp", ".crdownload", ".part", ".partial"};

    if (filename.starts_with("~$")) return true;

    std::string lower = filename;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    for (const char* suffix : suffixes) {
        if (lower.ends_with(suffix)) return true;
    }
    return false;
}

std::string make_signature(uint64_t size, int64_t mtime, const std::string& sha256) {
    std::string sig = std::to_string(size) + ":" + std::to_string(mtime);
    if (!sha256.empty()) sig += ":" + sha256;
    return sig;
}

std::string sha256_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return {};

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return {};

    std::vector<char> buf(1024 * 1024);
    while (in) {
        in.read(buf.data(), buf.size());
        auto n = in.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
            return {};
        }
    }
    if (in.bad()) return {};

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) return {};

    std::string hex;
    hex.reserve(len * 2);
    char byte[3];
    for (unsigned int i = 0; i < len; ++i) {
        std::snprintf(byte, sizeof(byte), "%02x", digest[i]);
        hex += byte;
    }
    return hex;
}

std::vector<SyncItem> scan_tracked(const std::filesystem::path& dir,
                                   const std::map<std::string, SyncItem>& known,
                                   bool use_sha256) {
    std::vector<SyncItem> out;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        log_warn("Tracked directory %s does not exist", dir.c_str());
        return out;
    }

    auto root = std::filesystem::absolute(dir);
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        log_error("Cannot scan %s: %s", root.c_str(), ec.message().c_str());
        return out;
    }

    size_t seen = 0;
    size_t unchanged = 0;
    for (auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            ec.clear();
            continue;
        }
        const auto& de = *it;
        if (de.is_symlink(ec) || !de.is_regular_file(ec)) continue;
        if (is_ignored_name(de.path().filename().string())) continue;
        ++seen;

        SyncItem item;
        item.path = de.path().string();
        item.size = de.file_size(ec);
        if (ec) {
            ec.clear();
            continue;
        }
        auto mt = de.last_write_time(ec);
        if (ec) {
            ec.clear();
            continue;
        }
        item.mtime = to_epoch(mt);

        if (use_sha256) {
            item.sha256 = sha256_file(de.path());
            if (item.sha256.empty()) {
                log_warn("Cannot hash %s, skipping", item.path.c_str());
                continue;
            }
        }
        item.sig = make_signature(item.size, item.mtime, item.sha256);

        auto k = known.find(item.path);
        if (k != known.end() && k->second.status == SyncStatus::Uploaded &&
            k->second.sig == item.sig) {
            ++unchanged;
            continue;
        }

        item.status = SyncStatus::Pending;
        item.updated_at = now_epoch();
        out.push_back(std::move(item));
    }

    std::sort(out.begin(), out.end(),
              [](const SyncItem& a, const SyncItem& b) { return a.path < b.path; });

    log_info("Scanned %s: %zu files, %zu unchanged, %zu to upload",
             root.c_str(), seen, unchanged, out.size());
    return out;
}

std::string human_size(uint64_t bytes) {
    static const char* const units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    if (unit == 0) {
        std::snprintf(buf, sizeof(buf), "%lu B", static_cast<unsigned long>(bytes));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    }
    return buf;
}

}  // namespace coldpack
