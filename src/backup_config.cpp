#include "coldpack/backup_config.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <thread>

#include <nlohmann/json.hpp>

namespace coldpack {

// --- BackendConfig ---

std::string BackendConfig::validate() const {
    if (type.empty()) return "backend type is required";
    if (type == "s3") {
        if (params.count("bucket") == 0 || params.at("bucket").empty())
            return "s3 backend requires 'bucket'";
        if (params.count("access_key") == 0 || params.at("access_key").empty() ||
            params.count("secret_key") == 0 || params.at("secret_key").empty())
            return "s3 backend requires credentials (access_key/secret_key or AWS_* env)";
    } else if (type == "local" || type == "nfs") {
        if (params.count("path") == 0 || params.at("path").empty())
            return type + " backend requires 'path'";
    } else {
        return "unknown backend type: " + type;
    }
    if (params.count("chunk_size")) {
        char* end = nullptr;
        auto v = std::strtoull(params.at("chunk_size").c_str(), &end, 10);
        if (v == 0 || (end && *end != '\0')) return "invalid chunk_size: " + params.at("chunk_size");
    }
    return {};
}

// --- BackupConfig ---

namespace {

const char* const COMMANDS[] = {"backup", "pack", "unpack", "restore", "status"};

bool is_command(const std::string& s) {
    for (const char* c : COMMANDS) {
        if (s == c) return true;
    }
    return false;
}

// Parse a --simple-X or --chunked-X flag and route to the correct BackendConfig.
// Returns true if the flag was handled, false if it wasn't a backend flag.
bool parse_backend_flag(const std::string& arg, const char* value,
                        BackendConfig& simple, BackendConfig& chunked) {
    BackendConfig* target = nullptr;
    std::string suffix;

    if (arg.compare(0, 9, "--simple-") == 0) {
        target = &simple;
        suffix = arg.substr(9);
    } else if (arg.compare(0, 10, "--chunked-") == 0) {
        target = &chunked;
        suffix = arg.substr(10);
    } else {
        return false;
    }

    if (suffix == "type") {
        target->type = value;
    } else if (suffix == "endpoint") {
        target->params["endpoint"] = value;
    } else if (suffix == "bucket") {
        target->params["bucket"] = value;
    } else if (suffix == "region") {
        target->params["region"] = value;
    } else if (suffix == "access-key") {
        target->params["access_key"] = value;
    } else if (suffix == "secret-key") {
        target->params["secret_key"] = value;
    } else if (suffix == "session-token") {
        target->params["session_token"] = value;
    } else if (suffix == "path") {
        target->params["path"] = value;
    } else if (suffix == "prefix") {
        target->params["path_prefix"] = value;
    } else if (suffix == "chunk-size") {
        target->params["chunk_size"] = value;
    } else {
        return false;
    }
    return true;
}

// Boolean backend flags (no value argument), plus the enable/disable switches
bool parse_backend_bool_flag(const std::string& arg, BackupConfig& config) {
    if (arg == "--no-simple") {
        config.simple_enabled = false;
    } else if (arg == "--no-chunked") {
        config.chunked_enabled = false;
    } else if (arg == "--simple-no-verify-ssl") {
        config.simple.params["verify_ssl"] = "false";
    } else if (arg == "--chunked-no-verify-ssl") {
        config.chunked.params["verify_ssl"] = "false";
    } else if (arg == "--simple-path-style") {
        config.simple.params["use_path_style"] = "true";
    } else if (arg == "--chunked-path-style") {
        config.chunked.params["use_path_style"] = "true";
    } else {
        return false;
    }
    return true;
}

void load_env_credentials(BackendConfig& bc) {
    if (bc.type != "s3") return;
    if (bc.params.count("access_key") == 0 || bc.params["access_key"].empty()) {
        if (const char* v = std::getenv("AWS_ACCESS_KEY_ID")) {
            bc.params["access_key"] = v;
        }
    }
    if (bc.params.count("secret_key") == 0 || bc.params["secret_key"].empty()) {
        if (const char* v = std::getenv("AWS_SECRET_ACCESS_KEY")) {
            bc.params["secret_key"] = v;
        }
    }
    if (bc.params.count("session_token") == 0 || bc.params["session_token"].empty()) {
        if (const char* v = std::getenv("AWS_SESSION_TOKEN")) {
            bc.params["session_token"] = v;
        }
    }
}

void load_backend_json(const nlohmann::json& j, BackendConfig& bc) {
    if (!j.is_object()) return;
    if (j.contains("type")) bc.type = j["type"].get<std::string>();
    for (auto& [key, val] : j.items()) {
        if (key == "type") continue;
        if (val.is_string()) {
            bc.params[key] = val.get<std::string>();
        } else if (val.is_boolean()) {
            bc.params[key] = val.get<bool>() ? "true" : "false";
        } else {
            bc.params[key] = val.dump();
        }
    }
}

}  // namespace

void BackupConfig::print_usage() {
    std::cerr <<
        "Usage: coldpack <backup|pack|unpack|restore|status> [options]\n"
        "\n"
        "Commands:\n"
        "  backup                           Scan tracked files, pack source_dir, upload everything\n"
        "  pack                             Archive only, print the parts\n"
        "  unpack                           Restore from local parts (--parts-dir, --restore-dir)\n"
        "  restore                          Download a job's parts and unpack (--restore-dir)\n"
        "  status                           Print item counts by status\n"
        "\n"
        "Paths:\n"
        "  --source-dir <path>              Folder to archive\n"
        "  --tracked-dir <path>             Folder whose files are uploaded individually\n"
        "  --state-dir <path>               Manifest directory (default: <source>/../.coldpack)\n"
        "  --staging-dir <path>             Part staging (default: <state_dir>/staging)\n"
        "  --base-name <name>               Part base name (default: Backup)\n"
        "  --restore-dir <path>             unpack/restore destination\n"
        "  --parts-dir <path>               unpack: directory holding the parts\n"
        "  --job <id>                       restore: job id (default: latest)\n"
        "\n"
        "Archiver:\n"
        "  --archive-ceiling <bytes>        Part size ceiling (default: 1900000000)\n"
        "  --archive-workers <N>            Compression workers (default: CPU count)\n"
        "\n"
        "Backends (--simple-* / --chunked-*):\n"
        "  --simple-type <s3|local|nfs>     Simple backend type\n"
        "  --simple-endpoint <url>          Endpoint URL (S3)\n"
        "  --simple-bucket <name>           Bucket name (S3)\n"
        "  --simple-region <region>         Region (S3, default: us-east-1)\n"
        "  --simple-access-key <key>        Access key (or AWS_ACCESS_KEY_ID env)\n"
        "  --simple-secret-key <key>        Secret key (or AWS_SECRET_ACCESS_KEY env)\n"
        "  --simple-session-token <token>   Session token (or AWS_SESSION_TOKEN env)\n"
        "  --simple-path <path>             Local directory (local/nfs)\n"
        "  --simple-prefix <prefix>         Key prefix\n"
        "  --simple-no-verify-ssl           Skip SSL verification\n"
        "  --simple-path-style              Path-style S3 addressing\n"
        "  Same flags with --chunked- prefix, plus --chunked-chunk-size <bytes>.\n"
        "  --no-simple / --no-chunked       Disable a backend\n"
        "  --force-simple / --force-chunked Override size-based selection\n"
        "  --simple-ceiling <bytes>         Simple object limit (default: 50000000)\n"
        "  --chunked-ceiling <bytes>        Chunked object limit (default: 2000000000)\n"
        "  --chunk-size <bytes>             Chunk size (default: 16777216)\n"
        "\n"
        "Transfers:\n"
        "  --transfer-workers <N>           Concurrent transfers (default: 3)\n"
        "  --max-retries <N>                Retries per unit (default: 3)\n"
        "  --initial-backoff-ms <N>         First retry delay (default: 500)\n"
        "  --max-backoff-ms <N>             Retry delay cap (default: 30000)\n"
        "  --request-timeout <secs>         Per-request timeout (default: 300)\n"
        "  --connect-timeout <secs>         Connect timeout (default: 10)\n"
        "\n"
        "General:\n"
        "  --config <path>                  JSON config file\n"
        "  --sha256                         Include SHA-256 in tracked-file signatures\n"
        "  --verbose                        Verbose output\n"
        "  --log-file <path>                Log file path\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

std::optional<BackupConfig> BackupConfig::from_args(int argc, char* argv[]) {
    BackupConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (parse_backend_bool_flag(arg, config)) continue;

            if (arg == "--simple-ceiling") {
                auto* v = next_arg(i, "--simple-ceiling");
                if (!v) return std::nullopt;
                config.simple_ceiling = std::stoull(v);
                continue;
            }
            if (arg == "--chunked-ceiling") {
                auto* v = next_arg(i, "--chunked-ceiling");
                if (!v) return std::nullopt;
                config.chunked_ceiling = std::stoull(v);
                continue;
            }

            if (arg.compare(0, 9, "--simple-") == 0 || arg.compare(0, 10, "--chunked-") == 0) {
                auto* v = next_arg(i, arg.c_str());
                if (!v) return std::nullopt;
                if (!parse_backend_flag(arg, v, config.simple, config.chunked)) {
                    std::cerr << "Error: unknown option: " << arg << "\n";
                    return std::nullopt;
                }
                continue;
            }

            if (arg == "--source-dir") {
                auto* v = next_arg(i, "--source-dir");
                if (!v) return std::nullopt;
                config.source_dir = v;
            } else if (arg == "--tracked-dir") {
                auto* v = next_arg(i, "--tracked-dir");
                if (!v) return std::nullopt;
                config.tracked_dir = v;
            } else if (arg == "--state-dir") {
                auto* v = next_arg(i, "--state-dir");
                if (!v) return std::nullopt;
                config.state_dir = v;
            } else if (arg == "--staging-dir") {
                auto* v = next_arg(i, "--staging-dir");
                if (!v) return std::nullopt;
                config.staging_dir = v;
            } else if (arg == "--base-name") {
                auto* v = next_arg(i, "--base-name");
                if (!v) return std::nullopt;
                config.base_name = v;
            } else if (arg == "--restore-dir") {
                auto* v = next_arg(i, "--restore-dir");
                if (!v) return std::nullopt;
                config.restore_dir = v;
            } else if (arg == "--parts-dir") {
                auto* v = next_arg(i, "--parts-dir");
                if (!v) return std::nullopt;
                config.parts_dir = v;
            } else if (arg == "--job") {
                auto* v = next_arg(i, "--job");
                if (!v) return std::nullopt;
                config.job_id = v;
            } else if (arg == "--archive-ceiling") {
                auto* v = next_arg(i, "--archive-ceiling");
                if (!v) return std::nullopt;
                config.archive_ceiling = std::stoull(v);
            } else if (arg == "--archive-workers") {
                auto* v = next_arg(i, "--archive-workers");
                if (!v) return std::nullopt;
                config.archive_workers = std::stoull(v);
            } else if (arg == "--force-simple") {
                config.force_simple = true;
            } else if (arg == "--force-chunked") {
                config.force_chunked = true;
            } else if (arg == "--chunk-size") {
                auto* v = next_arg(i, "--chunk-size");
                if (!v) return std::nullopt;
                config.chunk_size = std::stoull(v);
            } else if (arg == "--transfer-workers") {
                auto* v = next_arg(i, "--transfer-workers");
                if (!v) return std::nullopt;
                config.transfer_workers = std::stoull(v);
            } else if (arg == "--max-retries") {
                auto* v = next_arg(i, "--max-retries");
                if (!v) return std::nullopt;
                config.max_retries = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--initial-backoff-ms") {
                auto* v = next_arg(i, "--initial-backoff-ms");
                if (!v) return std::nullopt;
                config.initial_backoff_ms = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--max-backoff-ms") {
                auto* v = next_arg(i, "--max-backoff-ms");
                if (!v) return std::nullopt;
                config.max_backoff_ms = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--request-timeout") {
                auto* v = next_arg(i, "--request-timeout");
                if (!v) return std::nullopt;
                config.request_timeout_secs = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--connect-timeout") {
                auto* v = next_arg(i, "--connect-timeout");
                if (!v) return std::nullopt;
                config.connect_timeout_secs = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--sha256") {
                config.use_sha256 = true;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else if (config.command.empty() && is_command(arg)) {
                config.command = arg;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric value (" << e.what() << ")\n";
        return std::nullopt;
    }

    load_env_credentials(config.simple);
    load_env_credentials(config.chunked);

    config.apply_defaults();
    return config;
}

bool BackupConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("command")) command = j["command"].get<std::string>();
        if (j.contains("source_dir")) source_dir = j["source_dir"].get<std::string>();
        if (j.contains("tracked_dir")) tracked_dir = j["tracked_dir"].get<std::string>();
        if (j.contains("state_dir")) state_dir = j["state_dir"].get<std::string>();
        if (j.contains("staging_dir")) staging_dir = j["staging_dir"].get<std::string>();
        if (j.contains("base_name")) base_name = j["base_name"].get<std::string>();
        if (j.contains("archive_ceiling")) archive_ceiling = j["archive_ceiling"].get<uint64_t>();
        if (j.contains("archive_workers")) archive_workers = j["archive_workers"].get<size_t>();
        if (j.contains("simple_enabled")) simple_enabled = j["simple_enabled"].get<bool>();
        if (j.contains("chunked_enabled")) chunked_enabled = j["chunked_enabled"].get<bool>();
        if (j.contains("force_simple")) force_simple = j["force_simple"].get<bool>();
        if (j.contains("force_chunked")) force_chunked = j["force_chunked"].get<bool>();
        if (j.contains("simple_ceiling")) simple_ceiling = j["simple_ceiling"].get<uint64_t>();
        if (j.contains("chunked_ceiling")) chunked_ceiling = j["chunked_ceiling"].get<uint64_t>();
        if (j.contains("chunk_size")) chunk_size = j["chunk_size"].get<uint64_t>();
        if (j.contains("transfer_workers")) transfer_workers = j["transfer_workers"].get<size_t>();
        if (j.contains("max_retries")) max_retries = j["max_retries"].get<uint32_t>();
        if (j.contains("initial_backoff_ms")) initial_backoff_ms = j["initial_backoff_ms"].get<uint32_t>();
        if (j.contains("max_backoff_ms")) max_backoff_ms = j["max_backoff_ms"].get<uint32_t>();
        if (j.contains("request_timeout_secs"))
            request_timeout_secs = j["request_timeout_secs"].get<uint32_t>();
        if (j.contains("connect_timeout_secs"))
            connect_timeout_secs = j["connect_timeout_secs"].get<uint32_t>();
        if (j.contains("use_sha256")) use_sha256 = j["use_sha256"].get<bool>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval_secs"))
            metrics_interval_secs = j["metrics_interval_secs"].get<size_t>();
        if (j.contains("restore_dir")) restore_dir = j["restore_dir"].get<std::string>();
        if (j.contains("parts_dir")) parts_dir = j["parts_dir"].get<std::string>();
        if (j.contains("job_id")) job_id = j["job_id"].get<std::string>();

        if (j.contains("simple")) load_backend_json(j["simple"], simple);
        if (j.contains("chunked")) load_backend_json(j["chunked"], chunked);

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void BackupConfig::apply_defaults() {
    if (state_dir.empty() && !source_dir.empty()) {
        auto abs = std::filesystem::absolute(source_dir).lexically_normal();
        if (!abs.has_filename()) abs = abs.parent_path();
        state_dir = abs.parent_path() / ".coldpack";
    }
    if (staging_dir.empty() && !state_dir.empty()) {
        staging_dir = state_dir / "staging";
    }
    if (archive_workers == 0) {
        archive_workers = std::max(1u, std::thread::hardware_concurrency());
    }

    // A global chunk size applies unless a backend carries its own
    auto set_default_chunk = [&](BackendConfig& bc) {
        if (!bc.empty() && (bc.params.count("chunk_size") == 0 || bc.params["chunk_size"].empty())) {
            bc.params["chunk_size"] = std::to_string(chunk_size);
        }
    };
    set_default_chunk(simple);
    set_default_chunk(chunked);
}

std::string BackupConfig::validate() const {
    if (command.empty()) return "a command is required (backup, pack, unpack, restore, status)";
    if (!is_command(command)) return "unknown command: " + command;

    bool needs_source = command == "backup" || command == "pack";
    bool needs_backends = command == "backup" || command == "restore";

    if (needs_source) {
        if (source_dir.empty()) return "source_dir is required (--source-dir)";
        if (!std::filesystem::is_directory(source_dir))
            return "source_dir is not a directory: " + source_dir.string();
    }
    if (!tracked_dir.empty() && command == "backup" && !std::filesystem::is_directory(tracked_dir))
        return "tracked_dir is not a directory: " + tracked_dir.string();

    if (command == "unpack") {
        if (parts_dir.empty()) return "parts_dir is required (--parts-dir)";
        if (!std::filesystem::is_directory(parts_dir))
            return "parts_dir is not a directory: " + parts_dir.string();
        if (restore_dir.empty()) return "restore_dir is required (--restore-dir)";
    }
    if (command == "restore" && restore_dir.empty()) return "restore_dir is required (--restore-dir)";
    if (command != "unpack" && state_dir.empty()) return "state_dir is required (--state-dir)";

    if (archive_ceiling == 0) return "archive_ceiling must be > 0";
    if (force_simple && force_chunked) return "force_simple and force_chunked are mutually exclusive";
    if (chunk_size == 0) return "chunk_size must be > 0";
    if (transfer_workers == 0) return "transfer_workers must be > 0";
    if (max_backoff_ms < initial_backoff_ms) return "max_backoff_ms must be >= initial_backoff_ms";

    if (needs_backends) {
        bool any = false;
        if (simple_enabled && !simple.empty()) {
            auto err = simple.validate();
            if (!err.empty()) return "simple: " + err;
            any = true;
        }
        if (chunked_enabled && !chunked.empty()) {
            auto err = chunked.validate();
            if (!err.empty()) return "chunked: " + err;
            any = true;
        }
        if (!any) return "at least one backend is required (--simple-type or --chunked-type)";
        if (force_simple && (!simple_enabled || simple.empty()))
            return "force_simple requires the simple backend";
        if (force_chunked && (!chunked_enabled || chunked.empty()))
            return "force_chunked requires the chunked backend";
    }
    return {};
}

std::string mask_secret(const std::string& key, const std::string& value) {
    bool secret = key.find("secret") != std::string::npos ||
                  key.find("token") != std::string::npos ||
                  key == "access_key";
    if (!secret || value.empty()) return value;
    if (value.size() <= 4) return "****";
    return value.substr(0, 4) + "****";
}

std::vector<std::string> BackupConfig::describe() const {
    std::vector<std::string> lines;
    lines.push_back("  Command:        " + command);
    if (!source_dir.empty()) lines.push_back("  Source:         " + source_dir.string());
    if (!tracked_dir.empty()) lines.push_back("  Tracked:        " + tracked_dir.string());
    if (!state_dir.empty()) lines.push_back("  State dir:      " + state_dir.string());
    if (!staging_dir.empty()) lines.push_back("  Staging:        " + staging_dir.string());
    lines.push_back("  Ceiling:        " + std::to_string(archive_ceiling) + " bytes");
    lines.push_back("  Workers:        " + std::to_string(archive_workers) + " archive, " +
                    std::to_string(transfer_workers) + " transfer");

    auto backend_line = [&](const char* label, const BackendConfig& bc, bool enabled) {
        if (bc.empty() || !enabled) {
            lines.push_back(std::string(label) + "disabled");
            return;
        }
        std::string line = std::string(label) + bc.type;
        for (const auto& [k, v] : bc.params) {
            line += " " + k + "=" + mask_secret(k, v);
        }
        lines.push_back(line);
    };
    backend_line("  Simple:         ", simple, simple_enabled);
    backend_line("  Chunked:        ", chunked, chunked_enabled);
    if (force_simple) lines.push_back("  Override:       force simple");
    if (force_chunked) lines.push_back("  Override:       force chunked");
    if (!metrics_file.empty()) {
        lines.push_back("  Metrics:        " + metrics_file.string() + " (every " +
                        std::to_string(metrics_interval_secs) + "s)");
    }
    return lines;
}

}  // namespace coldpack
