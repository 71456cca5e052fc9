#include "coldpack/backup_config.hpp"
#include "coldpack/backup_job.hpp"
#include "coldpack/scanner.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <future>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

void print_parts(const coldpack::JobResult& result) {
    for (const auto& part : result.parts) {
        std::cout << "  " << part.path.string() << "  " << coldpack::human_size(part.size)
                  << "  " << part.entries.size() << " files"
                  << (part.oversized ? "  (oversized)" : "") << std::endl;
    }
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = coldpack::BackupConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        }
    }

    std::cout << "coldpack starting..." << std::endl;
    for (const auto& line : config.describe()) {
        std::cout << line << std::endl;
    }

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    coldpack::BackupJob job(config);
    err = job.start();
    if (!err.empty()) {
        std::cerr << "Failed to start: " << err << std::endl;
        return 1;
    }

    if (config.command == "status") {
        auto counts = job.status_counts();
        size_t total = 0;
        for (auto& [status, n] : counts) {
            std::cout << "  " << coldpack::to_string(status) << ": " << n << std::endl;
            total += n;
        }
        std::cout << "  total: " << total << std::endl;
        job.stop();
        return 0;
    }

    // Run the command off the main thread; a signal cancels it from here.
    auto run = std::async(std::launch::async, [&job, &config]() {
        if (config.command == "backup") return job.backup();
        if (config.command == "pack") return job.pack_only();
        if (config.command == "unpack") return job.unpack();
        return job.restore();
    });

    bool cancel_sent = false;
    while (run.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
        if (g_shutdown_requested && !cancel_sent) {
            std::cout << "Shutdown requested, finishing in-flight work..." << std::endl;
            job.cancel();
            cancel_sent = true;
        }
    }
    auto result = run.get();
    job.stop();

    if (config.command == "pack" || config.command == "backup") {
        print_parts(result);
    }

    if (result.cancelled) {
        std::cout << "coldpack cancelled: " << result.succeeded << " done, "
                  << result.pending << " left pending" << std::endl;
        return result.failed > 0 ? 2 : 0;
    }
    if (!result.success) {
        std::cerr << "coldpack " << config.command << " failed: " << result.error_message
                  << " (" << coldpack::to_string(result.error) << ")" << std::endl;
        return 2;
    }

    std::cout << "coldpack " << config.command << " finished cleanly" << std::endl;
    return 0;
}
