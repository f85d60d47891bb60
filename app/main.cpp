// ============================================================
// app/main.cpp -- resumecp entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "sync_app.hpp"
#include <iostream>
#include <string>
#include <cstdlib>
#include <cstring>
#include <csignal>

static SyncApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <source> <destination> [options]\n"
        << "\n"
        << "  source              file or directory to copy\n"
        << "  destination         target file, or directory to copy into\n"
        << "\nOptions:\n"
        << "  --dry-run           report what would be copied, write nothing\n"
        << "  --block-size N      resume search block in bytes (default: 1024)\n"
        << "  --chunk-kb N        copy chunk size in KB (default: 1024)\n"
        << "  --window N          throughput samples for the rate median (default: 10)\n"
        << "  --retention-weeks N keep ledger entries this long (default: 4)\n"
        << "  --ledger PATH       completion ledger file (default: ~/.resumecp/ledger)\n"
        << "  --start-from NAME   skip files until one with this name is reached\n"
        << "  --log-file PATH     append log lines to PATH\n"
        << "  --error-log PATH    append per-file errors to PATH\n"
        << "  --verbose           enable debug logging\n"
        << "\nInterrupted copies resume where they stopped on the next run.\n"
        << "\nExamples:\n"
        << "  " << prog << " /data/recordings /mnt/share/recordings\n"
        << "  " << prog << " big.iso /mnt/share/ --chunk-kb 4096\n";
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    SyncConfig cfg;
    cfg.src_path = argv[1];
    cfg.dst_path = argv[2];
    long chunk_kb = (long)(DEFAULT_CHUNK_SIZE / 1024);
    long block_size = (long)DEFAULT_BLOCK_SIZE;
    long window = (long)DEFAULT_RATE_WINDOW;

    for (int i = 3; i < argc; ++i) {
        if (std::strcmp(argv[i], "--dry-run") == 0) {
            cfg.dry_run = true;
        } else if (std::strcmp(argv[i], "--block-size") == 0 && i + 1 < argc) {
            block_size = std::atol(argv[++i]);
        } else if (std::strcmp(argv[i], "--chunk-kb") == 0 && i + 1 < argc) {
            chunk_kb = std::atol(argv[++i]);
        } else if (std::strcmp(argv[i], "--window") == 0 && i + 1 < argc) {
            window = std::atol(argv[++i]);
        } else if (std::strcmp(argv[i], "--retention-weeks") == 0 && i + 1 < argc) {
            cfg.retention_weeks = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--ledger") == 0 && i + 1 < argc) {
            cfg.ledger_path = argv[++i];
        } else if (std::strcmp(argv[i], "--start-from") == 0 && i + 1 < argc) {
            cfg.start_from = argv[++i];
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            cfg.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--error-log") == 0 && i + 1 < argc) {
            cfg.error_log = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            cfg.verbose = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_path(cfg.src_path)) {
        std::cerr << "ERROR: Invalid source path\n";
        return 1;
    }
    if (!utils::validate_path(cfg.dst_path)) {
        std::cerr << "ERROR: Invalid destination path\n";
        return 1;
    }
    if (block_size < 1) {
        std::cerr << "ERROR: --block-size must be at least 1\n";
        return 1;
    }
    if (chunk_kb < (long)(MIN_CHUNK_SIZE / 1024) || chunk_kb > (long)(MAX_CHUNK_SIZE / 1024)) {
        std::cerr << "ERROR: --chunk-kb must be 4-65536\n";
        return 1;
    }
    if (window < 1) {
        std::cerr << "ERROR: --window must be at least 1\n";
        return 1;
    }
    if (cfg.retention_weeks < 1 || cfg.retention_weeks > MAX_RETENTION_WEEKS) {
        std::cerr << "ERROR: --retention-weeks must be 1-" << MAX_RETENTION_WEEKS << "\n";
        return 1;
    }
    cfg.block_size  = (u64)block_size;
    cfg.chunk_size  = (u64)chunk_kb * 1024;
    cfg.rate_window = (size_t)window;

    Logger::get().set_level(cfg.verbose ? LogLevel::DEBUG : LogLevel::INFO);
    if (!cfg.log_file.empty() && !Logger::get().set_log_file(cfg.log_file)) {
        std::cerr << "ERROR: Cannot open log file: " << cfg.log_file << "\n";
        return 1;
    }
    if (!cfg.error_log.empty() && !Logger::get().set_error_log(cfg.error_log)) {
        std::cerr << "ERROR: Cannot open error log: " << cfg.error_log << "\n";
        return 1;
    }

    try {
        SyncApp app(std::move(cfg));
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
