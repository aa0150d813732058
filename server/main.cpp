// ============================================================
// server/main.cpp -- filepush server entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "server_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>

static ServerApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [dst_root] [options]\n"
        << "\n"
        << "  dst_root                 directory received files are written under (default: server-out)\n"
        << "\nOptions:\n"
        << "  --ip IP                  IPv4 address to listen on (default: 0.0.0.0)\n"
        << "  --port N                 TCP port (default: 9999)\n"
        << "  --idle-timeout S         drop a connection idle for S seconds, 0 = never (default: 60)\n"
        << "  --on-mismatch P          skip|abort on checksum mismatch (default: skip)\n"
        << "  --on-path-violation P    skip|abort on a path outside dst_root (default: skip)\n"
        << "  --on-disk-error P        skip|abort when a file cannot be stored (default: skip)\n"
        << "  --max-payload-mb N       reject payloads larger than N MiB (default: 1024)\n"
        << "  --verbose                enable debug logging\n"
        << "  --log-file F             also append log lines to F\n"
        << "  --security-log F         security event log (default: security_events.log)\n"
        << "\nThe server listens until SIGINT/SIGTERM and accepts any number of\n"
        << "concurrent client connections.\n"
        << "\nExample:\n"
        << "  " << prog << " /srv/incoming --port 9999 --on-mismatch abort\n";
}

static bool policy_arg(const char* opt, const char* val, FailurePolicy& out) {
    if (parse_policy(val, out)) return true;
    std::cerr << "ERROR: " << opt << " expects skip or abort, got: " << val << "\n";
    return false;
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

#ifndef _WIN32
    signal(SIGPIPE, SIG_IGN);
#endif

    ServerConfig cfg;
    int port_int    = cfg.listen_port;
    int idle_secs   = cfg.idle_timeout_ms / 1000;
    long long max_mb = (long long)(cfg.max_payload_bytes / (1024 * 1024));
    bool have_root  = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--ip") == 0 && i + 1 < argc) {
            cfg.listen_ip = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            port_int = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--idle-timeout") == 0 && i + 1 < argc) {
            idle_secs = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--on-mismatch") == 0 && i + 1 < argc) {
            if (!policy_arg(argv[i], argv[i + 1], cfg.on_mismatch)) return 1;
            ++i;
        } else if (std::strcmp(argv[i], "--on-path-violation") == 0 && i + 1 < argc) {
            if (!policy_arg(argv[i], argv[i + 1], cfg.on_path_violation)) return 1;
            ++i;
        } else if (std::strcmp(argv[i], "--on-disk-error") == 0 && i + 1 < argc) {
            if (!policy_arg(argv[i], argv[i + 1], cfg.on_disk_error)) return 1;
            ++i;
        } else if (std::strcmp(argv[i], "--max-payload-mb") == 0 && i + 1 < argc) {
            max_mb = std::atoll(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            Logger::get().set_log_file(argv[++i]);
        } else if (std::strcmp(argv[i], "--security-log") == 0 && i + 1 < argc) {
            Logger::get().set_security_log_file(argv[++i]);
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-' && !have_root) {
            cfg.dst_root = argv[i];
            have_root = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_path(cfg.dst_root)) {
        std::cerr << "ERROR: Invalid dst_root\n";
        return 1;
    }
    if (cfg.listen_ip != "0.0.0.0" && !utils::validate_ip(cfg.listen_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.listen_ip << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    if (idle_secs < 0 || idle_secs > 24 * 3600) {
        std::cerr << "ERROR: --idle-timeout must be 0-86400\n";
        return 1;
    }
    if (max_mb < 1 || max_mb > 1024LL * 1024) {
        std::cerr << "ERROR: --max-payload-mb must be 1-1048576\n";
        return 1;
    }

    cfg.listen_port       = (u16)port_int;
    cfg.idle_timeout_ms   = idle_secs * 1000;
    cfg.max_payload_bytes = (u64)max_mb * 1024 * 1024;

    try {
        ServerApp app(std::move(cfg));
        app.start();
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
