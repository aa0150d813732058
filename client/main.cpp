// ============================================================
// client/main.cpp -- filepush client entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "client_app.hpp"
#include <iostream>
#include <string>
#include <cstdlib>
#include <cstring>
#include <csignal>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [src_dir] [options]\n"
        << "\n"
        << "  src_dir         directory whose files are pushed (default: data)\n"
        << "\nOptions:\n"
        << "  --host H        filepush_server host name or IPv4 address (default: 127.0.0.1)\n"
        << "  --port N        TCP port (default: 9999)\n"
        << "  --progress      show a progress bar\n"
        << "  --verbose       enable debug logging\n"
        << "  --log-file F    also append log lines to F\n"
        << "\nExamples:\n"
        << "  " << prog << "\n"
        << "  " << prog << " /home/user/data --host 192.168.1.1 --port 9999\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

#ifndef _WIN32
    // A server that goes away mid-frame must surface as EPIPE, not kill us
    signal(SIGPIPE, SIG_IGN);
#endif

    ClientConfig cfg;
    int port_int = cfg.port;
    bool have_src = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            cfg.host = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            port_int = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--progress") == 0) {
            cfg.show_progress = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            Logger::get().set_log_file(argv[++i]);
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-' && !have_src) {
            cfg.src_dir = argv[i];
            have_src = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_path(cfg.src_dir)) {
        std::cerr << "ERROR: Invalid src_dir\n";
        return 1;
    }
    if (cfg.host.empty()) {
        std::cerr << "ERROR: Empty host\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    cfg.port = (u16)port_int;

    try {
        ClientApp app(cfg);
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
