#pragma once

// ============================================================
// client_app.hpp -- filepush client: scan a directory and push
//   every regular file in it over one connection
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include <string>

struct ClientConfig {
    std::string src_dir{"data"};
    std::string host{"127.0.0.1"};
    u16         port{FILEPUSH_DEFAULT_PORT};
    bool        show_progress{false};
};

class ClientApp {
public:
    explicit ClientApp(const ClientConfig& cfg);

    // Scan, connect, send all files, send the sentinel.
    // Returns 0 if every file was sent, 1 otherwise.
    // Throws std::runtime_error if src_dir is not a directory.
    int run();

private:
    ClientConfig cfg_;
};
