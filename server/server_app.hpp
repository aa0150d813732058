#pragma once

// ============================================================
// server_app.hpp -- filepush server: persistent receiver daemon
//
// Concurrency model:
//   accept_loop() -> accepts one socket at a time and spawns one
//                    worker thread per connection.
//   worker        -> runs a ConnectionHandler to completion.
//   Workers share only the read-only ConnectionContext (and the
//   observer, which must therefore be thread-safe).
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include "../common/transfer_observer.hpp"
#include "connection_handler.hpp"
#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <thread>
#include <mutex>

struct ServerConfig {
    std::string   dst_root{"server-out"};
    std::string   listen_ip{"0.0.0.0"};
    u16           listen_port{FILEPUSH_DEFAULT_PORT};   // 0 = ephemeral
    int           idle_timeout_ms{60000};
    FailurePolicy on_mismatch{FailurePolicy::SKIP_FILE};
    FailurePolicy on_path_violation{FailurePolicy::SKIP_FILE};
    FailurePolicy on_disk_error{FailurePolicy::SKIP_FILE};
    u64           max_payload_bytes{DEFAULT_MAX_PAYLOAD};
};

// Totals over every finished connection
struct ServerTotals {
    u32 connections{0};
    u32 completed{0};       // ended with the sentinel
    u32 aborted{0};
    u32 files_stored{0};
    u32 files_rejected{0};
    u64 bytes_written{0};
};

class ServerApp {
public:
    explicit ServerApp(ServerConfig config,
                       TransferObserver& observer = TransferObserver::none());
    ~ServerApp();

    ServerApp(const ServerApp&) = delete;
    ServerApp& operator=(const ServerApp&) = delete;

    // Prepare the destination root, bind and listen.
    // Throws std::runtime_error / TransportError.
    void start();

    // start() if needed, then accept until stop(); joins every worker.
    int run();

    // Safe to call from another thread or a signal handler
    void stop();

    // Actual listening port (useful with listen_port = 0)
    u16 bound_port() const { return bound_port_; }

    ServerTotals totals() const;

private:
    struct Worker {
        std::thread                        thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    ServerConfig           config_;
    TransferObserver&      observer_;
    ConnectionContext      ctx_;
    TcpSocket              listen_sock_;
    std::atomic<bool>      running_{false};
    bool                   started_{false};
    u16                    bound_port_{0};

    std::vector<Worker>    workers_;
    std::mutex             workers_mutex_;

    ServerTotals           totals_;
    mutable std::mutex     totals_mutex_;

    void accept_loop();
    void serve(TcpSocket sock);

    // Join workers that have finished
    void cleanup_threads();
    void join_all();
};
