// ============================================================
// server_app.cpp -- filepush server daemon implementation
// ============================================================

#include "server_app.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

ServerApp::ServerApp(ServerConfig config, TransferObserver& observer)
    : config_(std::move(config))
    , observer_(observer)
{}

ServerApp::~ServerApp() {
    stop();
    join_all();
}

void ServerApp::start() {
    if (started_) return;

    ctx_.root              = file_io::canonical_root(config_.dst_root);
    ctx_.on_mismatch       = config_.on_mismatch;
    ctx_.on_path_violation = config_.on_path_violation;
    ctx_.on_disk_error     = config_.on_disk_error;
    ctx_.max_payload_bytes = config_.max_payload_bytes;
    ctx_.idle_timeout_ms   = config_.idle_timeout_ms;

    listen_sock_.bind_and_listen(config_.listen_ip, config_.listen_port);
    bound_port_ = listen_sock_.local_port();
    started_ = true;
    running_.store(true);

    LOG_INFO("filepush server listening on " + config_.listen_ip + ":" +
             std::to_string(bound_port_) + ", writing to " + ctx_.root.string());
    LOG_INFO("Policies: mismatch=" + std::string(policy_str(ctx_.on_mismatch)) +
             " path-violation=" + policy_str(ctx_.on_path_violation) +
             " disk-error=" + policy_str(ctx_.on_disk_error) +
             " max-payload=" + utils::format_bytes(ctx_.max_payload_bytes));
}

int ServerApp::run() {
    start();
    accept_loop();

    listen_sock_.close();
    join_all();

    ServerTotals t = totals();
    LOG_INFO("Server stopped: " + std::to_string(t.connections) + " connections, " +
             std::to_string(t.files_stored) + " files stored, " +
             std::to_string(t.files_rejected) + " rejected");
    return 0;
}

void ServerApp::stop() {
    running_.store(false);
    // Wakes the accept() in accept_loop; run() closes the socket
    listen_sock_.shutdown();
#ifdef _WIN32
    listen_sock_.close();
#endif
}

ServerTotals ServerApp::totals() const {
    std::lock_guard<std::mutex> lk(totals_mutex_);
    return totals_;
}

// ---------------------------------------------------------------
// accept_loop
//   Pure accept() loop; every accepted socket gets its own worker.
// ---------------------------------------------------------------
void ServerApp::accept_loop() {
    while (running_.load()) {
        try {
            TcpSocket sock = listen_sock_.accept();
            if (!running_.load()) break;

            LOG_DEBUG("Accepted socket from " + sock.peer_addr());

            auto finished = std::make_shared<std::atomic<bool>>(false);
            std::thread t([this, s = std::move(sock), finished]() mutable {
                serve(std::move(s));
                finished->store(true);
            });
            {
                std::lock_guard<std::mutex> lk(workers_mutex_);
                workers_.push_back(Worker{std::move(t), finished});
            }

            cleanup_threads();

        } catch (const std::exception& e) {
            if (!running_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
        }
    }
}

void ServerApp::serve(TcpSocket sock) {
    HandlerState st = HandlerState::ABORTED;
    ConnectionStats cs;
    try {
        ConnectionHandler handler(std::move(sock), ctx_, observer_);
        st = handler.run();
        cs = handler.stats();
    } catch (const std::exception& e) {
        LOG_ERROR("Connection worker: " + std::string(e.what()));
    }

    std::lock_guard<std::mutex> lk(totals_mutex_);
    totals_.connections++;
    if (st == HandlerState::DONE) totals_.completed++;
    if (st == HandlerState::ABORTED) totals_.aborted++;
    totals_.files_stored   += cs.files_stored;
    totals_.files_rejected += cs.files_rejected;
    totals_.bytes_written  += cs.bytes_written;
}

void ServerApp::cleanup_threads() {
    std::lock_guard<std::mutex> lk(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end(); ) {
        if (it->finished->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void ServerApp::join_all() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lk(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}
