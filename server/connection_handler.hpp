#pragma once

// ============================================================
// connection_handler.hpp -- Per-connection receive state machine
//
//   AWAIT_HEADER -> READING_PAYLOAD -> VERIFYING -> PERSISTING
//        ^                                              |
//        +----------------------------------------------+
//
//   Terminal: DONE (sentinel), DISCONNECTED (peer went away between
//   files), ABORTED (broken frame, timeout, or an abort policy).
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include "../common/transfer_observer.hpp"
#include <filesystem>
#include <string>
#include <vector>

enum class HandlerState {
    AWAIT_HEADER,
    READING_PAYLOAD,
    VERIFYING,
    PERSISTING,
    DONE,
    DISCONNECTED,
    ABORTED,
};

const char* handler_state_str(HandlerState s);

// What to do with the connection after a per-file failure
enum class FailurePolicy {
    SKIP_FILE,
    ABORT_CONNECTION,
};

// "skip" / "abort"; returns false for anything else
bool parse_policy(const std::string& name, FailurePolicy& out);
const char* policy_str(FailurePolicy p);

// Shared read-only by every connection worker
struct ConnectionContext {
    std::filesystem::path root;     // canonical destination root
    FailurePolicy on_mismatch{FailurePolicy::SKIP_FILE};
    FailurePolicy on_path_violation{FailurePolicy::SKIP_FILE};
    FailurePolicy on_disk_error{FailurePolicy::SKIP_FILE};
    u64           max_payload_bytes{DEFAULT_MAX_PAYLOAD};
    int           idle_timeout_ms{60000};   // 0 = wait forever
};

struct ConnectionStats {
    u32 files_stored{0};
    u32 files_rejected{0};
    u64 bytes_received{0};  // compressed payload bytes off the wire
    u64 bytes_written{0};   // decompressed bytes persisted
};

class ConnectionHandler {
public:
    ConnectionHandler(TcpSocket socket,
                      const ConnectionContext& ctx,
                      TransferObserver& observer = TransferObserver::none());

    ConnectionHandler(const ConnectionHandler&) = delete;
    ConnectionHandler& operator=(const ConnectionHandler&) = delete;

    // Serve the connection until a terminal state; never throws
    HandlerState run();

    HandlerState state() const { return state_; }
    const ConnectionStats& stats() const { return stats_; }
    const std::string& peer() const { return peer_; }

private:
    TcpSocket                sock_;
    const ConnectionContext& ctx_;
    TransferObserver&        observer_;
    HandlerState             state_{HandlerState::AWAIT_HEADER};
    ConnectionStats          stats_;
    std::string              peer_;

    // One frame after its header. Returns false to end the connection.
    bool handle_frame(const FrameHeader& hdr);

    // Read exactly len bytes into out while hashing them; returns the hex digest
    std::string read_payload(u64 len, std::vector<u8>& out);

    // Read and discard len bytes
    void drain(u64 len);

    bool persist(const FrameHeader& hdr, const std::vector<u8>& compressed);

    // Count and report a rejected file; returns false if the policy aborts
    bool reject(FailurePolicy policy, const FileEvent& ev);
};
