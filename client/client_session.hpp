#pragma once

// ============================================================
// client_session.hpp -- One outbound push connection
//
//   CONNECTING -> SENDING -> ... -> TERMINATING -> CLOSED
//   CONNECTING | SENDING -> FAILED on any transport error
//
// Each file is compressed and checksummed completely before any
// byte of its frame is written. A failed write is final: the
// session does not retry.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include "../common/write_buffer.hpp"
#include "../common/transfer_observer.hpp"
#include "dir_scanner.hpp"
#include <memory>
#include <string>

enum class ClientState {
    CONNECTING,
    SENDING,
    TERMINATING,
    CLOSED,
    FAILED,
};

const char* client_state_str(ClientState s);

struct ClientStats {
    u32 files_sent{0};
    u32 files_skipped{0};   // unreadable locally, nothing written
    u64 bytes_original{0};
    u64 bytes_on_wire{0};   // compressed payload bytes
};

class ClientSession {
public:
    explicit ClientSession(TransferObserver& observer = TransferObserver::none());
    ~ClientSession();

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    // Throws TransportError (state -> FAILED)
    void connect(const std::string& host, u16 port);

    // Adopt a socket that is already connected
    void attach(TcpSocket sock);

    // Compress, checksum and send one file.
    // Returns false if the local file could not be read or its path does
    // not fit a string field (skipped, nothing written). Throws TransportError on write failure (state -> FAILED).
    bool send_file(const FileEntry& fe);

    // Send an already encoded record. Throws TransportError.
    void send_record(const FileRecord& rec);

    // Sentinel, flush, close. Throws TransportError (state -> FAILED).
    void finish();

    ClientState state() const { return state_; }
    const ClientStats& stats() const { return stats_; }

private:
    TransferObserver&               observer_;
    TcpSocket                       sock_{INVALID_SOCKET_VAL};
    std::unique_ptr<TcpWriteBuffer> wbuf_;
    ClientState                     state_{ClientState::CONNECTING};
    ClientStats                     stats_;
    std::string                     peer_;

    void require_sending(const char* op) const;
    void fail(const std::string& why);
    void skip_file(const FileEntry& fe, const std::string& why);
};
