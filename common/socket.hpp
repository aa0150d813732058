#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <stdexcept>
#include <vector>

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: resolve host (name or dotted quad) and connect
    void connect(const std::string& host, u16 port);

    // Server: bind + listen (port 0 picks an ephemeral port)
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 128);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send exactly 'len' bytes; throws TransportError
    void send_all(const void* buf, size_t len);

    // Receive exactly 'len' bytes. Returns false if the peer closed or
    // reset first; *got (if given) reports how many bytes did arrive.
    // Throws TransportError on timeout or other socket errors.
    bool recv_all(void* buf, size_t len, size_t* got = nullptr);

    // Send a file frame: header fields then payload, in as few syscalls
    // as the OS allows
    void write_frame(const FrameHeader& hdr, const void* payload, size_t payload_len);

    // Send the end-of-session marker
    void write_sentinel();

    // Read checksum, path and (unless sentinel) size.
    // Returns false on clean close before the first header byte.
    // An empty checksum followed by a clean close reads as the sentinel.
    // Throws MalformedFrame if the stream ends elsewhere inside the header.
    bool read_frame_header(FrameHeader& hdr);

    // Apply TCP performance tuning
    void tune();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    // Wake any thread blocked in accept()/recv() on this socket
    void shutdown();

    void close();

    // Get peer address as string
    std::string peer_addr() const;

    // Port this socket is bound to (after bind_and_listen)
    u16 local_port() const;

    // Set receive timeout in milliseconds (0 = infinite)
    void set_recv_timeout_ms(int ms);

private:
    socket_t fd_{INVALID_SOCKET_VAL};

    void apply_socket_opts();
    std::string recv_string(u16 len, const char* field);
};
