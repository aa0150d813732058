// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "protocol_io.hpp"
#include "errors.hpp"
#include <climits>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>

#ifndef _WIN32
#  include <sys/uio.h>
#endif

// Buffer size for SO_SNDBUF / SO_RCVBUF = 4 MB
static constexpr int SOCKET_BUF_SIZE = 4 * 1024 * 1024;

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw TransportError("socket() failed: " + socket_error_str(last_socket_error()));
    }
    apply_socket_opts();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {
    if (fd_ != INVALID_SOCKET_VAL) {
        apply_socket_opts();
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    // SO_REUSEADDR
    int on = 1;
#ifdef _WIN32
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, (const char*)&on, sizeof(on));
#else
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#endif
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    int sndbuf = SOCKET_BUF_SIZE;
    int rcvbuf = SOCKET_BUF_SIZE;

#ifdef _WIN32
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  (const char*)&nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, (const char*)&keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    (const char*)&sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    (const char*)&rcvbuf,    sizeof(rcvbuf));
#else
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    &sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    &rcvbuf,    sizeof(rcvbuf));
#endif
}

void TcpSocket::connect(const std::string& host, u16 port) {
    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        throw TransportError("Cannot resolve host " + host + ": " + gai_strerror(rc));
    }

    int err = 0;
    bool connected = false;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        if (::connect(fd_, ai->ai_addr, (int)ai->ai_addrlen) != SOCKET_ERROR_VAL) {
            connected = true;
            break;
        }
        err = last_socket_error();
    }
    ::freeaddrinfo(res);

    if (!connected) {
        throw TransportError("connect() to " + host + ":" + port_str +
                             " failed: " + socket_error_str(err));
    }
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw TransportError("Invalid IP address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw TransportError("bind() failed: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SOCKET_ERROR_VAL) {
        throw TransportError("listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
#ifdef _WIN32
    int peer_len = sizeof(peer);
#else
    socklen_t peer_len = sizeof(peer);
#endif
    socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
    if (client == INVALID_SOCKET_VAL) {
        throw TransportError("accept() failed: " + socket_error_str(last_socket_error()));
    }
    return TcpSocket(client);
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        int sent = ::send(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
#endif
        if (sent <= 0) {
            if (sent == 0) {
                throw TransportError("Connection closed during send");
            }
            int err = last_socket_error();
            if (interrupted(err)) continue;
            throw TransportError("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

bool TcpSocket::recv_all(void* buf, size_t len, size_t* got) {
    char* p = static_cast<char*>(buf);
    size_t remaining = len;
    if (got) *got = 0;
    while (remaining > 0) {
#ifdef _WIN32
        int received = ::recv(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t received = ::recv(fd_, p, remaining, 0);
#endif
        if (received == 0) return false; // clean close
        if (received < 0) {
            int err = last_socket_error();
            if (interrupted(err)) continue;
            if (conn_reset(err)) return false;
            if (would_block(err)) {
                // SO_RCVTIMEO expired
                throw TransportError("Receive timed out (peer idle)");
            }
            throw TransportError("recv() failed: " + socket_error_str(err));
        }
        p += received;
        remaining -= static_cast<size_t>(received);
        if (got) *got += static_cast<size_t>(received);
    }
    return true;
}

void TcpSocket::write_frame(const FrameHeader& hdr, const void* payload, size_t payload_len) {
    std::vector<u8> hdr_buf = proto::encode_header(hdr);

    if (payload_len == 0 || !payload) {
        send_all(hdr_buf.data(), hdr_buf.size());
        return;
    }

#ifdef _WIN32
    // WSASend: merge header + payload into one syscall, handle partial sends
    const char* p0 = reinterpret_cast<const char*>(hdr_buf.data());
    const char* p1 = static_cast<const char*>(payload);
    size_t remaining0 = hdr_buf.size(), remaining1 = payload_len;
    bool hdr_done = false;
    while (!hdr_done || remaining1 > 0) {
        WSABUF wb[2];
        int cnt = 0;
        if (!hdr_done) { wb[cnt].buf = const_cast<char*>(p0); wb[cnt].len = (ULONG)remaining0; ++cnt; }
        if (remaining1 > 0) { wb[cnt].buf = const_cast<char*>(p1); wb[cnt].len = (ULONG)std::min(remaining1, (size_t)INT_MAX); ++cnt; }
        DWORD sent = 0;
        int rc = WSASend(fd_, wb, cnt, &sent, 0, nullptr, nullptr);
        if (rc == SOCKET_ERROR) throw TransportError("WSASend failed: " + socket_error_str(WSAGetLastError()));
        size_t n = sent;
        if (!hdr_done) {
            size_t take = std::min(n, remaining0);
            p0 += take; remaining0 -= take; n -= take;
            if (remaining0 == 0) hdr_done = true;
        }
        if (n > 0) { p1 += n; remaining1 -= n; }
    }
#else
    // sendmsg: merge header + payload into one syscall, handle partial sends
    size_t hdr_len = hdr_buf.size();
    size_t total = hdr_len + payload_len;
    size_t sent_total = 0;
    while (sent_total < total) {
        // Rebuild iovec from remaining data
        struct iovec cur[2];
        int cur_cnt = 0;
        size_t skip = sent_total;
        for (int i = 0; i < 2; ++i) {
            size_t seg_len = (i == 0) ? hdr_len : payload_len;
            const char* seg_base = (i == 0) ? reinterpret_cast<const char*>(hdr_buf.data())
                                             : static_cast<const char*>(payload);
            if (skip >= seg_len) { skip -= seg_len; continue; }
            cur[cur_cnt].iov_base = const_cast<char*>(seg_base + skip);
            cur[cur_cnt].iov_len  = seg_len - skip;
            skip = 0;
            ++cur_cnt;
        }
        msghdr msg{};
        msg.msg_iov    = cur;
        msg.msg_iovlen = (size_t)cur_cnt;
        ssize_t n = ::sendmsg(fd_, &msg, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError("sendmsg failed: " + socket_error_str(errno));
        }
        sent_total += (size_t)n;
    }
#endif
}

void TcpSocket::write_sentinel() {
    std::vector<u8> buf = proto::encode_sentinel();
    send_all(buf.data(), buf.size());
}

std::string TcpSocket::recv_string(u16 len, const char* field) {
    std::string s(len, '\0');
    if (len > 0 && !recv_all(&s[0], len)) {
        throw MalformedFrame(std::string("Stream ended inside ") + field + " field");
    }
    return s;
}

bool TcpSocket::read_frame_header(FrameHeader& hdr) {
    u8 len_buf[2];
    size_t got = 0;
    if (!recv_all(len_buf, 2, &got)) {
        if (got == 0) return false;
        throw MalformedFrame("Stream ended inside checksum length");
    }
    hdr.checksum = recv_string(proto::get_u16(len_buf), "checksum");

    got = 0;
    if (!recv_all(len_buf, 2, &got)) {
        // A bare empty string followed by close also ends a session
        if (got == 0 && hdr.checksum.empty()) {
            hdr.rel_path.clear();
            hdr.payload_len = 0;
            return true;
        }
        throw MalformedFrame("Stream ended inside path length");
    }
    hdr.rel_path = recv_string(proto::get_u16(len_buf), "path");

    hdr.payload_len = 0;
    if (hdr.is_sentinel()) return true;

    u8 size_buf[8];
    if (!recv_all(size_buf, 8)) {
        throw MalformedFrame("Stream ended inside size field");
    }
    hdr.payload_len = proto::decode_payload_len(size_buf);
    return true;
}

void TcpSocket::shutdown() {
    if (fd_ != INVALID_SOCKET_VAL) {
        ::shutdown(fd_, SHUTDOWN_BOTH);
    }
}

void TcpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
#ifdef _WIN32
    int len = sizeof(peer);
#else
    socklen_t len = sizeof(peer);
#endif
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0 && peer.sin_family == AF_INET) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
        }
    }
    return "unknown";
}

u16 TcpSocket::local_port() const {
    sockaddr_in addr{};
#ifdef _WIN32
    int len = sizeof(addr);
#else
    socklen_t len = sizeof(addr);
#endif
    if (getsockname(fd_, (sockaddr*)&addr, &len) != 0) {
        throw TransportError("getsockname() failed: " + socket_error_str(last_socket_error()));
    }
    return ntohs(addr.sin_port);
}

void TcpSocket::set_recv_timeout_ms(int ms) {
#ifdef _WIN32
    DWORD timeout = (DWORD)ms;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, (const char*)&timeout, sizeof(timeout));
#else
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
#endif
}
