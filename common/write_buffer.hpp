#pragma once

// ============================================================
// write_buffer.hpp -- Application-level write buffer for TcpSocket
//
// Coalesces the frames of many small files into a few large send()
// calls. A payload at or above the threshold skips the copy: the
// buffer is flushed and the frame goes straight to the socket.
//
// Usage:
//   {
//       TcpWriteBuffer wbuf(sock);
//       for (auto& rec : records)
//           wbuf.write_frame(rec.header(), rec.payload.data(), rec.payload.size());
//       wbuf.write_sentinel();
//       wbuf.flush();
//   }
//
// The destructor does not flush: an error path must not push half a
// session onto the wire. Call flush() explicitly.
// Thread safety: NOT thread-safe; use one buffer per connection.
// ============================================================

#include "socket.hpp"
#include "protocol_io.hpp"
#include <vector>

class TcpWriteBuffer {
public:
    // 256 KB amortises syscall overhead for small files
    static constexpr size_t DEFAULT_THRESHOLD = 256 * 1024;

    explicit TcpWriteBuffer(TcpSocket& sock,
                            size_t threshold = DEFAULT_THRESHOLD)
        : sock_(sock), threshold_(threshold)
    {
        buf_.reserve(threshold + 4096);
    }

    // Non-copyable, non-movable (holds a reference to TcpSocket)
    TcpWriteBuffer(const TcpWriteBuffer&) = delete;
    TcpWriteBuffer& operator=(const TcpWriteBuffer&) = delete;

    void write_frame(const FrameHeader& hdr, const void* data, size_t len) {
        if (len >= threshold_) {
            flush();
            sock_.write_frame(hdr, data, len);
            return;
        }

        std::vector<u8> hdr_buf = proto::encode_header(hdr);
        buf_.insert(buf_.end(), hdr_buf.begin(), hdr_buf.end());
        if (data && len > 0) {
            buf_.insert(buf_.end(),
                        static_cast<const u8*>(data),
                        static_cast<const u8*>(data) + len);
        }

        if (buf_.size() >= threshold_) flush();
    }

    void write_sentinel() {
        std::vector<u8> s = proto::encode_sentinel();
        buf_.insert(buf_.end(), s.begin(), s.end());
    }

    // Send all buffered data to the socket
    void flush() {
        if (!buf_.empty()) {
            sock_.send_all(buf_.data(), buf_.size());
            buf_.clear();
        }
    }

private:
    TcpSocket&      sock_;
    size_t          threshold_;
    std::vector<u8> buf_;
};
