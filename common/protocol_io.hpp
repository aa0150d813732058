#pragma once

// ============================================================
// protocol_io.hpp -- Frame encode/decode with byte-order handling
//   Pure byte manipulation; socket I/O lives in socket.cpp.
// ============================================================

#include "protocol.hpp"
#include "errors.hpp"
#include <cstring>
#include <string>
#include <vector>

// Linux: htobe16/64 and be16/64toh live in <endian.h>
#ifndef _WIN32
#  include <endian.h>
#endif

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) {
#if defined(_WIN32)
    return htons(v);
#else
    return htobe16(v);
#endif
}

inline u64 hton64(u64 v) {
#if defined(_WIN32)
    return (((u64)htonl((u32)(v & 0xFFFFFFFFull))) << 32) | htonl((u32)(v >> 32));
#else
    return htobe64(v);
#endif
}

inline u16 ntoh16(u16 v) {
#if defined(_WIN32)
    return ntohs(v);
#else
    return be16toh(v);
#endif
}

inline u64 ntoh64(u64 v) {
#if defined(_WIN32)
    return (((u64)ntohl((u32)(v & 0xFFFFFFFFull))) << 32) | ntohl((u32)(v >> 32));
#else
    return be64toh(v);
#endif
}

// ---- Field encoders (append to buf) ----

inline void put_u16(std::vector<u8>& buf, u16 v) {
    u16 be = hton16(v);
    const u8* p = reinterpret_cast<const u8*>(&be);
    buf.insert(buf.end(), p, p + 2);
}

inline void put_i64(std::vector<u8>& buf, i64 v) {
    u64 be = hton64((u64)v);
    const u8* p = reinterpret_cast<const u8*>(&be);
    buf.insert(buf.end(), p, p + 8);
}

// Length-prefixed string; throws if it does not fit the u16 prefix
inline void put_string(std::vector<u8>& buf, const std::string& s) {
    if (s.size() > MAX_STRING_FIELD) {
        throw std::length_error("String field too long: " + std::to_string(s.size()) + " bytes");
    }
    put_u16(buf, (u16)s.size());
    buf.insert(buf.end(), s.begin(), s.end());
}

// ---- Field decoders ----

inline u16 get_u16(const u8 buf[2]) {
    u16 v;
    std::memcpy(&v, buf, 2);
    return ntoh16(v);
}

inline i64 get_i64(const u8 buf[8]) {
    u64 v;
    std::memcpy(&v, buf, 8);
    return (i64)ntoh64(v);
}

// ---- Frames ----

// Checksum, path and size fields. The payload is sent separately.
inline std::vector<u8> encode_header(const FrameHeader& h) {
    if (h.rel_path.empty()) {
        throw std::invalid_argument("File frame needs a non-empty path");
    }
    if (h.payload_len < 0) {
        throw std::invalid_argument("Negative payload length");
    }
    std::vector<u8> buf;
    buf.reserve(2 + h.checksum.size() + 2 + h.rel_path.size() + 8);
    put_string(buf, h.checksum);
    put_string(buf, h.rel_path);
    put_i64(buf, h.payload_len);
    return buf;
}

// End-of-session: empty checksum, empty path, nothing else
inline std::vector<u8> encode_sentinel() {
    std::vector<u8> buf;
    put_string(buf, std::string());
    put_string(buf, std::string());
    return buf;
}

inline i64 decode_payload_len(const u8 buf[8]) {
    i64 len = get_i64(buf);
    if (len < 0) {
        throw MalformedFrame("Negative payload length: " + std::to_string(len));
    }
    return len;
}

} // namespace proto
