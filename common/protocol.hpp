#pragma once

// protocol.hpp -- Wire protocol definitions for filepush
//
// One frame per file, big-endian, no version negotiation:
//
//   checksum : u16 len + UTF-8 (64 lower-case hex chars, SHA-256)
//   path     : u16 len + UTF-8 ('/'-separated; "" => end of session)
//   size     : i64 (compressed payload bytes, >= 0)
//   payload  : size bytes (one zstd frame)
//
// The end-of-session sentinel is an empty checksum and an empty path;
// no size or payload follow it.

#include "platform.hpp"
#include <string>
#include <vector>

static constexpr u16 FILEPUSH_DEFAULT_PORT = 9999;

// SHA-256 digest rendered as hex
static constexpr size_t CHECKSUM_HEX_LEN = 64;

// Length prefix of string fields is a u16
static constexpr size_t MAX_STRING_FIELD = 0xFFFFu;

// Block size for file reads, socket payload reads and (de)compression output
static constexpr size_t IO_BLOCK_SIZE = 64u * 1024u;

// Default upper bound on a single compressed payload held by the server
static constexpr u64 DEFAULT_MAX_PAYLOAD = 1024ull * 1024ull * 1024ull;

// zstd level 3 = library default; deterministic for a given input
static constexpr int FILEPUSH_ZSTD_LEVEL = 3;

// ---- Frame header (everything before the payload) ----
struct FrameHeader {
    std::string checksum;
    std::string rel_path;
    i64         payload_len{0};

    bool is_sentinel() const { return rel_path.empty(); }
};

// ---- One file in transit ----
// original_size is informational only; it never goes on the wire.
struct FileRecord {
    std::string     checksum;
    std::string     rel_path;
    u64             original_size{0};
    std::vector<u8> payload;

    FrameHeader header() const {
        FrameHeader h;
        h.checksum    = checksum;
        h.rel_path    = rel_path;
        h.payload_len = (i64)payload.size();
        return h;
    }
};
