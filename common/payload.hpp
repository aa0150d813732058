#pragma once

// ============================================================
// payload.hpp -- Compress + checksum on send, verify + decompress
//   on receive. The checksum always covers the compressed bytes,
//   so a payload is verified before it reaches the decoder.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "compress.hpp"
#include <string>
#include <vector>

namespace payload {

struct Verification {
    bool        ok{false};
    std::string expected;
    std::string actual;
};

// Read a file through a memory map and compress it block by block,
// hashing each compressed block as it is produced.
// Throws std::runtime_error on read or compression failure.
FileRecord encode_file(const std::string& abs_path, const std::string& rel_path);

FileRecord encode_buffer(const void* data, size_t len, const std::string& rel_path);

// Compare an already computed digest against the one from the wire.
// A malformed expected digest never matches.
Verification check_digest(const std::string& expected, const std::string& actual);

// Hash the compressed bytes and compare
Verification verify(const std::vector<u8>& compressed, const std::string& expected);

// Decompress a verified payload into sink; returns the original size.
// Throws std::runtime_error on a corrupt or truncated stream.
u64 decompress(const std::vector<u8>& compressed, const compress::Sink& sink);

} // namespace payload
