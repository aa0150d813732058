// ============================================================
// payload.cpp -- Integrity and compression of file payloads
// ============================================================

#include "payload.hpp"
#include "hash.hpp"
#include "file_io.hpp"
#include <algorithm>
#include <stdexcept>

namespace {

// Compress [data, data+len) in IO_BLOCK_SIZE steps into rec.payload,
// hashing the compressed output as it is produced.
void encode_into(FileRecord& rec, const char* data, u64 len) {
    hash::Sha256 hasher;
    compress::StreamCompressor comp;
    comp.set_pledged_size(len);

    compress::Sink sink = [&rec, &hasher](const u8* p, size_t n) {
        hasher.update(p, n);
        rec.payload.insert(rec.payload.end(), p, p + n);
    };

    u64 offset = 0;
    while (offset < len) {
        size_t n = (size_t)std::min<u64>(IO_BLOCK_SIZE, len - offset);
        comp.update(data + offset, n, sink);
        offset += n;
    }
    comp.finish(sink);

    rec.original_size = len;
    rec.checksum      = hasher.hex_digest();
}

} // namespace

FileRecord payload::encode_file(const std::string& abs_path, const std::string& rel_path) {
    file_io::MmapReader reader(abs_path);
    FileRecord rec;
    rec.rel_path = rel_path;
    encode_into(rec, reader.data(), reader.size());
    return rec;
}

FileRecord payload::encode_buffer(const void* data, size_t len, const std::string& rel_path) {
    FileRecord rec;
    rec.rel_path = rel_path;
    encode_into(rec, static_cast<const char*>(data), len);
    return rec;
}

payload::Verification payload::check_digest(const std::string& expected, const std::string& actual) {
    Verification v;
    v.expected = expected;
    v.actual   = actual;
    v.ok       = hash::is_hex_digest(expected) && expected == actual;
    return v;
}

payload::Verification payload::verify(const std::vector<u8>& compressed, const std::string& expected) {
    return check_digest(expected, hash::sha256_hex(compressed.data(), compressed.size()));
}

u64 payload::decompress(const std::vector<u8>& compressed, const compress::Sink& sink) {
    compress::StreamDecompressor d;
    return d.decompress(compressed.data(), compressed.size(), sink);
}
