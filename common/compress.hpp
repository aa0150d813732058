#pragma once

// ============================================================
// compress.hpp -- zstd streaming compression wrapper
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <functional>
#include <vector>
#include <string>
#include <stdexcept>

#include <zstd.h>

namespace compress {

// Receives each block of output as it is produced
using Sink = std::function<void(const u8*, size_t)>;

inline void check(size_t rc, const char* what) {
    if (ZSTD_isError(rc)) {
        throw std::runtime_error(std::string(what) + ": " + ZSTD_getErrorName(rc));
    }
}

// Feed input in arbitrary pieces, then finish() to close the frame.
class StreamCompressor {
public:
    explicit StreamCompressor(int level = FILEPUSH_ZSTD_LEVEL)
        : out_(ZSTD_CStreamOutSize()) {
        cctx_ = ZSTD_createCCtx();
        if (!cctx_) throw std::runtime_error("ZSTD_createCCtx failed");
        check(ZSTD_CCtx_setParameter(cctx_, ZSTD_c_compressionLevel, level),
              "ZSTD compression level");
        check(ZSTD_CCtx_setParameter(cctx_, ZSTD_c_checksumFlag, 0),
              "ZSTD checksum flag");
    }

    ~StreamCompressor() {
        if (cctx_) ZSTD_freeCCtx(cctx_);
    }

    StreamCompressor(const StreamCompressor&) = delete;
    StreamCompressor& operator=(const StreamCompressor&) = delete;

    // Records the content size in the frame header; must precede update()
    void set_pledged_size(u64 size) {
        check(ZSTD_CCtx_setPledgedSrcSize(cctx_, (unsigned long long)size),
              "ZSTD pledged size");
    }

    void update(const void* src, size_t len, const Sink& sink) {
        ZSTD_inBuffer in{src, len, 0};
        while (in.pos < in.size) {
            ZSTD_outBuffer out{out_.data(), out_.size(), 0};
            check(ZSTD_compressStream2(cctx_, &out, &in, ZSTD_e_continue),
                  "ZSTD compress error");
            if (out.pos > 0) sink(out_.data(), out.pos);
        }
    }

    void finish(const Sink& sink) {
        ZSTD_inBuffer in{nullptr, 0, 0};
        size_t remaining = 0;
        do {
            ZSTD_outBuffer out{out_.data(), out_.size(), 0};
            remaining = ZSTD_compressStream2(cctx_, &out, &in, ZSTD_e_end);
            check(remaining, "ZSTD compress error");
            if (out.pos > 0) sink(out_.data(), out.pos);
        } while (remaining != 0);
    }

private:
    ZSTD_CCtx*      cctx_{nullptr};
    std::vector<u8> out_;
};

class StreamDecompressor {
public:
    StreamDecompressor() : out_(ZSTD_DStreamOutSize()) {
        dctx_ = ZSTD_createDCtx();
        if (!dctx_) throw std::runtime_error("ZSTD_createDCtx failed");
    }

    ~StreamDecompressor() {
        if (dctx_) ZSTD_freeDCtx(dctx_);
    }

    StreamDecompressor(const StreamDecompressor&) = delete;
    StreamDecompressor& operator=(const StreamDecompressor&) = delete;

    // Decode a complete buffer of one or more frames; returns bytes produced.
    // Throws on corrupt input or a frame cut short.
    u64 decompress(const void* src, size_t len, const Sink& sink) {
        check(ZSTD_DCtx_reset(dctx_, ZSTD_reset_session_only), "ZSTD reset");
        ZSTD_inBuffer in{src, len, 0};
        u64 produced = 0;
        size_t hint = 1;
        bool out_full = false;
        do {
            ZSTD_outBuffer out{out_.data(), out_.size(), 0};
            hint = ZSTD_decompressStream(dctx_, &out, &in);
            check(hint, "ZSTD decompress error");
            if (out.pos > 0) {
                sink(out_.data(), out.pos);
                produced += out.pos;
            }
            out_full = out.pos == out.size;
        } while (in.pos < in.size || (hint != 0 && out_full));

        if (hint != 0) {
            throw std::runtime_error("ZSTD decompress error: truncated frame");
        }
        return produced;
    }

private:
    ZSTD_DCtx*      dctx_{nullptr};
    std::vector<u8> out_;
};

// Compress a memory buffer into one frame
inline std::vector<u8> compress_to_vec(const void* src, size_t src_len,
                                       int level = FILEPUSH_ZSTD_LEVEL) {
    std::vector<u8> buf;
    buf.reserve(ZSTD_compressBound(src_len));
    StreamCompressor c(level);
    c.set_pledged_size(src_len);
    Sink append = [&buf](const u8* p, size_t n) { buf.insert(buf.end(), p, p + n); };
    c.update(src, src_len, append);
    c.finish(append);
    return buf;
}

inline std::vector<u8> decompress_to_vec(const void* src, size_t src_len) {
    std::vector<u8> buf;
    StreamDecompressor d;
    d.decompress(src, src_len, [&buf](const u8* p, size_t n) {
        buf.insert(buf.end(), p, p + n);
    });
    return buf;
}

} // namespace compress
