#pragma once

// ============================================================
// hash.hpp -- SHA-256 wrappers (OpenSSL EVP) for filepush
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <openssl/evp.h>
#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace hash {

using Digest256 = std::array<u8, 32>;

// Lower-case hex rendering
inline std::string to_hex(const u8* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

inline std::string to_hex(const Digest256& d) {
    return to_hex(d.data(), d.size());
}

// True for exactly CHECKSUM_HEX_LEN lower-case hex characters
inline bool is_hex_digest(const std::string& s) {
    if (s.size() != CHECKSUM_HEX_LEN) return false;
    for (char c : s) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) return false;
    }
    return true;
}

// Streaming SHA-256
class Sha256 {
public:
    Sha256() {
        ctx_ = EVP_MD_CTX_new();
        if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
        reset();
    }

    ~Sha256() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void reset() {
        if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
        }
    }

    void update(const void* data, size_t len) {
        if (len == 0) return;
        if (EVP_DigestUpdate(ctx_, data, len) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }

    // Finalizes; call reset() before reusing
    Digest256 digest() {
        Digest256 out{};
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1 || len != out.size()) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return out;
    }

    std::string hex_digest() { return to_hex(digest()); }

private:
    EVP_MD_CTX* ctx_{nullptr};
};

// One-shot SHA-256 of a memory buffer, as hex
inline std::string sha256_hex(const void* data, size_t len) {
    Sha256 h;
    h.update(data, len);
    return h.hex_digest();
}

} // namespace hash
