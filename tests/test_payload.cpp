// ============================================================
// test_payload.cpp -- SHA-256, zstd streaming, payload integrity
// ============================================================

#include <gtest/gtest.h>
#include "test_util.hpp"
#include "common/compress.hpp"
#include "common/hash.hpp"
#include "common/payload.hpp"
#include <algorithm>

using testutil::make_bytes;

namespace {

std::string decode_to_string(const std::vector<u8>& compressed) {
    std::string out;
    payload::decompress(compressed, [&out](const u8* p, size_t n) {
        out.append(reinterpret_cast<const char*>(p), n);
    });
    return out;
}

} // namespace

TEST(Hash, KnownVectors) {
    EXPECT_EQ(hash::sha256_hex("abc", 3),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(hash::sha256_hex(nullptr, 0),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Hash, IncrementalMatchesOneShot) {
    std::string data = make_bytes(200000, 7);
    hash::Sha256 h;
    for (size_t off = 0; off < data.size(); off += 4093) {
        h.update(data.data() + off, std::min<size_t>(4093, data.size() - off));
    }
    EXPECT_EQ(h.hex_digest(), hash::sha256_hex(data.data(), data.size()));
}

TEST(Hash, HexDigestFormat) {
    std::string good(64, 'a');
    EXPECT_TRUE(hash::is_hex_digest(good));
    EXPECT_FALSE(hash::is_hex_digest(std::string(63, 'a')));
    EXPECT_FALSE(hash::is_hex_digest(std::string(64, 'A')));
    EXPECT_FALSE(hash::is_hex_digest(std::string(64, 'g')));
    EXPECT_FALSE(hash::is_hex_digest(""));
}

TEST(Compress, OneShotHelpers) {
    std::string text = make_bytes(100000, 3, true);
    std::vector<u8> z = compress::compress_to_vec(text.data(), text.size());
    EXPECT_LT(z.size(), text.size());
    std::vector<u8> back = compress::decompress_to_vec(z.data(), z.size());
    EXPECT_EQ(std::string(back.begin(), back.end()), text);
}

TEST(Payload, EncodeProducesChecksumOfCompressedBytes) {
    std::string text = make_bytes(50000, 11, true);
    FileRecord rec = payload::encode_buffer(text.data(), text.size(), "t.txt");

    EXPECT_EQ(rec.rel_path, "t.txt");
    EXPECT_EQ(rec.original_size, text.size());
    EXPECT_LT(rec.payload.size(), text.size());
    EXPECT_EQ(rec.checksum, hash::sha256_hex(rec.payload.data(), rec.payload.size()));
    EXPECT_TRUE(payload::verify(rec.payload, rec.checksum).ok);
    EXPECT_EQ(decode_to_string(rec.payload), text);

    FrameHeader h = rec.header();
    EXPECT_EQ(h.checksum, rec.checksum);
    EXPECT_EQ(h.rel_path, "t.txt");
    EXPECT_EQ((size_t)h.payload_len, rec.payload.size());
}

TEST(Payload, EmptyInputIsAValidFrame) {
    FileRecord rec = payload::encode_buffer(nullptr, 0, "empty");
    EXPECT_EQ(rec.original_size, 0u);
    EXPECT_FALSE(rec.payload.empty());
    EXPECT_TRUE(payload::verify(rec.payload, rec.checksum).ok);
    EXPECT_EQ(decode_to_string(rec.payload), "");
}

TEST(Payload, LargerThanEveryBlock) {
    std::string data = make_bytes(3 * 1024 * 1024 + 17, 5);
    FileRecord rec = payload::encode_buffer(data.data(), data.size(), "big.bin");
    EXPECT_TRUE(payload::verify(rec.payload, rec.checksum).ok);
    EXPECT_EQ(decode_to_string(rec.payload), data);
}

TEST(Payload, FlippedByteFailsVerification) {
    std::string text = make_bytes(4000, 9, true);
    FileRecord rec = payload::encode_buffer(text.data(), text.size(), "c.txt");
    rec.payload[rec.payload.size() / 2] ^= 0x01;

    payload::Verification v = payload::verify(rec.payload, rec.checksum);
    EXPECT_FALSE(v.ok);
    EXPECT_EQ(v.expected, rec.checksum);
    EXPECT_NE(v.actual, rec.checksum);
}

TEST(Payload, MalformedExpectedDigestNeverMatches) {
    EXPECT_FALSE(payload::check_digest("xyz", "xyz").ok);
    EXPECT_FALSE(payload::check_digest("", "").ok);
}

TEST(Payload, TruncatedFrameFailsToDecode) {
    std::string text = make_bytes(10000, 2);
    FileRecord rec = payload::encode_buffer(text.data(), text.size(), "t");
    rec.payload.resize(rec.payload.size() / 2);
    EXPECT_THROW(decode_to_string(rec.payload), std::runtime_error);

    std::vector<u8> nothing;
    EXPECT_THROW(decode_to_string(nothing), std::runtime_error);
}

TEST(Payload, EncodeFileReadsFromDisk) {
    testutil::TempDir dir("payload");
    std::string text = make_bytes(70000, 4, true);
    testutil::write_file(dir / "f.txt", text);

    FileRecord rec = payload::encode_file((dir / "f.txt").string(), "f.txt");
    EXPECT_EQ(rec.original_size, text.size());
    EXPECT_EQ(decode_to_string(rec.payload), text);

    EXPECT_THROW(payload::encode_file((dir / "missing").string(), "missing"),
                 std::runtime_error);
}
