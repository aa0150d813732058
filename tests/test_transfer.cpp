// ============================================================
// test_transfer.cpp -- ClientSession against ConnectionHandler
//   over a local socket pair
// ============================================================

#include <gtest/gtest.h>
#include "test_util.hpp"
#include "client/client_session.hpp"
#include "client/dir_scanner.hpp"
#include "common/errors.hpp"
#include "common/file_io.hpp"
#include "common/hash.hpp"
#include "common/payload.hpp"
#include "common/protocol_io.hpp"
#include "server/connection_handler.hpp"
#include <mutex>
#include <thread>

namespace fs = std::filesystem;
using testutil::TempDir;
using testutil::make_bytes;
using testutil::read_file;
using testutil::write_file;

namespace {

class RecordingObserver : public TransferObserver {
public:
    void on_file(const FileEvent& ev) override {
        std::lock_guard<std::mutex> lk(mu_);
        events_.push_back(ev);
    }
    void on_session_end(bool ok, const std::string& /*detail*/) override {
        std::lock_guard<std::mutex> lk(mu_);
        ended_ = true;
        ok_ = ok;
    }

    std::vector<FileEvent> events() const {
        std::lock_guard<std::mutex> lk(mu_);
        return events_;
    }
    size_t count(FileOutcome o) const {
        std::lock_guard<std::mutex> lk(mu_);
        size_t n = 0;
        for (const auto& ev : events_) n += ev.outcome == o;
        return n;
    }
    bool ended_ok() const {
        std::lock_guard<std::mutex> lk(mu_);
        return ended_ && ok_;
    }

private:
    mutable std::mutex     mu_;
    std::vector<FileEvent> events_;
    bool                   ended_{false};
    bool                   ok_{false};
};

FileRecord text_record(const std::string& rel, const std::string& text) {
    return payload::encode_buffer(text.data(), text.size(), rel);
}

} // namespace

class TransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        testutil::quiet_logging();
        ctx_.root = file_io::canonical_root((dir_ / "out").string());
    }

    void TearDown() override {
        if (server_.joinable()) server_.join();
    }

    // Start a handler on one end of a fresh pair; return the other end
    TcpSocket start_server() {
        auto socks = testutil::socket_pair();
        server_ = std::thread([this, s = std::move(socks.second)]() mutable {
            ConnectionHandler h(std::move(s), ctx_, observer_);
            final_ = h.run();
            stats_ = h.stats();
        });
        return std::move(socks.first);
    }

    HandlerState wait_server() {
        if (server_.joinable()) server_.join();
        return final_;
    }

    TempDir           dir_{"transfer"};
    ConnectionContext ctx_;
    RecordingObserver observer_;
    std::thread       server_;
    HandlerState      final_{HandlerState::AWAIT_HEADER};
    ConnectionStats   stats_;
};

TEST_F(TransferTest, SingleFileRoundTrip) {
    ClientSession session;
    session.attach(start_server());
    EXPECT_EQ(session.state(), ClientState::SENDING);

    session.send_record(text_record("docs/readme.txt", "hello, filepush"));
    session.finish();
    EXPECT_EQ(session.state(), ClientState::CLOSED);

    EXPECT_EQ(wait_server(), HandlerState::DONE);
    EXPECT_EQ(read_file(ctx_.root / "docs/readme.txt"), "hello, filepush");
    EXPECT_EQ(stats_.files_stored, 1u);
    EXPECT_EQ(stats_.files_rejected, 0u);
    EXPECT_EQ(observer_.count(FileOutcome::STORED), 1u);
    EXPECT_TRUE(observer_.ended_ok());
}

TEST_F(TransferTest, SentinelWithZeroFiles) {
    ClientSession session;
    session.attach(start_server());
    session.finish();

    EXPECT_EQ(wait_server(), HandlerState::DONE);
    EXPECT_EQ(stats_.files_stored, 0u);
    EXPECT_TRUE(fs::is_empty(ctx_.root));
}

TEST_F(TransferTest, CorruptedPayloadNeverWritten) {
    ClientSession session;
    session.attach(start_server());

    FileRecord bad = text_record("bad.txt", make_bytes(5000, 1, true));
    bad.payload[bad.payload.size() / 2] ^= 0x40;
    session.send_record(bad);
    session.send_record(text_record("good.txt", "fine"));
    session.finish();

    EXPECT_EQ(wait_server(), HandlerState::DONE);
    EXPECT_FALSE(fs::exists(ctx_.root / "bad.txt"));
    EXPECT_EQ(read_file(ctx_.root / "good.txt"), "fine");
    EXPECT_EQ(stats_.files_rejected, 1u);
    EXPECT_EQ(stats_.files_stored, 1u);

    ASSERT_EQ(observer_.count(FileOutcome::CHECKSUM_MISMATCH), 1u);
    for (const auto& ev : observer_.events()) {
        if (ev.outcome == FileOutcome::CHECKSUM_MISMATCH) {
            EXPECT_EQ(ev.rel_path, "bad.txt");
            EXPECT_NE(ev.detail.find(bad.checksum), std::string::npos);
        }
    }
}

TEST_F(TransferTest, MismatchAbortPolicyEndsConnection) {
    ctx_.on_mismatch = FailurePolicy::ABORT_CONNECTION;
    ClientSession session;
    session.attach(start_server());

    FileRecord bad = text_record("bad.txt", "payload");
    bad.checksum = std::string(CHECKSUM_HEX_LEN, '0');
    try {
        session.send_record(bad);
        session.send_record(text_record("after.txt", "never"));
        session.finish();
    } catch (const TransportError&) {
        // The server may already be gone
    }

    EXPECT_EQ(wait_server(), HandlerState::ABORTED);
    EXPECT_FALSE(fs::exists(ctx_.root / "bad.txt"));
    EXPECT_FALSE(fs::exists(ctx_.root / "after.txt"));
}

TEST_F(TransferTest, PathEscapeRejected) {
    ClientSession session;
    session.attach(start_server());
    session.send_record(text_record("../outside.txt", "escape"));
    session.send_record(text_record("inside.txt", "ok"));
    session.finish();

    EXPECT_EQ(wait_server(), HandlerState::DONE);
    EXPECT_FALSE(fs::exists(ctx_.root.parent_path() / "outside.txt"));
    EXPECT_EQ(read_file(ctx_.root / "inside.txt"), "ok");
    EXPECT_EQ(observer_.count(FileOutcome::PATH_REJECTED), 1u);
}

TEST_F(TransferTest, PathViolationAbortPolicy) {
    ctx_.on_path_violation = FailurePolicy::ABORT_CONNECTION;
    ClientSession session;
    session.attach(start_server());
    try {
        session.send_record(text_record("/etc/filepush-test", "x"));
        session.send_record(text_record("later.txt", "y"));
        session.finish();
    } catch (const TransportError&) {
    }

    EXPECT_EQ(wait_server(), HandlerState::ABORTED);
    EXPECT_FALSE(fs::exists(ctx_.root / "later.txt"));
}

TEST_F(TransferTest, LargeFileReassembledLosslessly) {
    // Bigger than the payload block, the write buffer and the socket buffers
    std::string big = make_bytes(6 * 1024 * 1024 + 123, 42);
    write_file(dir_ / "src/big.bin", big);

    ClientSession session;
    session.attach(start_server());
    FileEntry fe;
    fe.rel_path  = "big.bin";
    fe.abs_path  = (dir_ / "src/big.bin").string();
    fe.file_size = big.size();
    EXPECT_TRUE(session.send_file(fe));
    session.finish();

    EXPECT_EQ(wait_server(), HandlerState::DONE);
    EXPECT_EQ(read_file(ctx_.root / "big.bin"), big);
    EXPECT_EQ(stats_.bytes_written, big.size());
    EXPECT_EQ(session.stats().bytes_original, big.size());
}

TEST_F(TransferTest, MultiFileSessionFromScannedTree) {
    const int n = 25;
    for (int i = 0; i < n; ++i) {
        write_file(dir_ / ("src/d" + std::to_string(i % 4) + "/f" + std::to_string(i) + ".txt"),
                   make_bytes(100 + i * 37, (u32)i + 1, i % 2 == 0));
    }
    DirScanner scanner((dir_ / "src").string());
    std::vector<FileEntry> files = scanner.scan();
    ASSERT_EQ(files.size(), (size_t)n);

    ClientSession session;
    session.attach(start_server());
    for (const auto& fe : files) EXPECT_TRUE(session.send_file(fe));
    session.finish();

    EXPECT_EQ(wait_server(), HandlerState::DONE);
    EXPECT_EQ(stats_.files_stored, (u32)n);
    for (const auto& fe : files) {
        EXPECT_EQ(read_file(ctx_.root / fe.rel_path), read_file(fe.abs_path)) << fe.rel_path;
    }
}

TEST_F(TransferTest, ExistingFileReplacedWithoutLeftovers) {
    write_file(ctx_.root / "f.txt", "old contents");

    ClientSession session;
    session.attach(start_server());
    session.send_record(text_record("f.txt", "new"));
    session.finish();

    EXPECT_EQ(wait_server(), HandlerState::DONE);
    EXPECT_EQ(read_file(ctx_.root / "f.txt"), "new");
    for (const auto& de : fs::directory_iterator(ctx_.root)) {
        EXPECT_EQ(de.path().filename().string(), "f.txt");
    }
}

TEST_F(TransferTest, EmptyFileStored) {
    ClientSession session;
    session.attach(start_server());
    session.send_record(text_record("empty.txt", ""));
    session.finish();

    EXPECT_EQ(wait_server(), HandlerState::DONE);
    ASSERT_TRUE(fs::exists(ctx_.root / "empty.txt"));
    EXPECT_EQ(fs::file_size(ctx_.root / "empty.txt"), 0u);
}

TEST_F(TransferTest, OversizedPayloadDrainedAndSkipped) {
    ctx_.max_payload_bytes = 64;
    ClientSession session;
    session.attach(start_server());

    // Incompressible, so the frame is far over the limit
    session.send_record(text_record("huge.bin", make_bytes(4096, 77)));
    session.send_record(text_record("small.txt", "hi"));
    session.finish();

    EXPECT_EQ(wait_server(), HandlerState::DONE);
    EXPECT_FALSE(fs::exists(ctx_.root / "huge.bin"));
    EXPECT_EQ(read_file(ctx_.root / "small.txt"), "hi");
    EXPECT_EQ(observer_.count(FileOutcome::TOO_LARGE), 1u);
}

TEST_F(TransferTest, UndecodablePayloadIsDiskError) {
    ClientSession session;
    session.attach(start_server());

    // Checksum matches, but the bytes are not a zstd frame
    FileRecord rec;
    rec.rel_path = "junk.bin";
    rec.payload  = {1, 2, 3, 4, 5, 6, 7, 8};
    rec.checksum = hash::sha256_hex(rec.payload.data(), rec.payload.size());
    session.send_record(rec);
    session.finish();

    EXPECT_EQ(wait_server(), HandlerState::DONE);
    EXPECT_FALSE(fs::exists(ctx_.root / "junk.bin"));
    EXPECT_EQ(observer_.count(FileOutcome::DISK_ERROR), 1u);
    for (const auto& de : fs::directory_iterator(ctx_.root)) {
        ADD_FAILURE() << "leftover " << de.path();
    }
}

TEST_F(TransferTest, UnreadableSourceSkippedOnClient) {
    ClientSession session;
    session.attach(start_server());

    FileEntry fe;
    fe.rel_path = "gone.txt";
    fe.abs_path = (dir_ / "src/gone.txt").string();
    EXPECT_FALSE(session.send_file(fe));
    EXPECT_EQ(session.stats().files_skipped, 1u);
    EXPECT_EQ(session.state(), ClientState::SENDING);
    session.finish();

    EXPECT_EQ(wait_server(), HandlerState::DONE);
    EXPECT_EQ(stats_.files_stored, 0u);
}

TEST_F(TransferTest, OverlongPathSkippedOnClient) {
    write_file(dir_ / "src/real.txt", "data");
    ClientSession session(observer_);
    session.attach(start_server());

    FileEntry fe;
    fe.rel_path = std::string(MAX_STRING_FIELD + 10, 'p');
    fe.abs_path = (dir_ / "src/real.txt").string();
    EXPECT_FALSE(session.send_file(fe));
    EXPECT_EQ(session.stats().files_skipped, 1u);
    EXPECT_EQ(session.state(), ClientState::SENDING);
    session.finish();

    EXPECT_EQ(wait_server(), HandlerState::DONE);
    EXPECT_EQ(stats_.files_stored, 0u);
    EXPECT_EQ(observer_.count(FileOutcome::READ_ERROR), 1u);
}

TEST_F(TransferTest, NegativeSizeAborts) {
    TcpSocket client = start_server();
    std::vector<u8> raw;
    proto::put_string(raw, std::string(CHECKSUM_HEX_LEN, 'a'));
    proto::put_string(raw, "x.txt");
    proto::put_i64(raw, -1);
    client.send_all(raw.data(), raw.size());

    EXPECT_EQ(wait_server(), HandlerState::ABORTED);
    EXPECT_FALSE(fs::exists(ctx_.root / "x.txt"));
}

TEST_F(TransferTest, EndOfStreamInsidePayloadAborts) {
    TcpSocket client = start_server();
    FrameHeader h;
    h.checksum    = std::string(CHECKSUM_HEX_LEN, 'a');
    h.rel_path    = "cut.txt";
    h.payload_len = 100;
    std::vector<u8> raw = proto::encode_header(h);
    raw.resize(raw.size() + 10, 0x55);
    client.send_all(raw.data(), raw.size());
    client.close();

    EXPECT_EQ(wait_server(), HandlerState::ABORTED);
    EXPECT_FALSE(fs::exists(ctx_.root / "cut.txt"));
    EXPECT_FALSE(observer_.ended_ok());
}

TEST_F(TransferTest, BareEmptyStringThenCloseEndsCleanly) {
    TcpSocket client = start_server();
    std::vector<u8> raw;
    proto::put_string(raw, std::string());
    client.send_all(raw.data(), raw.size());
    client.close();

    EXPECT_EQ(wait_server(), HandlerState::DONE);
    EXPECT_TRUE(observer_.ended_ok());
    EXPECT_EQ(stats_.files_stored, 0u);
}

TEST_F(TransferTest, CloseBetweenFilesIsDisconnected) {
    {
        ClientSession session;
        session.attach(start_server());
        session.send_record(text_record("one.txt", "1"));
        // No finish(): the destructor drops the buffered frame and closes
    }
    EXPECT_EQ(wait_server(), HandlerState::DISCONNECTED);
    EXPECT_FALSE(fs::exists(ctx_.root / "one.txt"));
}

TEST_F(TransferTest, IdlePeerTimesOut) {
    ctx_.idle_timeout_ms = 200;
    TcpSocket client = start_server();
    EXPECT_EQ(wait_server(), HandlerState::ABORTED);
    client.close();
}

TEST_F(TransferTest, WriteFailureMovesClientToFailed) {
    auto socks = testutil::socket_pair();
    socks.second.close();

    ClientSession session;
    session.attach(std::move(socks.first));
    // Above the write-buffer threshold, so it goes straight to the socket
    std::string big = make_bytes(600 * 1024, 8);
    EXPECT_THROW(session.send_record(text_record("big.bin", big)), TransportError);
    EXPECT_EQ(session.state(), ClientState::FAILED);
    EXPECT_THROW(session.finish(), std::logic_error);
}

TEST(FailurePolicy, ParseNames) {
    FailurePolicy p = FailurePolicy::SKIP_FILE;
    EXPECT_TRUE(parse_policy("abort", p));
    EXPECT_EQ(p, FailurePolicy::ABORT_CONNECTION);
    EXPECT_TRUE(parse_policy("skip", p));
    EXPECT_EQ(p, FailurePolicy::SKIP_FILE);
    EXPECT_FALSE(parse_policy("retry", p));
    EXPECT_STREQ(policy_str(FailurePolicy::ABORT_CONNECTION), "abort");
}
