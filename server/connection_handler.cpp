// ============================================================
// connection_handler.cpp -- Per-connection receive state machine
// ============================================================

#include "connection_handler.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/payload.hpp"
#include "../common/utils.hpp"
#include <algorithm>

const char* handler_state_str(HandlerState s) {
    switch (s) {
        case HandlerState::AWAIT_HEADER:    return "AWAIT_HEADER";
        case HandlerState::READING_PAYLOAD: return "READING_PAYLOAD";
        case HandlerState::VERIFYING:       return "VERIFYING";
        case HandlerState::PERSISTING:      return "PERSISTING";
        case HandlerState::DONE:            return "DONE";
        case HandlerState::DISCONNECTED:    return "DISCONNECTED";
        case HandlerState::ABORTED:         return "ABORTED";
    }
    return "?";
}

bool parse_policy(const std::string& name, FailurePolicy& out) {
    if (name == "skip")  { out = FailurePolicy::SKIP_FILE;        return true; }
    if (name == "abort") { out = FailurePolicy::ABORT_CONNECTION; return true; }
    return false;
}

const char* policy_str(FailurePolicy p) {
    return p == FailurePolicy::ABORT_CONNECTION ? "abort" : "skip";
}

ConnectionHandler::ConnectionHandler(TcpSocket socket,
                                     const ConnectionContext& ctx,
                                     TransferObserver& observer)
    : sock_(std::move(socket))
    , ctx_(ctx)
    , observer_(observer)
{
    sock_.tune();
    if (ctx_.idle_timeout_ms > 0) {
        sock_.set_recv_timeout_ms(ctx_.idle_timeout_ms);
    }
    peer_ = sock_.peer_addr();
}

HandlerState ConnectionHandler::run() {
    LOG_INFO("Connection from " + peer_);
    observer_.on_session_start(peer_);

    std::string detail;
    try {
        for (;;) {
            state_ = HandlerState::AWAIT_HEADER;
            FrameHeader hdr;
            if (!sock_.read_frame_header(hdr)) {
                state_ = HandlerState::DISCONNECTED;
                break;
            }
            if (hdr.is_sentinel()) {
                state_ = HandlerState::DONE;
                break;
            }
            if (!handle_frame(hdr)) {
                state_ = HandlerState::ABORTED;
                detail = "aborted by failure policy";
                break;
            }
        }
    } catch (const TransportError& e) {
        LOG_ERROR("Connection " + peer_ + " in state " + handler_state_str(state_) +
                  ": " + e.what());
        detail = e.what();
        state_ = HandlerState::ABORTED;
    } catch (const std::exception& e) {
        LOG_ERROR("Connection " + peer_ + " failed: " + std::string(e.what()));
        detail = e.what();
        state_ = HandlerState::ABORTED;
    }

    sock_.close();

    LOG_INFO("Connection " + peer_ + " " + handler_state_str(state_) + ": " +
             std::to_string(stats_.files_stored) + " stored, " +
             std::to_string(stats_.files_rejected) + " rejected, " +
             utils::format_bytes(stats_.bytes_received) + " received, " +
             utils::format_bytes(stats_.bytes_written) + " written");
    observer_.on_session_end(state_ != HandlerState::ABORTED, detail);
    return state_;
}

bool ConnectionHandler::handle_frame(const FrameHeader& hdr) {
    const u64 len = (u64)hdr.payload_len;
    LOG_DEBUG("Frame " + hdr.rel_path + " (" + utils::format_bytes(len) + ")");

    // ---- READING_PAYLOAD ----
    state_ = HandlerState::READING_PAYLOAD;
    if (len > ctx_.max_payload_bytes) {
        // Keep the stream aligned on the next header
        drain(len);
        LOG_WARN("Rejected " + hdr.rel_path + ": payload of " + utils::format_bytes(len) +
                 " exceeds limit of " + utils::format_bytes(ctx_.max_payload_bytes));
        FileEvent ev;
        ev.rel_path        = hdr.rel_path;
        ev.compressed_size = len;
        ev.outcome         = FileOutcome::TOO_LARGE;
        ev.detail          = "payload exceeds limit";
        return reject(FailurePolicy::SKIP_FILE, ev);
    }

    std::vector<u8> compressed;
    std::string actual = read_payload(len, compressed);

    // ---- VERIFYING ----
    state_ = HandlerState::VERIFYING;
    payload::Verification v = payload::check_digest(hdr.checksum, actual);
    if (!v.ok) {
        ChecksumMismatch err(hdr.rel_path, v.expected, v.actual);
        LOG_ERROR(std::string(err.what()) + ", discarding");
        FileEvent ev;
        ev.rel_path        = hdr.rel_path;
        ev.compressed_size = len;
        ev.outcome         = FileOutcome::CHECKSUM_MISMATCH;
        ev.detail          = err.what();
        return reject(ctx_.on_mismatch, ev);
    }

    // ---- PERSISTING ----
    state_ = HandlerState::PERSISTING;
    return persist(hdr, compressed);
}

std::string ConnectionHandler::read_payload(u64 len, std::vector<u8>& out) {
    hash::Sha256 hasher;
    out.clear();
    out.reserve((size_t)len);

    u64 done = 0;
    while (done < len) {
        size_t n = (size_t)std::min<u64>(len - done, IO_BLOCK_SIZE);
        size_t off = out.size();
        out.resize(off + n);
        if (!sock_.recv_all(out.data() + off, n)) {
            throw TransportError("Stream ended inside payload after " +
                                 std::to_string(done) + " of " +
                                 std::to_string(len) + " bytes");
        }
        hasher.update(out.data() + off, n);
        done += n;
        stats_.bytes_received += n;
    }
    return hasher.hex_digest();
}

void ConnectionHandler::drain(u64 len) {
    std::vector<u8> scratch(IO_BLOCK_SIZE);
    u64 done = 0;
    while (done < len) {
        size_t n = (size_t)std::min<u64>(len - done, scratch.size());
        if (!sock_.recv_all(scratch.data(), n)) {
            throw TransportError("Stream ended inside oversized payload");
        }
        done += n;
        stats_.bytes_received += n;
    }
}

bool ConnectionHandler::persist(const FrameHeader& hdr, const std::vector<u8>& compressed) {
    FileEvent ev;
    ev.rel_path        = hdr.rel_path;
    ev.compressed_size = compressed.size();

    std::filesystem::path target;
    try {
        target = file_io::resolve_under_root(ctx_.root, hdr.rel_path);
    } catch (const PathSecurityViolation& e) {
        LOG_SECURITY("Rejected path from " + peer_ + ": " + e.what());
        ev.outcome = FileOutcome::PATH_REJECTED;
        ev.detail  = e.what();
        return reject(ctx_.on_path_violation, ev);
    }

    try {
        file_io::ensure_parent_dirs(target);
        file_io::PartialFile out(target);
        u64 original = payload::decompress(compressed, [&out](const u8* p, size_t n) {
            out.write(p, n);
        });
        out.commit();
        ev.original_size = original;
    } catch (const std::runtime_error& e) {
        // Decode failures land here too: the bytes were intact but undecodable
        LOG_ERROR("Could not store " + hdr.rel_path + ": " + e.what());
        ev.outcome = FileOutcome::DISK_ERROR;
        ev.detail  = e.what();
        return reject(ctx_.on_disk_error, ev);
    }

    stats_.files_stored++;
    stats_.bytes_written += ev.original_size;
    LOG_INFO("Stored " + hdr.rel_path + " (" + utils::format_bytes(ev.original_size) +
             ", " + utils::format_bytes(ev.compressed_size) + " on wire)");

    ev.outcome = FileOutcome::STORED;
    observer_.on_file(ev);
    return true;
}

bool ConnectionHandler::reject(FailurePolicy policy, const FileEvent& ev) {
    stats_.files_rejected++;
    observer_.on_file(ev);
    if (policy == FailurePolicy::ABORT_CONNECTION) {
        LOG_WARN("Closing connection " + peer_ + " after " +
                 outcome_str(ev.outcome) + " on " + ev.rel_path);
        return false;
    }
    return true;
}
