// ============================================================
// client_session.cpp -- One outbound push connection
// ============================================================

#include "client_session.hpp"
#include "../common/payload.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <stdexcept>

const char* client_state_str(ClientState s) {
    switch (s) {
        case ClientState::CONNECTING:  return "CONNECTING";
        case ClientState::SENDING:     return "SENDING";
        case ClientState::TERMINATING: return "TERMINATING";
        case ClientState::CLOSED:      return "CLOSED";
        case ClientState::FAILED:      return "FAILED";
    }
    return "?";
}

ClientSession::ClientSession(TransferObserver& observer)
    : observer_(observer) {}

ClientSession::~ClientSession() {
    // Dropping the buffer unsent: an unfinished session must not look
    // finished to the server.
    wbuf_.reset();
    sock_.close();
}

void ClientSession::connect(const std::string& host, u16 port) {
    if (state_ != ClientState::CONNECTING) {
        throw std::logic_error(std::string("connect() in state ") + client_state_str(state_));
    }
    LOG_INFO("Connecting to " + host + ":" + std::to_string(port) + " ...");
    try {
        TcpSocket s;
        s.connect(host, port);
        attach(std::move(s));
    } catch (const TransportError& e) {
        fail(e.what());
        throw;
    }
}

void ClientSession::attach(TcpSocket sock) {
    if (state_ != ClientState::CONNECTING) {
        throw std::logic_error(std::string("attach() in state ") + client_state_str(state_));
    }
    sock_  = std::move(sock);
    wbuf_  = std::make_unique<TcpWriteBuffer>(sock_);
    peer_  = sock_.peer_addr();
    state_ = ClientState::SENDING;
    LOG_INFO("Connected to " + peer_);
    observer_.on_session_start(peer_);
}

void ClientSession::require_sending(const char* op) const {
    if (state_ != ClientState::SENDING) {
        throw std::logic_error(std::string(op) + " in state " + client_state_str(state_));
    }
}

void ClientSession::fail(const std::string& why) {
    state_ = ClientState::FAILED;
    wbuf_.reset();
    sock_.close();
    LOG_ERROR("Session failed: " + why);
    observer_.on_session_end(false, why);
}

void ClientSession::skip_file(const FileEntry& fe, const std::string& why) {
    stats_.files_skipped++;
    LOG_ERROR("Skipping " + fe.rel_path.substr(0, 256) + ": " + why);
    FileEvent ev;
    ev.rel_path      = fe.rel_path;
    ev.original_size = fe.file_size;
    ev.outcome       = FileOutcome::READ_ERROR;
    ev.detail        = why;
    observer_.on_file(ev);
}

bool ClientSession::send_file(const FileEntry& fe) {
    require_sending("send_file()");

    if (fe.rel_path.size() > MAX_STRING_FIELD) {
        skip_file(fe, "relative path longer than " + std::to_string(MAX_STRING_FIELD) + " bytes");
        return false;
    }

    // Compress and hash first; nothing is written for this file until
    // the whole record exists.
    FileRecord rec;
    try {
        rec = payload::encode_file(fe.abs_path, fe.rel_path);
    } catch (const std::exception& e) {
        skip_file(fe, e.what());
        return false;
    }

    send_record(rec);
    return true;
}

void ClientSession::send_record(const FileRecord& rec) {
    require_sending("send_record()");

    try {
        wbuf_->write_frame(rec.header(), rec.payload.data(), rec.payload.size());
    } catch (const TransportError& e) {
        fail("sending " + rec.rel_path + ": " + e.what());
        throw;
    }

    stats_.files_sent++;
    stats_.bytes_original += rec.original_size;
    stats_.bytes_on_wire  += rec.payload.size();

    LOG_INFO("Sent " + rec.rel_path + " (" + utils::format_bytes(rec.original_size) +
             " -> " + utils::format_bytes(rec.payload.size()) +
             ", ratio " + utils::format_ratio(rec.payload.size(), rec.original_size) + ")");
    LOG_DEBUG("  sha256 " + rec.checksum);

    FileEvent ev;
    ev.rel_path        = rec.rel_path;
    ev.original_size   = rec.original_size;
    ev.compressed_size = rec.payload.size();
    ev.outcome         = FileOutcome::SENT;
    observer_.on_file(ev);
}

void ClientSession::finish() {
    require_sending("finish()");
    state_ = ClientState::TERMINATING;

    try {
        wbuf_->write_sentinel();
        wbuf_->flush();
    } catch (const TransportError& e) {
        fail(std::string("sending end-of-session: ") + e.what());
        throw;
    }

    wbuf_.reset();
    sock_.close();
    state_ = ClientState::CLOSED;

    LOG_INFO("Session closed: " + std::to_string(stats_.files_sent) + " files, " +
             utils::format_bytes(stats_.bytes_original) + " -> " +
             utils::format_bytes(stats_.bytes_on_wire) + " on wire");
    observer_.on_session_end(true, std::string());
}
