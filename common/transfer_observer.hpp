#pragma once

// ============================================================
// transfer_observer.hpp -- Telemetry hooks for sessions and files
//   Every hook defaults to a no-op; the transfer path behaves the
//   same whether or not anything is listening.
// ============================================================

#include "platform.hpp"
#include <string>

enum class FileOutcome {
    SENT,
    STORED,
    READ_ERROR,         // client could not read/compress the source
    CHECKSUM_MISMATCH,
    PATH_REJECTED,
    TOO_LARGE,
    DISK_ERROR,
};

inline const char* outcome_str(FileOutcome o) {
    switch (o) {
        case FileOutcome::SENT:              return "sent";
        case FileOutcome::STORED:            return "stored";
        case FileOutcome::READ_ERROR:        return "read-error";
        case FileOutcome::CHECKSUM_MISMATCH: return "checksum-mismatch";
        case FileOutcome::PATH_REJECTED:     return "path-rejected";
        case FileOutcome::TOO_LARGE:         return "too-large";
        case FileOutcome::DISK_ERROR:        return "disk-error";
    }
    return "unknown";
}

struct FileEvent {
    std::string rel_path;
    u64         original_size{0};
    u64         compressed_size{0};
    FileOutcome outcome{FileOutcome::SENT};
    std::string detail;
};

class TransferObserver {
public:
    virtual ~TransferObserver() = default;

    virtual void on_session_start(const std::string& /*peer*/) {}
    virtual void on_file(const FileEvent& /*ev*/) {}
    virtual void on_session_end(bool /*ok*/, const std::string& /*detail*/) {}

    // Shared stateless no-op instance
    static TransferObserver& none() {
        static TransferObserver instance;
        return instance;
    }
};
