#pragma once

// ============================================================
// file_io.hpp -- Source mapping, destination writing, path safety
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const char* data() const { return data_; }
    u64 size() const { return size_; }

    void close();

private:
    const char* data_{nullptr};
    u64 size_{0};

#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
    HANDLE map_handle_{nullptr};
#else
    int fd_{-1};
#endif
};

// ---- PartialFile: write to a hidden sibling, rename into place ----
// The target is only replaced by commit(); a PartialFile destroyed
// without commit() removes its temporary file.
class PartialFile {
public:
    explicit PartialFile(const fs::path& target);
    ~PartialFile();

    PartialFile(const PartialFile&) = delete;
    PartialFile& operator=(const PartialFile&) = delete;

    // Throws DiskError
    void write(const void* data, size_t len);
    void commit();

    const fs::path& target() const { return target_; }
    const fs::path& temp_path() const { return temp_; }
    u64 bytes_written() const { return written_; }

private:
    fs::path      target_;
    fs::path      temp_;
    std::ofstream out_;
    u64           written_{0};
    bool          committed_{false};

    void discard() noexcept;
};

// ---- Utility functions ----

// Map a relative wire path to an absolute target strictly inside root_dir.
// root_dir must already be canonical (see canonical_root).
// Throws PathSecurityViolation if the path is empty, absolute, or escapes.
fs::path resolve_under_root(const fs::path& root_dir, const std::string& relative_path);

// Create root if needed and return its canonical absolute form
fs::path canonical_root(const std::string& dir);

// Create parent directories if they don't exist; throws DiskError
void ensure_parent_dirs(const fs::path& path);

} // namespace file_io
