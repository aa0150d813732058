#pragma once

// ============================================================
// dir_scanner.hpp -- Recursive directory scanner
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <vector>
#include <filesystem>

// One regular file found under the source root
struct FileEntry {
    std::string rel_path;   // '/'-separated, relative to source root
    std::string abs_path;
    u64         file_size{0};
};

class DirScanner {
public:
    explicit DirScanner(const std::string& src_dir);

    DirScanner(const DirScanner&) = delete;
    DirScanner& operator=(const DirScanner&) = delete;

    // Walk src_dir and return every regular file in walk order.
    // Throws if src_dir is not a directory. Directories or entries that
    // cannot be read are logged and counted in scan_errors().
    std::vector<FileEntry> scan();

    u32 total_files() const { return file_count_; }
    u64 total_bytes() const { return total_bytes_; }
    u32 scan_errors() const { return error_count_; }

private:
    std::string src_dir_;
    u32 file_count_{0};
    u64 total_bytes_{0};
    u32 error_count_{0};

    void report(const std::string& what, const std::error_code& ec);
};
