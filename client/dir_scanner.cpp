// ============================================================
// dir_scanner.cpp -- Recursive directory scanner
// ============================================================

#include "dir_scanner.hpp"
#include "../common/logger.hpp"
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

DirScanner::DirScanner(const std::string& src_dir)
    : src_dir_(src_dir) {}

void DirScanner::report(const std::string& what, const std::error_code& ec) {
    error_count_++;
    LOG_ERROR(what + ": " + ec.message());
}

std::vector<FileEntry> DirScanner::scan() {
    std::error_code ec;
    if (!fs::is_directory(src_dir_, ec)) {
        throw std::runtime_error("Source directory not found: " + src_dir_);
    }

    file_count_  = 0;
    total_bytes_ = 0;
    error_count_ = 0;

    std::vector<FileEntry> results;
    fs::path root(src_dir_);

    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    fs::recursive_directory_iterator end;
    if (ec) {
        report("Cannot scan " + src_dir_, ec);
        return results;
    }

    for (; it != end; it.increment(ec)) {
        if (ec) break;
        const fs::directory_entry& entry = *it;

        // Directories behind symlinks are not descended into. An unreadable
        // subdirectory is counted and pruned so the walk goes on.
        if (entry.is_directory(ec) && !entry.is_symlink(ec)) {
            fs::directory_iterator sub(entry.path(), ec);
            if (ec) {
                report("Cannot read " + entry.path().string(), ec);
                ec.clear();
                it.disable_recursion_pending();
            }
            continue;
        }
        // Symlinks to regular files are followed
        if (!entry.is_regular_file(ec)) {
            ec.clear();
            continue;
        }
        fs::path rel = entry.path().lexically_relative(root);
        if (rel.empty()) continue;

        FileEntry fe;
        fe.abs_path  = entry.path().string();
        fe.rel_path  = rel.generic_string();
        fe.file_size = entry.file_size(ec);
        if (ec) {
            report("Cannot stat " + fe.abs_path, ec);
            ec.clear();
            fe.file_size = 0;
        }

        file_count_++;
        total_bytes_ += fe.file_size;
        results.push_back(std::move(fe));
    }
    if (ec) {
        report("Scan of " + src_dir_ + " stopped early", ec);
    }

    LOG_INFO("Scan complete: " + std::to_string(file_count_) +
             " files, " + std::to_string(total_bytes_) + " bytes" +
             (error_count_ ? ", " + std::to_string(error_count_) + " errors" : std::string()));
    return results;
}
