// ============================================================
// file_io.cpp -- Source mapping, destination writing, path safety
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include <algorithm>
#include <atomic>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>

#ifndef _WIN32
#  include <sys/mman.h>
#  include <sys/stat.h>
#  include <fcntl.h>
#  include <unistd.h>
#else
#  include <process.h>
#endif

using namespace file_io;

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
#ifdef _WIN32
    file_handle_ = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ,
                               nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL |
                               FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    LARGE_INTEGER sz{};
    GetFileSizeEx(file_handle_, &sz);
    size_ = (u64)sz.QuadPart;

    if (size_ == 0) {
        // Empty file: no mapping needed
        data_ = nullptr;
        return;
    }

    map_handle_ = CreateFileMappingA(file_handle_, nullptr, PAGE_READONLY, 0, 0, nullptr);
    if (!map_handle_) {
        CloseHandle(file_handle_);
        file_handle_ = INVALID_HANDLE_VALUE;
        throw std::runtime_error("CreateFileMapping failed: " + path);
    }

    data_ = static_cast<const char*>(MapViewOfFile(map_handle_, FILE_MAP_READ, 0, 0, 0));
    if (!data_) {
        CloseHandle(map_handle_);
        CloseHandle(file_handle_);
        map_handle_ = nullptr;
        file_handle_ = INVALID_HANDLE_VALUE;
        throw std::runtime_error("MapViewOfFile failed: " + path);
    }
#else
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path + ": " + strerror(errno));
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("fstat failed: " + path);
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("Not a regular file: " + path);
    }
    size_ = (u64)st.st_size;

    if (size_ == 0) {
        data_ = nullptr;
        return;
    }

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("mmap failed: " + path);
    }
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    data_ = static_cast<const char*>(p);
#endif
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
#ifdef _WIN32
    if (data_) { UnmapViewOfFile(data_); data_ = nullptr; }
    if (map_handle_) { CloseHandle(map_handle_); map_handle_ = nullptr; }
    if (file_handle_ != INVALID_HANDLE_VALUE) { CloseHandle(file_handle_); file_handle_ = INVALID_HANDLE_VALUE; }
#else
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
#endif
    size_ = 0;
}

// ============================================================
// PartialFile
// ============================================================

namespace {

// ".<name>.<pid>-<seq>.filepush-part": unique per writer, so concurrent
// connections storing the same path never share a temporary file
fs::path temp_sibling(const fs::path& target) {
    static std::atomic<u64> seq{0};
#ifdef _WIN32
    long pid = (long)_getpid();
#else
    long pid = (long)::getpid();
#endif
    return target.parent_path() /
           ("." + target.filename().string() + "." + std::to_string(pid) + "-" +
            std::to_string(seq.fetch_add(1)) + ".filepush-part");
}

} // namespace

PartialFile::PartialFile(const fs::path& target)
    : target_(target)
    , temp_(temp_sibling(target))
{
    out_.open(temp_, std::ios::binary | std::ios::trunc);
    if (!out_) {
        throw DiskError("Cannot create file: " + temp_.string());
    }
}

PartialFile::~PartialFile() {
    if (!committed_) discard();
}

void PartialFile::write(const void* data, size_t len) {
    out_.write(static_cast<const char*>(data), (std::streamsize)len);
    if (!out_) {
        throw DiskError("Write failed: " + temp_.string());
    }
    written_ += len;
}

void PartialFile::commit() {
    out_.flush();
    out_.close();
    if (out_.fail()) {
        discard();
        throw DiskError("Flush failed: " + temp_.string());
    }

    std::error_code ec;
    fs::rename(temp_, target_, ec);
    if (ec) {
        discard();
        throw DiskError("Cannot replace " + target_.string() + ": " + ec.message());
    }
    committed_ = true;
}

void PartialFile::discard() noexcept {
    if (out_.is_open()) out_.close();
    std::error_code ec;
    fs::remove(temp_, ec);
}

// ============================================================
// Utility functions
// ============================================================

// Component-wise prefix test. Plain string prefix would accept
// "/srv/out-evil" as inside "/srv/out".
static bool is_within(const fs::path& root, const fs::path& p, bool strict) {
    auto r = root.begin();
    auto q = p.begin();
    for (; r != root.end(); ++r, ++q) {
        if (q == p.end() || *r != *q) return false;
    }
    return strict ? q != p.end() : true;
}

fs::path file_io::resolve_under_root(const fs::path& root_dir, const std::string& relative_path) {
    if (relative_path.empty()) {
        throw PathSecurityViolation(relative_path, "Empty relative path");
    }
    if (relative_path.find('\0') != std::string::npos) {
        throw PathSecurityViolation(relative_path, "Path contains NUL byte");
    }
    if (relative_path[0] == '/' || relative_path[0] == '\\') {
        throw PathSecurityViolation(relative_path, "Absolute path rejected");
    }

    fs::path rel(relative_path);
    if (rel.has_root_name() || rel.has_root_directory()) {
        throw PathSecurityViolation(relative_path, "Absolute path rejected");
    }

    fs::path full = (root_dir / rel).lexically_normal();
    if (!full.has_filename()) {
        throw PathSecurityViolation(relative_path, "Path does not name a file");
    }
    if (!is_within(root_dir, full, true)) {
        throw PathSecurityViolation(relative_path, "Path escapes root directory");
    }

    // Lexically inside; make sure no symlinked directory on the way
    // points back out of the root.
    std::error_code ec;
    fs::path parent_real = fs::weakly_canonical(full.parent_path(), ec);
    if (ec) {
        throw PathSecurityViolation(relative_path, "Cannot resolve parent (" + ec.message() + ")");
    }
    if (!is_within(root_dir, parent_real, false)) {
        throw PathSecurityViolation(relative_path, "Path escapes root directory through a symlink");
    }

    return full;
}

fs::path file_io::canonical_root(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create root directory " + dir + ": " + ec.message());
    }
    fs::path root = fs::canonical(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot resolve root directory " + dir + ": " + ec.message());
    }
    if (!fs::is_directory(root, ec)) {
        throw std::runtime_error("Root is not a directory: " + root.string());
    }
    return root;
}

void file_io::ensure_parent_dirs(const fs::path& path) {
    auto parent = path.parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw DiskError("Cannot create directory " + parent.string() + ": " + ec.message());
    }
}
