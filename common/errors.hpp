#pragma once

// ============================================================
// errors.hpp -- Exception taxonomy for transfer failures
//
//   Connection-fatal:  TransportError, MalformedFrame
//   Per-file:          ChecksumMismatch, PathSecurityViolation, DiskError
// ============================================================

#include <stdexcept>
#include <string>

// Reset, broken pipe, receive timeout, or end-of-stream inside a frame.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& msg) : std::runtime_error(msg) {}
};

// The byte stream no longer parses as frames; nothing after it can be trusted.
class MalformedFrame : public TransportError {
public:
    explicit MalformedFrame(const std::string& msg) : TransportError(msg) {}
};

class ChecksumMismatch : public std::runtime_error {
public:
    ChecksumMismatch(const std::string& rel_path,
                     const std::string& expected,
                     const std::string& actual)
        : std::runtime_error("Checksum mismatch for " + rel_path +
                             ": expected " + expected + ", got " + actual)
        , rel_path_(rel_path), expected_(expected), actual_(actual) {}

    const std::string& rel_path() const { return rel_path_; }
    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    std::string rel_path_;
    std::string expected_;
    std::string actual_;
};

class PathSecurityViolation : public std::runtime_error {
public:
    PathSecurityViolation(const std::string& rel_path, const std::string& reason)
        : std::runtime_error(reason + ": " + rel_path)
        , rel_path_(rel_path) {}

    const std::string& rel_path() const { return rel_path_; }

private:
    std::string rel_path_;
};

// Could not create, write, rename or decode into the destination file.
class DiskError : public std::runtime_error {
public:
    explicit DiskError(const std::string& msg) : std::runtime_error(msg) {}
};
