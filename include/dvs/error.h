#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace dvs {

// ---------------------------------------------------------------------------
// ErrorKind / FileError
// ---------------------------------------------------------------------------

/// Classification of every failure the engine can report.
enum class ErrorKind : uint8_t {
    NotInitialized,
    NoFilesMatched,
    InvalidPattern,
    FileNotFound,
    IsDirectory,
    FileOutsideRepo,
    BrokenSymlink,
    PathError,
    PathTraversal,
    IoError,
    HashError,
    StorageError,
    MetadataError,
    ParseError,
    NotTracked,
    StorageMissing,
    HashMismatch,
};

/// Stable snake_case name of an ErrorKind (e.g. "path_traversal").
const char* error_kind_name(ErrorKind kind);

/// A per-file failure recorded in a batch result.
///
/// Callers branch on `kind`; `hint` is a human-readable suggestion meant
/// for the outermost layer (e.g. "check glob syntax").
struct FileError {
    ErrorKind                  kind;
    std::string                message;
    std::optional<std::string> hint;

    /// "message (hint)" or just "message".
    std::string display() const {
        return hint ? message + " (" + *hint + ")" : message;
    }
};

// ---------------------------------------------------------------------------
// Base exception
// ---------------------------------------------------------------------------

/// Base class for all dvs exceptions.
class DvsError : public std::runtime_error {
public:
    explicit DvsError(const std::string& msg) : std::runtime_error(msg) {}
};

// ---------------------------------------------------------------------------
// Repository-level exceptions
// ---------------------------------------------------------------------------

/// No dvs.yaml was found at (or above) the starting directory.
class NotInitializedError : public DvsError {
public:
    explicit NotInitializedError(const std::string& where)
        : DvsError("dvs not initialized: " + where) {}
};

/// Every pattern expanded to nothing.
class NoFilesMatchedError : public DvsError {
public:
    NoFilesMatchedError() : DvsError("no files matched") {}
};

/// A glob pattern is malformed.
class InvalidPatternError : public DvsError {
public:
    explicit InvalidPatternError(const std::string& pattern)
        : DvsError("invalid pattern: " + pattern), pattern_(pattern) {}
    const std::string& pattern() const { return pattern_; }
private:
    std::string pattern_;
};

/// A persisted file (manifest, sidecar, snapshot, reflog) is corrupt.
class ParseError : public DvsError {
public:
    ParseError(const std::string& path, const std::string& detail)
        : DvsError("parse error: " + path + ": " + detail), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// dvs.yaml is unreadable or holds invalid values.
class ConfigError : public DvsError {
public:
    explicit ConfigError(const std::string& msg)
        : DvsError("config error: " + msg) {}
};

/// init was asked for settings that differ from an existing dvs.yaml.
class ConfigMismatchError : public DvsError {
public:
    ConfigMismatchError()
        : DvsError("config mismatch: dvs.yaml exists with different settings") {}
};

/// A named object (state id, reflog index, sidecar) does not exist.
class NotFoundError : public DvsError {
public:
    explicit NotFoundError(const std::string& what)
        : DvsError("not found: " + what), what_(what) {}
    const std::string& what_missing() const { return what_; }
private:
    std::string what_;
};

/// An OID string or hash algorithm name is malformed.
class InvalidOidError : public DvsError {
public:
    explicit InvalidOidError(const std::string& msg)
        : DvsError("invalid oid: " + msg) {}
};

/// A low-level libgit2 operation failed.
class GitError : public DvsError {
public:
    explicit GitError(const std::string& msg)
        : DvsError("git error: " + msg) {}
};

/// A filesystem I/O error occurred.
class IoError : public DvsError {
public:
    explicit IoError(const std::string& msg)
        : DvsError("io error: " + msg) {}
};

/// The repository lock could not be taken in time.
class LockTimeoutError : public DvsError {
public:
    explicit LockTimeoutError(const std::string& lock_path)
        : DvsError("timeout waiting for repo lock: " + lock_path) {}
};

// ---------------------------------------------------------------------------
// Per-file exception
// ---------------------------------------------------------------------------

/// Raised by single-file steps; batch loops turn it into a FileResult.
class FileOpError : public DvsError {
public:
    FileOpError(ErrorKind kind, const std::string& msg,
                std::optional<std::string> hint = std::nullopt)
        : DvsError(std::string(error_kind_name(kind)) + ": " + msg)
        , error_{kind, msg, std::move(hint)} {}

    ErrorKind        kind()  const { return error_.kind; }
    const FileError& error() const { return error_; }
private:
    FileError error_;
};

} // namespace dvs
