#pragma once

#include "error.h"
#include "hash.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dvs {

// ---------------------------------------------------------------------------
// MetadataFormat
// ---------------------------------------------------------------------------

/// Serialization of a metadata sidecar. The format is chosen by the
/// repository config and is visible only in the sidecar's suffix.
enum class MetadataFormat : uint8_t {
    Json, ///< `<file>.dvs`
    Yaml, ///< `<file>.dvs.yaml`
};

const char* metadata_format_name(MetadataFormat fmt);
std::optional<MetadataFormat> metadata_format_from_name(const std::string& name);

// ---------------------------------------------------------------------------
// Per-file outcomes
// ---------------------------------------------------------------------------

/// Successful result of a single-file add or get.
enum class Outcome : uint8_t {
    Copied,  ///< Content was written (to storage on add, to disk on get).
    Present, ///< Already in sync; nothing was written.
};

const char* outcome_name(Outcome o);

/// Result of one expanded input of a batch operation.
///
/// Exactly one of `outcome` and `error` is set.
struct FileResult {
    std::filesystem::path      input;    ///< Path as expanded from the pattern.
    std::optional<std::string> relative; ///< Repo-relative path, when known.
    std::optional<Outcome>     outcome;
    std::optional<FileError>   error;
    std::optional<Oid>         oid;      ///< Content OID, when known.
    std::optional<uint64_t>    size;     ///< Byte count, when known.

    bool ok() const { return outcome.has_value(); }
    bool is(Outcome o) const { return outcome && *outcome == o; }
    bool failed_with(ErrorKind k) const { return error && error->kind == k; }
};

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

/// Working-tree state of a path relative to its sidecar.
enum class FileStatus : uint8_t {
    Untracked, ///< No sidecar.
    Absent,    ///< Sidecar exists, working file missing.
    Current,   ///< Working file matches the sidecar.
    Unsynced,  ///< Working file exists but differs.
};

const char* file_status_name(FileStatus s);

struct StatusEntry {
    std::string             path; ///< Repo-relative path.
    FileStatus              status;
    std::optional<uint64_t> size; ///< Recorded size, when tracked.
    std::optional<Oid>      oid;  ///< Recorded OID, when tracked.
};

// ---------------------------------------------------------------------------
// Reflog
// ---------------------------------------------------------------------------

/// Operation recorded in a reflog entry.
enum class ReflogOp : uint8_t {
    Init,
    Add,
    Get,
    Remove,
    Rollback,
};

const char* reflog_op_name(ReflogOp op);
std::optional<ReflogOp> reflog_op_from_name(const std::string& name);

/// One line of `.dvs/logs/refs/HEAD`.
struct ReflogEntry {
    std::string                ts;      ///< RFC 3339 UTC timestamp.
    std::string                actor;
    ReflogOp                   op = ReflogOp::Add;
    std::optional<std::string> message;
    std::optional<std::string> old_state; ///< "state:<id>", absent for the first entry.
    std::string                new_state; ///< "state:<id>".
    std::vector<std::string>   paths;

    /// Strip the "state:" prefix. Returns nullopt if it is missing.
    static std::optional<std::string> parse_state_id(const std::string& ref);

    /// "state:<id>".
    static std::string state_ref(const std::string& id) { return "state:" + id; }
};

/// A reflog entry with its position (0 = most recent).
struct LogEntry {
    size_t      index;
    ReflogEntry entry;
};

// ---------------------------------------------------------------------------
// OpenOptions / InitOptions
// ---------------------------------------------------------------------------

/// Options for Repository::open.
struct OpenOptions {
    std::optional<std::string> actor; ///< Override the reflog/sidecar identity.
};

/// Options for Repository::init.
struct InitOptions {
    std::filesystem::path          storage_dir;      ///< Required.
    std::optional<uint32_t>        permissions;      ///< e.g. 0664.
    std::optional<std::string>     group;
    HashAlgo                       hash_algo = DEFAULT_HASH_ALGO;
    MetadataFormat                 metadata_format = MetadataFormat::Json;
    std::optional<std::string>     actor;
};

// ---------------------------------------------------------------------------
// AddOptions
// ---------------------------------------------------------------------------

/// Options for Repository::add.
struct AddOptions {
    std::optional<std::string>    message;
    std::optional<HashAlgo>       algo;   ///< Override the selected algorithm.
    std::optional<MetadataFormat> format; ///< Override the sidecar format.
};

// ---------------------------------------------------------------------------
// RollbackOptions / RollbackResult
// ---------------------------------------------------------------------------

/// Options for Repository::rollback.
struct RollbackOptions {
    bool materialize = true; ///< Also restore data files via get.
};

struct RollbackResult {
    std::optional<std::string> from_state;
    std::string                to_state;
    std::vector<std::string>   restored; ///< Paths whose sidecar was written.
    std::vector<std::string>   removed;  ///< Paths whose sidecar was deleted.
    std::vector<FileResult>    materialized;
};

// ---------------------------------------------------------------------------
// Verify
// ---------------------------------------------------------------------------

/// Integrity check of one tracked path.
struct VerifyResult {
    std::string                path;
    bool                       metadata_ok = false;
    bool                       local_ok    = false;
    bool                       storage_ok  = false;
    std::optional<std::string> details;

    bool ok() const { return metadata_ok && local_ok && storage_ok; }
};

struct VerifySummary {
    size_t total           = 0;
    size_t passed          = 0;
    size_t local_issues    = 0;
    size_t storage_issues  = 0;
    size_t metadata_issues = 0;

    static VerifySummary from_results(const std::vector<VerifyResult>& results);
    bool all_ok() const { return passed == total; }
};

} // namespace dvs
