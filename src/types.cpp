#include "dvs/types.h"

namespace dvs {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotInitialized:  return "not_initialized";
        case ErrorKind::NoFilesMatched:  return "no_files_matched";
        case ErrorKind::InvalidPattern:  return "invalid_pattern";
        case ErrorKind::FileNotFound:    return "file_not_found";
        case ErrorKind::IsDirectory:     return "is_directory";
        case ErrorKind::FileOutsideRepo: return "file_outside_repo";
        case ErrorKind::BrokenSymlink:   return "broken_symlink";
        case ErrorKind::PathError:       return "path_error";
        case ErrorKind::PathTraversal:   return "path_traversal";
        case ErrorKind::IoError:         return "io_error";
        case ErrorKind::HashError:       return "hash_error";
        case ErrorKind::StorageError:    return "storage_error";
        case ErrorKind::MetadataError:   return "metadata_error";
        case ErrorKind::ParseError:      return "parse_error";
        case ErrorKind::NotTracked:      return "not_tracked";
        case ErrorKind::StorageMissing:  return "storage_missing";
        case ErrorKind::HashMismatch:    return "hash_mismatch";
    }
    return "unknown";
}

const char* metadata_format_name(MetadataFormat fmt) {
    return fmt == MetadataFormat::Yaml ? "yaml" : "json";
}

std::optional<MetadataFormat> metadata_format_from_name(const std::string& name) {
    if (name == "json") return MetadataFormat::Json;
    if (name == "yaml" || name == "yml") return MetadataFormat::Yaml;
    return std::nullopt;
}

const char* outcome_name(Outcome o) {
    return o == Outcome::Copied ? "copied" : "present";
}

const char* file_status_name(FileStatus s) {
    switch (s) {
        case FileStatus::Untracked: return "untracked";
        case FileStatus::Absent:    return "absent";
        case FileStatus::Current:   return "current";
        case FileStatus::Unsynced:  return "unsynced";
    }
    return "untracked"; // unreachable
}

const char* reflog_op_name(ReflogOp op) {
    switch (op) {
        case ReflogOp::Init:     return "init";
        case ReflogOp::Add:      return "add";
        case ReflogOp::Get:      return "get";
        case ReflogOp::Remove:   return "remove";
        case ReflogOp::Rollback: return "rollback";
    }
    return "add"; // unreachable
}

std::optional<ReflogOp> reflog_op_from_name(const std::string& name) {
    if (name == "init")     return ReflogOp::Init;
    if (name == "add")      return ReflogOp::Add;
    if (name == "get")      return ReflogOp::Get;
    if (name == "remove")   return ReflogOp::Remove;
    if (name == "rollback") return ReflogOp::Rollback;
    return std::nullopt;
}

std::optional<std::string> ReflogEntry::parse_state_id(const std::string& ref) {
    static const std::string prefix = "state:";
    if (ref.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    return ref.substr(prefix.size());
}

VerifySummary VerifySummary::from_results(const std::vector<VerifyResult>& results) {
    VerifySummary s;
    s.total = results.size();
    for (const auto& r : results) {
        if (r.ok()) ++s.passed;
        if (!r.metadata_ok) ++s.metadata_issues;
        if (!r.local_ok)    ++s.local_issues;
        if (!r.storage_ok)  ++s.storage_issues;
    }
    return s;
}

} // namespace dvs
