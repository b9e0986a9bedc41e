#pragma once
/// Internal helpers shared between dvs source files.
/// Not part of the public API.

#include "dvs/error.h"
#include "dvs/metadata.h"
#include "dvs/storage.h"
#include "dvs/types.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct git_repository;

namespace dvs {

class Repository;

// ---------------------------------------------------------------------------
// io: whole-file and atomic file helpers
// ---------------------------------------------------------------------------

namespace io {

/// Read size used for streaming hashes and copies.
constexpr size_t CHUNK_SIZE = 1 << 20;

/// create_directories that treats a concurrent "already exists" as success.
/// @throws IoError if the directory still does not exist afterwards.
void ensure_dir(const std::filesystem::path& dir);

std::string read_text(const std::filesystem::path& p);

/// Write `data` to a temp file beside `dest`, then rename over it.
/// @throws IoError on failure; the temp file is removed.
void write_atomic(const std::filesystem::path& dest, const std::string& data);
void write_atomic(const std::filesystem::path& dest, const std::vector<uint8_t>& data);

/// Copy `src` to a temp file beside `dest`, then rename over it.
void copy_atomic(const std::filesystem::path& src, const std::filesystem::path& dest);

/// Append one line (a trailing '\n' is added) and flush.
void append_line(const std::filesystem::path& p, const std::string& line);

/// Unique sibling name for a temp file.
std::filesystem::path temp_sibling(const std::filesystem::path& dest);

} // namespace io

// ---------------------------------------------------------------------------
// paths: repository-relative paths and timestamps
// ---------------------------------------------------------------------------

namespace paths {

/// Control directories skipped by every walk.
bool is_control_dir(const std::string& name);

/// `/`-separated path of `p` relative to `root`, or nullopt if `p` is
/// not lexically under `root`. Both are made absolute first.
std::optional<std::string> relative_to(const std::filesystem::path& root,
                                       const std::filesystem::path& p);

/// True if `p` lies under (or is) `root`, comparing whole components.
bool is_within(const std::filesystem::path& root, const std::filesystem::path& p);

/// Every sidecar under `root` keyed by its repo-relative data path,
/// skipping control directories. JSON wins when both formats exist.
/// @throws IoError if the walk fails.
std::map<std::string, std::filesystem::path> sidecar_index(const std::filesystem::path& root);

/// Current UTC time as RFC 3339, second precision ("2026-01-02T03:04:05Z").
std::string now_rfc3339();

} // namespace paths

// ---------------------------------------------------------------------------
// lock: advisory repository lock
// ---------------------------------------------------------------------------

namespace lock {

/// Exclusive advisory lock on `<locks_dir>/repo.lock`, held for the
/// object's lifetime. Waits up to 30 seconds, polling every 50 ms.
/// The holder's pid is written into the file for diagnostics.
/// @throws LockTimeoutError, IoError.
class RepoLock {
public:
    explicit RepoLock(const std::filesystem::path& locks_dir);
    ~RepoLock();
    RepoLock(const RepoLock&) = delete;
    RepoLock& operator=(const RepoLock&) = delete;

private:
    std::filesystem::path path_;
#if defined(DVS_POSIX_LOCK)
    int fd_ = -1;
#elif defined(_WIN32)
    void* handle_ = nullptr;
#endif
};

/// Run `fn` while holding the repository lock.
void with_repo_lock(const std::filesystem::path& locks_dir,
                    const std::function<void()>& fn);

} // namespace lock

// ---------------------------------------------------------------------------
// glob: pattern matching and expansion
// ---------------------------------------------------------------------------

namespace glob {

/// Match a glob pattern segment against a name.
bool fnmatch(const std::string& pattern, const std::string& name);

/// Match a glob pattern against a name (dot-awareness).
bool glob_match(const std::string& pattern, const std::string& name);

/// True if `pattern` contains `*`, `?` or `[`.
bool has_magic(const std::string& pattern);

/// @throws InvalidPatternError for an unbalanced `[` or an empty pattern.
void validate(const std::string& pattern);

using IgnorePredicate = std::function<bool(const std::string& rel)>;

/// Expand `patterns` against the working tree under `root`.
///
/// Literal patterns pass through unchanged (resolved against `root`).
/// Glob matches skip control directories, sidecar files and paths for
/// which `ignored` returns true. When `include_tracked` is set, a glob
/// also matches data paths that only exist as sidecars.
std::vector<std::filesystem::path>
expand(const std::filesystem::path& root,
       const std::vector<std::string>& patterns,
       const IgnorePredicate& ignored,
       bool include_tracked);

} // namespace glob

// ---------------------------------------------------------------------------
// git: libgit2 collaborators (discovery, identity, ignore rules)
// ---------------------------------------------------------------------------

namespace git {

/// Working directory of the git repository containing `start`, or
/// nullopt if there is none (or it is bare).
std::optional<std::filesystem::path> discover_workdir(const std::filesystem::path& start);

/// Open the repository whose work tree is `root`. Returns nullptr if
/// `root` is not a git work tree. Caller frees with git_repository_free.
git_repository* open(const std::filesystem::path& root);

/// `user.name` from the repository (or global) git config.
std::optional<std::string> config_user_name(git_repository* repo);

/// True if git ignore rules exclude `rel` (repo-relative, `/`-separated).
bool is_ignored(git_repository* repo, const std::string& rel);

void close(git_repository* repo);

} // namespace git

// ---------------------------------------------------------------------------
// txn: two-phase write of one tracked file
// ---------------------------------------------------------------------------

namespace txn {

/// Storage object first, sidecar second. The caller commits the manifest
/// and reflog only after both phases succeed for a path.
///
/// @code
///     txn::FileCommit commit(storage, oid, resolved, sidecar);
///     commit.stage_object();          // FileOpError(StorageError)
///     commit.write_sidecar(record);   // FileOpError(MetadataError), rolled back
/// @endcode
class FileCommit {
public:
    FileCommit(StorageBackend& storage, Oid oid,
               std::filesystem::path source, std::filesystem::path sidecar);

    /// Copy the source into storage unless the object already exists.
    /// Returns true if a copy was made.
    /// @throws FileOpError(StorageError) on failure.
    bool stage_object();

    /// Write `record` to the sidecar. On failure the sidecar is put back
    /// the way it was (deleted if new, previous bytes otherwise); the
    /// storage object is left in place.
    /// @throws FileOpError(MetadataError).
    void write_sidecar(const MetadataRecord& record);

private:
    void restore_sidecar() noexcept;

    StorageBackend&            storage_;
    Oid                        oid_;
    std::filesystem::path      source_;
    std::filesystem::path      sidecar_;
    bool                       existed_ = false;
    std::optional<std::string> previous_;
};

} // namespace txn

// ---------------------------------------------------------------------------
// fetch: working-copy comparison and restore
// ---------------------------------------------------------------------------

namespace fetch {

/// Algorithms recorded in `rec`, primary first.
std::vector<HashAlgo> record_algos(const MetadataRecord& rec);

/// True if `path` is a regular file whose digests and size match `rec`.
/// @throws IoError if the file exists but cannot be read.
bool matches(const std::filesystem::path& path, const MetadataRecord& rec);

/// Restore each of `files` from storage. The caller holds the locks.
std::vector<FileResult> restore(const Repository& repo,
                                const std::vector<std::filesystem::path>& files);

} // namespace fetch

/// Identity recorded in sidecars and the reflog: git user.name, then
/// $USER, $USERNAME, $LOGNAME, the passwd entry, then "unknown".
std::string current_actor(git_repository* repo);

} // namespace dvs
