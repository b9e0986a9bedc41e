#pragma once

#include "config.h"
#include "error.h"
#include "layout.h"
#include "state.h"
#include "storage.h"
#include "types.h"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward-declare libgit2 types to avoid pulling the header into every TU.
struct git_repository;

namespace dvs {

// ---------------------------------------------------------------------------
// RepositoryInner: shared state
// ---------------------------------------------------------------------------

/// State shared by copies of a Repository handle.
/// Not part of the public API.
struct RepositoryInner {
    git_repository*                 git;     ///< libgit2 handle (owned), or nullptr.
    Layout                          layout;
    Config                          config;
    std::unique_ptr<StorageBackend> storage;
    std::string                     actor;   ///< Identity for sidecars and reflog.
    std::mutex                      mutex;   ///< Serializes transactions in-process.

    RepositoryInner(const RepositoryInner&) = delete;
    RepositoryInner& operator=(const RepositoryInner&) = delete;

    RepositoryInner(git_repository* g, Layout l, Config c,
                    std::unique_ptr<StorageBackend> s, std::string a);
    ~RepositoryInner();
};

// ---------------------------------------------------------------------------
// Repository
// ---------------------------------------------------------------------------

/// Handle to one dvs repository: its root, config, storage backend and
/// control directory. Cheap to copy; copies share state.
///
/// Usage:
/// @code
///     auto repo = dvs::Repository::open(".");
///     dvs::AddOptions opts;
///     opts.message = "nightly import";
///     auto results = repo.add({"data/*.csv"}, opts);
///     for (auto& r : results)
///         if (!r.ok()) std::cerr << r.error->display() << "\n";
/// @endcode
///
/// Batch operations return one FileResult per expanded input; only
/// repository-level failures throw.
class Repository {
public:
    // -- Construction -------------------------------------------------------

    /// Find the repository containing `start`: the enclosing git work tree
    /// if there is one, otherwise the nearest ancestor holding dvs.yaml.
    ///
    /// @throws NotInitializedError if no dvs.yaml is found.
    /// @throws ConfigError if dvs.yaml is invalid.
    static Repository open(const std::filesystem::path& start,
                           OpenOptions opts = {});

    /// Initialize dvs in `root`: write dvs.yaml, create `.dvs/` and the
    /// storage directory. Re-running with identical settings is a no-op.
    ///
    /// @throws ConfigMismatchError if dvs.yaml exists with other settings.
    /// @throws IoError if directories cannot be created.
    static Repository init(const std::filesystem::path& root, InitOptions opts);

    // -- Transactions -------------------------------------------------------

    /// Track the files matched by `patterns`.
    ///
    /// @throws NoFilesMatchedError, InvalidPatternError, ParseError (corrupt
    ///         manifest), LockTimeoutError. Per-file failures are returned.
    std::vector<FileResult> add(const std::vector<std::string>& patterns,
                                const AddOptions& opts = {});

    /// Restore the working copies of tracked files from storage.
    ///
    /// @throws NoFilesMatchedError, InvalidPatternError, LockTimeoutError.
    std::vector<FileResult> get(const std::vector<std::string>& patterns);

    /// Classify paths (every tracked path when `patterns` is empty).
    std::vector<StatusEntry> status(const std::vector<std::string>& patterns = {}) const;

    // -- History ------------------------------------------------------------

    /// Reflog entries, newest first.
    std::vector<LogEntry> log(std::optional<size_t> limit = std::nullopt) const;

    /// Reflog entry at `index` (0 = newest).
    std::optional<LogEntry> log_entry(size_t index) const;

    /// Restore sidecars and manifest to an earlier state. `target` is a
    /// state id or a reflog index ("0" = most recent entry).
    /// @throws NotFoundError if the target does not exist.
    RollbackResult rollback(const std::string& target,
                            const RollbackOptions& opts = {});

    /// Check sidecar, working file and storage object of tracked paths
    /// (all of them when `patterns` is empty).
    std::vector<VerifyResult> verify(const std::vector<std::string>& patterns = {}) const;

    // -- State --------------------------------------------------------------

    /// Capture the current manifest and sidecars.
    WorkspaceState current_state() const;

    /// Load the manifest, or an empty one if dvs.lock does not exist.
    Manifest manifest() const;

    // -- Accessors ----------------------------------------------------------

    const std::filesystem::path& root() const;
    const Layout& layout() const;
    const Config& config() const;
    StorageBackend& storage() const;
    const std::string& actor() const;

    /// True if git ignore rules exclude the repo-relative `rel`.
    bool is_ignored(const std::string& rel) const;

    /// Access the shared inner state.
    std::shared_ptr<RepositoryInner> inner() const { return inner_; }

private:
    explicit Repository(std::shared_ptr<RepositoryInner> inner);

    /// Open the repository rooted exactly at `root`.
    static Repository open_at(const std::filesystem::path& root,
                              const OpenOptions& opts);

    /// Expand patterns; throws NoFilesMatchedError when nothing matches.
    std::vector<std::filesystem::path>
    expand(const std::vector<std::string>& patterns, bool include_tracked) const;

    /// Every tracked repo-relative path, sorted.
    std::vector<std::string> tracked_paths() const;

    /// Repo-relative paths named by `patterns` (tracked or not), or every
    /// tracked path when `patterns` is empty. Never throws NoFilesMatched.
    std::vector<std::string> select_paths(const std::vector<std::string>& patterns) const;

    std::shared_ptr<RepositoryInner> inner_;
};

} // namespace dvs
