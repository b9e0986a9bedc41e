#pragma once

#include "error.h"

#include <filesystem>
#include <string>

namespace dvs {

// ---------------------------------------------------------------------------
// PathGuard
// ---------------------------------------------------------------------------

/// A candidate path that passed PathGuard::check.
struct GuardedPath {
    std::filesystem::path input;    ///< As given (absolute).
    std::string           relative; ///< Repo-relative, `/`-separated.
    std::filesystem::path resolved; ///< Canonical path of the real file.
};

/// Confirms that a candidate names a real file strictly inside the
/// repository root, resolving symlinks, `.` and `..` on both sides.
class PathGuard {
public:
    /// @throws IoError if `root` cannot be canonicalized.
    explicit PathGuard(const std::filesystem::path& root);

    /// @throws FileOpError with kind FileOutsideRepo, FileNotFound,
    ///         IsDirectory, BrokenSymlink, PathError or PathTraversal.
    GuardedPath check(const std::filesystem::path& candidate) const;

    const std::filesystem::path& root() const { return root_; }
    const std::filesystem::path& canonical_root() const { return canonical_root_; }

private:
    std::filesystem::path root_;
    std::filesystem::path canonical_root_;
};

} // namespace dvs
