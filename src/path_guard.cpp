#include "dvs/path_guard.h"
#include "dvs/metadata.h"
#include "internal.h"

namespace dvs {

namespace fss = std::filesystem;

PathGuard::PathGuard(const fss::path& root)
    : root_(fss::absolute(root).lexically_normal())
{
    std::error_code ec;
    canonical_root_ = fss::canonical(root_, ec);
    if (ec) {
        throw IoError("cannot resolve repository root " + root_.string() +
                      ": " + ec.message());
    }
}

GuardedPath PathGuard::check(const fss::path& candidate) const {
    GuardedPath out;
    // `..` after a symlinked directory is left for the OS to resolve.
    auto raw  = fss::absolute(candidate);
    out.input = raw.lexically_normal();

    auto rel = paths::relative_to(root_, out.input);
    if (!rel) {
        throw FileOpError(ErrorKind::FileOutsideRepo,
                          out.input.string() + " is outside " + root_.string());
    }
    out.relative = *rel;

    auto first = out.relative.substr(0, out.relative.find('/'));
    if (paths::is_control_dir(first)) {
        throw FileOpError(ErrorKind::PathError,
                          out.relative + " is inside a control directory");
    }
    if (MetadataRecord::is_sidecar_name(out.input.filename().string())) {
        throw FileOpError(ErrorKind::PathError, out.relative + " is a sidecar",
                          "name the data file instead");
    }

    std::error_code ec;
    auto link_st = fss::symlink_status(raw, ec);
    if (!fss::exists(link_st)) {
        throw FileOpError(ErrorKind::FileNotFound, "file not found: " + out.relative);
    }
    if (fss::is_directory(fss::status(raw, ec))) {
        throw FileOpError(ErrorKind::IsDirectory, "is a directory: " + out.relative,
                          "use a glob pattern such as '" + out.relative + "/*'");
    }

    out.resolved = fss::canonical(raw, ec);
    if (ec) {
        if (fss::is_symlink(link_st)) {
            throw FileOpError(ErrorKind::BrokenSymlink,
                              "broken symlink: " + out.relative + ": " + ec.message());
        }
        throw FileOpError(ErrorKind::PathError,
                          "cannot resolve " + out.relative + ": " + ec.message());
    }

    if (!paths::is_within(canonical_root_, out.resolved) ||
        out.resolved == canonical_root_) {
        throw FileOpError(ErrorKind::PathTraversal,
                          out.relative + " resolves to " + out.resolved.string() +
                          ", outside " + canonical_root_.string());
    }
    return out;
}

} // namespace dvs
