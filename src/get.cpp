#include "dvs/repository.h"
#include "internal.h"

#include <spdlog/spdlog.h>

namespace dvs {

namespace fss = std::filesystem;

namespace fetch {

std::vector<HashAlgo> record_algos(const MetadataRecord& rec) {
    std::vector<HashAlgo> algos{rec.hash_algo};
    for (const auto& kv : rec.hashes) {
        if (kv.first != rec.hash_algo) algos.push_back(kv.first);
    }
    return algos;
}

bool matches(const fss::path& path, const MetadataRecord& rec) {
    std::error_code ec;
    if (!fss::is_regular_file(path, ec)) return false;
    auto size = fss::file_size(path, ec);
    if (ec || size != rec.size) return false;
    auto local = MetadataRecord::from_file(path, record_algos(rec), std::nullopt, "");
    return local == rec;
}

namespace {

void restore_one(const Repository& repo, const fss::path& canonical_root, FileResult& r) {
    auto rel = paths::relative_to(repo.root(), r.input);
    if (!rel || rel->empty()) {
        throw FileOpError(ErrorKind::FileOutsideRepo,
                          r.input.string() + " is outside " + repo.root().string());
    }
    r.relative = *rel;

    // A symlinked directory must not lead the write out of the root.
    auto parent = fss::weakly_canonical(r.input.parent_path());
    if (!paths::is_within(canonical_root, parent)) {
        throw FileOpError(ErrorKind::PathTraversal,
                          *rel + " resolves outside the repository");
    }

    auto sidecar = MetadataRecord::find_sidecar(r.input);
    if (!sidecar) {
        throw FileOpError(ErrorKind::NotTracked, *rel + " is not tracked",
                          "add it first");
    }

    MetadataRecord rec;
    Oid oid;
    try {
        rec = MetadataRecord::load(*sidecar);
        oid = rec.oid();
    } catch (const ParseError& e) {
        throw FileOpError(ErrorKind::ParseError, e.what());
    } catch (const InvalidOidError& e) {
        throw FileOpError(ErrorKind::ParseError,
                          sidecar->filename().string() + ": " + e.what());
    }
    r.oid  = oid;
    r.size = rec.size;

    if (!repo.storage().exists(oid)) {
        throw FileOpError(ErrorKind::StorageMissing,
                          "object " + oid.to_string() + " for " + *rel + " is not in storage",
                          "check storage_dir in dvs.yaml");
    }
    if (fss::is_directory(r.input)) {
        throw FileOpError(ErrorKind::IsDirectory, *rel + " is a directory");
    }

    if (matches(r.input, rec)) {
        spdlog::debug("get {}: present", *rel);
        r.outcome = Outcome::Present;
        return;
    }

    auto tmp = io::temp_sibling(r.input);
    repo.storage().retrieve(oid, tmp);

    std::error_code ec;
    if (!matches(tmp, rec)) {
        fss::remove(tmp, ec);
        throw FileOpError(ErrorKind::HashMismatch,
                          "retrieved content of " + *rel + " does not match " + oid.to_string(),
                          "the storage object may be corrupt; run verify");
    }
    fss::rename(tmp, r.input, ec);
    if (ec) {
        std::error_code ignore;
        fss::remove(tmp, ignore);
        throw IoError("cannot write " + r.input.string() + ": " + ec.message());
    }

    spdlog::debug("get {}: copied {}", *rel, oid.to_string());
    r.outcome = Outcome::Copied;
}

} // anonymous namespace

std::vector<FileResult> restore(const Repository& repo, const std::vector<fss::path>& files) {
    std::error_code ec;
    auto canonical_root = fss::canonical(repo.root(), ec);
    if (ec) {
        throw IoError("cannot resolve " + repo.root().string() + ": " + ec.message());
    }

    std::vector<FileResult> results;
    results.reserve(files.size());
    for (const auto& file : files) {
        FileResult r;
        r.input = file;
        try {
            restore_one(repo, canonical_root, r);
        } catch (const FileOpError& e) {
            r.error = e.error();
        } catch (const NotFoundError& e) {
            r.error = FileError{ErrorKind::StorageMissing, e.what(), std::nullopt};
        } catch (const IoError& e) {
            r.error = FileError{ErrorKind::IoError, e.what(), std::nullopt};
        } catch (const fss::filesystem_error& e) {
            r.error = FileError{ErrorKind::IoError, e.what(), std::nullopt};
        }
        if (r.error) {
            spdlog::debug("get {}: {}", file.string(), r.error->display());
        }
        results.push_back(std::move(r));
    }
    return results;
}

} // namespace fetch

// ---------------------------------------------------------------------------
// Repository::get
// ---------------------------------------------------------------------------

std::vector<FileResult> Repository::get(const std::vector<std::string>& patterns) {
    auto files = expand(patterns, true);

    std::lock_guard<std::mutex> in_process(inner_->mutex);
    std::vector<FileResult> results;

    lock::with_repo_lock(layout().locks_dir(), [&]() {
        // get writes only data files, so the manifest and sidecars (and
        // therefore the state id) are unchanged and no reflog entry is due.
        results = fetch::restore(*this, files);

        size_t copied = 0, present = 0;
        for (const auto& r : results) {
            if (r.is(Outcome::Copied)) ++copied;
            if (r.is(Outcome::Present)) ++present;
        }
        spdlog::info("get: {} copied, {} present, {} failed",
                     copied, present, results.size() - copied - present);
    });
    return results;
}

// ---------------------------------------------------------------------------
// Repository::status
// ---------------------------------------------------------------------------

std::vector<StatusEntry> Repository::status(const std::vector<std::string>& patterns) const {
    auto rels = select_paths(patterns);

    std::vector<StatusEntry> out;
    out.reserve(rels.size());
    for (const auto& rel : rels) {
        StatusEntry e{rel, FileStatus::Untracked, std::nullopt, std::nullopt};
        auto data = root() / fss::path(rel);
        auto sidecar = MetadataRecord::find_sidecar(data);
        if (sidecar) {
            auto rec = MetadataRecord::load(*sidecar);
            e.size = rec.size;
            e.oid  = rec.oid();
            std::error_code ec;
            if (!fss::exists(data, ec)) {
                e.status = FileStatus::Absent;
            } else {
                e.status = fetch::matches(data, rec) ? FileStatus::Current
                                                     : FileStatus::Unsynced;
            }
        }
        out.push_back(std::move(e));
    }
    return out;
}

} // namespace dvs
