#include "dvs/path_guard.h"
#include "dvs/repository.h"
#include "internal.h"

#include <spdlog/spdlog.h>

namespace dvs {

namespace fss = std::filesystem;

namespace {

/// Load the sidecar beside `data`, if any. A corrupt sidecar is treated
/// as absent so that re-adding the file repairs it.
std::optional<MetadataRecord> load_existing(const std::optional<fss::path>& sidecar) {
    if (!sidecar) return std::nullopt;
    try {
        return MetadataRecord::load(*sidecar);
    } catch (const ParseError& e) {
        spdlog::warn("ignoring unreadable sidecar: {}", e.what());
    } catch (const IoError& e) {
        spdlog::warn("ignoring unreadable sidecar: {}", e.what());
    }
    return std::nullopt;
}

/// Single-file add. Throws FileOpError (or IoError) on failure.
void add_one(const Repository& repo,
             const PathGuard& guard,
             const AddOptions& opts,
             FileResult& result) {
    auto g = guard.check(result.input);
    result.relative = g.relative;

    auto existing_sidecar = MetadataRecord::find_sidecar(g.input);
    auto existing = load_existing(existing_sidecar);

    HashAlgo algo = opts.algo ? *opts.algo
                  : existing  ? existing->hash_algo
                              : repo.config().hash_algo;
    MetadataFormat fmt = opts.format ? *opts.format
                       : existing    ? *MetadataRecord::format_of(*existing_sidecar)
                                     : repo.config().metadata_format;

    // hash the resolved target so a symlink and its target agree
    auto record = MetadataRecord::from_file(g.resolved, repo.config().algos_for(algo),
                                            opts.message, repo.actor());
    result.oid  = record.oid();
    result.size = record.size;

    if (existing && *existing == record) {
        spdlog::debug("add {}: present {}", g.relative, result.oid->to_string());
        result.outcome = Outcome::Present;
        return;
    }

    auto sidecar = MetadataRecord::sidecar_path(g.input, fmt);
    txn::FileCommit commit(repo.storage(), *result.oid, g.resolved, sidecar);
    bool stored = commit.stage_object();
    commit.write_sidecar(record);

    if (existing_sidecar && *existing_sidecar != sidecar) {
        std::error_code ec;
        fss::remove(*existing_sidecar, ec);
        if (ec) {
            spdlog::warn("could not remove old sidecar {}: {}",
                         existing_sidecar->string(), ec.message());
        }
    }

    spdlog::debug("add {}: copied {}{}", g.relative, result.oid->to_string(),
                  stored ? "" : " (object already stored)");
    result.outcome = Outcome::Copied;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Repository::add
// ---------------------------------------------------------------------------

std::vector<FileResult> Repository::add(const std::vector<std::string>& patterns,
                                        const AddOptions& opts) {
    auto files = expand(patterns, false);

    std::lock_guard<std::mutex> in_process(inner_->mutex);
    std::vector<FileResult> results;

    lock::with_repo_lock(layout().locks_dir(), [&]() {
        const Layout& lay = layout();
        Reflog reflog(lay);
        SnapshotStore snapshots(lay);

        // Captured before any mutation; absent for an empty workspace.
        auto before = current_state();
        std::optional<std::string> old_id;
        if (!before.is_empty()) old_id = before.id();

        auto manifest = Manifest::load_or_new(lay.manifest_path());
        PathGuard guard(root());

        for (const auto& file : files) {
            FileResult r;
            r.input = file;
            try {
                add_one(*this, guard, opts, r);
            } catch (const FileOpError& e) {
                r.error = e.error();
            } catch (const IoError& e) {
                r.error = FileError{ErrorKind::IoError, e.what(), std::nullopt};
            } catch (const fss::filesystem_error& e) {
                r.error = FileError{ErrorKind::IoError, e.what(), std::nullopt};
            }
            if (r.error) {
                spdlog::debug("add {}: {}", file.string(), r.error->display());
            }
            results.push_back(std::move(r));
        }

        bool manifest_changed = false;
        std::vector<std::string> copied;
        for (const auto& r : results) {
            if (!r.ok()) continue;
            manifest_changed |= manifest.upsert({*r.relative, *r.oid, *r.size});
            if (r.is(Outcome::Copied)) copied.push_back(*r.relative);
        }
        if (manifest_changed) manifest.save(lay.manifest_path());

        if (!copied.empty()) {
            auto after  = current_state();
            auto new_id = after.id();
            if (!old_id || *old_id != new_id) {
                if (old_id) snapshots.save(before);
                snapshots.save(after);
                reflog.record(actor(), ReflogOp::Add, opts.message, old_id, new_id, copied);
            }
        }

        size_t failed = 0;
        for (const auto& r : results) failed += r.ok() ? 0 : 1;
        spdlog::info("add: {} copied, {} present, {} failed",
                     copied.size(), results.size() - copied.size() - failed, failed);
    });
    return results;
}

} // namespace dvs
