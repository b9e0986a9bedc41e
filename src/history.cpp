#include "dvs/repository.h"
#include "internal.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace dvs {

namespace fss = std::filesystem;

namespace {

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c); });
}

/// A state id, or a reflog index ("0" = newest) naming one.
std::string resolve_target(const Reflog& reflog, const SnapshotStore& snapshots,
                           const std::string& target) {
    std::string id = target;
    if (all_digits(target) && target.size() <= 9) {
        auto entry = reflog.get_by_index(std::stoul(target));
        if (!entry) throw NotFoundError("reflog entry " + target);
        auto parsed = ReflogEntry::parse_state_id(entry->new_state);
        if (!parsed) throw NotFoundError("state in reflog entry " + target);
        id = *parsed;
    }
    if (!snapshots.exists(id)) throw NotFoundError("state " + id);
    return id;
}

void remove_sidecars(const fss::path& data) {
    for (auto fmt : {MetadataFormat::Json, MetadataFormat::Yaml}) {
        auto sidecar = MetadataRecord::sidecar_path(data, fmt);
        std::error_code ec;
        fss::remove(sidecar, ec);
        if (ec) {
            throw IoError("cannot remove " + sidecar.string() + ": " + ec.message());
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Repository::log
// ---------------------------------------------------------------------------

std::vector<LogEntry> Repository::log(std::optional<size_t> limit) const {
    Reflog reflog(layout());
    auto entries = limit ? reflog.recent(*limit) : reflog.read_recent();

    std::vector<LogEntry> out;
    out.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        out.push_back(LogEntry{i, std::move(entries[i])});
    }
    return out;
}

std::optional<LogEntry> Repository::log_entry(size_t index) const {
    auto entry = Reflog(layout()).get_by_index(index);
    if (!entry) return std::nullopt;
    return LogEntry{index, std::move(*entry)};
}

// ---------------------------------------------------------------------------
// Repository::rollback
// ---------------------------------------------------------------------------

RollbackResult Repository::rollback(const std::string& target, const RollbackOptions& opts) {
    std::lock_guard<std::mutex> in_process(inner_->mutex);
    RollbackResult result;

    lock::with_repo_lock(layout().locks_dir(), [&]() {
        const Layout& lay = layout();
        Reflog reflog(lay);
        SnapshotStore snapshots(lay);

        auto to_id   = resolve_target(reflog, snapshots, target);
        auto current = current_state();
        auto from_id = current.id();
        result.from_state = from_id;
        result.to_state   = to_id;

        if (from_id == to_id) {
            spdlog::info("rollback: already at {}", to_id.substr(0, 8));
            return;
        }

        auto wanted = snapshots.load(to_id);
        // keep the state we leave reachable
        snapshots.save(current);

        for (const auto& entry : wanted.metadata) {
            const MetadataRecord* now = current.find(entry.path);
            if (now && now->serialize(MetadataFormat::Json) ==
                       entry.record.serialize(MetadataFormat::Json)) {
                continue;
            }
            auto data     = root() / fss::path(entry.path);
            auto existing = MetadataRecord::find_sidecar(data);
            auto fmt      = existing ? *MetadataRecord::format_of(*existing)
                                     : config().metadata_format;
            auto sidecar  = MetadataRecord::sidecar_path(data, fmt);
            io::ensure_dir(sidecar.parent_path());
            entry.record.save(sidecar);
            result.restored.push_back(entry.path);
        }

        for (const auto& entry : current.metadata) {
            if (wanted.find(entry.path)) continue;
            remove_sidecars(root() / fss::path(entry.path));
            result.removed.push_back(entry.path);
        }

        if (wanted.manifest) {
            wanted.manifest->save(lay.manifest_path());
        } else {
            std::error_code ec;
            fss::remove(lay.manifest_path(), ec);
            if (ec) {
                throw IoError("cannot remove " + lay.manifest_path().string() + ": " +
                              ec.message());
            }
        }

        if (opts.materialize && !wanted.metadata.empty()) {
            std::vector<fss::path> files;
            files.reserve(wanted.metadata.size());
            for (const auto& entry : wanted.metadata) {
                files.push_back(root() / fss::path(entry.path));
            }
            result.materialized = fetch::restore(*this, files);
        }

        std::vector<std::string> changed = result.restored;
        changed.insert(changed.end(), result.removed.begin(), result.removed.end());
        std::sort(changed.begin(), changed.end());

        reflog.record(actor(), ReflogOp::Rollback,
                      "rolled back to " + to_id.substr(0, 8),
                      from_id, to_id, std::move(changed));

        spdlog::info("rollback {} -> {}: {} restored, {} removed",
                     from_id.substr(0, 8), to_id.substr(0, 8),
                     result.restored.size(), result.removed.size());
    });
    return result;
}

} // namespace dvs
