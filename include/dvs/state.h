#pragma once

#include "layout.h"
#include "manifest.h"
#include "metadata.h"
#include "types.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dvs {

// ---------------------------------------------------------------------------
// WorkspaceState
// ---------------------------------------------------------------------------

/// A sidecar found in the workspace.
struct MetadataEntry {
    std::string    path;   ///< Repo-relative data path.
    MetadataRecord record;
};

/// The manifest plus every sidecar under the root at one point in time.
///
/// Content-addressed by id(): SHA-256 of the compact JSON serialization.
/// Two states are the same iff their ids match.
struct WorkspaceState {
    static constexpr int VERSION = 1;

    std::optional<Manifest>    manifest; ///< Absent before the first add.
    std::vector<MetadataEntry> metadata; ///< Sorted by path.

    /// Load the manifest (if any) and every sidecar under `layout.root`,
    /// skipping `.git` and `.dvs`. Unreadable sidecars are skipped.
    /// @throws ParseError if the manifest is corrupt.
    static WorkspaceState capture(const Layout& layout);

    bool is_empty() const { return !manifest && metadata.empty(); }

    std::string to_json_string() const;
    static WorkspaceState from_json_string(const std::string& text,
                                           const std::string& origin);

    /// State id (64 hex chars).
    std::string id() const;

    /// Sidecar record for `path`, if present in this state.
    const MetadataRecord* find(const std::string& path) const;
};

// ---------------------------------------------------------------------------
// SnapshotStore
// ---------------------------------------------------------------------------

/// Content-addressed WorkspaceState blobs under `.dvs/state/snapshots/`.
class SnapshotStore {
public:
    explicit SnapshotStore(const Layout& layout) : layout_(layout) {}

    /// Persist `state` (idempotent) and return its id.
    std::string save(const WorkspaceState& state) const;

    /// @throws NotFoundError if the snapshot is missing, ParseError if corrupt.
    WorkspaceState load(const std::string& id) const;

    bool exists(const std::string& id) const;

    /// Ids of every stored snapshot (unordered).
    std::vector<std::string> list() const;

private:
    Layout layout_;
};

// ---------------------------------------------------------------------------
// Reflog
// ---------------------------------------------------------------------------

/// Append-only operation history at `.dvs/logs/refs/HEAD`, one compact
/// JSON object per line, plus the current state id in `.dvs/refs/HEAD`.
class Reflog {
public:
    explicit Reflog(const Layout& layout) : layout_(layout) {}

    /// Update HEAD to `new_id` and append one entry.
    /// @throws IoError on write failure.
    ReflogEntry record(const std::string& actor,
                       ReflogOp op,
                       std::optional<std::string> message,
                       const std::optional<std::string>& old_id,
                       const std::string& new_id,
                       std::vector<std::string> changed) const;

    void append(const ReflogEntry& entry) const;

    /// Every entry, oldest first. Missing log yields an empty list.
    /// @throws ParseError on a corrupt line.
    std::vector<ReflogEntry> read_all() const;

    /// Every entry, newest first.
    std::vector<ReflogEntry> read_recent() const;

    /// At most `n` entries, newest first.
    std::vector<ReflogEntry> recent(size_t n) const;

    /// Entry at `index` (0 = newest), or nullopt.
    std::optional<ReflogEntry> get_by_index(size_t index) const;

    /// Current state id from HEAD, or nullopt before the first entry.
    std::optional<std::string> read_head() const;
    void write_head(const std::string& id) const;

    static std::string to_json_line(const ReflogEntry& entry);
    static ReflogEntry from_json_line(const std::string& line, const std::string& origin);

private:
    Layout layout_;
};

} // namespace dvs
