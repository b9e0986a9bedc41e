#pragma once

#include "hash.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dvs {

// ---------------------------------------------------------------------------
// ManifestEntry
// ---------------------------------------------------------------------------

struct ManifestEntry {
    std::string path;  ///< Repo-relative, `/`-separated. Unique key.
    Oid         oid;
    uint64_t    bytes = 0;

    bool operator==(const ManifestEntry& o) const {
        return path == o.path && oid == o.oid && bytes == o.bytes;
    }
    bool operator!=(const ManifestEntry& o) const { return !(*this == o); }
};

// ---------------------------------------------------------------------------
// Manifest: dvs.lock
// ---------------------------------------------------------------------------

/// Repository-wide mapping from path to (OID, size), persisted as
/// `dvs.lock` at the repository root. Entries keep insertion order.
class Manifest {
public:
    static constexpr const char* FILENAME = "dvs.lock";
    static constexpr int VERSION = 1;

    Manifest() = default;

    /// Read a manifest file.
    /// @throws ParseError if the file is unreadable or corrupt. Callers
    ///         create an empty Manifest only when the file is absent.
    static Manifest load(const std::filesystem::path& path);

    /// Load `path` if it exists, otherwise return an empty manifest.
    /// @throws ParseError if the file exists but cannot be parsed.
    static Manifest load_or_new(const std::filesystem::path& path);

    /// Rewrite the whole file atomically.
    /// @throws IoError on write failure.
    void save(const std::filesystem::path& path) const;

    /// Insert or replace by path. Returns true if anything changed.
    bool upsert(ManifestEntry entry);

    /// Remove by path. Returns true if an entry was removed.
    bool remove(const std::string& path);

    std::optional<ManifestEntry> get(const std::string& path) const;

    size_t size() const { return entries_.size(); }
    bool   empty() const { return entries_.empty(); }
    const std::vector<ManifestEntry>& entries() const { return entries_; }

    /// Compact JSON document as stored on disk (without pretty-printing).
    std::string to_json_string(int indent = -1) const;
    static Manifest from_json_string(const std::string& text, const std::string& origin);

    bool operator==(const Manifest& o) const { return entries_ == o.entries_; }

private:
    std::vector<ManifestEntry> entries_;
};

} // namespace dvs
