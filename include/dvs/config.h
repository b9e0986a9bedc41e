#pragma once

#include "hash.h"
#include "types.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dvs {

// ---------------------------------------------------------------------------
// Config: dvs.yaml
// ---------------------------------------------------------------------------

/// Repository configuration, persisted as `dvs.yaml` at the repo root.
///
/// @code
///     storage_dir: /data/dvs-storage
///     permissions: "664"
///     group: analysts
///     hash_algo: sha256
///     metadata_format: json
///     extra_hashes: [md5]
/// @endcode
struct Config {
    static constexpr const char* FILENAME = "dvs.yaml";

    std::filesystem::path      storage_dir;
    std::optional<uint32_t>    permissions; ///< Applied to stored objects.
    std::optional<std::string> group;       ///< Applied to stored objects.
    HashAlgo                   hash_algo       = DEFAULT_HASH_ALGO;
    MetadataFormat             metadata_format = MetadataFormat::Json;
    std::vector<HashAlgo>      extra_hashes;    ///< Also recorded in sidecars.

    /// Parse `path`.
    /// @throws ConfigError on missing file, malformed YAML or bad values.
    static Config load(const std::filesystem::path& path);

    /// Write `path` (whole-file rewrite).
    /// @throws IoError if the file cannot be written.
    void save(const std::filesystem::path& path) const;

    /// `storage_dir` made absolute against `root` when it is relative.
    std::filesystem::path storage_root(const std::filesystem::path& root) const;

    /// Algorithms to compute when `primary` is the selected one:
    /// `primary` followed by `extra_hashes`, without duplicates.
    std::vector<HashAlgo> algos_for(HashAlgo primary) const;

    /// True when storage_dir, permissions and group agree.
    bool same_settings(const Config& other) const {
        return storage_dir == other.storage_dir &&
               permissions == other.permissions &&
               group == other.group;
    }
};

} // namespace dvs
