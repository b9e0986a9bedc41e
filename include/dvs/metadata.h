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
// MetadataRecord: per-file sidecar
// ---------------------------------------------------------------------------

/// Tracked state of one data file, saved beside it as `<file>.dvs`
/// (JSON) or `<file>.dvs.yaml` (YAML).
///
/// Only the digests and the size identify content; `created_by`,
/// `add_time` and `message` are provenance and are ignored by ==.
struct MetadataRecord {
    static constexpr const char* JSON_SUFFIX = ".dvs";
    static constexpr const char* YAML_SUFFIX = ".dvs.yaml";

    DigestSet                  hashes;
    uint64_t                   size = 0;
    std::string                created_by;
    std::string                add_time;
    std::optional<std::string> message;
    HashAlgo                   hash_algo = DEFAULT_HASH_ALGO;

    /// Hash `path` under `algos` (the first one becomes `hash_algo`) in
    /// one read pass. `add_time` is set to now.
    /// @throws FileOpError(IsDirectory / FileNotFound) if `path` is not a
    ///         regular file, IoError if it cannot be read.
    static MetadataRecord from_file(const std::filesystem::path& path,
                                    const std::vector<HashAlgo>& algos,
                                    std::optional<std::string> message,
                                    std::string created_by);

    /// Read a sidecar; the format follows the suffix.
    /// @throws IoError if missing or unreadable, ParseError if corrupt.
    static MetadataRecord load(const std::filesystem::path& sidecar);

    /// Write the sidecar atomically; the format follows the suffix.
    /// @throws IoError on write failure.
    void save(const std::filesystem::path& sidecar) const;

    /// Serialized form, as save() would write it for `fmt`.
    std::string serialize(MetadataFormat fmt) const;
    static MetadataRecord deserialize(const std::string& text, MetadataFormat fmt,
                                      const std::string& origin);

    /// OID under the primary algorithm.
    /// @throws InvalidOidError if the primary digest is missing or malformed.
    Oid oid() const;

    /// Primary digest hex, or "" if missing.
    std::string checksum() const;

    bool operator==(const MetadataRecord& o) const {
        return hashes == o.hashes && size == o.size;
    }
    bool operator!=(const MetadataRecord& o) const { return !(*this == o); }

    // -- Sidecar naming -----------------------------------------------------

    static std::filesystem::path sidecar_path(const std::filesystem::path& data_path,
                                              MetadataFormat fmt);

    /// Data path for a sidecar, or nullopt if `sidecar` has neither suffix.
    static std::optional<std::filesystem::path>
    data_path(const std::filesystem::path& sidecar);

    /// Format implied by a sidecar's suffix.
    static std::optional<MetadataFormat> format_of(const std::filesystem::path& sidecar);

    /// The existing sidecar for `data_path` (JSON checked first).
    static std::optional<std::filesystem::path>
    find_sidecar(const std::filesystem::path& data_path);

    /// True if `name` ends with a sidecar suffix.
    static bool is_sidecar_name(const std::string& name);
};

} // namespace dvs
