#pragma once

#include "error.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dvs {

// ---------------------------------------------------------------------------
// HashAlgo
// ---------------------------------------------------------------------------

/// Supported content hash algorithms. The set is closed: OIDs name their
/// algorithm and must stay comparable across repository versions.
enum class HashAlgo : uint8_t {
    Sha256,  ///< Cryptographic 256-bit (default).
    Fnv1a64, ///< Fast 64-bit FNV-1a. No collision resistance.
    Md5,     ///< Legacy 128-bit, for repositories tracked with it.
};

constexpr HashAlgo DEFAULT_HASH_ALGO = HashAlgo::Sha256;

/// Tag used in OIDs, sidecars and storage paths ("sha256", "fnv1a64", "md5").
const char* hash_algo_name(HashAlgo algo);

/// Parse a tag. Returns nullopt for unknown names.
std::optional<HashAlgo> hash_algo_from_name(const std::string& name);

/// Length of the hex digest produced by `algo`.
size_t hash_algo_hex_len(HashAlgo algo);

// ---------------------------------------------------------------------------
// Oid
// ---------------------------------------------------------------------------

/// Content identifier: algorithm tag plus lowercase hex digest.
struct Oid {
    HashAlgo    algo = DEFAULT_HASH_ALGO;
    std::string hex;

    /// Parse "algo:hex".
    /// @throws InvalidOidError on unknown tag, wrong length or non-hex digits.
    static Oid parse(const std::string& text);

    /// Build from parts, validating the digest.
    /// @throws InvalidOidError if `hex` does not fit `algo`.
    static Oid make(HashAlgo algo, std::string hex);

    /// "algo:hex".
    std::string to_string() const;

    /// "<algo>/<hex[0..2]>/<hex[2..]>", relative to a storage root.
    std::filesystem::path storage_subpath() const;

    bool operator==(const Oid& o) const { return algo == o.algo && hex == o.hex; }
    bool operator!=(const Oid& o) const { return !(*this == o); }
    bool operator<(const Oid& o) const {
        return algo != o.algo ? algo < o.algo : hex < o.hex;
    }
};

// ---------------------------------------------------------------------------
// DigestSet
// ---------------------------------------------------------------------------

/// Digests of one content body under one or more algorithms.
using DigestSet = std::map<HashAlgo, std::string>;

// ---------------------------------------------------------------------------
// Hasher: streaming digest
// ---------------------------------------------------------------------------

/// Incremental hasher for a single algorithm.
///
/// @code
///     dvs::Hasher h(dvs::HashAlgo::Sha256);
///     h.update(chunk1.data(), chunk1.size());
///     h.update(chunk2.data(), chunk2.size());
///     std::string hex = h.finish();
/// @endcode
class Hasher {
public:
    explicit Hasher(HashAlgo algo);
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;
    Hasher(Hasher&&) noexcept;
    Hasher& operator=(Hasher&&) noexcept;

    void update(const void* data, size_t len);

    /// Finalize and return the lowercase hex digest. The hasher is spent
    /// afterwards.
    std::string finish();

    HashAlgo algo() const { return algo_; }

private:
    struct Impl;
    HashAlgo              algo_;
    std::unique_ptr<Impl> impl_;
};

// ---------------------------------------------------------------------------
// One-shot helpers
// ---------------------------------------------------------------------------

/// Digest an in-memory buffer.
std::string hash_bytes(const void* data, size_t len, HashAlgo algo);

inline std::string hash_bytes(const std::vector<uint8_t>& data, HashAlgo algo) {
    return hash_bytes(data.data(), data.size(), algo);
}

inline std::string hash_bytes(const std::string& data, HashAlgo algo) {
    return hash_bytes(data.data(), data.size(), algo);
}

/// Hash a file under every algorithm in `algos` in a single read pass.
/// Returns the digests and the byte count.
/// @throws IoError if the file cannot be read.
std::pair<DigestSet, uint64_t>
hash_file(const std::filesystem::path& path, const std::vector<HashAlgo>& algos);

/// Convenience: single algorithm, returns the OID.
Oid hash_file_oid(const std::filesystem::path& path, HashAlgo algo);

} // namespace dvs
