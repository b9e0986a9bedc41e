#pragma once

#include "hash.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dvs {

// ---------------------------------------------------------------------------
// StorageBackend
// ---------------------------------------------------------------------------

/// Content-addressable byte store keyed by Oid.
///
/// Writing the same OID twice is idempotent. Callers check exists()
/// first to skip redundant copies, but store() stays correct when the
/// object is already present.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual bool exists(const Oid& oid) const = 0;

    /// Object bytes, or nullopt if the object is missing.
    /// @throws IoError if the object exists but cannot be read.
    virtual std::optional<std::vector<uint8_t>> read(const Oid& oid) const = 0;

    /// Copy `source` into the store under `oid`.
    /// @throws IoError on I/O failure.
    virtual void store(const Oid& oid, const std::filesystem::path& source) = 0;

    /// Store an in-memory buffer under `oid`.
    /// @throws IoError on I/O failure.
    virtual void store_bytes(const Oid& oid, const std::vector<uint8_t>& data) = 0;

    /// Copy the object to `dest`, replacing it atomically.
    /// @throws NotFoundError if the object is missing, IoError on I/O failure.
    virtual void retrieve(const Oid& oid, const std::filesystem::path& dest) const = 0;

    /// Re-hash the object with its own algorithm, streaming it from the
    /// store. Returns the digest and byte count, or nullopt if missing.
    /// @throws IoError if the object exists but cannot be read.
    virtual std::optional<std::pair<std::string, uint64_t>> hash(const Oid& oid) const = 0;

    /// Best-effort delete. Returns true if an object was removed.
    virtual bool remove(const Oid& oid) noexcept = 0;
};

// ---------------------------------------------------------------------------
// LocalStorage
// ---------------------------------------------------------------------------

/// StorageBackend over a local (or mounted) directory laid out as
/// `root/<algo>/<hex[0..2]>/<hex[2..]>`.
class LocalStorage : public StorageBackend {
public:
    explicit LocalStorage(std::filesystem::path root,
                          std::optional<uint32_t> permissions = std::nullopt,
                          std::optional<std::string> group = std::nullopt);

    bool exists(const Oid& oid) const override;
    std::optional<std::vector<uint8_t>> read(const Oid& oid) const override;
    void store(const Oid& oid, const std::filesystem::path& source) override;
    void store_bytes(const Oid& oid, const std::vector<uint8_t>& data) override;
    void retrieve(const Oid& oid, const std::filesystem::path& dest) const override;
    std::optional<std::pair<std::string, uint64_t>> hash(const Oid& oid) const override;
    bool remove(const Oid& oid) noexcept override;

    /// Absolute path an object lives at (whether or not it exists).
    std::filesystem::path object_path(const Oid& oid) const;

    const std::filesystem::path& root() const { return root_; }

private:
    /// Chmod/chgrp a freshly written object. Failures are logged only.
    void apply_permissions(const std::filesystem::path& p) const;

    std::filesystem::path      root_;
    std::optional<uint32_t>    permissions_;
    std::optional<std::string> group_;
};

} // namespace dvs
