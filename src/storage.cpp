#include "dvs/storage.h"
#include "internal.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>

#ifndef _WIN32
#  include <grp.h>
#  include <unistd.h>
#endif

namespace dvs {

namespace fss = std::filesystem;

// ---------------------------------------------------------------------------
// LocalStorage
// ---------------------------------------------------------------------------

LocalStorage::LocalStorage(fss::path root,
                           std::optional<uint32_t> permissions,
                           std::optional<std::string> group)
    : root_(std::move(root))
    , permissions_(permissions)
    , group_(std::move(group))
{}

fss::path LocalStorage::object_path(const Oid& oid) const {
    return root_ / oid.storage_subpath();
}

bool LocalStorage::exists(const Oid& oid) const {
    std::error_code ec;
    return fss::is_regular_file(object_path(oid), ec);
}

std::optional<std::vector<uint8_t>> LocalStorage::read(const Oid& oid) const {
    auto p = object_path(oid);
    if (!exists(oid)) return std::nullopt;

    std::ifstream ifs(p, std::ios::binary);
    if (!ifs) {
        throw IoError("cannot open object: " + p.string());
    }
    std::vector<uint8_t> data{std::istreambuf_iterator<char>(ifs),
                              std::istreambuf_iterator<char>()};
    if (ifs.bad()) {
        throw IoError("read failed: " + p.string());
    }
    return data;
}

std::optional<std::pair<std::string, uint64_t>> LocalStorage::hash(const Oid& oid) const {
    if (!exists(oid)) return std::nullopt;
    auto result = hash_file(object_path(oid), {oid.algo});
    return std::make_pair(result.first.at(oid.algo), result.second);
}

void LocalStorage::store(const Oid& oid, const fss::path& source) {
    auto dest = object_path(oid);
    io::ensure_dir(dest.parent_path());
    // rename() replaces an existing object with identical content, so a
    // concurrent writer of the same OID is harmless.
    io::copy_atomic(source, dest);
    apply_permissions(dest);
    spdlog::debug("stored {} from {}", oid.to_string(), source.string());
}

void LocalStorage::store_bytes(const Oid& oid, const std::vector<uint8_t>& data) {
    auto dest = object_path(oid);
    io::ensure_dir(dest.parent_path());
    io::write_atomic(dest, data);
    apply_permissions(dest);
    spdlog::debug("stored {} ({} bytes)", oid.to_string(), data.size());
}

void LocalStorage::retrieve(const Oid& oid, const fss::path& dest) const {
    if (!exists(oid)) {
        throw NotFoundError("storage object " + oid.to_string());
    }
    if (dest.has_parent_path()) io::ensure_dir(dest.parent_path());
    io::copy_atomic(object_path(oid), dest);
}

bool LocalStorage::remove(const Oid& oid) noexcept {
    std::error_code ec;
    bool removed = fss::remove(object_path(oid), ec);
    if (ec) {
        spdlog::warn("could not remove {}: {}", oid.to_string(), ec.message());
        return false;
    }
    return removed;
}

void LocalStorage::apply_permissions(const fss::path& p) const {
    if (permissions_) {
        std::error_code ec;
        fss::permissions(p, static_cast<fss::perms>(*permissions_),
                         fss::perm_options::replace, ec);
        if (ec) {
            spdlog::warn("could not set permissions {:o} on {}: {}",
                         *permissions_, p.string(), ec.message());
        }
    }
#ifndef _WIN32
    if (group_) {
        struct group* gr = ::getgrnam(group_->c_str());
        if (!gr) {
            spdlog::warn("unknown group '{}' for {}", *group_, p.string());
        } else if (::chown(p.c_str(), static_cast<uid_t>(-1), gr->gr_gid) != 0) {
            spdlog::warn("could not chgrp {} to '{}'", p.string(), *group_);
        }
    }
#endif
}

} // namespace dvs
