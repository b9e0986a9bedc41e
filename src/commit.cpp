#include "internal.h"

#include <spdlog/spdlog.h>

namespace dvs {
namespace txn {

namespace fss = std::filesystem;

FileCommit::FileCommit(StorageBackend& storage, Oid oid,
                       fss::path source, fss::path sidecar)
    : storage_(storage)
    , oid_(std::move(oid))
    , source_(std::move(source))
    , sidecar_(std::move(sidecar))
{}

// ---------------------------------------------------------------------------
// Phase 1: storage
// ---------------------------------------------------------------------------

bool FileCommit::stage_object() {
    try {
        if (storage_.exists(oid_)) return false;
        storage_.store(oid_, source_);
    } catch (const IoError& e) {
        throw FileOpError(ErrorKind::StorageError,
                          "cannot store " + oid_.to_string() + ": " + e.what());
    } catch (const fss::filesystem_error& e) {
        throw FileOpError(ErrorKind::StorageError,
                          "cannot store " + oid_.to_string() + ": " + e.what());
    }
    return true;
}

// ---------------------------------------------------------------------------
// Phase 2: sidecar
// ---------------------------------------------------------------------------

void FileCommit::write_sidecar(const MetadataRecord& record) {
    std::error_code ec;
    existed_ = fss::is_regular_file(sidecar_, ec);
    if (existed_) {
        try {
            previous_ = io::read_text(sidecar_);
        } catch (const IoError& e) {
            throw FileOpError(ErrorKind::MetadataError,
                              "cannot read existing sidecar: " + std::string(e.what()));
        }
    }

    try {
        record.save(sidecar_);
    } catch (const IoError& e) {
        restore_sidecar();
        throw FileOpError(ErrorKind::MetadataError,
                          "cannot write " + sidecar_.filename().string() + ": " + e.what(),
                          "storage object " + oid_.to_string() + " was kept");
    } catch (const fss::filesystem_error& e) {
        restore_sidecar();
        throw FileOpError(ErrorKind::MetadataError,
                          "cannot write " + sidecar_.filename().string() + ": " + e.what(),
                          "storage object " + oid_.to_string() + " was kept");
    }
}

void FileCommit::restore_sidecar() noexcept {
    std::error_code ec;
    if (!existed_) {
        // Only a file we may have created is ours to delete.
        if (fss::is_regular_file(fss::symlink_status(sidecar_, ec))) {
            fss::remove(sidecar_, ec);
            if (ec) {
                spdlog::error("rollback: cannot remove {}: {}",
                              sidecar_.string(), ec.message());
            }
        }
        return;
    }
    if (!previous_) return;
    try {
        io::write_atomic(sidecar_, *previous_);
    } catch (const std::exception& e) {
        spdlog::error("rollback: cannot restore {}: {}", sidecar_.string(), e.what());
    }
}

} // namespace txn
} // namespace dvs
