#include "dvs/repository.h"
#include "internal.h"

#include <spdlog/spdlog.h>

namespace dvs {

namespace fss = std::filesystem;

namespace {

void check_storage(const StorageBackend& storage, const Oid& oid,
                   const MetadataRecord& rec, VerifyResult& v,
                   std::vector<std::string>& problems) {
    try {
        auto stored = storage.hash(oid);
        if (!stored) {
            problems.push_back("storage object missing");
        } else if (stored->second != rec.size || stored->first != oid.hex) {
            problems.push_back("storage object corrupt");
        } else {
            v.storage_ok = true;
        }
    } catch (const IoError& e) {
        problems.push_back(e.what());
    } catch (const FileOpError& e) {
        problems.push_back(e.what());
    }
}

void check_local(const fss::path& data, const MetadataRecord& rec, VerifyResult& v,
                 std::vector<std::string>& problems) {
    std::error_code ec;
    if (!fss::exists(data, ec)) {
        problems.push_back("working file missing");
        return;
    }
    try {
        if (fetch::matches(data, rec)) {
            v.local_ok = true;
        } else {
            problems.push_back("working file differs");
        }
    } catch (const IoError& e) {
        problems.push_back(e.what());
    } catch (const FileOpError& e) {
        problems.push_back(e.what());
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Repository::verify
// ---------------------------------------------------------------------------

std::vector<VerifyResult> Repository::verify(const std::vector<std::string>& patterns) const {
    std::vector<VerifyResult> out;

    for (const auto& rel : select_paths(patterns)) {
        VerifyResult v;
        v.path = rel;
        auto data = root() / fss::path(rel);

        auto sidecar = MetadataRecord::find_sidecar(data);
        if (!sidecar) {
            v.details = "not tracked";
            out.push_back(std::move(v));
            continue;
        }

        MetadataRecord rec;
        Oid oid;
        try {
            rec = MetadataRecord::load(*sidecar);
            oid = rec.oid();
            v.metadata_ok = true;
        } catch (const ParseError& e) {
            v.details = e.what();
        } catch (const InvalidOidError& e) {
            v.details = e.what();
        } catch (const IoError& e) {
            v.details = e.what();
        }
        if (!v.metadata_ok) {
            out.push_back(std::move(v));
            continue;
        }

        std::vector<std::string> problems;
        check_local(data, rec, v, problems);
        check_storage(storage(), oid, rec, v, problems);

        if (!problems.empty()) {
            std::string joined;
            for (const auto& p : problems) {
                if (!joined.empty()) joined += "; ";
                joined += p;
            }
            v.details = joined;
        }
        out.push_back(std::move(v));
    }

    auto summary = VerifySummary::from_results(out);
    spdlog::info("verify: {}/{} ok", summary.passed, summary.total);
    return out;
}

} // namespace dvs
