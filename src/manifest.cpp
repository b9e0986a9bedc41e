#include "dvs/manifest.h"
#include "internal.h"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace dvs {

namespace fss = std::filesystem;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

std::string Manifest::to_json_string(int indent) const {
    json entries = json::array();
    for (const auto& e : entries_) {
        entries.push_back({{"path", e.path},
                           {"oid", e.oid.to_string()},
                           {"bytes", e.bytes}});
    }
    json j;
    j["version"] = VERSION;
    j["entries"] = entries;
    return j.dump(indent);
}

Manifest Manifest::from_json_string(const std::string& text, const std::string& origin) {
    Manifest m;
    try {
        json j = json::parse(text);
        int version = j.value("version", VERSION);
        if (version != VERSION) {
            throw ParseError(origin, "unsupported manifest version " +
                                     std::to_string(version));
        }
        for (const auto& e : j.at("entries")) {
            ManifestEntry entry;
            entry.path  = e.at("path").get<std::string>();
            entry.oid   = Oid::parse(e.at("oid").get<std::string>());
            if (!e.at("bytes").is_number_unsigned()) {
                throw ParseError(origin, "bytes must be a non-negative integer for " +
                                         entry.path);
            }
            entry.bytes = e["bytes"].get<uint64_t>();
            if (m.get(entry.path)) {
                throw ParseError(origin, "duplicate entry for " + entry.path);
            }
            m.entries_.push_back(std::move(entry));
        }
    } catch (const json::exception& e) {
        throw ParseError(origin, e.what());
    } catch (const InvalidOidError& e) {
        throw ParseError(origin, e.what());
    }
    return m;
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

Manifest Manifest::load(const fss::path& path) {
    std::string text;
    try {
        text = io::read_text(path);
    } catch (const IoError& e) {
        throw ParseError(path.string(), e.what());
    }
    return from_json_string(text, path.string());
}

Manifest Manifest::load_or_new(const fss::path& path) {
    std::error_code ec;
    if (!fss::exists(fss::symlink_status(path, ec))) return Manifest();
    return load(path);
}

void Manifest::save(const fss::path& path) const {
    io::write_atomic(path, to_json_string(2) + "\n");
}

// ---------------------------------------------------------------------------
// Entries
// ---------------------------------------------------------------------------

bool Manifest::upsert(ManifestEntry entry) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const ManifestEntry& e) { return e.path == entry.path; });
    if (it == entries_.end()) {
        entries_.push_back(std::move(entry));
        return true;
    }
    if (*it == entry) return false;
    *it = std::move(entry);
    return true;
}

bool Manifest::remove(const std::string& path) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const ManifestEntry& e) { return e.path == path; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

std::optional<ManifestEntry> Manifest::get(const std::string& path) const {
    for (const auto& e : entries_) {
        if (e.path == path) return e;
    }
    return std::nullopt;
}

} // namespace dvs
