#include "dvs/metadata.h"
#include "internal.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>

namespace dvs {

namespace fss = std::filesystem;
using json = nlohmann::json;

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

HashAlgo parse_algo(const std::string& name, const std::string& origin) {
    auto algo = hash_algo_from_name(name);
    if (!algo) throw ParseError(origin, "unknown hash algorithm '" + name + "'");
    return *algo;
}

/// Validate every digest against its algorithm and the primary's presence.
void check_digests(const MetadataRecord& rec, const std::string& origin) {
    if (rec.hashes.find(rec.hash_algo) == rec.hashes.end()) {
        throw ParseError(origin, std::string("missing ") +
                                 hash_algo_name(rec.hash_algo) + " digest");
    }
    for (const auto& kv : rec.hashes) {
        try {
            Oid::make(kv.first, kv.second);
        } catch (const InvalidOidError& e) {
            throw ParseError(origin, e.what());
        }
    }
}

// -- JSON -------------------------------------------------------------------

std::string to_json(const MetadataRecord& rec) {
    json hashes = json::object();
    for (const auto& kv : rec.hashes) hashes[hash_algo_name(kv.first)] = kv.second;

    json j;
    j["hashes"]     = hashes;
    j["size"]       = rec.size;
    j["created_by"] = rec.created_by;
    j["add_time"]   = rec.add_time;
    if (rec.message) j["message"] = *rec.message;
    j["hash_algo"]  = hash_algo_name(rec.hash_algo);
    return j.dump(2) + "\n";
}

MetadataRecord from_json(const std::string& text, const std::string& origin) {
    MetadataRecord rec;
    try {
        json j = json::parse(text);
        for (auto it = j.at("hashes").begin(); it != j.at("hashes").end(); ++it) {
            rec.hashes[parse_algo(it.key(), origin)] = it.value().get<std::string>();
        }
        if (!j.at("size").is_number_unsigned()) {
            throw ParseError(origin, "size must be a non-negative integer");
        }
        rec.size       = j["size"].get<uint64_t>();
        rec.created_by = j.value("created_by", std::string());
        rec.add_time   = j.value("add_time", std::string());
        if (j.contains("message") && !j["message"].is_null()) {
            rec.message = j["message"].get<std::string>();
        }
        rec.hash_algo = parse_algo(
            j.value("hash_algo", std::string(hash_algo_name(DEFAULT_HASH_ALGO))),
            origin);
    } catch (const json::exception& e) {
        throw ParseError(origin, e.what());
    }
    check_digests(rec, origin);
    return rec;
}

// -- YAML -------------------------------------------------------------------

std::string to_yaml(const MetadataRecord& rec) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "hashes" << YAML::Value << YAML::BeginMap;
    for (const auto& kv : rec.hashes) {
        out << YAML::Key << hash_algo_name(kv.first) << YAML::Value << kv.second;
    }
    out << YAML::EndMap;
    out << YAML::Key << "size"       << YAML::Value << rec.size;
    out << YAML::Key << "created_by" << YAML::Value << rec.created_by;
    out << YAML::Key << "add_time"   << YAML::Value << rec.add_time;
    if (rec.message) {
        out << YAML::Key << "message" << YAML::Value << *rec.message;
    }
    out << YAML::Key << "hash_algo"  << YAML::Value << hash_algo_name(rec.hash_algo);
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

MetadataRecord from_yaml(const std::string& text, const std::string& origin) {
    MetadataRecord rec;
    try {
        YAML::Node root = YAML::Load(text);
        if (!root.IsMap()) throw ParseError(origin, "expected a mapping");

        YAML::Node hashes = root["hashes"];
        if (!hashes || !hashes.IsMap()) throw ParseError(origin, "missing hashes");
        for (const auto& kv : hashes) {
            rec.hashes[parse_algo(kv.first.as<std::string>(), origin)] =
                kv.second.as<std::string>();
        }
        if (!root["size"]) throw ParseError(origin, "missing size");
        auto size = root["size"].as<std::string>();
        if (size.empty() || size[0] == '-') {
            throw ParseError(origin, "size must be a non-negative integer");
        }
        rec.size = root["size"].as<uint64_t>();
        if (root["created_by"]) rec.created_by = root["created_by"].as<std::string>();
        if (root["add_time"])   rec.add_time   = root["add_time"].as<std::string>();
        if (root["message"] && !root["message"].IsNull()) {
            rec.message = root["message"].as<std::string>();
        }
        rec.hash_algo = root["hash_algo"]
            ? parse_algo(root["hash_algo"].as<std::string>(), origin)
            : DEFAULT_HASH_ALGO;
    } catch (const YAML::Exception& e) {
        throw ParseError(origin, e.what());
    }
    check_digests(rec, origin);
    return rec;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

MetadataRecord MetadataRecord::from_file(const fss::path& path,
                                         const std::vector<HashAlgo>& algos,
                                         std::optional<std::string> message,
                                         std::string created_by) {
    std::error_code ec;
    auto st = fss::status(path, ec);
    if (!fss::exists(st)) {
        throw FileOpError(ErrorKind::FileNotFound, "file not found: " + path.string());
    }
    if (fss::is_directory(st)) {
        throw FileOpError(ErrorKind::IsDirectory, "is a directory: " + path.string(),
                          "use a glob pattern to add files within a directory");
    }
    if (!fss::is_regular_file(st)) {
        throw FileOpError(ErrorKind::PathError, "not a regular file: " + path.string());
    }

    MetadataRecord rec;
    rec.hash_algo  = algos.empty() ? DEFAULT_HASH_ALGO : algos.front();
    auto digests   = hash_file(path, algos.empty() ? std::vector<HashAlgo>{rec.hash_algo}
                                                   : algos);
    rec.hashes     = std::move(digests.first);
    rec.size       = digests.second;
    rec.created_by = std::move(created_by);
    rec.add_time   = paths::now_rfc3339();
    rec.message    = std::move(message);
    return rec;
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

std::string MetadataRecord::serialize(MetadataFormat fmt) const {
    return fmt == MetadataFormat::Yaml ? to_yaml(*this) : to_json(*this);
}

MetadataRecord MetadataRecord::deserialize(const std::string& text,
                                           MetadataFormat fmt,
                                           const std::string& origin) {
    return fmt == MetadataFormat::Yaml ? from_yaml(text, origin)
                                       : from_json(text, origin);
}

MetadataRecord MetadataRecord::load(const fss::path& sidecar) {
    auto fmt = format_of(sidecar);
    if (!fmt) throw ParseError(sidecar.string(), "not a sidecar file name");
    return deserialize(io::read_text(sidecar), *fmt, sidecar.string());
}

void MetadataRecord::save(const fss::path& sidecar) const {
    auto fmt = format_of(sidecar);
    if (!fmt) throw IoError("not a sidecar file name: " + sidecar.string());
    io::write_atomic(sidecar, serialize(*fmt));
}

Oid MetadataRecord::oid() const {
    auto it = hashes.find(hash_algo);
    if (it == hashes.end()) {
        throw InvalidOidError(std::string("record has no ") +
                              hash_algo_name(hash_algo) + " digest");
    }
    return Oid::make(hash_algo, it->second);
}

std::string MetadataRecord::checksum() const {
    auto it = hashes.find(hash_algo);
    return it == hashes.end() ? std::string() : it->second;
}

// ---------------------------------------------------------------------------
// Sidecar naming
// ---------------------------------------------------------------------------

fss::path MetadataRecord::sidecar_path(const fss::path& data_path, MetadataFormat fmt) {
    auto p = data_path;
    p += (fmt == MetadataFormat::Yaml ? YAML_SUFFIX : JSON_SUFFIX);
    return p;
}

std::optional<MetadataFormat> MetadataRecord::format_of(const fss::path& sidecar) {
    auto name = sidecar.filename().string();
    if (ends_with(name, YAML_SUFFIX) && name.size() > std::strlen(YAML_SUFFIX))
        return MetadataFormat::Yaml;
    if (ends_with(name, JSON_SUFFIX) && name.size() > std::strlen(JSON_SUFFIX))
        return MetadataFormat::Json;
    return std::nullopt;
}

std::optional<fss::path> MetadataRecord::data_path(const fss::path& sidecar) {
    auto fmt = format_of(sidecar);
    if (!fmt) return std::nullopt;
    auto s = sidecar.string();
    size_t cut = std::strlen(*fmt == MetadataFormat::Yaml ? YAML_SUFFIX : JSON_SUFFIX);
    return fss::path(s.substr(0, s.size() - cut));
}

std::optional<fss::path> MetadataRecord::find_sidecar(const fss::path& data_path) {
    for (auto fmt : {MetadataFormat::Json, MetadataFormat::Yaml}) {
        auto p = sidecar_path(data_path, fmt);
        std::error_code ec;
        if (fss::is_regular_file(p, ec)) return p;
    }
    return std::nullopt;
}

bool MetadataRecord::is_sidecar_name(const std::string& name) {
    return format_of(fss::path(name)).has_value();
}

} // namespace dvs
