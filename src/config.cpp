#include "dvs/config.h"
#include "internal.h"

#include <yaml-cpp/yaml.h>

#include <sstream>

namespace dvs {

namespace fss = std::filesystem;

namespace {

/// "664", "0664" or "0o664" -> 0664.
uint32_t parse_octal(const std::string& text) {
    std::string s = text;
    if (s.rfind("0o", 0) == 0 || s.rfind("0O", 0) == 0) s = s.substr(2);
    if (s.empty() || s.size() > 4 ||
        s.find_first_not_of("01234567") != std::string::npos) {
        throw ConfigError("permissions must be octal, got '" + text + "'");
    }
    return static_cast<uint32_t>(std::stoul(s, nullptr, 8));
}

std::string format_octal(uint32_t mode) {
    std::ostringstream ss;
    ss << std::oct << mode;
    return ss.str();
}

HashAlgo parse_algo(const std::string& name) {
    auto algo = hash_algo_from_name(name);
    if (!algo) throw ConfigError("unknown hash_algo '" + name + "'");
    return *algo;
}

} // anonymous namespace

Config Config::load(const fss::path& path) {
    std::error_code ec;
    if (!fss::exists(path, ec)) {
        throw ConfigError("missing " + path.string());
    }

    Config cfg;
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) throw ConfigError(path.string() + ": expected a mapping");

        if (!root["storage_dir"] || root["storage_dir"].as<std::string>().empty()) {
            throw ConfigError(path.string() + ": storage_dir is required");
        }
        cfg.storage_dir = root["storage_dir"].as<std::string>();

        if (root["permissions"] && !root["permissions"].IsNull()) {
            cfg.permissions = parse_octal(root["permissions"].as<std::string>());
        }
        if (root["group"] && !root["group"].IsNull()) {
            cfg.group = root["group"].as<std::string>();
        }
        if (root["hash_algo"]) {
            cfg.hash_algo = parse_algo(root["hash_algo"].as<std::string>());
        }
        if (root["metadata_format"]) {
            auto name = root["metadata_format"].as<std::string>();
            auto fmt  = metadata_format_from_name(name);
            if (!fmt) throw ConfigError("unknown metadata_format '" + name + "'");
            cfg.metadata_format = *fmt;
        }
        if (root["extra_hashes"]) {
            for (const auto& n : root["extra_hashes"]) {
                cfg.extra_hashes.push_back(parse_algo(n.as<std::string>()));
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(path.string() + ": " + e.what());
    }
    return cfg;
}

void Config::save(const fss::path& path) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "storage_dir" << YAML::Value << storage_dir.string();
    if (permissions) {
        out << YAML::Key << "permissions" << YAML::Value
            << YAML::DoubleQuoted << format_octal(*permissions);
    }
    if (group) {
        out << YAML::Key << "group" << YAML::Value << *group;
    }
    out << YAML::Key << "hash_algo" << YAML::Value << hash_algo_name(hash_algo);
    out << YAML::Key << "metadata_format" << YAML::Value
        << metadata_format_name(metadata_format);
    if (!extra_hashes.empty()) {
        out << YAML::Key << "extra_hashes" << YAML::Value << YAML::Flow << YAML::BeginSeq;
        for (auto a : extra_hashes) out << hash_algo_name(a);
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;
    io::write_atomic(path, std::string(out.c_str()) + "\n");
}

fss::path Config::storage_root(const fss::path& root) const {
    return storage_dir.is_absolute() ? storage_dir : root / storage_dir;
}

std::vector<HashAlgo> Config::algos_for(HashAlgo primary) const {
    std::vector<HashAlgo> out{primary};
    for (auto a : extra_hashes) {
        bool seen = false;
        for (auto b : out) seen = seen || a == b;
        if (!seen) out.push_back(a);
    }
    return out;
}

} // namespace dvs
