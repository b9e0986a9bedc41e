#pragma once

#include "config.h"
#include "manifest.h"

#include <filesystem>
#include <string>

namespace dvs {

// ---------------------------------------------------------------------------
// Layout: on-disk locations under a repository root
// ---------------------------------------------------------------------------

/// Paths of every file the engine owns under `root`.
struct Layout {
    static constexpr const char* DVS_DIR = ".dvs";

    std::filesystem::path root;

    explicit Layout(std::filesystem::path r) : root(std::move(r)) {}

    std::filesystem::path dvs_dir()       const { return root / DVS_DIR; }
    std::filesystem::path config_path()   const { return root / Config::FILENAME; }
    std::filesystem::path manifest_path() const { return root / Manifest::FILENAME; }
    std::filesystem::path state_dir()     const { return dvs_dir() / "state"; }
    std::filesystem::path snapshots_dir() const { return state_dir() / "snapshots"; }
    std::filesystem::path refs_dir()      const { return dvs_dir() / "refs"; }
    std::filesystem::path logs_dir()      const { return dvs_dir() / "logs"; }
    std::filesystem::path locks_dir()     const { return dvs_dir() / "locks"; }
    std::filesystem::path head_ref_path() const { return refs_dir() / "HEAD"; }
    std::filesystem::path head_log_path() const { return logs_dir() / "refs" / "HEAD"; }

    std::filesystem::path snapshot_path(const std::string& id) const {
        return snapshots_dir() / (id + ".json");
    }

    /// Create the `.dvs/` directory tree.
    /// @throws IoError on failure.
    void init() const;

    /// True when `.dvs/` exists.
    bool exists() const { return std::filesystem::is_directory(dvs_dir()); }
};

} // namespace dvs
