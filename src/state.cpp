#include "dvs/state.h"
#include "internal.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <sstream>

namespace dvs {

namespace fss = std::filesystem;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Layout
// ---------------------------------------------------------------------------

void Layout::init() const {
    for (const auto& dir : {dvs_dir(), snapshots_dir(), refs_dir(),
                            logs_dir() / "refs", locks_dir()}) {
        io::ensure_dir(dir);
    }
}

// ---------------------------------------------------------------------------
// sidecar_index
// ---------------------------------------------------------------------------

namespace paths {

std::map<std::string, fss::path> sidecar_index(const fss::path& root) {
    // a JSON sidecar wins over a YAML one for the same data path
    std::map<std::string, fss::path> sidecars;
    std::error_code ec;
    auto it = fss::recursive_directory_iterator(
        root, fss::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw IoError("cannot walk " + root.string() + ": " + ec.message());
    }
    for (auto end = fss::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            throw IoError("cannot walk " + root.string() + ": " + ec.message());
        }
        const auto& entry = *it;
        if (entry.is_directory(ec)) {
            if (paths::is_control_dir(entry.path().filename().string()))
                it.disable_recursion_pending();
            continue;
        }
        if (!entry.is_regular_file(ec)) continue;
        auto fmt = MetadataRecord::format_of(entry.path());
        if (!fmt) continue;

        auto rel = paths::relative_to(root, *MetadataRecord::data_path(entry.path()));
        if (!rel) continue;
        auto found = sidecars.find(*rel);
        if (found == sidecars.end() || *fmt == MetadataFormat::Json) {
            sidecars[*rel] = entry.path();
        }
    }
    return sidecars;
}

} // namespace paths

// ---------------------------------------------------------------------------
// WorkspaceState
// ---------------------------------------------------------------------------

WorkspaceState WorkspaceState::capture(const Layout& layout) {
    WorkspaceState state;

    auto manifest_path = layout.manifest_path();
    std::error_code ec;
    if (fss::exists(manifest_path, ec)) {
        state.manifest = Manifest::load(manifest_path);
    }

    // Unreadable sidecars are left out; only the manifest is fatal.
    for (const auto& kv : paths::sidecar_index(layout.root)) {
        try {
            state.metadata.push_back({kv.first, MetadataRecord::load(kv.second)});
        } catch (const ParseError& e) {
            spdlog::warn("state: skipping sidecar {}: {}", kv.second.string(), e.what());
        } catch (const IoError& e) {
            spdlog::warn("state: skipping sidecar {}: {}", kv.second.string(), e.what());
        }
    }
    return state;
}

std::string WorkspaceState::to_json_string() const {
    json meta = json::array();
    for (const auto& m : metadata) {
        meta.push_back({{"path", m.path},
                        {"meta", json::parse(m.record.serialize(MetadataFormat::Json))}});
    }
    json j;
    j["version"]  = VERSION;
    j["manifest"] = manifest ? json::parse(manifest->to_json_string()) : json(nullptr);
    j["metadata"] = meta;
    return j.dump();
}

WorkspaceState WorkspaceState::from_json_string(const std::string& text,
                                                const std::string& origin) {
    WorkspaceState state;
    try {
        json j = json::parse(text);
        if (!j.at("manifest").is_null()) {
            state.manifest = Manifest::from_json_string(j["manifest"].dump(), origin);
        }
        for (const auto& m : j.at("metadata")) {
            state.metadata.push_back(
                {m.at("path").get<std::string>(),
                 MetadataRecord::deserialize(m.at("meta").dump(),
                                             MetadataFormat::Json, origin)});
        }
    } catch (const json::exception& e) {
        throw ParseError(origin, e.what());
    }
    std::sort(state.metadata.begin(), state.metadata.end(),
              [](const MetadataEntry& a, const MetadataEntry& b) { return a.path < b.path; });
    return state;
}

std::string WorkspaceState::id() const {
    return hash_bytes(to_json_string(), HashAlgo::Sha256);
}

const MetadataRecord* WorkspaceState::find(const std::string& path) const {
    for (const auto& m : metadata) {
        if (m.path == path) return &m.record;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// SnapshotStore
// ---------------------------------------------------------------------------

std::string SnapshotStore::save(const WorkspaceState& state) const {
    auto id   = state.id();
    auto path = layout_.snapshot_path(id);
    if (!fss::exists(path)) {
        io::ensure_dir(layout_.snapshots_dir());
        io::write_atomic(path, state.to_json_string());
        spdlog::debug("saved snapshot {}", id.substr(0, 12));
    }
    return id;
}

WorkspaceState SnapshotStore::load(const std::string& id) const {
    auto path = layout_.snapshot_path(id);
    if (!fss::exists(path)) {
        throw NotFoundError("state " + id);
    }
    return WorkspaceState::from_json_string(io::read_text(path), path.string());
}

bool SnapshotStore::exists(const std::string& id) const {
    // ids are hex; anything else cannot name a snapshot file
    if (id.empty() || id.find_first_not_of("0123456789abcdef") != std::string::npos)
        return false;
    std::error_code ec;
    return fss::is_regular_file(layout_.snapshot_path(id), ec);
}

std::vector<std::string> SnapshotStore::list() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fss::is_directory(layout_.snapshots_dir(), ec)) return ids;
    for (const auto& entry : fss::directory_iterator(layout_.snapshots_dir())) {
        if (entry.path().extension() == ".json") {
            ids.push_back(entry.path().stem().string());
        }
    }
    return ids;
}

// ---------------------------------------------------------------------------
// Reflog
// ---------------------------------------------------------------------------

std::string Reflog::to_json_line(const ReflogEntry& e) {
    json j;
    j["ts"]    = e.ts;
    j["actor"] = e.actor;
    j["op"]    = reflog_op_name(e.op);
    if (e.message)   j["message"] = *e.message;
    if (e.old_state) j["old"]     = *e.old_state;
    j["new"]   = e.new_state;
    j["paths"] = e.paths;
    return j.dump();
}

ReflogEntry Reflog::from_json_line(const std::string& line, const std::string& origin) {
    ReflogEntry e;
    try {
        json j = json::parse(line);
        e.ts    = j.at("ts").get<std::string>();
        e.actor = j.at("actor").get<std::string>();
        auto op = reflog_op_from_name(j.at("op").get<std::string>());
        if (!op) throw ParseError(origin, "unknown op " + j["op"].dump());
        e.op = *op;
        if (j.contains("message") && !j["message"].is_null())
            e.message = j["message"].get<std::string>();
        if (j.contains("old") && !j["old"].is_null())
            e.old_state = j["old"].get<std::string>();
        e.new_state = j.at("new").get<std::string>();
        e.paths     = j.value("paths", std::vector<std::string>());
    } catch (const json::exception& ex) {
        throw ParseError(origin, ex.what());
    }
    return e;
}

void Reflog::append(const ReflogEntry& entry) const {
    io::ensure_dir(layout_.head_log_path().parent_path());
    io::append_line(layout_.head_log_path(), to_json_line(entry));
}

ReflogEntry Reflog::record(const std::string& actor,
                           ReflogOp op,
                           std::optional<std::string> message,
                           const std::optional<std::string>& old_id,
                           const std::string& new_id,
                           std::vector<std::string> changed) const {
    ReflogEntry e;
    e.ts      = paths::now_rfc3339();
    e.actor   = actor;
    e.op      = op;
    e.message = std::move(message);
    if (old_id) e.old_state = ReflogEntry::state_ref(*old_id);
    e.new_state = ReflogEntry::state_ref(new_id);
    e.paths     = std::move(changed);

    append(e);
    write_head(new_id);
    spdlog::debug("reflog {} -> {}", reflog_op_name(op), new_id.substr(0, 12));
    return e;
}

std::vector<ReflogEntry> Reflog::read_all() const {
    std::vector<ReflogEntry> out;
    auto path = layout_.head_log_path();
    std::error_code ec;
    if (!fss::exists(path, ec)) return out;

    std::istringstream in(io::read_text(path));
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (line.empty()) continue;
        out.push_back(from_json_line(line, path.string() + ":" + std::to_string(lineno)));
    }
    return out;
}

std::vector<ReflogEntry> Reflog::read_recent() const {
    auto all = read_all();
    std::reverse(all.begin(), all.end());
    return all;
}

std::vector<ReflogEntry> Reflog::recent(size_t n) const {
    auto all = read_recent();
    if (all.size() > n) all.resize(n);
    return all;
}

std::optional<ReflogEntry> Reflog::get_by_index(size_t index) const {
    auto all = read_recent();
    if (index >= all.size()) return std::nullopt;
    return all[index];
}

std::optional<std::string> Reflog::read_head() const {
    auto path = layout_.head_ref_path();
    std::error_code ec;
    if (!fss::exists(path, ec)) return std::nullopt;
    auto text = io::read_text(path);
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' '))
        text.pop_back();
    if (text.empty()) return std::nullopt;
    return text;
}

void Reflog::write_head(const std::string& id) const {
    io::ensure_dir(layout_.refs_dir());
    io::write_atomic(layout_.head_ref_path(), id + "\n");
}

} // namespace dvs
