#include "internal.h"
#include "dvs/dvs.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <set>
#include <sstream>

namespace dvs {
namespace glob {

/// Match a single pattern segment against a name.
/// Supports `*` (any sequence), `?` (any single char) and `[...]` / `[!...]`
/// character classes with ranges.
bool fnmatch(const std::string& pattern, const std::string& name) {
    size_t pi = 0, ni = 0;
    size_t plen = pattern.size(), nlen = name.size();

    while (pi < plen && ni < nlen) {
        char pc = pattern[pi];
        if (pc == '*') {
            while (pi < plen && pattern[pi] == '*') ++pi;
            if (pi == plen) return true;
            std::string rest_pat = pattern.substr(pi);
            for (size_t k = ni; k <= nlen; ++k) {
                if (fnmatch(rest_pat, name.substr(k))) return true;
            }
            return false;
        } else if (pc == '?') {
            ++pi; ++ni;
        } else if (pc == '[') {
            ++pi;
            bool negate = (pi < plen && pattern[pi] == '!');
            if (negate) ++pi;
            bool matched = false;
            char ch = name[ni];
            while (pi < plen && pattern[pi] != ']') {
                if (pi + 2 < plen && pattern[pi + 1] == '-' && pattern[pi + 2] != ']') {
                    if (ch >= pattern[pi] && ch <= pattern[pi + 2]) matched = true;
                    pi += 3;
                } else {
                    if (ch == pattern[pi]) matched = true;
                    ++pi;
                }
            }
            if (pi < plen) ++pi; // ']'
            if (matched == negate) return false;
            ++ni;
        } else {
            if (pc != name[ni]) return false;
            ++pi; ++ni;
        }
    }

    while (pi < plen && pattern[pi] == '*') ++pi;
    return pi == plen && ni == nlen;
}

/// A leading dot in `name` must be matched by a leading dot in `pattern`.
bool glob_match(const std::string& pattern, const std::string& name) {
    if (!name.empty() && name[0] == '.' &&
        !pattern.empty() && pattern[0] != '.') {
        return false;
    }
    return fnmatch(pattern, name);
}

bool has_magic(const std::string& pattern) {
    return pattern.find_first_of("*?[") != std::string::npos;
}

void validate(const std::string& pattern) {
    if (pattern.empty()) throw InvalidPatternError("(empty)");
    bool in_class = false;
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (!in_class && c == '[') {
            in_class = true;
            // "[]...]" and "[!]...]" treat the first ']' as a literal
            if (i + 1 < pattern.size() && pattern[i + 1] == '!') ++i;
            if (i + 1 < pattern.size() && pattern[i + 1] == ']') ++i;
        } else if (in_class && c == ']') {
            in_class = false;
        }
    }
    if (in_class) throw InvalidPatternError(pattern);
}

// ---------------------------------------------------------------------------
// expand
// ---------------------------------------------------------------------------

namespace {

namespace fss = std::filesystem;

struct Walk {
    const fss::path&               root;
    const std::vector<std::string>& segments;
    const IgnorePredicate&          ignored;
    bool                            include_tracked;
    std::vector<std::string>&       results;
};

std::string join_rel(const std::string& dir, const std::string& name) {
    return dir.empty() ? name : dir + "/" + name;
}

void walk(const Walk& w, const std::string& rel_dir, size_t seg_idx) {
    if (seg_idx >= w.segments.size()) return;

    const std::string& seg = w.segments[seg_idx];
    bool is_last = (seg_idx + 1 == w.segments.size());
    fss::path dir = rel_dir.empty() ? w.root : w.root / rel_dir;

    std::error_code ec;
    if (!fss::is_directory(dir, ec)) return;

    if (seg == "**") {
        // zero levels
        walk(w, rel_dir, seg_idx + 1);
        // one or more levels, never into dot-directories
        for (const auto& entry : fss::directory_iterator(dir, ec)) {
            auto name = entry.path().filename().string();
            if (name.empty() || name[0] == '.') continue;
            if (!entry.is_directory(ec)) continue;
            auto rel = join_rel(rel_dir, name);
            if (w.ignored && w.ignored(rel)) continue;
            walk(w, rel, seg_idx);
        }
        return;
    }

    for (const auto& entry : fss::directory_iterator(dir, ec)) {
        auto name = entry.path().filename().string();
        if (paths::is_control_dir(name)) continue;

        bool is_dir = entry.is_directory(ec);
        if (!is_last) {
            if (!is_dir || !glob_match(seg, name)) continue;
            auto rel = join_rel(rel_dir, name);
            if (w.ignored && w.ignored(rel)) continue;
            walk(w, rel, seg_idx + 1);
            continue;
        }

        if (is_dir) continue;
        std::string candidate = name;
        bool tracked = MetadataRecord::is_sidecar_name(name);
        if (tracked) {
            if (!w.include_tracked) continue;
            candidate = MetadataRecord::data_path(fss::path(name))->string();
        } else {
            tracked = MetadataRecord::find_sidecar(entry.path()).has_value();
        }
        if (!glob_match(seg, candidate)) continue;
        auto rel = join_rel(rel_dir, candidate);
        // ignore rules only hide untracked files
        if (!tracked && w.ignored && w.ignored(rel)) continue;
        w.results.push_back(rel);
    }
}

std::vector<std::string> split_segments(const std::string& pattern) {
    std::vector<std::string> segments;
    std::istringstream iss(pattern);
    std::string seg;
    while (std::getline(iss, seg, '/')) {
        if (!seg.empty() && seg != ".") segments.push_back(seg);
    }
    // trailing "**" means every file below
    if (!segments.empty() && segments.back() == "**") segments.push_back("*");
    return segments;
}

} // anonymous namespace

std::vector<fss::path>
expand(const fss::path& root,
       const std::vector<std::string>& patterns,
       const IgnorePredicate& ignored,
       bool include_tracked) {
    std::vector<fss::path> out;
    std::set<std::string>  seen;
    auto push = [&](const fss::path& p) {
        auto key = p.lexically_normal().string();
        if (seen.insert(key).second) out.push_back(p.lexically_normal());
    };

    for (const auto& pattern : patterns) {
        validate(pattern);

        if (!has_magic(pattern)) {
            fss::path p(pattern);
            push(p.is_absolute() ? p : root / p);
            continue;
        }

        std::string rel_pattern = pattern;
        if (fss::path(pattern).is_absolute()) {
            auto rel = paths::relative_to(root, fss::path(pattern));
            if (!rel) {
                spdlog::debug("pattern {} is outside {}", pattern, root.string());
                continue;
            }
            rel_pattern = *rel;
        }

        auto segments = split_segments(rel_pattern);
        if (segments.empty()) continue;

        std::vector<std::string> matches;
        walk(Walk{root, segments, ignored, include_tracked, matches}, "", 0);
        std::sort(matches.begin(), matches.end());
        for (const auto& m : matches) push(root / m);
    }
    return out;
}

} // namespace glob

// ---------------------------------------------------------------------------
// disk_glob
// ---------------------------------------------------------------------------

std::vector<std::string> disk_glob(const std::string& pattern,
                                   const std::string& root) {
    std::vector<std::string> results;
    auto root_path = std::filesystem::path(root);
    for (const auto& p : glob::expand(root_path, {pattern}, nullptr, false)) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(p, ec)) continue;
        auto rel = paths::relative_to(root_path, p);
        if (rel) results.push_back(*rel);
    }
    std::sort(results.begin(), results.end());
    return results;
}

} // namespace dvs
