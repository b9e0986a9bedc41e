#include "internal.h"

#include <ctime>
#include <string>

namespace dvs {
namespace paths {

bool is_control_dir(const std::string& name) {
    return name == ".git" || name == ".dvs";
}

/// Relative path with `/` separators. Rejects anything that climbs out of
/// `root` (a leading `..` segment) and `root` itself.
std::optional<std::string> relative_to(const std::filesystem::path& root,
                                       const std::filesystem::path& p) {
    namespace fss = std::filesystem;
    auto abs_root = fss::absolute(root).lexically_normal();
    auto abs_p    = fss::absolute(p).lexically_normal();

    auto rel = abs_p.lexically_relative(abs_root);
    if (rel.empty() || rel == ".") return std::nullopt;

    auto first = *rel.begin();
    if (first == "..") return std::nullopt;
    return rel.generic_string();
}

/// Component-wise prefix test; `/repo-other` is not within `/repo`.
bool is_within(const std::filesystem::path& root, const std::filesystem::path& p) {
    auto r  = root.lexically_normal();
    auto pp = p.lexically_normal();
    auto ri = r.begin();
    auto pi = pp.begin();
    for (; ri != r.end(); ++ri, ++pi) {
        // trailing separator yields an empty final component
        if (ri->empty()) continue;
        if (pi == pp.end() || *ri != *pi) return false;
    }
    return true;
}

std::string now_rfc3339() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace paths
} // namespace dvs
