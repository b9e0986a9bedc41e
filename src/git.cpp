#include "internal.h"

#include <git2.h>

#include <cstdlib>
#include <string>

#ifndef _WIN32
#  include <pwd.h>
#  include <unistd.h>
#endif

namespace dvs {

// ---------------------------------------------------------------------------
// libgit2 lifecycle: initialise once per process
// ---------------------------------------------------------------------------

namespace {
struct LibGit2Init {
    LibGit2Init()  { git_libgit2_init(); }
    ~LibGit2Init() { git_libgit2_shutdown(); }
};
static LibGit2Init s_libgit2;

[[noreturn]] void throw_git(const std::string& ctx) {
    const git_error* e = git_error_last();
    std::string msg = ctx;
    if (e && e->message) { msg += ": "; msg += e->message; }
    throw GitError(msg);
}

/// Owns a git_config snapshot.
struct ConfigGuard {
    git_config* cfg = nullptr;
    ~ConfigGuard() { if (cfg) git_config_free(cfg); }
};
} // anonymous namespace

namespace git {

std::optional<std::filesystem::path> discover_workdir(const std::filesystem::path& start) {
    git_buf buf = GIT_BUF_INIT;
    int rc = git_repository_discover(&buf, start.string().c_str(), 0, nullptr);
    if (rc == GIT_ENOTFOUND) return std::nullopt;
    if (rc != 0) throw_git("git_repository_discover");

    git_repository* repo = nullptr;
    rc = git_repository_open(&repo, buf.ptr);
    git_buf_dispose(&buf);
    if (rc != 0) throw_git("git_repository_open");

    std::optional<std::filesystem::path> out;
    if (const char* wd = git_repository_workdir(repo)) {
        out = std::filesystem::path(wd).lexically_normal();
        // workdir carries a trailing separator
        if (!out->has_filename()) out = out->parent_path();
    }
    git_repository_free(repo);
    return out;
}

git_repository* open(const std::filesystem::path& root) {
    git_repository* repo = nullptr;
    int rc = git_repository_open_ext(&repo, root.string().c_str(),
                                     GIT_REPOSITORY_OPEN_NO_SEARCH, nullptr);
    if (rc == GIT_ENOTFOUND) return nullptr;
    if (rc != 0) throw_git("git_repository_open_ext");
    if (git_repository_is_bare(repo)) {
        git_repository_free(repo);
        return nullptr;
    }
    return repo;
}

std::optional<std::string> config_user_name(git_repository* repo) {
    ConfigGuard guard;
    int rc = 0;
    if (repo) {
        rc = git_repository_config_snapshot(&guard.cfg, repo);
    } else {
        git_config* live = nullptr;
        rc = git_config_open_default(&live);
        if (rc == 0) {
            rc = git_config_snapshot(&guard.cfg, live);
            git_config_free(live);
        }
    }
    if (rc != 0) return std::nullopt;

    const char* name = nullptr;
    if (git_config_get_string(&name, guard.cfg, "user.name") != 0 || !name || !*name) {
        return std::nullopt;
    }
    return std::string(name);
}

bool is_ignored(git_repository* repo, const std::string& rel) {
    if (!repo) return false;
    int ignored = 0;
    if (git_ignore_path_is_ignored(&ignored, repo, rel.c_str()) != 0) {
        throw_git("git_ignore_path_is_ignored(" + rel + ")");
    }
    return ignored == 1;
}

void close(git_repository* repo) {
    if (repo) git_repository_free(repo);
}

} // namespace git

std::string current_actor(git_repository* repo) {
    if (auto name = git::config_user_name(repo)) return *name;

    for (const char* var : {"USER", "USERNAME", "LOGNAME"}) {
        const char* v = std::getenv(var);
        if (v && *v) return v;
    }
#ifndef _WIN32
    if (struct passwd* pw = ::getpwuid(::getuid())) {
        if (pw->pw_name && *pw->pw_name) return pw->pw_name;
    }
#endif
    return "unknown";
}

} // namespace dvs
