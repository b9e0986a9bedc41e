#include "dvs/repository.h"
#include "internal.h"

#include <git2.h>
#include <spdlog/spdlog.h>

namespace dvs {

namespace fss = std::filesystem;

// ---------------------------------------------------------------------------
// RepositoryInner
// ---------------------------------------------------------------------------

RepositoryInner::RepositoryInner(git_repository* g, Layout l, Config c,
                                 std::unique_ptr<StorageBackend> s, std::string a)
    : git(g)
    , layout(std::move(l))
    , config(std::move(c))
    , storage(std::move(s))
    , actor(std::move(a)) {}

RepositoryInner::~RepositoryInner() {
    git::close(git);
}

// ---------------------------------------------------------------------------
// Repository::open / init
// ---------------------------------------------------------------------------

Repository::Repository(std::shared_ptr<RepositoryInner> inner)
    : inner_(std::move(inner)) {}

Repository Repository::open_at(const fss::path& root, const OpenOptions& opts) {
    Layout layout(fss::absolute(root).lexically_normal());
    Config config = Config::load(layout.config_path());

    auto storage = std::make_unique<LocalStorage>(
        config.storage_root(layout.root), config.permissions, config.group);

    std::unique_ptr<git_repository, void (*)(git_repository*)> git(
        git::open(layout.root), git::close);
    std::string actor = opts.actor ? *opts.actor : current_actor(git.get());

    auto inner = std::make_shared<RepositoryInner>(
        git.get(), std::move(layout), std::move(config), std::move(storage),
        std::move(actor));
    git.release();
    return Repository(std::move(inner));
}

Repository Repository::open(const fss::path& start, OpenOptions opts) {
    auto from = fss::absolute(start).lexically_normal();

    if (auto workdir = git::discover_workdir(from)) {
        if (fss::exists(*workdir / Config::FILENAME)) {
            return open_at(*workdir, opts);
        }
    }
    for (auto dir = from; ; dir = dir.parent_path()) {
        if (fss::exists(dir / Config::FILENAME)) return open_at(dir, opts);
        if (dir == dir.root_path() || dir.parent_path() == dir) break;
    }
    throw NotInitializedError(from.string());
}

Repository Repository::init(const fss::path& root, InitOptions opts) {
    auto abs_root = fss::absolute(root).lexically_normal();
    if (!fss::is_directory(abs_root)) {
        throw IoError("not a directory: " + abs_root.string());
    }
    if (opts.storage_dir.empty()) {
        throw ConfigError("storage_dir is required");
    }

    Config cfg;
    cfg.storage_dir     = opts.storage_dir;
    cfg.permissions     = opts.permissions;
    cfg.group           = opts.group;
    cfg.hash_algo       = opts.hash_algo;
    cfg.metadata_format = opts.metadata_format;

    Layout layout(abs_root);
    OpenOptions open_opts;
    open_opts.actor = opts.actor;

    if (fss::exists(layout.config_path())) {
        auto existing = Config::load(layout.config_path());
        if (!existing.same_settings(cfg)) throw ConfigMismatchError();
        spdlog::debug("dvs already initialized in {}", abs_root.string());
        layout.init();
        return open_at(abs_root, open_opts);
    }

    io::ensure_dir(cfg.storage_root(abs_root));
    layout.init();
    cfg.save(layout.config_path());
    spdlog::info("initialized dvs in {} (storage {})", abs_root.string(),
                 cfg.storage_root(abs_root).string());

    auto repo = open_at(abs_root, open_opts);
    lock::with_repo_lock(layout.locks_dir(), [&]() {
        Reflog reflog(layout);
        if (reflog.read_head()) return;
        auto id = SnapshotStore(layout).save(repo.current_state());
        reflog.record(repo.actor(), ReflogOp::Init, std::string("initialized"),
                      std::nullopt, id, {});
    });
    return repo;
}

// ---------------------------------------------------------------------------
// State
// ---------------------------------------------------------------------------

WorkspaceState Repository::current_state() const {
    return WorkspaceState::capture(inner_->layout);
}

Manifest Repository::manifest() const {
    return Manifest::load_or_new(inner_->layout.manifest_path());
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

const fss::path& Repository::root() const { return inner_->layout.root; }
const Layout& Repository::layout() const { return inner_->layout; }
const Config& Repository::config() const { return inner_->config; }
StorageBackend& Repository::storage() const { return *inner_->storage; }
const std::string& Repository::actor() const { return inner_->actor; }

bool Repository::is_ignored(const std::string& rel) const {
    return git::is_ignored(inner_->git, rel);
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::vector<fss::path>
Repository::expand(const std::vector<std::string>& patterns, bool include_tracked) const {
    auto files = glob::expand(
        root(), patterns,
        [this](const std::string& rel) { return is_ignored(rel); },
        include_tracked);
    if (files.empty()) throw NoFilesMatchedError();
    return files;
}

std::vector<std::string> Repository::tracked_paths() const {
    std::vector<std::string> out;
    for (const auto& kv : paths::sidecar_index(root())) out.push_back(kv.first);
    return out;
}

std::vector<std::string>
Repository::select_paths(const std::vector<std::string>& patterns) const {
    if (patterns.empty()) return tracked_paths();

    std::vector<std::string> out;
    auto files = glob::expand(
        root(), patterns,
        [this](const std::string& rel) { return is_ignored(rel); },
        true);
    for (const auto& f : files) {
        auto rel = paths::relative_to(root(), f);
        if (rel && !rel->empty()) {
            out.push_back(*rel);
        } else {
            spdlog::debug("skipping {}: outside repository", f.string());
        }
    }
    return out;
}

} // namespace dvs
