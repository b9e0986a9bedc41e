#include <catch2/catch.hpp>
#include <dvs/dvs.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

#ifndef _WIN32
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static fs::path make_temp_repo() {
    auto tmp = fs::temp_directory_path() /
               ("dvs_add_" + std::to_string(
                    std::hash<std::thread::id>{}(std::this_thread::get_id())
                    ^ static_cast<size_t>(
                          std::chrono::steady_clock::now()
                              .time_since_epoch()
                              .count())));
    fs::create_directories(tmp);
    return tmp;
}

static fs::path storage_of(const fs::path& root) {
    return fs::path(root.string() + "-storage");
}

static dvs::Repository init_repo(const fs::path& root) {
    dvs::InitOptions opts;
    opts.storage_dir = storage_of(root);
    opts.actor       = "tester";
    return dvs::Repository::init(root, opts);
}

static void cleanup(const fs::path& root) {
    fs::remove_all(root);
    fs::remove_all(storage_of(root));
}

static void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream(p, std::ios::binary) << content;
}

// ---------------------------------------------------------------------------
// Scenarios
// ---------------------------------------------------------------------------

TEST_CASE("Add: data.csv is copied once, then present", "[add]") {
    auto path = make_temp_repo();
    auto repo = init_repo(path);
    write_file(path / "data.csv", "col1,col2\n1,2\n3,4\n");

    auto first = repo.add({"data.csv"});
    REQUIRE(first.size() == 1);
    REQUIRE(first[0].ok());
    CHECK(first[0].is(dvs::Outcome::Copied));
    CHECK(*first[0].size == 18);
    CHECK(*first[0].relative == "data.csv");
    CHECK(fs::is_regular_file(path / "data.csv.dvs"));
    CHECK(repo.storage().exists(*first[0].oid));

    auto second = repo.add({"data.csv"});
    REQUIRE(second.size() == 1);
    CHECK(second[0].is(dvs::Outcome::Present));
    CHECK(*second[0].oid == *first[0].oid);

    auto manifest = repo.manifest();
    REQUIRE(manifest.size() == 1);
    CHECK(manifest.entries()[0].path == "data.csv");
    CHECK(manifest.entries()[0].bytes == 18);
    CHECK(manifest.entries()[0].oid == *first[0].oid);

    cleanup(path);
}

TEST_CASE("Add: file1 and file2 get distinct oids; a modified file gets a new one", "[add]") {
    auto path = make_temp_repo();
    auto repo = init_repo(path);
    write_file(path / "file1.txt", "content one");
    write_file(path / "file2.txt", "content two");

    auto results = repo.add({"file1.txt", "file2.txt"});
    REQUIRE(results.size() == 2);
    CHECK(results[0].is(dvs::Outcome::Copied));
    CHECK(results[1].is(dvs::Outcome::Copied));
    CHECK(*results[0].size == 11);
    CHECK(*results[1].size == 11);
    CHECK(*results[0].oid != *results[1].oid);

    write_file(path / "file1.txt", "content one, edited");
    auto again = repo.add({"*.txt"});
    REQUIRE(again.size() == 2);
    CHECK(again[0].is(dvs::Outcome::Copied));
    CHECK(*again[0].oid != *results[0].oid);
    CHECK(again[1].is(dvs::Outcome::Present));

    auto manifest = repo.manifest();
    CHECK(manifest.size() == 2);
    CHECK(manifest.get("file1.txt")->oid == *again[0].oid);

    cleanup(path);
}

TEST_CASE("Add: identical content shares one storage object", "[add]") {
    auto path = make_temp_repo();
    auto repo = init_repo(path);
    write_file(path / "a" / "copy.bin", "same bytes");
    write_file(path / "b" / "copy.bin", "same bytes");

    auto results = repo.add({"**/*.bin"});
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].ok());
    REQUIRE(results[1].ok());
    CHECK(*results[0].oid == *results[1].oid);

    size_t objects = 0;
    for (const auto& e : fs::recursive_directory_iterator(storage_of(path))) {
        if (e.is_regular_file()) ++objects;
    }
    CHECK(objects == 1);

    fs::remove(path / "a" / "copy.bin.dvs");
    CHECK(repo.storage().exists(*results[1].oid));

    cleanup(path);
}

// ---------------------------------------------------------------------------
// Per-file failures
// ---------------------------------------------------------------------------

TEST_CASE("Add: a symlink leaving the repository is rejected", "[add]") {
    auto path = make_temp_repo();
    auto repo = init_repo(path);
    auto outside = fs::path(path.string() + "-outside.txt");
    write_file(outside, "secret");
    fs::create_symlink(outside, path / "link.txt");

    auto results = repo.add({"link.txt"});
    REQUIRE(results.size() == 1);
    CHECK(results[0].failed_with(dvs::ErrorKind::PathTraversal));
    CHECK_FALSE(fs::exists(path / "link.txt.dvs"));
    CHECK(repo.manifest().empty());

    fs::remove(outside);
    cleanup(path);
}

TEST_CASE("Add: a symlink inside the repository hashes its target", "[add]") {
    auto path = make_temp_repo();
    auto repo = init_repo(path);
    write_file(path / "real.txt", "target");
    fs::create_symlink(path / "real.txt", path / "alias.txt");

    auto results = repo.add({"alias.txt"});
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].ok());
    CHECK(*results[0].relative == "alias.txt");
    CHECK(results[0].oid->hex ==
          dvs::hash_bytes(std::string("target"), dvs::HashAlgo::Sha256));
    CHECK(fs::exists(path / "alias.txt.dvs"));

    cleanup(path);
}

TEST_CASE("Add: a broken symlink is reported", "[add]") {
    auto path = make_temp_repo();
    auto repo = init_repo(path);
    fs::create_symlink(path / "nowhere.txt", path / "dangling.txt");

    auto results = repo.add({"dangling.txt"});
    REQUIRE(results.size() == 1);
    CHECK(results[0].failed_with(dvs::ErrorKind::BrokenSymlink));

    cleanup(path);
}

TEST_CASE("Add: one failure does not abort the others", "[add]") {
    auto path = make_temp_repo();
    auto repo = init_repo(path);
    write_file(path / "data.csv", "ok");
    write_file(path / "subdir" / "inner.csv", "inner");
    auto outside = fs::path(path.string() + "-elsewhere.csv");
    write_file(outside, "far away");

    auto results = repo.add({"missing.csv", "subdir", "data.csv",
                             "data.csv.dvs", outside.string()});
    REQUIRE(results.size() == 5);
    CHECK(results[0].failed_with(dvs::ErrorKind::FileNotFound));
    CHECK(results[1].failed_with(dvs::ErrorKind::IsDirectory));
    CHECK(results[1].error->hint.has_value());
    CHECK(results[2].is(dvs::Outcome::Copied));
    CHECK(results[3].failed_with(dvs::ErrorKind::PathError));
    CHECK(results[4].failed_with(dvs::ErrorKind::FileOutsideRepo));

    CHECK(repo.manifest().size() == 1);

    fs::remove(outside);
    cleanup(path);
}

TEST_CASE("Add: a failed sidecar write leaves no sidecar and no history", "[add]") {
    auto path = make_temp_repo();
    auto repo = init_repo(path);
    write_file(path / "data.csv", "col1,col2\n1,2\n3,4\n");
    // a directory where the sidecar should go makes the final rename fail
    fs::create_directories(path / "data.csv.dvs");

    auto results = repo.add({"data.csv"});
    REQUIRE(results.size() == 1);
    CHECK(results[0].failed_with(dvs::ErrorKind::MetadataError));
    REQUIRE(results[0].error->hint.has_value());

    CHECK_FALSE(fs::is_regular_file(path / "data.csv.dvs"));
    CHECK_FALSE(fs::exists(path / "data.csv.dvs.yaml"));
    CHECK(repo.manifest().empty());
    CHECK(repo.log().size() == 1);

    // the storage object may remain
    auto oid = dvs::hash_file_oid(path / "data.csv", dvs::HashAlgo::Sha256);
    CHECK(repo.storage().exists(oid));

    cleanup(path);
}

// ---------------------------------------------------------------------------
// Repository-level failures
// ---------------------------------------------------------------------------

TEST_CASE("Add: pattern errors throw", "[add]") {
    auto path = make_temp_repo();
    auto repo = init_repo(path);
    write_file(path / "data.csv", "x");

    CHECK_THROWS_AS(repo.add({"*.none"}), dvs::NoFilesMatchedError);
    CHECK_THROWS_AS(repo.add({"[abc"}), dvs::InvalidPatternError);

    cleanup(path);
}

TEST_CASE("Add: a corrupt manifest aborts before any file is processed", "[add]") {
    auto path = make_temp_repo();
    auto repo = init_repo(path);
    write_file(path / "data.csv", "x");
    write_file(path / "dvs.lock", "{ broken");

    CHECK_THROWS_AS(repo.add({"data.csv"}), dvs::ParseError);
    CHECK_FALSE(fs::exists(path / "data.csv.dvs"));

    cleanup(path);
}

TEST_CASE("Add: a corrupt sidecar does not block other files and is repaired on re-add", "[add]") {
    auto path = make_temp_repo();
    auto repo = init_repo(path);
    write_file(path / "x.csv", "x,y\n");
    auto tracked = repo.add({"x.csv"});
    REQUIRE(tracked[0].ok());
    write_file(path / "x.csv.dvs", "{ broken");

    write_file(path / "data.csv", "col1,col2\n1,2\n3,4\n");
    auto results = repo.add({"data.csv"});
    REQUIRE(results.size() == 1);
    CHECK(results[0].is(dvs::Outcome::Copied));

    auto repaired = repo.add({"x.csv"});
    REQUIRE(repaired.size() == 1);
    CHECK(repaired[0].is(dvs::Outcome::Copied));
    CHECK(dvs::MetadataRecord::load(path / "x.csv.dvs").oid() == *tracked[0].oid);

    cleanup(path);
}

// ---------------------------------------------------------------------------
// Reflog
// ---------------------------------------------------------------------------

TEST_CASE("Add: records one reflog entry per effective add", "[add][reflog]") {
    auto path = make_temp_repo();
    auto repo = init_repo(path);
    write_file(path / "a.csv", "a");
    write_file(path / "b.csv", "b");

    dvs::AddOptions opts;
    opts.message = "nightly import";
    repo.add({"*.csv"}, opts);

    auto log = repo.log();
    REQUIRE(log.size() == 2);
    const auto& e = log[0].entry;
    CHECK(e.op == dvs::ReflogOp::Add);
    CHECK(e.actor == "tester");
    CHECK(e.message == std::optional<std::string>("nightly import"));
    CHECK_FALSE(e.old_state.has_value());
    CHECK(e.new_state == dvs::ReflogEntry::state_ref(repo.current_state().id()));
    CHECK(e.paths == std::vector<std::string>{"a.csv", "b.csv"});

    auto sidecar = dvs::MetadataRecord::load(path / "a.csv.dvs");
    CHECK(sidecar.message == std::optional<std::string>("nightly import"));
    CHECK(sidecar.created_by == "tester");

    // unchanged files: no new entry
    repo.add({"*.csv"});
    CHECK(repo.log().size() == 2);

    write_file(path / "a.csv", "a2");
    repo.add({"*.csv"});
    auto after = repo.log();
    REQUIRE(after.size() == 3);
    CHECK(after[0].entry.old_state == std::optional<std::string>(log[0].entry.new_state));
    CHECK(after[0].entry.paths == std::vector<std::string>{"a.csv"});

    cleanup(path);
}

// ---------------------------------------------------------------------------
// Algorithm and format selection
// ---------------------------------------------------------------------------

TEST_CASE("Add: an explicit algorithm sticks to the sidecar", "[add]") {
    auto path = make_temp_repo();
    auto repo = init_repo(path);
    write_file(path / "data.bin", "v1");

    dvs::AddOptions opts;
    opts.algo = dvs::HashAlgo::Md5;
    auto first = repo.add({"data.bin"}, opts);
    REQUIRE(first[0].ok());
    CHECK(first[0].oid->algo == dvs::HashAlgo::Md5);
    CHECK(dvs::MetadataRecord::load(path / "data.bin.dvs").hash_algo == dvs::HashAlgo::Md5);

    write_file(path / "data.bin", "v2");
    auto second = repo.add({"data.bin"});
    REQUIRE(second[0].ok());
    CHECK(second[0].oid->algo == dvs::HashAlgo::Md5);
    CHECK(second[0].oid->hex == dvs::hash_bytes(std::string("v2"), dvs::HashAlgo::Md5));

    cleanup(path);
}

TEST_CASE("Add: switching format replaces the other sidecar", "[add]") {
    auto path = make_temp_repo();
    auto repo = init_repo(path);
    write_file(path / "data.bin", "v1");
    repo.add({"data.bin"});
    REQUIRE(fs::exists(path / "data.bin.dvs"));

    write_file(path / "data.bin", "v2");
    dvs::AddOptions opts;
    opts.format = dvs::MetadataFormat::Yaml;
    auto results = repo.add({"data.bin"}, opts);
    REQUIRE(results[0].is(dvs::Outcome::Copied));
    CHECK(fs::exists(path / "data.bin.dvs.yaml"));
    CHECK_FALSE(fs::exists(path / "data.bin.dvs"));

    // later adds keep the existing format
    write_file(path / "data.bin", "v3");
    repo.add({"data.bin"});
    CHECK(fs::exists(path / "data.bin.dvs.yaml"));
    CHECK_FALSE(fs::exists(path / "data.bin.dvs"));
    CHECK(dvs::MetadataRecord::load(path / "data.bin.dvs.yaml").size == 2);

    cleanup(path);
}

TEST_CASE("Add: extra hashes from the config are recorded", "[add]") {
    auto path = make_temp_repo();
    init_repo(path);

    auto cfg = dvs::Config::load(path / "dvs.yaml");
    cfg.extra_hashes = {dvs::HashAlgo::Md5};
    cfg.save(path / "dvs.yaml");

    dvs::OpenOptions open_opts;
    open_opts.actor = "tester";
    auto repo = dvs::Repository::open(path, open_opts);

    write_file(path / "data.csv", "abc");
    auto results = repo.add({"data.csv"});
    REQUIRE(results[0].ok());

    auto rec = dvs::MetadataRecord::load(path / "data.csv.dvs");
    REQUIRE(rec.hashes.size() == 2);
    CHECK(rec.hashes.at(dvs::HashAlgo::Md5) == "900150983cd24fb0d6963f7d28e17f72");
    CHECK(rec.oid().algo == dvs::HashAlgo::Sha256);

    cleanup(path);
}

// ---------------------------------------------------------------------------
// git ignore rules
// ---------------------------------------------------------------------------

TEST_CASE("Add: git-ignored files are skipped by globs unless tracked", "[add][git]") {
    auto path = make_temp_repo();
    // minimal non-bare git repository
    fs::create_directories(path / ".git" / "objects");
    fs::create_directories(path / ".git" / "refs" / "heads");
    write_file(path / ".git" / "HEAD", "ref: refs/heads/main\n");
    write_file(path / ".git" / "config",
               "[core]\n\trepositoryformatversion = 0\n\tbare = false\n");
    write_file(path / ".gitignore", "*.log\n");

    auto repo = init_repo(path);
    write_file(path / "run.log", "log line");
    write_file(path / "data.csv", "data");

    CHECK(repo.is_ignored("run.log"));
    CHECK_FALSE(repo.is_ignored("data.csv"));

    auto results = repo.add({"*.csv", "*.log"});
    REQUIRE(results.size() == 1);
    CHECK(*results[0].relative == "data.csv");

    // literal paths bypass ignore rules; once tracked, globs see the file
    auto literal = repo.add({"run.log"});
    REQUIRE(literal.size() == 1);
    CHECK(literal[0].is(dvs::Outcome::Copied));

    auto tracked = repo.add({"*.log"});
    REQUIRE(tracked.size() == 1);
    CHECK(tracked[0].is(dvs::Outcome::Present));

    cleanup(path);
}

#ifndef _WIN32
TEST_CASE("Add: the repository lock file names its last holder", "[add][lock]") {
    auto path = make_temp_repo();
    auto repo = init_repo(path);
    write_file(path / "data.csv", "x");
    repo.add({"data.csv"});

    std::ifstream in(repo.layout().locks_dir() / "repo.lock");
    std::string pid;
    REQUIRE(in >> pid);
    CHECK(pid == std::to_string(::getpid()));

    cleanup(path);
}
#endif
