#include <catch2/catch.hpp>
#include <dvs/dvs.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

namespace fs = std::filesystem;

static fs::path make_temp_dir() {
    auto tmp = fs::temp_directory_path() /
               ("dvs_reflog_" + std::to_string(
                    std::hash<std::thread::id>{}(std::this_thread::get_id())
                    ^ static_cast<size_t>(
                          std::chrono::steady_clock::now()
                              .time_since_epoch()
                              .count())));
    fs::create_directories(tmp);
    return tmp;
}

static std::string fake_id(char c) {
    return std::string(64, c);
}

// ---------------------------------------------------------------------------
// Reflog
// ---------------------------------------------------------------------------

TEST_CASE("Reflog: empty log", "[reflog]") {
    auto dir = make_temp_dir();
    dvs::Layout layout(dir);
    dvs::Reflog reflog(layout);

    CHECK(reflog.read_all().empty());
    CHECK_FALSE(reflog.read_head().has_value());
    CHECK_FALSE(reflog.get_by_index(0).has_value());

    fs::remove_all(dir);
}

TEST_CASE("Reflog: entries are recent-first and HEAD follows the last one", "[reflog]") {
    auto dir = make_temp_dir();
    dvs::Layout layout(dir);
    layout.init();
    dvs::Reflog reflog(layout);

    reflog.record("alice", dvs::ReflogOp::Init, std::string("initialized"),
                  std::nullopt, fake_id('a'), {});
    reflog.record("alice", dvs::ReflogOp::Add, std::string("first"),
                  fake_id('a'), fake_id('b'), {"x.csv"});
    reflog.record("bob", dvs::ReflogOp::Add, std::nullopt,
                  fake_id('b'), fake_id('c'), {"y.csv", "z.csv"});

    auto all = reflog.read_all();
    REQUIRE(all.size() == 3);
    CHECK(all[0].op == dvs::ReflogOp::Init);
    CHECK_FALSE(all[0].old_state.has_value());

    auto recent = reflog.read_recent();
    REQUIRE(recent.size() == 3);
    CHECK(recent[0].actor == "bob");
    CHECK(recent[0].new_state == "state:" + fake_id('c'));
    CHECK(recent[0].paths == std::vector<std::string>{"y.csv", "z.csv"});
    CHECK_FALSE(recent[0].message.has_value());

    auto second = reflog.get_by_index(1);
    REQUIRE(second.has_value());
    CHECK(second->message == std::optional<std::string>("first"));
    REQUIRE(second->old_state.has_value());
    CHECK(*second->old_state == "state:" + fake_id('a'));

    CHECK(reflog.recent(2).size() == 2);
    CHECK(reflog.recent(10).size() == 3);

    REQUIRE(reflog.read_head().has_value());
    CHECK(*reflog.read_head() == fake_id('c'));

    fs::remove_all(dir);
}

TEST_CASE("Reflog: entries are one JSON object per line", "[reflog]") {
    auto dir = make_temp_dir();
    dvs::Layout layout(dir);
    layout.init();
    dvs::Reflog reflog(layout);

    reflog.record("alice", dvs::ReflogOp::Rollback, std::string("back"),
                  fake_id('1'), fake_id('2'), {"p"});

    std::ifstream in(layout.head_log_path());
    std::string line;
    REQUIRE(std::getline(in, line));
    CHECK(line.find('\n') == std::string::npos);

    auto e = dvs::Reflog::from_json_line(line, "test");
    CHECK(e.op == dvs::ReflogOp::Rollback);
    CHECK(e.actor == "alice");
    CHECK(dvs::ReflogEntry::parse_state_id(e.new_state) == std::optional<std::string>(fake_id('2')));

    fs::remove_all(dir);
}

TEST_CASE("Reflog: a corrupt line raises ParseError", "[reflog]") {
    auto dir = make_temp_dir();
    dvs::Layout layout(dir);
    layout.init();
    std::ofstream(layout.head_log_path()) << "{\"ts\": 1\n";

    dvs::Reflog reflog(layout);
    CHECK_THROWS_AS(reflog.read_all(), dvs::ParseError);

    fs::remove_all(dir);
}

TEST_CASE("Reflog: HEAD is not moved when the log append fails", "[reflog]") {
    auto dir = make_temp_dir();
    dvs::Layout layout(dir);
    layout.init();
    dvs::Reflog reflog(layout);
    reflog.record("alice", dvs::ReflogOp::Init, std::nullopt,
                  std::nullopt, fake_id('a'), {});

    // a directory in place of the log file makes the append fail
    fs::rename(layout.head_log_path(), dir / "saved-log");
    fs::create_directories(layout.head_log_path());

    CHECK_THROWS_AS(reflog.record("alice", dvs::ReflogOp::Add, std::nullopt,
                                  fake_id('a'), fake_id('b'), {"x"}),
                    dvs::IoError);
    REQUIRE(reflog.read_head().has_value());
    CHECK(*reflog.read_head() == fake_id('a'));

    fs::remove_all(dir);
}

TEST_CASE("Reflog: state references", "[reflog]") {
    CHECK(dvs::ReflogEntry::state_ref("abc") == "state:abc");
    CHECK(dvs::ReflogEntry::parse_state_id("state:abc") == std::optional<std::string>("abc"));
    CHECK_FALSE(dvs::ReflogEntry::parse_state_id("abc").has_value());
}

// ---------------------------------------------------------------------------
// Snapshots
// ---------------------------------------------------------------------------

TEST_CASE("Snapshot: save is content-addressed and idempotent", "[reflog][snapshot]") {
    auto dir = make_temp_dir();
    dvs::Layout layout(dir);
    layout.init();
    dvs::SnapshotStore snapshots(layout);

    dvs::WorkspaceState state;
    state.manifest = dvs::Manifest();
    state.manifest->upsert({"a.txt",
                            dvs::Oid::make(dvs::HashAlgo::Fnv1a64, "cbf29ce484222325"), 0});

    auto id  = snapshots.save(state);
    auto id2 = snapshots.save(state);
    CHECK(id == id2);
    CHECK(id.size() == 64);
    CHECK(id == state.id());
    CHECK(snapshots.exists(id));
    CHECK(snapshots.list().size() == 1);

    auto back = snapshots.load(id);
    CHECK(back.id() == id);
    REQUIRE(back.manifest.has_value());
    CHECK(back.manifest->size() == 1);

    fs::remove_all(dir);
}

TEST_CASE("Snapshot: unknown ids", "[reflog][snapshot]") {
    auto dir = make_temp_dir();
    dvs::Layout layout(dir);
    layout.init();
    dvs::SnapshotStore snapshots(layout);

    CHECK_FALSE(snapshots.exists(fake_id('f')));
    CHECK_FALSE(snapshots.exists("../../etc/passwd"));
    CHECK_THROWS_AS(snapshots.load(fake_id('f')), dvs::NotFoundError);

    fs::remove_all(dir);
}

TEST_CASE("Snapshot: empty and non-empty states differ", "[reflog][snapshot]") {
    dvs::WorkspaceState empty;
    CHECK(empty.is_empty());

    dvs::WorkspaceState with_manifest;
    with_manifest.manifest = dvs::Manifest();
    CHECK_FALSE(with_manifest.is_empty());
    CHECK(empty.id() != with_manifest.id());
}
