#include <catch2/catch.hpp>
#include <dvs/dvs.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>

namespace fs = std::filesystem;

static fs::path make_temp_dir() {
    auto tmp = fs::temp_directory_path() /
               ("dvs_storage_" + std::to_string(
                    std::hash<std::thread::id>{}(std::this_thread::get_id())
                    ^ static_cast<size_t>(
                          std::chrono::steady_clock::now()
                              .time_since_epoch()
                              .count())));
    fs::create_directories(tmp);
    return tmp;
}

static void write_file(const fs::path& p, const std::string& content) {
    std::ofstream(p, std::ios::binary) << content;
}

static std::string read_file(const fs::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

// ---------------------------------------------------------------------------
// LocalStorage
// ---------------------------------------------------------------------------

TEST_CASE("Storage: store places the object under algo/prefix/rest", "[storage]") {
    auto dir = make_temp_dir();
    write_file(dir / "src.bin", "hello storage");

    dvs::LocalStorage storage(dir / "objects");
    auto oid = dvs::hash_file_oid(dir / "src.bin", dvs::HashAlgo::Sha256);

    CHECK_FALSE(storage.exists(oid));
    storage.store(oid, dir / "src.bin");
    CHECK(storage.exists(oid));

    auto expected = dir / "objects" / "sha256" / oid.hex.substr(0, 2) / oid.hex.substr(2);
    CHECK(storage.object_path(oid) == expected);
    CHECK(read_file(expected) == "hello storage");

    fs::remove_all(dir);
}

TEST_CASE("Storage: storing the same oid twice is idempotent", "[storage]") {
    auto dir = make_temp_dir();
    write_file(dir / "src.bin", "same bytes");

    dvs::LocalStorage storage(dir / "objects");
    auto oid = dvs::hash_file_oid(dir / "src.bin", dvs::HashAlgo::Md5);
    storage.store(oid, dir / "src.bin");
    storage.store(oid, dir / "src.bin");

    size_t files = 0;
    for (const auto& e : fs::recursive_directory_iterator(dir / "objects")) {
        if (e.is_regular_file()) ++files;
    }
    CHECK(files == 1);

    fs::remove_all(dir);
}

TEST_CASE("Storage: read and retrieve return the stored bytes", "[storage]") {
    auto dir = make_temp_dir();
    std::string payload = "line one\nline two\n";
    std::vector<uint8_t> bytes(payload.begin(), payload.end());

    dvs::LocalStorage storage(dir / "objects");
    auto oid = dvs::Oid::make(dvs::HashAlgo::Fnv1a64,
                              dvs::hash_bytes(payload, dvs::HashAlgo::Fnv1a64));
    storage.store_bytes(oid, bytes);

    auto read = storage.read(oid);
    REQUIRE(read.has_value());
    CHECK(*read == bytes);

    storage.retrieve(oid, dir / "out" / "copy.txt");
    CHECK(read_file(dir / "out" / "copy.txt") == payload);

    fs::remove_all(dir);
}

TEST_CASE("Storage: missing objects", "[storage]") {
    auto dir = make_temp_dir();
    dvs::LocalStorage storage(dir / "objects");
    auto oid = dvs::Oid::make(dvs::HashAlgo::Fnv1a64, "cbf29ce484222325");

    CHECK_FALSE(storage.read(oid).has_value());
    CHECK_THROWS_AS(storage.retrieve(oid, dir / "out.txt"), dvs::NotFoundError);
    CHECK_FALSE(storage.remove(oid));

    fs::remove_all(dir);
}

TEST_CASE("Storage: remove deletes an object", "[storage]") {
    auto dir = make_temp_dir();
    dvs::LocalStorage storage(dir / "objects");
    auto oid = dvs::Oid::make(dvs::HashAlgo::Fnv1a64,
                              dvs::hash_bytes(std::string("x"), dvs::HashAlgo::Fnv1a64));
    storage.store_bytes(oid, {'x'});

    CHECK(storage.remove(oid));
    CHECK_FALSE(storage.exists(oid));

    fs::remove_all(dir);
}

#ifndef _WIN32
TEST_CASE("Storage: configured permissions are applied to new objects", "[storage]") {
    auto dir = make_temp_dir();
    write_file(dir / "src.bin", "perm");

    dvs::LocalStorage storage(dir / "objects", 0640);
    auto oid = dvs::hash_file_oid(dir / "src.bin", dvs::HashAlgo::Sha256);
    storage.store(oid, dir / "src.bin");

    auto perms = fs::status(storage.object_path(oid)).permissions();
    CHECK((perms & fs::perms::all) ==
          (fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read));

    fs::remove_all(dir);
}
#endif

TEST_CASE("Storage: hash re-digests the stored object", "[storage]") {
    auto dir = make_temp_dir();
    write_file(dir / "src.bin", "hash me");

    dvs::LocalStorage storage(dir / "objects");
    auto oid = dvs::hash_file_oid(dir / "src.bin", dvs::HashAlgo::Sha256);
    CHECK_FALSE(storage.hash(oid).has_value());

    storage.store(oid, dir / "src.bin");
    auto good = storage.hash(oid);
    REQUIRE(good.has_value());
    CHECK(good->first == oid.hex);
    CHECK(good->second == 7);

    write_file(storage.object_path(oid), "tampered!");
    auto bad = storage.hash(oid);
    REQUIRE(bad.has_value());
    CHECK(bad->first != oid.hex);
    CHECK(bad->second == 9);

    fs::remove_all(dir);
}
