#include <catch2/catch_test_macros.hpp>
#include <memory>
#include "hpkvfs/fs/filesystem.hpp"
#include "hpkvfs/storage/memorystore.hpp"
#include "test_helpers.hpp"

using namespace hpkvfs;
using namespace hpkvfs::fs;
using hpkvfs::testing::FixedClock;
using hpkvfs::testing::ToBytes;

namespace {

FileSystemOptions testOptions(std::shared_ptr<int64_t> now) {
    FileSystemOptions options;
    options.identity = Identity{501, 20};
    options.clock = FixedClock(now);
    options.deleteConcurrency = 2;
    return options;
}

} // namespace

TEST_CASE("FileSystem - mkdir", "[filesystem]") {
    auto store = std::make_shared<storage::MemoryStore>();
    auto now = std::make_shared<int64_t>(1700000000);
    FileSystem filesystem(store, testOptions(now));

    SECTION("Creates a directory record with the injected identity") {
        auto created = filesystem.Mkdir("/docs");
        REQUIRE(created.ok());
        REQUIRE(created.value());

        auto meta = filesystem.Stat("/docs");
        REQUIRE(meta.ok());
        REQUIRE(meta.value().mode == DEFAULT_DIR_MODE);
        REQUIRE(meta.value().uid == 501);
        REQUIRE(meta.value().gid == 20);
        REQUIRE(meta.value().ctime == 1700000000);
        REQUIRE_FALSE(meta.value().hasNumChunks);
    }

    SECTION("Is idempotent for directories") {
        REQUIRE(filesystem.Mkdir("/docs").value());
        *now += 50;
        auto again = filesystem.Mkdir("/docs");
        REQUIRE(again.ok());
        REQUIRE_FALSE(again.value());
        REQUIRE(filesystem.Stat("/docs").value().ctime == 1700000000);
    }

    SECTION("Conflicts with an existing file") {
        REQUIRE(filesystem.Write("/file", 0, ToBytes("x")).ok());
        REQUIRE(filesystem.Mkdir("/file").error().is(ErrorCode::Conflict));
    }

    SECTION("Rejects root and malformed paths") {
        REQUIRE(filesystem.Mkdir("/").error().is(ErrorCode::InvalidArgument));
        REQUIRE(filesystem.Mkdir("/docs/").error().is(ErrorCode::InvalidArgument));
        REQUIRE(filesystem.Mkdir("docs").error().is(ErrorCode::InvalidArgument));
        REQUIRE(store->Size() == 0);
    }
}

TEST_CASE("FileSystem - root directory", "[filesystem]") {
    auto store = std::make_shared<storage::MemoryStore>();
    auto now = std::make_shared<int64_t>(42);
    FileSystem filesystem(store, testOptions(now));

    SECTION("Stat of root without a record is synthesized") {
        auto meta = filesystem.Stat("/");
        REQUIRE(meta.ok());
        REQUIRE(meta.value().IsDirectory());
        REQUIRE(store->Size() == 0);
    }

    SECTION("EnsureRoot writes the record once") {
        REQUIRE(filesystem.EnsureRoot().ok());
        REQUIRE(store->Contains(ROOT_METADATA_KEY));
        *now = 99;
        REQUIRE(filesystem.EnsureRoot().ok());
        REQUIRE(filesystem.Stat("/").value().ctime == 42);
    }

    SECTION("Root cannot be written, read or deleted") {
        REQUIRE(filesystem.Write("/", 0, ToBytes("x")).error().is(ErrorCode::IsADirectory));
        REQUIRE(filesystem.Read("/", 0, 1).error().is(ErrorCode::IsADirectory));
        REQUIRE(filesystem.Delete("/").is(ErrorCode::InvalidArgument));
    }
}

TEST_CASE("FileSystem - end to end", "[filesystem]") {
    auto store = std::make_shared<storage::MemoryStore>(3);
    auto now = std::make_shared<int64_t>(10);
    FileSystem filesystem(store, testOptions(now));

    REQUIRE(filesystem.EnsureRoot().ok());
    REQUIRE(filesystem.Mkdir("/projects").value());
    REQUIRE(filesystem.Write("/projects/readme.md", 0, ToBytes("# hello\n")).value() == 8);
    REQUIRE(filesystem.Mkdir("/projects/empty").value());

    auto rootEntries = filesystem.List("/");
    REQUIRE(rootEntries.value() == std::vector<DirEntry>{{"projects", true}});

    auto entries = filesystem.List("/projects");
    REQUIRE(entries.value() == std::vector<DirEntry>{{"empty", true}, {"readme.md", false}});

    REQUIRE(filesystem.Read("/projects/readme.md", 2, 5).value() == ToBytes("hello"));

    REQUIRE(filesystem.Delete("/projects").is(ErrorCode::DirectoryNotEmpty));
    REQUIRE(filesystem.Delete("/projects/readme.md").ok());
    REQUIRE(filesystem.Delete("/projects/empty").ok());
    REQUIRE(filesystem.Delete("/projects").ok());

    REQUIRE(filesystem.List("/").value().empty());
    REQUIRE(store->Keys() == std::vector<std::string>{ROOT_METADATA_KEY});
}

TEST_CASE("FileSystem - invalid paths are rejected before touching the store", "[filesystem]") {
    auto store = std::make_shared<hpkvfs::testing::FaultyStore>();
    FileSystem filesystem(store);

    REQUIRE(filesystem.Stat("/a/../b").error().is(ErrorCode::InvalidArgument));
    REQUIRE(filesystem.Write("/x.chunk0", 0, ToBytes("x")).error().is(ErrorCode::InvalidArgument));
    REQUIRE(filesystem.Read("/a//b", 0, 1).error().is(ErrorCode::InvalidArgument));
    REQUIRE(filesystem.List("/a/").error().is(ErrorCode::InvalidArgument));
    REQUIRE(filesystem.Delete("/y.__meta__").is(ErrorCode::InvalidArgument));
    REQUIRE(store->sets.load() == 0);
    REQUIRE(store->removes.load() == 0);
    REQUIRE(store->lists.load() == 0);
}
