#include <catch2/catch_test_macros.hpp>
#include "hpkvfs/fs/directory_lister.hpp"
#include "hpkvfs/fs/chunk_store.hpp"
#include "hpkvfs/storage/memorystore.hpp"
#include "test_helpers.hpp"

using namespace hpkvfs;
using namespace hpkvfs::fs;
using hpkvfs::testing::FaultyStore;
using hpkvfs::testing::ToBytes;

namespace {

void putFile(MetadataStore& metadata, const std::string& path) {
    REQUIRE(metadata.Put(path, Metadata::NewFile(Identity(), 1)).ok());
}

void putDir(MetadataStore& metadata, const std::string& path) {
    REQUIRE(metadata.Put(path, Metadata::NewDirectory(Identity(), 1)).ok());
}

// 按给定顺序返回键的存储，值读写交给MemoryStore
class ScriptedListStore : public storage::KVStore {
public:
    explicit ScriptedListStore(std::vector<std::string> keys) : keys_(std::move(keys)) {}

    Result<Bytes> Get(const std::string& key) override { return inner_.Get(key); }
    Error Set(const std::string& key, const Bytes& value) override { return inner_.Set(key, value); }
    Error Remove(const std::string& key) override { return inner_.Remove(key); }

    Result<storage::ListPage> List(const std::string& prefix, const std::string&,
                                   const std::string&) override {
        storage::ListPage page;
        for (const auto& key : keys_) {
            if (key.compare(0, prefix.size(), prefix) == 0) {
                page.keys.push_back(key);
            }
        }
        return Result<storage::ListPage>(std::move(page));
    }

    std::string Location() const override { return "scripted"; }

private:
    std::vector<std::string> keys_;
    storage::MemoryStore inner_;
};

} // namespace

TEST_CASE("DirectoryLister - distinct entries", "[lister]") {
    storage::MemoryStore store;
    MetadataStore metadata(store);
    putDir(metadata, "/a");
    putFile(metadata, "/a/x");
    putFile(metadata, "/a/y/z");

    SECTION("Direct file and implied directory") {
        DirectoryLister lister(store, metadata);
        auto entries = lister.List("/a");
        REQUIRE(entries.ok());
        REQUIRE(entries.value() == std::vector<DirEntry>{{"x", false}, {"y", true}});
    }

    SECTION("Lazy mode gives the same answer for this layout") {
        DirectoryLister lister(store, metadata, ListOptions{false});
        auto entries = lister.List("/a");
        REQUIRE(entries.ok());
        REQUIRE(entries.value() == std::vector<DirEntry>{{"x", false}, {"y", true}});
    }
}

TEST_CASE("DirectoryLister - result does not depend on key order", "[lister]") {
    const std::vector<std::vector<std::string>> orders = {
        {"/a/y/z.__meta__", "/a/x.__meta__"},
        {"/a/x.__meta__", "/a/y/z.__meta__"},
        {"/a/y/z.__meta__", "/a/x.chunk0", "/a/y.__meta__", "/a/x.__meta__"},
        {"/a/x.__meta__", "/a/y.__meta__", "/a/x.chunk0", "/a/y/z.__meta__"},
    };

    for (const auto& order : orders) {
        for (bool resolve : {true, false}) {
            ScriptedListStore store(order);
            MetadataStore metadata(store);
            putDir(metadata, "/a");
            putFile(metadata, "/a/x");
            putDir(metadata, "/a/y");
            putFile(metadata, "/a/y/z");

            DirectoryLister lister(store, metadata, ListOptions{resolve});
            auto entries = lister.List("/a");
            INFO("first key " << order.front() << ", resolve " << resolve);
            REQUIRE(entries.ok());
            REQUIRE(entries.value() == std::vector<DirEntry>{{"x", false}, {"y", true}});
        }
    }
}

TEST_CASE("DirectoryLister - chunk keys and duplicates", "[lister]") {
    storage::MemoryStore store;
    MetadataStore metadata(store);
    ChunkStore chunks(store);

    putFile(metadata, "/f");
    REQUIRE(chunks.Put("/f", 0, ToBytes("a")).ok());
    REQUIRE(chunks.Put("/f", 1, ToBytes("b")).ok());
    putDir(metadata, "/d");
    putFile(metadata, "/d/one");
    putFile(metadata, "/d/two");

    DirectoryLister lister(store, metadata);
    auto entries = lister.List("/");
    REQUIRE(entries.ok());
    // /d同时有元数据键和更深层的键，只出现一次
    REQUIRE(entries.value() == std::vector<DirEntry>{{"d", true}, {"f", false}});
}

TEST_CASE("DirectoryLister - resolving empty directories", "[lister]") {
    storage::MemoryStore store;
    MetadataStore metadata(store);
    putDir(metadata, "/empty");
    putFile(metadata, "/file");

    SECTION("Resolve reads child metadata") {
        DirectoryLister lister(store, metadata, ListOptions{true});
        auto entries = lister.List("/");
        REQUIRE(entries.ok());
        REQUIRE(entries.value() == std::vector<DirEntry>{{"empty", true}, {"file", false}});
    }

    SECTION("Lazy mode reports leaf entries as files") {
        DirectoryLister lister(store, metadata, ListOptions{false});
        auto entries = lister.List("/");
        REQUIRE(entries.ok());
        REQUIRE(entries.value() == std::vector<DirEntry>{{"empty", false}, {"file", false}});
    }
}

TEST_CASE("DirectoryLister - errors and edge cases", "[lister]") {
    SECTION("Listing a regular file") {
        storage::MemoryStore store;
        MetadataStore metadata(store);
        putFile(metadata, "/f");
        DirectoryLister lister(store, metadata);
        REQUIRE(lister.List("/f").error().is(ErrorCode::NotADirectory));
    }

    SECTION("Listing a path with nothing under it") {
        storage::MemoryStore store;
        MetadataStore metadata(store);
        DirectoryLister lister(store, metadata);
        auto entries = lister.List("/nothing");
        REQUIRE(entries.ok());
        REQUIRE(entries.value().empty());
    }

    SECTION("Root is listed without its own metadata key") {
        storage::MemoryStore store;
        MetadataStore metadata(store);
        putDir(metadata, "/");
        putFile(metadata, "/only");
        DirectoryLister lister(store, metadata);
        auto entries = lister.List("/");
        REQUIRE(entries.ok());
        REQUIRE(entries.value() == std::vector<DirEntry>{{"only", false}});
    }

    SECTION("Sibling with a shared name prefix is excluded") {
        storage::MemoryStore store;
        MetadataStore metadata(store);
        putDir(metadata, "/a");
        putFile(metadata, "/a/in");
        putFile(metadata, "/ab/out");
        DirectoryLister lister(store, metadata);
        REQUIRE(lister.List("/a").value() == std::vector<DirEntry>{{"in", false}});
    }

    SECTION("List failure propagates") {
        FaultyStore store;
        MetadataStore metadata(store);
        store.failList = true;
        DirectoryLister lister(store, metadata);
        REQUIRE(lister.List("/").error().is(ErrorCode::StoreError));
    }

    SECTION("Failed child lookup falls back to a file entry") {
        FaultyStore store;
        MetadataStore metadata(store);
        putDir(metadata, "/dir");
        store.FailGet("/dir.__meta__");
        DirectoryLister lister(store, metadata);
        auto entries = lister.List("/");
        REQUIRE(entries.ok());
        REQUIRE(entries.value() == std::vector<DirEntry>{{"dir", false}});
    }
}

TEST_CASE("DirectoryLister - follows pagination", "[lister]") {
    storage::MemoryStore store(2);
    MetadataStore metadata(store);
    ChunkStore chunks(store);
    std::vector<DirEntry> expected;
    for (int i = 0; i < 7; ++i) {
        std::string name = "file" + std::to_string(i);
        putFile(metadata, "/big/" + name);
        REQUIRE(chunks.Put("/big/" + name, 0, ToBytes("x")).ok());
        expected.push_back(DirEntry{name, false});
    }
    putFile(metadata, "/big/sub/deep");
    expected.push_back(DirEntry{"sub", true});

    DirectoryLister lister(store, metadata);
    auto entries = lister.List("/big");
    REQUIRE(entries.ok());
    REQUIRE(entries.value() == expected);
}
