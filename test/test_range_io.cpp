#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <memory>
#include <string>
#include "hpkvfs/fs/range_writer.hpp"
#include "hpkvfs/fs/range_reader.hpp"
#include "hpkvfs/storage/memorystore.hpp"
#include "test_helpers.hpp"

using namespace hpkvfs;
using namespace hpkvfs::fs;
using hpkvfs::testing::FaultyStore;
using hpkvfs::testing::FixedClock;
using hpkvfs::testing::PatternBytes;
using hpkvfs::testing::ToBytes;

namespace {

struct RangeFixture {
    storage::MemoryStore store;
    MetadataStore metadata{store};
    ChunkStore chunks{store};
    std::shared_ptr<int64_t> now = std::make_shared<int64_t>(1000);
    RangeWriter writer{metadata, chunks, FixedClock(now)};
    RangeReader reader{metadata, chunks};
};

} // namespace

TEST_CASE("RangeWriter/RangeReader - round trip", "[rangeio]") {
    RangeFixture f;

    for (size_t length : {size_t(0), size_t(1), size_t(2999), size_t(3000), size_t(3001),
                          size_t(7500), size_t(30000)}) {
        INFO("length " << length);
        std::string path = "/rt" + std::to_string(length);
        Bytes data = PatternBytes(length, static_cast<uint8_t>(length));

        auto written = f.writer.Write(path, 0, data);
        REQUIRE(written.ok());
        REQUIRE(written.value() == static_cast<int64_t>(length));

        auto read = f.reader.Read(path, 0, static_cast<int64_t>(length));
        REQUIRE(read.ok());
        REQUIRE(read.value() == data);

        auto meta = f.metadata.Get(path);
        REQUIRE(meta.ok());
        REQUIRE(meta.value().size == static_cast<int64_t>(length));
        REQUIRE(meta.value().numChunks == ChunkCountForSize(static_cast<int64_t>(length)));
    }
}

TEST_CASE("RangeWriter - chunk boundary exactness", "[rangeio]") {
    RangeFixture f;
    const int64_t k = 3;
    Bytes data(static_cast<size_t>(k * MAX_CHUNK_SIZE), 'z');

    REQUIRE(f.writer.Write("/exact", 0, data).ok());

    for (int64_t i = 0; i < k; ++i) {
        auto chunk = f.chunks.Get("/exact", i);
        REQUIRE(chunk.ok());
        REQUIRE(chunk.value().has_value());
        REQUIRE(static_cast<int64_t>(chunk.value()->size()) == MAX_CHUNK_SIZE);
    }
    REQUIRE_FALSE(f.store.Contains("/exact.chunk3"));
    REQUIRE(f.metadata.Get("/exact").value().numChunks == k);
}

TEST_CASE("RangeWriter - partial overwrite preserves other bytes", "[rangeio]") {
    RangeFixture f;
    Bytes original(static_cast<size_t>(2 * MAX_CHUNK_SIZE), 'A');
    REQUIRE(f.writer.Write("/p", 0, original).ok());

    REQUIRE(f.writer.Write("/p", MAX_CHUNK_SIZE - 1, ToBytes("XYZ")).value() == 3);

    auto read = f.reader.Read("/p", 0, 2 * MAX_CHUNK_SIZE);
    REQUIRE(read.ok());
    Bytes expected = original;
    expected[MAX_CHUNK_SIZE - 1] = 'X';
    expected[MAX_CHUNK_SIZE] = 'Y';
    expected[MAX_CHUNK_SIZE + 1] = 'Z';
    REQUIRE(read.value() == expected);
    REQUIRE(f.metadata.Get("/p").value().size == 2 * MAX_CHUNK_SIZE);
}

TEST_CASE("RangeWriter - sparse writes", "[rangeio]") {
    RangeFixture f;

    SECTION("Writing past the end leaves a zero-filled hole") {
        REQUIRE(f.writer.Write("/s", 0, ToBytes("head")).ok());
        const int64_t far = 3 * MAX_CHUNK_SIZE + 10;
        REQUIRE(f.writer.Write("/s", far, ToBytes("tail")).ok());

        // 中间分块未写入
        REQUIRE_FALSE(f.store.Contains("/s.chunk1"));
        REQUIRE_FALSE(f.store.Contains("/s.chunk2"));

        auto meta = f.metadata.Get("/s");
        REQUIRE(meta.value().size == far + 4);

        auto read = f.reader.Read("/s", 0, far + 4);
        REQUIRE(read.ok());
        REQUIRE(read.value().size() == static_cast<size_t>(far + 4));
        Bytes expected(static_cast<size_t>(far + 4), 0);
        const std::string head = "head";
        const std::string tail = "tail";
        std::copy(head.begin(), head.end(), expected.begin());
        std::copy(tail.begin(), tail.end(), expected.begin() + far);
        REQUIRE(read.value() == expected);
    }

    SECTION("Reading a region with no chunks returns zeros") {
        REQUIRE(f.writer.Write("/hole", 2 * MAX_CHUNK_SIZE, ToBytes("x")).ok());
        auto read = f.reader.Read("/hole", 100, 500);
        REQUIRE(read.ok());
        REQUIRE(read.value() == Bytes(500, 0));
    }

    SECTION("Short existing chunk is padded before the write window") {
        REQUIRE(f.writer.Write("/short", 0, ToBytes("ab")).ok());
        REQUIRE(f.writer.Write("/short", 10, ToBytes("cd")).ok());
        auto chunk = f.chunks.Get("/short", 0);
        REQUIRE(chunk.value()->size() == 12);
        Bytes expected{'a', 'b', 0, 0, 0, 0, 0, 0, 0, 0, 'c', 'd'};
        REQUIRE(*chunk.value() == expected);
    }
}

TEST_CASE("RangeWriter - metadata updates", "[rangeio]") {
    RangeFixture f;

    SECTION("New file gets timestamps from the clock") {
        *f.now = 2000;
        REQUIRE(f.writer.Write("/t", 0, ToBytes("abc")).ok());
        auto meta = f.metadata.Get("/t").value();
        REQUIRE(meta.ctime == 2000);
        REQUIRE(meta.mtime == 2000);
        REQUIRE(meta.mode == DEFAULT_FILE_MODE);

        *f.now = 3000;
        REQUIRE(f.writer.Write("/t", 1, ToBytes("z")).ok());
        meta = f.metadata.Get("/t").value();
        REQUIRE(meta.ctime == 2000);
        REQUIRE(meta.mtime == 3000);
        REQUIRE(meta.atime == 3000);
        REQUIRE(meta.size == 3);
    }

    SECTION("Size never shrinks") {
        REQUIRE(f.writer.Write("/grow", 0, Bytes(100, 'a')).ok());
        REQUIRE(f.writer.Write("/grow", 10, Bytes(5, 'b')).ok());
        REQUIRE(f.metadata.Get("/grow").value().size == 100);
    }

    SECTION("Zero-length write creates an empty file") {
        auto written = f.writer.Write("/empty", 0, Bytes());
        REQUIRE(written.ok());
        REQUIRE(written.value() == 0);
        auto meta = f.metadata.Get("/empty");
        REQUIRE(meta.ok());
        REQUIRE(meta.value().size == 0);
        REQUIRE(f.store.Size() == 1);
    }

    SECTION("Existing owner is preserved") {
        Metadata custom = Metadata::NewFile(Identity{5, 6}, 1);
        REQUIRE(f.metadata.Put("/owned", custom).ok());
        REQUIRE(f.writer.Write("/owned", 0, ToBytes("x")).ok());
        auto meta = f.metadata.Get("/owned").value();
        REQUIRE(meta.uid == 5);
        REQUIRE(meta.gid == 6);
    }
}

TEST_CASE("RangeWriter/RangeReader - argument and type errors", "[rangeio]") {
    RangeFixture f;
    REQUIRE(f.metadata.Put("/dir", Metadata::NewDirectory(Identity(), 1)).ok());
    REQUIRE(f.writer.Write("/file", 0, ToBytes("0123456789")).ok());

    SECTION("Writing to a directory") {
        REQUIRE(f.writer.Write("/dir", 0, ToBytes("x")).error().is(ErrorCode::IsADirectory));
    }

    SECTION("Reading a directory") {
        REQUIRE(f.reader.Read("/dir", 0, 1).error().is(ErrorCode::IsADirectory));
    }

    SECTION("Negative offset or size") {
        REQUIRE(f.writer.Write("/file", -1, ToBytes("x")).error().is(ErrorCode::InvalidArgument));
        REQUIRE(f.reader.Read("/file", -1, 1).error().is(ErrorCode::InvalidArgument));
        REQUIRE(f.reader.Read("/file", 0, -1).error().is(ErrorCode::InvalidArgument));
    }

    SECTION("Reading a missing file") {
        REQUIRE(f.reader.Read("/missing", 0, 1).error().is(ErrorCode::NotFound));
    }

    SECTION("Reads are clipped to the file size") {
        REQUIRE(f.reader.Read("/file", 5, 100).value() == ToBytes("56789"));
        REQUIRE(f.reader.Read("/file", 10, 5).value().empty());
        REQUIRE(f.reader.Read("/file", 50, 5).value().empty());
        REQUIRE(f.reader.Read("/file", 0, 0).value().empty());
    }
}

TEST_CASE("RangeWriter - store failures", "[rangeio]") {
    FaultyStore store;
    MetadataStore metadata(store);
    ChunkStore chunks(store);
    RangeWriter writer(metadata, chunks);
    RangeReader reader(metadata, chunks);

    SECTION("Chunk write failure aborts before metadata") {
        store.FailSet("/f.chunk1");
        auto result = writer.Write("/f", 0, Bytes(static_cast<size_t>(MAX_CHUNK_SIZE + 5), 'q'));
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().is(ErrorCode::StoreError));
        REQUIRE(store.Inner().Contains("/f.chunk0"));
        REQUIRE_FALSE(store.Inner().Contains("/f.__meta__"));
    }

    SECTION("Metadata write failure is reported after chunks") {
        store.FailSet("/g.__meta__");
        auto result = writer.Write("/g", 0, ToBytes("data"));
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().what().find("Chunks written but metadata update failed") != std::string::npos);
        REQUIRE(result.error().upstreamStatus() == 503);
        REQUIRE(store.Inner().Contains("/g.chunk0"));
    }

    SECTION("Chunk read failure is not treated as a hole") {
        REQUIRE(writer.Write("/h", 0, ToBytes("hello")).ok());
        store.FailGet("/h.chunk0");
        REQUIRE(reader.Read("/h", 0, 5).error().is(ErrorCode::StoreError));
    }
}
