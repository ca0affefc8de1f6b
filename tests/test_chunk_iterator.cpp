#include <gtest/gtest.h>
#include "grid/chunk_iterator.hpp"
#include "grid/chunked_reader.hpp"
#include "grid/chunked_writer.hpp"
#include "test_util.hpp"

using namespace gridlite;
using gridlite::test::to_bytes;
using gridlite::test::to_str;

namespace {

    class IteratorTest : public gridlite::test::StoreTest {
    protected:
        void SetUp() override {
            StoreTest::SetUp();

            WriteOptions opts;
            opts.id = "hw";
            opts.chunk_size = 4;
            ChunkedWriter w(db, std::move(opts));
            ASSERT_TRUE(w.init());
            ASSERT_TRUE(w.write("hello world"));
            ASSERT_TRUE(w.close());
        }
    };

} // namespace

TEST_F(IteratorTest, YieldsChunksInOrder) {
    ChunkIterator it(db, "hw", 11, 4);
    EXPECT_EQ(it.chunk_count(), 3);

    std::vector<std::string> seen;
    while (it.has_next()) {
        auto data = it.next();
        ASSERT_TRUE(data);
        seen.push_back(to_str(*data));
    }
    EXPECT_EQ(seen, (std::vector<std::string>{"hell", "o wo", "rld"}));
    EXPECT_EQ(it.current(), 3);
}

TEST_F(IteratorTest, ExhaustedIteratorFails) {
    ChunkIterator it(db, "hw", 4, 4);
    ASSERT_TRUE(it.next());
    EXPECT_FALSE(it.has_next());

    auto res = it.next();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgument);
}

TEST_F(IteratorTest, EmptyFileHasNoChunks) {
    ChunkIterator it(db, "none", 0, 4);
    EXPECT_FALSE(it.has_next());
    EXPECT_EQ(it.chunk_count(), 0);
}

TEST_F(IteratorTest, MissingChunkIsCorrupt) {
    ASSERT_TRUE(db.insert_chunk({"holey", 0, to_bytes("abcd")}));
    ASSERT_TRUE(db.insert_chunk({"holey", 2, to_bytes("ij")}));

    ChunkIterator it(db, "holey", 10, 4);
    ASSERT_TRUE(it.next());

    auto res = it.next();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::CorruptGridFile);
    EXPECT_EQ(res.error().message, "no chunk #1");
}

TEST_F(IteratorTest, ReaderChunksIgnoreCursor) {
    ChunkedReader r(db, "hw");
    ASSERT_TRUE(r.read(6));

    auto it = r.chunks();
    ASSERT_TRUE(it);
    auto first = it->next();
    ASSERT_TRUE(first);
    EXPECT_EQ(to_str(*first), "hell");
    EXPECT_EQ(r.tell(), 6);
}
