#include <gtest/gtest.h>
#include <string>
#include "grid/chunk_codec.hpp"

using namespace gridlite;

TEST(ChunkCodec, ChunkCountRoundsUp) {
    EXPECT_EQ(codec::chunk_count(0, 4), 0);
    EXPECT_EQ(codec::chunk_count(1, 4), 1);
    EXPECT_EQ(codec::chunk_count(4, 4), 1);
    EXPECT_EQ(codec::chunk_count(11, 4), 3);
    EXPECT_EQ(codec::chunk_count(12, 4), 3);
    EXPECT_EQ(codec::chunk_count(13, 4), 4);
    EXPECT_EQ(codec::chunk_count(10, 0), 0);
}

TEST(ChunkCodec, IndexAndOffset) {
    EXPECT_EQ(codec::chunk_index(0, 4), 0);
    EXPECT_EQ(codec::chunk_index(3, 4), 0);
    EXPECT_EQ(codec::chunk_index(4, 4), 1);
    EXPECT_EQ(codec::chunk_index(9, 4), 2);
    EXPECT_EQ(codec::chunk_offset(9, 4), 1);
    EXPECT_EQ(codec::chunk_offset(8, 4), 0);
}

TEST(ChunkCodec, ExpectedChunkLength) {
    EXPECT_EQ(codec::expected_chunk_length(0, 11, 4), 4);
    EXPECT_EQ(codec::expected_chunk_length(1, 11, 4), 4);
    EXPECT_EQ(codec::expected_chunk_length(2, 11, 4), 3);
    EXPECT_EQ(codec::expected_chunk_length(3, 11, 4), 0);
    EXPECT_EQ(codec::expected_chunk_length(1, 8, 4), 4);
    EXPECT_EQ(codec::expected_chunk_length(0, 0, 4), 0);
}

TEST(ChunkCodec, SplitHelloWorld) {
    std::string s = "hello world";
    std::span<const uint8_t> data(reinterpret_cast<const uint8_t*>(s.data()), s.size());

    auto pieces = codec::split_chunks(data, 4);
    ASSERT_EQ(pieces.size(), 3u);
    EXPECT_EQ(pieces[0].size(), 4u);
    EXPECT_EQ(pieces[1].size(), 4u);
    EXPECT_EQ(pieces[2].size(), 3u);

    std::string joined;
    for (auto p : pieces) joined.append(reinterpret_cast<const char*>(p.data()), p.size());
    EXPECT_EQ(joined, s);
}

TEST(ChunkCodec, SplitEdgeCases) {
    EXPECT_TRUE(codec::split_chunks({}, 4).empty());

    std::string eight = "abcdefgh";
    std::span<const uint8_t> data(reinterpret_cast<const uint8_t*>(eight.data()), eight.size());
    auto pieces = codec::split_chunks(data, 4);
    ASSERT_EQ(pieces.size(), 2u);
    EXPECT_EQ(pieces[1].size(), 4u);

    EXPECT_TRUE(codec::split_chunks(data, 0).empty());
}
