#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "common/config.hpp"

using namespace gridlite;

TEST(Config, MissingFileGivesDefaults) {
    auto cfg = load_config("/nonexistent/gridlite.json");
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg->database, "grid.db");
    EXPECT_EQ(cfg->bucket, "fs");
    EXPECT_EQ(cfg->chunk_size, 255 * 1024);
    EXPECT_EQ(cfg->digest, crypto::DigestAlgorithm::MD5);
}

TEST(Config, ParsesAllKeys) {
    auto cfg = parse_config(R"({"database": "x.db", "bucket": "media", "chunk_size": 1024, "digest": "sha256"})");
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg->database, "x.db");
    EXPECT_EQ(cfg->bucket, "media");
    EXPECT_EQ(cfg->chunk_size, 1024);
    EXPECT_EQ(cfg->digest, crypto::DigestAlgorithm::SHA256);
}

TEST(Config, RejectsBadValues) {
    EXPECT_EQ(parse_config("[1, 2]").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_config("{not json").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_config(R"({"chunk_size": 0})").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_config(R"({"chunk_size": "big"})").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_config(R"({"digest": "crc32"})").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_config(R"({"bucket": 7})").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_config(R"({"chunk_size": 4294967296})").error().code, ErrorCode::InvalidArgument);
}

TEST(Config, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "gridlite_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"bucket": "archive", "chunk_size": 4096})";
    }

    auto cfg = load_config(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg->bucket, "archive");
    EXPECT_EQ(cfg->chunk_size, 4096);
    EXPECT_EQ(cfg->database, "grid.db");
}
