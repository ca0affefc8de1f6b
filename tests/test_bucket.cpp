#include <gtest/gtest.h>
#include <climits>
#include <sstream>
#include "grid/bucket.hpp"
#include "test_util.hpp"

using namespace gridlite;
using gridlite::test::to_bytes;
using gridlite::test::to_str;
using gridlite::test::pattern;

namespace {

    class BucketTest : public gridlite::test::StoreTest {
    protected:
        void SetUp() override {
            StoreTest::SetUp();
            bucket.emplace(db, BucketOptions{.chunk_size = 8});
        }

        std::string upload(const std::string& name, const std::string& payload) {
            std::istringstream src(payload);
            auto id = bucket->upload_from_stream(name, src);
            EXPECT_TRUE(id) << (id ? "" : id.error().message);
            return id ? *id : std::string{};
        }

        std::string download(const std::string& id) {
            std::ostringstream out;
            auto res = bucket->download_to_stream(id, out);
            EXPECT_TRUE(res) << (res ? "" : res.error().message);
            return out.str();
        }

        std::optional<Bucket> bucket;
    };

} // namespace

TEST_F(BucketTest, UploadThenDownload) {
    const std::string payload = pattern(100);
    std::string id = upload("blob.bin", payload);
    ASSERT_FALSE(id.empty());

    EXPECT_EQ(download(id), payload);
    EXPECT_EQ(*db.count_chunks(id), 13);

    auto reader = bucket->open_download_stream(id);
    ASSERT_TRUE(reader);
    EXPECT_EQ(*reader->filename(), "blob.bin");
    EXPECT_EQ(*reader->chunk_size(), 8);
    EXPECT_EQ(*reader->length(), 100);
}

TEST_F(BucketTest, UploadOptionsOverrideDefaults) {
    UploadOptions opts;
    opts.chunk_size = 3;
    opts.content_type = "text/plain";
    opts.metadata = json{{"source", "test"}};

    std::istringstream src("abcdefg");
    auto id = bucket->upload_from_stream("opts.txt", src, opts);
    ASSERT_TRUE(id);

    auto reader = bucket->open_download_stream(*id);
    ASSERT_TRUE(reader);
    EXPECT_EQ(*reader->chunk_size(), 3);
    EXPECT_EQ(*reader->content_type(), "text/plain");
    EXPECT_EQ((*reader->metadata())["source"], "test");
    EXPECT_EQ(*db.count_chunks(*id), 3);
}

TEST_F(BucketTest, UploadWithIdAndDuplicate) {
    std::istringstream first("one");
    ASSERT_TRUE(bucket->upload_from_stream_with_id("fixed", "a.txt", first));
    EXPECT_EQ(download("fixed"), "one");

    std::istringstream second("two");
    auto res = bucket->upload_from_stream_with_id("fixed", "b.txt", second);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::FileExists);
    EXPECT_EQ(download("fixed"), "one");
}

TEST_F(BucketTest, OpenUploadStream) {
    auto w = bucket->open_upload_stream("stream.txt");
    ASSERT_TRUE(w);
    ASSERT_TRUE(w->write("written "));
    ASSERT_TRUE(w->write("in parts"));
    ASSERT_TRUE(w->close());

    EXPECT_EQ(download(w->id()), "written in parts");
}

TEST_F(BucketTest, MissingFileIsNoFile) {
    auto reader = bucket->open_download_stream("nonexistent");
    ASSERT_FALSE(reader);
    EXPECT_EQ(reader.error().code, ErrorCode::NoFile);

    std::ostringstream out;
    auto res = bucket->download_to_stream("nonexistent", out);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::NoFile);
}

TEST_F(BucketTest, Revisions) {
    upload("doc.txt", "v0");
    upload("doc.txt", "v1");
    upload("doc.txt", "v2");
    upload("other.txt", "x");

    auto content = [&](int revision) -> std::string {
        std::ostringstream out;
        auto res = bucket->download_to_stream_by_name("doc.txt", out, revision);
        if (!res) return "<" + std::string(to_string(res.error().code)) + ">";
        return out.str();
    };

    EXPECT_EQ(content(-1), "v2");
    EXPECT_EQ(content(-2), "v1");
    EXPECT_EQ(content(-3), "v0");
    EXPECT_EQ(content(0), "v0");
    EXPECT_EQ(content(1), "v1");
    EXPECT_EQ(content(2), "v2");
    EXPECT_EQ(content(3), "<NoFile>");
    EXPECT_EQ(content(-4), "<NoFile>");

    auto reader = bucket->open_download_stream_by_name("missing.txt");
    ASSERT_FALSE(reader);
    EXPECT_EQ(reader.error().code, ErrorCode::NoFile);
}

TEST_F(BucketTest, RemoveDeletesRecordAndChunks) {
    std::string id = upload("gone.txt", "some bytes here");
    ASSERT_TRUE(bucket->remove(id));

    EXPECT_FALSE(*bucket->exists(id));
    EXPECT_EQ(*db.count_chunks(id), 0);

    auto again = bucket->remove(id);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::NoFile);
}

TEST_F(BucketTest, RemoveCleansOrphanChunks) {
    ASSERT_TRUE(db.insert_chunk({"orphan", 0, to_bytes("x")}));
    auto res = bucket->remove("orphan");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::NoFile);
    EXPECT_EQ(*db.count_chunks("orphan"), 0);
}

TEST_F(BucketTest, Rename) {
    std::string id = upload("before.txt", "data");
    ASSERT_TRUE(bucket->rename(id, "after.txt"));

    auto reader = bucket->open_download_stream(id);
    ASSERT_TRUE(reader);
    EXPECT_EQ(*reader->filename(), "after.txt");
    EXPECT_EQ(download(id), "data");

    auto res = bucket->rename("ghost", "x");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::NoFile);
}

TEST_F(BucketTest, ListAndFind) {
    upload("b.txt", "1");
    upload("a.txt", "22");
    upload("b.txt", "333");

    auto names = bucket->list();
    ASSERT_TRUE(names);
    EXPECT_EQ(*names, (std::vector<std::string>{"a.txt", "b.txt"}));

    FileQuery q;
    q.filename = "b.txt";
    auto readers = bucket->find(q);
    ASSERT_TRUE(readers);
    ASSERT_EQ(readers->size(), 2u);
    EXPECT_EQ(to_str(*(*readers)[0].read()), "1");
    EXPECT_EQ(to_str(*(*readers)[1].read()), "333");
}

TEST_F(BucketTest, Exists) {
    std::string id = upload("e.txt", "e");
    EXPECT_TRUE(*bucket->exists(id));
    EXPECT_FALSE(*bucket->exists("nope"));
}

TEST_F(BucketTest, VerifyDetectsTampering) {
    std::string id = upload("v.txt", "verify me please");
    EXPECT_TRUE(*bucket->verify(id));

    // Swap a chunk for one of equal size
    ASSERT_TRUE(db.delete_chunks(id, 1));
    ASSERT_TRUE(db.insert_chunk({id, 0, to_bytes("VERIFY M")}));
    EXPECT_FALSE(*bucket->verify(id));

    auto missing = bucket->verify("nope");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NoFile);
}

TEST_F(BucketTest, Sha256Bucket) {
    Bucket sha(db, BucketOptions{.chunk_size = 4, .digest = crypto::DigestAlgorithm::SHA256});
    std::istringstream src("hello world");
    auto id = sha.upload_from_stream("s.txt", src);
    ASSERT_TRUE(id);

    auto reader = sha.open_download_stream(*id);
    ASSERT_TRUE(reader);
    EXPECT_EQ(*reader->digest(), "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
    EXPECT_TRUE(*sha.verify(*id));
}

TEST_F(BucketTest, CorruptFileFailsDownload) {
    std::string id = upload("c.txt", "0123456789abcdef");
    ASSERT_TRUE(db.delete_chunks(id, 1));

    std::ostringstream out;
    auto res = bucket->download_to_stream(id, out);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::CorruptGridFile);
}

TEST_F(BucketTest, ExtremeRevisionsAreNoFile) {
    upload("edge.txt", "only");

    auto oldest = bucket->open_download_stream_by_name("edge.txt", INT_MIN);
    ASSERT_FALSE(oldest);
    EXPECT_EQ(oldest.error().code, ErrorCode::NoFile);

    auto newest = bucket->open_download_stream_by_name("edge.txt", INT_MAX);
    ASSERT_FALSE(newest);
    EXPECT_EQ(newest.error().code, ErrorCode::NoFile);
}

TEST_F(BucketTest, FindOneAndExistsByQuery) {
    UploadOptions text;
    text.content_type = "text/plain";
    std::istringstream a("first");
    std::istringstream b("second");
    ASSERT_TRUE(bucket->upload_from_stream("q.txt", a, text));
    ASSERT_TRUE(bucket->upload_from_stream("q.txt", b, text));

    FileQuery q;
    q.filename = "q.txt";
    q.order = SortOrder::Descending;
    auto newest = bucket->find_one(q);
    ASSERT_TRUE(newest);
    ASSERT_TRUE(newest->has_value());
    EXPECT_EQ(to_str(*(*newest)->read()), "second");

    FileQuery by_type;
    by_type.content_type = "text/plain";
    EXPECT_TRUE(*bucket->exists(by_type));

    FileQuery none;
    none.filename = "absent.txt";
    auto missing = bucket->find_one(none);
    ASSERT_TRUE(missing);
    EXPECT_FALSE(missing->has_value());
    EXPECT_FALSE(*bucket->exists(none));
}
