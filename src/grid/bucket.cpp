//
// Created by cv2 on 17.01.2026.
//

#include "bucket.hpp"
#include "store_error.hpp"
#include <format>
#include <print>

namespace gridlite {

Bucket::Bucket(Database& db, BucketOptions options)
    : db_(db), options_(options) {}

WriteOptions Bucket::make_write_options(const std::string& filename, const UploadOptions& opts) const {
    WriteOptions w;
    w.filename = filename;
    w.chunk_size = opts.chunk_size.value_or(options_.chunk_size);
    w.content_type = opts.content_type;
    w.aliases = opts.aliases;
    w.metadata = opts.metadata;
    w.digest = options_.digest;
    return w;
}

// --- Upload ---

Result<ChunkedWriter> Bucket::open_upload_stream(const std::string& filename, const UploadOptions& opts) {
    ChunkedWriter writer(db_, make_write_options(filename, opts));
    if (auto res = writer.init(); !res) return std::unexpected(res.error());
    return writer;
}

Result<ChunkedWriter> Bucket::open_upload_stream_with_id(const std::string& file_id, const std::string& filename,
                                                         const UploadOptions& opts) {
    WriteOptions w = make_write_options(filename, opts);
    w.id = file_id;

    ChunkedWriter writer(db_, std::move(w));
    if (auto res = writer.init(); !res) return std::unexpected(res.error());
    return writer;
}

// Drain + close; the writer has already aborted if the source failed
static Result<void> drain_and_close(ChunkedWriter& writer, std::istream& source) {
    if (auto res = writer.write_from(source); !res) {
        if (auto closed = writer.close(); !closed) {
            std::println(stderr, "[Bucket] Close after failed upload: {}", closed.error().message);
        }
        return res;
    }
    return writer.close();
}

Result<std::string> Bucket::upload_from_stream(const std::string& filename, std::istream& source,
                                               const UploadOptions& opts) {
    auto writer = open_upload_stream(filename, opts);
    if (!writer) return std::unexpected(writer.error());

    if (auto res = drain_and_close(*writer, source); !res) return std::unexpected(res.error());
    return writer->id();
}

Result<void> Bucket::upload_from_stream_with_id(const std::string& file_id, const std::string& filename,
                                                std::istream& source, const UploadOptions& opts) {
    auto writer = open_upload_stream_with_id(file_id, filename, opts);
    if (!writer) return std::unexpected(writer.error());
    return drain_and_close(*writer, source);
}

// --- Download ---

Result<ChunkedReader> Bucket::open_download_stream(const std::string& file_id) {
    ChunkedReader reader(db_, file_id);
    if (auto res = reader.ensure_file(); !res) return std::unexpected(res.error());
    return reader;
}

Result<void> Bucket::copy_to(ChunkedReader& reader, std::ostream& dest) {
    auto it = reader.chunks();
    if (!it) return std::unexpected(it.error());

    while (it->has_next()) {
        auto data = it->next();
        if (!data) return std::unexpected(data.error());

        dest.write(reinterpret_cast<const char*>(data->data()), static_cast<std::streamsize>(data->size()));
        if (!dest) return fail(ErrorCode::IOError, "write to destination failed");
    }
    return {};
}

Result<void> Bucket::download_to_stream(const std::string& file_id, std::ostream& dest) {
    auto reader = open_download_stream(file_id);
    if (!reader) return std::unexpected(reader.error());
    return copy_to(*reader, dest);
}

Result<ChunkedReader> Bucket::open_download_stream_by_name(const std::string& filename, int revision) {
    FileQuery q;
    q.filename = filename;
    q.sort = SortField::UploadDate;
    q.limit = 1;
    if (revision < 0) {
        q.order = SortOrder::Descending;
        q.skip = -(static_cast<int64_t>(revision) + 1);
    } else {
        q.order = SortOrder::Ascending;
        q.skip = revision;
    }

    auto files = db_.find_files(q);
    if (!files) return std::unexpected(store_error(files.error(), "find files"));
    if (files->empty()) {
        return fail(ErrorCode::NoFile, std::format("no version {} for filename '{}'", revision, filename));
    }
    return ChunkedReader(db_, std::move(files->front()));
}

Result<void> Bucket::download_to_stream_by_name(const std::string& filename, std::ostream& dest, int revision) {
    auto reader = open_download_stream_by_name(filename, revision);
    if (!reader) return std::unexpected(reader.error());
    return copy_to(*reader, dest);
}

// --- Management ---

Result<void> Bucket::remove(const std::string& file_id) {
    auto deleted = db_.delete_file(file_id);
    if (!deleted) return std::unexpected(store_error(deleted.error(), "delete file"));

    // Chunks go even when the record is already gone
    auto chunks = db_.delete_chunks(file_id);
    if (!chunks) return std::unexpected(store_error(chunks.error(), "delete chunks"));

    if (*deleted == 0) {
        return fail(ErrorCode::NoFile, std::format("no file could be deleted because none matched '{}'", file_id));
    }
    return {};
}

Result<void> Bucket::rename(const std::string& file_id, const std::string& new_filename) {
    auto matched = db_.update_file(file_id, json{{"filename", new_filename}});
    if (!matched) return std::unexpected(store_error(matched.error(), "update file"));
    if (*matched == 0) {
        return fail(ErrorCode::NoFile,
                    std::format("no files could be renamed '{}' because none matched file_id '{}'", new_filename, file_id));
    }
    return {};
}

Result<std::vector<ChunkedReader>> Bucket::find(const FileQuery& query) {
    auto files = db_.find_files(query);
    if (!files) return std::unexpected(store_error(files.error(), "find files"));

    std::vector<ChunkedReader> out;
    out.reserve(files->size());
    for (auto& rec : *files) out.emplace_back(db_, std::move(rec));
    return out;
}

Result<std::vector<std::string>> Bucket::list() {
    auto names = db_.distinct_filenames();
    if (!names) return std::unexpected(store_error(names.error(), "list filenames"));
    return std::move(*names);
}

Result<bool> Bucket::exists(const std::string& file_id) {
    auto found = db_.find_file(file_id);
    if (!found) return std::unexpected(store_error(found.error(), "find file"));
    return found->has_value();
}

Result<std::optional<ChunkedReader>> Bucket::find_one(const FileQuery& query) {
    FileQuery q = query;
    q.limit = 1;

    auto files = db_.find_files(q);
    if (!files) return std::unexpected(store_error(files.error(), "find files"));
    if (files->empty()) return std::nullopt;
    return ChunkedReader(db_, std::move(files->front()));
}

Result<bool> Bucket::exists(const FileQuery& query) {
    auto found = find_one(query);
    if (!found) return std::unexpected(found.error());
    return found->has_value();
}

Result<bool> Bucket::verify(const std::string& file_id) {
    auto reader = open_download_stream(file_id);
    if (!reader) return std::unexpected(reader.error());

    auto stored = reader->digest();
    if (!stored) return std::unexpected(stored.error());
    if (!*stored) return false;

    auto it = reader->chunks();
    if (!it) return std::unexpected(it.error());

    // Hex length tells which algorithm wrote it
    auto alg = (*stored)->size() == 64 ? crypto::DigestAlgorithm::SHA256 : crypto::DigestAlgorithm::MD5;
    crypto::DigestAccumulator acc(alg);
    while (it->has_next()) {
        auto data = it->next();
        if (!data) return std::unexpected(data.error());
        if (!acc.update(*data)) return fail(ErrorCode::IOError, "digest update failed");
    }

    auto hex = acc.finalize();
    if (!hex) return fail(ErrorCode::IOError, "digest finalize failed");

    if (*hex != **stored) {
        std::println(stderr, "[Bucket] Digest mismatch for {}: stored {}, computed {}", file_id, **stored, *hex);
        return false;
    }
    return true;
}

} // namespace gridlite
