//
// Created by cv2 on 15.01.2026.
//

#include "chunked_writer.hpp"
#include "chunk_codec.hpp"
#include "store_error.hpp"
#include <algorithm>
#include <chrono>
#include <climits>
#include <format>
#include <print>

namespace gridlite {

static int64_t now_millis() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

static Error closed_only(std::string_view field) {
    return Error{ErrorCode::InvalidArgument, std::format("can only get '{}' on a closed file", field)};
}

ChunkedWriter::ChunkedWriter(Database& db, WriteOptions options)
    : db_(db), options_(std::move(options)), digest_(options_.digest) {}

Result<void> ChunkedWriter::init() {
    if (initialized_) return {};

    if (options_.chunk_size <= 0) {
        return fail(ErrorCode::InvalidArgument, std::format("chunk size must be positive, got {}", options_.chunk_size));
    }
    // SQLite binds blob sizes as int
    if (options_.chunk_size > INT_MAX) {
        return fail(ErrorCode::InvalidArgument,
                    std::format("chunk size {} exceeds the maximum of {}", options_.chunk_size, INT_MAX));
    }

    // 1. Resolve the id
    if (options_.id) {
        if (options_.id->empty()) return fail(ErrorCode::InvalidArgument, "file id must not be empty");
        record_.id = *options_.id;
    } else {
        auto oid = crypto::generate_object_id();
        if (!oid) return fail(ErrorCode::IOError, "failed to generate file id");
        record_.id = *oid;
    }

    // 2. Typed fields
    record_.filename = options_.filename;
    record_.content_type = options_.content_type;
    record_.chunk_size = options_.chunk_size;
    record_.metadata = options_.metadata;
    record_.aliases = options_.aliases;

    // 3. Custom fields go through the same validation as later edits
    if (!options_.extra.is_null()) {
        if (auto res = apply_file_fields(record_, options_.extra); !res) {
            return std::unexpected(store_error(res.error(), "extra fields"));
        }
    }

    buffer_.reserve(static_cast<size_t>(record_.chunk_size));
    initialized_ = true;
    return {};
}

// --- Writing ---

Result<void> ChunkedWriter::write(std::string_view data) {
    return write(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

Result<void> ChunkedWriter::write(std::span<const uint8_t> data) {
    if (closed_) return fail(ErrorCode::InvalidArgument, "cannot write to a closed file");
    if (!initialized_) return fail(ErrorCode::InvalidArgument, "writer not initialised");

    const auto cs = static_cast<size_t>(record_.chunk_size);

    // 1. Top up a partially filled buffer first
    if (!buffer_.empty()) {
        size_t take = std::min(cs - buffer_.size(), data.size());
        buffer_.insert(buffer_.end(), data.begin(), data.begin() + take);
        data = data.subspan(take);

        if (buffer_.size() < cs) return {};
        if (auto res = flush_buffer(); !res) return res;
    }

    // 2. Whole chunks go straight from the input, the tail is buffered
    for (auto piece : codec::split_chunks(data, record_.chunk_size)) {
        if (piece.size() < cs) {
            buffer_.assign(piece.begin(), piece.end());
            break;
        }
        if (auto res = flush_data(piece); !res) return res;
    }
    return {};
}

Result<void> ChunkedWriter::write_from(std::istream& source) {
    if (closed_) return fail(ErrorCode::InvalidArgument, "cannot write to a closed file");
    if (!initialized_) return fail(ErrorCode::InvalidArgument, "writer not initialised");

    Bytes buf(static_cast<size_t>(record_.chunk_size));
    while (true) {
        source.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = source.gcount();

        if (source.bad()) {
            std::println(stderr, "[Writer] Source failed while uploading {}. Aborting.", record_.id);
            if (auto res = abort(); !res) {
                std::println(stderr, "[Writer] Abort failed: {}", res.error().message);
            }
            return fail(ErrorCode::IOError, "read from source failed");
        }

        if (got > 0) {
            if (auto res = write(std::span<const uint8_t>(buf.data(), static_cast<size_t>(got))); !res) return res;
        }
        if (!source) break; // EOF
    }
    return {};
}

Result<void> ChunkedWriter::flush_data(std::span<const uint8_t> data) {
    if (static_cast<int64_t>(data.size()) > record_.chunk_size) {
        closed_ = true;
        return fail(ErrorCode::InvalidArgument,
                    std::format("chunk of {} bytes exceeds chunk size {}", data.size(), record_.chunk_size));
    }

    if (auto res = digest_.update(data); !res) {
        closed_ = true;
        return fail(ErrorCode::IOError, "digest update failed");
    }

    // Empty tails are never stored
    if (data.empty()) return {};

    ChunkRecord chunk{record_.id, chunk_number_, Bytes(data.begin(), data.end())};
    if (auto res = db_.insert_chunk(chunk); !res) {
        closed_ = true;
        if (res.error() == DbError::DuplicateKey) {
            std::println(stderr, "[Writer] Chunk #{} of {} already exists", chunk_number_, record_.id);
            return fail(ErrorCode::FileExists, std::format("file with id '{}' already exists", record_.id));
        }
        return std::unexpected(store_error(res.error(), std::format("insert chunk #{}", chunk_number_)));
    }

    chunk_number_++;
    position_ += static_cast<int64_t>(data.size());
    return {};
}

Result<void> ChunkedWriter::flush_buffer() {
    auto res = flush_data(buffer_);
    if (res) buffer_.clear();
    return res;
}

// --- Finalize ---

Result<void> ChunkedWriter::finalize() {
    // 1. Tail chunk (0..chunk_size-1 bytes)
    if (auto res = flush_buffer(); !res) return res;

    // 2. Digest, length, upload date
    auto hex = digest_.finalize();
    if (!hex) return fail(ErrorCode::IOError, "digest finalize failed");

    record_.digest = *hex;
    record_.length = position_;
    record_.upload_date = now_millis();

    // 3. Persist the record
    if (auto res = db_.insert_file(record_); !res) {
        if (res.error() == DbError::DuplicateKey) {
            std::println(stderr, "[Writer] File {} already exists", record_.id);
            return fail(ErrorCode::FileExists, std::format("file with id '{}' already exists", record_.id));
        }
        return std::unexpected(store_error(res.error(), "insert file"));
    }
    persisted_ = true;
    return {};
}

Result<void> ChunkedWriter::close() {
    if (closed_) return {};
    if (!initialized_) return fail(ErrorCode::InvalidArgument, "writer not initialised");

    auto res = finalize();
    closed_ = true;
    return res;
}

Result<void> ChunkedWriter::abort() {
    buffer_.clear();
    if (!initialized_) {
        closed_ = true;
        return {};
    }

    // Only the indices this session flushed; a colliding file keeps its chunks
    auto removed = db_.delete_chunks(record_.id, chunk_number_);
    if (!removed) {
        closed_ = true;
        return std::unexpected(store_error(removed.error(), "delete chunks"));
    }

    if (persisted_) {
        auto res = db_.delete_file(record_.id);
        if (!res) {
            closed_ = true;
            return std::unexpected(store_error(res.error(), "delete file"));
        }
        persisted_ = false;
    }

    std::println(stderr, "[Writer] Aborted upload {} ({} chunks removed)", record_.id, *removed);
    chunk_number_ = 0;
    closed_ = true;
    return {};
}

// --- Fields ---

Result<void> ChunkedWriter::set_field(const std::string& name, const json& value) {
    if (is_chunking_field(name)) {
        return fail(ErrorCode::InvalidArgument, std::format("'{}' is read-only", name));
    }

    json fields = json::object();
    fields[name] = value;

    FileRecord updated = record_;
    if (auto res = apply_file_fields(updated, fields); !res) {
        return std::unexpected(store_error(res.error(), std::format("field '{}'", name)));
    }

    if (persisted_) {
        auto matched = db_.update_file(record_.id, fields);
        if (!matched) return std::unexpected(store_error(matched.error(), "update file"));
        if (*matched == 0) return fail(ErrorCode::NoFile, std::format("no file with id '{}'", record_.id));
    }

    record_ = std::move(updated);
    return {};
}

Result<int64_t> ChunkedWriter::length() const {
    if (!closed_) return std::unexpected(closed_only("length"));
    return record_.length_or_zero();
}

Result<int64_t> ChunkedWriter::upload_date() const {
    if (!closed_ || !record_.upload_date) return std::unexpected(closed_only("uploadDate"));
    return *record_.upload_date;
}

Result<std::string> ChunkedWriter::digest() const {
    if (!closed_ || !record_.digest) return std::unexpected(closed_only("digest"));
    return *record_.digest;
}

} // namespace gridlite
