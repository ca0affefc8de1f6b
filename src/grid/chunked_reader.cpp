//
// Created by cv2 on 16.01.2026.
//

#include "chunked_reader.hpp"
#include "chunk_codec.hpp"
#include "store_error.hpp"
#include <algorithm>
#include <format>
#include <limits>
#include <print>

namespace gridlite {

ChunkedReader::ChunkedReader(Database& db, std::string file_id)
    : db_(db), file_id_(std::move(file_id)) {}

ChunkedReader::ChunkedReader(Database& db, FileRecord record)
    : db_(db), file_id_(record.id), file_(std::move(record)) {}

Result<void> ChunkedReader::ensure_file() {
    if (!file_) {
        auto found = db_.find_file(file_id_);
        if (!found) return std::unexpected(store_error(found.error(), "find file"));
        if (!*found) {
            return fail(ErrorCode::NoFile,
                        std::format("no file in gridfs collection '{}_files' with id '{}'", db_.bucket(), file_id_));
        }
        file_ = std::move(**found);
    }

    if (!validated_) {
        if (file_->chunk_size <= 0) {
            return fail(ErrorCode::CorruptGridFile,
                        std::format("file '{}' has invalid chunk size {}", file_id_, file_->chunk_size));
        }
        validated_ = true;
    }
    return {};
}

// --- Fields ---

Result<std::string> ChunkedReader::id() {
    if (auto res = ensure_file(); !res) return std::unexpected(res.error());
    return file_->id;
}

Result<std::optional<std::string>> ChunkedReader::filename() {
    if (auto res = ensure_file(); !res) return std::unexpected(res.error());
    return file_->filename;
}

Result<int64_t> ChunkedReader::length() {
    if (auto res = ensure_file(); !res) return std::unexpected(res.error());
    return file_->length_or_zero();
}

Result<int64_t> ChunkedReader::chunk_size() {
    if (auto res = ensure_file(); !res) return std::unexpected(res.error());
    return file_->chunk_size;
}

Result<std::optional<int64_t>> ChunkedReader::upload_date() {
    if (auto res = ensure_file(); !res) return std::unexpected(res.error());
    return file_->upload_date;
}

Result<std::optional<std::string>> ChunkedReader::digest() {
    if (auto res = ensure_file(); !res) return std::unexpected(res.error());
    return file_->digest;
}

Result<std::optional<std::string>> ChunkedReader::content_type() {
    if (auto res = ensure_file(); !res) return std::unexpected(res.error());
    return file_->content_type;
}

Result<std::optional<std::vector<std::string>>> ChunkedReader::aliases() {
    if (auto res = ensure_file(); !res) return std::unexpected(res.error());
    return file_->aliases;
}

Result<json> ChunkedReader::metadata() {
    if (auto res = ensure_file(); !res) return std::unexpected(res.error());
    return file_->metadata;
}

Result<json> ChunkedReader::extra() {
    if (auto res = ensure_file(); !res) return std::unexpected(res.error());
    return file_->extra;
}

Result<FileRecord> ChunkedReader::record() {
    if (auto res = ensure_file(); !res) return std::unexpected(res.error());
    return *file_;
}

// --- Chunk Fetch ---

// Bytes starting at position_: the look-ahead if any, else the rest of the
// chunk holding position_. Does not move the cursor.
Result<Bytes> ChunkedReader::fetch_piece() {
    if (!buffer_.empty()) {
        Bytes out = std::move(buffer_);
        buffer_.clear();
        return out;
    }

    const int64_t length = file_->length_or_zero();
    if (position_ >= length) return Bytes{};

    const int64_t cs = file_->chunk_size;
    const int64_t n = codec::chunk_index(position_, cs);

    auto chunk = db_.find_chunk(file_->id, n);
    if (!chunk) return std::unexpected(store_error(chunk.error(), std::format("find chunk #{}", n)));
    if (!*chunk) {
        std::println(stderr, "[Reader] File {} is missing chunk #{}", file_->id, n);
        return fail(ErrorCode::CorruptGridFile, std::format("no chunk #{}", n));
    }

    Bytes& data = (*chunk)->data;
    const auto offset = static_cast<size_t>(codec::chunk_offset(position_, cs));
    if (offset >= data.size()) {
        std::println(stderr, "[Reader] File {} has truncated chunk #{}", file_->id, n);
        return fail(ErrorCode::CorruptGridFile, std::format("truncated chunk #{}", n));
    }

    // Never hand out bytes past the declared length
    const auto max_len = static_cast<size_t>(length - position_);
    auto end = data.begin() + static_cast<std::ptrdiff_t>(std::min(data.size(), offset + max_len));
    return Bytes(data.begin() + static_cast<std::ptrdiff_t>(offset), end);
}

Result<void> ChunkedReader::check_extra_chunks() {
    const int64_t expected = codec::chunk_count(file_->length_or_zero(), file_->chunk_size);

    // Empty extra chunks are tolerated
    auto extra = db_.find_extra_chunk(file_->id, expected);
    if (!extra) return std::unexpected(store_error(extra.error(), "find extra chunk"));
    if (*extra) {
        std::println(stderr, "[Reader] File {} has extra chunk #{}", file_->id, (*extra)->n);
        return fail(ErrorCode::CorruptGridFile,
                    std::format("extra chunk found: expected {} chunks but found chunk with n={}", expected, (*extra)->n));
    }
    return {};
}

// --- Reading ---

Result<Bytes> ChunkedReader::read_bounded(int64_t size, bool stop_at_newline) {
    if (auto res = ensure_file(); !res) return std::unexpected(res.error());
    if (size == 0) return Bytes{};

    const int64_t length = file_->length_or_zero();
    const int64_t remainder = std::max<int64_t>(0, length - position_);
    if (size < 0 || size > remainder) size = remainder;

    // No upfront reserve: a corrupt record may declare far more than is stored
    Bytes out;

    bool found_newline = false;
    while (static_cast<int64_t>(out.size()) < size && !found_newline) {
        auto piece = fetch_piece();
        if (!piece) return std::unexpected(piece.error());

        size_t take = std::min(piece->size(), static_cast<size_t>(size) - out.size());
        if (stop_at_newline) {
            auto nl = std::find(piece->begin(), piece->begin() + static_cast<std::ptrdiff_t>(take), uint8_t{'\n'});
            if (nl != piece->begin() + static_cast<std::ptrdiff_t>(take)) {
                take = static_cast<size_t>(nl - piece->begin()) + 1;
                found_newline = true;
            }
        }

        out.insert(out.end(), piece->begin(), piece->begin() + static_cast<std::ptrdiff_t>(take));
        position_ += static_cast<int64_t>(take);

        // Keep the unread tail for the next call
        if (take < piece->size()) {
            buffer_.assign(piece->begin() + static_cast<std::ptrdiff_t>(take), piece->end());
        }
    }

    if (position_ >= length) {
        if (auto res = check_extra_chunks(); !res) return std::unexpected(res.error());
    }
    return out;
}

Result<Bytes> ChunkedReader::read(int64_t size) {
    return read_bounded(size, false);
}

Result<Bytes> ChunkedReader::read_line(int64_t size) {
    return read_bounded(size, true);
}

Result<Bytes> ChunkedReader::read_chunk() {
    if (auto res = ensure_file(); !res) return std::unexpected(res.error());

    auto piece = fetch_piece();
    if (!piece) return std::unexpected(piece.error());
    position_ += static_cast<int64_t>(piece->size());
    return piece;
}

Result<void> ChunkedReader::seek(int64_t pos, Whence whence) {
    int64_t base = 0;
    switch (whence) {
        case Whence::Set:
            break;
        case Whence::Current:
            base = position_;
            break;
        case Whence::End: {
            auto len = length();
            if (!len) return std::unexpected(len.error());
            base = *len;
            break;
        }
    }

    // base is never negative, so only the upper bound can overflow
    if (pos > 0 && base > std::numeric_limits<int64_t>::max() - pos) {
        return fail(ErrorCode::InvalidArgument, std::format("seek offset {} from {} overflows", pos, base));
    }
    const int64_t new_pos = base + pos;

    if (new_pos < 0) {
        return fail(ErrorCode::InvalidArgument, std::format("invalid seek position {}: must be non-negative", new_pos));
    }

    position_ = new_pos;
    buffer_.clear();
    return {};
}

Result<ChunkIterator> ChunkedReader::chunks() {
    if (auto res = ensure_file(); !res) return std::unexpected(res.error());
    return ChunkIterator(db_, file_->id, file_->length_or_zero(), file_->chunk_size);
}

} // namespace gridlite
