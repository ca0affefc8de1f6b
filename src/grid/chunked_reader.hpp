//
// Created by cv2 on 16.01.2026.
//

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "../common/errors.hpp"
#include "../common/db.hpp"
#include "chunk_iterator.hpp"

namespace gridlite {

    enum class Whence {
        Set,     // From start
        Current, // From cursor
        End      // From declared length
    };

    // Random-access reader over one stored file.
    //
    // Built from an id, the FileRecord is fetched on first use and a
    // missing record fails with NoFile. Chunks are fetched lazily; the
    // unread tail of the last fetched chunk is kept until the next read
    // or seek.
    class ChunkedReader {
    public:
        ChunkedReader(Database& db, std::string file_id);
        ChunkedReader(Database& db, FileRecord record);

        Result<void> ensure_file();

        // --- Fields (each resolves the record) ---
        Result<std::string> id();
        Result<std::optional<std::string>> filename();
        Result<int64_t> length(); // 0 when absent
        Result<int64_t> chunk_size();
        Result<std::optional<int64_t>> upload_date();
        Result<std::optional<std::string>> digest();
        Result<std::optional<std::string>> content_type();
        Result<std::optional<std::vector<std::string>>> aliases();
        Result<json> metadata();
        Result<json> extra();
        Result<FileRecord> record();

        // --- Reading ---

        // Up to `size` bytes; negative or oversized reads are clamped to what remains
        Result<Bytes> read(int64_t size = -1);

        // Like read(), but stops after the first '\n' within the bound
        Result<Bytes> read_line(int64_t size = -1);

        // Rest of the current chunk (or look-ahead), empty at EOF
        Result<Bytes> read_chunk();

        int64_t tell() const { return position_; }

        // Drops the look-ahead buffer. Negative targets are rejected.
        Result<void> seek(int64_t pos, Whence whence = Whence::Set);

        // Whole-file sequential traversal, independent of the cursor
        Result<ChunkIterator> chunks();

    private:
        Database& db_;
        std::string file_id_;
        std::optional<FileRecord> file_;
        bool validated_ = false;

        Bytes buffer_;         // Unread bytes starting at position_
        int64_t position_ = 0;

        Result<Bytes> fetch_piece();
        Result<Bytes> read_bounded(int64_t size, bool stop_at_newline);
        Result<void> check_extra_chunks();
    };

} // namespace gridlite
