//
// Created by cv2 on 15.01.2026.
//

#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <optional>
#include <istream>
#include "../common/errors.hpp"
#include "../common/crypto.hpp"
#include "../common/config.hpp"
#include "../common/db.hpp"

namespace gridlite {

    struct WriteOptions {
        std::optional<std::string> id;  // Generated when absent
        std::optional<std::string> filename;
        std::optional<std::string> content_type;
        int64_t chunk_size = DEFAULT_CHUNK_SIZE;
        json metadata;
        std::optional<std::vector<std::string>> aliases;
        json extra = json::object();    // Custom top-level fields
        crypto::DigestAlgorithm digest = crypto::DigestAlgorithm::MD5;
    };

    // Write session for one file. Bytes are buffered and flushed as
    // chunk records of exactly chunk_size bytes (index 0, 1, ...).
    // close() flushes the tail chunk and persists the FileRecord.
    //
    // Not thread-safe. abort() is never called implicitly.
    class ChunkedWriter {
    public:
        ChunkedWriter(Database& db, WriteOptions options = {});

        // Validates options and assigns the id. Required before write().
        Result<void> init();

        Result<void> write(std::span<const uint8_t> data);
        Result<void> write(std::string_view data);

        // Drains source until EOF. A read error aborts the session.
        Result<void> write_from(std::istream& source);

        // Finalizes length, upload date and digest, then persists the record.
        // No-op when already closed.
        Result<void> close();

        // Removes the chunks flushed by this session (and the record, if
        // persisted), then closes.
        Result<void> abort();

        // Edits a mutable field; after close it is written through to the store.
        Result<void> set_field(const std::string& name, const json& value);

        bool closed() const { return closed_; }
        const std::string& id() const { return record_.id; }
        const FileRecord& record() const { return record_; }
        const std::optional<std::string>& filename() const { return record_.filename; }
        const std::optional<std::string>& content_type() const { return record_.content_type; }
        int64_t chunk_size() const { return record_.chunk_size; }

        // Only available once closed
        Result<int64_t> length() const;
        Result<int64_t> upload_date() const;
        Result<std::string> digest() const;

    private:
        Database& db_;
        WriteOptions options_;
        FileRecord record_;
        crypto::DigestAccumulator digest_;

        Bytes buffer_;             // < chunk_size pending bytes
        int64_t position_ = 0;     // Bytes flushed so far
        int64_t chunk_number_ = 0; // Next chunk index

        bool initialized_ = false;
        bool closed_ = false;
        bool persisted_ = false;

        Result<void> flush_data(std::span<const uint8_t> data);
        Result<void> flush_buffer();
        Result<void> finalize();
    };

} // namespace gridlite
