//
// Created by cv2 on 22.12.2025.
//

#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <expected>
#include <memory>
#include <cstdint>
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include "crypto.hpp"

namespace gridlite {

    using json = nlohmann::json;
    using crypto::Bytes;

    enum class DbError {
        DuplicateKey,
        QueryFailed,
        InvalidField,
        NotOpen
    };

    // Metadata document of one stored file ("<bucket>_files" row)
    struct FileRecord {
        std::string id;
        std::optional<std::string> filename;
        int64_t chunk_size = 0;
        std::optional<int64_t> length;       // Set at finalize
        std::optional<int64_t> upload_date;  // ms since epoch, set at finalize
        std::optional<std::string> digest;   // hex, set at finalize
        std::optional<std::string> content_type;
        std::optional<std::vector<std::string>> aliases;
        json metadata;                       // Opaque passthrough, null if absent
        json extra = json::object();         // Custom top-level fields

        // Absent length reads as zero
        int64_t length_or_zero() const { return length.value_or(0); }
    };

    // One slice of a file ("<bucket>_chunks" row)
    struct ChunkRecord {
        std::string files_id;
        int64_t n = 0;
        Bytes data;
    };

    enum class SortField { UploadDate, Filename, Length };
    enum class SortOrder { Ascending, Descending };

    struct FileQuery {
        std::optional<std::string> filename;
        std::optional<std::string> content_type;
        SortField sort = SortField::UploadDate;
        SortOrder order = SortOrder::Ascending;
        int64_t skip = 0;
        int64_t limit = 0; // 0 = unlimited
    };

    // Fields fixed at creation or finalize; never editable in place
    bool is_chunking_field(std::string_view key);

    // Applies a {"field": value} set to the mutable fields of rec.
    // Unknown keys land in rec.extra.
    std::expected<void, DbError> apply_file_fields(FileRecord& rec, const json& fields);

    class Database {
    public:
        Database();
        ~Database();

        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        // Opens (or creates) the DB and the bucket's two tables.
        // path may be ":memory:".
        bool open(const std::string& path, const std::string& bucket = "fs");
        void close();
        bool is_open() const { return db_ != nullptr; }

        const std::string& bucket() const { return bucket_; }

        // --- Files ---
        std::expected<void, DbError> insert_file(const FileRecord& rec);
        std::expected<std::optional<FileRecord>, DbError> find_file(const std::string& id);
        std::expected<std::vector<FileRecord>, DbError> find_files(const FileQuery& query);
        std::expected<int64_t, DbError> delete_file(const std::string& id);

        // Sets mutable fields (filename, contentType, metadata, aliases, custom keys).
        // Returns the matched count.
        std::expected<int64_t, DbError> update_file(const std::string& id, const json& fields);

        std::expected<std::vector<std::string>, DbError> distinct_filenames();

        // --- Chunks ---
        std::expected<void, DbError> insert_chunk(const ChunkRecord& chunk);
        std::expected<std::optional<ChunkRecord>, DbError> find_chunk(const std::string& files_id, int64_t n);

        // First non-empty chunk with index >= from_n
        std::expected<std::optional<ChunkRecord>, DbError> find_extra_chunk(const std::string& files_id, int64_t from_n);

        // Deletes all chunks of a file, or only those with n < below_n
        std::expected<int64_t, DbError> delete_chunks(const std::string& files_id,
                                                      std::optional<int64_t> below_n = std::nullopt);
        std::expected<int64_t, DbError> count_chunks(const std::string& files_id);

    private:
        using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

        sqlite3* db_ = nullptr;
        std::string bucket_;
        std::string files_table_;
        std::string chunks_table_;

        bool init_tables();
        StmtPtr prepare(const std::string& sql);
        DbError step_error(int rc) const;

        FileRecord read_file_row(sqlite3_stmt* stmt) const;
    };

} // namespace gridlite
