#include "db.hpp"
#include <print>
#include <format>
#include <cctype>

namespace gridlite {

// --- Helpers ---

static bool is_valid_bucket(const std::string& name) {
    if (name.empty() || name.size() > 64) return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

static void bind_opt_text(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& v) {
    if (v) sqlite3_bind_text(stmt, idx, v->c_str(), -1, SQLITE_TRANSIENT);
    else sqlite3_bind_null(stmt, idx);
}

static void bind_opt_int(sqlite3_stmt* stmt, int idx, const std::optional<int64_t>& v) {
    if (v) sqlite3_bind_int64(stmt, idx, *v);
    else sqlite3_bind_null(stmt, idx);
}

// NULL for null documents (and empty ones when collapse_empty), JSON text otherwise
static void bind_json(sqlite3_stmt* stmt, int idx, const json& j, bool collapse_empty = false) {
    if (j.is_null() || (collapse_empty && j.is_object() && j.empty())) {
        sqlite3_bind_null(stmt, idx);
        return;
    }
    std::string s = j.dump();
    sqlite3_bind_text(stmt, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static std::optional<std::string> column_opt_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    const char* txt = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return std::string(txt ? txt : "");
}

static std::optional<int64_t> column_opt_int(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(stmt, col);
}

static json column_json(sqlite3_stmt* stmt, int col) {
    auto txt = column_opt_text(stmt, col);
    if (!txt) return nullptr;
    json j = json::parse(*txt, nullptr, false);
    if (j.is_discarded()) {
        std::println(stderr, "[DB] Unparseable JSON column {}", col);
        return nullptr;
    }
    return j;
}

static Bytes column_blob(sqlite3_stmt* stmt, int col) {
    const void* b = sqlite3_column_blob(stmt, col);
    int bytes = sqlite3_column_bytes(stmt, col);
    if (!b || bytes <= 0) return {};
    return Bytes(static_cast<const uint8_t*>(b), static_cast<const uint8_t*>(b) + bytes);
}

std::expected<void, DbError> apply_file_fields(FileRecord& rec, const json& fields) {
    if (!fields.is_object()) return std::unexpected(DbError::InvalidField);

    // Validate everything before touching the record
    for (const auto& [key, value] : fields.items()) {
        if (is_chunking_field(key)) return std::unexpected(DbError::InvalidField);
        if ((key == "filename" || key == "contentType") && !value.is_string() && !value.is_null())
            return std::unexpected(DbError::InvalidField);
        if (key == "aliases" && !value.is_null()) {
            if (!value.is_array()) return std::unexpected(DbError::InvalidField);
            for (const auto& a : value) {
                if (!a.is_string()) return std::unexpected(DbError::InvalidField);
            }
        }
    }

    for (const auto& [key, value] : fields.items()) {
        if (key == "filename") {
            if (value.is_null()) rec.filename.reset();
            else rec.filename = value.get<std::string>();
        } else if (key == "contentType") {
            if (value.is_null()) rec.content_type.reset();
            else rec.content_type = value.get<std::string>();
        } else if (key == "aliases") {
            if (value.is_null()) rec.aliases.reset();
            else rec.aliases = value.get<std::vector<std::string>>();
        } else if (key == "metadata") {
            rec.metadata = value;
        } else {
            if (!rec.extra.is_object()) rec.extra = json::object();
            rec.extra[key] = value;
        }
    }
    return {};
}

bool is_chunking_field(std::string_view key) {
    return key == "_id" || key == "id" || key == "chunkSize" || key == "length" ||
           key == "uploadDate" || key == "digest" || key == "md5";
}

// --- Implementation ---

Database::Database() = default;

Database::~Database() {
    close();
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::open(const std::string& path, const std::string& bucket) {
    close();

    if (!is_valid_bucket(bucket)) {
        std::println(stderr, "[DB] Invalid bucket name '{}'", bucket);
        return false;
    }
    bucket_ = bucket;
    files_table_ = bucket + "_files";
    chunks_table_ = bucket + "_chunks";

    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::println(stderr, "[DB] Failed to open {}: {}", path, sqlite3_errmsg(db_));
        close();
        return false;
    }

    sqlite3_extended_result_codes(db_, 1);
    // Enable WAL for concurrent readers (no-op for :memory:)
    if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        std::println(stderr, "[DB] WAL unavailable, keeping default journal: {}", sqlite3_errmsg(db_));
    }

    if (!init_tables()) {
        close();
        return false;
    }
    return true;
}

bool Database::init_tables() {
    std::string sql = std::format(R"(
        CREATE TABLE IF NOT EXISTS {0} (
            id TEXT PRIMARY KEY,
            filename TEXT,
            chunk_size INTEGER NOT NULL,
            length INTEGER,
            upload_date INTEGER,
            digest TEXT,
            content_type TEXT,
            aliases TEXT,
            metadata TEXT,
            extra TEXT
        );
        CREATE INDEX IF NOT EXISTS {0}_filename_upload ON {0} (filename, upload_date);
        CREATE TABLE IF NOT EXISTS {1} (
            files_id TEXT NOT NULL,
            n INTEGER NOT NULL,
            data BLOB NOT NULL,
            UNIQUE (files_id, n)
        );
    )", files_table_, chunks_table_);

    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::println(stderr, "[DB] Init Error: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

Database::StmtPtr Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "[DB] Prepare Error: {}", sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        return StmtPtr(nullptr, sqlite3_finalize);
    }
    return StmtPtr(stmt, sqlite3_finalize);
}

DbError Database::step_error(int rc) const {
    if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) return DbError::DuplicateKey;
    std::println(stderr, "[DB] Step Error ({}): {}", rc, sqlite3_errmsg(db_));
    return DbError::QueryFailed;
}

FileRecord Database::read_file_row(sqlite3_stmt* stmt) const {
    FileRecord rec;
    rec.id = column_opt_text(stmt, 0).value_or("");
    rec.filename = column_opt_text(stmt, 1);
    rec.chunk_size = sqlite3_column_int64(stmt, 2);
    rec.length = column_opt_int(stmt, 3);
    rec.upload_date = column_opt_int(stmt, 4);
    rec.digest = column_opt_text(stmt, 5);
    rec.content_type = column_opt_text(stmt, 6);

    json aliases = column_json(stmt, 7);
    if (aliases.is_array()) {
        std::vector<std::string> list;
        for (const auto& a : aliases) {
            if (a.is_string()) list.push_back(a.get<std::string>());
        }
        rec.aliases = std::move(list);
    }

    rec.metadata = column_json(stmt, 8);
    json extra = column_json(stmt, 9);
    rec.extra = extra.is_object() ? extra : json::object();
    return rec;
}

static constexpr const char* FILE_COLUMNS =
    "id, filename, chunk_size, length, upload_date, digest, content_type, aliases, metadata, extra";

// --- Files ---

std::expected<void, DbError> Database::insert_file(const FileRecord& rec) {
    if (!db_) return std::unexpected(DbError::NotOpen);

    auto stmt = prepare(std::format("INSERT INTO {} ({}) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
                                    files_table_, FILE_COLUMNS));
    if (!stmt) return std::unexpected(DbError::QueryFailed);

    json aliases = nullptr;
    if (rec.aliases) aliases = *rec.aliases;

    sqlite3_bind_text(stmt.get(), 1, rec.id.c_str(), -1, SQLITE_TRANSIENT);
    bind_opt_text(stmt.get(), 2, rec.filename);
    sqlite3_bind_int64(stmt.get(), 3, rec.chunk_size);
    bind_opt_int(stmt.get(), 4, rec.length);
    bind_opt_int(stmt.get(), 5, rec.upload_date);
    bind_opt_text(stmt.get(), 6, rec.digest);
    bind_opt_text(stmt.get(), 7, rec.content_type);
    bind_json(stmt.get(), 8, aliases);
    bind_json(stmt.get(), 9, rec.metadata);
    bind_json(stmt.get(), 10, rec.extra, true);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) return std::unexpected(step_error(rc));
    return {};
}

std::expected<std::optional<FileRecord>, DbError> Database::find_file(const std::string& id) {
    if (!db_) return std::unexpected(DbError::NotOpen);

    auto stmt = prepare(std::format("SELECT {} FROM {} WHERE id = ?", FILE_COLUMNS, files_table_));
    if (!stmt) return std::unexpected(DbError::QueryFailed);
    sqlite3_bind_text(stmt.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) return read_file_row(stmt.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    return std::unexpected(step_error(rc));
}

std::expected<std::vector<FileRecord>, DbError> Database::find_files(const FileQuery& query) {
    if (!db_) return std::unexpected(DbError::NotOpen);

    std::string sql = std::format("SELECT {} FROM {} WHERE 1 = 1", FILE_COLUMNS, files_table_);
    if (query.filename) sql += " AND filename = ?";
    if (query.content_type) sql += " AND content_type = ?";

    const char* col = "upload_date";
    if (query.sort == SortField::Filename) col = "filename";
    else if (query.sort == SortField::Length) col = "length";
    const char* dir = query.order == SortOrder::Ascending ? "ASC" : "DESC";

    // rowid breaks ties in insertion order
    sql += std::format(" ORDER BY {0} {1}, rowid {1} LIMIT ? OFFSET ?", col, dir);

    auto stmt = prepare(sql);
    if (!stmt) return std::unexpected(DbError::QueryFailed);

    int idx = 1;
    if (query.filename) sqlite3_bind_text(stmt.get(), idx++, query.filename->c_str(), -1, SQLITE_TRANSIENT);
    if (query.content_type) sqlite3_bind_text(stmt.get(), idx++, query.content_type->c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), idx++, query.limit > 0 ? query.limit : -1);
    sqlite3_bind_int64(stmt.get(), idx++, query.skip > 0 ? query.skip : 0);

    std::vector<FileRecord> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        out.push_back(read_file_row(stmt.get()));
    }
    if (rc != SQLITE_DONE) return std::unexpected(step_error(rc));
    return out;
}

std::expected<int64_t, DbError> Database::delete_file(const std::string& id) {
    if (!db_) return std::unexpected(DbError::NotOpen);

    auto stmt = prepare(std::format("DELETE FROM {} WHERE id = ?", files_table_));
    if (!stmt) return std::unexpected(DbError::QueryFailed);
    sqlite3_bind_text(stmt.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) return std::unexpected(step_error(rc));
    return static_cast<int64_t>(sqlite3_changes(db_));
}

std::expected<int64_t, DbError> Database::update_file(const std::string& id, const json& fields) {
    if (!db_) return std::unexpected(DbError::NotOpen);

    // Reject bad field sets even when nothing matches
    FileRecord probe;
    if (auto v = apply_file_fields(probe, fields); !v) return std::unexpected(v.error());

    auto found = find_file(id);
    if (!found) return std::unexpected(found.error());
    if (!*found) return 0;

    FileRecord rec = std::move(**found);
    if (auto v = apply_file_fields(rec, fields); !v) return std::unexpected(v.error());

    auto stmt = prepare(std::format(
        "UPDATE {} SET filename = ?, content_type = ?, aliases = ?, metadata = ?, extra = ? WHERE id = ?",
        files_table_));
    if (!stmt) return std::unexpected(DbError::QueryFailed);

    json aliases = nullptr;
    if (rec.aliases) aliases = *rec.aliases;

    bind_opt_text(stmt.get(), 1, rec.filename);
    bind_opt_text(stmt.get(), 2, rec.content_type);
    bind_json(stmt.get(), 3, aliases);
    bind_json(stmt.get(), 4, rec.metadata);
    bind_json(stmt.get(), 5, rec.extra, true);
    sqlite3_bind_text(stmt.get(), 6, id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) return std::unexpected(step_error(rc));
    return static_cast<int64_t>(sqlite3_changes(db_));
}

std::expected<std::vector<std::string>, DbError> Database::distinct_filenames() {
    if (!db_) return std::unexpected(DbError::NotOpen);

    auto stmt = prepare(std::format(
        "SELECT DISTINCT filename FROM {} WHERE filename IS NOT NULL ORDER BY filename", files_table_));
    if (!stmt) return std::unexpected(DbError::QueryFailed);

    std::vector<std::string> names;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        names.push_back(column_opt_text(stmt.get(), 0).value_or(""));
    }
    if (rc != SQLITE_DONE) return std::unexpected(step_error(rc));
    return names;
}

// --- Chunks ---

std::expected<void, DbError> Database::insert_chunk(const ChunkRecord& chunk) {
    if (!db_) return std::unexpected(DbError::NotOpen);

    auto stmt = prepare(std::format("INSERT INTO {} (files_id, n, data) VALUES (?, ?, ?)", chunks_table_));
    if (!stmt) return std::unexpected(DbError::QueryFailed);

    sqlite3_bind_text(stmt.get(), 1, chunk.files_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 2, chunk.n);
    // A null pointer would bind NULL, which the schema rejects
    if (chunk.data.empty()) sqlite3_bind_zeroblob(stmt.get(), 3, 0);
    else sqlite3_bind_blob(stmt.get(), 3, chunk.data.data(), static_cast<int>(chunk.data.size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) return std::unexpected(step_error(rc));
    return {};
}

std::expected<std::optional<ChunkRecord>, DbError> Database::find_chunk(const std::string& files_id, int64_t n) {
    if (!db_) return std::unexpected(DbError::NotOpen);

    auto stmt = prepare(std::format("SELECT files_id, n, data FROM {} WHERE files_id = ? AND n = ?", chunks_table_));
    if (!stmt) return std::unexpected(DbError::QueryFailed);
    sqlite3_bind_text(stmt.get(), 1, files_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 2, n);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) return std::unexpected(step_error(rc));

    return ChunkRecord{files_id, sqlite3_column_int64(stmt.get(), 1), column_blob(stmt.get(), 2)};
}

std::expected<std::optional<ChunkRecord>, DbError> Database::find_extra_chunk(const std::string& files_id, int64_t from_n) {
    if (!db_) return std::unexpected(DbError::NotOpen);

    auto stmt = prepare(std::format(
        "SELECT files_id, n, data FROM {} WHERE files_id = ? AND n >= ? AND length(data) > 0 ORDER BY n LIMIT 1",
        chunks_table_));
    if (!stmt) return std::unexpected(DbError::QueryFailed);
    sqlite3_bind_text(stmt.get(), 1, files_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 2, from_n);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) return std::unexpected(step_error(rc));

    return ChunkRecord{files_id, sqlite3_column_int64(stmt.get(), 1), column_blob(stmt.get(), 2)};
}

std::expected<int64_t, DbError> Database::delete_chunks(const std::string& files_id, std::optional<int64_t> below_n) {
    if (!db_) return std::unexpected(DbError::NotOpen);

    std::string sql = std::format("DELETE FROM {} WHERE files_id = ?", chunks_table_);
    if (below_n) sql += " AND n < ?";

    auto stmt = prepare(sql);
    if (!stmt) return std::unexpected(DbError::QueryFailed);
    sqlite3_bind_text(stmt.get(), 1, files_id.c_str(), -1, SQLITE_TRANSIENT);
    if (below_n) sqlite3_bind_int64(stmt.get(), 2, *below_n);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) return std::unexpected(step_error(rc));
    return static_cast<int64_t>(sqlite3_changes(db_));
}

std::expected<int64_t, DbError> Database::count_chunks(const std::string& files_id) {
    if (!db_) return std::unexpected(DbError::NotOpen);

    auto stmt = prepare(std::format("SELECT COUNT(*) FROM {} WHERE files_id = ?", chunks_table_));
    if (!stmt) return std::unexpected(DbError::QueryFailed);
    sqlite3_bind_text(stmt.get(), 1, files_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW) return std::unexpected(step_error(rc));
    return sqlite3_column_int64(stmt.get(), 0);
}

} // namespace gridlite
