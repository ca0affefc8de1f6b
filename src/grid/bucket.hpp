//
// Created by cv2 on 17.01.2026.
//

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <istream>
#include <ostream>
#include "../common/errors.hpp"
#include "../common/config.hpp"
#include "../common/crypto.hpp"
#include "../common/db.hpp"
#include "chunked_writer.hpp"
#include "chunked_reader.hpp"

namespace gridlite {

    struct BucketOptions {
        int64_t chunk_size = DEFAULT_CHUNK_SIZE;
        crypto::DigestAlgorithm digest = crypto::DigestAlgorithm::MD5;
    };

    struct UploadOptions {
        std::optional<int64_t> chunk_size; // Bucket default when absent
        std::optional<std::string> content_type;
        std::optional<std::vector<std::string>> aliases;
        json metadata;
    };

    // Named-file operations composed from the writer, reader and store.
    class Bucket {
    public:
        explicit Bucket(Database& db, BucketOptions options = {});

        // --- Upload ---
        Result<ChunkedWriter> open_upload_stream(const std::string& filename, const UploadOptions& opts = {});
        Result<ChunkedWriter> open_upload_stream_with_id(const std::string& file_id, const std::string& filename,
                                                         const UploadOptions& opts = {});

        // Returns the generated id
        Result<std::string> upload_from_stream(const std::string& filename, std::istream& source,
                                               const UploadOptions& opts = {});
        Result<void> upload_from_stream_with_id(const std::string& file_id, const std::string& filename,
                                                std::istream& source, const UploadOptions& opts = {});

        // --- Download ---

        // Resolves the record now, so a missing file fails here
        Result<ChunkedReader> open_download_stream(const std::string& file_id);
        Result<void> download_to_stream(const std::string& file_id, std::ostream& dest);

        // revision >= 0: n-th oldest upload; revision < 0: -1 is the newest, -2 the one before...
        Result<ChunkedReader> open_download_stream_by_name(const std::string& filename, int revision = -1);
        Result<void> download_to_stream_by_name(const std::string& filename, std::ostream& dest, int revision = -1);

        // --- Management ---
        Result<void> remove(const std::string& file_id);
        Result<void> rename(const std::string& file_id, const std::string& new_filename);
        Result<std::vector<ChunkedReader>> find(const FileQuery& query = {});
        Result<std::vector<std::string>> list();
        Result<bool> exists(const std::string& file_id);

        // First match in query order, or nullopt; the query's limit is ignored
        Result<std::optional<ChunkedReader>> find_one(const FileQuery& query);
        Result<bool> exists(const FileQuery& query);

        // Recomputes the digest over the stored chunks and compares with the record
        Result<bool> verify(const std::string& file_id);

        const BucketOptions& options() const { return options_; }

    private:
        Database& db_;
        BucketOptions options_;

        WriteOptions make_write_options(const std::string& filename, const UploadOptions& opts) const;
        Result<void> copy_to(ChunkedReader& reader, std::ostream& dest);
    };

} // namespace gridlite
