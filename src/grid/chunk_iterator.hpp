//
// Created by cv2 on 16.01.2026.
//

#pragma once
#include <string>
#include <cstdint>
#include "../common/errors.hpp"
#include "../common/db.hpp"

namespace gridlite {

    // Forward-only walk over chunks 0 .. ceil(length / chunk_size) - 1.
    // One store lookup per step. Build a new iterator to start over.
    class ChunkIterator {
    public:
        ChunkIterator(Database& db, std::string file_id, int64_t length, int64_t chunk_size);

        bool has_next() const { return current_ < max_chunk_; }
        Result<Bytes> next();

        int64_t chunk_count() const { return max_chunk_; }
        int64_t current() const { return current_; }

    private:
        Database& db_;
        std::string file_id_;
        int64_t current_ = 0;
        int64_t max_chunk_ = 0;
    };

} // namespace gridlite
