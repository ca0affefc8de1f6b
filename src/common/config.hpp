//
// Created by cv2 on 15.01.2026.
//

#pragma once
#include <string>
#include <cstdint>
#include "errors.hpp"
#include "crypto.hpp"

namespace gridlite {

    // 255 KiB: slightly under a power of two
    constexpr int64_t DEFAULT_CHUNK_SIZE = 255 * 1024;

    struct Config {
        std::string database = "grid.db";
        std::string bucket = "fs";
        int64_t chunk_size = DEFAULT_CHUNK_SIZE;
        crypto::DigestAlgorithm digest = crypto::DigestAlgorithm::MD5;
    };

    // Reads a JSON object such as
    //   { "database": "grid.db", "bucket": "fs", "chunk_size": 261120, "digest": "md5" }
    // A missing file yields the defaults.
    Result<Config> load_config(const std::string& path);

    // Same rules, from an in-memory document
    Result<Config> parse_config(const std::string& text);

} // namespace gridlite
