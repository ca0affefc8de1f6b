//
// Created by cv2 on 15.01.2026.
//

#pragma once
#include <vector>
#include <span>
#include <cstdint>

namespace gridlite::codec {

    // ceil(length / chunk_size); 0 for an empty file
    int64_t chunk_count(int64_t length, int64_t chunk_size);

    // Which chunk holds byte `pos`, and where inside it
    int64_t chunk_index(int64_t pos, int64_t chunk_size);
    int64_t chunk_offset(int64_t pos, int64_t chunk_size);

    // Size chunk #index must have in a well-formed file of `length` bytes (0 if out of range)
    int64_t expected_chunk_length(int64_t index, int64_t length, int64_t chunk_size);

    // Ordered views of at most chunk_size bytes each. Only the last may be short.
    std::vector<std::span<const uint8_t>> split_chunks(std::span<const uint8_t> data, int64_t chunk_size);

} // namespace gridlite::codec
