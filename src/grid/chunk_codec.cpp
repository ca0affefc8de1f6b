#include "chunk_codec.hpp"
#include <algorithm>

namespace gridlite::codec {

int64_t chunk_count(int64_t length, int64_t chunk_size) {
    if (length <= 0 || chunk_size <= 0) return 0;
    return (length + chunk_size - 1) / chunk_size;
}

int64_t chunk_index(int64_t pos, int64_t chunk_size) {
    return pos / chunk_size;
}

int64_t chunk_offset(int64_t pos, int64_t chunk_size) {
    return pos % chunk_size;
}

int64_t expected_chunk_length(int64_t index, int64_t length, int64_t chunk_size) {
    int64_t count = chunk_count(length, chunk_size);
    if (index < 0 || index >= count) return 0;
    if (index < count - 1) return chunk_size;
    return length - index * chunk_size;
}

std::vector<std::span<const uint8_t>> split_chunks(std::span<const uint8_t> data, int64_t chunk_size) {
    std::vector<std::span<const uint8_t>> out;
    if (chunk_size <= 0) return out;

    const auto cs = static_cast<size_t>(chunk_size);
    out.reserve((data.size() + cs - 1) / cs);

    for (size_t offset = 0; offset < data.size(); offset += cs) {
        out.push_back(data.subspan(offset, std::min(cs, data.size() - offset)));
    }
    return out;
}

} // namespace gridlite::codec
