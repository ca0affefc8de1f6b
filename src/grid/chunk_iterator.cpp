#include "chunk_iterator.hpp"
#include "chunk_codec.hpp"
#include "store_error.hpp"
#include <format>

namespace gridlite {

ChunkIterator::ChunkIterator(Database& db, std::string file_id, int64_t length, int64_t chunk_size)
    : db_(db), file_id_(std::move(file_id)), max_chunk_(codec::chunk_count(length, chunk_size)) {}

Result<Bytes> ChunkIterator::next() {
    if (!has_next()) return fail(ErrorCode::InvalidArgument, "chunk iterator exhausted");

    auto chunk = db_.find_chunk(file_id_, current_);
    if (!chunk) return std::unexpected(store_error(chunk.error(), std::format("find chunk #{}", current_)));
    if (!*chunk) return fail(ErrorCode::CorruptGridFile, std::format("no chunk #{}", current_));

    current_++;
    return std::move((*chunk)->data);
}

} // namespace gridlite
