// ============================================================
// chunk_planner.cpp -- Split the compressed stream into
//                      bounded socket writes
// ============================================================

#include "chunk_planner.hpp"
#include <stdexcept>
#include <algorithm>

ChunkSequence::ChunkSequence(const std::vector<u8>& bytes, u32 max_chunk)
    : bytes_(bytes)
    , max_chunk_(max_chunk)
{
    if (max_chunk_ == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    count_ = (u32)((bytes_.size() + max_chunk_ - 1) / max_chunk_);
}

bool ChunkSequence::next(ChunkView& out) {
    if (done()) return false;

    u64 offset = (u64)next_index_ * max_chunk_;
    out.data   = bytes_.data() + offset;
    out.len    = (size_t)std::min<u64>(max_chunk_, bytes_.size() - offset);
    out.offset = offset;
    out.index  = next_index_;
    ++next_index_;
    return true;
}
