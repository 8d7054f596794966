#pragma once

// ============================================================
// chunk_planner.hpp -- Split the compressed stream into
//                      bounded socket writes
//
// The sequence is consumed once, front to back.  It borrows the
// buffer it was built from; keep that buffer alive meanwhile.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include <vector>

struct ChunkView {
    const u8* data{nullptr};
    size_t    len{0};
    u64       offset{0};   // offset in the compressed stream
    u32       index{0};
};

class ChunkSequence {
public:
    // max_chunk must be > 0 (std::invalid_argument otherwise)
    explicit ChunkSequence(const std::vector<u8>& bytes,
                           u32 max_chunk = MAX_CHUNK_SIZE);
    // The sequence only borrows the buffer
    ChunkSequence(std::vector<u8>&&, u32 = MAX_CHUNK_SIZE) = delete;

    // Total number of chunks (zero for an empty buffer)
    u32 count() const { return count_; }

    // Bytes covered by the whole sequence
    u64 total_bytes() const { return bytes_.size(); }

    // Fetch the next chunk; false once everything was handed out
    bool next(ChunkView& out);

    bool done() const { return next_index_ >= count_; }

    // Nothing handed out yet
    bool untouched() const { return next_index_ == 0; }

private:
    const std::vector<u8>& bytes_;
    u32 max_chunk_;
    u32 count_{0};
    u32 next_index_{0};
};
