#pragma once

// ============================================================
// compressor.hpp -- Payload compression (zlib, fixed level)
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "payload.hpp"
#include <vector>

struct CompressedPayload {
    u64             original_len{0};   // goes into the header verbatim
    std::vector<u8> data;              // what travels on the wire

    u64 compressed_len() const { return data.size(); }
};

// Read the whole payload and compress it.  NotFoundError if the file
// cannot be read, CompressionError if zlib fails.
CompressedPayload compress_payload(const ResolvedPayload& payload,
                                   int level = DEFLATE_LEVEL);

CompressedPayload compress_bytes(const void* data, size_t len,
                                 int level = DEFLATE_LEVEL);
