// ============================================================
// compressor.cpp -- Payload compression (zlib, fixed level)
// ============================================================

#include "compressor.hpp"
#include "../common/compress.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <memory>

CompressedPayload compress_bytes(const void* data, size_t len, int level) {
    CompressedPayload out;
    out.original_len = len;
    out.data = zlib_codec::compress_to_vec(data, len, level);
    return out;
}

CompressedPayload compress_payload(const ResolvedPayload& payload, int level) {
    std::unique_ptr<file_io::MmapReader> reader;
    try {
        reader = std::make_unique<file_io::MmapReader>(payload.path);
    } catch (const std::runtime_error& e) {
        throw NotFoundError(std::string("Cannot read payload: ") + e.what());
    }

    CompressedPayload out = compress_bytes(reader->data(), (size_t)reader->size(), level);
    reader->close();

    LOG_DEBUG("Compressed " + payload.name() + ": " +
              utils::format_bytes(out.original_len) + " -> " +
              utils::format_bytes(out.compressed_len()) + " (" +
              utils::format_ratio(out.compressed_len(), out.original_len) + ")");
    return out;
}
