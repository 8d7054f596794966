#pragma once

// ============================================================
// compress.hpp -- zlib compression wrapper
// ============================================================

#include "platform.hpp"
#include "errors.hpp"
#include <vector>
#include <string>
#include <limits>

#include <zlib.h>

namespace zlib_codec {

// zlib refuses a null input pointer even for zero bytes on some builds
static const Bytef EMPTY_INPUT[1] = { 0 };

inline const Bytef* input_ptr(const void* src, size_t src_len) {
    return src_len == 0 ? EMPTY_INPUT : static_cast<const Bytef*>(src);
}

inline std::string zlib_error_str(int rc) {
    const char* s = zError(rc);
    return std::string(s ? s : "unknown") + " (rc=" + std::to_string(rc) + ")";
}

// Compress src into a zlib-wrapped stream (what uncompress() on the
// receiver expects).
inline std::vector<u8> compress_to_vec(const void* src, size_t src_len, int level) {
    if (src_len > std::numeric_limits<uLong>::max()) {
        throw CompressionError("Input too large for zlib: " + std::to_string(src_len) + " bytes");
    }
    uLongf cap = compressBound(static_cast<uLong>(src_len));
    std::vector<u8> buf(cap);
    int rc = compress2(buf.data(), &cap, input_ptr(src, src_len),
                       static_cast<uLong>(src_len), level);
    if (rc != Z_OK) {
        throw CompressionError("zlib compress error: " + zlib_error_str(rc));
    }
    buf.resize(cap);
    return buf;
}

// Decompress a zlib stream whose original size is known
inline std::vector<u8> decompress_to_vec(const void* src, size_t src_len, size_t original_size) {
    std::vector<u8> buf(original_size == 0 ? 1 : original_size);
    uLongf out_len = static_cast<uLongf>(original_size);
    int rc = uncompress(buf.data(), &out_len, input_ptr(src, src_len),
                        static_cast<uLong>(src_len));
    if (rc != Z_OK) {
        throw CompressionError("zlib decompress error: " + zlib_error_str(rc));
    }
    buf.resize(out_len);
    return buf;
}

// Raw deflate (no zlib header/trailer), as stored in ZIP entries
inline std::vector<u8> deflate_raw(const void* src, size_t src_len, int level) {
    z_stream zs{};
    int rc = deflateInit2(&zs, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        throw CompressionError("deflateInit2 failed: " + zlib_error_str(rc));
    }
    std::vector<u8> out(deflateBound(&zs, static_cast<uLong>(src_len)));
    zs.next_in   = const_cast<Bytef*>(input_ptr(src, src_len));
    zs.avail_in  = static_cast<uInt>(src_len);
    zs.next_out  = out.data();
    zs.avail_out = static_cast<uInt>(out.size());
    rc = deflate(&zs, Z_FINISH);
    size_t produced = zs.total_out;
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        throw CompressionError("deflate failed: " + zlib_error_str(rc));
    }
    out.resize(produced);
    return out;
}

// Inflate a raw deflate stream of known original size
inline std::vector<u8> inflate_raw(const void* src, size_t src_len, size_t original_size) {
    z_stream zs{};
    int rc = inflateInit2(&zs, -MAX_WBITS);
    if (rc != Z_OK) {
        throw CompressionError("inflateInit2 failed: " + zlib_error_str(rc));
    }
    std::vector<u8> out(original_size == 0 ? 1 : original_size);
    zs.next_in   = const_cast<Bytef*>(input_ptr(src, src_len));
    zs.avail_in  = static_cast<uInt>(src_len);
    zs.next_out  = out.data();
    zs.avail_out = static_cast<uInt>(out.size());
    rc = inflate(&zs, Z_FINISH);
    size_t produced = zs.total_out;
    inflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        throw CompressionError("inflate failed: " + zlib_error_str(rc));
    }
    out.resize(produced);
    return out;
}

inline u32 crc32_of(const void* data, size_t len) {
    uLong c = crc32(0L, Z_NULL, 0);
    c = crc32(c, input_ptr(data, len), static_cast<uInt>(len));
    return static_cast<u32>(c);
}

} // namespace zlib_codec
