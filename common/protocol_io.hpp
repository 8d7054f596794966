#pragma once

// ============================================================
// protocol_io.hpp -- Header/argument-block encoding with
//                    byte-order handling
// ============================================================

#include "protocol.hpp"
#include "errors.hpp"
#include <string>
#include <vector>

// Linux: htobe16/32 and be16/32toh live in <endian.h>
#if !defined(_WIN32) && !defined(__APPLE__)
#  include <endian.h>
#endif

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) {
#if defined(_WIN32) || defined(__APPLE__)
    return htons(v);
#else
    return htobe16(v);
#endif
}

inline u32 hton32(u32 v) {
#if defined(_WIN32) || defined(__APPLE__)
    return htonl(v);
#else
    return htobe32(v);
#endif
}

inline u16 ntoh16(u16 v) {
#if defined(_WIN32) || defined(__APPLE__)
    return ntohs(v);
#else
    return be16toh(v);
#endif
}

inline u32 ntoh32(u32 v) {
#if defined(_WIN32) || defined(__APPLE__)
    return ntohl(v);
#else
    return be32toh(v);
#endif
}

// ---- Header construction ----

// Build the header for one transfer.  Lengths are checked against the
// width of their wire fields; nothing is truncated silently.
inline WireHeader make_header(u64 arg_block_len, u64 compressed_len, u64 original_len) {
    if (arg_block_len > MAX_ARG_BLOCK_LEN) {
        throw ProtocolLimitError("Argument block is " + std::to_string(arg_block_len) +
                                 " bytes; the header field holds at most " +
                                 std::to_string(MAX_ARG_BLOCK_LEN));
    }
    if (compressed_len > MAX_PAYLOAD_LEN) {
        throw ProtocolLimitError("Compressed payload is " + std::to_string(compressed_len) +
                                 " bytes; the header field holds at most " +
                                 std::to_string(MAX_PAYLOAD_LEN));
    }
    if (original_len > MAX_PAYLOAD_LEN) {
        throw ProtocolLimitError("Payload is " + std::to_string(original_len) +
                                 " bytes; the header field holds at most " +
                                 std::to_string(MAX_PAYLOAD_LEN));
    }
    WireHeader h;
    h.version_major  = PROTO_VERSION_MAJOR;
    h.version_minor  = PROTO_VERSION_MINOR;
    h.arg_block_len  = static_cast<u16>(arg_block_len);
    h.compressed_len = static_cast<u32>(compressed_len);
    h.original_len   = static_cast<u32>(original_len);
    return h;
}

// ---- Serialise / deserialise WireHeader ----

inline void encode_header(const WireHeader& h, u8 buf[WIRE_HEADER_LEN]) {
    u16 al = hton16(h.arg_block_len);
    u32 cl = hton32(h.compressed_len);
    u32 ol = hton32(h.original_len);
    buf[0] = h.version_major;
    buf[1] = h.version_minor;
    std::memcpy(buf + 2, &al, 2);
    std::memcpy(buf + 4, &cl, 4);
    std::memcpy(buf + 8, &ol, 4);
}

inline WireHeader decode_header(const u8 buf[WIRE_HEADER_LEN]) {
    WireHeader h;
    u16 al; u32 cl, ol;
    std::memcpy(&al, buf + 2, 2);
    std::memcpy(&cl, buf + 4, 4);
    std::memcpy(&ol, buf + 8, 4);
    h.version_major  = buf[0];
    h.version_minor  = buf[1];
    h.arg_block_len  = ntoh16(al);
    h.compressed_len = ntoh32(cl);
    h.original_len   = ntoh32(ol);
    return h;
}

// ---- Argument block ----

// "<name>\0<arg1>\0...<argN>\0".  The payload name always comes first.
inline std::vector<u8> build_arg_block(const std::string& payload_name,
                                       const std::vector<std::string>& args) {
    std::vector<u8> block;
    auto append = [&block](const std::string& s) {
        if (s.find('\0') != std::string::npos) {
            throw ConfigurationError("Launch argument contains a NUL byte");
        }
        block.insert(block.end(), s.begin(), s.end());
        block.push_back('\0');
    };
    append(payload_name);
    for (const auto& a : args) append(a);
    return block;
}

// Inverse of build_arg_block, keeping the empty element after the
// trailing NUL: "a\0b\0" -> {"a", "b", ""}.
inline std::vector<std::string> split_arg_block(const std::vector<u8>& block) {
    std::vector<std::string> out;
    std::string cur;
    for (u8 c : block) {
        if (c == '\0') {
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(static_cast<char>(c));
        }
    }
    out.push_back(cur);
    return out;
}

} // namespace proto
