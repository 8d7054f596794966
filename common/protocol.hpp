#pragma once

// protocol.hpp -- Wire protocol definitions for the homebrew loader
//
// Stream layout (one connection, client -> receiver only):
//
//   "HAXX" | WireHeader (12 bytes, big-endian) | zlib stream | arg block
//
// The receiver never answers.  Nothing is read back.

#include "platform.hpp"
#include <cstring>

// Magic: "HAXX"
static constexpr u8  HAXX_MAGIC[4]   = { 'H', 'A', 'X', 'X' };
static constexpr u32 HAXX_MAGIC_LEN  = 4;

static constexpr u8  PROTO_VERSION_MAJOR = 0;
static constexpr u8  PROTO_VERSION_MINOR = 5;

// Well-known receiver port
static constexpr u16 RECEIVER_PORT = 4299;

// Transport prefix the endpoint string must carry
static constexpr const char* ENDPOINT_PREFIX = "tcp:";

// Largest single socket write of compressed data
static constexpr u32 MAX_CHUNK_SIZE = 128u * 1024u;

// zlib level the receiver's loaders have always been fed
static constexpr int DEFLATE_LEVEL = 6;

// Field limits
static constexpr u32 MAX_ARG_BLOCK_LEN = 0xFFFFu;
static constexpr u64 MAX_PAYLOAD_LEN   = 0xFFFFFFFFull;

// ---- Header following the magic (12 bytes, big-endian on wire) ----
struct WireHeader {
    u8  version_major;
    u8  version_minor;
    u16 arg_block_len;
    u32 compressed_len;
    u32 original_len;
};

static constexpr size_t WIRE_HEADER_LEN = 12;

// ---- Artifact kinds the receiver can launch ----
enum class ArtifactKind : u8 {
    DOL = 0,  // executable-dol
    ELF = 1,  // executable-elf
    ZIP = 2,  // archive
};

inline const char* artifact_kind_str(ArtifactKind k) {
    switch (k) {
        case ArtifactKind::DOL: return "executable-dol";
        case ArtifactKind::ELF: return "executable-elf";
        case ArtifactKind::ZIP: return "archive";
    }
    return "unknown";
}
