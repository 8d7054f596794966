// ============================================================
// test_compressor.cpp -- zlib payload compression
// ============================================================

#include "client/compressor.hpp"
#include "client/payload.hpp"
#include "common/compress.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace testing_util;

TEST(CompressPayload, KeepsOriginalLengthAndInflatesBack) {
    TempDir tmp;
    std::vector<u8> data = text_bytes(300 * 1024);
    write_file(tmp.path() / "big.elf", data);

    CompressedPayload c = compress_payload(resolve_payload(tmp.str("big.elf")));
    EXPECT_EQ(data.size(), c.original_len);
    EXPECT_EQ(c.data.size(), c.compressed_len());
    EXPECT_LT(c.compressed_len(), c.original_len);

    std::vector<u8> back = zlib_codec::decompress_to_vec(c.data.data(), c.data.size(),
                                                       (size_t)c.original_len);
    EXPECT_EQ(data, back);
}

TEST(CompressPayload, ProducesZlibWrappedStream) {
    CompressedPayload c = compress_bytes("hello", 5);
    ASSERT_GE(c.data.size(), 2u);
    // CMF 0x78 = deflate, 32K window; FCHECK makes the pair a multiple of 31
    EXPECT_EQ(0x78, c.data[0]);
    EXPECT_EQ(0u, ((unsigned)c.data[0] * 256 + c.data[1]) % 31);
}

TEST(CompressPayload, DeterministicForSameInput) {
    std::vector<u8> data = random_bytes(50000, 7);
    CompressedPayload a = compress_bytes(data.data(), data.size());
    CompressedPayload b = compress_bytes(data.data(), data.size());
    EXPECT_EQ(a.data, b.data);
}

TEST(CompressPayload, EmptyFileStillYieldsValidStream) {
    TempDir tmp;
    write_file(tmp.path() / "empty.dol", std::vector<u8>{});
    CompressedPayload c = compress_payload(resolve_payload(tmp.str("empty.dol")));
    EXPECT_EQ(0u, c.original_len);
    EXPECT_GT(c.compressed_len(), 0u);
    EXPECT_TRUE(zlib_codec::decompress_to_vec(c.data.data(), c.data.size(), 0).empty());
}

TEST(CompressPayload, VanishedFileIsNotFound) {
    TempDir tmp;
    write_file(tmp.path() / "gone.dol", std::string("x"));
    ResolvedPayload p = resolve_payload(tmp.str("gone.dol"));
    fs::remove(tmp.path() / "gone.dol");
    EXPECT_THROW(compress_payload(p), NotFoundError);
}

TEST(CompressPayload, BadLevelIsCompressionError) {
    EXPECT_THROW(compress_bytes("abc", 3, 42), CompressionError);
}
