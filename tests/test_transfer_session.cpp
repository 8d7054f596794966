// ============================================================
// test_transfer_session.cpp -- Session state machine and the
//   exact byte stream a receiver sees
// ============================================================

#include "client/chunk_planner.hpp"
#include "client/compressor.hpp"
#include "client/transfer_session.hpp"
#include "common/compress.hpp"
#include "common/errors.hpp"
#include "common/protocol_io.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace testing_util;

static Endpoint loopback(u16 port) {
    Endpoint ep;
    ep.raw  = "tcp:127.0.0.1";
    ep.host = "127.0.0.1";
    ep.port = port;
    return ep;
}

TEST(TransferSession, StartsIdle) {
    TransferSession s;
    EXPECT_EQ(SessionState::IDLE, s.state());
    EXPECT_EQ(0u, s.bytes_written());
}

TEST(TransferSession, WritesMagicHeaderChunksThenArguments) {
    std::vector<u8> raw = random_bytes(300 * 1024, 3);
    CompressedPayload c = compress_bytes(raw.data(), raw.size());
    std::vector<u8> args = proto::build_arg_block("boot.dol", {"--fast", "x"});
    WireHeader h = proto::make_header(args.size(), c.compressed_len(), c.original_len);
    ChunkSequence chunks(c.data);

    LoopbackReceiver rx;
    std::vector<u32> seen;
    {
        TransferSession s;
        s.open(loopback(rx.port()));
        EXPECT_EQ(SessionState::CONNECTED, s.state());
        s.send(h, chunks, args,
               [&](const ChunkView& v, u32 count, u64 sent, u64 total) {
                   seen.push_back(v.index);
                   EXPECT_EQ(chunks.count(), count);
                   EXPECT_EQ(c.compressed_len(), total);
                   EXPECT_LE(sent, total);
               });
        EXPECT_EQ(SessionState::SENDING, s.state());
        EXPECT_EQ(4u + WIRE_HEADER_LEN + c.compressed_len() + args.size(), s.bytes_written());
        s.close();
        EXPECT_EQ(SessionState::CLOSED, s.state());
    }

    const CapturedTransfer& got = rx.wait();
    ASSERT_TRUE(got.complete) << got.error;
    EXPECT_EQ(0, std::memcmp(got.magic, "HAXX", 4));
    EXPECT_EQ(0, got.header.version_major);
    EXPECT_EQ(5, got.header.version_minor);
    EXPECT_EQ(args.size(), got.header.arg_block_len);
    EXPECT_EQ(c.compressed_len(), got.header.compressed_len);
    EXPECT_EQ(raw.size(), got.header.original_len);
    EXPECT_EQ(c.data, got.payload);
    EXPECT_EQ(args, got.arg_block);
    EXPECT_TRUE(got.trailing.empty());

    std::vector<u8> inflated = zlib_codec::decompress_to_vec(got.payload.data(), got.payload.size(),
                                                           got.header.original_len);
    EXPECT_EQ(raw, inflated);

    ASSERT_EQ(chunks.count(), seen.size());
    for (size_t i = 0; i < seen.size(); ++i) EXPECT_EQ(i, seen[i]);
}

TEST(TransferSession, ConnectionRefusedWritesNothing) {
    TransferSession s;
    EXPECT_THROW(s.open(loopback(unused_port())), ConnectionError);
    EXPECT_EQ(SessionState::CLOSED, s.state());
    EXPECT_EQ(0u, s.bytes_written());
}

TEST(TransferSession, UnresolvableHostIsConnectionError) {
    Endpoint ep;
    ep.raw  = "tcp:no-such-host.invalid";
    ep.host = "no-such-host.invalid";
    ep.port = RECEIVER_PORT;
    TransferSession s;
    EXPECT_THROW(s.open(ep), ConnectionError);
    EXPECT_EQ(SessionState::CLOSED, s.state());
}

TEST(TransferSession, IsSingleUse) {
    TransferSession s;
    EXPECT_THROW(s.open(loopback(unused_port())), ConnectionError);
    // Closed is terminal
    EXPECT_THROW(s.open(loopback(unused_port())), std::logic_error);

    std::vector<u8> empty;
    ChunkSequence chunks(empty);
    std::vector<u8> args = proto::build_arg_block("a.dol", {});
    WireHeader h = proto::make_header(args.size(), 0, 0);
    EXPECT_THROW(s.send(h, chunks, args), std::logic_error);
}

TEST(TransferSession, SendBeforeOpenIsRejected) {
    TransferSession s;
    std::vector<u8> empty;
    ChunkSequence chunks(empty);
    std::vector<u8> args = proto::build_arg_block("a.dol", {});
    WireHeader h = proto::make_header(args.size(), 0, 0);
    EXPECT_THROW(s.send(h, chunks, args), std::logic_error);
    EXPECT_EQ(SessionState::IDLE, s.state());
}

TEST(TransferSession, HeaderMustDescribeTheData) {
    std::vector<u8> data(100, 7);
    ChunkSequence chunks(data);
    std::vector<u8> args = proto::build_arg_block("a.dol", {});
    WireHeader wrong = proto::make_header(args.size(), 99, 100);

    LoopbackReceiver rx;
    TransferSession s;
    s.open(loopback(rx.port()));
    EXPECT_THROW(s.send(wrong, chunks, args), std::logic_error);
    EXPECT_EQ(0u, s.bytes_written());
    s.close();
    EXPECT_FALSE(rx.wait().complete);
}

TEST(TransferSession, PeerHangingUpIsTransferError) {
    // Incompressible and far larger than the socket buffers, so the
    // writes cannot all land before the reset arrives.
    std::vector<u8> raw = random_bytes(32 * 1024 * 1024, 11);
    CompressedPayload c = compress_bytes(raw.data(), raw.size(), 1);
    std::vector<u8> args = proto::build_arg_block("big.elf", {});
    WireHeader h = proto::make_header(args.size(), c.compressed_len(), c.original_len);
    ChunkSequence chunks(c.data);

    LoopbackReceiver rx(true);
    TransferSession s;
    s.open(loopback(rx.port()));
    rx.wait();
    EXPECT_THROW(s.send(h, chunks, args), TransferError);
    EXPECT_EQ(SessionState::CLOSED, s.state());
    EXPECT_LT(s.bytes_written(), 4u + WIRE_HEADER_LEN + c.compressed_len() + args.size());
}
