// ============================================================
// transfer_session.cpp -- One connection, one transfer
// ============================================================

#include "transfer_session.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include "../common/utils.hpp"
#include <stdexcept>

const char* session_state_str(SessionState s) {
    switch (s) {
        case SessionState::IDLE:      return "Idle";
        case SessionState::CONNECTED: return "Connected";
        case SessionState::SENDING:   return "Sending";
        case SessionState::CLOSED:    return "Closed";
    }
    return "?";
}

TransferSession::~TransferSession() {
    close();
}

void TransferSession::require_state(SessionState expected, const char* op) const {
    if (state_ != expected) {
        throw std::logic_error(std::string("TransferSession::") + op + " in state " +
                               session_state_str(state_) + " (expected " +
                               session_state_str(expected) + ")");
    }
}

void TransferSession::open(const Endpoint& endpoint) {
    require_state(SessionState::IDLE, "open");

    LOG_INFO("Connecting to " + endpoint.str() + "...");
    try {
        sock_ = std::make_unique<TcpSocket>();
        sock_->connect(endpoint.host, endpoint.port);
    } catch (const std::runtime_error& e) {
        close();
        throw ConnectionError("Can't connect to " + endpoint.str() + ": " + e.what());
    }

    peer_  = sock_->peer_addr();
    state_ = SessionState::CONNECTED;
    LOG_INFO("Connected to " + peer_);
}

void TransferSession::write(const void* buf, size_t len, const std::string& what) {
    try {
        sock_->send_all(buf, len);
    } catch (const std::runtime_error& e) {
        u64 done = bytes_written_;
        close();
        throw TransferError("Sending " + what + " to " + peer_ + " failed after " +
                            std::to_string(done) + " bytes: " + e.what());
    }
    bytes_written_ += len;
}

void TransferSession::send(const WireHeader& header,
                           ChunkSequence& chunks,
                           const std::vector<u8>& arg_block,
                           const ChunkProgressCallback& on_chunk)
{
    require_state(SessionState::CONNECTED, "send");

    // The receiver trusts these lengths blindly; a mismatch would
    // desynchronise its framing.
    if (header.compressed_len != chunks.total_bytes() ||
        header.arg_block_len != arg_block.size() || !chunks.untouched()) {
        throw std::logic_error("TransferSession::send: header does not describe the data");
    }

    state_ = SessionState::SENDING;

    u8 hdr_buf[WIRE_HEADER_LEN];
    proto::encode_header(header, hdr_buf);

    write(HAXX_MAGIC, HAXX_MAGIC_LEN, "magic");
    write(hdr_buf, WIRE_HEADER_LEN, "header");

    const u32 count = chunks.count();
    const u64 total = chunks.total_bytes();
    LOG_INFO("Sending " + std::to_string(count) + " pieces (" +
             utils::format_bytes(total) + ")...");

    u64 payload_sent = 0;
    ChunkView chunk;
    while (chunks.next(chunk)) {
        write(chunk.data, chunk.len,
              "chunk " + std::to_string(chunk.index + 1) + "/" + std::to_string(count));
        payload_sent += chunk.len;
        LOG_DEBUG("Chunk " + std::to_string(chunk.index + 1) + "/" + std::to_string(count) +
                  " offset=" + std::to_string(chunk.offset) +
                  " len=" + std::to_string(chunk.len));
        if (on_chunk) on_chunk(chunk, count, payload_sent, total);
    }

    write(arg_block.data(), arg_block.size(), "argument block");
    LOG_DEBUG("Wrote " + std::to_string(bytes_written_) + " bytes to " + peer_);
}

void TransferSession::close() {
    if (sock_) {
        sock_->close();
        sock_.reset();
    }
    state_ = SessionState::CLOSED;
}
