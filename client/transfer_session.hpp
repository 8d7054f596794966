#pragma once

// ============================================================
// transfer_session.hpp -- One connection, one transfer
//
//   Idle --open--> Connected --send--> Sending --close--> Closed
//
// A failed connect or a failed write goes straight to Closed.
// Sessions are single-use; the destructor always closes.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include "chunk_planner.hpp"
#include "endpoint.hpp"
#include <functional>
#include <memory>
#include <vector>

enum class SessionState {
    IDLE,
    CONNECTED,
    SENDING,
    CLOSED,
};

const char* session_state_str(SessionState s);

// Called after each chunk hits the socket
using ChunkProgressCallback =
    std::function<void(const ChunkView& chunk, u32 chunk_count, u64 bytes_sent, u64 bytes_total)>;

class TransferSession {
public:
    TransferSession() = default;
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // Connect to the receiver.  Throws ConnectionError; the session is
    // Closed afterwards and nothing has been written.
    void open(const Endpoint& endpoint);

    // Write magic, header, every chunk in order, then the argument
    // block.  Throws TransferError on the first failed write; the
    // session is Closed and the rest of the stream is dropped.
    void send(const WireHeader& header,
              ChunkSequence& chunks,
              const std::vector<u8>& arg_block,
              const ChunkProgressCallback& on_chunk = nullptr);

    // Release the connection.  Safe to call more than once.
    void close();

    SessionState state() const { return state_; }

    // Bytes handed to the socket so far (magic and header included)
    u64 bytes_written() const { return bytes_written_; }

private:
    std::unique_ptr<TcpSocket> sock_;
    SessionState state_{SessionState::IDLE};
    u64 bytes_written_{0};
    std::string peer_;

    void require_state(SessionState expected, const char* op) const;
    void write(const void* buf, size_t len, const std::string& what);
};
