#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include <string>
#include <stdexcept>

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: connect to remote.  host is a dotted IPv4 address or a
    // name resolved through getaddrinfo.  Throws std::runtime_error.
    void connect(const std::string& host, u16 port);

    // Server: bind + listen (port 0 picks an ephemeral port)
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 1);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send exactly 'len' bytes; throws on error
    void send_all(const void* buf, size_t len);

    // Receive exactly 'len' bytes; returns false on clean close
    bool recv_all(void* buf, size_t len);

    // Apply TCP tuning for one-way bulk sends
    void tune();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    void close();

    // Get peer address as string
    std::string peer_addr() const;

    // Port the socket is bound to locally (0 if unknown)
    u16 local_port() const;

private:
    socket_t fd_{INVALID_SOCKET_VAL};

    void apply_socket_opts();
};

// Resolve host to an IPv4 sockaddr; throws std::runtime_error if the
// name does not resolve.
sockaddr_in resolve_ipv4(const std::string& host, u16 port);

// Wait for a connect() already under way on fd (non-blocking, or cut
// short by a signal) to complete.  Throws std::runtime_error carrying
// the socket's SO_ERROR if it failed.
void await_connect(socket_t fd);
