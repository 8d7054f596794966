// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <algorithm>
#include <climits>
#ifndef _WIN32
#  include <poll.h>
#endif

// SO_SNDBUF: enough to keep a couple of 128 KiB chunks in flight
static constexpr int SOCKET_SNDBUF_SIZE = 512 * 1024;

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("socket() failed: " + socket_error_str(last_socket_error()));
    }
    apply_socket_opts();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {
    if (fd_ != INVALID_SOCKET_VAL) {
        apply_socket_opts();
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    int on = 1;
#ifdef _WIN32
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, (const char*)&on, sizeof(on));
#else
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#endif
}

void TcpSocket::tune() {
    int keepalive = 1;
    int sndbuf = SOCKET_SNDBUF_SIZE;

#ifdef _WIN32
    setsockopt(fd_, SOL_SOCKET, SO_KEEPALIVE, (const char*)&keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET, SO_SNDBUF,    (const char*)&sndbuf,    sizeof(sndbuf));
#else
    setsockopt(fd_, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET, SO_SNDBUF,    &sndbuf,    sizeof(sndbuf));
#endif
}

sockaddr_in resolve_ipv4(const std::string& host, u16 port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) {
        return addr;
    }

    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (rc != 0 || result == nullptr) {
        if (result) ::freeaddrinfo(result);
#ifdef _WIN32
        throw std::runtime_error("Cannot resolve host '" + host + "': " +
                                 socket_error_str(rc));
#else
        throw std::runtime_error("Cannot resolve host '" + host + "': " +
                                 std::string(gai_strerror(rc)));
#endif
    }
    addr.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    ::freeaddrinfo(result);
    return addr;
}

void TcpSocket::connect(const std::string& host, u16 port) {
    sockaddr_in addr = resolve_ipv4(host, port);
    if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        int err = last_socket_error();
        if (!interrupted(err)) {
            throw std::runtime_error("connect() failed: " + socket_error_str(err));
        }
        // An interrupted connect() keeps going in the background
        await_connect(fd_);
    }
    tune();
}

void await_connect(socket_t fd) {
#ifdef _WIN32
    WSAPOLLFD pfd{};
    pfd.fd     = fd;
    pfd.events = POLLOUT;
    int rc = ::WSAPoll(&pfd, 1, -1);
#else
    pollfd pfd{};
    pfd.fd     = fd;
    pfd.events = POLLOUT;
    int rc;
    do {
        rc = ::poll(&pfd, 1, -1);
    } while (rc < 0 && interrupted(last_socket_error()));
#endif
    if (rc < 0) {
        throw std::runtime_error("poll() failed: " + socket_error_str(last_socket_error()));
    }

    int err = 0;
#ifdef _WIN32
    int len = sizeof(err);
    int grc = getsockopt(fd, SOL_SOCKET, SO_ERROR, (char*)&err, &len);
#else
    socklen_t len = sizeof(err);
    int grc = getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len);
#endif
    if (grc == SOCKET_ERROR_VAL) err = last_socket_error();
    if (err != 0) {
        throw std::runtime_error("connect() failed: " + socket_error_str(err));
    }
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid IP address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("bind() failed: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
#ifdef _WIN32
    int peer_len = sizeof(peer);
#else
    socklen_t peer_len = sizeof(peer);
#endif
    socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
    if (client == INVALID_SOCKET_VAL) {
        throw std::runtime_error("accept() failed: " + socket_error_str(last_socket_error()));
    }
    return TcpSocket(client);
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        int sent = ::send(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), SEND_FLAGS);
#else
        ssize_t sent = ::send(fd_, p, remaining, SEND_FLAGS);
#endif
        if (sent < 0) {
            int err = last_socket_error();
            if (interrupted(err)) continue;
            throw std::runtime_error("send() failed: " + socket_error_str(err));
        }
        if (sent == 0) {
            throw std::runtime_error("Connection closed during send");
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

bool TcpSocket::recv_all(void* buf, size_t len) {
    char* p = static_cast<char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        int received = ::recv(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t received = ::recv(fd_, p, remaining, 0);
#endif
        if (received == 0) return false; // clean close
        if (received < 0) {
            int err = last_socket_error();
            if (interrupted(err)) continue;
            throw std::runtime_error("recv() failed: " + socket_error_str(err));
        }
        p += received;
        remaining -= static_cast<size_t>(received);
    }
    return true;
}

void TcpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
#ifdef _WIN32
    int len = sizeof(peer);
#else
    socklen_t len = sizeof(peer);
#endif
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
        }
    }
    return "unknown";
}

u16 TcpSocket::local_port() const {
    sockaddr_in local{};
#ifdef _WIN32
    int len = sizeof(local);
#else
    socklen_t len = sizeof(local);
#endif
    if (getsockname(fd_, (sockaddr*)&local, &len) == 0) {
        return ntohs(local.sin_port);
    }
    return 0;
}
