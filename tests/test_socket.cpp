// ============================================================
// test_socket.cpp -- Finishing a connect() that is still in
//   progress
// ============================================================

#include "common/socket.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

#ifndef _WIN32
#include <fcntl.h>

using testing_util::unused_port;

namespace {

// Start a non-blocking connect; returns 0 or the errno it left behind
int begin_connect(TcpSocket& s, u16 port) {
    int flags = ::fcntl(s.native(), F_GETFL, 0);
    ::fcntl(s.native(), F_SETFL, flags | O_NONBLOCK);
    sockaddr_in addr = resolve_ipv4("127.0.0.1", port);
    if (::connect(s.native(), (sockaddr*)&addr, sizeof(addr)) == 0) return 0;
    return errno;
}

} // namespace

TEST(AwaitConnect, CompletesHandshakeAlreadyUnderWay) {
    TcpSocket listener;
    listener.bind_and_listen("127.0.0.1", 0, 4);

    TcpSocket client;
    int err = begin_connect(client, listener.local_port());
    ASSERT_TRUE(err == 0 || err == EINPROGRESS) << socket_error_str(err);
    EXPECT_NO_THROW(await_connect(client.native()));

    TcpSocket accepted = listener.accept();
    EXPECT_TRUE(accepted.is_valid());
}

TEST(AwaitConnect, ReportsRefusedHandshake) {
    TcpSocket client;
    int err = begin_connect(client, unused_port());
    if (err == EINPROGRESS) {
        EXPECT_THROW(await_connect(client.native()), std::runtime_error);
    } else {
        EXPECT_EQ(ECONNREFUSED, err);
    }
}

#endif
