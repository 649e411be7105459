#include "respcodec/net/connection.hpp"

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <thread>

namespace respcodec::net::test {

class ConnectionTest : public ::testing::Test {
   protected:
    void SetUp() override {
        int fds[2];
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        conn_ = Connection(fds[0]);
        peer_ = fds[1];
    }

    void TearDown() override {
        close_peer();
    }

    void close_peer() {
        if (peer_ >= 0) {
            ::close(peer_);
            peer_ = -1;
        }
    }

    std::string peer_read(std::size_t n) {
        std::string out;
        char buf[256];
        while (out.size() < n) {
            ssize_t got = ::read(peer_, buf, std::min(sizeof(buf), n - out.size()));
            if (got <= 0) {
                break;
            }
            out.append(buf, static_cast<std::size_t>(got));
        }
        return out;
    }

    Connection conn_;
    int peer_ = -1;
};

TEST_F(ConnectionTest, SendWritesAllBytes) {
    std::string payload(100000, 'x');
    payload[0] = '*';
    payload.back() = '\n';

    // larger than the socket buffer, so drain from the peer side while sending
    std::string received;
    std::thread reader([&] { received = peer_read(payload.size()); });
    conn_.send(payload);
    reader.join();

    EXPECT_EQ(received, payload);
}

TEST_F(ConnectionTest, ReceiveReturnsAvailableBytes) {
    ASSERT_EQ(::write(peer_, "+PONG\r\n", 7), 7);

    std::string chunk = conn_.receive(1024);
    EXPECT_EQ(chunk, "+PONG\r\n");
}

TEST_F(ConnectionTest, ReceiveHonorsMaxBytes) {
    ASSERT_EQ(::write(peer_, "abcdef", 6), 6);

    EXPECT_EQ(conn_.receive(4), "abcd");
    EXPECT_EQ(conn_.receive(4), "ef");
}

TEST_F(ConnectionTest, ReceiveEmptyWhenPeerCloses) {
    close_peer();
    EXPECT_TRUE(conn_.receive(16).empty());
}

TEST_F(ConnectionTest, ZeroSizedReceiveThrows) {
    EXPECT_THROW((void)conn_.receive(0), std::invalid_argument);
}

TEST_F(ConnectionTest, SendToClosedPeerThrowsAndCloses) {
    close_peer();
    EXPECT_THROW(conn_.send("*1\r\n$4\r\nPING\r\n"), std::runtime_error);
    EXPECT_FALSE(conn_.is_open());
}

TEST_F(ConnectionTest, MoveTransfersOwnership) {
    int fd = conn_.fd();
    Connection moved(std::move(conn_));

    EXPECT_FALSE(conn_.is_open());
    EXPECT_TRUE(moved.is_open());
    EXPECT_EQ(moved.fd(), fd);
}

TEST_F(ConnectionTest, OperationsOnClosedConnectionThrow) {
    conn_.close();
    EXPECT_FALSE(conn_.is_open());
    EXPECT_THROW(conn_.send("x"), std::runtime_error);
    EXPECT_THROW((void)conn_.receive(1), std::runtime_error);
}

TEST(ConnectionConnectTest, ConnectsToListeningSocket) {
    int listener = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(listener, 0);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;  // let the kernel pick
    ASSERT_EQ(bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(listen(listener, 1), 0);

    socklen_t len = sizeof(addr);
    ASSERT_EQ(getsockname(listener, reinterpret_cast<sockaddr*>(&addr), &len), 0);

    ConnectionOptions opts;
    opts.host = "127.0.0.1";
    opts.port = ntohs(addr.sin_port);
    opts.timeout_seconds = 5;

    Connection conn = Connection::connect(opts);
    EXPECT_TRUE(conn.is_open());

    int accepted = accept(listener, nullptr, nullptr);
    ASSERT_GE(accepted, 0);

    conn.send("*1\r\n$4\r\nPING\r\n");
    char buf[64];
    ssize_t n = ::read(accepted, buf, sizeof(buf));
    EXPECT_EQ(std::string(buf, n > 0 ? static_cast<std::size_t>(n) : 0), "*1\r\n$4\r\nPING\r\n");

    ::close(accepted);
    ::close(listener);
}

TEST(ConnectionConnectTest, ConnectFailureThrows) {
    ConnectionOptions opts;
    opts.host = "not a valid host name";
    opts.port = 6379;

    EXPECT_THROW((void)Connection::connect(opts), std::runtime_error);
}

}  // namespace respcodec::net::test
