#include "respcodec/net/connection.hpp"

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace respcodec::net {

namespace {

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

void set_timeouts(int fd, int seconds) {
    if (seconds <= 0) {
        return;
    }
    struct timeval tv;
    tv.tv_sec = seconds;
    tv.tv_usec = 0;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        throw std::runtime_error(errno_message("failed to set socket timeout"));
    }
}

}  // namespace

Connection::Connection(int fd) noexcept : fd_(fd) {}

Connection::~Connection() {
    close();
}

Connection::Connection(Connection&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

Connection Connection::connect(const ConnectionOptions& options) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    std::string port = std::to_string(options.port);
    int rc = getaddrinfo(options.host.c_str(), port.c_str(), &hints, &results);
    if (rc != 0) {
        throw std::runtime_error("failed to resolve " + options.host + ": " + gai_strerror(rc));
    }

    // try each address until one connects
    std::string last_error = "no addresses";
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        Connection conn(socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!conn.is_open()) {
            last_error = errno_message("failed to create socket");
            continue;
        }

        if (::connect(conn.fd_, ai->ai_addr, ai->ai_addrlen) < 0) {
            last_error = errno_message("connect");
            continue;
        }

        freeaddrinfo(results);
        set_timeouts(conn.fd_, options.timeout_seconds);
        return conn;
    }

    freeaddrinfo(results);
    throw std::runtime_error("failed to connect to " + options.host + ":" + port + " (" +
                             last_error + ")");
}

void Connection::send(std::string_view bytes) {
    if (fd_ < 0) {
        throw std::runtime_error("not connected");
    }

    size_t total_sent = 0;
    while (total_sent < bytes.size()) {
        // MSG_NOSIGNAL: a closed peer gives EPIPE instead of killing the process
        ssize_t sent = ::send(fd_, bytes.data() + total_sent, bytes.size() - total_sent,
                              MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent <= 0) {
            std::string message = errno_message("failed to send");
            close();
            throw std::runtime_error(message);
        }
        total_sent += static_cast<size_t>(sent);
    }
}

std::string Connection::receive(std::size_t max_bytes) {
    if (fd_ < 0) {
        throw std::runtime_error("not connected");
    }
    // a zero sized read would look like the peer closing
    if (max_bytes == 0) {
        throw std::invalid_argument("receive size must be positive");
    }

    std::string chunk(max_bytes, '\0');
    ssize_t n = 0;
    do {
        n = ::recv(fd_, chunk.data(), chunk.size(), 0);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        bool timed_out = (errno == EAGAIN || errno == EWOULDBLOCK);
        std::string message = timed_out ? std::string("receive timed out")
                                        : errno_message("failed to receive");
        close();
        throw std::runtime_error(message);
    }

    chunk.resize(static_cast<std::size_t>(n));
    return chunk;
}

void Connection::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace respcodec::net
