#ifndef RESPCODEC_NET_CONNECTION_HPP
#define RESPCODEC_NET_CONNECTION_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace respcodec::net {

struct ConnectionOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    int timeout_seconds = 30;  // 0 disables send/receive timeouts
};

/*
    owns one connected stream socket. move-only, closes on destruction.
    there is no reconnect: a failed send/receive closes the socket and throws, callers decide what
   to do next.
*/
class Connection {
   public:
    Connection() = default;
    explicit Connection(int fd) noexcept;  // adopt an already connected fd
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    // resolve host (IPv4 or IPv6) and connect, throws std::runtime_error
    [[nodiscard]] static Connection connect(const ConnectionOptions& options);

    // write every byte, throws std::runtime_error
    void send(std::string_view bytes);

    // up to max_bytes, empty when the peer closed; throws std::runtime_error on errors/timeouts
    [[nodiscard]] std::string receive(std::size_t max_bytes);

    void close() noexcept;
    [[nodiscard]] bool is_open() const noexcept {
        return fd_ >= 0;
    }
    [[nodiscard]] int fd() const noexcept {
        return fd_;
    }

   private:
    int fd_ = -1;
};

}  // namespace respcodec::net

#endif
