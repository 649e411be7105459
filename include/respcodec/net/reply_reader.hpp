#ifndef RESPCODEC_NET_REPLY_READER_HPP
#define RESPCODEC_NET_REPLY_READER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "respcodec/net/connection.hpp"
#include "respcodec/proto/codec.hpp"
#include "respcodec/proto/value.hpp"

namespace respcodec::net {

struct ReaderOptions {
    proto::DecoderOptions decoder;
    std::size_t read_chunk_size = 16 * 1024;
    // raised by the reader to hold at least one bulk of decoder.max_bulk_length
    std::size_t max_buffer_bytes = 1024 * 1024 * 1024;
};

/*
    buffers the bytes received on one connection and hands out one reply per read_reply call.
    the connection is passed in on every call, the reader never holds on to it. bytes past the
   first reply (a pipelined second reply, say) stay buffered for the next call, so use one reader
   per connection.
*/
class ReplyReader {
   public:
    // throws std::invalid_argument for a zero read_chunk_size
    explicit ReplyReader(const ReaderOptions& options = {});

    // encode args as a command and send it
    void write_command(Connection& conn, const std::vector<std::string>& args);

    /*
        decode the next reply, receiving more bytes while the buffered frame is truncated.
        - nullopt: peer closed cleanly with nothing buffered
        - throws proto::ProtocolError for invalid RESP or a frame past max_buffer_bytes
        - throws std::runtime_error for socket errors or a close in the middle of a reply
    */
    [[nodiscard]] std::optional<proto::Value> read_reply(Connection& conn);

    // write_command + read_reply
    [[nodiscard]] std::optional<proto::Value> execute(Connection& conn,
                                                      const std::vector<std::string>& args);

    [[nodiscard]] std::size_t buffered() const noexcept {
        return buffer_.size();
    }

    [[nodiscard]] const ReaderOptions& options() const noexcept {
        return options_;
    }

   private:
    void reset();

    ReaderOptions options_;
    std::string buffer_;
    std::size_t needed_ = 0;
};

}  // namespace respcodec::net

#endif
