#include "respcodec/net/reply_reader.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

#include "respcodec/util/logger.hpp"

namespace respcodec::net {

namespace {

// "$" + up to 20 length digits + two CRLFs
constexpr std::size_t kBulkFrameOverhead = 32;

// single receive calls stay below this even when a large bulk is pending
constexpr std::size_t kMaxReadSize = 1024 * 1024;

}  // namespace

ReplyReader::ReplyReader(const ReaderOptions& options) : options_(options) {
    // a bulk string the decoder accepts has to fit in the buffer
    constexpr std::size_t kMaxSize = std::numeric_limits<std::size_t>::max();
    std::size_t bulk_limit = options_.decoder.max_bulk_length;
    std::size_t largest_bulk =
        bulk_limit > kMaxSize - kBulkFrameOverhead ? kMaxSize : bulk_limit + kBulkFrameOverhead;
    if (options_.max_buffer_bytes < largest_bulk) {
        LOG_DEBUG("raising reply buffer limit from " + std::to_string(options_.max_buffer_bytes) +
                  " to " + std::to_string(largest_bulk) + " bytes");
        options_.max_buffer_bytes = largest_bulk;
    }
    if (options_.read_chunk_size == 0) {
        throw std::invalid_argument("read chunk size must be positive");
    }
}

void ReplyReader::write_command(Connection& conn, const std::vector<std::string>& args) {
    conn.send(proto::Codec::encode_command(args));
}

std::optional<proto::Value> ReplyReader::read_reply(Connection& conn) {
    while (true) {
        // a truncated bulk cannot complete before the buffer reaches needed_
        if (!buffer_.empty() && buffer_.size() >= needed_) {
            auto result = proto::Codec::decode_one(buffer_, options_.decoder);

            if (result.ok()) {
                proto::Value value = std::move(*result.value);
                buffer_.erase(0, result.consumed);
                needed_ = 0;
                return value;
            }

            if (!result.incomplete()) {
                // the stream is out of sync from here on, nothing buffered can be trusted
                LOG_WARN("dropping " + std::to_string(buffer_.size()) +
                         " buffered bytes: " + result.detail);
                reset();
                throw proto::ProtocolError(result.status, result.detail);
            }

            needed_ = result.needed;
        }

        if (buffer_.size() >= options_.max_buffer_bytes) {
            std::string detail = "reply still incomplete after " +
                                 std::to_string(buffer_.size()) + " bytes";
            LOG_WARN(detail);
            reset();
            throw proto::ProtocolError(proto::DecodeStatus::FrameTooLarge, detail);
        }

        std::size_t want = options_.read_chunk_size;
        if (needed_ > buffer_.size()) {
            want = std::max(want, std::min(needed_ - buffer_.size(), kMaxReadSize));
        }

        std::string chunk = conn.receive(want);
        if (chunk.empty()) {
            if (buffer_.empty()) {
                return std::nullopt;
            }
            std::size_t pending = buffer_.size();
            reset();
            throw std::runtime_error("connection closed with " + std::to_string(pending) +
                                     " bytes of an incomplete reply");
        }

        buffer_ += chunk;
        LOG_DEBUG("received " + std::to_string(chunk.size()) + " bytes, " +
                  std::to_string(buffer_.size()) + " buffered");
    }
}

std::optional<proto::Value> ReplyReader::execute(Connection& conn,
                                                 const std::vector<std::string>& args) {
    write_command(conn, args);
    return read_reply(conn);
}

void ReplyReader::reset() {
    buffer_.clear();
    needed_ = 0;
}

}  // namespace respcodec::net
