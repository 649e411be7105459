#ifndef RESPCODEC_PROTO_CODEC_HPP
#define RESPCODEC_PROTO_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "respcodec/proto/value.hpp"

namespace respcodec::proto {

enum class DecodeStatus : uint8_t {
    Ok = 0,
    TruncatedFrame = 1,     // need more bytes, retry from the same start
    MalformedInteger = 2,   // integer reply or length field is not a decimal
    UnknownType = 3,        // first byte is not one of * $ + - :
    NestingTooDeep = 4,     // arrays nested past DecoderOptions::max_depth
    MissingTerminator = 5,  // bulk payload not followed by \r\n
    FrameTooLarge = 6,      // bulk length past DecoderOptions::max_bulk_length
};

[[nodiscard]] const char* status_to_string(DecodeStatus status);

// only a short read can be fixed by reading more
[[nodiscard]] constexpr bool is_recoverable(DecodeStatus status) noexcept {
    return status == DecodeStatus::TruncatedFrame;
}

struct DecoderOptions {
    std::size_t max_depth = 64;
    std::size_t max_bulk_length = 512 * 1024 * 1024;
};

/*
    result of decoding one top-level frame.
    on success value is set and consumed is the frame size. on any failure consumed is 0 and the
   input was not touched, so a truncated buffer can be extended and decoded again from the start.

    note: remainder is a view into the caller's buffer and dies with it.
*/
struct DecodeResult {
    DecodeStatus status = DecodeStatus::Ok;
    std::optional<Value> value;
    std::size_t consumed = 0;
    std::string_view remainder;
    std::string detail;
    // TruncatedFrame only: buffer size the frame needs at least before a retry can succeed,
    // 0 when it is not known yet
    std::size_t needed = 0;

    [[nodiscard]] bool ok() const noexcept {
        return status == DecodeStatus::Ok;
    }
    [[nodiscard]] bool incomplete() const noexcept {
        return status == DecodeStatus::TruncatedFrame;
    }
};

// result of decoding every complete frame in a buffer
struct BatchResult {
    std::vector<Value> values;
    std::size_t consumed = 0;
    std::string_view remainder;
    DecodeStatus status = DecodeStatus::Ok;  // what stopped decoding, Ok if buffer was used up
    std::string detail;
};

// thrown by transport code when a reply is not valid RESP
class ProtocolError : public std::runtime_error {
   public:
    ProtocolError(DecodeStatus status, const std::string& detail);

    [[nodiscard]] DecodeStatus status() const noexcept {
        return status_;
    }

   private:
    DecodeStatus status_;
};

class Codec {
   public:
    // *<N>\r\n followed by $<len>\r\n<bytes>\r\n per argument
    [[nodiscard]] static std::string encode_command(const std::vector<std::string>& args);

    // serialize any value, throws std::invalid_argument for line text holding \r or \n
    [[nodiscard]] static std::string encode(const Value& value);

    // decode exactly one top-level frame from the front of buffer
    [[nodiscard]] static DecodeResult decode_one(std::string_view buffer,
                                                 const DecoderOptions& options = {});

    // decode frames until the buffer is used up, a frame is incomplete, or one is invalid
    [[nodiscard]] static BatchResult decode_all(std::string_view buffer,
                                                const DecoderOptions& options = {});
};

}  // namespace respcodec::proto

#endif
