#include "respcodec/proto/codec.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <system_error>
#include <utility>

/*
    wire format (RESP2):
    - *<N>\r\n         array header, N elements follow. N = -1 is the null array
    - $<L>\r\n<L bytes>\r\n   bulk string. L = -1 is the null bulk string
    - +<text>\r\n      simple string
    - -<text>\r\n      error
    - :<int>\r\n       signed 64 bit integer
    bulk strings are framed by length so the payload may hold any byte, \r and \n included.
*/

namespace respcodec::proto {

namespace {

constexpr std::string_view kCrlf = "\r\n";

// smallest possible frame is "+\r\n"
constexpr std::size_t kMinFrameSize = 3;

struct Cursor {
    std::string_view buf;
    std::size_t pos = 0;
    const DecoderOptions& options;
    std::string detail;
    std::size_t needed = 0;
};

bool parse_int64(std::string_view text, int64_t& out) {
    if (text.empty()) {
        return false;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    // from_chars rejects a leading '+' and reports overflow via ec
    return ec == std::errc() && ptr == last;
}

// line = bytes between pos and the next \r\n; pos moves past the terminator
DecodeStatus read_line(Cursor& cur, std::string_view& line) {
    std::size_t end = cur.buf.find(kCrlf, cur.pos);
    if (end == std::string_view::npos) {
        cur.detail = "no line terminator";
        return DecodeStatus::TruncatedFrame;
    }
    line = cur.buf.substr(cur.pos, end - cur.pos);
    cur.pos = end + kCrlf.size();
    return DecodeStatus::Ok;
}

DecodeStatus read_integer_line(Cursor& cur, const char* what, int64_t& out) {
    std::string_view line;
    DecodeStatus status = read_line(cur, line);
    if (status != DecodeStatus::Ok) {
        return status;
    }
    if (!parse_int64(line, out)) {
        cur.detail = std::string("invalid ") + what + " '" + std::string(line) + "'";
        return DecodeStatus::MalformedInteger;
    }
    return DecodeStatus::Ok;
}

DecodeStatus decode_value(Cursor& cur, std::size_t depth, Value& out);

DecodeStatus decode_bulk(Cursor& cur, Value& out) {
    int64_t len = 0;
    DecodeStatus status = read_integer_line(cur, "bulk length", len);
    if (status != DecodeStatus::Ok) {
        return status;
    }

    if (len == -1) {
        out = Value::null_bulk_string();
        return DecodeStatus::Ok;
    }
    if (len < 0) {
        cur.detail = "negative bulk length " + std::to_string(len);
        return DecodeStatus::MalformedInteger;
    }
    if (static_cast<uint64_t>(len) > cur.options.max_bulk_length) {
        cur.detail = "bulk length " + std::to_string(len) + " exceeds limit " +
                     std::to_string(cur.options.max_bulk_length);
        return DecodeStatus::FrameTooLarge;
    }

    auto size = static_cast<std::size_t>(len);
    if (cur.buf.size() - cur.pos < size + kCrlf.size()) {
        cur.detail = "bulk payload incomplete";
        cur.needed = cur.pos + size + kCrlf.size();
        return DecodeStatus::TruncatedFrame;
    }
    if (cur.buf.compare(cur.pos + size, kCrlf.size(), kCrlf) != 0) {
        cur.detail = "bulk payload of " + std::to_string(size) + " bytes not followed by CRLF";
        return DecodeStatus::MissingTerminator;
    }

    out = Value::bulk_string(std::string(cur.buf.substr(cur.pos, size)));
    cur.pos += size + kCrlf.size();
    return DecodeStatus::Ok;
}

DecodeStatus decode_array(Cursor& cur, std::size_t depth, Value& out) {
    if (depth >= cur.options.max_depth) {
        cur.detail = "array nesting exceeds " + std::to_string(cur.options.max_depth);
        return DecodeStatus::NestingTooDeep;
    }

    int64_t count = 0;
    DecodeStatus status = read_integer_line(cur, "array length", count);
    if (status != DecodeStatus::Ok) {
        return status;
    }

    if (count < 0) {
        out = Value::null();
        return DecodeStatus::Ok;
    }

    std::vector<Value> items;
    // each element takes at least 3 bytes, reserve no more than the buffer could hold
    std::size_t room = (cur.buf.size() - cur.pos) / kMinFrameSize;
    items.reserve(std::min(static_cast<std::size_t>(count), room));

    for (int64_t i = 0; i < count; ++i) {
        Value child;
        status = decode_value(cur, depth + 1, child);
        if (status != DecodeStatus::Ok) {
            return status;
        }
        items.push_back(std::move(child));
    }

    out = Value::array(std::move(items));
    return DecodeStatus::Ok;
}

DecodeStatus decode_value(Cursor& cur, std::size_t depth, Value& out) {
    if (cur.pos >= cur.buf.size()) {
        cur.detail = "no type byte";
        return DecodeStatus::TruncatedFrame;
    }

    char tag = cur.buf[cur.pos];
    switch (tag) {
        case '+':
        case '-': {
            ++cur.pos;
            std::string_view line;
            DecodeStatus status = read_line(cur, line);
            if (status != DecodeStatus::Ok) {
                return status;
            }
            out = (tag == '+') ? Value::simple_string(std::string(line))
                               : Value::error(std::string(line));
            return DecodeStatus::Ok;
        }

        case ':': {
            ++cur.pos;
            int64_t n = 0;
            DecodeStatus status = read_integer_line(cur, "integer", n);
            if (status != DecodeStatus::Ok) {
                return status;
            }
            out = Value::from_integer(n);
            return DecodeStatus::Ok;
        }

        case '$':
            ++cur.pos;
            return decode_bulk(cur, out);

        case '*':
            ++cur.pos;
            return decode_array(cur, depth, out);

        default: {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "0x%02x", static_cast<unsigned char>(tag));
            cur.detail = std::string("unknown type byte ") + hex + " at offset " +
                         std::to_string(cur.pos);
            return DecodeStatus::UnknownType;
        }
    }
}

void append_line(std::string& out, char tag, const std::string& text) {
    if (text.find_first_of("\r\n") != std::string::npos) {
        throw std::invalid_argument(std::string("line text for '") + tag +
                                    "' must not contain CR or LF");
    }
    out += tag;
    out += text;
    out += kCrlf;
}

void append_bulk(std::string& out, std::string_view bytes) {
    out += '$';
    out += std::to_string(bytes.size());
    out += kCrlf;
    out.append(bytes.data(), bytes.size());
    out += kCrlf;
}

void encode_into(std::string& out, const Value& value) {
    switch (value.type) {
        case Value::Type::SimpleString:
            append_line(out, '+', value.str());
            break;

        case Value::Type::Error:
            append_line(out, '-', value.str());
            break;

        case Value::Type::Integer:
            out += ':';
            out += std::to_string(value.integer);
            out += kCrlf;
            break;

        case Value::Type::BulkString:
            if (!value.data) {
                out += "$-1\r\n";
            } else {
                append_bulk(out, *value.data);
            }
            break;

        case Value::Type::Array:
            if (value.null_array) {
                out += "*-1\r\n";
                break;
            }
            out += '*';
            out += std::to_string(value.elements.size());
            out += kCrlf;
            for (const auto& element : value.elements) {
                encode_into(out, element);
            }
            break;
    }
}

}  // namespace

const char* status_to_string(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::Ok:
            return "ok";
        case DecodeStatus::TruncatedFrame:
            return "truncated frame";
        case DecodeStatus::MalformedInteger:
            return "malformed integer";
        case DecodeStatus::UnknownType:
            return "unknown type";
        case DecodeStatus::NestingTooDeep:
            return "nesting too deep";
        case DecodeStatus::MissingTerminator:
            return "missing terminator";
        case DecodeStatus::FrameTooLarge:
            return "frame too large";
    }
    return "unknown status";
}

ProtocolError::ProtocolError(DecodeStatus status, const std::string& detail)
    : std::runtime_error(std::string("protocol error (") + status_to_string(status) +
                         "): " + detail),
      status_(status) {}

std::string Codec::encode_command(const std::vector<std::string>& args) {
    std::size_t total = 16;
    for (const auto& arg : args) {
        total += arg.size() + 16;  // "$" + digits + 2 x CRLF
    }

    std::string out;
    out.reserve(total);
    out += '*';
    out += std::to_string(args.size());
    out += kCrlf;
    for (const auto& arg : args) {
        append_bulk(out, arg);
    }
    return out;
}

std::string Codec::encode(const Value& value) {
    std::string out;
    encode_into(out, value);
    return out;
}

DecodeResult Codec::decode_one(std::string_view buffer, const DecoderOptions& options) {
    Cursor cur{buffer, 0, options, {}};
    Value value;

    DecodeResult result;
    result.status = decode_value(cur, 0, value);

    if (result.status == DecodeStatus::Ok) {
        result.value = std::move(value);
        result.consumed = cur.pos;
        result.remainder = buffer.substr(cur.pos);
    } else {
        // nothing is consumed on failure, the caller's cursor stays where it was
        result.remainder = buffer;
        result.detail = std::move(cur.detail);
        result.needed = cur.needed;
    }
    return result;
}

BatchResult Codec::decode_all(std::string_view buffer, const DecoderOptions& options) {
    BatchResult batch;
    std::size_t offset = 0;

    while (offset < buffer.size()) {
        DecodeResult frame = decode_one(buffer.substr(offset), options);
        if (!frame.ok()) {
            batch.status = frame.status;
            batch.detail = std::move(frame.detail);
            break;
        }
        batch.values.push_back(std::move(*frame.value));
        offset += frame.consumed;
    }

    batch.consumed = offset;
    batch.remainder = buffer.substr(offset);
    return batch;
}

}  // namespace respcodec::proto
