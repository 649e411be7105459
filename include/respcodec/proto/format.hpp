#ifndef RESPCODEC_PROTO_FORMAT_HPP
#define RESPCODEC_PROTO_FORMAT_HPP

#include <string>
#include <string_view>

#include "respcodec/proto/value.hpp"

namespace respcodec::proto {

/*
    human readable rendering, same layout as redis-cli:
        "value"          bulk string (quoted, escaped)
        OK               simple string
        (error) ERR x    error
        (integer) 5      integer
        (nil)            null bulk string / null array
        (empty array)
        1) "a"           arrays, nested ones indented under their index
        2) 1) (integer) 1
           2) "b"
    every line ends with '\n'.
*/
[[nodiscard]] std::string format_reply(const Value& value);

// double quoted with C style escapes for quotes, backslash and non-printable bytes
[[nodiscard]] std::string quote_bytes(std::string_view bytes);

}  // namespace respcodec::proto

#endif
