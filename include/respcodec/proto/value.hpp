#ifndef RESPCODEC_PROTO_VALUE_HPP
#define RESPCODEC_PROTO_VALUE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace respcodec::proto {

/*
    one decoded RESP unit.
    - SimpleString / Error: text lives in data (never nullopt)
    - Integer: integer
    - BulkString: data, nullopt means the null bulk string ($-1)
    - Array: elements, null_array marks *-1 (elements stays empty)

    note: we keep a flat struct instead of std::variant so the wire type is always readable from
   `type` and arrays can own their children by value.
*/
struct Value {
    enum class Type : uint8_t {
        SimpleString = 0,
        Error = 1,
        Integer = 2,
        BulkString = 3,
        Array = 4,
    };

    Type type = Type::BulkString;
    std::optional<std::string> data;
    int64_t integer = 0;
    std::vector<Value> elements;
    bool null_array = false;

    static Value simple_string(std::string text);
    static Value error(std::string text);
    static Value from_integer(int64_t n);
    static Value bulk_string(std::string bytes);
    static Value null_bulk_string();
    static Value array(std::vector<Value> items = {});
    static Value null();  // the null array (*-1)

    [[nodiscard]] bool is_null() const noexcept;
    [[nodiscard]] bool is_error() const noexcept {
        return type == Type::Error;
    }

    // text of a simple string, error or bulk string; empty for null bulk
    [[nodiscard]] const std::string& str() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const {
        return !(*this == other);
    }
};

[[nodiscard]] const char* type_name(Value::Type type);

}  // namespace respcodec::proto

#endif
