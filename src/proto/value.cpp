#include "respcodec/proto/value.hpp"

#include <utility>

namespace respcodec::proto {

namespace {
const std::string kEmpty;
}  // namespace

Value Value::simple_string(std::string text) {
    Value v;
    v.type = Type::SimpleString;
    v.data = std::move(text);
    return v;
}

Value Value::error(std::string text) {
    Value v;
    v.type = Type::Error;
    v.data = std::move(text);
    return v;
}

Value Value::from_integer(int64_t n) {
    Value v;
    v.type = Type::Integer;
    v.integer = n;
    return v;
}

Value Value::bulk_string(std::string bytes) {
    Value v;
    v.type = Type::BulkString;
    v.data = std::move(bytes);
    return v;
}

Value Value::null_bulk_string() {
    Value v;
    v.type = Type::BulkString;
    v.data = std::nullopt;
    return v;
}

Value Value::array(std::vector<Value> items) {
    Value v;
    v.type = Type::Array;
    v.elements = std::move(items);
    return v;
}

Value Value::null() {
    Value v;
    v.type = Type::Array;
    v.null_array = true;
    return v;
}

bool Value::is_null() const noexcept {
    if (type == Type::BulkString) {
        return !data.has_value();
    }
    if (type == Type::Array) {
        return null_array;
    }
    return false;
}

const std::string& Value::str() const {
    return data ? *data : kEmpty;
}

bool Value::operator==(const Value& other) const {
    if (type != other.type) {
        return false;
    }

    switch (type) {
        case Type::SimpleString:
        case Type::Error:
        case Type::BulkString:
            // optional compare keeps null and "" apart
            return data == other.data;
        case Type::Integer:
            return integer == other.integer;
        case Type::Array:
            return null_array == other.null_array && elements == other.elements;
    }
    return false;
}

const char* type_name(Value::Type type) {
    switch (type) {
        case Value::Type::SimpleString:
            return "simple-string";
        case Value::Type::Error:
            return "error";
        case Value::Type::Integer:
            return "integer";
        case Value::Type::BulkString:
            return "bulk-string";
        case Value::Type::Array:
            return "array";
    }
    return "unknown";
}

}  // namespace respcodec::proto
