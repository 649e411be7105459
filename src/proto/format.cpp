#include "respcodec/proto/format.hpp"

#include <cstdio>

namespace respcodec::proto {

namespace {

void format_into(std::string& out, const Value& value, std::size_t indent) {
    switch (value.type) {
        case Value::Type::SimpleString:
            out += value.str();
            out += '\n';
            break;

        case Value::Type::Error:
            out += "(error) ";
            out += value.str();
            out += '\n';
            break;

        case Value::Type::Integer:
            out += "(integer) ";
            out += std::to_string(value.integer);
            out += '\n';
            break;

        case Value::Type::BulkString:
            out += value.data ? quote_bytes(*value.data) : "(nil)";
            out += '\n';
            break;

        case Value::Type::Array:
            if (value.null_array) {
                out += "(nil)\n";
                break;
            }
            if (value.elements.empty()) {
                out += "(empty array)\n";
                break;
            }
            for (std::size_t i = 0; i < value.elements.size(); ++i) {
                std::string label = std::to_string(i + 1) + ") ";
                // first item continues the caller's line
                if (i > 0) {
                    out.append(indent, ' ');
                }
                out += label;
                format_into(out, value.elements[i], indent + label.size());
            }
            break;
    }
}

}  // namespace

std::string format_reply(const Value& value) {
    std::string out;
    format_into(out, value, 0);
    return out;
}

std::string quote_bytes(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size() + 2);
    out += '"';
    for (char c : bytes) {
        switch (c) {
            case '\\':
                out += "\\\\";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default: {
                auto byte = static_cast<unsigned char>(c);
                if (byte < 0x20 || byte >= 0x7f) {
                    char hex[8];
                    std::snprintf(hex, sizeof(hex), "\\x%02x", byte);
                    out += hex;
                } else {
                    out += c;
                }
                break;
            }
        }
    }
    out += '"';
    return out;
}

}  // namespace respcodec::proto
