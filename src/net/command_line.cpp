#include "respcodec/net/command_line.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace respcodec::net {

namespace {

char unescape(char c) {
    switch (c) {
        case 'n':
            return '\n';
        case 'r':
            return '\r';
        case 't':
            return '\t';
        default:
            return c;  // \\ \" \' and anything else stand for themselves
    }
}

}  // namespace

std::vector<std::string> split_command_line(std::string_view line) {
    std::vector<std::string> args;
    std::string current;
    bool have_token = false;  // lets "" count as an argument
    char quote = 0;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (quote != 0) {
            if (c == quote) {
                quote = 0;
            } else if (c == '\\' && i + 1 < line.size()) {
                current += unescape(line[++i]);
            } else {
                current += c;
            }
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(c))) {
            if (have_token) {
                args.push_back(std::move(current));
                current.clear();
                have_token = false;
            }
            continue;
        }

        have_token = true;
        if (c == '"' || c == '\'') {
            quote = c;
        } else {
            current += c;
        }
    }

    if (quote != 0) {
        throw std::invalid_argument("unbalanced quotes in command line");
    }
    if (have_token) {
        args.push_back(std::move(current));
    }
    return args;
}

}  // namespace respcodec::net
