#ifndef RESPCODEC_NET_COMMAND_LINE_HPP
#define RESPCODEC_NET_COMMAND_LINE_HPP

#include <string>
#include <string_view>
#include <vector>

namespace respcodec::net {

/*
    split a line of user input into command arguments.
    words are separated by whitespace. single or double quotes group words ("hello world") and
   may produce an empty argument (""). inside quotes \n \r \t \\ \" \' are unescaped.
    throws std::invalid_argument on an unterminated quote.
*/
[[nodiscard]] std::vector<std::string> split_command_line(std::string_view line);

}  // namespace respcodec::net

#endif
