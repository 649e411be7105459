#include <filesystem>
#include <iostream>
#include <string>

#include "respcodec/net/command_line.hpp"
#include "respcodec/net/connection.hpp"
#include "respcodec/net/reply_reader.hpp"
#include "respcodec/proto/format.hpp"
#include "respcodec/util/config.hpp"
#include "respcodec/util/logger.hpp"

using namespace respcodec;

int main(int argc, char* argv[]) {
    util::Config config;

    try {
        util::Config defaults;
        util::Config file_config = defaults;

        std::filesystem::path config_path = util::Config::find_config_path(argc, argv);
        if (!config_path.empty()) {
            auto loaded = util::Config::load_file(config_path);
            if (loaded) {
                file_config = *loaded;
            } else {
                std::cerr << "Warning: Could not load config file: " << config_path << std::endl;
            }
        }

        auto cli_config = util::Config::parse_args(argc, argv);
        if (!cli_config) {
            return 0;  // --help was shown
        }

        // Merge: CLI > file > defaults
        config = util::Config::merge(file_config, *cli_config, defaults);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    util::Logger::instance().set_level(config.log_level);

    net::ConnectionOptions conn_opts;
    conn_opts.host = config.host;
    conn_opts.port = config.port;
    conn_opts.timeout_seconds = config.timeout_seconds;

    net::Connection conn;
    try {
        conn = net::Connection::connect(conn_opts);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("connection failed: ") + e.what());
        return 1;
    }
    LOG_INFO("connected to " + config.host + ":" + std::to_string(config.port));

    net::ReaderOptions reader_opts;
    reader_opts.decoder = config.decoder_options();
    net::ReplyReader reader(reader_opts);

    std::string line;
    std::cout << "Enter command: " << std::flush;

    while (std::getline(std::cin, line)) {
        if (line == "exit") {
            break;
        }

        try {
            auto args = net::split_command_line(line);
            if (!args.empty()) {
                auto reply = reader.execute(conn, args);
                if (!reply) {
                    LOG_WARN("server closed the connection");
                    return 1;
                }
                std::cout << proto::format_reply(*reply);
            }
        } catch (const std::invalid_argument& e) {
            std::cout << "(error) " << e.what() << std::endl;
        } catch (const std::exception& e) {
            // socket and protocol failures leave the stream unusable
            LOG_ERROR(e.what());
            return 1;
        }

        std::cout << "Enter command: " << std::flush;
    }

    return 0;
}
