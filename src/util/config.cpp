#include "respcodec/util/config.hpp"

#include <charconv>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace respcodec::util {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

LogLevel to_log_level(const std::string& s) {
    auto level = parse_log_level(s);
    if (!level) {
        throw std::invalid_argument("invalid log level: " + s);
    }
    return *level;
}

// unsigned decimal only: no sign, no trailing text, must fit in 64 bits
uint64_t to_unsigned(const std::string& s, const char* what) {
    uint64_t value = 0;
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), last, value);
    if (s.empty() || ec != std::errc() || ptr != last) {
        throw std::invalid_argument(std::string("invalid ") + what + ": " + s);
    }
    return value;
}

uint16_t to_port(const std::string& s) {
    uint64_t port = to_unsigned(s, "port");
    if (port == 0 || port > 65535) {
        throw std::invalid_argument("invalid port: " + s);
    }
    return static_cast<uint16_t>(port);
}

int to_timeout(const std::string& s) {
    uint64_t seconds = to_unsigned(s, "timeout");
    if (seconds > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("invalid timeout: " + s);
    }
    return static_cast<int>(seconds);
}

std::size_t to_max_depth(const std::string& s) {
    uint64_t depth = to_unsigned(s, "max depth");
    if (depth == 0 || depth > Config::kMaxDepthLimit) {
        throw std::invalid_argument("max depth must be between 1 and " +
                                    std::to_string(Config::kMaxDepthLimit) + ": " + s);
    }
    return static_cast<std::size_t>(depth);
}

std::size_t to_max_bulk_length(const std::string& s) {
    uint64_t length = to_unsigned(s, "max bulk length");
    if (length > Config::kMaxBulkLengthLimit) {
        throw std::invalid_argument("max bulk length must be at most " +
                                    std::to_string(Config::kMaxBulkLengthLimit) + ": " + s);
    }
    return static_cast<std::size_t>(length);
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -c, --config FILE        Config file path\n"
              << "  -H, --host HOST          Server host (default: 127.0.0.1)\n"
              << "  -p, --port PORT          Server port (default: 6379)\n"
              << "  -t, --timeout SEC        Socket timeout seconds (default: 30)\n"
              << "  -l, --log-level LEVEL    Log level: debug, info, warn, error, none\n"
              << "  --max-depth N            Max reply nesting (default: 64)\n"
              << "  --max-bulk-length N      Max bulk string bytes (default: 536870912)\n"
              << "  -h, --help               Show this help\n"
              << "\n"
              << "Type a command such as 'SET key value' at the prompt, 'exit' to quit.\n";
}

}  // namespace

std::optional<Config> Config::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // remove quotes if present
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (key == "host") {
            config.host = value;
        } else if (key == "port") {
            config.port = to_port(value);
        } else if (key == "timeout_seconds") {
            config.timeout_seconds = to_timeout(value);
        } else if (key == "max_depth") {
            config.max_depth = to_max_depth(value);
        } else if (key == "max_bulk_length") {
            config.max_bulk_length = to_max_bulk_length(value);
        } else if (key == "log_level") {
            config.log_level = to_log_level(value);
        }
    }

    return config;
}

std::optional<Config> Config::parse_args(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return std::nullopt;
        }
        if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
            config.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            config.port = to_port(argv[++i]);
        } else if ((arg == "-t" || arg == "--timeout") && i + 1 < argc) {
            config.timeout_seconds = to_timeout(argv[++i]);
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            config.log_level = to_log_level(argv[++i]);
        } else if (arg == "--max-depth" && i + 1 < argc) {
            config.max_depth = to_max_depth(argv[++i]);
        } else if (arg == "--max-bulk-length" && i + 1 < argc) {
            config.max_bulk_length = to_max_bulk_length(argv[++i]);
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            // config file handled by find_config_path
            ++i;
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }

    return config;
}

std::filesystem::path Config::find_config_path(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return argv[i + 1];
        }
    }
    return {};
}

Config Config::merge(const Config& file_config, const Config& cli_config, const Config& defaults) {
    Config result = defaults;
    // File overrides defaults
    if (file_config.host != defaults.host) result.host = file_config.host;
    if (file_config.port != defaults.port) result.port = file_config.port;
    if (file_config.timeout_seconds != defaults.timeout_seconds) result.timeout_seconds = file_config.timeout_seconds;
    if (file_config.max_depth != defaults.max_depth) result.max_depth = file_config.max_depth;
    if (file_config.max_bulk_length != defaults.max_bulk_length) result.max_bulk_length = file_config.max_bulk_length;
    if (file_config.log_level != defaults.log_level) result.log_level = file_config.log_level;

    // CLI overrides file
    if (cli_config.host != defaults.host) result.host = cli_config.host;
    if (cli_config.port != defaults.port) result.port = cli_config.port;
    if (cli_config.timeout_seconds != defaults.timeout_seconds) result.timeout_seconds = cli_config.timeout_seconds;
    if (cli_config.max_depth != defaults.max_depth) result.max_depth = cli_config.max_depth;
    if (cli_config.max_bulk_length != defaults.max_bulk_length) result.max_bulk_length = cli_config.max_bulk_length;
    if (cli_config.log_level != defaults.log_level) result.log_level = cli_config.log_level;

    return result;
}

proto::DecoderOptions Config::decoder_options() const {
    proto::DecoderOptions options;
    options.max_depth = max_depth;
    options.max_bulk_length = max_bulk_length;
    return options;
}

}  // namespace respcodec::util
