#ifndef RESPCODEC_UTIL_CONFIG_HPP
#define RESPCODEC_UTIL_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "respcodec/proto/codec.hpp"
#include "respcodec/util/logger.hpp"

namespace respcodec::util {

struct Config {
    // upper bounds accepted from a file or the command line
    static constexpr uint64_t kMaxDepthLimit = 1024;
    static constexpr uint64_t kMaxBulkLengthLimit = 4ULL * 1024 * 1024 * 1024;

    // connection
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    int timeout_seconds = 30;

    // decoder limits
    std::size_t max_depth = 64;
    std::size_t max_bulk_length = 512 * 1024 * 1024;

    // logging
    LogLevel log_level = LogLevel::Warn;

    // Load from file (key = value lines, '#' comments)
    // returns nullopt if the file cannot be opened, throws std::invalid_argument on bad values
    static std::optional<Config> load_file(const std::filesystem::path& path);

    // parse CLI args, returns nullopt on --help, throws std::invalid_argument on bad input
    static std::optional<Config> parse_args(int argc, char* argv[]);

    // -c / --config value, empty if absent
    static std::filesystem::path find_config_path(int argc, char* argv[]);

    // merge: CLI overrides file
    static Config merge(const Config& file_config, const Config& cli_config,
                        const Config& defaults);

    [[nodiscard]] proto::DecoderOptions decoder_options() const;
};

}  // namespace respcodec::util

#endif
