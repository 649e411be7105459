#ifndef RESPCODEC_UTIL_LOGGER_HPP
#define RESPCODEC_UTIL_LOGGER_HPP

#include <atomic>
#include <mutex>
#include <optional>
#include <string_view>

namespace respcodec::util {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    None = 4
};

// "debug", "info", "warn", "error", "none"; nullopt for anything else
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

class Logger {
   public:
    static Logger& instance();

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);

   private:
    Logger() = default;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
};

// logging macros
#define LOG_DEBUG(msg) respcodec::util::Logger::instance().debug(msg)
#define LOG_INFO(msg) respcodec::util::Logger::instance().info(msg)
#define LOG_WARN(msg) respcodec::util::Logger::instance().warn(msg)
#define LOG_ERROR(msg) respcodec::util::Logger::instance().error(msg)

}  // namespace respcodec::util

#endif
