#pragma once

#include <functional>
#include <mutex>
#include <string>

namespace collabscribe {
namespace utils {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Parse a level name ("DEBUG", "info", "Warn", ...). Unknown names map to INFO.
 */
LogLevel parseLogLevel(const std::string& name);
std::string logLevelToString(LogLevel level);

class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static void initialize();
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
    static void debug(const std::string& message);

    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    /**
     * Redirect output to a custom sink (tests). Pass nullptr to restore stdout/stderr.
     */
    static void setSink(Sink sink);

private:
    static void write(LogLevel level, const std::string& message);

    static bool initialized_;
    static LogLevel level_;
    static Sink sink_;
    static std::mutex mutex_;
};

} // namespace utils
} // namespace collabscribe

#define LOG_INFO(msg) ::collabscribe::utils::Logger::info(msg)
#define LOG_WARNING(msg) ::collabscribe::utils::Logger::warn(msg)
#define LOG_ERROR(msg) ::collabscribe::utils::Logger::error(msg)
#define LOG_DEBUG(msg) ::collabscribe::utils::Logger::debug(msg)
