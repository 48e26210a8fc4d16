#include "collabscribe/utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace collabscribe {
namespace utils {

bool Logger::initialized_ = false;
LogLevel Logger::level_ = LogLevel::INFO;
Logger::Sink Logger::sink_;
std::mutex Logger::mutex_;

LogLevel parseLogLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

void Logger::initialize() {
    if (!initialized_) {
        initialized_ = true;
        info("Logger initialized");
    }
}

void Logger::info(const std::string &message) {
    write(LogLevel::INFO, message);
}

void Logger::warn(const std::string &message) {
    write(LogLevel::WARN, message);
}

void Logger::error(const std::string &message) {
    write(LogLevel::ERROR, message);
}

void Logger::debug(const std::string &message) {
    write(LogLevel::DEBUG, message);
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::getLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) {
        return;
    }

    if (sink_) {
        sink_(level, message);
        return;
    }

    if (level == LogLevel::ERROR) {
        std::cerr << "[ERROR] " << message << std::endl;
    } else {
        std::cout << "[" << logLevelToString(level) << "] " << message << std::endl;
    }
}

} // namespace utils
} // namespace collabscribe
