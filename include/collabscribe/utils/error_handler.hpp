#pragma once

#include <string>
#include <exception>
#include <functional>
#include <chrono>
#include <mutex>
#include <vector>

namespace collabscribe {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories for better classification
 */
enum class ErrorCategory {
    SESSION,
    RECOGNITION,
    AUDIO_INTAKE,
    SPEAKER_MATCHING,
    QUALITY,
    LEDGER,
    EXPORT,
    CONFIG,
    SYSTEM,
    UNKNOWN
};

std::string errorCategoryToString(ErrorCategory category);

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;
    std::string session_id;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "",
              const std::string& sid = "");
};

/**
 * Base exception carrying structured error information
 */
class CollabScribeException : public std::exception {
public:
    explicit CollabScribeException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

class ExportException : public CollabScribeException {
public:
    ExportException(const std::string& message, const std::string& details = "");
};

class ConfigException : public CollabScribeException {
public:
    ConfigException(const std::string& message, const std::string& details = "");
};

using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Central error handler. Collects reported errors into a bounded history,
 * logs them and forwards them to an optional callback.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "",
                     const std::string& session_id = "");

    void setErrorCallback(ErrorCallback callback);

    size_t getErrorCount(ErrorCategory category) const;
    size_t getTotalErrorCount() const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

    void setMaxHistorySize(size_t max_size);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error) const;

    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_ = 1000;

    mutable std::mutex mutex_;
};

/**
 * RAII error context manager
 */
class ErrorContext {
public:
    ErrorContext(const std::string& context, const std::string& session_id = "");
    ~ErrorContext();

    static std::string getCurrentContext();
    static std::string getCurrentSessionId();

private:
    std::string previous_context_;
    std::string previous_session_id_;

    static thread_local std::string current_context_;
    static thread_local std::string current_session_id_;
};

#define COLLABSCRIBE_REPORT_ERROR(category, severity, message, details) \
    do { \
        ::collabscribe::utils::ErrorInfo error_info_(category, severity, message, details, \
                       ::collabscribe::utils::ErrorContext::getCurrentContext(), \
                       ::collabscribe::utils::ErrorContext::getCurrentSessionId()); \
        ::collabscribe::utils::ErrorHandler::getInstance().reportError(error_info_); \
    } while (0)

} // namespace utils
} // namespace collabscribe
