#include "collabscribe/utils/error_handler.hpp"
#include "collabscribe/utils/id_generator.hpp"
#include "collabscribe/utils/logging.hpp"
#include <algorithm>
#include <sstream>

namespace collabscribe {
namespace utils {

thread_local std::string ErrorContext::current_context_;
thread_local std::string ErrorContext::current_session_id_;

std::string errorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::SESSION: return "Session";
        case ErrorCategory::RECOGNITION: return "Recognition";
        case ErrorCategory::AUDIO_INTAKE: return "AudioIntake";
        case ErrorCategory::SPEAKER_MATCHING: return "SpeakerMatching";
        case ErrorCategory::QUALITY: return "Quality";
        case ErrorCategory::LEDGER: return "Ledger";
        case ErrorCategory::EXPORT: return "Export";
        case ErrorCategory::CONFIG: return "Config";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx, const std::string& sid)
    : id("err_" + generateShortId()), category(cat), severity(sev), message(msg), details(det),
      context(ctx), timestamp(std::chrono::steady_clock::now()), session_id(sid) {
}

CollabScribeException::CollabScribeException(const ErrorInfo& error_info)
    : error_info_(error_info) {
}

const char* CollabScribeException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

ExportException::ExportException(const std::string& message, const std::string& details)
    : CollabScribeException(ErrorInfo(ErrorCategory::EXPORT, ErrorSeverity::ERROR,
                                      message, details, "Export")) {
}

ConfigException::ConfigException(const std::string& message, const std::string& details)
    : CollabScribeException(ErrorInfo(ErrorCategory::CONFIG, ErrorSeverity::ERROR,
                                      message, details, "Config")) {
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        logError(error);

        error_history_.push_back(error);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }
        callback = error_callback_;
    }

    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context,
                               const std::string& session_id) {
    ErrorCategory category = ErrorCategory::UNKNOWN;
    ErrorSeverity severity = ErrorSeverity::ERROR;

    if (auto* typed = dynamic_cast<const CollabScribeException*>(&e)) {
        category = typed->getErrorInfo().category;
        severity = typed->getErrorInfo().severity;
    }

    ErrorInfo error(category, severity, e.what(), "", context, session_id);
    reportError(error);
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(error_history_.begin(), error_history_.end(),
                         [category](const ErrorInfo& error) {
                             return error.category == category;
                         }));
}

size_t ErrorHandler::getTotalErrorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_history_.size();
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (error_history_.size() <= count) {
        return error_history_;
    }

    return std::vector<ErrorInfo>(error_history_.end() - static_cast<std::ptrdiff_t>(count),
                                  error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
}

void ErrorHandler::setMaxHistorySize(size_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_history_size_ = std::max<size_t>(1, max_size);
    while (error_history_.size() > max_history_size_) {
        error_history_.erase(error_history_.begin());
    }
}

void ErrorHandler::logError(const ErrorInfo& error) const {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << errorCategoryToString(error.category)
                << " - " << error.message;

    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }

    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }

    if (!error.session_id.empty()) {
        log_message << " | Session: " << error.session_id;
    }

    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(log_message.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(log_message.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(log_message.str());
            break;
    }
}

ErrorContext::ErrorContext(const std::string& context, const std::string& session_id)
    : previous_context_(current_context_), previous_session_id_(current_session_id_) {
    current_context_ = context;
    if (!session_id.empty()) {
        current_session_id_ = session_id;
    }
}

ErrorContext::~ErrorContext() {
    current_context_ = previous_context_;
    current_session_id_ = previous_session_id_;
}

std::string ErrorContext::getCurrentContext() {
    return current_context_;
}

std::string ErrorContext::getCurrentSessionId() {
    return current_session_id_;
}

} // namespace utils
} // namespace collabscribe
