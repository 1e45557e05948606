#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <sstream>
#include <random>
#include <algorithm>
#include <numeric>

namespace loadpulse {
namespace utils {

thread_local std::string ErrorContext::current_context_;

// ErrorInfo implementation
ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()) {

    // Workers create these concurrently
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

// LoadPulseException implementation
LoadPulseException::LoadPulseException(const ErrorInfo& error_info)
    : error_info_(error_info) {
}

const char* LoadPulseException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

InvalidConfigurationException::InvalidConfigurationException(const std::string& message,
                                                             const std::string& details)
    : LoadPulseException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::CRITICAL,
                                   message, details, "Configuration")) {
}

TransportException::TransportException(const std::string& message, const std::string& url)
    : LoadPulseException(ErrorInfo(ErrorCategory::TRANSPORT, ErrorSeverity::WARNING,
                                   message, url, "Transport")) {
}

DispatchException::DispatchException(const std::string& message, const std::string& details)
    : LoadPulseException(ErrorInfo(ErrorCategory::DISPATCH, ErrorSeverity::CRITICAL,
                                   message, details, "Dispatcher")) {
}

ReportException::ReportException(const std::string& message, const std::string& path)
    : LoadPulseException(ErrorInfo(ErrorCategory::REPORTING, ErrorSeverity::ERROR,
                                   message, path, "Report")) {
}

std::string severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARN";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "ERROR";
}

std::string categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::TRANSPORT: return "Transport";
        case ErrorCategory::DISPATCH: return "Dispatch";
        case ErrorCategory::REPORTING: return "Reporting";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

// ErrorHandler implementation
ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        logError(error);

        category_counts_[static_cast<size_t>(error.category)]++;
        error_history_.push_back(error);
        while (error_history_.size() > max_history_size_) {
            error_history_.pop_front();
        }
        callback = error_callback_;
    }

    // Invoked outside the lock so the callback may query the handler
    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context) {
    if (auto* lp = dynamic_cast<const LoadPulseException*>(&e)) {
        ErrorInfo error = lp->getErrorInfo();
        if (!context.empty()) {
            error.context = context;
        }
        reportError(error);
        return;
    }

    reportError(ErrorInfo(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, e.what(), "", context));
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = callback;
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (category == ErrorCategory::UNKNOWN) {
        return std::accumulate(category_counts_.begin(), category_counts_.end(), size_t{0});
    }

    return category_counts_[static_cast<size_t>(category)];
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (error_history_.size() <= count) {
        return std::vector<ErrorInfo>(error_history_.begin(), error_history_.end());
    }

    return std::vector<ErrorInfo>(error_history_.end() - count, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
    std::fill(category_counts_.begin(), category_counts_.end(), 0);
}

void ErrorHandler::setMaxHistorySize(size_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_history_size_ = max_size;
    while (error_history_.size() > max_history_size_) {
        error_history_.pop_front();
    }
}

void ErrorHandler::setLogThreshold(ErrorSeverity severity) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_threshold_ = severity;
}

void ErrorHandler::logError(const ErrorInfo& error) const {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << categoryToString(error.category)
                << " - " << error.message;

    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }

    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }

    if (error.severity < log_threshold_) {
        Logger::debug(log_message.str());
        return;
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

// ErrorContext implementation
ErrorContext::ErrorContext(const std::string& context)
    : previous_context_(current_context_) {
    current_context_ = context;
}

ErrorContext::~ErrorContext() {
    current_context_ = previous_context_;
}

std::string ErrorContext::getCurrentContext() {
    return current_context_;
}

} // namespace utils
} // namespace loadpulse
