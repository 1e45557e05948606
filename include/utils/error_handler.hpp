#pragma once

#include <string>
#include <exception>
#include <functional>
#include <chrono>
#include <deque>
#include <mutex>
#include <vector>

namespace loadpulse {
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
 * Error categories for classification and counting
 */
enum class ErrorCategory {
    CONFIGURATION,
    TRANSPORT,
    DISPATCH,
    REPORTING,
    SYSTEM,
    UNKNOWN
};

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

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "");
};

/**
 * Base exception for everything loadpulse throws
 */
class LoadPulseException : public std::exception {
public:
    explicit LoadPulseException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

/**
 * Raised before any worker starts when the run cannot be configured
 */
class InvalidConfigurationException : public LoadPulseException {
public:
    InvalidConfigurationException(const std::string& message, const std::string& details = "");
};

/**
 * Raised by HttpClient implementations when a request does not complete
 */
class TransportException : public LoadPulseException {
public:
    TransportException(const std::string& message, const std::string& url = "");
};

class DispatchException : public LoadPulseException {
public:
    DispatchException(const std::string& message, const std::string& details = "");
};

class ReportException : public LoadPulseException {
public:
    ReportException(const std::string& message, const std::string& path = "");
};

std::string severityToString(ErrorSeverity severity);
std::string categoryToString(ErrorCategory category);

using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Central error handler for the application.
 * Counts and keeps a bounded history of reported errors. Errors below the
 * log threshold are only written at debug level.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "");

    void setErrorCallback(ErrorCallback callback);

    /**
     * Count errors in a category; UNKNOWN counts everything.
     */
    size_t getErrorCount(ErrorCategory category = ErrorCategory::UNKNOWN) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

    void setMaxHistorySize(size_t max_size);
    void setLogThreshold(ErrorSeverity severity);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error) const;

    ErrorCallback error_callback_;
    std::deque<ErrorInfo> error_history_;
    std::vector<size_t> category_counts_ = std::vector<size_t>(6, 0);
    size_t max_history_size_ = 1000;
    ErrorSeverity log_threshold_ = ErrorSeverity::ERROR;

    mutable std::mutex mutex_;
};

/**
 * RAII error context manager
 */
class ErrorContext {
public:
    explicit ErrorContext(const std::string& context);
    ~ErrorContext();

    ErrorContext(const ErrorContext&) = delete;
    ErrorContext& operator=(const ErrorContext&) = delete;

    static std::string getCurrentContext();

private:
    std::string previous_context_;

    static thread_local std::string current_context_;
};

} // namespace utils
} // namespace loadpulse
