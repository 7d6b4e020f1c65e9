#pragma once

#include <string>
#include <exception>
#include <chrono>
#include <mutex>
#include <vector>

namespace overlapseg {
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
    MANIFEST_IO,
    CONFIGURATION,
    VALIDATION,
    SEGMENTATION,
    WORKER,
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
    std::string segment_id;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "",
              const std::string& sid = "");
};

/**
 * Base exception carrying an ErrorInfo
 */
class OverlapSegException : public std::exception {
public:
    explicit OverlapSegException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

class ManifestException : public OverlapSegException {
public:
    ManifestException(const std::string& message, const std::string& path = "");
};

class ConfigurationException : public OverlapSegException {
public:
    ConfigurationException(const std::string& message, const std::string& context = "");
};

/**
 * Raised for a segment whose times or utterances are unusable
 */
class InvalidSegmentException : public OverlapSegException {
public:
    InvalidSegmentException(const std::string& message, const std::string& segment_id);
};

/**
 * Raised when splitting produced a segment that breaks its timing guarantees
 */
class SegmentationException : public OverlapSegException {
public:
    SegmentationException(const std::string& message, const std::string& segment_id);
};

std::string toString(ErrorCategory category);
std::string toString(ErrorSeverity severity);

/**
 * Central error handler for the application
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    // Error reporting
    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "",
                     const std::string& segment_id = "");

    // Error statistics, UNKNOWN counts every category
    size_t getErrorCount(ErrorCategory category = ErrorCategory::UNKNOWN) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();
    void setMaxHistorySize(size_t max_size);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error);

    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_ = 1000;

    mutable std::mutex mutex_;
};

/**
 * RAII error context manager, scoped to the current thread
 */
class ErrorContext {
public:
    ErrorContext(const std::string& context, const std::string& segment_id = "");
    ~ErrorContext();

    void setContext(const std::string& context);
    void setSegmentId(const std::string& segment_id);

    static std::string getCurrentContext();
    static std::string getCurrentSegmentId();

private:
    std::string previous_context_;
    std::string previous_segment_id_;

    static thread_local std::string current_context_;
    static thread_local std::string current_segment_id_;
};

/**
 * Utility macros for error handling
 */
#define OVERLAPSEG_HANDLE_ERROR(category, severity, message, details) \
    do { \
        ::overlapseg::utils::ErrorInfo error_(category, severity, message, details, \
                       ::overlapseg::utils::ErrorContext::getCurrentContext(), \
                       ::overlapseg::utils::ErrorContext::getCurrentSegmentId()); \
        ::overlapseg::utils::ErrorHandler::getInstance().reportError(error_); \
    } while(0)

#define OVERLAPSEG_HANDLE_EXCEPTION(e, context) \
    ::overlapseg::utils::ErrorHandler::getInstance().reportError( \
        e, context, ::overlapseg::utils::ErrorContext::getCurrentSegmentId())

} // namespace utils
} // namespace overlapseg
