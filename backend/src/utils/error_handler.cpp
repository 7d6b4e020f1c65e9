#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <sstream>
#include <iomanip>
#include <random>
#include <algorithm>
#include <mutex>

namespace overlapseg {
namespace utils {

// Thread-local storage for error context
thread_local std::string ErrorContext::current_context_;
thread_local std::string ErrorContext::current_segment_id_;

// ErrorInfo implementation
ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx, const std::string& sid)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()), segment_id(sid) {

    // Generate unique error ID
    static std::mutex id_mutex;
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);

    std::lock_guard<std::mutex> lock(id_mutex);
    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

// OverlapSegException implementation
OverlapSegException::OverlapSegException(const ErrorInfo& error_info)
    : error_info_(error_info) {
}

const char* OverlapSegException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

// Specific exception implementations
ManifestException::ManifestException(const std::string& message, const std::string& path)
    : OverlapSegException(ErrorInfo(ErrorCategory::MANIFEST_IO, ErrorSeverity::ERROR,
                                    message, path, "Manifest")) {
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& context)
    : OverlapSegException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::ERROR,
                                    message, "", context.empty() ? "Configuration" : context)) {
}

InvalidSegmentException::InvalidSegmentException(const std::string& message, const std::string& segment_id)
    : OverlapSegException(ErrorInfo(ErrorCategory::VALIDATION, ErrorSeverity::ERROR,
                                    message, "segment " + segment_id, "Validation", segment_id)) {
}

SegmentationException::SegmentationException(const std::string& message, const std::string& segment_id)
    : OverlapSegException(ErrorInfo(ErrorCategory::SEGMENTATION, ErrorSeverity::ERROR,
                                    message, "segment " + segment_id, "Segmentation", segment_id)) {
}

std::string toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::MANIFEST_IO: return "Manifest";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::VALIDATION: return "Validation";
        case ErrorCategory::SEGMENTATION: return "Segmentation";
        case ErrorCategory::WORKER: return "Worker";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

std::string toString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARN";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "ERROR";
}

// ErrorHandler implementation
ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    std::lock_guard<std::mutex> lock(mutex_);

    logError(error);

    error_history_.push_back(error);
    if (error_history_.size() > max_history_size_) {
        error_history_.erase(error_history_.begin());
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context,
                               const std::string& segment_id) {
    if (const auto* known = dynamic_cast<const OverlapSegException*>(&e)) {
        ErrorInfo error = known->getErrorInfo();
        if (!context.empty()) {
            error.context = context;
        }
        if (!segment_id.empty()) {
            error.segment_id = segment_id;
        }
        reportError(error);
        return;
    }

    ErrorInfo error(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, e.what(), "", context, segment_id);
    reportError(error);
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (category == ErrorCategory::UNKNOWN) {
        return error_history_.size();
    }

    return std::count_if(error_history_.begin(), error_history_.end(),
                         [category](const ErrorInfo& error) {
                             return error.category == category;
                         });
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (error_history_.size() <= count) {
        return error_history_;
    }

    return std::vector<ErrorInfo>(error_history_.end() - count, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
}

void ErrorHandler::setMaxHistorySize(size_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_history_size_ = std::max<size_t>(max_size, 1);
    while (error_history_.size() > max_history_size_) {
        error_history_.erase(error_history_.begin());
    }
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << toString(error.category) << " - " << error.message;

    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }

    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }

    if (!error.segment_id.empty()) {
        log_message << " | Segment: " << error.segment_id;
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
ErrorContext::ErrorContext(const std::string& context, const std::string& segment_id)
    : previous_context_(current_context_), previous_segment_id_(current_segment_id_) {
    current_context_ = context;
    if (!segment_id.empty()) {
        current_segment_id_ = segment_id;
    }
}

ErrorContext::~ErrorContext() {
    current_context_ = previous_context_;
    current_segment_id_ = previous_segment_id_;
}

void ErrorContext::setContext(const std::string& context) {
    current_context_ = context;
}

void ErrorContext::setSegmentId(const std::string& segment_id) {
    current_segment_id_ = segment_id;
}

std::string ErrorContext::getCurrentContext() {
    return current_context_;
}

std::string ErrorContext::getCurrentSegmentId() {
    return current_segment_id_;
}

} // namespace utils
} // namespace overlapseg
