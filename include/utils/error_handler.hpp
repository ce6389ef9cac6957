#pragma once

#include <string>
#include <exception>
#include <memory>
#include <functional>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>

namespace fastnet {
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
    DISPATCH,
    TRANSPORT,
    CACHE,
    QUALITY,
    LISTENER,
    CONFIG,
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
    uint64_t request_id;   // 0 when the error is not tied to a request

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "",
              uint64_t rid = 0);
};

/**
 * Base exception for everything the library throws
 */
class FastNetException : public std::exception {
public:
    explicit FastNetException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

/**
 * Thrown by submit() once the dispatcher has been shut down.
 * The rejected request never enters any queue.
 */
class ShutdownException : public FastNetException {
public:
    explicit ShutdownException(const std::string& message);
};

class InvalidRequestException : public FastNetException {
public:
    InvalidRequestException(const std::string& message, const std::string& url = "");
};

class TransportException : public FastNetException {
public:
    TransportException(const std::string& message, const std::string& url = "");
};

class ConfigException : public FastNetException {
public:
    ConfigException(const std::string& message, const std::string& details = "");
};

/**
 * Error handler callback type
 */
using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Process-wide sink for errors that are handled locally and must not
 * propagate: listener failures, transport failures, rejected cache entries.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    // Error reporting
    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "",
                     uint64_t request_id = 0);

    void setErrorCallback(ErrorCallback callback);

    // Error statistics
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

    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_ = 1000;

    mutable std::mutex mutex_;
};

std::string categoryName(ErrorCategory category);

/**
 * Utility macros for error handling
 */
#define FASTNET_REPORT_ERROR(category, severity, message, details) \
    do { \
        ::fastnet::utils::ErrorInfo fastnet_error_(category, severity, message, details); \
        ::fastnet::utils::ErrorHandler::getInstance().reportError(fastnet_error_); \
    } while(0)

#define FASTNET_REPORT_EXCEPTION(e, context) \
    ::fastnet::utils::ErrorHandler::getInstance().reportError(e, context)

} // namespace utils
} // namespace fastnet
