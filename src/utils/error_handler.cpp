#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <sstream>
#include <iomanip>
#include <random>
#include <algorithm>
#include <mutex>

namespace fastnet {
namespace utils {

// ErrorInfo implementation
ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx, uint64_t rid)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()), request_id(rid) {

    static std::mutex id_mutex;
    static std::mt19937 gen(std::random_device{}());
    static std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "err_";
    std::lock_guard<std::mutex> lock(id_mutex);
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

// FastNetException implementation
FastNetException::FastNetException(const ErrorInfo& error_info)
    : error_info_(error_info) {
}

const char* FastNetException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

ShutdownException::ShutdownException(const std::string& message)
    : FastNetException(ErrorInfo(ErrorCategory::DISPATCH, ErrorSeverity::ERROR,
                                 message, "", "RequestQueue")) {
}

InvalidRequestException::InvalidRequestException(const std::string& message, const std::string& url)
    : FastNetException(ErrorInfo(ErrorCategory::DISPATCH, ErrorSeverity::ERROR,
                                 message, url, "RequestBuilder")) {
}

TransportException::TransportException(const std::string& message, const std::string& url)
    : FastNetException(ErrorInfo(ErrorCategory::TRANSPORT, ErrorSeverity::ERROR,
                                 message, url, "Transport")) {
}

ConfigException::ConfigException(const std::string& message, const std::string& details)
    : FastNetException(ErrorInfo(ErrorCategory::CONFIG, ErrorSeverity::CRITICAL,
                                 message, details, "Config")) {
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
                               uint64_t request_id) {
    ErrorCategory category = ErrorCategory::UNKNOWN;
    ErrorSeverity severity = ErrorSeverity::ERROR;

    if (auto fastnet_error = dynamic_cast<const FastNetException*>(&e)) {
        category = fastnet_error->getErrorInfo().category;
        severity = fastnet_error->getErrorInfo().severity;
    }

    ErrorInfo error(category, severity, e.what(), "", context, request_id);
    reportError(error);
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
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
    max_history_size_ = std::max<size_t>(1, max_size);
    while (error_history_.size() > max_history_size_) {
        error_history_.erase(error_history_.begin());
    }
}

std::string categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::DISPATCH: return "Dispatch";
        case ErrorCategory::TRANSPORT: return "Transport";
        case ErrorCategory::CACHE: return "Cache";
        case ErrorCategory::QUALITY: return "Quality";
        case ErrorCategory::LISTENER: return "Listener";
        case ErrorCategory::CONFIG: return "Config";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << categoryName(error.category) << " - " << error.message;

    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }

    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }

    if (error.request_id != 0) {
        log_message << " | Request: " << error.request_id;
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

} // namespace utils
} // namespace fastnet
