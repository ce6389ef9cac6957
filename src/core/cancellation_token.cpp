#include "core/cancellation_token.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace fastnet {
namespace core {

bool CancellationToken::cancel() {
    bool expected = false;
    return cancelled_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

void CancellationToken::forceCancel() {
    cancel();

    bool expected = false;
    if (!forced_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }

    std::vector<InterruptHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers.swap(handlers_);
    }

    for (auto& handler : handlers) {
        try {
            handler();
        } catch (const std::exception& e) {
            FASTNET_REPORT_ERROR(utils::ErrorCategory::TRANSPORT, utils::ErrorSeverity::WARNING,
                                 "Interrupt handler failed", e.what());
        }
    }
}

void CancellationToken::onInterrupt(InterruptHandler handler) {
    if (!handler) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        if (!forced_.load(std::memory_order_acquire)) {
            handlers_.push_back(std::move(handler));
            return;
        }
    }

    // Already forced: the caller registered too late to be swept by forceCancel().
    try {
        handler();
    } catch (const std::exception& e) {
        FASTNET_REPORT_ERROR(utils::ErrorCategory::TRANSPORT, utils::ErrorSeverity::WARNING,
                             "Interrupt handler failed", e.what());
    }
}

void CancellationToken::clearInterruptHandlers() {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    handlers_.clear();
}

} // namespace core
} // namespace fastnet
