#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <vector>

namespace fastnet {
namespace core {

/**
 * Per-request cancellation signal.
 *
 * Cooperative cancellation only raises a flag that the running transport
 * polls at its checkpoints (before each read/write chunk). Forced
 * cancellation raises both flags and runs every registered interrupt
 * handler so a blocking transport call can be torn down immediately.
 */
class CancellationToken {
public:
    using InterruptHandler = std::function<void()>;

    CancellationToken() : cancelled_(false), forced_(false) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }
    bool isForced() const { return forced_.load(std::memory_order_acquire); }

    /**
     * Raise the cooperative flag. Returns true on the first call only.
     */
    bool cancel();

    /**
     * Raise both flags and fire interrupt handlers. Handlers run on the
     * calling thread, at most once per token.
     */
    void forceCancel();

    /**
     * Register a handler the transport uses to abort an in-flight call.
     * If the token was already force-cancelled the handler runs immediately.
     */
    void onInterrupt(InterruptHandler handler);

    /**
     * Drop registered handlers once the transport call has returned.
     */
    void clearInterruptHandlers();

private:
    std::atomic<bool> cancelled_;
    std::atomic<bool> forced_;
    std::mutex handlersMutex_;
    std::vector<InterruptHandler> handlers_;
};

} // namespace core
} // namespace fastnet
