#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace fastnet {
namespace core {

/**
 * Single background thread that runs listener callbacks in posting order.
 *
 * Core components post here instead of invoking user code themselves, so a
 * slow or reentrant listener never runs under a dispatcher, estimator or
 * cache lock. Each notification is isolated: an exception is reported to
 * the ErrorHandler and the next notification still runs.
 */
class NotificationDispatcher {
public:
    NotificationDispatcher();
    ~NotificationDispatcher();

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    /**
     * Queue a notification. Returns false once stopped.
     * @param name Used in error reports when the notification throws
     */
    bool post(std::function<void()> notification, const std::string& name = "listener");

    /**
     * Block until every notification posted so far has run.
     */
    bool waitIdle(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    /**
     * Run what is queued, then join the thread. Idempotent.
     *
     * Called from a notification (for example a callback that destroys the
     * owning context), the thread is detached instead and notifications still
     * queued are dropped, since they may refer to objects being destroyed.
     */
    void stop();

    bool isRunning() const { return state_->running; }
    uint64_t getDeliveredCount() const { return state_->delivered; }
    uint64_t getFailedCount() const { return state_->failed; }
    bool isDispatchThread() const;

private:
    struct Notification {
        std::function<void()> fn;
        std::string name;
    };

    // Shared with the thread so a detached loop never touches a destroyed dispatcher.
    struct State {
        std::mutex mutex;
        std::condition_variable condition;
        std::condition_variable idleCondition;
        std::deque<Notification> queue;
        bool busy = false;
        bool detached = false;
        std::atomic<bool> running{true};
        std::atomic<uint64_t> delivered{0};
        std::atomic<uint64_t> failed{0};
    };

    static void dispatchLoop(std::shared_ptr<State> state);
    static void runIsolated(State& state, Notification& notification);

    std::shared_ptr<State> state_;
    std::thread::id workerId_;
    std::thread worker_;
};

} // namespace core
} // namespace fastnet
