#include "core/notification_dispatcher.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace fastnet {
namespace core {

NotificationDispatcher::NotificationDispatcher()
    : state_(std::make_shared<State>()) {
    worker_ = std::thread(&NotificationDispatcher::dispatchLoop, state_);
    workerId_ = worker_.get_id();
}

NotificationDispatcher::~NotificationDispatcher() {
    stop();
}

bool NotificationDispatcher::post(std::function<void()> notification, const std::string& name) {
    if (!notification) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->running) {
            return false;
        }
        state_->queue.push_back(Notification{std::move(notification), name});
    }
    state_->condition.notify_one();
    return true;
}

bool NotificationDispatcher::waitIdle(std::chrono::milliseconds timeout) {
    if (isDispatchThread()) {
        // Waiting on ourselves would never finish.
        return false;
    }

    State& state = *state_;
    std::unique_lock<std::mutex> lock(state.mutex);
    return state.idleCondition.wait_for(lock, timeout, [&state] { return state.queue.empty() && !state.busy; });
}

void NotificationDispatcher::stop() {
    const bool fromDispatchThread = isDispatchThread();
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->running) {
            return;
        }
        state_->running = false;
        if (fromDispatchThread) {
            state_->detached = true;
            dropped = state_->queue.size();
            state_->queue.clear();
        }
    }
    state_->condition.notify_all();

    if (dropped > 0) {
        utils::Logger::warn("Notification dispatcher stopped from its own thread, dropped " +
                            std::to_string(dropped) + " notifications");
    }

    if (worker_.joinable()) {
        if (fromDispatchThread) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

bool NotificationDispatcher::isDispatchThread() const {
    return std::this_thread::get_id() == workerId_;
}

void NotificationDispatcher::dispatchLoop(std::shared_ptr<State> state) {
    while (true) {
        Notification notification;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->condition.wait(lock, [&state] { return !state->queue.empty() || !state->running; });

            if (state->queue.empty()) {
                // Stopped and drained
                break;
            }

            notification = std::move(state->queue.front());
            state->queue.pop_front();
            state->busy = true;
        }

        runIsolated(*state, notification);

        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->busy = false;
            if (state->detached) {
                break;
            }
        }
        state->idleCondition.notify_all();
    }

    state->idleCondition.notify_all();
}

void NotificationDispatcher::runIsolated(State& state, Notification& notification) {
    try {
        notification.fn();
        state.delivered++;
    } catch (const std::exception& e) {
        state.failed++;
        FASTNET_REPORT_ERROR(utils::ErrorCategory::LISTENER, utils::ErrorSeverity::WARNING,
                             "Listener '" + notification.name + "' threw", e.what());
    } catch (...) {
        state.failed++;
        FASTNET_REPORT_ERROR(utils::ErrorCategory::LISTENER, utils::ErrorSeverity::WARNING,
                             "Listener '" + notification.name + "' threw", "non-standard exception");
    }
}

} // namespace core
} // namespace fastnet
