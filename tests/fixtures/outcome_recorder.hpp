#pragma once

#include "core/request.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <vector>

namespace fixtures {

/**
 * Collects completion callbacks delivered on the notification thread.
 */
class OutcomeRecorder {
public:
    fastnet::core::CompletionCallback callback() {
        return [this](const fastnet::core::RequestOutcome& outcome) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                outcomes_.push_back(outcome);
            }
            condition_.notify_all();
        };
    }

    bool waitFor(size_t count, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return condition_.wait_for(lock, timeout, [this, count] { return outcomes_.size() >= count; });
    }

    std::vector<fastnet::core::RequestOutcome> outcomes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outcomes_;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outcomes_.size();
    }

    size_t count(fastnet::core::OutcomeStatus status) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& outcome : outcomes_) {
            if (outcome.status == status) {
                n++;
            }
        }
        return n;
    }

    /**
     * Deliveries per request id.
     */
    std::map<fastnet::core::RequestId, size_t> deliveriesById() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<fastnet::core::RequestId, size_t> byId;
        for (const auto& outcome : outcomes_) {
            byId[outcome.id]++;
        }
        return byId;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::vector<fastnet::core::RequestOutcome> outcomes_;
};

} // namespace fixtures
