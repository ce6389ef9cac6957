#include "core/request.hpp"

#include <algorithm>

namespace fastnet {
namespace core {

std::string RequestSpec::downloadPath() const {
    if (downloadDir.empty()) {
        return fileName;
    }
    if (downloadDir.back() == '/') {
        return downloadDir + fileName;
    }
    return downloadDir + "/" + fileName;
}

RequestStatus::RequestStatus(RequestId id)
    : id_(id)
    , state_(RequestState::PENDING)
    , progress_(0)
    , delivered_(false) {
}

bool RequestStatus::isTerminal() const {
    RequestState current = state();
    return current == RequestState::CANCELLED ||
           current == RequestState::COMPLETED ||
           current == RequestState::FAILED;
}

void RequestStatus::updateProgress(uint64_t bytesDone, uint64_t bytesTotal) {
    if (bytesTotal == 0) {
        return;
    }
    uint64_t percent = std::min<uint64_t>(100, bytesDone * 100 / bytesTotal);
    progress_.store(static_cast<int>(percent), std::memory_order_relaxed);
}

bool RequestStatus::transition(RequestState next) {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        RequestState current = state_.load(std::memory_order_acquire);
        if (current == RequestState::CANCELLED ||
            current == RequestState::COMPLETED ||
            current == RequestState::FAILED) {
            return false;
        }
        state_.store(next, std::memory_order_release);
    }
    waitCondition_.notify_all();
    return true;
}

bool RequestStatus::claimDelivery() {
    bool expected = false;
    return delivered_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

bool RequestStatus::waitForTerminal(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(waitMutex_);
    return waitCondition_.wait_for(lock, timeout, [this] { return isTerminal(); });
}

RequestState RequestHandle::state() const {
    return status_ ? status_->state() : RequestState::CANCELLED;
}

bool RequestHandle::isCancelled() const {
    return status_ && (status_->state() == RequestState::CANCELLED || status_->token().isCancelled());
}

bool RequestHandle::wait(std::chrono::milliseconds timeout) const {
    return status_ && status_->waitForTerminal(timeout);
}

std::string toString(Priority priority) {
    switch (priority) {
        case Priority::LOW: return "LOW";
        case Priority::MEDIUM: return "MEDIUM";
        case Priority::HIGH: return "HIGH";
        case Priority::IMMEDIATE: return "IMMEDIATE";
    }
    return "MEDIUM";
}

std::string toString(RequestState state) {
    switch (state) {
        case RequestState::PENDING: return "PENDING";
        case RequestState::RUNNING: return "RUNNING";
        case RequestState::CANCELLED: return "CANCELLED";
        case RequestState::COMPLETED: return "COMPLETED";
        case RequestState::FAILED: return "FAILED";
    }
    return "FAILED";
}

std::string toString(Method method) {
    switch (method) {
        case Method::GET: return "GET";
        case Method::HEAD: return "HEAD";
        case Method::POST: return "POST";
        case Method::PUT: return "PUT";
        case Method::DELETE: return "DELETE";
        case Method::PATCH: return "PATCH";
    }
    return "GET";
}

std::string toString(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::SUCCESS: return "SUCCESS";
        case OutcomeStatus::FAILED: return "FAILED";
        case OutcomeStatus::CANCELLED: return "CANCELLED";
    }
    return "FAILED";
}

} // namespace core
} // namespace fastnet
