#include "core/request_queue.hpp"
#include "core/notification_dispatcher.hpp"
#include "quality/connection_quality_estimator.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <algorithm>

namespace fastnet {
namespace core {

RequestQueue::RequestQueue(Transport& transport,
                           NotificationDispatcher& notifier,
                           quality::ConnectionQualityEstimator* estimator,
                           const DispatcherConfig& config)
    : transport_(transport)
    , notifier_(notifier)
    , estimator_(estimator)
    , nextId_(0)
    , shutdown_(false)
    , stopping_(false)
    , activeWorkers_(0)
    , submitted_(0)
    , completed_(0)
    , failed_(0)
    , cancelled_(0) {

    size_t general = config.workerThreads;
    if (general == 0) {
        general = 2 * std::max(1u, std::thread::hardware_concurrency()) + 1;
    }

    workers_.reserve(general + config.immediateThreads);
    for (size_t i = 0; i < general; ++i) {
        workers_.emplace_back(&RequestQueue::workerLoop, this, WorkerKind::GENERAL);
    }
    for (size_t i = 0; i < config.immediateThreads; ++i) {
        workers_.emplace_back(&RequestQueue::workerLoop, this, WorkerKind::IMMEDIATE);
    }

    utils::Logger::debug("RequestQueue started with " + std::to_string(general) + " workers and " +
                         std::to_string(config.immediateThreads) + " immediate workers");
}

RequestQueue::~RequestQueue() {
    shutdown();
    cancelAll(true);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

RequestHandle RequestQueue::submit(RequestSpec spec,
                                   CompletionCallback onComplete,
                                   ProgressListener onProgress) {
    std::shared_ptr<RequestStatus> status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            utils::Logger::warn("Rejected " + toString(spec.method) + " " + spec.url + ": queue is shut down");
            throw utils::ShutdownException("Request queue is shut down, rejected " + spec.url);
        }

        const RequestId id = ++nextId_;
        const Priority priority = spec.priority;
        const std::optional<std::string> tag = spec.tag;

        auto request = std::make_unique<Request>(std::move(spec), id,
                                                 std::move(onComplete), std::move(onProgress));
        status = request->status;

        if (tag) {
            tagIndex_[*tag].insert(id);
        }
        pending_.insert(PendingEntry{priority, id});
        requests_.emplace(id, std::move(request));
    }

    submitted_++;
    // Immediate workers only take IMMEDIATE work, so wake everybody.
    condition_.notify_all();
    return RequestHandle(status);
}

void RequestQueue::cancel(const std::string& tag, bool force) {
    CancelBatch batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto bucket = tagIndex_.find(tag);
        if (bucket == tagIndex_.end()) {
            return;
        }

        // cancelLocked edits the bucket
        std::vector<RequestId> ids(bucket->second.begin(), bucket->second.end());
        std::sort(ids.begin(), ids.end());
        for (RequestId id : ids) {
            cancelLocked(id, force, batch);
        }
    }
    finishCancel(batch);
}

bool RequestQueue::cancel(RequestId id, bool force) {
    CancelBatch batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requests_.find(id) == requests_.end()) {
            return false;
        }
        cancelLocked(id, force, batch);
    }
    finishCancel(batch);
    return true;
}

void RequestQueue::cancelAll(bool force) {
    CancelBatch batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<RequestId> ids;
        ids.reserve(requests_.size());
        for (const auto& entry : requests_) {
            ids.push_back(entry.first);
        }
        std::sort(ids.begin(), ids.end());
        for (RequestId id : ids) {
            cancelLocked(id, force, batch);
        }
    }
    finishCancel(batch);
}

bool RequestQueue::isRequestRunning(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto bucket = tagIndex_.find(tag);
    return bucket != tagIndex_.end() && !bucket->second.empty();
}

size_t RequestQueue::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t RequestQueue::runningCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.size();
}

size_t RequestQueue::trackedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

void RequestQueue::setUserAgent(const std::string& userAgent) {
    std::lock_guard<std::mutex> lock(mutex_);
    userAgent_ = userAgent;
}

std::string RequestQueue::getUserAgent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return userAgent_;
}

void RequestQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
    }
    condition_.notify_all();
    utils::Logger::info("RequestQueue shut down, no further requests accepted");
}

bool RequestQueue::isShutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

std::map<std::string, double> RequestQueue::getStats() const {
    std::map<std::string, double> stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats["pending"] = static_cast<double>(pending_.size());
        stats["running"] = static_cast<double>(running_.size());
        stats["tracked"] = static_cast<double>(requests_.size());
    }
    stats["submitted"] = static_cast<double>(submitted_.load());
    stats["completed"] = static_cast<double>(completed_.load());
    stats["failed"] = static_cast<double>(failed_.load());
    stats["cancelled"] = static_cast<double>(cancelled_.load());
    stats["active_workers"] = static_cast<double>(activeWorkers_.load());
    return stats;
}

bool RequestQueue::hasRunnable(WorkerKind kind) const {
    if (pending_.empty()) {
        return false;
    }
    if (kind == WorkerKind::IMMEDIATE) {
        return pending_.begin()->priority == Priority::IMMEDIATE;
    }
    return true;
}

void RequestQueue::workerLoop(WorkerKind kind) {
    while (true) {
        Request* request = nullptr;
        std::string defaultUserAgent;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this, kind] {
                return stopping_ || shutdown_ || hasRunnable(kind);
            });

            if (stopping_ || !hasRunnable(kind)) {
                if (stopping_ || shutdown_) {
                    break;
                }
                continue;
            }

            const PendingEntry next = *pending_.begin();
            pending_.erase(pending_.begin());

            request = requests_.at(next.id).get();
            request->status->transition(RequestState::RUNNING);
            running_.insert(next.id);
            defaultUserAgent = userAgent_;
            activeWorkers_++;
        }

        runRequest(*request, defaultUserAgent);
        activeWorkers_--;
    }
}

void RequestQueue::runRequest(Request& request, const std::string& defaultUserAgent) {
    const RequestId id = request.id();
    std::shared_ptr<RequestStatus> status = request.status;
    CancellationToken& token = status->token();

    RequestSpec effective = request.spec;
    if (effective.userAgent.empty()) {
        effective.userAgent = defaultUserAgent;
    }

    ProgressListener listener = request.onProgress;
    ProgressCallback progress = [this, status, listener](uint64_t done, uint64_t total) {
        status->updateProgress(done, total);
        if (listener) {
            notifier_.post([listener, done, total]() { listener(done, total); }, "progress");
        }
    };

    TransportResult result;
    if (token.isCancelled()) {
        result.error = "Cancelled before dispatch";
    } else {
        try {
            result = transport_.execute(effective, token, progress);
        } catch (const std::exception& e) {
            result = TransportResult();
            result.error = e.what();
            utils::ErrorHandler::getInstance().reportError(
                utils::TransportException(e.what(), effective.url), "RequestQueue::runRequest", id);
        } catch (...) {
            result = TransportResult();
            result.error = "Transport threw a non-standard exception";
            utils::ErrorHandler::getInstance().reportError(
                utils::TransportException(result.error, effective.url), "RequestQueue::runRequest", id);
        }
    }
    token.clearInterruptHandlers();

    onComplete(id, result);
}

void RequestQueue::onComplete(RequestId id, const TransportResult& result) {
    std::unique_ptr<Request> request;
    std::vector<Delivery> deliveries;
    bool sample = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.find(id);
        if (it == requests_.end()) {
            utils::Logger::error("Completion for unknown request " + std::to_string(id));
            return;
        }

        request = std::move(it->second);
        requests_.erase(it);
        running_.erase(id);
        unindexLocked(*request);

        RequestStatus& status = *request->status;
        if (status.token().isCancelled()) {
            // Outcome discarded. A cooperative cancel becomes final only now.
            if (status.transition(RequestState::CANCELLED)) {
                cancelled_++;
            }
            if (request->onComplete && status.claimDelivery()) {
                deliveries.push_back(Delivery{request->onComplete, cancelledOutcome(id)});
            }
        } else {
            const bool ok = result.success;
            status.transition(ok ? RequestState::COMPLETED : RequestState::FAILED);
            (ok ? completed_ : failed_)++;
            sample = true;

            if (!ok) {
                utils::Logger::warn("Request " + std::to_string(id) + " " + request->spec.url +
                                    " failed: " + result.error);
            }

            if (request->onComplete && status.claimDelivery()) {
                RequestOutcome outcome;
                outcome.id = id;
                outcome.status = ok ? OutcomeStatus::SUCCESS : OutcomeStatus::FAILED;
                outcome.response.statusCode = result.statusCode;
                outcome.response.headers = result.headers;
                outcome.response.body = result.body;
                outcome.response.bytesTransferred = result.bytesTransferred;
                outcome.response.elapsedMillis = result.elapsedMillis;
                outcome.error = result.error;
                deliveries.push_back(Delivery{request->onComplete, std::move(outcome)});
            }
        }
    }

    if (sample && estimator_) {
        estimator_->addSample(result.bytesTransferred, result.elapsedMillis);
    }

    deliver(deliveries);
}

void RequestQueue::cancelLocked(RequestId id, bool force, CancelBatch& batch) {
    auto it = requests_.find(id);
    if (it == requests_.end()) {
        return;
    }

    Request& request = *it->second;
    RequestStatus& status = *request.status;

    switch (status.state()) {
        case RequestState::PENDING: {
            status.token().cancel();
            status.transition(RequestState::CANCELLED);
            cancelled_++;
            pending_.erase(PendingEntry{request.spec.priority, id});
            unindexLocked(request);
            if (request.onComplete && status.claimDelivery()) {
                batch.deliveries.push_back(Delivery{request.onComplete, cancelledOutcome(id)});
            }
            batch.released.push_back(std::move(it->second));
            requests_.erase(it);
            break;
        }

        case RequestState::RUNNING: {
            if (!force) {
                const int threshold = request.spec.cancelThresholdPercent;
                if (threshold > 0 && status.progressPercent() >= threshold) {
                    utils::Logger::info("Request " + std::to_string(id) + " not cancelled: " +
                                        std::to_string(status.progressPercent()) + "% done, threshold " +
                                        std::to_string(threshold) + "%");
                    return;
                }
                status.token().cancel();
                return;
            }

            // Forced: terminal now; the worker drops the request when its call returns.
            status.token().cancel();
            if (status.transition(RequestState::CANCELLED)) {
                cancelled_++;
            }
            running_.erase(id);
            unindexLocked(request);
            batch.interrupts.push_back(request.status);
            if (request.onComplete && status.claimDelivery()) {
                batch.deliveries.push_back(Delivery{request.onComplete, cancelledOutcome(id)});
            }
            break;
        }

        case RequestState::CANCELLED:
        case RequestState::COMPLETED:
        case RequestState::FAILED:
            // Already terminal, worker still draining
            break;
    }
}

void RequestQueue::unindexLocked(const Request& request) {
    if (!request.spec.tag) {
        return;
    }
    auto bucket = tagIndex_.find(*request.spec.tag);
    if (bucket == tagIndex_.end()) {
        return;
    }
    bucket->second.erase(request.id());
    if (bucket->second.empty()) {
        tagIndex_.erase(bucket);
    }
}

void RequestQueue::finishCancel(CancelBatch& batch) {
    for (auto& status : batch.interrupts) {
        status->token().forceCancel();
    }
    deliver(batch.deliveries);
    batch.released.clear();
}

void RequestQueue::deliver(std::vector<Delivery>& deliveries) {
    for (auto& delivery : deliveries) {
        CompletionCallback callback = std::move(delivery.callback);
        RequestOutcome outcome = std::move(delivery.outcome);
        if (!notifier_.post([callback, outcome]() { callback(outcome); }, "completion")) {
            utils::Logger::debug("Completion for request " + std::to_string(outcome.id) +
                                 " dropped: notifications stopped");
        }
    }
}

RequestOutcome RequestQueue::cancelledOutcome(RequestId id) {
    RequestOutcome outcome;
    outcome.id = id;
    outcome.status = OutcomeStatus::CANCELLED;
    outcome.error = "Request cancelled";
    return outcome;
}

} // namespace core
} // namespace fastnet
