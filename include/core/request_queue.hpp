#pragma once

#include "core/request.hpp"
#include "core/transport.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fastnet {
namespace quality {
class ConnectionQualityEstimator;
}

namespace core {

class NotificationDispatcher;

/**
 * Worker pool sizing
 */
struct DispatcherConfig {
    size_t workerThreads = 0;      // 0 = 2 * hardware threads + 1
    size_t immediateThreads = 2;   // reserved for IMMEDIATE requests only
};

/**
 * Pending-queue ordering: higher priority first, then lower id (FIFO).
 */
struct PendingEntry {
    Priority priority;
    RequestId id;
};

struct PendingComparator {
    bool operator()(const PendingEntry& a, const PendingEntry& b) const {
        if (a.priority != b.priority) {
            return static_cast<int>(a.priority) > static_cast<int>(b.priority);
        }
        return a.id < b.id;
    }
};

/**
 * Admits requests, runs them on a bounded worker pool and cancels them by
 * id, by tag or all at once.
 *
 * The request table, tag index and pending queue share one mutex. Transport
 * calls run outside it; completion and progress callbacks are posted to the
 * NotificationDispatcher.
 */
class RequestQueue {
public:
    RequestQueue(Transport& transport,
                 NotificationDispatcher& notifier,
                 quality::ConnectionQualityEstimator* estimator = nullptr,
                 const DispatcherConfig& config = DispatcherConfig());
    ~RequestQueue();

    // Non-copyable, non-movable
    RequestQueue(const RequestQueue&) = delete;
    RequestQueue& operator=(const RequestQueue&) = delete;
    RequestQueue(RequestQueue&&) = delete;
    RequestQueue& operator=(RequestQueue&&) = delete;

    /**
     * Queue a request. Never blocks on worker capacity.
     * @throws utils::ShutdownException after shutdown(); the request is not queued
     */
    RequestHandle submit(RequestSpec spec,
                         CompletionCallback onComplete = nullptr,
                         ProgressListener onProgress = nullptr);

    /**
     * Cancel every pending or running request carrying the tag.
     * Unknown tags are a no-op.
     * @param force Interrupt running transport calls instead of only flagging them
     */
    void cancel(const std::string& tag, bool force);

    /**
     * Cancel one request. Returns false if it is not tracked any more.
     */
    bool cancel(RequestId id, bool force);

    void cancelAll(bool force);

    bool isRequestRunning(const std::string& tag) const;

    size_t pendingCount() const;
    size_t runningCount() const;

    /**
     * Requests still held by the queue, including force-cancelled ones whose
     * worker has not returned yet.
     */
    size_t trackedCount() const;

    /**
     * Default user agent for requests that do not set their own.
     */
    void setUserAgent(const std::string& userAgent);
    std::string getUserAgent() const;

    /**
     * Stop accepting requests. Workers drain what is already pending.
     */
    void shutdown();
    bool isShutdown() const;

    size_t getNumThreads() const { return workers_.size(); }
    size_t getActiveWorkers() const { return activeWorkers_; }

    std::map<std::string, double> getStats() const;

private:
    enum class WorkerKind {
        GENERAL,
        IMMEDIATE
    };

    struct Delivery {
        CompletionCallback callback;
        RequestOutcome outcome;
    };

    /**
     * Work collected under the lock and finished after releasing it.
     */
    struct CancelBatch {
        std::vector<std::shared_ptr<RequestStatus>> interrupts;
        std::vector<Delivery> deliveries;
        std::vector<std::unique_ptr<Request>> released;
    };

    void workerLoop(WorkerKind kind);
    bool hasRunnable(WorkerKind kind) const;
    void runRequest(Request& request, const std::string& defaultUserAgent);
    void onComplete(RequestId id, const TransportResult& result);

    void cancelLocked(RequestId id, bool force, CancelBatch& batch);
    void unindexLocked(const Request& request);
    void finishCancel(CancelBatch& batch);
    void deliver(std::vector<Delivery>& deliveries);

    static RequestOutcome cancelledOutcome(RequestId id);

    Transport& transport_;
    NotificationDispatcher& notifier_;
    quality::ConnectionQualityEstimator* estimator_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::unordered_map<RequestId, std::unique_ptr<Request>> requests_;
    std::unordered_map<std::string, std::unordered_set<RequestId>> tagIndex_;
    std::set<PendingEntry, PendingComparator> pending_;
    std::unordered_set<RequestId> running_;
    RequestId nextId_;
    std::string userAgent_;
    bool shutdown_;
    bool stopping_;

    std::vector<std::thread> workers_;
    std::atomic<size_t> activeWorkers_;

    std::atomic<uint64_t> submitted_;
    std::atomic<uint64_t> completed_;
    std::atomic<uint64_t> failed_;
    std::atomic<uint64_t> cancelled_;
};

} // namespace core
} // namespace fastnet
