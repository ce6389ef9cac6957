#pragma once

#include "core/cancellation_token.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fastnet {
namespace core {

using RequestId = uint64_t;

/**
 * Dispatch priority. IMMEDIATE requests may also run on the reserved
 * immediate workers.
 */
enum class Priority {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2,
    IMMEDIATE = 3
};

enum class Method {
    GET,
    HEAD,
    POST,
    PUT,
    DELETE,
    PATCH
};

enum class RequestKind {
    SIMPLE,
    DOWNLOAD,
    MULTIPART
};

/**
 * Lifecycle: PENDING -> RUNNING -> {COMPLETED, FAILED, CANCELLED},
 * or PENDING -> CANCELLED. CANCELLED is final.
 */
enum class RequestState {
    PENDING,
    RUNNING,
    CANCELLED,
    COMPLETED,
    FAILED
};

enum class OutcomeStatus {
    SUCCESS,
    FAILED,
    CANCELLED
};

struct MultipartPart {
    std::string name;
    std::string value;        // inline value, empty for file parts
    std::string filePath;     // file to stream, empty for inline parts
    std::string contentType;

    bool isFile() const { return !filePath.empty(); }
};

/**
 * Immutable description of one network operation. Built and validated by
 * RequestBuilder, then handed to RequestQueue::submit.
 */
struct RequestSpec {
    Method method = Method::GET;
    RequestKind kind = RequestKind::SIMPLE;
    std::string url;
    Priority priority = Priority::MEDIUM;
    std::optional<std::string> tag;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::string contentType;
    std::vector<MultipartPart> parts;
    std::string downloadDir;
    std::string fileName;
    std::string userAgent;
    int cancelThresholdPercent = 0;   // 0: cooperative cancel always applies

    std::string downloadPath() const;
};

struct Response {
    int statusCode = 0;
    std::map<std::string, std::string> headers;
    std::string body;
    uint64_t bytesTransferred = 0;
    int64_t elapsedMillis = 0;
};

struct RequestOutcome {
    RequestId id = 0;
    OutcomeStatus status = OutcomeStatus::FAILED;
    Response response;
    std::string error;

    bool ok() const { return status == OutcomeStatus::SUCCESS; }
};

using CompletionCallback = std::function<void(const RequestOutcome&)>;
using ProgressListener = std::function<void(uint64_t bytesDone, uint64_t bytesTotal)>;

/**
 * Runtime state shared between the dispatcher and caller handles.
 * The dispatcher is the only writer.
 */
class RequestStatus {
public:
    explicit RequestStatus(RequestId id);

    RequestStatus(const RequestStatus&) = delete;
    RequestStatus& operator=(const RequestStatus&) = delete;

    RequestId id() const { return id_; }
    RequestState state() const { return state_.load(std::memory_order_acquire); }
    bool isTerminal() const;

    CancellationToken& token() { return token_; }
    const CancellationToken& token() const { return token_; }

    int progressPercent() const { return progress_.load(std::memory_order_relaxed); }
    void updateProgress(uint64_t bytesDone, uint64_t bytesTotal);

    /**
     * Moves to a new state. Terminal states are sticky: once CANCELLED,
     * COMPLETED or FAILED, further transitions are refused.
     * Returns false if the transition was refused.
     */
    bool transition(RequestState next);

    /**
     * Claims the single completion delivery. Only the first caller gets true.
     */
    bool claimDelivery();

    /**
     * Blocks until a terminal state is reached or the timeout expires.
     */
    bool waitForTerminal(std::chrono::milliseconds timeout) const;

private:
    const RequestId id_;
    std::atomic<RequestState> state_;
    std::atomic<int> progress_;
    std::atomic<bool> delivered_;
    CancellationToken token_;

    mutable std::mutex waitMutex_;
    mutable std::condition_variable waitCondition_;
};

/**
 * Caller-side view of a submitted request.
 */
class RequestHandle {
public:
    RequestHandle() = default;
    explicit RequestHandle(std::shared_ptr<const RequestStatus> status) : status_(std::move(status)) {}

    bool valid() const { return static_cast<bool>(status_); }
    RequestId id() const { return status_ ? status_->id() : 0; }
    RequestState state() const;
    bool isCancelled() const;
    int progressPercent() const { return status_ ? status_->progressPercent() : 0; }

    /**
     * Wait for a terminal state. Returns false on timeout.
     */
    bool wait(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) const;

private:
    std::shared_ptr<const RequestStatus> status_;
};

/**
 * A submitted request, owned by the RequestQueue from submission until it
 * reaches a terminal state.
 */
struct Request {
    RequestSpec spec;
    std::shared_ptr<RequestStatus> status;
    CompletionCallback onComplete;
    ProgressListener onProgress;

    Request(RequestSpec s, RequestId id, CompletionCallback complete, ProgressListener progress)
        : spec(std::move(s)),
          status(std::make_shared<RequestStatus>(id)),
          onComplete(std::move(complete)),
          onProgress(std::move(progress)) {}

    RequestId id() const { return status->id(); }
};

std::string toString(Priority priority);
std::string toString(RequestState state);
std::string toString(Method method);
std::string toString(OutcomeStatus status);

} // namespace core
} // namespace fastnet
