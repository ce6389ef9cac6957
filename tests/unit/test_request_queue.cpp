#include "core/request_queue.hpp"
#include "core/notification_dispatcher.hpp"
#include "quality/connection_quality_estimator.hpp"
#include "utils/error_handler.hpp"
#include "../fixtures/fake_transport.hpp"
#include "../fixtures/outcome_recorder.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <memory>
#include <thread>

using namespace fastnet::core;
using fastnet::quality::ConnectionQualityEstimator;
using fixtures::BlockingTransport;
using fixtures::MockTransport;
using fixtures::OutcomeRecorder;
using ::testing::_;
using ::testing::Return;
using ::testing::Invoke;

namespace {

RequestSpec makeSpec(const std::string& url, Priority priority = Priority::MEDIUM,
                     const std::string& tag = "") {
    RequestSpec spec;
    spec.url = url;
    spec.priority = priority;
    if (!tag.empty()) {
        spec.tag = tag;
    }
    return spec;
}

// Polls until the queue has dropped every request.
bool waitUntilUntracked(const RequestQueue& queue, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (queue.trackedCount() == 0) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return queue.trackedCount() == 0;
}

} // namespace

class RequestQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        notifier = std::make_unique<NotificationDispatcher>();
        estimator = std::make_unique<ConnectionQualityEstimator>(*notifier);
    }

    void TearDown() override {
        transport.release();
        queue.reset();
        notifier->stop();
    }

    void createQueue(size_t workers, size_t immediate = 0) {
        DispatcherConfig config;
        config.workerThreads = workers;
        config.immediateThreads = immediate;
        queue = std::make_unique<RequestQueue>(transport, *notifier, estimator.get(), config);
    }

    BlockingTransport transport;
    OutcomeRecorder recorder;
    std::unique_ptr<NotificationDispatcher> notifier;
    std::unique_ptr<ConnectionQualityEstimator> estimator;
    std::unique_ptr<RequestQueue> queue;
};

TEST_F(RequestQueueTest, HigherPriorityDispatchedFirst) {
    createQueue(1);

    queue->submit(makeSpec("http://host/blocker"));
    ASSERT_TRUE(transport.waitForStarted(1));

    queue->submit(makeSpec("http://host/low", Priority::LOW));
    queue->submit(makeSpec("http://host/high", Priority::HIGH));
    queue->submit(makeSpec("http://host/medium", Priority::MEDIUM));
    queue->submit(makeSpec("http://host/immediate", Priority::IMMEDIATE));
    EXPECT_EQ(queue->pendingCount(), 4u);

    transport.release();
    ASSERT_TRUE(transport.waitForFinished(5));

    std::vector<std::string> expected = {
        "http://host/blocker", "http://host/immediate", "http://host/high",
        "http://host/medium", "http://host/low"
    };
    EXPECT_EQ(transport.startedUrls(), expected);
}

TEST_F(RequestQueueTest, EqualPriorityKeepsSubmissionOrder) {
    createQueue(1);

    queue->submit(makeSpec("http://host/blocker", Priority::HIGH));
    ASSERT_TRUE(transport.waitForStarted(1));

    for (int i = 1; i <= 5; ++i) {
        queue->submit(makeSpec("http://host/" + std::to_string(i), Priority::HIGH));
    }

    transport.release();
    ASSERT_TRUE(transport.waitForFinished(6));

    auto started = transport.startedUrls();
    ASSERT_EQ(started.size(), 6u);
    for (int i = 1; i <= 5; ++i) {
        EXPECT_EQ(started[i], "http://host/" + std::to_string(i));
    }
}

TEST_F(RequestQueueTest, SubmitAssignsIncreasingIds) {
    createQueue(1);

    RequestHandle first = queue->submit(makeSpec("http://host/a"));
    RequestHandle second = queue->submit(makeSpec("http://host/b"));

    EXPECT_TRUE(first.valid());
    EXPECT_GT(second.id(), first.id());
}

TEST_F(RequestQueueTest, CancelTagOnlyAffectsThatTag) {
    createQueue(4);
    transport.setCooperative(false);

    RequestHandle a1 = queue->submit(makeSpec("http://host/a1", Priority::MEDIUM, "A"), recorder.callback());
    RequestHandle a2 = queue->submit(makeSpec("http://host/a2", Priority::MEDIUM, "A"), recorder.callback());
    RequestHandle b1 = queue->submit(makeSpec("http://host/b1", Priority::MEDIUM, "B"), recorder.callback());
    RequestHandle b2 = queue->submit(makeSpec("http://host/b2", Priority::MEDIUM, "B"), recorder.callback());
    ASSERT_TRUE(transport.waitForStarted(4));

    queue->cancel("A", true);

    EXPECT_EQ(a1.state(), RequestState::CANCELLED);
    EXPECT_EQ(a2.state(), RequestState::CANCELLED);
    EXPECT_EQ(b1.state(), RequestState::RUNNING);
    EXPECT_EQ(b2.state(), RequestState::RUNNING);
    EXPECT_FALSE(queue->isRequestRunning("A"));
    EXPECT_TRUE(queue->isRequestRunning("B"));

    transport.release();
    ASSERT_TRUE(b1.wait());
    ASSERT_TRUE(b2.wait());
    EXPECT_EQ(b1.state(), RequestState::COMPLETED);
    EXPECT_EQ(b2.state(), RequestState::COMPLETED);

    ASSERT_TRUE(recorder.waitFor(4));
    EXPECT_EQ(recorder.count(OutcomeStatus::CANCELLED), 2u);
    EXPECT_EQ(recorder.count(OutcomeStatus::SUCCESS), 2u);
}

TEST_F(RequestQueueTest, CancelPendingRequestDeliversCancelledOnce) {
    createQueue(1);

    queue->submit(makeSpec("http://host/blocker"));
    ASSERT_TRUE(transport.waitForStarted(1));

    RequestHandle pending = queue->submit(makeSpec("http://host/pending", Priority::LOW, "tag"), recorder.callback());
    EXPECT_EQ(pending.state(), RequestState::PENDING);

    queue->cancel("tag", false);
    queue->cancel("tag", false);
    queue->cancel(pending.id(), true);

    EXPECT_EQ(pending.state(), RequestState::CANCELLED);
    EXPECT_EQ(queue->pendingCount(), 0u);

    transport.release();
    ASSERT_TRUE(transport.waitForFinished(1));
    ASSERT_TRUE(recorder.waitFor(1));
    ASSERT_TRUE(notifier->waitIdle());

    EXPECT_EQ(recorder.count(), 1u);
    EXPECT_EQ(recorder.outcomes()[0].status, OutcomeStatus::CANCELLED);
    EXPECT_EQ(transport.startedUrls().size(), 1u);
}

TEST_F(RequestQueueTest, ForceCancelAllLeavesNoActiveRequests) {
    createQueue(2);
    transport.setCooperative(false);

    std::vector<RequestHandle> handles;
    for (int i = 0; i < 5; ++i) {
        handles.push_back(queue->submit(makeSpec("http://host/" + std::to_string(i), Priority::MEDIUM,
                                                 i % 2 ? "odd" : "even"),
                                        recorder.callback()));
    }
    ASSERT_TRUE(transport.waitForStarted(2));

    queue->cancelAll(true);

    for (const auto& handle : handles) {
        EXPECT_EQ(handle.state(), RequestState::CANCELLED);
    }
    EXPECT_EQ(queue->pendingCount(), 0u);
    EXPECT_EQ(queue->runningCount(), 0u);
    EXPECT_FALSE(queue->isRequestRunning("odd"));
    EXPECT_FALSE(queue->isRequestRunning("even"));

    ASSERT_TRUE(transport.waitForFinished(2));
    EXPECT_EQ(transport.interruptedCalls(), 2u);
    EXPECT_TRUE(waitUntilUntracked(*queue));

    ASSERT_TRUE(recorder.waitFor(5));
    ASSERT_TRUE(notifier->waitIdle());
    EXPECT_EQ(recorder.count(OutcomeStatus::CANCELLED), 5u);
    for (const auto& entry : recorder.deliveriesById()) {
        EXPECT_EQ(entry.second, 1u) << "request " << entry.first;
    }
}

TEST_F(RequestQueueTest, CancelledNeverBecomesCompleted) {
    createQueue(1);
    // The transport ignores the cooperative flag and finishes successfully.
    transport.setCooperative(false);

    RequestHandle handle = queue->submit(makeSpec("http://host/slow", Priority::MEDIUM, "slow"), recorder.callback());
    ASSERT_TRUE(transport.waitForStarted(1));

    queue->cancel("slow", false);
    EXPECT_TRUE(handle.isCancelled());

    transport.release();
    ASSERT_TRUE(handle.wait());
    EXPECT_EQ(handle.state(), RequestState::CANCELLED);

    ASSERT_TRUE(recorder.waitFor(1));
    ASSERT_TRUE(notifier->waitIdle());
    EXPECT_EQ(recorder.count(), 1u);
    EXPECT_EQ(recorder.outcomes()[0].status, OutcomeStatus::CANCELLED);

    // Cancelled transfers are not bandwidth samples
    EXPECT_EQ(estimator->getSampleCount(), 0u);
}

TEST_F(RequestQueueTest, CooperativeCancelStopsAtCheckpoint) {
    createQueue(1);

    RequestHandle handle = queue->submit(makeSpec("http://host/a", Priority::MEDIUM, "coop"), recorder.callback());
    ASSERT_TRUE(transport.waitForStarted(1));

    queue->cancel("coop", false);

    ASSERT_TRUE(handle.wait());
    EXPECT_EQ(handle.state(), RequestState::CANCELLED);
    EXPECT_EQ(transport.interruptedCalls(), 0u);
    ASSERT_TRUE(recorder.waitFor(1));
    EXPECT_EQ(recorder.outcomes()[0].status, OutcomeStatus::CANCELLED);
}

TEST_F(RequestQueueTest, ForceCancelInterruptsTransport) {
    createQueue(1);
    transport.setCooperative(false);

    RequestHandle handle = queue->submit(makeSpec("http://host/a", Priority::MEDIUM, "force"));
    ASSERT_TRUE(transport.waitForStarted(1));

    queue->cancel("force", true);
    EXPECT_EQ(handle.state(), RequestState::CANCELLED);

    ASSERT_TRUE(transport.waitForFinished(1));
    EXPECT_EQ(transport.interruptedCalls(), 1u);
    EXPECT_TRUE(waitUntilUntracked(*queue));
}

TEST_F(RequestQueueTest, CancelThresholdKeepsNearlyFinishedRequest) {
    createQueue(1);
    transport.setProgress(90, 100);

    RequestSpec spec = makeSpec("http://host/big", Priority::MEDIUM, "big");
    spec.cancelThresholdPercent = 80;
    RequestHandle handle = queue->submit(spec, recorder.callback());
    ASSERT_TRUE(transport.waitForStarted(1));
    EXPECT_EQ(handle.progressPercent(), 90);

    queue->cancel("big", false);
    EXPECT_FALSE(handle.isCancelled());
    EXPECT_EQ(handle.state(), RequestState::RUNNING);

    transport.release();
    ASSERT_TRUE(handle.wait());
    EXPECT_EQ(handle.state(), RequestState::COMPLETED);
}

TEST_F(RequestQueueTest, ForceCancelIgnoresThreshold) {
    createQueue(1);
    transport.setProgress(90, 100);
    transport.setCooperative(false);

    RequestSpec spec = makeSpec("http://host/big", Priority::MEDIUM, "big");
    spec.cancelThresholdPercent = 80;
    RequestHandle handle = queue->submit(spec);
    ASSERT_TRUE(transport.waitForStarted(1));

    queue->cancel("big", true);
    EXPECT_EQ(handle.state(), RequestState::CANCELLED);
}

TEST_F(RequestQueueTest, UnknownTagIsNoop) {
    createQueue(1);

    RequestHandle handle = queue->submit(makeSpec("http://host/a", Priority::MEDIUM, "known"));
    ASSERT_TRUE(transport.waitForStarted(1));

    queue->cancel("unknown", true);
    EXPECT_FALSE(queue->cancel(RequestId(9999), true));
    EXPECT_EQ(handle.state(), RequestState::RUNNING);
}

TEST_F(RequestQueueTest, SubmitAfterShutdownThrows) {
    createQueue(1);
    queue->shutdown();

    EXPECT_TRUE(queue->isShutdown());
    EXPECT_THROW(queue->submit(makeSpec("http://host/late")), fastnet::utils::ShutdownException);
    EXPECT_EQ(queue->trackedCount(), 0u);
    EXPECT_EQ(queue->pendingCount(), 0u);
}

TEST_F(RequestQueueTest, ShutdownDrainsPendingRequests) {
    createQueue(1);

    RequestHandle first = queue->submit(makeSpec("http://host/1"), recorder.callback());
    RequestHandle second = queue->submit(makeSpec("http://host/2"), recorder.callback());
    ASSERT_TRUE(transport.waitForStarted(1));

    queue->shutdown();
    transport.release();

    ASSERT_TRUE(first.wait());
    ASSERT_TRUE(second.wait());
    EXPECT_EQ(first.state(), RequestState::COMPLETED);
    EXPECT_EQ(second.state(), RequestState::COMPLETED);
    ASSERT_TRUE(recorder.waitFor(2));
    EXPECT_EQ(recorder.count(OutcomeStatus::SUCCESS), 2u);
}

TEST_F(RequestQueueTest, ImmediateWorkersOnlyTakeImmediateRequests) {
    createQueue(1, 1);

    queue->submit(makeSpec("http://host/blocker"));
    ASSERT_TRUE(transport.waitForStarted(1));

    // The general worker is busy; only the immediate worker is free.
    RequestHandle urgent = queue->submit(makeSpec("http://host/urgent", Priority::IMMEDIATE));
    ASSERT_TRUE(transport.waitForStarted(2));
    EXPECT_EQ(urgent.state(), RequestState::RUNNING);

    RequestHandle low = queue->submit(makeSpec("http://host/low", Priority::LOW));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(low.state(), RequestState::PENDING);
    EXPECT_EQ(queue->pendingCount(), 1u);
    EXPECT_EQ(queue->runningCount(), 2u);

    transport.release();
    ASSERT_TRUE(low.wait());
    EXPECT_EQ(low.state(), RequestState::COMPLETED);
}

TEST_F(RequestQueueTest, CompletionFeedsEstimator) {
    createQueue(1);
    transport.setSample(1000000, 100);
    transport.release();

    RequestHandle handle = queue->submit(makeSpec("http://host/a"), recorder.callback());
    ASSERT_TRUE(recorder.waitFor(1));

    EXPECT_EQ(handle.state(), RequestState::COMPLETED);
    EXPECT_EQ(estimator->getSampleCount(), 1u);
    EXPECT_EQ(estimator->getCurrentBandwidth(), 80000);
}

TEST_F(RequestQueueTest, SuccessfulOutcomeCarriesResponse) {
    createQueue(1);
    transport.release();

    queue->submit(makeSpec("http://host/body"), recorder.callback());
    ASSERT_TRUE(recorder.waitFor(1));

    auto outcome = recorder.outcomes()[0];
    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.response.statusCode, 200);
    EXPECT_EQ(outcome.response.body, "http://host/body");
}

TEST_F(RequestQueueTest, IsRequestRunningTracksTag) {
    createQueue(1);

    EXPECT_FALSE(queue->isRequestRunning("t"));
    RequestHandle handle = queue->submit(makeSpec("http://host/a", Priority::MEDIUM, "t"));
    EXPECT_TRUE(queue->isRequestRunning("t"));

    transport.release();
    ASSERT_TRUE(handle.wait());
    EXPECT_FALSE(queue->isRequestRunning("t"));
}

class RequestQueueMockTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastnet::utils::ErrorHandler::getInstance().clearErrorHistory();
        DispatcherConfig config;
        config.workerThreads = 1;
        config.immediateThreads = 0;
        queue = std::make_unique<RequestQueue>(transport, notifier, nullptr, config);
    }

    void TearDown() override {
        queue.reset();
        notifier.stop();
        fastnet::utils::ErrorHandler::getInstance().clearErrorHistory();
    }

    MockTransport transport;
    NotificationDispatcher notifier;
    OutcomeRecorder recorder;
    std::unique_ptr<RequestQueue> queue;
};

TEST_F(RequestQueueMockTest, TransportFailureIsReportedNotRetried) {
    fastnet::core::TransportResult failure;
    failure.statusCode = 503;
    failure.error = "HTTP Error 503";

    EXPECT_CALL(transport, execute(_, _, _)).Times(1).WillOnce(Return(failure));

    RequestHandle handle = queue->submit(makeSpec("http://host/down"), recorder.callback());
    ASSERT_TRUE(recorder.waitFor(1));

    EXPECT_EQ(handle.state(), RequestState::FAILED);
    auto outcome = recorder.outcomes()[0];
    EXPECT_EQ(outcome.status, OutcomeStatus::FAILED);
    EXPECT_EQ(outcome.response.statusCode, 503);
    EXPECT_EQ(outcome.error, "HTTP Error 503");
}

TEST_F(RequestQueueMockTest, TransportExceptionBecomesFailure) {
    EXPECT_CALL(transport, execute(_, _, _))
        .WillOnce(Invoke([](const RequestSpec&, CancellationToken&, const fastnet::core::ProgressCallback&)
                             -> fastnet::core::TransportResult {
            throw std::runtime_error("socket closed");
        }));

    RequestHandle handle = queue->submit(makeSpec("http://host/broken"), recorder.callback());
    ASSERT_TRUE(recorder.waitFor(1));

    EXPECT_EQ(handle.state(), RequestState::FAILED);
    EXPECT_EQ(recorder.outcomes()[0].error, "socket closed");
    EXPECT_EQ(fastnet::utils::ErrorHandler::getInstance().getErrorCount(fastnet::utils::ErrorCategory::TRANSPORT), 1u);
}

TEST_F(RequestQueueMockTest, DefaultUserAgentApplied) {
    queue->setUserAgent("fastnet-test/1.0");

    std::string seenAgent;
    EXPECT_CALL(transport, execute(_, _, _))
        .WillOnce(Invoke([&seenAgent](const RequestSpec& spec, CancellationToken&,
                                      const fastnet::core::ProgressCallback&) {
            seenAgent = spec.userAgent;
            return fixtures::okResult();
        }));

    RequestHandle handle = queue->submit(makeSpec("http://host/ua"));
    ASSERT_TRUE(handle.wait());
    EXPECT_EQ(seenAgent, "fastnet-test/1.0");
}

TEST_F(RequestQueueMockTest, RequestUserAgentWins) {
    queue->setUserAgent("default-agent");

    std::string seenAgent;
    EXPECT_CALL(transport, execute(_, _, _))
        .WillOnce(Invoke([&seenAgent](const RequestSpec& spec, CancellationToken&,
                                      const fastnet::core::ProgressCallback&) {
            seenAgent = spec.userAgent;
            return fixtures::okResult();
        }));

    RequestSpec spec = makeSpec("http://host/ua");
    spec.userAgent = "custom-agent";
    RequestHandle handle = queue->submit(spec);
    ASSERT_TRUE(handle.wait());
    EXPECT_EQ(seenAgent, "custom-agent");
}

TEST_F(RequestQueueMockTest, ProgressListenerReceivesUpdates) {
    EXPECT_CALL(transport, execute(_, _, _))
        .WillOnce(Invoke([](const RequestSpec&, CancellationToken&, const fastnet::core::ProgressCallback& progress) {
            progress(50, 100);
            progress(100, 100);
            return fixtures::okResult();
        }));

    std::mutex progressMutex;
    std::vector<uint64_t> seen;
    RequestHandle handle = queue->submit(makeSpec("http://host/p"), recorder.callback(),
                                         [&](uint64_t done, uint64_t) {
                                             std::lock_guard<std::mutex> lock(progressMutex);
                                             seen.push_back(done);
                                         });
    ASSERT_TRUE(recorder.waitFor(1));
    ASSERT_TRUE(notifier.waitIdle());

    EXPECT_EQ(handle.progressPercent(), 100);
    std::lock_guard<std::mutex> lock(progressMutex);
    EXPECT_EQ(seen, (std::vector<uint64_t>{50, 100}));
}
