#include "core/cancellation_token.hpp"
#include "utils/error_handler.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace fastnet::core;
using fastnet::utils::ErrorCategory;
using fastnet::utils::ErrorHandler;

TEST(CancellationTokenTest, CancelReturnsTrueOnce) {
    CancellationToken token;
    EXPECT_FALSE(token.isCancelled());

    EXPECT_TRUE(token.cancel());
    EXPECT_FALSE(token.cancel());
    EXPECT_TRUE(token.isCancelled());
    EXPECT_FALSE(token.isForced());
}

TEST(CancellationTokenTest, CooperativeCancelDoesNotRunHandlers) {
    CancellationToken token;
    int calls = 0;
    token.onInterrupt([&calls]() { calls++; });

    token.cancel();
    EXPECT_EQ(calls, 0);
}

TEST(CancellationTokenTest, ForceCancelRunsHandlersOnce) {
    CancellationToken token;
    int calls = 0;
    token.onInterrupt([&calls]() { calls++; });
    token.onInterrupt([&calls]() { calls++; });

    token.forceCancel();
    token.forceCancel();

    EXPECT_EQ(calls, 2);
    EXPECT_TRUE(token.isCancelled());
    EXPECT_TRUE(token.isForced());
}

TEST(CancellationTokenTest, LateHandlerRunsImmediately) {
    CancellationToken token;
    token.forceCancel();

    bool ran = false;
    token.onInterrupt([&ran]() { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(CancellationTokenTest, ClearedHandlersAreNotRun) {
    CancellationToken token;
    bool ran = false;
    token.onInterrupt([&ran]() { ran = true; });

    token.clearInterruptHandlers();
    token.forceCancel();
    EXPECT_FALSE(ran);
}

TEST(CancellationTokenTest, ThrowingHandlerIsReported) {
    ErrorHandler::getInstance().clearErrorHistory();

    CancellationToken token;
    bool second = false;
    token.onInterrupt([]() { throw std::runtime_error("socket already closed"); });
    token.onInterrupt([&second]() { second = true; });

    EXPECT_NO_THROW(token.forceCancel());
    EXPECT_TRUE(second);
    EXPECT_EQ(ErrorHandler::getInstance().getErrorCount(ErrorCategory::TRANSPORT), 1u);

    ErrorHandler::getInstance().clearErrorHistory();
}

TEST(CancellationTokenTest, ConcurrentForceCancelFiresOnce) {
    CancellationToken token;
    std::atomic<int> calls{0};
    token.onInterrupt([&calls]() { calls++; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&token]() { token.forceCancel(); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(calls.load(), 1);
}
