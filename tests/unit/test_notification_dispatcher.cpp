#include "core/notification_dispatcher.hpp"
#include "utils/error_handler.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using fastnet::core::NotificationDispatcher;
using fastnet::utils::ErrorCategory;
using fastnet::utils::ErrorHandler;

class NotificationDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorHandler::getInstance().clearErrorHistory();
    }

    void TearDown() override {
        dispatcher.stop();
        ErrorHandler::getInstance().clearErrorHistory();
    }

    NotificationDispatcher dispatcher;
};

TEST_F(NotificationDispatcherTest, RunsInPostingOrder) {
    std::vector<int> order;
    for (int i = 0; i < 10; ++i) {
        dispatcher.post([&order, i]() { order.push_back(i); });
    }
    ASSERT_TRUE(dispatcher.waitIdle());

    ASSERT_EQ(order.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(order[i], i);
    }
    EXPECT_EQ(dispatcher.getDeliveredCount(), 10u);
}

TEST_F(NotificationDispatcherTest, RunsOffTheCallingThread) {
    std::thread::id callbackThread;
    dispatcher.post([&]() {
        callbackThread = std::this_thread::get_id();
        EXPECT_TRUE(dispatcher.isDispatchThread());
    });
    ASSERT_TRUE(dispatcher.waitIdle());

    EXPECT_NE(callbackThread, std::this_thread::get_id());
    EXPECT_FALSE(dispatcher.isDispatchThread());
}

TEST_F(NotificationDispatcherTest, ThrowingListenerDoesNotStopOthers) {
    std::atomic<int> delivered{0};

    dispatcher.post([&]() { delivered++; });
    dispatcher.post([]() { throw std::runtime_error("boom"); }, "completion");
    dispatcher.post([&]() { delivered++; });
    ASSERT_TRUE(dispatcher.waitIdle());

    EXPECT_EQ(delivered.load(), 2);
    EXPECT_EQ(dispatcher.getFailedCount(), 1u);
    EXPECT_EQ(ErrorHandler::getInstance().getErrorCount(ErrorCategory::LISTENER), 1u);

    auto recent = ErrorHandler::getInstance().getRecentErrors(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_NE(recent[0].message.find("completion"), std::string::npos);
    EXPECT_EQ(recent[0].details, "boom");
}

TEST_F(NotificationDispatcherTest, StopDrainsQueue) {
    std::atomic<int> delivered{0};
    for (int i = 0; i < 20; ++i) {
        dispatcher.post([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            delivered++;
        });
    }

    dispatcher.stop();

    EXPECT_EQ(delivered.load(), 20);
    EXPECT_FALSE(dispatcher.isRunning());
}

TEST_F(NotificationDispatcherTest, PostAfterStopRejected) {
    dispatcher.stop();
    dispatcher.stop();

    EXPECT_FALSE(dispatcher.post([]() {}));
}

TEST_F(NotificationDispatcherTest, EmptyNotificationRejected) {
    EXPECT_FALSE(dispatcher.post(nullptr));
}

TEST_F(NotificationDispatcherTest, WaitIdleFromDispatchThreadReturnsFalse) {
    std::atomic<bool> result{true};
    dispatcher.post([&]() { result = dispatcher.waitIdle(std::chrono::milliseconds(10)); });
    ASSERT_TRUE(dispatcher.waitIdle());

    EXPECT_FALSE(result.load());
}

TEST(NotificationDispatcherOwnershipTest, DestroyedFromOwnCallback) {
    auto dispatcher = std::make_unique<NotificationDispatcher>();
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::promise<void> destroyed;
    std::atomic<bool> laterRan{false};

    dispatcher->post([&dispatcher, opened, &destroyed]() {
        opened.wait();
        dispatcher.reset();
        destroyed.set_value();
    });
    dispatcher->post([&laterRan]() { laterRan = true; });
    gate.set_value();

    auto done = destroyed.get_future();
    ASSERT_EQ(done.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(dispatcher, nullptr);

    // The detached loop exits without running what was still queued.
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(laterRan.load());
}
