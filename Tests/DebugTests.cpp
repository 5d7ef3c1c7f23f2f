#include <gtest/gtest.h>

#include "Utils/Debug/Debug.hpp"
#include "Utils/Debug/ThreadSafeQueue.hpp"

#include <chrono>
#include <deque>
#include <string>
#include <thread>
#include <vector>

TEST(DebugTests, QueueHandsOutEverythingPendingInPushOrder) {
    ThreadSafeQueue<int> queue;
    queue.Push(1);
    queue.Push(2);
    queue.Push(3);

    std::deque<int> batch{ 99 };
    ASSERT_TRUE(queue.WaitPopAll(batch));
    EXPECT_EQ(batch, (std::deque<int>{ 1, 2, 3 }));

    queue.Push(4);
    ASSERT_TRUE(queue.WaitPopAll(batch));
    EXPECT_EQ(batch, (std::deque<int>{ 4 }));
}

TEST(DebugTests, ClosedQueueDrainsThenReportsEmpty) {
    ThreadSafeQueue<std::string> queue;
    std::vector<std::string> received;

    std::thread consumer([&] {
        std::deque<std::string> batch;
        while (queue.WaitPopAll(batch)) {
            received.insert(received.end(), batch.begin(), batch.end());
        }
    });

    queue.Push("first");
    queue.Push("second");
    queue.Close();
    consumer.join();

    EXPECT_EQ(received, (std::vector<std::string>{ "first", "second" }));
}

TEST(DebugTests, ReopenedQueueBlocksAgain) {
    ThreadSafeQueue<int> queue;
    queue.Close();
    std::deque<int> batch;
    EXPECT_FALSE(queue.WaitPopAll(batch));

    queue.Reopen();
    queue.Push(7);
    EXPECT_TRUE(queue.WaitPopAll(batch));
    EXPECT_EQ(batch, (std::deque<int>{ 7 }));
}

TEST(DebugTests, LevelNames) {
    EXPECT_STREQ(LevelToString(LogLevel::Info), "[INFO]");
    EXPECT_STREQ(LevelToString(LogLevel::Warning), "[WARN]");
    EXPECT_STREQ(LevelToString(LogLevel::Error), "[ERROR]");
    EXPECT_STREQ(LevelToString(LogLevel::Critical), "[CRITICAL]");
}

TEST(DebugTests, LoggingBeforeInitializeIsDropped) {
    Debug::Info("Test") << "dropped " << 42;
    Debug::Warning() << "also dropped";
    Debug::LogError("dropped", "Test");
    SUCCEED();
}

TEST(DebugTests, TimestampsCarryMilliseconds) {
    auto time = std::chrono::system_clock::time_point(std::chrono::milliseconds(1234567890042));

    std::string shortForm = FormatTimestamp(time, false);
    std::string longForm = FormatTimestamp(time, true);

    ASSERT_EQ(shortForm.size(), 12u);
    EXPECT_EQ(shortForm.substr(8), ".042");
    ASSERT_EQ(longForm.size(), 23u);
    EXPECT_EQ(longForm.substr(19), ".042");
    EXPECT_EQ(longForm.substr(11), shortForm);
}
