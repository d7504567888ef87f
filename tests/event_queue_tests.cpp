#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "kernel/EventQueue.h"
#include "utils/EventLog.h"
#include "TestSupport.h"

TEST(EventQueueTest, TasksRunInOrder) {
    EventLog log;
    Trace trace;
    EventQueue queue(log);
    for (int i = 0; i < 5; ++i) {
        queue.invokeLater([&trace, i] { trace.add(std::to_string(i)); });
    }
    queue.flush();
    const std::vector<std::string> expected{"0", "1", "2", "3", "4"};
    EXPECT_EQ(trace.tags(), expected);
}

TEST(EventQueueTest, TasksWaitForTheLock) {
    EventLog log;
    std::atomic<bool> ran{false};
    EventQueue queue(log);
    {
        std::lock_guard<std::mutex> guard(queue.lock());
        queue.invokeLaterLocked([&ran] { ran = true; });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        EXPECT_FALSE(ran.load());
        EXPECT_EQ(queue.pendingLocked(), 1u);
    }
    queue.flush();
    EXPECT_TRUE(ran.load());
}

TEST(EventQueueTest, ThrowingTaskDoesNotStopTheDrain) {
    EventLog log;
    log.setEcho(nullptr);
    Trace trace;
    EventQueue queue(log);
    queue.invokeLater([] { throw std::runtime_error("boom"); });
    queue.invokeLater([&trace] { trace.add("after"); });
    queue.flush();
    EXPECT_EQ(trace.count("after"), 1u);
    EXPECT_EQ(log.count(EventCategory::ListenerFailure), 1u);
}

TEST(EventQueueTest, NonStandardExceptionIsLogged) {
    EventLog log;
    log.setEcho(nullptr);
    Trace trace;
    EventQueue queue(log);
    queue.invokeLater([] { throw 7; });
    queue.invokeLater([&trace] { trace.add("after"); });
    queue.flush();
    EXPECT_EQ(trace.count("after"), 1u);
    EXPECT_EQ(log.count(EventCategory::ListenerFailure), 1u);
}

TEST(EventQueueTest, TasksRunOnTheDispatchThread) {
    EventLog log;
    log.setEcho(nullptr);
    std::atomic<bool> onWorker{false};
    EventQueue queue(log);
    EXPECT_FALSE(queue.isDispatchThread());
    queue.invokeLater([&queue, &onWorker] {
        onWorker = queue.isDispatchThread();
        queue.flush();  // throws, logged as a failure
    });
    queue.flush();
    EXPECT_TRUE(onWorker.load());
    EXPECT_EQ(log.count(EventCategory::ListenerFailure), 1u);
}

TEST(EventQueueTest, DisposeDrainsThenDrops) {
    EventLog log;
    std::ostringstream echo;
    log.setEcho(&echo);
    Trace trace;
    EventQueue queue(log, "test-queue");
    queue.invokeLater([&trace] { trace.add("queued"); });
    queue.dispose();
    EXPECT_TRUE(queue.disposed());
    EXPECT_EQ(trace.count("queued"), 1u);

    queue.invokeLater([&trace] { trace.add("late"); });
    EXPECT_EQ(trace.count("late"), 0u);
    EXPECT_EQ(log.count(EventCategory::Warning), 1u);
    EXPECT_NE(echo.str().find("test-queue"), std::string::npos);
    EXPECT_NO_THROW(queue.dispose());
}

TEST(EventQueueTest, DisposeFromATask) {
    EventLog log;
    Trace trace;
    EventQueue queue(log);
    queue.invokeLater([&queue] { queue.dispose(); });
    queue.invokeLater([&trace] { trace.add("same drain"); });
    queue.flush();
    EXPECT_TRUE(queue.disposed());
    EXPECT_EQ(trace.count("same drain"), 1u);
    EXPECT_NO_THROW(queue.dispose());
}
