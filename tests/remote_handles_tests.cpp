#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>
#include "kernel/Errors.h"
#include "modules/RemoteHandles.h"
#include "utils/EventLog.h"

namespace {
    // Refuses graceful deregistration for the first `refusals` calls and
    // records the mode of every attempt.
    class ScriptedRegistry : public HandleRegistry {
    public:
        explicit ScriptedRegistry(int refusals, bool forceWorks = true)
            : refusals_(refusals), forceWorks_(forceWorks) {}

        void exportHandle(const RemoteHandle&) override {}

        bool unexportHandle(const RemoteHandle&, bool force) override {
            attempts.push_back(force);
            if (force) {
                return forceWorks_;
            }
            return refusals_-- <= 0;
        }

        std::vector<bool> attempts;

    private:
        int refusals_;
        bool forceWorks_;
    };

    const TeardownPolicy kNoDelay{4, std::chrono::milliseconds(0)};
    const RemoteHandle kAgent{"agent", 7};
}

TEST(RemoteHandlesTest, DefaultPolicy) {
    const TeardownPolicy policy;
    EXPECT_EQ(policy.attempts, 4);
    EXPECT_EQ(policy.delay, std::chrono::milliseconds(250));
}

TEST(RemoteHandlesTest, FirstGracefulAttemptSucceeds) {
    EventLog log;
    ScriptedRegistry registry(0);
    EXPECT_TRUE(withdrawHandle(registry, kAgent, log, kNoDelay));
    EXPECT_EQ(registry.attempts, std::vector<bool>{false});
}

TEST(RemoteHandlesTest, UnknownHandleCountsAsWithdrawn) {
    EventLog log;
    InProcessHandleRegistry registry;
    EXPECT_TRUE(withdrawHandle(registry, kAgent, log, kNoDelay));
    EXPECT_EQ(log.count(EventCategory::HandleFailure), 0u);
}

TEST(RemoteHandlesTest, BusyHandleIsForcedAfterGracefulAttempts) {
    EventLog log;
    ScriptedRegistry registry(100);
    EXPECT_TRUE(withdrawHandle(registry, kAgent, log, kNoDelay));
    const std::vector<bool> expected{false, false, false, false, true};
    EXPECT_EQ(registry.attempts, expected);
}

TEST(RemoteHandlesTest, ExhaustionIsLogged) {
    EventLog log;
    log.setEcho(nullptr);
    ScriptedRegistry registry(100, false);
    EXPECT_FALSE(withdrawHandle(registry, kAgent, log, kNoDelay, 12));
    EXPECT_EQ(registry.attempts.size(), 8u);
    ASSERT_EQ(log.count(EventCategory::HandleFailure), 1u);
    const EventRecord record = log.entries().back();
    EXPECT_EQ(record.step, 12);
    EXPECT_NE(record.message.find("agent#7"), std::string::npos);
}

TEST(RemoteHandlesTest, DelayBetweenAttempts) {
    EventLog log;
    log.setEcho(nullptr);
    ScriptedRegistry registry(100, false);
    const TeardownPolicy policy{2, std::chrono::milliseconds(10)};
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(withdrawHandle(registry, kAgent, log, policy));
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(registry.attempts.size(), 4u);
    EXPECT_GE(elapsed, std::chrono::milliseconds(30));
}

TEST(RemoteHandlesTest, InProcessRegistryRejectsDuplicates) {
    InProcessHandleRegistry registry;
    registry.exportHandle(kAgent);
    EXPECT_THROW(registry.exportHandle(kAgent), std::invalid_argument);
    registry.setBusy(kAgent, true);
    EXPECT_FALSE(registry.unexportHandle(kAgent, false));
    EXPECT_TRUE(registry.unexportHandle(kAgent, true));
    EXPECT_THROW(registry.unexportHandle(kAgent, false), NoSuchHandle);
}

TEST(RemoteHandlesTest, SharedHandlesAreReferenceCounted) {
    EventLog log;
    auto registry = std::make_shared<InProcessHandleRegistry>();
    HandlePublisher publisher(registry, log, kNoDelay);
    const RemoteHandle species{"species", 3};

    publisher.acquire(species);
    publisher.acquire(species);
    EXPECT_TRUE(registry->isExported(species));
    EXPECT_TRUE(publisher.release(species));
    EXPECT_TRUE(registry->isExported(species));
    EXPECT_TRUE(publisher.release(species));
    EXPECT_FALSE(registry->isExported(species));
    EXPECT_TRUE(publisher.release(species));  // unknown

    publisher.publish(kAgent);
    EXPECT_THROW(publisher.publish(kAgent), std::invalid_argument);
    EXPECT_TRUE(publisher.withdraw(kAgent));
    EXPECT_EQ(registry->size(), 0u);
}

TEST(RemoteHandlesTest, PublisherNeedsRegistry) {
    EventLog log;
    EXPECT_THROW(HandlePublisher(nullptr, log), std::invalid_argument);
}
