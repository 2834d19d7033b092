#include "messaging/PollingCallbackScheduler.hh"
#include "messaging/TerminationGuard.hh"
#include "CallbackSchedulerUtility.hh"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <vector>

using namespace std::chrono_literals;
using Trio::Messaging::MessageContext;
using Trio::Messaging::PollingCallbackScheduler;
using Trio::Messaging::TerminationGuard;
using Trio::Messaging::pollAndExecuteCallbacks;

class PollingCallbackSchedulerTest : public testing::Test {
protected:
    auto record(const int n)
    {
        return [this, n]() { calls.push_back(n); };
    }

    MessageContext context;
    PollingCallbackScheduler scheduler {
        context, TerminationGuard::createTerminationSubscriber(context)};
    TerminationGuard terminationGuard {context};
    std::vector<int> calls;
};

TEST_F(PollingCallbackSchedulerTest, testCallSoon)
{
    scheduler.callSoon(record(1));
    EXPECT_TRUE(calls.empty());
    pollAndExecuteCallbacks(scheduler);
    EXPECT_EQ(std::vector {1}, calls);
}

TEST_F(PollingCallbackSchedulerTest, testCallSoonKeepsOrder)
{
    scheduler.callSoon(record(1));
    scheduler.callSoon(record(2));
    scheduler.callSoon(record(3));
    while (calls.size() < 3u) {
        pollAndExecuteCallbacks(scheduler);
    }
    EXPECT_EQ((std::vector {1, 2, 3}), calls);
}

TEST_F(PollingCallbackSchedulerTest, testCallLaterWaitsForTimeout)
{
    scheduler.callLater(50ms, record(1));
    const auto start = std::chrono::steady_clock::now();
    pollAndExecuteCallbacks(scheduler);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 45ms);
    EXPECT_EQ(std::vector {1}, calls);
}

TEST_F(PollingCallbackSchedulerTest, testShorterTimeoutRunsFirst)
{
    scheduler.callLater(40ms, record(2));
    scheduler.callLater(20ms, record(1));
    pollAndExecuteCallbacks(scheduler);
    pollAndExecuteCallbacks(scheduler);
    EXPECT_EQ((std::vector {1, 2}), calls);
}

TEST_F(PollingCallbackSchedulerTest, testThrowingCallbackIsNotRetried)
{
    scheduler.callSoon([]() { throw std::runtime_error {"Room destroyed"}; });
    EXPECT_THROW(pollAndExecuteCallbacks(scheduler), std::runtime_error);
    scheduler.callSoon(record(1));
    pollAndExecuteCallbacks(scheduler);
    EXPECT_EQ(std::vector {1}, calls);
}
