#include "MockCallbackScheduler.hh"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using Trio::Messaging::MockCallbackScheduler;

using namespace std::chrono_literals;
using testing::_;
using testing::SaveArg;
using testing::StrictMock;

class CallbackSchedulerTest : public testing::Test {
public:
    void returnCards(const std::string& playerId, const int count)
    {
        returned.push_back(playerId + ':' + std::to_string(count));
    }

protected:
    StrictMock<MockCallbackScheduler> callbackScheduler;
    MockCallbackScheduler::Callback scheduled;
    std::vector<std::string> returned;
};

TEST_F(CallbackSchedulerTest, testCallSoonDefersCall)
{
    EXPECT_CALL(callbackScheduler, handleCallSoon(_))
        .WillOnce(SaveArg<0>(&scheduled));
    callbackScheduler.callSoon(
        &CallbackSchedulerTest::returnCards, this, "p1", 2);
    EXPECT_TRUE(returned.empty());
    ASSERT_TRUE(scheduled);
    scheduled();
    EXPECT_EQ(std::vector<std::string> {"p1:2"}, returned);
}

TEST_F(CallbackSchedulerTest, testCallLaterPassesTimeout)
{
    EXPECT_CALL(callbackScheduler, handleCallLater(2000ms, _))
        .WillOnce(SaveArg<1>(&scheduled));
    callbackScheduler.callLater(
        2000ms, [this]() { returnCards("p2", 1); });
    EXPECT_TRUE(returned.empty());
    ASSERT_TRUE(scheduled);
    scheduled();
    EXPECT_EQ(std::vector<std::string> {"p2:1"}, returned);
}

TEST_F(CallbackSchedulerTest, testArgumentsAreCopied)
{
    EXPECT_CALL(callbackScheduler, handleCallSoon(_))
        .WillOnce(SaveArg<0>(&scheduled));
    {
        const auto player_id = std::string {"p3"};
        callbackScheduler.callSoon(
            &CallbackSchedulerTest::returnCards, this, player_id, 3);
    }
    scheduled();
    EXPECT_EQ(std::vector<std::string> {"p3:3"}, returned);
}
