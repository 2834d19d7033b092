#include "coroutines/CoroutineAdapter.hh"
#include "coroutines/Future.hh"
#include "Utility.hh"
#include "MockCallbackScheduler.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <vector>

using Trio::Coroutines::CoroutineAdapter;
using Trio::Coroutines::Future;
using Trio::Messaging::MockCallbackScheduler;

using testing::_;
using testing::Mock;
using testing::SaveArg;
using testing::StrictMock;

class CoroutineAdapterTest : public testing::Test
{
protected:

    template<typename FutureIterator>
    auto createCoroutineAdapter(FutureIterator first, FutureIterator last)
    {
        return CoroutineAdapter::create(
            [first, last](auto& sink) { std::copy(first, last, begin(sink)); },
            callbackScheduler);
    }

    std::shared_ptr<StrictMock<MockCallbackScheduler>> callbackScheduler {
        std::make_shared<StrictMock<MockCallbackScheduler>>()};
};

TEST_F(CoroutineAdapterTest, testFutureCoroutine)
{
    auto futures = std::vector {
        std::make_shared<Future>(),
        std::make_shared<Future>(),
    };
    auto callback = MockCallbackScheduler::Callback {};
    auto coroutineAdapter = createCoroutineAdapter(
        futures.begin(), futures.end());
    EXPECT_EQ(futures.front().get(), coroutineAdapter->getAwaited());
    EXPECT_CALL(*callbackScheduler, handleCallSoon(_))
        .WillOnce(SaveArg<0>(&callback));
    futures.front()->resolve();
    Mock::VerifyAndClearExpectations(callbackScheduler.get());
    ASSERT_TRUE(callback);
    callback();
    EXPECT_EQ(futures.back().get(), coroutineAdapter->getAwaited());
    EXPECT_CALL(*callbackScheduler, handleCallSoon(_))
        .WillOnce(SaveArg<0>(&callback));
    futures.back()->resolve();
    Mock::VerifyAndClearExpectations(callbackScheduler.get());
    callback();
    EXPECT_FALSE(coroutineAdapter->getAwaited());
}

TEST_F(CoroutineAdapterTest, testResolvedFutureIsResumedSoon)
{
    auto futures = std::vector { std::make_shared<Future>() };
    futures.front()->resolve();
    auto callback = MockCallbackScheduler::Callback {};
    EXPECT_CALL(*callbackScheduler, handleCallSoon(_))
        .WillOnce(SaveArg<0>(&callback));
    auto coroutineAdapter = createCoroutineAdapter(
        futures.begin(), futures.end());
    Mock::VerifyAndClearExpectations(callbackScheduler.get());
    ASSERT_TRUE(callback);
    callback();
    EXPECT_FALSE(coroutineAdapter->getAwaited());
}

TEST_F(CoroutineAdapterTest, testResolvingTwiceResumesOnce)
{
    auto futures = std::vector { std::make_shared<Future>() };
    auto coroutineAdapter = createCoroutineAdapter(
        futures.begin(), futures.end());
    EXPECT_CALL(*callbackScheduler, handleCallSoon(_));
    futures.front()->resolve();
    futures.front()->resolve();
    EXPECT_TRUE(futures.front()->isResolved());
}

TEST_F(CoroutineAdapterTest, testCompletedCoroutine)
{
    auto futures = std::vector<std::shared_ptr<Future>> {};
    auto coroutineAdapter = createCoroutineAdapter(
        futures.begin(), futures.end());
    EXPECT_FALSE(coroutineAdapter->getAwaited());
}

TEST_F(CoroutineAdapterTest, testExceptionIsPropagatedFromCreate)
{
    EXPECT_THROW(
        CoroutineAdapter::create(
            [](auto&) { throw std::runtime_error {"error"}; },
            callbackScheduler),
        std::runtime_error);
}
