#include "FunctionQueue.hh"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

class FunctionQueueTest : public testing::Test {
protected:
    std::vector<int> calls;
    Trio::FunctionQueue functionQueue;
};

TEST_F(FunctionQueueTest, testNestedCallIsDeferred)
{
    functionQueue(
        [this]()
        {
            calls.push_back(1);
            functionQueue([this]() { calls.push_back(3); });
            calls.push_back(2);
        });
    EXPECT_EQ((std::vector {1, 2, 3}), calls);
}

TEST_F(FunctionQueueTest, testExceptionDiscardsQueue)
{
    EXPECT_THROW(
        functionQueue(
            [this]()
            {
                functionQueue([this]() { calls.push_back(2); });
                throw std::runtime_error {"failed"};
            }),
        std::runtime_error);
    EXPECT_TRUE(calls.empty());
    functionQueue([this]() { calls.push_back(1); });
    EXPECT_EQ(std::vector {1}, calls);
}
