#include "coroutines/AsynchronousExecutionPolicy.hh"
#include "coroutines/Future.hh"
#include "messaging/MessageHelper.hh"
#include "messaging/MessageQueue.hh"
#include "messaging/MessageUtility.hh"
#include "messaging/MessageHandler.hh"
#include "CallbackSchedulerUtility.hh"
#include "MockMessageHandler.hh"
#include "Blob.hh"

#include <gtest/gtest.h>

#include <array>
#include <memory>
#include <string>

using namespace Trio::Coroutines;
using namespace Trio::Messaging;
using testing::_;
using testing::Invoke;
using testing::IsEmpty;
using testing::WithArgs;

namespace {

using MockAsynchronousMessageHandler =
    MockBasicMessageHandler<AsynchronousExecutionPolicy>;

using namespace Trio::BlobLiterals;
using namespace std::string_view_literals;
const auto TAG = "tag"_BS;
const auto COMMAND = "command"_BS;
constexpr auto MQ_ENDPOINT = "inproc://trio.test.asyncexecpolicy.mq"sv;

}

class AsynchronousExecutionPolicyTest :
    public testing::TestWithParam<Trio::ByteSpan> {
protected:
    void SetUp() override
    {
        messageQueue.addExecutionPolicy(
            AsynchronousExecutionPolicy {callbackScheduler});
        messageQueue.trySetHandler(COMMAND, handler);
    }

    MessageContext context {};
    MessageQueue messageQueue {};
    std::shared_ptr<QueuedCallbackScheduler> callbackScheduler {
        std::make_shared<QueuedCallbackScheduler>()};
    std::shared_ptr<MockAsynchronousMessageHandler> handler {
        std::make_shared<MockAsynchronousMessageHandler>()};
    std::shared_ptr<Future> future {std::make_shared<Future>()};
    std::pair<Socket, Socket> messageQueueSockets {
        createSocketPair(context, MQ_ENDPOINT)};
};

TEST_P(AsynchronousExecutionPolicyTest, testAsynchronousExecution)
{
    const auto status = GetParam();
    EXPECT_CALL(*handler, doHandle(_, _, IsEmpty(), _)).WillOnce(
        WithArgs<0, 3>(
            Invoke(
                [this, status](auto context, auto& response)
                {
                    context.await(future);
                    if (status == REPLY_SUCCESS) {
                        response.succeed();
                    } else {
                        response.fail();
                    }
                })));
    sendMessage(messageQueueSockets.second, messageBuffer(TAG), true);
    sendMessage(messageQueueSockets.second, messageBuffer(COMMAND));
    messageQueue(messageQueueSockets.first);

    // The coroutine is suspended, so nothing has been replied yet
    EXPECT_FALSE(socketHasEvents(messageQueueSockets.second, ZMQ_POLLIN));
    future->resolve();
    callbackScheduler->runAll();

    constexpr auto EXPECTED_N_PARTS = 2;
    auto reply = std::array<Message, EXPECTED_N_PARTS> {};
    const auto n_parts = recvMultipart(
        messageQueueSockets.second, reply.begin(), reply.size()).second;
    EXPECT_EQ(EXPECTED_N_PARTS, n_parts);
    EXPECT_EQ(TAG, messageView(reply[0]));
    EXPECT_EQ(status, messageView(reply[1]));
}

INSTANTIATE_TEST_SUITE_P(
    StatusCodes, AsynchronousExecutionPolicyTest,
    testing::Values(REPLY_SUCCESS, REPLY_FAILURE));
