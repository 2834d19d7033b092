#ifndef MOCKMESSAGEHANDLER_HH_
#define MOCKMESSAGEHANDLER_HH_

#include "messaging/MessageHandler.hh"
#include "Blob.hh"

#include <gmock/gmock.h>

#include <utility>
#include <vector>

namespace Trio {
namespace Messaging {

template<typename ExecutionPolicy>
class MockBasicMessageHandler : public BasicMessageHandler<ExecutionPolicy> {
public:
    using typename BasicMessageHandler<ExecutionPolicy>::ExecutionContext;
    using typename BasicMessageHandler<ExecutionPolicy>::ParameterVector;
    MOCK_METHOD4_T(
        doHandle,
        void(
            ExecutionContext, const Identity&, const ParameterVector&,
            Response&));
};

using MockMessageHandler = MockBasicMessageHandler<SynchronousExecutionPolicy>;

class MockResponse : public Response {
public:
    MOCK_METHOD1(handleSetStatus, void(ByteSpan));
    MOCK_METHOD1(handleAddFrame, void(ByteSpan));
};

using ReplyParameters = std::vector<std::pair<Blob, Blob>>;

// Action for doHandle() replying OK with the given key/value pairs
inline auto Succeed(ReplyParameters params = {})
{
    return ::testing::WithArg<3>(
        ::testing::Invoke(
            [params = std::move(params)](Response& response)
            {
                response.succeed();
                for (const auto& [key, value] : params) {
                    response.addParameter(asBytes(key), asBytes(value));
                }
            }));
}

// Action for doHandle() replying ERR
inline auto Fail()
{
    return ::testing::WithArg<3>(
        ::testing::Invoke([](Response& response) { response.fail(); }));
}

}
}

#endif // MOCKMESSAGEHANDLER_HH_
