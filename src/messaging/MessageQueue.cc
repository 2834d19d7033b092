#include "messaging/MessageQueue.hh"

#include "messaging/MessageUtility.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <algorithm>
#include <iterator>

namespace Trio {
namespace Messaging {

MessageQueue::BasicResponse::BasicResponse(
    MessageVector& inputFrames, const std::ptrdiff_t nPrefix) :
    // the status frame directly follows the echoed prefix
    nStatusFrame {nPrefix},
    frames(nPrefix + 1)
{
    assert(0 <= nPrefix && nPrefix < std::ssize(inputFrames));
    for (auto n = std::ptrdiff_t {}; n < nPrefix; ++n) {
        frames[n].move(inputFrames[n]);
    }
}

void MessageQueue::BasicResponse::sendResponse(Socket& socket)
{
    sendMultipart(socket, frames.begin(), frames.end());
}

void MessageQueue::BasicResponse::handleSetStatus(const ByteSpan status)
{
    assert(0 <= nStatusFrame && nStatusFrame < std::ssize(frames));
    frames[nStatusFrame].rebuild(status.data(), status.size());
}

void MessageQueue::BasicResponse::handleAddFrame(const ByteSpan frame)
{
    frames.emplace_back(frame.data(), frame.size());
}

namespace {

class UnknownCommandHandler : public MessageHandler {
private:
    void doHandle(
        ExecutionContext, const Identity& identity,
        const ParameterVector& params, Response& response) override;
};

void UnknownCommandHandler::doHandle(
    ExecutionContext, const Identity& identity, const ParameterVector&,
    Response& response)
{
    log(LogLevel::DEBUG, "Unknown command from %s", identity);
    response.fail();
}

}

MessageQueue::MessageQueue() :
    defaultExecutor {
        internalCreateExecutor<SynchronousExecutionPolicy>(
            std::make_shared<UnknownCommandHandler>())}
{
}

MessageQueue::~MessageQueue() = default;

void MessageQueue::operator()(Socket& socket)
{
    auto input_frames = MessageVector {};
    recvMultipart(socket, std::back_inserter(input_frames));

    auto identity = Identity {};
    auto payload_frame_iter = input_frames.begin();
    if (getSocketType(socket) == SocketType::router) {
        payload_frame_iter = std::find_if(
            payload_frame_iter, input_frames.end(),
            [](const auto& message) { return message.size() == 0u; });
        // Drop messages without routing id or empty frame
        if (payload_frame_iter == input_frames.begin() ||
            payload_frame_iter == input_frames.end()) {
            return;
        }
        identity = identityFromMessage(payload_frame_iter[-1]);
        ++payload_frame_iter;
    }

    // Drop messages without tag and command
    if (input_frames.end() - payload_frame_iter < 2) {
        return;
    }

    const auto executor_iter = executors.find(
        payload_frame_iter[1].to_string_view());
    auto& executor = (executor_iter != executors.end()) ?
        executor_iter->second : defaultExecutor;
    const auto n_prefix = payload_frame_iter - input_frames.begin() + 1;
    executor(std::move(identity), std::move(input_frames), n_prefix, socket);
}

}
}
