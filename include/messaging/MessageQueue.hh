/** \file
 *
 * \brief Definition of Trio::Messaging::MessageQueue class
 */

#ifndef MESSAGING_MESSAGEQUEUE_HH_
#define MESSAGING_MESSAGEQUEUE_HH_

#include <any>
#include <cassert>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/core/noncopyable.hpp>

#include "messaging/Identity.hh"
#include "messaging/MessageHandler.hh"
#include "messaging/Sockets.hh"
#include "Blob.hh"
#include "Utility.hh"

namespace Trio {

/** \brief The messaging framework
 *
 * Namespace Messaging contains the ZeroMQ based transport of the Trio server:
 * receiving commands, dispatching them to handlers, replying and sending
 * events to the clients.
 */
namespace Messaging {

/** \brief Command dispatcher
 *
 * MessageQueue receives a command from a socket, dispatches it to the handler
 * registered for the command, and sends the reply back through the same
 * socket. It does not own the socket, but is meant to be registered as a
 * callback to a MessageLoop.
 *
 * A command message consists of the frames
 *
 * <tt>[routing id] [empty] [tag] [command] [argument]...</tt>
 *
 * where the routing id is only present when the socket is a ROUTER. The
 * reply echoes the routing id, the empty frame and the tag, and continues
 * with the status frame and the reply frames written by the handler.
 *
 * The command is matched bytewise. An unknown command is replied with
 * REPLY_FAILURE. A message without the tag and command frames is dropped
 * without reply.
 */
class MessageQueue : private boost::noncopyable {
public:

    /** \brief Create message queue with no handlers
     */
    MessageQueue();

    ~MessageQueue();

    /** \brief Add execution policy
     *
     * \param executionPolicy the execution policy used by the handlers
     * expecting \c ExecutionPolicy
     *
     * \return true if \p executionPolicy was registered, false if an execution
     * policy of the same type already exists
     */
    template<typename ExecutionPolicy>
    bool addExecutionPolicy(ExecutionPolicy executionPolicy);

    /** \brief Try to set handler for a command
     *
     * The execution policy of the handler must be added with
     * addExecutionPolicy() before the handler, unless it is default
     * constructible.
     *
     * \return true if \p handler was registered, false if \p command already
     * has a handler
     *
     * \throw std::runtime_error if the execution policy is missing
     */
    template<typename MessageHandlerType>
    bool trySetHandler(
        ByteSpan command, std::shared_ptr<MessageHandlerType> handler);

    /** \brief Receive and reply the next message
     *
     * The handler is invoked as specified by its execution policy. With an
     * asynchronous policy the reply may be sent after this method returns.
     *
     * \param socket the socket the message is received from and the reply is
     * sent to
     */
    void operator()(Socket& socket);

private:

    using MessageVector = std::vector<Message>;

    class BasicResponse : public Response {
    public:
        BasicResponse(MessageVector&, std::ptrdiff_t);
        void sendResponse(Socket&);

    private:
        void handleSetStatus(ByteSpan) override;
        void handleAddFrame(ByteSpan) override;

        std::ptrdiff_t nStatusFrame;
        MessageVector frames;
    };

    template<typename ExecutionPolicy>
    auto internalAddExecutionPolicyHelper(ExecutionPolicy executionPolicy);

    template<typename ExecutionPolicy>
    auto internalCreateExecutor(
        std::shared_ptr<BasicMessageHandler<ExecutionPolicy>> handler);

    using ExecutionFunction = std::function<
        void(Identity&&, MessageVector&&, std::ptrdiff_t, Socket&)>;

    std::map<std::type_index, std::any> policies;
    std::map<std::string, ExecutionFunction, std::less<>> executors;
    ExecutionFunction defaultExecutor;
};

template<typename ExecutionPolicy>
auto MessageQueue::internalAddExecutionPolicyHelper(
    ExecutionPolicy executionPolicy)
{
    return policies.try_emplace(
        typeid(ExecutionPolicy), std::move(executionPolicy));
}

template<typename ExecutionPolicy>
bool MessageQueue::addExecutionPolicy(ExecutionPolicy executionPolicy)
{
    return internalAddExecutionPolicyHelper(std::move(executionPolicy)).second;
}

template<typename ExecutionPolicy>
auto MessageQueue::internalCreateExecutor(
    std::shared_ptr<BasicMessageHandler<ExecutionPolicy>> handler)
{
    const auto& policy_type_id = typeid(ExecutionPolicy);
    auto policy_iter = policies.find(policy_type_id);
    if (policy_iter == policies.end()) {
        if constexpr (std::is_default_constructible_v<ExecutionPolicy>) {
            policy_iter =
                internalAddExecutionPolicyHelper(ExecutionPolicy {}).first;
        } else {
            throw std::runtime_error {"Execution policy missing"};
        }
    }
    // The policy is stored in the map node, so the reference stays valid
    return ExecutionFunction {
        [&policy = std::any_cast<ExecutionPolicy&>(policy_iter->second),
         handler = std::move(handler)](
             Identity&& identity, MessageVector&& inputFrames,
             const std::ptrdiff_t nPrefix, Socket& socket)
        {
            std::invoke(
                policy,
                [identity = std::move(identity),
                 inputFrames = std::move(inputFrames), nPrefix, &socket,
                 handler](auto&& context) mutable
                {
                    const auto command_frame_iter =
                        inputFrames.begin() + nPrefix;
                    assert(command_frame_iter != inputFrames.end());
                    auto response = BasicResponse(inputFrames, nPrefix);
                    dereference(handler).handle(
                        std::forward<decltype(context)>(context), identity,
                        command_frame_iter + 1, inputFrames.end(), response);
                    response.sendResponse(socket);
                });
        }
    };
}

template<typename MessageHandlerType>
bool MessageQueue::trySetHandler(
    const ByteSpan command, std::shared_ptr<MessageHandlerType> handler)
{
    using ExecutionPolicy = typename MessageHandlerType::ExecutionPolicyType;
    return executors.emplace(
        blobToString(command),
        internalCreateExecutor<ExecutionPolicy>(
            std::shared_ptr<BasicMessageHandler<ExecutionPolicy>> {
                std::move(handler)})).second;
}

}
}

#endif // MESSAGING_MESSAGEQUEUE_HH_
