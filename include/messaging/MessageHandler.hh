/** \file
 *
 * \brief Definition of the command handler interface of the control socket
 */

#ifndef MESSAGING_MESSAGEHANDLER_HH_
#define MESSAGING_MESSAGEHANDLER_HH_

#include "messaging/Identity.hh"
#include "messaging/SynchronousExecutionPolicy.hh"
#include "Blob.hh"

#include <boost/iterator/transform_iterator.hpp>

#include <vector>
#include <utility>

namespace Trio {
namespace Messaging {

/** \brief Status frame of an executed command, "OK"
 */
extern const ByteSpan REPLY_SUCCESS;

/** \brief Status frame of a rejected command, "ERR"
 */
extern const ByteSpan REPLY_FAILURE;

/** \brief Reply of a command under construction
 *
 * A reply to a Trio command is a status followed by key/value parameter
 * pairs. The handler sets the status exactly once, before adding parameters.
 */
class Response {
public:

    virtual ~Response();

    /** \brief Reply REPLY_SUCCESS
     */
    void succeed();

    /** \brief Reply REPLY_FAILURE
     */
    void fail();

    /** \brief Append a parameter to a successful reply
     *
     * \param key the name of the parameter
     * \param value the serialized value of the parameter
     */
    void addParameter(ByteSpan key, ByteSpan value);

private:

    virtual void handleSetStatus(ByteSpan status) = 0;

    virtual void handleAddFrame(ByteSpan frame) = 0;
};

/** \brief Executor of one command of the control socket
 *
 * MessageQueue routes each command to the handler registered for its name.
 * The handler sees the connection identity and the frames after the command
 * name, and replies through Response. Room commands use the coroutine
 * execution policy, so their replies may be written after the handler has
 * suspended.
 *
 * \tparam ExecutionPolicy A type satisfying the \ref executionpolicy
 */
template<typename ExecutionPolicy>
class BasicMessageHandler {
public:

    using ExecutionPolicyType = ExecutionPolicy;

    /** \brief Context passed by the policy, e.g. a coroutine to await in
     */
    using ExecutionContext = typename ExecutionPolicy::Context;

    virtual ~BasicMessageHandler() = default;

    /** \brief Execute a command
     *
     * \param context the execution context
     * \param identity the connection that sent the command
     * \param first, last the key/value frames following the command name,
     * anything asBytes() accepts
     * \param response the reply
     */
    template<typename ParameterIterator>
    void handle(
        ExecutionContext context, const Identity& identity,
        ParameterIterator first, ParameterIterator last, Response& response);

protected:

    using ParameterVector = std::vector<ByteSpan>;

private:

    virtual void doHandle(
        ExecutionContext context, const Identity& identity,
        const ParameterVector& params, Response& response) = 0;
};

template<typename ExecutionPolicy>
template<typename ParameterIterator>
void BasicMessageHandler<ExecutionPolicy>::handle(
    ExecutionContext context, const Identity& identity,
    ParameterIterator first, ParameterIterator last, Response& response)
{
    const auto to_bytes = [](const auto& p) { return asBytes(p); };
    doHandle(
        std::move(context), identity,
        ParameterVector(
            boost::make_transform_iterator(first, to_bytes),
            boost::make_transform_iterator(last, to_bytes)),
        response);
}

/** \brief Handler replying before returning to MessageQueue
 */
using MessageHandler = BasicMessageHandler<SynchronousExecutionPolicy>;

}
}

#endif // MESSAGING_MESSAGEHANDLER_HH_
