/** \file
 *
 * \brief Definition of Trio::Messaging::SynchronousExecutionPolicy
 *
 * \page executionpolicy ExecutionPolicy concept
 *
 * Trio::Messaging::BasicMessageHandler uses classes satisfying the execution
 * policy concept to control how a command is executed. Given an execution
 * policy \c e of type \c E, and a callable \c f, the expression \c e(f) shall
 *
 * 1. Create the execution context for \c f, if necessary
 * 2. Invoke \c f with an rvalue of type \c E::Context
 *
 * The context is the handle the code in \c f uses to interact with the way it
 * is executed. Unless \c E describes synchronous execution, the invocation of
 * \c e may complete before the invocation of \c f does (see
 * Trio::Coroutines::AsynchronousExecutionPolicy).
 */

#ifndef MESSAGING_SYNCHRONOUSEXECUTIONPOLICY_HH_
#define MESSAGING_SYNCHRONOUSEXECUTIONPOLICY_HH_

#include <functional>
#include <utility>

namespace Trio {
namespace Messaging {

/** \brief Dummy context
 */
struct SynchronousExecutionContext {};

/** \brief Synchronous execution policy
 *
 * Executes a function in the caller’s call stack.
 *
 * \sa BasicMessageHandler, MessageHandler
 */
class SynchronousExecutionPolicy {
public:

    /** \brief Synchronous execution context
     */
    using Context = SynchronousExecutionContext;

    /** \brief Invoke \p callback with a Context object
     */
    template<typename Callback>
    void operator()(Callback&& callback);
};

template<typename Callback>
void SynchronousExecutionPolicy::operator()(Callback&& callback)
{
    std::invoke(std::forward<Callback>(callback), Context {});
}

}
}

#endif // MESSAGING_SYNCHRONOUSEXECUTIONPOLICY_HH_
