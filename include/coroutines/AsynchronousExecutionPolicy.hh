/** \file
 *
 * \brief Definition of Trio::Coroutines::AsynchronousExecutionPolicy
 */

#ifndef COROUTINES_ASYNCHRONOUSEXECUTIONPOLICY_HH_
#define COROUTINES_ASYNCHRONOUSEXECUTIONPOLICY_HH_

#include "coroutines/CoroutineAdapter.hh"
#include "messaging/MessageHandler.hh"

#include <cassert>
#include <chrono>
#include <functional>
#include <memory>
#include <utility>

namespace Trio {

namespace Messaging {

class CallbackScheduler;

}

namespace Coroutines {

/** \brief Asynchronous execution context
 *
 * The context holds reference to the coroutine sink that can be used to
 * await futures.
 */
class AsynchronousExecutionContext {
public:

    /** \brief Create asynchronous execution context
     *
     * \param sink the coroutine sink
     * \param callbackScheduler the callback scheduler resuming the coroutine
     */
    AsynchronousExecutionContext(
        CoroutineAdapter::Sink& sink,
        std::weak_ptr<Messaging::CallbackScheduler> callbackScheduler);

    /** \brief Suspend coroutine until \p future is resolved
     *
     * \param future the future to await
     */
    void await(std::shared_ptr<Future> future);

    /** \brief Suspend coroutine for \p timeout
     *
     * \param timeout the minimum time the coroutine is suspended
     */
    void sleep(std::chrono::milliseconds timeout);

private:

    CoroutineAdapter::Sink* sink;
    std::weak_ptr<Messaging::CallbackScheduler> callbackScheduler;
};

/** \brief Asynchronous execution policy
 *
 * Asynchronous execution policy creates a coroutine, and executes a function in
 * the coroutine context. The caller resumes when the coroutine completes or
 * awaits for a future.
 *
 * \sa Messaging::BasicMessageHandler, AsynchronousMessageHandler
 */
class AsynchronousExecutionPolicy {
public:

    /** \brief Asynchronous execution context
     */
    using Context = AsynchronousExecutionContext;

    /** \brief Create asynchronous execution policy
     *
     * \param callbackScheduler callback scheduler
     */
    explicit AsynchronousExecutionPolicy(
        std::weak_ptr<Messaging::CallbackScheduler> callbackScheduler);

    /** \brief Execute callback as coroutine
     *
     * Creates new coroutine, and invokes \p callback in the coroutine
     * context. The argument for the callback is a Context object that can be
     * used to await futures.
     *
     * \param callback the callback to be executed
     */
    template<typename Callback>
    void operator()(Callback&& callback);

private:

    std::weak_ptr<Messaging::CallbackScheduler> callbackScheduler;
};

template<typename Callback>
void AsynchronousExecutionPolicy::operator()(Callback&& callback)
{
    CoroutineAdapter::create(
        [callbackScheduler = this->callbackScheduler,
         callback = std::forward<Callback>(callback)](auto& sink) mutable
        {
            std::invoke(std::move(callback), Context {sink, callbackScheduler});
        }, callbackScheduler);
}

/** \brief Message handler with asynchronous execution policy
 */
using AsynchronousMessageHandler =
    Messaging::BasicMessageHandler<AsynchronousExecutionPolicy>;

}
}

#endif // COROUTINES_ASYNCHRONOUSEXECUTIONPOLICY_HH_
