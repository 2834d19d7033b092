/** \file
 *
 * \brief Definition of Trio::Coroutines::CoroutineAdapter
 */

#ifndef COROUTINES_COROUTINEADAPTER_HH_
#define COROUTINES_COROUTINEADAPTER_HH_

#include <boost/coroutine2/all.hpp>

#include <memory>

namespace Trio {

namespace Messaging {

class CallbackScheduler;

}

/** \brief Classes for executing coroutines in the Trio server
 *
 * The commands that mutate a room may need to wait, either for their turn to
 * access the room or for the delay before the cards of a failed turn are
 * returned. Such commands are executed as coroutines, which suspend by
 * awaiting a Future and are resumed from the message loop.
 */
namespace Coroutines {

class Future;

/** \brief Adapt future based coroutine into the message loop framework
 *
 * This class works as glue between the message loop and Boost.Coroutine2
 * based coroutines. It allows creating push coroutines that can await futures
 * by pushing them to the main context. When the future is resolved, the
 * resumption of the coroutine is scheduled to the injected
 * Messaging::CallbackScheduler, so that a coroutine is never resumed from
 * inside another coroutine.
 *
 * The callback scheduler is accepted as weak_ptr to allow clean termination
 * of the coroutines if it is destructed. A coroutine awaiting a future is
 * never resumed once the callback scheduler goes out of scope.
 *
 * \sa create() for documentation about creating a coroutine and expectations
 * for a coroutine function
 */
class CoroutineAdapter :
    public std::enable_shared_from_this<CoroutineAdapter> {
public:

    struct DoNotCallDirectly {};

    /** \brief Awaitable object
     */
    using Awaitable = std::shared_ptr<Future>;

    /** \brief Sink used by a coroutine function to await a future
     *
     * A coroutine function used with a coroutine adapter object receives an
     * instance of Sink as its only parameter. By pushing a future to the sink
     * the coroutine is suspended until the future is resolved. The behavior
     * is undefined if a coroutine function pushes a \c nullptr to the sink.
     */
    using Sink = boost::coroutines2::coroutine<Awaitable>::push_type;

    /** \brief Create new coroutine adapter
     *
     * The coroutine starts executing immediately, until it awaits a future by
     * pushing it to the sink or completes.
     *
     * \param coroutine the coroutine function, accepting a \ref Sink as its
     * only parameter
     * \param callbackScheduler the callback scheduler used to resume the
     * coroutine
     *
     * \return the adapter, or a completed adapter if the coroutine did not
     * await anything
     *
     * \throw Any exception thrown in the coroutine function
     */
    template<typename CoroutineFunction>
    static std::shared_ptr<CoroutineAdapter> create(
        CoroutineFunction&& coroutine,
        std::weak_ptr<Messaging::CallbackScheduler> callbackScheduler);

    /** \brief Constructor
     *
     * CoroutineAdapter is intended to be managed by shared pointer. This
     * constructor should not be invoked directly, but an instance should be
     * created using create().
     */
    template<typename CoroutineFunction>
    CoroutineAdapter(
        DoNotCallDirectly, CoroutineFunction&& coroutine,
        std::weak_ptr<Messaging::CallbackScheduler> callbackScheduler);

    /** \brief Return the awaited future, if any
     *
     * \return Pointer to the future the coroutine is awaiting, or nullptr if
     * the coroutine has completed
     */
    const Future* getAwaited() const;

private:

    void internalResume();
    void internalUpdate();

    using Source = boost::coroutines2::coroutine<Awaitable>::pull_type;

    Source source;
    Awaitable awaited;
    std::weak_ptr<Messaging::CallbackScheduler> callbackScheduler;
};

template<typename CoroutineFunction>
CoroutineAdapter::CoroutineAdapter(
    DoNotCallDirectly, CoroutineFunction&& coroutine,
    std::weak_ptr<Messaging::CallbackScheduler> callbackScheduler) :
    source {std::forward<CoroutineFunction>(coroutine)},
    callbackScheduler {std::move(callbackScheduler)}
{
}

template<typename CoroutineFunction>
std::shared_ptr<CoroutineAdapter> CoroutineAdapter::create(
    CoroutineFunction&& coroutine,
    std::weak_ptr<Messaging::CallbackScheduler> callbackScheduler)
{
    auto adapter = std::make_shared<CoroutineAdapter>(
        DoNotCallDirectly {}, std::forward<CoroutineFunction>(coroutine),
        std::move(callbackScheduler));
    adapter->internalUpdate();
    return adapter;
}

}
}

#endif // COROUTINES_COROUTINEADAPTER_HH_
