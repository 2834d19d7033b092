/** \file
 *
 * \brief Definition of Trio::Coroutines::Future
 */

#ifndef COROUTINES_FUTURE_HH_
#define COROUTINES_FUTURE_HH_

#include <functional>

namespace Trio {
namespace Coroutines {

class CoroutineAdapter;

/** \brief Future that a coroutine can await
 *
 * When awaited by CoroutineAdapter, the coroutine will be resumed when the
 * future is resolved by another (co)routine, or by a callback scheduled to a
 * Messaging::CallbackScheduler.
 *
 * A future can be resolved before it is awaited. In that case the awaiting
 * coroutine is resumed as soon as possible.
 *
 * \note Only “void” futures are supported, i.e. the coroutine can be notified
 * but no value can be transferred using it.
 */
class Future
{
public:

    /** \brief Default constructor
     *
     * Create a future that is initially not resolved nor awaited by any
     * coroutine.
     */
    Future();

    /** \brief Resolve the future
     *
     * If a coroutine function associated with a \ref CoroutineAdapter was
     * awaiting this future, it is resumed. Resolving a future more than once
     * has no further effect.
     */
    void resolve();

    /** \brief Determine if the future has been resolved
     */
    bool isResolved() const { return resolved; }

private:

    static void nullResolve();

    std::function<void()> resolveCallback;
    bool resolved;

    friend class CoroutineAdapter;
};

}
}

#endif // COROUTINES_FUTURE_HH_
