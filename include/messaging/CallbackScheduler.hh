/** \file
 *
 * \brief Definition of Trio::Messaging::CallbackScheduler
 */

#ifndef MESSAGING_CALLBACKSCHEDULER_HH_
#define MESSAGING_CALLBACKSCHEDULER_HH_

#include <chrono>
#include <functional>
#include <tuple>
#include <utility>

namespace Trio {
namespace Messaging {

/** \brief Interface for running callbacks later, outside of the caller
 *
 * The server uses the scheduler to resume coroutines. The delay before
 * returning the cards of a failed reveal sequence is a callLater() call.
 */
class CallbackScheduler {
public:

    virtual ~CallbackScheduler() = default;

    /** \brief Schedule a callback to run as soon as possible
     *
     * \p callable and \p args are copied or moved into the scheduler and
     * invoked as if by \c std::apply, outside of the call stack of the
     * caller.
     *
     * \param callable the callback
     * \param args the arguments of the callback
     */
    template<typename Callable, typename... Args>
    void callSoon(Callable&& callable, Args&&... args);

    /** \brief Schedule a callback to run after a timeout
     *
     * \param timeout the minimum time before the callback is invoked
     * \param callable the callback
     * \param args the arguments of the callback
     *
     * \sa callSoon()
     */
    template<typename Callable, typename... Args>
    void callLater(
        std::chrono::milliseconds timeout, Callable&& callable, Args&&... args);

protected:

    /** \brief Type erased callback
     */
    using Callback = std::function<void()>;

private:

    template<typename Callable, typename... Args>
    static Callback internalMakeCallback(Callable&& callable, Args&&... args);

    /** \brief Handle for callSoon()
     *
     * The default implementation calls handleCallLater() with zero timeout.
     * The implementation must invoke \p callback at most once.
     */
    virtual void handleCallSoon(Callback callback);

    /** \brief Handle for callLater()
     *
     * The implementation must invoke \p callback at most once.
     */
    virtual void handleCallLater(
        std::chrono::milliseconds timeout, Callback callback) = 0;
};

inline void CallbackScheduler::handleCallSoon(Callback callback)
{
    handleCallLater(std::chrono::milliseconds::zero(), std::move(callback));
}

template<typename Callable, typename... Args>
CallbackScheduler::Callback CallbackScheduler::internalMakeCallback(
    Callable&& callable, Args&&... args)
{
    return [callable = std::forward<Callable>(callable),
            args = std::tuple {std::forward<Args>(args)...}]() mutable
    {
        std::apply(std::move(callable), std::move(args));
    };
}

template<typename Callable, typename... Args>
void CallbackScheduler::callSoon(Callable&& callable, Args&&... args)
{
    handleCallSoon(
        internalMakeCallback(
            std::forward<Callable>(callable), std::forward<Args>(args)...));
}

template<typename Callable, typename... Args>
void CallbackScheduler::callLater(
    const std::chrono::milliseconds timeout, Callable&& callable,
    Args&&... args)
{
    handleCallLater(
        timeout,
        internalMakeCallback(
            std::forward<Callable>(callable), std::forward<Args>(args)...));
}

}
}

#endif // MESSAGING_CALLBACKSCHEDULER_HH_
