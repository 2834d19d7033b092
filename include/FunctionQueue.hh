/** \file
 *
 * \brief Definition of Trio::FunctionQueue class
 */

#ifndef FUNCTIONQUEUE_HH_
#define FUNCTIONQUEUE_HH_

#include <functional>
#include <list>

namespace Trio {

/** \brief Queue serializing nested function calls
 *
 * A function passed to an idle queue is called at once. A function passed
 * while another one is still running (for example from inside it) is
 * appended and called after the running ones return. Observable uses this to
 * deliver notifications in the order they were emitted even when an observer
 * emits new notifications.
 */
class FunctionQueue {
public:

    /** \brief Call or enqueue \p function
     *
     * If a function throws, the remaining queue is discarded and the
     * exception propagates to the outermost caller.
     *
     * \param function callable without arguments, return value ignored
     */
    template<typename Function>
    void operator()(Function&& function);

private:

    void internalRunQueued();

    std::list<std::function<void()>> pending;
};

template<typename Function>
void FunctionQueue::operator()(Function&& function)
{
    pending.emplace_back(std::forward<Function>(function));
    if (pending.size() > 1) {
        return;
    }
    try {
        internalRunQueued();
    } catch (...) {
        pending.clear();
        throw;
    }
}

inline void FunctionQueue::internalRunQueued()
{
    while (!pending.empty()) {
        pending.front()();
        pending.pop_front();
    }
}

}

#endif // FUNCTIONQUEUE_HH_
