/** \file
 *
 * \brief Definition of Trio::Coroutines::Mutex and Trio::Coroutines::Lock
 */

#ifndef COROUTINES_LOCK_HH_
#define COROUTINES_LOCK_HH_

#include <boost/core/noncopyable.hpp>

#include <cstddef>
#include <deque>
#include <memory>

namespace Trio {
namespace Coroutines {

class AsynchronousExecutionContext;
class Future;

/** \brief Mutual exclusion for coroutines
 *
 * Every room owns a coroutine mutex, and every command mutating the room
 * holds it while it runs, including the time it is suspended. A command
 * arriving while the mutex is held is suspended until the commands before it
 * have completed.
 *
 * The mutex is FIFO. If multiple coroutines are waiting for the same mutex,
 * they acquire it in the same order they called lock(). The ownership is
 * handed over directly from the releasing coroutine to the next one, so no
 * coroutine can slip in between.
 *
 * \warning A coroutine mutex is not an inter‐thread synchronization
 * mechanism, nor is it thread safe.
 *
 * \sa Lock
 */
class Mutex : private boost::noncopyable {
public:

    /** \brief Create new mutex
     *
     * The mutex is initially unlocked.
     */
    Mutex();

    /** \brief Acquire the mutex
     *
     * If the mutex is free, the execution proceeds immediately. Otherwise the
     * calling coroutine is suspended until the ownership is handed over to it.
     *
     * \param context the execution context of the calling coroutine
     */
    void lock(AsynchronousExecutionContext& context);

    /** \brief Release the mutex
     *
     * If coroutines are waiting, the ownership is given to the first one and
     * its resumption is scheduled.
     */
    void unlock();

    /** \brief Determine if the mutex is held by a coroutine
     */
    bool isLocked() const { return locked; }

    /** \brief Return the number of coroutines waiting for the mutex
     */
    std::size_t getNumberOfWaiting() const { return waiting.size(); }

private:

    bool locked;
    std::deque<std::shared_ptr<Future>> waiting;
};

/** \brief RAII guard for acquiring and releasing Mutex
 */
class Lock : private boost::noncopyable {
public:

    /** \brief Acquire \p mutex, suspending if necessary
     */
    Lock(AsynchronousExecutionContext& context, Mutex& mutex);

    ~Lock();

private:

    Mutex& mutex;
};

}
}

#endif // COROUTINES_LOCK_HH_
