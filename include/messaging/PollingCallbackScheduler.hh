/** \file
 *
 * \brief Definition of Trio::Messaging::PollingCallbackScheduler
 */

#ifndef MESSAGING_POLLINGCALLBACKSCHEDULER_HH_
#define MESSAGING_POLLINGCALLBACKSCHEDULER_HH_

#include "messaging/CallbackScheduler.hh"
#include "messaging/Sockets.hh"

#include <boost/core/noncopyable.hpp>

#include <chrono>
#include <map>
#include <thread>

namespace Trio {
namespace Messaging {

/** \brief Callback scheduler driven by MessageLoop
 *
 * The callbacks are stored in the scheduler and identified by a running
 * number. A worker thread keeps the timers and, when a callback is due, sends
 * its number through an inproc socket. The receiving end of the socket is
 * registered to the MessageLoop, so the callbacks are executed in the thread
 * of the loop.
 *
 * The worker thread is joined in the destructor. It exits when the
 * termination subscriber passed to the constructor receives a message, so
 * the message loop must have been terminated before the scheduler is
 * destroyed.
 */
class PollingCallbackScheduler :
    public CallbackScheduler, private boost::noncopyable {
public:

    /** \brief Create new callback scheduler
     *
     * \param context the ZeroMQ context
     * \param terminationSubscriber socket notified when the worker thread
     * needs to exit, see MessageLoop::createTerminationSubscriber()
     */
    PollingCallbackScheduler(
        MessageContext& context, Socket terminationSubscriber);

    /** \brief Return the socket to register to MessageLoop
     *
     * The messages in the socket are internal to the scheduler.
     */
    SharedSocket getSocket();

    /** \brief Execute the callbacks that are due
     *
     * Meant to be registered with getSocket() to MessageLoop. Each callback
     * is removed before it is invoked. An exception from a callback is
     * propagated, and the rest of the due callbacks are executed when the
     * loop calls this method again.
     *
     * \param socket the socket returned by getSocket()
     */
    void operator()(Socket& socket);

private:

    void handleCallLater(
        std::chrono::milliseconds timeout, Callback callback) override;

    Socket frontSocket;
    SharedSocket backSocket;
    std::map<unsigned long, Callback> callbacks;
    unsigned long nextCallbackId {};
    std::jthread worker;
};

}
}

#endif // MESSAGING_POLLINGCALLBACKSCHEDULER_HH_
