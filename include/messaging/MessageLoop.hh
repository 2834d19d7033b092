/** \file
 *
 * \brief Definition of Trio::Messaging::MessageLoop class
 */

#ifndef MESSAGING_MESSAGELOOP_HH_
#define MESSAGING_MESSAGELOOP_HH_

#include "messaging/Sockets.hh"

#include <boost/core/noncopyable.hpp>

#include <functional>
#include <memory>

namespace Trio {
namespace Messaging {

/** \brief Event loop polling ZeroMQ sockets
 *
 * MessageLoop polls the sockets registered with addPollable() and invokes
 * their callbacks when they become readable. The whole server runs in
 * the thread calling run().
 *
 * The loop blocks SIGINT and SIGTERM when constructed, and receives them
 * through a signalfd while running. Either signal makes run() return. The
 * signal mask is restored when the loop is destroyed. Threads created after
 * the loop inherit the mask, so worker threads should be started after
 * constructing the loop.
 */
class MessageLoop : private boost::noncopyable {
public:

    /** \brief Callback invoked when a registered socket is readable
     */
    using SocketCallback = std::function<void(Socket&)>;

    /** \brief Create new message loop with no sockets
     *
     * \param context the ZeroMQ context shared by the registered sockets
     *
     * \throw std::system_error if the signal mask cannot be set
     */
    explicit MessageLoop(MessageContext& context);

    ~MessageLoop();

    /** \brief Poll until SIGINT or SIGTERM is received
     *
     * Exceptions from the callbacks are logged and do not stop the loop.
     *
     * \throw std::system_error if the signalfd cannot be created
     */
    void run();

    /** \brief Create a socket notified when the loop exits
     *
     * The returned SUB socket receives one message when run() returns because
     * of a signal. It is used to tell worker threads to exit.
     */
    Socket createTerminationSubscriber();

    /** \brief Start polling \p socket
     *
     * The loop shares the ownership of \p socket until removePollable() is
     * called. Anything captured by \p callback must stay valid until then.
     *
     * \throw std::invalid_argument if \p socket or \p callback is empty, or
     * \p socket is already polled
     */
    void addPollable(SharedSocket socket, SocketCallback callback);

    /** \brief Stop polling \p socket
     *
     * Unknown sockets are ignored.
     */
    void removePollable(Socket& socket);

private:

    class Impl;
    const std::unique_ptr<Impl> impl;
};

}
}

#endif // MESSAGING_MESSAGELOOP_HH_
