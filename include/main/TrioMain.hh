/** \file
 *
 * \brief Definition of Trio::Main::TrioMain class
 */

#ifndef MAIN_TRIOMAIN_HH_
#define MAIN_TRIOMAIN_HH_

#include <zmq.hpp>

#include <memory>

namespace Trio {

/** \brief The glue code and high level logic for the Trio server
 *
 * The main class TrioMain is responsible for setting up the Trio server
 * application.
 */
namespace Main {

class Config;

/** \brief Set up and run the Trio server
 *
 * When constructed, TrioMain binds the control socket and registers the
 * command handlers of the room manager. Commands, replies and events all go
 * through the control socket.
 *
 * The server starts processing messages when run() is called. The destructor
 * closes sockets and cleans up the application.
 *
 * \sa \ref trioprotocol
 */
class TrioMain {
public:

    /** \brief Create Trio server
     *
     * \param context the ZeroMQ context
     * \param config the application configurations
     */
    TrioMain(zmq::context_t& context, const Config& config);

    ~TrioMain();

    /** \brief Start receiving and handling messages
     *
     * This method blocks until SIGINT or SIGTERM is received.
     */
    void run();

private:

    class Impl;
    const std::unique_ptr<Impl> impl;
};

}
}

#endif // MAIN_TRIOMAIN_HH_
