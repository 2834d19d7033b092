/** \file
 *
 * \brief Definition of Trio::Messaging::EventSender interface
 */

#ifndef MESSAGING_EVENTSENDER_HH_
#define MESSAGING_EVENTSENDER_HH_

#include "messaging/Identity.hh"
#include "messaging/Sockets.hh"

#include <nlohmann/json.hpp>

#include <string_view>

namespace Trio {
namespace Messaging {

/** \brief Interface for delivering events to a single client
 *
 * An event message consists of the event name followed by key-value pairs.
 * Each member of the parameter object becomes two frames: the key and the
 * JSON dump of the value.
 */
class EventSender {
public:

    virtual ~EventSender();

    /** \brief Send event to a client
     *
     * \param identity the identity of the receiving client
     * \param event the event name
     * \param params JSON object containing the parameters of the event
     *
     * \return true if the event was delivered, false if the client is no
     * longer connected
     */
    bool send(
        const Identity& identity, std::string_view event,
        const nlohmann::json& params);

private:

    /** \brief Handle sending event
     *
     * \sa send()
     */
    virtual bool handleSend(
        const Identity& identity, std::string_view event,
        const nlohmann::json& params) = 0;
};

/** \brief Event sender writing to a ROUTER socket
 *
 * The message is prefixed with the routing id of the client and the empty
 * delimiter frame. The socket is expected to have \c ZMQ_ROUTER_MANDATORY
 * set, so that sending to a disconnected client fails with \c EHOSTUNREACH
 * instead of dropping the message silently.
 */
class RouterEventSender : public EventSender {
public:

    /** \brief Create new router event sender
     *
     * \param socket the ROUTER socket
     */
    explicit RouterEventSender(SharedSocket socket);

private:

    bool handleSend(
        const Identity& identity, std::string_view event,
        const nlohmann::json& params) override;

    SharedSocket socket;
};

}
}

#endif // MESSAGING_EVENTSENDER_HH_
