/** \file
 *
 * \brief Definition of Trio::Messaging::Identity
 */

#ifndef MESSAGING_IDENTITY_HH_
#define MESSAGING_IDENTITY_HH_

#include "messaging/Sockets.hh"
#include "Blob.hh"

#include <iosfwd>

namespace Trio {
namespace Messaging {

/** \brief Routing ID type
 *
 * \sa Identity
 */
using RoutingId = Blob;

/** \brief Identity of a client connection
 *
 * The identity is the routing id the ROUTER socket attaches to the
 * connection. The client may choose it by setting \c ZMQ_ROUTING_ID on its
 * socket, otherwise ZeroMQ generates one. The server treats it as an opaque
 * session token. Each identity can be seated in at most one room.
 */
struct Identity {

    Identity() = default;

    /** \brief Create new identity object
     *
     * \param routingId see \ref routingId
     */
    explicit Identity(RoutingId routingId);

    RoutingId routingId;  ///< Routing ID

    /// \cond DOXYGEN_IGNORE
    friend auto operator<=>(const Identity&, const Identity&) = default;
    /// \endcond
};

/** \brief Retrieve identity from the routing id frame of a ROUTER socket
 *
 * \param routerIdentityFrame the first frame of a message received through a
 * ROUTER socket
 *
 * \return Identity of the connection that sent the message
 */
Identity identityFromMessage(const Message& routerIdentityFrame);

/** \brief Output an identity to stream
 *
 * The routing id is written as hex.
 *
 * \param os the output stream
 * \param identity the identity
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const Identity& identity);

}
}

#endif // MESSAGING_IDENTITY_HH_
