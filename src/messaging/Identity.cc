#include "messaging/Identity.hh"

#include "messaging/MessageUtility.hh"
#include "HexUtility.hh"

#include <ostream>
#include <utility>

namespace Trio {
namespace Messaging {

Identity::Identity(RoutingId routingId) :
    routingId {std::move(routingId)}
{
}

Identity identityFromMessage(const Message& routerIdentityFrame)
{
    const auto routing_id_view = messageView(routerIdentityFrame);
    return Identity {RoutingId(routing_id_view.begin(), routing_id_view.end())};
}

std::ostream& operator<<(std::ostream& os, const Identity& identity)
{
    return os << formatHex(identity.routingId);
}

}
}
