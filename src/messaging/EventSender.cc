#include "messaging/EventSender.hh"

#include "messaging/MessageUtility.hh"
#include "Utility.hh"

#include <cassert>
#include <cerrno>
#include <stdexcept>
#include <string>
#include <vector>

namespace Trio {
namespace Messaging {

EventSender::~EventSender() = default;

bool EventSender::send(
    const Identity& identity, const std::string_view event,
    const nlohmann::json& params)
{
    if (!params.is_object()) {
        throw std::invalid_argument {"Event parameters must be an object"};
    }
    return handleSend(identity, event, params);
}

RouterEventSender::RouterEventSender(SharedSocket socket) :
    socket {std::move(socket)}
{
    assert(this->socket);
}

bool RouterEventSender::handleSend(
    const Identity& identity, const std::string_view event,
    const nlohmann::json& params)
{
    auto frames = std::vector<Message> {};
    frames.reserve(2 + 2 * params.size());
    frames.emplace_back(event.data(), event.size());
    for (const auto& [key, value] : params.items()) {
        frames.emplace_back(key.data(), key.size());
        frames.emplace_back(messageFromContainer(value.dump()));
    }
    auto& s = dereference(socket);
    try {
        sendMessage(s, messageBuffer(asBytes(identity.routingId)), true);
    } catch (const SocketError& e) {
        if (e.num() == EHOSTUNREACH) {
            return false;
        }
        throw;
    }
    sendEmptyMessage(s, true);
    sendMultipart(s, frames.begin(), frames.end());
    return true;
}

}
}
