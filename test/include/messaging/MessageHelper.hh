/** \file
 *
 * \brief Messaging utilities to be used in unit tests
 */

#ifndef MESSAGING_MESSAGEHELPER_HH_
#define MESSAGING_MESSAGEHELPER_HH_

#include "messaging/MessageUtility.hh"
#include "messaging/Sockets.hh"
#include "Blob.hh"

#include <initializer_list>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Trio {
namespace Messaging {

/** \brief Create a pair of mutually connected sockets
 *
 * The first socket binds and the second socket connects to \p endpoint.
 *
 * \param context the ZeroMQ context
 * \param endpoint the common endpoint of the sockets
 * \param type the type of both sockets
 *
 * \return std::pair containing two mutually connected sockets
 */
inline std::pair<Socket, Socket> createSocketPair(
    MessageContext& context, const std::string_view endpoint,
    const SocketType type = SocketType::pair)
{
    auto ret = std::pair {Socket {context, type}, Socket {context, type}};
    bindSocket(ret.first, endpoint);
    connectSocket(ret.second, endpoint);
    return ret;
}

/** \brief Send a message consisting of string frames
 *
 * The empty delimiter frame is prepended if \p socket needs one.
 */
inline void sendFrames(
    Socket& socket, std::initializer_list<std::string_view> frames)
{
    sendEmptyFrameIfNecessary(socket);
    auto messages = std::vector<Message> {};
    for (const auto frame : frames) {
        messages.emplace_back(frame.data(), frame.size());
    }
    sendMultipart(socket, messages.begin(), messages.end());
}

/** \brief Receive a message and return its frames as strings
 *
 * The empty delimiter frame is dropped if \p socket has one.
 */
inline std::vector<std::string> recvFrames(Socket& socket)
{
    recvEmptyFrameIfNecessary(socket);
    auto messages = std::vector<Message> {};
    recvMultipart(socket, std::back_inserter(messages));
    auto ret = std::vector<std::string> {};
    for (const auto& message : messages) {
        ret.emplace_back(message.to_string());
    }
    return ret;
}

}
}

#endif // MESSAGING_MESSAGEHELPER_HH_
