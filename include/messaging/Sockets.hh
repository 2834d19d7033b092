/** \file
 *
 * The Trio server talks to its clients through ZeroMQ, using the cppzmq
 * bindings (https://github.com/zeromq/cppzmq). This header gives the library
 * types the names used in the rest of the code base, and wraps the few socket
 * operations that need error handling of their own.
 *
 * \brief Trio messaging socket definitions
 */

#ifndef MESSAGING_SOCKETS_HH_
#define MESSAGING_SOCKETS_HH_

#include "Blob.hh"

#include <zmq.hpp>

#include <chrono>
#include <memory>
#include <ranges>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace Trio {
namespace Messaging {

/** \brief ZeroMQ context type
 */
using MessageContext = zmq::context_t;

/** \brief ZeroMQ socket type
 */
using Socket = zmq::socket_t;

/** \brief ZeroMQ socket type enumeration
 */
using SocketType = zmq::socket_type;

/** \brief Socket with shared ownership, as registered to a MessageLoop
 */
using SharedSocket = std::shared_ptr<Socket>;

/** \brief ZeroMQ message frame
 */
using Message = zmq::message_t;

/** \brief Exception thrown by the ZeroMQ bindings
 */
using SocketError = zmq::error_t;

/** \brief Poll item for pollSockets()
 */
using Pollitem = zmq::pollitem_t;

/** \brief Wrap bytes into a ZeroMQ buffer without copying
 */
inline auto messageBuffer(const ByteSpan bytes)
{
    return zmq::const_buffer(bytes.data(), bytes.size());
}

/** \brief Wrap raw memory into a mutable ZeroMQ buffer without copying
 */
inline auto messageBuffer(void* data, const std::size_t size)
{
    return zmq::mutable_buffer(data, size);
}

/** \brief Create a socket with shared ownership
 */
inline SharedSocket makeSharedSocket(MessageContext& context, SocketType type)
{
    return std::make_shared<Socket>(context, type);
}

/** \brief Bind \p socket to \p endpoint
 */
inline void bindSocket(Socket& socket, const std::string_view endpoint)
{
    socket.bind(std::string {endpoint});
}

/** \brief Connect \p socket to \p endpoint
 */
inline void connectSocket(Socket& socket, const std::string_view endpoint)
{
    socket.connect(std::string {endpoint});
}

/** \brief Return the type of \p socket
 */
inline SocketType getSocketType(const Socket& socket)
{
    return static_cast<SocketType>(socket.get(zmq::sockopt::type));
}

/** \brief Determine if \p socket is ready for \p events
 *
 * \param socket the socket
 * \param events bitmask of \c ZMQ_POLLIN and \c ZMQ_POLLOUT
 */
inline bool socketHasEvents(const Socket& socket, const int events)
{
    return (socket.get(zmq::sockopt::events) & events) != 0;
}

/** \brief Poll a contiguous range of Pollitem objects
 *
 * \param pollitems the items to poll
 * \param timeout the timeout, or negative to wait indefinitely
 *
 * \return the number of items with events
 */
template<std::ranges::contiguous_range Pollitems>
int pollSockets(
    Pollitems& pollitems,
    const std::chrono::milliseconds timeout = std::chrono::milliseconds {-1})
{
    return zmq::poll(
        std::ranges::data(pollitems), std::ranges::size(pollitems), timeout);
}

/** \brief Send a frame, blocking until it is queued
 *
 * \param socket the socket
 * \param message a Message or a buffer
 * \param more whether more frames of the same message follow
 *
 * \throw SocketError if the send fails, for example with \c EHOSTUNREACH on a
 * ROUTER socket with \c ZMQ_ROUTER_MANDATORY
 */
template<typename MessageLike>
void sendMessage(Socket& socket, MessageLike&& message, const bool more = false)
{
    const auto flags = more ? zmq::send_flags::sndmore : zmq::send_flags::none;
    if (!socket.send(std::forward<MessageLike>(message), flags)) {
        throw std::runtime_error {"Blocking send returned without sending"};
    }
}

/** \brief Send a frame without blocking
 *
 * \return true if the frame was queued, false if the socket was not ready
 */
template<typename MessageLike>
[[nodiscard]] bool sendMessageNonblocking(
    Socket& socket, MessageLike&& message, const bool more = false)
{
    const auto flags = more ? zmq::send_flags::sndmore : zmq::send_flags::none;
    return static_cast<bool>(
        socket.send(
            std::forward<MessageLike>(message),
            flags | zmq::send_flags::dontwait));
}

/** \brief Receive a frame, blocking until one is available
 *
 * \return the result of \c zmq::socket_t::recv() with the optional unwrapped
 */
template<typename MessageLike>
auto recvMessage(Socket& socket, MessageLike&& message)
{
    const auto result = socket.recv(
        std::forward<MessageLike>(message), zmq::recv_flags::none);
    if (!result) {
        throw std::runtime_error {"Blocking receive returned without a frame"};
    }
    return *result;
}

}
}

#endif // MESSAGING_SOCKETS_HH_
