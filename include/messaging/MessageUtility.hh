/** \file
 *
 * \brief Definition of messaging utilities
 *
 * The functions in this file work on whole multipart messages instead of
 * single frames, and take care of the empty delimiter frame that ROUTER and
 * DEALER sockets need to stay compatible with REQ and REP peers.
 */

#ifndef MESSAGING_MESSAGEUTILITY_HH_
#define MESSAGING_MESSAGEUTILITY_HH_

#include "messaging/Sockets.hh"
#include "Blob.hh"

#include <iterator>
#include <limits>
#include <type_traits>
#include <utility>

namespace Trio {
namespace Messaging {

/** \brief Send an empty frame
 *
 * \param socket the socket used to send the empty frame
 * \param more if true, the frame is sent with \c ZMQ_SNDMORE
 */
inline void sendEmptyMessage(Socket& socket, const bool more = false)
{
    sendMessage(socket, zmq::const_buffer {}, more);
}

/** \brief Send the empty delimiter frame if \p socket needs one
 *
 * ROUTER and DEALER sockets need the empty frame before the payload. For
 * other socket types this function does nothing.
 *
 * \note A ROUTER socket also needs the routing id before the empty frame. This
 * function does not send it.
 */
inline void sendEmptyFrameIfNecessary(Socket& socket)
{
    const auto type = getSocketType(socket);
    if (type == SocketType::router || type == SocketType::dealer) {
        sendEmptyMessage(socket, true);
    }
}

/** \brief Receive the empty delimiter frame if \p socket has one
 *
 * \return true if there are more frames in the message, false otherwise
 */
inline bool recvEmptyFrameIfNecessary(Socket& socket)
{
    const auto type = getSocketType(socket);
    if (type == SocketType::router || type == SocketType::dealer) {
        auto empty_frame = Message {};
        recvMessage(socket, empty_frame);
        return empty_frame.more();
    }
    return true;
}

/** \brief Send a range of Message objects as one multipart message
 *
 * \param socket the socket
 * \param first iterator to the first frame
 * \param last iterator one past the last frame
 * \param more if true, the last frame is sent with \c ZMQ_SNDMORE
 */
template<typename MessageIterator>
void sendMultipart(
    Socket& socket, MessageIterator first, MessageIterator last,
    const bool more = false)
{
    while (first != last) {
        const auto next = std::next(first);
        sendMessage(socket, std::move(*first), more || (next != last));
        first = next;
    }
}

/** \brief Receive and drop the rest of the current message
 *
 * At least one frame is always received.
 *
 * \return the number of frames dropped
 */
inline int discardMessage(
    Socket& socket, const int maximumParts = std::numeric_limits<int>::max())
{
    auto n_parts = 0;
    do {
        if (n_parts >= maximumParts) {
            break;
        }
        auto frame = Message {};
        recvMessage(socket, frame);
        ++n_parts;
    } while (socket.get(zmq::sockopt::rcvmore));
    return n_parts;
}

/** \brief Receive all frames of the next message
 *
 * At most \p maximumParts frames are written to \p out. The frames exceeding
 * the limit are received and dropped.
 *
 * \param socket the socket
 * \param out output iterator accepting Message objects
 * \param maximumParts the maximum number of frames written to \p out
 *
 * \return pair containing \p out after the writes, and the total number of
 * frames received
 */
template<typename MessageIterator>
std::pair<MessageIterator, int> recvMultipart(
    Socket& socket, MessageIterator out,
    const int maximumParts = std::numeric_limits<int>::max())
{
    auto n_parts = 0;
    auto more = true;
    while (more && n_parts < maximumParts) {
        auto next_message = Message {};
        recvMessage(socket, next_message);
        more = next_message.more();
        *out++ = std::move(next_message);
        ++n_parts;
    }
    if (more) {
        n_parts += discardMessage(socket);
    }
    return {out, n_parts};
}

/** \brief View the bytes of \p message
 */
inline ByteSpan messageView(const Message& message)
{
    return asBytes(message);
}

/** \brief Create a Message with a copy of a contiguous container
 *
 * \param container contiguous container of trivially copyable elements
 */
template<typename Container>
Message messageFromContainer(const Container& container)
{
    using ValueType = std::remove_cv_t<
        std::remove_reference_t<decltype(*std::data(container))>>;
    static_assert(
        std::is_trivially_copyable_v<ValueType>,
        "Argument must contain trivially copyable elements");
    return Message(
        std::data(container), std::size(container) * sizeof(ValueType));
}

}
}

#endif // MESSAGING_MESSAGEUTILITY_HH_
