/** \file
 *
 * \brief Definition of Trio::Main::RoomManager class
 */

#ifndef MAIN_ROOMMANAGER_HH_
#define MAIN_ROOMMANAGER_HH_

#include "coroutines/AsynchronousExecutionPolicy.hh"
#include "messaging/FunctionMessageHandler.hh"
#include "messaging/Identity.hh"

#include <boost/core/noncopyable.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace Trio {

namespace Messaging {

class EventSender;
class MessageQueue;

}

namespace Main {

class TrioGame;

/** \brief Registry of the hosted rooms
 *
 * RoomManager owns the rooms of the server and remembers which room each
 * connection is seated in. Its public member functions implement the
 * commands of the \ref trioprotocol, and addHandlers() registers them to a
 * message queue.
 *
 * The commands mutating a room are executed as coroutines holding the mutex
 * of the room for their whole duration, so the commands of a room are applied
 * one at a time in arrival order. This includes the delay before the cards of
 * a failed reveal sequence are returned.
 *
 * A command rejected by the game rules is answered with an \c error event to
 * the sender and a failed reply.
 */
class RoomManager : private boost::noncopyable {
public:

    /** \brief Execution context of the room mutating commands
     */
    using Context = Coroutines::AsynchronousExecutionContext;

    /** \brief Create room manager with no rooms
     *
     * \param eventSender the event sender used to deliver events
     * \param minPlayers the minimum number of seats to start a game
     * \param maxPlayers the maximum number of seats in a room
     * \param failDelay the time the cards of a failed reveal sequence stay
     * visible before they are returned
     */
    RoomManager(
        std::shared_ptr<Messaging::EventSender> eventSender,
        int minPlayers, int maxPlayers, std::chrono::milliseconds failDelay);

    ~RoomManager();

    /** \brief Register the command handlers
     *
     * \param messageQueue the message queue the handlers are added to. The
     * queue must already have an AsynchronousExecutionPolicy.
     */
    void addHandlers(Messaging::MessageQueue& messageQueue);

    /** \brief Implement \ref trioprotocolcommandcreate
     */
    Messaging::Reply<std::string> create(
        const Messaging::Identity& identity, std::string name,
        std::optional<std::string> mode);

    /** \brief Implement \ref trioprotocolcommandlist
     */
    Messaging::Reply<nlohmann::json> list(const Messaging::Identity& identity);

    /** \brief Implement \ref trioprotocolcommandjoin
     */
    Messaging::Reply<std::string> join(
        Context context, const Messaging::Identity& identity,
        std::string room, std::string name);

    /** \brief Implement \ref trioprotocolcommandleave
     */
    Messaging::Reply<> leave(
        Context context, const Messaging::Identity& identity);

    /** \brief Implement \ref trioprotocolcommandsetmode
     */
    Messaging::Reply<> setMode(
        Context context, const Messaging::Identity& identity,
        std::string mode);

    /** \brief Implement \ref trioprotocolcommandstart
     */
    Messaging::Reply<> startGame(
        Context context, const Messaging::Identity& identity);

    /** \brief Implement \ref trioprotocolcommandrevealmiddle
     *
     * If the reveal fails the sequence, the reply is sent after the cards
     * have been returned.
     */
    Messaging::Reply<std::string> revealMiddle(
        Context context, const Messaging::Identity& identity, int cardId);

    /** \brief Implement \ref trioprotocolcommandrevealplayer
     *
     * \sa revealMiddle()
     */
    Messaging::Reply<std::string> revealPlayer(
        Context context, const Messaging::Identity& identity,
        std::string targetPlayerId, std::string position);

    /** \brief Implement \ref trioprotocolcommandchat
     */
    Messaging::Reply<> chat(
        const Messaging::Identity& identity, std::string message);

    /** \brief Find a room by its code
     *
     * \return pointer to the game, or nullptr if there is no such room
     */
    TrioGame* getGame(std::string_view code);

    /** \brief Find the room a connection is seated in
     *
     * \return pointer to the game, or nullptr if \p identity is not seated
     */
    TrioGame* getGameOf(const Messaging::Identity& identity);

    /** \brief Return the number of rooms
     */
    std::size_t getNumberOfRooms() const { return games.size(); }

private:

    using GamePtr = std::shared_ptr<TrioGame>;

    GamePtr internalFindGame(std::string_view code) const;
    bool internalIsLive(const GamePtr& game) const;
    void internalSendError(
        const Messaging::Identity& identity, std::string_view message);
    void internalCompleteReveal(Context& context, TrioGame& game, bool failed);

    template<typename ReplyType, typename Function>
    ReplyType internalExecuteInRoom(
        Context& context, const Messaging::Identity& identity,
        Function&& function);

    const std::shared_ptr<Messaging::EventSender> eventSender;
    const int minPlayers;
    const int maxPlayers;
    const std::chrono::milliseconds failDelay;
    std::map<std::string, GamePtr, std::less<>> games;
    std::map<Messaging::Identity, std::string> members;
};

}
}

#endif // MAIN_ROOMMANAGER_HH_
