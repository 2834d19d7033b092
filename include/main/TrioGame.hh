/** \file
 *
 * \brief Definition of Trio::Main::TrioGame class
 */

#ifndef MAIN_TRIOGAME_HH_
#define MAIN_TRIOGAME_HH_

#include "engine/RevealOutcome.hh"
#include "messaging/Identity.hh"
#include "trio/Card.hh"
#include "trio/GameMode.hh"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Trio {

namespace Coroutines {

class Mutex;

}

namespace Engine {

class Room;

}

namespace Messaging {

class EventSender;

}

namespace Main {

/** \brief Single hosted Trio game
 *
 * Each TrioGame instance glues together a Room, the TurnEngine playing the
 * game in it and an EventSender delivering the events to the seated
 * clients. It provides high level interface oriented to handling \ref
 * trioprotocolcontrolmessage commands.
 *
 * Every event published by the game gets the next value of a running
 * counter, shared by all the recipients of a broadcast.
 *
 * Rejected actions throw Engine::GameError. The exception is thrown before
 * anything is mutated or published. Reporting the error to the client is
 * left to the caller, see sendError().
 */
class TrioGame {
public:

    /** \brief Type of the running counter
     *
     * \sa \ref trioprotocoleventmessage
     */
    using Counter = std::uint64_t;

    /** \brief Create new game in a waiting room
     *
     * \param code the room code
     * \param name the display name of the room
     * \param mode the initial game mode
     * \param minPlayers the minimum number of seats to start
     * \param maxPlayers the maximum number of seats
     * \param eventSender the event sender used to deliver events
     */
    TrioGame(
        std::string code, std::string name, GameMode mode, int minPlayers,
        int maxPlayers, std::shared_ptr<Messaging::EventSender> eventSender);

    /** \brief Move constructor
     */
    TrioGame(TrioGame&&) = default;

    /** \brief Move assignment
     */
    TrioGame& operator=(TrioGame&&) = default;

    /** \brief Seat a client
     *
     * Publishes \c player_joined to the room, the joiner included, followed
     * by \c welcome to the joiner.
     *
     * \param identity the identity of the client
     * \param name the display name of the player
     *
     * \return the id of the new player
     *
     * \throw Engine::PhaseError if the game has started or \p identity is
     * already seated
     * \throw Engine::CapacityError if the room is full
     */
    std::string join(const Messaging::Identity& identity, std::string name);

    /** \brief Remove a client from the game
     *
     * Publishes \c player_disconnected to the rest of the room. While waiting
     * the seat is removed, otherwise it stays marked disconnected.
     *
     * \param identity the identity of the client
     *
     * \return true if the room is waiting and has no seats left, false
     * otherwise
     *
     * \throw Engine::TargetError if \p identity is not seated
     */
    bool leave(const Messaging::Identity& identity);

    /** \brief Change the game mode
     *
     * \param identity the identity of the client
     * \param mode the mode name, “spicy” selects the spicy mode and anything
     * else the simple mode
     *
     * \throw Engine::TargetError if \p identity is not seated
     * \throw Engine::PhaseError if the game has started
     */
    void setMode(const Messaging::Identity& identity, std::string_view mode);

    /** \brief Start the game with a freshly shuffled deck
     *
     * \param identity the identity of the client
     *
     * \throw Engine::TargetError if \p identity is not seated
     * \throw Engine::PhaseError if the game has started
     * \throw Engine::CapacityError if there are not enough seats
     */
    void start(const Messaging::Identity& identity);

    /** \brief Start the game with the given deck
     *
     * \throw See start(const Messaging::Identity&)
     */
    void start(
        const Messaging::Identity& identity, const std::vector<Card>& deck);

    /** \brief Reveal a middle card
     *
     * \param identity the identity of the client
     * \param cardId the id of the card
     *
     * \return the outcome of the reveal sequence
     *
     * \throw Engine::GameError if the reveal is rejected
     */
    Engine::RevealOutcome revealFromMiddle(
        const Messaging::Identity& identity, int cardId);

    /** \brief Reveal the lowest or highest card of a hand
     *
     * \param identity the identity of the client
     * \param targetId the id of the player whose card is revealed
     * \param position “lowest” or “highest”
     *
     * \return the outcome of the reveal sequence
     *
     * \throw Engine::GameError if the reveal is rejected
     */
    Engine::RevealOutcome revealFromPlayer(
        const Messaging::Identity& identity, std::string_view targetId,
        std::string_view position);

    /** \brief Return the cards of a failed sequence and pass the turn
     *
     * \throw Engine::PhaseError if no failed sequence is pending
     */
    void endFailedTurn();

    /** \brief Publish a chat message to the room
     *
     * \throw Engine::TargetError if \p identity is not seated
     */
    void chat(const Messaging::Identity& identity, std::string_view message);

    /** \brief Send \c error event to a client
     *
     * The event is sent even if \p identity is not seated.
     *
     * \param identity the identity of the client
     * \param message the human readable error message
     */
    void sendError(
        const Messaging::Identity& identity, std::string_view message);

    /** \brief Return the id of the player seated by \p identity
     *
     * \return the player id, or none if \p identity is not seated
     */
    std::optional<std::string> getPlayerId(
        const Messaging::Identity& identity) const;

    /** \brief Return the room of the game
     */
    const Engine::Room& getRoom() const;

    /** \brief Return the mutex serializing the commands of the room
     */
    Coroutines::Mutex& getMutex();

    /** \brief Return the value of the running counter
     *
     * The value is the counter of the latest event, or zero if nothing has
     * been published.
     */
    Counter getCounter() const;

private:

    class Impl;
    std::shared_ptr<Impl> impl;
};

}
}

#endif // MAIN_TRIOGAME_HH_
